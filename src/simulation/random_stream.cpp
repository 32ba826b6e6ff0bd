/**
 * @file random_stream.cpp
 * @brief Implementation of per-trial random streams
 */

#include "simulation/random_stream.hpp"

namespace allocation
{
    namespace simulation
    {

        std::uint64_t splitmix64(std::uint64_t x)
        {
            x += 0x9E3779B97F4A7C15ULL;
            x = (x ^ (x >> 30)) * 0xBF58476D1CE4E5B9ULL;
            x = (x ^ (x >> 27)) * 0x94D049BB133111EBULL;
            return x ^ (x >> 31);
        }

        std::uint64_t entropy_seed()
        {
            std::random_device rd;
            const std::uint64_t high = rd();
            const std::uint64_t low = rd();
            return (high << 32) ^ low;
        }

        TrialRandomStream::TrialRandomStream(std::uint64_t seed, std::uint64_t trial_index)
            : engine_(splitmix64(splitmix64(seed) + trial_index))
        {
        }

        double TrialRandomStream::uniform()
        {
            return static_cast<double>(engine_() >> 11) * (1.0 / 9007199254740992.0);
        }

    } // namespace simulation
} // namespace allocation

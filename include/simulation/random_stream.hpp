/**
 * @file random_stream.hpp
 * @brief Deterministic per-trial random streams
 *
 * Each trial derives its own generator from (run seed, trial index), so
 * the value of trial k never depends on which worker ran it or when.
 */

#pragma once

#include <cstdint>
#include <random>

namespace allocation
{
    namespace simulation
    {

        /**
         * @brief SplitMix64 finalizer (Steele, Lea, Flood 2014)
         */
        std::uint64_t splitmix64(std::uint64_t x);

        /**
         * @brief Draw a fresh 64-bit seed from std::random_device
         */
        std::uint64_t entropy_seed();

        /**
         * @class TrialRandomStream
         * @brief mt19937_64 seeded by SplitMix64(SplitMix64(seed) + trial_index)
         *
         * The run seed is mixed before the index is added, so nearby run
         * seeds never share trial streams.
         */
        class TrialRandomStream
        {
        public:
            TrialRandomStream(std::uint64_t seed, std::uint64_t trial_index);

            /**
             * @brief Uniform double in [0, 1) built from the top 53 bits
             *
             * Avoids std::uniform_real_distribution, whose output is not
             * specified identically across standard libraries.
             */
            double uniform();

        private:
            std::mt19937_64 engine_;
        };

    } // namespace simulation
} // namespace allocation

/**
 * @file simulation_result.hpp
 * @brief Aggregated statistics over completed simulation trials
 */

#pragma once

#include "core/diagnostics.hpp"
#include "simulation/outcome_state.hpp"
#include <array>
#include <cstdint>
#include <map>
#include <optional>
#include <vector>
#include <nlohmann/json.hpp>

namespace allocation
{
    namespace simulation
    {

        /**
         * @struct SimulationResult
         * @brief Distribution of realized allocation value for one Allocation
         *
         * Built fresh by each simulate() call and never mutated afterwards.
         */
        struct SimulationResult
        {
            double mean = 0.0;           ///< Mean realized value
            double std_dev = 0.0;        ///< Sample standard deviation
            double variance = 0.0;       ///< Sample variance
            double standard_error = 0.0; ///< std_dev / sqrt(trials_completed)

            std::map<double, double> percentiles; ///< Percentile (0-100) -> value

            /// mean / std_dev; empty when std_dev is zero
            std::optional<double> sharpe_ratio;

            size_t trials_requested = 0;
            size_t trials_completed = 0;
            int horizon = 0;
            std::uint64_t seed = 0; ///< Seed actually used, replayable

            /// Fraction of candidate-trials ending in each state, indexed by OutcomeState
            std::array<double, NUM_OUTCOME_STATES> terminal_state_distribution{};

            /// Mean step of conversion over converted candidate-trials
            std::optional<double> mean_conversion_step;

            std::vector<Warning> warnings;

            /**
             * @brief Aggregate per-trial values
             * @param values Realized values of completed trials, in trial-index order
             * @param percentile_levels Levels in [0, 100]
             * @throws std::invalid_argument if values is empty or a level is out of range
             */
            static SimulationResult from_values(const std::vector<double> &values,
                                                const std::vector<double> &percentile_levels);

            /**
             * @brief Linear-interpolated percentile of a sorted sample
             */
            static double interpolate_percentile(const std::vector<double> &sorted, double level);

            double terminal_fraction(OutcomeState state) const
            {
                return terminal_state_distribution[state_index(state)];
            }

            void print_summary() const;

            nlohmann::json to_json() const;
        };

    } // namespace simulation
} // namespace allocation

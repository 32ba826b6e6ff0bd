/**
 * @file scenario_simulator.hpp
 * @brief Monte Carlo stress test of an allocation
 *
 * Each trial walks every allocated candidate through the OutcomeState
 * machine for H steps. At each step a non-terminal candidate makes one
 * uniform draw u:
 *
 *   u < p_adv                    -> advance to the next stage
 *   p_adv <= u < p_adv + p_lapse -> LAPSED
 *   otherwise                    -> stay
 *
 * Realized trial value:
 *
 *   V = sum_i w_i * payoff(state_i) * 0.5^(t_i / half_life)
 *
 * where t_i is the step at which candidate i became terminal, or H if it
 * never did. A half-life of zero disables decay.
 *
 * Trials run on a TrialPool; each trial owns a TrialRandomStream derived
 * from (seed, trial index), so a fixed seed reproduces the result
 * bit-for-bit regardless of thread count.
 */

#pragma once

#include "core/candidate.hpp"
#include "optimizer/allocation.hpp"
#include "simulation/outcome_state.hpp"
#include "simulation/simulation_result.hpp"
#include "simulation/transition_model.hpp"
#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace allocation
{
    namespace simulation
    {

        /**
         * @struct OutcomePayoffs
         * @brief Payoff earned by a candidate ending a trial in each state
         */
        struct OutcomePayoffs
        {
            std::array<double, NUM_OUTCOME_STATES> values{0.0, 0.0, 0.0, 1.0, 0.0};

            double payoff(OutcomeState state) const { return values[state_index(state)]; }
            void set(OutcomeState state, double value) { values[state_index(state)] = value; }

            /**
             * @brief Parse {"converted": 1.0, "responded": 0.2, ...}
             * @throws std::invalid_argument on unknown state names or non-finite values
             */
            static OutcomePayoffs from_json(const nlohmann::json &j);
            nlohmann::json to_json() const;
        };

        /**
         * @struct SimulationConfig
         * @brief Parameters of one simulation run
         */
        struct SimulationConfig
        {
            size_t trials = 10000;                    ///< Trial count T
            int horizon = 10;                         ///< Steps per trial H
            std::optional<std::uint64_t> seed;        ///< Fresh entropy when empty
            int threads = 0;                          ///< 0 = hardware concurrency
            long long time_budget_ms = 0;             ///< 0 = no budget
            double decay_half_life = 0.0;             ///< 0 = no decay
            std::vector<double> percentiles{5.0, 50.0, 95.0};
            TransitionConfig transitions;
            OutcomePayoffs payoffs;
            bool scale_payoff_by_alpha = false;       ///< Multiply payoff by the candidate alpha

            /**
             * @throws std::invalid_argument on non-positive trials or horizon,
             *         negative threads, budget or half-life, or percentiles
             *         outside [0, 100]
             */
            void validate() const;

            /**
             * @brief Parse the "simulation" configuration section
             *
             * "decay_rate" is accepted in place of "decay_half_life" and
             * converted as half_life = ln 2 / rate.
             */
            static SimulationConfig from_json(const nlohmann::json &j);
            nlohmann::json to_json() const;
        };

        /**
         * @struct EngagementStrategy
         * @brief Named scaling of the base stage probabilities
         */
        struct EngagementStrategy
        {
            std::string name;
            StageProbabilities multipliers{1.0, 1.0, 1.0};
            double lapse_multiplier = 1.0;

            static EngagementStrategy from_json(const nlohmann::json &j);
            nlohmann::json to_json() const;
        };

        /**
         * @struct StrategyOutcome
         * @brief Simulation of one strategy in a comparison
         */
        struct StrategyOutcome
        {
            EngagementStrategy strategy;
            SimulationResult result;

            nlohmann::json to_json() const;
        };

        /**
         * @class ScenarioSimulator
         * @brief Runs T independent trials of an allocation and aggregates them
         *
         * Usage Example:
         * @code
         * SimulationConfig config;
         * config.trials = 20000;
         * config.seed = 42;
         *
         * ScenarioSimulator simulator(config);
         * SimulationResult result = simulator.simulate(allocation, candidates);
         * result.print_summary();
         * @endcode
         *
         * Thread Safety: simulate() is const and may be called concurrently.
         */
        class ScenarioSimulator
        {
        public:
            explicit ScenarioSimulator(const SimulationConfig &config = SimulationConfig());

            /**
             * @brief Simulate with the configured transition model
             * @param allocation Weights per candidate id
             * @param candidates Source of alpha and risk for every allocated id
             * @throws std::invalid_argument if an allocated id has no candidate
             * @throws std::runtime_error if the time budget expired before any trial
             */
            SimulationResult simulate(const optimizer::Allocation &allocation,
                                      const std::vector<Candidate> &candidates) const;

            SimulationResult simulate(const optimizer::Allocation &allocation,
                                      const std::vector<Candidate> &candidates,
                                      const TransitionModel &model) const;

            /**
             * @brief Simulate every strategy under one seed and rank by mean
             * @return One outcome per strategy, highest mean first
             * @throws std::invalid_argument if strategies is empty
             */
            std::vector<StrategyOutcome> compare_strategies(
                const optimizer::Allocation &allocation,
                const std::vector<Candidate> &candidates,
                const std::vector<EngagementStrategy> &strategies) const;

            const SimulationConfig &get_config() const { return config_; }

        private:
            SimulationConfig config_;

            struct Participant
            {
                double weight;
                double alpha;
                double risk;
            };

            struct TrialOutcome
            {
                double value = 0.0;
                std::array<int, NUM_OUTCOME_STATES> terminal_counts{};
                int conversions = 0;
                long long conversion_step_sum = 0;
            };

            static std::vector<Participant> match_participants(
                const optimizer::Allocation &allocation,
                const std::vector<Candidate> &candidates);

            TrialOutcome run_trial(const std::vector<Participant> &participants,
                                   const TransitionModel &model,
                                   std::uint64_t seed,
                                   std::uint64_t trial_index) const;

            double decay_factor(int steps) const;

            SimulationResult run(const std::vector<Participant> &participants,
                                 const TransitionModel &model,
                                 std::uint64_t seed) const;
        };

    } // namespace simulation
} // namespace allocation

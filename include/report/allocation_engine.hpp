/**
 * @file allocation_engine.hpp
 * @brief End-to-end pipeline from scored candidates to a report
 *
 * candidates -> RiskReturnEstimator -> (mu, Sigma) -> ViewBlender
 *            -> MeanVarianceOptimizer / EfficientFrontier -> Allocation
 *            -> ScenarioSimulator -> AllocationReport
 */

#pragma once

#include "config/engine_config.hpp"
#include "core/candidate.hpp"
#include "report/allocation_report.hpp"
#include <functional>
#include <string>
#include <vector>

namespace allocation
{
    namespace report
    {

        /**
         * @brief Progress callback: (step, total_steps, description)
         */
        using ProgressCallback = std::function<void(int, int, const std::string &)>;

        /**
         * @class AllocationEngine
         * @brief Runs the full allocation pipeline
         *
         * Holds no state between calls: every run builds fresh estimators,
         * optimizers and simulators from the configuration it is given, so a
         * failed run cannot affect the next one.
         *
         * Usage Example:
         * @code
         * EngineConfig config = EngineConfig::load_from_file("config.json");
         * auto candidates = DataLoader::load_candidates_csv("candidates.csv");
         *
         * AllocationReport report = AllocationEngine::run(candidates, {}, config);
         * report.print_summary();
         * @endcode
         */
        class AllocationEngine
        {
        public:
            static constexpr int NUM_STEPS = 5;

            /**
             * @brief Run estimation, blending, optimization, frontier and simulation
             * @param candidates Scored candidates (read-only)
             * @param user_views Subjective views (may be empty)
             * @param config Engine configuration
             * @param scorer Optional alpha scorer; Candidate::alpha is used when empty
             * @param progress Optional progress callback
             * @return Report with every stage's output and all warnings
             * @throws InfeasibleError if there are no candidates or constraints contradict
             * @throws std::invalid_argument on invalid candidates, views or configuration
             */
            static AllocationReport run(const std::vector<Candidate> &candidates,
                                        const std::vector<View> &user_views,
                                        const EngineConfig &config,
                                        const ScoringFunction &scorer = ScoringFunction(),
                                        const ProgressCallback &progress = ProgressCallback());
        };

    } // namespace report
} // namespace allocation

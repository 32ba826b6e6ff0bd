/**
 * @file engine_config.hpp
 * @brief Complete allocation engine configuration
 *
 * Every section and field is optional; missing values take the defaults
 * documented on each struct. Example:
 *
 * {
 *   "estimator":  { "type": "feature_distance", "length_scale": 1.5 },
 *   "views":      { "tau": 0.05 },
 *   "optimizer":  { "objective": "risk_aversion", "risk_aversion": 2.0,
 *                   "max_weight": 0.25 },
 *   "frontier":   { "num_points": 25 },
 *   "simulation": { "trials": 20000, "horizon": 12, "seed": 7,
 *                   "decay_half_life": 6 }
 * }
 */

#pragma once

#include "optimizer/efficient_frontier.hpp"
#include "optimizer/mean_variance_optimizer.hpp"
#include "optimizer/optimizer_interface.hpp"
#include "risk/correlation_model_factory.hpp"
#include "simulation/scenario_simulator.hpp"
#include "views/view_blender.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace allocation
{

    /**
     * @struct OptimizerConfig
     * @brief Configuration for optimizer parameters
     */
    struct OptimizerConfig
    {
        optimizer::ObjectiveType objective = optimizer::ObjectiveType::RISK_AVERSION;
        double risk_aversion = 1.0;         ///< Lambda for RISK_AVERSION
        double target_return = 0.0;         ///< Target for TARGET_RETURN
        double risk_free_rate = 0.0;        ///< Baseline for the Sharpe-like ratio
        double condition_threshold = 1e8;   ///< Regularize Sigma above this condition number
        double weight_cutoff = 1e-4;        ///< Clean-up threshold for tiny weights
        int max_iterations = 10000;         ///< Solver iteration limit
        double tolerance = 1e-7;            ///< Solver tolerance
        optimizer::OptimizationConstraints constraints;

        /**
         * @brief Load from JSON object
         *
         * Constraint fields (min_weight, max_weight, budget, fully_invested,
         * group_constraints) may sit directly in the section or inside a
         * "constraints" object.
         */
        static OptimizerConfig from_json(const nlohmann::json &j);
        nlohmann::json to_json() const;

        optimizer::SolverOptions solver_options() const;
    };

    /**
     * @struct EngineConfig
     * @brief Complete engine configuration
     */
    struct EngineConfig
    {
        risk::CorrelationModelConfig estimator;
        views::BlenderConfig views;
        OptimizerConfig optimizer;
        optimizer::FrontierConfig frontier;
        simulation::SimulationConfig simulation;
        std::vector<simulation::EngagementStrategy> strategies; ///< Compared when non-empty

        bool compute_frontier = true; ///< Trace the efficient frontier
        bool run_simulation = true;   ///< Stress-test the chosen allocation

        static EngineConfig from_json(const nlohmann::json &j);

        /**
         * @brief Load complete configuration from JSON file
         * @throws std::runtime_error if the file cannot be read
         * @throws std::invalid_argument on invalid values
         */
        static EngineConfig load_from_file(const std::string &config_path);

        nlohmann::json to_json() const;
    };

} // namespace allocation

/**
 * @file allocation_report.hpp
 * @brief Combined optimizer and simulator output for one engine run
 */

#pragma once

#include "core/diagnostics.hpp"
#include "optimizer/allocation.hpp"
#include "optimizer/efficient_frontier.hpp"
#include "optimizer/optimizer_interface.hpp"
#include "simulation/scenario_simulator.hpp"
#include "simulation/simulation_result.hpp"
#include <Eigen/Dense>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace allocation
{
    namespace report
    {

        /**
         * @struct AllocationReport
         * @brief Everything one engine run produced
         *
         * to_json() yields only nested objects, arrays, numbers, strings and
         * null, ready for any downstream store.
         */
        struct AllocationReport
        {
            std::vector<std::string> ids;       ///< Candidate ids, index order
            Eigen::VectorXd prior_returns;      ///< Returns before view blending
            Eigen::VectorXd posterior_returns;  ///< Returns after view blending
            Eigen::VectorXd volatilities;       ///< sqrt(diag(Sigma)) used by the optimizer
            std::string correlation_model;      ///< Correlation source name
            int effective_views = 0;            ///< Views that influenced the posterior

            optimizer::OptimizationResult optimization;  ///< Chosen allocation statistics
            optimizer::Allocation allocation;            ///< Chosen allocation by id
            std::optional<optimizer::EfficientFrontierResult> frontier;
            std::optional<simulation::SimulationResult> simulation;
            std::vector<simulation::StrategyOutcome> strategy_comparison;

            std::vector<Warning> warnings; ///< Union of warnings from every stage

            nlohmann::json to_json() const;

            void print_summary() const;
        };

    } // namespace report
} // namespace allocation

/**
 * @file optimizer_interface.hpp
 * @brief Abstract interface for allocation optimizers
 *
 * Provides a common interface for optimizers that turn expected returns
 * and a covariance matrix into candidate weights. Follows the
 * CorrelationModel pattern from the risk layer.
 *
 * Thread Safety: Implementations are expected to be thread-safe for
 * read-only operations.
 */

#pragma once

#include "core/diagnostics.hpp"
#include <Eigen/Dense>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace allocation
{
    namespace optimizer
    {

        /**
         * @struct GroupConstraint
         * @brief Constraint on the total weight of a group of candidates
         *
         * Enforces: min_exposure <= sum(w_i : i in group) <= max_exposure
         *
         * Example: GroupConstraint{"referrals", {"c1", "c4"}, {}, 0.10, 0.40}
         *          keeps 10-40% of the budget on c1 and c4 combined.
         */
        struct GroupConstraint
        {
            std::string name;                 ///< Group name
            std::vector<std::string> members; ///< Candidate ids in this group
            std::vector<int> asset_indices;   ///< Resolved indices (or given directly)
            double min_exposure = 0.0;        ///< Minimum total weight
            double max_exposure = 1.0;        ///< Maximum total weight

            /**
             * @brief Validate constraint
             * @throws std::invalid_argument if empty, out of [0, 1] or min > max
             */
            void validate() const;

            nlohmann::json to_json() const;
            static GroupConstraint from_json(const nlohmann::json &j);
        };

        /**
         * @struct OptimizationConstraints
         * @brief Container for allocation constraints
         *
         * Weights are always long-only: a candidate cannot be un-selected
         * retroactively, so min_weight must be >= 0.
         */
        struct OptimizationConstraints
        {
            double min_weight = 0.0;    ///< Minimum weight per candidate
            double max_weight = 1.0;    ///< Maximum weight per candidate
            double budget = 1.0;        ///< Total weight available (<= 1, no leverage)
            bool fully_invested = true; ///< sum(w) == budget, otherwise sum(w) <= budget
            std::vector<GroupConstraint> group_constraints;

            /**
             * @brief Validate parameter ranges
             * @throws std::invalid_argument if a parameter is out of range
             */
            void validate() const;

            /**
             * @brief Check that the constraints admit at least one allocation
             * @param n Number of candidates
             * @throws InfeasibleError if n == 0 or bounds contradict each other
             */
            void check_feasibility(int n) const;

            /**
             * @brief Resolve group member ids to indices
             * @param ids Candidate ids in index order
             * @return Copy with every group's asset_indices filled
             * @throws std::invalid_argument if a member id is unknown
             */
            OptimizationConstraints resolve_groups(const std::vector<std::string> &ids) const;

            static OptimizationConstraints from_json(const nlohmann::json &j);
            nlohmann::json to_json() const;
        };

        /**
         * @struct OptimizationResult
         * @brief Container for optimization results
         */
        struct OptimizationResult
        {
            Eigen::VectorXd weights;             ///< Optimal candidate weights
            double expected_return = 0.0;        ///< Allocation expected return
            double volatility = 0.0;             ///< Allocation standard deviation
            std::optional<double> sharpe_ratio;  ///< Undefined when volatility is zero
            double risk_aversion = 0.0;          ///< Lambda that produced this allocation
            bool success = false;                ///< Optimization succeeded
            std::string message;                 ///< Status message
            int iterations = 0;                  ///< Solver iterations
            double objective_value = 0.0;        ///< Final objective value
            std::vector<Warning> warnings;       ///< Recovered numerical conditions

            bool is_valid() const;

            void print_summary() const;

            nlohmann::json to_json() const;
        };

        /**
         * @class OptimizerInterface
         * @brief Abstract base class for allocation optimizers
         *
         * Usage Example:
         * @code
         * auto optimizer = std::make_unique<MeanVarianceOptimizer>();
         * auto result = optimizer->optimize(returns, covariance, constraints);
         * result.print_summary();
         * @endcode
         */
        class OptimizerInterface
        {
        public:
            virtual ~OptimizerInterface() = default;

            /**
             * @brief Optimize candidate weights
             * @param expected_returns Expected return per candidate (N x 1)
             * @param covariance Covariance matrix (N x N)
             * @param constraints Allocation constraints (group indices resolved)
             * @return OptimizationResult
             * @throws InfeasibleError if the constraints are contradictory
             * @throws std::invalid_argument if inputs are invalid
             */
            virtual OptimizationResult optimize(
                const Eigen::VectorXd &expected_returns,
                const Eigen::MatrixXd &covariance,
                const OptimizationConstraints &constraints) const = 0;

            virtual std::string get_name() const = 0;

            virtual nlohmann::json get_parameters() const = 0;

            /**
             * @brief Validate input data
             * @throws std::invalid_argument on empty, mismatched, non-finite,
             *         asymmetric or indefinite input
             */
            static void validate_inputs(
                const Eigen::VectorXd &expected_returns,
                const Eigen::MatrixXd &covariance);

            /**
             * @brief Calculate allocation statistics
             * @param weights Candidate weights
             * @param expected_returns Expected returns
             * @param covariance Covariance matrix
             * @param risk_free_rate Baseline for the Sharpe-like ratio
             */
            static OptimizationResult calculate_statistics(
                const Eigen::VectorXd &weights,
                const Eigen::VectorXd &expected_returns,
                const Eigen::MatrixXd &covariance,
                double risk_free_rate = 0.0);

        protected:
            /**
             * @brief Check if weights satisfy constraints
             */
            static bool check_constraints(
                const Eigen::VectorXd &weights,
                const OptimizationConstraints &constraints,
                double tolerance = 1e-6);
        };

    } // namespace optimizer
} // namespace allocation

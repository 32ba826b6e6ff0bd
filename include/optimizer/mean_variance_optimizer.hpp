/**
 * @file mean_variance_optimizer.hpp
 * @brief Mean-variance allocation optimizer (Markowitz)
 *
 * Supports multiple objective functions:
 * - Risk aversion utility maximization
 * - Target return with minimum variance
 * - Minimum variance
 * - Maximum Sharpe-like ratio
 *
 * Mathematical Formulation (RISK_AVERSION):
 *
 * Maximize:     mu^T * w - lambda * w^T * Sigma * w
 * Subject to:   sum(w_i) = budget            (or <= budget if not fully invested)
 *               w_min <= w_i <= w_max
 *               g_min <= sum(w_i : i in G) <= g_max   for each group G
 *
 * For lambda > 0 this is solved as the equivalent QP
 *   minimize (1/2) w^T (2 Sigma) w - (1/lambda) mu^T w
 * with OSQP. For lambda = 0 the problem is linear and is solved exactly by
 * filling candidates in descending order of return (ties to lower risk,
 * then lower index).
 *
 * Numerical policy: when the condition number of Sigma exceeds the
 * configured threshold, Sigma is shrunk toward its diagonal before
 * solving and REGULARIZED_COVARIANCE is reported. Statistics are always
 * computed against the caller's Sigma.
 */

#pragma once

#include "optimizer/optimizer_interface.hpp"
#include "optimizer/quadratic_problem.hpp"
#include <utility>

namespace allocation
{
    namespace optimizer
    {

        /**
         * @enum ObjectiveType
         * @brief Type of optimization objective
         */
        enum class ObjectiveType
        {
            MIN_VARIANCE,  ///< Minimize variance only
            MAX_SHARPE,    ///< Maximize return / volatility over a lambda grid
            TARGET_RETURN, ///< Target return with min variance
            RISK_AVERSION  ///< Utility: return - lambda * variance
        };

        /**
         * @brief Parse objective name (case-insensitive)
         * @throws std::invalid_argument listing the valid options
         */
        ObjectiveType parse_objective_type(const std::string &name);
        std::string to_string(ObjectiveType objective);

        /**
         * @class MeanVarianceOptimizer
         * @brief Markowitz mean-variance allocation optimizer
         *
         * Usage Example:
         * @code
         * MeanVarianceOptimizer optimizer(ObjectiveType::RISK_AVERSION);
         * optimizer.set_risk_aversion(1.0);
         *
         * OptimizationConstraints constraints;
         * constraints.max_weight = 0.5;
         *
         * auto result = optimizer.optimize(returns, covariance, constraints);
         * @endcode
         *
         * Thread Safety: Safe for concurrent read-only operations
         */
        class MeanVarianceOptimizer : public OptimizerInterface
        {
        public:
            /**
             * @brief Construct mean-variance optimizer
             * @param objective Optimization objective type
             * @param risk_free_rate Baseline return for the Sharpe-like ratio
             */
            explicit MeanVarianceOptimizer(
                ObjectiveType objective = ObjectiveType::RISK_AVERSION,
                double risk_free_rate = 0.0);

            ~MeanVarianceOptimizer() override = default;

            /**
             * @brief Optimize candidate weights
             * @throws InfeasibleError if constraints are contradictory or the
             *         target return is outside the achievable range
             * @throws std::invalid_argument if inputs are invalid
             *
             * Solver non-convergence is reported through success = false.
             */
            OptimizationResult optimize(
                const Eigen::VectorXd &expected_returns,
                const Eigen::MatrixXd &covariance,
                const OptimizationConstraints &constraints) const override;

            std::string get_name() const override;

            nlohmann::json get_parameters() const override;

            /**
             * @brief Set risk aversion parameter
             * @param lambda Risk aversion (lambda >= 0); 0 maximizes return only
             * @throws std::invalid_argument if lambda < 0 or not finite
             */
            void set_risk_aversion(double lambda);

            void set_target_return(double target_return);

            void set_solver_options(const SolverOptions &options);

            /**
             * @brief Set the condition number above which Sigma is regularized
             * @throws std::invalid_argument if threshold <= 1
             */
            void set_condition_threshold(double threshold);

            /**
             * @brief Weights below the cutoff are zeroed before rescaling
             * @throws std::invalid_argument if cutoff is negative
             */
            void set_weight_cutoff(double cutoff);

            double get_risk_aversion() const { return risk_aversion_; }
            double get_target_return() const { return target_return_; }
            ObjectiveType get_objective() const { return objective_; }
            double get_condition_threshold() const { return condition_threshold_; }

            /**
             * @brief Lowest and highest allocation return the constraints allow
             * @return (min_return, max_return)
             */
            std::pair<double, double> achievable_return_range(
                const Eigen::VectorXd &expected_returns,
                const OptimizationConstraints &constraints) const;

            /**
             * @brief Exact maximizer of scores^T w under box and budget constraints
             * @param scores Linear objective per candidate
             * @param variances Tie-break key (lower first)
             * @param constraints Box and budget (groups are ignored)
             */
            static Eigen::VectorXd greedy_fill(const Eigen::VectorXd &scores,
                                               const Eigen::VectorXd &variances,
                                               const OptimizationConstraints &constraints);

        private:
            ObjectiveType objective_;
            double risk_free_rate_;
            double risk_aversion_;
            double target_return_;
            double condition_threshold_;
            double weight_cutoff_;
            SolverOptions solver_options_;

            OptimizationResult optimize_min_variance(
                const Eigen::VectorXd &expected_returns,
                const Eigen::MatrixXd &solve_covariance,
                const Eigen::MatrixXd &covariance,
                const OptimizationConstraints &constraints) const;

            OptimizationResult optimize_max_sharpe(
                const Eigen::VectorXd &expected_returns,
                const Eigen::MatrixXd &solve_covariance,
                const Eigen::MatrixXd &covariance,
                const OptimizationConstraints &constraints) const;

            OptimizationResult optimize_target_return(
                const Eigen::VectorXd &expected_returns,
                const Eigen::MatrixXd &solve_covariance,
                const Eigen::MatrixXd &covariance,
                const OptimizationConstraints &constraints,
                double target_return) const;

            OptimizationResult optimize_risk_aversion(
                const Eigen::VectorXd &expected_returns,
                const Eigen::MatrixXd &solve_covariance,
                const Eigen::MatrixXd &covariance,
                const OptimizationConstraints &constraints,
                double lambda) const;

            /**
             * @brief Problem skeleton with budget, group and box rows
             */
            static QuadraticProblem build_problem(int n, const OptimizationConstraints &constraints);

            /**
             * @brief Solve a QP and turn the solution into a cleaned result
             */
            OptimizationResult solve_and_finalize(
                const QuadraticProblem &problem,
                const Eigen::VectorXd &expected_returns,
                const Eigen::MatrixXd &covariance,
                const OptimizationConstraints &constraints) const;

            /**
             * @brief Zero tiny and negative weights, clamp, rescale to budget
             */
            Eigen::VectorXd clean_weights(const Eigen::VectorXd &weights,
                                          const OptimizationConstraints &constraints) const;
        };

    } // namespace optimizer
} // namespace allocation

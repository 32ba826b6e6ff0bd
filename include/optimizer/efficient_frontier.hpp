/**
 * @file efficient_frontier.hpp
 * @brief Efficient frontier computation for allocation optimization
 *
 * Computes the efficient frontier by solving the allocation problem
 * across a monotonically increasing sweep of risk-aversion values, or
 * across a grid of target returns.
 *
 * Mathematical Background:
 *
 *     For each risk aversion lambda (log-spaced, optionally starting at 0):
 *         Maximize:   mu^T * w - lambda * w^T * Sigma * w
 *
 *     Or for each target return r_target:
 *         Minimize:   w^T * Sigma * w
 *         Subject to: mu^T * w = r_target
 *
 * Only non-dominated points are retained: sorted by increasing volatility,
 * each retained point has a strictly higher return than the one before it.
 * When two points share a return, the lower-risk point wins.
 */

#pragma once

#include "optimizer/allocation.hpp"
#include "optimizer/mean_variance_optimizer.hpp"
#include "optimizer/optimizer_interface.hpp"
#include <optional>
#include <string>
#include <vector>

namespace allocation
{
    namespace optimizer
    {

        /**
         * @enum FrontierMethod
         * @brief Parameter swept to trace the frontier
         */
        enum class FrontierMethod
        {
            RISK_AVERSION, ///< Log-spaced lambda grid
            TARGET_RETURN  ///< Evenly spaced target returns over the achievable range
        };

        FrontierMethod parse_frontier_method(const std::string &name);
        std::string to_string(FrontierMethod method);

        /**
         * @struct FrontierConfig
         * @brief Frontier sweep parameters
         */
        struct FrontierConfig
        {
            int num_points = 20;                    ///< Grid size
            double min_lambda = 0.01;               ///< Smallest positive risk aversion
            double max_lambda = 1000.0;             ///< Largest risk aversion
            bool include_return_maximizing = true;  ///< Prepend the lambda = 0 point
            FrontierMethod method = FrontierMethod::RISK_AVERSION;

            /**
             * @throws std::invalid_argument if num_points < 2 or the lambda range is invalid
             */
            void validate() const;

            static FrontierConfig from_json(const nlohmann::json &j);
            nlohmann::json to_json() const;
        };

        /**
         * @struct FrontierPoint
         * @brief Single point on the efficient frontier
         */
        struct FrontierPoint
        {
            double expected_return;            ///< Allocation expected return
            double volatility;                 ///< Allocation standard deviation
            std::optional<double> sharpe_ratio; ///< Undefined for zero volatility
            double risk_aversion;              ///< Lambda (risk-aversion sweep only)
            Allocation allocation;             ///< Candidate weights
            bool is_valid;                     ///< Point successfully computed

            FrontierPoint();

            /**
             * @brief Construct from optimization result
             * @param result Optimizer output
             * @param ids Candidate ids in index order
             */
            FrontierPoint(const OptimizationResult &result, const std::vector<std::string> &ids);

            nlohmann::json to_json() const;
        };

        /**
         * @struct EfficientFrontierResult
         * @brief Complete efficient frontier data
         */
        struct EfficientFrontierResult
        {
            std::vector<FrontierPoint> points;    ///< Non-dominated points, increasing risk
            FrontierPoint min_variance_portfolio; ///< Minimum variance allocation
            FrontierPoint max_sharpe_portfolio;   ///< Highest defined Sharpe-like ratio on the frontier
            bool success;                         ///< Computation succeeded
            std::string message;                  ///< Status message
            std::vector<Warning> warnings;        ///< Distinct warnings raised along the sweep

            EfficientFrontierResult();

            bool is_valid() const;

            size_t num_valid_points() const;

            void print_summary() const;

            /**
             * @brief Export frontier data to CSV
             * @param filepath Path to output file
             * @throws std::runtime_error if the file cannot be opened
             *
             * Columns: return, volatility, sharpe_ratio, risk_aversion, then
             * one weight column per candidate id.
             */
            void export_to_csv(const std::string &filepath) const;

            nlohmann::json to_json() const;
        };

        /**
         * @class EfficientFrontier
         * @brief Computes the efficient frontier
         *
         * Usage Example:
         * @code
         * FrontierConfig config;
         * config.num_points = 25;
         *
         * EfficientFrontier frontier(config);
         * auto result = frontier.compute(ids, returns, covariance, constraints);
         *
         * result.print_summary();
         * result.export_to_csv("efficient_frontier.csv");
         * @endcode
         *
         * Thread Safety: Safe for concurrent read-only operations
         */
        class EfficientFrontier
        {
        public:
            explicit EfficientFrontier(const FrontierConfig &config = FrontierConfig());

            ~EfficientFrontier() = default;

            /**
             * @brief Compute efficient frontier with the configured method
             * @param ids Candidate ids in index order
             * @param expected_returns Expected returns for each candidate
             * @param covariance Covariance matrix
             * @param constraints Allocation constraints (group indices resolved)
             * @param risk_free_rate Baseline for the Sharpe-like ratio
             * @throws InfeasibleError if the constraints are contradictory
             * @throws std::invalid_argument if inputs are invalid
             */
            EfficientFrontierResult compute(
                const std::vector<std::string> &ids,
                const Eigen::VectorXd &expected_returns,
                const Eigen::MatrixXd &covariance,
                const OptimizationConstraints &constraints,
                double risk_free_rate = 0.0) const;

            EfficientFrontierResult compute_via_risk_aversion(
                const std::vector<std::string> &ids,
                const Eigen::VectorXd &expected_returns,
                const Eigen::MatrixXd &covariance,
                const OptimizationConstraints &constraints,
                double risk_free_rate = 0.0) const;

            EfficientFrontierResult compute_via_target_return(
                const std::vector<std::string> &ids,
                const Eigen::VectorXd &expected_returns,
                const Eigen::MatrixXd &covariance,
                const OptimizationConstraints &constraints,
                double risk_free_rate = 0.0) const;

            // ===== Configuration Methods =====

            /**
             * @throws std::invalid_argument if num_points < 2
             */
            void set_num_points(int num_points);

            /**
             * @throws std::invalid_argument if range is invalid
             */
            void set_risk_aversion_range(double min_lambda, double max_lambda);

            void set_include_return_maximizing(bool include);
            void set_method(FrontierMethod method);

            void set_condition_threshold(double threshold);
            void set_weight_cutoff(double cutoff);
            void set_solver_options(const SolverOptions &options);

            // ===== Getters =====

            const FrontierConfig &get_config() const { return config_; }

            /**
             * @brief Lambda grid the risk-aversion sweep uses, increasing
             */
            std::vector<double> lambda_grid() const;

        private:
            FrontierConfig config_;
            double condition_threshold_;
            double weight_cutoff_;
            SolverOptions solver_options_;

            MeanVarianceOptimizer make_optimizer(ObjectiveType objective, double risk_free_rate) const;

            FrontierPoint compute_min_variance_portfolio(
                const std::vector<std::string> &ids,
                const Eigen::VectorXd &expected_returns,
                const Eigen::MatrixXd &covariance,
                const OptimizationConstraints &constraints,
                double risk_free_rate) const;

            /**
             * @brief Sort by risk and drop dominated or invalid points
             */
            static void retain_non_dominated(std::vector<FrontierPoint> &points);

            /**
             * @brief Fill special points and status after the sweep
             */
            void finalize(EfficientFrontierResult &result,
                          const std::vector<std::string> &ids,
                          const Eigen::VectorXd &expected_returns,
                          const Eigen::MatrixXd &covariance,
                          const OptimizationConstraints &constraints,
                          double risk_free_rate) const;

            void validate_inputs(
                const std::vector<std::string> &ids,
                const Eigen::VectorXd &expected_returns,
                const Eigen::MatrixXd &covariance,
                const OptimizationConstraints &constraints) const;
        };

    } // namespace optimizer
} // namespace allocation

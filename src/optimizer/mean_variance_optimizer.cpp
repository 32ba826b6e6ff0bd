/**
 * @file mean_variance_optimizer.cpp
 * @brief Implementation of mean-variance allocation optimizer
 */

#include "optimizer/mean_variance_optimizer.hpp"
#include "optimizer/osqp_solver.hpp"
#include "risk/covariance_conditioning.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>
#include <numeric>
#include <sstream>
#include <stdexcept>

namespace allocation
{
    namespace optimizer
    {

        namespace
        {
            constexpr double RANGE_TOLERANCE = 1e-9;

            /// Risk-aversion grid searched by MAX_SHARPE, log-spaced over [1e-2, 1e3]
            std::vector<double> sharpe_lambda_grid()
            {
                std::vector<double> lambdas;
                const int points = 31;
                const double log_min = std::log(1e-2);
                const double log_max = std::log(1e3);
                for (int i = 0; i < points; ++i)
                {
                    lambdas.push_back(std::exp(log_min + i * (log_max - log_min) / (points - 1)));
                }
                return lambdas;
            }
        } // namespace

        ObjectiveType parse_objective_type(const std::string &name)
        {
            std::string normalized = name;
            std::transform(normalized.begin(), normalized.end(), normalized.begin(), [](unsigned char c)
                           { return std::tolower(c); });

            if (normalized == "risk_aversion")
            {
                return ObjectiveType::RISK_AVERSION;
            }
            else if (normalized == "target_return")
            {
                return ObjectiveType::TARGET_RETURN;
            }
            else if (normalized == "min_variance")
            {
                return ObjectiveType::MIN_VARIANCE;
            }
            else if (normalized == "max_sharpe")
            {
                return ObjectiveType::MAX_SHARPE;
            }

            throw std::invalid_argument(
                "Unknown objective: '" + name + "'. Valid options: risk_aversion, target_return, min_variance, max_sharpe");
        }

        std::string to_string(ObjectiveType objective)
        {
            switch (objective)
            {
            case ObjectiveType::MIN_VARIANCE:
                return "MIN_VARIANCE";
            case ObjectiveType::MAX_SHARPE:
                return "MAX_SHARPE";
            case ObjectiveType::TARGET_RETURN:
                return "TARGET_RETURN";
            case ObjectiveType::RISK_AVERSION:
                return "RISK_AVERSION";
            }
            return "UNKNOWN";
        }

        MeanVarianceOptimizer::MeanVarianceOptimizer(
            ObjectiveType objective,
            double risk_free_rate)
            : objective_(objective),
              risk_free_rate_(risk_free_rate),
              risk_aversion_(1.0),
              target_return_(0.0),
              condition_threshold_(1e8),
              weight_cutoff_(1e-4)
        {
            if (!std::isfinite(risk_free_rate))
            {
                throw std::invalid_argument("Risk-free rate must be finite");
            }

            solver_options_.max_iterations = 10000;
            solver_options_.tolerance = 1e-7;
        }

        std::string MeanVarianceOptimizer::get_name() const
        {
            return "MeanVarianceOptimizer";
        }

        nlohmann::json MeanVarianceOptimizer::get_parameters() const
        {
            nlohmann::json params;
            params["optimizer_type"] = "MeanVariance";
            params["objective"] = to_string(objective_);
            params["risk_free_rate"] = risk_free_rate_;
            params["risk_aversion"] = risk_aversion_;
            params["target_return"] = target_return_;
            params["condition_threshold"] = condition_threshold_;
            params["weight_cutoff"] = weight_cutoff_;
            params["max_iterations"] = solver_options_.max_iterations;
            params["tolerance"] = solver_options_.tolerance;
            return params;
        }

        void MeanVarianceOptimizer::set_risk_aversion(double lambda)
        {
            if (!(lambda >= 0.0) || !std::isfinite(lambda))
            {
                throw std::invalid_argument(
                    "Risk aversion must be non-negative, got: " + std::to_string(lambda));
            }
            risk_aversion_ = lambda;
        }

        void MeanVarianceOptimizer::set_target_return(double target_return)
        {
            if (!std::isfinite(target_return))
            {
                throw std::invalid_argument("Target return must be finite");
            }
            target_return_ = target_return;
        }

        void MeanVarianceOptimizer::set_solver_options(const SolverOptions &options)
        {
            options.validate();
            solver_options_ = options;
        }

        void MeanVarianceOptimizer::set_condition_threshold(double threshold)
        {
            if (!(threshold > 1.0))
            {
                throw std::invalid_argument(
                    "Condition threshold must exceed 1, got: " + std::to_string(threshold));
            }
            condition_threshold_ = threshold;
        }

        void MeanVarianceOptimizer::set_weight_cutoff(double cutoff)
        {
            if (!(cutoff >= 0.0))
            {
                throw std::invalid_argument(
                    "Weight cutoff must be non-negative, got: " + std::to_string(cutoff));
            }
            weight_cutoff_ = cutoff;
        }

        OptimizationResult MeanVarianceOptimizer::optimize(
            const Eigen::VectorXd &expected_returns,
            const Eigen::MatrixXd &covariance,
            const OptimizationConstraints &constraints) const
        {
            validate_inputs(expected_returns, covariance);
            constraints.check_feasibility(static_cast<int>(expected_returns.size()));

            // Regularize an ill-conditioned covariance before it reaches the solver
            risk::ConditioningResult conditioning =
                risk::regularize_if_ill_conditioned(covariance, condition_threshold_);

            OptimizationResult result;
            switch (objective_)
            {
            case ObjectiveType::MIN_VARIANCE:
                result = optimize_min_variance(expected_returns, conditioning.matrix, covariance, constraints);
                break;

            case ObjectiveType::MAX_SHARPE:
                result = optimize_max_sharpe(expected_returns, conditioning.matrix, covariance, constraints);
                break;

            case ObjectiveType::TARGET_RETURN:
                result = optimize_target_return(expected_returns, conditioning.matrix, covariance,
                                                constraints, target_return_);
                break;

            case ObjectiveType::RISK_AVERSION:
                result = optimize_risk_aversion(expected_returns, conditioning.matrix, covariance,
                                                constraints, risk_aversion_);
                break;
            }

            if (conditioning.regularized)
            {
                std::ostringstream msg;
                msg << "Covariance condition number " << conditioning.condition_before
                    << " exceeds " << condition_threshold_ << "; shrunk toward diagonal (delta="
                    << conditioning.shrinkage << ", ridge=" << conditioning.ridge << ")";
                result.warnings.push_back({WarningCode::REGULARIZED_COVARIANCE, msg.str()});
            }

            return result;
        }

        OptimizationResult MeanVarianceOptimizer::optimize_min_variance(
            const Eigen::VectorXd &expected_returns,
            const Eigen::MatrixXd &solve_covariance,
            const Eigen::MatrixXd &covariance,
            const OptimizationConstraints &constraints) const
        {
            const int n = expected_returns.size();

            // Minimize: (1/2) * w^T * (2 Sigma) * w
            QuadraticProblem problem = build_problem(n, constraints);
            problem.P = 2.0 * solve_covariance;
            problem.q = Eigen::VectorXd::Zero(n);

            return solve_and_finalize(problem, expected_returns, covariance, constraints);
        }

        OptimizationResult MeanVarianceOptimizer::optimize_max_sharpe(
            const Eigen::VectorXd &expected_returns,
            const Eigen::MatrixXd &solve_covariance,
            const Eigen::MatrixXd &covariance,
            const OptimizationConstraints &constraints) const
        {
            // Grid search over risk aversion; the Sharpe-like ratio along the
            // lambda path is unimodal for the long-only problem in practice
            std::vector<double> lambdas = sharpe_lambda_grid();
            lambdas.insert(lambdas.begin(), 0.0);

            OptimizationResult best_result;
            bool found = false;

            for (double lambda : lambdas)
            {
                OptimizationResult result = optimize_risk_aversion(
                    expected_returns, solve_covariance, covariance, constraints, lambda);

                if (!result.success || !result.sharpe_ratio)
                {
                    continue;
                }

                if (!found || *result.sharpe_ratio > *best_result.sharpe_ratio)
                {
                    best_result = result;
                    found = true;
                }
            }

            if (found)
            {
                best_result.message = "Optimized via risk aversion grid search";
                return best_result;
            }

            // Every grid point had zero volatility: Sharpe-like ratio is undefined
            OptimizationResult fallback = optimize_min_variance(
                expected_returns, solve_covariance, covariance, constraints);
            fallback.message = "Sharpe-like ratio undefined on the whole grid; returned minimum variance";
            return fallback;
        }

        OptimizationResult MeanVarianceOptimizer::optimize_target_return(
            const Eigen::VectorXd &expected_returns,
            const Eigen::MatrixXd &solve_covariance,
            const Eigen::MatrixXd &covariance,
            const OptimizationConstraints &constraints,
            double target_return) const
        {
            const int n = expected_returns.size();

            const auto range = achievable_return_range(expected_returns, constraints);
            const double slack = RANGE_TOLERANCE * std::max(1.0, std::abs(target_return));
            if (target_return < range.first - slack || target_return > range.second + slack)
            {
                throw InfeasibleError(
                    "target return " + std::to_string(target_return) + " is outside the achievable range [" +
                    std::to_string(range.first) + ", " + std::to_string(range.second) + "]");
            }

            // Minimize: (1/2) * w^T * (2 Sigma) * w  subject to mu^T w = target
            QuadraticProblem problem = build_problem(n, constraints);
            problem.P = 2.0 * solve_covariance;
            problem.q = Eigen::VectorXd::Zero(n);

            const int n_eq = problem.A_eq.rows();
            Eigen::MatrixXd A_eq(n_eq + 1, n);
            Eigen::VectorXd b_eq(n_eq + 1);
            if (n_eq > 0)
            {
                A_eq.topRows(n_eq) = problem.A_eq;
                b_eq.head(n_eq) = problem.b_eq;
            }
            A_eq.row(n_eq) = expected_returns.transpose();
            b_eq(n_eq) = std::clamp(target_return, range.first, range.second);
            problem.A_eq = A_eq;
            problem.b_eq = b_eq;

            // Weight clean-up would move the return off target; keep the raw solution
            OSQPSolver solver(solver_options_);
            SolverResult solver_result = solver.solve(problem);

            Eigen::VectorXd weights = solver_result.solution.cwiseMax(0.0);
            OptimizationResult result = calculate_statistics(
                weights, expected_returns, covariance, risk_free_rate_);
            result.success = solver_result.success;
            result.message = solver_result.message;
            result.iterations = solver_result.iterations;
            result.objective_value = solver_result.objective_value;

            return result;
        }

        OptimizationResult MeanVarianceOptimizer::optimize_risk_aversion(
            const Eigen::VectorXd &expected_returns,
            const Eigen::MatrixXd &solve_covariance,
            const Eigen::MatrixXd &covariance,
            const OptimizationConstraints &constraints,
            double lambda) const
        {
            const int n = expected_returns.size();

            if (lambda == 0.0 && constraints.group_constraints.empty())
            {
                // Pure return maximization is a linear program with an exact greedy solution
                Eigen::VectorXd weights = greedy_fill(expected_returns, covariance.diagonal(), constraints);

                OptimizationResult result = calculate_statistics(
                    weights, expected_returns, covariance, risk_free_rate_);
                result.risk_aversion = 0.0;
                result.objective_value = -result.expected_return;
                result.message = "Solved exactly (return maximization)";
                return result;
            }

            // Minimize: (1/2) * w^T * (2 Sigma) * w - (1/lambda) * mu^T * w
            QuadraticProblem problem = build_problem(n, constraints);
            if (lambda > 0.0)
            {
                problem.P = 2.0 * solve_covariance;
                problem.q = -expected_returns / lambda;
            }
            else
            {
                problem.P = Eigen::MatrixXd::Zero(n, n);
                problem.q = -expected_returns;
            }

            OptimizationResult result = solve_and_finalize(problem, expected_returns, covariance, constraints);
            result.risk_aversion = lambda;
            return result;
        }

        std::pair<double, double> MeanVarianceOptimizer::achievable_return_range(
            const Eigen::VectorXd &expected_returns,
            const OptimizationConstraints &constraints) const
        {
            const int n = expected_returns.size();
            const Eigen::VectorXd variances = Eigen::VectorXd::Zero(n);

            // Box and budget only: both extremes are greedy fills
            double min_return = greedy_fill(-expected_returns, variances, constraints).dot(expected_returns);
            double max_return = greedy_fill(expected_returns, variances, constraints).dot(expected_returns);

            if (constraints.group_constraints.empty())
            {
                return {min_return, max_return};
            }

            // Groups present: solve both linear programs
            OSQPSolver solver(solver_options_);
            QuadraticProblem problem = build_problem(n, constraints);
            problem.P = Eigen::MatrixXd::Zero(n, n);

            problem.q = expected_returns;
            SolverResult low = solver.solve(problem);
            problem.q = -expected_returns;
            SolverResult high = solver.solve(problem);

            if (low.success)
            {
                min_return = std::max(min_return, low.solution.dot(expected_returns));
            }
            if (high.success)
            {
                max_return = std::min(max_return, high.solution.dot(expected_returns));
            }

            return {min_return, max_return};
        }

        Eigen::VectorXd MeanVarianceOptimizer::greedy_fill(const Eigen::VectorXd &scores,
                                                           const Eigen::VectorXd &variances,
                                                           const OptimizationConstraints &constraints)
        {
            const int n = scores.size();

            std::vector<int> order(n);
            std::iota(order.begin(), order.end(), 0);
            std::stable_sort(order.begin(), order.end(), [&](int a, int b)
                             {
                                 if (scores(a) != scores(b))
                                     return scores(a) > scores(b);
                                 if (variances(a) != variances(b))
                                     return variances(a) < variances(b);
                                 return a < b; });

            Eigen::VectorXd weights = Eigen::VectorXd::Constant(n, constraints.min_weight);
            double remaining = constraints.budget - n * constraints.min_weight;
            const double headroom = constraints.max_weight - constraints.min_weight;

            for (int idx : order)
            {
                if (remaining <= 0.0)
                {
                    break;
                }

                // Without full investment, only positive scores are worth funding
                if (!constraints.fully_invested && scores(idx) <= 0.0)
                {
                    break;
                }

                const double add = std::min(headroom, remaining);
                weights(idx) += add;
                remaining -= add;
            }

            return weights;
        }

        QuadraticProblem MeanVarianceOptimizer::build_problem(int n, const OptimizationConstraints &constraints)
        {
            QuadraticProblem problem;

            if (constraints.fully_invested)
            {
                problem.A_eq = Eigen::MatrixXd::Ones(1, n);
                problem.b_eq = Eigen::VectorXd::Constant(1, constraints.budget);
            }

            const int n_groups = static_cast<int>(constraints.group_constraints.size());
            const int n_ineq = n_groups + (constraints.fully_invested ? 0 : 1);

            if (n_ineq > 0)
            {
                problem.A_ineq = Eigen::MatrixXd::Zero(n_ineq, n);
                problem.b_ineq_lower = Eigen::VectorXd(n_ineq);
                problem.b_ineq_upper = Eigen::VectorXd(n_ineq);

                int row = 0;
                if (!constraints.fully_invested)
                {
                    problem.A_ineq.row(row) = Eigen::RowVectorXd::Ones(n);
                    problem.b_ineq_lower(row) = -std::numeric_limits<double>::infinity();
                    problem.b_ineq_upper(row) = constraints.budget;
                    ++row;
                }

                for (const auto &group : constraints.group_constraints)
                {
                    for (int idx : group.asset_indices)
                    {
                        problem.A_ineq(row, idx) = 1.0;
                    }
                    problem.b_ineq_lower(row) = group.min_exposure;
                    problem.b_ineq_upper(row) = group.max_exposure;
                    ++row;
                }
            }

            problem.lower_bounds = Eigen::VectorXd::Constant(n, constraints.min_weight);
            problem.upper_bounds = Eigen::VectorXd::Constant(n, constraints.max_weight);

            return problem;
        }

        OptimizationResult MeanVarianceOptimizer::solve_and_finalize(
            const QuadraticProblem &problem,
            const Eigen::VectorXd &expected_returns,
            const Eigen::MatrixXd &covariance,
            const OptimizationConstraints &constraints) const
        {
            OSQPSolver solver(solver_options_);
            SolverResult solver_result = solver.solve(problem);

            Eigen::VectorXd weights = solver_result.success
                                          ? clean_weights(solver_result.solution, constraints)
                                          : solver_result.solution;

            OptimizationResult result = calculate_statistics(
                weights, expected_returns, covariance, risk_free_rate_);

            result.success = solver_result.success;
            result.message = solver_result.message;
            result.iterations = solver_result.iterations;
            result.objective_value = solver_result.objective_value;

            if (result.success && !check_constraints(weights, constraints, 1e-3))
            {
                result.success = false;
                result.message = "Solution violates constraints after clean-up";
            }

            return result;
        }

        Eigen::VectorXd MeanVarianceOptimizer::clean_weights(const Eigen::VectorXd &weights,
                                                             const OptimizationConstraints &constraints) const
        {
            // A positive min_weight already keeps every weight above the cutoff
            const double cutoff = constraints.min_weight > 0.0 ? 0.0 : weight_cutoff_;

            Eigen::VectorXd cleaned = weights.cwiseMax(0.0).cwiseMin(constraints.max_weight);
            for (int i = 0; i < cleaned.size(); ++i)
            {
                if (cleaned(i) < cutoff)
                {
                    cleaned(i) = 0.0;
                }
            }

            const double total = cleaned.sum();
            if (total > 0.0 && (constraints.fully_invested || total > constraints.budget))
            {
                cleaned *= constraints.budget / total;
            }

            return cleaned.cwiseMax(0.0).cwiseMin(1.0);
        }

    } // namespace optimizer
} // namespace allocation

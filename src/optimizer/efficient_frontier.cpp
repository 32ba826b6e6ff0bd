/**
 * @file efficient_frontier.cpp
 * @brief Implementation of efficient frontier computation
 */

#include "optimizer/efficient_frontier.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <limits>

namespace allocation
{
    namespace optimizer
    {

        namespace
        {
            constexpr double RETURN_TOLERANCE = 1e-9;

            void add_distinct_warnings(std::vector<Warning> &target, const std::vector<Warning> &source)
            {
                for (const auto &w : source)
                {
                    if (!has_warning(target, w.code))
                    {
                        target.push_back(w);
                    }
                }
            }
        } // namespace

        FrontierMethod parse_frontier_method(const std::string &name)
        {
            std::string normalized = name;
            std::transform(normalized.begin(), normalized.end(), normalized.begin(), [](unsigned char c)
                           { return std::tolower(c); });

            if (normalized == "risk_aversion" || normalized == "lambda")
            {
                return FrontierMethod::RISK_AVERSION;
            }
            else if (normalized == "target_return")
            {
                return FrontierMethod::TARGET_RETURN;
            }

            throw std::invalid_argument(
                "Unknown frontier method: '" + name + "'. Valid options: risk_aversion, target_return");
        }

        std::string to_string(FrontierMethod method)
        {
            switch (method)
            {
            case FrontierMethod::RISK_AVERSION:
                return "risk_aversion";
            case FrontierMethod::TARGET_RETURN:
                return "target_return";
            }
            return "unknown";
        }

        // ============================================================================
        // FrontierConfig Implementation
        // ============================================================================

        void FrontierConfig::validate() const
        {
            if (num_points < 2)
            {
                throw std::invalid_argument(
                    "Number of points must be at least 2, got: " + std::to_string(num_points));
            }
            if (!(min_lambda > 0.0) || !(max_lambda > 0.0) || !std::isfinite(max_lambda))
            {
                throw std::invalid_argument("Risk aversion range must be positive and finite");
            }
            if (min_lambda >= max_lambda)
            {
                throw std::invalid_argument("min_lambda must be less than max_lambda");
            }
        }

        FrontierConfig FrontierConfig::from_json(const nlohmann::json &j)
        {
            FrontierConfig config;
            config.num_points = j.value("num_points", config.num_points);
            config.min_lambda = j.value("min_lambda", config.min_lambda);
            config.max_lambda = j.value("max_lambda", config.max_lambda);
            config.include_return_maximizing = j.value("include_return_maximizing", config.include_return_maximizing);
            if (j.contains("method"))
            {
                config.method = parse_frontier_method(j.at("method").get<std::string>());
            }
            config.validate();
            return config;
        }

        nlohmann::json FrontierConfig::to_json() const
        {
            return nlohmann::json{
                {"num_points", num_points},
                {"min_lambda", min_lambda},
                {"max_lambda", max_lambda},
                {"include_return_maximizing", include_return_maximizing},
                {"method", to_string(method)}};
        }

        // ============================================================================
        // FrontierPoint Implementation
        // ============================================================================

        FrontierPoint::FrontierPoint()
            : expected_return(0.0),
              volatility(0.0),
              risk_aversion(0.0),
              is_valid(false)
        {
        }

        FrontierPoint::FrontierPoint(const OptimizationResult &result, const std::vector<std::string> &ids)
            : expected_return(result.expected_return),
              volatility(result.volatility),
              sharpe_ratio(result.sharpe_ratio),
              risk_aversion(result.risk_aversion),
              allocation(Allocation::from_weights(ids, result.weights)),
              is_valid(result.success)
        {
        }

        nlohmann::json FrontierPoint::to_json() const
        {
            nlohmann::json j;
            j["expected_return"] = expected_return;
            j["volatility"] = volatility;
            j["sharpe_ratio"] = sharpe_ratio ? nlohmann::json(*sharpe_ratio) : nlohmann::json(nullptr);
            j["risk_aversion"] = risk_aversion;
            j["allocation"] = allocation.to_json();
            return j;
        }

        // ============================================================================
        // EfficientFrontierResult Implementation
        // ============================================================================

        EfficientFrontierResult::EfficientFrontierResult()
            : success(false)
        {
        }

        bool EfficientFrontierResult::is_valid() const
        {
            return success && num_valid_points() > 0;
        }

        size_t EfficientFrontierResult::num_valid_points() const
        {
            return static_cast<size_t>(std::count_if(points.begin(), points.end(),
                                                     [](const FrontierPoint &p)
                                                     { return p.is_valid; }));
        }

        void EfficientFrontierResult::print_summary() const
        {
            auto print_point = [](const std::string &title, const FrontierPoint &point)
            {
                std::cout << "\n"
                          << title << ":\n";
                std::cout << "  Expected Return:  " << std::fixed << std::setprecision(4)
                          << point.expected_return << "\n";
                std::cout << "  Volatility:       " << point.volatility << "\n";
                std::cout << "  Sharpe Ratio:     ";
                if (point.sharpe_ratio)
                {
                    std::cout << std::setprecision(3) << *point.sharpe_ratio << "\n";
                }
                else
                {
                    std::cout << "undefined\n";
                }
            };

            std::cout << "\n=== Efficient Frontier Summary ===\n";
            std::cout << "Status: " << (success ? "SUCCESS" : "FAILED") << "\n";
            std::cout << "Message: " << message << "\n";
            std::cout << "Points: " << points.size() << "\n";
            std::cout << std::string(60, '-') << "\n";

            if (min_variance_portfolio.is_valid)
            {
                print_point("Minimum Variance Allocation", min_variance_portfolio);
            }

            if (max_sharpe_portfolio.is_valid)
            {
                print_point("Maximum Sharpe-like Allocation", max_sharpe_portfolio);
            }

            if (!points.empty())
            {
                std::cout << "\nFrontier Range:\n";
                std::cout << "  Return range:     " << std::fixed << std::setprecision(4)
                          << points.front().expected_return << " to " << points.back().expected_return << "\n";
                std::cout << "  Volatility range: "
                          << points.front().volatility << " to " << points.back().volatility << "\n";
            }

            std::cout << "================================\n"
                      << std::endl;
        }

        void EfficientFrontierResult::export_to_csv(const std::string &filepath) const
        {
            std::ofstream file(filepath);
            if (!file.is_open())
            {
                throw std::runtime_error("Could not open file for writing: " + filepath);
            }

            file << "return,volatility,sharpe_ratio,risk_aversion";
            if (!points.empty())
            {
                for (const auto &id : points.front().allocation.ids)
                {
                    file << "," << id;
                }
            }
            file << "\n";

            for (const auto &point : points)
            {
                file << std::fixed << std::setprecision(8)
                     << point.expected_return << ","
                     << point.volatility << ",";
                if (point.sharpe_ratio)
                {
                    file << *point.sharpe_ratio;
                }
                file << "," << point.risk_aversion;
                for (double w : point.allocation.weights)
                {
                    file << "," << w;
                }
                file << "\n";
            }
        }

        nlohmann::json EfficientFrontierResult::to_json() const
        {
            nlohmann::json j;
            j["success"] = success;
            j["message"] = message;

            j["points"] = nlohmann::json::array();
            for (const auto &point : points)
            {
                j["points"].push_back(point.to_json());
            }

            j["min_variance"] = min_variance_portfolio.is_valid ? min_variance_portfolio.to_json()
                                                                : nlohmann::json(nullptr);
            j["max_sharpe"] = max_sharpe_portfolio.is_valid ? max_sharpe_portfolio.to_json()
                                                            : nlohmann::json(nullptr);

            j["warnings"] = nlohmann::json::array();
            for (const auto &w : warnings)
            {
                j["warnings"].push_back(w.to_json());
            }
            return j;
        }

        // ============================================================================
        // EfficientFrontier Implementation
        // ============================================================================

        EfficientFrontier::EfficientFrontier(const FrontierConfig &config)
            : config_(config),
              condition_threshold_(1e8),
              weight_cutoff_(1e-4)
        {
            config_.validate();
            solver_options_.tolerance = 1e-7;
        }

        void EfficientFrontier::set_num_points(int num_points)
        {
            if (num_points < 2)
            {
                throw std::invalid_argument(
                    "Number of points must be at least 2, got: " + std::to_string(num_points));
            }
            config_.num_points = num_points;
        }

        void EfficientFrontier::set_risk_aversion_range(double min_lambda, double max_lambda)
        {
            FrontierConfig updated = config_;
            updated.min_lambda = min_lambda;
            updated.max_lambda = max_lambda;
            updated.validate();
            config_ = updated;
        }

        void EfficientFrontier::set_include_return_maximizing(bool include)
        {
            config_.include_return_maximizing = include;
        }

        void EfficientFrontier::set_method(FrontierMethod method)
        {
            config_.method = method;
        }

        void EfficientFrontier::set_condition_threshold(double threshold)
        {
            if (!(threshold > 1.0))
            {
                throw std::invalid_argument(
                    "Condition threshold must exceed 1, got: " + std::to_string(threshold));
            }
            condition_threshold_ = threshold;
        }

        void EfficientFrontier::set_weight_cutoff(double cutoff)
        {
            if (!(cutoff >= 0.0))
            {
                throw std::invalid_argument(
                    "Weight cutoff must be non-negative, got: " + std::to_string(cutoff));
            }
            weight_cutoff_ = cutoff;
        }

        void EfficientFrontier::set_solver_options(const SolverOptions &options)
        {
            options.validate();
            solver_options_ = options;
        }

        std::vector<double> EfficientFrontier::lambda_grid() const
        {
            std::vector<double> lambdas;
            lambdas.reserve(config_.num_points + 1);

            if (config_.include_return_maximizing)
            {
                lambdas.push_back(0.0);
            }

            // Log-space sampling for better coverage
            const double log_min = std::log(config_.min_lambda);
            const double log_max = std::log(config_.max_lambda);
            const double log_step = (log_max - log_min) / (config_.num_points - 1);

            for (int i = 0; i < config_.num_points; ++i)
            {
                lambdas.push_back(std::exp(log_min + i * log_step));
            }

            return lambdas;
        }

        MeanVarianceOptimizer EfficientFrontier::make_optimizer(ObjectiveType objective,
                                                                double risk_free_rate) const
        {
            MeanVarianceOptimizer optimizer(objective, risk_free_rate);
            optimizer.set_condition_threshold(condition_threshold_);
            optimizer.set_weight_cutoff(weight_cutoff_);
            optimizer.set_solver_options(solver_options_);
            return optimizer;
        }

        void EfficientFrontier::validate_inputs(
            const std::vector<std::string> &ids,
            const Eigen::VectorXd &expected_returns,
            const Eigen::MatrixXd &covariance,
            const OptimizationConstraints &constraints) const
        {
            OptimizerInterface::validate_inputs(expected_returns, covariance);
            if (static_cast<Eigen::Index>(ids.size()) != expected_returns.size())
            {
                throw std::invalid_argument(
                    "Frontier got " + std::to_string(ids.size()) + " ids for " +
                    std::to_string(expected_returns.size()) + " returns");
            }
            constraints.check_feasibility(static_cast<int>(expected_returns.size()));
        }

        EfficientFrontierResult EfficientFrontier::compute(
            const std::vector<std::string> &ids,
            const Eigen::VectorXd &expected_returns,
            const Eigen::MatrixXd &covariance,
            const OptimizationConstraints &constraints,
            double risk_free_rate) const
        {
            if (config_.method == FrontierMethod::TARGET_RETURN)
            {
                return compute_via_target_return(ids, expected_returns, covariance, constraints, risk_free_rate);
            }
            return compute_via_risk_aversion(ids, expected_returns, covariance, constraints, risk_free_rate);
        }

        EfficientFrontierResult EfficientFrontier::compute_via_risk_aversion(
            const std::vector<std::string> &ids,
            const Eigen::VectorXd &expected_returns,
            const Eigen::MatrixXd &covariance,
            const OptimizationConstraints &constraints,
            double risk_free_rate) const
        {
            validate_inputs(ids, expected_returns, covariance, constraints);

            EfficientFrontierResult result;
            MeanVarianceOptimizer optimizer = make_optimizer(ObjectiveType::RISK_AVERSION, risk_free_rate);

            for (double lambda : lambda_grid())
            {
                optimizer.set_risk_aversion(lambda);

                try
                {
                    OptimizationResult opt_result = optimizer.optimize(
                        expected_returns, covariance, constraints);
                    add_distinct_warnings(result.warnings, opt_result.warnings);
                    result.points.emplace_back(opt_result, ids);
                }
                catch (const std::runtime_error &)
                {
                    // Numerical failure at one grid point does not invalidate the sweep
                    result.points.emplace_back();
                }
            }

            finalize(result, ids, expected_returns, covariance, constraints, risk_free_rate);
            return result;
        }

        EfficientFrontierResult EfficientFrontier::compute_via_target_return(
            const std::vector<std::string> &ids,
            const Eigen::VectorXd &expected_returns,
            const Eigen::MatrixXd &covariance,
            const OptimizationConstraints &constraints,
            double risk_free_rate) const
        {
            validate_inputs(ids, expected_returns, covariance, constraints);

            EfficientFrontierResult result;
            MeanVarianceOptimizer optimizer = make_optimizer(ObjectiveType::TARGET_RETURN, risk_free_rate);

            const auto range = optimizer.achievable_return_range(expected_returns, constraints);
            const double return_step = (range.second - range.first) / (config_.num_points - 1);

            for (int i = 0; i < config_.num_points; ++i)
            {
                const double target_return = (i == config_.num_points - 1)
                                                 ? range.second
                                                 : range.first + i * return_step;
                optimizer.set_target_return(target_return);

                try
                {
                    OptimizationResult opt_result = optimizer.optimize(
                        expected_returns, covariance, constraints);
                    add_distinct_warnings(result.warnings, opt_result.warnings);
                    result.points.emplace_back(opt_result, ids);
                }
                catch (const std::runtime_error &)
                {
                    result.points.emplace_back();
                }
            }

            finalize(result, ids, expected_returns, covariance, constraints, risk_free_rate);
            return result;
        }

        void EfficientFrontier::finalize(EfficientFrontierResult &result,
                                         const std::vector<std::string> &ids,
                                         const Eigen::VectorXd &expected_returns,
                                         const Eigen::MatrixXd &covariance,
                                         const OptimizationConstraints &constraints,
                                         double risk_free_rate) const
        {
            retain_non_dominated(result.points);

            result.min_variance_portfolio = compute_min_variance_portfolio(
                ids, expected_returns, covariance, constraints, risk_free_rate);

            for (const auto &point : result.points)
            {
                if (!point.sharpe_ratio)
                {
                    continue;
                }
                if (!result.max_sharpe_portfolio.is_valid ||
                    *point.sharpe_ratio > *result.max_sharpe_portfolio.sharpe_ratio)
                {
                    result.max_sharpe_portfolio = point;
                }
            }

            result.success = result.num_valid_points() > 0;
            result.message = result.success ? "Efficient frontier computed successfully"
                                            : "Failed to compute efficient frontier";
        }

        FrontierPoint EfficientFrontier::compute_min_variance_portfolio(
            const std::vector<std::string> &ids,
            const Eigen::VectorXd &expected_returns,
            const Eigen::MatrixXd &covariance,
            const OptimizationConstraints &constraints,
            double risk_free_rate) const
        {
            MeanVarianceOptimizer optimizer = make_optimizer(ObjectiveType::MIN_VARIANCE, risk_free_rate);

            try
            {
                OptimizationResult result = optimizer.optimize(expected_returns, covariance, constraints);
                return FrontierPoint(result, ids);
            }
            catch (const std::runtime_error &)
            {
                return FrontierPoint();
            }
        }

        void EfficientFrontier::retain_non_dominated(std::vector<FrontierPoint> &points)
        {
            std::vector<FrontierPoint> valid;
            valid.reserve(points.size());
            for (auto &point : points)
            {
                if (point.is_valid)
                {
                    valid.push_back(std::move(point));
                }
            }

            // Increasing risk; at equal risk the higher return comes first
            std::stable_sort(valid.begin(), valid.end(),
                             [](const FrontierPoint &a, const FrontierPoint &b)
                             {
                                 if (a.volatility != b.volatility)
                                     return a.volatility < b.volatility;
                                 return a.expected_return > b.expected_return;
                             });

            // Sweep: a point survives only if it beats every lower-risk return
            std::vector<FrontierPoint> retained;
            retained.reserve(valid.size());
            double best_return = -std::numeric_limits<double>::infinity();

            for (auto &point : valid)
            {
                const double tolerance = RETURN_TOLERANCE * std::max(1.0, std::abs(point.expected_return));
                if (point.expected_return > best_return + tolerance)
                {
                    best_return = point.expected_return;
                    retained.push_back(std::move(point));
                }
            }

            points = std::move(retained);
        }

    } // namespace optimizer
} // namespace allocation

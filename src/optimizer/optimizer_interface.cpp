/**
 * @file optimizer_interface.cpp
 * @brief Implementation of optimizer interface and common structures
 */

#include "optimizer/optimizer_interface.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <set>
#include <unordered_map>

namespace allocation
{
    namespace optimizer
    {

        namespace
        {
            constexpr double FEASIBILITY_TOLERANCE = 1e-9;
        } // namespace

        // ============================================================================
        // GroupConstraint Implementation
        // ============================================================================

        void GroupConstraint::validate() const
        {
            if (members.empty() && asset_indices.empty())
            {
                throw std::invalid_argument("GroupConstraint '" + name + "' has no members");
            }

            if (min_exposure < 0.0 || min_exposure > 1.0)
            {
                throw std::invalid_argument("GroupConstraint '" + name + "' has invalid min_exposure: " + std::to_string(min_exposure));
            }

            if (max_exposure < 0.0 || max_exposure > 1.0)
            {
                throw std::invalid_argument("GroupConstraint '" + name + "' has invalid max_exposure: " + std::to_string(max_exposure));
            }

            if (min_exposure > max_exposure)
            {
                throw InfeasibleError("GroupConstraint '" + name + "' min_exposure (" + std::to_string(min_exposure) +
                                      ") exceeds max_exposure (" + std::to_string(max_exposure) + ")");
            }

            std::set<std::string> unique_members(members.begin(), members.end());
            std::set<int> unique_indices(asset_indices.begin(), asset_indices.end());
            if (unique_members.size() != members.size() || unique_indices.size() != asset_indices.size())
            {
                throw std::invalid_argument("GroupConstraint '" + name + "' contains duplicate members");
            }
        }

        nlohmann::json GroupConstraint::to_json() const
        {
            nlohmann::json j{
                {"name", name},
                {"min_exposure", min_exposure},
                {"max_exposure", max_exposure}};

            if (!members.empty())
            {
                j["members"] = members;
            }
            else
            {
                j["assets"] = asset_indices;
            }
            return j;
        }

        GroupConstraint GroupConstraint::from_json(const nlohmann::json &j)
        {
            GroupConstraint gc;
            gc.name = j.at("name").get<std::string>();

            if (j.contains("members"))
            {
                gc.members = j.at("members").get<std::vector<std::string>>();
            }
            if (j.contains("assets"))
            {
                gc.asset_indices = j.at("assets").get<std::vector<int>>();
            }

            gc.min_exposure = j.value("min_exposure", 0.0);
            gc.max_exposure = j.value("max_exposure", 1.0);

            gc.validate();
            return gc;
        }

        // ============================================================================
        // OptimizationConstraints Implementation
        // ============================================================================

        void OptimizationConstraints::validate() const
        {
            if (min_weight < 0.0)
            {
                throw std::invalid_argument(
                    "min_weight must be non-negative (no short positions), got: " +
                    std::to_string(min_weight));
            }

            if (max_weight <= 0.0 || max_weight > 1.0)
            {
                throw std::invalid_argument(
                    "max_weight must be in (0, 1], got: " + std::to_string(max_weight));
            }

            if (budget <= 0.0 || budget > 1.0)
            {
                throw std::invalid_argument(
                    "budget must be in (0, 1] (no leverage), got: " + std::to_string(budget));
            }

            if (min_weight > max_weight)
            {
                throw InfeasibleError(
                    "min_weight (" + std::to_string(min_weight) +
                    ") exceeds max_weight (" + std::to_string(max_weight) + ")");
            }

            for (const auto &group : group_constraints)
            {
                group.validate();
            }
        }

        void OptimizationConstraints::check_feasibility(int n) const
        {
            if (n <= 0)
            {
                throw InfeasibleError("no candidates to allocate");
            }

            validate();

            const double floor_total = n * min_weight;
            const double cap_total = n * max_weight;

            if (floor_total > budget + FEASIBILITY_TOLERANCE)
            {
                throw InfeasibleError(
                    std::to_string(n) + " candidates at min_weight " + std::to_string(min_weight) +
                    " exceed the budget " + std::to_string(budget));
            }

            if (fully_invested && cap_total < budget - FEASIBILITY_TOLERANCE)
            {
                throw InfeasibleError(
                    std::to_string(n) + " candidates at max_weight " + std::to_string(max_weight) +
                    " cannot reach the budget " + std::to_string(budget));
            }

            for (const auto &group : group_constraints)
            {
                const int k = static_cast<int>(group.asset_indices.size());
                if (k == 0 && !group.members.empty())
                {
                    throw std::invalid_argument(
                        "GroupConstraint '" + group.name + "' members have not been resolved to indices");
                }

                for (int idx : group.asset_indices)
                {
                    if (idx < 0 || idx >= n)
                    {
                        throw std::invalid_argument(
                            "GroupConstraint '" + group.name + "' index out of range: " + std::to_string(idx));
                    }
                }

                if (k * min_weight > group.max_exposure + FEASIBILITY_TOLERANCE)
                {
                    throw InfeasibleError("group '" + group.name + "' max_exposure is below its members' min_weight total");
                }

                if (k * max_weight < group.min_exposure - FEASIBILITY_TOLERANCE)
                {
                    throw InfeasibleError("group '" + group.name + "' min_exposure is above its members' max_weight total");
                }

                if (group.min_exposure > budget + FEASIBILITY_TOLERANCE)
                {
                    throw InfeasibleError("group '" + group.name + "' min_exposure exceeds the budget");
                }

                if (fully_invested &&
                    (n - k) * max_weight + group.max_exposure < budget - FEASIBILITY_TOLERANCE)
                {
                    throw InfeasibleError("group '" + group.name + "' max_exposure leaves the budget unreachable");
                }
            }
        }

        OptimizationConstraints OptimizationConstraints::resolve_groups(const std::vector<std::string> &ids) const
        {
            std::unordered_map<std::string, int> index;
            for (int i = 0; i < static_cast<int>(ids.size()); ++i)
            {
                index[ids[i]] = i;
            }

            OptimizationConstraints resolved = *this;
            for (auto &group : resolved.group_constraints)
            {
                if (group.members.empty())
                {
                    continue;
                }

                group.asset_indices.clear();
                for (const auto &id : group.members)
                {
                    auto it = index.find(id);
                    if (it == index.end())
                    {
                        throw std::invalid_argument(
                            "GroupConstraint '" + group.name + "' references unknown candidate '" + id + "'");
                    }
                    group.asset_indices.push_back(it->second);
                }
            }
            return resolved;
        }

        OptimizationConstraints OptimizationConstraints::from_json(const nlohmann::json &j)
        {
            OptimizationConstraints constraints;

            constraints.min_weight = j.value("min_weight", 0.0);
            constraints.max_weight = j.value("max_weight", 1.0);
            constraints.budget = j.value("budget", 1.0);
            constraints.fully_invested = j.value("fully_invested", true);

            if (j.contains("group_constraints"))
            {
                for (const auto &g : j.at("group_constraints"))
                {
                    constraints.group_constraints.push_back(GroupConstraint::from_json(g));
                }
            }

            constraints.validate();
            return constraints;
        }

        nlohmann::json OptimizationConstraints::to_json() const
        {
            nlohmann::json groups = nlohmann::json::array();
            for (const auto &g : group_constraints)
            {
                groups.push_back(g.to_json());
            }

            return nlohmann::json{
                {"min_weight", min_weight},
                {"max_weight", max_weight},
                {"budget", budget},
                {"fully_invested", fully_invested},
                {"group_constraints", groups}};
        }

        // ============================================================================
        // OptimizationResult Implementation
        // ============================================================================

        bool OptimizationResult::is_valid() const
        {
            if (!success)
                return false;
            if (weights.size() == 0)
                return false;
            if (!weights.allFinite())
                return false;
            if (volatility < 0.0)
                return false;

            return true;
        }

        void OptimizationResult::print_summary() const
        {
            std::cout << "\n=== Optimization Result ===\n";
            std::cout << "Status: " << (success ? "SUCCESS" : "FAILED") << "\n";
            std::cout << "Message: " << message << "\n";
            std::cout << "Iterations: " << iterations << "\n";
            std::cout << std::string(50, '-') << "\n";

            if (success && weights.size() > 0)
            {
                std::cout << "Allocation Statistics:\n";
                std::cout << "  Risk Aversion:    " << std::fixed << std::setprecision(4)
                          << risk_aversion << "\n";
                std::cout << "  Expected Return:  " << expected_return << "\n";
                std::cout << "  Volatility:       " << volatility << "\n";
                std::cout << "  Sharpe Ratio:     ";
                if (sharpe_ratio)
                {
                    std::cout << std::setprecision(3) << *sharpe_ratio << "\n";
                }
                else
                {
                    std::cout << "undefined\n";
                }

                std::cout << "\nWeight Statistics:\n";
                std::cout << "  Candidates:       " << weights.size() << "\n";
                std::cout << "  Sum of weights:   " << std::setprecision(4)
                          << weights.sum() << "\n";
                std::cout << "  Max weight:       " << weights.maxCoeff() << "\n";

                int non_zero = 0;
                for (int i = 0; i < weights.size(); ++i)
                {
                    if (weights(i) > 1e-6)
                    {
                        ++non_zero;
                    }
                }
                std::cout << "  Selected:         " << non_zero << "\n";
            }

            std::cout << "===========================\n"
                      << std::endl;
        }

        nlohmann::json OptimizationResult::to_json() const
        {
            nlohmann::json j;
            j["weights"] = std::vector<double>(weights.data(), weights.data() + weights.size());
            j["expected_return"] = expected_return;
            j["volatility"] = volatility;
            j["sharpe_ratio"] = sharpe_ratio ? nlohmann::json(*sharpe_ratio) : nlohmann::json(nullptr);
            j["risk_aversion"] = risk_aversion;
            j["success"] = success;
            j["message"] = message;
            j["iterations"] = iterations;

            nlohmann::json warns = nlohmann::json::array();
            for (const auto &w : warnings)
            {
                warns.push_back(w.to_json());
            }
            j["warnings"] = warns;
            return j;
        }

        // ============================================================================
        // OptimizerInterface Methods
        // ============================================================================

        void OptimizerInterface::validate_inputs(
            const Eigen::VectorXd &expected_returns,
            const Eigen::MatrixXd &covariance)
        {
            if (expected_returns.size() == 0)
            {
                throw InfeasibleError("expected returns vector is empty");
            }

            if (expected_returns.size() != covariance.rows() ||
                expected_returns.size() != covariance.cols())
            {
                throw std::invalid_argument(
                    "Dimension mismatch: expected returns size (" +
                    std::to_string(expected_returns.size()) +
                    ") does not match covariance dimensions (" +
                    std::to_string(covariance.rows()) + "x" +
                    std::to_string(covariance.cols()) + ")");
            }

            if (!expected_returns.allFinite())
            {
                throw std::invalid_argument("Expected returns contain NaN or Inf values");
            }

            if (!covariance.allFinite())
            {
                throw std::invalid_argument("Covariance matrix contains NaN or Inf values");
            }

            const double scale = std::max(1.0, covariance.cwiseAbs().maxCoeff());

            double asymmetry = (covariance - covariance.transpose()).cwiseAbs().maxCoeff();
            if (asymmetry > 1e-8 * scale)
            {
                throw std::invalid_argument(
                    "Covariance matrix is not symmetric (max asymmetry: " +
                    std::to_string(asymmetry) + ")");
            }

            Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd> solver(covariance, Eigen::EigenvaluesOnly);
            double min_eigenvalue = solver.eigenvalues().minCoeff();
            if (min_eigenvalue < -1e-8 * scale)
            {
                throw std::invalid_argument(
                    "Covariance matrix is not positive semi-definite (min eigenvalue: " +
                    std::to_string(min_eigenvalue) + ")");
            }
        }

        bool OptimizerInterface::check_constraints(
            const Eigen::VectorXd &weights,
            const OptimizationConstraints &constraints,
            double tolerance)
        {
            const int n = weights.size();

            for (int i = 0; i < n; ++i)
            {
                if (weights(i) < constraints.min_weight - tolerance ||
                    weights(i) > constraints.max_weight + tolerance)
                {
                    return false;
                }
            }

            const double sum = weights.sum();
            if (sum > constraints.budget + tolerance)
            {
                return false;
            }
            if (constraints.fully_invested && std::abs(sum - constraints.budget) > tolerance)
            {
                return false;
            }

            for (const auto &group : constraints.group_constraints)
            {
                double exposure = 0.0;
                for (int idx : group.asset_indices)
                {
                    exposure += weights(idx);
                }
                if (exposure < group.min_exposure - tolerance || exposure > group.max_exposure + tolerance)
                {
                    return false;
                }
            }

            return true;
        }

        OptimizationResult OptimizerInterface::calculate_statistics(
            const Eigen::VectorXd &weights,
            const Eigen::VectorXd &expected_returns,
            const Eigen::MatrixXd &covariance,
            double risk_free_rate)
        {
            OptimizationResult result;
            result.weights = weights;
            result.success = true;

            result.expected_return = weights.dot(expected_returns);

            const double variance = weights.dot(covariance * weights);
            result.volatility = std::sqrt(std::max(0.0, variance));

            // Sharpe-like ratio is undefined, not infinite, at zero risk
            if (result.volatility > 1e-12)
            {
                result.sharpe_ratio = (result.expected_return - risk_free_rate) / result.volatility;
            }

            result.objective_value = variance;

            return result;
        }

    } // namespace optimizer
} // namespace allocation

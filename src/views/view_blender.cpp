/**
 * @file view_blender.cpp
 * @brief Implementation of Black-Litterman view blending
 */

#include "views/view_blender.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <unordered_map>

namespace allocation
{
    namespace views
    {

        namespace
        {
            constexpr double SINGULAR_TOLERANCE = 1e-12;
        } // namespace

        // ============================================================================
        // BlenderConfig Implementation
        // ============================================================================

        void BlenderConfig::validate() const
        {
            if (!(tau > 0.0) || !std::isfinite(tau))
            {
                throw std::invalid_argument("Blender tau must be positive, got: " + std::to_string(tau));
            }

            if (!(tikhonov_epsilon > 0.0))
            {
                throw std::invalid_argument(
                    "Blender tikhonov_epsilon must be positive, got: " + std::to_string(tikhonov_epsilon));
            }

            if (market_risk_aversion < 0.0)
            {
                throw std::invalid_argument(
                    "market_risk_aversion must be non-negative, got: " + std::to_string(market_risk_aversion));
            }
        }

        BlenderConfig BlenderConfig::from_json(const nlohmann::json &j)
        {
            BlenderConfig config;
            config.tau = j.value("tau", 0.05);
            config.tikhonov_epsilon = j.value("tikhonov_epsilon", 1e-8);
            config.use_implied_prior = j.value("use_implied_prior", false);
            config.market_risk_aversion = j.value("market_risk_aversion", 2.5);
            config.use_posterior_covariance = j.value("use_posterior_covariance", false);

            config.validate();
            return config;
        }

        nlohmann::json BlenderConfig::to_json() const
        {
            return nlohmann::json{
                {"tau", tau},
                {"tikhonov_epsilon", tikhonov_epsilon},
                {"use_implied_prior", use_implied_prior},
                {"market_risk_aversion", market_risk_aversion},
                {"use_posterior_covariance", use_posterior_covariance}};
        }

        nlohmann::json BlendResult::to_json() const
        {
            nlohmann::json j;
            j["posterior_returns"] = std::vector<double>(posterior_returns.data(),
                                                         posterior_returns.data() + posterior_returns.size());
            j["effective_views"] = effective_views;

            nlohmann::json warns = nlohmann::json::array();
            for (const auto &w : warnings)
            {
                warns.push_back(w.to_json());
            }
            j["warnings"] = warns;
            return j;
        }

        // ============================================================================
        // ViewBlender Implementation
        // ============================================================================

        ViewBlender::ViewBlender(const BlenderConfig &config) : config_(config)
        {
            config_.validate();
        }

        BlendResult ViewBlender::blend(const std::vector<std::string> &ids,
                                       const Eigen::VectorXd &prior,
                                       const Eigen::MatrixXd &covariance,
                                       const std::vector<View> &views) const
        {
            const int n = static_cast<int>(prior.size());

            if (n == 0)
            {
                throw std::invalid_argument("Prior return vector is empty");
            }

            if (static_cast<int>(ids.size()) != n || covariance.rows() != n || covariance.cols() != n)
            {
                throw std::invalid_argument(
                    "Dimension mismatch: " + std::to_string(ids.size()) + " ids, prior of size " +
                    std::to_string(n) + ", covariance " + std::to_string(covariance.rows()) + "x" +
                    std::to_string(covariance.cols()));
            }

            if (!prior.allFinite() || !covariance.allFinite())
            {
                throw std::invalid_argument("Prior or covariance contains NaN or Inf values");
            }

            BlendResult result;
            result.posterior_returns = prior;
            result.posterior_covariance = covariance;

            // Step 1: Build P, Q and the diagonal of Omega from effective views
            std::vector<Eigen::RowVectorXd> rows;
            std::vector<double> q_values;
            std::vector<double> omega_diag;

            const double avg_variance = std::max(covariance.trace() / n, 0.0);

            for (const auto &view : views)
            {
                view.validate();
                Eigen::RowVectorXd p = pick_row(view, ids);

                if (view.confidence <= 0.0)
                {
                    // Infinite uncertainty: the view carries no information
                    continue;
                }

                const Eigen::VectorXd pt = p.transpose();
                const double view_variance = std::max(pt.dot(covariance * pt), 0.0);
                double omega = config_.tau * view_variance * (1.0 - view.confidence) / view.confidence;

                // Relative floor, or an absolute one when every variance is zero
                const double scale = config_.tau * std::max(view_variance, avg_variance);
                double floor = config_.tikhonov_epsilon * (scale > 0.0 ? scale : 1.0);
                if (!std::isfinite(1.0 / floor))
                {
                    floor = config_.tikhonov_epsilon;
                }
                if (omega < floor)
                {
                    omega = floor;
                    result.warnings.push_back(
                        {WarningCode::SINGULAR_BLEND,
                         "View uncertainty is zero (confidence " + std::to_string(view.confidence) +
                             "); Tikhonov floor applied"});
                }

                rows.push_back(p);
                q_values.push_back(view.value);
                omega_diag.push_back(omega);
            }

            result.effective_views = static_cast<int>(rows.size());
            if (rows.empty())
            {
                return result;
            }

            const int k = static_cast<int>(rows.size());
            Eigen::MatrixXd P(k, n);
            Eigen::VectorXd Q(k);
            Eigen::VectorXd omega_inv(k);
            for (int i = 0; i < k; ++i)
            {
                P.row(i) = rows[i];
                Q(i) = q_values[i];
                omega_inv(i) = 1.0 / omega_diag[i];
            }

            // Step 2: (tau*Sigma)^-1, regularized if singular
            Eigen::MatrixXd prior_precision = regularized_inverse(config_.tau * covariance,
                                                                  "tau * covariance",
                                                                  result.warnings);

            // Step 3: Posterior precision and mean
            Eigen::MatrixXd view_precision = P.transpose() * omega_inv.asDiagonal() * P;
            Eigen::MatrixXd posterior_precision = prior_precision + view_precision;
            posterior_precision = 0.5 * (posterior_precision + posterior_precision.transpose());

            Eigen::MatrixXd M = regularized_inverse(posterior_precision, "posterior precision",
                                                    result.warnings);

            Eigen::VectorXd rhs = prior_precision * prior + P.transpose() * omega_inv.asDiagonal() * Q;
            result.posterior_returns = M * rhs;

            result.posterior_covariance = covariance + M;
            result.posterior_covariance = 0.5 * (result.posterior_covariance +
                                                 result.posterior_covariance.transpose());

            if (!result.posterior_returns.allFinite())
            {
                throw std::runtime_error("View blending produced non-finite posterior returns");
            }

            return result;
        }

        Eigen::VectorXd ViewBlender::implied_prior_returns(const Eigen::VectorXd &market_weights,
                                                           const Eigen::MatrixXd &covariance,
                                                           double risk_aversion)
        {
            if (market_weights.size() != covariance.rows() || covariance.rows() != covariance.cols())
            {
                throw std::invalid_argument("Dimension mismatch in implied prior calculation");
            }

            return risk_aversion * covariance * market_weights;
        }

        Eigen::RowVectorXd ViewBlender::pick_row(const View &view,
                                                 const std::vector<std::string> &ids)
        {
            std::unordered_map<std::string, int> index;
            for (int i = 0; i < static_cast<int>(ids.size()); ++i)
            {
                index[ids[i]] = i;
            }

            auto lookup = [&index](const std::string &id)
            {
                auto it = index.find(id);
                if (it == index.end())
                {
                    throw std::invalid_argument("View references unknown candidate '" + id + "'");
                }
                return it->second;
            };

            Eigen::RowVectorXd p = Eigen::RowVectorXd::Zero(static_cast<int>(ids.size()));

            // Equal weight across the target group
            const double long_weight = 1.0 / static_cast<double>(view.targets.size());
            for (const auto &id : view.targets)
            {
                p(lookup(id)) += long_weight;
            }

            if (view.type == ViewType::RELATIVE)
            {
                const double short_weight = 1.0 / static_cast<double>(view.against.size());
                for (const auto &id : view.against)
                {
                    p(lookup(id)) -= short_weight;
                }
            }

            return p;
        }

        Eigen::MatrixXd ViewBlender::regularized_inverse(const Eigen::MatrixXd &matrix,
                                                         const std::string &label,
                                                         std::vector<Warning> &warnings) const
        {
            const int n = matrix.rows();
            Eigen::MatrixXd symmetric = 0.5 * (matrix + matrix.transpose());

            Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd> solver(symmetric, Eigen::EigenvaluesOnly);
            if (solver.info() != Eigen::Success)
            {
                throw std::runtime_error("Eigen decomposition failed while inverting " + label);
            }

            const double max_eig = solver.eigenvalues().maxCoeff();
            const double min_eig = solver.eigenvalues().minCoeff();

            if (max_eig > 0.0 && min_eig > max_eig * SINGULAR_TOLERANCE)
            {
                return symmetric.ldlt().solve(Eigen::MatrixXd::Identity(n, n));
            }

            const double scale = max_eig > 0.0 ? max_eig : 1.0;
            const double ridge = config_.tikhonov_epsilon * scale + std::max(-min_eig, 0.0);
            warnings.push_back({WarningCode::SINGULAR_BLEND,
                                label + " is singular beyond tolerance; added ridge " + std::to_string(ridge)});

            symmetric.diagonal().array() += ridge;
            return symmetric.ldlt().solve(Eigen::MatrixXd::Identity(n, n));
        }

    } // namespace views
} // namespace allocation

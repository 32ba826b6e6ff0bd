/**
 * @file view_blender.hpp
 * @brief Black-Litterman blending of a prior return vector with subjective views
 *
 * Posterior returns:
 *   mu_post = ((tau*Sigma)^-1 + P' Omega^-1 P)^-1 ((tau*Sigma)^-1 pi + P' Omega^-1 Q)
 *
 * Posterior covariance:
 *   Sigma_post = Sigma + ((tau*Sigma)^-1 + P' Omega^-1 P)^-1
 *
 * Where:
 *   pi:    Prior returns (N x 1)
 *   Sigma: Covariance (N x N)
 *   P:     View pick matrix (K x N), one row per effective view
 *   Q:     View values (K x 1)
 *   Omega: Diagonal view uncertainty, Omega_kk = tau * p_k Sigma p_k' * (1 - c_k) / c_k
 *
 * A view with confidence 0 carries infinite uncertainty and is dropped.
 * A view with confidence 1 has zero uncertainty; its Omega entry is floored
 * (Tikhonov) and SINGULAR_BLEND is recorded. The same floor is applied to
 * (tau*Sigma) when it is singular.
 */

#pragma once

#include "core/candidate.hpp"
#include "core/diagnostics.hpp"
#include <Eigen/Dense>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace allocation
{
    namespace views
    {

        /**
         * @struct BlenderConfig
         * @brief Parameters of the view blender
         */
        struct BlenderConfig
        {
            double tau = 0.05;                 ///< Uncertainty scale of the prior
            double tikhonov_epsilon = 1e-8;    ///< Relative ridge for singular inverses
            bool use_implied_prior = false;    ///< Replace prior with delta * Sigma * w_mkt
            double market_risk_aversion = 2.5; ///< delta for the implied prior
            bool use_posterior_covariance = false; ///< Optimize with Sigma_post instead of Sigma

            /**
             * @brief Validate parameters
             * @throws std::invalid_argument if tau or epsilon are non-positive
             */
            void validate() const;

            static BlenderConfig from_json(const nlohmann::json &j);
            nlohmann::json to_json() const;
        };

        /**
         * @struct BlendResult
         * @brief Posterior distribution after blending views
         */
        struct BlendResult
        {
            Eigen::VectorXd posterior_returns;
            Eigen::MatrixXd posterior_covariance;
            int effective_views = 0; ///< Views with non-zero confidence
            std::vector<Warning> warnings;

            nlohmann::json to_json() const;
        };

        /**
         * @class ViewBlender
         * @brief Stateless Black-Litterman view blender
         *
         * Usage Example:
         * @code
         * ViewBlender blender(BlenderConfig{});
         * auto blend = blender.blend(ids, prior, covariance, views);
         * @endcode
         */
        class ViewBlender
        {
        public:
            explicit ViewBlender(const BlenderConfig &config = BlenderConfig());

            /**
             * @brief Blend views into the prior
             * @param ids Candidate ids in index order (resolve view targets)
             * @param prior Prior return vector pi (N x 1)
             * @param covariance Covariance Sigma (N x N)
             * @param views Views to blend (may be empty)
             * @return BlendResult; prior and Sigma unchanged when no view is effective
             * @throws std::invalid_argument on dimension mismatch, invalid views
             *         or view targets that are not in ids
             */
            BlendResult blend(const std::vector<std::string> &ids,
                              const Eigen::VectorXd &prior,
                              const Eigen::MatrixXd &covariance,
                              const std::vector<View> &views) const;

            /**
             * @brief Market-implied equilibrium returns pi = delta * Sigma * w
             * @throws std::invalid_argument on dimension mismatch
             */
            static Eigen::VectorXd implied_prior_returns(const Eigen::VectorXd &market_weights,
                                                         const Eigen::MatrixXd &covariance,
                                                         double risk_aversion);

            const BlenderConfig &get_config() const { return config_; }

        private:
            BlenderConfig config_;

            /**
             * @brief Build one pick-matrix row for a view
             */
            static Eigen::RowVectorXd pick_row(const View &view,
                                               const std::vector<std::string> &ids);

            /**
             * @brief Symmetric inverse with Tikhonov fallback
             * @param matrix Symmetric PSD matrix
             * @param label Name used in the warning message
             * @param warnings Receives SINGULAR_BLEND if a ridge was needed
             */
            Eigen::MatrixXd regularized_inverse(const Eigen::MatrixXd &matrix,
                                                const std::string &label,
                                                std::vector<Warning> &warnings) const;
        };

    } // namespace views
} // namespace allocation

/**
 * @file risk_return_estimator.hpp
 * @brief Turns scored candidates into an expected-return vector and covariance
 *
 * Covariance is assembled as Sigma_ij = sigma_i * sigma_j * rho_ij, where
 * sigma is the candidate risk estimate and rho comes from a pluggable
 * CorrelationModel. The correlation is cleaned before use:
 * - symmetrised, clamped to [-1, 1], unit diagonal
 * - if not PSD, eigenvalues are clipped at zero and the result is
 *   rescaled back to a unit diagonal (CORRELATION_REPAIRED)
 *
 * Thus the diagonal of the covariance always equals risk squared.
 */

#pragma once

#include "core/candidate.hpp"
#include "core/diagnostics.hpp"
#include "risk/correlation_model.hpp"
#include <Eigen/Dense>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace allocation
{
    namespace risk
    {

        /**
         * @struct RiskReturnEstimate
         * @brief Expected returns and covariance for one candidate set
         */
        struct RiskReturnEstimate
        {
            std::vector<std::string> ids;     ///< Candidate ids, index order
            Eigen::VectorXd expected_returns; ///< Scored alpha per candidate
            Eigen::MatrixXd covariance;       ///< N x N, symmetric PSD
            Eigen::MatrixXd correlation;      ///< N x N, unit diagonal
            std::vector<Warning> warnings;

            nlohmann::json to_json() const;
        };

        /**
         * @class RiskReturnEstimator
         * @brief Stateless estimator of returns and covariance
         *
         * Usage Example:
         * @code
         * RiskReturnEstimator estimator(std::make_shared<FeatureDistanceCorrelation>());
         * auto estimate = estimator.estimate(candidates);
         * @endcode
         */
        class RiskReturnEstimator
        {
        public:
            /**
             * @brief Construct estimator
             * @param model Correlation source (required)
             * @param scorer Optional alpha scorer; Candidate::alpha is used when empty
             * @throws std::invalid_argument if model is null
             */
            explicit RiskReturnEstimator(std::shared_ptr<const CorrelationModel> model,
                                         ScoringFunction scorer = ScoringFunction());

            /**
             * @brief Estimate returns and covariance
             * @param candidates Candidate set (read-only)
             * @return RiskReturnEstimate
             * @throws InfeasibleError if candidates is empty
             * @throws std::invalid_argument on duplicate ids, invalid risk or non-finite scores
             *
             * A single candidate yields a 1x1 covariance and INSUFFICIENT_DATA.
             */
            RiskReturnEstimate estimate(const std::vector<Candidate> &candidates) const;

            const CorrelationModel &get_model() const { return *model_; }

        private:
            std::shared_ptr<const CorrelationModel> model_;
            ScoringFunction scorer_;

            /**
             * @brief Symmetrise, clamp and, if needed, PSD-repair a correlation matrix
             * @param correlation Matrix to clean in place
             * @return true if eigenvalue clipping was applied
             */
            static bool clean_correlation(Eigen::MatrixXd &correlation);
        };

    } // namespace risk
} // namespace allocation

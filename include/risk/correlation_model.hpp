/**
 * @file correlation_model.hpp
 * @brief Abstract interface for pairwise candidate correlation sources
 *
 * Provides a common interface for the strategies that turn a candidate
 * set into an N x N correlation matrix. The estimator combines that
 * matrix with per-candidate risk to build the covariance.
 *
 * Thread Safety: Implementations are expected to be thread-safe for
 * read-only operations.
 */

#pragma once

#include "core/candidate.hpp"
#include <Eigen/Dense>
#include <string>
#include <vector>

namespace allocation
{
    namespace risk
    {

        /**
         * @class CorrelationModel
         * @brief Abstract base class for correlation estimation
         *
         * Concrete implementations include feature-distance decay, constant
         * correlation and caller-supplied explicit correlation.
         *
         * Usage Example:
         * @code
         * auto model = std::make_unique<FeatureDistanceCorrelation>(1.0, 0.9);
         * Eigen::MatrixXd corr = model->estimate_correlation(candidates);
         * @endcode
         */
        class CorrelationModel
        {
        public:
            virtual ~CorrelationModel() = default;

            /**
             * @brief Estimate correlation matrix for a candidate set
             * @param candidates Candidates in index order
             * @return Correlation matrix (N x N)
             * @throws std::invalid_argument if the source cannot describe the set
             *
             * @note The returned matrix is not guaranteed to be PSD; the
             *       estimator repairs it if necessary
             */
            virtual Eigen::MatrixXd estimate_correlation(
                const std::vector<Candidate> &candidates) const = 0;

            /**
             * @brief Get the name of the correlation model
             * @return String identifier for the model type
             */
            virtual std::string get_name() const = 0;

        protected:
            /**
             * @brief Enforce exact symmetry: (M + M^T) / 2
             */
            static Eigen::MatrixXd ensure_symmetric(const Eigen::MatrixXd &matrix);
        };

        /**
         * @brief Convert covariance matrix to correlation matrix
         * @param covariance Input covariance matrix
         * @return Correlation matrix with unit diagonal, entries clamped to [-1, 1]
         * @throws std::runtime_error if matrix is not square or empty
         *
         * Zero-variance rows map to zero off-diagonal correlation.
         */
        Eigen::MatrixXd covariance_to_correlation(const Eigen::MatrixXd &covariance);

    } // namespace risk
} // namespace allocation

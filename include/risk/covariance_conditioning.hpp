/**
 * @file covariance_conditioning.hpp
 * @brief Condition-number checks and diagonal shrinkage for covariance matrices
 *
 * Rank-deficient or nearly singular covariance (duplicate candidates,
 * perfect correlation) makes the quadratic program and the view blender
 * numerically unstable. These helpers measure conditioning and shrink the
 * matrix toward its own diagonal, in the Ledoit-Wolf convex form
 *
 *   shrunk = delta * diag(S) + (1 - delta) * S
 *
 * which keeps every variance exactly and only damps cross terms.
 */

#pragma once

#include <Eigen/Dense>

namespace allocation
{
    namespace risk
    {

        /**
         * @struct ConditioningResult
         * @brief Output of regularize_if_ill_conditioned
         */
        struct ConditioningResult
        {
            Eigen::MatrixXd matrix;         ///< Conditioned covariance
            double shrinkage = 0.0;         ///< Delta applied toward the diagonal
            double ridge = 0.0;             ///< Identity multiple added after full shrinkage
            double condition_before = 0.0;  ///< Condition number of the input
            double condition_after = 0.0;   ///< Condition number of the output
            bool regularized = false;       ///< True if the matrix was modified
        };

        /**
         * @brief Spectral condition number lambda_max / lambda_min
         * @param matrix Symmetric matrix
         * @return Condition number; +infinity if lambda_min <= 0
         * @throws std::invalid_argument if matrix is not square or is empty
         */
        double condition_number(const Eigen::MatrixXd &matrix);

        /**
         * @brief Shrink toward the diagonal: delta * diag(S) + (1 - delta) * S
         * @param matrix Covariance matrix
         * @param delta Shrinkage intensity in [0, 1]
         * @throws std::invalid_argument if delta is outside [0, 1]
         */
        Eigen::MatrixXd shrink_toward_diagonal(const Eigen::MatrixXd &matrix, double delta);

        /**
         * @brief Regularize a covariance matrix whose condition number exceeds threshold
         * @param matrix Covariance matrix
         * @param threshold Maximum acceptable condition number (> 1)
         * @return ConditioningResult; unchanged matrix if already well conditioned
         *
         * Shrinkage starts at 0.05 and doubles until the threshold is met.
         * If the fully shrunk (diagonal) matrix is still ill conditioned,
         * the smallest identity ridge that meets the threshold is added.
         */
        ConditioningResult regularize_if_ill_conditioned(const Eigen::MatrixXd &matrix,
                                                         double threshold);

    } // namespace risk
} // namespace allocation

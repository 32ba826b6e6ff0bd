/**
 * @file covariance_conditioning.cpp
 * @brief Implementation of covariance conditioning helpers
 */

#include "risk/covariance_conditioning.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

namespace allocation
{
    namespace risk
    {

        double condition_number(const Eigen::MatrixXd &matrix)
        {
            if (matrix.rows() == 0 || matrix.rows() != matrix.cols())
            {
                throw std::invalid_argument("Condition number requires a non-empty square matrix");
            }

            Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd> solver(matrix, Eigen::EigenvaluesOnly);
            if (solver.info() != Eigen::Success)
            {
                throw std::runtime_error("Eigen decomposition failed while computing condition number");
            }

            const double max_eig = solver.eigenvalues().maxCoeff();
            const double min_eig = solver.eigenvalues().minCoeff();

            if (max_eig <= 0.0)
            {
                // Zero matrix: nothing to invert, treat as singular
                return std::numeric_limits<double>::infinity();
            }

            // Eigenvalues below machine precision relative to the largest are zero
            if (min_eig <= max_eig * std::numeric_limits<double>::epsilon())
            {
                return std::numeric_limits<double>::infinity();
            }

            return max_eig / min_eig;
        }

        Eigen::MatrixXd shrink_toward_diagonal(const Eigen::MatrixXd &matrix, double delta)
        {
            if (!(delta >= 0.0 && delta <= 1.0))
            {
                throw std::invalid_argument(
                    "Shrinkage intensity must be in [0, 1], got: " + std::to_string(delta));
            }

            Eigen::MatrixXd target = matrix.diagonal().asDiagonal();
            Eigen::MatrixXd shrunk = delta * target + (1.0 - delta) * matrix;

            return 0.5 * (shrunk + shrunk.transpose());
        }

        ConditioningResult regularize_if_ill_conditioned(const Eigen::MatrixXd &matrix,
                                                         double threshold)
        {
            if (!(threshold > 1.0))
            {
                throw std::invalid_argument(
                    "Condition threshold must exceed 1, got: " + std::to_string(threshold));
            }

            ConditioningResult result;
            result.matrix = matrix;
            result.condition_before = condition_number(matrix);
            result.condition_after = result.condition_before;

            if (result.condition_before <= threshold)
            {
                return result;
            }

            result.regularized = true;

            double delta = 0.05;
            while (true)
            {
                result.matrix = shrink_toward_diagonal(matrix, delta);
                result.shrinkage = delta;
                result.condition_after = condition_number(result.matrix);

                if (result.condition_after <= threshold || delta >= 1.0)
                {
                    break;
                }
                delta = std::min(1.0, 2.0 * delta);
            }

            if (result.condition_after <= threshold)
            {
                return result;
            }

            // Diagonal still singular (some zero variances): add the smallest
            // ridge r with (max + r) / (min + r) <= threshold
            Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd> solver(result.matrix, Eigen::EigenvaluesOnly);
            const double max_eig = std::max(solver.eigenvalues().maxCoeff(), 0.0);
            const double min_eig = std::max(solver.eigenvalues().minCoeff(), 0.0);
            const double scale = std::max(max_eig, 1.0);

            double ridge = (max_eig - threshold * min_eig) / (threshold - 1.0);
            ridge = std::max(ridge, 1e-12 * scale) * (1.0 + 1e-6);

            result.matrix.diagonal().array() += ridge;
            result.ridge = ridge;
            result.condition_after = condition_number(result.matrix);

            return result;
        }

    } // namespace risk
} // namespace allocation

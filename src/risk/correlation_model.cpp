/**
 * @file correlation_model.cpp
 * @brief Implementation of CorrelationModel base class utilities
 */

#include "risk/correlation_model.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace allocation
{
    namespace risk
    {

        Eigen::MatrixXd CorrelationModel::ensure_symmetric(const Eigen::MatrixXd &matrix)
        {
            return 0.5 * (matrix + matrix.transpose());
        }

        Eigen::MatrixXd covariance_to_correlation(const Eigen::MatrixXd &covariance)
        {
            const int n = covariance.rows();

            if (n == 0 || covariance.cols() != n)
            {
                throw std::runtime_error("Covariance matrix must be square and non-empty");
            }

            Eigen::VectorXd std_devs = covariance.diagonal().cwiseMax(0.0).array().sqrt();
            Eigen::MatrixXd correlation = Eigen::MatrixXd::Identity(n, n);

            for (int i = 0; i < n; ++i)
            {
                for (int j = 0; j < n; ++j)
                {
                    if (i == j)
                    {
                        continue;
                    }

                    const double denom = std_devs(i) * std_devs(j);
                    if (denom <= 0.0)
                    {
                        correlation(i, j) = 0.0;
                        continue;
                    }

                    // Clamp to [-1, 1] to handle numerical errors
                    correlation(i, j) = std::clamp(covariance(i, j) / denom, -1.0, 1.0);
                }
            }

            return correlation;
        }

    } // namespace risk
} // namespace allocation

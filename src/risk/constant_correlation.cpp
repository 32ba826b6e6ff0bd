/**
 * @file constant_correlation.cpp
 * @brief Implementation of constant correlation model
 */

#include "risk/constant_correlation.hpp"
#include <stdexcept>

namespace allocation
{
    namespace risk
    {

        ConstantCorrelation::ConstantCorrelation(double rho) : rho_(rho)
        {
            if (!(rho >= -1.0 && rho <= 1.0))
            {
                throw std::invalid_argument(
                    "Constant correlation must be in [-1, 1], got: " + std::to_string(rho));
            }
        }

        Eigen::MatrixXd ConstantCorrelation::estimate_correlation(
            const std::vector<Candidate> &candidates) const
        {
            const int n = static_cast<int>(candidates.size());

            // F_ij = rho for i != j, F_ii = 1
            Eigen::MatrixXd correlation = Eigen::MatrixXd::Constant(n, n, rho_);
            correlation.diagonal().setOnes();
            return correlation;
        }

        std::string ConstantCorrelation::get_name() const
        {
            return rho_ == 0.0 ? "Independent" : "ConstantCorrelation";
        }

    } // namespace risk
} // namespace allocation

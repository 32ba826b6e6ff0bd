/**
 * @file explicit_correlation.cpp
 * @brief Implementation of caller-supplied correlation source
 */

#include "risk/explicit_correlation.hpp"
#include <cmath>
#include <stdexcept>
#include <utility>

namespace allocation
{
    namespace risk
    {

        ExplicitCorrelation::ExplicitCorrelation(const Eigen::MatrixXd &matrix)
            : matrix_(matrix)
        {
            if (matrix.rows() != matrix.cols())
            {
                throw std::invalid_argument(
                    "Explicit correlation matrix must be square, got " +
                    std::to_string(matrix.rows()) + "x" + std::to_string(matrix.cols()));
            }

            if (!matrix.allFinite())
            {
                throw std::invalid_argument("Explicit correlation matrix contains NaN or Inf values");
            }
        }

        ExplicitCorrelation::ExplicitCorrelation(PairwiseCorrelation pairwise)
            : pairwise_(std::move(pairwise))
        {
            if (!pairwise_)
            {
                throw std::invalid_argument("Explicit correlation requires a pairwise function");
            }
        }

        Eigen::MatrixXd ExplicitCorrelation::estimate_correlation(
            const std::vector<Candidate> &candidates) const
        {
            const int n = static_cast<int>(candidates.size());
            Eigen::MatrixXd correlation;

            if (pairwise_)
            {
                correlation = Eigen::MatrixXd::Identity(n, n);
                for (int i = 0; i < n; ++i)
                {
                    for (int j = i + 1; j < n; ++j)
                    {
                        const double rho = pairwise_(candidates[i], candidates[j]);
                        if (!std::isfinite(rho))
                        {
                            throw std::invalid_argument(
                                "Pairwise correlation between '" + candidates[i].id + "' and '" +
                                candidates[j].id + "' is not finite");
                        }
                        correlation(i, j) = rho;
                        correlation(j, i) = rho;
                    }
                }
                return correlation;
            }

            if (matrix_.rows() != n)
            {
                throw std::invalid_argument(
                    "Explicit correlation matrix has " + std::to_string(matrix_.rows()) +
                    " rows but there are " + std::to_string(n) + " candidates");
            }

            correlation = ensure_symmetric(matrix_);
            correlation.diagonal().setOnes();
            return correlation;
        }

        std::string ExplicitCorrelation::get_name() const
        {
            return "ExplicitCorrelation";
        }

    } // namespace risk
} // namespace allocation

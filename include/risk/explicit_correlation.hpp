/**
 * @file explicit_correlation.hpp
 * @brief Caller-supplied correlation source
 *
 * Wraps either a precomputed N x N matrix (indexed like the candidate
 * vector) or a pairwise similarity function. Use this when an external
 * similarity service already knows how candidates relate.
 */

#pragma once

#include "risk/correlation_model.hpp"
#include <functional>

namespace allocation
{
    namespace risk
    {

        /// Pairwise similarity in [-1, 1]; called once per unordered pair
        using PairwiseCorrelation = std::function<double(const Candidate &, const Candidate &)>;

        class ExplicitCorrelation : public CorrelationModel
        {
        public:
            /**
             * @brief Construct from a fixed matrix
             * @throws std::invalid_argument if matrix is not square or has NaN/Inf values
             */
            explicit ExplicitCorrelation(const Eigen::MatrixXd &matrix);

            /**
             * @brief Construct from a pairwise function
             * @throws std::invalid_argument if the function is empty
             */
            explicit ExplicitCorrelation(PairwiseCorrelation pairwise);

            /**
             * @brief Return the supplied correlation with a unit diagonal
             * @throws std::invalid_argument if the matrix size does not match the candidates
             */
            Eigen::MatrixXd estimate_correlation(
                const std::vector<Candidate> &candidates) const override;

            std::string get_name() const override;

        private:
            Eigen::MatrixXd matrix_;
            PairwiseCorrelation pairwise_;
        };

    } // namespace risk
} // namespace allocation

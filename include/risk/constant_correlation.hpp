/**
 * @file constant_correlation.hpp
 * @brief Every pair of distinct candidates shares the same correlation
 *
 * rho = 0 gives the independent model. Negative values are accepted but
 * a constant correlation below -1/(N-1) is not PSD; the estimator
 * repairs such matrices and reports CORRELATION_REPAIRED.
 */

#pragma once

#include "risk/correlation_model.hpp"

namespace allocation
{
    namespace risk
    {

        class ConstantCorrelation : public CorrelationModel
        {
        public:
            /**
             * @brief Construct constant-correlation model
             * @param rho Off-diagonal correlation in [-1, 1]
             * @throws std::invalid_argument if rho is out of range
             */
            explicit ConstantCorrelation(double rho = 0.0);

            Eigen::MatrixXd estimate_correlation(
                const std::vector<Candidate> &candidates) const override;

            std::string get_name() const override;

            double get_rho() const { return rho_; }

        private:
            double rho_;
        };

    } // namespace risk
} // namespace allocation

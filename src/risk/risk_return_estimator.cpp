/**
 * @file risk_return_estimator.cpp
 * @brief Implementation of the risk/return estimator
 */

#include "risk/risk_return_estimator.hpp"
#include <algorithm>
#include <cmath>
#include <set>
#include <stdexcept>
#include <utility>

namespace allocation
{
    namespace risk
    {

        namespace
        {
            constexpr double PSD_TOLERANCE = 1e-10;

            nlohmann::json matrix_to_json(const Eigen::MatrixXd &m)
            {
                nlohmann::json rows = nlohmann::json::array();
                for (int i = 0; i < m.rows(); ++i)
                {
                    std::vector<double> row(m.cols());
                    for (int j = 0; j < m.cols(); ++j)
                    {
                        row[j] = m(i, j);
                    }
                    rows.push_back(row);
                }
                return rows;
            }
        } // namespace

        nlohmann::json RiskReturnEstimate::to_json() const
        {
            nlohmann::json j;
            j["ids"] = ids;
            j["expected_returns"] = std::vector<double>(expected_returns.data(),
                                                        expected_returns.data() + expected_returns.size());
            j["covariance"] = matrix_to_json(covariance);
            j["correlation"] = matrix_to_json(correlation);

            nlohmann::json warns = nlohmann::json::array();
            for (const auto &w : warnings)
            {
                warns.push_back(w.to_json());
            }
            j["warnings"] = warns;
            return j;
        }

        RiskReturnEstimator::RiskReturnEstimator(std::shared_ptr<const CorrelationModel> model,
                                                 ScoringFunction scorer)
            : model_(std::move(model)), scorer_(std::move(scorer))
        {
            if (!model_)
            {
                throw std::invalid_argument("RiskReturnEstimator requires a correlation model");
            }
        }

        RiskReturnEstimate RiskReturnEstimator::estimate(const std::vector<Candidate> &candidates) const
        {
            if (candidates.empty())
            {
                throw InfeasibleError("cannot estimate risk for an empty candidate set");
            }

            const int n = static_cast<int>(candidates.size());

            RiskReturnEstimate result;
            result.ids.reserve(n);
            result.expected_returns.resize(n);
            Eigen::VectorXd sigma(n);

            std::set<std::string> seen;
            for (int i = 0; i < n; ++i)
            {
                const Candidate &c = candidates[i];
                c.validate();

                if (!seen.insert(c.id).second)
                {
                    throw std::invalid_argument("Duplicate candidate id: '" + c.id + "'");
                }

                const double score = scorer_ ? scorer_(c) : c.alpha;
                if (!std::isfinite(score))
                {
                    throw std::invalid_argument("Scoring function returned non-finite value for '" + c.id + "'");
                }

                result.ids.push_back(c.id);
                result.expected_returns(i) = score;
                sigma(i) = c.risk;
            }

            if (n < 2)
            {
                result.correlation = Eigen::MatrixXd::Identity(n, n);
                result.covariance = sigma.array().square().matrix().asDiagonal();
                result.warnings.push_back({WarningCode::INSUFFICIENT_DATA,
                                           "Only one candidate; using diagonal covariance of variances"});
                return result;
            }

            Eigen::MatrixXd correlation = model_->estimate_correlation(candidates);
            if (correlation.rows() != n || correlation.cols() != n)
            {
                throw std::runtime_error(
                    model_->get_name() + " returned a correlation matrix of wrong size");
            }

            if (clean_correlation(correlation))
            {
                result.warnings.push_back({WarningCode::CORRELATION_REPAIRED,
                                           model_->get_name() +
                                               " produced a non-PSD correlation; negative eigenvalues clipped"});
            }

            result.correlation = correlation;
            result.covariance = sigma.asDiagonal() * correlation * sigma.asDiagonal();
            result.covariance = 0.5 * (result.covariance + result.covariance.transpose());

            // Diagonal equals variance exactly
            result.covariance.diagonal() = sigma.array().square().matrix();

            return result;
        }

        bool RiskReturnEstimator::clean_correlation(Eigen::MatrixXd &correlation)
        {
            const int n = correlation.rows();

            if (!correlation.allFinite())
            {
                throw std::invalid_argument("Correlation source produced NaN or Inf values");
            }

            correlation = 0.5 * (correlation + correlation.transpose());
            correlation = correlation.cwiseMax(-1.0).cwiseMin(1.0);
            correlation.diagonal().setOnes();

            Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd> solver(correlation);
            if (solver.info() != Eigen::Success)
            {
                throw std::runtime_error("Eigen decomposition of correlation matrix failed");
            }

            if (solver.eigenvalues().minCoeff() >= -PSD_TOLERANCE)
            {
                return false;
            }

            // Clip negative eigenvalues and rebuild
            Eigen::VectorXd clipped = solver.eigenvalues().cwiseMax(0.0);
            Eigen::MatrixXd repaired = solver.eigenvectors() * clipped.asDiagonal() *
                                       solver.eigenvectors().transpose();

            // Rescale to unit diagonal
            Eigen::VectorXd d = repaired.diagonal().cwiseMax(PSD_TOLERANCE).cwiseSqrt().cwiseInverse();
            repaired = d.asDiagonal() * repaired * d.asDiagonal();
            repaired = 0.5 * (repaired + repaired.transpose());
            repaired = repaired.cwiseMax(-1.0).cwiseMin(1.0);

            for (int i = 0; i < n; ++i)
            {
                repaired(i, i) = 1.0;
            }

            correlation = repaired;
            return true;
        }

    } // namespace risk
} // namespace allocation

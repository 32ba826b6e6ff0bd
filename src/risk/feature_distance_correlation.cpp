/**
 * @file feature_distance_correlation.cpp
 * @brief Implementation of feature-distance correlation model
 */

#include "risk/feature_distance_correlation.hpp"
#include <cmath>
#include <stdexcept>

namespace allocation
{
    namespace risk
    {

        FeatureDistanceCorrelation::FeatureDistanceCorrelation(double length_scale,
                                                               double max_correlation,
                                                               bool standardize_features)
            : length_scale_(length_scale),
              max_correlation_(max_correlation),
              standardize_features_(standardize_features)
        {
            if (!(length_scale > 0.0) || !std::isfinite(length_scale))
            {
                throw std::invalid_argument(
                    "Feature distance length_scale must be positive, got: " + std::to_string(length_scale));
            }

            if (!(max_correlation >= 0.0 && max_correlation <= 1.0))
            {
                throw std::invalid_argument(
                    "Feature distance max_correlation must be in [0, 1], got: " + std::to_string(max_correlation));
            }
        }

        Eigen::MatrixXd FeatureDistanceCorrelation::estimate_correlation(
            const std::vector<Candidate> &candidates) const
        {
            const int n = static_cast<int>(candidates.size());
            Eigen::MatrixXd correlation = Eigen::MatrixXd::Identity(n, n);

            if (n < 2)
            {
                return correlation;
            }

            std::vector<bool> has_features;
            Eigen::MatrixXd features = build_feature_matrix(candidates, has_features);

            if (features.cols() == 0)
            {
                // No candidate carries features: independent outcomes
                return correlation;
            }

            if (standardize_features_)
            {
                standardize(features, has_features);
            }

            for (int i = 0; i < n; ++i)
            {
                if (!has_features[i])
                {
                    continue;
                }

                for (int j = i + 1; j < n; ++j)
                {
                    if (!has_features[j])
                    {
                        continue;
                    }

                    const double distance = (features.row(i) - features.row(j)).norm();
                    const double rho = max_correlation_ * std::exp(-distance / length_scale_);
                    correlation(i, j) = rho;
                    correlation(j, i) = rho;
                }
            }

            return ensure_symmetric(correlation);
        }

        std::string FeatureDistanceCorrelation::get_name() const
        {
            return "FeatureDistanceCorrelation";
        }

        Eigen::MatrixXd FeatureDistanceCorrelation::build_feature_matrix(
            const std::vector<Candidate> &candidates,
            std::vector<bool> &has_features) const
        {
            const int n = static_cast<int>(candidates.size());
            has_features.assign(n, false);

            // Dimension is taken from the first candidate that has features
            int dim = 0;
            for (const auto &c : candidates)
            {
                if (!c.features.empty())
                {
                    dim = static_cast<int>(c.features.size());
                    break;
                }
            }

            Eigen::MatrixXd features = Eigen::MatrixXd::Zero(n, dim);

            for (int i = 0; i < n; ++i)
            {
                const auto &f = candidates[i].features;
                if (f.empty())
                {
                    continue;
                }

                if (static_cast<int>(f.size()) != dim)
                {
                    throw std::invalid_argument(
                        "Candidate '" + candidates[i].id + "' has " + std::to_string(f.size()) +
                        " features, expected " + std::to_string(dim));
                }

                for (int k = 0; k < dim; ++k)
                {
                    features(i, k) = f[k];
                }
                has_features[i] = true;
            }

            return features;
        }

        void FeatureDistanceCorrelation::standardize(Eigen::MatrixXd &features,
                                                     const std::vector<bool> &has_features)
        {
            const int n = features.rows();
            int count = 0;
            for (bool h : has_features)
            {
                count += h ? 1 : 0;
            }

            if (count < 2)
            {
                return;
            }

            for (int k = 0; k < features.cols(); ++k)
            {
                double mean = 0.0;
                for (int i = 0; i < n; ++i)
                {
                    if (has_features[i])
                    {
                        mean += features(i, k);
                    }
                }
                mean /= count;

                double var = 0.0;
                for (int i = 0; i < n; ++i)
                {
                    if (has_features[i])
                    {
                        const double d = features(i, k) - mean;
                        var += d * d;
                    }
                }
                var /= (count - 1);

                const double sd = std::sqrt(var);
                for (int i = 0; i < n; ++i)
                {
                    if (!has_features[i])
                    {
                        continue;
                    }
                    features(i, k) -= mean;
                    if (sd > 1e-12)
                    {
                        features(i, k) /= sd;
                    }
                }
            }
        }

    } // namespace risk
} // namespace allocation

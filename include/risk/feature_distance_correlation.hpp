/**
 * @file feature_distance_correlation.hpp
 * @brief Default correlation model: correlation decays with feature distance
 *
 * Candidates that look alike (close feature vectors) are assumed to have
 * correlated outcomes. The correlation between candidates i and j is
 *
 *   rho_ij = max_correlation * exp(-||f_i - f_j||_2 / length_scale)
 *
 * The exponential (Laplacian) kernel is positive semi-definite for any
 * Euclidean distance, so the resulting matrix needs no repair when
 * max_correlation lies in [0, 1].
 *
 * Candidates with an empty feature vector are uncorrelated with every
 * other candidate.
 */

#pragma once

#include "risk/correlation_model.hpp"

namespace allocation
{
    namespace risk
    {

        /**
         * @class FeatureDistanceCorrelation
         * @brief Exponential-decay kernel over (optionally standardized) features
         *
         * Usage Example:
         * @code
         * FeatureDistanceCorrelation model(1.0, 0.9, true);
         * Eigen::MatrixXd corr = model.estimate_correlation(candidates);
         * @endcode
         */
        class FeatureDistanceCorrelation : public CorrelationModel
        {
        public:
            /**
             * @brief Construct feature-distance model
             * @param length_scale Distance at which correlation falls by a factor e (> 0)
             * @param max_correlation Correlation of identical feature vectors, in [0, 1]
             * @param standardize_features Z-score each feature column before measuring distance
             * @throws std::invalid_argument if parameters are out of range
             */
            explicit FeatureDistanceCorrelation(double length_scale = 1.0,
                                                double max_correlation = 0.9,
                                                bool standardize_features = true);

            /**
             * @brief Estimate correlation from feature distances
             * @throws std::invalid_argument if candidates with features disagree on dimension
             */
            Eigen::MatrixXd estimate_correlation(
                const std::vector<Candidate> &candidates) const override;

            std::string get_name() const override;

            double get_length_scale() const { return length_scale_; }
            double get_max_correlation() const { return max_correlation_; }

        private:
            double length_scale_;
            double max_correlation_;
            bool standardize_features_;

            /**
             * @brief Stack feature vectors into a matrix (rows = candidates)
             * @param candidates Candidates in index order
             * @param has_features Output flag per candidate
             * @return Feature matrix; rows of featureless candidates are zero
             */
            Eigen::MatrixXd build_feature_matrix(const std::vector<Candidate> &candidates,
                                                 std::vector<bool> &has_features) const;

            /**
             * @brief Z-score columns over the rows that carry features
             *
             * Constant columns are centred but not scaled.
             */
            static void standardize(Eigen::MatrixXd &features,
                                    const std::vector<bool> &has_features);
        };

    } // namespace risk
} // namespace allocation

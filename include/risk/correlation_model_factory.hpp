/**
 * @file correlation_model_factory.hpp
 * @brief Factory for creating correlation models from configuration
 *
 * Example configuration:
 * @code{.json}
 * {
 *   "estimator": {
 *     "type": "feature_distance",
 *     "length_scale": 1.5,
 *     "max_correlation": 0.8,
 *     "standardize_features": true
 *   }
 * }
 * @endcode
 */

#pragma once

#include "risk/correlation_model.hpp"
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace allocation
{
    namespace risk
    {

        /**
         * @struct CorrelationModelConfig
         * @brief Parameters for any supported correlation model
         *
         * Unused parameters are ignored based on the model type.
         */
        struct CorrelationModelConfig
        {
            /**
             * @brief Type of correlation model
             *
             * Supported values (case-insensitive):
             * - "feature_distance" or "distance": FeatureDistanceCorrelation
             * - "constant": ConstantCorrelation
             * - "independent" or "diagonal": ConstantCorrelation(0)
             */
            std::string type = "feature_distance";

            double length_scale = 1.0;         ///< Used by: FeatureDistanceCorrelation
            double max_correlation = 0.9;      ///< Used by: FeatureDistanceCorrelation
            bool standardize_features = true;  ///< Used by: FeatureDistanceCorrelation
            double constant_correlation = 0.0; ///< Used by: ConstantCorrelation

            /**
             * @brief Create configuration from JSON
             *
             * Provides defaults for missing fields.
             */
            static CorrelationModelConfig from_json(const nlohmann::json &j);

            nlohmann::json to_json() const;
        };

        /**
         * @class CorrelationModelFactory
         * @brief Creates correlation model instances from configuration
         *
         * Usage Pattern:
         * @code
         * auto config = CorrelationModelConfig::from_json(json_obj);
         * auto model = CorrelationModelFactory::create(config);
         * @endcode
         */
        class CorrelationModelFactory
        {
        public:
            /**
             * @brief Create correlation model from configuration
             * @throws std::invalid_argument if type is unknown or parameters are invalid
             */
            static std::unique_ptr<CorrelationModel> create(const CorrelationModelConfig &config);

            /**
             * @brief Create correlation model from type string and JSON parameters
             * @throws std::invalid_argument if type is unknown
             */
            static std::unique_ptr<CorrelationModel> create(
                const std::string &type,
                const nlohmann::json &params);

            static std::vector<std::string> get_supported_types();

        private:
            static std::string normalize_type(const std::string &type);
        };

    } // namespace risk
} // namespace allocation

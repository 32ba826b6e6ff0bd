/**
 * @file correlation_model_factory.cpp
 * @brief Implementation of correlation model factory
 */

#include "risk/correlation_model_factory.hpp"
#include "risk/constant_correlation.hpp"
#include "risk/feature_distance_correlation.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace allocation
{
    namespace risk
    {

        // CorrelationModelConfig implementation
        CorrelationModelConfig CorrelationModelConfig::from_json(const nlohmann::json &doc)
        {
            CorrelationModelConfig config;

            if (doc.contains("type"))
            {
                if (!doc["type"].is_string())
                {
                    throw std::invalid_argument("Correlation model 'type' must be a string");
                }
                config.type = doc["type"].get<std::string>();
            }

            if (doc.contains("length_scale"))
            {
                config.length_scale = doc["length_scale"].get<double>();
            }

            if (doc.contains("max_correlation"))
            {
                config.max_correlation = doc["max_correlation"].get<double>();
            }

            if (doc.contains("standardize_features"))
            {
                config.standardize_features = doc["standardize_features"].get<bool>();
            }

            if (doc.contains("constant_correlation"))
            {
                config.constant_correlation = doc["constant_correlation"].get<double>();
            }

            return config;
        }

        nlohmann::json CorrelationModelConfig::to_json() const
        {
            return nlohmann::json{
                {"type", type},
                {"length_scale", length_scale},
                {"max_correlation", max_correlation},
                {"standardize_features", standardize_features},
                {"constant_correlation", constant_correlation}};
        }

        // CorrelationModelFactory implementation
        std::string CorrelationModelFactory::normalize_type(const std::string &type)
        {
            std::string normalized = type;

            std::transform(normalized.begin(), normalized.end(), normalized.begin(), [](unsigned char c)
                           { return std::tolower(c); });
            return normalized;
        }

        std::unique_ptr<CorrelationModel> CorrelationModelFactory::create(const CorrelationModelConfig &config)
        {
            std::string type = normalize_type(config.type);

            if (type == "feature_distance" || type == "distance")
            {
                return std::make_unique<FeatureDistanceCorrelation>(
                    config.length_scale, config.max_correlation, config.standardize_features);
            }
            else if (type == "constant")
            {
                return std::make_unique<ConstantCorrelation>(config.constant_correlation);
            }
            else if (type == "independent" || type == "diagonal")
            {
                return std::make_unique<ConstantCorrelation>(0.0);
            }
            else
            {
                throw std::invalid_argument(
                    "Unknown correlation model type: '" + config.type + "'. "
                    "Valid options: feature_distance, constant, independent");
            }
        }

        std::unique_ptr<CorrelationModel> CorrelationModelFactory::create(const std::string &type,
                                                                          const nlohmann::json &params)
        {
            nlohmann::json config_json = params;
            config_json["type"] = type;

            return create(CorrelationModelConfig::from_json(config_json));
        }

        std::vector<std::string> CorrelationModelFactory::get_supported_types()
        {
            return {
                "feature_distance",
                "distance",
                "constant",
                "independent",
                "diagonal"};
        }

    } // namespace risk
} // namespace allocation

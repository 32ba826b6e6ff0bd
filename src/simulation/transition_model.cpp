/**
 * @file transition_model.cpp
 * @brief Implementation of TransitionModel
 */

#include "simulation/transition_model.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace allocation
{
    namespace simulation
    {

        namespace
        {
            void require_probability(double value, const std::string &name)
            {
                if (!(value >= 0.0 && value <= 1.0))
                {
                    throw std::invalid_argument(
                        name + " must be in [0, 1], got: " + std::to_string(value));
                }
            }

            void require_positive(double value, const std::string &name)
            {
                if (!(value > 0.0) || !std::isfinite(value))
                {
                    throw std::invalid_argument(
                        name + " must be positive and finite, got: " + std::to_string(value));
                }
            }

            void require_non_negative(double value, const std::string &name)
            {
                if (!(value >= 0.0) || !std::isfinite(value))
                {
                    throw std::invalid_argument(
                        name + " must be non-negative and finite, got: " + std::to_string(value));
                }
            }
        } // namespace

        // ============================================================================
        // StageProbabilities
        // ============================================================================

        double StageProbabilities::for_state(OutcomeState state) const
        {
            switch (state)
            {
            case OutcomeState::PROSPECT:
                return engage;
            case OutcomeState::ENGAGED:
                return respond;
            case OutcomeState::RESPONDED:
                return convert;
            case OutcomeState::CONVERTED:
            case OutcomeState::LAPSED:
                break;
            }
            throw std::invalid_argument("Terminal state " + to_string(state) + " has no stage probability");
        }

        StageProbabilities StageProbabilities::from_json(const nlohmann::json &j)
        {
            return from_json(j, StageProbabilities());
        }

        StageProbabilities StageProbabilities::from_json(const nlohmann::json &j,
                                                         const StageProbabilities &defaults)
        {
            StageProbabilities p = defaults;
            p.engage = j.value("engage", p.engage);
            p.respond = j.value("respond", p.respond);
            p.convert = j.value("convert", p.convert);
            return p;
        }

        nlohmann::json StageProbabilities::to_json() const
        {
            return nlohmann::json{
                {"engage", engage},
                {"respond", respond},
                {"convert", convert}};
        }

        // ============================================================================
        // TransitionConfig
        // ============================================================================

        void TransitionConfig::validate() const
        {
            require_probability(base.engage, "base engage probability");
            require_probability(base.respond, "base respond probability");
            require_probability(base.convert, "base convert probability");
            if (!(base_lapse >= 0.0 && base_lapse <= MAX_BASE_LAPSE))
            {
                throw std::invalid_argument(
                    "base_lapse must be in [0, " + std::to_string(MAX_BASE_LAPSE) + "], got: " +
                    std::to_string(base_lapse));
            }
            // A constant hazard would not grow with elapsed steps
            require_positive(lapse_growth, "lapse_growth");

            if (!std::isfinite(alpha_sensitivity) || !std::isfinite(risk_sensitivity))
            {
                throw std::invalid_argument("alpha_sensitivity and risk_sensitivity must be finite");
            }
        }

        TransitionConfig TransitionConfig::from_json(const nlohmann::json &j)
        {
            TransitionConfig config;
            if (j.contains("base_probabilities"))
            {
                config.base = StageProbabilities::from_json(j.at("base_probabilities"), config.base);
            }
            config.base_lapse = j.value("base_lapse", config.base_lapse);
            config.lapse_growth = j.value("lapse_growth", config.lapse_growth);
            config.alpha_sensitivity = j.value("alpha_sensitivity", config.alpha_sensitivity);
            config.risk_sensitivity = j.value("risk_sensitivity", config.risk_sensitivity);
            config.validate();
            return config;
        }

        nlohmann::json TransitionConfig::to_json() const
        {
            return nlohmann::json{
                {"base_probabilities", base.to_json()},
                {"base_lapse", base_lapse},
                {"lapse_growth", lapse_growth},
                {"alpha_sensitivity", alpha_sensitivity},
                {"risk_sensitivity", risk_sensitivity}};
        }

        InteractionOutcome InteractionOutcome::from_json(const nlohmann::json &j)
        {
            InteractionOutcome o;
            o.engaged = j.value("engaged", false);
            o.responded = j.value("responded", false);
            o.converted = j.value("converted", false);
            o.lapsed = j.value("lapsed", false);
            return o;
        }

        // ============================================================================
        // TransitionModel
        // ============================================================================

        TransitionModel::TransitionModel(const TransitionConfig &config)
            : config_(config)
        {
            config_.validate();
        }

        double TransitionModel::advance_probability(OutcomeState state, double alpha, double risk) const
        {
            const double base = config_.base.for_state(state);
            const double tilt = std::exp(config_.alpha_sensitivity * alpha - config_.risk_sensitivity * risk);
            return std::clamp(base * tilt, 0.0, 1.0);
        }

        double TransitionModel::lapse_hazard(int step) const
        {
            return 1.0 - (1.0 - config_.base_lapse) * std::exp(-config_.lapse_growth * step);
        }

        double TransitionModel::lapse_probability(OutcomeState state, double alpha, double risk, int step) const
        {
            return (1.0 - advance_probability(state, alpha, risk)) * lapse_hazard(step);
        }

        TransitionModel TransitionModel::with_multipliers(const StageProbabilities &multipliers,
                                                          double lapse_multiplier) const
        {
            require_non_negative(multipliers.engage, "engage multiplier");
            require_non_negative(multipliers.respond, "respond multiplier");
            require_non_negative(multipliers.convert, "convert multiplier");
            require_non_negative(lapse_multiplier, "lapse multiplier");

            TransitionConfig adjusted = config_;
            adjusted.base.engage = std::min(1.0, config_.base.engage * multipliers.engage);
            adjusted.base.respond = std::min(1.0, config_.base.respond * multipliers.respond);
            adjusted.base.convert = std::min(1.0, config_.base.convert * multipliers.convert);
            adjusted.base_lapse = std::min(MAX_BASE_LAPSE, config_.base_lapse * lapse_multiplier);
            return TransitionModel(adjusted);
        }

        TransitionConfig TransitionModel::calibrate(const std::vector<InteractionOutcome> &outcomes,
                                                    const TransitionConfig &defaults)
        {
            if (outcomes.empty())
            {
                throw std::invalid_argument("Cannot calibrate transition model from zero outcomes");
            }

            int engaged = 0;
            int responded = 0;
            int converted = 0;
            int lapsed = 0;

            for (const auto &o : outcomes)
            {
                if (!o.engaged)
                {
                    continue;
                }
                ++engaged;
                if (o.lapsed)
                {
                    ++lapsed;
                }
                if (o.responded)
                {
                    ++responded;
                    if (o.converted)
                    {
                        ++converted;
                    }
                }
            }

            TransitionConfig config = defaults;
            config.base.engage = static_cast<double>(engaged) / outcomes.size();

            if (engaged > 0)
            {
                config.base.respond = static_cast<double>(responded) / engaged;
                config.base_lapse = std::min(MAX_BASE_LAPSE, static_cast<double>(lapsed) / engaged);
            }
            if (responded > 0)
            {
                config.base.convert = static_cast<double>(converted) / responded;
            }

            config.validate();
            return config;
        }

    } // namespace simulation
} // namespace allocation

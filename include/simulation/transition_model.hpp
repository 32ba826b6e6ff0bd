/**
 * @file transition_model.hpp
 * @brief Stochastic outcome model driving the scenario simulator
 *
 * For a candidate with score alpha and risk sigma in stage s at elapsed
 * step t:
 *
 *   p_adv(s)      = clamp(base_s * exp(a * alpha - r * sigma), 0, 1)
 *   h(t)          = 1 - (1 - base_lapse) * exp(-lapse_growth * t)
 *   p_lapse(s, t) = (1 - p_adv(s)) * h(t)
 *
 * lapse_growth > 0 and base_lapse < 1 are enforced, so h(t) strictly
 * increases with t and a candidate that lingers becomes steadily more
 * likely to lapse.
 */

#pragma once

#include "simulation/outcome_state.hpp"
#include <vector>
#include <nlohmann/json.hpp>

namespace allocation
{
    namespace simulation
    {

        /**
         * @struct StageProbabilities
         * @brief One value per non-terminal stage
         *
         * Used both for base advance probabilities and for strategy multipliers.
         */
        struct StageProbabilities
        {
            double engage = 0.3;  ///< PROSPECT -> ENGAGED
            double respond = 0.5; ///< ENGAGED -> RESPONDED
            double convert = 0.4; ///< RESPONDED -> CONVERTED

            /**
             * @brief Value for the stage a state advances out of
             * @throws std::invalid_argument for terminal states
             */
            double for_state(OutcomeState state) const;

            static StageProbabilities from_json(const nlohmann::json &j);
            static StageProbabilities from_json(const nlohmann::json &j,
                                                const StageProbabilities &defaults);
            nlohmann::json to_json() const;
        };

        /// Upper bound on base_lapse; h(t) stays constant at base_lapse = 1
        constexpr double MAX_BASE_LAPSE = 0.99;

        /**
         * @struct TransitionConfig
         * @brief Parameters of the transition model
         */
        struct TransitionConfig
        {
            StageProbabilities base;        ///< Base advance probabilities
            double base_lapse = 0.05;       ///< Lapse hazard at t = 0
            double lapse_growth = 0.1;      ///< Growth rate of the lapse hazard per step
            double alpha_sensitivity = 0.0; ///< Advance boost per unit alpha
            double risk_sensitivity = 0.0;  ///< Advance penalty per unit risk

            /**
             * @throws std::invalid_argument if a probability is outside [0, 1],
             *         base_lapse exceeds MAX_BASE_LAPSE, lapse_growth is not
             *         positive, or a sensitivity is non-finite
             */
            void validate() const;

            static TransitionConfig from_json(const nlohmann::json &j);
            nlohmann::json to_json() const;
        };

        /**
         * @struct InteractionOutcome
         * @brief One historical interaction record used for calibration
         */
        struct InteractionOutcome
        {
            bool engaged = false;
            bool responded = false;
            bool converted = false;
            bool lapsed = false;

            static InteractionOutcome from_json(const nlohmann::json &j);
        };

        /**
         * @class TransitionModel
         * @brief Advance and lapse probabilities per stage and elapsed step
         *
         * Immutable after construction; shared read-only by all trial workers.
         */
        class TransitionModel
        {
        public:
            explicit TransitionModel(const TransitionConfig &config = TransitionConfig());

            /**
             * @brief Probability of moving to the next stage
             * @param state Current non-terminal state
             * @param alpha Candidate score
             * @param risk Candidate risk
             */
            double advance_probability(OutcomeState state, double alpha, double risk) const;

            /**
             * @brief Probability of lapsing at elapsed step t
             */
            double lapse_probability(OutcomeState state, double alpha, double risk, int step) const;

            /**
             * @brief Lapse hazard h(t) before scaling by (1 - p_adv)
             */
            double lapse_hazard(int step) const;

            /**
             * @brief Model with every base advance probability scaled (capped at 1)
             * @param multipliers Per-stage scale factors (>= 0)
             * @param lapse_multiplier Scale on base_lapse (>= 0, result capped at MAX_BASE_LAPSE)
             * @throws std::invalid_argument on negative multipliers
             */
            TransitionModel with_multipliers(const StageProbabilities &multipliers,
                                             double lapse_multiplier = 1.0) const;

            const TransitionConfig &get_config() const { return config_; }

            /**
             * @brief Estimate base probabilities from observed outcomes
             *
             * engage  = P(engaged)
             * respond = P(responded | engaged)
             * convert = P(converted | responded)
             * lapse   = P(lapsed | engaged), capped at MAX_BASE_LAPSE
             *
             * Rates with no conditioning records keep the value in defaults.
             *
             * @throws std::invalid_argument if outcomes is empty
             */
            static TransitionConfig calibrate(const std::vector<InteractionOutcome> &outcomes,
                                              const TransitionConfig &defaults = TransitionConfig());

        private:
            TransitionConfig config_;
        };

    } // namespace simulation
} // namespace allocation

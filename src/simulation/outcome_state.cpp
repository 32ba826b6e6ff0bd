/**
 * @file outcome_state.cpp
 * @brief OutcomeState helpers
 */

#include "simulation/outcome_state.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace allocation
{
    namespace simulation
    {

        OutcomeState next_state(OutcomeState state)
        {
            switch (state)
            {
            case OutcomeState::PROSPECT:
                return OutcomeState::ENGAGED;
            case OutcomeState::ENGAGED:
                return OutcomeState::RESPONDED;
            case OutcomeState::RESPONDED:
                return OutcomeState::CONVERTED;
            case OutcomeState::CONVERTED:
            case OutcomeState::LAPSED:
                break;
            }
            throw std::invalid_argument("Terminal state " + to_string(state) + " has no successor");
        }

        std::string to_string(OutcomeState state)
        {
            switch (state)
            {
            case OutcomeState::PROSPECT:
                return "PROSPECT";
            case OutcomeState::ENGAGED:
                return "ENGAGED";
            case OutcomeState::RESPONDED:
                return "RESPONDED";
            case OutcomeState::CONVERTED:
                return "CONVERTED";
            case OutcomeState::LAPSED:
                return "LAPSED";
            }
            return "UNKNOWN";
        }

        OutcomeState parse_outcome_state(const std::string &name)
        {
            std::string normalized = name;
            std::transform(normalized.begin(), normalized.end(), normalized.begin(), [](unsigned char c)
                           { return std::toupper(c); });

            for (OutcomeState state : ALL_OUTCOME_STATES)
            {
                if (to_string(state) == normalized)
                {
                    return state;
                }
            }

            throw std::invalid_argument(
                "Unknown outcome state: '" + name +
                "'. Valid options: prospect, engaged, responded, converted, lapsed");
        }

    } // namespace simulation
} // namespace allocation

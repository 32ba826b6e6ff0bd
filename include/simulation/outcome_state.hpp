/**
 * @file outcome_state.hpp
 * @brief Lifecycle states of a simulated candidate interaction
 */

#pragma once

#include <array>
#include <string>

namespace allocation
{
    namespace simulation
    {

        /**
         * @enum OutcomeState
         * @brief Prospect -> Engaged -> Responded -> Converted, or Lapsed from any non-terminal state
         */
        enum class OutcomeState
        {
            PROSPECT,  ///< Initial state of every trial
            ENGAGED,   ///< First interaction made
            RESPONDED, ///< Candidate replied
            CONVERTED, ///< Terminal success
            LAPSED     ///< Terminal abandonment
        };

        constexpr int NUM_OUTCOME_STATES = 5;

        constexpr std::array<OutcomeState, NUM_OUTCOME_STATES> ALL_OUTCOME_STATES = {
            OutcomeState::PROSPECT,
            OutcomeState::ENGAGED,
            OutcomeState::RESPONDED,
            OutcomeState::CONVERTED,
            OutcomeState::LAPSED};

        inline bool is_terminal(OutcomeState state)
        {
            return state == OutcomeState::CONVERTED || state == OutcomeState::LAPSED;
        }

        /**
         * @brief Next state on the success path
         * @throws std::invalid_argument for terminal states
         */
        OutcomeState next_state(OutcomeState state);

        std::string to_string(OutcomeState state);

        /**
         * @brief Parse a state name (case-insensitive)
         * @throws std::invalid_argument listing the valid options
         */
        OutcomeState parse_outcome_state(const std::string &name);

        inline int state_index(OutcomeState state)
        {
            return static_cast<int>(state);
        }

    } // namespace simulation
} // namespace allocation

/**
 * @file diagnostics.hpp
 * @brief Warning records and typed failures shared by all components
 *
 * Numerical near-failures are recovered locally and recorded as a
 * Warning on the result object. Structural failures (no candidates,
 * contradictory constraints) are thrown as InfeasibleError.
 */

#pragma once

#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace allocation
{

    /**
     * @enum WarningCode
     * @brief Recoverable numerical conditions
     */
    enum class WarningCode
    {
        INSUFFICIENT_DATA,      ///< Fewer than two candidates, diagonal covariance used
        SINGULAR_BLEND,         ///< Tikhonov-regularized inverse used in view blending
        REGULARIZED_COVARIANCE, ///< Covariance shrunk toward its diagonal before solving
        CORRELATION_REPAIRED,   ///< Correlation source was not PSD, eigenvalues clipped
        PARTIAL_SIMULATION      ///< Time budget expired before all trials completed
    };

    /**
     * @struct Warning
     * @brief A recovered numerical condition, surfaced to the caller
     */
    struct Warning
    {
        WarningCode code;
        std::string message;

        nlohmann::json to_json() const;
    };

    /**
     * @class InfeasibleError
     * @brief Constraints are contradictory or the candidate set is empty
     *
     * Fatal to the call that raised it only; no engine state survives
     * between calls.
     */
    class InfeasibleError : public std::invalid_argument
    {
    public:
        explicit InfeasibleError(const std::string &what)
            : std::invalid_argument("Infeasible: " + what)
        {
        }
    };

    std::string to_string(WarningCode code);

    /**
     * @brief Check whether a warning with the given code is present
     */
    bool has_warning(const std::vector<Warning> &warnings, WarningCode code);

    /**
     * @brief Append all warnings from source to target
     */
    void append_warnings(std::vector<Warning> &target, const std::vector<Warning> &source);

    /**
     * @brief Print warnings as "Warning [CODE]: message" lines
     */
    void print_warnings(const std::vector<Warning> &warnings, std::ostream &os);

} // namespace allocation

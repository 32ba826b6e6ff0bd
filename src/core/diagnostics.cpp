/**
 * @file diagnostics.cpp
 * @brief Warning helpers
 */

#include "core/diagnostics.hpp"
#include <algorithm>

namespace allocation
{

    nlohmann::json Warning::to_json() const
    {
        return nlohmann::json{
            {"code", to_string(code)},
            {"message", message}};
    }

    std::string to_string(WarningCode code)
    {
        switch (code)
        {
        case WarningCode::INSUFFICIENT_DATA:
            return "INSUFFICIENT_DATA";
        case WarningCode::SINGULAR_BLEND:
            return "SINGULAR_BLEND";
        case WarningCode::REGULARIZED_COVARIANCE:
            return "REGULARIZED_COVARIANCE";
        case WarningCode::CORRELATION_REPAIRED:
            return "CORRELATION_REPAIRED";
        case WarningCode::PARTIAL_SIMULATION:
            return "PARTIAL_SIMULATION";
        }
        return "UNKNOWN";
    }

    bool has_warning(const std::vector<Warning> &warnings, WarningCode code)
    {
        return std::any_of(warnings.begin(), warnings.end(),
                           [code](const Warning &w)
                           { return w.code == code; });
    }

    void append_warnings(std::vector<Warning> &target, const std::vector<Warning> &source)
    {
        target.insert(target.end(), source.begin(), source.end());
    }

    void print_warnings(const std::vector<Warning> &warnings, std::ostream &os)
    {
        for (const auto &w : warnings)
        {
            os << "Warning [" << to_string(w.code) << "]: " << w.message << "\n";
        }
    }

} // namespace allocation

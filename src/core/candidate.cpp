/**
 * @file candidate.cpp
 * @brief Validation and JSON conversion for candidates and views
 */

#include "core/candidate.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <set>
#include <stdexcept>

namespace allocation
{

    // ============================================================================
    // Candidate Implementation
    // ============================================================================

    void Candidate::validate() const
    {
        if (id.empty())
        {
            throw std::invalid_argument("Candidate id cannot be empty");
        }

        if (!std::isfinite(alpha))
        {
            throw std::invalid_argument("Candidate '" + id + "' has non-finite alpha");
        }

        if (!std::isfinite(risk) || risk < 0.0)
        {
            throw std::invalid_argument(
                "Candidate '" + id + "' has invalid risk: " + std::to_string(risk));
        }

        for (double f : features)
        {
            if (!std::isfinite(f))
            {
                throw std::invalid_argument(
                    "Candidate '" + id + "' has NaN or Inf feature values");
            }
        }
    }

    nlohmann::json Candidate::to_json() const
    {
        return nlohmann::json{
            {"id", id},
            {"alpha", alpha},
            {"risk", risk},
            {"features", features}};
    }

    Candidate Candidate::from_json(const nlohmann::json &j)
    {
        Candidate c;
        c.id = j.at("id").get<std::string>();
        c.alpha = j.at("alpha").get<double>();
        c.risk = j.at("risk").get<double>();

        if (j.contains("features"))
        {
            c.features = j.at("features").get<std::vector<double>>();
        }

        c.validate();
        return c;
    }

    // ============================================================================
    // View Implementation
    // ============================================================================

    void View::validate() const
    {
        if (targets.empty())
        {
            throw std::invalid_argument("View has no target candidates");
        }

        if (!std::isfinite(value))
        {
            throw std::invalid_argument("View value must be finite");
        }

        if (!(confidence >= 0.0 && confidence <= 1.0))
        {
            throw std::invalid_argument(
                "View confidence must be in [0, 1], got: " + std::to_string(confidence));
        }

        if (type == ViewType::RELATIVE && against.empty())
        {
            throw std::invalid_argument("Relative view requires an 'against' group");
        }

        std::set<std::string> seen(targets.begin(), targets.end());
        if (seen.size() != targets.size())
        {
            throw std::invalid_argument("View contains duplicate target ids");
        }

        for (const auto &id : against)
        {
            if (seen.count(id))
            {
                throw std::invalid_argument(
                    "Candidate '" + id + "' appears on both sides of a relative view");
            }
        }
    }

    nlohmann::json View::to_json() const
    {
        nlohmann::json j{
            {"targets", targets},
            {"value", value},
            {"confidence", confidence},
            {"type", to_string(type)}};

        if (!against.empty())
        {
            j["against"] = against;
        }
        return j;
    }

    View View::from_json(const nlohmann::json &j)
    {
        View v;

        // Accept either a single "target" or a list of "targets"
        if (j.contains("targets"))
        {
            v.targets = j.at("targets").get<std::vector<std::string>>();
        }
        else if (j.contains("target"))
        {
            v.targets.push_back(j.at("target").get<std::string>());
        }

        if (j.contains("against"))
        {
            v.against = j.at("against").get<std::vector<std::string>>();
        }

        v.value = j.at("value").get<double>();
        v.confidence = j.value("confidence", 0.5);
        v.type = parse_view_type(j.value("type", std::string("absolute")));

        v.validate();
        return v;
    }

    ViewType parse_view_type(const std::string &type)
    {
        std::string normalized = type;
        std::transform(normalized.begin(), normalized.end(), normalized.begin(), [](unsigned char c)
                       { return std::tolower(c); });

        if (normalized == "absolute")
        {
            return ViewType::ABSOLUTE;
        }
        else if (normalized == "relative")
        {
            return ViewType::RELATIVE;
        }

        throw std::invalid_argument(
            "Unknown view type: '" + type + "'. Valid options: absolute, relative");
    }

    std::string to_string(ViewType type)
    {
        switch (type)
        {
        case ViewType::ABSOLUTE:
            return "absolute";
        case ViewType::RELATIVE:
            return "relative";
        }
        return "unknown";
    }

} // namespace allocation

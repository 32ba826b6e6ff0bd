/**
 * @file candidate.hpp
 * @brief Candidate and view records consumed by the allocation engine
 *
 * Candidates and views are supplied by the caller and are read-only
 * for the duration of a run. Everything derived from them (covariance,
 * allocations, simulation statistics) is rebuilt on every invocation.
 */

#pragma once

#include <functional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace allocation
{

    /**
     * @struct Candidate
     * @brief One scored candidate in the selection stream
     */
    struct Candidate
    {
        std::string id;               ///< Unique identifier
        double alpha = 0.0;           ///< Expected-value estimate
        double risk = 0.0;            ///< Standard deviation of outcome
        std::vector<double> features; ///< Optional feature vector for correlation

        /**
         * @brief Validate candidate fields
         * @throws std::invalid_argument if id is empty or alpha/risk are invalid
         */
        void validate() const;

        nlohmann::json to_json() const;
        static Candidate from_json(const nlohmann::json &j);
    };

    /**
     * @enum ViewType
     * @brief Shape of a subjective view
     */
    enum class ViewType
    {
        ABSOLUTE, ///< Average return of targets equals value
        RELATIVE  ///< Targets outperform 'against' by value
    };

    /**
     * @struct View
     * @brief Confidence-weighted adjustment to the prior return of a group
     *
     * Example: View{{"c1", "c2"}, {}, 0.4, 0.8, ViewType::ABSOLUTE}
     *          states that c1 and c2 return 0.4 on average, with 80% confidence.
     */
    struct View
    {
        std::vector<std::string> targets;  ///< Candidate ids the view is about
        std::vector<std::string> against;  ///< Comparison group (RELATIVE only)
        double value = 0.0;                ///< Return override or outperformance
        double confidence = 0.5;           ///< Confidence in [0, 1]
        ViewType type = ViewType::ABSOLUTE;

        /**
         * @brief Validate view shape
         * @throws std::invalid_argument if targets are empty, confidence is
         *         outside [0, 1], or a relative view has no comparison group
         */
        void validate() const;

        nlohmann::json to_json() const;
        static View from_json(const nlohmann::json &j);
    };

    /**
     * @brief Injected alpha scorer (Candidate -> expected value)
     *
     * When empty, Candidate::alpha is used as the expected return.
     */
    using ScoringFunction = std::function<double(const Candidate &)>;

    ViewType parse_view_type(const std::string &type);
    std::string to_string(ViewType type);

} // namespace allocation

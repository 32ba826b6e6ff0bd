/**
 * @file data_loader.hpp
 * @brief Loading and parsing of candidates, views and interaction outcomes
 *
 * Provides functionality to load scored candidates from CSV files and
 * views, outcomes and configuration from JSON files.
 */

#pragma once

#include "core/candidate.hpp"
#include "simulation/transition_model.hpp"
#include <istream>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace allocation
{

    /**
     * @class DataLoader
     * @brief Loads and parses engine inputs
     *
     * Candidate CSV format (header required, feature columns optional):
     *
     * id,alpha,risk,feature_1,feature_2,...
     * c001,0.42,0.18,1.3,-0.2
     */
    class DataLoader
    {
    public:
        DataLoader() = default;
        ~DataLoader() = default;

        // ========================================================================
        // CSV Loading Methods
        // ========================================================================

        /**
         * @brief Load candidates from a CSV file
         * @param filepath Path to CSV file
         * @return Candidates in file order
         * @throws std::runtime_error if the file cannot be read or holds no valid rows
         */
        static std::vector<Candidate> load_candidates_csv(const std::string &filepath);

        /**
         * @brief Parse candidates from a CSV stream
         *
         * Rows with a missing id or a non-finite alpha or risk are skipped.
         * Missing feature cells become NaN and make the row invalid.
         *
         * @throws std::runtime_error if the header is missing or malformed
         */
        static std::vector<Candidate> parse_candidates_csv(std::istream &input);

        /**
         * @brief Save candidates to CSV in the format load_candidates_csv reads
         * @throws std::runtime_error if the file cannot be opened
         */
        static void save_candidates_csv(const std::vector<Candidate> &candidates,
                                        const std::string &filepath);

        // ========================================================================
        // JSON Loading
        // ========================================================================

        /**
         * @brief Load JSON file
         * @throws std::runtime_error if file cannot be loaded or parsed
         */
        static nlohmann::json load_json(const std::string &filepath);

        /**
         * @brief Load views from a JSON array, or an object with a "views" array
         * @throws std::invalid_argument if a view is malformed
         */
        static std::vector<View> load_views(const std::string &filepath);
        static std::vector<View> parse_views(const nlohmann::json &j);

        /**
         * @brief Load historical interaction outcomes for calibration
         *
         * Expects an array of {engaged, responded, converted, lapsed} objects,
         * or an object with an "outcomes" array.
         */
        static std::vector<simulation::InteractionOutcome> load_outcomes(const std::string &filepath);
        static std::vector<simulation::InteractionOutcome> parse_outcomes(const nlohmann::json &j);

        // ========================================================================
        // Data Generation (for testing)
        // ========================================================================

        /**
         * @brief Generate synthetic scored candidates
         * @param count Number of candidates
         * @param num_features Feature dimension
         * @param seed Generator seed
         *
         * Alpha is drawn from a Beta-like distribution on (0, 1), risk is
         * proportional to sqrt(alpha * (1 - alpha)) with noise, and features
         * are standard normal with the first feature tilted toward alpha.
         */
        static std::vector<Candidate> generate_synthetic_candidates(size_t count,
                                                                    size_t num_features,
                                                                    unsigned int seed);

    private:
        static std::vector<std::string> parse_csv_line(const std::string &line);

        static std::string trim(const std::string &str);

        /**
         * @brief Convert string to double safely
         * @return Double value, or NaN if conversion fails
         */
        static double safe_stod(const std::string &str);
    };

} // namespace allocation

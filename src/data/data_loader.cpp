/**
 * @file data_loader.cpp
 * @brief Implementation of DataLoader
 */

#include "data/data_loader.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <limits>
#include <random>
#include <set>
#include <sstream>
#include <stdexcept>

namespace allocation
{

    // ===========================
    // CSV Loading
    // ===========================

    std::vector<Candidate> DataLoader::load_candidates_csv(const std::string &filepath)
    {
        std::ifstream file(filepath);
        if (!file.is_open())
        {
            throw std::runtime_error("Could not open file: " + filepath);
        }

        std::vector<Candidate> candidates = parse_candidates_csv(file);
        if (candidates.empty())
        {
            throw std::runtime_error("No valid candidates found in CSV file: " + filepath);
        }
        return candidates;
    }

    std::vector<Candidate> DataLoader::parse_candidates_csv(std::istream &input)
    {
        std::string line;

        // Read header line
        if (!std::getline(input, line))
        {
            throw std::runtime_error("Empty CSV file");
        }

        auto header = parse_csv_line(line);
        for (auto &column : header)
        {
            column = trim(column);
            std::transform(column.begin(), column.end(), column.begin(), [](unsigned char c)
                           { return std::tolower(c); });
        }

        if (header.size() < 3 || header[0] != "id" || header[1] != "alpha" || header[2] != "risk")
        {
            throw std::runtime_error("CSV must start with 'id,alpha,risk' columns");
        }

        const size_t num_features = header.size() - 3;

        std::vector<Candidate> candidates;
        std::set<std::string> seen;

        while (std::getline(input, line))
        {
            if (trim(line).empty())
                continue;

            auto fields = parse_csv_line(line);

            Candidate candidate;
            candidate.id = trim(fields[0]);
            if (candidate.id.empty() || fields.size() < 3)
                continue;

            candidate.alpha = safe_stod(fields[1]);
            candidate.risk = safe_stod(fields[2]);

            // Skip rows whose estimates are unusable
            if (!std::isfinite(candidate.alpha) || !std::isfinite(candidate.risk) || candidate.risk < 0.0)
                continue;

            candidate.features.reserve(num_features);
            bool features_ok = true;
            for (size_t k = 0; k < num_features; ++k)
            {
                const size_t idx = k + 3;
                const double value = idx < fields.size() ? safe_stod(fields[idx])
                                                         : std::numeric_limits<double>::quiet_NaN();
                if (!std::isfinite(value))
                {
                    features_ok = false;
                    break;
                }
                candidate.features.push_back(value);
            }
            if (!features_ok)
                continue;

            if (!seen.insert(candidate.id).second)
            {
                throw std::runtime_error("Duplicate candidate id in CSV: " + candidate.id);
            }

            candidates.push_back(std::move(candidate));
        }

        return candidates;
    }

    void DataLoader::save_candidates_csv(const std::vector<Candidate> &candidates,
                                         const std::string &filepath)
    {
        std::ofstream file(filepath);
        if (!file.is_open())
        {
            throw std::runtime_error("Could not open file for writing: " + filepath);
        }

        const size_t num_features = candidates.empty() ? 0 : candidates.front().features.size();

        file << "id,alpha,risk";
        for (size_t k = 0; k < num_features; ++k)
        {
            file << ",feature_" << (k + 1);
        }
        file << "\n";

        file << std::fixed << std::setprecision(6);
        for (const auto &c : candidates)
        {
            file << c.id << "," << c.alpha << "," << c.risk;
            for (double f : c.features)
            {
                file << "," << f;
            }
            file << "\n";
        }
    }

    // ================
    // JSON Loading
    // ================

    nlohmann::json DataLoader::load_json(const std::string &filepath)
    {
        std::ifstream file(filepath);
        if (!file.is_open())
        {
            throw std::runtime_error("Could not open JSON file: " + filepath);
        }

        nlohmann::json j;
        try
        {
            file >> j;
        }
        catch (const nlohmann::json::exception &e)
        {
            throw std::runtime_error("JSON parsing error in " + filepath + ": " + std::string(e.what()));
        }

        return j;
    }

    std::vector<View> DataLoader::parse_views(const nlohmann::json &j)
    {
        const nlohmann::json &array = (j.is_object() && j.contains("views")) ? j.at("views") : j;
        if (!array.is_array())
        {
            throw std::invalid_argument("Views document must be an array or contain a 'views' array");
        }

        std::vector<View> views;
        views.reserve(array.size());
        for (const auto &item : array)
        {
            views.push_back(View::from_json(item));
        }
        return views;
    }

    std::vector<View> DataLoader::load_views(const std::string &filepath)
    {
        return parse_views(load_json(filepath));
    }

    std::vector<simulation::InteractionOutcome> DataLoader::parse_outcomes(const nlohmann::json &j)
    {
        const nlohmann::json &array = (j.is_object() && j.contains("outcomes")) ? j.at("outcomes") : j;
        if (!array.is_array())
        {
            throw std::invalid_argument("Outcomes document must be an array or contain an 'outcomes' array");
        }

        std::vector<simulation::InteractionOutcome> outcomes;
        outcomes.reserve(array.size());
        for (const auto &item : array)
        {
            outcomes.push_back(simulation::InteractionOutcome::from_json(item));
        }
        return outcomes;
    }

    std::vector<simulation::InteractionOutcome> DataLoader::load_outcomes(const std::string &filepath)
    {
        return parse_outcomes(load_json(filepath));
    }

    // ===========================
    // Synthetic Data Generation
    // ===========================

    std::vector<Candidate> DataLoader::generate_synthetic_candidates(size_t count,
                                                                     size_t num_features,
                                                                     unsigned int seed)
    {
        std::mt19937 gen(seed);
        std::gamma_distribution<double> shape_a(2.0, 1.0);
        std::gamma_distribution<double> shape_b(3.0, 1.0);
        std::normal_distribution<double> noise(0.0, 1.0);
        std::uniform_real_distribution<double> risk_scale(0.6, 1.4);

        std::vector<Candidate> candidates;
        candidates.reserve(count);

        const int width = std::max<int>(3, static_cast<int>(std::to_string(count).size()));

        for (size_t i = 0; i < count; ++i)
        {
            // Beta(2, 3) draw via two gammas
            const double x = shape_a(gen);
            const double y = shape_b(gen);
            const double alpha = x / (x + y);

            std::ostringstream id;
            id << "c" << std::setw(width) << std::setfill('0') << (i + 1);

            Candidate c;
            c.id = id.str();
            c.alpha = alpha;
            c.risk = std::sqrt(alpha * (1.0 - alpha)) * risk_scale(gen);

            c.features.reserve(num_features);
            for (size_t k = 0; k < num_features; ++k)
            {
                double f = noise(gen);
                if (k == 0)
                {
                    f += 2.0 * (alpha - 0.4);
                }
                c.features.push_back(f);
            }

            candidates.push_back(std::move(c));
        }

        return candidates;
    }

    // =========================
    // Private Helper Methods
    // =========================

    std::vector<std::string> DataLoader::parse_csv_line(const std::string &line)
    {
        std::vector<std::string> tokens;
        std::string token;
        bool in_quotes = false;

        for (char c : line)
        {
            if (c == '"')
            {
                in_quotes = !in_quotes;
            }
            else if (c == ',' && !in_quotes)
            {
                tokens.push_back(token);
                token.clear();
            }
            else
            {
                token += c;
            }
        }

        tokens.push_back(token);
        return tokens;
    }

    std::string DataLoader::trim(const std::string &str)
    {
        size_t first = str.find_first_not_of(" \t\r\n");
        if (first == std::string::npos)
            return "";

        size_t last = str.find_last_not_of(" \t\r\n");
        return str.substr(first, last - first + 1);
    }

    double DataLoader::safe_stod(const std::string &str)
    {
        std::string trimmed = trim(str);
        if (trimmed.empty() || trimmed == "nan" || trimmed == "NaN")
        {
            return std::numeric_limits<double>::quiet_NaN();
        }

        try
        {
            size_t consumed = 0;
            const double value = std::stod(trimmed, &consumed);
            return consumed == trimmed.size() ? value : std::numeric_limits<double>::quiet_NaN();
        }
        catch (const std::invalid_argument &)
        {
            return std::numeric_limits<double>::quiet_NaN();
        }
        catch (const std::out_of_range &)
        {
            return std::numeric_limits<double>::quiet_NaN();
        }
    }

} // namespace allocation

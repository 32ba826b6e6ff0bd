/**
 * @file simulation_result.cpp
 * @brief Implementation of SimulationResult aggregation
 */

#include "simulation/simulation_result.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace allocation
{
    namespace simulation
    {

        namespace
        {
            constexpr double ZERO_STD_TOLERANCE = 1e-12;

            std::string percentile_key(double level)
            {
                std::ostringstream key;
                key << "p" << level;
                return key.str();
            }
        } // namespace

        double SimulationResult::interpolate_percentile(const std::vector<double> &sorted, double level)
        {
            if (sorted.empty())
            {
                throw std::invalid_argument("Cannot take a percentile of an empty sample");
            }
            if (!(level >= 0.0 && level <= 100.0))
            {
                throw std::invalid_argument(
                    "Percentile must be in [0, 100], got: " + std::to_string(level));
            }

            const double rank = level / 100.0 * static_cast<double>(sorted.size() - 1);
            const size_t lo = static_cast<size_t>(std::floor(rank));
            const size_t hi = std::min(lo + 1, sorted.size() - 1);
            const double frac = rank - static_cast<double>(lo);

            return sorted[lo] + frac * (sorted[hi] - sorted[lo]);
        }

        SimulationResult SimulationResult::from_values(const std::vector<double> &values,
                                                       const std::vector<double> &percentile_levels)
        {
            if (values.empty())
            {
                throw std::invalid_argument("Cannot aggregate zero simulation trials");
            }

            SimulationResult result;
            const double n = static_cast<double>(values.size());

            double sum = 0.0;
            for (double v : values)
            {
                sum += v;
            }
            result.mean = sum / n;

            double sum_sq = 0.0;
            for (double v : values)
            {
                const double d = v - result.mean;
                sum_sq += d * d;
            }
            result.variance = values.size() > 1 ? sum_sq / (n - 1.0) : 0.0;
            result.std_dev = std::sqrt(result.variance);
            result.standard_error = result.std_dev / std::sqrt(n);

            // Sharpe-like ratio is undefined, not infinite, at zero spread
            if (result.std_dev > ZERO_STD_TOLERANCE)
            {
                result.sharpe_ratio = result.mean / result.std_dev;
            }

            std::vector<double> sorted = values;
            std::sort(sorted.begin(), sorted.end());
            for (double level : percentile_levels)
            {
                result.percentiles[level] = interpolate_percentile(sorted, level);
            }

            result.trials_completed = values.size();
            return result;
        }

        void SimulationResult::print_summary() const
        {
            std::cout << "\n=== Simulation Result ===\n";
            std::cout << "Trials:           " << trials_completed << " / " << trials_requested << "\n";
            std::cout << "Horizon:          " << horizon << " steps\n";
            std::cout << "Seed:             " << seed << "\n";
            std::cout << std::string(50, '-') << "\n";

            std::cout << std::fixed << std::setprecision(4);
            std::cout << "  Mean:           " << mean << "\n";
            std::cout << "  Std Dev:        " << std_dev << "\n";
            std::cout << "  Std Error:      " << standard_error << "\n";
            for (const auto &entry : percentiles)
            {
                std::cout << "  " << std::left << std::setw(14) << percentile_key(entry.first) + ":"
                          << std::right << entry.second << "\n";
            }
            std::cout << "  Sharpe Ratio:   ";
            if (sharpe_ratio)
            {
                std::cout << std::setprecision(3) << *sharpe_ratio << "\n";
            }
            else
            {
                std::cout << "undefined\n";
            }

            std::cout << "\nTerminal States:\n";
            std::cout << std::setprecision(4);
            for (OutcomeState state : ALL_OUTCOME_STATES)
            {
                std::cout << "  " << std::left << std::setw(14) << to_string(state)
                          << std::right << terminal_fraction(state) << "\n";
            }

            std::cout << "=========================\n"
                      << std::endl;
        }

        nlohmann::json SimulationResult::to_json() const
        {
            nlohmann::json j;
            j["mean"] = mean;
            j["std_dev"] = std_dev;
            j["variance"] = variance;
            j["standard_error"] = standard_error;
            j["sharpe_ratio"] = sharpe_ratio ? nlohmann::json(*sharpe_ratio) : nlohmann::json(nullptr);
            j["trials_requested"] = trials_requested;
            j["trials_completed"] = trials_completed;
            j["horizon"] = horizon;
            j["seed"] = seed;

            nlohmann::json pct = nlohmann::json::object();
            for (const auto &entry : percentiles)
            {
                pct[percentile_key(entry.first)] = entry.second;
            }
            j["percentiles"] = pct;

            nlohmann::json states = nlohmann::json::object();
            for (OutcomeState state : ALL_OUTCOME_STATES)
            {
                states[to_string(state)] = terminal_fraction(state);
            }
            j["terminal_state_distribution"] = states;

            j["mean_conversion_step"] = mean_conversion_step ? nlohmann::json(*mean_conversion_step)
                                                             : nlohmann::json(nullptr);

            j["warnings"] = nlohmann::json::array();
            for (const auto &w : warnings)
            {
                j["warnings"].push_back(w.to_json());
            }
            return j;
        }

    } // namespace simulation
} // namespace allocation

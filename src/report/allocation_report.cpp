/**
 * @file allocation_report.cpp
 * @brief Implementation of AllocationReport
 */

#include "report/allocation_report.hpp"
#include <algorithm>
#include <iomanip>
#include <iostream>
#include <numeric>

namespace allocation
{
    namespace report
    {

        namespace
        {
            nlohmann::json vector_by_id(const std::vector<std::string> &ids, const Eigen::VectorXd &values)
            {
                nlohmann::json j = nlohmann::json::object();
                for (size_t i = 0; i < ids.size() && static_cast<Eigen::Index>(i) < values.size(); ++i)
                {
                    j[ids[i]] = values(static_cast<Eigen::Index>(i));
                }
                return j;
            }
        } // namespace

        nlohmann::json AllocationReport::to_json() const
        {
            nlohmann::json j;

            j["candidates"] = ids;
            j["correlation_model"] = correlation_model;
            j["effective_views"] = effective_views;
            j["prior_returns"] = vector_by_id(ids, prior_returns);
            j["posterior_returns"] = vector_by_id(ids, posterior_returns);
            j["volatilities"] = vector_by_id(ids, volatilities);

            nlohmann::json chosen = optimization.to_json();
            chosen["allocation"] = allocation.to_json();
            j["allocation"] = chosen;

            j["frontier"] = frontier ? frontier->to_json() : nlohmann::json(nullptr);
            j["simulation"] = simulation ? simulation->to_json() : nlohmann::json(nullptr);

            j["strategy_comparison"] = nlohmann::json::array();
            for (const auto &outcome : strategy_comparison)
            {
                j["strategy_comparison"].push_back(outcome.to_json());
            }

            j["warnings"] = nlohmann::json::array();
            for (const auto &w : warnings)
            {
                j["warnings"].push_back(w.to_json());
            }

            return j;
        }

        void AllocationReport::print_summary() const
        {
            std::cout << "\n";
            std::cout << "========================================\n";
            std::cout << "        ALLOCATION REPORT\n";
            std::cout << "========================================\n";
            std::cout << "Candidates:        " << ids.size() << "\n";
            std::cout << "Correlation model: " << correlation_model << "\n";
            std::cout << "Effective views:   " << effective_views << "\n";

            optimization.print_summary();

            // Largest weights first
            std::vector<size_t> order(allocation.size());
            std::iota(order.begin(), order.end(), 0);
            std::stable_sort(order.begin(), order.end(), [this](size_t a, size_t b)
                             { return allocation.weights[a] > allocation.weights[b]; });

            std::cout << "Top Allocations:\n";
            std::cout << "  " << std::left << std::setw(16) << "Candidate"
                      << std::right << std::setw(10) << "Weight"
                      << std::setw(12) << "Prior" << std::setw(12) << "Posterior" << "\n";

            const size_t shown = std::min<size_t>(order.size(), 10);
            for (size_t k = 0; k < shown; ++k)
            {
                const size_t i = order[k];
                if (allocation.weights[i] <= 0.0)
                {
                    break;
                }
                std::cout << "  " << std::left << std::setw(16) << allocation.ids[i]
                          << std::right << std::fixed << std::setprecision(4)
                          << std::setw(10) << allocation.weights[i]
                          << std::setw(12) << prior_returns(static_cast<Eigen::Index>(i))
                          << std::setw(12) << posterior_returns(static_cast<Eigen::Index>(i)) << "\n";
            }

            if (frontier)
            {
                frontier->print_summary();
            }

            if (simulation)
            {
                simulation->print_summary();
            }

            if (!strategy_comparison.empty())
            {
                std::cout << "Strategy Comparison (by mean):\n";
                for (const auto &outcome : strategy_comparison)
                {
                    std::cout << "  " << std::left << std::setw(20) << outcome.strategy.name
                              << std::right << std::fixed << std::setprecision(4)
                              << " mean=" << outcome.result.mean
                              << " std=" << outcome.result.std_dev << "\n";
                }
                std::cout << "\n";
            }

            if (!warnings.empty())
            {
                std::cout << "Warnings: " << warnings.size() << "\n";
            }
        }

    } // namespace report
} // namespace allocation

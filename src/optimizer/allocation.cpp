/**
 * @file allocation.cpp
 * @brief Implementation of Allocation
 */

#include "optimizer/allocation.hpp"
#include <numeric>
#include <stdexcept>

namespace allocation
{
    namespace optimizer
    {

        Allocation Allocation::from_weights(const std::vector<std::string> &ids,
                                            const Eigen::VectorXd &weights)
        {
            if (static_cast<Eigen::Index>(ids.size()) != weights.size())
            {
                throw std::invalid_argument(
                    "Allocation has " + std::to_string(ids.size()) + " ids but " +
                    std::to_string(weights.size()) + " weights");
            }

            Allocation alloc;
            alloc.ids = ids;
            alloc.weights.assign(weights.data(), weights.data() + weights.size());
            return alloc;
        }

        double Allocation::weight_of(const std::string &id) const
        {
            for (size_t i = 0; i < ids.size(); ++i)
            {
                if (ids[i] == id)
                {
                    return weights[i];
                }
            }
            throw std::invalid_argument("Candidate '" + id + "' is not in the allocation");
        }

        double Allocation::total() const
        {
            return std::accumulate(weights.begin(), weights.end(), 0.0);
        }

        Eigen::VectorXd Allocation::to_vector() const
        {
            Eigen::VectorXd v(static_cast<Eigen::Index>(weights.size()));
            for (size_t i = 0; i < weights.size(); ++i)
            {
                v(static_cast<Eigen::Index>(i)) = weights[i];
            }
            return v;
        }

        nlohmann::json Allocation::to_json() const
        {
            nlohmann::json j = nlohmann::json::object();
            for (size_t i = 0; i < ids.size(); ++i)
            {
                j[ids[i]] = weights[i];
            }
            return j;
        }

    } // namespace optimizer
} // namespace allocation

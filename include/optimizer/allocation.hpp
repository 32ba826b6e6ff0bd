/**
 * @file allocation.hpp
 * @brief Mapping from candidate id to weight
 */

#pragma once

#include <Eigen/Dense>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace allocation
{
    namespace optimizer
    {

        /**
         * @struct Allocation
         * @brief Candidate weights produced by the optimizer
         *
         * Invariants (after the optimizer's clean-up):
         * - every weight lies in [0, 1]
         * - total() <= 1 within floating tolerance
         */
        struct Allocation
        {
            std::vector<std::string> ids; ///< Candidate ids, index order
            std::vector<double> weights;  ///< Weight per candidate

            /**
             * @brief Build from ids and a weight vector
             * @throws std::invalid_argument on size mismatch
             */
            static Allocation from_weights(const std::vector<std::string> &ids,
                                           const Eigen::VectorXd &weights);

            /**
             * @brief Weight of a candidate
             * @throws std::invalid_argument if id is not in the allocation
             */
            double weight_of(const std::string &id) const;

            double total() const;
            size_t size() const { return ids.size(); }
            bool empty() const { return ids.empty(); }

            Eigen::VectorXd to_vector() const;

            /**
             * @brief JSON object {id: weight}
             */
            nlohmann::json to_json() const;
        };

    } // namespace optimizer
} // namespace allocation

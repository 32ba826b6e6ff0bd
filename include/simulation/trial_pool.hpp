/**
 * @file trial_pool.hpp
 * @brief Worker pool for embarrassingly parallel trials
 *
 * Workers pull fixed-size chunks of trial indices from an atomic counter.
 * The task for index i must write only to slot i of caller-owned storage;
 * the pool itself holds no per-trial state beyond a completion flag.
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <vector>

namespace allocation
{
    namespace simulation
    {

        /**
         * @struct TrialPoolReport
         * @brief What a run actually completed
         */
        struct TrialPoolReport
        {
            std::vector<char> completed; ///< completed[i] != 0 if trial i ran to the end
            size_t completed_count = 0;  ///< Number of completed trials
            bool budget_expired = false; ///< Workers stopped on the time budget
        };

        /**
         * @class TrialPool
         * @brief Runs task(i) for i in [0, count) across std::thread workers
         *
         * Usage Example:
         * @code
         * std::vector<double> values(trials);
         * TrialPool pool(4);
         * auto report = pool.run(trials, [&](size_t i) { values[i] = run_trial(i); });
         * @endcode
         *
         * Thread Safety: run() may be called concurrently on distinct pools.
         */
        class TrialPool
        {
        public:
            /**
             * @param num_threads Worker count (0 = hardware concurrency)
             * @param chunk_size Trial indices claimed per counter increment
             * @throws std::invalid_argument if num_threads < 0 or chunk_size == 0
             */
            explicit TrialPool(int num_threads = 0, size_t chunk_size = 64);

            /**
             * @brief Run every trial, or as many as fit in the time budget
             * @param count Number of trials
             * @param task Trial body; must be safe to call concurrently for distinct indices
             * @param time_budget Zero for no budget
             * @return Completion flags and count
             *
             * An exception thrown by a task stops the pool and is rethrown
             * after all workers have joined.
             */
            TrialPoolReport run(size_t count,
                                const std::function<void(size_t)> &task,
                                std::chrono::milliseconds time_budget = std::chrono::milliseconds(0)) const;

            int get_num_threads() const { return num_threads_; }

        private:
            int num_threads_;
            size_t chunk_size_;
        };

    } // namespace simulation
} // namespace allocation

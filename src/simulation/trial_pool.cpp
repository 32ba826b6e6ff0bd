/**
 * @file trial_pool.cpp
 * @brief Implementation of TrialPool
 */

#include "simulation/trial_pool.hpp"
#include <algorithm>
#include <atomic>
#include <exception>
#include <mutex>
#include <stdexcept>
#include <thread>

namespace allocation
{
    namespace simulation
    {

        TrialPool::TrialPool(int num_threads, size_t chunk_size)
            : num_threads_(num_threads),
              chunk_size_(chunk_size)
        {
            if (num_threads < 0)
            {
                throw std::invalid_argument(
                    "Thread count must be non-negative, got: " + std::to_string(num_threads));
            }
            if (chunk_size == 0)
            {
                throw std::invalid_argument("Chunk size must be positive");
            }

            if (num_threads_ == 0)
            {
                num_threads_ = std::max(1u, std::thread::hardware_concurrency());
            }
        }

        TrialPoolReport TrialPool::run(size_t count,
                                       const std::function<void(size_t)> &task,
                                       std::chrono::milliseconds time_budget) const
        {
            TrialPoolReport report;
            report.completed.assign(count, 0);

            if (count == 0)
            {
                return report;
            }

            using Clock = std::chrono::steady_clock;
            const bool has_budget = time_budget.count() > 0;
            const Clock::time_point deadline = Clock::now() + time_budget;

            std::atomic<size_t> next_chunk{0};
            std::atomic<bool> stop{false};
            std::atomic<bool> expired{false};

            std::mutex error_mutex;
            std::exception_ptr first_error;

            auto worker = [&]()
            {
                while (!stop.load(std::memory_order_relaxed))
                {
                    const size_t begin = next_chunk.fetch_add(chunk_size_);
                    if (begin >= count)
                    {
                        return;
                    }
                    const size_t end = std::min(count, begin + chunk_size_);

                    for (size_t i = begin; i < end; ++i)
                    {
                        if (has_budget && Clock::now() >= deadline)
                        {
                            expired.store(true);
                            stop.store(true);
                            return;
                        }

                        try
                        {
                            task(i);
                        }
                        catch (...)
                        {
                            std::lock_guard<std::mutex> lock(error_mutex);
                            if (!first_error)
                            {
                                first_error = std::current_exception();
                            }
                            stop.store(true);
                            return;
                        }
                        report.completed[i] = 1;
                    }
                }
            };

            const size_t max_useful = (count + chunk_size_ - 1) / chunk_size_;
            const size_t n_workers = std::min(static_cast<size_t>(num_threads_), max_useful);

            std::vector<std::thread> workers;
            workers.reserve(n_workers);
            for (size_t t = 0; t < n_workers; ++t)
            {
                workers.emplace_back(worker);
            }
            for (auto &thread : workers)
            {
                thread.join();
            }

            if (first_error)
            {
                std::rethrow_exception(first_error);
            }

            report.completed_count = static_cast<size_t>(
                std::count(report.completed.begin(), report.completed.end(), 1));
            report.budget_expired = expired.load();
            return report;
        }

    } // namespace simulation
} // namespace allocation

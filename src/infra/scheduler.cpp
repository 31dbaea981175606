/*
 * ULIDKIT COMMUNITY LICENSE
 * Version 1.0, February 2026
 *
 * Copyright (c) 2026 Ananda Firmansyah.
 *
 * This source code is licensed under the UlidKit Community License.
 * You may not use this file except in compliance with the License.
 */

/**
 * @file scheduler.cpp
 * @brief Implementation of the worker pool.
 *
 * @details
 * Manages the lifecycle of a fixed worker thread pool, implementing the
 * producer-consumer synchronization pattern with a condition variable and a
 * draining shutdown.
 */

#include "ulidkit/infra/scheduler.hpp"

#include "ulidkit/infra/logger.hpp"

#include <string>
#include <utility>

namespace ulidkit::infra {

/**
 * @brief Constructs the scheduler and initializes the worker cohort.
 *
 * @param threads The number of persistent worker threads (0 = hardware concurrency).
 */
Scheduler::Scheduler(std::size_t threads) : stop_(false)
{
    if (threads == 0) {
        threads = std::thread::hardware_concurrency();
        if (threads == 0) {
            threads = 2;
        }
    }

    for (std::size_t i = 0; i < threads; ++i) {
        workers_.emplace_back([this] {
            /* * ============================================================
             * Worker Thread Event Loop
             * ============================================================
             */
            while (true) {
                std::function<void()> task;

                // --- Critical Section: Task Acquisition ---
                {
                    std::unique_lock<std::mutex> lock(this->queue_mutex_);

                    this->condition_.wait(lock,
                                          [this] { return this->stop_ || !this->tasks_.empty(); });

                    /* * Exit only when stopping AND the queue is drained, so every
                     * submitted future is eventually satisfied.
                     */
                    if (this->stop_ && this->tasks_.empty()) {
                        return;
                    }

                    task = std::move(this->tasks_.front());
                    this->tasks_.pop();
                }
                // --- End Critical Section ---

                if (task) {
                    task();
                }
            }
        });
    }

    Logger::log(LogLevel::DEBUG,
                "Scheduler: Worker pool online with " + std::to_string(workers_.size()) +
                    " threads.");
}

/**
 * @brief Destructor. Orchestrates a graceful pool teardown.
 */
Scheduler::~Scheduler()
{
    {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        stop_ = true;
    }

    condition_.notify_all();

    for (std::thread& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

/**
 * @brief Dispatches a new task to the worker pool and wakes one worker.
 */
void Scheduler::enqueue(std::function<void()> task)
{
    {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        tasks_.emplace(std::move(task));
    }

    condition_.notify_one();
}

std::size_t Scheduler::size() const
{
    return workers_.size();
}

} // namespace ulidkit::infra

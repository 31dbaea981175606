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
 * @file scheduler.hpp
 * @brief Fixed-size worker pool used for parallel chunk dispatch.
 *
 * @details
 * This header defines the `Scheduler` class, a Producer-Consumer thread pool. The
 * streaming engine submits index-tagged slices of a chunk to it and waits on the
 * returned futures; the pool itself makes no ordering promises, which is why the
 * engine writes every result into a pre-sized slot by input index.
 */

#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <type_traits>
#include <vector>

namespace ulidkit::infra {

/**
 * @class Scheduler
 * @brief A thread-safe worker pool for executing tasks asynchronously.
 *
 * @details
 * The Scheduler maintains a fixed cohort of worker threads and a FIFO task queue.
 *
 * **Concurrency Model:**
 * - **Producers:** Any thread can `enqueue()` or `submit()` a task.
 * - **Consumers:** Worker threads sleep on a condition variable until work is available.
 */
class Scheduler {
  public:
    /**
     * @brief Initializes the thread pool and spawns worker threads.
     *
     * @param threads The number of worker threads to spawn. `0` selects
     * `std::thread::hardware_concurrency()`, falling back to 2 when the hardware
     * concurrency cannot be detected.
     */
    explicit Scheduler(std::size_t threads = 0);

    /**
     * @brief Destructor. Drains the queue, then joins every worker.
     *
     * @note This is a **blocking** operation.
     */
    ~Scheduler();

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    /**
     * @brief Submits a fire-and-forget task for asynchronous execution.
     *
     * @param task The operation to execute. It must not throw; tasks that can
     * fail go through `submit()` so the exception reaches the caller.
     */
    void enqueue(std::function<void()> task);

    /**
     * @brief Submits a task and returns a future for its result.
     *
     * Exceptions thrown by the task are captured in the future and rethrown by
     * `get()` on the caller's thread.
     *
     * @code
     * auto done = scheduler.submit([&] { return process_slice(begin, end); });
     * done.get();
     * @endcode
     */
    template <typename F> auto submit(F&& func) -> std::future<std::invoke_result_t<F>>
    {
        using R = std::invoke_result_t<F>;
        // packaged_task is move-only; std::function needs a copyable target.
        auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(func));
        std::future<R> result = task->get_future();
        enqueue([task] { (*task)(); });
        return result;
    }

    /// @brief Number of worker threads owned by the pool.
    std::size_t size() const;

  private:
    /// @brief The container of active worker threads managed by this pool.
    std::vector<std::thread> workers_;

    /// @brief A FIFO queue storing pending tasks waiting for a worker.
    std::queue<std::function<void()>> tasks_;

    /// @brief Synchronization primitive protecting access to the `tasks_` queue.
    std::mutex queue_mutex_;

    /// @brief Signaling mechanism used to wake up workers or notify shutdown.
    std::condition_variable condition_;

    /// @brief Atomic flag controlling the lifecycle of the event loops.
    std::atomic<bool> stop_;
};

} // namespace ulidkit::infra

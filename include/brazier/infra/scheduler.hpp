/*
 * AEVUMDB COMMUNITY LICENSE
 * Version 1.0, February 2026
 *
 * Copyright (c) 2026 Ananda Firmansyah.
 * Official Organization: AevumDB (https://github.com/aevumdb)
 *
 * This source code is licensed under the AevumDB Community License.
 * You may not use this file except in compliance with the License.
 */

/**
 * @file scheduler.hpp
 * @brief Worker pool that executes handler invocations off the caller's thread.
 *
 * @details
 * This header defines the `Scheduler` class, a fixed-size implementation of the
 * Producer-Consumer pattern. The mediator submits every handler invocation to a
 * Scheduler, so a handler that waits on I/O occupies a pool worker rather than the
 * thread that called `send`.
 */

#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace brazier::infra {

/**
 * @class Scheduler
 * @brief A thread-safe worker pool for executing tasks asynchronously.
 *
 * @details
 * **Concurrency Model:**
 * - **Producers:** Any thread can `enqueue()` a task.
 * - **Consumers:** Worker threads sleep on a condition variable until work is available.
 *
 * Tasks run in FIFO order of submission; completion order across workers is not
 * defined.
 */
class Scheduler {
  public:
    /// @brief Worker count used when the requested count (or the detected core count) is 0.
    static constexpr std::size_t kFallbackThreads = 2;

    /**
     * @brief Initializes the thread pool and spawns worker threads.
     *
     * @param threads The number of worker threads to spawn. Defaults to
     * `std::thread::hardware_concurrency()`. A value of 0 is replaced by
     * `kFallbackThreads`.
     */
    explicit Scheduler(std::size_t threads = std::thread::hardware_concurrency());

    /**
     * @brief Destructor. Initiates a graceful shutdown of the pool.
     *
     * @note This is a **blocking** operation. Tasks already queued are drained
     * before the workers are joined, so every pending future is satisfied.
     */
    ~Scheduler();

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    /**
     * @brief Submits a task for asynchronous execution.
     *
     * @param task The unit of work.
     * @throws std::runtime_error if the pool is shutting down.
     */
    void enqueue(std::function<void()> task);

    /// @brief Number of worker threads owned by this pool.
    std::size_t size() const { return workers_.size(); }

    /**
     * @brief Whether the calling thread is one of this pool's workers.
     *
     * Work submitted from inside a task can run inline instead of queuing behind
     * the task that is waiting for it.
     */
    bool is_worker() const;

  private:
    /// @brief Pool that owns the current thread; null outside worker threads.
    static thread_local const Scheduler* current_;

    std::vector<std::thread> workers_;

    std::queue<std::function<void()>> tasks_;

    /// @brief Protects `tasks_` and the `stop_` transition.
    std::mutex queue_mutex_;

    std::condition_variable condition_;

    std::atomic<bool> stop_;
};

} // namespace brazier::infra

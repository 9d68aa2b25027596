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
 * @file scheduler.cpp
 * @brief Implementation of the worker pool backing asynchronous dispatch.
 */

#include "brazier/infra/scheduler.hpp"

#include "brazier/infra/logger.hpp"

#include <stdexcept>
#include <string>

namespace brazier::infra {

thread_local const Scheduler* Scheduler::current_ = nullptr;

Scheduler::Scheduler(std::size_t threads) : stop_(false)
{
    if (threads == 0) {
        threads = kFallbackThreads;
    }

    for (std::size_t i = 0; i < threads; ++i) {
        workers_.emplace_back([this] {
            current_ = this;

            while (true) {
                std::function<void()> task;

                {
                    std::unique_lock<std::mutex> lock(this->queue_mutex_);

                    this->condition_.wait(lock,
                                          [this] { return this->stop_ || !this->tasks_.empty(); });

                    // Leave only once stopping AND drained, so no promise is abandoned.
                    if (this->stop_ && this->tasks_.empty()) {
                        return;
                    }

                    task = std::move(this->tasks_.front());
                    this->tasks_.pop();
                }

                // Run outside the lock; other workers keep pulling tasks meanwhile.
                if (task) {
                    task();
                }
            }
        });
    }

    Logger::log(LogLevel::DEBUG, "Scheduler: Started " + std::to_string(threads) + " worker(s)");
}

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

void Scheduler::enqueue(std::function<void()> task)
{
    {
        std::unique_lock<std::mutex> lock(queue_mutex_);

        if (stop_) {
            throw std::runtime_error("Scheduler: enqueue on a stopped pool");
        }

        tasks_.emplace(std::move(task));
    }

    condition_.notify_one();
}

bool Scheduler::is_worker() const
{
    return current_ == this;
}

} // namespace brazier::infra

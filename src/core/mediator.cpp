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
 * @file mediator.cpp
 * @brief Registry maintenance for the `Mediator`.
 *
 * @details
 * The templated halves of `register_handler` and `send` live in the header; this
 * file owns everything that touches the lock-protected map directly.
 */

#include "brazier/core/mediator.hpp"

#include <algorithm>
#include <mutex>

namespace brazier::core {

using infra::Logger;
using infra::LogLevel;

Mediator::Mediator(infra::Scheduler& scheduler) : scheduler_(scheduler) {}

void Mediator::install(std::shared_ptr<detail::HandlerSlot> slot)
{
    const HandlerInfo info = slot->info();
    std::shared_ptr<detail::HandlerSlot> replaced;

    {
        std::unique_lock lock(rw_lock_);
        auto& entry = registry_[slot->key()];
        replaced = std::move(entry);
        entry = std::move(slot);
    }

    // Log outside the exclusive section; senders must not wait on console I/O.
    if (replaced) {
        Logger::log(LogLevel::WARN, "Mediator: Handler '" + replaced->info().handler_type +
                                        "' for '" + info.request_type + "' replaced by '" +
                                        info.handler_type + "'");
    } else {
        Logger::log(LogLevel::DEBUG, "Mediator: Registered '" + info.handler_type + "' for '" +
                                         info.request_type + "' -> '" + info.response_type +
                                         "'");
    }
}

std::shared_ptr<detail::HandlerSlot> Mediator::find(std::type_index key) const
{
    std::shared_lock lock(rw_lock_);
    auto it = registry_.find(key);
    if (it == registry_.end()) {
        return nullptr;
    }
    return it->second;
}

std::size_t Mediator::handler_count() const
{
    std::shared_lock lock(rw_lock_);
    return registry_.size();
}

std::vector<HandlerInfo> Mediator::snapshot() const
{
    std::vector<HandlerInfo> entries;
    {
        std::shared_lock lock(rw_lock_);
        entries.reserve(registry_.size());
        for (const auto& entry : registry_) {
            entries.push_back(entry.second->info());
        }
    }

    std::sort(entries.begin(), entries.end(), [](const HandlerInfo& a, const HandlerInfo& b) {
        return a.request_type < b.request_type;
    });
    return entries;
}

HandlerNotRegistered Mediator::on_miss(const std::string& request_type)
{
    Logger::log(LogLevel::DEBUG, "Mediator: No handler registered for '" + request_type + "'");
    return HandlerNotRegistered(request_type);
}

void Mediator::on_corruption(const std::string& request_type, const HandlerInfo& stored)
{
    Logger::log(LogLevel::FATAL, "Mediator: Registry entry for '" + request_type +
                                     "' does not match its key (holds '" + stored.handler_type +
                                     "' for '" + stored.request_type + "')");
    throw RegistryCorrupted(request_type, stored.handler_type);
}

} // namespace brazier::core

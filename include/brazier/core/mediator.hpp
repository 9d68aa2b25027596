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
 * @file mediator.hpp
 * @brief Request router: one handler per request type, asynchronous dispatch.
 *
 * @details
 * The `Mediator` owns a registry keyed by request type. Registration wraps each
 * concrete handler in a type-erased slot; `send` recovers the typed slot for the
 * request, submits the invocation to a `Scheduler`, and hands back a `std::future`
 * for the response.
 *
 * **Registration policy:** one handler per request type. Registering another
 * handler for a type that already has one replaces it (last registration wins) and
 * emits a `WARN` log line. Handlers are never fanned out.
 *
 * **Thread safety:** the registry sits behind a reader-writer lock. `send` and the
 * query methods share it; `register_handler` takes it exclusively. The lock is
 * released before the handler is scheduled.
 *
 * @code
 * brazier::infra::Scheduler scheduler(4);
 * brazier::core::Mediator mediator(scheduler);
 * mediator.register_handler(PingHandler{});
 * std::string reply = mediator.send(Ping{}).get(); // "pong!"
 * @endcode
 */

#pragma once

#include "brazier/core/error.hpp"
#include "brazier/core/handler.hpp"
#include "brazier/core/request.hpp"
#include "brazier/infra/logger.hpp"
#include "brazier/infra/scheduler.hpp"
#include "brazier/infra/type_name.hpp"

#include <cstddef>
#include <exception>
#include <future>
#include <memory>
#include <shared_mutex>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <typeindex>
#include <typeinfo>
#include <unordered_map>
#include <utility>
#include <vector>

namespace brazier::core {

/**
 * @struct HandlerInfo
 * @brief Readable description of one registry entry.
 */
struct HandlerInfo {
    std::string request_type;
    std::string response_type;
    std::string handler_type;
};

namespace detail {

/// @brief The single place the registry key is derived, for storage and lookup alike.
template <typename TRequest> std::type_index registry_key()
{
    return std::type_index(typeid(TRequest));
}

/**
 * @class HandlerSlot
 * @brief Type-erased registry entry.
 */
class HandlerSlot {
  public:
    HandlerSlot(std::type_index key, HandlerInfo info) : key_(key), info_(std::move(info)) {}
    virtual ~HandlerSlot() = default;

    std::type_index key() const { return key_; }
    const HandlerInfo& info() const { return info_; }

  private:
    std::type_index key_;
    HandlerInfo info_;
};

/**
 * @class TypedHandlerSlot
 * @brief Registry entry that knows the concrete request/response signature.
 */
template <typename TRequest, typename TResponse> class TypedHandlerSlot final : public HandlerSlot {
  public:
    TypedHandlerSlot(std::shared_ptr<RequestHandler<TRequest, TResponse>> handler,
                     std::string handler_type)
        : HandlerSlot(registry_key<TRequest>(),
                      HandlerInfo{infra::TypeName::of<TRequest>(), infra::TypeName::of<TResponse>(),
                                  std::move(handler_type)}),
          handler_(std::move(handler))
    {
    }

    TResponse invoke(TRequest request) { return handler_->handle(std::move(request)); }

  private:
    std::shared_ptr<RequestHandler<TRequest, TResponse>> handler_;
};

} // namespace detail

/**
 * @class Mediator
 * @brief Routes each request to the handler registered for its type.
 */
class Mediator {
  public:
    /**
     * @brief Creates an empty mediator.
     *
     * @param scheduler Pool that runs handler invocations. Must outlive every
     * future returned by `send`.
     */
    explicit Mediator(infra::Scheduler& scheduler);

    Mediator(const Mediator&) = delete;
    Mediator& operator=(const Mediator&) = delete;

    /**
     * @brief Registers `handler` for `THandler::request_type`.
     *
     * Replaces any handler previously registered for the same request type.
     *
     * @return `*this`, so registrations can be chained.
     * @throws std::invalid_argument if `handler` is null.
     */
    template <typename THandler> Mediator& register_handler(std::shared_ptr<THandler> handler)
    {
        static_assert(is_handler_v<THandler>,
                      "THandler must derive from brazier::core::RequestHandler<TRequest, TResponse>");

        using TRequest = typename THandler::request_type;
        using TResponse = typename THandler::response_type;

        if (!handler) {
            throw std::invalid_argument("Mediator: null handler for request type '" +
                                        infra::TypeName::of<TRequest>() + "'");
        }

        std::string handler_type = infra::TypeName::demangle(typeid(*handler));
        install(std::make_shared<detail::TypedHandlerSlot<TRequest, TResponse>>(
            std::shared_ptr<RequestHandler<TRequest, TResponse>>(std::move(handler)),
            std::move(handler_type)));
        return *this;
    }

    /// @brief Moves a handler value into the registry.
    template <typename THandler, typename = std::enable_if_t<is_handler_v<THandler>>>
    Mediator& register_handler(THandler handler)
    {
        return register_handler(std::make_shared<THandler>(std::move(handler)));
    }

    /**
     * @brief Dispatches `request` to its handler.
     *
     * The registry lookup happens on the calling thread; the handler runs on a
     * scheduler worker. When `send` is itself called from one of the scheduler's
     * workers (a handler issuing a sub-request), the handler runs inline on that
     * worker, so waiting on the returned future cannot deadlock the pool.
     *
     * @return A future for the response. `get()` rethrows `HandlerNotRegistered` when
     * no handler exists, or the handler's own exception, unchanged.
     * @throws RegistryCorrupted on an internal invariant violation (never expected).
     */
    template <typename TRequest> std::future<response_of_t<TRequest>> send(TRequest request)
    {
        static_assert(is_request_v<TRequest>, "TRequest must derive from brazier::core::Request<R>");

        using TResponse = response_of_t<TRequest>;
        using Slot = detail::TypedHandlerSlot<TRequest, TResponse>;

        std::shared_ptr<detail::HandlerSlot> entry = find(detail::registry_key<TRequest>());
        if (!entry) {
            std::promise<TResponse> missing;
            missing.set_exception(std::make_exception_ptr(on_miss(infra::TypeName::of<TRequest>())));
            return missing.get_future();
        }

        std::shared_ptr<Slot> slot = std::dynamic_pointer_cast<Slot>(entry);
        if (!slot) {
            on_corruption(infra::TypeName::of<TRequest>(), entry->info());
        }

        auto pending = std::make_shared<std::promise<TResponse>>();
        std::future<TResponse> outcome = pending->get_future();

        // A handler sending a sub-request already holds a worker; queuing behind
        // itself would starve the pool, so nested sends run on the current thread.
        if (scheduler_.is_worker()) {
            fulfil(*slot, *pending, std::move(request));
            return outcome;
        }

        auto payload = std::make_shared<TRequest>(std::move(request));
        try {
            scheduler_.enqueue(
                [slot, pending, payload]() { fulfil(*slot, *pending, std::move(*payload)); });
        } catch (const std::exception&) {
            // Scheduler is shutting down; report through the outcome like any other failure.
            pending->set_exception(std::current_exception());
        }

        return outcome;
    }

    /// @brief Whether a handler is registered for `TRequest`.
    template <typename TRequest> bool has_handler() const
    {
        return find(detail::registry_key<TRequest>()) != nullptr;
    }

    /// @brief Number of registered request types.
    std::size_t handler_count() const;

    /// @brief Description of every entry, sorted by request type name.
    std::vector<HandlerInfo> snapshot() const;

  private:
    /// @brief Runs the handler and settles `pending` with its value or exception.
    template <typename TRequest, typename TResponse>
    static void fulfil(detail::TypedHandlerSlot<TRequest, TResponse>& slot,
                       std::promise<TResponse>& pending, TRequest request)
    {
        try {
            if constexpr (std::is_void_v<TResponse>) {
                slot.invoke(std::move(request));
                pending.set_value();
            } else {
                pending.set_value(slot.invoke(std::move(request)));
            }
        } catch (...) {
            pending.set_exception(std::current_exception());
        }
    }

    void install(std::shared_ptr<detail::HandlerSlot> slot);

    std::shared_ptr<detail::HandlerSlot> find(std::type_index key) const;

    static HandlerNotRegistered on_miss(const std::string& request_type);

    [[noreturn]] static void on_corruption(const std::string& request_type,
                                           const HandlerInfo& stored);

    infra::Scheduler& scheduler_;

    mutable std::shared_mutex rw_lock_;

    std::unordered_map<std::type_index, std::shared_ptr<detail::HandlerSlot>> registry_;
};

} // namespace brazier::core

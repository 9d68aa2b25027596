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
 * @file handler.hpp
 * @brief The contract every request handler implements.
 *
 * @details
 * A handler turns one request value into one response value, or fails by throwing.
 * Handlers never run on the caller's thread: the `Mediator` submits each call to its
 * `Scheduler`, and the caller observes the result through a `std::future`. A handler
 * that blocks on I/O therefore stalls a single pool worker and nothing else.
 *
 * A handler may itself `send` a sub-request and wait on it. That nested call runs
 * inline on the worker already executing the outer handler.
 */

#pragma once

#include "brazier/core/request.hpp"

#include <type_traits>

namespace brazier::core {

/**
 * @class RequestHandler
 * @brief Abstract handler for one request type.
 *
 * @tparam TRequest  A type deriving from `Request<TResponse>`.
 * @tparam TResponse Must equal `TRequest::response_type`; defaulted accordingly.
 *
 * Handlers may keep mutable state between calls. Concurrent `send` calls for the
 * same request type run `handle` concurrently on different workers, so such
 * state must be synchronized by the handler.
 *
 * @code
 * class PingHandler : public brazier::core::RequestHandler<Ping> {
 *   public:
 *     std::string handle(Ping) override { return "pong!"; }
 * };
 * @endcode
 */
template <typename TRequest, typename TResponse = response_of_t<TRequest>> class RequestHandler {
    static_assert(is_request_v<TRequest>, "TRequest must derive from brazier::core::Request<R>");
    static_assert(std::is_same_v<TResponse, response_of_t<TRequest>>,
                  "TResponse must match the response type declared by TRequest");

  public:
    using request_type = TRequest;
    using response_type = TResponse;

    virtual ~RequestHandler() = default;

    /**
     * @brief Produces the response for `request`.
     *
     * @param request Consumed by the call.
     * @return The response value.
     * @throws Any exception; it is delivered unchanged to the caller of `send`.
     */
    virtual TResponse handle(TRequest request) = 0;
};

namespace detail {

template <typename T, typename = void> struct is_handler : std::false_type {};

template <typename T>
struct is_handler<T, std::void_t<typename T::request_type, typename T::response_type>>
    : std::is_base_of<RequestHandler<typename T::request_type, typename T::response_type>, T> {};

} // namespace detail

/// @brief True when `T` implements `RequestHandler<T::request_type, T::response_type>`.
template <typename T> inline constexpr bool is_handler_v = detail::is_handler<T>::value;

} // namespace brazier::core

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
 * @file request.hpp
 * @brief Compile-time association between a request type and its response type.
 *
 * @details
 * Every request routed through the `Mediator` derives from `Request<TResponse>`.
 * The base carries no data; it only publishes `response_type`, which lets
 * `Mediator::send` infer the result type from its argument alone.
 *
 * @code
 * struct Ping : brazier::core::Request<std::string> {};
 *
 * std::future<std::string> reply = mediator.send(Ping{});
 * @endcode
 */

#pragma once

#include <type_traits>

namespace brazier::core {

/**
 * @struct Request
 * @brief Marker base declaring the single response type a request produces.
 *
 * @tparam TResponse The value handed back on success. May be `void`.
 */
template <typename TResponse> struct Request {
    using response_type = TResponse;
};

/// @brief The response type a request type is linked to.
template <typename TRequest> using response_of_t = typename TRequest::response_type;

namespace detail {

template <typename T, typename = void> struct is_request : std::false_type {};

template <typename T>
struct is_request<T, std::void_t<typename T::response_type>>
    : std::is_base_of<Request<typename T::response_type>, T> {};

} // namespace detail

/// @brief True when `T` derives from `Request<T::response_type>`.
template <typename T> inline constexpr bool is_request_v = detail::is_request<T>::value;

} // namespace brazier::core

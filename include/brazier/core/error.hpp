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
 * @file error.hpp
 * @brief Failures raised by the mediator itself.
 *
 * @details
 * **Taxonomy:**
 * - `HandlerNotRegistered`: `send` found no handler for the request type. Delivered
 *   through the returned future.
 * - Handler failures: whatever the handler threw, delivered through the future with
 *   its dynamic type and message intact. The mediator defines no wrapper for them.
 * - `RegistryCorrupted`: a registry entry could not be recovered as the type it was
 *   stored under. A library defect, thrown synchronously from `send`.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace brazier::core {

/**
 * @class MediatorError
 * @brief Base of recoverable failures produced by the mediator (not by handlers).
 */
class MediatorError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

/**
 * @class HandlerNotRegistered
 * @brief No handler is registered for the request type passed to `send`.
 */
class HandlerNotRegistered : public MediatorError {
  public:
    explicit HandlerNotRegistered(std::string request_type);

    /// @brief Readable name of the request type that had no handler.
    const std::string& request_type() const noexcept { return request_type_; }

  private:
    std::string request_type_;
};

/**
 * @class RegistryCorrupted
 * @brief Internal invariant violation: stored and requested handler types disagree.
 */
class RegistryCorrupted : public std::logic_error {
  public:
    RegistryCorrupted(const std::string& request_type, const std::string& stored_handler);
};

} // namespace brazier::core

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

#include "brazier/core/error.hpp"

#include <utility>

namespace brazier::core {

HandlerNotRegistered::HandlerNotRegistered(std::string request_type)
    : MediatorError("Handler not registered for request type '" + request_type + "'"),
      request_type_(std::move(request_type))
{
}

RegistryCorrupted::RegistryCorrupted(const std::string& request_type,
                                     const std::string& stored_handler)
    : std::logic_error("Registry corrupted: entry for '" + request_type + "' holds '" +
                       stored_handler + "'")
{
}

} // namespace brazier::core

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
 * @file registry_report.hpp
 * @brief JSON rendering of a mediator registry snapshot.
 *
 * @details
 * Used by host processes to answer "what is wired up?" without coupling the
 * mediator to a serialization library.
 */

#pragma once

#include "brazier/core/mediator.hpp"

#include <string>
#include <vector>

namespace brazier::diagnostics {

/**
 * @class RegistryReport
 * @brief Serializes `Mediator::snapshot()` output.
 */
class RegistryReport {
  public:
    /**
     * @brief Renders the entries as compact JSON.
     *
     * **Format:**
     * @code
     * {"handlers":[{"request":"Ping","response":"std::string","handler":"PingHandler"}],"count":1}
     * @endcode
     *
     * @throws std::runtime_error if the JSON document cannot be allocated.
     */
    static std::string to_json(const std::vector<core::HandlerInfo>& entries);

    /// @brief Convenience overload taking a live mediator.
    static std::string to_json(const core::Mediator& mediator);
};

} // namespace brazier::diagnostics

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
 * @file config.hpp
 * @brief Runtime settings for processes that host a mediator.
 *
 * @details
 * Settings start from compiled defaults and are overlaid by environment variables:
 * - `BRAZIER_WORKERS`   : scheduler worker count (positive integer).
 * - `BRAZIER_LOG_LEVEL` : `trace|debug|info|warn|error|fatal`.
 *
 * Command line arguments are applied on top by the host binary.
 */

#pragma once

#include "brazier/infra/logger.hpp"

#include <cstddef>
#include <string>

namespace brazier::infra {

struct Config {
    std::size_t worker_threads = 0; ///< 0 means "detect" (hardware concurrency).
    LogLevel log_level = LogLevel::INFO;

    /**
     * @brief Builds a configuration from defaults plus the process environment.
     *
     * @throws std::invalid_argument naming the offending variable when a value
     * cannot be parsed.
     */
    static Config from_env();

    /**
     * @brief Parses a worker count.
     *
     * @param source Name reported in the exception message (variable or flag).
     * @throws std::invalid_argument for non-numeric, zero or negative input.
     */
    static std::size_t parse_workers(const std::string& text, const std::string& source);

    /// @brief Pushes process-wide settings (log threshold) into the infrastructure.
    void apply() const;
};

} // namespace brazier::infra

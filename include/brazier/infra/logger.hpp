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
 * @file logger.hpp
 * @brief Thread-safe diagnostic logging facility for Brazier.
 *
 * @details
 * This header declares the `Logger` class, the single reporting channel used by
 * the mediator and its infrastructure. Output is serialized across threads so that
 * messages emitted from concurrent handler invocations never interleave.
 */

#pragma once

#include <atomic>
#include <mutex>
#include <optional>
#include <string>

namespace brazier::infra {

/**
 * @enum LogLevel
 * @brief Defines the severity hierarchy for diagnostic messages.
 */
enum class LogLevel {
    TRACE, ///< Granular execution flow details.
    DEBUG, ///< Registry mutations, dispatch misses.
    INFO,  ///< Nominal operational events (e.g., startup, shutdown).
    WARN,  ///< Non-blocking anomalies such as a replaced handler.
    ERROR, ///< Recoverable runtime errors.
    FATAL  ///< Invariant violations inside the library itself.
};

/**
 * @brief Parses a textual severity (`trace`, `debug`, `info`, `warn`, `error`, `fatal`).
 *
 * Matching is case-insensitive and ignores surrounding whitespace.
 *
 * @return The matching level, or `std::nullopt` for unknown input.
 */
std::optional<LogLevel> parse_level(const std::string& text);

/**
 * @class Logger
 * @brief A static utility class providing system-wide logging capabilities.
 *
 * @details
 * The Logger writes through an internal mutex so that entries from multiple
 * worker threads remain distinct. Messages below the configured threshold are
 * discarded before the lock is taken.
 */
class Logger {
  public:
    /**
     * @brief Writes a formatted diagnostic message to the console.
     *
     * The output includes a timestamp, the severity tag, and the payload.
     *
     * **Stream Routing Logic:**
     * - `TRACE`, `DEBUG`, `INFO`: Routed to `std::cout`.
     * - `WARN`, `ERROR`, `FATAL`: Routed to `std::cerr`.
     *
     * @param level The severity classification of the message.
     * @param message The content payload to be logged.
     *
     * @code
     * brazier::infra::Logger::log(LogLevel::INFO, "Mediator ready.");
     * @endcode
     */
    static void log(LogLevel level, const std::string& message);

    /// @brief Sets the minimum severity that reaches the console.
    static void set_level(LogLevel level);

    /// @brief Returns the current minimum severity.
    static LogLevel level();

  private:
    /// @brief Guards `std::cout` and `std::cerr` against interleaved writes.
    static std::mutex mutex_;

    /// @brief Severity threshold. Defaults to `INFO`.
    static std::atomic<LogLevel> threshold_;
};

} // namespace brazier::infra

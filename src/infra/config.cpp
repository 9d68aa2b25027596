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
 * @file config.cpp
 * @brief Environment parsing for `Config`.
 */

#include "brazier/infra/config.hpp"

#include "brazier/infra/string.hpp"

#include <cctype>
#include <cstdlib>
#include <stdexcept>

namespace brazier::infra {

std::size_t Config::parse_workers(const std::string& text, const std::string& source)
{
    const std::string value = String::trim(text);

    if (value.empty()) {
        throw std::invalid_argument(source + ": worker count is empty");
    }
    for (char c : value) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            throw std::invalid_argument(source + ": worker count '" + value +
                                        "' is not a positive integer");
        }
    }

    unsigned long parsed = 0;
    try {
        parsed = std::stoul(value);
    } catch (const std::out_of_range&) {
        throw std::invalid_argument(source + ": worker count '" + value + "' is out of range");
    }

    if (parsed == 0) {
        throw std::invalid_argument(source + ": worker count must be at least 1");
    }
    return static_cast<std::size_t>(parsed);
}

Config Config::from_env()
{
    Config config;

    if (const char* workers = std::getenv("BRAZIER_WORKERS")) {
        config.worker_threads = parse_workers(workers, "BRAZIER_WORKERS");
    }

    if (const char* level = std::getenv("BRAZIER_LOG_LEVEL")) {
        auto parsed = parse_level(level);
        if (!parsed) {
            throw std::invalid_argument("BRAZIER_LOG_LEVEL: unknown level '" +
                                        std::string(level) + "'");
        }
        config.log_level = *parsed;
    }

    return config;
}

void Config::apply() const
{
    Logger::set_level(log_level);
}

} // namespace brazier::infra

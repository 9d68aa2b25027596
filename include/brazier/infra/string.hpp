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
 * @file string.hpp
 * @brief Text normalization helpers used when reading configuration values.
 */

#pragma once

#include <string>

namespace brazier::infra {

/**
 * @class String
 * @brief Static helpers for sanitizing user-supplied text.
 */
class String {
  public:
    /**
     * @brief Trims leading and trailing whitespace from a string.
     *
     * @param s The source string to process.
     * @return A new string without surrounding whitespace. Empty if the input
     * consists solely of whitespace.
     *
     * @code
     * std::string clean = brazier::infra::String::trim("  debug \n"); // "debug"
     * @endcode
     */
    static std::string trim(const std::string& s);

    /// @brief ASCII lower-casing.
    static std::string to_lower(std::string s);
};

} // namespace brazier::infra

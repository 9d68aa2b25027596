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
 * @file type_name.hpp
 * @brief Readable C++ type names for log lines and error messages.
 */

#pragma once

#include <string>
#include <typeinfo>

namespace brazier::infra {

/**
 * @class TypeName
 * @brief Demangles RTTI names (`7app::Ping` -> `app::Ping`).
 */
class TypeName {
  public:
    /**
     * @brief Returns the demangled name of `info`.
     *
     * Falls back to the raw `info.name()` when the ABI demangler rejects it.
     */
    static std::string demangle(const std::type_info& info);

    template <typename T> static std::string of() { return demangle(typeid(T)); }
};

} // namespace brazier::infra

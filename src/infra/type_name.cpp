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
 * @file type_name.cpp
 * @brief Itanium ABI demangling for diagnostic type names.
 */

#include "brazier/infra/type_name.hpp"

#include <cstdlib>
#include <cxxabi.h>
#include <memory>

namespace brazier::infra {

std::string TypeName::demangle(const std::type_info& info)
{
    int status = 0;

    // __cxa_demangle allocates with malloc; ownership moves to the unique_ptr.
    std::unique_ptr<char, void (*)(void*)> readable(
        abi::__cxa_demangle(info.name(), nullptr, nullptr, &status), std::free);

    if (status != 0 || !readable) {
        return info.name();
    }
    return std::string(readable.get());
}

} // namespace brazier::infra

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
 * @file registry_report.cpp
 * @brief cJSON-backed implementation of `RegistryReport`.
 */

#include "brazier/diagnostics/registry_report.hpp"

#include <cJSON.h>
#include <cstdlib>
#include <stdexcept>

namespace brazier::diagnostics {

std::string RegistryReport::to_json(const std::vector<core::HandlerInfo>& entries)
{
    cJSON* root = cJSON_CreateObject();
    if (!root) {
        throw std::runtime_error("RegistryReport: out of memory");
    }

    // 'handlers' becomes a child of 'root'; deleting root releases both.
    cJSON* handlers = cJSON_AddArrayToObject(root, "handlers");
    if (!handlers) {
        cJSON_Delete(root);
        throw std::runtime_error("RegistryReport: out of memory");
    }

    for (const auto& entry : entries) {
        cJSON* item = cJSON_CreateObject();
        if (!item) {
            cJSON_Delete(root);
            throw std::runtime_error("RegistryReport: out of memory");
        }
        cJSON_AddStringToObject(item, "request", entry.request_type.c_str());
        cJSON_AddStringToObject(item, "response", entry.response_type.c_str());
        cJSON_AddStringToObject(item, "handler", entry.handler_type.c_str());
        cJSON_AddItemToArray(handlers, item);
    }
    cJSON_AddNumberToObject(root, "count", static_cast<double>(entries.size()));

    char* raw_output = cJSON_PrintUnformatted(root);
    cJSON_Delete(root);
    if (!raw_output) {
        throw std::runtime_error("RegistryReport: serialization failed");
    }

    std::string report(raw_output);
    free(raw_output);
    return report;
}

std::string RegistryReport::to_json(const core::Mediator& mediator)
{
    return to_json(mediator.snapshot());
}

} // namespace brazier::diagnostics

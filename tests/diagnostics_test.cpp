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
 * @file diagnostics_test.cpp
 * @brief JSON registry report produced from a live mediator.
 */

#include "brazier/core/mediator.hpp"
#include "brazier/diagnostics/registry_report.hpp"
#include "brazier/infra/scheduler.hpp"
#include "framework.hpp"

#include <cJSON.h>
#include <cstddef>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <vector>

namespace diagnostics_fixtures {

struct Status : brazier::core::Request<std::string> {};
struct Add : brazier::core::Request<int> {
    int lhs = 0;
    int rhs = 0;
};

class StatusHandler : public brazier::core::RequestHandler<Status> {
  public:
    std::string handle(Status) override { return "green"; }
};

class AddHandler : public brazier::core::RequestHandler<Add> {
  public:
    int handle(Add request) override { return request.lhs + request.rhs; }
};

/// Allocations cJSON may still make before its allocator starts returning null.
std::size_t allocation_budget = 0;

void* rationed_malloc(std::size_t size)
{
    if (allocation_budget == 0) {
        return nullptr;
    }
    --allocation_budget;
    return std::malloc(size);
}

void release(void* block)
{
    std::free(block);
}

/// Routes cJSON through `rationed_malloc` for the lifetime of the guard.
class RationedAllocator {
  public:
    explicit RationedAllocator(std::size_t budget)
    {
        allocation_budget = budget;
        cJSON_Hooks hooks{rationed_malloc, release};
        cJSON_InitHooks(&hooks);
    }

    ~RationedAllocator() { cJSON_InitHooks(nullptr); }

    RationedAllocator(const RationedAllocator&) = delete;
    RationedAllocator& operator=(const RationedAllocator&) = delete;
};

} // namespace diagnostics_fixtures

using namespace diagnostics_fixtures;

void test_report_lists_handlers()
{
    brazier::infra::Scheduler scheduler(1);
    brazier::core::Mediator mediator(scheduler);
    mediator.register_handler(StatusHandler{}).register_handler(AddHandler{});

    std::string report = brazier::diagnostics::RegistryReport::to_json(mediator);

    cJSON* root = cJSON_Parse(report.c_str());
    ASSERT_NE(root, (cJSON*)nullptr);

    cJSON* count = cJSON_GetObjectItem(root, "count");
    cJSON* handlers = cJSON_GetObjectItem(root, "handlers");
    bool shape_ok = count && handlers && cJSON_IsArray(handlers) && count->valueint == 2 &&
                    cJSON_GetArraySize(handlers) == 2;

    std::string first_request;
    std::string first_response;
    std::string first_handler;
    if (shape_ok) {
        cJSON* first = cJSON_GetArrayItem(handlers, 0);
        cJSON* req = cJSON_GetObjectItem(first, "request");
        cJSON* resp = cJSON_GetObjectItem(first, "response");
        cJSON* handler = cJSON_GetObjectItem(first, "handler");
        first_request = (req && req->valuestring) ? req->valuestring : "";
        first_response = (resp && resp->valuestring) ? resp->valuestring : "";
        first_handler = (handler && handler->valuestring) ? handler->valuestring : "";
    }
    cJSON_Delete(root);

    ASSERT_TRUE(shape_ok);
    // Sorted by request type name: Add before Status.
    ASSERT_EQ(first_request, std::string("diagnostics_fixtures::Add"));
    ASSERT_EQ(first_response, std::string("int"));
    ASSERT_EQ(first_handler, std::string("diagnostics_fixtures::AddHandler"));
}

void test_report_for_empty_registry()
{
    std::string report = brazier::diagnostics::RegistryReport::to_json(
        std::vector<brazier::core::HandlerInfo>{});
    ASSERT_EQ(report, std::string("{\"handlers\":[],\"count\":0}"));
}

/**
 * @brief Allocation failures past the root object surface as exceptions, not crashes.
 */
void test_report_out_of_memory_throws()
{
    std::vector<brazier::core::HandlerInfo> entries{
        {"diagnostics_fixtures::Status", "std::string", "diagnostics_fixtures::StatusHandler"}};

    {
        // Root object only: the "handlers" array cannot be created.
        RationedAllocator allocator(1);
        ASSERT_THROWS(brazier::diagnostics::RegistryReport::to_json(entries), std::runtime_error);
    }
    {
        // Root, array and its key: the first entry object cannot be created.
        RationedAllocator allocator(3);
        ASSERT_THROWS(brazier::diagnostics::RegistryReport::to_json(entries), std::runtime_error);
    }

    // Default allocator restored.
    ASSERT_FALSE(brazier::diagnostics::RegistryReport::to_json(entries).empty());
}

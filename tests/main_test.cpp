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
 * @file main_test.cpp
 * @brief Central orchestrator for the Brazier test suite.
 */

#include "brazier/infra/logger.hpp"
#include "framework.hpp"

#include <iostream>

// ============================================================================
// Forward Declarations
// ============================================================================

// Infrastructure (infra_test.cpp)
void test_string_trim();
void test_string_trim_empty();
void test_string_to_lower();
void test_parse_level();
void test_logger_threshold();
void test_config_parse_workers();
void test_config_from_env();
void test_scheduler_zero_threads_fallback();
void test_scheduler_drains_on_shutdown();
void test_scheduler_rejects_enqueue_during_shutdown();
void test_scheduler_is_worker();
void test_type_name_demangles();

// Mediator (mediator_test.cpp)
void test_send_ping_returns_pong();
void test_send_without_handler_reports_request_type();
void test_not_registered_is_a_mediator_error();
void test_second_registration_replaces_first();
void test_registration_order_is_irrelevant();
void test_handler_failure_passes_through_unchanged();
void test_void_response();
void test_move_only_request();
void test_shared_handler_registration();
void test_null_handler_is_rejected();
void test_stateful_handler_keeps_state();
void test_registry_queries();
void test_handler_runs_off_caller_thread();
void test_blocked_handler_does_not_block_callers();
void test_concurrent_sends();
void test_registration_during_dispatch();
void test_nested_send_from_handler();
void test_send_during_scheduler_shutdown();

// Diagnostics (diagnostics_test.cpp)
void test_report_lists_handlers();
void test_report_for_empty_registry();
void test_report_out_of_memory_throws();

/**
 * @return 0 when every test passed, 1 otherwise.
 */
int main()
{
    std::cout << "\033[36mInitiating Brazier Test Suite...\033[0m" << std::endl;

    // Replacement warnings are expected in bulk; keep the report readable.
    brazier::infra::Logger::set_level(brazier::infra::LogLevel::ERROR);

    // --- 1. Infrastructure ---
    RUN_TEST(test_string_trim);
    RUN_TEST(test_string_trim_empty);
    RUN_TEST(test_string_to_lower);
    RUN_TEST(test_parse_level);
    RUN_TEST(test_logger_threshold);
    RUN_TEST(test_config_parse_workers);
    RUN_TEST(test_config_from_env);
    RUN_TEST(test_scheduler_zero_threads_fallback);
    RUN_TEST(test_scheduler_drains_on_shutdown);
    RUN_TEST(test_scheduler_rejects_enqueue_during_shutdown);
    RUN_TEST(test_scheduler_is_worker);
    RUN_TEST(test_type_name_demangles);

    // --- 2. Mediator: registry and dispatch ---
    RUN_TEST(test_send_ping_returns_pong);
    RUN_TEST(test_send_without_handler_reports_request_type);
    RUN_TEST(test_not_registered_is_a_mediator_error);
    RUN_TEST(test_second_registration_replaces_first);
    RUN_TEST(test_registration_order_is_irrelevant);
    RUN_TEST(test_handler_failure_passes_through_unchanged);
    RUN_TEST(test_void_response);
    RUN_TEST(test_move_only_request);
    RUN_TEST(test_shared_handler_registration);
    RUN_TEST(test_null_handler_is_rejected);
    RUN_TEST(test_stateful_handler_keeps_state);
    RUN_TEST(test_registry_queries);

    // --- 3. Mediator: asynchrony and concurrency ---
    RUN_TEST(test_handler_runs_off_caller_thread);
    RUN_TEST(test_blocked_handler_does_not_block_callers);
    RUN_TEST(test_concurrent_sends);
    RUN_TEST(test_registration_during_dispatch);
    RUN_TEST(test_nested_send_from_handler);
    RUN_TEST(test_send_during_scheduler_shutdown);

    // --- 4. Diagnostics ---
    RUN_TEST(test_report_lists_handlers);
    RUN_TEST(test_report_for_empty_registry);
    RUN_TEST(test_report_out_of_memory_throws);

    brazier::test::print_summary();

    return (brazier::test::failed_count == 0) ? 0 : 1;
}

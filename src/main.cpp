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
 * @file main.cpp
 * @brief `brazier-ping`: minimal host wiring a mediator end to end.
 *
 * @details
 * Startup sequence:
 * 1. Configuration (environment, then command line).
 * 2. Scheduler and mediator construction.
 * 3. Handler registration.
 * 4. A successful `Ping` round trip and an unregistered `Echo` request.
 */

#include "brazier/core/mediator.hpp"
#include "brazier/diagnostics/registry_report.hpp"
#include "brazier/infra/config.hpp"
#include "brazier/infra/logger.hpp"
#include "brazier/infra/scheduler.hpp"

#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>

namespace {

struct Ping : brazier::core::Request<std::string> {};

struct Echo : brazier::core::Request<std::string> {
    std::string text;
};

class PingHandler : public brazier::core::RequestHandler<Ping> {
  public:
    std::string handle(Ping) override { return "pong!"; }
};

void print_help(const char* binary_name)
{
    std::cout << "Usage: " << binary_name << " [WORKERS] [--describe]\n"
              << "Options:\n"
              << "  WORKERS     Scheduler worker threads (Default: $BRAZIER_WORKERS or core count)\n"
              << "  --describe  Print the handler registry as JSON\n"
              << "  --help      Show this help message\n"
              << "Environment:\n"
              << "  BRAZIER_WORKERS    Scheduler worker threads\n"
              << "  BRAZIER_LOG_LEVEL  trace|debug|info|warn|error|fatal (Default: info)\n";
}

} // namespace

int main(int argc, char* argv[])
{
    using brazier::infra::Logger;
    using brazier::infra::LogLevel;

    bool describe = false;

    try {
        brazier::infra::Config config = brazier::infra::Config::from_env();

        for (int i = 1; i < argc; ++i) {
            const std::string arg = argv[i];
            if (arg == "--help") {
                print_help(argv[0]);
                return 0;
            }
            if (arg == "--describe") {
                describe = true;
            } else {
                config.worker_threads = brazier::infra::Config::parse_workers(arg, "WORKERS");
            }
        }

        config.apply();

        brazier::infra::Scheduler scheduler(config.worker_threads != 0
                                                ? config.worker_threads
                                                : std::thread::hardware_concurrency());
        Logger::log(LogLevel::INFO,
                    "System: Scheduler running " + std::to_string(scheduler.size()) + " worker(s)");

        brazier::core::Mediator mediator(scheduler);
        mediator.register_handler(PingHandler{});

        if (describe) {
            std::cout << brazier::diagnostics::RegistryReport::to_json(mediator) << std::endl;
        }

        std::cout << mediator.send(Ping{}).get() << std::endl;

        Echo echo;
        echo.text = "hi";
        try {
            std::cout << mediator.send(std::move(echo)).get() << std::endl;
        } catch (const brazier::core::HandlerNotRegistered& e) {
            Logger::log(LogLevel::WARN, std::string("Echo: ") + e.what());
        }

    } catch (const std::exception& e) {
        Logger::log(LogLevel::FATAL, "System: Critical Failure: " + std::string(e.what()));
        return 1;
    }

    return 0;
}

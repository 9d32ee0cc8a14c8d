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
 * @brief Demo executable for the SLogger library.
 *
 * @details
 * Startup sequence:
 * 1. Argument parsing.
 * 2. Registry configuration (JSON file or built-in default).
 * 3. Error bridge installation on the `default` logger.
 * 4. One message per severity, payload examples and a logged exception.
 * 5. Flush and orderly shutdown.
 */

#include "slogger/bridge/error_bridge.hpp"
#include "slogger/core/error.hpp"
#include "slogger/core/registry.hpp"
#include "slogger/infra/diagnostics.hpp"

#include <cJSON.h>
#include <iostream>
#include <stdexcept>
#include <string>

using slogger::core::Data;
using slogger::infra::DiagLevel;
using slogger::infra::Diagnostics;

/**
 * @brief Prints usage instructions to stdout.
 */
void print_help(const char* binary_name)
{
    std::cout << "Usage: " << binary_name << " [CONFIG_JSON]\n"
              << "Options:\n"
              << "  CONFIG_JSON   Logger configuration file (Default: one 'default' logger in ./log)\n"
              << "  --help        Show this help message\n"
              << "\nConfiguration example:\n"
              << "  { \"default\": [\"./log\"],\n"
              << "    \"paypal\":  [\"./log/paypal\", {\"severityThreshold\": \"error\",\n"
              << "                                   \"smartSeverityThreshold\": \"critical\"}] }\n";
}

void charge_card(int cents)
{
    try {
        throw std::runtime_error("card declined");
    } catch (...) {
        std::throw_with_nested(std::invalid_argument("charge of " + std::to_string(cents) +
                                                     " cents failed"));
    }
}

int main(int argc, char* argv[])
{
    if (argc > 1 && std::string(argv[1]) == "--help") {
        print_help(argv[0]);
        return 0;
    }

    slogger::core::Registry registry;

    try {
        if (argc > 1) {
            Diagnostics::log(DiagLevel::INFO, std::string("Config: loading ") + argv[1]);
            registry.configure_file(argv[1]);
        } else {
            registry.configure({{"default", {"./log", {}}}});
        }

        slogger::core::Logger* log = registry.get();
        if (!log) {
            Diagnostics::log(DiagLevel::FATAL, "Config: no 'default' logger configured");
            return 1;
        }
        Diagnostics::log(DiagLevel::INFO, "Logging to " + log->active_file());

        auto bridge = slogger::bridge::ErrorBridge::install(registry, "default");

        // Severities adopted from RFC 5424.
        log->emergency("System wide failures. Wake everyone!", Data::none(), SLOGGER_HERE);
        log->alert("Primary system failure. Wake the admin!", Data::none(), SLOGGER_HERE);
        log->critical("Secondary system failure. Wake the admin!", Data::none(), SLOGGER_HERE);
        log->error("Non-urgent failure. Wake a developer!", Data::none(), SLOGGER_HERE);
        log->warning("Failure forthcoming unless action taken.", Data::none(), SLOGGER_HERE);
        log->notice("Unusual event. Admins take note.", Data::none(), SLOGGER_HERE);
        log->info("Normal operating event.", Data::none(), SLOGGER_HERE);
        log->debug("Detailed messages for developers.", Data::none(), SLOGGER_HERE);

        cJSON* account = cJSON_CreateObject();
        cJSON_AddNumberToObject(account, "balance", 200);
        log->debug("Logging an object", Data(account), SLOGGER_HERE);
        cJSON_Delete(account);

        log->debug("Logging null", Data::null(), SLOGGER_HERE);

        SLOGGER_REPORT(*bridge, slogger::bridge::error_kind::DEPRECATED,
                       "Positional config arrays are deprecated");

        try {
            charge_card(1999);
        } catch (const std::exception& e) {
            log->critical(e, Data::none(), SLOGGER_HERE);
        }

        registry.flush_all();
        Diagnostics::log(DiagLevel::INFO, "Done. Check log_*.csv in " + log->directory());

    } catch (const slogger::core::Error& e) {
        Diagnostics::log(DiagLevel::FATAL, std::string("Logger setup failed: ") + e.what());
        return 1;
    }

    return 0;
}

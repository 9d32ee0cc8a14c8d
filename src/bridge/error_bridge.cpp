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
 * @file error_bridge.cpp
 * @brief Terminate/exit hooks and the error-kind mapping table.
 */

#include "slogger/bridge/error_bridge.hpp"

#include "slogger/core/error.hpp"
#include "slogger/infra/diagnostics.hpp"

#include <cstdlib>
#include <iostream>

namespace slogger::bridge {

using core::Severity;
using infra::DiagLevel;
using infra::Diagnostics;

std::atomic<ErrorBridge*> ErrorBridge::active_{nullptr};
std::atomic<bool> ErrorBridge::exit_hook_registered_{false};

ErrorBridge::ErrorBridge(Passkey, core::Registry& registry, std::string logger, int filter,
                         bool display)
    : registry_(registry), logger_(std::move(logger)), filter_(filter), display_(display)
{
}

std::unique_ptr<ErrorBridge> ErrorBridge::install(core::Registry& registry, std::string logger,
                                                  int filter, bool display)
{
    auto bridge =
        std::make_unique<ErrorBridge>(Passkey{}, registry, std::move(logger), filter, display);

    ErrorBridge* expected = nullptr;
    if (!active_.compare_exchange_strong(expected, bridge.get())) {
        throw core::ConfigError("An error bridge is already installed");
    }

    bridge->previous_ = std::set_terminate(&ErrorBridge::terminate_handler);

    // atexit registrations cannot be undone, so the hook is registered once per
    // process and consults active_ when it runs.
    if (!exit_hook_registered_.exchange(true)) {
        if (std::atexit(&ErrorBridge::exit_handler) != 0) {
            Diagnostics::log(DiagLevel::WARN, "ErrorBridge: could not register the exit hook");
        }
    }

    Diagnostics::log(DiagLevel::DEBUG, "ErrorBridge: forwarding to logger '" +
                                           bridge->logger_ + "'");
    return bridge;
}

ErrorBridge::~ErrorBridge()
{
    ErrorBridge* expected = this;
    if (active_.compare_exchange_strong(expected, nullptr)) {
        std::set_terminate(previous_);
    }
}

ErrorBridge* ErrorBridge::active()
{
    return active_.load();
}

bool ErrorBridge::is_known(int kind)
{
    switch (kind) {
    case error_kind::FATAL:
    case error_kind::CORE_ERROR:
    case error_kind::ERROR:
    case error_kind::USER_ERROR:
    case error_kind::RECOVERABLE_ERROR:
    case error_kind::WARNING:
    case error_kind::USER_WARNING:
    case error_kind::DEPRECATED:
    case error_kind::NOTICE:
    case error_kind::USER_NOTICE:
        return true;
    default:
        return false;
    }
}

Severity ErrorBridge::severity_for(int kind)
{
    switch (kind) {
    case error_kind::FATAL:
    case error_kind::CORE_ERROR:
        return Severity::EMERGENCY;
    case error_kind::ERROR:
    case error_kind::USER_ERROR:
    case error_kind::RECOVERABLE_ERROR:
        return Severity::ALERT;
    case error_kind::NOTICE:
    case error_kind::USER_NOTICE:
        return Severity::NOTICE;
    case error_kind::WARNING:
    case error_kind::USER_WARNING:
    case error_kind::DEPRECATED:
    default:
        return Severity::WARNING;
    }
}

core::Logger* ErrorBridge::target_logger() const
{
    core::Logger* logger = registry_.get(logger_);
    if (!logger) {
        Diagnostics::log(DiagLevel::ERROR,
                         "ErrorBridge: target logger '" + logger_ + "' is not registered");
    }
    return logger;
}

void ErrorBridge::report(int kind, const std::string& message, const std::string& file, long line)
{
    if ((kind & filter_) == 0) {
        return;
    }

    if (display_) {
        std::cerr << "Error (" << kind << "): " << message << " in " << file << ":" << line
                  << std::endl;
    }

    core::Logger* logger = target_logger();
    if (!logger) {
        return;
    }

    if (!is_known(kind)) {
        logger->warning("Unknown error type (" + std::to_string(kind) + ")", core::Data::none(),
                        SLOGGER_HERE);
        return;
    }

    core::Overrides site;
    site.file = file;
    site.line = line;
    logger->log(message, severity_for(kind), core::Data::none(), site);
}

void ErrorBridge::log_exception(std::exception_ptr error)
{
    core::Logger* logger = target_logger();

    try {
        if (!error) {
            if (logger) {
                logger->alert("std::terminate called without an active exception");
            }
        } else {
            try {
                std::rethrow_exception(error);
            } catch (const std::exception& e) {
                if (display_) {
                    std::cerr << "Unhandled exception: " << e.what() << std::endl;
                }
                if (logger) {
                    logger->alert(e);
                }
            } catch (...) {
                if (display_) {
                    std::cerr << "Unhandled non-standard exception" << std::endl;
                }
                if (logger) {
                    logger->alert("Unhandled non-standard exception");
                }
            }
        }
    } catch (const std::exception& e) {
        Diagnostics::log(DiagLevel::FATAL,
                         std::string("ErrorBridge: could not log unhandled exception: ") +
                             e.what());
    }

    registry_.flush_all();
}

void ErrorBridge::on_exit()
{
    registry_.flush_all();
}

void ErrorBridge::terminate_handler()
{
    ErrorBridge* bridge = active_.load();
    std::terminate_handler next = nullptr;
    if (bridge) {
        next = bridge->previous_;
        bridge->log_exception(std::current_exception());
    }
    if (next) {
        next();
    }
    std::abort();
}

void ErrorBridge::exit_handler()
{
    if (ErrorBridge* bridge = active_.load()) {
        bridge->on_exit();
    }
}

} // namespace slogger::bridge

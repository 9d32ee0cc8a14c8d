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
 * @file error_bridge.hpp
 * @brief Forwards process-wide error notifications into a registered logger.
 *
 * @details
 * The logging core knows nothing about process-wide handlers. `ErrorBridge` is
 * the adapter that subscribes to them and turns each notification into an
 * ordinary `Logger::log` call on a target logger looked up by name:
 *
 * | Notification         | Source                          | Logged as                      |
 * |----------------------|---------------------------------|--------------------------------|
 * | Runtime error        | `report()` / `SLOGGER_REPORT`   | severity from the kind table   |
 * | Unhandled exception  | `std::set_terminate` hook       | alert, then every logger flushed |
 * | Process exit         | `std::atexit` hook              | every logger flushed           |
 *
 * At most one bridge is installed at a time. It is an RAII object: destroying it
 * restores the previous terminate handler and disarms the exit hook, so it must
 * not outlive the `Registry` it was installed on.
 */

#pragma once

#include "slogger/core/registry.hpp"
#include "slogger/core/severity.hpp"

#include <atomic>
#include <exception>
#include <memory>
#include <string>

namespace slogger::bridge {

/**
 * @brief Error classes understood by the bridge. Values are bit flags so a
 * filter can combine them.
 */
namespace error_kind {
inline constexpr int FATAL = 1 << 0;
inline constexpr int CORE_ERROR = 1 << 1;
inline constexpr int ERROR = 1 << 2;
inline constexpr int USER_ERROR = 1 << 3;
inline constexpr int RECOVERABLE_ERROR = 1 << 4;
inline constexpr int WARNING = 1 << 5;
inline constexpr int USER_WARNING = 1 << 6;
inline constexpr int DEPRECATED = 1 << 7;
inline constexpr int NOTICE = 1 << 8;
inline constexpr int USER_NOTICE = 1 << 9;

/// @brief Filter accepting every kind, including unrecognized ones.
inline constexpr int ALL = -1;
} // namespace error_kind

class ErrorBridge {
  public:
    /**
     * @brief Installs the bridge.
     *
     * @param registry Where the target logger is looked up on every event.
     * @param logger Target logger name.
     * @param filter Bitmask of `error_kind` values to capture.
     * @param display Also echo captured errors to `stderr`.
     *
     * @throws ConfigError if another bridge is already installed.
     */
    static std::unique_ptr<ErrorBridge> install(core::Registry& registry,
                                                std::string logger = "default",
                                                int filter = error_kind::ALL,
                                                bool display = false);

    /// @brief Uninstalls: restores the previous terminate handler.
    ~ErrorBridge();

    ErrorBridge(const ErrorBridge&) = delete;
    ErrorBridge& operator=(const ErrorBridge&) = delete;

    /**
     * @brief Runtime-error notification.
     *
     * Ignored when @p kind is not in the filter. File and line come from the
     * caller, not from stack inspection. An unrecognized kind is logged as a
     * warning `"Unknown error type (<kind>)"` located in this adapter.
     */
    void report(int kind, const std::string& message, const std::string& file, long line);

    /**
     * @brief Unhandled-exception notification.
     *
     * Logs @p error at alert on the target, then flushes every logger in the
     * registry. Failures while logging are written to the diagnostics channel.
     */
    void log_exception(std::exception_ptr error);

    /// @brief Process-exit notification: flushes every logger in the registry.
    void on_exit();

    /// @brief The mapping table. Unrecognized kinds map to warning.
    static core::Severity severity_for(int kind);

    /// @brief True if @p kind is exactly one of the `error_kind` flags.
    static bool is_known(int kind);

    /// @brief The installed bridge, or `nullptr`.
    static ErrorBridge* active();

    const std::string& target() const { return logger_; }
    int filter() const { return filter_; }
    bool display() const { return display_; }

  private:
    /// @brief Restricts construction to `install()`.
    struct Passkey {
        explicit Passkey() = default;
    };

  public:
    ErrorBridge(Passkey, core::Registry& registry, std::string logger, int filter, bool display);

  private:

    /// @brief Looks the target up; reports a missing target through diagnostics.
    core::Logger* target_logger() const;

    static void terminate_handler();
    static void exit_handler();

    core::Registry& registry_;
    std::string logger_;
    int filter_;
    bool display_;
    std::terminate_handler previous_ = nullptr;

    static std::atomic<ErrorBridge*> active_;
    static std::atomic<bool> exit_hook_registered_;
};

} // namespace slogger::bridge

/// @brief Reports a runtime error from the current source line.
#define SLOGGER_REPORT(bridge, kind, message) (bridge).report((kind), (message), __FILE__, __LINE__)

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
 * @file diagnostics.hpp
 * @brief Console channel for the library's own status and warning messages.
 *
 * @details
 * SLogger writes application records to CSV files, but it also needs a place to
 * report problems it cannot raise as exceptions (lock misuse, failures during
 * teardown, a missing error-bridge target). Those go through `Diagnostics`,
 * which serializes output to `stdout`/`stderr` across threads.
 */

#pragma once

#include <mutex>
#include <string>

namespace slogger::infra {

/**
 * @enum DiagLevel
 * @brief Severity hierarchy for diagnostic console messages.
 */
enum class DiagLevel {
    TRACE, ///< Granular execution flow details.
    DEBUG, ///< Development-time state dumps.
    INFO,  ///< Nominal lifecycle events (logger opened, registry configured).
    WARN,  ///< Caller misuse or recoverable anomalies.
    ERROR, ///< Failures that were reported instead of thrown.
    FATAL  ///< Failures observed while the process is going down.
};

/**
 * @class Diagnostics
 * @brief A static, thread-safe console writer.
 *
 * @details
 * Messages below the configured minimum level are discarded. The default
 * minimum is `INFO`; the test runner raises it to keep output readable.
 */
class Diagnostics {
  public:
    /**
     * @brief Writes a timestamped, tagged message to the console.
     *
     * **Stream Routing Logic:**
     * - `TRACE`, `DEBUG`, `INFO`: Routed to `std::cout`.
     * - `WARN`, `ERROR`, `FATAL`: Routed to `std::cerr`.
     *
     * @param level The severity classification of the message.
     * @param message The content payload.
     *
     * @code
     * slogger::infra::Diagnostics::log(DiagLevel::WARN, "FileMutex: release without lock");
     * @endcode
     */
    static void log(DiagLevel level, const std::string& message);

    /**
     * @brief Sets the minimum level that reaches the console.
     */
    static void set_level(DiagLevel level);

    /// @brief Returns the current minimum level.
    static DiagLevel level();

  private:
    /// @brief Guards the console streams and the level setting.
    static std::mutex mutex_;

    static DiagLevel min_level_;
};

} // namespace slogger::infra

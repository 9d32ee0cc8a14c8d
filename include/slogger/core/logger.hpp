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
 * @file logger.hpp
 * @brief A named, buffering, "smart" CSV logger bound to one directory.
 *
 * @details
 * A `Logger` buffers every record in memory, one FIFO queue per severity rank.
 * Nothing touches the disk until `flush()` (or teardown), which decides what to
 * write:
 *
 * - **Normal window:** only queues at or above `severity_threshold`.
 * - **Escalated window:** if any record in the window was at or above
 *   `smart_severity_threshold`, every queue, debug breadcrumbs included.
 *
 * Either way the selected records are written in enqueue order, and all queues
 * are emptied afterwards. Writes, rotation and retention are serialized across
 * processes by a `FileMutex` on the directory.
 */

#pragma once

#include "slogger/core/config.hpp"
#include "slogger/core/data.hpp"
#include "slogger/core/record.hpp"
#include "slogger/core/severity.hpp"
#include "slogger/io/file_mutex.hpp"
#include "slogger/io/log_files.hpp"

#include <array>
#include <cstdint>
#include <exception>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace slogger::core {

class Logger {
  public:
    /**
     * @brief Opens a logger on @p directory.
     *
     * Unless the threshold is OFF, this creates the directory, takes the
     * directory lock, resolves and opens the active file (rotating by size),
     * sweeps expired files and releases the lock. With OFF nothing on disk is
     * created or touched.
     *
     * @throws ConstructionError (or its subclass `PermissionError`) on any failure;
     * the lock is always released first.
     */
    Logger(std::string directory, Config config = {});

    /**
     * @brief Flushes pending records and closes the file.
     *
     * A failing final flush is reported through diagnostics; destructors do not throw.
     */
    virtual ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    // ========================================================================
    //  ENQUEUE
    // ========================================================================

    /**
     * @brief Queues a message. Never touches the file system.
     *
     * @param message Message text.
     * @param severity Rank to file the record under.
     * @param data Payload; `Data::none()` leaves the data column empty.
     * @param overrides Call site and/or replacement payload. Defaults to the
     * caller's file and line.
     *
     * @throws UnknownSeverity if @p severity is OFF or out of range. The logger
     * state is unchanged in that case.
     */
    void log(const std::string& message, Severity severity, const Data& data = Data::none(),
             const Overrides& overrides = Overrides::caller());

    /// @brief As above, resolving @p severity by name prefix (`"err"`, `"info"`).
    void log(const std::string& message, std::string_view severity,
             const Data& data = Data::none(), const Overrides& overrides = Overrides::caller());

    /**
     * @brief Queues an exception.
     *
     * The message column becomes `"<type>: <what()>"` and the trace column gets
     * the current call stack followed by any nested causes.
     */
    void log(const std::exception& error, Severity severity, const Data& data = Data::none(),
             const Overrides& overrides = Overrides::caller());

    void emergency(const std::string& message, const Data& data = Data::none(),
                   const Overrides& overrides = Overrides::caller());
    void alert(const std::string& message, const Data& data = Data::none(),
               const Overrides& overrides = Overrides::caller());
    void critical(const std::string& message, const Data& data = Data::none(),
                  const Overrides& overrides = Overrides::caller());
    void error(const std::string& message, const Data& data = Data::none(),
               const Overrides& overrides = Overrides::caller());
    void warning(const std::string& message, const Data& data = Data::none(),
                 const Overrides& overrides = Overrides::caller());
    void notice(const std::string& message, const Data& data = Data::none(),
                const Overrides& overrides = Overrides::caller());
    void info(const std::string& message, const Data& data = Data::none(),
              const Overrides& overrides = Overrides::caller());
    void debug(const std::string& message, const Data& data = Data::none(),
               const Overrides& overrides = Overrides::caller());

    void emergency(const std::exception& e, const Data& data = Data::none(),
                   const Overrides& overrides = Overrides::caller());
    void alert(const std::exception& e, const Data& data = Data::none(),
               const Overrides& overrides = Overrides::caller());
    void critical(const std::exception& e, const Data& data = Data::none(),
                  const Overrides& overrides = Overrides::caller());
    void error(const std::exception& e, const Data& data = Data::none(),
               const Overrides& overrides = Overrides::caller());
    void warning(const std::exception& e, const Data& data = Data::none(),
                 const Overrides& overrides = Overrides::caller());

    // ========================================================================
    //  FLUSH / TEARDOWN
    // ========================================================================

    /**
     * @brief Writes the current window smartly and starts a new one.
     *
     * Queues and the escalation flag are reset even when writing fails; the
     * failed batch is lost rather than retried.
     *
     * @throws LockError if the directory lock cannot be taken.
     * @throws WriteError if appending fails (raised after the lock is released).
     */
    void flush();

    /**
     * @brief Flushes once, closes the file and rejects further records.
     *
     * Idempotent: closing a closed logger does nothing.
     *
     * @throws LockError, WriteError from the final flush. The logger is closed
     * regardless.
     */
    void close();

    // ========================================================================
    //  INTROSPECTION
    // ========================================================================

    const std::string& directory() const { return directory_; }
    const Config& config() const { return config_; }

    /// @brief Active CSV path; empty when OFF.
    std::string active_file() const;

    /// @brief Lock file path; empty when OFF.
    std::string lock_file() const;

    /// @brief Records queued in the current window, across all ranks.
    std::size_t pending() const;

    /// @brief True once the current window has escalated.
    bool verbose() const;

    bool closed() const;

  protected:
    /**
     * @brief Called inside the locked section just before row @p index is written.
     *
     * No-op by default. Instrumentation subclasses use it to widen the critical
     * section when exercising cross-writer exclusion.
     */
    virtual void on_locked_write(std::size_t index);

  private:
    /// @brief Builds and queues a record. Caller holds `mutex_`.
    void enqueue(int rank, std::string message, std::string trace, const Data& data,
                 const Overrides& overrides);

    /// @brief Flush body. Caller holds `mutex_`.
    void write_locked();

    /// @brief Empties every queue and clears the escalation flag.
    void reset_window();

    std::string directory_;
    Config config_;

    std::unique_ptr<io::LogFiles> files_;
    std::unique_ptr<io::FileMutex> file_mutex_;

    /// @brief Guards queues, counter, flags and the file handle.
    mutable std::mutex mutex_;

    std::array<std::vector<Record>, severity::kCount> queues_;
    std::uint64_t next_sequence_ = 0;
    bool verbose_ = false;
    bool closed_ = false;
};

} // namespace slogger::core

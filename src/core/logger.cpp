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
 * @file logger.cpp
 * @brief Implementation of the buffering smart logger.
 *
 * @details
 * Lifecycle of a record:
 * 1. **Enqueue**: rendered into a `Record` and pushed to the queue of its rank.
 * 2. **Select**: at flush, queues are picked by the threshold or, in an
 *    escalated window, all of them.
 * 3. **Order**: the selection is sorted by sequence number, restoring the
 *    chronological order across ranks.
 * 4. **Persist**: rows are appended under the directory lock.
 * 5. **Reset**: queues and the escalation flag are cleared, success or not.
 */

#include "slogger/core/logger.hpp"

#include "slogger/core/csv.hpp"
#include "slogger/core/error.hpp"
#include "slogger/infra/clock.hpp"
#include "slogger/infra/diagnostics.hpp"
#include "slogger/infra/string.hpp"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <cxxabi.h>
#include <execinfo.h>
#include <filesystem>
#include <iterator>
#include <typeinfo>
#include <unistd.h>

namespace fs = std::filesystem;

namespace slogger::core {

using infra::DiagLevel;
using infra::Diagnostics;

namespace {

/// @brief Deepest call stack captured for an exception trace.
constexpr int kMaxFrames = 64;

std::string demangle(const char* mangled)
{
    int status = 0;
    char* readable = abi::__cxa_demangle(mangled, nullptr, nullptr, &status);
    if (status != 0 || !readable) {
        return mangled;
    }
    std::string out(readable);
    free(readable);
    return out;
}

/// @brief `"<dynamic type>: <what()>"`.
std::string describe(const std::exception& e)
{
    return demangle(typeid(e).name()) + ": " + e.what();
}

/**
 * @brief Renders the current call stack as `#<n> <frame>` lines ending in `{main}`.
 *
 * The first @p skip frames (this function and its logging callers) are left out.
 */
std::string stack_trace(int skip)
{
    void* frames[kMaxFrames];
    const int depth = backtrace(frames, kMaxFrames);
    char** symbols = backtrace_symbols(frames, depth);

    std::string out;
    int index = 0;
    for (int i = skip; i < depth; ++i) {
        out += "#" + std::to_string(index++) + " ";
        out += symbols ? symbols[i] : "??";
        out += "\n";
    }
    free(symbols);

    out += "#" + std::to_string(index) + " {main}";
    return out;
}

/// @brief Appends one `Caused by:` line per level of `std::nested_exception`.
void append_causes(const std::exception& e, std::string& trace)
{
    try {
        std::rethrow_if_nested(e);
    } catch (const std::exception& cause) {
        trace += "\nCaused by: " + describe(cause);
        append_causes(cause, trace);
    } catch (...) {
        trace += "\nCaused by: non-standard exception";
    }
}

std::string location_of(const Overrides& overrides)
{
    std::string out = overrides.file.value_or("");
    out += "(";
    if (overrides.line) {
        out += std::to_string(*overrides.line);
    }
    out += ")";
    return out;
}

} // namespace

// ============================================================================
//  CONSTRUCTION / TEARDOWN
// ============================================================================

/**
 * @brief Bootstraps the logger on its directory.
 *
 * **Startup Sequence (skipped entirely when OFF):**
 * 1. Create the directory tree.
 * 2. Pre-flight: an existing lock file must be writable.
 * 3. Under the directory lock: resolve the active file, open it, sweep expired files.
 *
 * The lock is held through a `FileMutex::Guard`, so it is released before any
 * exception leaves the locked section.
 */
Logger::Logger(std::string directory, Config config) : config_(std::move(config))
{
    if (directory.empty()) {
        throw ConstructionError("Log directory is required");
    }

    directory_ = infra::String::rtrim_any(directory, "/\\");
    if (directory_.empty()) {
        directory_ = "/";
    }

    if (config_.off()) {
        return;
    }

    try {
        files_ = std::make_unique<io::LogFiles>(directory_, config_.max_file_size,
                                                config_.max_days, config_.default_permission);
        files_->ensure_directory();

        const std::string lock_path = io::FileMutex::path_for(directory_);
        if (fs::exists(lock_path) && access(lock_path.c_str(), W_OK) != 0) {
            throw PermissionError("Please check permissions on lock file: " + lock_path);
        }
        file_mutex_ = std::make_unique<io::FileMutex>(lock_path);

        const auto now = std::chrono::system_clock::now();
        io::FileMutex::Guard guard(*file_mutex_);
        files_->resolve_active_file(now);
        files_->open();
        files_->delete_expired(now);
    } catch (const ConstructionError&) {
        throw;
    } catch (const Error& e) {
        throw ConstructionError("Could not open logger on " + directory_ + ": " + e.what());
    } catch (const fs::filesystem_error& e) {
        throw ConstructionError("Could not open logger on " + directory_ + ": " + e.what());
    }

    Diagnostics::log(DiagLevel::DEBUG, "Logger: writing to " + files_->active_file());
}

Logger::~Logger()
{
    try {
        close();
    } catch (const std::exception& e) {
        Diagnostics::log(DiagLevel::ERROR, "Logger: final flush of " + directory_ +
                                               " failed, batch dropped: " + e.what());
    }
}

void Logger::close()
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
        return;
    }
    closed_ = true;

    if (config_.off()) {
        return;
    }

    try {
        write_locked();
    } catch (...) {
        files_->close();
        throw;
    }
    files_->close();
}

// ============================================================================
//  ENQUEUE
// ============================================================================

void Logger::log(const std::string& message, Severity severity, const Data& data,
                 const Overrides& overrides)
{
    if (config_.off()) {
        return;
    }
    const int rank = severity::rank(severity);
    if (!severity::in_range(rank)) {
        throw UnknownSeverity("Cannot log at severity ordinal " + std::to_string(rank));
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
        return;
    }
    enqueue(rank, message, "", data, overrides);
}

void Logger::log(const std::string& message, std::string_view severity, const Data& data,
                 const Overrides& overrides)
{
    if (config_.off()) {
        return;
    }
    log(message, static_cast<Severity>(severity::ordinal(severity)), data, overrides);
}

void Logger::log(const std::exception& error, Severity severity, const Data& data,
                 const Overrides& overrides)
{
    if (config_.off()) {
        return;
    }
    const int rank = severity::rank(severity);
    if (!severity::in_range(rank)) {
        throw UnknownSeverity("Cannot log at severity ordinal " + std::to_string(rank));
    }

    // Rendered before taking the lock; backtrace() is comparatively slow.
    std::string trace = stack_trace(1);
    append_causes(error, trace);

    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
        return;
    }
    enqueue(rank, describe(error), std::move(trace), data, overrides);
}

void Logger::enqueue(int rank, std::string message, std::string trace, const Data& data,
                     const Overrides& overrides)
{
    if (rank <= severity::rank(config_.smart_severity_threshold)) {
        verbose_ = true;
    }

    Record record;
    record.sequence = next_sequence_++;
    record.rank = rank;
    record.timestamp = infra::Clock::format(config_.date_format, std::chrono::system_clock::now());
    record.severity = severity::upper_label(rank);
    record.message = std::move(message);
    record.location = location_of(overrides);
    record.trace = std::move(trace);
    record.data = overrides.data ? overrides.data->str() : data.str();

    queues_[rank].push_back(std::move(record));
}

void Logger::emergency(const std::string& message, const Data& data, const Overrides& overrides)
{
    log(message, Severity::EMERGENCY, data, overrides);
}

void Logger::alert(const std::string& message, const Data& data, const Overrides& overrides)
{
    log(message, Severity::ALERT, data, overrides);
}

void Logger::critical(const std::string& message, const Data& data, const Overrides& overrides)
{
    log(message, Severity::CRITICAL, data, overrides);
}

void Logger::error(const std::string& message, const Data& data, const Overrides& overrides)
{
    log(message, Severity::ERROR, data, overrides);
}

void Logger::warning(const std::string& message, const Data& data, const Overrides& overrides)
{
    log(message, Severity::WARNING, data, overrides);
}

void Logger::notice(const std::string& message, const Data& data, const Overrides& overrides)
{
    log(message, Severity::NOTICE, data, overrides);
}

void Logger::info(const std::string& message, const Data& data, const Overrides& overrides)
{
    log(message, Severity::INFORMATIONAL, data, overrides);
}

void Logger::debug(const std::string& message, const Data& data, const Overrides& overrides)
{
    log(message, Severity::DEBUG, data, overrides);
}

void Logger::emergency(const std::exception& e, const Data& data, const Overrides& overrides)
{
    log(e, Severity::EMERGENCY, data, overrides);
}

void Logger::alert(const std::exception& e, const Data& data, const Overrides& overrides)
{
    log(e, Severity::ALERT, data, overrides);
}

void Logger::critical(const std::exception& e, const Data& data, const Overrides& overrides)
{
    log(e, Severity::CRITICAL, data, overrides);
}

void Logger::error(const std::exception& e, const Data& data, const Overrides& overrides)
{
    log(e, Severity::ERROR, data, overrides);
}

void Logger::warning(const std::exception& e, const Data& data, const Overrides& overrides)
{
    log(e, Severity::WARNING, data, overrides);
}

// ============================================================================
//  FLUSH
// ============================================================================

void Logger::flush()
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (config_.off() || closed_) {
        return;
    }
    write_locked();
}

/**
 * @brief Selects, orders and appends the current window.
 *
 * Records below the threshold are discarded here unless the window escalated;
 * they are not carried into the next window.
 */
void Logger::write_locked()
{
    std::vector<Record> batch;
    const int threshold = severity::rank(config_.severity_threshold);
    for (int rank = 0; rank < severity::kCount; ++rank) {
        if (verbose_ || rank <= threshold) {
            std::move(queues_[rank].begin(), queues_[rank].end(), std::back_inserter(batch));
        }
    }

    if (batch.empty()) {
        reset_window();
        return;
    }

    std::sort(batch.begin(), batch.end(),
              [](const Record& a, const Record& b) { return a.sequence < b.sequence; });

    try {
        io::FileMutex::Guard guard(*file_mutex_);
        for (std::size_t i = 0; i < batch.size(); ++i) {
            on_locked_write(i);
            files_->append(Csv::row(batch[i]));
        }
    } catch (...) {
        // The guard has already released the lock at this point.
        reset_window();
        throw;
    }
    reset_window();
}

void Logger::reset_window()
{
    for (auto& queue : queues_) {
        queue.clear();
    }
    verbose_ = false;
}

void Logger::on_locked_write(std::size_t) {}

// ============================================================================
//  INTROSPECTION
// ============================================================================

std::string Logger::active_file() const
{
    return files_ ? files_->active_file() : std::string();
}

std::string Logger::lock_file() const
{
    return file_mutex_ ? file_mutex_->path() : std::string();
}

std::size_t Logger::pending() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t total = 0;
    for (const auto& queue : queues_) {
        total += queue.size();
    }
    return total;
}

bool Logger::verbose() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return verbose_;
}

bool Logger::closed() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

} // namespace slogger::core

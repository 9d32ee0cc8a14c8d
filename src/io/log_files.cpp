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
 * @file log_files.cpp
 * @brief Directory setup, size rotation and age retention for log files.
 */

#include "slogger/io/log_files.hpp"

#include "slogger/core/error.hpp"
#include "slogger/infra/clock.hpp"
#include "slogger/infra/diagnostics.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <regex>
#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace slogger::io {

using infra::DiagLevel;
using infra::Diagnostics;

LogFiles::LogFiles(std::string directory, std::uint64_t max_file_size, int max_days,
                   mode_t permission)
    : directory_(std::move(directory)), max_file_size_(max_file_size), max_days_(max_days),
      permission_(permission)
{
}

/**
 * @brief Creates each missing component with `mkdir(2)` so the configured mode
 * (filtered by the umask) applies to every level, like `mkdir -p -m`.
 */
void LogFiles::ensure_directory()
{
    std::error_code ec;
    if (fs::is_directory(directory_, ec)) {
        return;
    }

    fs::path partial;
    for (const auto& part : fs::path(directory_)) {
        partial /= part;
        if (part.empty() || part == partial.root_path()) {
            continue;
        }
        if (mkdir(partial.c_str(), permission_) != 0 && errno != EEXIST) {
            throw core::IoError("Could not create log directory " + partial.string() + ": " +
                                std::strerror(errno));
        }
    }

    if (!fs::is_directory(directory_, ec)) {
        throw core::IoError("Log directory is not a directory: " + directory_);
    }
}

std::string LogFiles::file_name(const std::string& date, int counter)
{
    char suffix[16];
    std::snprintf(suffix, sizeof(suffix), "-%03d.csv", counter);
    return "log_" + date + suffix;
}

std::string LogFiles::resolve_active_file(time_point now)
{
    const std::string date = infra::Clock::date(now);

    int counter = 0;
    std::string candidate = directory_ + "/" + file_name(date, counter);
    std::error_code ec;
    while (fs::exists(candidate, ec) && fs::file_size(candidate, ec) > max_file_size_ && !ec) {
        candidate = directory_ + "/" + file_name(date, ++counter);
    }

    if (fs::exists(candidate, ec) && access(candidate.c_str(), W_OK) != 0) {
        throw core::PermissionError(
            "Cannot write to log file. Please check permissions on log file: " + candidate);
    }

    active_file_ = candidate;
    return active_file_;
}

void LogFiles::open()
{
    if (active_file_.empty()) {
        throw core::IoError("No active log file resolved in " + directory_);
    }
    stream_.open(active_file_, std::ios::out | std::ios::app | std::ios::binary);
    if (!stream_.is_open()) {
        throw core::IoError("Cannot append to log file: " + active_file_);
    }
}

void LogFiles::append(const std::string& bytes)
{
    if (!stream_.is_open()) {
        throw core::WriteError("Log file is not open: " + active_file_);
    }
    stream_.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    // Flush while the caller still holds the lock; buffered bytes must not
    // land in the file after another writer has taken over.
    stream_.flush();
    if (!stream_.good()) {
        stream_.clear();
        throw core::WriteError("Failed writing to log file: " + active_file_);
    }
}

void LogFiles::close()
{
    if (stream_.is_open()) {
        stream_.close();
    }
}

std::size_t LogFiles::delete_expired(time_point now)
{
    static const std::regex pattern(R"(^log_([0-9]{4}-[0-9]{2}-[0-9]{2})(-[0-9]+)?\.csv$)");

    const std::time_t cutoff = std::chrono::system_clock::to_time_t(now) -
                               static_cast<std::time_t>(max_days_) * 24 * 60 * 60;

    std::size_t removed = 0;
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(directory_, ec)) {
        const std::string name = entry.path().filename().string();
        std::smatch match;
        if (!std::regex_match(name, match, pattern)) {
            continue;
        }
        // The active file is already open for appending.
        if (!active_file_.empty() && name == fs::path(active_file_).filename().string()) {
            continue;
        }

        auto file_time = infra::Clock::parse_date(match[1].str());
        if (!file_time || *file_time >= cutoff) {
            continue;
        }

        std::error_code rm_ec;
        if (fs::remove(entry.path(), rm_ec)) {
            removed++;
        } else if (rm_ec) {
            throw core::IoError("Could not delete expired log file " + entry.path().string() +
                                ": " + rm_ec.message());
        }
    }
    if (ec) {
        throw core::IoError("Could not scan log directory " + directory_ + ": " + ec.message());
    }

    if (removed > 0) {
        Diagnostics::log(DiagLevel::DEBUG, "LogFiles: removed " + std::to_string(removed) +
                                               " expired file(s) from " + directory_);
    }
    return removed;
}

} // namespace slogger::io

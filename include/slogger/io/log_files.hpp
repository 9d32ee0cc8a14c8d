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
 * @file log_files.hpp
 * @brief Management of the CSV files inside one log directory.
 *
 * @details
 * `LogFiles` owns a log directory: it creates it, picks the active file
 * (rotating by size), holds the append stream and sweeps out files past the
 * retention age. File names follow `log_<YYYY-MM-DD>-<NNN>.csv`.
 *
 * None of these methods lock anything. `Logger` calls the mutating ones with
 * its `FileMutex` held.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <fstream>
#include <string>
#include <sys/types.h>

namespace slogger::io {

class LogFiles {
  public:
    using time_point = std::chrono::system_clock::time_point;

    /**
     * @param directory Normalized log directory (no trailing separator).
     * @param max_file_size Rotation threshold in bytes.
     * @param max_days Retention age in days.
     * @param permission Mode used when creating directories.
     */
    LogFiles(std::string directory, std::uint64_t max_file_size, int max_days,
             mode_t permission);

    /**
     * @brief Creates the directory tree if it is absent.
     * @throws IoError if creation fails or the path exists but is not a directory.
     */
    void ensure_directory();

    /**
     * @brief Chooses the file to append to for the calendar day of @p now.
     *
     * Starting from `-000`, the counter advances while the candidate exists
     * and is strictly larger than the size cap.
     *
     * @return std::string The resolved path, also stored as the active file.
     * @throws PermissionError if the resolved file exists but is not writable.
     */
    std::string resolve_active_file(time_point now);

    /**
     * @brief Opens the active file for appending.
     * @throws IoError if no file was resolved or it cannot be opened.
     */
    void open();

    /**
     * @brief Appends pre-encoded bytes and pushes them to the OS.
     * @throws WriteError if the stream is closed or fails.
     */
    void append(const std::string& bytes);

    /// @brief Closes the append stream. Safe to call repeatedly.
    void close();

    bool is_open() const { return stream_.is_open(); }

    /**
     * @brief Deletes log files dated strictly before `now - max_days`.
     *
     * Only names matching `log_<YYYY-MM-DD>[-<digits>].csv` are considered; a
     * name whose date does not parse is left alone. The pattern is anchored at
     * both ends: a name that merely ends in `log_<date>.csv`, such as
     * `archive_log_2020-01-01-000.csv`, is kept, where an unanchored
     * `log_(...)\.csv$` search would delete it.
     *
     * The resolved active file is never deleted, even with `max_days` of 0.
     *
     * @return std::size_t Number of files removed.
     */
    std::size_t delete_expired(time_point now);

    /// @brief Builds `log_<date>-<NNN>.csv`.
    static std::string file_name(const std::string& date, int counter);

    const std::string& directory() const { return directory_; }
    const std::string& active_file() const { return active_file_; }

  private:
    std::string directory_;
    std::uint64_t max_file_size_;
    int max_days_;
    mode_t permission_;
    std::string active_file_;
    std::ofstream stream_;
};

} // namespace slogger::io

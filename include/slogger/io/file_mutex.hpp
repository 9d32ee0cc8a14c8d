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
 * @file file_mutex.hpp
 * @brief Advisory, cross-process exclusive lock backed by a lock file.
 *
 * @details
 * `FileMutex` wraps `flock(2)` on a dedicated lock file. Locks taken through
 * different open file descriptions exclude each other, so the same mechanism
 * serializes two processes and two `FileMutex` objects inside one process.
 * The lock file carries a human-readable `Locked`/`Unlocked` marker that has
 * no meaning beyond helping someone inspecting the directory.
 */

#pragma once

#include <string>

namespace slogger::io {

class FileMutex {
  public:
    /// @brief Fixed name of the lock file inside a log directory.
    static constexpr const char* kLockFileName = ".lockfile";

    /**
     * @brief Binds the mutex to a lock file path. Nothing is opened yet.
     */
    explicit FileMutex(std::string path);

    /**
     * @brief Returns the lock file path for a log directory: `<dir>/.lockfile`.
     */
    static std::string path_for(const std::string& directory);

    /// @brief Releases a held lock and closes the descriptor.
    ~FileMutex();

    FileMutex(const FileMutex&) = delete;
    FileMutex& operator=(const FileMutex&) = delete;

    /**
     * @brief Blocks until the exclusive lock is held.
     *
     * Opens (creating if needed) the lock file on first use, then calls
     * `flock(LOCK_EX)`, retrying on `EINTR`. On success the file is truncated
     * and marked `Locked`.
     *
     * @throws LockError if the lock file cannot be opened for writing or the
     * lock call fails.
     */
    void acquire();

    /**
     * @brief Releases the lock and marks the file `Unlocked`.
     *
     * Releasing a mutex that is not held is caller misuse: a warning goes to
     * the diagnostics channel and the call returns normally.
     */
    void release();

    /// @brief True while this object holds the lock.
    bool owned() const { return owned_; }

    const std::string& path() const { return path_; }

    /**
     * @class Guard
     * @brief Scoped acquisition: acquires on construction, releases on every exit path.
     */
    class Guard {
      public:
        explicit Guard(FileMutex& mutex) : mutex_(mutex) { mutex_.acquire(); }
        ~Guard() { mutex_.release(); }

        Guard(const Guard&) = delete;
        Guard& operator=(const Guard&) = delete;

      private:
        FileMutex& mutex_;
    };

  private:
    /// @brief Truncates the lock file and writes @p marker.
    void mark(const char* marker);

    std::string path_;
    int fd_ = -1;
    bool owned_ = false;
};

} // namespace slogger::io

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
 * @file file_mutex.cpp
 * @brief `flock(2)` implementation of the cross-process mutex.
 */

#include "slogger/io/file_mutex.hpp"

#include "slogger/core/error.hpp"
#include "slogger/infra/diagnostics.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace slogger::io {

using infra::DiagLevel;
using infra::Diagnostics;

FileMutex::FileMutex(std::string path) : path_(std::move(path)) {}

std::string FileMutex::path_for(const std::string& directory)
{
    return directory + "/" + kLockFileName;
}

FileMutex::~FileMutex()
{
    if (owned_) {
        release();
    }
    if (fd_ >= 0) {
        close(fd_);
    }
}

void FileMutex::acquire()
{
    if (fd_ < 0) {
        fd_ = open(path_.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0666);
        if (fd_ < 0) {
            throw core::LockError("Could not open lock file " + path_ + ": " +
                                  std::strerror(errno));
        }
    }

    int rc = 0;
    do {
        rc = flock(fd_, LOCK_EX);
    } while (rc != 0 && errno == EINTR);

    if (rc != 0) {
        Diagnostics::log(DiagLevel::ERROR, "FileMutex: failed to acquire lock [" + path_ + "]");
        throw core::LockError("Could not lock " + path_ + ": " + std::strerror(errno));
    }

    owned_ = true;
    mark("Locked\n");
}

void FileMutex::release()
{
    if (!owned_) {
        Diagnostics::log(DiagLevel::WARN,
                         "FileMutex: release called on [" + path_ + "] but it is not held");
        return;
    }

    // Mark before unlocking so the marker is never rewritten under another holder's lock.
    mark("Unlocked\n");
    owned_ = false;
    if (flock(fd_, LOCK_UN) != 0) {
        Diagnostics::log(DiagLevel::ERROR, "FileMutex: failed to release lock [" + path_ +
                                               "]: " + std::strerror(errno));
    }
}

void FileMutex::mark(const char* marker)
{
    // The marker is informational only; a failure here does not affect the lock.
    if (ftruncate(fd_, 0) != 0 || lseek(fd_, 0, SEEK_SET) < 0) {
        Diagnostics::log(DiagLevel::DEBUG, "FileMutex: could not reset marker in " + path_);
        return;
    }
    const std::size_t len = std::strlen(marker);
    if (write(fd_, marker, len) != static_cast<ssize_t>(len)) {
        Diagnostics::log(DiagLevel::DEBUG, "FileMutex: could not write marker to " + path_);
    }
}

} // namespace slogger::io

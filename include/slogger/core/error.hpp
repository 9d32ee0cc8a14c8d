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
 * @file error.hpp
 * @brief Exception taxonomy raised by the logging core.
 *
 * @details
 * Every failure the library surfaces derives from `slogger::core::Error`, which is
 * itself a `std::runtime_error`, so callers may catch as broadly or as narrowly as
 * they need:
 *
 * | Type                | Raised by                               | Meaning                            |
 * |---------------------|-----------------------------------------|------------------------------------|
 * | `ConstructionError` | `Logger` constructor                    | Logger unusable, never registered. |
 * | `PermissionError`   | `Logger` constructor (pre-flight)       | Lock or log file not writable.     |
 * | `UnknownSeverity`   | severity lookup, `Logger::log`          | Caller passed a bad severity.      |
 * | `LockError`         | `FileMutex::acquire`                    | Cross-process lock unavailable.    |
 * | `WriteError`        | `Logger::flush`                         | Rows could not be appended.        |
 * | `IoError`           | `LogFiles` directory/file setup         | File system refused an operation.  |
 * | `ConfigError`       | `Config`, `Registry`, `ErrorBridge`     | Bad key, value or document shape.  |
 */

#pragma once

#include <stdexcept>
#include <string>

namespace slogger::core {

class Error : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

class ConstructionError : public Error {
  public:
    using Error::Error;
};

/// @brief Pre-flight writability check failed. Fatal at construction.
class PermissionError : public ConstructionError {
  public:
    using ConstructionError::ConstructionError;
};

class UnknownSeverity : public Error {
  public:
    using Error::Error;
};

class LockError : public Error {
  public:
    using Error::Error;
};

/// @brief Appending a flush batch failed. The batch is dropped, not retried.
class WriteError : public Error {
  public:
    using Error::Error;
};

class IoError : public Error {
  public:
    using Error::Error;
};

class ConfigError : public Error {
  public:
    using Error::Error;
};

} // namespace slogger::core

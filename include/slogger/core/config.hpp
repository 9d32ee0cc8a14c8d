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
 * @file config.hpp
 * @brief Per-logger configuration with defaults and string overrides.
 */

#pragma once

#include "slogger/core/severity.hpp"

#include <cstdint>
#include <string>
#include <sys/types.h>

namespace slogger::core {

/**
 * @struct Config
 * @brief Settings fixed at logger construction.
 *
 * @details
 * Bulk configuration supplies overrides as `(key, value)` text pairs; `apply`
 * validates and converts them. Recognized keys:
 *
 * | Key                      | Value                                   | Default                   |
 * |--------------------------|-----------------------------------------|---------------------------|
 * | `severityThreshold`      | severity name/prefix, ordinal or `off`  | `informational`           |
 * | `smartSeverityThreshold` | severity name/prefix, ordinal or `off`  | `notice`                  |
 * | `maxFileSize`            | bytes                                   | `100000000`               |
 * | `dateFormat`             | strftime pattern, `%f` = microseconds   | `%Y-%m-%d %H:%M:%S.%f`    |
 * | `defaultPermission`      | octal mode (`0777`, `755`)              | `0777`                    |
 * | `maxDays`                | days of retention                       | `7`                       |
 *
 * Leading underscores on keys are ignored (`_maxDays` == `maxDays`).
 */
struct Config {
    /// @brief Records at this rank or more severe are normally written.
    Severity severity_threshold = Severity::INFORMATIONAL;

    /// @brief A record at this rank or more severe escalates the whole flush window.
    Severity smart_severity_threshold = Severity::NOTICE;

    std::uint64_t max_file_size = 100000000;
    std::string date_format = "%Y-%m-%d %H:%M:%S.%f";
    mode_t default_permission = 0777;
    int max_days = 7;

    /**
     * @brief Applies one textual override.
     * @throws ConfigError for an unknown key or an unparsable value.
     */
    void apply(const std::string& key, const std::string& value);

    /// @brief True if logging is disabled entirely.
    bool off() const { return severity_threshold == Severity::OFF; }
};

} // namespace slogger::core

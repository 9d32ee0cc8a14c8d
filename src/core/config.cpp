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
 * @file config.cpp
 * @brief Validation and conversion of configuration overrides.
 */

#include "slogger/core/config.hpp"

#include "slogger/core/error.hpp"
#include "slogger/infra/string.hpp"

#include <cerrno>
#include <cstdlib>

namespace slogger::core {

namespace {

std::uint64_t parse_unsigned(const std::string& key, const std::string& value, int base)
{
    if (value.empty() || value.front() == '-' || value.front() == '+') {
        throw ConfigError("Invalid value for " + key + ": '" + value + "'");
    }
    errno = 0;
    char* end = nullptr;
    unsigned long long n = std::strtoull(value.c_str(), &end, base);
    if (errno != 0 || end == value.c_str() || *end != '\0') {
        throw ConfigError("Invalid value for " + key + ": '" + value + "'");
    }
    return static_cast<std::uint64_t>(n);
}

Severity parse_severity(const std::string& key, const std::string& value)
{
    try {
        return severity::threshold(value);
    } catch (const UnknownSeverity& e) {
        throw ConfigError("Invalid value for " + key + ": " + e.what());
    }
}

} // namespace

void Config::apply(const std::string& raw_key, const std::string& raw_value)
{
    const std::string key = infra::String::ltrim_any(raw_key, "_");
    const std::string value = infra::String::trim(raw_value);

    if (key == "severityThreshold") {
        severity_threshold = parse_severity(key, value);
    } else if (key == "smartSeverityThreshold") {
        smart_severity_threshold = parse_severity(key, value);
    } else if (key == "maxFileSize") {
        max_file_size = parse_unsigned(key, value, 10);
    } else if (key == "dateFormat") {
        date_format = raw_value;
    } else if (key == "defaultPermission") {
        auto mode = parse_unsigned(key, value, 8);
        if (mode > 07777) {
            throw ConfigError("Invalid value for " + key + ": '" + value + "'");
        }
        default_permission = static_cast<mode_t>(mode);
    } else if (key == "maxDays") {
        auto days = parse_unsigned(key, value, 10);
        if (days > 36500) {
            throw ConfigError("Invalid value for " + key + ": '" + value + "'");
        }
        max_days = static_cast<int>(days);
    } else {
        throw ConfigError("Unknown configuration key: '" + raw_key + "'");
    }
}

} // namespace slogger::core

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
 * @file clock.hpp
 * @brief Local-time formatting and calendar-date parsing.
 *
 * @details
 * Record timestamps and log file names are both expressed in local time.
 * `Clock::format` extends `strftime` with a `%f` conversion (six-digit
 * microseconds), which `strftime` itself lacks.
 */

#pragma once

#include <chrono>
#include <ctime>
#include <optional>
#include <string>
#include <string_view>

namespace slogger::infra {

class Clock {
  public:
    using time_point = std::chrono::system_clock::time_point;

    /**
     * @brief Formats @p when in local time.
     *
     * @param format `strftime` pattern; `%f` expands to microseconds (000000-999999)
     * and `%%f` stays a literal `%f`.
     * @param when The instant to format.
     * @return std::string The formatted text. An empty pattern yields an empty string.
     *
     * @code
     * Clock::format("%Y-%m-%d %H:%M:%S.%f", now); // "2026-10-19 08:15:02.004211"
     * @endcode
     */
    static std::string format(std::string_view format, time_point when);

    /// @brief `YYYY-MM-DD` of @p when in local time.
    static std::string date(time_point when);

    /**
     * @brief Parses a `YYYY-MM-DD` calendar date to local midnight.
     *
     * @return std::nullopt for malformed text or an impossible date (month 13,
     * February 30, ...).
     */
    static std::optional<std::time_t> parse_date(std::string_view text);

    /// @brief Converts a time point to local broken-down time.
    static std::tm local(time_point when);
};

} // namespace slogger::infra

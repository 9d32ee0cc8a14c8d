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
 * @file severity.hpp
 * @brief RFC 5424 severity scale and its name/ordinal conversions.
 *
 * @details
 * Ranks run from 0 (most severe) to 7 (most verbose). `Severity::OFF` is a
 * separate sentinel that disables a logger entirely; it is not part of the
 * rank scale and has no label.
 */

#pragma once

#include <array>
#include <string>
#include <string_view>

namespace slogger::core {

/**
 * @enum Severity
 * @brief The eight RFC 5424 severities plus the OFF sentinel.
 */
enum class Severity : int {
    OFF = -1,          ///< Logging disabled, including all file-system side effects.
    EMERGENCY = 0,     ///< System is unusable.
    ALERT = 1,         ///< Action must be taken immediately.
    CRITICAL = 2,      ///< Critical conditions.
    ERROR = 3,         ///< Error conditions.
    WARNING = 4,       ///< Warning conditions.
    NOTICE = 5,        ///< Normal but significant condition.
    INFORMATIONAL = 6, ///< Informational messages.
    DEBUG = 7          ///< Debug-level messages.
};

namespace severity {

/// @brief Number of ranks on the scale (OFF excluded).
inline constexpr int kCount = 8;

/// @brief Rank-ordered names. The scan order of prefix matching follows this table.
inline constexpr std::array<std::string_view, kCount> kNames = {
    "emergency", "alert", "critical", "error", "warning", "notice", "informational", "debug",
};

/// @brief Ordinal value of @p s.
constexpr int rank(Severity s)
{
    return static_cast<int>(s);
}

/// @brief True for 0..7. OFF and anything else is out of range.
constexpr bool in_range(int ordinal)
{
    return ordinal >= 0 && ordinal < kCount;
}

/// @brief An ordinal is already resolved; it is returned unchanged.
constexpr int ordinal(int value)
{
    return value;
}

/**
 * @brief Resolves a user-supplied name to its ordinal by prefix.
 *
 * The input is lower-cased and the table is scanned from rank 0 upwards; the
 * first name that starts with the input wins. `"err"` is ERROR, `"info"` is
 * INFORMATIONAL, and `"e"` is EMERGENCY because emergency is scanned first.
 *
 * @throws UnknownSeverity if no name starts with @p name.
 */
int ordinal(std::string_view name);

/**
 * @brief Returns the lower-case name of a rank.
 * @throws UnknownSeverity for anything outside 0..7, OFF included.
 */
std::string label(int ordinal);

/// @brief Upper-case name as written to the CSV severity column.
std::string upper_label(int ordinal);

/**
 * @brief Resolves a configured threshold.
 *
 * Accepts everything `ordinal(std::string_view)` accepts plus `"off"` (any
 * case) and decimal ordinals from `"-1"` to `"7"`.
 *
 * @throws UnknownSeverity for anything else.
 */
Severity threshold(std::string_view text);

/// @brief Converts a validated ordinal (or -1) back to the enum.
/// @throws UnknownSeverity outside -1..7.
Severity from_ordinal(int ordinal);

} // namespace severity
} // namespace slogger::core

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
 * @file string.hpp
 * @brief Text helpers shared by severity parsing, path handling and configuration.
 */

#pragma once

#include <string>
#include <string_view>

namespace slogger::infra {

/**
 * @class String
 * @brief A static container for stateless text operations.
 */
class String {
  public:
    /**
     * @brief Trims leading and trailing whitespace (per `std::isspace`).
     *
     * @code
     * slogger::infra::String::trim("  0777 \n"); // "0777"
     * @endcode
     */
    static std::string trim(const std::string& s);

    /**
     * @brief Removes every trailing character contained in @p chars.
     *
     * Used to strip trailing path separators: `rtrim_any("/var/log//", "/\\")`
     * yields `"/var/log"`.
     */
    static std::string rtrim_any(const std::string& s, std::string_view chars);

    /// @brief Removes every leading character contained in @p chars.
    static std::string ltrim_any(const std::string& s, std::string_view chars);

    /// @brief ASCII lower-case copy.
    static std::string to_lower(std::string_view s);

    /// @brief ASCII upper-case copy.
    static std::string to_upper(std::string_view s);

    /// @brief True if @p s begins with @p prefix. An empty prefix always matches.
    static bool starts_with(std::string_view s, std::string_view prefix);

    /**
     * @brief True if @p s is an optionally signed run of decimal digits.
     *
     * `"-1"` and `"7"` qualify, `""`, `"-"` and `"0x1"` do not.
     */
    static bool is_integer(std::string_view s);
};

} // namespace slogger::infra

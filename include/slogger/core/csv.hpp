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
 * @file csv.hpp
 * @brief CSV row encoding for log records.
 *
 * @details
 * Column order is fixed:
 * `timestamp, SEVERITY, message, file(line), trace, data`
 *
 * A field is enclosed in double quotes when it contains the delimiter, the
 * enclosure, a backslash, a space or a line/tab character; enclosed quotes are
 * doubled. Every row ends with a single `\n`.
 */

#pragma once

#include "slogger/core/record.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace slogger::core {

class Csv {
  public:
    static constexpr char kDelimiter = ',';
    static constexpr char kEnclosure = '"';

    /// @brief Encodes one field, quoting only when required.
    static std::string field(std::string_view value);

    /// @brief Encodes a row of fields, newline included.
    static std::string row(const std::vector<std::string>& fields);

    /// @brief Encodes a record in the fixed column order.
    static std::string row(const Record& record);
};

} // namespace slogger::core

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
 * @file csv.cpp
 * @brief Implementation of the CSV row encoder.
 */

#include "slogger/core/csv.hpp"

namespace slogger::core {

std::string Csv::field(std::string_view value)
{
    static constexpr std::string_view kSpecial = ",\"\\ \t\r\n";
    if (value.find_first_of(kSpecial) == std::string_view::npos) {
        return std::string(value);
    }

    std::string out;
    out.reserve(value.size() + 2);
    out += kEnclosure;
    for (char c : value) {
        if (c == kEnclosure) {
            out += kEnclosure;
        }
        out += c;
    }
    out += kEnclosure;
    return out;
}

std::string Csv::row(const std::vector<std::string>& fields)
{
    std::string out;
    for (std::size_t i = 0; i < fields.size(); ++i) {
        if (i > 0) {
            out += kDelimiter;
        }
        out += field(fields[i]);
    }
    out += '\n';
    return out;
}

std::string Csv::row(const Record& record)
{
    return row({record.timestamp, record.severity, record.message, record.location, record.trace,
                record.data});
}

} // namespace slogger::core

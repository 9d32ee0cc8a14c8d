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
 * @file severity.cpp
 * @brief Implementation of the severity conversions.
 */

#include "slogger/core/severity.hpp"

#include "slogger/core/error.hpp"
#include "slogger/infra/string.hpp"

namespace slogger::core::severity {

int ordinal(std::string_view name)
{
    const std::string wanted = infra::String::to_lower(name);
    for (int i = 0; i < kCount; ++i) {
        if (infra::String::starts_with(kNames[i], wanted)) {
            return i;
        }
    }
    throw UnknownSeverity("Unknown severity: " + wanted);
}

std::string label(int ordinal)
{
    if (!in_range(ordinal)) {
        throw UnknownSeverity("Severity ordinal out of range: " + std::to_string(ordinal));
    }
    return std::string(kNames[ordinal]);
}

std::string upper_label(int ordinal)
{
    return infra::String::to_upper(label(ordinal));
}

Severity from_ordinal(int ordinal)
{
    if (ordinal == rank(Severity::OFF) || in_range(ordinal)) {
        return static_cast<Severity>(ordinal);
    }
    throw UnknownSeverity("Severity ordinal out of range: " + std::to_string(ordinal));
}

Severity threshold(std::string_view text)
{
    const std::string value = infra::String::trim(std::string(text));
    if (infra::String::to_lower(value) == "off") {
        return Severity::OFF;
    }
    if (infra::String::is_integer(value)) {
        int n = 0;
        try {
            n = std::stoi(value);
        } catch (const std::out_of_range&) {
            throw UnknownSeverity("Severity ordinal out of range: " + value);
        }
        return from_ordinal(n);
    }
    return static_cast<Severity>(ordinal(value));
}

} // namespace slogger::core::severity

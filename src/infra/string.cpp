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
 * @file string.cpp
 * @brief Implementation of the text helpers.
 *
 * @note Every `<cctype>` call casts to `unsigned char` first; passing a negative
 * `char` to those predicates is undefined behavior.
 */

#include "slogger/infra/string.hpp"

#include <algorithm>
#include <cctype>

namespace slogger::infra {

std::string String::trim(const std::string& s)
{
    auto start = s.begin();
    while (start != s.end() && std::isspace(static_cast<unsigned char>(*start))) {
        start++;
    }

    if (start == s.end()) {
        return "";
    }

    auto end = s.end();
    do {
        end--;
    } while (std::distance(start, end) > 0 && std::isspace(static_cast<unsigned char>(*end)));

    return std::string(start, end + 1);
}

std::string String::rtrim_any(const std::string& s, std::string_view chars)
{
    auto pos = s.find_last_not_of(chars.data(), std::string::npos, chars.size());
    if (pos == std::string::npos) {
        return "";
    }
    return s.substr(0, pos + 1);
}

std::string String::ltrim_any(const std::string& s, std::string_view chars)
{
    auto pos = s.find_first_not_of(chars.data(), 0, chars.size());
    if (pos == std::string::npos) {
        return "";
    }
    return s.substr(pos);
}

std::string String::to_lower(std::string_view s)
{
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string String::to_upper(std::string_view s)
{
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return out;
}

bool String::starts_with(std::string_view s, std::string_view prefix)
{
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

bool String::is_integer(std::string_view s)
{
    if (!s.empty() && (s.front() == '-' || s.front() == '+')) {
        s.remove_prefix(1);
    }
    if (s.empty()) {
        return false;
    }
    return std::all_of(s.begin(), s.end(),
                       [](unsigned char c) { return std::isdigit(c) != 0; });
}

} // namespace slogger::infra

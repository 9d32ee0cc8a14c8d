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
 * @file clock.cpp
 * @brief Implementation of local-time formatting helpers.
 */

#include "slogger/infra/clock.hpp"

#include <cctype>
#include <iomanip>
#include <sstream>

namespace slogger::infra {

std::tm Clock::local(time_point when)
{
    std::time_t t = std::chrono::system_clock::to_time_t(when);
    std::tm out{};
    localtime_r(&t, &out);
    return out;
}

/**
 * @brief Expands `%f` first, then hands the rest to `std::put_time`.
 *
 * `%%` pairs are copied through untouched so that `%%f` still reaches
 * `put_time` as an escaped percent followed by a literal `f`.
 */
std::string Clock::format(std::string_view format, time_point when)
{
    if (format.empty()) {
        return "";
    }

    auto since_epoch = when.time_since_epoch();
    auto micros =
        std::chrono::duration_cast<std::chrono::microseconds>(since_epoch).count() % 1000000;
    if (micros < 0) {
        micros += 1000000;
    }

    std::ostringstream frac;
    frac << std::setw(6) << std::setfill('0') << micros;

    std::string pattern;
    pattern.reserve(format.size() + 8);
    for (std::size_t i = 0; i < format.size(); ++i) {
        if (format[i] == '%' && i + 1 < format.size()) {
            if (format[i + 1] == 'f') {
                pattern += frac.str();
                ++i;
                continue;
            }
            pattern += format[i];
            pattern += format[i + 1];
            ++i;
            continue;
        }
        pattern += format[i];
    }

    std::tm tm = local(when);
    std::ostringstream out;
    out << std::put_time(&tm, pattern.c_str());
    return out.str();
}

std::string Clock::date(time_point when)
{
    return format("%Y-%m-%d", when);
}

std::optional<std::time_t> Clock::parse_date(std::string_view text)
{
    // Strictly DDDD-DD-DD.
    if (text.size() != 10 || text[4] != '-' || text[7] != '-') {
        return std::nullopt;
    }
    for (std::size_t i : {0, 1, 2, 3, 5, 6, 8, 9}) {
        if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
            return std::nullopt;
        }
    }

    auto number = [&](std::size_t pos, std::size_t len) {
        int v = 0;
        for (std::size_t i = pos; i < pos + len; ++i) {
            v = v * 10 + (text[i] - '0');
        }
        return v;
    };

    std::tm tm{};
    tm.tm_year = number(0, 4) - 1900;
    tm.tm_mon = number(5, 2) - 1;
    tm.tm_mday = number(8, 2);
    tm.tm_isdst = -1;

    const int want_year = tm.tm_year;
    const int want_mon = tm.tm_mon;
    const int want_day = tm.tm_mday;

    std::time_t t = std::mktime(&tm);
    if (t == static_cast<std::time_t>(-1)) {
        return std::nullopt;
    }
    // mktime normalizes out-of-range fields; a changed field means the date was impossible.
    if (tm.tm_year != want_year || tm.tm_mon != want_mon || tm.tm_mday != want_day) {
        return std::nullopt;
    }
    return t;
}

} // namespace slogger::infra

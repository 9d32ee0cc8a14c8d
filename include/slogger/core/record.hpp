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
 * @file record.hpp
 * @brief Pending log records and the per-call override set.
 */

#pragma once

#include "slogger/core/data.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace slogger::core {

/**
 * @struct Overrides
 * @brief Per-call values that replace what the logger would otherwise use.
 *
 * @details
 * `file`/`line` name the call site. Logging calls that omit the argument get
 * `caller()`; the `SLOGGER_HERE` macro fills them from `__FILE__`/`__LINE__`,
 * and an empty `Overrides{}` leaves the location column as `()`. A present
 * `data` replaces the positional payload argument, including when it holds
 * `Data::null()`.
 */
struct Overrides {
    std::optional<std::string> file;
    std::optional<long> line;
    std::optional<Data> data;

    /**
     * @brief Call site of the expression that evaluates it.
     *
     * Used as the default argument of the logging API, where GCC and Clang
     * resolve `__builtin_FILE()`/`__builtin_LINE()` to the caller's line.
     */
    static Overrides caller(const char* file = __builtin_FILE(), int line = __builtin_LINE())
    {
        return Overrides{std::string(file), static_cast<long>(line), std::nullopt};
    }

    /// @brief Returns a copy with `data` set.
    Overrides with_data(Data value) const
    {
        Overrides copy = *this;
        copy.data = std::move(value);
        return copy;
    }
};

/**
 * @struct Record
 * @brief One queued message, fully rendered and immutable once enqueued.
 */
struct Record {
    /// @brief Strictly increasing per logger; the flush sort key.
    std::uint64_t sequence = 0;

    /// @brief Queue index, 0..7.
    int rank = 0;

    std::string timestamp;
    std::string severity; ///< Upper-case label.
    std::string message;
    std::string location; ///< `"file(line)"`.
    std::string trace;    ///< Empty unless an exception was logged.
    std::string data;     ///< Empty for `Data::none()`.
};

} // namespace slogger::core

/// @brief Call-site overrides for the current source line.
#define SLOGGER_HERE \
    (::slogger::core::Overrides{std::string(__FILE__), static_cast<long>(__LINE__), std::nullopt})

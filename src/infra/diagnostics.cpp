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
 * @file diagnostics.cpp
 * @brief Implementation of the diagnostics console channel.
 */

#include "slogger/infra/diagnostics.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>

namespace slogger::infra {

std::mutex Diagnostics::mutex_;
DiagLevel Diagnostics::min_level_ = DiagLevel::INFO;

void Diagnostics::set_level(DiagLevel level)
{
    std::lock_guard<std::mutex> lock(mutex_);
    min_level_ = level;
}

DiagLevel Diagnostics::level()
{
    std::lock_guard<std::mutex> lock(mutex_);
    return min_level_;
}

/**
 * @brief Dispatches a formatted diagnostic line to the appropriate stream.
 *
 * The whole line is written under the lock so concurrent callers never
 * interleave partial output. The timestamp uses `localtime_r`, so the lock is
 * not protecting a shared `tm` buffer here, only the streams.
 */
void Diagnostics::log(DiagLevel level, const std::string& message)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (level < min_level_) {
        return;
    }

    auto now = std::chrono::system_clock::now();
    std::time_t time = std::chrono::system_clock::to_time_t(now);
    std::tm local{};
    localtime_r(&time, &local);

    auto& stream = (level >= DiagLevel::WARN) ? std::cerr : std::cout;

    stream << "[" << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << "] ";

    switch (level) {
    case DiagLevel::TRACE:
        stream << "\033[90m[slogger:TRCE] ";
        break;
    case DiagLevel::DEBUG:
        stream << "\033[36m[slogger:DBUG] ";
        break;
    case DiagLevel::INFO:
        stream << "\033[32m[slogger:INFO] ";
        break;
    case DiagLevel::WARN:
        stream << "\033[33m[slogger:WARN] ";
        break;
    case DiagLevel::ERROR:
        stream << "\033[31m[slogger:FAIL] ";
        break;
    case DiagLevel::FATAL:
        stream << "\033[1;31m[slogger:CRIT] ";
        break;
    }

    stream << message << "\033[0m" << std::endl;
}

} // namespace slogger::infra

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
 * @file data.cpp
 * @brief cJSON-backed serialization of record payloads.
 */

#include "slogger/core/data.hpp"

#include <cstdlib>
#include <new>

namespace slogger::core {

std::string Data::print_owned(cJSON* json)
{
    if (!json) {
        // cJSON_Create* only fails on allocation failure.
        throw std::bad_alloc();
    }
    char* raw = cJSON_PrintUnformatted(json);
    cJSON_Delete(json);
    if (!raw) {
        throw std::bad_alloc();
    }
    std::string out(raw);
    free(raw);
    return out;
}

Data::Data(std::nullptr_t) : text_("null") {}

Data::Data(const char* text)
    : text_(text ? print_owned(cJSON_CreateString(text)) : std::string("null"))
{
}

Data::Data(const std::string& text) : text_(print_owned(cJSON_CreateString(text.c_str()))) {}

Data::Data(bool value) : text_(value ? "true" : "false") {}

Data::Data(int value) : text_(std::to_string(value)) {}

Data::Data(long value) : text_(std::to_string(value)) {}

// Integers are written directly; cJSON stores numbers as double and would
// round anything past 2^53.
Data::Data(long long value) : text_(std::to_string(value)) {}

Data::Data(unsigned value) : text_(std::to_string(value)) {}

Data::Data(unsigned long value) : text_(std::to_string(value)) {}

Data::Data(unsigned long long value) : text_(std::to_string(value)) {}

Data::Data(double value) : text_(print_owned(cJSON_CreateNumber(value))) {}

Data::Data(const cJSON* json)
{
    if (!json) {
        text_ = "null";
        return;
    }
    char* raw = cJSON_PrintUnformatted(json);
    if (!raw) {
        throw std::bad_alloc();
    }
    text_ = std::string(raw);
    free(raw);
}

} // namespace slogger::core

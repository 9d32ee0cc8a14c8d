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
 * @file data.hpp
 * @brief Auxiliary payload attached to a log record.
 *
 * @details
 * A payload is serialized to compact JSON the moment it is created, so a record
 * captures the value as it was at the logging call. Three states must stay
 * distinguishable because `null` and `""` are legitimate payloads:
 *
 * - `Data::none()` : nothing supplied, the CSV data column stays empty.
 * - `Data::null()` : an explicit null, written as `null`.
 * - any value      : its JSON text, e.g. `"abc"`, `42`, `{"balance":200}`.
 */

#pragma once

#include <cJSON.h>
#include <cstddef>
#include <optional>
#include <string>

namespace slogger::core {

class Data {
  public:
    /// @brief The "no data supplied" sentinel.
    Data() = default;

    /// @brief Explicit null payload.
    Data(std::nullptr_t);

    Data(const char* text);
    Data(const std::string& text);
    Data(bool value);
    Data(int value);
    Data(long value);
    Data(long long value);
    Data(unsigned value);
    Data(unsigned long value);
    Data(unsigned long long value);
    Data(double value);

    /**
     * @brief Serializes an arbitrary cJSON tree.
     *
     * The tree is only read; ownership stays with the caller. A null pointer is
     * an explicit null payload, not the sentinel.
     */
    explicit Data(const cJSON* json);

    static Data none() { return Data(); }
    static Data null() { return Data(nullptr); }

    /// @brief True unless this is the sentinel.
    bool present() const { return text_.has_value(); }

    /// @brief JSON text, or empty for the sentinel.
    std::string str() const { return text_.value_or(""); }

    bool operator==(const Data& other) const { return text_ == other.text_; }
    bool operator!=(const Data& other) const { return !(*this == other); }

  private:
    /// @brief Takes ownership of @p json, prints it and frees it.
    static std::string print_owned(cJSON* json);

    std::optional<std::string> text_;
};

} // namespace slogger::core

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
 * @file core_test.cpp
 * @brief Unit tests for the value types of the core: severity scale, payloads,
 * CSV encoding and configuration overrides.
 */

#include "framework.hpp"
#include "slogger/core/config.hpp"
#include "slogger/core/csv.hpp"
#include "slogger/core/data.hpp"
#include "slogger/core/error.hpp"
#include "slogger/core/severity.hpp"
#include "support.hpp"

#include <cJSON.h>
#include <cstdint>
#include <string>
#include <vector>

using namespace slogger::core;

// ============================================================================
// Severity Scale
// ============================================================================

/**
 * @brief Prefix lookup is case-insensitive and resolves in table order.
 */
void test_severity_prefix_lookup()
{
    ASSERT_EQ(severity::ordinal("err"), 3);
    ASSERT_EQ(severity::ordinal("info"), 6);
    ASSERT_EQ(severity::ordinal("DEBUG"), 7);
    ASSERT_EQ(severity::ordinal("Crit"), 2);
    ASSERT_EQ(severity::ordinal("warning"), 4);

    // "e" matches emergency before error because emergency is scanned first.
    ASSERT_EQ(severity::ordinal("e"), 0);
    ASSERT_EQ(severity::ordinal("c"), 2);
}

void test_severity_unknown_name_fails()
{
    ASSERT_THROWS(severity::ordinal("bogus"), UnknownSeverity);
    ASSERT_THROWS(severity::ordinal("errors"), UnknownSeverity);
    ASSERT_THROWS(severity::ordinal("off"), UnknownSeverity);
}

/**
 * @brief An already-resolved ordinal passes through untouched.
 */
void test_severity_ordinal_passthrough()
{
    ASSERT_EQ(severity::ordinal(5), 5);
    ASSERT_EQ(severity::ordinal(-1), -1);
}

void test_severity_labels()
{
    ASSERT_EQ(severity::label(0), std::string("emergency"));
    ASSERT_EQ(severity::label(6), std::string("informational"));
    ASSERT_EQ(severity::upper_label(3), std::string("ERROR"));
    ASSERT_THROWS(severity::label(-1), UnknownSeverity);
    ASSERT_THROWS(severity::label(8), UnknownSeverity);
}

void test_severity_threshold_parsing()
{
    ASSERT_EQ(severity::rank(severity::threshold("off")), -1);
    ASSERT_EQ(severity::rank(severity::threshold("OFF")), -1);
    ASSERT_EQ(severity::rank(severity::threshold("-1")), -1);
    ASSERT_EQ(severity::rank(severity::threshold("7")), 7);
    ASSERT_EQ(severity::rank(severity::threshold("notice")), 5);
    ASSERT_THROWS(severity::threshold("8"), UnknownSeverity);
    ASSERT_THROWS(severity::threshold("loud"), UnknownSeverity);
}

// ============================================================================
// Data Payloads
// ============================================================================

/**
 * @brief The sentinel, an explicit null and an empty string are three different things.
 */
void test_data_sentinel_is_distinct_from_null()
{
    ASSERT_FALSE(Data::none().present());
    ASSERT_EQ(Data::none().str(), std::string(""));

    ASSERT_TRUE(Data::null().present());
    ASSERT_EQ(Data::null().str(), std::string("null"));

    ASSERT_TRUE(Data(std::string()).present());
    ASSERT_EQ(Data(std::string()).str(), std::string("\"\""));

    ASSERT_TRUE(Data::none() != Data::null());
}

void test_data_scalars()
{
    ASSERT_EQ(Data(42).str(), std::string("42"));
    ASSERT_EQ(Data(true).str(), std::string("true"));
    ASSERT_EQ(Data("say \"hi\"").str(), std::string("\"say \\\"hi\\\"\""));
    ASSERT_EQ(Data(9007199254740993LL).str(), std::string("9007199254740993"));
    ASSERT_EQ(Data(static_cast<const cJSON*>(nullptr)).str(), std::string("null"));
}

/**
 * @brief Sizes and counts are accepted as payloads without casts.
 */
void test_data_unsigned_scalars()
{
    std::vector<int> items(3);
    ASSERT_EQ(Data(items.size()).str(), std::string("3"));

    std::uint64_t bytes = 18446744073709551615ULL;
    ASSERT_EQ(Data(bytes).str(), std::string("18446744073709551615"));

    unsigned retries = 2;
    ASSERT_EQ(Data(retries).str(), std::string("2"));
}

/**
 * @brief cJSON trees are serialized compactly and left owned by the caller.
 */
void test_data_json_tree()
{
    cJSON* root = cJSON_CreateObject();
    cJSON_AddNumberToObject(root, "balance", 200);
    cJSON* tags = cJSON_AddArrayToObject(root, "tags");
    cJSON_AddItemToArray(tags, cJSON_CreateString("vip"));

    Data data(root);
    ASSERT_EQ(data.str(), std::string("{\"balance\":200,\"tags\":[\"vip\"]}"));

    // Still valid: Data did not take ownership.
    ASSERT_NE(cJSON_GetObjectItem(root, "balance"), static_cast<cJSON*>(nullptr));
    cJSON_Delete(root);
}

// ============================================================================
// CSV Encoding
// ============================================================================

void test_csv_quotes_only_when_needed()
{
    ASSERT_EQ(Csv::field("plain"), std::string("plain"));
    ASSERT_EQ(Csv::field(""), std::string(""));
    ASSERT_EQ(Csv::field("a,b"), std::string("\"a,b\""));
    ASSERT_EQ(Csv::field("two words"), std::string("\"two words\""));
    ASSERT_EQ(Csv::field("say \"hi\""), std::string("\"say \"\"hi\"\"\""));
    ASSERT_EQ(Csv::field("line1\nline2"), std::string("\"line1\nline2\""));
}

/**
 * @brief A record is written in the fixed column order and parses back to six fields.
 */
void test_csv_record_row_layout()
{
    Record record;
    record.timestamp = "2026-07-15 10:00:00.000001";
    record.severity = "WARNING";
    record.message = "disk, almost full";
    record.location = "main.cpp(42)";
    record.trace = "";
    record.data = "{\"free\":3}";

    std::string row = Csv::row(record);
    ASSERT_EQ(row.back(), '\n');

    auto rows = slogger::test::parse_csv(row);
    ASSERT_EQ(rows.size(), static_cast<size_t>(1));
    ASSERT_EQ(rows[0].size(), static_cast<size_t>(6));
    ASSERT_EQ(rows[0][0], record.timestamp);
    ASSERT_EQ(rows[0][1], std::string("WARNING"));
    ASSERT_EQ(rows[0][2], std::string("disk, almost full"));
    ASSERT_EQ(rows[0][3], std::string("main.cpp(42)"));
    ASSERT_EQ(rows[0][4], std::string(""));
    ASSERT_EQ(rows[0][5], std::string("{\"free\":3}"));
}

// ============================================================================
// Configuration
// ============================================================================

void test_config_defaults()
{
    Config config;
    ASSERT_EQ(severity::rank(config.severity_threshold), 6);
    ASSERT_EQ(severity::rank(config.smart_severity_threshold), 5);
    ASSERT_EQ(config.max_file_size, static_cast<std::uint64_t>(100000000));
    ASSERT_EQ(config.max_days, 7);
    ASSERT_EQ(config.default_permission, static_cast<mode_t>(0777));
    ASSERT_FALSE(config.off());
}

void test_config_apply_overrides()
{
    Config config;
    config.apply("severityThreshold", "error");
    config.apply("smartSeverityThreshold", "crit");
    config.apply("maxFileSize", "2048");
    config.apply("_maxDays", "3");
    config.apply("defaultPermission", "0750");
    config.apply("dateFormat", "%H-%M-%S.%f");

    ASSERT_EQ(severity::rank(config.severity_threshold), 3);
    ASSERT_EQ(severity::rank(config.smart_severity_threshold), 2);
    ASSERT_EQ(config.max_file_size, static_cast<std::uint64_t>(2048));
    ASSERT_EQ(config.max_days, 3);
    ASSERT_EQ(config.default_permission, static_cast<mode_t>(0750));
    ASSERT_EQ(config.date_format, std::string("%H-%M-%S.%f"));

    config.apply("severityThreshold", "off");
    ASSERT_TRUE(config.off());
}

void test_config_rejects_unknown_key_and_bad_values()
{
    Config config;
    ASSERT_THROWS(config.apply("colour", "blue"), ConfigError);
    ASSERT_THROWS(config.apply("maxFileSize", "-5"), ConfigError);
    ASSERT_THROWS(config.apply("maxFileSize", "10MB"), ConfigError);
    ASSERT_THROWS(config.apply("defaultPermission", "0789"), ConfigError);
    ASSERT_THROWS(config.apply("severityThreshold", "bogus"), ConfigError);
}

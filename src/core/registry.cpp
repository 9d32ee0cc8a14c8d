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
 * @file registry.cpp
 * @brief Bulk configuration and lookup of named loggers.
 *
 * @details
 * JSON configuration is decoded with cJSON into `LoggerSpec` entries and then
 * goes through the same all-or-nothing path as programmatic configuration.
 */

#include "slogger/core/registry.hpp"

#include "slogger/core/error.hpp"
#include "slogger/infra/diagnostics.hpp"
#include "slogger/infra/string.hpp"

#include <cJSON.h>
#include <cmath>
#include <cstdio>
#include <fstream>
#include <sstream>

namespace slogger::core {

using infra::DiagLevel;
using infra::Diagnostics;

namespace {

/**
 * @brief Converts a JSON override value to the text `Config::apply` expects.
 *
 * Numbers must be integral. A numeric `defaultPermission` is a mode value
 * (511 == 0777), so it is rendered in octal.
 */
std::string override_text(const std::string& key, const cJSON* value)
{
    if (cJSON_IsString(value) && value->valuestring) {
        return value->valuestring;
    }
    if (cJSON_IsNumber(value)) {
        double n = value->valuedouble;
        if (std::floor(n) != n || std::fabs(n) > 9.0e15) {
            throw ConfigError("Override '" + key + "' must be an integer");
        }
        auto integral = static_cast<long long>(n);
        if (infra::String::ltrim_any(key, "_") == "defaultPermission") {
            if (integral < 0) {
                throw ConfigError("Override '" + key + "' must not be negative");
            }
            char buf[32];
            std::snprintf(buf, sizeof(buf), "0%llo", integral);
            return buf;
        }
        return std::to_string(integral);
    }
    throw ConfigError("Override '" + key + "' must be a string or a number");
}

} // namespace

void Registry::configure(const std::map<std::string, LoggerSpec>& specs)
{
    // Build everything first; nothing is registered unless every entry succeeds.
    std::map<std::string, std::unique_ptr<Logger>> staged;
    for (const auto& [name, spec] : specs) {
        Config config;
        for (const auto& [key, value] : spec.overrides) {
            config.apply(key, value);
        }
        staged[name] = std::make_unique<Logger>(spec.directory, std::move(config));
    }

    for (auto& [name, logger] : staged) {
        loggers_[name] = std::move(logger);
        Diagnostics::log(DiagLevel::DEBUG, "Registry: logger '" + name + "' on " +
                                               loggers_[name]->directory());
    }
}

void Registry::configure_json(const std::string& json)
{
    cJSON* root = cJSON_Parse(json.c_str());
    if (!root) {
        const char* where = cJSON_GetErrorPtr();
        throw ConfigError(std::string("Invalid JSON configuration") +
                          (where ? std::string(" near: ") + std::string(where).substr(0, 32)
                                 : std::string()));
    }

    std::map<std::string, LoggerSpec> specs;
    try {
        if (!cJSON_IsObject(root)) {
            throw ConfigError("Configuration must be an object of logger names");
        }

        const cJSON* entry = nullptr;
        cJSON_ArrayForEach(entry, root)
        {
            const std::string name = entry->string ? entry->string : "";
            if (!cJSON_IsArray(entry) || cJSON_GetArraySize(entry) < 1) {
                throw ConfigError("Logger '" + name + "' must be an array starting with a directory");
            }

            const cJSON* dir = cJSON_GetArrayItem(entry, 0);
            if (!cJSON_IsString(dir) || !dir->valuestring) {
                throw ConfigError("Logger '" + name + "': first element must be a directory string");
            }

            LoggerSpec spec;
            spec.directory = dir->valuestring;

            for (int i = 1; i < cJSON_GetArraySize(entry); ++i) {
                const cJSON* group = cJSON_GetArrayItem(entry, i);
                if (!cJSON_IsObject(group)) {
                    throw ConfigError("Logger '" + name + "': overrides must be objects");
                }
                const cJSON* item = nullptr;
                cJSON_ArrayForEach(item, group)
                {
                    const std::string key = item->string ? item->string : "";
                    spec.overrides.emplace_back(key, override_text(key, item));
                }
            }
            specs[name] = std::move(spec);
        }
    } catch (...) {
        cJSON_Delete(root);
        throw;
    }
    cJSON_Delete(root);

    configure(specs);
}

void Registry::configure_file(const std::string& path)
{
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw ConfigError("Cannot read configuration file: " + path);
    }
    std::ostringstream contents;
    contents << file.rdbuf();
    configure_json(contents.str());
}

Logger* Registry::get(const std::string& name) const
{
    auto it = loggers_.find(name);
    return it == loggers_.end() ? nullptr : it->second.get();
}

std::vector<std::string> Registry::names() const
{
    std::vector<std::string> out;
    out.reserve(loggers_.size());
    for (const auto& entry : loggers_) {
        out.push_back(entry.first);
    }
    return out;
}

std::size_t Registry::flush_all()
{
    std::size_t failed = 0;
    for (auto& [name, logger] : loggers_) {
        try {
            logger->flush();
        } catch (const Error& e) {
            failed++;
            Diagnostics::log(DiagLevel::ERROR,
                             "Registry: flush of '" + name + "' failed: " + e.what());
        }
    }
    return failed;
}

} // namespace slogger::core

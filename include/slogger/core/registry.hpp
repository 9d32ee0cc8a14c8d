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
 * @file registry.hpp
 * @brief Named collection of loggers, configured in bulk.
 *
 * @details
 * A `Registry` is an ordinary object owned by the application (typically a local
 * in `main`) and passed by reference to code that needs to look loggers up by
 * name. There is no hidden global instance.
 */

#pragma once

#include "slogger/core/logger.hpp"

#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace slogger::core {

/**
 * @struct LoggerSpec
 * @brief Bulk-configuration entry: a directory and textual overrides.
 */
struct LoggerSpec {
    std::string directory;
    std::vector<std::pair<std::string, std::string>> overrides;
};

class Registry {
  public:
    Registry() = default;
    ~Registry() = default;

    Registry(const Registry&) = delete;
    Registry& operator=(const Registry&) = delete;

    /**
     * @brief Creates one logger per entry, all-or-nothing.
     *
     * Every logger is constructed before any is registered. If one entry fails
     * (bad override, unusable directory), the loggers already built for this
     * batch are discarded, the registry is left as it was, and the error
     * propagates. A name that is already registered is replaced; the previous
     * logger is flushed and closed.
     *
     * @throws ConfigError for unknown keys or bad values.
     * @throws ConstructionError if a logger cannot be opened.
     *
     * @code
     * registry.configure({
     *     {"default", {"./log", {}}},
     *     {"paypal",  {"./log/paypal", {{"severityThreshold", "error"},
     *                                   {"smartSeverityThreshold", "critical"}}}},
     * });
     * @endcode
     */
    void configure(const std::map<std::string, LoggerSpec>& specs);

    /**
     * @brief Bulk configuration from a JSON document.
     *
     * Shape: an object mapping logger names to arrays. The first element is the
     * directory; any further elements are objects of overrides whose values may be
     * strings or numbers.
     *
     * @code
     * { "default": ["./log"],
     *   "paypal":  ["./log/paypal", {"severityThreshold": "error", "maxDays": 3}] }
     * @endcode
     *
     * @throws ConfigError if the document is malformed or has the wrong shape.
     */
    void configure_json(const std::string& json);

    /// @brief Reads @p path and passes its contents to `configure_json`.
    /// @throws ConfigError if the file cannot be read.
    void configure_file(const std::string& path);

    /**
     * @brief Looks a logger up by name.
     * @return Logger* The logger, or `nullptr` if no such name is registered.
     */
    Logger* get(const std::string& name = "default") const;

    /// @brief Registered names in lexical order.
    std::vector<std::string> names() const;

    std::size_t size() const { return loggers_.size(); }

    /**
     * @brief Flushes every logger; failures are reported, not thrown.
     * @return std::size_t Number of loggers whose flush failed.
     */
    std::size_t flush_all();

  private:
    std::map<std::string, std::unique_ptr<Logger>> loggers_;
};

} // namespace slogger::core

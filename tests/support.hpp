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
 * @file support.hpp
 * @brief Shared fixtures: scratch directories and a CSV reader for log files.
 */

#pragma once

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

namespace slogger::test {

namespace fs = std::filesystem;

/**
 * @class ScratchDir
 * @brief RAII scratch directory: purged on construction and on destruction.
 */
class ScratchDir {
  public:
    explicit ScratchDir(std::string path) : path_(std::move(path)) { reset(); }

    ~ScratchDir()
    {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    ScratchDir(const ScratchDir&) = delete;
    ScratchDir& operator=(const ScratchDir&) = delete;

    void reset()
    {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    const std::string& path() const { return path_; }

    /// @brief Path of an entry inside the directory.
    std::string operator/(const std::string& name) const { return path_ + "/" + name; }

  private:
    std::string path_;
};

using Row = std::vector<std::string>;

/**
 * @brief Parses CSV text: `"` enclosure, doubled quotes, fields may span lines.
 */
inline std::vector<Row> parse_csv(const std::string& text)
{
    std::vector<Row> rows;
    Row row;
    std::string field;
    bool quoted = false;
    bool row_started = false;

    for (std::size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        row_started = true;
        if (quoted) {
            if (c == '"') {
                if (i + 1 < text.size() && text[i + 1] == '"') {
                    field += '"';
                    ++i;
                } else {
                    quoted = false;
                }
            } else {
                field += c;
            }
        } else if (c == '"') {
            quoted = true;
        } else if (c == ',') {
            row.push_back(field);
            field.clear();
        } else if (c == '\n') {
            row.push_back(field);
            field.clear();
            rows.push_back(row);
            row.clear();
            row_started = false;
        } else {
            field += c;
        }
    }
    if (row_started) {
        row.push_back(field);
        rows.push_back(row);
    }
    return rows;
}

inline std::string read_file(const std::string& path)
{
    std::ifstream file(path, std::ios::binary);
    std::ostringstream out;
    out << file.rdbuf();
    return out.str();
}

inline std::vector<Row> read_csv(const std::string& path)
{
    return parse_csv(read_file(path));
}

/// @brief Sorted names of `log_*.csv` files in @p dir.
inline std::vector<std::string> log_files(const std::string& dir)
{
    std::vector<std::string> names;
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(dir, ec)) {
        const std::string name = entry.path().filename().string();
        if (name.rfind("log_", 0) == 0 && entry.path().extension() == ".csv") {
            names.push_back(name);
        }
    }
    std::sort(names.begin(), names.end());
    return names;
}

/// @brief Creates (or truncates) a file holding @p contents.
inline void touch(const std::string& path, const std::string& contents = "")
{
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    file << contents;
}

} // namespace slogger::test

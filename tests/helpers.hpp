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
 * @file helpers.hpp
 * @brief Shared fixtures: scratch directories, stderr capture, file inspection.
 */

#pragma once

#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace prettylog::test {

/**
 * @class ScratchDir
 * @brief RAII infrastructure for an isolated, volatile test directory.
 *
 * @details
 * Implements a strict "Clean Room" policy for filesystem tests:
 * - **Setup**: Purges and recreates the directory.
 * - **Teardown**: Removes it again when the fixture goes out of scope.
 */
class ScratchDir {
  public:
    explicit ScratchDir(std::string name) : path_("./" + std::move(name))
    {
        std::filesystem::remove_all(path_);
        std::filesystem::create_directories(path_);
    }

    ~ScratchDir()
    {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    ScratchDir(const ScratchDir&) = delete;
    ScratchDir& operator=(const ScratchDir&) = delete;

    /// @brief Path of `file` inside the scratch directory.
    std::string file(const std::string& file) const
    {
        return path_ + "/" + file;
    }

    const std::string& path() const
    {
        return path_;
    }

  private:
    std::string path_;
};

/**
 * @class StderrCapture
 * @brief Redirects `std::cerr` into a string buffer for the fixture's lifetime.
 */
class StderrCapture {
  public:
    StderrCapture() : previous_(std::cerr.rdbuf(captured_.rdbuf())) {}

    ~StderrCapture()
    {
        std::cerr.rdbuf(previous_);
    }

    StderrCapture(const StderrCapture&) = delete;
    StderrCapture& operator=(const StderrCapture&) = delete;

    std::string str() const
    {
        return captured_.str();
    }

  private:
    std::ostringstream captured_;
    std::streambuf* previous_;
};

/// @brief Reads `path` as newline-terminated lines. Missing files yield no lines.
inline std::vector<std::string> read_lines(const std::string& path)
{
    std::vector<std::string> lines;
    std::ifstream file(path);
    std::string line;
    while (std::getline(file, line)) {
        lines.push_back(line);
    }
    return lines;
}

/// @brief Splits captured console text into lines.
inline std::vector<std::string> split_lines(const std::string& text)
{
    std::vector<std::string> lines;
    std::istringstream stream(text);
    std::string line;
    while (std::getline(stream, line)) {
        lines.push_back(line);
    }
    return lines;
}

} // namespace prettylog::test

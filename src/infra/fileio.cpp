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
 * @file fileio.cpp
 * @brief Implementation of the text file helpers.
 */

#include "prettylog/infra/fileio.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace prettylog::infra {

bool FileIo::is_writable(const std::string& path)
{
    if (path.empty()) {
        return false;
    }

    // A directory can be opened by some libstdc++ builds; reject it explicitly.
    std::error_code ec;
    if (fs::is_directory(path, ec)) {
        return false;
    }

    std::ofstream file(path, std::ios::app);
    return file.is_open();
}

bool FileIo::append(const std::string& path, const std::string& content)
{
    std::ofstream file(path, std::ios::binary | std::ios::app);

    if (!file.is_open()) {
        return false;
    }

    file.write(content.data(), static_cast<std::streamsize>(content.size()));
    file.flush();

    // Check stream state to ensure physical write success
    return file.good();
}

bool FileIo::overwrite(const std::string& path, const std::string& content)
{
    std::ofstream file(path, std::ios::binary | std::ios::trunc);

    if (!file.is_open()) {
        return false;
    }

    file.write(content.data(), static_cast<std::streamsize>(content.size()));
    file.flush();
    return file.good();
}

std::optional<std::string> FileIo::read(const std::string& path)
{
    std::ifstream file(path, std::ios::binary);

    if (!file.is_open()) {
        return std::nullopt;
    }

    std::ostringstream contents;
    contents << file.rdbuf();
    return contents.str();
}

} // namespace prettylog::infra

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
 * @file fileio.hpp
 * @brief Thin filesystem helpers used by the file output and template codec.
 *
 * @details
 * Log files are plain append-only text. These helpers keep the `std::fstream`
 * plumbing in one place and report success as a boolean; callers translate
 * failures into the appropriate prettylog exception.
 */

#pragma once

#include <optional>
#include <string>

namespace prettylog::infra {

/**
 * @class FileIo
 * @brief Static helpers for text file access.
 */
class FileIo {
  public:
    /**
     * @brief Checks that `path` can be opened for appending.
     *
     * Creates the file when it does not exist yet. Existing content is never
     * truncated.
     *
     * @param path Filesystem path of the log file.
     * @return true If the file exists (or was created) and is writable.
     */
    static bool is_writable(const std::string& path);

    /**
     * @brief Appends `content` verbatim to the end of `path`.
     *
     * @return true If the open and write both succeeded.
     * @return false On any filesystem error (missing directory, permissions, disk full).
     */
    static bool append(const std::string& path, const std::string& content);

    /**
     * @brief Replaces the contents of `path` with `content`.
     * @return true If the file was written completely.
     */
    static bool overwrite(const std::string& path, const std::string& content);

    /**
     * @brief Reads the whole file.
     * @return The file contents, or `std::nullopt` if it cannot be opened.
     */
    static std::optional<std::string> read(const std::string& path);
};

} // namespace prettylog::infra

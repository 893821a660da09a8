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
 * @file logger_template.hpp
 * @brief Serializable Logger configuration and its JSON codec.
 *
 * @details
 * A template captures every persistent setting of a Logger: the formatter
 * configuration, the per-stream output switches and file settings, the
 * verbosity and the filtering flag. Runtime state (buffered lines, stored
 * events, the advisory lock) is never part of a template.
 *
 * The JSON document layout is a compatibility surface:
 *
 * @code
 * {
 *   "formatter": {
 *     "log_header_color_enabled": true,
 *     "debug_color": "Blue", "info_color": "Green", "warning_color": "Yellow",
 *     "error_color": "Red", "fatal_color": "Magenta",
 *     "debug_header": "DBG", "info_header": "INF", "warning_header": "WAR",
 *     "error_header": "ERR", "fatal_header": "FATAL",
 *     "log_format": "[%h] %m",
 *     "datetime_format": "%Y-%m-%d %H:%M:%S"
 *   },
 *   "output": {
 *     "enabled": true,
 *     "stderr_output": { "enabled": true },
 *     "buffer_output": { "enabled": false },
 *     "file_output": {
 *       "enabled": false,
 *       "log_file_path": null,
 *       "max_buffer_size": 128,
 *       "on_drop_policy": "DiscardLogBuffer"
 *     }
 *   },
 *   "verbosity": "Standard",
 *   "filtering_enabled": true
 * }
 * @endcode
 */

#pragma once

#include "prettylog/core/severity.hpp"
#include "prettylog/format/formatter.hpp"
#include "prettylog/output/file_stream.hpp"

#include <cstddef>
#include <optional>
#include <string>

namespace prettylog::config {

/**
 * @struct OutputTemplate
 * @brief Persistent settings of an OutputRouter and its built-in streams.
 */
struct OutputTemplate {
    bool enabled = true;
    bool stderr_enabled = true;
    bool buffer_enabled = false;
    bool file_enabled = false;
    std::optional<std::string> log_file_path;
    std::optional<size_t> max_buffer_size = output::kDefaultMaxBufferSize;
    core::OnDropPolicy on_drop_policy = core::OnDropPolicy::DiscardLogBuffer;

    bool operator==(const OutputTemplate& other) const;
    bool operator!=(const OutputTemplate& other) const;
};

/**
 * @struct LoggerTemplate
 * @brief Persistent settings of a whole Logger. Defaults match `Logger()`.
 */
struct LoggerTemplate {
    format::FormatterConfig formatter;
    OutputTemplate output;
    core::Verbosity verbosity = core::Verbosity::Standard;
    bool filtering_enabled = true;

    bool operator==(const LoggerTemplate& other) const;
    bool operator!=(const LoggerTemplate& other) const;
};

/**
 * @brief Serializes a template to an indented JSON document.
 * @throws core::ConfigError If `max_buffer_size` exceeds 2^53, the largest
 * integer a JSON number holds exactly.
 */
std::string to_json(const LoggerTemplate& tmpl);

/**
 * @brief Parses and validates a JSON template document.
 *
 * Every field is required. The log format is re-validated exactly as
 * `FormatterConfig::set_log_format` would.
 *
 * @throws core::ConfigError On malformed JSON, a missing or mistyped field, an
 * unknown color/verbosity/policy name, a negative or fractional buffer size,
 * or a log format without `%m`.
 */
LoggerTemplate from_json(const std::string& json);

/**
 * @brief Writes `to_json(tmpl)` to `path`, replacing any existing file.
 * @throws core::IoError If the file cannot be written.
 */
void save_file(const LoggerTemplate& tmpl, const std::string& path);

/**
 * @brief Reads and parses a template file.
 * @throws core::IoError If the file cannot be read.
 * @throws core::ConfigError If its content is not a valid template.
 */
LoggerTemplate load_file(const std::string& path);

} // namespace prettylog::config

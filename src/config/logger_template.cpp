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
 * @file logger_template.cpp
 * @brief cJSON based (de)serialization of Logger templates.
 *
 * @details
 * Decoding is strict: the document must contain every field with the expected
 * JSON type. All cJSON trees are owned by `JsonPtr` so that a `ConfigError`
 * thrown half-way through decoding never leaks the parsed document.
 */

#include "prettylog/config/logger_template.hpp"

#include "prettylog/core/error.hpp"
#include "prettylog/format/colors.hpp"
#include "prettylog/infra/fileio.hpp"

#include <cJSON.h>
#include <cmath>
#include <memory>
#include <string>

namespace prettylog::config {

namespace {

struct JsonDeleter {
    void operator()(cJSON* item) const
    {
        cJSON_Delete(item);
    }
};

using JsonPtr = std::unique_ptr<cJSON, JsonDeleter>;

/// JSON key prefixes, indexed by severity rank: "debug" -> "debug_color", "debug_header".
constexpr const char* kSeverityKeys[core::kSeverityCount] = {"debug", "info", "warning", "error",
                                                             "fatal"};

/// Largest size a JSON number (an IEEE double) carries exactly: 2^53.
constexpr size_t kMaxJsonSize = size_t{1} << 53;

// ============================================================================
// Decoding helpers
// ============================================================================

const cJSON* require(const cJSON* object, const char* key, const std::string& scope)
{
    const cJSON* item = cJSON_GetObjectItemCaseSensitive(object, key);
    if (!item) {
        throw core::ConfigError("Template: missing field '" + scope + key + "'");
    }
    return item;
}

const cJSON* require_object(const cJSON* object, const char* key, const std::string& scope)
{
    const cJSON* item = require(object, key, scope);
    if (!cJSON_IsObject(item)) {
        throw core::ConfigError("Template: field '" + scope + key + "' must be an object");
    }
    return item;
}

bool require_bool(const cJSON* object, const char* key, const std::string& scope)
{
    const cJSON* item = require(object, key, scope);
    if (!cJSON_IsBool(item)) {
        throw core::ConfigError("Template: field '" + scope + key + "' must be a boolean");
    }
    return cJSON_IsTrue(item);
}

std::string require_string(const cJSON* object, const char* key, const std::string& scope)
{
    const cJSON* item = require(object, key, scope);
    if (!cJSON_IsString(item) || item->valuestring == nullptr) {
        throw core::ConfigError("Template: field '" + scope + key + "' must be a string");
    }
    return item->valuestring;
}

std::optional<std::string> require_optional_string(const cJSON* object, const char* key,
                                                   const std::string& scope)
{
    const cJSON* item = require(object, key, scope);
    if (cJSON_IsNull(item)) {
        return std::nullopt;
    }
    return require_string(object, key, scope);
}

std::optional<size_t> require_optional_size(const cJSON* object, const char* key,
                                            const std::string& scope)
{
    const cJSON* item = require(object, key, scope);
    if (cJSON_IsNull(item)) {
        return std::nullopt;
    }
    if (!cJSON_IsNumber(item)) {
        throw core::ConfigError("Template: field '" + scope + key + "' must be a number or null");
    }

    double value = item->valuedouble;
    if (!(value >= 0) || std::floor(value) != value) {
        throw core::ConfigError("Template: field '" + scope + key +
                                "' must be a non-negative integer");
    }
    // Checked before the cast: converting an out-of-range double is undefined.
    if (value > static_cast<double>(kMaxJsonSize)) {
        throw core::ConfigError("Template: field '" + scope + key + "' exceeds " +
                                std::to_string(kMaxJsonSize));
    }
    return static_cast<size_t>(value);
}

format::FormatterConfig decode_formatter(const cJSON* node)
{
    const std::string scope = "formatter.";
    format::FormatterConfig config;

    config.set_header_color_enabled(require_bool(node, "log_header_color_enabled", scope));

    for (int i = 0; i < core::kSeverityCount; ++i) {
        auto severity = static_cast<core::Severity>(i);
        std::string prefix = kSeverityKeys[i];

        std::string color_key = prefix + "_color";
        config.set_color(severity,
                         format::color_from_string(require_string(node, color_key.c_str(), scope)));

        std::string header_key = prefix + "_header";
        config.set_header(severity, require_string(node, header_key.c_str(), scope));
    }

    // FormatError is a ConfigError, so an invalid template surfaces as ConfigError.
    config.set_log_format(require_string(node, "log_format", scope));
    config.set_datetime_format(require_string(node, "datetime_format", scope));
    return config;
}

OutputTemplate decode_output(const cJSON* node)
{
    OutputTemplate out;
    out.enabled = require_bool(node, "enabled", "output.");

    const cJSON* err = require_object(node, "stderr_output", "output.");
    out.stderr_enabled = require_bool(err, "enabled", "output.stderr_output.");

    const cJSON* buf = require_object(node, "buffer_output", "output.");
    out.buffer_enabled = require_bool(buf, "enabled", "output.buffer_output.");

    const std::string file_scope = "output.file_output.";
    const cJSON* file = require_object(node, "file_output", "output.");
    out.file_enabled = require_bool(file, "enabled", file_scope);
    out.log_file_path = require_optional_string(file, "log_file_path", file_scope);
    out.max_buffer_size = require_optional_size(file, "max_buffer_size", file_scope);
    out.on_drop_policy =
        core::on_drop_policy_from_string(require_string(file, "on_drop_policy", file_scope));
    return out;
}

// ============================================================================
// Encoding helpers
// ============================================================================

cJSON* encode_formatter(const format::FormatterConfig& config)
{
    cJSON* node = cJSON_CreateObject();
    cJSON_AddBoolToObject(node, "log_header_color_enabled", config.header_color_enabled());

    for (int i = 0; i < core::kSeverityCount; ++i) {
        auto severity = static_cast<core::Severity>(i);
        std::string prefix = kSeverityKeys[i];
        cJSON_AddStringToObject(node, (prefix + "_color").c_str(),
                                format::to_string(config.color(severity)).c_str());
    }
    for (int i = 0; i < core::kSeverityCount; ++i) {
        auto severity = static_cast<core::Severity>(i);
        std::string prefix = kSeverityKeys[i];
        cJSON_AddStringToObject(node, (prefix + "_header").c_str(),
                                config.header(severity).c_str());
    }

    cJSON_AddStringToObject(node, "log_format", config.log_format().c_str());
    cJSON_AddStringToObject(node, "datetime_format", config.datetime_format().c_str());
    return node;
}

cJSON* encode_output(const OutputTemplate& out)
{
    // Larger sizes would not survive the trip through a JSON number.
    if (out.max_buffer_size && *out.max_buffer_size > kMaxJsonSize) {
        throw core::ConfigError("Template: max_buffer_size " +
                                std::to_string(*out.max_buffer_size) + " exceeds " +
                                std::to_string(kMaxJsonSize));
    }

    cJSON* node = cJSON_CreateObject();
    cJSON_AddBoolToObject(node, "enabled", out.enabled);

    cJSON* err = cJSON_CreateObject();
    cJSON_AddBoolToObject(err, "enabled", out.stderr_enabled);
    cJSON_AddItemToObject(node, "stderr_output", err);

    cJSON* buf = cJSON_CreateObject();
    cJSON_AddBoolToObject(buf, "enabled", out.buffer_enabled);
    cJSON_AddItemToObject(node, "buffer_output", buf);

    cJSON* file = cJSON_CreateObject();
    cJSON_AddBoolToObject(file, "enabled", out.file_enabled);
    if (out.log_file_path) {
        cJSON_AddStringToObject(file, "log_file_path", out.log_file_path->c_str());
    } else {
        cJSON_AddNullToObject(file, "log_file_path");
    }
    if (out.max_buffer_size) {
        cJSON_AddNumberToObject(file, "max_buffer_size", static_cast<double>(*out.max_buffer_size));
    } else {
        cJSON_AddNullToObject(file, "max_buffer_size");
    }
    cJSON_AddStringToObject(file, "on_drop_policy", core::to_string(out.on_drop_policy).c_str());
    cJSON_AddItemToObject(node, "file_output", file);
    return node;
}

} // namespace

bool OutputTemplate::operator==(const OutputTemplate& other) const
{
    return enabled == other.enabled && stderr_enabled == other.stderr_enabled &&
           buffer_enabled == other.buffer_enabled && file_enabled == other.file_enabled &&
           log_file_path == other.log_file_path && max_buffer_size == other.max_buffer_size &&
           on_drop_policy == other.on_drop_policy;
}

bool OutputTemplate::operator!=(const OutputTemplate& other) const
{
    return !(*this == other);
}

bool LoggerTemplate::operator==(const LoggerTemplate& other) const
{
    return formatter == other.formatter && output == other.output &&
           verbosity == other.verbosity && filtering_enabled == other.filtering_enabled;
}

bool LoggerTemplate::operator!=(const LoggerTemplate& other) const
{
    return !(*this == other);
}

std::string to_json(const LoggerTemplate& tmpl)
{
    JsonPtr root(cJSON_CreateObject());
    cJSON_AddItemToObject(root.get(), "formatter", encode_formatter(tmpl.formatter));
    cJSON_AddItemToObject(root.get(), "output", encode_output(tmpl.output));
    cJSON_AddStringToObject(root.get(), "verbosity", core::to_string(tmpl.verbosity).c_str());
    cJSON_AddBoolToObject(root.get(), "filtering_enabled", tmpl.filtering_enabled);

    char* printed = cJSON_Print(root.get());
    if (!printed) {
        throw core::ConfigError("Template: failed to serialize JSON document");
    }
    std::string json(printed);
    cJSON_free(printed);
    return json;
}

LoggerTemplate from_json(const std::string& json)
{
    JsonPtr root(cJSON_Parse(json.c_str()));
    if (!root) {
        throw core::ConfigError("Template: invalid JSON syntax");
    }
    if (!cJSON_IsObject(root.get())) {
        throw core::ConfigError("Template: document root must be an object");
    }

    LoggerTemplate tmpl;
    tmpl.formatter = decode_formatter(require_object(root.get(), "formatter", ""));
    tmpl.output = decode_output(require_object(root.get(), "output", ""));
    tmpl.verbosity = core::verbosity_from_string(require_string(root.get(), "verbosity", ""));
    tmpl.filtering_enabled = require_bool(root.get(), "filtering_enabled", "");
    return tmpl;
}

void save_file(const LoggerTemplate& tmpl, const std::string& path)
{
    if (!infra::FileIo::overwrite(path, to_json(tmpl))) {
        throw core::IoError("Template: failed to write '" + path + "'");
    }
}

LoggerTemplate load_file(const std::string& path)
{
    std::optional<std::string> contents = infra::FileIo::read(path);
    if (!contents) {
        throw core::IoError("Template: failed to read '" + path + "'");
    }
    return from_json(*contents);
}

} // namespace prettylog::config

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
 * @file formatter.cpp
 * @brief Placeholder substitution and datetime rendering.
 *
 * @details
 * Rendering is a single left-to-right scan of the log line template. The
 * datetime text is produced lazily, the first time a `%d` is met, so
 * templates without a timestamp never pay for `strftime`.
 */

#include "prettylog/format/formatter.hpp"

#include "prettylog/core/error.hpp"

#include <ctime>
#include <cstring>
#include <optional>
#include <vector>

namespace prettylog::format {

namespace {

// Conversion characters defined for std::strftime by C99/C++11.
constexpr const char* kStrftimeConversions = "aAbBcCdDeFgGhHIjmMnprRStTuUVwWxXyYzZ%";

size_t index_of(core::Severity severity)
{
    return static_cast<size_t>(severity);
}

/**
 * @brief Runs strftime with a buffer that grows until the result fits.
 *
 * A trailing space is appended to the template so that a legitimately empty
 * expansion can be told apart from a buffer that was too small.
 */
std::string strftime_string(const std::string& format, const std::tm& tm)
{
    std::string padded = format + " ";
    std::vector<char> buffer(64 + padded.size() * 4);

    while (buffer.size() <= 64 * 1024) {
        size_t written = std::strftime(buffer.data(), buffer.size(), padded.c_str(), &tm);
        if (written > 0) {
            return std::string(buffer.data(), written - 1);
        }
        buffer.resize(buffer.size() * 2);
    }
    return std::string();
}

} // namespace

// ============================================================================
// FormatterConfig
// ============================================================================

FormatterConfig::FormatterConfig()
    : headers_{"DBG", "INF", "WAR", "ERR", "FATAL"},
      colors_{Color::Blue, Color::Green, Color::Yellow, Color::Red, Color::Magenta},
      header_color_enabled_(true), log_format_(kDefaultLogFormat),
      datetime_format_(kDefaultDatetimeFormat)
{
}

const std::string& FormatterConfig::header(core::Severity severity) const
{
    return headers_[index_of(severity)];
}

void FormatterConfig::set_header(core::Severity severity, std::string header)
{
    headers_[index_of(severity)] = std::move(header);
}

Color FormatterConfig::color(core::Severity severity) const
{
    return colors_[index_of(severity)];
}

void FormatterConfig::set_color(core::Severity severity, Color color)
{
    colors_[index_of(severity)] = color;
}

void FormatterConfig::set_log_format(const std::string& format)
{
    if (!has_message_placeholder(format)) {
        throw core::FormatError("Log format '" + format + "' lacks the %m message placeholder");
    }
    log_format_ = format;
}

bool FormatterConfig::has_message_placeholder(const std::string& format)
{
    for (size_t i = 0; i + 1 < format.size(); ++i) {
        if (format[i] == '%') {
            if (format[i + 1] == 'm') {
                return true;
            }
            // Skip the escaped character so "%%m" is not mistaken for "%m".
            ++i;
        }
    }
    return false;
}

bool FormatterConfig::operator==(const FormatterConfig& other) const
{
    return headers_ == other.headers_ && colors_ == other.colors_ &&
           header_color_enabled_ == other.header_color_enabled_ &&
           log_format_ == other.log_format_ && datetime_format_ == other.datetime_format_;
}

bool FormatterConfig::operator!=(const FormatterConfig& other) const
{
    return !(*this == other);
}

// ============================================================================
// Formatter
// ============================================================================

Formatter::Formatter(FormatterConfig config) : config_(std::move(config)) {}

std::string Formatter::render(const core::LogEvent& event) const
{
    const std::string& format = config_.log_format();
    std::string header = render_header(event.severity());
    std::optional<std::string> datetime;

    std::string result;
    result.reserve(format.size() + header.size() + event.message().size());

    for (size_t i = 0; i < format.size(); ++i) {
        char c = format[i];
        if (c != '%') {
            result += c;
            continue;
        }
        if (i + 1 >= format.size()) {
            // Trailing lone '%': nothing to substitute.
            break;
        }

        char directive = format[++i];
        switch (directive) {
        case 'h':
            result += header;
            break;
        case 'd':
            if (!datetime) {
                datetime = render_datetime(event.timestamp());
            }
            result += *datetime;
            break;
        case 'm':
            result += event.message();
            break;
        default:
            result += directive;
            break;
        }
    }
    return result;
}

std::string Formatter::render_header(core::Severity severity) const
{
    const std::string& header = config_.header(severity);
    if (!config_.header_color_enabled()) {
        return header;
    }
    return color_text(header, config_.color(severity));
}

std::string Formatter::render_datetime(core::LogEvent::Clock::time_point timestamp) const
{
    std::time_t time = core::LogEvent::Clock::to_time_t(timestamp);
    std::tm local{};
    localtime_r(&time, &local);

    const std::string& format = config_.datetime_format();
    if (!is_valid_datetime_format(format)) {
        return strftime_string(kDefaultDatetimeFormat, local);
    }
    return strftime_string(format, local);
}

void Formatter::set_log_format(const std::string& format)
{
    config_.set_log_format(format);
}

void Formatter::set_datetime_format(std::string format)
{
    config_.set_datetime_format(std::move(format));
}

bool Formatter::is_valid_datetime_format(const std::string& format)
{
    for (size_t i = 0; i < format.size(); ++i) {
        if (format[i] != '%') {
            continue;
        }
        if (++i >= format.size()) {
            return false;
        }
        // E and O are locale modifiers applied to the following conversion.
        if (format[i] == 'E' || format[i] == 'O') {
            if (++i >= format.size()) {
                return false;
            }
        }
        if (format[i] == '\0' || std::strchr(kStrftimeConversions, format[i]) == nullptr) {
            return false;
        }
    }
    return true;
}

} // namespace prettylog::format

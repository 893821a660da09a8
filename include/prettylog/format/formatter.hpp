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
 * @file formatter.hpp
 * @brief Template driven rendering of log events into display lines.
 *
 * @details
 * A log line template is plain text with three placeholders:
 * - `%h` : the severity header (colored when header colors are enabled).
 * - `%d` : the event timestamp, rendered with the datetime template.
 * - `%m` : the message. Mandatory: templates without it are rejected.
 *
 * `%` followed by any other character emits that character, so `%%` yields a
 * literal percent sign. A lone `%` at the very end is dropped.
 */

#pragma once

#include "prettylog/core/log_event.hpp"
#include "prettylog/core/severity.hpp"
#include "prettylog/format/colors.hpp"

#include <array>
#include <string>
#include <utility>

namespace prettylog::format {

/// @brief Template used when none is configured: `[INF] message`.
inline constexpr const char* kDefaultLogFormat = "[%h] %m";

/// @brief strftime-style template used for `%d`, and as the fallback for invalid ones.
inline constexpr const char* kDefaultDatetimeFormat = "%Y-%m-%d %H:%M:%S";

/**
 * @class FormatterConfig
 * @brief Per-severity headers and colors plus the line and datetime templates.
 *
 * @details
 * The log line template invariant (it contains `%m`) is enforced when the
 * template is assigned. A rejected assignment leaves the previous template in
 * place.
 */
class FormatterConfig {
  public:
    /// @brief Default preset: DBG/INF/WAR/ERR/FATAL headers, colored, `[%h] %m`.
    FormatterConfig();

    const std::string& header(core::Severity severity) const;
    void set_header(core::Severity severity, std::string header);

    Color color(core::Severity severity) const;
    void set_color(core::Severity severity, Color color);

    bool header_color_enabled() const
    {
        return header_color_enabled_;
    }

    void set_header_color_enabled(bool enabled)
    {
        header_color_enabled_ = enabled;
    }

    const std::string& log_format() const
    {
        return log_format_;
    }

    /**
     * @brief Replaces the log line template.
     * @throws core::FormatError If `format` lacks the `%m` placeholder.
     */
    void set_log_format(const std::string& format);

    const std::string& datetime_format() const
    {
        return datetime_format_;
    }

    /**
     * @brief Replaces the datetime template.
     *
     * Directives are not validated here. An invalid template makes `%d`
     * render with `kDefaultDatetimeFormat` instead.
     */
    void set_datetime_format(std::string format)
    {
        datetime_format_ = std::move(format);
    }

    bool operator==(const FormatterConfig& other) const;
    bool operator!=(const FormatterConfig& other) const;

    /// @brief True if `format` contains an unescaped `%m` placeholder.
    static bool has_message_placeholder(const std::string& format);

  private:
    std::array<std::string, core::kSeverityCount> headers_;
    std::array<Color, core::kSeverityCount> colors_;
    bool header_color_enabled_;
    std::string log_format_;
    std::string datetime_format_;
};

/**
 * @class Formatter
 * @brief Renders `LogEvent`s according to a `FormatterConfig`.
 *
 * Rendering is a pure function of the event and the configuration: the time
 * shown by `%d` is the event's own timestamp, never the time of rendering.
 */
class Formatter {
  public:
    Formatter() = default;
    explicit Formatter(FormatterConfig config);

    /**
     * @brief Produces the display line for `event`, without a trailing newline.
     *
     * @code
     * Formatter f;
     * f.config().set_header_color_enabled(false);
     * f.render(core::LogEvent::info("ready")); // "[INF] ready"
     * @endcode
     */
    std::string render(const core::LogEvent& event) const;

    /// @brief The header for `severity`, colored if header colors are enabled.
    std::string render_header(core::Severity severity) const;

    /**
     * @brief Formats `timestamp` (local time) with the datetime template.
     *
     * Falls back to `kDefaultDatetimeFormat` when the template contains a
     * directive outside the C `strftime` set.
     */
    std::string render_datetime(core::LogEvent::Clock::time_point timestamp) const;

    /// @brief Shortcut for `config().set_log_format()`.
    void set_log_format(const std::string& format);

    /// @brief Shortcut for `config().set_datetime_format()`.
    void set_datetime_format(std::string format);

    const FormatterConfig& config() const
    {
        return config_;
    }

    FormatterConfig& config()
    {
        return config_;
    }

    /// @brief True if every `%` directive in `format` is a standard strftime conversion.
    static bool is_valid_datetime_format(const std::string& format);

  private:
    FormatterConfig config_;
};

} // namespace prettylog::format

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
 * @file logger.hpp
 * @brief Top-level logging facade: severity filtering in front of the output router.
 *
 * @details
 * A `Logger` owns one `Formatter` and one `OutputRouter`. Each logging call
 * stamps a `LogEvent`, decides whether it passes the verbosity filter, and if
 * so hands it to the router, which fans it out to the enabled streams.
 *
 * **Threading:** a Logger is meant to be driven by one thread at a time. Share
 * one between threads through `SynchronizedLogger` (see `global.hpp`), which
 * wraps it in a `std::mutex`.
 */

#pragma once

#include "prettylog/config/logger_template.hpp"
#include "prettylog/core/log_event.hpp"
#include "prettylog/core/severity.hpp"
#include "prettylog/format/formatter.hpp"
#include "prettylog/output/output_router.hpp"

#include <memory>
#include <string>
#include <vector>

namespace prettylog::logging {

/**
 * @class Logger
 * @brief Filters, formats and routes log events.
 *
 * **Filtering rule:** an event is emitted iff filtering is disabled, or its
 * severity is `Error` or `Fatal`, or its severity is at least the threshold
 * implied by the current `Verbosity`.
 *
 * Destroying a Logger destroys its file output, which applies its drop policy
 * to any pending lines.
 *
 * @code
 * prettylog::logging::Logger logger;
 * logger.set_verbosity(prettylog::core::Verbosity::All);
 * logger.debug("Cache warmed");
 * logger.error("Upstream timeout");
 * @endcode
 */
class Logger {
  public:
    /// @brief Default preset: stderr output only, `Standard` verbosity, filtering on.
    Logger();

    /**
     * @brief Builds a Logger configured from a template.
     * @throws core::PathError If the template enables file output without a usable path.
     */
    explicit Logger(const config::LoggerTemplate& tmpl);

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    /**
     * @brief Creates an event stamped now and dispatches it if it passes the filter.
     *
     * @throws core::DispatchError If one or more streams failed. Streams that
     * did not fail still received the event.
     */
    void log(core::Severity severity, const std::string& message);

    void debug(const std::string& message);
    void info(const std::string& message);
    void warning(const std::string& message);
    void error(const std::string& message);
    void fatal(const std::string& message);

    /// @brief Dispatches a debug event regardless of verbosity.
    void debug_no_filtering(const std::string& message);

    /// @brief Dispatches an info event regardless of verbosity.
    void info_no_filtering(const std::string& message);

    /// @brief Dispatches a warning event regardless of verbosity.
    void warning_no_filtering(const std::string& message);

    /**
     * @brief Dispatches a pre-built event as-is, without filtering.
     * @throws core::DispatchError As `log()`.
     */
    void print_log(const core::LogEvent& event);

    /// @brief Renders `event` with this Logger's formatter.
    std::string format_log(const core::LogEvent& event) const;

    /// @brief The filtering decision for `severity` under the current settings.
    bool should_emit(core::Severity severity) const;

    void set_verbosity(core::Verbosity verbosity)
    {
        verbosity_ = verbosity;
    }

    core::Verbosity verbosity() const
    {
        return verbosity_;
    }

    void enable_log_filtering()
    {
        filtering_enabled_ = true;
    }

    void disable_log_filtering()
    {
        filtering_enabled_ = false;
    }

    bool is_filtering_enabled() const
    {
        return filtering_enabled_;
    }

    format::Formatter& formatter()
    {
        return formatter_;
    }

    const format::Formatter& formatter() const
    {
        return formatter_;
    }

    output::OutputRouter& output()
    {
        return output_;
    }

    const output::OutputRouter& output() const
    {
        return output_;
    }

    /// @brief Events collected by the buffer output (empty unless it is enabled).
    const std::vector<core::LogEvent>& log_buffer() const
    {
        return output_.buffer_output().get_log_buffer();
    }

    /**
     * @brief Flushes the file output if it is enabled.
     * @throws core::LockedError, core::PathError, core::IoError As `FileStream::flush()`.
     */
    void flush();

    // ========================================================================
    // Templates
    // ========================================================================

    /// @brief Captures every persistent setting into a template value.
    config::LoggerTemplate to_template() const;

    /**
     * @brief Replaces every persistent setting with those of `tmpl`.
     *
     * All-or-nothing: the file path and the enable precondition are checked
     * before anything is changed.
     *
     * @throws core::PathError If `tmpl` sets an unwritable path, or enables
     * file output with no path available.
     */
    void apply_template(const config::LoggerTemplate& tmpl);

    /**
     * @brief Builds a Logger from a JSON template file.
     * @throws core::IoError If the file cannot be read.
     * @throws core::ConfigError If the document is not a valid template.
     * @throws core::PathError As `apply_template()`.
     */
    static std::unique_ptr<Logger> from_template(const std::string& path);

    /// @brief As `from_template()`, reading the JSON document from memory.
    static std::unique_ptr<Logger> from_template_str(const std::string& json);

    /**
     * @brief Writes this Logger's template to `path` as JSON.
     * @throws core::IoError If the file cannot be written.
     * @throws core::ConfigError As `config::to_json()`.
     */
    void save_template(const std::string& path) const;

    /// @brief This Logger's template as a JSON document.
    std::string save_template_str() const;

  private:
    format::Formatter formatter_;
    output::OutputRouter output_;
    core::Verbosity verbosity_ = core::Verbosity::Standard;
    bool filtering_enabled_ = true;
};

} // namespace prettylog::logging

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
 * @file logger.cpp
 * @brief Implementation of the Logger facade.
 *
 * @details
 * Control flow of a logging call:
 * 1. **Filter**: `should_emit()` decides from severity, verbosity and the filtering flag.
 * 2. **Stamp**: a `LogEvent` is created with the current system time.
 * 3. **Route**: the router renders (per stream) and delivers the event.
 */

#include "prettylog/logging/logger.hpp"

#include "prettylog/core/error.hpp"
#include "prettylog/infra/fileio.hpp"

namespace prettylog::logging {

Logger::Logger() = default;

Logger::Logger(const config::LoggerTemplate& tmpl)
{
    apply_template(tmpl);
}

void Logger::log(core::Severity severity, const std::string& message)
{
    if (!should_emit(severity)) {
        return;
    }
    output_.dispatch(core::LogEvent(severity, message), formatter_);
}

void Logger::debug(const std::string& message)
{
    log(core::Severity::Debug, message);
}

void Logger::info(const std::string& message)
{
    log(core::Severity::Info, message);
}

void Logger::warning(const std::string& message)
{
    log(core::Severity::Warning, message);
}

void Logger::error(const std::string& message)
{
    log(core::Severity::Error, message);
}

void Logger::fatal(const std::string& message)
{
    log(core::Severity::Fatal, message);
}

void Logger::debug_no_filtering(const std::string& message)
{
    print_log(core::LogEvent::debug(message));
}

void Logger::info_no_filtering(const std::string& message)
{
    print_log(core::LogEvent::info(message));
}

void Logger::warning_no_filtering(const std::string& message)
{
    print_log(core::LogEvent::warning(message));
}

void Logger::print_log(const core::LogEvent& event)
{
    output_.dispatch(event, formatter_);
}

std::string Logger::format_log(const core::LogEvent& event) const
{
    return formatter_.render(event);
}

bool Logger::should_emit(core::Severity severity) const
{
    // Error and Fatal are never suppressible.
    if (!filtering_enabled_ || severity == core::Severity::Error ||
        severity == core::Severity::Fatal) {
        return true;
    }
    return core::rank(severity) >= core::rank(core::threshold(verbosity_));
}

void Logger::flush()
{
    if (output_.file_output().is_enabled()) {
        output_.file_output().flush();
    }
}

config::LoggerTemplate Logger::to_template() const
{
    const output::FileStream& file = output_.file_output();

    config::LoggerTemplate tmpl;
    tmpl.formatter = formatter_.config();
    tmpl.output.enabled = output_.is_enabled();
    tmpl.output.stderr_enabled = output_.stderr_output().is_enabled();
    tmpl.output.buffer_enabled = output_.buffer_output().is_enabled();
    tmpl.output.file_enabled = file.is_enabled();
    tmpl.output.log_file_path = file.log_file_path();
    tmpl.output.max_buffer_size = file.max_buffer_size();
    tmpl.output.on_drop_policy = file.on_drop_policy();
    tmpl.verbosity = verbosity_;
    tmpl.filtering_enabled = filtering_enabled_;
    return tmpl;
}

void Logger::apply_template(const config::LoggerTemplate& tmpl)
{
    const config::OutputTemplate& out = tmpl.output;

    // 1. Validation phase: nothing is modified until every check has passed.
    if (out.log_file_path && !infra::FileIo::is_writable(*out.log_file_path)) {
        throw core::PathError("Template: log file path '" + *out.log_file_path +
                              "' is not writable");
    }
    if (out.file_enabled && !out.log_file_path) {
        throw core::PathError("Template: file output enabled without a log file path");
    }

    // 2. File output first: it is the only part that can still fail.
    output::FileStream& file = output_.file_output();
    if (out.log_file_path) {
        file.set_log_file_path(*out.log_file_path);
    } else {
        file.clear_log_file_path();
    }
    if (out.file_enabled) {
        file.enable();
    } else {
        file.disable();
    }
    file.set_max_buffer_size(out.max_buffer_size);
    file.set_on_drop_policy(out.on_drop_policy);

    // 3. Remaining state cannot fail.
    if (out.enabled) {
        output_.enable();
    } else {
        output_.disable();
    }
    if (out.stderr_enabled) {
        output_.stderr_output().enable();
    } else {
        output_.stderr_output().disable();
    }
    if (out.buffer_enabled) {
        output_.buffer_output().enable();
    } else {
        output_.buffer_output().disable();
    }

    formatter_ = format::Formatter(tmpl.formatter);
    verbosity_ = tmpl.verbosity;
    filtering_enabled_ = tmpl.filtering_enabled;
}

std::unique_ptr<Logger> Logger::from_template(const std::string& path)
{
    return std::make_unique<Logger>(config::load_file(path));
}

std::unique_ptr<Logger> Logger::from_template_str(const std::string& json)
{
    return std::make_unique<Logger>(config::from_json(json));
}

void Logger::save_template(const std::string& path) const
{
    config::save_file(to_template(), path);
}

std::string Logger::save_template_str() const
{
    return config::to_json(to_template());
}

} // namespace prettylog::logging

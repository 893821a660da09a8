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
 * @file log_event.cpp
 * @brief Construction helpers for `LogEvent`.
 */

#include "prettylog/core/log_event.hpp"

#include <utility>

namespace prettylog::core {

LogEvent::LogEvent(Severity severity, std::string message, Clock::time_point timestamp)
    : severity_(severity), message_(std::move(message)), timestamp_(timestamp)
{
}

LogEvent::LogEvent(Severity severity, std::string message)
    : LogEvent(severity, std::move(message), Clock::now())
{
}

LogEvent LogEvent::debug(std::string message)
{
    return LogEvent(Severity::Debug, std::move(message));
}

LogEvent LogEvent::info(std::string message)
{
    return LogEvent(Severity::Info, std::move(message));
}

LogEvent LogEvent::warning(std::string message)
{
    return LogEvent(Severity::Warning, std::move(message));
}

LogEvent LogEvent::error(std::string message)
{
    return LogEvent(Severity::Error, std::move(message));
}

LogEvent LogEvent::fatal(std::string message)
{
    return LogEvent(Severity::Fatal, std::move(message));
}

bool LogEvent::operator==(const LogEvent& other) const
{
    return severity_ == other.severity_ && message_ == other.message_ &&
           timestamp_ == other.timestamp_;
}

bool LogEvent::operator!=(const LogEvent& other) const
{
    return !(*this == other);
}

} // namespace prettylog::core

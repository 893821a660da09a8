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
 * @file log_event.hpp
 * @brief Immutable record of one logging call.
 */

#pragma once

#include "prettylog/core/severity.hpp"

#include <chrono>
#include <string>

namespace prettylog::core {

/**
 * @class LogEvent
 * @brief One log occurrence: severity, message and creation time.
 *
 * @details
 * Events are created when a logging call is made and are never mutated
 * afterwards. Streams that keep events (the buffer stream) store their own
 * copy; streams that only need text receive a const reference.
 */
class LogEvent {
  public:
    using Clock = std::chrono::system_clock;

    /**
     * @brief Creates an event stamped with an explicit point in time.
     *
     * Mostly useful for deterministic rendering in tests.
     */
    LogEvent(Severity severity, std::string message, Clock::time_point timestamp);

    /// @brief Creates an event stamped with the current system time.
    LogEvent(Severity severity, std::string message);

    static LogEvent debug(std::string message);
    static LogEvent info(std::string message);
    static LogEvent warning(std::string message);
    static LogEvent error(std::string message);
    static LogEvent fatal(std::string message);

    Severity severity() const
    {
        return severity_;
    }

    const std::string& message() const
    {
        return message_;
    }

    Clock::time_point timestamp() const
    {
        return timestamp_;
    }

    bool operator==(const LogEvent& other) const;
    bool operator!=(const LogEvent& other) const;

  private:
    Severity severity_;
    std::string message_;
    Clock::time_point timestamp_;
};

} // namespace prettylog::core

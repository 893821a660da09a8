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
 * @file global.hpp
 * @brief Mutex-guarded Logger wrapper and the process-wide default instance.
 *
 * @details
 * `Logger` itself carries no locking. `SynchronizedLogger` serializes every
 * access to a wrapped Logger with a `std::mutex`, which is what the
 * `PRETTYLOG_*` convenience macros use through `global()`.
 */

#pragma once

#include "prettylog/logging/logger.hpp"

#include <mutex>
#include <string>

namespace prettylog::logging {

/**
 * @class SynchronizedLogger
 * @brief A Logger that may be shared between threads.
 *
 * Each call holds the mutex for its full duration, so lines from different
 * threads are dispatched whole and in lock acquisition order.
 */
class SynchronizedLogger {
  public:
    SynchronizedLogger() = default;

    SynchronizedLogger(const SynchronizedLogger&) = delete;
    SynchronizedLogger& operator=(const SynchronizedLogger&) = delete;

    /**
     * @brief Thread-safe `Logger::log`.
     * @throws core::DispatchError As `Logger::log`.
     */
    void log(core::Severity severity, const std::string& message);

    /**
     * @brief Runs `fn(Logger&)` with the mutex held and returns its result.
     *
     * Use it for configuration and for multi-step sequences that must not
     * interleave with other threads.
     *
     * @code
     * prettylog::logging::global().with([](auto& logger) {
     *     logger.set_verbosity(prettylog::core::Verbosity::All);
     * });
     * @endcode
     */
    template <typename Fn> auto with(Fn&& fn)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return fn(logger_);
    }

  private:
    std::mutex mutex_;
    Logger logger_;
};

/**
 * @brief The process-wide logger used by the `PRETTYLOG_*` macros.
 *
 * Constructed on first use with the default preset.
 */
SynchronizedLogger& global();

} // namespace prettylog::logging

// ============================================================================
// API Macros
// ============================================================================

/**
 * @def PRETTYLOG_DEBUG
 * @brief Logs a debug message through the global logger.
 */
#define PRETTYLOG_DEBUG(msg) \
    ::prettylog::logging::global().log(::prettylog::core::Severity::Debug, (msg))

/**
 * @def PRETTYLOG_INFO
 * @brief Logs an informational message through the global logger.
 */
#define PRETTYLOG_INFO(msg) \
    ::prettylog::logging::global().log(::prettylog::core::Severity::Info, (msg))

/**
 * @def PRETTYLOG_WARNING
 * @brief Logs a warning through the global logger.
 */
#define PRETTYLOG_WARNING(msg) \
    ::prettylog::logging::global().log(::prettylog::core::Severity::Warning, (msg))

/**
 * @def PRETTYLOG_ERROR
 * @brief Logs an error through the global logger.
 */
#define PRETTYLOG_ERROR(msg) \
    ::prettylog::logging::global().log(::prettylog::core::Severity::Error, (msg))

/**
 * @def PRETTYLOG_FATAL
 * @brief Logs a fatal error through the global logger. Does not terminate the process.
 */
#define PRETTYLOG_FATAL(msg) \
    ::prettylog::logging::global().log(::prettylog::core::Severity::Fatal, (msg))

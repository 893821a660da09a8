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
 * @file diagnostics.hpp
 * @brief Thread-safe reporter for prettylog's own internal diagnostics.
 *
 * @details
 * User-facing logging goes through `prettylog::logging::Logger`. This class is
 * the library's private channel for conditions that cannot be reported by
 * throwing, most notably failures while a `FileStream` is being destroyed.
 * Output is serialized with a static mutex so concurrent reports never
 * interleave on `stderr`.
 */

#pragma once

#include <atomic>
#include <mutex>
#include <string>

namespace prettylog::infra {

/**
 * @enum DiagLevel
 * @brief Severity of an internal diagnostic.
 */
enum class DiagLevel {
    DEBUG, ///< Lifecycle detail (stream closed, buffer flushed at teardown).
    INFO,  ///< Nominal notices.
    WARN,  ///< Data was discarded or a best-effort step was skipped.
    ERROR  ///< A best-effort step failed.
};

/**
 * @class Diagnostics
 * @brief Static, mutex-guarded writer for internal diagnostics.
 */
class Diagnostics {
  public:
    /**
     * @brief Writes one timestamped diagnostic line to `std::cerr`.
     *
     * Format: `[YYYY-MM-DD HH:MM:SS] [prettylog] [LEVEL] message`
     *
     * Lines below the configured minimum level, or any line while reporting
     * is disabled, are dropped.
     *
     * @param level The severity classification of the diagnostic.
     * @param message The content payload.
     */
    static void report(DiagLevel level, const std::string& message);

    /// @brief Turns reporting on or off process-wide (tests switch it off).
    static void set_enabled(bool enabled);

    static bool is_enabled();

    /// @brief Sets the least severe level that is still written. Defaults to `WARN`.
    static void set_min_level(DiagLevel level);

  private:
    /// @brief Serializes writes to `std::cerr` and guards `std::localtime`.
    static std::mutex mutex_;

    static std::atomic<bool> enabled_;

    static std::atomic<int> min_level_;
};

} // namespace prettylog::infra

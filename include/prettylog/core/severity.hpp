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
 * @file severity.hpp
 * @brief Severity tiers, verbosity thresholds and the file drop policy.
 *
 * @details
 * These enumerations are the vocabulary shared by every prettylog module. Each
 * one has a canonical textual name used by the JSON template codec.
 */

#pragma once

#include <string>

namespace prettylog::core {

/**
 * @enum Severity
 * @brief Importance tier of a log event, ordered by ascending importance.
 */
enum class Severity {
    Debug = 0,   ///< Development detail.
    Info = 1,    ///< Nominal operational events.
    Warning = 2, ///< Non-blocking anomalies.
    Error = 3,   ///< Recoverable failures. Never suppressed by filtering.
    Fatal = 4    ///< Unrecoverable failures. Never suppressed by filtering.
};

/// @brief Number of `Severity` values; sizes per-severity lookup tables.
inline constexpr int kSeverityCount = 5;

/**
 * @enum Verbosity
 * @brief Suppression threshold applied by the Logger when filtering is enabled.
 *
 * Each level maps to the minimum severity that is still emitted:
 * - `All`        -> `Debug`
 * - `Standard`   -> `Info`
 * - `Quiet`      -> `Warning`
 * - `ErrorsOnly` -> `Error`
 */
enum class Verbosity { All = 0, Standard = 1, Quiet = 2, ErrorsOnly = 3 };

/**
 * @enum OnDropPolicy
 * @brief What a locked `FileStream` does with pending lines when it is closed.
 */
enum class OnDropPolicy {
    IgnoreLogFileLock, ///< Write pending lines anyway.
    DiscardLogBuffer   ///< Drop pending lines without touching the file.
};

/// @brief Zero-based rank used for ordering comparisons.
inline int rank(Severity severity)
{
    return static_cast<int>(severity);
}

/// @brief The least important severity a verbosity level lets through.
Severity threshold(Verbosity verbosity);

std::string to_string(Severity severity);
std::string to_string(Verbosity verbosity);
std::string to_string(OnDropPolicy policy);

/**
 * @brief Parses a canonical severity name ("Debug", "Info", ...).
 * @throws ConfigError If the name is unknown.
 */
Severity severity_from_string(const std::string& name);

/**
 * @brief Parses a canonical verbosity name ("All", "Standard", "Quiet", "ErrorsOnly").
 * @throws ConfigError If the name is unknown.
 */
Verbosity verbosity_from_string(const std::string& name);

/**
 * @brief Parses a drop policy name ("IgnoreLogFileLock", "DiscardLogBuffer").
 * @throws ConfigError If the name is unknown.
 */
OnDropPolicy on_drop_policy_from_string(const std::string& name);

} // namespace prettylog::core

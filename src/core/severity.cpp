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
 * @file severity.cpp
 * @brief Name tables and threshold mapping for the core enumerations.
 */

#include "prettylog/core/severity.hpp"

#include "prettylog/core/error.hpp"

namespace prettylog::core {

Severity threshold(Verbosity verbosity)
{
    switch (verbosity) {
    case Verbosity::All:
        return Severity::Debug;
    case Verbosity::Standard:
        return Severity::Info;
    case Verbosity::Quiet:
        return Severity::Warning;
    case Verbosity::ErrorsOnly:
        return Severity::Error;
    }
    return Severity::Info;
}

std::string to_string(Severity severity)
{
    switch (severity) {
    case Severity::Debug:
        return "Debug";
    case Severity::Info:
        return "Info";
    case Severity::Warning:
        return "Warning";
    case Severity::Error:
        return "Error";
    case Severity::Fatal:
        return "Fatal";
    }
    return "Unknown";
}

std::string to_string(Verbosity verbosity)
{
    switch (verbosity) {
    case Verbosity::All:
        return "All";
    case Verbosity::Standard:
        return "Standard";
    case Verbosity::Quiet:
        return "Quiet";
    case Verbosity::ErrorsOnly:
        return "ErrorsOnly";
    }
    return "Unknown";
}

std::string to_string(OnDropPolicy policy)
{
    switch (policy) {
    case OnDropPolicy::IgnoreLogFileLock:
        return "IgnoreLogFileLock";
    case OnDropPolicy::DiscardLogBuffer:
        return "DiscardLogBuffer";
    }
    return "Unknown";
}

Severity severity_from_string(const std::string& name)
{
    for (int i = 0; i < kSeverityCount; ++i) {
        auto severity = static_cast<Severity>(i);
        if (to_string(severity) == name) {
            return severity;
        }
    }
    throw ConfigError("Unknown severity '" + name + "'");
}

Verbosity verbosity_from_string(const std::string& name)
{
    for (auto v : {Verbosity::All, Verbosity::Standard, Verbosity::Quiet, Verbosity::ErrorsOnly}) {
        if (to_string(v) == name) {
            return v;
        }
    }
    throw ConfigError("Unknown verbosity '" + name + "'");
}

OnDropPolicy on_drop_policy_from_string(const std::string& name)
{
    if (name == "IgnoreLogFileLock") {
        return OnDropPolicy::IgnoreLogFileLock;
    }
    if (name == "DiscardLogBuffer") {
        return OnDropPolicy::DiscardLogBuffer;
    }
    throw ConfigError("Unknown on-drop policy '" + name + "'");
}

} // namespace prettylog::core

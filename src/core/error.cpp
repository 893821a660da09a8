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
 * @file error.cpp
 * @brief Constructors and helpers of the prettylog exception hierarchy.
 */

#include "prettylog/core/error.hpp"

#include <algorithm>
#include <utility>

namespace prettylog::core {

namespace {

/**
 * @brief Builds the `what()` text of a DispatchError.
 *
 * Example: `2 stream(s) failed: [file] Locked: Log file is locked; [audit] Io: disk full`
 */
std::string summarize(const std::vector<StreamFailure>& failures)
{
    std::string text = std::to_string(failures.size()) + " stream(s) failed: ";
    for (size_t i = 0; i < failures.size(); ++i) {
        if (i > 0) {
            text += "; ";
        }
        text += "[" + failures[i].stream + "] " + to_string(failures[i].kind) + ": " +
                failures[i].message;
    }
    return text;
}

} // namespace

std::string to_string(ErrorKind kind)
{
    switch (kind) {
    case ErrorKind::Config:
        return "Config";
    case ErrorKind::Path:
        return "Path";
    case ErrorKind::Locked:
        return "Locked";
    case ErrorKind::Io:
        return "Io";
    case ErrorKind::Dispatch:
        return "Dispatch";
    }
    return "Unknown";
}

Error::Error(ErrorKind kind, const std::string& message)
    : std::runtime_error(message), kind_(kind)
{
}

ConfigError::ConfigError(const std::string& message) : Error(ErrorKind::Config, message) {}

FormatError::FormatError(const std::string& message) : ConfigError(message) {}

PathError::PathError(const std::string& message) : Error(ErrorKind::Path, message) {}

LockedError::LockedError(const std::string& message) : Error(ErrorKind::Locked, message) {}

IoError::IoError(const std::string& message) : Error(ErrorKind::Io, message) {}

DispatchError::DispatchError(std::vector<StreamFailure> failures)
    : Error(ErrorKind::Dispatch, summarize(failures)), failures_(std::move(failures))
{
}

bool DispatchError::contains(ErrorKind kind) const
{
    return std::any_of(failures_.begin(), failures_.end(),
                       [kind](const StreamFailure& f) { return f.kind == kind; });
}

} // namespace prettylog::core

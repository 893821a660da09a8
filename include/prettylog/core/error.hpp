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
 * @file error.hpp
 * @brief Exception hierarchy reported by every prettylog operation.
 *
 * @details
 * All failures surface as exceptions derived from `prettylog::core::Error`,
 * which is itself a `std::runtime_error`. Callers that only care about
 * "something in the logger failed" can catch the base class; callers that
 * need to react to a specific condition (a held file lock, a missing path)
 * can catch the concrete type or inspect `kind()`.
 */

#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace prettylog::core {

/**
 * @enum ErrorKind
 * @brief Coarse classification of a failure.
 */
enum class ErrorKind {
    Config,  ///< Invalid template, placeholder or enumeration value.
    Path,    ///< File output used without a valid writable path.
    Locked,  ///< Operation attempted while the advisory file lock is held.
    Io,      ///< Underlying open/write failure.
    Dispatch ///< One or more streams failed during a fan-out.
};

std::string to_string(ErrorKind kind);

/**
 * @class Error
 * @brief Base class of all prettylog exceptions.
 */
class Error : public std::runtime_error {
  public:
    Error(ErrorKind kind, const std::string& message);

    ErrorKind kind() const
    {
        return kind_;
    }

  private:
    ErrorKind kind_;
};

/// @brief Invalid configuration value (template, enumeration name, JSON shape).
class ConfigError : public Error {
  public:
    explicit ConfigError(const std::string& message);
};

/// @brief A log line template was rejected by the formatter.
class FormatError : public ConfigError {
  public:
    explicit FormatError(const std::string& message);
};

/// @brief File output enabled or flushed without a valid writable path.
class PathError : public Error {
  public:
    explicit PathError(const std::string& message);
};

/// @brief The advisory file lock is held; the operation was not attempted.
class LockedError : public Error {
  public:
    explicit LockedError(const std::string& message);
};

/// @brief An operating system level read or write failed.
class IoError : public Error {
  public:
    explicit IoError(const std::string& message);
};

/**
 * @struct StreamFailure
 * @brief One stream's failure recorded during a router fan-out.
 */
struct StreamFailure {
    std::string stream; ///< Name of the failing stream (e.g. "file").
    ErrorKind kind;     ///< Kind of the original exception.
    std::string message;
};

/**
 * @class DispatchError
 * @brief Aggregate of every stream failure raised during one dispatch.
 *
 * Thrown only after all enabled streams were attempted, so sibling streams
 * still received the event.
 */
class DispatchError : public Error {
  public:
    explicit DispatchError(std::vector<StreamFailure> failures);

    const std::vector<StreamFailure>& failures() const
    {
        return failures_;
    }

    /// @brief True if any recorded failure has the given kind.
    bool contains(ErrorKind kind) const;

  private:
    std::vector<StreamFailure> failures_;
};

} // namespace prettylog::core

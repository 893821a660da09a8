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
 * @file file_stream.cpp
 * @brief Implementation of the buffered log file output.
 *
 * @details
 * The on-disk format is plain UTF-8 text, one formatted line per event, each
 * terminated by `\n`. Writes are appends; existing content is never rewritten.
 */

#include "prettylog/output/file_stream.hpp"

#include "prettylog/core/error.hpp"
#include "prettylog/infra/diagnostics.hpp"
#include "prettylog/infra/fileio.hpp"

namespace prettylog::output {

FileStream::~FileStream()
{
    if (closed_) {
        return;
    }

    size_t pending = log_buffer_.size();
    try {
        close();
    } catch (const core::Error& e) {
        infra::Diagnostics::report(infra::DiagLevel::ERROR,
                                   "FileStream: Final flush failed, " + std::to_string(pending) +
                                       " line(s) lost: " + e.what());
    }
}

void FileStream::enable()
{
    if (enabled_) {
        return;
    }
    if (!path_) {
        throw core::PathError("Cannot enable file output: no log file path set");
    }
    if (!infra::FileIo::is_writable(*path_)) {
        throw core::PathError("Cannot enable file output: '" + *path_ + "' is not writable");
    }

    enabled_ = true;
    closed_ = false;
}

void FileStream::out(const core::LogEvent& event, const format::Formatter& formatter)
{
    if (!enabled_) {
        return;
    }
    if (locked_) {
        throw core::LockedError("Log file is locked; event not buffered");
    }

    log_buffer_.push_back(formatter.render(event) + "\n");

    if (max_buffer_size_ && log_buffer_.size() >= *max_buffer_size_) {
        flush();
    }
}

void FileStream::set_log_file_path(const std::string& path)
{
    if (!infra::FileIo::is_writable(path)) {
        throw core::PathError("Log file path '" + path + "' is not writable");
    }
    path_ = path;
}

void FileStream::flush()
{
    if (locked_) {
        throw core::LockedError("Log file is locked; flush refused");
    }
    if (!path_) {
        throw core::PathError("Cannot flush file output: no log file path set");
    }
    if (log_buffer_.empty()) {
        return;
    }

    write_pending();
}

void FileStream::close()
{
    if (closed_) {
        return;
    }
    bool was_enabled = enabled_;
    closed_ = true;
    enabled_ = false;

    if (log_buffer_.empty()) {
        return;
    }

    if (!was_enabled) {
        infra::Diagnostics::report(infra::DiagLevel::WARN,
                                   "FileStream: File output disabled, discarding " +
                                       std::to_string(log_buffer_.size()) + " pending line(s)");
        log_buffer_.clear();
        return;
    }

    if (!path_) {
        infra::Diagnostics::report(infra::DiagLevel::WARN,
                                   "FileStream: No log file path, discarding " +
                                       std::to_string(log_buffer_.size()) + " pending line(s)");
        log_buffer_.clear();
        return;
    }

    if (locked_ && on_drop_policy_ == core::OnDropPolicy::DiscardLogBuffer) {
        infra::Diagnostics::report(infra::DiagLevel::WARN,
                                   "FileStream: Log file locked, discarding " +
                                       std::to_string(log_buffer_.size()) + " pending line(s)");
        log_buffer_.clear();
        return;
    }

    try {
        write_pending();
    } catch (const core::IoError&) {
        // Closed streams keep nothing; the caller learns about the loss from the rethrow.
        log_buffer_.clear();
        throw;
    }
}

void FileStream::write_pending()
{
    std::string joined;
    for (const auto& line : log_buffer_) {
        joined += line;
    }

    if (!infra::FileIo::append(*path_, joined)) {
        throw core::IoError("Failed to append " + std::to_string(log_buffer_.size()) +
                            " line(s) to '" + *path_ + "'");
    }

    log_buffer_.clear();
}

} // namespace prettylog::output

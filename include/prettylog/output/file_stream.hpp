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
 * @file file_stream.hpp
 * @brief Buffered, append-only log file output.
 *
 * @details
 * Formatted lines are accumulated in memory and written to the log file in one
 * append when the buffer is flushed, either explicitly or automatically once it
 * reaches the configured size. The file is opened only for the duration of a
 * flush.
 *
 * **Advisory lock:** `lock_file()` sets a cooperative flag that makes `out()`
 * and `flush()` fail fast with `LockedError`. It lets a caller pause writes
 * while external code (a rotation routine, for example) manipulates the file.
 * Nothing ever blocks on it.
 *
 * **Teardown:** when the stream is closed or destroyed, pending lines are
 * written unless the lock is held under `OnDropPolicy::DiscardLogBuffer`.
 */

#pragma once

#include "prettylog/core/severity.hpp"
#include "prettylog/output/output_stream.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace prettylog::output {

/// @brief Buffer size after which a FileStream flushes on its own.
inline constexpr size_t kDefaultMaxBufferSize = 128;

/**
 * @class FileStream
 * @brief Output stream that buffers formatted lines and appends them to a file.
 */
class FileStream : public OutputStream {
  public:
    FileStream() = default;

    /**
     * @brief Applies the drop policy to pending lines unless `close()` already did.
     *
     * Never throws: a failed final write is reported through
     * `infra::Diagnostics` and the pending lines are lost.
     */
    ~FileStream() override;

    FileStream(const FileStream&) = delete;
    FileStream& operator=(const FileStream&) = delete;

    /**
     * @brief Enables the stream.
     *
     * Requires a path that was set earlier and is still writable.
     *
     * @throws core::PathError If no path is set or it cannot be opened for
     * appending. The stream stays disabled.
     */
    void enable() override;

    void disable() override
    {
        enabled_ = false;
    }

    bool is_enabled() const override
    {
        return enabled_;
    }

    /**
     * @brief Renders `event` and appends the line to the pending buffer.
     *
     * When a maximum buffer size is set and the buffer reaches it, the buffer
     * is flushed before returning.
     *
     * @throws core::LockedError If the lock is held. Nothing is buffered.
     * @throws core::IoError If the implicit flush fails. The lines stay buffered.
     */
    void out(const core::LogEvent& event, const format::Formatter& formatter) override;

    std::string name() const override
    {
        return "file";
    }

    /**
     * @brief Sets the log file path after checking it can be opened for appending.
     *
     * A missing file is created; an existing one is left untouched.
     *
     * @throws core::PathError If the path is not writable. The previous path is kept.
     */
    void set_log_file_path(const std::string& path);

    const std::optional<std::string>& log_file_path() const
    {
        return path_;
    }

    /// @brief Forgets the path and disables the stream. Pending lines are kept.
    void clear_log_file_path()
    {
        path_.reset();
        enabled_ = false;
    }

    /**
     * @brief Appends every pending line to the log file, then clears the buffer.
     *
     * Retry-safe: the buffer is only cleared after a successful write, so a
     * failed flush can be repeated with the same pending lines. Flushing an
     * empty buffer does nothing.
     *
     * @throws core::LockedError If the lock is held.
     * @throws core::PathError If no path is set.
     * @throws core::IoError If the file cannot be opened or written.
     */
    void flush();

    /**
     * @brief Enables (`n`) or disables (`std::nullopt`) automatic flushing.
     *
     * With `n` set, the buffer is flushed as soon as it holds `n` lines.
     */
    void set_max_buffer_size(std::optional<size_t> size)
    {
        max_buffer_size_ = size;
    }

    std::optional<size_t> max_buffer_size() const
    {
        return max_buffer_size_;
    }

    void set_on_drop_policy(core::OnDropPolicy policy)
    {
        on_drop_policy_ = policy;
    }

    core::OnDropPolicy on_drop_policy() const
    {
        return on_drop_policy_;
    }

    void lock_file()
    {
        locked_ = true;
    }

    void unlock_file()
    {
        locked_ = false;
    }

    bool is_locked() const
    {
        return locked_;
    }

    /// @brief Lines rendered but not yet written, each with its trailing newline.
    const std::vector<std::string>& pending_lines() const
    {
        return log_buffer_;
    }

    /**
     * @brief Runs the teardown sequence now and disables the stream.
     *
     * 1. Disabled, locked with `DiscardLogBuffer`, or no path: pending lines
     *    are dropped.
     * 2. Otherwise (unlocked, or locked with `IgnoreLogFileLock`): pending
     *    lines are written, bypassing the lock.
     *
     * The sequence runs once; later calls, and the destructor, do nothing
     * until the stream is enabled again.
     *
     * @throws core::IoError If the final write fails. The stream still counts
     * as closed and the lines are dropped.
     */
    void close();

    bool is_closed() const
    {
        return closed_;
    }

  private:
    /// @brief Writes the joined buffer to `path_` and clears it on success.
    void write_pending();

    bool enabled_ = false;
    bool locked_ = false;
    bool closed_ = false;
    std::optional<std::string> path_;
    std::vector<std::string> log_buffer_;
    std::optional<size_t> max_buffer_size_ = kDefaultMaxBufferSize;
    core::OnDropPolicy on_drop_policy_ = core::OnDropPolicy::DiscardLogBuffer;
};

} // namespace prettylog::output

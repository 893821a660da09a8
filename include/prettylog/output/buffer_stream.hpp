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
 * @file buffer_stream.hpp
 * @brief In-memory sink that keeps raw, unformatted events.
 */

#pragma once

#include "prettylog/output/output_stream.hpp"

#include <vector>

namespace prettylog::output {

/**
 * @class BufferStream
 * @brief Stores a copy of every received `LogEvent` in call order.
 *
 * Disabled by default. The buffer is unbounded until `clear()` is called.
 */
class BufferStream : public OutputStream {
  public:
    BufferStream() = default;

    void enable() override
    {
        enabled_ = true;
    }

    void disable() override
    {
        enabled_ = false;
    }

    bool is_enabled() const override
    {
        return enabled_;
    }

    /// @brief Appends a copy of `event`. The formatter is not used.
    void out(const core::LogEvent& event, const format::Formatter& formatter) override;

    /// @brief Appends a copy of `event` without needing a formatter.
    void out(const core::LogEvent& event);

    std::string name() const override
    {
        return "buffer";
    }

    /// @brief Read-only view of the stored events; entries stay owned by the stream.
    const std::vector<core::LogEvent>& get_log_buffer() const
    {
        return log_buffer_;
    }

    void clear();

  private:
    bool enabled_ = false;
    std::vector<core::LogEvent> log_buffer_;
};

} // namespace prettylog::output

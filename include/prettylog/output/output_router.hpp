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
 * @file output_router.hpp
 * @brief Best-effort fan-out of events to the enabled output streams.
 *
 * @details
 * The router owns the three built-in streams (stderr, file, buffer) and any
 * number of caller-supplied streams. A master switch gates the whole fan-out;
 * each stream's own flag gates its share of it.
 */

#pragma once

#include "prettylog/output/buffer_stream.hpp"
#include "prettylog/output/file_stream.hpp"
#include "prettylog/output/output_stream.hpp"
#include "prettylog/output/stderr_stream.hpp"

#include <memory>
#include <vector>

namespace prettylog::output {

/**
 * @class OutputRouter
 * @brief Owns the output streams and dispatches each event to the enabled ones.
 *
 * **Dispatch order:** stderr, file, buffer, then added streams in insertion
 * order. Within one stream, events are handled in call order.
 */
class OutputRouter {
  public:
    OutputRouter() = default;

    OutputRouter(const OutputRouter&) = delete;
    OutputRouter& operator=(const OutputRouter&) = delete;

    /**
     * @brief Hands `event` to every enabled stream.
     *
     * Does nothing while the router itself is disabled. A failing stream does
     * not prevent delivery to the streams after it.
     *
     * @throws core::DispatchError After the fan-out, if any stream threw a
     * `core::Error`; it lists each failure with the stream's name.
     */
    void dispatch(const core::LogEvent& event, const format::Formatter& formatter);

    void enable()
    {
        enabled_ = true;
    }

    void disable()
    {
        enabled_ = false;
    }

    bool is_enabled() const
    {
        return enabled_;
    }

    /**
     * @brief Takes ownership of an extra stream, dispatched after the built-in ones.
     * @return A reference to the stored stream, valid for the router's lifetime.
     */
    OutputStream& add_stream(std::unique_ptr<OutputStream> stream);

    size_t extra_stream_count() const
    {
        return extra_streams_.size();
    }

    StderrStream& stderr_output()
    {
        return stderr_output_;
    }

    const StderrStream& stderr_output() const
    {
        return stderr_output_;
    }

    FileStream& file_output()
    {
        return file_output_;
    }

    const FileStream& file_output() const
    {
        return file_output_;
    }

    BufferStream& buffer_output()
    {
        return buffer_output_;
    }

    const BufferStream& buffer_output() const
    {
        return buffer_output_;
    }

  private:
    bool enabled_ = true;
    StderrStream stderr_output_;
    FileStream file_output_;
    BufferStream buffer_output_;
    std::vector<std::unique_ptr<OutputStream>> extra_streams_;
};

} // namespace prettylog::output

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

#include "prettylog/output/buffer_stream.hpp"

namespace prettylog::output {

void BufferStream::out(const core::LogEvent& event, const format::Formatter& /*formatter*/)
{
    out(event);
}

void BufferStream::out(const core::LogEvent& event)
{
    if (enabled_) {
        log_buffer_.push_back(event);
    }
}

void BufferStream::clear()
{
    log_buffer_.clear();
}

} // namespace prettylog::output

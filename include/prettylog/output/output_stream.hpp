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
 * @file output_stream.hpp
 * @brief Capability interface shared by every log destination.
 *
 * @details
 * A stream is an independently toggleable sink. The router only hands events
 * to streams whose `is_enabled()` is true; streams that need display text
 * render it with the formatter they are given, raw-storing streams ignore it.
 */

#pragma once

#include "prettylog/core/log_event.hpp"
#include "prettylog/format/formatter.hpp"

#include <string>

namespace prettylog::output {

/**
 * @class OutputStream
 * @brief Abstract sink: `{enable, disable, is_enabled, out}`.
 *
 * Implementations report failures by throwing `prettylog::core::Error`
 * subclasses. Any other exception type escaping `out()` is treated as a bug
 * and is not caught by the router.
 */
class OutputStream {
  public:
    virtual ~OutputStream() = default;

    /**
     * @brief Turns the stream on.
     * @throws core::Error If the stream has an unmet precondition (see FileStream).
     */
    virtual void enable() = 0;

    virtual void disable() = 0;

    virtual bool is_enabled() const = 0;

    /**
     * @brief Consumes one event.
     *
     * Calling `out()` on a disabled stream is a no-op.
     *
     * @param event The event to print, store or buffer.
     * @param formatter Renders the event for text-consuming streams.
     */
    virtual void out(const core::LogEvent& event, const format::Formatter& formatter) = 0;

    /// @brief Short identifier used in dispatch failure reports.
    virtual std::string name() const = 0;
};

} // namespace prettylog::output

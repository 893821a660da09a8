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
 * @file stderr_stream.hpp
 * @brief Console output on the standard error stream.
 */

#pragma once

#include "prettylog/output/output_stream.hpp"

namespace prettylog::output {

/**
 * @class StderrStream
 * @brief Writes each formatted line plus a newline to `std::cerr`.
 *
 * Enabled by default. Enabling and disabling never fail.
 */
class StderrStream : public OutputStream {
  public:
    StderrStream() = default;

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

    /**
     * @brief Renders `event` and writes it to standard error.
     * @throws core::IoError If the stream reports a write failure.
     */
    void out(const core::LogEvent& event, const format::Formatter& formatter) override;

    std::string name() const override
    {
        return "stderr";
    }

  private:
    bool enabled_ = true;
};

} // namespace prettylog::output

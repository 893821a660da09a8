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
 * @file stderr_stream.cpp
 * @brief Standard error sink.
 */

#include "prettylog/output/stderr_stream.hpp"

#include "prettylog/core/error.hpp"

#include <iostream>

namespace prettylog::output {

void StderrStream::out(const core::LogEvent& event, const format::Formatter& formatter)
{
    if (!enabled_) {
        return;
    }

    std::string line = formatter.render(event);
    line += '\n';

    std::cerr.write(line.data(), static_cast<std::streamsize>(line.size()));
    std::cerr.flush();

    if (!std::cerr.good()) {
        // Reset the state so the next event gets a fresh attempt.
        std::cerr.clear();
        throw core::IoError("Failed to write log line to standard error");
    }
}

} // namespace prettylog::output

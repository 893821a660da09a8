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
 * @file output_router.cpp
 * @brief Implementation of the best-effort fan-out.
 */

#include "prettylog/output/output_router.hpp"

#include "prettylog/core/error.hpp"

#include <stdexcept>
#include <utility>

namespace prettylog::output {

void OutputRouter::dispatch(const core::LogEvent& event, const format::Formatter& formatter)
{
    if (!enabled_) {
        return;
    }

    std::vector<OutputStream*> targets = {&stderr_output_, &file_output_, &buffer_output_};
    for (const auto& stream : extra_streams_) {
        targets.push_back(stream.get());
    }

    std::vector<core::StreamFailure> failures;

    for (OutputStream* stream : targets) {
        if (!stream->is_enabled()) {
            continue;
        }
        try {
            stream->out(event, formatter);
        } catch (const core::Error& e) {
            failures.push_back({stream->name(), e.kind(), e.what()});
        } catch (const std::exception& e) {
            // User streams may raise arbitrary exceptions; record them as I/O failures.
            failures.push_back({stream->name(), core::ErrorKind::Io, e.what()});
        }
    }

    if (!failures.empty()) {
        throw core::DispatchError(std::move(failures));
    }
}

OutputStream& OutputRouter::add_stream(std::unique_ptr<OutputStream> stream)
{
    if (!stream) {
        throw std::invalid_argument("OutputRouter::add_stream: null stream");
    }
    extra_streams_.push_back(std::move(stream));
    return *extra_streams_.back();
}

} // namespace prettylog::output

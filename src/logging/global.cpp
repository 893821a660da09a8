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
 * @file global.cpp
 * @brief SynchronizedLogger and the lazily constructed global instance.
 */

#include "prettylog/logging/global.hpp"

#include "prettylog/infra/diagnostics.hpp"

namespace prettylog::logging {

void SynchronizedLogger::log(core::Severity severity, const std::string& message)
{
    std::lock_guard<std::mutex> lock(mutex_);
    logger_.log(severity, message);
}

SynchronizedLogger& global()
{
    // Function-local static: initialization is thread-safe since C++11.
    static SynchronizedLogger instance;
    static std::once_flag announced;
    std::call_once(announced, [] {
        infra::Diagnostics::report(infra::DiagLevel::DEBUG, "Global logger initialized");
    });
    return instance;
}

} // namespace prettylog::logging

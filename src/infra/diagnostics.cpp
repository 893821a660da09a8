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
 * @file diagnostics.cpp
 * @brief Implementation of the internal diagnostics reporter.
 *
 * @details
 * Each report is written atomically with an ISO 8601-like timestamp and an
 * ANSI color-coded level tag.
 */

#include "prettylog/infra/diagnostics.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>

namespace prettylog::infra {

std::mutex Diagnostics::mutex_;
std::atomic<bool> Diagnostics::enabled_{true};
std::atomic<int> Diagnostics::min_level_{static_cast<int>(DiagLevel::WARN)};

void Diagnostics::report(DiagLevel level, const std::string& message)
{
    if (!enabled_.load() || static_cast<int>(level) < min_level_.load()) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);

    std::tm local{};
    localtime_r(&time, &local);

    std::cerr << "[" << std::put_time(&local, "%Y-%m-%d %H:%M:%S")
              << "] [prettylog] ";

    switch (level) {
    case DiagLevel::DEBUG:
        std::cerr << "\033[36m[DBUG]\033[0m ";
        break;
    case DiagLevel::INFO:
        std::cerr << "\033[32m[INFO]\033[0m ";
        break;
    case DiagLevel::WARN:
        std::cerr << "\033[33m[WARN]\033[0m ";
        break;
    case DiagLevel::ERROR:
        std::cerr << "\033[31m[FAIL]\033[0m ";
        break;
    }

    std::cerr << message << std::endl;
}

void Diagnostics::set_enabled(bool enabled)
{
    enabled_.store(enabled);
}

bool Diagnostics::is_enabled()
{
    return enabled_.load();
}

void Diagnostics::set_min_level(DiagLevel level)
{
    min_level_.store(static_cast<int>(level));
}

} // namespace prettylog::infra

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
 * @file infra_test.cpp
 * @brief Unit tests for shared infrastructure primitives (FileIo, Diagnostics).
 */

#include "framework.hpp"
#include "helpers.hpp"
#include "prettylog/core/log_event.hpp"
#include "prettylog/format/formatter.hpp"
#include "prettylog/infra/diagnostics.hpp"
#include "prettylog/infra/fileio.hpp"

#include <cctype>
#include <optional>
#include <string>
#include <thread>
#include <vector>

using prettylog::infra::DiagLevel;
using prettylog::infra::Diagnostics;
using prettylog::infra::FileIo;
using prettylog::test::ScratchDir;
using prettylog::test::StderrCapture;

/**
 * @brief Writability check rejects empty paths, directories and missing parents.
 */
void test_fileio_writability()
{
    ScratchDir dir("test_fileio_writable");

    ASSERT_FALSE(FileIo::is_writable(""));
    ASSERT_FALSE(FileIo::is_writable(dir.path()));
    ASSERT_FALSE(FileIo::is_writable(dir.file("no/such/parent.log")));
    ASSERT_TRUE(FileIo::is_writable(dir.file("fresh.log")));
}

/**
 * @brief Appends accumulate; overwrite replaces; missing files read as nullopt.
 */
void test_fileio_append_and_read()
{
    ScratchDir dir("test_fileio_rw");
    std::string path = dir.file("data.txt");

    ASSERT_FALSE(FileIo::read(path).has_value());

    ASSERT_TRUE(FileIo::append(path, "alpha\n"));
    ASSERT_TRUE(FileIo::append(path, "beta\n"));
    std::optional<std::string> content = FileIo::read(path);
    ASSERT_TRUE(content.has_value());
    ASSERT_EQ(*content, std::string("alpha\nbeta\n"));

    ASSERT_TRUE(FileIo::overwrite(path, "gamma"));
    ASSERT_EQ(*FileIo::read(path), std::string("gamma"));

    ASSERT_FALSE(FileIo::append(dir.file("no/such/parent.log"), "x"));
}

/**
 * @brief Diagnostics honour the enable switch and the minimum level.
 */
void test_diagnostics_gating()
{
    bool was_enabled = Diagnostics::is_enabled();

    {
        StderrCapture capture;
        Diagnostics::set_enabled(false);
        Diagnostics::report(DiagLevel::ERROR, "silenced");
        ASSERT_TRUE(capture.str().empty());

        Diagnostics::set_enabled(true);
        Diagnostics::set_min_level(DiagLevel::WARN);
        Diagnostics::report(DiagLevel::INFO, "below threshold");
        ASSERT_TRUE(capture.str().empty());

        Diagnostics::report(DiagLevel::WARN, "visible notice");
        std::string text = capture.str();
        ASSERT_TRUE(text.find("[prettylog]") != std::string::npos);
        ASSERT_TRUE(text.find("visible notice") != std::string::npos);
    }

    Diagnostics::set_enabled(was_enabled);
}

namespace {

/// True if `line` opens with a "[YYYY-MM-DD HH:MM:SS] " stamp.
bool has_timestamp_prefix(const std::string& line)
{
    const std::string shape = "[dddd-dd-dd dd:dd:dd] ";
    if (line.size() < shape.size()) {
        return false;
    }
    for (size_t i = 0; i < shape.size(); ++i) {
        bool ok = shape[i] == 'd' ? std::isdigit(static_cast<unsigned char>(line[i])) != 0
                                  : line[i] == shape[i];
        if (!ok) {
            return false;
        }
    }
    return true;
}

} // namespace

/**
 * @brief Reports from several threads, interleaved with datetime rendering,
 * each carry a well-formed timestamp.
 */
void test_diagnostics_concurrent_timestamps()
{
    bool was_enabled = Diagnostics::is_enabled();
    std::vector<std::string> lines;

    {
        StderrCapture capture;
        Diagnostics::set_enabled(true);
        Diagnostics::set_min_level(DiagLevel::WARN);

        std::vector<std::thread> workers;
        for (int t = 0; t < 4; ++t) {
            workers.emplace_back([] {
                for (int i = 0; i < 25; ++i) {
                    Diagnostics::report(DiagLevel::WARN, "concurrent notice");
                }
            });
        }
        workers.emplace_back([] {
            prettylog::format::Formatter formatter;
            for (int i = 0; i < 100; ++i) {
                formatter.render_datetime(prettylog::core::LogEvent::Clock::now());
            }
        });
        for (auto& worker : workers) {
            worker.join();
        }

        Diagnostics::set_enabled(was_enabled);
        lines = prettylog::test::split_lines(capture.str());
    }

    ASSERT_EQ(lines.size(), static_cast<size_t>(100));
    for (const auto& line : lines) {
        ASSERT_TRUE(has_timestamp_prefix(line));
    }
}

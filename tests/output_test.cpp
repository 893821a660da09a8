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
 * @file output_test.cpp
 * @brief Integration tests for the output streams and the fan-out router.
 *
 * @details
 * File stream tests run inside a scratch directory that is purged before and
 * after each case. Console output is captured by swapping `std::cerr`'s buffer.
 */

#include "framework.hpp"
#include "helpers.hpp"
#include "prettylog/core/error.hpp"
#include "prettylog/core/log_event.hpp"
#include "prettylog/format/formatter.hpp"
#include "prettylog/output/buffer_stream.hpp"
#include "prettylog/output/file_stream.hpp"
#include "prettylog/output/output_router.hpp"
#include "prettylog/output/stderr_stream.hpp"

#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using prettylog::core::LogEvent;
using prettylog::core::OnDropPolicy;
using prettylog::format::Formatter;
using prettylog::output::BufferStream;
using prettylog::output::FileStream;
using prettylog::output::OutputRouter;
using prettylog::output::OutputStream;
using prettylog::test::read_lines;
using prettylog::test::ScratchDir;
using prettylog::test::StderrCapture;

namespace {

Formatter plain_formatter()
{
    Formatter formatter;
    formatter.config().set_header_color_enabled(false);
    return formatter;
}

/// Always fails with an I/O error when written to.
class FailingStream : public OutputStream {
  public:
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
    void out(const LogEvent&, const Formatter&) override
    {
        throw prettylog::core::IoError("sink unavailable");
    }
    std::string name() const override
    {
        return "failing";
    }

  private:
    bool enabled_ = true;
};

/// Fails with a plain std::runtime_error, as third-party sinks may.
class ThrowingStream : public FailingStream {
  public:
    void out(const LogEvent&, const Formatter&) override
    {
        throw std::runtime_error("sink down");
    }
    std::string name() const override
    {
        return "throwing";
    }
};

/// Records rendered lines in memory.
class RecordingStream : public OutputStream {
  public:
    explicit RecordingStream(std::vector<std::string>& lines) : lines_(lines) {}

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
    void out(const LogEvent& event, const Formatter& formatter) override
    {
        if (enabled_) {
            lines_.push_back(formatter.render(event));
        }
    }
    std::string name() const override
    {
        return "recording";
    }

  private:
    std::vector<std::string>& lines_;
    bool enabled_ = true;
};

} // namespace

/**
 * @brief The buffer stream stores copies only while enabled and clears on demand.
 */
void test_buffer_stream_capture()
{
    BufferStream buffer;
    Formatter formatter;

    ASSERT_FALSE(buffer.is_enabled());
    buffer.out(LogEvent::info("ignored"), formatter);
    ASSERT_TRUE(buffer.get_log_buffer().empty());

    buffer.enable();
    buffer.out(LogEvent::info("one"), formatter);
    buffer.out(LogEvent::error("two"));
    ASSERT_EQ(buffer.get_log_buffer().size(), static_cast<size_t>(2));
    ASSERT_EQ(buffer.get_log_buffer()[1].message(), std::string("two"));

    buffer.clear();
    ASSERT_TRUE(buffer.get_log_buffer().empty());
}

/**
 * @brief The console stream writes one newline-terminated line per event.
 */
void test_stderr_stream_output()
{
    prettylog::output::StderrStream stream;
    Formatter formatter = plain_formatter();
    ASSERT_TRUE(stream.is_enabled());

    StderrCapture capture;
    stream.out(LogEvent::info("hello"), formatter);
    stream.disable();
    stream.out(LogEvent::info("hidden"), formatter);

    ASSERT_EQ(capture.str(), std::string("[INF] hello\n"));
}

/**
 * @brief Enabling file output demands a writable path.
 */
void test_file_stream_enable_requires_path()
{
    ScratchDir dir("test_file_enable");
    FileStream stream;

    ASSERT_THROWS(stream.enable(), prettylog::core::PathError);
    ASSERT_THROWS(stream.set_log_file_path(dir.path()), prettylog::core::PathError);
    ASSERT_THROWS(stream.set_log_file_path(dir.file("missing/dir/out.log")),
                  prettylog::core::PathError);
    ASSERT_FALSE(stream.is_enabled());

    stream.set_log_file_path(dir.file("out.log"));
    stream.enable();
    ASSERT_TRUE(stream.is_enabled());

    stream.clear_log_file_path();
    ASSERT_FALSE(stream.is_enabled());
    ASSERT_FALSE(stream.log_file_path().has_value());
}

/**
 * @brief Reaching the buffer limit flushes every pending line at once.
 */
void test_file_stream_auto_flush()
{
    ScratchDir dir("test_file_autoflush");
    std::string path = dir.file("out.log");
    Formatter formatter = plain_formatter();

    FileStream stream;
    stream.set_log_file_path(path);
    stream.set_max_buffer_size(16);
    stream.enable();

    for (int i = 0; i < 15; ++i) {
        stream.out(LogEvent::info("line " + std::to_string(i)), formatter);
    }
    ASSERT_EQ(read_lines(path).size(), static_cast<size_t>(0));
    ASSERT_EQ(stream.pending_lines().size(), static_cast<size_t>(15));

    stream.out(LogEvent::info("line 15"), formatter);
    std::vector<std::string> lines = read_lines(path);
    ASSERT_EQ(lines.size(), static_cast<size_t>(16));
    ASSERT_EQ(lines.front(), std::string("[INF] line 0"));
    ASSERT_EQ(lines.back(), std::string("[INF] line 15"));
    ASSERT_TRUE(stream.pending_lines().empty());

    stream.out(LogEvent::info("line 16"), formatter);
    ASSERT_EQ(stream.pending_lines().size(), static_cast<size_t>(1));
    ASSERT_EQ(read_lines(path).size(), static_cast<size_t>(16));
}

/**
 * @brief While locked, neither writes nor flushes touch the file.
 */
void test_file_stream_lock_blocks_io()
{
    ScratchDir dir("test_file_lock");
    std::string path = dir.file("out.log");
    Formatter formatter = plain_formatter();

    FileStream stream;
    stream.set_log_file_path(path);
    stream.enable();
    stream.out(LogEvent::info("a"), formatter);
    stream.out(LogEvent::info("b"), formatter);

    stream.lock_file();
    ASSERT_TRUE(stream.is_locked());
    ASSERT_THROWS(stream.out(LogEvent::info("c"), formatter), prettylog::core::LockedError);
    ASSERT_THROWS(stream.flush(), prettylog::core::LockedError);
    ASSERT_EQ(read_lines(path).size(), static_cast<size_t>(0));
    ASSERT_EQ(stream.pending_lines().size(), static_cast<size_t>(2));

    stream.unlock_file();
    stream.flush();
    std::vector<std::string> lines = read_lines(path);
    ASSERT_EQ(lines.size(), static_cast<size_t>(2));
    ASSERT_EQ(lines[1], std::string("[INF] b"));
}

/**
 * @brief Discard policy drops pending lines of a locked stream on close.
 */
void test_file_stream_drop_discards_when_locked()
{
    ScratchDir dir("test_file_drop_discard");
    std::string path = dir.file("out.log");
    Formatter formatter = plain_formatter();

    {
        FileStream stream;
        stream.set_log_file_path(path);
        stream.set_on_drop_policy(OnDropPolicy::DiscardLogBuffer);
        stream.enable();
        for (int i = 0; i < 5; ++i) {
            stream.out(LogEvent::warning("w" + std::to_string(i)), formatter);
        }
        stream.lock_file();
    }

    ASSERT_EQ(read_lines(path).size(), static_cast<size_t>(0));
}

/**
 * @brief Ignore policy writes pending lines on close despite the lock.
 */
void test_file_stream_drop_ignores_lock()
{
    ScratchDir dir("test_file_drop_ignore");
    std::string path = dir.file("out.log");
    Formatter formatter = plain_formatter();

    FileStream stream;
    stream.set_log_file_path(path);
    stream.set_on_drop_policy(OnDropPolicy::IgnoreLogFileLock);
    stream.enable();
    for (int i = 0; i < 5; ++i) {
        stream.out(LogEvent::warning("w" + std::to_string(i)), formatter);
    }
    stream.lock_file();
    stream.close();

    ASSERT_TRUE(stream.is_closed());
    ASSERT_FALSE(stream.is_enabled());
    ASSERT_EQ(read_lines(path).size(), static_cast<size_t>(5));

    // Close runs once.
    stream.close();
    ASSERT_EQ(read_lines(path).size(), static_cast<size_t>(5));
}

/**
 * @brief An unlocked stream flushes its remainder when destroyed.
 */
void test_file_stream_flushes_on_destruction()
{
    ScratchDir dir("test_file_teardown");
    std::string path = dir.file("out.log");
    Formatter formatter = plain_formatter();

    {
        FileStream stream;
        stream.set_log_file_path(path);
        stream.enable();
        stream.out(LogEvent::error("last words"), formatter);
    }

    std::vector<std::string> lines = read_lines(path);
    ASSERT_EQ(lines.size(), static_cast<size_t>(1));
    ASSERT_EQ(lines[0], std::string("[ERR] last words"));
}

/**
 * @brief A stream switched off before teardown discards its pending lines.
 */
void test_file_stream_disabled_discards_on_destruction()
{
    ScratchDir dir("test_file_disabled_teardown");
    std::string path = dir.file("out.log");
    Formatter formatter = plain_formatter();

    {
        FileStream stream;
        stream.set_log_file_path(path);
        stream.enable();
        for (int i = 0; i < 5; ++i) {
            stream.out(LogEvent::info("stale " + std::to_string(i)), formatter);
        }
        stream.disable();
    }

    ASSERT_EQ(read_lines(path).size(), static_cast<size_t>(0));

    FileStream closed;
    closed.set_log_file_path(path);
    closed.enable();
    closed.out(LogEvent::info("dropped"), formatter);
    closed.disable();
    closed.close();
    ASSERT_TRUE(closed.pending_lines().empty());
    ASSERT_EQ(read_lines(path).size(), static_cast<size_t>(0));
}

/**
 * @brief A failed write keeps the buffer so a later flush can retry.
 */
void test_file_stream_flush_retry()
{
    ScratchDir dir("test_file_retry");
    std::string sub = dir.file("sub");
    std::filesystem::create_directories(sub);
    std::string path = sub + "/out.log";
    Formatter formatter = plain_formatter();

    FileStream stream;
    stream.set_log_file_path(path);
    stream.enable();
    stream.out(LogEvent::info("kept"), formatter);

    std::filesystem::remove_all(sub);
    ASSERT_THROWS(stream.flush(), prettylog::core::IoError);
    ASSERT_EQ(stream.pending_lines().size(), static_cast<size_t>(1));

    std::filesystem::create_directories(sub);
    stream.flush();
    ASSERT_TRUE(stream.pending_lines().empty());
    ASSERT_EQ(read_lines(path).size(), static_cast<size_t>(1));
}

/**
 * @brief One failing stream does not starve the streams after it.
 */
void test_router_best_effort_dispatch()
{
    OutputRouter router;
    router.stderr_output().disable();
    router.buffer_output().enable();

    std::vector<std::string> recorded;
    router.add_stream(std::make_unique<FailingStream>());
    router.add_stream(std::make_unique<RecordingStream>(recorded));
    ASSERT_EQ(router.extra_stream_count(), static_cast<size_t>(2));

    bool caught = false;
    try {
        router.dispatch(LogEvent::error("fan out"), plain_formatter());
    } catch (const prettylog::core::DispatchError& e) {
        caught = true;
        ASSERT_EQ(e.failures().size(), static_cast<size_t>(1));
        ASSERT_EQ(e.failures()[0].stream, std::string("failing"));
        ASSERT_TRUE(e.contains(prettylog::core::ErrorKind::Io));
    }
    ASSERT_TRUE(caught);

    ASSERT_EQ(router.buffer_output().get_log_buffer().size(), static_cast<size_t>(1));
    ASSERT_EQ(recorded.size(), static_cast<size_t>(1));
    ASSERT_EQ(recorded[0], std::string("[ERR] fan out"));

    ASSERT_THROWS(router.add_stream(nullptr), std::invalid_argument);
}

/**
 * @brief A user stream throwing a non-library exception is recorded, not propagated.
 */
void test_router_isolates_foreign_exceptions()
{
    OutputRouter router;
    router.stderr_output().disable();

    std::vector<std::string> recorded;
    router.add_stream(std::make_unique<ThrowingStream>());
    router.add_stream(std::make_unique<RecordingStream>(recorded));

    bool caught = false;
    try {
        router.dispatch(LogEvent::warning("still delivered"), plain_formatter());
    } catch (const prettylog::core::DispatchError& e) {
        caught = true;
        ASSERT_EQ(e.failures().size(), static_cast<size_t>(1));
        ASSERT_EQ(e.failures()[0].stream, std::string("throwing"));
        ASSERT_EQ(e.failures()[0].message, std::string("sink down"));
        ASSERT_TRUE(e.contains(prettylog::core::ErrorKind::Io));
    }
    ASSERT_TRUE(caught);

    ASSERT_EQ(recorded.size(), static_cast<size_t>(1));
    ASSERT_EQ(recorded[0], std::string("[WAR] still delivered"));
}

/**
 * @brief A locked file output surfaces as a Locked failure inside DispatchError.
 */
void test_router_reports_locked_file()
{
    ScratchDir dir("test_router_locked");
    OutputRouter router;
    router.stderr_output().disable();
    router.buffer_output().enable();
    router.file_output().set_log_file_path(dir.file("out.log"));
    router.file_output().enable();
    router.file_output().lock_file();

    bool caught = false;
    try {
        router.dispatch(LogEvent::info("x"), plain_formatter());
    } catch (const prettylog::core::DispatchError& e) {
        caught = true;
        ASSERT_TRUE(e.contains(prettylog::core::ErrorKind::Locked));
    }
    ASSERT_TRUE(caught);
    ASSERT_EQ(router.buffer_output().get_log_buffer().size(), static_cast<size_t>(1));
}

/**
 * @brief The router's master switch silences every stream.
 */
void test_router_master_gate()
{
    OutputRouter router;
    router.buffer_output().enable();

    StderrCapture capture;
    router.disable();
    router.dispatch(LogEvent::fatal("muted"), plain_formatter());

    ASSERT_TRUE(capture.str().empty());
    ASSERT_TRUE(router.buffer_output().get_log_buffer().empty());

    router.enable();
    router.dispatch(LogEvent::fatal("heard"), plain_formatter());
    ASSERT_EQ(capture.str(), std::string("[FATAL] heard\n"));
    ASSERT_EQ(router.buffer_output().get_log_buffer().size(), static_cast<size_t>(1));
}

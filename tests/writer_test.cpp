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
 * @file writer_test.cpp
 * @brief Tests for persistence, rotation and viewer forwarding.
 *
 * @details
 * Rotation tests drive `Writer::process` directly with a simulated clock, so file
 * switches happen at exactly known instants without sleeping. The threaded tests
 * check the stop handshake used during shutdown.
 */

#include "framework.hpp"
#include "xlogd/infra/clock.hpp"
#include "xlogd/infra/config.hpp"
#include "xlogd/infra/record_queue.hpp"
#include "xlogd/record/normalizer.hpp"
#include "xlogd/storage/writer.hpp"
#include "xlogd/view/viewer.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;

using xlogd::infra::Clock;
using xlogd::infra::Config;
using xlogd::infra::RecordQueue;
using xlogd::record::Normalizer;
using xlogd::storage::Writer;

namespace {

/**
 * @class WriterTestDir
 * @brief RAII infrastructure for an isolated log directory.
 *
 * - **Construction**: Purges leftovers from an earlier aborted run.
 * - **Destruction**: Removes everything the test wrote.
 */
class WriterTestDir {
  public:
    const std::string path = "./test_xlogd_writer";

    WriterTestDir()
    {
        if (fs::exists(path)) {
            fs::remove_all(path);
        }
    }

    ~WriterTestDir()
    {
        if (fs::exists(path)) {
            fs::remove_all(path);
        }
    }
};

std::vector<std::string> read_lines(const std::string& file)
{
    std::vector<std::string> lines;
    std::ifstream in(file);
    std::string line;
    while (std::getline(in, line)) {
        lines.push_back(line);
    }
    return lines;
}

/// Counts renders and remembers the last `_id` field.
class RecordingViewer : public xlogd::view::Viewer {
  public:
    int renders = 0;
    std::string last_id;

    void render(const xlogd::record::RecordFields& fields, const cJSON*) override
    {
        ++renders;
        last_id = fields.id;
    }
};

class ThrowingViewer : public xlogd::view::Viewer {
  public:
    void render(const xlogd::record::RecordFields&, const cJSON*) override
    {
        throw std::runtime_error("viewer exploded");
    }
};

/// Blocks inside `render` until released, like a console stuck on a full pipe.
class HangingViewer : public xlogd::view::Viewer {
  public:
    std::atomic<bool> entered{false};
    std::atomic<bool> released{false};

    void render(const xlogd::record::RecordFields&, const cJSON*) override
    {
        entered = true;
        while (!released) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
    }
};

/// 2022-01-07 23:59:59.5 UTC, half a second before a day boundary.
constexpr double kBeforeMidnight = 1641599999.5;

} // namespace

/**
 * @brief Crossing midnight moves the next record into the new day's file.
 *
 * **Scenario Execution:**
 * 1. Write one record at 23:59:59.5 into `<dir>/220107/day.log`.
 * 2. Advance one second and write another.
 * 3. Expect `<dir>/220108/day.log` to hold the second record.
 */
void test_writer_rotates_at_midnight()
{
    WriterTestDir dir;
    double now = kBeforeMidnight;
    Clock clock([&now] { return now; });
    Normalizer normalizer(clock);
    RecordQueue queue;

    Config cfg;
    cfg.log_path = dir.path + "/~ymd~/day.log";

    {
        Writer writer(cfg, clock, queue, nullptr);
        writer.process(normalizer.normalize("1.2.3.4\t{\"n\":1}").record);
        ASSERT_EQ(writer.current_path(), dir.path + "/220107/day.log");

        now += 1.0;
        writer.process(normalizer.normalize("1.2.3.4\t{\"n\":2}").record);
        ASSERT_EQ(writer.current_path(), dir.path + "/220108/day.log");

        ASSERT_EQ(writer.files_opened(), static_cast<size_t>(2));
        ASSERT_EQ(writer.records_written(), static_cast<size_t>(2));
    }

    std::vector<std::string> first = read_lines(dir.path + "/220107/day.log");
    std::vector<std::string> second = read_lines(dir.path + "/220108/day.log");
    ASSERT_EQ(first.size(), static_cast<size_t>(1));
    ASSERT_EQ(second.size(), static_cast<size_t>(1));
    ASSERT_CONTAINS(first[0], std::string("\"n\":1"));
    ASSERT_CONTAINS(second[0], std::string("\"n\":2"));
}

/**
 * @brief The path is re-evaluated at most once per second of clock time.
 *
 * With a per-second template, records 0.3 s and 0.8 s after the first check stay
 * in the first file even though the wall-clock second has changed.
 */
void test_writer_rotation_check_throttled()
{
    WriterTestDir dir;
    double now = 1700000000.7;
    Clock clock([&now] { return now; });
    Normalizer normalizer(clock);
    RecordQueue queue;

    Config cfg;
    cfg.log_path = dir.path + "/~hms~.log";

    Writer writer(cfg, clock, queue, nullptr);
    for (double t : {1700000000.7, 1700000001.0, 1700000001.5}) {
        now = t;
        writer.process(normalizer.normalize("1.2.3.4\t{}").record);
    }
    ASSERT_EQ(writer.files_opened(), static_cast<size_t>(1));
    ASSERT_EQ(writer.current_path(), dir.path + "/221320.log");

    now = 1700000001.8;
    writer.process(normalizer.normalize("1.2.3.4\t{}").record);
    ASSERT_EQ(writer.files_opened(), static_cast<size_t>(2));
    ASSERT_EQ(writer.current_path(), dir.path + "/221321.log");
    ASSERT_EQ(read_lines(dir.path + "/221320.log").size(), static_cast<size_t>(3));
}

/**
 * @brief Verbose mode without a path renders every record and persists nothing.
 */
void test_writer_console_only()
{
    Clock clock([] { return 1700000000.0; });
    Normalizer normalizer(clock);
    RecordQueue queue;
    RecordingViewer viewer;

    Config cfg;
    cfg.verbose = true;

    Writer writer(cfg, clock, queue, &viewer);
    writer.process(normalizer.normalize("1.2.3.4\t{\"_id\":42}").record);

    ASSERT_EQ(viewer.renders, 1);
    ASSERT_EQ(viewer.last_id, std::string("0042"));
    ASSERT_EQ(writer.records_written(), static_cast<size_t>(0));
}

/**
 * @brief A failing viewer never prevents the record from being persisted.
 */
void test_writer_viewer_fault_isolated()
{
    WriterTestDir dir;
    Clock clock([] { return 1700000000.0; });
    Normalizer normalizer(clock);
    RecordQueue queue;
    ThrowingViewer viewer;

    Config cfg;
    cfg.verbose = true;
    cfg.log_path = dir.path + "/viewer.log";

    {
        Writer writer(cfg, clock, queue, &viewer);
        writer.process(normalizer.normalize("1.2.3.4\t{\"a\":1}").record);
        writer.process(normalizer.normalize("1.2.3.4\t{\"a\":2}").record);
        ASSERT_EQ(writer.records_written(), static_cast<size_t>(2));
    }
    ASSERT_EQ(read_lines(dir.path + "/viewer.log").size(), static_cast<size_t>(2));
}

void test_writer_requires_sink()
{
    Clock clock;
    RecordQueue queue;
    Config cfg;

    Writer writer(cfg, clock, queue, nullptr);
    bool threw = false;
    try {
        writer.start();
    } catch (const xlogd::storage::WriterError&) {
        threw = true;
    }
    ASSERT_TRUE(threw);
}

/**
 * @brief The writer thread drains the queue and acknowledges a stop request.
 */
void test_writer_thread_stop_handshake()
{
    WriterTestDir dir;
    Clock clock;
    Normalizer normalizer(clock);
    RecordQueue queue;

    Config cfg;
    cfg.log_path = dir.path + "/~me~.log";
    cfg.me = "handshake";

    Writer writer(cfg, clock, queue, nullptr);
    writer.start();
    for (int i = 0; i < 3; ++i) {
        queue.push(normalizer.normalize("1.2.3.4\t{\"i\":" + std::to_string(i) + "}").record);
    }

    for (int i = 0; i < 100 && !queue.empty(); ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    ASSERT_TRUE(queue.empty());

    writer.request_stop();
    ASSERT_TRUE(writer.wait_stopped(std::chrono::seconds(5)));
    ASSERT_TRUE(writer.stopped());
    ASSERT_FALSE(writer.failed());
    writer.close();

    std::vector<std::string> lines = read_lines(dir.path + "/handshake.log");
    ASSERT_EQ(lines.size(), static_cast<size_t>(3));
    ASSERT_CONTAINS(lines[2], std::string("\"i\":2"));
}

/**
 * @brief A writer stuck in its viewer is detached on destruction instead of joined.
 *
 * The viewer has static storage because the detached thread returns into it once
 * released, after the writer and the queue are gone.
 */
void test_writer_detaches_hung_thread()
{
    static HangingViewer viewer;
    Clock clock;
    Normalizer normalizer(clock);
    RecordQueue queue;

    Config cfg;
    cfg.verbose = true;

    bool acknowledged = true;
    auto begin = std::chrono::steady_clock::now();
    {
        Writer writer(cfg, clock, queue, &viewer);
        writer.start();
        queue.push(normalizer.normalize("1.2.3.4\t{\"hang\":1}").record);
        for (int i = 0; i < 250 && !viewer.entered; ++i) {
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }

        writer.request_stop();
        acknowledged = writer.wait_stopped(std::chrono::milliseconds(500));
        writer.close();
    }
    auto elapsed = std::chrono::steady_clock::now() - begin;
    viewer.released = true;

    ASSERT_TRUE(viewer.entered.load());
    ASSERT_FALSE(acknowledged);
    ASSERT_TRUE(elapsed < std::chrono::seconds(8));
}

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
 * @file writer.hpp
 * @brief Single-consumer persistence stage with time-driven file rotation.
 *
 * @details
 * This header declares the `Writer` class, the only component that touches the
 * flat files. It drains the shared `RecordQueue` on a dedicated thread and appends
 * every record to the file named by the path template, re-resolving that name at
 * most once per second of clock advance.
 */

#pragma once

#include "xlogd/infra/clock.hpp"
#include "xlogd/infra/config.hpp"
#include "xlogd/infra/record_queue.hpp"
#include "xlogd/view/viewer.hpp"

#include <chrono>
#include <cstddef>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>

namespace xlogd::storage {

/**
 * @class WriterError
 * @brief A persistence fault with no console fallback, or an unusable configuration.
 */
class WriterError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

/**
 * @class Writer
 * @brief Drains the record queue into time-rotated flat files.
 *
 * **Loop body** (writer thread):
 * 1. **Stop:** If a stop was requested, close the file, acknowledge, and exit.
 * 2. **Pop:** Wait up to `kPollInterval` for a record; on timeout go back to 1.
 * 3. **Rotate:** If at least one second passed since the last check, flush and
 *    `fsync` the previous batch, re-resolve the path and close the file if it changed.
 * 4. **Append:** Open lazily (creating directories) with line buffering and write.
 * 5. **View:** In verbose mode, decode the record and hand it to the viewer.
 *
 * **Ownership:** everything the thread touches lives in a `Worker` that the thread
 * co-owns with the `Writer`. The path, file handle, last-check time and since-flush
 * counter are touched only by the thread running `process()`.
 *
 * **Bounded exit:** if the thread does not acknowledge a stop within `kDetachGrace`,
 * the destructor detaches it instead of joining. Such a thread reaches the clock
 * and the queue again only after passing the stop check, which it never passes, so
 * only the viewer has to outlive it.
 */
class Writer {
  public:
    /// @brief Bounded wait of each queue pop.
    static constexpr std::chrono::milliseconds kPollInterval{250};

    /// @brief How long the destructor waits for a stop acknowledgement before detaching.
    static constexpr std::chrono::milliseconds kDetachGrace{1000};

    /**
     * @param config Settings; `log_path`, `verbose` and `me` are copied.
     * @param clock Shared clock consulted for rotation decisions.
     * @param queue The queue to drain.
     * @param viewer Renderer used when `config.verbose` is set; may be null otherwise.
     */
    Writer(const infra::Config& config, infra::Clock& clock, infra::RecordQueue& queue,
           view::Viewer* viewer);

    /// @brief Requests a stop, then joins the writer thread or detaches it if it hangs.
    ~Writer();

    Writer(const Writer&) = delete;
    Writer& operator=(const Writer&) = delete;

    /// @brief Spawns the writer thread.
    void start();

    /// @brief Asks the writer thread to exit at its next loop iteration. Idempotent.
    void request_stop();

    /**
     * @brief Waits for the writer thread to acknowledge the stop.
     *
     * @return true if the writer reported stopped within `timeout`.
     */
    bool wait_stopped(std::chrono::milliseconds timeout);

    /// @brief True once the writer thread has exited (normally or after a fault).
    bool stopped() const;

    /// @brief True if the writer thread exited because of a `WriterError`.
    bool failed() const;

    /**
     * @brief Joins a stopped writer thread and closes any file it left open.
     *
     * Does nothing to the file if the thread has not acknowledged its stop.
     */
    void close();

    /**
     * @brief Persists and/or renders one record. Runs on the writer thread.
     *
     * Exposed so tests can drive rotation deterministically without a thread.
     *
     * @throws WriterError on an unrecoverable persistence fault.
     */
    void process(const std::string& record);

    /// @brief Records appended to files since construction.
    size_t records_written() const;

    /// @brief Files opened since construction.
    size_t files_opened() const;

    /// @brief Path of the file currently selected (empty before the first record).
    std::string current_path() const;

  private:
    class Worker;

    std::shared_ptr<Worker> worker_;
    std::thread thread_;
};

} // namespace xlogd::storage

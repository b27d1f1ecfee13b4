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
 * @file record_queue.hpp
 * @brief Unbounded FIFO hand-off between connection threads and the writer.
 *
 * @details
 * This header defines the `RecordQueue` class, the producer-consumer channel of
 * the ingestion pipeline. Any number of connection threads push formatted records;
 * exactly one writer thread pops them. The pop has a bounded wait so the consumer
 * can periodically re-check its stop flag while idle.
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <queue>
#include <string>

namespace xlogd::infra {

/**
 * @class RecordQueue
 * @brief A thread-safe, unbounded FIFO of formatted record lines.
 *
 * **Concurrency Model:**
 * - **Producers:** Any thread can `push()`; records from one thread keep their order.
 * - **Consumer:** One thread calls `pop_for()`, sleeping on a condition variable
 *   until a record arrives or the timeout elapses.
 */
class RecordQueue {
  public:
    RecordQueue() = default;

    RecordQueue(const RecordQueue&) = delete;
    RecordQueue& operator=(const RecordQueue&) = delete;

    /**
     * @brief Appends a record and wakes the consumer.
     *
     * @param record A complete formatted record line.
     */
    void push(std::string record);

    /**
     * @brief Removes the oldest record, waiting at most `timeout` for one to arrive.
     *
     * @return The record, or `std::nullopt` if the queue stayed empty.
     */
    std::optional<std::string> pop_for(std::chrono::milliseconds timeout);

    /// @brief True when no record is pending.
    bool empty() const;

    /// @brief Number of pending records.
    size_t size() const;

  private:
    std::queue<std::string> records_;
    mutable std::mutex mutex_;
    std::condition_variable condition_;
};

} // namespace xlogd::infra

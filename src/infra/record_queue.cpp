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
 * @file record_queue.cpp
 * @brief Implementation of the record hand-off queue.
 */

#include "xlogd/infra/record_queue.hpp"

namespace xlogd::infra {

/**
 * @brief Producer side. Appends under the lock, then signals outside it.
 */
void RecordQueue::push(std::string record)
{
    {
        std::unique_lock<std::mutex> lock(mutex_);
        records_.emplace(std::move(record));
    }

    // Single consumer, so waking one waiter is enough.
    condition_.notify_one();
}

/**
 * @brief Consumer side. Blocks until a record is available or `timeout` elapses.
 */
std::optional<std::string> RecordQueue::pop_for(std::chrono::milliseconds timeout)
{
    std::unique_lock<std::mutex> lock(mutex_);

    if (!condition_.wait_for(lock, timeout, [this] { return !records_.empty(); })) {
        return std::nullopt;
    }

    std::string record = std::move(records_.front());
    records_.pop();
    return record;
}

bool RecordQueue::empty() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.empty();
}

size_t RecordQueue::size() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size();
}

} // namespace xlogd::infra

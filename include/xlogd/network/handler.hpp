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
 * @file handler.hpp
 * @brief Line protocol dispatcher between the socket layer and the pipeline.
 *
 * @details
 * This header declares the `Handler` class, which interprets one client line at a
 * time and produces the reply to send back. It knows nothing about sockets, so the
 * whole protocol can be exercised without a network.
 */

#pragma once

#include "xlogd/infra/record_queue.hpp"
#include "xlogd/record/normalizer.hpp"

#include <atomic>
#include <optional>
#include <string>

namespace xlogd::network {

/**
 * @class Handler
 * @brief Maps one received line to its side effects and reply.
 *
 * | Line                | Effect                         | Reply           |
 * |---------------------|--------------------------------|-----------------|
 * | empty               | none                           | none            |
 * | `!STOP!`            | sets the stop flag             | `OK`            |
 * | `!...!`             | none (liveness echo)           | `OK|<line>`     |
 * | anything else       | normalize, enqueue on success  | `OK` / `E: <r>` |
 */
class Handler {
  public:
    /// @brief The remote shutdown command.
    static constexpr const char* kStopCommand = "!STOP!";

    /**
     * @param normalizer Builds records from submissions.
     * @param queue Receives accepted records.
     * @param stop_flag Set by `!STOP!`; owned by the daemon.
     * @param ippfx Address prefix stripped in diagnostics.
     */
    Handler(const record::Normalizer& normalizer, infra::RecordQueue& queue,
            std::atomic<bool>& stop_flag, std::string ippfx);

    /**
     * @brief Processes one line from `client_ip`.
     *
     * @param raw_line The line as read, without its `\n`; trailing whitespace is stripped here.
     * @param client_ip The peer's dotted address.
     * @return The reply without its terminating newline, or `std::nullopt` for no reply.
     */
    std::optional<std::string> process(const std::string& raw_line,
                                       const std::string& client_ip) const;

    /// @brief `ip` with the configured prefix removed, for log messages.
    std::string short_ip(const std::string& ip) const;

  private:
    const record::Normalizer& normalizer_;
    infra::RecordQueue& queue_;
    std::atomic<bool>& stop_flag_;
    std::string ippfx_;
};

} // namespace xlogd::network

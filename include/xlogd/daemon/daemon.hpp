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
 * @file daemon.hpp
 * @brief Process lifecycle: component wiring, main loop and ordered shutdown.
 *
 * @details
 * `Daemon` owns every pipeline component and is the only place that knows the
 * order in which they start and stop. The shutdown sequence guarantees that every
 * submission acknowledged with `OK` is on disk (or rendered) before `run()` returns.
 */

#pragma once

#include "xlogd/infra/clock.hpp"
#include "xlogd/infra/config.hpp"
#include "xlogd/infra/record_queue.hpp"
#include "xlogd/network/handler.hpp"
#include "xlogd/network/server.hpp"
#include "xlogd/record/normalizer.hpp"
#include "xlogd/storage/writer.hpp"
#include "xlogd/view/viewer.hpp"

#include <atomic>
#include <chrono>
#include <string>
#include <thread>

namespace xlogd::daemon {

/**
 * @class Daemon
 * @brief Shutdown coordinator and owner of the ingestion pipeline.
 *
 * **Lifecycle of `run()`:**
 * 1. Start the writer thread and enqueue the `main begins` marker.
 * 2. Bind the listener and run its accept loop on a background thread.
 * 3. Poll until `!STOP!`, `interrupt()`, or a fatal writer/listener failure.
 * 4. Stop the listener, enqueue the `main ends` marker, wait for the queue to
 *    drain, stop the writer and close its file, join the listener thread.
 */
class Daemon {
  public:
    /// @brief Main loop poll period.
    static constexpr std::chrono::milliseconds kPollInterval{100};

    /// @brief Longest wait for the writer to empty the queue during shutdown.
    static constexpr std::chrono::seconds kDrainTimeout{10};

    /// @brief Longest wait for the writer to acknowledge its stop request.
    static constexpr std::chrono::seconds kStopTimeout{10};

    /**
     * @param config Validated configuration; must outlive the daemon.
     * @param viewer Console renderer used in verbose mode; may be null otherwise.
     */
    Daemon(const infra::Config& config, view::Viewer* viewer);

    /// @brief Runs the shutdown sequence if `run()` was interrupted by an exception.
    ~Daemon();

    Daemon(const Daemon&) = delete;
    Daemon& operator=(const Daemon&) = delete;

    /**
     * @brief Runs the daemon until it is told to stop.
     *
     * @return 0 on a clean stop, 1 if the writer or listener failed.
     */
    int run();

    /// @brief Same effect as a client sending `!STOP!`.
    void request_stop() { stop_ = true; }

    /**
     * @brief Flags the daemon to stop.
     *
     * Only touches a lock-free atomic, so it may be called from a signal handler.
     * An interrupt raised before `run()` stays pending; the run that sees it clears it.
     */
    static void interrupt();

    /// @brief True once the listener is accepting connections.
    bool ready() const { return ready_.load(); }

    /// @brief The bound listener port, or -1 before `ready()`.
    int port() const { return server_.port(); }

    /// @brief Read-only view of the listener and its connection counters.
    const network::Server& server() const { return server_; }

  private:
    static std::atomic<bool> interrupted_;

    const infra::Config& config_;
    infra::Clock clock_;
    infra::RecordQueue queue_;
    std::atomic<bool> stop_;
    std::atomic<bool> ready_;
    std::atomic<bool> server_failed_;
    bool writer_started_;
    bool shut_down_;

    record::Normalizer normalizer_;
    storage::Writer writer_;
    network::Handler handler_;
    network::Server server_;
    std::thread server_thread_;

    void enqueue_marker(const std::string& event);
    void shutdown();
};

} // namespace xlogd::daemon

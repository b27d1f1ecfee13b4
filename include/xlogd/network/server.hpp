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
 * @file server.hpp
 * @brief Multi-threaded TCP listener for log submissions.
 *
 * @details
 * This header declares the `Server` class, the network entry point of the daemon.
 * It handles the BSD socket operations (bind, listen, accept) and runs one thread
 * per accepted connection, each reading newline-terminated lines and replying
 * through the `Handler`.
 */

#pragma once

#include "xlogd/infra/config.hpp"
#include "xlogd/network/handler.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace xlogd::network {

/**
 * @class Server
 * @brief A thread-per-connection TCP server for the line protocol.
 *
 * **Operational Workflow:**
 * 1. **Listen:** `listen()` binds the configured host/port (port 0 picks one).
 * 2. **Accept:** `run()` blocks on `accept()` until `stop()` shuts the listener down.
 * 3. **Serve:** Each connection gets a detached thread running `handle_client`.
 * 4. **Cleanup:** `stop()` half-closes every registered client socket and waits for
 *    the connection threads to finish, so no submission is accepted after it returns.
 */
class Server {
  public:
    /// @brief Upper bound on a single line; longer lines drop the connection.
    static constexpr size_t kMaxLineLength = 1 << 20;

    /// @brief How long `stop()` waits for connection threads to exit.
    static constexpr std::chrono::seconds kDrainTimeout{5};

    /**
     * @param config Supplies `host`, `port` and `ippfx`.
     * @param handler Line protocol dispatcher shared by all connections.
     */
    Server(const infra::Config& config, const Handler& handler);

    /// @brief Stops the server and closes the listening socket.
    ~Server();

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    /**
     * @brief Creates, binds and listens on the server socket.
     *
     * @return false (after logging FATAL) if any step fails.
     */
    bool listen();

    /**
     * @brief Runs the accept loop. Calls `listen()` first if needed.
     *
     * @note Blocking. Returns after `stop()` or a fatal socket error.
     *
     * @return false if the server could not start listening.
     */
    bool run();

    /**
     * @brief Stops accepting, disconnects every client, and waits for their threads.
     *
     * Idempotent and safe to call from any thread other than a connection thread.
     */
    void stop();

    /// @brief The bound port (useful when configured with port 0), or -1 before `listen()`.
    int port() const { return bound_port_.load(); }

    /// @brief True between a successful `listen()` and `stop()`.
    bool running() const { return running_.load(); }

    /// @brief Connections currently open.
    int open_connections() const { return open_connections_.load(); }

    /// @brief Connections accepted since construction.
    uint64_t total_connections() const { return total_connections_.load(); }

  private:
    const infra::Config& config_;
    const Handler& handler_;

    int server_fd_;
    std::atomic<int> bound_port_;
    std::atomic<bool> running_;
    std::atomic<bool> stopping_;

    std::atomic<int> open_connections_;
    std::atomic<uint64_t> total_connections_;

    /// @brief Registry of connected client sockets.
    std::vector<int> client_sockets_;
    std::mutex client_mutex_;
    std::condition_variable clients_done_;

    void handle_client(int sock, std::string client_ip);
    bool send_line(int sock, const std::string& reply);
    void add_client(int sock);
    void remove_client(int sock);
};

} // namespace xlogd::network

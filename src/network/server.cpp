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
 * @file server.cpp
 * @brief Implementation of the TCP listener and per-connection read loop.
 *
 * @details
 * Raw BSD sockets. Each connection thread owns its socket descriptor and is the
 * only one that closes it; `stop()` merely half-closes sockets to wake blocked
 * `recv()` calls, so a descriptor is never closed twice or reused under a reader.
 */

#include "xlogd/network/server.hpp"

#include "xlogd/infra/logger.hpp"

#include <algorithm>
#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <netinet/in.h>
#include <sys/socket.h>
#include <thread>
#include <unistd.h>

namespace xlogd::network {

Server::Server(const infra::Config& config, const Handler& handler)
    : config_(config), handler_(handler), server_fd_(-1), bound_port_(-1), running_(false),
      stopping_(false), open_connections_(0), total_connections_(0)
{
}

Server::~Server()
{
    stop();
    if (server_fd_ >= 0) {
        close(server_fd_);
        server_fd_ = -1;
    }
}

bool Server::listen()
{
    if (server_fd_ >= 0) {
        return true;
    }

    int fd = socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
        infra::Logger::log(infra::LogLevel::FATAL, "Network: Failed to create socket: " +
                                                       std::string(std::strerror(errno)));
        return false;
    }

    // Allow immediate address reuse to facilitate quick restarts.
    int opt = 1;
    if (setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
        infra::Logger::log(infra::LogLevel::ERROR, "Network: setsockopt(SO_REUSEADDR) failed.");
    }

    struct sockaddr_in address;
    std::memset(&address, 0, sizeof(address));
    address.sin_family = AF_INET;
    address.sin_port = htons(static_cast<uint16_t>(config_.port));

    std::string host = config_.host == "localhost" ? "127.0.0.1" : config_.host;
    if (host.empty() || host == "0.0.0.0") {
        address.sin_addr.s_addr = INADDR_ANY;
    } else if (inet_pton(AF_INET, host.c_str(), &address.sin_addr) != 1) {
        infra::Logger::log(infra::LogLevel::FATAL, "Network: Invalid host '" + config_.host + "'");
        close(fd);
        return false;
    }

    if (bind(fd, (struct sockaddr*)&address, sizeof(address)) < 0) {
        infra::Logger::log(infra::LogLevel::FATAL, "Network: Failed to bind to " + config_.host +
                                                       ":" + std::to_string(config_.port) + ": " +
                                                       std::strerror(errno));
        close(fd);
        return false;
    }

    if (::listen(fd, SOMAXCONN) < 0) {
        infra::Logger::log(infra::LogLevel::FATAL, "Network: Failed to listen.");
        close(fd);
        return false;
    }

    socklen_t len = sizeof(address);
    if (getsockname(fd, (struct sockaddr*)&address, &len) == 0) {
        bound_port_ = ntohs(address.sin_port);
    } else {
        bound_port_ = config_.port;
    }

    server_fd_ = fd;
    running_ = true;
    infra::Logger::log(infra::LogLevel::INFO, "Network: xlogd listening on " + config_.host +
                                                  ":" + std::to_string(bound_port_.load()));
    return true;
}

/**
 * @brief Accept loop. Blocks until `stop()` shuts the listening socket down.
 */
bool Server::run()
{
    if (!listen()) {
        return false;
    }

    while (running_) {
        struct sockaddr_in client_addr;
        socklen_t len = sizeof(client_addr);

        int sock = accept(server_fd_, (struct sockaddr*)&client_addr, &len);

        if (sock < 0) {
            if (!running_) {
                break;
            }
            if (errno == EINTR || errno == ECONNABORTED) {
                continue;
            }
            infra::Logger::log(infra::LogLevel::ERROR,
                               "Network: Accept failed: " + std::string(std::strerror(errno)));
            continue;
        }

        char ip_buf[INET_ADDRSTRLEN] = {0};
        std::string client_ip = inet_ntop(AF_INET, &client_addr.sin_addr, ip_buf, sizeof(ip_buf))
                                    ? ip_buf
                                    : "unknown";

        add_client(sock);
        if (stopping_) {
            remove_client(sock);
            break;
        }

        uint64_t n = ++total_connections_;
        infra::Logger::log(infra::LogLevel::INFO,
                           "Network: connection " + std::to_string(n) + " (" +
                               std::to_string(open_connections_.load()) + " open): " +
                               handler_.short_ip(client_ip) + ":" +
                               std::to_string(ntohs(client_addr.sin_port)));

        std::thread([this, sock, client_ip]() { this->handle_client(sock, client_ip); }).detach();
    }

    infra::Logger::log(infra::LogLevel::INFO, "Network: Server event loop terminated.");
    return true;
}

/**
 * @brief Gracefully terminates the server.
 *
 * 1. Clears the running flag and shuts the listener down to unblock `accept()`.
 * 2. Half-closes every client socket to unblock the connection threads.
 * 3. Waits for all connection threads to deregister.
 */
void Server::stop()
{
    {
        std::lock_guard<std::mutex> lock(client_mutex_);
        if (stopping_) {
            return;
        }
        stopping_ = true;
    }
    running_ = false;

    if (server_fd_ >= 0) {
        shutdown(server_fd_, SHUT_RDWR);
    }

    std::unique_lock<std::mutex> lock(client_mutex_);
    for (int sock : client_sockets_) {
        shutdown(sock, SHUT_RDWR);
    }

    bool drained = clients_done_.wait_for(lock, kDrainTimeout,
                                          [this] { return client_sockets_.empty(); });
    if (!drained) {
        infra::Logger::log(infra::LogLevel::ERROR,
                           "Network: " + std::to_string(client_sockets_.size()) +
                               " connection(s) did not close in time");
    }
}

/**
 * @brief Client read loop (connection thread).
 *
 * Splits the byte stream on `\n`, dispatching each line to the handler and sending
 * its reply. A final unterminated line is still processed at end-of-stream.
 */
void Server::handle_client(int sock, std::string client_ip)
{
    const std::string who = handler_.short_ip(client_ip);
    std::string pending;
    char buffer[8192];

    while (true) {
        ssize_t read_len = recv(sock, buffer, sizeof(buffer), 0);

        if (read_len > 0) {
            pending.append(buffer, static_cast<size_t>(read_len));

            bool ok = true;
            size_t start = 0;
            size_t nl;
            while (ok && (nl = pending.find('\n', start)) != std::string::npos) {
                auto reply = handler_.process(pending.substr(start, nl - start), client_ip);
                start = nl + 1;
                if (reply) {
                    ok = send_line(sock, *reply);
                }
            }
            pending.erase(0, start);
            if (!ok) {
                break;
            }

            if (pending.size() > kMaxLineLength) {
                infra::Logger::log(infra::LogLevel::ERROR,
                                   "Network: client " + who + " sent a line over " +
                                       std::to_string(kMaxLineLength) + " bytes; dropping");
                break;
            }
        } else if (read_len == 0) {
            if (!pending.empty()) {
                auto reply = handler_.process(pending, client_ip);
                if (reply) {
                    send_line(sock, *reply);
                }
            }
            infra::Logger::log(infra::LogLevel::INFO, "Network: client " + who + ": no more rx");
            break;
        } else if (errno == EINTR) {
            continue;
        } else if (errno == ECONNRESET) {
            infra::Logger::log(infra::LogLevel::INFO,
                               "Network: client " + who + " closed connection");
            break;
        } else if (errno == ECONNABORTED) {
            infra::Logger::log(infra::LogLevel::INFO,
                               "Network: client " + who + " aborted connection");
            break;
        } else {
            infra::Logger::log(infra::LogLevel::ERROR, "Network: client " + who + " error: " +
                                                           std::string(std::strerror(errno)));
            break;
        }
    }

    remove_client(sock);
}

/**
 * @brief Sends `reply` plus `\n`, retrying short writes.
 *
 * @return false if the peer is gone; the reason is logged.
 */
bool Server::send_line(int sock, const std::string& reply)
{
    std::string out = reply + "\n";
    size_t sent = 0;
    while (sent < out.size()) {
        ssize_t n = send(sock, out.data() + sent, out.size() - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            auto level = (errno == EPIPE || errno == ECONNRESET) ? infra::LogLevel::INFO
                                                                 : infra::LogLevel::ERROR;
            infra::Logger::log(level, std::string("Network: reply failed: ") +
                                          std::strerror(errno));
            return false;
        }
        sent += static_cast<size_t>(n);
    }
    return true;
}

void Server::add_client(int sock)
{
    std::lock_guard<std::mutex> lock(client_mutex_);
    client_sockets_.push_back(sock);
    ++open_connections_;
}

/**
 * @brief Deregisters and closes a client socket, waking `stop()` when the last one goes.
 */
void Server::remove_client(int sock)
{
    // Notify under the lock: once it is released `stop()` may return and the
    // server may be destroyed.
    std::lock_guard<std::mutex> lock(client_mutex_);
    auto it = std::find(client_sockets_.begin(), client_sockets_.end(), sock);
    if (it != client_sockets_.end()) {
        client_sockets_.erase(it);
        --open_connections_;
    }
    close(sock);
    infra::Logger::log(infra::LogLevel::INFO, "Network: connection closed -> " +
                                                  std::to_string(open_connections_.load()) +
                                                  " open");
    clients_done_.notify_all();
}

} // namespace xlogd::network

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
 * @file daemon.cpp
 * @brief Implementation of the main loop and the drain-then-stop sequence.
 */

#include "xlogd/daemon/daemon.hpp"

#include "xlogd/infra/logger.hpp"

#include <cmath>
#include <cstdio>
#include <ctime>
#include <stdexcept>

namespace xlogd::daemon {

std::atomic<bool> Daemon::interrupted_{false};

namespace {

/**
 * @brief Local time as `YYYY-MM-DDTHH:MM:SS.ffffff`, for the lifecycle markers.
 */
std::string local_iso(double epoch)
{
    double whole = std::floor(epoch);
    std::time_t secs = static_cast<std::time_t>(whole);
    long micros = static_cast<long>((epoch - whole) * 1e6);

    std::tm tm_local{};
    localtime_r(&secs, &tm_local);

    char date[32];
    std::strftime(date, sizeof(date), "%Y-%m-%dT%H:%M:%S", &tm_local);
    char out[48];
    std::snprintf(out, sizeof(out), "%s.%06ld", date, micros);
    return out;
}

} // namespace

Daemon::Daemon(const infra::Config& config, view::Viewer* viewer)
    : config_(config), stop_(false), ready_(false), server_failed_(false),
      writer_started_(false), shut_down_(false), normalizer_(clock_),
      writer_(config_, clock_, queue_, viewer), handler_(normalizer_, queue_, stop_, config_.ippfx),
      server_(config_, handler_)
{
}

Daemon::~Daemon()
{
    if (!shut_down_ && (writer_started_ || server_thread_.joinable())) {
        shutdown();
    }
}

void Daemon::interrupt()
{
    interrupted_ = true;
}

void Daemon::enqueue_marker(const std::string& event)
{
    record::NormalizeResult marker = normalizer_.make_marker(event);
    if (!marker.ok) {
        infra::Logger::log(infra::LogLevel::ERROR, "Daemon: marker rejected: " + marker.reason);
        return;
    }
    queue_.push(std::move(marker.record));
}

int Daemon::run()
{
    int exit_code = 0;

    try {
        infra::Logger::log(infra::LogLevel::INFO, "Daemon: " + config_.me + " begins");

        writer_.start();
        writer_started_ = true;
        enqueue_marker("main begins @ " + local_iso(infra::Clock::system_now()));

        if (!server_.listen()) {
            throw std::runtime_error("Daemon: listener could not start");
        }
        server_thread_ = std::thread([this] {
            if (!server_.run()) {
                server_failed_ = true;
            }
        });
        ready_ = true;

        while (true) {
            if (stop_) {
                infra::Logger::log(infra::LogLevel::WARN, "Daemon: STOP received");
                break;
            }
            if (interrupted_.exchange(false)) {
                infra::Logger::log(infra::LogLevel::WARN, "Daemon: interrupted");
                break;
            }
            if (writer_.failed()) {
                infra::Logger::log(infra::LogLevel::FATAL, "Daemon: writer failed");
                exit_code = 1;
                break;
            }
            if (server_failed_) {
                infra::Logger::log(infra::LogLevel::FATAL, "Daemon: listener failed");
                exit_code = 1;
                break;
            }
            std::this_thread::sleep_for(kPollInterval);
        }
    } catch (const std::exception& e) {
        infra::Logger::log(infra::LogLevel::FATAL, std::string("Daemon: ") + e.what());
        exit_code = 1;
    }

    shutdown();

    if (writer_.failed()) {
        exit_code = 1;
    }
    infra::Logger::log(infra::LogLevel::INFO, "Daemon: " + config_.me + " ends");
    return exit_code;
}

/**
 * @brief The ordered stop sequence.
 *
 * The listener is stopped first and its connection threads are waited for, so the
 * end marker is the last record enqueued.
 */
void Daemon::shutdown()
{
    shut_down_ = true;
    ready_ = false;

    server_.stop();

    if (writer_started_) {
        enqueue_marker("main ends @ " + local_iso(infra::Clock::system_now()));

        auto waited = std::chrono::milliseconds(0);
        while (!queue_.empty() && !writer_.stopped() && waited < kDrainTimeout) {
            std::this_thread::sleep_for(kPollInterval);
            waited += kPollInterval;
        }
        if (!queue_.empty()) {
            infra::Logger::log(infra::LogLevel::ERROR,
                               "Daemon: writer did not empty its queue (" +
                                   std::to_string(queue_.size()) + " left)");
        }

        writer_.request_stop();
        if (!writer_.wait_stopped(kStopTimeout)) {
            infra::Logger::log(infra::LogLevel::ERROR,
                               "Daemon: writer didn't acknowledge STOP request");
        }
        writer_.close();
    }

    if (server_thread_.joinable()) {
        server_thread_.join();
    }
}

} // namespace xlogd::daemon

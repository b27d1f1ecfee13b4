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
 * @file logger.hpp
 * @brief Thread-safe diagnostic logging facility for the xlogd daemon.
 *
 * @details
 * This header declares the `Logger` class, the reporting interface used by every
 * xlogd component for its own diagnostics (connection lifecycle, rejected records,
 * rotation, shutdown anomalies). It is distinct from the flat files the daemon
 * writes: nothing logged here ever reaches a persisted log file.
 */

#pragma once

#include <atomic>
#include <mutex>
#include <string>

namespace xlogd::infra {

/**
 * @enum LogLevel
 * @brief Defines the severity hierarchy for diagnostic messages.
 *
 * WARN and above are routed to standard error.
 */
enum class LogLevel {
    TRACE, ///< Per-line protocol chatter.
    DEBUG, ///< Rotation checks, file opens, viewer wiring.
    INFO,  ///< Connection lifecycle and startup/shutdown milestones.
    WARN,  ///< Interrupts and unexpected but harmless client behaviour.
    ERROR, ///< Rejected records, persistence faults, drain timeouts.
    FATAL  ///< Failures that terminate the daemon.
};

/**
 * @class Logger
 * @brief A static utility class providing process-wide logging.
 *
 * @details
 * All output is serialized by one mutex, so log lines emitted concurrently by
 * connection threads and the writer thread never interleave. Messages below the
 * configured minimum level are discarded before the lock is taken.
 */
class Logger {
  public:
    /**
     * @brief Writes a formatted diagnostic message to the console.
     *
     * The output includes a timestamp, the severity tag, and the payload.
     *
     * @param level The severity classification of the message.
     * @param message The content payload to be logged.
     *
     * @code
     * xlogd::infra::Logger::log(LogLevel::INFO, "Network: listening on 0.0.0.0:12321");
     * @endcode
     */
    static void log(LogLevel level, const std::string& message);

    /**
     * @brief Writes a single progress mark (no timestamp, no newline) to stdout.
     *
     * Used in non-verbose mode to show one dot per flushed batch of records.
     */
    static void mark(char c);

    /// @brief Sets the minimum severity that is emitted.
    static void set_level(LogLevel level);

    /// @brief Returns the minimum severity that is emitted.
    static LogLevel level();

  private:
    /// @brief Guards `std::cout` and `std::cerr`.
    static std::mutex mutex_;

    /// @brief Minimum emitted severity.
    static std::atomic<LogLevel> threshold_;

    /// @brief True when the last write was a progress mark, so the next line starts fresh.
    static bool pending_marks_;
};

} // namespace xlogd::infra

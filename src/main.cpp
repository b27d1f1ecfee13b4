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
 * @file main.cpp
 * @brief Application Entry Point (Bootstrap).
 *
 * @details
 * This file contains the `main` function which orchestrates the startup sequence:
 * 1. Configuration (ini file, then command line).
 * 2. Signal Handling Registration (SIGINT/SIGTERM).
 * 3. Viewer selection for verbose mode.
 * 4. Daemon execution until `!STOP!` or a signal.
 */

#include "xlogd/daemon/daemon.hpp"
#include "xlogd/infra/config.hpp"
#include "xlogd/infra/logger.hpp"
#include "xlogd/view/viewer.hpp"

#include <csignal>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

namespace {

constexpr const char* kVersion = "xlogd 1.0.0";

/**
 * @brief System Signal Handler.
 *
 * Only raises the daemon's interrupt flag; the main loop notices it within one
 * poll period and runs the normal shutdown sequence.
 */
void signal_handler(int)
{
    xlogd::daemon::Daemon::interrupt();
}

} // namespace

/**
 * @brief Main Execution Entry Point.
 */
int main(int argc, char* argv[])
{
    using xlogd::infra::LogLevel;
    using xlogd::infra::Logger;

    xlogd::infra::Config config;
    try {
        config = xlogd::infra::Config::from_args(argc, argv);
    } catch (const xlogd::infra::ConfigError& e) {
        Logger::log(LogLevel::FATAL, std::string("Config: ") + e.what());
        std::cerr << xlogd::infra::Config::usage(argv[0]);
        return 2;
    }

    if (config.show_help) {
        std::cout << xlogd::infra::Config::usage(argv[0]);
        return 0;
    }
    if (config.show_version) {
        std::cout << kVersion << "\n";
        return 0;
    }

    Logger::set_level(config.verbose ? LogLevel::TRACE : LogLevel::INFO);

    std::signal(SIGINT, signal_handler);  // Ctrl+C
    std::signal(SIGTERM, signal_handler); // Docker Stop / Kill

    try {
        Logger::log(LogLevel::INFO, std::string("System: Booting ") + kVersion + " as '" +
                                        config.me + "'");
        Logger::log(LogLevel::INFO, "Config: log_path '" + config.log_path + "', verbose " +
                                        (config.verbose ? "on" : "off"));

        std::unique_ptr<xlogd::view::Viewer> viewer;
        if (config.verbose) {
            viewer = xlogd::view::make_viewer(config.viewer);
        }

        xlogd::daemon::Daemon daemon(config, viewer.get());
        int rc = daemon.run();

        Logger::log(LogLevel::INFO, "System: Shutdown complete.");
        return rc;
    } catch (const xlogd::infra::ConfigError& e) {
        Logger::log(LogLevel::FATAL, std::string("Config: ") + e.what());
        return 2;
    } catch (const std::exception& e) {
        Logger::log(LogLevel::FATAL, "System: Critical Failure: " + std::string(e.what()));
        return 1;
    }
}

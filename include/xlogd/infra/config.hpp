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
 * @file config.hpp
 * @brief Runtime configuration of the daemon (ini file + command line).
 *
 * @details
 * Values are resolved in three layers, lowest precedence first: built-in defaults,
 * the ini file, then command-line options. The resulting `Config` is passed by
 * reference to every component; nothing reads the environment or argv afterwards.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace xlogd::infra {

/**
 * @class ConfigError
 * @brief Raised for unreadable ini files, malformed options and invalid combinations.
 */
class ConfigError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

/**
 * @struct Config
 * @brief Fully resolved daemon settings.
 */
struct Config {
    std::string host = "0.0.0.0"; ///< Listen address.
    int port = 12321;             ///< Listen port (0 picks an ephemeral port).
    std::string ippfx;            ///< Address prefix stripped from diagnostic output.
    std::string log_path;         ///< Flat-file path template; empty disables persistence.
    bool verbose = false;         ///< Render every record through the viewer.
    std::string viewer = "console"; ///< Viewer identifier used when `verbose` is set.
    std::string me = "xlogd";     ///< Process identity, substituted for `~me~`.
    std::string ini = "xlogd.ini"; ///< Ini file consulted before the command line.

    bool show_help = false;    ///< `-h` / `--help` was given.
    bool show_version = false; ///< `--version` was given.

    /**
     * @brief Parses `argv`, reads the ini file it names (or the default one), and validates.
     *
     * @throws ConfigError on unknown options, bad values, an explicitly named ini that
     * cannot be read, or `log_path` empty without `verbose`.
     */
    static Config from_args(int argc, const char* const argv[]);

    /**
     * @brief Applies `key = value` pairs from an ini file on top of this config.
     *
     * Blank lines, `#`/`;` comments and `[section]` headers are skipped.
     *
     * @return false if the file could not be opened (config unchanged).
     */
    bool apply_ini(const std::string& path);

    /**
     * @brief Applies one named setting (`host`, `port`, `ippfx`, `log_path`, `verbose`,
     * `viewer`, `me`).
     *
     * @throws ConfigError for unknown keys or unparsable values.
     */
    void set(const std::string& key, const std::string& value);

    /// @brief Checks cross-field constraints.
    void validate() const;

    /// @brief Usage text for `--help`.
    static std::string usage(const std::string& binary_name);
};

} // namespace xlogd::infra

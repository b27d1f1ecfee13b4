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
 * @file string.hpp
 * @brief Supplementary string manipulation primitives.
 *
 * @details
 * Stateless text helpers shared by the line protocol, the path resolver and the
 * configuration loader.
 */

#pragma once

#include <string>

namespace xlogd::infra {

/**
 * @class String
 * @brief A static container for text processing algorithms.
 */
class String {
  public:
    /**
     * @brief Trims leading and trailing whitespace from a string.
     *
     * @param s The source string to process.
     * @return std::string The trimmed copy; empty if `s` is empty or all whitespace.
     *
     * @code
     * std::string clean = xlogd::infra::String::trim("  port = 12321 \r\n"); // "port = 12321"
     * @endcode
     */
    static std::string trim(const std::string& s);

    /**
     * @brief Strips trailing whitespace only (space, `\t`, `\r`, `\n`, `\v`, `\f`).
     *
     * Used on every line read from a client socket.
     */
    static std::string rtrim(const std::string& s);

    /**
     * @brief Replaces every occurrence of `from` in `s` with `to`.
     *
     * A `from` of length zero leaves `s` unchanged.
     */
    static std::string replace_all(std::string s, const std::string& from, const std::string& to);

    /// @brief Returns `s` without `prefix` if it starts with it, otherwise `s` unchanged.
    static std::string strip_prefix(const std::string& s, const std::string& prefix);
};

} // namespace xlogd::infra

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
 * @file string.cpp
 * @brief Implementation of the string manipulation primitives.
 */

#include "xlogd/infra/string.hpp"

#include <algorithm>
#include <cctype>

namespace xlogd::infra {

/**
 * @brief Trims leading and trailing whitespace from a string instance.
 *
 * @note The `static_cast<unsigned char>` prevents undefined behavior with
 * `std::isspace` for bytes above 0x7F (UTF-8 continuation bytes).
 */
std::string String::trim(const std::string& s)
{
    auto start = s.begin();
    while (start != s.end() && std::isspace(static_cast<unsigned char>(*start))) {
        start++;
    }

    if (start == s.end()) {
        return "";
    }

    auto end = s.end();
    do {
        end--;
    } while (std::distance(start, end) > 0 && std::isspace(static_cast<unsigned char>(*end)));

    return std::string(start, end + 1);
}

std::string String::rtrim(const std::string& s)
{
    auto end = s.end();
    while (end != s.begin() && std::isspace(static_cast<unsigned char>(*(end - 1)))) {
        end--;
    }
    return std::string(s.begin(), end);
}

std::string String::replace_all(std::string s, const std::string& from, const std::string& to)
{
    if (from.empty()) {
        return s;
    }

    size_t pos = 0;
    while ((pos = s.find(from, pos)) != std::string::npos) {
        s.replace(pos, from.length(), to);
        // Skip past the replacement so `to` containing `from` cannot loop forever.
        pos += to.length();
    }
    return s;
}

std::string String::strip_prefix(const std::string& s, const std::string& prefix)
{
    if (!prefix.empty() && s.compare(0, prefix.size(), prefix) == 0) {
        return s.substr(prefix.size());
    }
    return s;
}

} // namespace xlogd::infra

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
 * @file path_resolver.hpp
 * @brief Maps a flat-file path template and a clock snapshot to a concrete path.
 */

#pragma once

#include "xlogd/infra/clock.hpp"

#include <optional>
#include <string>

namespace xlogd::record {

/**
 * @class PathResolver
 * @brief Pure placeholder substitution over local calendar/time strings.
 *
 * Placeholders:
 * | Token   | Value                      |
 * |---------|----------------------------|
 * | `~me~`  | process identity           |
 * | `~y~`   | local `YY`                 |
 * | `~ym~`  | local `YYMM`               |
 * | `~ymd~` | local `YYMMDD`             |
 * | `~h~`   | local `HH`                 |
 * | `~hm~`  | local `HHMM`               |
 * | `~hms~` | local `HHMMSS`             |
 */
class PathResolver {
  public:
    /**
     * @brief Resolves `path_template` against the local fields of `now`.
     *
     * @return The path, or `std::nullopt` when the template is empty (persistence off).
     */
    static std::optional<std::string> resolve(const std::string& path_template,
                                              const infra::ClockSnapshot& now,
                                              const std::string& me);
};

} // namespace xlogd::record

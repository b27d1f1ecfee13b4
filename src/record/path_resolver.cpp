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
 * @file path_resolver.cpp
 * @brief Implementation of the path template substitution.
 */

#include "xlogd/record/path_resolver.hpp"

#include "xlogd/infra/string.hpp"

namespace xlogd::record {

std::optional<std::string> PathResolver::resolve(const std::string& path_template,
                                                 const infra::ClockSnapshot& now,
                                                 const std::string& me)
{
    if (path_template.empty()) {
        return std::nullopt;
    }

    using infra::String;
    std::string p = path_template;
    p = String::replace_all(p, "~me~", me);
    p = String::replace_all(p, "~y~", now.loc_ymd.substr(0, 2));
    p = String::replace_all(p, "~ym~", now.loc_ymd.substr(0, 4));
    p = String::replace_all(p, "~ymd~", now.loc_ymd);
    p = String::replace_all(p, "~h~", now.loc_hms.substr(0, 2));
    p = String::replace_all(p, "~hm~", now.loc_hms.substr(0, 4));
    p = String::replace_all(p, "~hms~", now.loc_hms);
    return p;
}

} // namespace xlogd::record

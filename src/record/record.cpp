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
 * @file record.cpp
 * @brief Record join/split.
 */

#include "xlogd/record/record.hpp"

#include <initializer_list>
#include <vector>

namespace xlogd::record {

std::string RecordCodec::encode(const RecordFields& f)
{
    std::string out;
    out.reserve(f.json.size() + 96);
    for (const std::string* part : {&f.version, &f.rx_ts, &f.ts, &f.id, &f.si, &f.el, &f.sl,
                                    &f.sha1}) {
        out += *part;
        out += kDelimiter;
    }
    out += f.json;
    out += '\n';
    return out;
}

bool RecordCodec::decode(const std::string& line, RecordFields& out)
{
    std::string body = line;
    while (!body.empty() && (body.back() == '\n' || body.back() == '\r')) {
        body.pop_back();
    }

    std::vector<std::string> parts;
    size_t start = 0;
    while (parts.size() < static_cast<size_t>(kFieldCount - 1)) {
        size_t pos = body.find(kDelimiter, start);
        if (pos == std::string::npos) {
            return false;
        }
        parts.push_back(body.substr(start, pos - start));
        start = pos + 1;
    }
    parts.push_back(body.substr(start));

    out.version = parts[0];
    out.rx_ts = parts[1];
    out.ts = parts[2];
    out.id = parts[3];
    out.si = parts[4];
    out.el = parts[5];
    out.sl = parts[6];
    out.sha1 = parts[7];
    out.json = parts[8];
    return true;
}

} // namespace xlogd::record

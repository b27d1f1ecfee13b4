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
 * @file canonical_json.cpp
 * @brief Implementation of the canonical JSON writer.
 */

#include "xlogd/record/canonical_json.hpp"

#include <cmath>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <map>
#include <stdexcept>

namespace xlogd::record {

namespace {

constexpr double kMaxExactInteger = 9007199254740992.0; // 2^53

void append_u16(std::string& out, uint32_t unit)
{
    char buf[8];
    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(unit));
    out += buf;
}

/**
 * @brief Decodes one UTF-8 sequence starting at `s[i]`, advancing `i`.
 */
uint32_t decode_utf8(const std::string& s, size_t& i)
{
    unsigned char lead = static_cast<unsigned char>(s[i]);
    size_t extra = 0;
    uint32_t cp = 0;

    if (lead < 0x80) {
        ++i;
        return lead;
    } else if ((lead & 0xE0) == 0xC0) {
        extra = 1;
        cp = lead & 0x1F;
    } else if ((lead & 0xF0) == 0xE0) {
        extra = 2;
        cp = lead & 0x0F;
    } else if ((lead & 0xF8) == 0xF0) {
        extra = 3;
        cp = lead & 0x07;
    } else {
        throw std::runtime_error("invalid UTF-8 lead byte");
    }

    if (i + extra >= s.size()) {
        throw std::runtime_error("truncated UTF-8 sequence");
    }
    for (size_t k = 1; k <= extra; ++k) {
        unsigned char c = static_cast<unsigned char>(s[i + k]);
        if ((c & 0xC0) != 0x80) {
            throw std::runtime_error("invalid UTF-8 continuation byte");
        }
        cp = (cp << 6) | (c & 0x3F);
    }

    // Reject overlong forms and values outside the Unicode range.
    static const uint32_t min_for_len[] = {0, 0x80, 0x800, 0x10000};
    if (cp < min_for_len[extra] || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
        throw std::runtime_error("invalid UTF-8 code point");
    }

    i += extra + 1;
    return cp;
}

std::string format_number(double v)
{
    if (!std::isfinite(v)) {
        return "null";
    }
    if (std::floor(v) == v && std::fabs(v) <= kMaxExactInteger) {
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%lld", static_cast<long long>(v));
        return buf;
    }
    char buf[40];
    for (int precision = 1; precision <= 17; ++precision) {
        std::snprintf(buf, sizeof(buf), "%.*g", precision, v);
        if (std::strtod(buf, nullptr) == v) {
            break;
        }
    }
    return buf;
}

void write_value(std::string& out, const cJSON* item);

void write_object(std::string& out, const cJSON* item)
{
    // std::map orders by unsigned byte comparison, which matches code point order
    // for UTF-8; assignment keeps the last of any duplicate keys.
    std::map<std::string, const cJSON*> members;
    for (const cJSON* child = item->child; child; child = child->next) {
        members[child->string ? child->string : ""] = child;
    }

    out += '{';
    bool first = true;
    for (const auto& kv : members) {
        if (!first) {
            out += ',';
        }
        first = false;
        out += CanonicalJson::quote(kv.first);
        out += ':';
        write_value(out, kv.second);
    }
    out += '}';
}

void write_array(std::string& out, const cJSON* item)
{
    out += '[';
    bool first = true;
    for (const cJSON* child = item->child; child; child = child->next) {
        if (!first) {
            out += ',';
        }
        first = false;
        write_value(out, child);
    }
    out += ']';
}

void write_value(std::string& out, const cJSON* item)
{
    if (cJSON_IsNull(item)) {
        out += "null";
    } else if (cJSON_IsTrue(item)) {
        out += "true";
    } else if (cJSON_IsFalse(item)) {
        out += "false";
    } else if (cJSON_IsNumber(item)) {
        out += format_number(item->valuedouble);
    } else if (cJSON_IsString(item)) {
        out += CanonicalJson::quote(item->valuestring ? item->valuestring : "");
    } else if (cJSON_IsArray(item)) {
        write_array(out, item);
    } else if (cJSON_IsObject(item)) {
        write_object(out, item);
    } else if (cJSON_IsRaw(item)) {
        out += item->valuestring ? item->valuestring : "null";
    } else {
        throw std::runtime_error("unsupported JSON node");
    }
}

} // namespace

std::string CanonicalJson::quote(const std::string& s)
{
    std::string out;
    out.reserve(s.size() + 2);
    out += '"';

    size_t i = 0;
    while (i < s.size()) {
        uint32_t cp = decode_utf8(s, i);
        switch (cp) {
        case '"':
            out += "\\\"";
            break;
        case '\\':
            out += "\\\\";
            break;
        case '\n':
            out += "\\n";
            break;
        case '\r':
            out += "\\r";
            break;
        case '\t':
            out += "\\t";
            break;
        case '\b':
            out += "\\b";
            break;
        case '\f':
            out += "\\f";
            break;
        default:
            if (cp >= 0x20 && cp < 0x7F) {
                out += static_cast<char>(cp);
            } else if (cp < 0x10000) {
                append_u16(out, cp);
            } else {
                uint32_t v = cp - 0x10000;
                append_u16(out, 0xD800 + (v >> 10));
                append_u16(out, 0xDC00 + (v & 0x3FF));
            }
        }
    }

    out += '"';
    return out;
}

std::string CanonicalJson::serialize(const cJSON* item)
{
    if (!item) {
        return "null";
    }
    std::string out;
    write_value(out, item);
    return out;
}

} // namespace xlogd::record

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
 * @file normalizer.cpp
 * @brief Implementation of the record normalization pipeline.
 *
 * @details
 * Pipeline per line:
 * 1. **Validate**: delimiter split, IP shape, brace bounds, JSON parse.
 * 2. **Stamp**: inject `_ip`, refresh the clock, default the control keys.
 * 3. **Seal**: canonical JSON, SHA-1, prefix fields.
 */

#include "xlogd/record/normalizer.hpp"

#include "xlogd/infra/digest.hpp"
#include "xlogd/record/canonical_json.hpp"
#include "xlogd/record/record.hpp"

#include <algorithm>
#include <cctype>
#include <cJSON.h>
#include <cmath>
#include <cstdio>
#include <stdexcept>

namespace xlogd::record {

namespace {

NormalizeResult reject(std::string reason)
{
    NormalizeResult r;
    r.ok = false;
    r.reason = std::move(reason);
    return r;
}

bool is_digit(char c)
{
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

/// Removes all but the last member for every key that occurs more than once.
void drop_shadowed_keys(cJSON* object)
{
    cJSON* child = object->child;
    while (child) {
        cJSON* next = child->next;
        for (cJSON* later = next; later; later = later->next) {
            if (child->string && later->string && std::string(child->string) == later->string) {
                cJSON_Delete(cJSON_DetachItemViaPointer(object, child));
                break;
            }
        }
        child = next;
    }
}

void set_string(cJSON* object, const char* key, const std::string& value)
{
    cJSON* item = cJSON_CreateString(value.c_str());
    if (!item) {
        throw std::runtime_error("out of memory creating '" + std::string(key) + "'");
    }
    if (cJSON_GetObjectItemCaseSensitive(object, key)) {
        cJSON_ReplaceItemInObjectCaseSensitive(object, key, item);
    } else {
        cJSON_AddItemToObject(object, key, item);
    }
}

/// Control values become prefix fields, so they must not carry record delimiters.
std::string flatten(std::string v)
{
    std::replace_if(v.begin(), v.end(), [](char c) { return c == '\t' || c == '\n' || c == '\r'; },
                    ' ');
    return v;
}

/**
 * @brief Reads a control key, applying its default and fixed-width integer form.
 *
 * Booleans count as the integers 1 and 0. Non-integral numbers and containers are
 * carried in their canonical JSON text.
 */
std::string control_value(const cJSON* event, const char* key, const char* fallback, int width)
{
    const cJSON* item = cJSON_GetObjectItemCaseSensitive(event, key);
    if (!item || cJSON_IsNull(item)) {
        return fallback;
    }
    if (cJSON_IsString(item)) {
        return item->valuestring ? item->valuestring : "";
    }

    long long n = 0;
    if (cJSON_IsBool(item)) {
        n = cJSON_IsTrue(item) ? 1 : 0;
    } else if (cJSON_IsNumber(item) && std::floor(item->valuedouble) == item->valuedouble &&
               std::fabs(item->valuedouble) < 9.0e15) {
        n = static_cast<long long>(item->valuedouble);
    } else {
        return CanonicalJson::serialize(item);
    }

    char buf[32];
    std::snprintf(buf, sizeof(buf), "%0*lld", width, n);
    return buf;
}

/**
 * @brief Resolves the event timestamp; empty means "not supplied".
 *
 * Absent, null, false, zero and empty strings all count as not supplied.
 */
std::string event_timestamp(const cJSON* event)
{
    const cJSON* item = cJSON_GetObjectItemCaseSensitive(event, "_ts");
    if (!item) {
        return "";
    }
    if (cJSON_IsString(item)) {
        return item->valuestring ? item->valuestring : "";
    }
    if (cJSON_IsNumber(item) && item->valuedouble != 0.0) {
        char buf[64];
        std::snprintf(buf, sizeof(buf), "%15.4f", item->valuedouble);
        return buf;
    }
    if (cJSON_IsTrue(item) || cJSON_IsArray(item) || cJSON_IsObject(item)) {
        return CanonicalJson::serialize(item);
    }
    return "";
}

} // namespace

Normalizer::Normalizer(infra::Clock& clock) : clock_(clock) {}

/**
 * @brief Public entry point. Converts any unexpected exception into a rejection.
 */
NormalizeResult Normalizer::normalize(const std::string& line) const
{
    try {
        return build(line);
    } catch (const std::exception& e) {
        return reject(std::string("normalize: ") + e.what());
    }
}

NormalizeResult Normalizer::build(const std::string& line) const
{
    // 1. Split `<ip>\t<payload>`.
    size_t cut = line.find(kDelimiter);
    if (cut == std::string::npos) {
        return reject("split _ip|payload: no delimiter");
    }
    std::string ip = line.substr(0, cut);
    std::string payload = line.substr(cut + 1);

    // 2. Syntactic IPv4 sanity check.
    if (ip.empty() || !is_digit(ip.front()) || !is_digit(ip.back()) ||
        std::count(ip.begin(), ip.end(), '.') != 3) {
        return reject("bad _ip: '" + ip + "'");
    }

    // 3. Brace bounds.
    if (payload.empty() || payload.front() != '{' || payload.back() != '}') {
        return reject("bad json dict: '" + payload + "'");
    }

    // 4. Parse. Trailing data after the object is an error.
    if (payload.find('\0') != std::string::npos) {
        return reject("json parse: embedded NUL");
    }
    const char* parse_end = nullptr;
    ScopedJson event(cJSON_ParseWithOpts(payload.c_str(), &parse_end, 1));
    if (!event || !cJSON_IsObject(event.get())) {
        size_t offset = parse_end ? static_cast<size_t>(parse_end - payload.c_str()) : 0;
        return reject("json parse: syntax error at offset " + std::to_string(offset));
    }
    drop_shadowed_keys(event.get());

    set_string(event.get(), "_ip", ip);

    infra::ClockSnapshot now = clock_.refresh();

    RecordFields f;
    f.version = kFormatVersion;
    f.rx_ts = now.utc_ts_str;
    f.id = flatten(control_value(event.get(), "_id", "____", 4));
    f.si = flatten(control_value(event.get(), "_si", "____", 4));
    f.el = flatten(control_value(event.get(), "_el", "_", 1));
    f.sl = flatten(control_value(event.get(), "_sl", "_", 1));
    f.ts = flatten(event_timestamp(event.get()));
    if (f.ts.empty()) {
        f.ts = f.rx_ts;
    }

    set_string(event.get(), "_ts", f.ts);
    set_string(event.get(), "_id", f.id);
    set_string(event.get(), "_si", f.si);
    set_string(event.get(), "_el", f.el);
    set_string(event.get(), "_sl", f.sl);

    f.json = CanonicalJson::serialize(event.get());
    f.sha1 = infra::Digest::sha1_hex(f.json);

    NormalizeResult r;
    r.ok = true;
    r.reason = "OK";
    r.record = RecordCodec::encode(f);
    return r;
}

NormalizeResult Normalizer::make_marker(const std::string& message) const
{
    try {
        ScopedJson event(cJSON_CreateObject());
        if (!event) {
            return reject("make_marker: out of memory");
        }
        cJSON_AddStringToObject(event.get(), "_id", "----");
        cJSON_AddStringToObject(event.get(), "_si", "----");
        cJSON_AddNumberToObject(event.get(), "_el", 0);
        cJSON_AddStringToObject(event.get(), "_sl", "_");
        cJSON_AddStringToObject(event.get(), "_msg", message.c_str());

        std::string line = std::string(kMarkerSource) + kDelimiter +
                           CanonicalJson::serialize(event.get());
        return normalize(line);
    } catch (const std::exception& e) {
        return reject(std::string("make_marker: ") + e.what());
    }
}

} // namespace xlogd::record

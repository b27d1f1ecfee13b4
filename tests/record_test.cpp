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
 * @file record_test.cpp
 * @brief Unit tests for the record subsystem and the console viewer.
 *
 * @details
 * Validates the tamper-evidence contract of a formatted record:
 * 1. Canonical JSON is byte-stable (sorted keys, compact, ASCII only).
 * 2. Field 8 is the SHA-1 of field 9 exactly as written.
 * 3. Control keys are defaulted, padded and written back into the payload.
 * 4. Malformed submissions are rejected with a specific reason.
 */

#include "framework.hpp"
#include "xlogd/infra/clock.hpp"
#include "xlogd/infra/config.hpp"
#include "xlogd/infra/digest.hpp"
#include "xlogd/record/canonical_json.hpp"
#include "xlogd/record/normalizer.hpp"
#include "xlogd/record/path_resolver.hpp"
#include "xlogd/record/record.hpp"
#include "xlogd/view/viewer.hpp"

#include <cJSON.h>
#include <stdexcept>
#include <string>

using xlogd::infra::Clock;
using xlogd::infra::ClockSnapshot;
using xlogd::record::CanonicalJson;
using xlogd::record::NormalizeResult;
using xlogd::record::Normalizer;
using xlogd::record::PathResolver;
using xlogd::record::RecordCodec;
using xlogd::record::RecordFields;
using xlogd::record::ScopedJson;

namespace {

/// 2023-11-14 22:13:20.5 UTC.
constexpr double kFixedEpoch = 1700000000.5;

std::string canonical(const std::string& json)
{
    ScopedJson root(cJSON_Parse(json.c_str()));
    if (!root) {
        throw std::runtime_error("test fixture is not JSON: " + json);
    }
    return CanonicalJson::serialize(root.get());
}

/// Normalizes `payload` as if received from `ip`, and decodes the result.
RecordFields accept_event(const std::string& ip, const std::string& payload)
{
    Clock clock([] { return kFixedEpoch; });
    Normalizer normalizer(clock);
    NormalizeResult r = normalizer.normalize(ip + "\t" + payload);
    if (!r.ok) {
        throw std::runtime_error("unexpected rejection: " + r.reason);
    }
    RecordFields f;
    if (!RecordCodec::decode(r.record, f)) {
        throw std::runtime_error("record does not decode: " + r.record);
    }
    return f;
}

std::string reject_reason(const std::string& line)
{
    Clock clock([] { return kFixedEpoch; });
    Normalizer normalizer(clock);
    NormalizeResult r = normalizer.normalize(line);
    return r.ok ? std::string("<accepted>") : r.reason;
}

} // namespace

// ============================================================================
// PathResolver
// ============================================================================

/**
 * @brief Every placeholder is replaced with its slice of the local calendar.
 */
void test_path_resolver_placeholders()
{
    ClockSnapshot now = ClockSnapshot::at(1700000000.0);
    auto path = PathResolver::resolve("/logs/~me~/~y~/~ym~/~ymd~/~h~-~hm~-~hms~.log", now, "xlogd");

    ASSERT_TRUE(path.has_value());
    ASSERT_EQ(*path, std::string("/logs/xlogd/23/2311/231114/22-2213-221320.log"));
}

void test_path_resolver_disabled()
{
    ClockSnapshot now = ClockSnapshot::at(1700000000.0);
    ASSERT_FALSE(PathResolver::resolve("", now, "xlogd").has_value());
    ASSERT_EQ(*PathResolver::resolve("plain.log", now, "xlogd"), std::string("plain.log"));
}

// ============================================================================
// CanonicalJson
// ============================================================================

/**
 * @brief Keys are sorted at every depth; separators carry no whitespace.
 */
void test_canonical_sorted_compact()
{
    std::string out = canonical("{ \"b\" : 1, \"a\" : [true, null, \"x\"], "
                                "\"c\" : { \"z\" : 1.5, \"y\" : -2 } }");
    ASSERT_EQ(out, std::string("{\"a\":[true,null,\"x\"],\"b\":1,\"c\":{\"y\":-2,\"z\":1.5}}"));
}

/**
 * @brief Output is pure ASCII; astral code points become surrogate pairs.
 */
void test_canonical_escapes()
{
    ASSERT_EQ(CanonicalJson::quote("caf\xc3\xa9"), std::string("\"caf\\u00e9\""));
    ASSERT_EQ(CanonicalJson::quote("\xf0\x9f\x98\x80"), std::string("\"\\ud83d\\ude00\""));
    ASSERT_EQ(CanonicalJson::quote("a/b\"c\\d\n\x01\x7f"),
              std::string("\"a/b\\\"c\\\\d\\n\\u0001\\u007f\""));
}

void test_canonical_rejects_bad_utf8()
{
    bool threw = false;
    try {
        CanonicalJson::quote("bad \xff byte");
    } catch (const std::runtime_error&) {
        threw = true;
    }
    ASSERT_TRUE(threw);
}

void test_canonical_numbers()
{
    ASSERT_EQ(canonical("[0, -7, 1e3, 0.1, 2.5e-8]"), std::string("[0,-7,1000,0.1,2.5e-08]"));
}

// ============================================================================
// RecordCodec
// ============================================================================

void test_record_codec_layout()
{
    RecordFields f;
    f.version = "1";
    f.rx_ts = "1700000000.5000";
    f.ts = "x";
    f.id = "0001";
    f.si = "____";
    f.el = "2";
    f.sl = "_";
    f.sha1 = "deadbeef";
    f.json = "{}";

    std::string line = RecordCodec::encode(f);
    ASSERT_EQ(line, std::string("1\t1700000000.5000\tx\t0001\t____\t2\t_\tdeadbeef\t{}\n"));

    RecordFields back;
    ASSERT_TRUE(RecordCodec::decode(line, back));
    ASSERT_EQ(back.sha1, std::string("deadbeef"));
    ASSERT_EQ(back.json, std::string("{}"));

    ASSERT_FALSE(RecordCodec::decode("1\t2\t3\n", back));
}

// ============================================================================
// Normalizer
// ============================================================================

/**
 * @brief A minimal submission gains every control key and a stable digest.
 */
void test_normalize_minimal_event()
{
    RecordFields f = accept_event("127.0.0.1", "{\"_msg\":\"hello\"}");

    ASSERT_EQ(f.version, std::string("1"));
    ASSERT_EQ(f.rx_ts, std::string("1700000000.5000"));
    ASSERT_EQ(f.ts, f.rx_ts);
    ASSERT_EQ(f.id, std::string("____"));
    ASSERT_EQ(f.si, std::string("____"));
    ASSERT_EQ(f.el, std::string("_"));
    ASSERT_EQ(f.sl, std::string("_"));
    ASSERT_EQ(f.json, std::string("{\"_el\":\"_\",\"_id\":\"____\",\"_ip\":\"127.0.0.1\","
                                  "\"_msg\":\"hello\",\"_si\":\"____\",\"_sl\":\"_\","
                                  "\"_ts\":\"1700000000.5000\"}"));
    ASSERT_EQ(f.sha1, std::string("0579f08529b24d0eb902f688836c3138ff66dbe3"));
    ASSERT_EQ(f.sha1, xlogd::infra::Digest::sha1_hex(f.json));
}

/**
 * @brief Integer control values are zero-padded; booleans count as integers.
 */
void test_normalize_integer_controls()
{
    RecordFields f = accept_event("10.1.2.3", "{\"_id\":7,\"_si\":12,\"_el\":3,\"_sl\":true}");

    ASSERT_EQ(f.id, std::string("0007"));
    ASSERT_EQ(f.si, std::string("0012"));
    ASSERT_EQ(f.el, std::string("3"));
    ASSERT_EQ(f.sl, std::string("1"));
    ASSERT_CONTAINS(f.json, std::string("\"_id\":\"0007\""));
}

/**
 * @brief A supplied timestamp wins; numeric ones use the receipt-time format.
 */
void test_normalize_event_timestamp()
{
    RecordFields text = accept_event("1.2.3.4", "{\"_ts\":\"yesterday\"}");
    ASSERT_EQ(text.ts, std::string("yesterday"));
    ASSERT_EQ(text.rx_ts, std::string("1700000000.5000"));

    RecordFields numeric = accept_event("1.2.3.4", "{\"_ts\":1600000000.25}");
    ASSERT_EQ(numeric.ts, std::string("1600000000.2500"));
    ASSERT_CONTAINS(numeric.json, std::string("\"_ts\":\"1600000000.2500\""));

    RecordFields blank = accept_event("1.2.3.4", "{\"_ts\":\"\"}");
    ASSERT_EQ(blank.ts, blank.rx_ts);

    RecordFields null_ts = accept_event("1.2.3.4", "{\"_ts\":null}");
    ASSERT_EQ(null_ts.ts, null_ts.rx_ts);
}

/**
 * @brief The receiving address replaces any client-supplied `_ip`.
 */
void test_normalize_ip_overwritten()
{
    RecordFields f = accept_event("1.2.3.4", "{\"_ip\":\"9.9.9.9\"}");
    ASSERT_CONTAINS(f.json, std::string("\"_ip\":\"1.2.3.4\""));
}

void test_normalize_duplicate_keys()
{
    RecordFields f = accept_event("1.2.3.4", "{\"a\":1,\"b\":0,\"a\":2}");
    ASSERT_CONTAINS(f.json, std::string("\"a\":2,\"b\":0"));
    ASSERT_EQ(f.json.find("\"a\":1"), std::string::npos);
}

/**
 * @brief A tab inside a control value cannot break the record layout.
 */
void test_normalize_control_delimiters()
{
    RecordFields f = accept_event("1.2.3.4", "{\"_id\":\"a\\tb\"}");
    ASSERT_EQ(f.id, std::string("a b"));
    ASSERT_EQ(f.sha1, xlogd::infra::Digest::sha1_hex(f.json));
}

/**
 * @brief Identical input at the same instant yields an identical record.
 */
void test_normalize_deterministic()
{
    Clock clock([] { return kFixedEpoch; });
    Normalizer normalizer(clock);
    std::string line = "5.6.7.8\t{\"z\":[1,2],\"a\":{\"k\":\"v\"}}";

    NormalizeResult first = normalizer.normalize(line);
    NormalizeResult second = normalizer.normalize(line);
    ASSERT_TRUE(first.ok);
    ASSERT_EQ(first.record, second.record);
}

/**
 * @brief Re-submitting a record's canonical payload reproduces its digest.
 *
 * The second pass runs an hour later, so only the receipt time may differ.
 */
void test_normalize_idempotent_digest()
{
    const std::string ip = "172.16.0.9";
    const std::string payloads[] = {
        "{\"_ts\":1600000000.25,\"_id\":7,\"_si\":12,\"_el\":true,\"_sl\":false,\"n\":[1,2.5]}",
        "{\"_msg\":\"caf\\u00e9 \\u2603 \\ud83d\\ude00\",\"_el\":4}",
        "{\"_msg\":\"na\xc3\xafve \xe2\x82\xac\",\"z\":{\"b\":null,\"a\":\"/\"}}",
    };

    Clock later([] { return kFixedEpoch + 3600.0; });
    Normalizer renormalizer(later);

    for (const std::string& payload : payloads) {
        RecordFields first = accept_event(ip, payload);

        NormalizeResult again = renormalizer.normalize(ip + "\t" + first.json);
        ASSERT_TRUE(again.ok);
        RecordFields second;
        ASSERT_TRUE(RecordCodec::decode(again.record, second));

        ASSERT_EQ(second.json, first.json);
        ASSERT_EQ(second.sha1, first.sha1);
        ASSERT_EQ(second.ts, first.ts);
        ASSERT_EQ(second.id, first.id);
        ASSERT_EQ(second.el, first.el);
        ASSERT_NE(second.rx_ts, first.rx_ts);
    }
}

/**
 * @brief Each validation stage reports its own reason.
 */
void test_normalize_rejections()
{
    ASSERT_EQ(reject_reason("no delimiter here"), std::string("split _ip|payload: no delimiter"));
    ASSERT_EQ(reject_reason("not-an-ip\t{}"), std::string("bad _ip: 'not-an-ip'"));
    ASSERT_EQ(reject_reason("1.2.3\t{}"), std::string("bad _ip: '1.2.3'"));
    ASSERT_EQ(reject_reason("1.2.3.4\tnotjson"), std::string("bad json dict: 'notjson'"));
    ASSERT_EQ(reject_reason("1.2.3.4\t{bad"), std::string("bad json dict: '{bad'"));
    ASSERT_EQ(reject_reason("1.2.3.4\t[1]"), std::string("bad json dict: '[1]'"));
    ASSERT_CONTAINS(reject_reason("1.2.3.4\t{bad}"), std::string("json parse:"));
    ASSERT_CONTAINS(reject_reason("1.2.3.4\t{\"a\":1} {}"), std::string("json parse:"));
}

void test_normalize_lifecycle_marker()
{
    Clock clock([] { return kFixedEpoch; });
    Normalizer normalizer(clock);
    NormalizeResult r = normalizer.make_marker("main begins @ now");
    ASSERT_TRUE(r.ok);

    RecordFields f;
    ASSERT_TRUE(RecordCodec::decode(r.record, f));
    ASSERT_EQ(f.id, std::string("----"));
    ASSERT_EQ(f.el, std::string("0"));
    ASSERT_EQ(f.sl, std::string("_"));
    ASSERT_CONTAINS(f.json, std::string("\"_ip\":\"0.0.0.0\""));
    ASSERT_CONTAINS(f.json, std::string("\"_msg\":\"main begins @ now\""));
}

// ============================================================================
// Viewer
// ============================================================================

void test_console_viewer_format()
{
    RecordFields f;
    f.id = "0007";
    f.el = "3";
    f.sl = "1";

    ScopedJson with_msg(cJSON_Parse("{\"_msg\":\"disk full\"}"));
    ASSERT_EQ(xlogd::view::ConsoleViewer::format(f, with_msg.get()),
              std::string("0007 3 1 disk full"));

    ScopedJson without(cJSON_Parse("{}"));
    ASSERT_EQ(xlogd::view::ConsoleViewer::format(f, without.get()), std::string("0007 3 1 None"));

    ScopedJson numeric(cJSON_Parse("{\"_msg\":42}"));
    ASSERT_EQ(xlogd::view::ConsoleViewer::format(f, numeric.get()), std::string("0007 3 1 42"));
}

void test_make_viewer()
{
    ASSERT_TRUE(xlogd::view::make_viewer("console") != nullptr);
    ASSERT_TRUE(xlogd::view::make_viewer("xviewer") != nullptr);

    bool threw = false;
    try {
        xlogd::view::make_viewer("nonesuch");
    } catch (const xlogd::infra::ConfigError&) {
        threw = true;
    }
    ASSERT_TRUE(threw);
}

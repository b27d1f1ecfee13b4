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
 * @file clock.cpp
 * @brief Implementation of the shared clock snapshot.
 */

#include "xlogd/infra/clock.hpp"

#include <chrono>
#include <cstdio>
#include <ctime>

namespace xlogd::infra {

namespace {

/// Formats a `tm` date as `YYMMDD`.
std::string format_ymd(const std::tm& t)
{
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%02d%02d%02d", t.tm_year % 100, t.tm_mon + 1, t.tm_mday);
    return buf;
}

/// Formats a `tm` time of day as `HHMMSS`.
std::string format_hms(const std::tm& t)
{
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%02d%02d%02d", t.tm_hour, t.tm_min, t.tm_sec);
    return buf;
}

} // namespace

ClockSnapshot ClockSnapshot::at(double epoch)
{
    ClockSnapshot s;
    s.utc_ts = epoch;
    s.utc_ut = static_cast<int64_t>(epoch);

    char buf[64];
    std::snprintf(buf, sizeof(buf), "%15.4f", epoch);
    s.utc_ts_str = buf;

    std::time_t whole = static_cast<std::time_t>(s.utc_ut);
    std::tm utc{};
    std::tm loc{};
    gmtime_r(&whole, &utc);
    localtime_r(&whole, &loc);

    s.utc_ymd = format_ymd(utc);
    s.utc_hms = format_hms(utc);
    s.loc_ymd = format_ymd(loc);
    s.loc_hms = format_hms(loc);
    return s;
}

Clock::Clock() : Clock(&Clock::system_now) {}

Clock::Clock(Source source) : source_(std::move(source)), snapshot_(ClockSnapshot::at(0.0)) {}

double Clock::system_now()
{
    auto now = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration_cast<std::chrono::duration<double>>(now).count();
}

/**
 * @brief Samples, formats, and publishes a snapshot.
 *
 * Sampling and publishing happen under one lock, so snapshots are published in
 * the order they were sampled and `current()` never moves backwards for a
 * monotonic source.
 */
ClockSnapshot Clock::refresh(std::optional<double> explicit_epoch)
{
    std::lock_guard<std::mutex> lock(mutex_);
    double epoch = explicit_epoch ? *explicit_epoch : source_();
    snapshot_ = ClockSnapshot::at(epoch);
    return snapshot_;
}

ClockSnapshot Clock::current() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return snapshot_;
}

} // namespace xlogd::infra

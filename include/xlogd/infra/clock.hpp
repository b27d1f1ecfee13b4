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
 * @file clock.hpp
 * @brief Process-wide, lock-guarded snapshot of the current instant.
 *
 * @details
 * The `Clock` is the only source of "now" for the daemon: the normalizer uses it to
 * stamp receipt times and default missing event timestamps, and the writer uses it
 * to decide when to re-resolve the output file path. Every field of a snapshot is
 * derived from a single sampled instant and the whole snapshot is published at once,
 * so readers never see an epoch from one refresh paired with calendar strings from
 * another.
 */

#pragma once

#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

namespace xlogd::infra {

/**
 * @struct ClockSnapshot
 * @brief An immutable view of one instant in UTC and local time.
 */
struct ClockSnapshot {
    double utc_ts = 0.0;    ///< UTC epoch seconds with fractional part.
    int64_t utc_ut = 0;     ///< `utc_ts` truncated to whole seconds.
    std::string utc_ts_str; ///< `utc_ts` formatted as `%15.4f`.
    std::string utc_ymd;    ///< UTC `YYMMDD`.
    std::string utc_hms;    ///< UTC `HHMMSS`.
    std::string loc_ymd;    ///< Local `YYMMDD`.
    std::string loc_hms;    ///< Local `HHMMSS`.

    /**
     * @brief Builds a snapshot for the given epoch.
     *
     * Calendar fields are computed from the truncated second with `gmtime_r` and
     * `localtime_r`.
     */
    static ClockSnapshot at(double epoch);
};

/**
 * @class Clock
 * @brief Thread-safe holder of the most recently published `ClockSnapshot`.
 */
class Clock {
  public:
    /// @brief Signature of the wall-clock sampler; returns UTC epoch seconds.
    using Source = std::function<double()>;

    /// @brief Creates a clock sampling `std::chrono::system_clock`.
    Clock();

    /**
     * @brief Creates a clock sampling a caller-provided source.
     *
     * Tests use this to drive simulated time through the normalizer and writer.
     */
    explicit Clock(Source source);

    /**
     * @brief Samples the source (or uses `explicit_epoch`) and publishes a new snapshot.
     *
     * @param explicit_epoch Seeds the snapshot instead of sampling the source.
     * @return ClockSnapshot The snapshot that was published.
     */
    ClockSnapshot refresh(std::optional<double> explicit_epoch = std::nullopt);

    /// @brief Returns a copy of the latest published snapshot.
    ClockSnapshot current() const;

    /// @brief Reads `std::chrono::system_clock` as fractional epoch seconds.
    static double system_now();

  private:
    Source source_;
    mutable std::mutex mutex_;
    ClockSnapshot snapshot_;
};

} // namespace xlogd::infra

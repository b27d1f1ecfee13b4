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
 * @file normalizer.hpp
 * @brief Validates one inbound line and turns it into a hashed flat-file record.
 *
 * @details
 * Input is a source-prefixed line: the client's dotted IP, a TAB, and the raw JSON
 * object the client sent. Output is a complete record line (see `record.hpp`).
 * Rejections are returned, never thrown, so a single malformed line cannot take
 * down the connection that carried it.
 */

#pragma once

#include "xlogd/infra/clock.hpp"

#include <string>

namespace xlogd::record {

/**
 * @struct NormalizeResult
 * @brief Outcome of normalizing one line.
 */
struct NormalizeResult {
    bool ok = false;     ///< True when `record` holds a formatted record.
    std::string reason;  ///< `OK`, or why the line was rejected.
    std::string record;  ///< Newline-terminated record when `ok`.
};

/**
 * @class Normalizer
 * @brief Stateless record builder bound to the shared clock.
 *
 * **Validation Order** (first failure wins):
 * 1. The line splits on TAB into an IP segment and a payload.
 * 2. The IP is non-empty, starts and ends with a digit and has exactly three dots.
 * 3. The payload is non-empty and bounded by `{` ... `}`.
 * 4. The payload parses as a JSON object.
 *
 * **Normalization:**
 * - `_ip` is set to the sender address.
 * - `_id`/`_si` default to `____`, `_el`/`_sl` to `_`; integers are zero padded to
 *   width 4 and 1 respectively. The normalized values are written back to the event.
 * - A missing or empty `_ts` becomes the receipt timestamp.
 * - The event is serialized canonically and SHA-1 stamped.
 */
class Normalizer {
  public:
    /// @brief Source address attributed to lifecycle markers.
    static constexpr const char* kMarkerSource = "0.0.0.0";

    explicit Normalizer(infra::Clock& clock);

    /**
     * @brief Normalizes one source-prefixed line.
     *
     * Refreshes the shared clock once per accepted line.
     */
    NormalizeResult normalize(const std::string& line) const;

    /**
     * @brief Builds a lifecycle marker record (daemon begins/ends) through `normalize`.
     *
     * @param message Free text stored under `_msg`.
     */
    NormalizeResult make_marker(const std::string& message) const;

  private:
    infra::Clock& clock_;

    NormalizeResult build(const std::string& line) const;
};

} // namespace xlogd::record

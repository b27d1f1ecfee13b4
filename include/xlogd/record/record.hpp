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
 * @file record.hpp
 * @brief Layout of one persisted flat-file record.
 *
 * @details
 * A record is nine fields joined by TAB and terminated by a newline:
 *
 * | # | Width | Field                                   |
 * |---|-------|-----------------------------------------|
 * | 1 | 1     | format version (`1`)                    |
 * | 2 | 15    | receipt timestamp (`%15.4f`, server)    |
 * | 3 | var   | event timestamp (`_ts`)                 |
 * | 4 | 4     | `_id` major source id                   |
 * | 5 | 4     | `_si` minor source id                   |
 * | 6 | 1     | `_el` error level                       |
 * | 7 | 1     | `_sl` sub level                         |
 * | 8 | 40    | SHA-1 hex of field 9                    |
 * | 9 | var   | canonical JSON of the full event        |
 */

#pragma once

#include <string>

namespace xlogd::record {

/// @brief Separator between record fields, and between client IP and payload on input.
constexpr char kDelimiter = '\t';

/// @brief Flat-file format version written as field 1.
constexpr const char* kFormatVersion = "1";

/// @brief Number of fields in a record.
constexpr int kFieldCount = 9;

/**
 * @struct RecordFields
 * @brief The nine fields of a record, without delimiters or trailing newline.
 */
struct RecordFields {
    std::string version;
    std::string rx_ts;
    std::string ts;
    std::string id;
    std::string si;
    std::string el;
    std::string sl;
    std::string sha1;
    std::string json;
};

/**
 * @class RecordCodec
 * @brief Joins and splits records. The only place that knows the field order.
 */
class RecordCodec {
  public:
    /// @brief Joins `fields` with `kDelimiter` and appends `\n`.
    static std::string encode(const RecordFields& fields);

    /**
     * @brief Splits a record line (with or without its trailing newline).
     *
     * The JSON field may itself contain no raw TAB (canonical JSON escapes it), but
     * the split still stops after eight delimiters so the payload is taken whole.
     *
     * @return false if fewer than nine fields are present.
     */
    static bool decode(const std::string& line, RecordFields& out);
};

} // namespace xlogd::record

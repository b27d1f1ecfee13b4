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
 * @file canonical_json.hpp
 * @brief Deterministic JSON serialization of cJSON trees.
 *
 * @details
 * The digest stamped on every record is computed over this serialization, so it
 * must be byte-stable: the same logical event always yields the same bytes no
 * matter how the client ordered its keys or encoded its strings.
 */

#pragma once

#include <cJSON.h>
#include <string>

namespace xlogd::record {

/**
 * @class ScopedJson
 * @brief RAII owner of a cJSON tree; calls `cJSON_Delete` on destruction.
 */
class ScopedJson {
  public:
    /// Takes ownership of a tree returned by `cJSON_Parse` or `cJSON_Create*`.
    explicit ScopedJson(cJSON* root) : root_(root) {}

    ScopedJson(const ScopedJson&) = delete;
    ScopedJson& operator=(const ScopedJson&) = delete;

    ~ScopedJson()
    {
        if (root_) {
            cJSON_Delete(root_);
        }
    }

    cJSON* get() const { return root_; }

    explicit operator bool() const { return root_ != nullptr; }

  private:
    cJSON* root_;
};

/**
 * @class CanonicalJson
 * @brief Sorted-key, ASCII-only JSON writer.
 *
 * **Canonical Form:**
 * - Object keys sorted by byte order; on duplicate keys the last one wins.
 * - No whitespace: separators are `,` and `:`.
 * - Every character outside printable ASCII is written as `\uXXXX` (lowercase hex),
 *   code points above U+FFFF as a UTF-16 surrogate pair.
 * - Integral numbers within +/-2^53 are written without a fraction; other numbers use
 *   the shortest `%g` form that reads back to the same double.
 */
class CanonicalJson {
  public:
    /**
     * @brief Serializes `item` (and its children) canonically.
     *
     * @throws std::runtime_error if a string holds malformed UTF-8.
     */
    static std::string serialize(const cJSON* item);

    /**
     * @brief Writes `s` as a quoted, escaped JSON string literal.
     *
     * @throws std::runtime_error if `s` holds malformed UTF-8.
     */
    static std::string quote(const std::string& s);
};

} // namespace xlogd::record

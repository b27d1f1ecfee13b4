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
 * @file digest.hpp
 * @brief Tamper-stamp digests for formatted records.
 */

#pragma once

#include <string>

namespace xlogd::infra {

/**
 * @class Digest
 * @brief Static wrappers over the OpenSSL EVP message-digest API.
 */
class Digest {
  public:
    /**
     * @brief Computes the SHA-1 of `data` as 40 lowercase hex characters.
     *
     * @throws std::runtime_error if OpenSSL reports a failure.
     */
    static std::string sha1_hex(const std::string& data);
};

} // namespace xlogd::infra

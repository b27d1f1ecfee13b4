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
 * @file digest.cpp
 * @brief SHA-1 hex digests through OpenSSL's EVP interface.
 */

#include "xlogd/infra/digest.hpp"

#include <memory>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <stdexcept>

namespace xlogd::infra {

namespace {

struct MdContextDeleter {
    void operator()(EVP_MD_CTX* ctx) const noexcept { EVP_MD_CTX_free(ctx); }
};

using MdContextPtr = std::unique_ptr<EVP_MD_CTX, MdContextDeleter>;

[[noreturn]] void throw_openssl_error(const char* context)
{
    unsigned long err = ERR_get_error();
    if (err == 0) {
        throw std::runtime_error(std::string(context) + ": unknown OpenSSL error");
    }
    char buf[256] = {0};
    ERR_error_string_n(err, buf, sizeof(buf));
    throw std::runtime_error(std::string(context) + ": " + buf);
}

} // namespace

std::string Digest::sha1_hex(const std::string& data)
{
    MdContextPtr ctx(EVP_MD_CTX_new());
    if (!ctx) {
        throw_openssl_error("EVP_MD_CTX_new");
    }
    if (EVP_DigestInit_ex(ctx.get(), EVP_sha1(), nullptr) != 1) {
        throw_openssl_error("EVP_DigestInit_ex");
    }
    if (EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1) {
        throw_openssl_error("EVP_DigestUpdate");
    }

    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int md_len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), md, &md_len) != 1) {
        throw_openssl_error("EVP_DigestFinal_ex");
    }

    static const char hex[] = "0123456789abcdef";
    std::string out;
    out.reserve(md_len * 2);
    for (unsigned int i = 0; i < md_len; ++i) {
        out.push_back(hex[md[i] >> 4]);
        out.push_back(hex[md[i] & 0x0F]);
    }
    return out;
}

} // namespace xlogd::infra

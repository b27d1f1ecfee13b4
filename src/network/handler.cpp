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
 * @file handler.cpp
 * @brief Implementation of the line protocol dispatcher.
 */

#include "xlogd/network/handler.hpp"

#include "xlogd/infra/logger.hpp"
#include "xlogd/infra/string.hpp"
#include "xlogd/record/record.hpp"

namespace xlogd::network {

Handler::Handler(const record::Normalizer& normalizer, infra::RecordQueue& queue,
                 std::atomic<bool>& stop_flag, std::string ippfx)
    : normalizer_(normalizer), queue_(queue), stop_flag_(stop_flag), ippfx_(std::move(ippfx))
{
}

std::string Handler::short_ip(const std::string& ip) const
{
    return infra::String::strip_prefix(ip, ippfx_);
}

/**
 * @brief Dispatches one line.
 *
 * `!STOP!` is tested before the generic `!...!` echo form, which would otherwise
 * shadow it.
 */
std::optional<std::string> Handler::process(const std::string& raw_line,
                                            const std::string& client_ip) const
{
    std::string rx = infra::String::rtrim(raw_line);
    if (rx.empty()) {
        return std::nullopt;
    }

    if (rx == kStopCommand) {
        infra::Logger::log(infra::LogLevel::WARN,
                           "Network: STOP requested by " + short_ip(client_ip));
        stop_flag_ = true;
        return std::string("OK");
    }

    if (rx.front() == '!' && rx.back() == '!') {
        infra::Logger::log(infra::LogLevel::TRACE, "Network: echo " + rx);
        return "OK|" + rx;
    }

    std::string logrec = client_ip + record::kDelimiter + rx;
    record::NormalizeResult result = normalizer_.normalize(logrec);
    if (result.ok) {
        queue_.push(std::move(result.record));
        return std::string("OK");
    }

    std::string tx = "E: " + result.reason;
    infra::Logger::log(infra::LogLevel::ERROR, tx);
    infra::Logger::log(infra::LogLevel::ERROR,
                       ":: " + short_ip(client_ip) + record::kDelimiter + rx);
    return tx;
}

} // namespace xlogd::network

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
 * @file viewer.cpp
 * @brief The built-in console viewer and the viewer registry.
 */

#include "xlogd/view/viewer.hpp"

#include "xlogd/infra/config.hpp"
#include "xlogd/infra/logger.hpp"
#include "xlogd/record/canonical_json.hpp"

namespace xlogd::view {

namespace {

infra::LogLevel level_for(const std::string& el)
{
    if (el.size() != 1) {
        return infra::LogLevel::INFO;
    }
    switch (el[0]) {
    case '0':
        return infra::LogLevel::TRACE;
    case '1':
        return infra::LogLevel::DEBUG;
    case '2':
        return infra::LogLevel::INFO;
    case '3':
        return infra::LogLevel::WARN;
    case '4':
        return infra::LogLevel::ERROR;
    case '5':
        return infra::LogLevel::FATAL;
    default:
        return infra::LogLevel::INFO;
    }
}

} // namespace

std::string ConsoleViewer::format(const record::RecordFields& fields, const cJSON* event)
{
    std::string msg = "None";
    const cJSON* m = event ? cJSON_GetObjectItemCaseSensitive(event, "_msg") : nullptr;
    if (cJSON_IsString(m) && m->valuestring) {
        msg = m->valuestring;
    } else if (m) {
        msg = record::CanonicalJson::serialize(m);
    }
    return fields.id + " " + fields.el + " " + fields.sl + " " + msg;
}

void ConsoleViewer::render(const record::RecordFields& fields, const cJSON* event)
{
    infra::Logger::log(level_for(fields.el), format(fields, event));
}

std::unique_ptr<Viewer> make_viewer(const std::string& name)
{
    if (name == "console" || name == "xviewer") {
        return std::make_unique<ConsoleViewer>();
    }
    throw infra::ConfigError("Config: unknown viewer '" + name + "'");
}

} // namespace xlogd::view

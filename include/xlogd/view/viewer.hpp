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
 * @file viewer.hpp
 * @brief Per-record console rendering used in verbose mode.
 *
 * @details
 * The writer calls `Viewer::render` once for every record it persists (or would
 * persist, when no path template is configured). A viewer owns all formatting
 * policy; it may throw, and the writer isolates any such failure.
 */

#pragma once

#include "xlogd/record/record.hpp"

#include <cJSON.h>
#include <memory>
#include <string>

namespace xlogd::view {

/**
 * @class Viewer
 * @brief Abstract per-record renderer.
 */
class Viewer {
  public:
    virtual ~Viewer() = default;

    /**
     * @brief Renders one record.
     *
     * @param fields The decoded prefix fields of the record.
     * @param event The full event object parsed from the record's JSON field. Owned
     * by the caller and only valid for the duration of the call.
     */
    virtual void render(const record::RecordFields& fields, const cJSON* event) = 0;
};

/**
 * @class ConsoleViewer
 * @brief Writes `"<_id> <_el> <_sl> <_msg>"` through the diagnostic logger.
 *
 * The severity follows `_el`: 0 TRACE, 1 DEBUG, 2 INFO, 3 WARN, 4 ERROR, 5 FATAL;
 * any other value is logged at INFO.
 */
class ConsoleViewer : public Viewer {
  public:
    void render(const record::RecordFields& fields, const cJSON* event) override;

    /// @brief Formats the line `render` emits; exposed for tests.
    static std::string format(const record::RecordFields& fields, const cJSON* event);
};

/**
 * @brief Creates the viewer registered under `name` (`console`, alias `xviewer`).
 *
 * @throws infra::ConfigError for unknown names.
 */
std::unique_ptr<Viewer> make_viewer(const std::string& name);

} // namespace xlogd::view

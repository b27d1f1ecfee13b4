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
 * @file config.cpp
 * @brief Ini and command-line parsing for `Config`.
 */

#include "xlogd/infra/config.hpp"

#include "xlogd/infra/string.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <utility>
#include <vector>

namespace xlogd::infra {

namespace {

std::string to_lower(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool parse_bool(const std::string& key, const std::string& value)
{
    std::string v = to_lower(String::trim(value));
    if (v == "1" || v == "true" || v == "yes" || v == "on") {
        return true;
    }
    if (v == "0" || v == "false" || v == "no" || v == "off" || v.empty()) {
        return false;
    }
    throw ConfigError("Config: '" + key + "' expects a boolean, got '" + value + "'");
}

int parse_port(const std::string& value)
{
    std::string v = String::trim(value);
    if (v.empty() || !std::all_of(v.begin(), v.end(),
                                  [](unsigned char c) { return std::isdigit(c) != 0; })) {
        throw ConfigError("Config: port must be numeric, got '" + value + "'");
    }
    if (v.size() > 5 || std::stoi(v) > 65535) {
        throw ConfigError("Config: port out of range: " + v);
    }
    return std::stoi(v);
}

} // namespace

void Config::set(const std::string& key, const std::string& value)
{
    if (key == "host") {
        host = value;
    } else if (key == "port") {
        port = parse_port(value);
    } else if (key == "ippfx") {
        ippfx = value;
    } else if (key == "log_path") {
        log_path = value;
    } else if (key == "verbose" || key == "v") {
        verbose = parse_bool(key, value);
    } else if (key == "viewer") {
        viewer = value;
    } else if (key == "me") {
        me = value;
    } else {
        throw ConfigError("Config: unknown setting '" + key + "'");
    }
}

/**
 * @brief Reads `key = value` lines.
 *
 * Keys may carry the command-line spelling (`--port`), which is normalized away so
 * one ini can be shared with scripts that build argv from it.
 */
bool Config::apply_ini(const std::string& path)
{
    std::ifstream in(path);
    if (!in.is_open()) {
        return false;
    }

    std::string line;
    int line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        std::string t = String::trim(line);
        if (t.empty() || t[0] == '#' || t[0] == ';' || t[0] == '[') {
            continue;
        }

        auto eq = t.find('=');
        if (eq == std::string::npos) {
            throw ConfigError("Config: " + path + ":" + std::to_string(line_no) +
                              ": expected 'key = value'");
        }

        std::string key = String::trim(t.substr(0, eq));
        std::string value = String::trim(t.substr(eq + 1));
        while (!key.empty() && key[0] == '-') {
            key.erase(0, 1);
        }
        set(to_lower(key), value);
    }
    return true;
}

void Config::validate() const
{
    if (log_path.empty() && !verbose) {
        throw ConfigError("Config: no log_path given and verbose is off; records would go nowhere");
    }
    if (verbose && viewer.empty()) {
        throw ConfigError("Config: verbose requires a viewer name");
    }
}

Config Config::from_args(int argc, const char* const argv[])
{
    Config cfg;
    std::vector<std::pair<std::string, std::string>> cli;
    bool ini_explicit = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            cfg.show_help = true;
            continue;
        }
        if (arg == "--version") {
            cfg.show_version = true;
            continue;
        }
        if (arg == "-v" || arg == "--verbose") {
            cli.emplace_back("verbose", "1");
            continue;
        }
        if (arg.compare(0, 2, "--") != 0) {
            throw ConfigError("Config: unexpected argument '" + arg + "'");
        }

        std::string key;
        std::string value;
        auto eq = arg.find('=');
        if (eq != std::string::npos) {
            key = arg.substr(2, eq - 2);
            value = arg.substr(eq + 1);
        } else {
            key = arg.substr(2);
            if (i + 1 >= argc) {
                throw ConfigError("Config: option '" + arg + "' needs a value");
            }
            value = argv[++i];
        }

        if (key == "ini") {
            cfg.ini = value;
            ini_explicit = true;
        } else {
            cli.emplace_back(key, value);
        }
    }

    if (cfg.show_help || cfg.show_version) {
        return cfg;
    }

    if (!cfg.apply_ini(cfg.ini) && ini_explicit) {
        throw ConfigError("Config: cannot read ini file '" + cfg.ini + "'");
    }

    for (const auto& kv : cli) {
        cfg.set(kv.first, kv.second);
    }

    cfg.validate();
    return cfg;
}

std::string Config::usage(const std::string& binary_name)
{
    std::ostringstream os;
    os << "Usage: " << binary_name
       << " [--ini=<ini> --host=<host> --ippfx=<ippfx> --port=<port> --log_path=<log_path>"
          " --viewer=<viewer> --me=<me> -v --verbose]\n"
       << "       " << binary_name << " (-h | --help | --version)\n"
       << "Options:\n"
       << "  --ini=<ini>            Ini file (default: xlogd.ini, optional).\n"
       << "  --host=<host>          Listen address (default: 0.0.0.0).\n"
       << "  --ippfx=<ippfx>        Address prefix stripped from diagnostics.\n"
       << "  --port=<port>          Listen port (default: 12321).\n"
       << "  --log_path=<log_path>  Flat-file path template (~me~ ~y~ ~ym~ ~ymd~ ~h~ ~hm~ ~hms~).\n"
       << "  --viewer=<viewer>      Viewer used in verbose mode (default: console).\n"
       << "  --me=<me>              Process identity (default: xlogd).\n"
       << "  -v --verbose           Render records to the console instead of dots.\n";
    return os.str();
}

} // namespace xlogd::infra

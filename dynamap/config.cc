/*
 * Copyright 2024-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "dynamap/config.hh"

#include <stdexcept>
#include <boost/lexical_cast.hpp>
#include <fmt/format.h>
#include <yaml-cpp/yaml.h>

#include "log.hh"

static logging::logger clogger("dynamap-config");

namespace dynamap {

engine_config engine_config::from_yaml(const YAML::Node& node) {
    engine_config cfg;
    if (!node || node.IsNull()) {
        return cfg;
    }
    if (!node.IsMap()) {
        throw std::invalid_argument(fmt::format("dynamap configuration must be a map: {}", boost::lexical_cast<std::string>(node)));
    }
    for (auto it = node.begin(); it != node.end(); ++it) {
        auto key = it->first.as<std::string>();
        auto& v = it->second;
        if (key == "consistent_reads") {
            cfg.consistent_reads = v.as<bool>();
        } else if (key == "atomic") {
            cfg.atomic = v.as<bool>();
        } else if (key == "table_name_template") {
            cfg.table_name_template = v.as<std::string>();
        } else if (key == "skip_table_setup") {
            cfg.skip_table_setup = v.as<bool>();
        } else if (key == "calls_to_reach_head") {
            cfg.calls_to_reach_head = v.as<unsigned>();
        } else if (key == "default_log_level") {
            cfg.default_log_level = v.as<std::string>();
        } else if (key == "logger_log_level") {
            cfg.logger_log_level = v.as<std::map<std::string, std::string>>();
        } else {
            throw std::invalid_argument(fmt::format("unknown dynamap configuration option: {}", key));
        }
    }
    // Catch a broken template here rather than on the first bind.
    cfg.format_table_name("");
    return cfg;
}

engine_config engine_config::read_from_file(const std::string& path) {
    clogger.debug("reading configuration from {}", path);
    return from_yaml(YAML::LoadFile(path));
}

engine_config engine_config::read_from_string(std::string_view text) {
    return from_yaml(YAML::Load(std::string(text)));
}

std::string engine_config::format_table_name(std::string_view table_name) const {
    try {
        return fmt::format(fmt::runtime(table_name_template), fmt::arg("table_name", table_name));
    } catch (const fmt::format_error& e) {
        throw std::invalid_argument(fmt::format("invalid table_name_template \"{}\": {}", table_name_template, e.what()));
    }
}

static logging::log_level parse_log_level(const std::string& level) {
    try {
        return boost::lexical_cast<logging::log_level>(level);
    } catch (boost::bad_lexical_cast& e) {
        throw std::invalid_argument("Unknown logging level " + level);
    }
}

void engine_config::apply_logging() const {
    auto& registry = logging::logger_registry();
    if (default_log_level) {
        registry.set_all_loggers_level(parse_log_level(*default_log_level));
    }
    for (auto& [name, level] : logger_log_level) {
        try {
            registry.set_logger_level(name, parse_log_level(level));
        } catch (std::out_of_range& e) {
            throw std::invalid_argument("Unknown logger name " + name);
        }
    }
    clogger.debug("applied log levels");
}

}

/*
 * Copyright 2024-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace YAML {
class Node;
}

namespace dynamap {

struct engine_config {
    // Default for load, query and scan
    bool consistent_reads = false;
    // Default for save and remove
    bool atomic = false;
    // fmt template for the physical table name, with a {table_name} argument
    std::string table_name_template = "{table_name}";
    bool skip_table_setup = false;
    // Consecutive empty fetches a shard makes before it considers itself
    // caught up with the head of its partition.
    unsigned calls_to_reach_head = 5;
    std::optional<std::string> default_log_level;
    std::map<std::string, std::string> logger_log_level;

    // Every key is optional; unknown keys throw std::invalid_argument.
    static engine_config from_yaml(const YAML::Node& node);
    static engine_config read_from_file(const std::string& path);
    static engine_config read_from_string(std::string_view text);

    std::string format_table_name(std::string_view table_name) const;
    // Applies the log levels to the logger registry.
    void apply_logging() const;
};

}

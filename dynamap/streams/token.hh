/*
 * Copyright 2024-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "dynamap/session.hh"
#include "utils/rjson.hh"

namespace dynamap::streams {

// Position of one shard within a serialized stream position.
struct shard_token {
    std::string shard_id;
    std::optional<shard_iterator_type> iterator_type;
    std::optional<std::string> sequence_number;
    std::optional<std::string> parent;

    bool operator==(const shard_token&) const = default;
};

// A serialized stream position:
//   {"stream_arn": ..., "active": [shard ids],
//    "shards": [{"shard_id", "iterator_type"?, "sequence_number"?, "parent"?}]}
// Iterator types are written as trim_horizon, latest, at_sequence and
// after_sequence.
struct stream_token {
    std::string stream_arn;
    std::vector<std::string> active;
    std::vector<shard_token> shards;

    rjson::value to_json() const;
    // Throws rjson::error on a malformed token.
    static stream_token from_json(const rjson::value& v);

    bool operator==(const stream_token&) const = default;
};

std::string_view token_name(shard_iterator_type type);
shard_iterator_type iterator_type_from_token_name(std::string_view name);

}

/*
 * Copyright 2024-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once

#include <chrono>
#include <optional>
#include <string>

#include "utils/rjson.hh"

namespace dynamap::streams {

struct event_info {
    std::string id;
    // insert, modify or remove
    std::string type;
    std::string version;
};

struct record_metadata {
    std::chrono::system_clock::time_point created_at;
    std::string sequence_number;
    event_info event;
};

// One change log entry with its attribute maps still in wire form.
struct stream_record {
    std::optional<rjson::copyable_value> key;
    std::optional<rjson::copyable_value> new_image;
    std::optional<rjson::copyable_value> old_image;
    record_metadata meta;
};

// Converts a raw GetRecords entry. Throws rjson::error if a required
// member is missing.
stream_record reformat_record(const rjson::value& raw);

}

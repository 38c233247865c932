/*
 * Copyright 2024-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "dynamap/streams/record.hh"

#include <algorithm>
#include <cctype>
#include <cmath>

namespace dynamap::streams {

static std::optional<rjson::copyable_value> image(const rjson::value& dynamodb, std::string_view name) {
    auto v = rjson::find(dynamodb, name);
    if (!v || v->IsNull()) {
        return std::nullopt;
    }
    return rjson::copyable_value(*v);
}

// ApproximateCreationDateTime is in seconds since the epoch, possibly
// with a fraction.
static std::chrono::system_clock::time_point creation_time(const rjson::value& v) {
    if (!v.IsNumber()) {
        throw rjson::error("ApproximateCreationDateTime is not a number");
    }
    auto micros = std::llround(v.GetDouble() * 1e6);
    return std::chrono::system_clock::time_point(std::chrono::duration_cast<std::chrono::system_clock::duration>(
            std::chrono::microseconds(micros)));
}

stream_record reformat_record(const rjson::value& raw) {
    auto& dynamodb = rjson::get(raw, "dynamodb");
    stream_record ret;
    ret.key = image(dynamodb, "Keys");
    ret.new_image = image(dynamodb, "NewImage");
    ret.old_image = image(dynamodb, "OldImage");
    ret.meta.created_at = creation_time(rjson::get(dynamodb, "ApproximateCreationDateTime"));
    ret.meta.sequence_number = std::string(rjson::to_string_view(rjson::get(dynamodb, "SequenceNumber")));
    ret.meta.event.id = rjson::get_opt<std::string>(raw, "eventID").value_or("");
    auto type = rjson::get_opt<std::string>(raw, "eventName").value_or("");
    std::transform(type.begin(), type.end(), type.begin(), [] (unsigned char c) { return std::tolower(c); });
    ret.meta.event.type = std::move(type);
    ret.meta.event.version = rjson::get_opt<std::string>(raw, "eventVersion").value_or("");
    return ret;
}

}

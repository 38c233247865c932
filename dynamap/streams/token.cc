/*
 * Copyright 2024-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "dynamap/streams/token.hh"

#include <fmt/format.h>

namespace dynamap::streams {

std::string_view token_name(shard_iterator_type type) {
    switch (type) {
        case shard_iterator_type::at_sequence: return "at_sequence";
        case shard_iterator_type::after_sequence: return "after_sequence";
        case shard_iterator_type::trim_horizon: return "trim_horizon";
        case shard_iterator_type::latest: return "latest";
        default: throw std::logic_error(std::to_string(int(type)));
    }
}

shard_iterator_type iterator_type_from_token_name(std::string_view name) {
    if (name == "at_sequence") {
        return shard_iterator_type::at_sequence;
    } else if (name == "after_sequence") {
        return shard_iterator_type::after_sequence;
    } else if (name == "trim_horizon") {
        return shard_iterator_type::trim_horizon;
    } else if (name == "latest") {
        return shard_iterator_type::latest;
    }
    throw rjson::error(fmt::format("unknown iterator type in stream token: {}", name));
}

rjson::value stream_token::to_json() const {
    rjson::value ret = rjson::empty_object();
    rjson::add(ret, "stream_arn", std::string_view(stream_arn));
    rjson::value active_ids = rjson::empty_array();
    for (auto& id : active) {
        rjson::push_back(active_ids, rjson::from_string(id));
    }
    rjson::add(ret, "active", std::move(active_ids));
    rjson::value shard_list = rjson::empty_array();
    for (auto& s : shards) {
        rjson::value entry = rjson::empty_object();
        rjson::add(entry, "shard_id", std::string_view(s.shard_id));
        if (s.iterator_type) {
            rjson::add(entry, "iterator_type", token_name(*s.iterator_type));
        }
        if (s.sequence_number) {
            rjson::add(entry, "sequence_number", std::string_view(*s.sequence_number));
        }
        if (s.parent) {
            rjson::add(entry, "parent", std::string_view(*s.parent));
        }
        rjson::push_back(shard_list, std::move(entry));
    }
    rjson::add(ret, "shards", std::move(shard_list));
    return ret;
}

static std::string get_string(const rjson::value& v, std::string_view name) {
    auto& member = rjson::get(v, name);
    if (!member.IsString()) {
        throw rjson::error(fmt::format("stream token member {} is not a string", name));
    }
    return std::string(rjson::to_string_view(member));
}

stream_token stream_token::from_json(const rjson::value& v) {
    if (!v.IsObject()) {
        throw rjson::error("stream token is not an object");
    }
    stream_token ret;
    ret.stream_arn = get_string(v, "stream_arn");
    auto& active_ids = rjson::get(v, "active");
    if (!active_ids.IsArray()) {
        throw rjson::error("stream token member active is not an array");
    }
    for (auto& id : active_ids.GetArray()) {
        if (!id.IsString()) {
            throw rjson::error("stream token has a non-string active shard id");
        }
        ret.active.emplace_back(rjson::to_string_view(id));
    }
    auto& shard_list = rjson::get(v, "shards");
    if (!shard_list.IsArray()) {
        throw rjson::error("stream token member shards is not an array");
    }
    for (auto& entry : shard_list.GetArray()) {
        shard_token s;
        s.shard_id = get_string(entry, "shard_id");
        if (auto type = rjson::get_opt<std::string>(entry, "iterator_type")) {
            s.iterator_type = iterator_type_from_token_name(*type);
        }
        s.sequence_number = rjson::get_opt<std::string>(entry, "sequence_number");
        s.parent = rjson::get_opt<std::string>(entry, "parent");
        ret.shards.push_back(std::move(s));
    }
    return ret;
}

}

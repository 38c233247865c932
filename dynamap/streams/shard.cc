/*
 * Copyright 2024-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "dynamap/streams/shard.hh"

#include <algorithm>
#include <deque>
#include <map>
#include <set>
#include <fmt/format.h>

#include "dynamap/error.hh"
#include "log.hh"

static logging::logger slogger("dynamap-shard");

namespace dynamap::streams {

shard::shard(session& s, std::string stream_arn, std::string shard_id, unsigned calls_to_reach_head)
    : _session(&s)
    , _stream_arn(std::move(stream_arn))
    , _shard_id(std::move(shard_id))
    , _calls_to_reach_head(calls_to_reach_head)
{ }

void shard::jump_to(shard_iterator_type type, std::optional<std::string> sequence_number) {
    bool fixed = type == shard_iterator_type::at_sequence || type == shard_iterator_type::after_sequence;
    if (fixed && !sequence_number) {
        throw std::invalid_argument(fmt::format("{} iterator for shard {} needs a sequence number", type, _shard_id));
    }
    if (!fixed) {
        sequence_number.reset();
    }
    slogger.debug("shard {} jumps to {} {}", _shard_id, type, sequence_number.value_or(""));
    try {
        _iterator_id = _session->get_shard_iterator(_stream_arn, _shard_id, type, sequence_number);
    } catch (const api_error& e) {
        rjson::value request = rjson::empty_object();
        rjson::add(request, "StreamArn", std::string_view(_stream_arn));
        rjson::add(request, "ShardId", std::string_view(_shard_id));
        rjson::add(request, "ShardIteratorType", fmt::format("{}", type));
        if (sequence_number) {
            rjson::add(request, "SequenceNumber", std::string_view(*sequence_number));
        }
        translate_session_error(e, "GetShardIterator", request);
    }
    _iterator_type = type;
    _sequence_number = std::move(sequence_number);
    _empty_responses = 0;
}

void shard::jump_to_or_trim_horizon(shard_iterator_type type, std::optional<std::string> sequence_number) {
    try {
        jump_to(type, std::move(sequence_number));
    } catch (const records_expired& e) {
        slogger.warn("position of shard {} expired, restarting from trim_horizon: {}", _shard_id, e.what());
        jump_to(shard_iterator_type::trim_horizon);
    }
}

std::vector<stream_record> shard::fetch() {
    if (!_iterator_id) {
        throw std::logic_error(fmt::format("shard {} was never positioned", _shard_id));
    }
    rjson::value response;
    try {
        response = _session->get_records(*_iterator_id);
    } catch (const api_error& e) {
        rjson::value request = rjson::empty_object();
        rjson::add(request, "ShardIterator", std::string_view(*_iterator_id));
        translate_session_error(e, "GetRecords", request);
    }
    if (auto next = rjson::get_opt<std::string>(response, "NextShardIterator")) {
        _iterator_id = std::move(*next);
    } else {
        slogger.debug("shard {} exhausted", _shard_id);
        _iterator_id = std::string(exhausted_iterator);
    }
    std::vector<stream_record> records;
    if (auto raw = rjson::find(response, "Records")) {
        for (auto& r : raw->GetArray()) {
            records.push_back(reformat_record(r));
        }
    }
    slogger.trace("shard {} fetched {} records", _shard_id, records.size());
    if (records.empty()) {
        ++_empty_responses;
        return records;
    }
    _empty_responses = 0;
    if (!_sequence_number) {
        _sequence_number = records.front().meta.sequence_number;
        _iterator_type = shard_iterator_type::at_sequence;
    }
    return records;
}

std::vector<stream_record> shard::get_records() {
    if (exhausted()) {
        return {};
    }
    if (_empty_responses >= _calls_to_reach_head) {
        return fetch();
    }
    while (_empty_responses < _calls_to_reach_head) {
        auto records = fetch();
        if (!records.empty() || exhausted()) {
            return records;
        }
    }
    return {};
}

std::vector<stream_record> shard::next_records() {
    try {
        return get_records();
    } catch (const shard_iterator_expired&) {
        if (!_sequence_number) {
            throw;
        }
        slogger.warn("iterator of shard {} expired, refreshing from {} {}", _shard_id, *_iterator_type, *_sequence_number);
    } catch (const records_expired& e) {
        slogger.warn("records of shard {} expired, restarting from trim_horizon: {}", _shard_id, e.what());
        jump_to(shard_iterator_type::trim_horizon);
        return get_records();
    }
    jump_to_or_trim_horizon(*_iterator_type, _sequence_number);
    return get_records();
}

void shard::load_children() {
    if (!_children.empty()) {
        return;
    }
    rjson::value description;
    try {
        description = _session->describe_stream(_stream_arn, _shard_id);
    } catch (const api_error& e) {
        rjson::value request = rjson::empty_object();
        rjson::add(request, "StreamArn", std::string_view(_stream_arn));
        rjson::add(request, "ExclusiveStartShardId", std::string_view(_shard_id));
        translate_session_error(e, "DescribeStream", request);
    }
    // Shards later in the listing may descend from this one through
    // shards listed before them; parents always come first.
    std::map<std::string, shard*> known{{_shard_id, this}};
    for (auto& desc : rjson::get(description, "Shards").GetArray()) {
        auto parent_id = rjson::get_opt<std::string>(desc, "ParentShardId");
        if (!parent_id) {
            continue;
        }
        auto parent = known.find(*parent_id);
        if (parent == known.end()) {
            continue;
        }
        auto child = std::make_shared<shard>(*_session, _stream_arn,
                std::string(rjson::to_string_view(rjson::get(desc, "ShardId"))), _calls_to_reach_head);
        known.emplace(child->shard_id(), child.get());
        parent->second->add_child(std::move(child));
    }
    slogger.debug("shard {} has {} children", _shard_id, _children.size());
}

void shard::add_child(std::shared_ptr<shard> child) {
    child->set_parent(this);
    _children.push_back(std::move(child));
}

void shard::remove_child(const shard* child) noexcept {
    std::erase_if(_children, [child] (const std::shared_ptr<shard>& c) { return c.get() == child; });
}

std::vector<stream_record> shard::seek_to(std::chrono::system_clock::time_point t) {
    jump_to(shard_iterator_type::trim_horizon);
    std::optional<std::string> last_seen;
    while (!exhausted() && _empty_responses < _calls_to_reach_head) {
        auto records = get_records();
        if (records.empty()) {
            continue;
        }
        auto first = std::find_if(records.begin(), records.end(), [t] (const stream_record& r) {
            return r.meta.created_at >= t;
        });
        if (first != records.end()) {
            set_position(shard_iterator_type::at_sequence, first->meta.sequence_number);
            return std::vector<stream_record>(std::make_move_iterator(first), std::make_move_iterator(records.end()));
        }
        last_seen = records.back().meta.sequence_number;
    }
    if (last_seen) {
        // Everything read so far is older than t.
        set_position(shard_iterator_type::after_sequence, std::move(last_seen));
    }
    return {};
}

void shard::set_position(shard_iterator_type type, std::optional<std::string> sequence_number) noexcept {
    _iterator_type = type;
    _sequence_number = std::move(sequence_number);
}

void shard::restore(std::optional<shard_iterator_type> type, std::optional<std::string> sequence_number) noexcept {
    _iterator_type = type;
    _sequence_number = std::move(sequence_number);
}

shard_token shard::token() const {
    return shard_token{
        .shard_id = _shard_id,
        .iterator_type = _iterator_type,
        .sequence_number = _sequence_number,
        .parent = _parent ? std::optional<std::string>(_parent->shard_id()) : std::nullopt,
    };
}

bool shard::operator==(const shard& other) const {
    auto child_ids = [] (const shard& s) {
        std::set<std::string> ids;
        for (auto& c : s._children) {
            ids.insert(c->shard_id());
        }
        return ids;
    };
    return _stream_arn == other._stream_arn && _shard_id == other._shard_id
            && _iterator_id == other._iterator_id && child_ids(*this) == child_ids(other);
}

std::vector<std::shared_ptr<shard>> walk_tree(const std::shared_ptr<shard>& root) {
    std::vector<std::shared_ptr<shard>> ret;
    std::deque<std::shared_ptr<shard>> queue{root};
    while (!queue.empty()) {
        auto s = std::move(queue.front());
        queue.pop_front();
        queue.insert(queue.end(), s->children().begin(), s->children().end());
        ret.push_back(std::move(s));
    }
    return ret;
}

}

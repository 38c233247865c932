/*
 * Copyright 2024-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "dynamap/streams/coordinator.hh"

#include <algorithm>
#include <deque>
#include <map>
#include <set>
#include <fmt/chrono.h>
#include <fmt/format.h>

#include "dynamap/error.hh"
#include "log.hh"
#include "utils/overloaded_functor.hh"

static logging::logger clogger("dynamap-coordinator");

namespace dynamap::streams {

std::ostream& operator<<(std::ostream& os, stream_endpoint e) {
    switch (e) {
        case stream_endpoint::trim_horizon: os << "trim_horizon"; break;
        case stream_endpoint::latest: os << "latest"; break;
        default: throw std::logic_error(std::to_string(int(e)));
    }
    return os;
}

coordinator::coordinator(session& s, std::string stream_arn, unsigned calls_to_reach_head)
    : _session(s)
    , _stream_arn(std::move(stream_arn))
    , _calls_to_reach_head(calls_to_reach_head)
{ }

bool coordinator::is_active(const shard* s) const noexcept {
    return std::any_of(_active.begin(), _active.end(), [s] (const std::shared_ptr<shard>& a) { return a.get() == s; });
}

void coordinator::add_root(std::shared_ptr<shard> s) {
    _roots.push_back(std::move(s));
}

void coordinator::activate(std::shared_ptr<shard> s) {
    if (!is_active(s.get())) {
        _active.push_back(std::move(s));
    }
}

void coordinator::clear() noexcept {
    _roots.clear();
    _active.clear();
    _buffer.clear();
}

void coordinator::advance_shards() {
    if (!_buffer.empty()) {
        return;
    }
    // Records are buffered shard by shard. A shard that throws leaves the
    // records of the shards polled before it in the buffer.
    size_t fetched = 0;
    for (auto& s : _active) {
        fetched += buffer_records(s, s->next_records());
    }
    clogger.debug("buffered {} records from {} shards", fetched, _active.size());
    remove_exhausted();
}

void coordinator::heartbeat() {
    size_t fetched = 0;
    for (auto& s : _active) {
        if (s->sequence_number()) {
            continue;
        }
        fetched += buffer_records(s, s->next_records());
    }
    if (fetched) {
        clogger.debug("heartbeat buffered {} records", fetched);
    }
    remove_exhausted();
}

size_t coordinator::buffer_records(const std::shared_ptr<shard>& s, std::vector<stream_record> records) {
    std::vector<buffered_record> batch;
    batch.reserve(records.size());
    for (auto& r : records) {
        batch.push_back(buffered_record{std::move(r), s});
    }
    _buffer.push_all(std::move(batch));
    return records.size();
}

std::optional<stream_record> coordinator::next() {
    if (_buffer.empty()) {
        advance_shards();
    }
    if (_buffer.empty()) {
        return std::nullopt;
    }
    auto r = _buffer.pop();
    r.source->set_position(shard_iterator_type::after_sequence, r.record.meta.sequence_number);
    return std::move(r.record);
}

// Records already buffered from an exhausted shard stay in the buffer; the
// shard only stops being polled.
void coordinator::remove_exhausted() {
    std::vector<std::shared_ptr<shard>> exhausted;
    std::copy_if(_active.begin(), _active.end(), std::back_inserter(exhausted), [] (const std::shared_ptr<shard>& s) {
        return s->exhausted();
    });
    for (auto& s : exhausted) {
        s->load_children();
        detach_shard(s);
        clogger.debug("replaced exhausted shard {} with {} children", s->shard_id(), s->children().size());
    }
}

void coordinator::detach_shard(std::shared_ptr<shard> s) {
    auto& children = s->children();
    auto root = std::find(_roots.begin(), _roots.end(), s);
    if (root != _roots.end()) {
        _roots.erase(root);
        for (auto& child : children) {
            child->set_parent(nullptr);
            _roots.push_back(child);
        }
    } else if (auto parent = s->parent()) {
        // Keep the children in the tree for token().
        for (auto& child : children) {
            parent->add_child(child);
        }
        parent->remove_child(s.get());
    }
    auto active = std::find(_active.begin(), _active.end(), s);
    if (active != _active.end()) {
        _active.erase(active);
        for (auto& child : children) {
            if (!is_active(child.get())) {
                child->jump_to(shard_iterator_type::trim_horizon);
                _active.push_back(child);
            }
        }
    }
}

void coordinator::remove_shard(std::shared_ptr<shard> s) {
    detach_shard(s);
    _buffer.remove_if_source(s.get());
}

// Replaces the forest with the shards the stream has now.
void coordinator::load_forest() {
    rjson::value description;
    try {
        description = _session.describe_stream(_stream_arn);
    } catch (const api_error& e) {
        rjson::value request = rjson::empty_object();
        rjson::add(request, "StreamArn", std::string_view(_stream_arn));
        translate_session_error(e, "DescribeStream", request);
    }
    std::map<std::string, std::shared_ptr<shard>> by_id;
    std::vector<std::pair<std::shared_ptr<shard>, std::optional<std::string>>> listed;
    for (auto& desc : rjson::get(description, "Shards").GetArray()) {
        auto id = std::string(rjson::to_string_view(rjson::get(desc, "ShardId")));
        auto s = std::make_shared<shard>(_session, _stream_arn, id, _calls_to_reach_head);
        by_id.emplace(id, s);
        listed.emplace_back(std::move(s), rjson::get_opt<std::string>(desc, "ParentShardId"));
    }
    for (auto& [s, parent_id] : listed) {
        auto parent = parent_id ? by_id.find(*parent_id) : by_id.end();
        if (parent != by_id.end()) {
            parent->second->add_child(s);
        } else {
            _roots.push_back(s);
        }
    }
    clogger.debug("stream {} has {} shards in {} trees", _stream_arn, listed.size(), _roots.size());
}

void coordinator::move_to(const stream_position& position) {
    std::visit(overloaded_functor{
        [this] (stream_endpoint e) { move_to_endpoint(e); },
        [this] (std::chrono::system_clock::time_point t) { move_to_time(t); },
        [this] (const stream_token& token) { move_to_token(token); },
    }, position);
}

void coordinator::move_to_endpoint(stream_endpoint endpoint) {
    clogger.info("moving stream {} to {}", _stream_arn, endpoint);
    clear();
    load_forest();
    if (endpoint == stream_endpoint::trim_horizon) {
        for (auto& root : _roots) {
            root->jump_to(shard_iterator_type::trim_horizon);
            _active.push_back(root);
        }
        return;
    }
    for (auto& root : _roots) {
        for (auto& s : walk_tree(root)) {
            if (s->children().empty()) {
                s->jump_to(shard_iterator_type::latest);
                _active.push_back(s);
            }
        }
    }
}

void coordinator::move_to_time(std::chrono::system_clock::time_point t) {
    clogger.info("moving stream {} to {}", _stream_arn, t);
    clear();
    load_forest();
    std::vector<buffered_record> found;
    std::deque<std::shared_ptr<shard>> queue(_roots.begin(), _roots.end());
    while (!queue.empty()) {
        auto s = std::move(queue.front());
        queue.pop_front();
        auto records = s->seek_to(t);
        if (!records.empty()) {
            for (auto& r : records) {
                found.push_back(buffered_record{std::move(r), s});
            }
            _active.push_back(s);
        } else if (s->exhausted()) {
            // Nothing after t here; the records are in its children.
            s->load_children();
            for (auto& child : s->children()) {
                queue.push_back(child);
            }
        } else {
            // Caught up with an open shard; read new records from here.
            _active.push_back(s);
        }
    }
    _buffer.push_all(std::move(found));
}

void coordinator::move_to_token(const stream_token& token) {
    clogger.info("moving stream {} to a token with {} shards", _stream_arn, token.shards.size());
    if (token.stream_arn != _stream_arn) {
        throw invalid_stream(fmt::format("token of stream {} cannot be used with stream {}", token.stream_arn, _stream_arn));
    }
    clear();
    std::map<std::string, std::shared_ptr<shard>> by_id;
    for (auto& st : token.shards) {
        auto s = std::make_shared<shard>(_session, _stream_arn, st.shard_id, _calls_to_reach_head);
        s->restore(st.iterator_type, st.sequence_number);
        by_id.emplace(st.shard_id, std::move(s));
    }
    for (auto& st : token.shards) {
        auto& s = by_id.at(st.shard_id);
        auto parent = st.parent ? by_id.find(*st.parent) : by_id.end();
        if (parent != by_id.end()) {
            parent->second->add_child(s);
        } else {
            _roots.push_back(s);
        }
    }
    for (auto& id : token.active) {
        auto it = by_id.find(id);
        if (it == by_id.end()) {
            clear();
            throw invalid_stream(fmt::format("active shard {} is missing from the token", id));
        }
        _active.push_back(it->second);
    }

    // Drop the shards the stream no longer has, replacing them with their
    // descendants, from the token or from the stream.
    rjson::value description;
    try {
        description = _session.describe_stream(_stream_arn);
    } catch (const api_error& e) {
        rjson::value request = rjson::empty_object();
        rjson::add(request, "StreamArn", std::string_view(_stream_arn));
        translate_session_error(e, "DescribeStream", request);
    }
    std::set<std::string> live;
    std::multimap<std::string, std::string> live_children;
    for (auto& desc : rjson::get(description, "Shards").GetArray()) {
        auto id = std::string(rjson::to_string_view(rjson::get(desc, "ShardId")));
        if (auto parent = rjson::get_opt<std::string>(desc, "ParentShardId")) {
            live_children.emplace(*parent, id);
        }
        live.insert(std::move(id));
    }
    std::deque<std::shared_ptr<shard>> to_check(_roots.begin(), _roots.end());
    _roots.clear();
    while (!to_check.empty()) {
        auto s = std::move(to_check.front());
        to_check.pop_front();
        if (live.contains(s->shard_id())) {
            s->set_parent(nullptr);
            _roots.push_back(std::move(s));
            continue;
        }
        clogger.debug("shard {} of the token is gone from stream {}", s->shard_id(), _stream_arn);
        if (s->children().empty()) {
            auto [begin, end] = live_children.equal_range(s->shard_id());
            for (auto it = begin; it != end; ++it) {
                s->add_child(std::make_shared<shard>(_session, _stream_arn, it->second, _calls_to_reach_head));
            }
        }
        bool was_active = is_active(s.get());
        std::erase(_active, s);
        for (auto& child : s->children()) {
            child->set_parent(nullptr);
            if (was_active) {
                activate(child);
            }
            to_check.push_back(child);
        }
    }
    if (_roots.empty()) {
        clear();
        throw invalid_stream(fmt::format("no shard of the token is left in stream {}", _stream_arn));
    }

    for (auto& s : _active) {
        auto type = s->iterator_type().value_or(shard_iterator_type::trim_horizon);
        auto seq = s->sequence_number();
        bool fixed = type == shard_iterator_type::at_sequence || type == shard_iterator_type::after_sequence;
        if (fixed && !seq) {
            type = shard_iterator_type::trim_horizon;
        }
        s->jump_to_or_trim_horizon(type, seq);
    }
}

stream_token coordinator::token() const {
    stream_token ret;
    ret.stream_arn = _stream_arn;
    for (auto& s : _active) {
        ret.active.push_back(s->shard_id());
    }
    for (auto& root : _roots) {
        for (auto& s : walk_tree(root)) {
            ret.shards.push_back(s->token());
        }
    }
    return ret;
}

}

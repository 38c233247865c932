/*
 * Copyright 2024-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "dynamap/session.hh"
#include "dynamap/streams/record.hh"
#include "dynamap/streams/token.hh"

namespace dynamap::streams {

// A cursor over one partition of a change stream.
//
// A shard starts unpositioned, gets a relative position (trim_horizon or
// latest) or a fixed one (at/after a sequence number) with jump_to(), and
// turns a relative position into at_sequence of the first record it
// fetches. Only the consumer of a record moves the position past it. A
// shard whose partition is closed and fully read is exhausted for good.
class shard {
public:
    static constexpr std::string_view exhausted_iterator = "<exhausted>";
private:
    session* _session;
    std::string _stream_arn;
    std::string _shard_id;
    std::optional<std::string> _iterator_id;
    std::optional<shard_iterator_type> _iterator_type;
    std::optional<std::string> _sequence_number;
    shard* _parent = nullptr;
    std::vector<std::shared_ptr<shard>> _children;
    unsigned _empty_responses = 0;
    unsigned _calls_to_reach_head;
public:
    shard(session& s, std::string stream_arn, std::string shard_id, unsigned calls_to_reach_head = 5);
    shard(const shard&) = delete;
    shard& operator=(const shard&) = delete;

    const std::string& stream_arn() const noexcept { return _stream_arn; }
    const std::string& shard_id() const noexcept { return _shard_id; }
    const std::optional<std::string>& iterator_id() const noexcept { return _iterator_id; }
    const std::optional<shard_iterator_type>& iterator_type() const noexcept { return _iterator_type; }
    const std::optional<std::string>& sequence_number() const noexcept { return _sequence_number; }
    shard* parent() const noexcept { return _parent; }
    const std::vector<std::shared_ptr<shard>>& children() const noexcept { return _children; }
    unsigned empty_responses() const noexcept { return _empty_responses; }
    bool exhausted() const noexcept { return _iterator_id == exhausted_iterator; }

    // Gets a new iterator from the session and resets the empty fetch
    // count. Throws records_expired if sequence_number was trimmed, and
    // std::invalid_argument if an at/after position lacks a sequence number.
    void jump_to(shard_iterator_type type, std::optional<std::string> sequence_number = {});
    // Like jump_to(), but falls back to trim_horizon when the position expired.
    void jump_to_or_trim_horizon(shard_iterator_type type, std::optional<std::string> sequence_number = {});

    // Fetches until records arrive, the shard is exhausted or the empty
    // fetch budget runs out. Once the budget is spent, every call makes a
    // single fetch.
    std::vector<stream_record> get_records();
    // get_records() that recovers from an expired iterator (by jumping back
    // to the last known position) and from trimmed data (by jumping to
    // trim_horizon).
    std::vector<stream_record> next_records();

    // Discovers the shards split off this one, once.
    void load_children();
    void add_child(std::shared_ptr<shard> child);
    void remove_child(const shard* child) noexcept;
    void set_parent(shard* parent) noexcept { _parent = parent; }

    // Reads from trim_horizon and returns the first records created at or
    // after t, leaving the shard positioned on the first of them. Returns
    // nothing when the shard is exhausted or caught up before such a record.
    std::vector<stream_record> seek_to(std::chrono::system_clock::time_point t);

    // Moves the checkpoint, e.g. past a record that was consumed.
    void set_position(shard_iterator_type type, std::optional<std::string> sequence_number) noexcept;
    // Restores a position read from a token without contacting the session.
    void restore(std::optional<shard_iterator_type> type, std::optional<std::string> sequence_number) noexcept;
    void reset_empty_responses() noexcept { _empty_responses = 0; }

    shard_token token() const;

    // Same stream and shard id, same iterator and same set of children.
    bool operator==(const shard& other) const;
private:
    std::vector<stream_record> fetch();
};

// The shard and all its descendants, breadth first.
std::vector<std::shared_ptr<shard>> walk_tree(const std::shared_ptr<shard>& root);

}

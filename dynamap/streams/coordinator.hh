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
#include <variant>
#include <vector>

#include "dynamap/session.hh"
#include "dynamap/streams/record_buffer.hh"
#include "dynamap/streams/shard.hh"
#include "dynamap/streams/token.hh"

namespace dynamap::streams {

enum class stream_endpoint {
    trim_horizon,
    latest,
};

std::ostream& operator<<(std::ostream& os, stream_endpoint e);

// Where to (re)start reading a stream: one of its ends, the first record
// at or after a point in time, or a saved token.
using stream_position = std::variant<stream_endpoint, std::chrono::system_clock::time_point, stream_token>;

// Merges the shards of one stream into a single, roughly time ordered
// sequence of records.
//
// The coordinator keeps the forest of known shards (roots have no known
// parent) and the active shards it reads from. Records are fetched into a
// buffer only when the buffer is empty, and a shard's checkpoint moves past
// a record only when next() hands the record out. Nothing here sleeps; an
// empty next() means there is nothing to read right now.
class coordinator {
    session& _session;
    std::string _stream_arn;
    unsigned _calls_to_reach_head;
    std::vector<std::shared_ptr<shard>> _roots;
    std::vector<std::shared_ptr<shard>> _active;
    record_buffer _buffer;
public:
    coordinator(session& s, std::string stream_arn, unsigned calls_to_reach_head = 5);
    coordinator(const coordinator&) = delete;
    coordinator& operator=(const coordinator&) = delete;

    const std::string& stream_arn() const noexcept { return _stream_arn; }
    const std::vector<std::shared_ptr<shard>>& roots() const noexcept { return _roots; }
    const std::vector<std::shared_ptr<shard>>& active() const noexcept { return _active; }
    const record_buffer& buffer() const noexcept { return _buffer; }
    record_buffer& buffer() noexcept { return _buffer; }

    // Fetches once from every active shard unless records are still
    // buffered, then replaces exhausted active shards with their children.
    void advance_shards();
    // Fetches once from every active shard that has no sequence number yet,
    // so that relative iterators get a fixed position before they expire.
    void heartbeat();
    std::optional<stream_record> next();

    void move_to(const stream_position& position);

    // Removes the shard from the roots and the active shards, promoting its
    // children into the roles it had, and drops its buffered records.
    // Children promoted into the active shards start at the trim horizon.
    void remove_shard(std::shared_ptr<shard> s);

    // Adds a shard without a parent to the forest.
    void add_root(std::shared_ptr<shard> s);
    // Starts reading from a shard already in the forest.
    void activate(std::shared_ptr<shard> s);

    stream_token token() const;
private:
    void clear() noexcept;
    void load_forest();
    void detach_shard(std::shared_ptr<shard> s);
    void remove_exhausted();
    // Pushes the records of one shard and returns how many there were.
    size_t buffer_records(const std::shared_ptr<shard>& s, std::vector<stream_record> records);
    void move_to_endpoint(stream_endpoint endpoint);
    void move_to_time(std::chrono::system_clock::time_point t);
    void move_to_token(const stream_token& token);
    bool is_active(const shard* s) const noexcept;
};

}

template <> struct fmt::formatter<dynamap::streams::stream_endpoint> : fmt::ostream_formatter {};

/*
 * Copyright 2024-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once

#include <memory>
#include <vector>
#include <boost/multiprecision/cpp_int.hpp>

#include "dynamap/streams/record.hh"

namespace dynamap::streams {

class shard;

// A record together with the shard it was read from.
struct buffered_record {
    stream_record record;
    std::shared_ptr<shard> source;
};

// Min-heap of buffered records ordered by (creation time, sequence number,
// insertion clock). Sequence numbers are compared numerically; the clock
// makes the order total across shards whose timestamps and sequence
// numbers collide.
class record_buffer {
    struct entry {
        std::chrono::system_clock::time_point created_at;
        boost::multiprecision::cpp_int sequence_number;
        uint64_t clock;
        buffered_record value;
    };
    std::vector<entry> _heap;
    uint64_t _clock = 0;
public:
    void push(stream_record record, std::shared_ptr<shard> source);
    // Adds every record and restores the heap once.
    void push_all(std::vector<buffered_record> records);
    // Removes and returns the earliest record. The buffer must not be empty.
    buffered_record pop();
    const buffered_record& peek() const;
    // Drops every record read from source.
    void remove_if_source(const shard* source);
    void clear() noexcept;

    size_t size() const noexcept { return _heap.size(); }
    bool empty() const noexcept { return _heap.empty(); }
private:
    entry make_entry(buffered_record r);
};

}

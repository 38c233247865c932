/*
 * Copyright 2024-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "dynamap/streams/record_buffer.hh"

#include <algorithm>
#include <stdexcept>
#include <tuple>

namespace dynamap::streams {

// std heap algorithms keep the largest element on top, so order greater-first.
static constexpr auto later = [] (const auto& a, const auto& b) {
    return std::tie(a.created_at, a.sequence_number, a.clock) > std::tie(b.created_at, b.sequence_number, b.clock);
};

record_buffer::entry record_buffer::make_entry(buffered_record r) {
    auto created_at = r.record.meta.created_at;
    boost::multiprecision::cpp_int seq(r.record.meta.sequence_number);
    // Odd values only; the clock never repeats.
    _clock += 2;
    return entry{created_at, std::move(seq), _clock - 1, std::move(r)};
}

void record_buffer::push(stream_record record, std::shared_ptr<shard> source) {
    _heap.push_back(make_entry(buffered_record{std::move(record), std::move(source)}));
    std::push_heap(_heap.begin(), _heap.end(), later);
}

void record_buffer::push_all(std::vector<buffered_record> records) {
    _heap.reserve(_heap.size() + records.size());
    for (auto& r : records) {
        _heap.push_back(make_entry(std::move(r)));
    }
    std::make_heap(_heap.begin(), _heap.end(), later);
}

buffered_record record_buffer::pop() {
    if (_heap.empty()) {
        throw std::out_of_range("pop from an empty record buffer");
    }
    std::pop_heap(_heap.begin(), _heap.end(), later);
    auto ret = std::move(_heap.back().value);
    _heap.pop_back();
    return ret;
}

const buffered_record& record_buffer::peek() const {
    if (_heap.empty()) {
        throw std::out_of_range("peek into an empty record buffer");
    }
    return _heap.front().value;
}

void record_buffer::remove_if_source(const shard* source) {
    auto it = std::remove_if(_heap.begin(), _heap.end(), [source] (const entry& e) { return e.value.source.get() == source; });
    if (it == _heap.end()) {
        return;
    }
    _heap.erase(it, _heap.end());
    std::make_heap(_heap.begin(), _heap.end(), later);
}

void record_buffer::clear() noexcept {
    _heap.clear();
}

}

/*
 * Copyright 2024-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once

#include <deque>
#include <optional>
#include <string>
#include <vector>

#include "dynamap/conditions.hh"
#include "dynamap/model.hh"
#include "utils/rjson.hh"

namespace dynamap {

class engine;

struct search_options {
    // Query only: hash key equality, optionally AND one range key condition.
    condition key;
    condition filter;
    // Columns to load; empty loads every column the table or index has.
    std::vector<const column*> projection;
    // Only count the matching items.
    bool count_only = false;
    // Defaults to the engine's consistent_reads.
    std::optional<bool> consistent;
    // Query only: ascending range key order.
    bool forward = true;
    // Stop after this many objects.
    std::optional<unsigned> limit;
    // Parallel scan
    std::optional<unsigned> segment;
    std::optional<unsigned> total_segments;
};

enum class search_mode {
    query,
    scan,
};

// A lazily paged query or scan. Each next() returns one object, fetching
// the next page from the session when the current one is used up.
class search_iterator {
    engine* _engine;
    const model* _model;
    const secondary_index* _index;
    search_mode _mode;
    search_options _options;
    rjson::copyable_value _request;
    std::vector<const column*> _expected;

    std::deque<rjson::copyable_value> _items;
    std::optional<rjson::copyable_value> _last_key;
    bool _exhausted = false;
    size_t _count = 0;
    size_t _scanned = 0;
    size_t _yielded = 0;
public:
    // Throws invalid_search when the options cannot be used together or
    // do not fit the table or index.
    search_iterator(engine& e, const model& m, const secondary_index* index, search_mode mode, search_options options);

    std::optional<object> next();
    // Throws constraint_violation if there is no result.
    object first();
    // Throws constraint_violation unless there is exactly one result.
    object one();
    std::vector<object> all();

    // Items matched and items evaluated by the pages fetched so far.
    size_t count() const noexcept { return _count; }
    size_t scanned() const noexcept { return _scanned; }
    bool exhausted() const noexcept;
    // Starts over from the first page.
    void reset() noexcept;

    const rjson::value& request() const noexcept { return _request; }
private:
    void validate() const;
    void validate_key_condition(const column& hash_key, const column* range_key) const;
    void prepare();
    void fetch_page();
    std::string_view operation() const noexcept;
};

}

/*
 * Copyright 2024-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "dynamap/tracking.hh"

#include <algorithm>

#include "log.hh"

static logging::logger tlogger("dynamap-tracking");

namespace dynamap {

static void sort_by_dynamo_name(std::vector<const column*>& cols) {
    std::sort(cols.begin(), cols.end(), [] (const column* a, const column* b) {
        return a->dynamo_name() < b->dynamo_name();
    });
}

void tracking_table::mark(const object& obj, const column& col) {
    _entries[&obj].marked.insert(&col);
}

bool tracking_table::is_marked(const object& obj, const column& col) const {
    auto it = _entries.find(&obj);
    return it != _entries.end() && it->second.marked.contains(&col);
}

std::vector<const column*> tracking_table::marked(const object& obj) const {
    std::vector<const column*> ret;
    auto it = _entries.find(&obj);
    if (it != _entries.end()) {
        ret.assign(it->second.marked.begin(), it->second.marked.end());
        sort_by_dynamo_name(ret);
    }
    return ret;
}

condition tracking_table::get_snapshot(const object& obj) {
    auto& e = _entries[&obj];
    if (!e.snapshot) {
        auto cols = obj.get_model().columns();
        sort_by_dynamo_name(cols);
        condition snapshot;
        for (auto col : cols) {
            snapshot &= col->path() == value();
        }
        tlogger.trace("new snapshot for {} object: {}", obj.get_model().name(), snapshot);
        e.snapshot = std::move(snapshot);
    }
    return *e.snapshot;
}

void tracking_table::sync(const object& obj, const type_engine& types) {
    auto& e = _entries[&obj];
    condition snapshot;
    for (auto col : marked(obj)) {
        if (col->is_key()) {
            continue;
        }
        auto encoded = types.encode(*col->type(), obj.get(*col));
        snapshot &= condition::make_comparison(comparison_operator::eq, col->path(), wire_value{std::move(encoded)});
    }
    tlogger.trace("synced {} object: {}", obj.get_model().name(), snapshot);
    e.snapshot = std::move(snapshot);
}

void tracking_table::clear(const object& obj) {
    auto it = _entries.find(&obj);
    if (it != _entries.end()) {
        it->second.snapshot.reset();
    }
}

void tracking_table::copy(const object& from, const object& to) {
    auto it = _entries.find(&from);
    if (it == _entries.end()) {
        _entries.erase(&to);
        return;
    }
    auto e = it->second;
    _entries[&to] = std::move(e);
}

void tracking_table::forget(const object& obj) noexcept {
    _entries.erase(&obj);
}

}

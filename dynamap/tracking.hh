/*
 * Copyright 2024-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once

#include <optional>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "dynamap/conditions.hh"
#include "dynamap/model.hh"
#include "dynamap/types.hh"

namespace dynamap {

// Per-object change tracking owned by an engine: which columns were touched
// since the object was created, and the condition describing the values
// last synchronized with the table (used for atomic writes).
//
// Objects are keyed by address; the engine forgets an object when it is
// destroyed, and copies the entry when an object is copied.
class tracking_table {
    struct entry {
        std::unordered_set<const column*> marked;
        std::optional<condition> snapshot;
    };
    std::unordered_map<const object*, entry> _entries;
public:
    void mark(const object& obj, const column& col);
    bool is_marked(const object& obj, const column& col) const;
    // Marked columns sorted by wire name
    std::vector<const column*> marked(const object& obj) const;

    // The cached snapshot, or, for an object never loaded or saved, a
    // condition expecting every column to be absent.
    condition get_snapshot(const object& obj);
    // Rebuilds the snapshot from the current values of the marked non-key
    // columns, encoded right away.
    void sync(const object& obj, const type_engine& types);
    // Drops the snapshot, e.g. after the object was deleted.
    void clear(const object& obj);
    void copy(const object& from, const object& to);
    void forget(const object& obj) noexcept;

    bool contains(const object& obj) const noexcept { return _entries.contains(&obj); }
    size_t size() const noexcept { return _entries.size(); }
};

}

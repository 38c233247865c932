/*
 * Copyright 2024-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once

#include <ostream>
#include "dynamap/types.hh"

namespace dynamap {

// Order of the enumerators is the order of clauses in an UpdateExpression.
enum class action_type {
    set,
    remove,
    add,
    del,
};

std::ostream& operator<<(std::ostream& os, action_type type);

// A pending mutation of one attribute. Plain assignments become SET or
// REMOVE; add and del carry an operand for the ADD and DELETE clauses
// (numeric increments, set union and set difference).
class action {
    action_type _type;
    value _operand;

    action(action_type type, value operand) : _type(type), _operand(std::move(operand)) {}
public:
    static action set(value v) {
        return action(action_type::set, std::move(v));
    }
    static action remove() {
        return action(action_type::remove, value());
    }
    static action add(value v) {
        return action(action_type::add, std::move(v));
    }
    static action del(value v) {
        return action(action_type::del, std::move(v));
    }

    action_type type() const noexcept { return _type; }
    const value& operand() const noexcept { return _operand; }

    bool operator==(const action&) const = default;
};

}

template <> struct fmt::formatter<dynamap::action_type> : fmt::ostream_formatter {};

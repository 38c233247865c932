/*
 * Copyright 2024-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once

#include <memory>
#include <optional>
#include <ostream>
#include <variant>
#include <vector>

#include "dynamap/model.hh"
#include "dynamap/types.hh"
#include "utils/rjson.hh"

namespace dynamap {

enum class comparison_operator {
    eq, ne, lt, le, gt, ge,
};

// Prints the operator the way the expression language spells it.
std::ostream& operator<<(std::ostream& os, comparison_operator op);

// A literal that is already in wire form, e.g. a tracking snapshot value.
// JSON null stands for an absent attribute.
struct wire_value {
    rjson::copyable_value v;
};

// Right-hand side of a leaf condition: a native literal, another attribute,
// or an already encoded literal.
using operand = std::variant<value, attribute_path, wire_value>;

enum class condition_kind {
    empty,
    comparison,
    exists,
    begins_with,
    between,
    contains,
    in,
    conjunction,
    disjunction,
    negation,
};

std::ostream& operator<<(std::ostream& os, condition_kind kind);

// A handle to a node of a condition tree. Handles are cheap to copy and
// share the node; is() compares node identity while == compares structure.
//
// Composition follows these rules, E being the empty condition:
//   a & E == a,  E & a == a
//   (a & b) & (c & d) is one conjunction [a, b, c, d]
//   ~E is E, ~~a is a (the very same node)
// and the same for | with disjunctions. Only &= and |= on an existing
// conjunction or disjunction mutate a node; everything else builds new ones.
//
// An appended child that already reaches the node it is appended to closes
// a cycle. That one edge does not own its target, so the strong edges of a
// tree never form a cycle and releasing the last outside handle frees every
// node. A back edge whose target is gone reads as the empty condition, so
// keep a handle to the node a cycle was closed on for as long as the tree
// is used.
class condition {
public:
    struct node;
private:
    std::shared_ptr<node> _node;
    // Set instead of _node on a child edge that closes a cycle.
    std::weak_ptr<node> _back_edge;

    explicit condition(std::shared_ptr<node> n) : _node(std::move(n)) {}
    node& get() const noexcept;
    condition as_back_edge() const;
public:
    // The empty condition
    condition();

    static condition make_comparison(comparison_operator op, attribute_path path, operand rhs);
    static condition make_exists(attribute_path path, bool negate);
    static condition make_begins_with(attribute_path path, operand prefix);
    static condition make_between(attribute_path path, operand lower, operand upper);
    static condition make_contains(attribute_path path, operand v);
    static condition make_in(attribute_path path, std::vector<operand> values);
    static condition make_conjunction(std::vector<condition> values);
    static condition make_disjunction(std::vector<condition> values);
    static condition make_negation(condition c);

    condition_kind kind() const noexcept;
    bool empty() const noexcept { return kind() == condition_kind::empty; }
    bool is_meta() const noexcept;
    explicit operator bool() const noexcept { return !empty(); }
    bool is(const condition& other) const noexcept { return id() == other.id(); }
    const node* id() const noexcept { return &get(); }
    // True for a child edge that closes a cycle and does not own its node.
    bool is_back_edge() const noexcept { return !_node; }

    // Accessors, valid for the kinds that carry the member.
    comparison_operator op() const;
    bool negated() const;
    const attribute_path& path() const;
    const std::vector<operand>& operands() const;
    const std::vector<condition>& children() const;

    condition operator&(const condition& other) const;
    condition operator|(const condition& other) const;
    condition operator~() const;
    condition& operator&=(const condition& other);
    condition& operator|=(const condition& other);
    // Appends to a conjunction or disjunction in place.
    void append(condition c);

    // Number of leaf conditions reachable through iter_conditions(), plus
    // one if the root is reached again through a cycle. Meta nodes other
    // than the root never count, so for root = a & b with b = c | root the
    // size is 3: the leaves a and c and the edge back to root.
    size_t size() const;

    // Structural equality, safe on cyclic trees.
    bool operator==(const condition& other) const;

    friend std::ostream& operator<<(std::ostream& os, const condition& c);
};

struct condition::node {
    condition_kind kind = condition_kind::empty;
    comparison_operator op = comparison_operator::eq;
    bool negate = false;
    std::optional<attribute_path> path;
    std::vector<operand> operands;
    std::vector<condition> children;
};

// Every condition of the tree in depth-first order, each distinct node
// exactly once, even when the tree contains cycles. A conjunction,
// disjunction or negation at the root is not itself returned unless it is
// reached again through a cycle. Expired back edges are skipped.
std::vector<condition> iter_conditions(const condition& c);

// Every column referenced by the tree, in first-seen order.
std::vector<const column*> iter_columns(const condition& c);

condition operator==(const attribute_path& p, value v);
condition operator!=(const attribute_path& p, value v);
condition operator<(const attribute_path& p, value v);
condition operator<=(const attribute_path& p, value v);
condition operator>(const attribute_path& p, value v);
condition operator>=(const attribute_path& p, value v);

condition operator==(const attribute_path& p, const attribute_path& other);
condition operator!=(const attribute_path& p, const attribute_path& other);
condition operator<(const attribute_path& p, const attribute_path& other);
condition operator<=(const attribute_path& p, const attribute_path& other);
condition operator>(const attribute_path& p, const attribute_path& other);
condition operator>=(const attribute_path& p, const attribute_path& other);

}

template <> struct fmt::formatter<dynamap::condition> : fmt::ostream_formatter {};
template <> struct fmt::formatter<dynamap::comparison_operator> : fmt::ostream_formatter {};
template <> struct fmt::formatter<dynamap::condition_kind> : fmt::ostream_formatter {};

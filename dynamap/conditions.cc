/*
 * Copyright 2024-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "dynamap/conditions.hh"

#include <algorithm>
#include <set>
#include <unordered_set>
#include <fmt/format.h>

#include "dynamap/error.hh"
#include "utils/overloaded_functor.hh"

namespace dynamap {

std::ostream& operator<<(std::ostream& os, comparison_operator op) {
    switch (op) {
        case comparison_operator::eq: os << "="; break;
        case comparison_operator::ne: os << "<>"; break;
        case comparison_operator::lt: os << "<"; break;
        case comparison_operator::le: os << "<="; break;
        case comparison_operator::gt: os << ">"; break;
        case comparison_operator::ge: os << ">="; break;
        default: throw std::logic_error(std::to_string(int(op)));
    }
    return os;
}

std::ostream& operator<<(std::ostream& os, condition_kind kind) {
    switch (kind) {
        case condition_kind::empty: os << "empty"; break;
        case condition_kind::comparison: os << "comparison"; break;
        case condition_kind::exists: os << "exists"; break;
        case condition_kind::begins_with: os << "begins_with"; break;
        case condition_kind::between: os << "between"; break;
        case condition_kind::contains: os << "contains"; break;
        case condition_kind::in: os << "in"; break;
        case condition_kind::conjunction: os << "and"; break;
        case condition_kind::disjunction: os << "or"; break;
        case condition_kind::negation: os << "not"; break;
        default: throw std::logic_error(std::to_string(int(kind)));
    }
    return os;
}

static const std::shared_ptr<condition::node>& empty_node() {
    static const auto n = std::make_shared<condition::node>();
    return n;
}

condition::condition()
    : _node(empty_node())
{ }

condition::node& condition::get() const noexcept {
    if (_node) {
        return *_node;
    }
    // The target of a live back edge is owned by the strong edges of its
    // tree, so the node outlives the temporary returned by lock().
    if (auto n = _back_edge.lock()) {
        return *n;
    }
    return *empty_node();
}

condition condition::as_back_edge() const {
    condition ret;
    ret._node.reset();
    ret._back_edge = _node ? std::weak_ptr<node>(_node) : _back_edge;
    return ret;
}

static std::shared_ptr<condition::node> make_leaf(condition_kind kind, attribute_path path, std::vector<operand> operands) {
    auto n = std::make_shared<condition::node>();
    n->kind = kind;
    n->path.emplace(std::move(path));
    n->operands = std::move(operands);
    return n;
}

condition condition::make_comparison(comparison_operator op, attribute_path path, operand rhs) {
    auto n = make_leaf(condition_kind::comparison, std::move(path), {});
    n->op = op;
    n->operands.push_back(std::move(rhs));
    return condition(std::move(n));
}

condition condition::make_exists(attribute_path path, bool negate) {
    auto n = make_leaf(condition_kind::exists, std::move(path), {});
    n->negate = negate;
    return condition(std::move(n));
}

condition condition::make_begins_with(attribute_path path, operand prefix) {
    auto n = make_leaf(condition_kind::begins_with, std::move(path), {});
    n->operands.push_back(std::move(prefix));
    return condition(std::move(n));
}

condition condition::make_between(attribute_path path, operand lower, operand upper) {
    auto n = make_leaf(condition_kind::between, std::move(path), {});
    n->operands.push_back(std::move(lower));
    n->operands.push_back(std::move(upper));
    return condition(std::move(n));
}

condition condition::make_contains(attribute_path path, operand v) {
    auto n = make_leaf(condition_kind::contains, std::move(path), {});
    n->operands.push_back(std::move(v));
    return condition(std::move(n));
}

condition condition::make_in(attribute_path path, std::vector<operand> values) {
    return condition(make_leaf(condition_kind::in, std::move(path), std::move(values)));
}

static std::shared_ptr<condition::node> make_meta(condition_kind kind, std::vector<condition> children) {
    auto n = std::make_shared<condition::node>();
    n->kind = kind;
    n->children = std::move(children);
    return n;
}

condition condition::make_conjunction(std::vector<condition> values) {
    return condition(make_meta(condition_kind::conjunction, std::move(values)));
}

condition condition::make_disjunction(std::vector<condition> values) {
    return condition(make_meta(condition_kind::disjunction, std::move(values)));
}

condition condition::make_negation(condition c) {
    return condition(make_meta(condition_kind::negation, {std::move(c)}));
}

condition_kind condition::kind() const noexcept {
    return get().kind;
}

bool condition::is_meta() const noexcept {
    auto k = kind();
    return k == condition_kind::conjunction || k == condition_kind::disjunction || k == condition_kind::negation;
}

static bool has_path(condition_kind kind) {
    return kind != condition_kind::empty && kind != condition_kind::conjunction
            && kind != condition_kind::disjunction && kind != condition_kind::negation;
}

comparison_operator condition::op() const {
    if (kind() != condition_kind::comparison) {
        throw std::logic_error(fmt::format("{} condition has no comparison operator", kind()));
    }
    return get().op;
}

bool condition::negated() const {
    if (kind() != condition_kind::exists) {
        throw std::logic_error(fmt::format("{} condition has no negate flag", kind()));
    }
    return get().negate;
}

const attribute_path& condition::path() const {
    if (!has_path(kind())) {
        throw std::logic_error(fmt::format("{} condition has no path", kind()));
    }
    return *get().path;
}

const std::vector<operand>& condition::operands() const {
    return get().operands;
}

const std::vector<condition>& condition::children() const {
    return get().children;
}

// Builds a new meta node joining a and b, flattening either side that
// already is a node of the same kind.
static condition combine(condition_kind kind, const condition& a, const condition& b) {
    if (a.empty()) {
        return b;
    }
    if (b.empty()) {
        return a;
    }
    std::vector<condition> values;
    if (a.kind() == kind) {
        values = a.children();
    } else {
        values.push_back(a);
    }
    if (b.kind() == kind) {
        values.insert(values.end(), b.children().begin(), b.children().end());
    } else {
        values.push_back(b);
    }
    return kind == condition_kind::conjunction
            ? condition::make_conjunction(std::move(values))
            : condition::make_disjunction(std::move(values));
}

condition condition::operator&(const condition& other) const {
    return combine(condition_kind::conjunction, *this, other);
}

condition condition::operator|(const condition& other) const {
    return combine(condition_kind::disjunction, *this, other);
}

condition condition::operator~() const {
    if (empty()) {
        return *this;
    }
    if (kind() == condition_kind::negation) {
        return get().children.front();
    }
    return make_negation(*this);
}

condition& condition::operator&=(const condition& other) {
    if (kind() == condition_kind::conjunction && !other.empty()) {
        append(other);
    } else {
        *this = *this & other;
    }
    return *this;
}

condition& condition::operator|=(const condition& other) {
    if (kind() == condition_kind::disjunction && !other.empty()) {
        append(other);
    } else {
        *this = *this | other;
    }
    return *this;
}

// Whether target is reachable from c, c itself included.
static bool reaches(const condition& c, const condition::node* target) {
    std::unordered_set<const condition::node*> visited;
    std::vector<condition> stack{c};
    while (!stack.empty()) {
        condition n = std::move(stack.back());
        stack.pop_back();
        if (n.id() == target) {
            return true;
        }
        if (!visited.insert(n.id()).second) {
            continue;
        }
        auto& children = n.children();
        stack.insert(stack.end(), children.begin(), children.end());
    }
    return false;
}

void condition::append(condition c) {
    if (kind() != condition_kind::conjunction && kind() != condition_kind::disjunction) {
        throw invalid_condition(fmt::format("cannot append to a {} condition", kind()));
    }
    if (c.empty()) {
        return;
    }
    std::vector<condition> added;
    if (c.kind() == kind() && !c.is(*this)) {
        auto& values = c.children();
        // c may share nodes with this one, so copy before inserting.
        added.assign(values.begin(), values.end());
    } else {
        added.push_back(std::move(c));
    }
    auto& children = get().children;
    for (auto& child : added) {
        if (reaches(child, id())) {
            children.push_back(child.as_back_edge());
        } else {
            children.push_back(std::move(child));
        }
    }
}

std::vector<condition> iter_conditions(const condition& root) {
    std::vector<condition> ret;
    if (root.empty()) {
        return ret;
    }
    if (!root.is_meta()) {
        ret.push_back(root);
        return ret;
    }
    std::unordered_set<const condition::node*> visited{root.id()};
    bool root_yielded = false;
    std::vector<condition> stack(root.children().rbegin(), root.children().rend());
    while (!stack.empty()) {
        condition c = std::move(stack.back());
        stack.pop_back();
        // An expired back edge
        if (c.empty()) {
            continue;
        }
        if (!visited.insert(c.id()).second) {
            if (c.is(root) && !root_yielded) {
                root_yielded = true;
                ret.push_back(c);
            }
            continue;
        }
        ret.push_back(c);
        auto& children = c.children();
        stack.insert(stack.end(), children.rbegin(), children.rend());
    }
    return ret;
}

std::vector<const column*> iter_columns(const condition& c) {
    std::vector<const column*> ret;
    auto add = [&ret] (const column* col) {
        if (std::find(ret.begin(), ret.end(), col) == ret.end()) {
            ret.push_back(col);
        }
    };
    for (auto& cond : iter_conditions(c)) {
        if (!has_path(cond.kind())) {
            continue;
        }
        add(&cond.path().get_column());
        for (auto& o : cond.operands()) {
            if (auto p = std::get_if<attribute_path>(&o)) {
                add(&p->get_column());
            }
        }
    }
    return ret;
}

size_t condition::size() const {
    if (empty()) {
        return 0;
    }
    size_t count = 0;
    for (auto& c : iter_conditions(*this)) {
        if (!c.is_meta() || c.is(*this)) {
            // A re-reached root counts the cycle edge once.
            ++count;
        }
    }
    return count;
}

static bool operand_equal(const operand& a, const operand& b) {
    if (a.index() != b.index()) {
        return false;
    }
    return std::visit(overloaded_functor{
        [&] (const value& v) { return v == std::get<value>(b); },
        [&] (const attribute_path& p) { return p.same_as(std::get<attribute_path>(b)); },
        [&] (const wire_value& w) {
            const rjson::value& lhs = w.v;
            const rjson::value& rhs = std::get<wire_value>(b).v;
            return lhs == rhs;
        },
    }, a);
}

using node_pair = std::pair<const condition::node*, const condition::node*>;

static bool structurally_equal(const condition& a, const condition& b, std::set<node_pair>& visited) {
    if (a.is(b)) {
        return true;
    }
    // A pair already under comparison is assumed equal; any difference
    // is found along the path that first reached it.
    if (!visited.emplace(a.id(), b.id()).second) {
        return true;
    }
    auto& x = *a.id();
    auto& y = *b.id();
    if (x.kind != y.kind || x.op != y.op || x.negate != y.negate) {
        return false;
    }
    if (x.path.has_value() != y.path.has_value() || (x.path && !x.path->same_as(*y.path))) {
        return false;
    }
    if (x.operands.size() != y.operands.size() || x.children.size() != y.children.size()) {
        return false;
    }
    for (size_t i = 0; i < x.operands.size(); ++i) {
        if (!operand_equal(x.operands[i], y.operands[i])) {
            return false;
        }
    }
    for (size_t i = 0; i < x.children.size(); ++i) {
        if (!structurally_equal(x.children[i], y.children[i], visited)) {
            return false;
        }
    }
    return true;
}

bool condition::operator==(const condition& other) const {
    std::set<node_pair> visited;
    return structurally_equal(*this, other, visited);
}

static std::ostream& print_operand(std::ostream& os, const operand& o) {
    std::visit(overloaded_functor{
        [&] (const value& v) { os << v; },
        [&] (const attribute_path& p) { os << p; },
        [&] (const wire_value& w) { os << static_cast<const rjson::value&>(w.v); },
    }, o);
    return os;
}

static void print_condition(std::ostream& os, const condition& c, std::unordered_set<const condition::node*>& ancestors) {
    if (!ancestors.insert(c.id()).second) {
        os << "<cycle>";
        return;
    }
    switch (c.kind()) {
    case condition_kind::empty:
        os << "()";
        break;
    case condition_kind::comparison:
        os << "(" << c.path() << " " << c.op() << " ";
        print_operand(os, c.operands()[0]) << ")";
        break;
    case condition_kind::exists:
        os << (c.negated() ? "not_exists(" : "exists(") << c.path() << ")";
        break;
    case condition_kind::begins_with:
        os << "begins_with(" << c.path() << ", ";
        print_operand(os, c.operands()[0]) << ")";
        break;
    case condition_kind::contains:
        os << "contains(" << c.path() << ", ";
        print_operand(os, c.operands()[0]) << ")";
        break;
    case condition_kind::between:
        os << "(" << c.path() << " between ";
        print_operand(os, c.operands()[0]) << " and ";
        print_operand(os, c.operands()[1]) << ")";
        break;
    case condition_kind::in: {
        os << "(" << c.path() << " in [";
        const char* sep = "";
        for (auto& o : c.operands()) {
            os << sep;
            print_operand(os, o);
            sep = ", ";
        }
        os << "])";
        break;
    }
    case condition_kind::conjunction:
    case condition_kind::disjunction: {
        const char* sep = "";
        os << "(";
        for (auto& child : c.children()) {
            os << sep;
            print_condition(os, child, ancestors);
            sep = c.kind() == condition_kind::conjunction ? " & " : " | ";
        }
        os << ")";
        break;
    }
    case condition_kind::negation:
        os << "~";
        print_condition(os, c.children().front(), ancestors);
        break;
    }
    ancestors.erase(c.id());
}

std::ostream& operator<<(std::ostream& os, const condition& c) {
    std::unordered_set<const condition::node*> ancestors;
    print_condition(os, c, ancestors);
    return os;
}

condition operator==(const attribute_path& p, value v) {
    return condition::make_comparison(comparison_operator::eq, p, std::move(v));
}

condition operator!=(const attribute_path& p, value v) {
    return condition::make_comparison(comparison_operator::ne, p, std::move(v));
}

condition operator<(const attribute_path& p, value v) {
    return condition::make_comparison(comparison_operator::lt, p, std::move(v));
}

condition operator<=(const attribute_path& p, value v) {
    return condition::make_comparison(comparison_operator::le, p, std::move(v));
}

condition operator>(const attribute_path& p, value v) {
    return condition::make_comparison(comparison_operator::gt, p, std::move(v));
}

condition operator>=(const attribute_path& p, value v) {
    return condition::make_comparison(comparison_operator::ge, p, std::move(v));
}

condition operator==(const attribute_path& p, const attribute_path& other) {
    return condition::make_comparison(comparison_operator::eq, p, other);
}

condition operator!=(const attribute_path& p, const attribute_path& other) {
    return condition::make_comparison(comparison_operator::ne, p, other);
}

condition operator<(const attribute_path& p, const attribute_path& other) {
    return condition::make_comparison(comparison_operator::lt, p, other);
}

condition operator<=(const attribute_path& p, const attribute_path& other) {
    return condition::make_comparison(comparison_operator::le, p, other);
}

condition operator>(const attribute_path& p, const attribute_path& other) {
    return condition::make_comparison(comparison_operator::gt, p, other);
}

condition operator>=(const attribute_path& p, const attribute_path& other) {
    return condition::make_comparison(comparison_operator::ge, p, other);
}

condition attribute_path::begins_with(value v) const {
    return condition::make_begins_with(*this, std::move(v));
}

condition attribute_path::between(value lower, value upper) const {
    return condition::make_between(*this, std::move(lower), std::move(upper));
}

condition attribute_path::contains(value v) const {
    return condition::make_contains(*this, std::move(v));
}

condition attribute_path::in(std::vector<value> values) const {
    std::vector<operand> operands;
    operands.reserve(values.size());
    for (auto& v : values) {
        operands.emplace_back(std::move(v));
    }
    return condition::make_in(*this, std::move(operands));
}

condition attribute_path::exists() const {
    return condition::make_exists(*this, false);
}

condition attribute_path::not_exists() const {
    return condition::make_exists(*this, true);
}

condition attribute_path::is_(value v) const {
    return *this == std::move(v);
}

condition attribute_path::is_not(value v) const {
    return *this != std::move(v);
}

condition column::begins_with(value v) const {
    return path().begins_with(std::move(v));
}

condition column::between(value lower, value upper) const {
    return path().between(std::move(lower), std::move(upper));
}

condition column::contains(value v) const {
    return path().contains(std::move(v));
}

condition column::in(std::vector<value> values) const {
    return path().in(std::move(values));
}

condition column::exists() const {
    return path().exists();
}

condition column::not_exists() const {
    return path().not_exists();
}

condition column::is_(value v) const {
    return path().is_(std::move(v));
}

condition column::is_not(value v) const {
    return path().is_not(std::move(v));
}

}

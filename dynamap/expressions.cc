/*
 * Copyright 2024-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "dynamap/expressions.hh"

#include <algorithm>
#include <map>
#include <fmt/format.h>
#include <fmt/ranges.h>

#include "dynamap/error.hh"
#include "log.hh"
#include "utils/overloaded_functor.hh"

static logging::logger rlogger("dynamap-render");

namespace dynamap {

expression_renderer::expression_renderer(const type_engine& types)
    : _types(types)
    , _refs(types)
{ }

reference expression_renderer::name(const attribute_path& path, std::vector<reference>& allocated) {
    allocated.push_back(_refs.name_ref(path));
    return allocated.back();
}

reference expression_renderer::render_operand(const attribute_path& path, const operand& o, std::vector<reference>& allocated,
        bool element_of_path) {
    reference ref = std::visit(overloaded_functor{
        [&] (const value& v) {
            data_type t = path.type();
            if (element_of_path) {
                auto inner = t->inner_types();
                if (inner.size() == 1) {
                    t = inner.front();
                }
            }
            return _refs.value_ref(*t, v);
        },
        [&] (const attribute_path& p) {
            return _refs.name_ref(p);
        },
        [&] (const wire_value& w) {
            return _refs.value_ref(rjson::copy(w.v));
        },
    }, o);
    allocated.push_back(ref);
    return ref;
}

static bool is_absent(const reference_tracker& refs, const reference& ref) {
    return ref.kind == reference_kind::value && refs.stored_value(ref).IsNull();
}

std::string expression_renderer::render(const condition& c, std::vector<reference>& allocated) {
    if (!_in_progress.insert(c.id()).second) {
        throw invalid_condition(fmt::format("cannot render a cyclic condition: {}", c));
    }
    // Renders the operand and rejects it when it encodes to an absent value.
    auto present_operand = [&] (const operand& o, bool element_of_path = false) {
        auto ref = render_operand(c.path(), o, allocated, element_of_path);
        if (is_absent(_refs, ref)) {
            throw invalid_condition(fmt::format("{} condition on {} cannot use an absent value", c.kind(), c.path()));
        }
        return ref.name;
    };
    std::string ret;
    switch (c.kind()) {
    case condition_kind::empty:
        throw invalid_condition("an empty condition cannot be rendered");
    case condition_kind::comparison: {
        auto lhs = name(c.path(), allocated);
        auto rhs = render_operand(c.path(), c.operands()[0], allocated);
        if (is_absent(_refs, rhs)) {
            // Comparing with an absent value checks for the attribute instead.
            _refs.pop_refs(rhs);
            allocated.pop_back();
            if (c.op() == comparison_operator::eq) {
                ret = fmt::format("(attribute_not_exists({}))", lhs.name);
            } else if (c.op() == comparison_operator::ne) {
                ret = fmt::format("(attribute_exists({}))", lhs.name);
            } else {
                throw invalid_condition(fmt::format("cannot compare {} {} with an absent value", c.path(), c.op()));
            }
        } else {
            ret = fmt::format("({} {} {})", lhs.name, c.op(), rhs.name);
        }
        break;
    }
    case condition_kind::exists: {
        auto n = name(c.path(), allocated);
        ret = fmt::format("({}({}))", c.negated() ? "attribute_not_exists" : "attribute_exists", n.name);
        break;
    }
    case condition_kind::begins_with: {
        auto n = name(c.path(), allocated);
        auto prefix = present_operand(c.operands()[0]);
        ret = fmt::format("(begins_with({}, {}))", n.name, prefix);
        break;
    }
    case condition_kind::contains: {
        auto n = name(c.path(), allocated);
        auto v = present_operand(c.operands()[0], true);
        ret = fmt::format("(contains({}, {}))", n.name, v);
        break;
    }
    case condition_kind::between: {
        auto n = name(c.path(), allocated);
        auto lower = present_operand(c.operands()[0]);
        auto upper = present_operand(c.operands()[1]);
        ret = fmt::format("({} BETWEEN {} AND {})", n.name, lower, upper);
        break;
    }
    case condition_kind::in: {
        if (c.operands().empty()) {
            throw invalid_condition(fmt::format("IN condition on {} has no candidate values", c.path()));
        }
        auto n = name(c.path(), allocated);
        std::vector<std::string> values;
        for (auto& o : c.operands()) {
            values.push_back(present_operand(o));
        }
        ret = fmt::format("({} IN ({}))", n.name, fmt::join(values, ", "));
        break;
    }
    case condition_kind::conjunction:
    case condition_kind::disjunction: {
        auto& children = c.children();
        if (children.empty()) {
            throw invalid_condition(fmt::format("cannot render an empty {} condition", c.kind()));
        }
        if (children.size() == 1) {
            ret = render(children.front(), allocated);
            break;
        }
        std::vector<std::string> parts;
        for (auto& child : children) {
            parts.push_back(render(child, allocated));
        }
        auto sep = c.kind() == condition_kind::conjunction ? " AND " : " OR ";
        ret = fmt::format("({})", fmt::join(parts, sep));
        break;
    }
    case condition_kind::negation:
        ret = fmt::format("(NOT {})", render(c.children().front(), allocated));
        break;
    }
    _in_progress.erase(c.id());
    return ret;
}

std::string expression_renderer::render_condition(const condition& c) {
    std::vector<reference> allocated;
    try {
        auto ret = render(c, allocated);
        rlogger.trace("rendered {} as {}", c, ret);
        return ret;
    } catch (...) {
        _refs.pop_refs(allocated);
        _in_progress.clear();
        throw;
    }
}

std::string expression_renderer::projection_expression(const std::vector<const column*>& columns) {
    std::vector<const column*> distinct;
    for (auto col : columns) {
        if (std::find(distinct.begin(), distinct.end(), col) == distinct.end()) {
            distinct.push_back(col);
        }
    }
    std::vector<std::string> names;
    for (auto col : distinct) {
        names.push_back(_refs.name_ref(col->path()).name);
    }
    return fmt::format("{}", fmt::join(names, ", "));
}

std::string expression_renderer::update_expression(const object& obj, const tracking_table& tracking) {
    std::map<action_type, std::vector<std::string>> clauses;
    std::vector<reference> allocated;
    try {
        for (auto col : tracking.marked(obj)) {
            if (col->is_key()) {
                continue;
            }
            auto n = name(col->path(), allocated);
            if (auto a = obj.pending_action(*col)) {
                allocated.push_back(_refs.value_ref(*col->type(), a->operand()));
                auto& v = allocated.back();
                if (is_absent(_refs, v)) {
                    throw invalid_value(fmt::format("{} of an empty value to {}.{}", a->type(), obj.get_model().name(), col->name()));
                }
                clauses[a->type()].push_back(fmt::format("{} {}", n.name, v.name));
                continue;
            }
            allocated.push_back(_refs.value_ref(*col->type(), obj.get(*col)));
            auto& v = allocated.back();
            if (is_absent(_refs, v)) {
                _refs.pop_refs(v);
                allocated.pop_back();
                clauses[action_type::remove].push_back(n.name);
            } else {
                clauses[action_type::set].push_back(fmt::format("{}={}", n.name, v.name));
            }
        }
    } catch (...) {
        _refs.pop_refs(allocated);
        throw;
    }
    std::vector<std::string> parts;
    for (auto& [type, entries] : clauses) {
        parts.push_back(fmt::format("{} {}", type, fmt::join(entries, ", ")));
    }
    auto ret = fmt::format("{}", fmt::join(parts, " "));
    rlogger.trace("update expression for {} object: {}", obj.get_model().name(), ret);
    return ret;
}

void expression_renderer::add_attribute_maps(rjson::value& request) const {
    if (!_refs.attr_names().empty()) {
        rjson::add(request, "ExpressionAttributeNames", _refs.names_json());
    }
    if (_refs.attr_values().MemberCount() > 0) {
        rjson::add(request, "ExpressionAttributeValues", _refs.values_json());
    }
}

rjson::value render(const type_engine& types, tracking_table& tracking, const render_request& req) {
    if ((req.atomic || req.update) && !req.obj) {
        throw invalid_condition("atomic and update expressions need the object they apply to");
    }
    expression_renderer r(types);
    rjson::value ret = rjson::empty_object();
    if (req.filter) {
        rjson::add(ret, "FilterExpression", r.filter_expression(req.filter));
    }
    if (req.projection && !req.projection->empty()) {
        rjson::add(ret, "ProjectionExpression", r.projection_expression(*req.projection));
    }
    if (req.key) {
        rjson::add(ret, "KeyConditionExpression", r.key_expression(req.key));
    }
    condition cond = req.conditional;
    if (req.atomic) {
        cond = cond & tracking.get_snapshot(*req.obj);
    }
    if (cond) {
        rjson::add(ret, "ConditionExpression", r.condition_expression(cond));
    }
    if (req.update) {
        auto update = r.update_expression(*req.obj, tracking);
        if (!update.empty()) {
            rjson::add(ret, "UpdateExpression", update);
        }
    }
    r.add_attribute_maps(ret);
    return ret;
}

}

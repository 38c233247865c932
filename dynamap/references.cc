/*
 * Copyright 2024-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "dynamap/references.hh"

#include <fmt/format.h>

#include "dynamap/error.hh"
#include "utils/overloaded_functor.hh"

namespace dynamap {

reference_tracker::reference_tracker(const type_engine& types)
    : _types(types)
{ }

std::string reference_tracker::next_placeholder(std::string_view prefix) {
    return fmt::format("{}{}", prefix, _next_index++);
}

reference reference_tracker::name_ref(const attribute_path& path) {
    return name_ref(path.get_column().dynamo_name(), path.segments());
}

reference reference_tracker::name_ref(const std::string& dynamo_name, const std::vector<path_segment>& segments) {
    reference ref{.name = {}, .kind = reference_kind::name, .placeholders = {}};
    auto component = [&] (const std::string& raw) {
        auto it = _name_index.find(raw);
        if (it == _name_index.end()) {
            auto placeholder = next_placeholder("#n");
            _attr_names.emplace(placeholder, raw);
            it = _name_index.emplace(raw, std::move(placeholder)).first;
        }
        ++_counts[it->second];
        ref.placeholders.push_back(it->second);
        if (!ref.name.empty()) {
            ref.name += '.';
        }
        ref.name += it->second;
    };
    component(dynamo_name);
    for (auto& segment : segments) {
        std::visit(overloaded_functor{
            [&] (const std::string& key) { component(key); },
            [&] (unsigned index) { ref.name += fmt::format("[{}]", index); },
        }, segment);
    }
    return ref;
}

reference reference_tracker::value_ref(const attribute_path& path, const value& v) {
    return value_ref(*path.type(), v);
}

reference reference_tracker::value_ref(const abstract_type& type, const value& v) {
    return value_ref(_types.encode(type, v));
}

reference reference_tracker::value_ref(rjson::value encoded) {
    auto placeholder = next_placeholder(":v");
    rjson::add(_attr_values, placeholder, std::move(encoded));
    _counts[placeholder] = 1;
    return reference{.name = placeholder, .kind = reference_kind::value, .placeholders = {placeholder}};
}

void reference_tracker::pop_refs(const reference& ref) {
    for (auto& placeholder : ref.placeholders) {
        auto it = _counts.find(placeholder);
        if (it == _counts.end()) {
            continue;
        }
        if (--it->second > 0) {
            continue;
        }
        _counts.erase(it);
        if (ref.kind == reference_kind::value) {
            rjson::remove_member(_attr_values, placeholder);
        } else {
            auto name = _attr_names.find(placeholder);
            if (name != _attr_names.end()) {
                _name_index.erase(name->second);
                _attr_names.erase(name);
            }
        }
    }
}

void reference_tracker::pop_refs(const std::vector<reference>& refs) {
    for (auto& ref : refs) {
        pop_refs(ref);
    }
}

const rjson::value& reference_tracker::stored_value(const reference& ref) const {
    if (ref.kind != reference_kind::value) {
        throw std::logic_error(fmt::format("{} is not a value reference", ref.name));
    }
    return rjson::get(_attr_values, ref.name);
}

rjson::value reference_tracker::names_json() const {
    rjson::value ret = rjson::empty_object();
    for (auto& [placeholder, raw] : _attr_names) {
        rjson::add(ret, placeholder, std::string_view(raw));
    }
    return ret;
}

rjson::value reference_tracker::values_json() const {
    return rjson::copy(_attr_values);
}

}

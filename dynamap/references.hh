/*
 * Copyright 2024-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once

#include <map>
#include <string>
#include <vector>

#include "dynamap/model.hh"
#include "utils/rjson.hh"

namespace dynamap {

enum class reference_kind {
    name,
    value,
};

// The rendering of one operand of an expression. A name reference is the
// dotted path of its placeholders (e.g. "#n0.#n1[3]"), a value reference
// a single ":v<i>" placeholder.
struct reference {
    std::string name;
    reference_kind kind;
    // Placeholders this reference holds a usage count on.
    std::vector<std::string> placeholders;
};

// Allocates expression placeholders for one render pass and keeps the
// ExpressionAttributeNames / ExpressionAttributeValues maps they fill.
//
// Name placeholders are shared between every use of the same attribute
// name, value placeholders never are. Indices come from one counter and
// are never issued twice, even after the placeholder was released.
class reference_tracker {
    const type_engine& _types;
    unsigned _next_index = 0;
    std::map<std::string, std::string> _attr_names;
    rjson::copyable_value _attr_values = rjson::empty_object();
    // raw attribute name -> its placeholder
    std::map<std::string, std::string> _name_index;
    std::map<std::string, unsigned> _counts;
public:
    explicit reference_tracker(const type_engine& types);

    reference name_ref(const attribute_path& path);
    reference name_ref(const std::string& dynamo_name, const std::vector<path_segment>& segments = {});

    // Encodes v with the type of the addressed attribute. An absent value
    // is stored as JSON null and yields a reference all the same; callers
    // decide whether that is acceptable.
    reference value_ref(const attribute_path& path, const value& v);
    reference value_ref(const abstract_type& type, const value& v);
    // Stores an already encoded value.
    reference value_ref(rjson::value encoded);

    // Releases one use of every placeholder in refs. A placeholder with no
    // uses left is removed from the emitted maps.
    void pop_refs(const std::vector<reference>& refs);
    void pop_refs(const reference& ref);

    // The wire value stored for a value reference
    const rjson::value& stored_value(const reference& ref) const;

    const std::map<std::string, std::string>& attr_names() const noexcept { return _attr_names; }
    const rjson::value& attr_values() const noexcept { return _attr_values; }
    rjson::value names_json() const;
    rjson::value values_json() const;
private:
    std::string next_placeholder(std::string_view prefix);
};

}

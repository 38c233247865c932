/*
 * Copyright 2024-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once

#include <chrono>
#include <concepts>
#include <cstdint>
#include <map>
#include <memory>
#include <ostream>
#include <set>
#include <string>
#include <string_view>
#include <unordered_set>
#include <variant>
#include <vector>
#include <boost/uuid/uuid.hpp>

#include "utils/rjson.hh"

namespace dynamap {

struct binary {
    std::string data;

    bool operator==(const binary&) const = default;
    auto operator<=>(const binary&) const = default;
};

using string_set = std::set<std::string>;
using number_set = std::set<double>;
using binary_set = std::set<binary>;

// One step into a document attribute: a map key or a list index.
using path_segment = std::variant<std::string, unsigned>;

// A native attribute value. The default-constructed value is "absent",
// which every type encodes as an omitted attribute.
class value {
public:
    using list = std::vector<value>;
    using map = std::map<std::string, value>;
    using time_point = std::chrono::system_clock::time_point;
    using native_type = std::variant<std::monostate, bool, int64_t, double, std::string, binary,
            string_set, number_set, binary_set, list, map, boost::uuids::uuid, time_point>;
private:
    native_type _v;
public:
    value() = default;
    value(std::nullptr_t) {}
    value(bool v) : _v(v) {}
    template <std::integral T>
    requires (!std::same_as<T, bool>)
    value(T v) : _v(int64_t(v)) {}
    template <std::floating_point T>
    value(T v) : _v(double(v)) {}
    value(const char* v) : _v(std::string(v)) {}
    value(std::string v) : _v(std::move(v)) {}
    value(std::string_view v) : _v(std::string(v)) {}
    value(binary v) : _v(std::move(v)) {}
    value(string_set v) : _v(std::move(v)) {}
    value(number_set v) : _v(std::move(v)) {}
    value(binary_set v) : _v(std::move(v)) {}
    value(list v) : _v(std::move(v)) {}
    value(map v) : _v(std::move(v)) {}
    value(boost::uuids::uuid v) : _v(v) {}
    value(time_point v) : _v(v) {}

    bool is_null() const noexcept {
        return std::holds_alternative<std::monostate>(_v);
    }
    template <typename T>
    bool is() const noexcept {
        return std::holds_alternative<T>(_v);
    }
    // Throws std::bad_variant_access if the value holds another alternative.
    template <typename T>
    const T& as() const {
        return std::get<T>(_v);
    }
    const native_type& native() const noexcept {
        return _v;
    }

    bool operator==(const value& other) const;
    friend std::ostream& operator<<(std::ostream& os, const value& v);
};

class abstract_type;
using data_type = std::shared_ptr<const abstract_type>;

// A wire type: converts native values to and from the tagged single-key
// maps of the wire format, e.g. {"S": "text"} or {"L": [...]}.
class abstract_type {
public:
    virtual ~abstract_type() = default;
    virtual std::string_view name() const = 0;
    // The wire tag, "S", "N", "B", "BOOL", "SS", "NS", "BS", "L" or "M".
    virtual std::string_view backing_type() const = 0;
    // Returns JSON null when the value is absent or empty and the attribute
    // must be omitted. Throws invalid_value on an unsuitable native value.
    virtual rjson::value encode(const value& v) const = 0;
    // Accepts a tagged wire value or JSON null. Absent collections decode
    // to their empty container.
    virtual value decode(const rjson::value& wire) const = 0;
    // Type of the document element addressed by one path segment.
    virtual data_type element_type(const path_segment& segment) const;
    virtual std::vector<data_type> inner_types() const { return {}; }
};

data_type string_type();
data_type integer_type();
data_type float_type();
data_type binary_type();
data_type boolean_type();
// Element must be a string, number or binary type.
data_type set_type(data_type element);
data_type list_type(data_type element);
data_type map_type(std::vector<std::pair<std::string, data_type>> fields);
// A map with arbitrary string keys whose values all have one type.
data_type typed_map_type(data_type element);
// Stored as the canonical lower case string form.
data_type uuid_type();
// Stored as a UTC ISO-8601 string with microseconds, e.g.
// "2016-08-09T01:16:25.322849+00:00", so that string order is time order.
// Decoding accepts any UTC offset and drops precision below microseconds.
data_type datetime_type();

// Dispatches encode/decode to registered types only. Models register
// their column types when they are bound to an engine.
class type_engine {
    std::unordered_set<const abstract_type*> _registered;
    std::vector<data_type> _types;
public:
    void register_type(const data_type& t);
    bool is_registered(const abstract_type& t) const noexcept;
    rjson::value encode(const abstract_type& t, const value& v) const;
    value decode(const abstract_type& t, const rjson::value& wire) const;
private:
    void check_registered(const abstract_type& t) const;
};

}

template <> struct fmt::formatter<dynamap::value> : fmt::ostream_formatter {};

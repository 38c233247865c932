/*
 * Copyright 2024-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "dynamap/types.hh"

#include <cmath>
#include <regex>
#include <boost/date_time/gregorian/gregorian_types.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/uuid/string_generator.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <fmt/chrono.h>
#include <fmt/format.h>
#include <fmt/ranges.h>

#include "dynamap/base64.hh"
#include "dynamap/error.hh"
#include "utils/overloaded_functor.hh"

namespace dynamap {

bool value::operator==(const value& other) const {
    return _v == other._v;
}

static std::string format_datetime(value::time_point tp) {
    auto secs = std::chrono::floor<std::chrono::seconds>(tp);
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(tp - secs).count();
    return fmt::format("{:%Y-%m-%dT%H:%M:%S}.{:06}+00:00", fmt::gmtime(std::chrono::system_clock::to_time_t(secs)), micros);
}

std::ostream& operator<<(std::ostream& os, const value& v) {
    std::visit(overloaded_functor{
        [&] (const std::monostate&) { os << "<absent>"; },
        [&] (bool b) { os << (b ? "true" : "false"); },
        [&] (int64_t i) { os << i; },
        [&] (double d) { os << fmt::format("{}", d); },
        [&] (const std::string& s) { os << '"' << s << '"'; },
        [&] (const binary& b) { os << "b'" << base64_encode(b.data) << "'"; },
        [&] (const string_set& s) { os << fmt::format("{{{}}}", fmt::join(s, ", ")); },
        [&] (const number_set& s) { os << fmt::format("{{{}}}", fmt::join(s, ", ")); },
        [&] (const binary_set& s) {
            os << '{';
            const char* sep = "";
            for (auto& b : s) {
                os << sep << "b'" << base64_encode(b.data) << "'";
                sep = ", ";
            }
            os << '}';
        },
        [&] (const value::list& l) { os << fmt::format("[{}]", fmt::join(l, ", ")); },
        [&] (const value::map& m) {
            os << '{';
            const char* sep = "";
            for (auto& [k, e] : m) {
                os << sep << k << ": " << e;
                sep = ", ";
            }
            os << '}';
        },
        [&] (const boost::uuids::uuid& u) { os << boost::uuids::to_string(u); },
        [&] (const value::time_point& tp) { os << format_datetime(tp); },
    }, v.native());
    return os;
}

data_type abstract_type::element_type(const path_segment& segment) const {
    throw invalid_condition(fmt::format("{} attributes have no nested elements", name()));
}

[[noreturn]] static void throw_mismatch(const abstract_type& t, const value& v) {
    throw invalid_value(fmt::format("{} cannot hold {}", t.name(), v));
}

static rjson::value tagged(std::string_view tag, rjson::value&& payload) {
    auto ret = rjson::empty_object();
    rjson::add(ret, tag, std::move(payload));
    return ret;
}

// Returns the payload of a tagged wire value, or nullptr for JSON null.
static const rjson::value* untag(const abstract_type& t, const rjson::value& wire) {
    if (wire.IsNull()) {
        return nullptr;
    }
    const rjson::value* payload = rjson::find(wire, t.backing_type());
    if (!payload || wire.MemberCount() != 1) {
        throw invalid_value(fmt::format("{} expected a {} wire value, got {}", t.name(), t.backing_type(), wire));
    }
    return payload;
}

static std::string_view payload_string(const abstract_type& t, const rjson::value& payload) {
    if (!payload.IsString()) {
        throw invalid_value(fmt::format("{} expected a string payload, got {}", t.name(), payload));
    }
    return rjson::to_string_view(payload);
}

static std::string format_number(const abstract_type& t, double d) {
    if (!std::isfinite(d)) {
        throw invalid_value(fmt::format("{} cannot hold non-finite number {}", t.name(), d));
    }
    return fmt::format("{}", d);
}

template <typename T>
static T parse_number(const abstract_type& t, std::string_view text) {
    try {
        return boost::lexical_cast<T>(text);
    } catch (boost::bad_lexical_cast&) {
        throw invalid_value(fmt::format("{} cannot parse number {}", t.name(), text));
    }
}

// Parses the ISO-8601 form written by format_datetime(), with any UTC
// offset and one to six fractional digits.
static value::time_point parse_datetime(const abstract_type& t, std::string_view text) {
    static const std::regex datetime_re(R"((\d{4})-(\d{2})-(\d{2})T(\d{2}):(\d{2}):(\d{2})(\.(\d{1,6}))?(Z|([+-])(\d{2}):(\d{2})))");
    std::cmatch m;
    if (!std::regex_match(text.data(), text.data() + text.size(), m, datetime_re)) {
        throw invalid_value(fmt::format("{} cannot parse {}", t.name(), text));
    }
    auto number = [&m] (int i) { return boost::lexical_cast<int>(m.str(i)); };
    int64_t day_count;
    try {
        boost::gregorian::date date(number(1), number(2), number(3));
        day_count = (date - boost::gregorian::date(1970, 1, 1)).days();
    } catch (std::out_of_range& e) {
        throw invalid_value(fmt::format("{} cannot parse {}: {}", t.name(), text, e.what()));
    }
    auto hour = number(4);
    auto minute = number(5);
    auto second = number(6);
    if (hour > 23 || minute > 59 || second > 59) {
        throw invalid_value(fmt::format("{} cannot parse {}: time of day out of range", t.name(), text));
    }
    int64_t micros = 0;
    if (m[8].matched) {
        auto digits = m.str(8);
        digits.resize(6, '0');
        micros = boost::lexical_cast<int64_t>(digits);
    }
    std::chrono::minutes offset{0};
    if (m[10].matched) {
        offset = std::chrono::hours(number(11)) + std::chrono::minutes(number(12));
        if (m.str(10) == "-") {
            offset = -offset;
        }
    }
    auto since_epoch = std::chrono::days(day_count) + std::chrono::hours(hour) + std::chrono::minutes(minute)
            + std::chrono::seconds(second) + std::chrono::microseconds(micros) - offset;
    return value::time_point(std::chrono::duration_cast<value::time_point::duration>(since_epoch));
}

namespace {

class string_type_impl final : public abstract_type {
public:
    std::string_view name() const override { return "String"; }
    std::string_view backing_type() const override { return "S"; }
    rjson::value encode(const value& v) const override {
        if (v.is_null()) {
            return rjson::null_value();
        }
        if (!v.is<std::string>()) {
            throw_mismatch(*this, v);
        }
        auto& s = v.as<std::string>();
        if (s.empty()) {
            return rjson::null_value();
        }
        return tagged(backing_type(), rjson::from_string(s));
    }
    value decode(const rjson::value& wire) const override {
        auto payload = untag(*this, wire);
        if (!payload) {
            return value();
        }
        return value(payload_string(*this, *payload));
    }
};

class integer_type_impl final : public abstract_type {
public:
    std::string_view name() const override { return "Integer"; }
    std::string_view backing_type() const override { return "N"; }
    rjson::value encode(const value& v) const override {
        if (v.is_null()) {
            return rjson::null_value();
        }
        if (!v.is<int64_t>()) {
            throw_mismatch(*this, v);
        }
        return tagged(backing_type(), rjson::from_string(fmt::format("{}", v.as<int64_t>())));
    }
    value decode(const rjson::value& wire) const override {
        auto payload = untag(*this, wire);
        if (!payload) {
            return value();
        }
        return value(parse_number<int64_t>(*this, payload_string(*this, *payload)));
    }
};

class float_type_impl final : public abstract_type {
public:
    std::string_view name() const override { return "Float"; }
    std::string_view backing_type() const override { return "N"; }
    rjson::value encode(const value& v) const override {
        if (v.is_null()) {
            return rjson::null_value();
        }
        double d;
        if (v.is<double>()) {
            d = v.as<double>();
        } else if (v.is<int64_t>()) {
            d = double(v.as<int64_t>());
        } else {
            throw_mismatch(*this, v);
        }
        return tagged(backing_type(), rjson::from_string(format_number(*this, d)));
    }
    value decode(const rjson::value& wire) const override {
        auto payload = untag(*this, wire);
        if (!payload) {
            return value();
        }
        return value(parse_number<double>(*this, payload_string(*this, *payload)));
    }
};

class binary_type_impl final : public abstract_type {
public:
    std::string_view name() const override { return "Binary"; }
    std::string_view backing_type() const override { return "B"; }
    rjson::value encode(const value& v) const override {
        if (v.is_null()) {
            return rjson::null_value();
        }
        if (!v.is<binary>()) {
            throw_mismatch(*this, v);
        }
        auto& b = v.as<binary>();
        if (b.data.empty()) {
            return rjson::null_value();
        }
        return tagged(backing_type(), rjson::from_string(base64_encode(b.data)));
    }
    value decode(const rjson::value& wire) const override {
        auto payload = untag(*this, wire);
        if (!payload) {
            return value();
        }
        try {
            return value(binary{base64_decode(payload_string(*this, *payload))});
        } catch (std::invalid_argument& e) {
            throw invalid_value(fmt::format("{}: {}", name(), e.what()));
        }
    }
};

class boolean_type_impl final : public abstract_type {
public:
    std::string_view name() const override { return "Boolean"; }
    std::string_view backing_type() const override { return "BOOL"; }
    rjson::value encode(const value& v) const override {
        if (v.is_null()) {
            return rjson::null_value();
        }
        if (!v.is<bool>()) {
            throw_mismatch(*this, v);
        }
        return tagged(backing_type(), rjson::value(v.as<bool>()));
    }
    value decode(const rjson::value& wire) const override {
        auto payload = untag(*this, wire);
        if (!payload) {
            return value();
        }
        if (!payload->IsBool()) {
            throw invalid_value(fmt::format("{} expected a boolean payload, got {}", name(), *payload));
        }
        return value(payload->GetBool());
    }
};

class set_type_impl final : public abstract_type {
    data_type _element;
    std::string _tag;
    std::string _name;
public:
    explicit set_type_impl(data_type element)
        : _element(std::move(element))
        , _tag(std::string(_element->backing_type()) + "S")
        , _name(fmt::format("Set[{}]", _element->name()))
    { }
    std::string_view name() const override { return _name; }
    std::string_view backing_type() const override { return _tag; }
    std::vector<data_type> inner_types() const override { return {_element}; }

    rjson::value encode(const value& v) const override {
        if (v.is_null()) {
            return rjson::null_value();
        }
        auto items = rjson::empty_array();
        if (_tag == "SS" && v.is<string_set>()) {
            for (auto& s : v.as<string_set>()) {
                rjson::push_back(items, rjson::from_string(s));
            }
        } else if (_tag == "NS" && v.is<number_set>()) {
            for (double d : v.as<number_set>()) {
                rjson::push_back(items, rjson::from_string(format_number(*this, d)));
            }
        } else if (_tag == "BS" && v.is<binary_set>()) {
            for (auto& b : v.as<binary_set>()) {
                rjson::push_back(items, rjson::from_string(base64_encode(b.data)));
            }
        } else {
            throw_mismatch(*this, v);
        }
        if (items.Empty()) {
            return rjson::null_value();
        }
        return tagged(backing_type(), std::move(items));
    }

    value decode(const rjson::value& wire) const override {
        auto payload = untag(*this, wire);
        if (payload && !payload->IsArray()) {
            throw invalid_value(fmt::format("{} expected an array payload, got {}", name(), *payload));
        }
        if (_tag == "SS") {
            string_set ret;
            if (payload) {
                for (auto& item : payload->GetArray()) {
                    ret.emplace(payload_string(*this, item));
                }
            }
            return value(std::move(ret));
        } else if (_tag == "NS") {
            number_set ret;
            if (payload) {
                for (auto& item : payload->GetArray()) {
                    ret.insert(parse_number<double>(*this, payload_string(*this, item)));
                }
            }
            return value(std::move(ret));
        }
        binary_set ret;
        if (payload) {
            for (auto& item : payload->GetArray()) {
                try {
                    ret.insert(binary{base64_decode(payload_string(*this, item))});
                } catch (std::invalid_argument& e) {
                    throw invalid_value(fmt::format("{}: {}", name(), e.what()));
                }
            }
        }
        return value(std::move(ret));
    }
};

class list_type_impl final : public abstract_type {
    data_type _element;
    std::string _name;
public:
    explicit list_type_impl(data_type element)
        : _element(std::move(element))
        , _name(fmt::format("List[{}]", _element->name()))
    { }
    std::string_view name() const override { return _name; }
    std::string_view backing_type() const override { return "L"; }
    std::vector<data_type> inner_types() const override { return {_element}; }

    data_type element_type(const path_segment& segment) const override {
        if (!std::holds_alternative<unsigned>(segment)) {
            throw invalid_condition(fmt::format("{} elements are addressed by index, not by key {}",
                    name(), std::get<std::string>(segment)));
        }
        return _element;
    }

    rjson::value encode(const value& v) const override {
        if (v.is_null()) {
            return rjson::null_value();
        }
        if (!v.is<value::list>()) {
            throw_mismatch(*this, v);
        }
        auto items = rjson::empty_array();
        for (auto& e : v.as<value::list>()) {
            auto encoded = _element->encode(e);
            if (!encoded.IsNull()) {
                rjson::push_back(items, std::move(encoded));
            }
        }
        if (items.Empty()) {
            return rjson::null_value();
        }
        return tagged(backing_type(), std::move(items));
    }

    value decode(const rjson::value& wire) const override {
        value::list ret;
        auto payload = untag(*this, wire);
        if (payload) {
            if (!payload->IsArray()) {
                throw invalid_value(fmt::format("{} expected an array payload, got {}", name(), *payload));
            }
            for (auto& item : payload->GetArray()) {
                ret.push_back(_element->decode(item));
            }
        }
        return value(std::move(ret));
    }
};

class map_type_impl final : public abstract_type {
    std::vector<std::pair<std::string, data_type>> _fields;
    std::string _name;
public:
    explicit map_type_impl(std::vector<std::pair<std::string, data_type>> fields)
        : _fields(std::move(fields))
    {
        std::vector<std::string> parts;
        for (auto& [field, type] : _fields) {
            parts.push_back(fmt::format("{}: {}", field, type->name()));
        }
        _name = fmt::format("Map[{}]", fmt::join(parts, ", "));
    }
    std::string_view name() const override { return _name; }
    std::string_view backing_type() const override { return "M"; }

    std::vector<data_type> inner_types() const override {
        std::vector<data_type> ret;
        for (auto& [field, type] : _fields) {
            ret.push_back(type);
        }
        return ret;
    }

    data_type element_type(const path_segment& segment) const override {
        if (!std::holds_alternative<std::string>(segment)) {
            throw invalid_condition(fmt::format("{} fields are addressed by key, not by index {}",
                    name(), std::get<unsigned>(segment)));
        }
        auto& key = std::get<std::string>(segment);
        for (auto& [field, type] : _fields) {
            if (field == key) {
                return type;
            }
        }
        throw invalid_condition(fmt::format("{} has no field {}", name(), key));
    }

    rjson::value encode(const value& v) const override {
        if (v.is_null()) {
            return rjson::null_value();
        }
        if (!v.is<value::map>()) {
            throw_mismatch(*this, v);
        }
        auto& m = v.as<value::map>();
        size_t known = 0;
        auto fields = rjson::empty_object();
        for (auto& [field, type] : _fields) {
            auto it = m.find(field);
            if (it == m.end()) {
                continue;
            }
            ++known;
            auto encoded = type->encode(it->second);
            if (!encoded.IsNull()) {
                rjson::add(fields, field, std::move(encoded));
            }
        }
        if (known != m.size()) {
            throw_mismatch(*this, v);
        }
        if (fields.MemberCount() == 0) {
            return rjson::null_value();
        }
        return tagged(backing_type(), std::move(fields));
    }

    value decode(const rjson::value& wire) const override {
        value::map ret;
        auto payload = untag(*this, wire);
        if (payload) {
            if (!payload->IsObject()) {
                throw invalid_value(fmt::format("{} expected an object payload, got {}", name(), *payload));
            }
            for (auto& [field, type] : _fields) {
                if (auto item = rjson::find(*payload, field)) {
                    ret.emplace(field, type->decode(*item));
                }
            }
        }
        return value(std::move(ret));
    }
};


class typed_map_type_impl final : public abstract_type {
    data_type _element;
    std::string _name;
public:
    explicit typed_map_type_impl(data_type element)
        : _element(std::move(element))
        , _name(fmt::format("TypedMap[{}]", _element->name()))
    { }
    std::string_view name() const override { return _name; }
    std::string_view backing_type() const override { return "M"; }
    std::vector<data_type> inner_types() const override { return {_element}; }

    data_type element_type(const path_segment& segment) const override {
        if (!std::holds_alternative<std::string>(segment)) {
            throw invalid_condition(fmt::format("{} values are addressed by key, not by index {}",
                    name(), std::get<unsigned>(segment)));
        }
        return _element;
    }

    rjson::value encode(const value& v) const override {
        if (v.is_null()) {
            return rjson::null_value();
        }
        if (!v.is<value::map>()) {
            throw_mismatch(*this, v);
        }
        auto entries = rjson::empty_object();
        for (auto& [key, e] : v.as<value::map>()) {
            auto encoded = _element->encode(e);
            if (!encoded.IsNull()) {
                rjson::add(entries, key, std::move(encoded));
            }
        }
        if (entries.MemberCount() == 0) {
            return rjson::null_value();
        }
        return tagged(backing_type(), std::move(entries));
    }

    value decode(const rjson::value& wire) const override {
        value::map ret;
        auto payload = untag(*this, wire);
        if (payload) {
            if (!payload->IsObject()) {
                throw invalid_value(fmt::format("{} expected an object payload, got {}", name(), *payload));
            }
            for (auto it = payload->MemberBegin(); it != payload->MemberEnd(); ++it) {
                ret.emplace(std::string(rjson::to_string_view(it->name)), _element->decode(it->value));
            }
        }
        return value(std::move(ret));
    }
};

class uuid_type_impl final : public abstract_type {
public:
    std::string_view name() const override { return "UUID"; }
    std::string_view backing_type() const override { return "S"; }
    rjson::value encode(const value& v) const override {
        if (v.is_null()) {
            return rjson::null_value();
        }
        if (!v.is<boost::uuids::uuid>()) {
            throw_mismatch(*this, v);
        }
        return tagged(backing_type(), rjson::from_string(boost::uuids::to_string(v.as<boost::uuids::uuid>())));
    }
    value decode(const rjson::value& wire) const override {
        auto payload = untag(*this, wire);
        if (!payload) {
            return value();
        }
        auto text = payload_string(*this, *payload);
        try {
            return value(boost::uuids::string_generator()(text.begin(), text.end()));
        } catch (std::runtime_error& e) {
            throw invalid_value(fmt::format("{} cannot parse {}: {}", name(), text, e.what()));
        }
    }
};

class datetime_type_impl final : public abstract_type {
public:
    std::string_view name() const override { return "DateTime"; }
    std::string_view backing_type() const override { return "S"; }
    rjson::value encode(const value& v) const override {
        if (v.is_null()) {
            return rjson::null_value();
        }
        if (!v.is<value::time_point>()) {
            throw_mismatch(*this, v);
        }
        return tagged(backing_type(), rjson::from_string(format_datetime(v.as<value::time_point>())));
    }
    value decode(const rjson::value& wire) const override {
        auto payload = untag(*this, wire);
        if (!payload) {
            return value();
        }
        return value(parse_datetime(*this, payload_string(*this, *payload)));
    }
};

}

data_type string_type() {
    static const data_type t = std::make_shared<string_type_impl>();
    return t;
}

data_type integer_type() {
    static const data_type t = std::make_shared<integer_type_impl>();
    return t;
}

data_type float_type() {
    static const data_type t = std::make_shared<float_type_impl>();
    return t;
}

data_type binary_type() {
    static const data_type t = std::make_shared<binary_type_impl>();
    return t;
}

data_type boolean_type() {
    static const data_type t = std::make_shared<boolean_type_impl>();
    return t;
}

data_type set_type(data_type element) {
    auto tag = element->backing_type();
    if (tag != "S" && tag != "N" && tag != "B") {
        throw unknown_type(fmt::format("sets hold strings, numbers or binary, not {}", element->name()));
    }
    return std::make_shared<set_type_impl>(std::move(element));
}

data_type list_type(data_type element) {
    return std::make_shared<list_type_impl>(std::move(element));
}

data_type map_type(std::vector<std::pair<std::string, data_type>> fields) {
    return std::make_shared<map_type_impl>(std::move(fields));
}

data_type typed_map_type(data_type element) {
    return std::make_shared<typed_map_type_impl>(std::move(element));
}

data_type uuid_type() {
    static const data_type t = std::make_shared<uuid_type_impl>();
    return t;
}

data_type datetime_type() {
    static const data_type t = std::make_shared<datetime_type_impl>();
    return t;
}

void type_engine::register_type(const data_type& t) {
    if (!_registered.insert(t.get()).second) {
        return;
    }
    _types.push_back(t);
    for (auto& inner : t->inner_types()) {
        register_type(inner);
    }
}

bool type_engine::is_registered(const abstract_type& t) const noexcept {
    return _registered.contains(&t);
}

void type_engine::check_registered(const abstract_type& t) const {
    if (!is_registered(t)) {
        throw unknown_type(fmt::format("type {} is not registered; bind its model first", t.name()));
    }
}

rjson::value type_engine::encode(const abstract_type& t, const value& v) const {
    check_registered(t);
    return t.encode(v);
}

value type_engine::decode(const abstract_type& t, const rjson::value& wire) const {
    check_registered(t);
    return t.decode(wire);
}

}

/*
 * Copyright 2024-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "utils/rjson.hh"

#include <fmt/format.h>

namespace rjson {

static allocator the_allocator;

// Each object/array layer adds another stack frame to parsing, printing
// and destroying a JSON document, so nesting is bounded.
static constexpr size_t max_nested_level = 39;

/*
 * This wrapper class adds nested level checks to rapidjson's handlers.
 * Each rapidjson handler implements functions for accepting JSON values,
 * which includes strings, numbers, objects, arrays, etc.
 * After trying to exceed the max nested level, a proper rjson::error will be thrown.
 */
template<typename Handler>
struct guarded_json_handler : public Handler {
    size_t _nested_level = 0;
    size_t _max_nested_level;
public:
    using handler_base = Handler;

    explicit guarded_json_handler(size_t max_nested_level) : _max_nested_level(max_nested_level) {}
    explicit guarded_json_handler(string_buffer& buf, size_t max_nested_level)
            : handler_base(buf), _max_nested_level(max_nested_level) {}

    void Parse(const char* str, size_t length) {
        rapidjson::MemoryStream ms(static_cast<const char*>(str), length * sizeof(typename encoding::Ch));
        rapidjson::EncodedInputStream<encoding, rapidjson::MemoryStream> is(ms);
        rapidjson::GenericReader<encoding, encoding, allocator> reader(&the_allocator);
        reader.Parse(is, *this);
        // The parsed data sits on the document's private stack; Populate() with
        // an empty generator moves it into the document itself.
        auto dummy_generator = [](handler_base&){return true;};
        handler_base::Populate(dummy_generator);
    }

    bool StartObject() {
        ++_nested_level;
        check_nested_level();
        return handler_base::StartObject();
    }

    bool EndObject(rapidjson::SizeType elements_count = 0) {
        --_nested_level;
        return handler_base::EndObject(elements_count);
    }

    bool StartArray() {
        ++_nested_level;
        check_nested_level();
        return handler_base::StartArray();
    }

    bool EndArray(rapidjson::SizeType elements_count = 0) {
        --_nested_level;
        return handler_base::EndArray(elements_count);
    }
protected:
    void check_nested_level() const {
        if (RAPIDJSON_UNLIKELY(_nested_level > _max_nested_level)) {
            throw rjson::error(fmt::format("Max nested level reached: {}", _max_nested_level));
        }
    }
};

std::string print(const rjson::value& value) {
    string_buffer buffer;
    guarded_json_handler<writer> writer(buffer, max_nested_level);
    value.Accept(writer);
    return std::string(buffer.GetString(), buffer.GetSize());
}

rjson::value copy(const rjson::value& value) {
    return rjson::value(value, the_allocator);
}

rjson::value parse(std::string_view str) {
    guarded_json_handler<document> d(max_nested_level);
    d.Parse(str.data(), str.size());
    if (d.HasParseError()) {
        throw rjson::error(fmt::format("Parsing JSON failed: {}", GetParseError_En(d.GetParseError())));
    }
    rjson::value& v = d;
    return std::move(v);
}

static rjson::value name_ref(std::string_view name) {
    return rjson::value(rapidjson::StringRef(name.data(), name.size()));
}

rjson::value& get(rjson::value& value, std::string_view name) {
    auto member_it = value.FindMember(name_ref(name));
    if (member_it != value.MemberEnd()) {
        return member_it->value;
    }
    throw rjson::error(fmt::format("JSON parameter {} not found", name));
}

const rjson::value& get(const rjson::value& value, std::string_view name) {
    auto member_it = value.FindMember(name_ref(name));
    if (member_it != value.MemberEnd()) {
        return member_it->value;
    }
    throw rjson::error(fmt::format("JSON parameter {} not found", name));
}

rjson::value from_string(std::string_view view) {
    return rjson::value(view.data(), view.size(), the_allocator);
}

rjson::value from_string(const char* str, size_t size) {
    return rjson::value(str, size, the_allocator);
}

const rjson::value* find(const rjson::value& value, std::string_view name) {
    if (!value.IsObject()) {
        return nullptr;
    }
    auto member_it = value.FindMember(name_ref(name));
    return member_it != value.MemberEnd() ? &member_it->value : nullptr;
}

rjson::value* find(rjson::value& value, std::string_view name) {
    if (!value.IsObject()) {
        return nullptr;
    }
    auto member_it = value.FindMember(name_ref(name));
    return member_it != value.MemberEnd() ? &member_it->value : nullptr;
}

void add(rjson::value& base, std::string_view name, rjson::value&& member) {
    base.AddMember(rjson::value(name.data(), name.size(), the_allocator), std::move(member), the_allocator);
}

void add(rjson::value& base, std::string_view name, std::string_view member) {
    base.AddMember(rjson::value(name.data(), name.size(), the_allocator), from_string(member), the_allocator);
}

void replace(rjson::value& base, std::string_view name, rjson::value&& member) {
    if (rjson::value* existing = find(base, name)) {
        *existing = std::move(member);
    } else {
        add(base, name, std::move(member));
    }
}

bool remove_member(rjson::value& base, std::string_view name) {
    return base.RemoveMember(name_ref(name));
}

void push_back(rjson::value& base_array, rjson::value&& item) {
    base_array.PushBack(std::move(item), the_allocator);
}

} // end namespace rjson

std::ostream& std::operator<<(std::ostream& os, const rjson::value& v) {
    return os << rjson::print(v);
}

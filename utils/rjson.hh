/*
 * Copyright 2024-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once

/*
 * rjson is a wrapper over rapidjson library, providing fast JSON parsing and generation.
 *
 * Every wire object dynamap exchanges with a session (requests, responses, tagged
 * attribute values, stream tokens) is an rjson::value.
 *
 * rapidjson has strict copy elision policies, which, among other things, involves
 * using provided char arrays without copying them and allows copying objects only explicitly.
 * The functions below always copy member names and string contents, so the liveness
 * of the source strings never matters to the resulting JSON value.
 * Also, bear in mind that methods exposed by rjson::value are generic, but some of them
 * work fine only for specific types. In case the type does not match, an rjson::error will be thrown.
 * Examples of such mismatched usages is calling MemberCount() on a JSON value not of object type
 * or calling Size() on a non-array value.
 */

#include <string>
#include <string_view>
#include <stdexcept>
#include <optional>
#include <ostream>

namespace rjson {
class error : public std::exception {
    std::string _msg;
public:
    error() = default;
    error(const std::string& msg) : _msg(msg) {}

    virtual const char* what() const noexcept override { return _msg.c_str(); }
};
}

// rapidjson configuration macros
#define RAPIDJSON_HAS_STDSTRING 1
// Default rjson policy is to use assert() - which is dangerous for two reasons:
// 1. assert() can be turned off with -DNDEBUG
// 2. assert() crashes a program
// Fortunately, the default policy can be overridden, and so rapidjson errors will
// throw an rjson::error exception instead.
#define RAPIDJSON_ASSERT(x) do { if (!(x)) throw rjson::error(std::string("JSON error: condition not met: ") + #x); } while (0)

#include <rapidjson/document.h>
#include <rapidjson/writer.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/error/en.h>
#include <fmt/ostream.h>

namespace rjson {

using allocator = rapidjson::CrtAllocator;
using encoding = rapidjson::UTF8<>;
using document = rapidjson::GenericDocument<encoding, allocator>;
using value = rapidjson::GenericValue<encoding, allocator>;
using string_buffer = rapidjson::GenericStringBuffer<encoding>;
using writer = rapidjson::Writer<string_buffer, encoding>;
using type = rapidjson::Type;

// Returns an object representing JSON's null
inline rjson::value null_value() {
    return rjson::value(rapidjson::kNullType);
}

// Returns an empty JSON object - {}
inline rjson::value empty_object() {
    return rjson::value(rapidjson::kObjectType);
}

// Returns an empty JSON array - []
inline rjson::value empty_array() {
    return rjson::value(rapidjson::kArrayType);
}

// Returns an empty JSON string - ""
inline rjson::value empty_string() {
    return rjson::value(rapidjson::kStringType);
}

// Convert the JSON value to a string with JSON syntax, the opposite of parse().
// The representation is dense - without any redundant indentation.
std::string print(const rjson::value& value);

// Returns a string_view to the string held in a JSON value (which is
// assumed to hold a string, i.e., v.IsString() == true). This is a view
// to the existing data - no copying is done.
inline std::string_view to_string_view(const rjson::value& v) {
    return std::string_view(v.GetString(), v.GetStringLength());
}

// Copies given JSON value - involves allocation
rjson::value copy(const rjson::value& value);

// Parses a JSON value from given string.
// The string liveness does not need to be persisted,
// as parse() will allocate member names and values.
// Throws rjson::error if parsing failed.
rjson::value parse(std::string_view str);

// Creates a JSON value (of JSON string type) out of internal string representations.
// The string value is copied, so str's liveness does not need to be persisted.
rjson::value from_string(std::string_view view);
rjson::value from_string(const char* str, size_t size);

// Returns a pointer to JSON member if it exists, nullptr otherwise
rjson::value* find(rjson::value& value, std::string_view name);
const rjson::value* find(const rjson::value& value, std::string_view name);

// Returns a reference to JSON member if it exists, throws otherwise
rjson::value& get(rjson::value& value, std::string_view name);
const rjson::value& get(const rjson::value& value, std::string_view name);

// Returns the member converted to T if it exists and is not null,
// std::nullopt otherwise. Throws if the member has another type.
template<typename T>
std::optional<T> get_opt(const rjson::value& value, std::string_view name) {
    const rjson::value* member = find(value, name);
    if (!member || member->IsNull()) {
        return std::nullopt;
    }
    if (!member->template Is<T>()) {
        throw rjson::error(std::string("JSON parameter ") + std::string(name) + " has unexpected type");
    }
    return member->template Get<T>();
}

// Adds a member to given JSON object by moving the member - allocates the name.
// Throws if base is not a JSON object.
void add(rjson::value& base, std::string_view name, rjson::value&& member);

// Adds a string member, copying both the name and the string.
void add(rjson::value& base, std::string_view name, std::string_view member);

// Replaces a member if it exists, adds it otherwise.
void replace(rjson::value& base, std::string_view name, rjson::value&& member);

// Removes a member from given JSON object, returns true if it was present.
bool remove_member(rjson::value& base, std::string_view name);

// Adds a value to a JSON list by moving the item to its end.
// Throws if base_array is not a JSON array.
void push_back(rjson::value& base_array, rjson::value&& item);

// rjson::value is move-only. copyable_value adds an (allocating) copy
// constructor, for containers and exception classes that require one.
struct copyable_value : public rjson::value {
    copyable_value() : rjson::value(rapidjson::kNullType) {}
    copyable_value(rjson::value&& v) : rjson::value(std::move(v)) {}
    copyable_value(const rjson::value& v) : rjson::value(copy(v)) {}
    copyable_value(const copyable_value& other) : rjson::value(copy(other)) {}
    copyable_value(copyable_value&& other) noexcept : rjson::value(std::move(static_cast<rjson::value&>(other))) {}
    copyable_value& operator=(const copyable_value& other) {
        if (this != &other) {
            rjson::value::operator=(copy(other));
        }
        return *this;
    }
    copyable_value& operator=(copyable_value&& other) noexcept {
        rjson::value::operator=(std::move(static_cast<rjson::value&>(other)));
        return *this;
    }
};

} // end namespace rjson

namespace std {
std::ostream& operator<<(std::ostream& os, const rjson::value& v);
}

template <> struct fmt::formatter<rjson::value> : fmt::ostream_formatter {};
template <> struct fmt::formatter<rjson::copyable_value> : fmt::ostream_formatter {};

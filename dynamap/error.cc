/*
 * Copyright 2024-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "dynamap/error.hh"

#include <fmt/format.h>

namespace dynamap {

const char* api_error::what() const noexcept {
    if (_what_string.empty()) {
        _what_string = fmt::format("{}: {}", _type, _msg);
    }
    return _what_string.c_str();
}

constraint_violation::constraint_violation(std::string operation, const rjson::value& request, const std::string& msg)
    : dynamap_error(fmt::format("{} failed its condition: {}", operation, msg))
    , _operation(std::move(operation))
    , _request(request)
{ }

session_error::session_error(std::string_view operation, api_error cause)
    : dynamap_error(fmt::format("{} failed: {}", operation, cause.what()))
    , _cause(std::move(cause))
{ }

void translate_session_error(const api_error& e, std::string_view operation, const rjson::value& request) {
    if (e.is("ConditionalCheckFailedException")) {
        throw constraint_violation(std::string(operation), request, e._msg);
    }
    if (e.is("TrimmedDataAccessException")) {
        throw records_expired(fmt::format("{}: {}", operation, e._msg));
    }
    if (e.is("ExpiredIteratorException")) {
        throw shard_iterator_expired(fmt::format("{}: {}", operation, e._msg));
    }
    throw session_error(operation, e);
}

}

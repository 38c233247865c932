/*
 * Copyright 2024-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once

#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>
#include "utils/rjson.hh"

namespace dynamap {

class object;

// api_error is the error a session raises when the service rejects a request.
// https://docs.aws.amazon.com/amazondynamodb/latest/developerguide/Programming.Errors.html
// An error message has a type, e.g., "ResourceNotFoundException", and a
// human readable message. The engine and the stream shards translate it into
// one of the dynamap_error kinds below before it reaches application code.
class api_error final : public std::exception {
public:
    std::string _type;
    std::string _msg;
    // Additional data attached to the error, null value if not set. It's wrapped in copyable_value
    // class because copy constructor is required for exception classes.
    rjson::copyable_value _extra_fields;
    api_error(std::string type, std::string msg, rjson::value extra_fields = rjson::null_value())
        : _type(std::move(type))
        , _msg(std::move(msg))
        , _extra_fields(std::move(extra_fields))
    { }

    // Factory functions for the DynamoDB API errors dynamap distinguishes
    static api_error validation(std::string msg) {
        return api_error("ValidationException", std::move(msg));
    }
    static api_error resource_not_found(std::string msg) {
        return api_error("ResourceNotFoundException", std::move(msg));
    }
    static api_error resource_in_use(std::string msg) {
        return api_error("ResourceInUseException", std::move(msg));
    }
    static api_error conditional_check_failed(std::string msg) {
        return api_error("ConditionalCheckFailedException", std::move(msg));
    }
    static api_error expired_iterator(std::string msg) {
        return api_error("ExpiredIteratorException", std::move(msg));
    }
    static api_error trimmed_data_access_exception(std::string msg) {
        return api_error("TrimmedDataAccessException", std::move(msg));
    }
    static api_error throughput_exceeded(std::string msg) {
        return api_error("ProvisionedThroughputExceededException", std::move(msg));
    }
    static api_error internal(std::string msg) {
        return api_error("InternalServerError", std::move(msg));
    }

    bool is(std::string_view type) const noexcept {
        return _type == type;
    }

    virtual const char* what() const noexcept override;
    mutable std::string _what_string;
};

// Base of every error dynamap itself raises.
class dynamap_error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// A conditional write's precondition did not hold.
class constraint_violation : public dynamap_error {
    std::string _operation;
    rjson::copyable_value _request;
public:
    constraint_violation(std::string operation, const rjson::value& request, const std::string& msg);
    const std::string& operation() const noexcept { return _operation; }
    const rjson::value& request() const noexcept { return _request; }
};

// The condition tree cannot be rendered into a wire expression.
class invalid_condition : public dynamap_error {
public:
    using dynamap_error::dynamap_error;
};

// A query or scan was built with an unusable combination of options.
class invalid_search : public dynamap_error {
public:
    using dynamap_error::dynamap_error;
};

// The requested stream position is older than the retention window.
class records_expired : public dynamap_error {
public:
    using dynamap_error::dynamap_error;
};

// The shard iterator handle is no longer valid.
class shard_iterator_expired : public dynamap_error {
public:
    using dynamap_error::dynamap_error;
};

// A stream token whose shards are all unknown to the live stream.
class invalid_stream : public dynamap_error {
public:
    using dynamap_error::dynamap_error;
};

class unknown_type : public dynamap_error {
public:
    using dynamap_error::dynamap_error;
};

// A native value that does not fit the column's wire type.
class invalid_value : public dynamap_error {
public:
    using dynamap_error::dynamap_error;
};

// A model declaration that cannot be used, e.g. one without a hash key.
class invalid_model : public dynamap_error {
public:
    using dynamap_error::dynamap_error;
};

class unknown_column : public dynamap_error {
public:
    using dynamap_error::dynamap_error;
};

class unbound_model : public dynamap_error {
public:
    using dynamap_error::dynamap_error;
};

// The live table's key schema disagrees with the model.
class table_mismatch : public dynamap_error {
public:
    using dynamap_error::dynamap_error;
};

// Some objects passed to a load were not found in the table.
class missing_objects : public dynamap_error {
    std::vector<const object*> _objects;
public:
    missing_objects(const std::string& msg, std::vector<const object*> objects)
        : dynamap_error(msg), _objects(std::move(objects)) {}
    const std::vector<const object*>& objects() const noexcept { return _objects; }
};

// Any other failure of the session, with the originating error attached.
class session_error : public dynamap_error {
    api_error _cause;
public:
    session_error(std::string_view operation, api_error cause);
    const api_error& cause() const noexcept { return _cause; }
};

// Throws the dynamap_error kind matching an api_error raised by a session
// while performing the named operation.
[[noreturn]] void translate_session_error(const api_error& e, std::string_view operation, const rjson::value& request);

}

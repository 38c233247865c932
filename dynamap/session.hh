/*
 * Copyright 2024-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once

#include <istream>
#include <optional>
#include <ostream>
#include <string>

#include "utils/rjson.hh"

namespace dynamap {

enum class shard_iterator_type {
    at_sequence,
    after_sequence,
    trim_horizon,
    latest,
};

// Wire names, AT_SEQUENCE_NUMBER, AFTER_SEQUENCE_NUMBER, TRIM_HORIZON and LATEST
std::ostream& operator<<(std::ostream& os, shard_iterator_type type);
std::istream& operator>>(std::istream& is, shard_iterator_type& type);

// The connection to the database service. Requests and responses use the
// JSON shapes of the DynamoDB API; an implementation reports every service
// side failure by throwing api_error, and does its own retrying.
class session {
public:
    virtual ~session() = default;

    virtual rjson::value create_table(const rjson::value& request) = 0;
    virtual rjson::value describe_table(const std::string& table_name) = 0;
    virtual rjson::value update_item(const rjson::value& request) = 0;
    virtual rjson::value delete_item(const rjson::value& request) = 0;
    // Returns {"Responses": {table: [items]}, "UnprocessedKeys": {...}}
    virtual rjson::value batch_get_item(const rjson::value& request) = 0;
    // Both return {"Count", "ScannedCount", "Items", "LastEvaluatedKey"?}
    virtual rjson::value query(const rjson::value& request) = 0;
    virtual rjson::value scan(const rjson::value& request) = 0;

    // Returns {"Shards": [...]} with every shard of the stream, following
    // pagination. When first_shard is given, only shards after it.
    virtual rjson::value describe_stream(const std::string& stream_arn, const std::optional<std::string>& first_shard = {}) = 0;
    // Returns the iterator id. Throws TrimmedDataAccessException when
    // sequence_number is older than the retention window.
    virtual std::string get_shard_iterator(const std::string& stream_arn, const std::string& shard_id,
            shard_iterator_type type, const std::optional<std::string>& sequence_number = {}) = 0;
    // Returns {"Records": [...], "NextShardIterator"?}. Throws
    // TrimmedDataAccessException or ExpiredIteratorException.
    virtual rjson::value get_records(const std::string& iterator_id) = 0;
};

}

template <> struct fmt::formatter<dynamap::shard_iterator_type> : fmt::ostream_formatter {};

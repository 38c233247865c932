/*
 * Copyright 2024-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#define BOOST_TEST_MODULE shard

#include <boost/test/unit_test.hpp>

#include "dynamap/error.hh"
#include "dynamap/streams/shard.hh"
#include "mock_session.hh"

using namespace dynamap;
using namespace dynamap::streams;
using namespace std::chrono_literals;

namespace {

const std::string arn = "arn:aws:dynamodb:us-east-1:1:table/users/stream/1";

// A shard with records "1", "2", ... created at 10, 20, ... seconds
mock_session::mock_shard& fill(mock_session& s, std::string id, int count, std::optional<std::string> parent = {}) {
    auto& ms = s.add_shard(std::move(id), std::move(parent));
    for (int i = 1; i <= count; ++i) {
        ms.records.emplace_back(mock_session::make_record(std::to_string(i), i * 10));
    }
    return ms;
}

std::vector<std::string> sequence_numbers(const std::vector<stream_record>& records) {
    std::vector<std::string> ret;
    for (auto& r : records) {
        ret.push_back(r.meta.sequence_number);
    }
    return ret;
}

using seqs = std::vector<std::string>;

}

BOOST_AUTO_TEST_CASE(test_jump_to) {
    mock_session s;
    fill(s, "a", 3);
    shard sh(s, arn, "a");
    BOOST_REQUIRE(!sh.iterator_id());
    BOOST_REQUIRE_THROW(sh.get_records(), std::logic_error);
    BOOST_REQUIRE_THROW(sh.jump_to(shard_iterator_type::at_sequence), std::invalid_argument);

    sh.jump_to(shard_iterator_type::after_sequence, "1");
    BOOST_REQUIRE(sh.iterator_type() == shard_iterator_type::after_sequence);
    BOOST_REQUIRE(sh.sequence_number() == "1");
    auto& request = s.last_request("GetShardIterator");
    BOOST_REQUIRE_EQUAL(rjson::to_string_view(rjson::get(request, "ShardIteratorType")), "AFTER_SEQUENCE_NUMBER");
    BOOST_REQUIRE(sequence_numbers(sh.get_records()) == (seqs{"2", "3"}));

    // Relative positions carry no sequence number
    sh.jump_to(shard_iterator_type::latest, "2");
    BOOST_REQUIRE(!sh.sequence_number());
}

BOOST_AUTO_TEST_CASE(test_first_fetch_fixes_the_position) {
    mock_session s;
    s.page_size = 2;
    fill(s, "a", 3);
    shard sh(s, arn, "a");
    sh.jump_to(shard_iterator_type::trim_horizon);
    BOOST_REQUIRE(sequence_numbers(sh.get_records()) == (seqs{"1", "2"}));
    BOOST_REQUIRE(sh.iterator_type() == shard_iterator_type::at_sequence);
    BOOST_REQUIRE(sh.sequence_number() == "1");

    // Fetching does not move the checkpoint past unconsumed records
    BOOST_REQUIRE(sequence_numbers(sh.get_records()) == (seqs{"3"}));
    BOOST_REQUIRE(sh.sequence_number() == "1");

    sh.set_position(shard_iterator_type::after_sequence, "3");
    BOOST_REQUIRE(sh.sequence_number() == "3");
}

BOOST_AUTO_TEST_CASE(test_empty_fetch_budget) {
    mock_session s;
    fill(s, "a", 0);
    shard sh(s, arn, "a", 3);
    sh.jump_to(shard_iterator_type::latest);
    BOOST_REQUIRE(sh.get_records().empty());
    BOOST_REQUIRE_EQUAL(s.count("GetRecords"), 3u);
    BOOST_REQUIRE_EQUAL(sh.empty_responses(), 3u);

    // Once caught up, one fetch per call
    BOOST_REQUIRE(sh.get_records().empty());
    BOOST_REQUIRE_EQUAL(s.count("GetRecords"), 4u);

    // New records reset the count
    s.get_shard("a").records.emplace_back(mock_session::make_record("1", 10));
    BOOST_REQUIRE_EQUAL(sh.get_records().size(), 1u);
    BOOST_REQUIRE_EQUAL(sh.empty_responses(), 0u);
    BOOST_REQUIRE(sh.sequence_number() == "1");

    sh.jump_to(shard_iterator_type::latest);
    BOOST_REQUIRE_EQUAL(sh.empty_responses(), 0u);
}

BOOST_AUTO_TEST_CASE(test_closed_shard_is_exhausted) {
    mock_session s;
    fill(s, "a", 1).closed = true;
    shard sh(s, arn, "a");
    sh.jump_to(shard_iterator_type::trim_horizon);
    BOOST_REQUIRE_EQUAL(sh.get_records().size(), 1u);
    BOOST_REQUIRE(sh.exhausted());
    BOOST_REQUIRE(sh.iterator_id() == std::string(shard::exhausted_iterator));

    auto calls = s.count("GetRecords");
    BOOST_REQUIRE(sh.get_records().empty());
    BOOST_REQUIRE_EQUAL(s.count("GetRecords"), calls);
}

BOOST_AUTO_TEST_CASE(test_expired_iterator_is_refreshed) {
    mock_session s;
    s.page_size = 2;
    fill(s, "a", 3);
    shard sh(s, arn, "a");
    sh.jump_to(shard_iterator_type::trim_horizon);
    BOOST_REQUIRE(sequence_numbers(sh.next_records()) == (seqs{"1", "2"}));

    s.expire_iterators();
    BOOST_REQUIRE_THROW(sh.get_records(), shard_iterator_expired);

    // Back to the checkpoint, at "1"
    BOOST_REQUIRE(sequence_numbers(sh.next_records()) == (seqs{"1", "2"}));
    auto& request = s.last_request("GetShardIterator");
    BOOST_REQUIRE_EQUAL(rjson::to_string_view(rjson::get(request, "ShardIteratorType")), "AT_SEQUENCE_NUMBER");
    BOOST_REQUIRE_EQUAL(rjson::to_string_view(rjson::get(request, "SequenceNumber")), "1");
}

BOOST_AUTO_TEST_CASE(test_expired_relative_iterator_is_an_error) {
    mock_session s;
    fill(s, "a", 0);
    shard sh(s, arn, "a");
    sh.jump_to(shard_iterator_type::latest);
    s.expire_iterators();
    BOOST_REQUIRE_THROW(sh.next_records(), shard_iterator_expired);
}

BOOST_AUTO_TEST_CASE(test_trimmed_records_restart_from_trim_horizon) {
    mock_session s;
    auto& ms = fill(s, "a", 3);
    shard sh(s, arn, "a");
    sh.jump_to(shard_iterator_type::trim_horizon);
    ms.trimmed = 2;
    BOOST_REQUIRE_THROW(sh.get_records(), records_expired);
    BOOST_REQUIRE(sequence_numbers(sh.next_records()) == (seqs{"3"}));

    BOOST_REQUIRE_THROW(sh.jump_to(shard_iterator_type::at_sequence, "1"), records_expired);
    sh.jump_to_or_trim_horizon(shard_iterator_type::at_sequence, "1");
    BOOST_REQUIRE(sh.iterator_type() == shard_iterator_type::trim_horizon);
    BOOST_REQUIRE(!sh.sequence_number());
}

BOOST_AUTO_TEST_CASE(test_session_errors_are_translated) {
    mock_session s;
    fill(s, "a", 1);
    shard sh(s, arn, "a");
    s.push_error("GetShardIterator", api_error::internal("boom"));
    BOOST_REQUIRE_THROW(sh.jump_to(shard_iterator_type::latest), session_error);
    BOOST_REQUIRE(!sh.iterator_id());
}

BOOST_AUTO_TEST_CASE(test_load_children) {
    mock_session s;
    fill(s, "root", 0);
    fill(s, "other", 0);
    fill(s, "b", 0, "root");
    fill(s, "c", 0, "root");
    fill(s, "d", 0, "b");
    fill(s, "e", 0, "other");
    auto root = std::make_shared<shard>(s, arn, "root");
    root->load_children();
    BOOST_REQUIRE(rjson::get(s.last_request("DescribeStream"), "ExclusiveStartShardId") == rjson::from_string("root"));
    BOOST_REQUIRE_EQUAL(root->children().size(), 2u);

    std::vector<std::string> ids;
    for (auto& sh : walk_tree(root)) {
        ids.push_back(sh->shard_id());
    }
    BOOST_REQUIRE(ids == (seqs{"root", "b", "c", "d"}));
    auto& d = root->children()[0]->children()[0];
    BOOST_REQUIRE(d->parent() == root->children()[0].get());
    BOOST_REQUIRE(d->token().parent == "b");
    BOOST_REQUIRE(!root->token().parent);

    // Loaded once
    root->load_children();
    BOOST_REQUIRE_EQUAL(s.count("DescribeStream"), 1u);

    root->remove_child(root->children()[1].get());
    BOOST_REQUIRE_EQUAL(root->children().size(), 1u);
}

BOOST_AUTO_TEST_CASE(test_seek_to) {
    mock_session s;
    fill(s, "a", 3);
    shard sh(s, arn, "a");
    auto t = std::chrono::system_clock::time_point(20s);
    BOOST_REQUIRE(sequence_numbers(sh.seek_to(t)) == (seqs{"2", "3"}));
    BOOST_REQUIRE(sh.iterator_type() == shard_iterator_type::at_sequence);
    BOOST_REQUIRE(sh.sequence_number() == "2");

    // Everything is older: positioned after the last record
    BOOST_REQUIRE(sh.seek_to(std::chrono::system_clock::time_point(40s)).empty());
    BOOST_REQUIRE(sh.iterator_type() == shard_iterator_type::after_sequence);
    BOOST_REQUIRE(sh.sequence_number() == "3");

    mock_session empty;
    fill(empty, "a", 0);
    shard nothing(empty, arn, "a");
    BOOST_REQUIRE(nothing.seek_to(t).empty());
    BOOST_REQUIRE(nothing.iterator_type() == shard_iterator_type::trim_horizon);
}

BOOST_AUTO_TEST_CASE(test_token_and_equality) {
    mock_session s;
    fill(s, "a", 2);
    shard x(s, arn, "a");
    shard y(s, arn, "a");
    BOOST_REQUIRE(x == y);
    x.jump_to(shard_iterator_type::trim_horizon);
    BOOST_REQUIRE(!(x == y));

    y.restore(shard_iterator_type::after_sequence, "1");
    auto t = y.token();
    BOOST_REQUIRE_EQUAL(t.shard_id, "a");
    BOOST_REQUIRE(t.iterator_type == shard_iterator_type::after_sequence);
    BOOST_REQUIRE(t.sequence_number == "1");
    BOOST_REQUIRE(!y.iterator_id());
}

/*
 * Copyright 2024-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#define BOOST_TEST_MODULE coordinator

#include <algorithm>
#include <boost/test/unit_test.hpp>

#include "dynamap/error.hh"
#include "dynamap/streams/coordinator.hh"
#include "mock_session.hh"

using namespace dynamap;
using namespace dynamap::streams;
using namespace std::chrono_literals;

namespace {

const std::string arn = "arn:aws:dynamodb:us-east-1:1:table/users/stream/1";

using ids = std::vector<std::string>;

void add_records(mock_session::mock_shard& ms, std::vector<std::pair<std::string, int>> records) {
    for (auto& [seq, seconds] : records) {
        ms.records.emplace_back(mock_session::make_record(seq, seconds));
    }
}

// "a" is closed and split into "b"; "x" is an unrelated open root.
void split_stream(mock_session& s) {
    auto& a = s.add_shard("a");
    add_records(a, {{"1", 10}, {"2", 20}});
    a.closed = true;
    add_records(s.add_shard("b", "a"), {{"3", 30}});
    add_records(s.add_shard("x"), {{"5", 15}});
}

ids shard_ids(const std::vector<std::shared_ptr<shard>>& shards) {
    ids ret;
    for (auto& s : shards) {
        ret.push_back(s->shard_id());
    }
    std::sort(ret.begin(), ret.end());
    return ret;
}

std::string next_seq(coordinator& c) {
    auto r = c.next();
    return r ? r->meta.sequence_number : "<none>";
}

}

BOOST_AUTO_TEST_CASE(test_read_from_trim_horizon) {
    mock_session s;
    split_stream(s);
    coordinator c(s, arn);
    c.move_to(stream_endpoint::trim_horizon);
    BOOST_REQUIRE(shard_ids(c.roots()) == (ids{"a", "x"}));
    BOOST_REQUIRE(shard_ids(c.active()) == (ids{"a", "x"}));

    // Records of both roots interleave by creation time
    BOOST_REQUIRE_EQUAL(next_seq(c), "1");
    // "a" was read to its end and replaced by its child
    BOOST_REQUIRE(shard_ids(c.roots()) == (ids{"b", "x"}));
    BOOST_REQUIRE(shard_ids(c.active()) == (ids{"b", "x"}));
    BOOST_REQUIRE_EQUAL(next_seq(c), "5");
    // Buffered records of the exhausted shard are still delivered
    BOOST_REQUIRE_EQUAL(next_seq(c), "2");
    BOOST_REQUIRE_EQUAL(next_seq(c), "3");
    BOOST_REQUIRE_EQUAL(next_seq(c), "<none>");
}

BOOST_AUTO_TEST_CASE(test_back_pressure) {
    mock_session s;
    split_stream(s);
    coordinator c(s, arn);
    c.move_to(stream_endpoint::trim_horizon);
    c.advance_shards();
    auto fetches = s.count("GetRecords");
    BOOST_REQUIRE_EQUAL(fetches, 2u);
    BOOST_REQUIRE_EQUAL(c.buffer().size(), 3u);

    c.advance_shards();
    BOOST_REQUIRE_EQUAL(s.count("GetRecords"), fetches);
    BOOST_REQUIRE_EQUAL(c.buffer().size(), 3u);

    // Consuming without draining the buffer does not fetch either
    BOOST_REQUIRE_EQUAL(next_seq(c), "1");
    BOOST_REQUIRE_EQUAL(s.count("GetRecords"), fetches);
}

BOOST_AUTO_TEST_CASE(test_consumed_records_move_the_checkpoint) {
    mock_session s;
    add_records(s.add_shard("p"), {{"1", 10}, {"2", 20}});
    coordinator c(s, arn);
    c.move_to(stream_endpoint::trim_horizon);
    BOOST_REQUIRE_EQUAL(next_seq(c), "1");
    auto& p = c.active().front();
    BOOST_REQUIRE(p->iterator_type() == shard_iterator_type::after_sequence);
    BOOST_REQUIRE(p->sequence_number() == "1");
}

BOOST_AUTO_TEST_CASE(test_read_from_latest) {
    mock_session s;
    split_stream(s);
    coordinator c(s, arn);
    c.move_to(stream_endpoint::latest);
    // Only the leaves are read
    BOOST_REQUIRE(shard_ids(c.active()) == (ids{"b", "x"}));
    BOOST_REQUIRE_EQUAL(next_seq(c), "<none>");

    add_records(s.get_shard("b"), {{"4", 40}});
    BOOST_REQUIRE_EQUAL(next_seq(c), "4");
}

BOOST_AUTO_TEST_CASE(test_read_from_time) {
    mock_session s;
    split_stream(s);
    coordinator c(s, arn);
    c.move_to(std::chrono::system_clock::time_point(18s));
    BOOST_REQUIRE(shard_ids(c.active()) == (ids{"a", "x"}));
    BOOST_REQUIRE_EQUAL(c.buffer().size(), 1u);
    BOOST_REQUIRE_EQUAL(next_seq(c), "2");

    // "a" is used up; its child takes over on the next round
    BOOST_REQUIRE_EQUAL(next_seq(c), "<none>");
    BOOST_REQUIRE(shard_ids(c.active()) == (ids{"b", "x"}));
    BOOST_REQUIRE_EQUAL(next_seq(c), "3");

    // A time after every record of a closed shard starts in its children
    mock_session later;
    split_stream(later);
    coordinator d(later, arn);
    d.move_to(std::chrono::system_clock::time_point(25s));
    BOOST_REQUIRE(shard_ids(d.active()) == (ids{"b", "x"}));
    BOOST_REQUIRE_EQUAL(next_seq(d), "3");
}

BOOST_AUTO_TEST_CASE(test_token_round_trip) {
    mock_session s;
    add_records(s.add_shard("p"), {{"1", 10}, {"2", 20}});
    coordinator c(s, arn);
    c.move_to(stream_endpoint::trim_horizon);
    BOOST_REQUIRE_EQUAL(next_seq(c), "1");
    auto token = c.token();
    BOOST_REQUIRE_EQUAL(token.stream_arn, arn);
    BOOST_REQUIRE(token.active == (ids{"p"}));
    BOOST_REQUIRE_EQUAL(token.shards.size(), 1u);
    BOOST_REQUIRE(token.shards[0].iterator_type == shard_iterator_type::after_sequence);
    BOOST_REQUIRE(token.shards[0].sequence_number == "1");

    // Serialized and restored elsewhere
    auto restored = stream_token::from_json(rjson::parse(rjson::print(token.to_json())));
    coordinator d(s, arn);
    d.move_to(restored);
    BOOST_REQUIRE_EQUAL(next_seq(d), "2");
    BOOST_REQUIRE(d.token().shards[0].sequence_number == "2");
}

BOOST_AUTO_TEST_CASE(test_token_of_a_split_stream) {
    mock_session s;
    split_stream(s);
    coordinator c(s, arn);
    c.move_to(stream_endpoint::latest);
    auto token = c.token();
    BOOST_REQUIRE_EQUAL(token.shards.size(), 3u);
    auto b = std::find_if(token.shards.begin(), token.shards.end(), [] (const shard_token& t) { return t.shard_id == "b"; });
    BOOST_REQUIRE(b != token.shards.end());
    BOOST_REQUIRE(b->parent == "a");
    BOOST_REQUIRE(b->iterator_type == shard_iterator_type::latest);

    coordinator d(s, arn);
    d.move_to(token);
    BOOST_REQUIRE(shard_ids(d.roots()) == (ids{"a", "x"}));
    BOOST_REQUIRE(shard_ids(d.active()) == (ids{"b", "x"}));
}

BOOST_AUTO_TEST_CASE(test_token_with_vanished_shards) {
    mock_session s;
    add_records(s.add_shard("q", "gone"), {{"7", 70}});
    stream_token token{
        .stream_arn = arn,
        .active = {"gone"},
        .shards = {shard_token{.shard_id = "gone", .iterator_type = shard_iterator_type::after_sequence,
                .sequence_number = "6", .parent = {}}},
    };
    coordinator c(s, arn);
    c.move_to(token);
    // The live child takes over and starts from its beginning
    BOOST_REQUIRE(shard_ids(c.roots()) == (ids{"q"}));
    BOOST_REQUIRE(shard_ids(c.active()) == (ids{"q"}));
    BOOST_REQUIRE(c.active().front()->iterator_type() == shard_iterator_type::trim_horizon);
    BOOST_REQUIRE_EQUAL(next_seq(c), "7");
}

BOOST_AUTO_TEST_CASE(test_invalid_tokens) {
    mock_session s;
    s.add_shard("p");
    coordinator c(s, arn);

    stream_token other{.stream_arn = "arn:other", .active = {}, .shards = {}};
    BOOST_REQUIRE_THROW(c.move_to(other), invalid_stream);

    stream_token missing_active{.stream_arn = arn, .active = {"p2"},
            .shards = {shard_token{.shard_id = "p", .iterator_type = {}, .sequence_number = {}, .parent = {}}}};
    BOOST_REQUIRE_THROW(c.move_to(missing_active), invalid_stream);
    BOOST_REQUIRE(c.roots().empty());
    BOOST_REQUIRE(c.active().empty());
    BOOST_REQUIRE(c.buffer().empty());

    stream_token all_gone{.stream_arn = arn, .active = {"old"},
            .shards = {shard_token{.shard_id = "old", .iterator_type = {}, .sequence_number = {}, .parent = {}}}};
    BOOST_REQUIRE_THROW(c.move_to(all_gone), invalid_stream);
    BOOST_REQUIRE(c.roots().empty());
    BOOST_REQUIRE(c.active().empty());
}

BOOST_AUTO_TEST_CASE(test_trimmed_token_position_falls_back) {
    mock_session s;
    auto& p = s.add_shard("p");
    add_records(p, {{"1", 10}, {"2", 20}, {"3", 30}});
    p.trimmed = 2;
    stream_token token{.stream_arn = arn, .active = {"p"},
            .shards = {shard_token{.shard_id = "p", .iterator_type = shard_iterator_type::at_sequence,
                    .sequence_number = "1", .parent = {}}}};
    coordinator c(s, arn);
    c.move_to(token);
    BOOST_REQUIRE_EQUAL(next_seq(c), "3");
}

BOOST_AUTO_TEST_CASE(test_heartbeat) {
    mock_session s;
    add_records(s.add_shard("p"), {{"1", 10}});
    s.add_shard("r");
    coordinator c(s, arn);
    c.move_to(stream_endpoint::trim_horizon);

    c.heartbeat();
    BOOST_REQUIRE_EQUAL(c.buffer().size(), 1u);
    auto& active = c.active();
    auto p = std::find_if(active.begin(), active.end(), [] (auto& sh) { return sh->shard_id() == "p"; });
    BOOST_REQUIRE((*p)->sequence_number() == "1");

    // "p" has a fixed position now; only "r" is still polled
    auto fetches = s.count("GetRecords");
    c.heartbeat();
    BOOST_REQUIRE_EQUAL(s.count("GetRecords"), fetches + 1);
    BOOST_REQUIRE_EQUAL(c.buffer().size(), 1u);
}

BOOST_AUTO_TEST_CASE(test_remove_shard) {
    mock_session s;
    auto& ma = s.add_shard("A");
    add_records(ma, {{"1", 10}});
    ma.closed = true;
    add_records(s.add_shard("C", "A"), {{"4", 40}});
    add_records(s.add_shard("B"), {{"2", 20}, {"3", 30}});

    coordinator c(s, arn);
    auto a = std::make_shared<shard>(s, arn, "A");
    auto b = std::make_shared<shard>(s, arn, "B");
    c.add_root(a);
    c.add_root(b);
    c.activate(a);
    c.activate(b);
    a->jump_to(shard_iterator_type::trim_horizon);
    b->jump_to(shard_iterator_type::trim_horizon);
    for (auto& sh : {a, b}) {
        for (auto& r : sh->get_records()) {
            c.buffer().push(std::move(r), sh);
        }
    }
    BOOST_REQUIRE(a->exhausted());
    a->load_children();
    BOOST_REQUIRE_EQUAL(a->children().size(), 1u);
    BOOST_REQUIRE_EQUAL(c.buffer().size(), 3u);

    c.remove_shard(a);
    BOOST_REQUIRE(shard_ids(c.roots()) == (ids{"B", "C"}));
    BOOST_REQUIRE(shard_ids(c.active()) == (ids{"B", "C"}));
    BOOST_REQUIRE(!a->children().front()->parent());
    BOOST_REQUIRE_EQUAL(c.buffer().size(), 2u);
    BOOST_REQUIRE(c.buffer().peek().source == b);

    // The promoted child starts from its beginning and is read after the
    // buffered records of "B"
    auto child = a->children().front();
    BOOST_REQUIRE(child->iterator_type() == shard_iterator_type::trim_horizon);
    BOOST_REQUIRE_EQUAL(next_seq(c), "2");
    BOOST_REQUIRE_EQUAL(next_seq(c), "3");
    BOOST_REQUIRE_EQUAL(next_seq(c), "4");
    BOOST_REQUIRE_EQUAL(next_seq(c), "<none>");
}

BOOST_AUTO_TEST_CASE(test_failing_shard_keeps_records_of_earlier_shards) {
    mock_session s;
    add_records(s.add_shard("p"), {{"1", 10}, {"2", 20}});
    add_records(s.add_shard("q"), {{"3", 15}});
    coordinator c(s, arn);
    c.move_to(stream_endpoint::trim_horizon);
    BOOST_REQUIRE(c.active().front()->shard_id() == "p");

    s.get_shard("q").failure = api_error::throughput_exceeded("rate exceeded");
    BOOST_REQUIRE_THROW(c.next(), session_error);
    BOOST_REQUIRE_EQUAL(c.buffer().size(), 2u);
    BOOST_REQUIRE_EQUAL(next_seq(c), "1");
    BOOST_REQUIRE_EQUAL(next_seq(c), "2");

    // "q" is polled again once it recovers
    s.get_shard("q").failure.reset();
    BOOST_REQUIRE_EQUAL(next_seq(c), "3");
    BOOST_REQUIRE_EQUAL(next_seq(c), "<none>");
}

BOOST_AUTO_TEST_CASE(test_heartbeat_keeps_records_of_earlier_shards) {
    mock_session s;
    add_records(s.add_shard("p"), {{"1", 10}});
    add_records(s.add_shard("q"), {{"2", 20}});
    coordinator c(s, arn);
    c.move_to(stream_endpoint::trim_horizon);

    s.get_shard("q").failure = api_error::internal("boom");
    BOOST_REQUIRE_THROW(c.heartbeat(), session_error);
    BOOST_REQUIRE_EQUAL(c.buffer().size(), 1u);
    BOOST_REQUIRE_EQUAL(next_seq(c), "1");
}

BOOST_AUTO_TEST_CASE(test_remove_inner_shard) {
    mock_session s;
    s.add_shard("root");
    s.add_shard("mid", "root");
    add_records(s.add_shard("leaf", "mid"), {{"1", 10}});
    coordinator c(s, arn);
    auto root = std::make_shared<shard>(s, arn, "root");
    auto mid = std::make_shared<shard>(s, arn, "mid");
    auto leaf = std::make_shared<shard>(s, arn, "leaf");
    root->add_child(mid);
    mid->add_child(leaf);
    c.add_root(root);
    c.activate(mid);

    c.remove_shard(mid);
    BOOST_REQUIRE(shard_ids(c.roots()) == (ids{"root"}));
    BOOST_REQUIRE(shard_ids(root->children()) == (ids{"leaf"}));
    BOOST_REQUIRE(leaf->parent() == root.get());
    BOOST_REQUIRE(shard_ids(c.active()) == (ids{"leaf"}));
    BOOST_REQUIRE(leaf->iterator_type() == shard_iterator_type::trim_horizon);
    BOOST_REQUIRE_EQUAL(next_seq(c), "1");
}

/*
 * Copyright 2024-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#define BOOST_TEST_MODULE engine

#include <boost/test/unit_test.hpp>

#include <algorithm>

#include "dynamap/engine.hh"
#include "dynamap/error.hh"
#include "mock_session.hh"

using namespace dynamap;

namespace {

struct user_model {
    model m{"User", "users"};
    const column& id = m.add_column("id", string_type(), {.hash_key = true});
    const column& age = m.add_column("age", integer_type());
    const column& email = m.add_column("email", string_type(), {.dynamo_name = "e"});
    const column& tags = m.add_column("tags", set_type(string_type()));
};

const char* users_description = R"({"Table": {
    "TableName": "users",
    "KeySchema": [{"AttributeName": "id", "KeyType": "HASH"}],
    "LatestStreamArn": "arn:users/stream"
}})";

std::string_view str(const rjson::value& v, std::string_view name) {
    return rjson::to_string_view(rjson::get(v, name));
}

// An engine with the user model bound, the table already set up.
struct bound_engine {
    mock_session s;
    user_model u;
    engine e;

    explicit bound_engine(engine_config cfg = {.skip_table_setup = true})
        : e(s, std::move(cfg)) {
        e.bind(u.m);
    }

    object user(std::string id) {
        object o(u.m);
        o.set(u.id, std::move(id));
        return o;
    }
};

}

BOOST_AUTO_TEST_CASE(test_bind_creates_table) {
    mock_session s;
    model m("Order", "orders");
    m.add_column("customer", string_type(), {.hash_key = true});
    m.add_column("placed", integer_type(), {.range_key = true});
    m.add_column("status", string_type());
    m.add_column("total", float_type());
    m.add_global_index("by_status", "status", "placed", {.dynamo_name = "status-idx", .projection = projection_type::include,
            .include = {"total"}});
    m.set_stream({.arn = "", .keys = false, .new_image = true, .old_image = false});
    s.push_response("DescribeTable", R"({"Table": {
        "KeySchema": [{"AttributeName": "customer", "KeyType": "HASH"}, {"AttributeName": "placed", "KeyType": "RANGE"}],
        "LatestStreamArn": "arn:orders/stream"
    }})");

    engine e(s, engine_config{.table_name_template = "test_{table_name}"});
    std::vector<std::string> bound;
    e.on_model_bound([&bound] (const model& m) { bound.push_back(m.name()); });
    e.bind(m);
    BOOST_REQUIRE(e.is_bound(m));
    BOOST_REQUIRE(bound == std::vector<std::string>{"Order"});
    BOOST_REQUIRE_EQUAL(m.stream()->arn, "arn:orders/stream");

    auto& request = s.last_request("CreateTable");
    BOOST_REQUIRE(request == rjson::parse(R"({
        "TableName": "test_orders",
        "BillingMode": "PAY_PER_REQUEST",
        "KeySchema": [{"AttributeName": "customer", "KeyType": "HASH"}, {"AttributeName": "placed", "KeyType": "RANGE"}],
        "AttributeDefinitions": [
            {"AttributeName": "customer", "AttributeType": "S"},
            {"AttributeName": "placed", "AttributeType": "N"},
            {"AttributeName": "status", "AttributeType": "S"}
        ],
        "GlobalSecondaryIndexes": [{
            "IndexName": "status-idx",
            "KeySchema": [{"AttributeName": "status", "KeyType": "HASH"}, {"AttributeName": "placed", "KeyType": "RANGE"}],
            "Projection": {"ProjectionType": "INCLUDE", "NonKeyAttributes": ["total"]}
        }],
        "StreamSpecification": {"StreamEnabled": true, "StreamViewType": "NEW_IMAGE"}
    })"));
    BOOST_REQUIRE_EQUAL(str(s.last_request("DescribeTable"), "TableName"), "test_orders");

    // Binding twice is a no-op
    e.bind(m);
    BOOST_REQUIRE_EQUAL(s.count("CreateTable"), 1u);
}

BOOST_AUTO_TEST_CASE(test_bind_existing_table) {
    mock_session s;
    user_model u;
    s.push_error("CreateTable", api_error::resource_in_use("table exists"));
    s.push_response("DescribeTable", users_description);
    engine e(s);
    e.bind(u.m);
    BOOST_REQUIRE(e.is_bound(u.m));
}

BOOST_AUTO_TEST_CASE(test_bind_mismatched_table) {
    mock_session s;
    user_model u;
    s.push_response("DescribeTable", R"({"Table": {"KeySchema": [{"AttributeName": "email", "KeyType": "HASH"}]}})");
    engine e(s);
    BOOST_REQUIRE_THROW(e.bind(u.m), table_mismatch);
    BOOST_REQUIRE(!e.is_bound(u.m));

    model streamed("Event", "events");
    streamed.add_column("id", string_type(), {.hash_key = true});
    streamed.set_stream({});
    s.push_response("DescribeTable", R"({"Table": {"KeySchema": [{"AttributeName": "id", "KeyType": "HASH"}]}})");
    BOOST_REQUIRE_THROW(e.bind(streamed), table_mismatch);

    s.push_error("CreateTable", api_error::validation("bad table"));
    BOOST_REQUIRE_THROW(e.bind(u.m), session_error);
}

BOOST_AUTO_TEST_CASE(test_bind_validates_model) {
    mock_session s;
    model keyless("Keyless");
    keyless.add_column("name", string_type());
    engine e(s, {.skip_table_setup = true});
    BOOST_REQUIRE_THROW(e.bind(keyless), invalid_model);
    BOOST_REQUIRE(s.calls.empty());
}

BOOST_AUTO_TEST_CASE(test_unbound_model) {
    mock_session s;
    user_model u;
    engine e(s, {.skip_table_setup = true});
    object o(u.m);
    o.set(u.id, "u1");
    BOOST_REQUIRE_THROW(e.save(o), unbound_model);
    BOOST_REQUIRE_THROW(e.load(o), unbound_model);
    BOOST_REQUIRE_THROW(e.scan(u.m), unbound_model);
}

BOOST_AUTO_TEST_CASE(test_save) {
    bound_engine b;
    auto o = b.user("u1");
    o.set(b.u.age, 30);
    o.remove(b.u.email);
    std::vector<const object*> saved;
    b.e.on_object_saved([&saved] (const object& obj) { saved.push_back(&obj); });
    b.e.save(o);

    auto& request = b.s.last_request("UpdateItem");
    BOOST_REQUIRE(request == rjson::parse(R"({
        "TableName": "users",
        "Key": {"id": {"S": "u1"}},
        "UpdateExpression": "SET #n0=:v1 REMOVE #n2",
        "ExpressionAttributeNames": {"#n0": "age", "#n2": "e"},
        "ExpressionAttributeValues": {":v1": {"N": "30"}}
    })"));
    BOOST_REQUIRE_EQUAL(saved.size(), 1u);
    BOOST_REQUIRE(saved[0] == &o);
}

BOOST_AUTO_TEST_CASE(test_atomic_save) {
    bound_engine b;
    auto o = b.user("u1");
    o.set(b.u.age, 30);
    b.e.save(o, {}, true);
    auto& first = b.s.last_request("UpdateItem");
    // Nothing is expected to exist before the first save
    BOOST_REQUIRE_EQUAL(str(first, "ConditionExpression"),
            "((attribute_not_exists(#n0)) AND (attribute_not_exists(#n2)) AND (attribute_not_exists(#n4)) AND (attribute_not_exists(#n6)))");

    o.set(b.u.age, 31);
    b.e.save(o, {}, true);
    auto& second = b.s.last_request("UpdateItem");
    BOOST_REQUIRE_EQUAL(str(second, "ConditionExpression"), "(#n0 = :v1)");
    BOOST_REQUIRE_EQUAL(str(second, "UpdateExpression"), "SET #n0=:v2");
    BOOST_REQUIRE(rjson::get(second, "ExpressionAttributeValues") == rjson::parse(R"({":v1": {"N": "30"}, ":v2": {"N": "31"}})"));
}

BOOST_AUTO_TEST_CASE(test_atomic_by_configuration) {
    bound_engine b({.atomic = true, .skip_table_setup = true});
    auto o = b.user("u1");
    o.set(b.u.age, 1);
    b.e.save(o);
    BOOST_REQUIRE(rjson::find(b.s.last_request("UpdateItem"), "ConditionExpression"));
    o.set(b.u.age, 2);
    b.e.save(o, {}, false);
    BOOST_REQUIRE(!rjson::find(b.s.last_request("UpdateItem"), "ConditionExpression"));
}

BOOST_AUTO_TEST_CASE(test_conditional_save_fails) {
    bound_engine b;
    auto o = b.user("u1");
    o.set(b.u.age, 30);
    b.e.save(o);

    o.set(b.u.age, 40);
    b.s.push_error("UpdateItem", api_error::conditional_check_failed("The conditional request failed"));
    try {
        b.e.save(o, b.u.age < 35);
        BOOST_FAIL("save should have failed");
    } catch (const constraint_violation& e) {
        BOOST_REQUIRE_EQUAL(e.operation(), "UpdateItem");
        BOOST_REQUIRE_EQUAL(str(e.request(), "ConditionExpression"), "(#n0 < :v1)");
    }

    // The snapshot still holds the last saved value
    b.e.save(o, {}, true);
    auto& request = b.s.last_request("UpdateItem");
    BOOST_REQUIRE(rjson::get(rjson::get(request, "ExpressionAttributeValues"), ":v1") == rjson::parse(R"({"N": "30"})"));

    b.s.push_error("UpdateItem", api_error::throughput_exceeded("slow down"));
    try {
        b.e.save(o);
        BOOST_FAIL("save should have failed");
    } catch (const session_error& e) {
        BOOST_REQUIRE(e.cause().is("ProvisionedThroughputExceededException"));
    }
}

BOOST_AUTO_TEST_CASE(test_save_collection_actions) {
    bound_engine b;
    auto o = b.user("u1");
    o.apply(b.u.tags, action::add(string_set{"new"}));
    BOOST_REQUIRE(o.pending_action(b.u.tags));
    b.e.save(o);
    BOOST_REQUIRE_EQUAL(str(b.s.last_request("UpdateItem"), "UpdateExpression"), "ADD #n0 :v1");
    // Pending actions are cleared once written
    BOOST_REQUIRE(!o.pending_action(b.u.tags));
}

BOOST_AUTO_TEST_CASE(test_save_without_key) {
    bound_engine b;
    object o(b.u.m);
    o.set(b.u.age, 1);
    BOOST_REQUIRE_THROW(b.e.save(o), invalid_value);
    BOOST_REQUIRE_EQUAL(b.s.count("UpdateItem"), 0u);
}

BOOST_AUTO_TEST_CASE(test_remove) {
    bound_engine b;
    auto o = b.user("u1");
    o.set(b.u.age, 30);
    b.e.save(o);
    std::vector<const object*> deleted;
    b.e.on_object_deleted([&deleted] (const object& obj) { deleted.push_back(&obj); });
    b.e.remove(o, b.u.age.exists());
    BOOST_REQUIRE(b.s.last_request("DeleteItem") == rjson::parse(R"({
        "TableName": "users",
        "Key": {"id": {"S": "u1"}},
        "ConditionExpression": "(attribute_exists(#n0))",
        "ExpressionAttributeNames": {"#n0": "age"}
    })"));
    BOOST_REQUIRE_EQUAL(deleted.size(), 1u);

    // After a delete, an atomic save expects nothing to exist again
    b.e.save(o, {}, true);
    auto cond = str(b.s.last_request("UpdateItem"), "ConditionExpression");
    BOOST_REQUIRE(cond.starts_with("((attribute_not_exists("));

    b.s.push_error("DeleteItem", api_error::conditional_check_failed("no"));
    BOOST_REQUIRE_THROW(b.e.remove(o, {}, true), constraint_violation);
}

BOOST_AUTO_TEST_CASE(test_load) {
    bound_engine b;
    auto o = b.user("u1");
    b.s.push_response("BatchGetItem", R"({"Responses": {"users": [
        {"id": {"S": "u1"}, "age": {"N": "7"}, "tags": {"SS": ["a"]}}
    ]}})");
    int loaded = 0;
    b.e.on_object_loaded([&loaded] (const object&) { ++loaded; });
    b.e.load(o, true);

    BOOST_REQUIRE(b.s.last_request("BatchGetItem") == rjson::parse(R"({"RequestItems": {
        "users": {"Keys": [{"id": {"S": "u1"}}], "ConsistentRead": true}
    }})"));
    BOOST_REQUIRE_EQUAL(o.get(b.u.age), value(7));
    BOOST_REQUIRE_EQUAL(o.get(b.u.tags), value(string_set{"a"}));
    BOOST_REQUIRE(!o.has(b.u.email));
    BOOST_REQUIRE_EQUAL(loaded, 1);

    // The loaded values are the snapshot for the next atomic save
    o.set(b.u.age, 8);
    b.e.save(o, {}, true);
    auto& request = b.s.last_request("UpdateItem");
    BOOST_REQUIRE(str(request, "ConditionExpression").find("attribute_not_exists") != std::string_view::npos);
    BOOST_REQUIRE(rjson::get(request, "ExpressionAttributeValues").HasMember(":v1"));
}

BOOST_AUTO_TEST_CASE(test_load_retries_unprocessed_keys) {
    bound_engine b;
    auto o1 = b.user("u1");
    auto o2 = b.user("u2");
    auto twin = b.user("u1");
    b.s.push_response("BatchGetItem", R"({
        "Responses": {"users": [{"id": {"S": "u1"}, "age": {"N": "1"}}]},
        "UnprocessedKeys": {"users": {"Keys": [{"id": {"S": "u2"}}], "ConsistentRead": false}}
    })");
    b.s.push_response("BatchGetItem", R"({"Responses": {"users": [{"id": {"S": "u2"}, "age": {"N": "2"}}]}})");
    b.e.load(std::vector<object*>{&o1, &o2, &twin});

    BOOST_REQUIRE_EQUAL(b.s.count("BatchGetItem"), 2u);
    // Objects with the same key share one requested key
    auto& first = b.s.calls[0].request;
    BOOST_REQUIRE_EQUAL(rjson::get(rjson::get(rjson::get(first, "RequestItems"), "users"), "Keys").Size(), 2u);
    BOOST_REQUIRE(b.s.last_request("BatchGetItem") == rjson::parse(R"({"RequestItems": {
        "users": {"Keys": [{"id": {"S": "u2"}}], "ConsistentRead": false}
    }})"));
    BOOST_REQUIRE_EQUAL(o1.get(b.u.age), value(1));
    BOOST_REQUIRE_EQUAL(twin.get(b.u.age), value(1));
    BOOST_REQUIRE_EQUAL(o2.get(b.u.age), value(2));
}

BOOST_AUTO_TEST_CASE(test_load_missing_objects) {
    bound_engine b;
    std::vector<object> users;
    for (int i = 0; i < 150; ++i) {
        users.push_back(b.user(fmt::format("u{}", i)));
    }
    std::vector<object*> pointers;
    for (auto& o : users) {
        pointers.push_back(&o);
    }
    b.s.push_response("BatchGetItem", R"({"Responses": {"users": [{"id": {"S": "u3"}}]}})");
    b.s.push_response("BatchGetItem", R"({"Responses": {}})");
    try {
        b.e.load(pointers);
        BOOST_FAIL("load should have failed");
    } catch (const missing_objects& e) {
        BOOST_REQUIRE_EQUAL(e.objects().size(), 149u);
        BOOST_REQUIRE(std::find(e.objects().begin(), e.objects().end(), &users[3]) == e.objects().end());
    }
    // At most 100 keys per request
    BOOST_REQUIRE_EQUAL(b.s.count("BatchGetItem"), 2u);
    auto keys = [&] (size_t i) {
        return rjson::get(rjson::get(rjson::get(b.s.calls[i].request, "RequestItems"), "users"), "Keys").Size();
    };
    BOOST_REQUIRE_EQUAL(keys(0), 100u);
    BOOST_REQUIRE_EQUAL(keys(1), 50u);
}

BOOST_AUTO_TEST_CASE(test_tracking_follows_objects) {
    bound_engine b;
    std::vector<std::string> modified;
    b.e.on_object_modified([&modified] (const object&, const column& col) { modified.push_back(col.name()); });
    auto before = b.e.tracking().size();
    {
        auto o = b.user("u1");
        o.set(b.u.age, 3);
        BOOST_REQUIRE(b.e.tracking().is_marked(o, b.u.age));
        BOOST_REQUIRE(modified == (std::vector<std::string>{"id", "age"}));

        // Copies carry the marks along
        object copy = o;
        BOOST_REQUIRE(b.e.tracking().is_marked(copy, b.u.age));
        BOOST_REQUIRE(b.e.tracking().is_marked(copy, b.u.id));
        BOOST_REQUIRE_EQUAL(b.e.tracking().size(), before + 2);
    }
    // Destroyed objects are forgotten
    BOOST_REQUIRE_EQUAL(b.e.tracking().size(), before);
}

BOOST_AUTO_TEST_CASE(test_engine_outlived_by_objects) {
    mock_session s;
    user_model u;
    {
        engine e(s, {.skip_table_setup = true});
        e.bind(u.m);
    }
    // The model no longer reports to the destroyed engine
    object o(u.m);
    o.set(u.age, 1);
}

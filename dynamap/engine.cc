/*
 * Copyright 2024-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "dynamap/engine.hh"

#include <algorithm>
#include <map>
#include <fmt/format.h>

#include "dynamap/error.hh"
#include "dynamap/expressions.hh"
#include "log.hh"

static logging::logger elogger("dynamap-engine");

namespace dynamap {

// BatchGetItem accepts at most this many keys per request.
static constexpr size_t max_batch_get_keys = 100;

void engine::tracking_listener::on_object_modified(const object& obj, const column& col) {
    _engine._tracking.mark(obj, col);
    for (auto& o : _engine._modified_observers) {
        o(obj, col);
    }
}

void engine::tracking_listener::on_object_copied(const object& from, const object& to) {
    _engine._tracking.copy(from, to);
}

void engine::tracking_listener::on_object_disposed(const object& obj) noexcept {
    _engine._tracking.forget(obj);
}

engine::engine(session& s, engine_config cfg)
    : _session(s)
    , _config(std::move(cfg))
    , _listener(*this)
{ }

engine::~engine() {
    for (auto m : _bound) {
        m->remove_listener(_listener);
    }
}

bool engine::is_bound(const model& m) const noexcept {
    return std::find(_bound.begin(), _bound.end(), &m) != _bound.end();
}

void engine::check_bound(const model& m) const {
    if (!is_bound(m)) {
        throw unbound_model(fmt::format("model {} is not bound to this engine", m.name()));
    }
}

std::string engine::table_name(const model& m) const {
    return _config.format_table_name(m.table_name());
}

void engine::notify(const std::vector<object_observer>& observers, const object& obj) {
    for (auto& o : observers) {
        o(obj);
    }
}

static void add_key_schema(rjson::value& parent, const column& hash_key, const column* range_key) {
    rjson::value key_schema = rjson::empty_array();
    auto add_key = [&key_schema] (const column& col, std::string_view type) {
        rjson::value key = rjson::empty_object();
        rjson::add(key, "AttributeName", std::string_view(col.dynamo_name()));
        rjson::add(key, "KeyType", type);
        rjson::push_back(key_schema, std::move(key));
    };
    add_key(hash_key, "HASH");
    if (range_key) {
        add_key(*range_key, "RANGE");
    }
    rjson::add(parent, "KeySchema", std::move(key_schema));
}

static rjson::value projection_json(const secondary_index& index) {
    rjson::value projection = rjson::empty_object();
    rjson::add(projection, "ProjectionType", fmt::format("{}", index.projection()));
    if (index.projection() == projection_type::include) {
        rjson::value names = rjson::empty_array();
        auto keys = index.owner().keys();
        for (auto col : index.projected_columns()) {
            bool is_key = col == &index.hash_key() || col == index.range_key()
                    || std::find(keys.begin(), keys.end(), col) != keys.end();
            if (!is_key) {
                rjson::push_back(names, rjson::from_string(col->dynamo_name()));
            }
        }
        rjson::add(projection, "NonKeyAttributes", std::move(names));
    }
    return projection;
}

static std::string_view stream_view_type(const stream_options& opts) {
    if (opts.keys) {
        return "KEYS_ONLY";
    }
    if (opts.new_image && opts.old_image) {
        return "NEW_AND_OLD_IMAGES";
    }
    return opts.new_image ? "NEW_IMAGE" : "OLD_IMAGE";
}

void engine::create_table(const model& m) {
    rjson::value request = rjson::empty_object();
    rjson::add(request, "TableName", table_name(m));
    rjson::add(request, "BillingMode", "PAY_PER_REQUEST");
    add_key_schema(request, m.hash_key(), m.range_key());

    // Every key column of the table and its indexes, by wire name.
    std::map<std::string, std::string_view> attribute_types;
    auto add_attribute = [&attribute_types] (const column* col) {
        if (col) {
            attribute_types.emplace(col->dynamo_name(), col->type()->backing_type());
        }
    };
    for (auto col : m.keys()) {
        add_attribute(col);
    }
    rjson::value gsis = rjson::empty_array();
    rjson::value lsis = rjson::empty_array();
    for (auto index : m.indexes()) {
        add_attribute(&index->hash_key());
        add_attribute(index->range_key());
        rjson::value entry = rjson::empty_object();
        rjson::add(entry, "IndexName", std::string_view(index->dynamo_name()));
        add_key_schema(entry, index->hash_key(), index->range_key());
        rjson::add(entry, "Projection", projection_json(*index));
        rjson::push_back(index->kind() == index_kind::global ? gsis : lsis, std::move(entry));
    }
    rjson::value attribute_definitions = rjson::empty_array();
    for (auto& [name, type] : attribute_types) {
        rjson::value definition = rjson::empty_object();
        rjson::add(definition, "AttributeName", std::string_view(name));
        rjson::add(definition, "AttributeType", type);
        rjson::push_back(attribute_definitions, std::move(definition));
    }
    rjson::add(request, "AttributeDefinitions", std::move(attribute_definitions));
    if (!gsis.Empty()) {
        rjson::add(request, "GlobalSecondaryIndexes", std::move(gsis));
    }
    if (!lsis.Empty()) {
        rjson::add(request, "LocalSecondaryIndexes", std::move(lsis));
    }
    if (auto& opts = m.stream()) {
        rjson::value spec = rjson::empty_object();
        rjson::add(spec, "StreamEnabled", rjson::value(true));
        rjson::add(spec, "StreamViewType", stream_view_type(*opts));
        rjson::add(request, "StreamSpecification", std::move(spec));
    }

    elogger.trace("CreateTable request: {}", request);
    try {
        _session.create_table(request);
    } catch (const api_error& e) {
        if (e.is("ResourceInUseException")) {
            elogger.debug("table {} already exists", table_name(m));
            return;
        }
        translate_session_error(e, "CreateTable", request);
    }
}

// Checks the live key schema against the model and picks up the stream ARN.
void engine::check_table(model& m) {
    auto name = table_name(m);
    rjson::value description;
    try {
        description = _session.describe_table(name);
    } catch (const api_error& e) {
        rjson::value request = rjson::empty_object();
        rjson::add(request, "TableName", std::string_view(name));
        translate_session_error(e, "DescribeTable", request);
    }
    auto& table = rjson::get(description, "Table");
    std::optional<std::string> hash;
    std::optional<std::string> range;
    for (auto& key : rjson::get(table, "KeySchema").GetArray()) {
        auto attr = std::string(rjson::to_string_view(rjson::get(key, "AttributeName")));
        auto type = rjson::to_string_view(rjson::get(key, "KeyType"));
        (type == "HASH" ? hash : range) = std::move(attr);
    }
    auto range_key = m.range_key();
    if (hash != m.hash_key().dynamo_name() || range != (range_key ? std::optional<std::string>(range_key->dynamo_name()) : std::nullopt)) {
        log_warning_and_throw<table_mismatch>(elogger, "table {} has key ({}, {}), model {} expects ({}, {})", name,
                hash.value_or(""), range.value_or(""), m.name(), m.hash_key().dynamo_name(), range_key ? range_key->dynamo_name() : "");
    }
    if (m.stream() && m.stream()->arn.empty()) {
        auto arn = rjson::get_opt<std::string>(table, "LatestStreamArn");
        if (!arn) {
            log_warning_and_throw<table_mismatch>(elogger, "table {} has no stream, model {} expects one", name, m.name());
        }
        m.set_stream_arn(std::move(*arn));
    }
}

void engine::bind(model& m) {
    if (is_bound(m)) {
        return;
    }
    m.validate();
    for (auto col : m.columns()) {
        _types.register_type(col->type());
    }
    if (!_config.skip_table_setup) {
        create_table(m);
        check_table(m);
    }
    m.add_listener(_listener);
    _bound.push_back(&m);
    elogger.info("bound model {} to table {}", m.name(), table_name(m));
    for (auto& o : _bound_observers) {
        o(m);
    }
}

rjson::value engine::dump_key(const object& obj) const {
    rjson::value key = rjson::empty_object();
    for (auto col : obj.get_model().keys()) {
        auto encoded = _types.encode(*col->type(), obj.get(*col));
        if (encoded.IsNull()) {
            throw invalid_value(fmt::format("key column {}.{} is not set", obj.get_model().name(), col->name()));
        }
        rjson::add(key, col->dynamo_name(), std::move(encoded));
    }
    return key;
}

static void merge(rjson::value& request, rjson::value rendered) {
    for (auto it = rendered.MemberBegin(); it != rendered.MemberEnd(); ++it) {
        rjson::add(request, rjson::to_string_view(it->name), std::move(it->value));
    }
}

void engine::save(object& obj, const condition& cond, std::optional<bool> atomic) {
    check_bound(obj.get_model());
    render_request r;
    r.conditional = cond;
    r.atomic = atomic.value_or(_config.atomic);
    r.update = true;
    r.obj = &obj;
    rjson::value request = rjson::empty_object();
    rjson::add(request, "TableName", table_name(obj.get_model()));
    rjson::add(request, "Key", dump_key(obj));
    merge(request, render(_types, _tracking, r));
    elogger.trace("UpdateItem request: {}", request);
    try {
        _session.update_item(request);
    } catch (const api_error& e) {
        translate_session_error(e, "UpdateItem", request);
    }
    obj.clear_actions();
    _tracking.sync(obj, _types);
    notify(_saved_observers, obj);
}

void engine::remove(object& obj, const condition& cond, std::optional<bool> atomic) {
    check_bound(obj.get_model());
    render_request r;
    r.conditional = cond;
    r.atomic = atomic.value_or(_config.atomic);
    r.obj = &obj;
    rjson::value request = rjson::empty_object();
    rjson::add(request, "TableName", table_name(obj.get_model()));
    rjson::add(request, "Key", dump_key(obj));
    merge(request, render(_types, _tracking, r));
    elogger.trace("DeleteItem request: {}", request);
    try {
        _session.delete_item(request);
    } catch (const api_error& e) {
        translate_session_error(e, "DeleteItem", request);
    }
    _tracking.clear(obj);
    notify(_deleted_observers, obj);
}

void engine::load(object& obj, std::optional<bool> consistent) {
    load(std::vector<object*>{&obj}, consistent);
}

namespace {

// Objects waiting for the item with one key, within one table.
struct pending_key {
    const model* m;
    std::string table;
    rjson::copyable_value key;
    std::vector<object*> objects;
};

}

void engine::load(const std::vector<object*>& objs, std::optional<bool> consistent_read) {
    bool consistent = consistent_read.value_or(_config.consistent_reads);
    // (table, printed key) -> pending key; one request per distinct item
    std::map<std::pair<std::string, std::string>, pending_key> pending;
    std::vector<std::pair<std::string, std::string>> order;
    for (auto obj : objs) {
        check_bound(obj->get_model());
        auto table = table_name(obj->get_model());
        auto key = dump_key(*obj);
        auto id = std::make_pair(table, rjson::print(key));
        auto [it, inserted] = pending.try_emplace(id, pending_key{&obj->get_model(), table, std::move(key), {}});
        it->second.objects.push_back(obj);
        if (inserted) {
            order.push_back(std::move(id));
        }
    }

    auto key_of = [] (const model& m, const rjson::value& item) {
        rjson::value key = rjson::empty_object();
        for (auto col : m.keys()) {
            if (auto v = rjson::find(item, col->dynamo_name())) {
                rjson::add(key, col->dynamo_name(), rjson::copy(*v));
            }
        }
        return rjson::print(key);
    };

    for (size_t start = 0; start < order.size(); start += max_batch_get_keys) {
        rjson::value request_items = rjson::empty_object();
        auto end = std::min(order.size(), start + max_batch_get_keys);
        for (size_t i = start; i < end; ++i) {
            auto& p = pending.at(order[i]);
            auto entry = rjson::find(request_items, p.table);
            if (!entry) {
                rjson::value table_request = rjson::empty_object();
                rjson::add(table_request, "Keys", rjson::empty_array());
                rjson::add(table_request, "ConsistentRead", rjson::value(consistent));
                rjson::add(request_items, p.table, std::move(table_request));
                entry = rjson::find(request_items, p.table);
            }
            rjson::push_back(rjson::get(*entry, "Keys"), rjson::copy(p.key));
        }
        while (request_items.MemberCount() > 0) {
            rjson::value request = rjson::empty_object();
            rjson::add(request, "RequestItems", std::move(request_items));
            elogger.trace("BatchGetItem request: {}", request);
            rjson::value response;
            try {
                response = _session.batch_get_item(request);
            } catch (const api_error& e) {
                translate_session_error(e, "BatchGetItem", request);
            }
            if (auto responses = rjson::find(response, "Responses")) {
                for (auto it = responses->MemberBegin(); it != responses->MemberEnd(); ++it) {
                    auto table = std::string(rjson::to_string_view(it->name));
                    for (auto& item : it->value.GetArray()) {
                        // Every pending key of a table belongs to models with the same key names.
                        auto first = pending.lower_bound(std::make_pair(table, std::string()));
                        if (first == pending.end() || first->first.first != table) {
                            continue;
                        }
                        auto found = pending.find(std::make_pair(table, key_of(*first->second.m, item)));
                        if (found == pending.end()) {
                            continue;
                        }
                        for (auto obj : found->second.objects) {
                            unpack(*obj, item, obj->get_model().columns());
                        }
                        pending.erase(found);
                    }
                }
            }
            auto unprocessed = rjson::find(response, "UnprocessedKeys");
            request_items = unprocessed && unprocessed->IsObject() ? rjson::copy(*unprocessed) : rjson::empty_object();
        }
    }

    if (!pending.empty()) {
        std::vector<const object*> missing;
        for (auto& [id, p] : pending) {
            missing.insert(missing.end(), p.objects.begin(), p.objects.end());
        }
        throw missing_objects(fmt::format("{} objects were not found", missing.size()), std::move(missing));
    }
}

void engine::unpack(object& obj, const rjson::value& attrs, const std::vector<const column*>& expected) {
    for (auto col : expected) {
        auto wire = rjson::find(attrs, col->dynamo_name());
        obj.set(*col, wire ? _types.decode(*col->type(), *wire) : value());
    }
    _tracking.sync(obj, _types);
    notify(_loaded_observers, obj);
}

search_iterator engine::query(const model& m, search_options options) {
    check_bound(m);
    return search_iterator(*this, m, nullptr, search_mode::query, std::move(options));
}

search_iterator engine::query(const secondary_index& index, search_options options) {
    check_bound(index.owner());
    return search_iterator(*this, index.owner(), &index, search_mode::query, std::move(options));
}

search_iterator engine::scan(const model& m, search_options options) {
    check_bound(m);
    return search_iterator(*this, m, nullptr, search_mode::scan, std::move(options));
}

search_iterator engine::scan(const secondary_index& index, search_options options) {
    check_bound(index.owner());
    return search_iterator(*this, index.owner(), &index, search_mode::scan, std::move(options));
}

streams::stream engine::stream(const model& m, const streams::stream_position& position) {
    check_bound(m);
    return streams::stream(*this, m, position);
}

}

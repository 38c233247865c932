/*
 * Copyright 2024-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "dynamap/search.hh"

#include <algorithm>
#include <fmt/format.h>

#include "dynamap/engine.hh"
#include "dynamap/error.hh"
#include "dynamap/expressions.hh"
#include "log.hh"

static logging::logger slogger("dynamap-search");

namespace dynamap {

search_iterator::search_iterator(engine& e, const model& m, const secondary_index* index, search_mode mode, search_options options)
    : _engine(&e)
    , _model(&m)
    , _index(index)
    , _mode(mode)
    , _options(std::move(options))
{
    validate();
    prepare();
}

std::string_view search_iterator::operation() const noexcept {
    return _mode == search_mode::query ? "Query" : "Scan";
}

static bool is_plain_path_on(const condition& c, const column* col) {
    return col && &c.path().get_column() == col && c.path().segments().empty();
}

static bool has_value_operands(const condition& c) {
    return std::all_of(c.operands().begin(), c.operands().end(), [] (const operand& o) {
        return std::holds_alternative<value>(o);
    });
}

void search_iterator::validate_key_condition(const column& hash_key, const column* range_key) const {
    auto& key = _options.key;
    auto hash_condition = [&] (const condition& c) {
        return c.kind() == condition_kind::comparison && c.op() == comparison_operator::eq
                && is_plain_path_on(c, &hash_key) && has_value_operands(c);
    };
    auto range_condition = [&] (const condition& c) {
        switch (c.kind()) {
        case condition_kind::comparison:
            if (c.op() == comparison_operator::ne) {
                return false;
            }
            break;
        case condition_kind::between:
        case condition_kind::begins_with:
            break;
        default:
            return false;
        }
        return is_plain_path_on(c, range_key) && has_value_operands(c);
    };
    if (key.empty()) {
        throw invalid_search(fmt::format("a query on {} needs a key condition", _model->name()));
    }
    if (hash_condition(key)) {
        return;
    }
    if (key.kind() == condition_kind::conjunction && key.children().size() == 2) {
        auto& a = key.children()[0];
        auto& b = key.children()[1];
        if ((hash_condition(a) && range_condition(b)) || (range_condition(a) && hash_condition(b))) {
            return;
        }
    }
    throw invalid_search(fmt::format("invalid key condition {}: a query needs equality on hash key {} and at most one condition on the range key",
            key, hash_key.name()));
}

void search_iterator::validate() const {
    const column& hash_key = _index ? _index->hash_key() : _model->hash_key();
    const column* range_key = _index ? _index->range_key() : _model->range_key();
    bool global = _index && _index->kind() == index_kind::global;

    if (_mode == search_mode::query) {
        validate_key_condition(hash_key, range_key);
        for (auto col : iter_columns(_options.filter)) {
            if (col == &hash_key || col == range_key) {
                throw invalid_search(fmt::format("a query filter cannot use key column {}", col->name()));
            }
        }
        if (_options.segment || _options.total_segments) {
            throw invalid_search("a query cannot be a parallel scan");
        }
    } else {
        if (!_options.key.empty()) {
            throw invalid_search("a scan takes no key condition");
        }
        if (_options.segment.has_value() != _options.total_segments.has_value()) {
            throw invalid_search("a parallel scan needs both segment and total_segments");
        }
        if (_options.segment && *_options.segment >= *_options.total_segments) {
            throw invalid_search(fmt::format("segment {} is not below total_segments {}", *_options.segment, *_options.total_segments));
        }
    }
    if (global && _options.consistent.value_or(false)) {
        throw invalid_search(fmt::format("global secondary index {} cannot be read consistently", _index->name()));
    }
    if (_options.count_only && !_options.projection.empty()) {
        throw invalid_search("a counting search cannot project columns");
    }
    std::vector<const column*> available = _index ? _index->projected_columns() : _model->columns();
    for (auto col : _options.projection) {
        if (&col->owner() != _model) {
            throw invalid_search(fmt::format("column {} does not belong to model {}", col->name(), _model->name()));
        }
        if (std::find(available.begin(), available.end(), col) == available.end()) {
            throw invalid_search(fmt::format("index {} does not project column {}", _index->name(), col->name()));
        }
    }
}

void search_iterator::prepare() {
    rjson::value request = rjson::empty_object();
    rjson::add(request, "TableName", _engine->table_name(*_model));
    if (_index) {
        rjson::add(request, "IndexName", std::string_view(_index->dynamo_name()));
    }
    bool consistent = _options.consistent.value_or(_engine->config().consistent_reads);
    if (_index && _index->kind() == index_kind::global) {
        consistent = false;
    }
    rjson::add(request, "ConsistentRead", rjson::value(consistent));

    render_request r;
    r.filter = _options.filter;
    if (_options.count_only) {
        rjson::add(request, "Select", "COUNT");
    } else if (_options.projection.empty()) {
        rjson::add(request, "Select", _index ? "ALL_PROJECTED_ATTRIBUTES" : "ALL_ATTRIBUTES");
        _expected = _index ? _index->projected_columns() : _model->columns();
    } else {
        rjson::add(request, "Select", "SPECIFIC_ATTRIBUTES");
        r.projection = _options.projection;
        _expected = _options.projection;
    }
    if (_mode == search_mode::query) {
        r.key = _options.key;
        rjson::add(request, "ScanIndexForward", rjson::value(_options.forward));
    }
    if (_options.segment) {
        rjson::add(request, "Segment", rjson::value(*_options.segment));
        rjson::add(request, "TotalSegments", rjson::value(*_options.total_segments));
    }
    auto rendered = render(_engine->types(), _engine->tracking(), r);
    for (auto it = rendered.MemberBegin(); it != rendered.MemberEnd(); ++it) {
        rjson::add(request, rjson::to_string_view(it->name), std::move(it->value));
    }
    _request = std::move(request);
}

void search_iterator::fetch_page() {
    rjson::value request = rjson::copy(_request);
    if (_last_key) {
        rjson::add(request, "ExclusiveStartKey", rjson::copy(*_last_key));
    }
    slogger.trace("{} request: {}", operation(), request);
    rjson::value response;
    try {
        response = _mode == search_mode::query ? _engine->get_session().query(request) : _engine->get_session().scan(request);
    } catch (const api_error& e) {
        translate_session_error(e, operation(), request);
    }
    _count += rjson::get_opt<uint64_t>(response, "Count").value_or(0);
    _scanned += rjson::get_opt<uint64_t>(response, "ScannedCount").value_or(0);
    if (auto items = rjson::find(response, "Items")) {
        for (auto& item : items->GetArray()) {
            _items.emplace_back(std::move(item));
        }
    }
    auto last_key = rjson::find(response, "LastEvaluatedKey");
    if (last_key && !last_key->IsNull()) {
        _last_key = rjson::copyable_value(*last_key);
    } else {
        _last_key.reset();
        _exhausted = true;
    }
    slogger.trace("{} page: {} items, {} matched so far", operation(), _items.size(), _count);
}

std::optional<object> search_iterator::next() {
    while (true) {
        if (_options.limit && _yielded >= *_options.limit) {
            return std::nullopt;
        }
        if (!_items.empty()) {
            auto item = std::move(_items.front());
            _items.pop_front();
            object obj(*_model);
            _engine->unpack(obj, item, _expected);
            ++_yielded;
            return obj;
        }
        if (_exhausted) {
            return std::nullopt;
        }
        fetch_page();
    }
}

object search_iterator::first() {
    auto obj = next();
    if (!obj) {
        throw constraint_violation(std::string(operation()), _request, fmt::format("{} on {} found no results", operation(), _model->name()));
    }
    return std::move(*obj);
}

object search_iterator::one() {
    auto obj = first();
    if (next()) {
        throw constraint_violation(std::string(operation()), _request, fmt::format("{} on {} found more than one result", operation(), _model->name()));
    }
    return obj;
}

std::vector<object> search_iterator::all() {
    std::vector<object> ret;
    while (auto obj = next()) {
        ret.push_back(std::move(*obj));
    }
    return ret;
}

bool search_iterator::exhausted() const noexcept {
    if (_options.limit && _yielded >= *_options.limit) {
        return true;
    }
    return _exhausted && _items.empty();
}

void search_iterator::reset() noexcept {
    _items.clear();
    _last_key.reset();
    _exhausted = false;
    _count = 0;
    _scanned = 0;
    _yielded = 0;
}

}

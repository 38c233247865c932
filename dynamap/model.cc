/*
 * Copyright 2024-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "dynamap/model.hh"

#include <algorithm>
#include <fmt/format.h>

#include "dynamap/error.hh"
#include "utils/overloaded_functor.hh"

namespace dynamap {

attribute_path::attribute_path(const column& col, std::vector<path_segment> segments)
    : _column(&col)
    , _segments(std::move(segments))
{ }

attribute_path attribute_path::operator[](std::string key) const {
    auto segments = _segments;
    segments.emplace_back(std::move(key));
    return attribute_path(*_column, std::move(segments));
}

attribute_path attribute_path::operator[](unsigned index) const {
    auto segments = _segments;
    segments.emplace_back(index);
    return attribute_path(*_column, std::move(segments));
}

data_type attribute_path::type() const {
    data_type t = _column->type();
    for (auto& segment : _segments) {
        t = t->element_type(segment);
    }
    return t;
}

bool attribute_path::same_as(const attribute_path& other) const noexcept {
    return _column == other._column && _segments == other._segments;
}

std::ostream& operator<<(std::ostream& os, const attribute_path& p) {
    os << p._column->owner().name() << '.' << p._column->name();
    for (auto& segment : p._segments) {
        std::visit(overloaded_functor{
            [&] (const std::string& key) { os << '.' << key; },
            [&] (unsigned index) { os << '[' << index << ']'; },
        }, segment);
    }
    return os;
}

column::column(const model& m, std::string name, data_type type, column_options opts)
    : _model(&m)
    , _name(std::move(name))
    , _dynamo_name(opts.dynamo_name.empty() ? _name : std::move(opts.dynamo_name))
    , _type(std::move(type))
    , _hash_key(opts.hash_key)
    , _range_key(opts.range_key)
{ }

std::ostream& operator<<(std::ostream& os, projection_type p) {
    switch (p) {
        case projection_type::all: os << "ALL"; break;
        case projection_type::keys_only: os << "KEYS_ONLY"; break;
        case projection_type::include: os << "INCLUDE"; break;
        default: throw std::logic_error(std::to_string(int(p)));
    }
    return os;
}

secondary_index::secondary_index(const model& m, index_kind kind, std::string name, const column& hash_key, const column* range_key,
        projection_type projection, std::vector<const column*> included, std::string dynamo_name)
    : _model(&m)
    , _kind(kind)
    , _name(std::move(name))
    , _dynamo_name(dynamo_name.empty() ? _name : std::move(dynamo_name))
    , _hash_key(&hash_key)
    , _range_key(range_key)
    , _projection(projection)
    , _included(std::move(included))
{ }

std::vector<const column*> secondary_index::projected_columns() const {
    if (_projection == projection_type::all) {
        return _model->columns();
    }
    std::vector<const column*> ret = _model->keys();
    auto add = [&ret] (const column* c) {
        if (c && std::find(ret.begin(), ret.end(), c) == ret.end()) {
            ret.push_back(c);
        }
    };
    add(_hash_key);
    add(_range_key);
    for (auto c : _included) {
        add(c);
    }
    return ret;
}

model::model(std::string name, std::string table_name)
    : _name(std::move(name))
    , _table_name(table_name.empty() ? _name : std::move(table_name))
{ }

const column& model::add_column(std::string name, data_type type, column_options opts) {
    if (find_column(name)) {
        throw invalid_model(fmt::format("model {} already has a column {}", _name, name));
    }
    if (opts.hash_key && opts.range_key) {
        throw invalid_model(fmt::format("column {}.{} cannot be both hash and range key", _name, name));
    }
    if (opts.hash_key && _hash_key) {
        throw invalid_model(fmt::format("model {} already has hash key {}", _name, _hash_key->name()));
    }
    if (opts.range_key && _range_key) {
        throw invalid_model(fmt::format("model {} already has range key {}", _name, _range_key->name()));
    }
    auto dynamo_name = opts.dynamo_name.empty() ? name : opts.dynamo_name;
    if (find_column_by_dynamo_name(dynamo_name)) {
        throw invalid_model(fmt::format("model {} already has an attribute named {}", _name, dynamo_name));
    }
    auto& col = *_columns.emplace_back(std::make_unique<column>(*this, std::move(name), std::move(type), std::move(opts)));
    if (col.is_hash_key()) {
        _hash_key = &col;
    }
    if (col.is_range_key()) {
        _range_key = &col;
    }
    return col;
}

static std::vector<const column*> included_columns(const model& m, const index_options& opts) {
    std::vector<const column*> ret;
    if (opts.projection != projection_type::include) {
        if (!opts.include.empty()) {
            throw invalid_model(fmt::format("index projection {} cannot list included columns", opts.projection));
        }
        return ret;
    }
    for (auto& name : opts.include) {
        ret.push_back(&m.get_column(name));
    }
    return ret;
}

const secondary_index& model::add_global_index(std::string name, std::string_view hash_key, std::string_view range_key,
        index_options opts) {
    auto& hk = get_column(hash_key);
    const column* rk = range_key.empty() ? nullptr : &get_column(range_key);
    auto included = included_columns(*this, opts);
    return *_indexes.emplace_back(std::make_unique<secondary_index>(*this, index_kind::global, std::move(name), hk, rk,
            opts.projection, std::move(included), std::move(opts.dynamo_name)));
}

const secondary_index& model::add_local_index(std::string name, std::string_view range_key, index_options opts) {
    auto& rk = get_column(range_key);
    auto included = included_columns(*this, opts);
    return *_indexes.emplace_back(std::make_unique<secondary_index>(*this, index_kind::local, std::move(name), hash_key(), &rk,
            opts.projection, std::move(included), std::move(opts.dynamo_name)));
}

void model::set_stream(stream_options opts) {
    if (!opts.keys && !opts.new_image && !opts.old_image) {
        throw invalid_model(fmt::format("stream of model {} must include keys, new or old images", _name));
    }
    if (opts.keys && (opts.new_image || opts.old_image)) {
        throw invalid_model(fmt::format("stream of model {} cannot include keys together with images", _name));
    }
    _stream = std::move(opts);
}

void model::set_stream_arn(std::string arn) {
    if (!_stream) {
        throw invalid_model(fmt::format("model {} has no stream", _name));
    }
    _stream->arn = std::move(arn);
}

std::vector<const column*> model::columns() const {
    std::vector<const column*> ret;
    ret.reserve(_columns.size());
    for (auto& c : _columns) {
        ret.push_back(c.get());
    }
    return ret;
}

std::vector<const secondary_index*> model::indexes() const {
    std::vector<const secondary_index*> ret;
    ret.reserve(_indexes.size());
    for (auto& i : _indexes) {
        ret.push_back(i.get());
    }
    return ret;
}

const column& model::hash_key() const {
    if (!_hash_key) {
        throw invalid_model(fmt::format("model {} has no hash key", _name));
    }
    return *_hash_key;
}

std::vector<const column*> model::keys() const {
    std::vector<const column*> ret{&hash_key()};
    if (_range_key) {
        ret.push_back(_range_key);
    }
    return ret;
}

const column* model::find_column(std::string_view name) const noexcept {
    for (auto& c : _columns) {
        if (c->name() == name) {
            return c.get();
        }
    }
    return nullptr;
}

const column* model::find_column_by_dynamo_name(std::string_view dynamo_name) const noexcept {
    for (auto& c : _columns) {
        if (c->dynamo_name() == dynamo_name) {
            return c.get();
        }
    }
    return nullptr;
}

const column& model::get_column(std::string_view name) const {
    if (auto c = find_column(name)) {
        return *c;
    }
    throw unknown_column(fmt::format("model {} has no column {}", _name, name));
}

const secondary_index& model::get_index(std::string_view name) const {
    for (auto& i : _indexes) {
        if (i->name() == name) {
            return *i;
        }
    }
    throw unknown_column(fmt::format("model {} has no index {}", _name, name));
}

void model::validate() const {
    hash_key();
    for (auto& i : _indexes) {
        if (i->kind() == index_kind::local && !_range_key) {
            throw invalid_model(fmt::format("local index {} needs model {} to have a range key", i->name(), _name));
        }
    }
}

void model::add_listener(model_listener& l) {
    if (std::find(_listeners.begin(), _listeners.end(), &l) == _listeners.end()) {
        _listeners.push_back(&l);
    }
}

void model::remove_listener(model_listener& l) noexcept {
    _listeners.erase(std::remove(_listeners.begin(), _listeners.end(), &l), _listeners.end());
}

void model::notify_modified(const object& obj, const column& col) const {
    for (auto l : _listeners) {
        l->on_object_modified(obj, col);
    }
}

void model::notify_copied(const object& from, const object& to) const {
    for (auto l : _listeners) {
        l->on_object_copied(from, to);
    }
}

void model::notify_disposed(const object& obj) const noexcept {
    for (auto l : _listeners) {
        l->on_object_disposed(obj);
    }
}

static const value absent_value;

object::object(const model& m)
    : _model(&m)
{ }

object::object(const object& other)
    : _model(other._model)
    , _values(other._values)
    , _actions(other._actions)
{
    _model->notify_copied(other, *this);
}

object::object(object&& other)
    : _model(other._model)
    , _values(std::move(other._values))
    , _actions(std::move(other._actions))
{
    _model->notify_copied(other, *this);
}

object& object::operator=(const object& other) {
    if (this != &other) {
        if (_model != other._model) {
            _model->notify_disposed(*this);
        }
        _model = other._model;
        _values = other._values;
        _actions = other._actions;
        _model->notify_copied(other, *this);
    }
    return *this;
}

object& object::operator=(object&& other) {
    if (this != &other) {
        if (_model != other._model) {
            _model->notify_disposed(*this);
        }
        _model = other._model;
        _values = std::move(other._values);
        _actions = std::move(other._actions);
        _model->notify_copied(other, *this);
    }
    return *this;
}

object::~object() {
    _model->notify_disposed(*this);
}

const column& object::check_column(const column& col) const {
    if (&col.owner() != _model) {
        throw unknown_column(fmt::format("column {} does not belong to model {}", col.name(), _model->name()));
    }
    return col;
}

const value& object::get(const column& col) const {
    auto it = _values.find(&check_column(col));
    return it == _values.end() ? absent_value : it->second;
}

const value& object::get(std::string_view column_name) const {
    return get(_model->get_column(column_name));
}

bool object::has(const column& col) const {
    auto it = _values.find(&check_column(col));
    return it != _values.end() && !it->second.is_null();
}

void object::set(const column& col, value v) {
    check_column(col);
    _actions.erase(&col);
    if (v.is_null()) {
        _values.erase(&col);
    } else {
        _values.insert_or_assign(&col, std::move(v));
    }
    _model->notify_modified(*this, col);
}

void object::set(std::string_view column_name, value v) {
    set(_model->get_column(column_name), std::move(v));
}

void object::remove(const column& col) {
    set(col, value());
}

void object::remove(std::string_view column_name) {
    remove(_model->get_column(column_name));
}

void object::apply(const column& col, action a) {
    switch (a.type()) {
    case action_type::set:
        set(col, a.operand());
        return;
    case action_type::remove:
        remove(col);
        return;
    case action_type::add:
    case action_type::del:
        check_column(col);
        if (a.operand().is_null()) {
            throw invalid_value(fmt::format("{} on {} needs an operand", a.type(), col.name()));
        }
        _actions.insert_or_assign(&col, std::move(a));
        _model->notify_modified(*this, col);
        return;
    }
}

const action* object::pending_action(const column& col) const {
    auto it = _actions.find(&check_column(col));
    return it == _actions.end() ? nullptr : &it->second;
}

void object::clear_actions() noexcept {
    _actions.clear();
}

}

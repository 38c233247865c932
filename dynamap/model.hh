/*
 * Copyright 2024-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "dynamap/actions.hh"
#include "dynamap/types.hh"

namespace dynamap {

class model;
class column;
class object;
class condition;

// A path into one column's value: the column itself, or a nested
// map field / list element inside it. Paths are compared by column
// identity, never by column name.
class attribute_path {
    const column* _column;
    std::vector<path_segment> _segments;
public:
    explicit attribute_path(const column& col, std::vector<path_segment> segments = {});

    const column& get_column() const noexcept { return *_column; }
    const std::vector<path_segment>& segments() const noexcept { return _segments; }

    attribute_path operator[](std::string key) const;
    attribute_path operator[](unsigned index) const;

    // Wire type of the addressed element
    data_type type() const;
    bool same_as(const attribute_path& other) const noexcept;

    // Condition builders, see conditions.hh for the comparison operators.
    condition begins_with(value v) const;
    condition between(value lower, value upper) const;
    condition contains(value v) const;
    condition in(std::vector<value> values) const;
    condition exists() const;
    condition not_exists() const;
    condition is_(value v) const;
    condition is_not(value v) const;

    friend std::ostream& operator<<(std::ostream& os, const attribute_path& p);
};

struct column_options {
    // Attribute name on the wire, defaults to the column name.
    std::string dynamo_name;
    bool hash_key = false;
    bool range_key = false;
};

class column {
    const model* _model;
    std::string _name;
    std::string _dynamo_name;
    data_type _type;
    bool _hash_key;
    bool _range_key;
public:
    column(const model& m, std::string name, data_type type, column_options opts);
    column(const column&) = delete;
    column& operator=(const column&) = delete;

    const model& owner() const noexcept { return *_model; }
    const std::string& name() const noexcept { return _name; }
    const std::string& dynamo_name() const noexcept { return _dynamo_name; }
    const data_type& type() const noexcept { return _type; }
    bool is_hash_key() const noexcept { return _hash_key; }
    bool is_range_key() const noexcept { return _range_key; }
    bool is_key() const noexcept { return _hash_key || _range_key; }

    attribute_path path() const { return attribute_path(*this); }
    operator attribute_path() const { return path(); }
    attribute_path operator[](std::string key) const { return path()[std::move(key)]; }
    attribute_path operator[](unsigned index) const { return path()[index]; }

    condition begins_with(value v) const;
    condition between(value lower, value upper) const;
    condition contains(value v) const;
    condition in(std::vector<value> values) const;
    condition exists() const;
    condition not_exists() const;
    condition is_(value v) const;
    condition is_not(value v) const;
};

enum class index_kind {
    global,
    local,
};

enum class projection_type {
    all,
    keys_only,
    include,
};

std::ostream& operator<<(std::ostream& os, projection_type p);

struct index_options {
    // Index name on the wire, defaults to the index name.
    std::string dynamo_name;
    projection_type projection = projection_type::all;
    // Names of non-key columns projected when projection is include.
    std::vector<std::string> include;
};

class secondary_index {
    const model* _model;
    index_kind _kind;
    std::string _name;
    std::string _dynamo_name;
    const column* _hash_key;
    const column* _range_key;
    projection_type _projection;
    std::vector<const column*> _included;
public:
    secondary_index(const model& m, index_kind kind, std::string name, const column& hash_key, const column* range_key,
            projection_type projection, std::vector<const column*> included, std::string dynamo_name);
    secondary_index(const secondary_index&) = delete;
    secondary_index& operator=(const secondary_index&) = delete;

    const model& owner() const noexcept { return *_model; }
    index_kind kind() const noexcept { return _kind; }
    const std::string& name() const noexcept { return _name; }
    const std::string& dynamo_name() const noexcept { return _dynamo_name; }
    const column& hash_key() const noexcept { return *_hash_key; }
    const column* range_key() const noexcept { return _range_key; }
    projection_type projection() const noexcept { return _projection; }
    // Columns available when reading through this index: the table keys,
    // the index keys and, depending on the projection, included or all columns.
    std::vector<const column*> projected_columns() const;
};

// Which images a stream record carries, and which of them the stream
// facade turns into objects. keys cannot be combined with images.
struct stream_options {
    // Filled in from the live table when the model is bound, if empty.
    std::string arn;
    bool keys = false;
    bool new_image = true;
    bool old_image = true;
};

// Receives object lifecycle notifications from a model. The engine uses
// this to keep its change tracking table in step with the objects.
class model_listener {
public:
    virtual ~model_listener() = default;
    virtual void on_object_modified(const object& obj, const column& col) = 0;
    virtual void on_object_copied(const object& from, const object& to) = 0;
    virtual void on_object_disposed(const object& obj) noexcept = 0;
};

// A table declaration. Columns and indexes are owned by the model and are
// referred to by address, so a model is neither copyable nor movable and
// must outlive its objects and any engine it is bound to.
class model {
    std::string _name;
    std::string _table_name;
    std::vector<std::unique_ptr<column>> _columns;
    std::vector<std::unique_ptr<secondary_index>> _indexes;
    const column* _hash_key = nullptr;
    const column* _range_key = nullptr;
    std::optional<stream_options> _stream;
    std::vector<model_listener*> _listeners;
public:
    explicit model(std::string name, std::string table_name = {});
    model(const model&) = delete;
    model& operator=(const model&) = delete;

    const column& add_column(std::string name, data_type type, column_options opts = {});
    const secondary_index& add_global_index(std::string name, std::string_view hash_key, std::string_view range_key = {},
            index_options opts = {});
    const secondary_index& add_local_index(std::string name, std::string_view range_key, index_options opts = {});
    void set_stream(stream_options opts);
    void set_stream_arn(std::string arn);

    const std::string& name() const noexcept { return _name; }
    const std::string& table_name() const noexcept { return _table_name; }
    std::vector<const column*> columns() const;
    std::vector<const secondary_index*> indexes() const;
    // Throws invalid_model when no hash key was declared.
    const column& hash_key() const;
    const column* range_key() const noexcept { return _range_key; }
    std::vector<const column*> keys() const;
    const std::optional<stream_options>& stream() const noexcept { return _stream; }

    const column* find_column(std::string_view name) const noexcept;
    const column* find_column_by_dynamo_name(std::string_view dynamo_name) const noexcept;
    // Throws unknown_column
    const column& get_column(std::string_view name) const;
    const secondary_index& get_index(std::string_view name) const;

    // Throws invalid_model if the declaration is incomplete.
    void validate() const;

    void add_listener(model_listener& l);
    void remove_listener(model_listener& l) noexcept;
    void notify_modified(const object& obj, const column& col) const;
    void notify_copied(const object& from, const object& to) const;
    void notify_disposed(const object& obj) const noexcept;
};

// An instance of a model: native values per column and any pending
// collection actions. Every mutation is reported to the model's listeners.
class object {
    const model* _model;
    std::map<const column*, value> _values;
    std::map<const column*, action> _actions;
public:
    explicit object(const model& m);
    object(const object& other);
    object(object&& other);
    object& operator=(const object& other);
    object& operator=(object&& other);
    ~object();

    const model& get_model() const noexcept { return *_model; }

    // Returns the absent value for columns that were never set.
    const value& get(const column& col) const;
    const value& get(std::string_view column_name) const;
    bool has(const column& col) const;

    void set(const column& col, value v);
    void set(std::string_view column_name, value v);
    // Deletes the attribute; the deletion is persisted by the next save.
    void remove(const column& col);
    void remove(std::string_view column_name);

    void apply(const column& col, action a);
    const action* pending_action(const column& col) const;
    void clear_actions() noexcept;
private:
    const column& check_column(const column& col) const;
};

}

template <> struct fmt::formatter<dynamap::attribute_path> : fmt::ostream_formatter {};
template <> struct fmt::formatter<dynamap::projection_type> : fmt::ostream_formatter {};

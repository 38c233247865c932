/*
 * Copyright 2024-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "dynamap/conditions.hh"
#include "dynamap/config.hh"
#include "dynamap/model.hh"
#include "dynamap/search.hh"
#include "dynamap/session.hh"
#include "dynamap/streams/stream.hh"
#include "dynamap/tracking.hh"
#include "dynamap/types.hh"

namespace dynamap {

// Maps objects of bound models to items of their tables through a session.
//
// An engine owns the change tracking of every object of its bound models,
// learned through a model listener. Models must outlive the engine they are
// bound to.
class engine {
public:
    using object_observer = std::function<void(const object&)>;
    using modified_observer = std::function<void(const object&, const column&)>;
    using model_observer = std::function<void(const model&)>;
private:
    class tracking_listener final : public model_listener {
        engine& _engine;
    public:
        explicit tracking_listener(engine& e) : _engine(e) {}
        void on_object_modified(const object& obj, const column& col) override;
        void on_object_copied(const object& from, const object& to) override;
        void on_object_disposed(const object& obj) noexcept override;
    };

    session& _session;
    engine_config _config;
    type_engine _types;
    tracking_table _tracking;
    tracking_listener _listener;
    std::vector<model*> _bound;

    std::vector<object_observer> _loaded_observers;
    std::vector<object_observer> _saved_observers;
    std::vector<object_observer> _deleted_observers;
    std::vector<modified_observer> _modified_observers;
    std::vector<model_observer> _bound_observers;
public:
    explicit engine(session& s, engine_config cfg = {});
    engine(const engine&) = delete;
    engine& operator=(const engine&) = delete;
    ~engine();

    // Registers the model's types and, unless skip_table_setup is set,
    // creates its table if needed and checks the key schema of the live
    // table. Throws table_mismatch if the live table disagrees.
    void bind(model& m);
    bool is_bound(const model& m) const noexcept;

    // Writes the pending changes of obj. Throws constraint_violation when
    // the condition (and, if atomic, the tracking snapshot) does not hold.
    void save(object& obj, const condition& cond = {}, std::optional<bool> atomic = {});
    void remove(object& obj, const condition& cond = {}, std::optional<bool> atomic = {});
    // Fills the objects from their items, matched by key. Throws
    // missing_objects listing the objects that have no item.
    void load(object& obj, std::optional<bool> consistent = {});
    void load(const std::vector<object*>& objs, std::optional<bool> consistent = {});

    search_iterator query(const model& m, search_options options);
    search_iterator query(const secondary_index& index, search_options options);
    search_iterator scan(const model& m, search_options options = {});
    search_iterator scan(const secondary_index& index, search_options options = {});

    // Throws invalid_stream if the model has no stream.
    streams::stream stream(const model& m, const streams::stream_position& position);

    void on_object_loaded(object_observer o) { _loaded_observers.push_back(std::move(o)); }
    void on_object_saved(object_observer o) { _saved_observers.push_back(std::move(o)); }
    void on_object_deleted(object_observer o) { _deleted_observers.push_back(std::move(o)); }
    void on_object_modified(modified_observer o) { _modified_observers.push_back(std::move(o)); }
    void on_model_bound(model_observer o) { _bound_observers.push_back(std::move(o)); }

    session& get_session() noexcept { return _session; }
    const engine_config& config() const noexcept { return _config; }
    const type_engine& types() const noexcept { return _types; }
    tracking_table& tracking() noexcept { return _tracking; }
    const tracking_table& tracking() const noexcept { return _tracking; }

    std::string table_name(const model& m) const;
    // The object's key as a wire attribute map. Throws invalid_value when
    // a key column is not set.
    rjson::value dump_key(const object& obj) const;
    // Sets every expected column from attrs (absent attributes unset the
    // column), then synchronizes tracking and notifies loaded observers.
    void unpack(object& obj, const rjson::value& attrs, const std::vector<const column*>& expected);
private:
    void check_bound(const model& m) const;
    void create_table(const model& m);
    void check_table(model& m);
    void notify(const std::vector<object_observer>& observers, const object& obj);
};

}

/*
 * Copyright 2024-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once

#include <optional>

#include "dynamap/model.hh"
#include "dynamap/streams/coordinator.hh"

namespace dynamap {
class engine;
}

namespace dynamap::streams {

// A stream record with its images decoded into objects of the model.
struct typed_record {
    std::optional<object> key;
    std::optional<object> new_image;
    std::optional<object> old_image;
    record_metadata meta;
};

// The change stream of one model's table.
class stream {
    engine& _engine;
    const model& _model;
    coordinator _coordinator;
public:
    // Throws invalid_stream if the model has no stream or its ARN is unknown.
    stream(engine& e, const model& m, const stream_position& position);

    // Returns the next record, or nothing if no record is available now.
    // Only the images the model's stream options ask for are decoded.
    std::optional<typed_record> next();
    void heartbeat() { _coordinator.heartbeat(); }
    void move_to(const stream_position& position) { _coordinator.move_to(position); }
    stream_token token() const { return _coordinator.token(); }

    const model& get_model() const noexcept { return _model; }
    coordinator& get_coordinator() noexcept { return _coordinator; }
};

}

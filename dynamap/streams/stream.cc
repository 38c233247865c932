/*
 * Copyright 2024-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "dynamap/streams/stream.hh"

#include <fmt/format.h>

#include "dynamap/engine.hh"
#include "dynamap/error.hh"
#include "log.hh"

static logging::logger stlogger("dynamap-stream");

namespace dynamap::streams {

static const std::string& stream_arn_of(const model& m) {
    auto& opts = m.stream();
    if (!opts) {
        throw invalid_stream(fmt::format("model {} has no stream", m.name()));
    }
    if (opts->arn.empty()) {
        throw invalid_stream(fmt::format("the stream of model {} has no ARN; bind the model first", m.name()));
    }
    return opts->arn;
}

stream::stream(engine& e, const model& m, const stream_position& position)
    : _engine(e)
    , _model(m)
    , _coordinator(e.get_session(), stream_arn_of(m), e.config().calls_to_reach_head)
{
    stlogger.info("opening stream of {}", _model.name());
    _coordinator.move_to(position);
}

std::optional<typed_record> stream::next() {
    auto record = _coordinator.next();
    if (!record) {
        return std::nullopt;
    }
    auto& opts = *_model.stream();
    typed_record ret{.key = std::nullopt, .new_image = std::nullopt, .old_image = std::nullopt, .meta = record->meta};
    auto decode = [this] (std::optional<object>& target, const std::optional<rjson::copyable_value>& attrs,
            const std::vector<const column*>& expected) {
        if (!attrs) {
            return;
        }
        object obj(_model);
        _engine.unpack(obj, *attrs, expected);
        target.emplace(std::move(obj));
    };
    if (opts.keys) {
        decode(ret.key, record->key, _model.keys());
    }
    if (opts.new_image) {
        decode(ret.new_image, record->new_image, _model.columns());
    }
    if (opts.old_image) {
        decode(ret.old_image, record->old_image, _model.columns());
    }
    stlogger.trace("{} record {} of {}", record->meta.event.type, record->meta.sequence_number, _model.name());
    return ret;
}

}

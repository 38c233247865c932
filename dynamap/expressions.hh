/*
 * Copyright 2024-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once

#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

#include "dynamap/conditions.hh"
#include "dynamap/references.hh"
#include "dynamap/tracking.hh"

namespace dynamap {

// Turns condition trees, projections and pending object changes into the
// placeholder based expression strings of the wire protocol. One renderer
// serves one request: every expression it produces shares its reference
// tracker and therefore its attribute name and value maps.
class expression_renderer {
    const type_engine& _types;
    reference_tracker _refs;
    // Nodes currently being rendered, to reject cyclic trees.
    std::unordered_set<const condition::node*> _in_progress;
public:
    explicit expression_renderer(const type_engine& types);

    // Renders a condition. On failure every placeholder the condition had
    // allocated is released before the exception propagates, leaving the
    // tracker as it was before the call.
    std::string render_condition(const condition& c);

    std::string condition_expression(const condition& c) { return render_condition(c); }
    std::string filter_expression(const condition& c) { return render_condition(c); }
    std::string key_expression(const condition& c) { return render_condition(c); }
    std::string projection_expression(const std::vector<const column*>& columns);
    // Renders the pending changes of obj's marked non-key columns. Returns
    // an empty string when there is nothing to update.
    std::string update_expression(const object& obj, const tracking_table& tracking);

    const reference_tracker& refs() const noexcept { return _refs; }
    // Adds ExpressionAttributeNames / ExpressionAttributeValues to request
    // when they are not empty.
    void add_attribute_maps(rjson::value& request) const;
private:
    std::string render(const condition& c, std::vector<reference>& allocated);
    reference render_operand(const attribute_path& path, const operand& o, std::vector<reference>& allocated,
            bool element_of_path = false);
    reference name(const attribute_path& path, std::vector<reference>& allocated);
};

// Which expressions to render for one request.
struct render_request {
    condition filter;
    std::optional<std::vector<const column*>> projection;
    condition key;
    condition conditional;
    // AND the object's tracking snapshot into the condition
    bool atomic = false;
    bool update = false;
    const object* obj = nullptr;
};

// Renders every requested expression into one JSON object holding only the
// requested expression keys plus the non-empty attribute maps.
rjson::value render(const type_engine& types, tracking_table& tracking, const render_request& req);

}

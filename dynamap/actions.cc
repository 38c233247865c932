/*
 * Copyright 2024-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "dynamap/actions.hh"

namespace dynamap {

std::ostream& operator<<(std::ostream& os, action_type type) {
    switch (type) {
        case action_type::set: os << "SET"; break;
        case action_type::remove: os << "REMOVE"; break;
        case action_type::add: os << "ADD"; break;
        case action_type::del: os << "DELETE"; break;
        default: throw std::logic_error(std::to_string(int(type)));
    }
    return os;
}

}

/*
 * Copyright 2024-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "dynamap/session.hh"

#include <stdexcept>

namespace dynamap {

std::ostream& operator<<(std::ostream& os, shard_iterator_type type) {
    switch (type) {
        case shard_iterator_type::at_sequence: os << "AT_SEQUENCE_NUMBER"; break;
        case shard_iterator_type::after_sequence: os << "AFTER_SEQUENCE_NUMBER"; break;
        case shard_iterator_type::trim_horizon: os << "TRIM_HORIZON"; break;
        case shard_iterator_type::latest: os << "LATEST"; break;
        default: throw std::logic_error(std::to_string(int(type)));
    }
    return os;
}

std::istream& operator>>(std::istream& is, shard_iterator_type& type) {
    std::string s;
    is >> s;
    if (s == "AT_SEQUENCE_NUMBER") {
        type = shard_iterator_type::at_sequence;
    } else if (s == "AFTER_SEQUENCE_NUMBER") {
        type = shard_iterator_type::after_sequence;
    } else if (s == "TRIM_HORIZON") {
        type = shard_iterator_type::trim_horizon;
    } else if (s == "LATEST") {
        type = shard_iterator_type::latest;
    } else {
        throw std::invalid_argument(s);
    }
    return is;
}

}

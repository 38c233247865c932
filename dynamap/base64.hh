/*
 * Copyright 2024-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once

#include <string>
#include <string_view>

namespace dynamap {

std::string base64_encode(std::string_view);
// Throws std::invalid_argument on characters outside the base64 alphabet.
std::string base64_decode(std::string_view);

size_t base64_decoded_len(std::string_view str);

}

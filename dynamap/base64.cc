/*
 * Copyright 2024-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

// Binary attribute values travel as base64-encoded strings in the "B" and
// "BS" wire tags. This is code to convert byte strings to base64, and back.

#include "dynamap/base64.hh"

#include <cstdint>
#include <stdexcept>
#include <fmt/format.h>

namespace dynamap {

// Arrays for quickly converting to and from an integer between 0 and 63,
// and the character used in base64 encoding to represent it.
static class base64_chars {
public:
    static constexpr const char to[] =
            "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
    int8_t from[256];
    base64_chars() {
        static_assert(sizeof(to) == 64 + 1);
        for (int i = 0; i < 256; i++) {
            from[i] = -1; // signal invalid character
        }
        for (int i = 0; i < 64; i++) {
            from[(unsigned char) to[i]] = i;
        }
    }
} base64_chars;

std::string base64_encode(std::string_view in) {
    std::string ret;
    ret.reserve(((4 * in.size() / 3) + 3) & ~3);
    int i = 0;
    unsigned char chunk3[3]; // chunk of input
    for (unsigned char byte : in) {
        chunk3[i++] = byte;
        if (i == 3) {
            ret += base64_chars.to[ (chunk3[0] & 0xfc) >> 2 ];
            ret += base64_chars.to[ ((chunk3[0] & 0x03) << 4) + ((chunk3[1] & 0xf0) >> 4) ];
            ret += base64_chars.to[ ((chunk3[1] & 0x0f) << 2) + ((chunk3[2] & 0xc0) >> 6) ];
            ret += base64_chars.to[ chunk3[2] & 0x3f ];
            i = 0;
        }
    }
    if (i) {
        // i can be 1 or 2.
        for (int j = i; j < 3; j++) {
            chunk3[j] = '\0';
        }
        ret += base64_chars.to[ (chunk3[0] & 0xfc) >> 2 ];
        ret += base64_chars.to[ ((chunk3[0] & 0x03) << 4) + ((chunk3[1] & 0xf0) >> 4) ];
        if (i == 2) {
            ret += base64_chars.to[ ((chunk3[1] & 0x0f) << 2) + ((chunk3[2] & 0xc0) >> 6) ];
        } else {
            ret += '=';
        }
        ret += '=';
    }
    return ret;
}

static size_t base64_padding_len(std::string_view str) {
    size_t padding = 0;
    padding += (!str.empty() && str.back() == '=');
    padding += (str.size() > 1 && *(str.end() - 2) == '=');
    return padding;
}

std::string base64_decode(std::string_view in) {
    size_t padding = base64_padding_len(in);
    in.remove_suffix(padding);
    int i = 0;
    int8_t chunk4[4]; // chunk of input, each byte converted to 0..63;
    std::string ret;
    ret.reserve(in.size() * 3 / 4);
    for (unsigned char c : in) {
        int8_t dc = base64_chars.from[c];
        if (dc < 0) {
            throw std::invalid_argument(fmt::format("invalid base64 character {:#x}", unsigned(c)));
        }
        chunk4[i++] = dc;
        if (i == 4) {
            ret += char((chunk4[0] << 2) + ((chunk4[1] & 0x30) >> 4));
            ret += char(((chunk4[1] & 0xf) << 4) + ((chunk4[2] & 0x3c) >> 2));
            ret += char(((chunk4[2] & 0x3) << 6) + chunk4[3]);
            i = 0;
        }
    }
    if (i) {
        // i can be 2 or 3, meaning 1 or 2 more output characters
        if (i >= 2) {
            ret += char((chunk4[0] << 2) + ((chunk4[1] & 0x30) >> 4));
        }
        if (i == 3) {
            ret += char(((chunk4[1] & 0xf) << 4) + ((chunk4[2] & 0x3c) >> 2));
        }
    }
    return ret;
}

size_t base64_decoded_len(std::string_view str) {
    return str.size() / 4 * 3 - base64_padding_len(str);
}

}

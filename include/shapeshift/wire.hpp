/*
    Copyright (c) 2015 Evgeny Safronov <division494@gmail.com>
    Copyright (c) 2011-2015 Other contributors as noted in the AUTHORS file.
    This file is part of ShapeShift.
    ShapeShift is free software; you can redistribute it and/or modify
    it under the terms of the GNU Lesser General Public License as published by
    the Free Software Foundation; either version 3 of the License, or
    (at your option) any later version.
    ShapeShift is distributed in the hope that it will be useful,
    but WITHOUT ANY WARRANTY; without even the implied warranty of
    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
    GNU Lesser General Public License for more details.
    You should have received a copy of the GNU Lesser General Public License
    along with this program. If not, see <http://www.gnu.org/licenses/>.
*/

#pragma once

#include <cstdint>

namespace shapeshift {

/// MessagePack marker bytes.
namespace code {

const std::uint8_t min_fixint = 0x00;
const std::uint8_t max_fixint = 0x7f;
const std::uint8_t min_fixmap = 0x80;
const std::uint8_t max_fixmap = 0x8f;
const std::uint8_t min_fixarray = 0x90;
const std::uint8_t max_fixarray = 0x9f;
const std::uint8_t min_fixstr = 0xa0;
const std::uint8_t max_fixstr = 0xbf;
const std::uint8_t nil = 0xc0;
const std::uint8_t never_used = 0xc1;
const std::uint8_t false_value = 0xc2;
const std::uint8_t true_value = 0xc3;
const std::uint8_t bin8 = 0xc4;
const std::uint8_t bin16 = 0xc5;
const std::uint8_t bin32 = 0xc6;
const std::uint8_t ext8 = 0xc7;
const std::uint8_t ext16 = 0xc8;
const std::uint8_t ext32 = 0xc9;
const std::uint8_t float32 = 0xca;
const std::uint8_t float64 = 0xcb;
const std::uint8_t uint8 = 0xcc;
const std::uint8_t uint16 = 0xcd;
const std::uint8_t uint32 = 0xce;
const std::uint8_t uint64 = 0xcf;
const std::uint8_t int8 = 0xd0;
const std::uint8_t int16 = 0xd1;
const std::uint8_t int32 = 0xd2;
const std::uint8_t int64 = 0xd3;
const std::uint8_t fixext1 = 0xd4;
const std::uint8_t fixext2 = 0xd5;
const std::uint8_t fixext4 = 0xd6;
const std::uint8_t fixext8 = 0xd7;
const std::uint8_t fixext16 = 0xd8;
const std::uint8_t str8 = 0xd9;
const std::uint8_t str16 = 0xda;
const std::uint8_t str32 = 0xdb;
const std::uint8_t array16 = 0xdc;
const std::uint8_t array32 = 0xdd;
const std::uint8_t map16 = 0xde;
const std::uint8_t map32 = 0xdf;
const std::uint8_t min_negative_fixint = 0xe0;
const std::uint8_t max_negative_fixint = 0xff;

inline bool is_positive_fixint(std::uint8_t c) { return c <= max_fixint; }
inline bool is_negative_fixint(std::uint8_t c) { return c >= min_negative_fixint; }
inline bool is_fixmap(std::uint8_t c) { return c >= min_fixmap && c <= max_fixmap; }
inline bool is_fixarray(std::uint8_t c) { return c >= min_fixarray && c <= max_fixarray; }
inline bool is_fixstr(std::uint8_t c) { return c >= min_fixstr && c <= max_fixstr; }

} // namespace code

/// Extension type codes reserved by the format.
namespace extension {

const std::int8_t timestamp = -1;

} // namespace extension

/// Broad category of a token, as determined by its marker byte.
enum class token_type {
    unknown,
    nil,
    boolean,
    integer,
    floating,
    string,
    binary,
    array,
    map,
    extension
};

token_type
to_token_type(std::uint8_t code);

/// Human readable name of a token type, used in diagnostics.
const char*
describe(token_type type);

/// Outcome of a non-throwing decode attempt.
enum class decode_result {
    /// The token was decoded and consumed.
    success,
    /// The next token has another type. Nothing was consumed.
    token_mismatch,
    /// The token may be decodable once more bytes arrive. Nothing was consumed.
    insufficient_data,
    /// No more bytes will ever arrive and the token is incomplete. Nothing was consumed.
    end_of_stream
};

const char*
describe(decode_result result);

/// Object encoding selected by the serializer options.
enum class object_layout {
    map,
    array
};

/// Extension token header.
struct extension_header_t {
    std::int8_t type;
    std::uint32_t length;

    extension_header_t() :
        type(0),
        length(0)
    {}

    extension_header_t(std::int8_t type, std::uint32_t length) :
        type(type),
        length(length)
    {}
};

inline
bool
operator==(const extension_header_t& lhs, const extension_header_t& rhs) {
    return lhs.type == rhs.type && lhs.length == rhs.length;
}

} // namespace shapeshift

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

#include "shapeshift/wire.hpp"

namespace shapeshift {

token_type
to_token_type(std::uint8_t c) {
    if (code::is_positive_fixint(c) || code::is_negative_fixint(c)) {
        return token_type::integer;
    }

    if (code::is_fixmap(c)) {
        return token_type::map;
    }

    if (code::is_fixarray(c)) {
        return token_type::array;
    }

    if (code::is_fixstr(c)) {
        return token_type::string;
    }

    switch (c) {
    case code::nil:
        return token_type::nil;
    case code::false_value:
    case code::true_value:
        return token_type::boolean;
    case code::bin8:
    case code::bin16:
    case code::bin32:
        return token_type::binary;
    case code::ext8:
    case code::ext16:
    case code::ext32:
    case code::fixext1:
    case code::fixext2:
    case code::fixext4:
    case code::fixext8:
    case code::fixext16:
        return token_type::extension;
    case code::float32:
    case code::float64:
        return token_type::floating;
    case code::uint8:
    case code::uint16:
    case code::uint32:
    case code::uint64:
    case code::int8:
    case code::int16:
    case code::int32:
    case code::int64:
        return token_type::integer;
    case code::str8:
    case code::str16:
    case code::str32:
        return token_type::string;
    case code::array16:
    case code::array32:
        return token_type::array;
    case code::map16:
    case code::map32:
        return token_type::map;
    default:
        return token_type::unknown;
    }
}

const char*
describe(token_type type) {
    switch (type) {
    case token_type::nil:
        return "nil";
    case token_type::boolean:
        return "boolean";
    case token_type::integer:
        return "integer";
    case token_type::floating:
        return "float";
    case token_type::string:
        return "string";
    case token_type::binary:
        return "binary";
    case token_type::array:
        return "array";
    case token_type::map:
        return "map";
    case token_type::extension:
        return "extension";
    default:
        return "unknown";
    }
}

const char*
describe(decode_result result) {
    switch (result) {
    case decode_result::success:
        return "success";
    case decode_result::token_mismatch:
        return "token mismatch";
    case decode_result::insufficient_data:
        return "insufficient data";
    case decode_result::end_of_stream:
        return "end of stream";
    default:
        return "unknown";
    }
}

} // namespace shapeshift

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

#include "shapeshift/reader.hpp"

#include "shapeshift/context.hpp"

using namespace shapeshift;

reader_t::reader_t(const sequence_t& sequence, object_layout layout) :
    impl(sequence, true, layout)
{}

reader_t::reader_t(const cursor_t& cursor, object_layout layout) :
    impl(cursor, true, layout)
{}

void
reader_t::check(decode_result result, const char* expected) const {
    switch (result) {
    case decode_result::success:
        return;
    case decode_result::token_mismatch:
        throw unexpected_token_error(peek_code(), position(), expected);
    default:
        if (remaining() == 0) {
            throw end_of_stream_error(position());
        }
        throw insufficient_data_error(position());
    }
}

std::uint8_t
reader_t::peek_code() const {
    std::uint8_t code = 0;
    if (impl.try_peek_code(code) != decode_result::success) {
        throw end_of_stream_error(position());
    }

    return code;
}

token_type
reader_t::peek_type() const {
    return to_token_type(peek_code());
}

bool
reader_t::is_nil() const {
    std::uint8_t code = 0;
    return impl.try_peek_code(code) == decode_result::success && code == code::nil;
}

bool
reader_t::try_read_nil() {
    return impl.try_read_nil() == decode_result::success;
}

void
reader_t::read_nil() {
    check(impl.try_read_nil(), "nil");
}

bool
reader_t::read_bool() {
    bool value = false;
    check(impl.try_read(value), "boolean");
    return value;
}

float
reader_t::read_float() {
    float value = 0;
    check(impl.try_read(value), "float");
    return value;
}

double
reader_t::read_double() {
    double value = 0;
    check(impl.try_read(value), "float");
    return value;
}

std::string
reader_t::read_string() {
    std::string value;
    check(impl.try_read(value), "string");
    return value;
}

sequence_t
reader_t::read_string_sequence() {
    sequence_t value;
    check(impl.try_read_string(value), "string");
    return value;
}

bool
reader_t::try_read_string_span(const char*& data, std::size_t& size) {
    streaming_reader_t probe(impl);

    sequence_t value;
    check(probe.try_read_string(value), "string");

    if (!value.contiguous()) {
        return false;
    }

    if (value.empty()) {
        data = "";
        size = 0;
    } else {
        data = static_cast<const char*>(value.segments().front().data());
        size = value.size();
    }

    impl = probe;
    return true;
}

std::uint32_t
reader_t::read_string_header() {
    std::uint32_t length = 0;
    check(impl.try_read_string_header(length), "string");
    return length;
}

std::vector<char>
reader_t::read_binary() {
    std::vector<char> value;
    check(impl.try_read_binary(value), "binary");
    return value;
}

sequence_t
reader_t::read_binary_sequence() {
    sequence_t value;
    check(impl.try_read_binary(value), "binary");
    return value;
}

std::uint32_t
reader_t::read_binary_header() {
    std::uint32_t length = 0;
    check(impl.try_read_binary_header(length), "binary");
    return length;
}

std::uint32_t
reader_t::read_array_header() {
    std::uint32_t count = 0;
    check(impl.try_read_array_header(count), "array");
    return count;
}

std::uint32_t
reader_t::read_map_header() {
    std::uint32_t count = 0;
    check(impl.try_read_map_header(count), "map");
    return count;
}

extension_header_t
reader_t::read_extension_header() {
    extension_header_t header;
    check(impl.try_read_extension_header(header), "extension");
    return header;
}

timestamp_t
reader_t::read_timestamp() {
    timestamp_t value;
    check(impl.try_read(value), "timestamp");
    return value;
}

std::chrono::system_clock::time_point
reader_t::read_time_point() {
    std::chrono::system_clock::time_point value;
    check(impl.try_read(value), "timestamp");
    return value;
}

sequence_t
reader_t::read_raw(std::size_t length) {
    sequence_t value;
    check(impl.try_read_raw(length, value), "raw bytes");
    return value;
}

void
reader_t::skip_raw(std::size_t length) {
    check(impl.try_skip_raw(length), "raw bytes");
}

sequence_t
reader_t::read_raw_structure(context_t& context) {
    sequence_t value;
    check(impl.try_read_raw_structure(context, value), "any token");
    return value;
}

void
reader_t::skip(context_t& context) {
    streaming_reader_t probe(impl.cursor(), true, impl.layout());
    check(probe.try_skip(context), "any token");
    impl = probe;
}

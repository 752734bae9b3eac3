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

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <type_traits>
#include <vector>

#include "shapeshift/error.hpp"
#include "shapeshift/forwards.hpp"
#include "shapeshift/sequence.hpp"
#include "shapeshift/streaming_reader.hpp"
#include "shapeshift/wire.hpp"

namespace shapeshift {

/*!
 * Synchronous MessagePack reader over a complete buffer.
 *
 * Every read either consumes a whole token or throws, leaving the position untouched:
 * - end_of_stream_error when there are no more bytes;
 * - insufficient_data_error when the token is truncated;
 * - unexpected_token_error when the token has another type;
 * - overflow_error when an integer does not fit into the requested type.
 *
 * Readers are cheap to copy, a copy being a checkpoint of the current position.
 *
 * \warning the sequence must outlive the reader.
 */
class reader_t {
    streaming_reader_t impl;

public:
    explicit reader_t(const sequence_t& sequence, object_layout layout = object_layout::map);
    explicit reader_t(const cursor_t& cursor, object_layout layout = object_layout::map);

    const cursor_t&
    cursor() const {
        return impl.cursor();
    }

    std::size_t
    position() const {
        return impl.position();
    }

    std::size_t
    remaining() const {
        return impl.remaining();
    }

    bool
    end() const {
        return impl.remaining() == 0;
    }

    object_layout
    layout() const {
        return impl.layout();
    }

    std::uint8_t
    peek_code() const;

    token_type
    peek_type() const;

    bool
    is_nil() const;

    /// Consumes nil if it is the next token.
    bool
    try_read_nil();

    void
    read_nil();

    bool
    read_bool();

    template<typename T>
    typename std::enable_if<std::is_integral<T>::value && !std::is_same<T, bool>::value, T>::type
    read_integer() {
        T value = 0;
        check(impl.try_read(value), "integer");
        return value;
    }

    float
    read_float();

    double
    read_double();

    std::string
    read_string();

    /// Returns the string payload without copying it.
    sequence_t
    read_string_sequence();

    /// Returns the string payload as a contiguous span if it does not cross segment boundaries.
    ///
    /// Returns false without consuming anything if the payload is fragmented.
    bool
    try_read_string_span(const char*& data, std::size_t& size);

    std::uint32_t
    read_string_header();

    std::vector<char>
    read_binary();

    sequence_t
    read_binary_sequence();

    std::uint32_t
    read_binary_header();

    std::uint32_t
    read_array_header();

    std::uint32_t
    read_map_header();

    extension_header_t
    read_extension_header();

    timestamp_t
    read_timestamp();

    std::chrono::system_clock::time_point
    read_time_point();

    /// Consumes the given number of raw bytes.
    sequence_t
    read_raw(std::size_t length);

    /// Consumes the given number of raw bytes without looking at them.
    void
    skip_raw(std::size_t length);

    /// Consumes the next whole structure, returning its encoded bytes.
    sequence_t
    read_raw_structure(context_t& context);

    /// Skips the next structure, including everything nested in it.
    void
    skip(context_t& context);

private:
    void
    check(decode_result result, const char* expected) const;
};

} // namespace shapeshift

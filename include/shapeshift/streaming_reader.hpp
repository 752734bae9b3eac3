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
#include <typeinfo>
#include <vector>

#include "shapeshift/error.hpp"
#include "shapeshift/forwards.hpp"
#include "shapeshift/primitives.hpp"
#include "shapeshift/sequence.hpp"
#include "shapeshift/wire.hpp"

namespace shapeshift {

/// Progress of an interrupted skip.
struct skip_state_t {
    /// Number of structures left to skip at each nesting level, the innermost last.
    std::vector<std::uint64_t> pending;

    bool
    empty() const {
        return pending.empty();
    }
};

/*!
 * Non-throwing reader over a possibly incomplete buffer.
 *
 * Every `try_*` operation either consumes a whole token and returns `decode_result::success`, or
 * leaves the reader exactly where it was. When the buffer ends in the middle of a token the result
 * is `decode_result::insufficient_data`, unless the buffer is known to be the whole remaining
 * stream, in which case it is `decode_result::end_of_stream`.
 *
 * The only exception is `try_skip`, which keeps the progress over already skipped tokens in its
 * skip state, so that a retry over a larger buffer resumes instead of starting over.
 *
 * Malformed input that can never become valid, such as an integer overflowing the requested type,
 * is still reported by exceptions.
 *
 * \warning the sequence must outlive the reader.
 */
class streaming_reader_t {
    cursor_t cursor_;
    bool eof_;
    object_layout layout_;
    skip_state_t skip_;

public:
    streaming_reader_t(const sequence_t& sequence, bool eof, object_layout layout = object_layout::map);

    streaming_reader_t(const cursor_t& cursor, bool eof, object_layout layout = object_layout::map);

    /// Resumes after an interrupted skip. The cursor must be positioned where the previous reader stopped.
    streaming_reader_t(const cursor_t& cursor, bool eof, const skip_state_t& state,
                       object_layout layout = object_layout::map);

    const cursor_t&
    cursor() const {
        return cursor_;
    }

    std::size_t
    position() const {
        return cursor_.position();
    }

    std::size_t
    remaining() const {
        return cursor_.remaining();
    }

    /// Whether no more bytes will follow the buffer this reader has.
    bool
    eof() const {
        return eof_;
    }

    object_layout
    layout() const {
        return layout_;
    }

    const skip_state_t&
    skip_state() const {
        return skip_;
    }

    decode_result
    try_peek_code(std::uint8_t& code) const;

    decode_result
    try_peek_type(token_type& type) const;

    /// Consumes nil, returning `token_mismatch` for any other token.
    decode_result
    try_read_nil();

    decode_result
    try_read(bool& value);

    /// \throw overflow_error when the integer does not fit into T.
    template<typename T>
    typename std::enable_if<std::is_integral<T>::value && !std::is_same<T, bool>::value, decode_result>::type
    try_read(T& value) {
        integer_t integer;
        const cursor_t origin = cursor_;
        const decode_result result = try_read(integer);

        if (result == decode_result::success && !narrow(integer, value)) {
            cursor_ = origin;
            throw overflow_error(origin.position(), typeid(T).name());
        }

        return result;
    }

    decode_result
    try_read(integer_t& value);

    decode_result
    try_read(float& value);

    decode_result
    try_read(double& value);

    /// \throw protocol_error when the string is not valid UTF-8.
    decode_result
    try_read(std::string& value);

    decode_result
    try_read(timestamp_t& value);

    /// \throw overflow_error when the timestamp is out of range of the system clock.
    decode_result
    try_read(std::chrono::system_clock::time_point& value);

    decode_result
    try_read_string_header(std::uint32_t& length);

    /// Reads the payload of a string without copying it.
    decode_result
    try_read_string(sequence_t& value);

    decode_result
    try_read_binary(std::vector<char>& value);

    decode_result
    try_read_binary(sequence_t& value);

    decode_result
    try_read_binary_header(std::uint32_t& length);

    decode_result
    try_read_array_header(std::uint32_t& count);

    decode_result
    try_read_map_header(std::uint32_t& count);

    decode_result
    try_read_extension_header(extension_header_t& header);

    /// Consumes the given number of raw bytes.
    decode_result
    try_read_raw(std::size_t length, sequence_t& value);

    /// Consumes the given number of raw bytes without looking at them.
    decode_result
    try_skip_raw(std::size_t length);

    /// Skips the next structure, including everything nested in it.
    ///
    /// Resumes an interrupted skip when the skip state is not empty.
    ///
    /// \throw depth_exceeded_error when the nesting goes beyond the context limit.
    decode_result
    try_skip(context_t& context);

    /// Consumes the next whole structure, returning its encoded bytes.
    decode_result
    try_read_raw_structure(context_t& context, sequence_t& value);

private:
    /// Maps a primitive decoder shortage to the stream state.
    decode_result
    shortage() const {
        return eof_ ? decode_result::end_of_stream : decode_result::insufficient_data;
    }

    template<class T>
    decode_result
    decode(decode_result (*decoder)(const char*, std::size_t, T&, std::size_t&), T& value);

    decode_result
    read_payload(decode_result header, std::uint32_t length, sequence_t& value, cursor_t& origin);
};

} // namespace shapeshift

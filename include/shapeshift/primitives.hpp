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
#include <limits>
#include <type_traits>

#include "shapeshift/wire.hpp"

/// Stateless encoding and decoding of single tokens over contiguous memory.
///
/// Decoders never throw. They return `decode_result::insufficient_data` when the buffer ends before
/// the token does, and `decode_result::token_mismatch` when the marker byte belongs to another
/// type. Nothing is consumed unless the result is a success.
///
/// Encoders write the shortest representation into the given memory, which must have at least
/// `max_header_size` (or `max_timestamp_size`) bytes available, and return the number of bytes
/// written.

namespace shapeshift {

/// Decoded integer of any wire width.
struct integer_t {
    /// Set for values below zero, in which case `bits` holds the two's complement representation.
    bool negative;
    std::uint64_t bits;

    integer_t() :
        negative(false),
        bits(0)
    {}
};

/// Narrows the decoded integer, returning false when it does not fit.
template<typename T>
inline
bool
narrow(const integer_t& value, T& result) {
    static_assert(std::is_integral<T>::value, "integral type required");

    if (value.negative) {
        if (!std::is_signed<T>::value) {
            return false;
        }

        const std::int64_t signed_value = static_cast<std::int64_t>(value.bits);
        if (signed_value < static_cast<std::int64_t>(std::numeric_limits<T>::min())) {
            return false;
        }

        result = static_cast<T>(signed_value);
        return true;
    }

    if (value.bits > static_cast<std::uint64_t>(std::numeric_limits<T>::max())) {
        return false;
    }

    result = static_cast<T>(value.bits);
    return true;
}

/// Timestamp extension value: seconds since the epoch and a nanosecond adjustment.
struct timestamp_t {
    std::int64_t seconds;
    std::uint32_t nanoseconds;

    timestamp_t() :
        seconds(0),
        nanoseconds(0)
    {}

    timestamp_t(std::int64_t seconds, std::uint32_t nanoseconds) :
        seconds(seconds),
        nanoseconds(nanoseconds)
    {}

    static
    timestamp_t
    from_time_point(const std::chrono::system_clock::time_point& time);

    /// Whether the value fits into the range of the system clock.
    bool
    representable() const;

    /// \throw overflow_error when the value is not representable.
    std::chrono::system_clock::time_point
    to_time_point() const;
};

inline
bool
operator==(const timestamp_t& lhs, const timestamp_t& rhs) {
    return lhs.seconds == rhs.seconds && lhs.nanoseconds == rhs.nanoseconds;
}

namespace primitives {

/// Largest encoded size of a token header or a scalar.
const std::size_t max_header_size = 9;

/// Largest encoded size of a timestamp, including its extension header.
const std::size_t max_timestamp_size = 15;

/// Total size of the token header starting at the given marker, which is known without reading
/// further bytes. Returns zero for the never-used marker.
std::size_t
header_size(std::uint8_t code);

decode_result
try_read_nil(const char* data, std::size_t size, std::size_t& consumed);

decode_result
try_read(const char* data, std::size_t size, bool& value, std::size_t& consumed);

decode_result
try_read(const char* data, std::size_t size, integer_t& value, std::size_t& consumed);

/// Accepts both float forms, and integers as well. Doubles are narrowed.
decode_result
try_read(const char* data, std::size_t size, float& value, std::size_t& consumed);

/// Accepts both float forms, and integers as well.
decode_result
try_read(const char* data, std::size_t size, double& value, std::size_t& consumed);

decode_result
try_read_string_header(const char* data, std::size_t size, std::uint32_t& length, std::size_t& consumed);

decode_result
try_read_binary_header(const char* data, std::size_t size, std::uint32_t& length, std::size_t& consumed);

decode_result
try_read_array_header(const char* data, std::size_t size, std::uint32_t& count, std::size_t& consumed);

decode_result
try_read_map_header(const char* data, std::size_t size, std::uint32_t& count, std::size_t& consumed);

decode_result
try_read_extension_header(const char* data, std::size_t size, extension_header_t& header, std::size_t& consumed);

/// Decodes the whole timestamp extension, both its header and payload.
decode_result
try_read(const char* data, std::size_t size, timestamp_t& value, std::size_t& consumed);

std::size_t
write_nil(char* data);

std::size_t
write(char* data, bool value);

std::size_t
write(char* data, std::int64_t value);

std::size_t
write(char* data, std::uint64_t value);

std::size_t
write(char* data, float value);

std::size_t
write(char* data, double value);

std::size_t
write_string_header(char* data, std::uint32_t length);

std::size_t
write_binary_header(char* data, std::uint32_t length);

std::size_t
write_array_header(char* data, std::uint32_t count);

std::size_t
write_map_header(char* data, std::uint32_t count);

std::size_t
write_extension_header(char* data, const extension_header_t& header);

/// Writes the shortest of the 32, 64 and 96-bit timestamp forms.
std::size_t
write(char* data, const timestamp_t& value);

} // namespace primitives

} // namespace shapeshift

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

#include "shapeshift/primitives.hpp"

#include "shapeshift/error.hpp"

#include "shapeshift/detail/endian.hpp"

using namespace shapeshift;
using namespace shapeshift::detail;

namespace {

/// Reads a big-endian length prefix of the given width following the marker.
decode_result
read_length(const char* data, std::size_t size, std::size_t width, std::uint32_t& length, std::size_t& consumed) {
    if (size < 1 + width) {
        return decode_result::insufficient_data;
    }

    switch (width) {
    case 1:
        length = load8(data + 1);
        break;
    case 2:
        length = load16(data + 1);
        break;
    default:
        length = load32(data + 1);
        break;
    }

    consumed = 1 + width;
    return decode_result::success;
}

} // namespace

timestamp_t
timestamp_t::from_time_point(const std::chrono::system_clock::time_point& time) {
    const std::int64_t ns = std::chrono::duration_cast<std::chrono::nanoseconds>(time.time_since_epoch()).count();

    std::int64_t seconds = ns / 1000000000;
    std::int64_t rest = ns % 1000000000;
    if (rest < 0) {
        seconds -= 1;
        rest += 1000000000;
    }

    return timestamp_t(seconds, static_cast<std::uint32_t>(rest));
}

bool
timestamp_t::representable() const {
    typedef std::chrono::system_clock::duration duration_type;

    // Truncation towards zero keeps both bounds inside the clock range, the upper one is exclusive
    // to leave room for the nanoseconds part.
    const std::int64_t max = std::chrono::duration_cast<std::chrono::seconds>(duration_type::max()).count();
    const std::int64_t min = std::chrono::duration_cast<std::chrono::seconds>(duration_type::min()).count();

    return seconds >= min && seconds < max;
}

std::chrono::system_clock::time_point
timestamp_t::to_time_point() const {
    typedef std::chrono::system_clock::duration duration_type;

    if (!representable()) {
        throw overflow_error(0, "std::chrono::system_clock::time_point");
    }

    return std::chrono::system_clock::time_point(
        std::chrono::duration_cast<duration_type>(std::chrono::seconds(seconds)) +
        std::chrono::duration_cast<duration_type>(std::chrono::nanoseconds(nanoseconds))
    );
}

std::size_t
primitives::header_size(std::uint8_t c) {
    if (code::is_positive_fixint(c) || code::is_negative_fixint(c) ||
        code::is_fixmap(c) || code::is_fixarray(c) || code::is_fixstr(c))
    {
        return 1;
    }

    switch (c) {
    case code::nil:
    case code::false_value:
    case code::true_value:
        return 1;
    case code::uint8:
    case code::int8:
    case code::bin8:
    case code::str8:
    case code::fixext1:
    case code::fixext2:
    case code::fixext4:
    case code::fixext8:
    case code::fixext16:
        return 2;
    case code::uint16:
    case code::int16:
    case code::bin16:
    case code::str16:
    case code::array16:
    case code::map16:
    case code::ext8:
        return 3;
    case code::ext16:
        return 4;
    case code::uint32:
    case code::int32:
    case code::float32:
    case code::bin32:
    case code::str32:
    case code::array32:
    case code::map32:
        return 5;
    case code::ext32:
        return 6;
    case code::uint64:
    case code::int64:
    case code::float64:
        return 9;
    default:
        return 0;
    }
}

decode_result
primitives::try_read_nil(const char* data, std::size_t size, std::size_t& consumed) {
    if (size == 0) {
        return decode_result::insufficient_data;
    }

    if (load8(data) != code::nil) {
        return decode_result::token_mismatch;
    }

    consumed = 1;
    return decode_result::success;
}

decode_result
primitives::try_read(const char* data, std::size_t size, bool& value, std::size_t& consumed) {
    if (size == 0) {
        return decode_result::insufficient_data;
    }

    switch (load8(data)) {
    case code::false_value:
        value = false;
        break;
    case code::true_value:
        value = true;
        break;
    default:
        return decode_result::token_mismatch;
    }

    consumed = 1;
    return decode_result::success;
}

decode_result
primitives::try_read(const char* data, std::size_t size, integer_t& value, std::size_t& consumed) {
    if (size == 0) {
        return decode_result::insufficient_data;
    }

    const std::uint8_t c = load8(data);

    if (code::is_positive_fixint(c)) {
        value.negative = false;
        value.bits = c;
        consumed = 1;
        return decode_result::success;
    }

    if (code::is_negative_fixint(c)) {
        value.negative = true;
        value.bits = static_cast<std::uint64_t>(static_cast<std::int64_t>(static_cast<std::int8_t>(c)));
        consumed = 1;
        return decode_result::success;
    }

    std::int64_t signed_value = 0;
    bool is_signed = false;

    switch (c) {
    case code::uint8:
    case code::uint16:
    case code::uint32:
    case code::uint64:
    case code::int8:
    case code::int16:
    case code::int32:
    case code::int64:
        break;
    default:
        return decode_result::token_mismatch;
    }

    const std::size_t total = header_size(c);
    if (size < total) {
        return decode_result::insufficient_data;
    }

    switch (c) {
    case code::uint8:
        value.bits = load8(data + 1);
        break;
    case code::uint16:
        value.bits = load16(data + 1);
        break;
    case code::uint32:
        value.bits = load32(data + 1);
        break;
    case code::uint64:
        value.bits = load64(data + 1);
        break;
    case code::int8:
        is_signed = true;
        signed_value = static_cast<std::int8_t>(load8(data + 1));
        break;
    case code::int16:
        is_signed = true;
        signed_value = static_cast<std::int16_t>(load16(data + 1));
        break;
    case code::int32:
        is_signed = true;
        signed_value = static_cast<std::int32_t>(load32(data + 1));
        break;
    default:
        is_signed = true;
        signed_value = static_cast<std::int64_t>(load64(data + 1));
        break;
    }

    if (is_signed) {
        value.negative = signed_value < 0;
        value.bits = static_cast<std::uint64_t>(signed_value);
    } else {
        value.negative = false;
    }

    consumed = total;
    return decode_result::success;
}

decode_result
primitives::try_read(const char* data, std::size_t size, double& value, std::size_t& consumed) {
    if (size == 0) {
        return decode_result::insufficient_data;
    }

    const std::uint8_t c = load8(data);

    if (c == code::float32 || c == code::float64) {
        const std::size_t total = header_size(c);
        if (size < total) {
            return decode_result::insufficient_data;
        }

        value = c == code::float32 ? load_float(data + 1) : load_double(data + 1);
        consumed = total;
        return decode_result::success;
    }

    integer_t integer;
    const decode_result result = try_read(data, size, integer, consumed);
    if (result != decode_result::success) {
        return result;
    }

    if (integer.negative) {
        value = static_cast<double>(static_cast<std::int64_t>(integer.bits));
    } else {
        value = static_cast<double>(integer.bits);
    }

    return decode_result::success;
}

decode_result
primitives::try_read(const char* data, std::size_t size, float& value, std::size_t& consumed) {
    double wide;
    const decode_result result = try_read(data, size, wide, consumed);
    if (result == decode_result::success) {
        value = static_cast<float>(wide);
    }

    return result;
}

decode_result
primitives::try_read_string_header(const char* data, std::size_t size, std::uint32_t& length, std::size_t& consumed) {
    if (size == 0) {
        return decode_result::insufficient_data;
    }

    const std::uint8_t c = load8(data);

    if (code::is_fixstr(c)) {
        length = c & 0x1f;
        consumed = 1;
        return decode_result::success;
    }

    switch (c) {
    case code::str8:
        return read_length(data, size, 1, length, consumed);
    case code::str16:
        return read_length(data, size, 2, length, consumed);
    case code::str32:
        return read_length(data, size, 4, length, consumed);
    default:
        return decode_result::token_mismatch;
    }
}

decode_result
primitives::try_read_binary_header(const char* data, std::size_t size, std::uint32_t& length, std::size_t& consumed) {
    if (size == 0) {
        return decode_result::insufficient_data;
    }

    switch (load8(data)) {
    case code::bin8:
        return read_length(data, size, 1, length, consumed);
    case code::bin16:
        return read_length(data, size, 2, length, consumed);
    case code::bin32:
        return read_length(data, size, 4, length, consumed);
    default:
        return decode_result::token_mismatch;
    }
}

decode_result
primitives::try_read_array_header(const char* data, std::size_t size, std::uint32_t& count, std::size_t& consumed) {
    if (size == 0) {
        return decode_result::insufficient_data;
    }

    const std::uint8_t c = load8(data);

    if (code::is_fixarray(c)) {
        count = c & 0x0f;
        consumed = 1;
        return decode_result::success;
    }

    switch (c) {
    case code::array16:
        return read_length(data, size, 2, count, consumed);
    case code::array32:
        return read_length(data, size, 4, count, consumed);
    default:
        return decode_result::token_mismatch;
    }
}

decode_result
primitives::try_read_map_header(const char* data, std::size_t size, std::uint32_t& count, std::size_t& consumed) {
    if (size == 0) {
        return decode_result::insufficient_data;
    }

    const std::uint8_t c = load8(data);

    if (code::is_fixmap(c)) {
        count = c & 0x0f;
        consumed = 1;
        return decode_result::success;
    }

    switch (c) {
    case code::map16:
        return read_length(data, size, 2, count, consumed);
    case code::map32:
        return read_length(data, size, 4, count, consumed);
    default:
        return decode_result::token_mismatch;
    }
}

decode_result
primitives::try_read_extension_header(const char* data, std::size_t size, extension_header_t& header, std::size_t& consumed) {
    if (size == 0) {
        return decode_result::insufficient_data;
    }

    const std::uint8_t c = load8(data);

    std::uint32_t length = 0;
    std::size_t width = 0;

    switch (c) {
    case code::fixext1:
        length = 1;
        break;
    case code::fixext2:
        length = 2;
        break;
    case code::fixext4:
        length = 4;
        break;
    case code::fixext8:
        length = 8;
        break;
    case code::fixext16:
        length = 16;
        break;
    case code::ext8:
        width = 1;
        break;
    case code::ext16:
        width = 2;
        break;
    case code::ext32:
        width = 4;
        break;
    default:
        return decode_result::token_mismatch;
    }

    const std::size_t total = header_size(c);
    if (size < total) {
        return decode_result::insufficient_data;
    }

    if (width > 0) {
        std::size_t unused;
        read_length(data, size, width, length, unused);
    }

    header.type = static_cast<std::int8_t>(load8(data + total - 1));
    header.length = length;
    consumed = total;
    return decode_result::success;
}

decode_result
primitives::try_read(const char* data, std::size_t size, timestamp_t& value, std::size_t& consumed) {
    extension_header_t header;
    std::size_t header_length = 0;

    const decode_result result = try_read_extension_header(data, size, header, header_length);
    if (result != decode_result::success) {
        return result;
    }

    if (header.type != extension::timestamp) {
        return decode_result::token_mismatch;
    }

    if (header.length != 4 && header.length != 8 && header.length != 12) {
        return decode_result::token_mismatch;
    }

    if (size < header_length + header.length) {
        return decode_result::insufficient_data;
    }

    const char* payload = data + header_length;

    switch (header.length) {
    case 4:
        value.seconds = load32(payload);
        value.nanoseconds = 0;
        break;
    case 8: {
        const std::uint64_t bits = load64(payload);
        value.nanoseconds = static_cast<std::uint32_t>(bits >> 34);
        value.seconds = static_cast<std::int64_t>(bits & 0x00000003ffffffffull);
        break;
    }
    default:
        value.nanoseconds = load32(payload);
        value.seconds = static_cast<std::int64_t>(load64(payload + 4));
        break;
    }

    consumed = header_length + header.length;
    return decode_result::success;
}

std::size_t
primitives::write_nil(char* data) {
    store8(data, code::nil);
    return 1;
}

std::size_t
primitives::write(char* data, bool value) {
    store8(data, value ? code::true_value : code::false_value);
    return 1;
}

std::size_t
primitives::write(char* data, std::uint64_t value) {
    if (value <= code::max_fixint) {
        store8(data, static_cast<std::uint8_t>(value));
        return 1;
    }

    if (value <= std::numeric_limits<std::uint8_t>::max()) {
        store8(data, code::uint8);
        store8(data + 1, static_cast<std::uint8_t>(value));
        return 2;
    }

    if (value <= std::numeric_limits<std::uint16_t>::max()) {
        store8(data, code::uint16);
        store16(data + 1, static_cast<std::uint16_t>(value));
        return 3;
    }

    if (value <= std::numeric_limits<std::uint32_t>::max()) {
        store8(data, code::uint32);
        store32(data + 1, static_cast<std::uint32_t>(value));
        return 5;
    }

    store8(data, code::uint64);
    store64(data + 1, value);
    return 9;
}

std::size_t
primitives::write(char* data, std::int64_t value) {
    if (value >= 0) {
        return write(data, static_cast<std::uint64_t>(value));
    }

    if (value >= -32) {
        store8(data, static_cast<std::uint8_t>(static_cast<std::int8_t>(value)));
        return 1;
    }

    if (value >= std::numeric_limits<std::int8_t>::min()) {
        store8(data, code::int8);
        store8(data + 1, static_cast<std::uint8_t>(static_cast<std::int8_t>(value)));
        return 2;
    }

    if (value >= std::numeric_limits<std::int16_t>::min()) {
        store8(data, code::int16);
        store16(data + 1, static_cast<std::uint16_t>(static_cast<std::int16_t>(value)));
        return 3;
    }

    if (value >= std::numeric_limits<std::int32_t>::min()) {
        store8(data, code::int32);
        store32(data + 1, static_cast<std::uint32_t>(static_cast<std::int32_t>(value)));
        return 5;
    }

    store8(data, code::int64);
    store64(data + 1, static_cast<std::uint64_t>(value));
    return 9;
}

std::size_t
primitives::write(char* data, float value) {
    store8(data, code::float32);
    store_float(data + 1, value);
    return 5;
}

std::size_t
primitives::write(char* data, double value) {
    store8(data, code::float64);
    store_double(data + 1, value);
    return 9;
}

std::size_t
primitives::write_string_header(char* data, std::uint32_t length) {
    if (length <= 31) {
        store8(data, static_cast<std::uint8_t>(code::min_fixstr | length));
        return 1;
    }

    if (length <= std::numeric_limits<std::uint8_t>::max()) {
        store8(data, code::str8);
        store8(data + 1, static_cast<std::uint8_t>(length));
        return 2;
    }

    if (length <= std::numeric_limits<std::uint16_t>::max()) {
        store8(data, code::str16);
        store16(data + 1, static_cast<std::uint16_t>(length));
        return 3;
    }

    store8(data, code::str32);
    store32(data + 1, length);
    return 5;
}

std::size_t
primitives::write_binary_header(char* data, std::uint32_t length) {
    if (length <= std::numeric_limits<std::uint8_t>::max()) {
        store8(data, code::bin8);
        store8(data + 1, static_cast<std::uint8_t>(length));
        return 2;
    }

    if (length <= std::numeric_limits<std::uint16_t>::max()) {
        store8(data, code::bin16);
        store16(data + 1, static_cast<std::uint16_t>(length));
        return 3;
    }

    store8(data, code::bin32);
    store32(data + 1, length);
    return 5;
}

std::size_t
primitives::write_array_header(char* data, std::uint32_t count) {
    if (count <= 15) {
        store8(data, static_cast<std::uint8_t>(code::min_fixarray | count));
        return 1;
    }

    if (count <= std::numeric_limits<std::uint16_t>::max()) {
        store8(data, code::array16);
        store16(data + 1, static_cast<std::uint16_t>(count));
        return 3;
    }

    store8(data, code::array32);
    store32(data + 1, count);
    return 5;
}

std::size_t
primitives::write_map_header(char* data, std::uint32_t count) {
    if (count <= 15) {
        store8(data, static_cast<std::uint8_t>(code::min_fixmap | count));
        return 1;
    }

    if (count <= std::numeric_limits<std::uint16_t>::max()) {
        store8(data, code::map16);
        store16(data + 1, static_cast<std::uint16_t>(count));
        return 3;
    }

    store8(data, code::map32);
    store32(data + 1, count);
    return 5;
}

std::size_t
primitives::write_extension_header(char* data, const extension_header_t& header) {
    const std::uint8_t type = static_cast<std::uint8_t>(header.type);

    switch (header.length) {
    case 1:
        store8(data, code::fixext1);
        store8(data + 1, type);
        return 2;
    case 2:
        store8(data, code::fixext2);
        store8(data + 1, type);
        return 2;
    case 4:
        store8(data, code::fixext4);
        store8(data + 1, type);
        return 2;
    case 8:
        store8(data, code::fixext8);
        store8(data + 1, type);
        return 2;
    case 16:
        store8(data, code::fixext16);
        store8(data + 1, type);
        return 2;
    default:
        break;
    }

    if (header.length <= std::numeric_limits<std::uint8_t>::max()) {
        store8(data, code::ext8);
        store8(data + 1, static_cast<std::uint8_t>(header.length));
        store8(data + 2, type);
        return 3;
    }

    if (header.length <= std::numeric_limits<std::uint16_t>::max()) {
        store8(data, code::ext16);
        store16(data + 1, static_cast<std::uint16_t>(header.length));
        store8(data + 3, type);
        return 4;
    }

    store8(data, code::ext32);
    store32(data + 1, header.length);
    store8(data + 5, type);
    return 6;
}

std::size_t
primitives::write(char* data, const timestamp_t& value) {
    if ((static_cast<std::uint64_t>(value.seconds) >> 34) == 0) {
        const std::uint64_t bits = (static_cast<std::uint64_t>(value.nanoseconds) << 34) |
            static_cast<std::uint64_t>(value.seconds);

        if ((bits & 0xffffffff00000000ull) == 0) {
            const std::size_t header = write_extension_header(data, extension_header_t(extension::timestamp, 4));
            store32(data + header, static_cast<std::uint32_t>(bits));
            return header + 4;
        }

        const std::size_t header = write_extension_header(data, extension_header_t(extension::timestamp, 8));
        store64(data + header, bits);
        return header + 8;
    }

    const std::size_t header = write_extension_header(data, extension_header_t(extension::timestamp, 12));
    store32(data + header, value.nanoseconds);
    store64(data + header + 4, static_cast<std::uint64_t>(value.seconds));
    return header + 12;
}

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

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <type_traits>
#include <typeinfo>

#include "shapeshift/error.hpp"
#include "shapeshift/primitives.hpp"
#include "shapeshift/reader.hpp"
#include "shapeshift/writer.hpp"

namespace shapeshift { namespace detail {

/// Element types whose arrays are encoded and decoded in bulk.
template<class T>
struct is_accelerated :
    public std::integral_constant<bool, std::is_arithmetic<T>::value>
{};

/// Number of elements encoded per reserved block.
const std::size_t bulk_block_size = 1024;

inline
std::size_t
encode(char* data, bool value) {
    return primitives::write(data, value);
}

inline
std::size_t
encode(char* data, float value) {
    return primitives::write(data, value);
}

inline
std::size_t
encode(char* data, double value) {
    return primitives::write(data, value);
}

template<class T>
inline
typename std::enable_if<std::is_integral<T>::value && std::is_signed<T>::value, std::size_t>::type
encode(char* data, T value) {
    return primitives::write(data, static_cast<std::int64_t>(value));
}

template<class T>
inline
typename std::enable_if<std::is_integral<T>::value && !std::is_signed<T>::value && !std::is_same<T, bool>::value,
    std::size_t>::type
encode(char* data, T value) {
    return primitives::write(data, static_cast<std::uint64_t>(value));
}

inline
decode_result
decode(const char* data, std::size_t size, bool& value, std::size_t& consumed) {
    return primitives::try_read(data, size, value, consumed);
}

inline
decode_result
decode(const char* data, std::size_t size, float& value, std::size_t& consumed) {
    return primitives::try_read(data, size, value, consumed);
}

inline
decode_result
decode(const char* data, std::size_t size, double& value, std::size_t& consumed) {
    return primitives::try_read(data, size, value, consumed);
}

/// Integers that do not fit are reported as a mismatch, leaving the exact error to the slow path.
template<class T>
inline
typename std::enable_if<std::is_integral<T>::value && !std::is_same<T, bool>::value, decode_result>::type
decode(const char* data, std::size_t size, T& value, std::size_t& consumed) {
    integer_t integer;

    const decode_result result = primitives::try_read(data, size, integer, consumed);
    if (result == decode_result::success && !narrow(integer, value)) {
        consumed = 0;
        return decode_result::token_mismatch;
    }

    return result;
}

inline
bool
read_element(reader_t& reader, bool*) {
    return reader.read_bool();
}

inline
float
read_element(reader_t& reader, float*) {
    return reader.read_float();
}

inline
double
read_element(reader_t& reader, double*) {
    return reader.read_double();
}

template<class T>
inline
typename std::enable_if<std::is_integral<T>::value && !std::is_same<T, bool>::value, T>::type
read_element(reader_t& reader, T*) {
    return reader.read_integer<T>();
}

/*!
 * Encodes the elements of the range directly into reserved blocks of the output buffer.
 *
 * Produces exactly the same bytes as writing the elements one by one.
 */
template<class Iterator>
void
write_bulk(writer_t& writer, Iterator first, Iterator last) {
    while (first != last) {
        char* data = writer.prepare(bulk_block_size * primitives::max_header_size);

        std::size_t size = 0;
        for (std::size_t i = 0; i < bulk_block_size && first != last; ++i, ++first) {
            size += encode(data + size, *first);
        }

        writer.advance(size);
    }
}

/*!
 * Decodes `count` elements, appending them to the container.
 *
 * Elements are decoded straight from the contiguous span under the cursor. An element crossing a
 * segment boundary, or one that can not be decoded fast, goes through the regular reader, which
 * either decodes it or throws the appropriate error.
 */
template<class T, class Container>
void
read_bulk(reader_t& reader, std::size_t count, Container& values) {
    while (count > 0) {
        const boost::asio::const_buffer span = reader.cursor().span();
        const char* data = static_cast<const char*>(span.data());
        const std::size_t size = span.size();

        std::size_t offset = 0;
        while (count > 0) {
            T value;
            std::size_t consumed = 0;

            if (decode(data + offset, size - offset, value, consumed) != decode_result::success) {
                break;
            }

            values.push_back(value);
            offset += consumed;
            --count;
        }

        reader.skip_raw(offset);

        if (count > 0) {
            values.push_back(read_element(reader, static_cast<T*>(nullptr)));
            --count;
        }
    }
}

}} // namespace shapeshift::detail

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

#include "shapeshift/buffer.hpp"
#include "shapeshift/primitives.hpp"
#include "shapeshift/sequence.hpp"
#include "shapeshift/wire.hpp"

namespace shapeshift {

/*!
 * Synchronous MessagePack writer appending to an output buffer.
 *
 * Every value is written in its shortest representation. The writer does not check structural
 * consistency: writing the announced number of elements after a header is the caller's duty.
 *
 * \warning the buffer must outlive the writer.
 */
class writer_t {
    output_buffer_t* buffer_;
    object_layout layout_;
    std::size_t written_;

public:
    explicit writer_t(output_buffer_t& buffer, object_layout layout = object_layout::map);

    /// Object encoding the converters should use.
    object_layout
    layout() const {
        return layout_;
    }

    /// Number of bytes written by this writer.
    std::size_t
    written() const {
        return written_;
    }

    void
    write_nil();

    void
    write(bool value);

    template<typename T>
    typename std::enable_if<std::is_integral<T>::value && std::is_signed<T>::value>::type
    write(T value) {
        put(static_cast<std::int64_t>(value));
    }

    template<typename T>
    typename std::enable_if<std::is_integral<T>::value && !std::is_signed<T>::value>::type
    write(T value) {
        put(static_cast<std::uint64_t>(value));
    }

    void
    write(float value);

    void
    write(double value);

    void
    write(const std::string& value);

    /// Writes a null-terminated string.
    void
    write(const char* value);

    void
    write(const timestamp_t& value);

    void
    write(const std::chrono::system_clock::time_point& value);

    /// Writes the header and the UTF-8 payload.
    void
    write_string(const char* data, std::size_t size);

    void
    write_string_header(std::uint32_t length);

    void
    write_binary(const char* data, std::size_t size);

    void
    write_binary_header(std::uint32_t length);

    void
    write_array_header(std::uint32_t count);

    void
    write_map_header(std::uint32_t count);

    void
    write_extension_header(const extension_header_t& header);

    void
    write_extension(std::int8_t type, const char* data, std::size_t size);

    /// Appends already encoded MessagePack bytes as is.
    void
    write_raw(const char* data, std::size_t size);

    void
    write_raw(const sequence_t& data);

    /// Reserves `size` bytes for direct encoding. Must be followed by `advance`.
    char*
    prepare(std::size_t size);

    /// Commits `size` bytes previously obtained with `prepare`.
    void
    advance(std::size_t size);

private:
    void
    put(std::int64_t value);

    void
    put(std::uint64_t value);
};

} // namespace shapeshift

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

#include "shapeshift/writer.hpp"

#include <cstring>

using namespace shapeshift;

writer_t::writer_t(output_buffer_t& buffer, object_layout layout) :
    buffer_(&buffer),
    layout_(layout),
    written_(0)
{}

void
writer_t::write_nil() {
    advance(primitives::write_nil(prepare(1)));
}

void
writer_t::write(bool value) {
    advance(primitives::write(prepare(1), value));
}

void
writer_t::put(std::int64_t value) {
    advance(primitives::write(prepare(primitives::max_header_size), value));
}

void
writer_t::put(std::uint64_t value) {
    advance(primitives::write(prepare(primitives::max_header_size), value));
}

void
writer_t::write(float value) {
    advance(primitives::write(prepare(primitives::max_header_size), value));
}

void
writer_t::write(double value) {
    advance(primitives::write(prepare(primitives::max_header_size), value));
}

void
writer_t::write(const std::string& value) {
    write_string(value.data(), value.size());
}

void
writer_t::write(const char* value) {
    write_string(value, std::strlen(value));
}

void
writer_t::write(const timestamp_t& value) {
    advance(primitives::write(prepare(primitives::max_timestamp_size), value));
}

void
writer_t::write(const std::chrono::system_clock::time_point& value) {
    write(timestamp_t::from_time_point(value));
}

void
writer_t::write_string(const char* data, std::size_t size) {
    write_string_header(static_cast<std::uint32_t>(size));
    write_raw(data, size);
}

void
writer_t::write_string_header(std::uint32_t length) {
    advance(primitives::write_string_header(prepare(primitives::max_header_size), length));
}

void
writer_t::write_binary(const char* data, std::size_t size) {
    write_binary_header(static_cast<std::uint32_t>(size));
    write_raw(data, size);
}

void
writer_t::write_binary_header(std::uint32_t length) {
    advance(primitives::write_binary_header(prepare(primitives::max_header_size), length));
}

void
writer_t::write_array_header(std::uint32_t count) {
    advance(primitives::write_array_header(prepare(primitives::max_header_size), count));
}

void
writer_t::write_map_header(std::uint32_t count) {
    advance(primitives::write_map_header(prepare(primitives::max_header_size), count));
}

void
writer_t::write_extension_header(const extension_header_t& header) {
    advance(primitives::write_extension_header(prepare(primitives::max_header_size), header));
}

void
writer_t::write_extension(std::int8_t type, const char* data, std::size_t size) {
    write_extension_header(extension_header_t(type, static_cast<std::uint32_t>(size)));
    write_raw(data, size);
}

void
writer_t::write_raw(const char* data, std::size_t size) {
    if (size == 0) {
        return;
    }

    std::memcpy(prepare(size), data, size);
    advance(size);
}

void
writer_t::write_raw(const sequence_t& data) {
    const auto& segments = data.segments();
    for (auto it = segments.begin(); it != segments.end(); ++it) {
        write_raw(static_cast<const char*>(it->data()), it->size());
    }
}

char*
writer_t::prepare(std::size_t size) {
    return buffer_->prepare(size);
}

void
writer_t::advance(std::size_t size) {
    buffer_->commit(size);
    written_ += size;
}

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

#include <cstddef>
#include <string>
#include <vector>

#include "shapeshift/sequence.hpp"

namespace shapeshift {

/*!
 * Growable output buffer.
 *
 * Bytes are appended at the tail through the prepare/commit pair and released from the head after
 * they have been flushed.
 */
class output_buffer_t {
    std::vector<char> storage_;
    std::size_t head_;
    std::size_t tail_;

public:
    output_buffer_t();
    explicit output_buffer_t(std::size_t capacity);

    /// Returns a pointer to at least `size` writable bytes at the tail.
    char*
    prepare(std::size_t size);

    /// Makes `size` prepared bytes part of the content.
    void
    commit(std::size_t size);

    /// Releases `size` bytes from the head.
    void
    consume(std::size_t size);

    void
    clear();

    const char*
    data() const {
        return storage_.data() + head_;
    }

    std::size_t
    size() const {
        return tail_ - head_;
    }

    bool
    empty() const {
        return size() == 0;
    }

    sequence_t
    view() const {
        return sequence_t(data(), size());
    }

    std::vector<char>
    to_vector() const {
        return std::vector<char>(data(), data() + size());
    }

    std::string
    to_string() const {
        return std::string(data(), size());
    }
};

} // namespace shapeshift

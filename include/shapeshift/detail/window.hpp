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

#include "shapeshift/sequence.hpp"

namespace shapeshift {

namespace detail {

/// Contiguous view over the bytes at a cursor, large enough to decode a token header.
///
/// Points directly into the current segment when it is long enough, otherwise copies the bytes
/// spread across segment boundaries into the internal storage.
class window_t {
    char storage[16];
    const char* data_;
    std::size_t size_;

public:
    window_t(const cursor_t& cursor, std::size_t want) {
        const auto span = cursor.span();

        if (span.size() >= want || span.size() == cursor.remaining()) {
            data_ = static_cast<const char*>(span.data());
            size_ = span.size();
        } else {
            data_ = storage;
            size_ = cursor.peek(storage, want < sizeof(storage) ? want : sizeof(storage));
        }
    }

    window_t(const window_t&) = delete;
    window_t& operator=(const window_t&) = delete;

    const char*
    data() const {
        return data_;
    }

    std::size_t
    size() const {
        return size_;
    }
};

} // namespace detail

} // namespace shapeshift

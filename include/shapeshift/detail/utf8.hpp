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
#include <cstdint>

namespace shapeshift {

namespace detail {

/// Checks the well-formedness of UTF-8 text, rejecting overlong forms and surrogates.
inline
bool
valid_utf8(const char* data, std::size_t size) {
    const unsigned char* it = reinterpret_cast<const unsigned char*>(data);
    const unsigned char* end = it + size;

    while (it != end) {
        const unsigned char lead = *it;

        if (lead < 0x80) {
            ++it;
            continue;
        }

        std::size_t length;
        std::uint32_t point;

        if ((lead & 0xe0) == 0xc0) {
            length = 2;
            point = lead & 0x1f;
        } else if ((lead & 0xf0) == 0xe0) {
            length = 3;
            point = lead & 0x0f;
        } else if ((lead & 0xf8) == 0xf0) {
            length = 4;
            point = lead & 0x07;
        } else {
            return false;
        }

        if (static_cast<std::size_t>(end - it) < length) {
            return false;
        }

        for (std::size_t i = 1; i < length; ++i) {
            if ((it[i] & 0xc0) != 0x80) {
                return false;
            }
            point = (point << 6) | (it[i] & 0x3f);
        }

        if ((length == 2 && point < 0x80) ||
            (length == 3 && point < 0x800) ||
            (length == 4 && (point < 0x10000 || point > 0x10ffff)) ||
            (point >= 0xd800 && point <= 0xdfff))
        {
            return false;
        }

        it += length;
    }

    return true;
}

} // namespace detail

} // namespace shapeshift

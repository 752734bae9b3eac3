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

#include "shapeshift/forwards.hpp"
#include "shapeshift/sequence.hpp"
#include "shapeshift/wire.hpp"

namespace shapeshift {

/*!
 * String with its UTF-8 bytes and its complete MessagePack encoding computed ahead of time.
 *
 * Used for property names, so that writing them is a plain copy and matching them against the
 * input requires no allocation.
 */
class preformatted_string_t {
    std::string value_;
    std::vector<char> formatted_;
    std::size_t header_;

public:
    explicit preformatted_string_t(std::string value);

    const std::string&
    value() const {
        return value_;
    }

    /// UTF-8 bytes without the header.
    boost::asio::const_buffer
    encoded() const;

    /// Header followed by the UTF-8 bytes.
    boost::asio::const_buffer
    formatted() const;

    /// Compares the given UTF-8 bytes with the value.
    bool
    is_match(const char* data, std::size_t size) const;

    /// Compares the possibly segmented UTF-8 bytes with the value.
    bool
    is_match(const sequence_t& data) const;

    /// Consumes the next string token if it is equal to the value.
    ///
    /// Returns false without consuming anything for a different string, for nil or for any other
    /// token.
    bool
    try_read(reader_t& reader) const;

    /// Non-throwing variant, setting `matched` on success.
    ///
    /// A string that does not match is not consumed and yields `decode_result::success` with
    /// `matched` unset.
    decode_result
    try_read(streaming_reader_t& reader, bool& matched) const;

    void
    write(writer_t& writer) const;
};

inline
bool
operator==(const preformatted_string_t& lhs, const preformatted_string_t& rhs) {
    return lhs.value() == rhs.value();
}

} // namespace shapeshift

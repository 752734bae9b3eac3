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

#include <utility>
#include <vector>

#include "shapeshift/converter.hpp"

namespace shapeshift {

/// Already encoded MessagePack structure, kept as is.
struct raw_t {
    std::vector<char> bytes;

    raw_t() {}

    explicit raw_t(std::vector<char> bytes) :
        bytes(std::move(bytes))
    {}
};

inline
bool
operator==(const raw_t& lhs, const raw_t& rhs) {
    return lhs.bytes == rhs.bytes;
}

/// Copies the next whole structure on read and emits the bytes verbatim on write.
///
/// An empty value is written as nil.
class raw_converter : public converter<raw_t> {
public:
    virtual
    void
    write(writer_t& writer, const raw_t& value, context_t&) const {
        if (value.bytes.empty()) {
            writer.write_nil();
        } else {
            writer.write_raw(value.bytes.data(), value.bytes.size());
        }
    }

    virtual
    raw_t
    read(reader_t& reader, context_t& context) const {
        return raw_t(reader.read_raw_structure(context).to_vector());
    }
};

} // namespace shapeshift

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

#include <memory>
#include <string>

#include "shapeshift/converter.hpp"
#include "shapeshift/interner.hpp"

#include "shapeshift/detail/format.hpp"
#include "shapeshift/detail/utf8.hpp"

namespace shapeshift {

/*!
 * Strings shared through the string pool of the context.
 *
 * With interning disabled every decoded string gets its own instance. Nil is read as an empty
 * pointer and an empty pointer is written as nil.
 */
class interned_string_converter : public converter<interned_string> {
public:
    virtual
    void
    write(writer_t& writer, const interned_string& value, context_t&) const {
        if (!value) {
            writer.write_nil();
        } else {
            writer.write(*value);
        }
    }

    virtual
    interned_string
    read(reader_t& reader, context_t& context) const {
        if (reader.try_read_nil()) {
            return interned_string();
        }

        const std::size_t offset = reader.position();
        const sequence_t payload = reader.read_string_sequence();

        if (payload.contiguous()) {
            const char* data = payload.empty() ? "" : static_cast<const char*>(payload.segments().front().data());
            return make(data, payload.size(), offset, context);
        }

        const std::string text = payload.to_string();
        return make(text.data(), text.size(), offset, context);
    }

private:
    static
    interned_string
    make(const char* data, std::size_t size, std::size_t offset, context_t& context) {
        if (!detail::valid_utf8(data, size)) {
            throw protocol_error(error::invalid_utf8,
                shapeshift::format("the string at offset %d is not valid utf-8", offset));
        }

        if (string_interner_t* interner = context.interner()) {
            return interner->intern(data, size);
        }

        return std::make_shared<const std::string>(data, size);
    }
};

} // namespace shapeshift

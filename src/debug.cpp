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

#include "shapeshift/debug.hpp"

#include <cmath>
#include <cstdio>
#include <sstream>

#include "shapeshift/context.hpp"
#include "shapeshift/reader.hpp"

using namespace shapeshift;

namespace {

void
hex(std::ostream& stream, const sequence_t& bytes) {
    static const char digits[] = "0123456789abcdef";

    const std::vector<char> data = bytes.to_vector();
    for (auto it = data.begin(); it != data.end(); ++it) {
        const unsigned char byte = static_cast<unsigned char>(*it);
        stream << digits[byte >> 4] << digits[byte & 0x0f];
    }
}

void
quote(std::ostream& stream, const std::string& value) {
    stream << '"';

    for (auto it = value.begin(); it != value.end(); ++it) {
        const unsigned char c = static_cast<unsigned char>(*it);

        switch (c) {
        case '"':
            stream << "\\\"";
            break;
        case '\\':
            stream << "\\\\";
            break;
        case '\n':
            stream << "\\n";
            break;
        case '\r':
            stream << "\\r";
            break;
        case '\t':
            stream << "\\t";
            break;
        default:
            if (c < 0x20) {
                char escaped[8];
                std::snprintf(escaped, sizeof(escaped), "\\u%04x", c);
                stream << escaped;
            } else {
                stream << *it;
            }
        }
    }

    stream << '"';
}

void
number(std::ostream& stream, double value) {
    if (std::isnan(value)) {
        stream << "NaN";
        return;
    }

    if (std::isinf(value)) {
        stream << (value < 0 ? "-Infinity" : "Infinity");
        return;
    }

    char text[32];
    std::snprintf(text, sizeof(text), "%.17g", value);

    const std::string result(text);
    stream << result;

    if (result.find_first_of(".e") == std::string::npos) {
        stream << ".0";
    }
}

void
render(reader_t& reader, context_t& context, std::ostream& stream) {
    const std::uint8_t marker = reader.peek_code();

    switch (to_token_type(marker)) {
    case token_type::nil:
        reader.read_nil();
        stream << "null";
        break;
    case token_type::boolean:
        stream << (reader.read_bool() ? "true" : "false");
        break;
    case token_type::integer:
        if (marker == code::uint64) {
            stream << reader.read_integer<std::uint64_t>();
        } else {
            stream << reader.read_integer<std::int64_t>();
        }
        break;
    case token_type::floating:
        if (marker == code::float32) {
            number(stream, reader.read_float());
            stream << 'f';
        } else {
            number(stream, reader.read_double());
        }
        break;
    case token_type::string:
        quote(stream, reader.read_string());
        break;
    case token_type::binary:
        stream << "bin\"";
        hex(stream, reader.read_binary_sequence());
        stream << '"';
        break;
    case token_type::extension: {
        const extension_header_t header = reader.read_extension_header();
        stream << "ext(" << static_cast<int>(header.type) << ", \"";
        hex(stream, reader.read_raw(header.length));
        stream << "\")";
        break;
    }
    case token_type::array: {
        context_t::depth_scope_t scope(context);

        const std::uint32_t count = reader.read_array_header();
        stream << '[';
        for (std::uint32_t i = 0; i < count; ++i) {
            if (i > 0) {
                stream << ", ";
            }

            render(reader, context, stream);
        }
        stream << ']';
        break;
    }
    case token_type::map: {
        context_t::depth_scope_t scope(context);

        const std::uint32_t count = reader.read_map_header();
        stream << '{';
        for (std::uint32_t i = 0; i < count; ++i) {
            if (i > 0) {
                stream << ", ";
            }

            render(reader, context, stream);
            stream << ": ";
            render(reader, context, stream);
        }
        stream << '}';
        break;
    }
    default:
        throw unexpected_token_error(marker, reader.position(), "any token");
    }
}

} // namespace

std::string
shapeshift::to_text(const sequence_t& bytes, const options_t& options) {
    context_t context(options);
    reader_t reader(bytes, options.layout);

    std::ostringstream stream;
    while (!reader.end()) {
        if (reader.position() > 0) {
            stream << '\n';
        }

        render(reader, context, stream);
    }

    return stream.str();
}

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

#include "shapeshift/streaming_reader.hpp"

#include "shapeshift/context.hpp"
#include "shapeshift/detail/format.hpp"
#include "shapeshift/detail/log.hpp"
#include "shapeshift/detail/utf8.hpp"
#include "shapeshift/detail/window.hpp"

using namespace shapeshift;

streaming_reader_t::streaming_reader_t(const sequence_t& sequence, bool eof, object_layout layout) :
    cursor_(sequence),
    eof_(eof),
    layout_(layout)
{}

streaming_reader_t::streaming_reader_t(const cursor_t& cursor, bool eof, object_layout layout) :
    cursor_(cursor),
    eof_(eof),
    layout_(layout)
{}

streaming_reader_t::streaming_reader_t(const cursor_t& cursor,
                                       bool eof,
                                       const skip_state_t& state,
                                       object_layout layout) :
    cursor_(cursor),
    eof_(eof),
    layout_(layout),
    skip_(state)
{}

template<class T>
decode_result
streaming_reader_t::decode(decode_result (*decoder)(const char*, std::size_t, T&, std::size_t&), T& value) {
    const detail::window_t window(cursor_, primitives::max_timestamp_size);

    std::size_t consumed = 0;
    const decode_result result = decoder(window.data(), window.size(), value, consumed);

    switch (result) {
    case decode_result::success:
        cursor_.try_advance(consumed);
        return result;
    case decode_result::insufficient_data:
        return shortage();
    default:
        return result;
    }
}

decode_result
streaming_reader_t::try_peek_code(std::uint8_t& code) const {
    if (!cursor_.try_peek(code)) {
        return shortage();
    }

    return decode_result::success;
}

decode_result
streaming_reader_t::try_peek_type(token_type& type) const {
    std::uint8_t code;

    const decode_result result = try_peek_code(code);
    if (result == decode_result::success) {
        type = to_token_type(code);
    }

    return result;
}

decode_result
streaming_reader_t::try_read_nil() {
    std::uint8_t code;

    const decode_result result = try_peek_code(code);
    if (result != decode_result::success) {
        return result;
    }

    if (code != code::nil) {
        return decode_result::token_mismatch;
    }

    cursor_.try_advance(1);
    return decode_result::success;
}

decode_result
streaming_reader_t::try_read(bool& value) {
    return decode(&primitives::try_read, value);
}

decode_result
streaming_reader_t::try_read(integer_t& value) {
    return decode(&primitives::try_read, value);
}

decode_result
streaming_reader_t::try_read(float& value) {
    return decode(&primitives::try_read, value);
}

decode_result
streaming_reader_t::try_read(double& value) {
    return decode(&primitives::try_read, value);
}

decode_result
streaming_reader_t::try_read(timestamp_t& value) {
    return decode(&primitives::try_read, value);
}

decode_result
streaming_reader_t::try_read(std::chrono::system_clock::time_point& value) {
    const cursor_t origin = cursor_;

    timestamp_t timestamp;
    const decode_result result = try_read(timestamp);
    if (result != decode_result::success) {
        return result;
    }

    if (!timestamp.representable()) {
        cursor_ = origin;
        throw overflow_error(origin.position(), "std::chrono::system_clock::time_point");
    }

    value = timestamp.to_time_point();
    return decode_result::success;
}

decode_result
streaming_reader_t::try_read(std::string& value) {
    const cursor_t origin = cursor_;

    sequence_t payload;
    const decode_result result = try_read_string(payload);
    if (result != decode_result::success) {
        return result;
    }

    std::string text = payload.to_string();
    if (!detail::valid_utf8(text.data(), text.size())) {
        cursor_ = origin;
        throw protocol_error(error::invalid_utf8,
            shapeshift::format("the string at offset %d is not valid utf-8", origin.position()));
    }

    value.swap(text);
    return decode_result::success;
}

decode_result
streaming_reader_t::try_read_string_header(std::uint32_t& length) {
    return decode(&primitives::try_read_string_header, length);
}

decode_result
streaming_reader_t::read_payload(decode_result header, std::uint32_t length, sequence_t& value, cursor_t& origin) {
    if (header != decode_result::success) {
        return header;
    }

    if (cursor_.remaining() < length) {
        cursor_ = origin;
        return shortage();
    }

    value = cursor_.sequence().slice(cursor_.position(), length);
    cursor_.try_advance(length);
    return decode_result::success;
}

decode_result
streaming_reader_t::try_read_string(sequence_t& value) {
    cursor_t origin = cursor_;

    std::uint32_t length = 0;
    const decode_result header = try_read_string_header(length);
    return read_payload(header, length, value, origin);
}

decode_result
streaming_reader_t::try_read_binary(sequence_t& value) {
    cursor_t origin = cursor_;

    std::uint32_t length = 0;
    const decode_result header = try_read_binary_header(length);
    return read_payload(header, length, value, origin);
}

decode_result
streaming_reader_t::try_read_binary(std::vector<char>& value) {
    sequence_t payload;

    const decode_result result = try_read_binary(payload);
    if (result == decode_result::success) {
        value = payload.to_vector();
    }

    return result;
}

decode_result
streaming_reader_t::try_read_binary_header(std::uint32_t& length) {
    return decode(&primitives::try_read_binary_header, length);
}

decode_result
streaming_reader_t::try_read_array_header(std::uint32_t& count) {
    return decode(&primitives::try_read_array_header, count);
}

decode_result
streaming_reader_t::try_read_map_header(std::uint32_t& count) {
    return decode(&primitives::try_read_map_header, count);
}

decode_result
streaming_reader_t::try_read_extension_header(extension_header_t& header) {
    return decode(&primitives::try_read_extension_header, header);
}

decode_result
streaming_reader_t::try_read_raw(std::size_t length, sequence_t& value) {
    if (cursor_.remaining() < length) {
        return shortage();
    }

    value = cursor_.sequence().slice(cursor_.position(), length);
    cursor_.try_advance(length);
    return decode_result::success;
}

decode_result
streaming_reader_t::try_skip_raw(std::size_t length) {
    if (!cursor_.try_advance(length)) {
        return shortage();
    }

    return decode_result::success;
}

decode_result
streaming_reader_t::try_skip(context_t& context) {
    if (skip_.pending.empty()) {
        skip_.pending.push_back(1);
    }

    while (!skip_.pending.empty()) {
        if (skip_.pending.back() == 0) {
            skip_.pending.pop_back();
            continue;
        }

        const detail::window_t window(cursor_, primitives::max_header_size);
        if (window.size() == 0) {
            return shortage();
        }

        const std::uint8_t code = static_cast<std::uint8_t>(window.data()[0]);
        const token_type type = to_token_type(code);

        if (type == token_type::unknown) {
            throw unexpected_token_error(code, position(), "any token");
        }

        if (type == token_type::array || type == token_type::map) {
            std::uint32_t count = 0;

            const decode_result result = type == token_type::array ?
                try_read_array_header(count) :
                try_read_map_header(count);

            if (result != decode_result::success) {
                return result;
            }

            skip_.pending.back() -= 1;

            // The entered aggregate lives one level below every pending one.
            if (context.depth() + static_cast<int>(skip_.pending.size()) > context.max_depth()) {
                SHAPESHIFT_WRN("depth limit of %d has been hit while skipping", context.max_depth());
                throw depth_exceeded_error(context.max_depth());
            }

            const std::uint64_t children = type == token_type::array ?
                static_cast<std::uint64_t>(count) :
                static_cast<std::uint64_t>(count) * 2;

            if (children > 0) {
                skip_.pending.push_back(children);
            }

            continue;
        }

        const std::size_t header = primitives::header_size(code);
        if (window.size() < header) {
            return shortage();
        }

        std::uint64_t total = header;
        std::size_t consumed = 0;

        if (type == token_type::string) {
            std::uint32_t length = 0;
            primitives::try_read_string_header(window.data(), window.size(), length, consumed);
            total += length;
        } else if (type == token_type::binary) {
            std::uint32_t length = 0;
            primitives::try_read_binary_header(window.data(), window.size(), length, consumed);
            total += length;
        } else if (type == token_type::extension) {
            extension_header_t extension;
            primitives::try_read_extension_header(window.data(), window.size(), extension, consumed);
            total += extension.length;
        }

        if (cursor_.remaining() < total) {
            return shortage();
        }

        cursor_.try_advance(static_cast<std::size_t>(total));
        skip_.pending.back() -= 1;
    }

    return decode_result::success;
}

decode_result
streaming_reader_t::try_read_raw_structure(context_t& context, sequence_t& value) {
    streaming_reader_t probe(cursor_, eof_, layout_);

    const decode_result result = probe.try_skip(context);
    if (result != decode_result::success) {
        return result;
    }

    value = cursor_.sequence().slice(position(), probe.position() - position());
    cursor_ = probe.cursor_;
    return decode_result::success;
}

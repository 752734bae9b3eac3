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

#include "shapeshift/preformatted_string.hpp"

#include <cstring>

#include "shapeshift/primitives.hpp"
#include "shapeshift/reader.hpp"
#include "shapeshift/streaming_reader.hpp"
#include "shapeshift/writer.hpp"

using namespace shapeshift;

preformatted_string_t::preformatted_string_t(std::string value) :
    value_(std::move(value)),
    formatted_(primitives::max_header_size + value_.size())
{
    header_ = primitives::write_string_header(formatted_.data(), static_cast<std::uint32_t>(value_.size()));
    std::memcpy(formatted_.data() + header_, value_.data(), value_.size());
    formatted_.resize(header_ + value_.size());
}

boost::asio::const_buffer
preformatted_string_t::encoded() const {
    return boost::asio::const_buffer(formatted_.data() + header_, value_.size());
}

boost::asio::const_buffer
preformatted_string_t::formatted() const {
    return boost::asio::const_buffer(formatted_.data(), formatted_.size());
}

bool
preformatted_string_t::is_match(const char* data, std::size_t size) const {
    return size == value_.size() && std::memcmp(data, value_.data(), size) == 0;
}

bool
preformatted_string_t::is_match(const sequence_t& data) const {
    if (data.size() != value_.size()) {
        return false;
    }

    return cursor_t(data).equals(value_.data(), value_.size());
}

bool
preformatted_string_t::try_read(reader_t& reader) const {
    reader_t probe(reader);

    if (probe.end() || probe.peek_type() != token_type::string) {
        return false;
    }

    const std::uint32_t length = probe.read_string_header();
    if (length != value_.size() || !probe.cursor().equals(value_.data(), length)) {
        return false;
    }

    probe.skip_raw(length);
    reader = probe;
    return true;
}

decode_result
preformatted_string_t::try_read(streaming_reader_t& reader, bool& matched) const {
    matched = false;

    streaming_reader_t probe(reader);

    token_type type;
    decode_result result = probe.try_peek_type(type);
    if (result != decode_result::success) {
        return result;
    }

    if (type != token_type::string) {
        return decode_result::token_mismatch;
    }

    std::uint32_t length = 0;
    result = probe.try_read_string_header(length);
    if (result != decode_result::success) {
        return result;
    }

    if (length != value_.size()) {
        return decode_result::success;
    }

    if (probe.remaining() < length) {
        return probe.eof() ? decode_result::end_of_stream : decode_result::insufficient_data;
    }

    if (probe.cursor().equals(value_.data(), length)) {
        probe.try_skip_raw(length);
        reader = probe;
        matched = true;
    }

    return decode_result::success;
}

void
preformatted_string_t::write(writer_t& writer) const {
    writer.write_raw(formatted_.data(), formatted_.size());
}

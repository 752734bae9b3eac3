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

#include "shapeshift/sequence.hpp"

#include <algorithm>
#include <cstring>

using namespace shapeshift;

namespace {

const char*
data_of(const boost::asio::const_buffer& segment) {
    return static_cast<const char*>(segment.data());
}

const sequence_t&
empty_sequence() {
    static const sequence_t sequence;
    return sequence;
}

} // namespace

sequence_t::sequence_t() :
    size_(0)
{}

sequence_t::sequence_t(const char* data, std::size_t size) :
    size_(0)
{
    append(segment_type(data, size));
}

sequence_t::sequence_t(const segment_type& segment) :
    size_(0)
{
    append(segment);
}

sequence_t::sequence_t(const std::string& data) :
    size_(0)
{
    append(segment_type(data.data(), data.size()));
}

sequence_t::sequence_t(const std::vector<char>& data) :
    size_(0)
{
    append(segment_type(data.data(), data.size()));
}

void
sequence_t::append(const segment_type& segment) {
    if (segment.size() == 0) {
        return;
    }

    segments_.push_back(segment);
    size_ += segment.size();
}

sequence_t
sequence_t::slice(std::size_t offset, std::size_t length) const {
    sequence_t result;

    for (auto it = segments_.begin(); it != segments_.end() && length > 0; ++it) {
        if (offset >= it->size()) {
            offset -= it->size();
            continue;
        }

        const std::size_t count = std::min(it->size() - offset, length);
        result.append(segment_type(data_of(*it) + offset, count));
        length -= count;
        offset = 0;
    }

    return result;
}

sequence_t
sequence_t::slice(std::size_t offset) const {
    return slice(offset, offset < size_ ? size_ - offset : 0);
}

std::vector<char>
sequence_t::to_vector() const {
    std::vector<char> result;
    result.reserve(size_);

    for (auto it = segments_.begin(); it != segments_.end(); ++it) {
        result.insert(result.end(), data_of(*it), data_of(*it) + it->size());
    }

    return result;
}

std::string
sequence_t::to_string() const {
    std::string result;
    result.reserve(size_);

    for (auto it = segments_.begin(); it != segments_.end(); ++it) {
        result.append(data_of(*it), it->size());
    }

    return result;
}

cursor_t::cursor_t() :
    sequence_(&empty_sequence()),
    segment_(0),
    offset_(0),
    position_(0)
{}

cursor_t::cursor_t(const sequence_t& sequence) :
    sequence_(&sequence),
    segment_(0),
    offset_(0),
    position_(0)
{}

std::size_t
cursor_t::remaining() const {
    return sequence_->size() - position_;
}

bool
cursor_t::try_peek(std::uint8_t& value) const {
    const auto current = span();
    if (current.size() == 0) {
        return false;
    }

    value = static_cast<std::uint8_t>(*data_of(current));
    return true;
}

std::size_t
cursor_t::peek(char* data, std::size_t size) const {
    const auto& segments = sequence_->segments();

    std::size_t copied = 0;
    std::size_t offset = offset_;

    for (std::size_t id = segment_; id < segments.size() && copied < size; ++id) {
        const std::size_t count = std::min(segments[id].size() - offset, size - copied);
        std::memcpy(data + copied, data_of(segments[id]) + offset, count);
        copied += count;
        offset = 0;
    }

    return copied;
}

boost::asio::const_buffer
cursor_t::span() const {
    const auto& segments = sequence_->segments();

    if (segment_ >= segments.size()) {
        return boost::asio::const_buffer();
    }

    return boost::asio::const_buffer(data_of(segments[segment_]) + offset_, segments[segment_].size() - offset_);
}

bool
cursor_t::try_advance(std::size_t size) {
    if (size > remaining()) {
        return false;
    }

    const auto& segments = sequence_->segments();

    position_ += size;
    while (size > 0) {
        const std::size_t count = std::min(segments[segment_].size() - offset_, size);
        offset_ += count;
        size -= count;
        skip_empty();
    }

    return true;
}

bool
cursor_t::try_copy(char* data, std::size_t size) {
    if (size > remaining()) {
        return false;
    }

    peek(data, size);
    return try_advance(size);
}

bool
cursor_t::equals(const char* data, std::size_t size) const {
    if (size > remaining()) {
        return false;
    }

    const auto& segments = sequence_->segments();

    std::size_t offset = offset_;
    for (std::size_t id = segment_; size > 0; ++id) {
        const std::size_t count = std::min(segments[id].size() - offset, size);
        if (std::memcmp(data, data_of(segments[id]) + offset, count) != 0) {
            return false;
        }

        data += count;
        size -= count;
        offset = 0;
    }

    return true;
}

sequence_t
cursor_t::rest() const {
    return sequence_->slice(position_);
}

void
cursor_t::skip_empty() {
    const auto& segments = sequence_->segments();

    if (segment_ < segments.size() && offset_ == segments[segment_].size()) {
        ++segment_;
        offset_ = 0;
    }
}

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
#include <string>
#include <vector>

#include <boost/asio/buffer.hpp>

namespace shapeshift {

/*!
 * Read-only view over a possibly segmented run of bytes.
 *
 * The sequence does not own the memory it refers to, only the list of segments.
 */
class sequence_t {
public:
    typedef boost::asio::const_buffer segment_type;
    typedef std::vector<segment_type> segments_type;

private:
    segments_type segments_;
    std::size_t size_;

public:
    sequence_t();
    sequence_t(const char* data, std::size_t size);
    explicit sequence_t(const segment_type& segment);
    explicit sequence_t(const std::string& data);
    explicit sequence_t(const std::vector<char>& data);

    /// Builds a sequence from a range of Boost.Asio constant buffers.
    template<class Iterator>
    static
    sequence_t
    from_segments(Iterator first, Iterator last) {
        sequence_t result;
        for (; first != last; ++first) {
            result.append(segment_type(*first));
        }

        return result;
    }

    /// Appends a segment to the end of the sequence. Empty segments are ignored.
    void
    append(const segment_type& segment);

    std::size_t
    size() const {
        return size_;
    }

    bool
    empty() const {
        return size_ == 0;
    }

    /// Whether the whole sequence lives in a single segment.
    bool
    contiguous() const {
        return segments_.size() <= 1;
    }

    const segments_type&
    segments() const {
        return segments_;
    }

    /// Returns the sub-sequence of `length` bytes starting at `offset`.
    sequence_t
    slice(std::size_t offset, std::size_t length) const;

    sequence_t
    slice(std::size_t offset) const;

    /// Copies the whole sequence into a flat vector.
    std::vector<char>
    to_vector() const;

    std::string
    to_string() const;
};

/*!
 * Position within a sequence.
 *
 * Cursors are cheap to copy, which makes them usable as checkpoints: copy, attempt a decode and
 * commit by assigning back only on success.
 *
 * \warning the cursor refers to the sequence, which must outlive it.
 */
class cursor_t {
    const sequence_t* sequence_;
    std::size_t segment_;
    std::size_t offset_;
    std::size_t position_;

public:
    cursor_t();
    explicit cursor_t(const sequence_t& sequence);

    const sequence_t&
    sequence() const {
        return *sequence_;
    }

    /// Number of bytes already consumed from the beginning of the sequence.
    std::size_t
    position() const {
        return position_;
    }

    std::size_t
    remaining() const;

    bool
    end() const {
        return remaining() == 0;
    }

    /// Peeks at the next byte without consuming it.
    bool
    try_peek(std::uint8_t& value) const;

    /// Copies up to `size` bytes starting at the cursor without consuming them. Returns the number
    /// of copied bytes.
    std::size_t
    peek(char* data, std::size_t size) const;

    /// Returns the contiguous run of bytes available before the next segment boundary.
    boost::asio::const_buffer
    span() const;

    /// Consumes `size` bytes if they are all available.
    bool
    try_advance(std::size_t size);

    /// Copies and consumes `size` bytes if they are all available.
    bool
    try_copy(char* data, std::size_t size);

    /// Compares the next `size` bytes against the given memory without consuming them.
    bool
    equals(const char* data, std::size_t size) const;

    /// Returns the unconsumed rest of the sequence.
    sequence_t
    rest() const;

private:
    void
    skip_empty();
};

} // namespace shapeshift

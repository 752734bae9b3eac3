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
#include <exception>
#include <functional>
#include <vector>

#include "shapeshift/cancellation.hpp"
#include "shapeshift/common.hpp"
#include "shapeshift/loan.hpp"
#include "shapeshift/reader.hpp"
#include "shapeshift/sequence.hpp"
#include "shapeshift/source.hpp"
#include "shapeshift/streaming_reader.hpp"

namespace shapeshift {

/*!
 * Asynchronous MessagePack reader over a byte source.
 *
 * The reader owns a buffer of fetched, not yet consumed bytes and lends synchronous views over it.
 * It is always in one of the three states:
 * - idle: every operation is allowed;
 * - lent: a view is out, only returning it is allowed;
 * - busy: a fetch is in flight, nothing is allowed until its handler is invoked.
 * Any other call throws loan_violation_error.
 *
 * Typical usage is to lend a streaming reader, attempt decoding, return it and fetch more bytes
 * when the result was `decode_result::insufficient_data`.
 *
 * \warning the source must outlive the reader, and the reader must outlive its pending operations.
 */
class async_reader_t {
public:
    typedef std::function<void(const std::exception_ptr&)> handler_type;

private:
    source_t& source;
    cancellation_t cancellation;
    std::size_t minimum_fetch_size;
    detail::lender_t lender;

    std::vector<char> storage;
    std::size_t head;
    std::size_t tail;
    std::size_t consumed;
    bool eof_;

    /// View over the unconsumed bytes, referred to by lent readers.
    sequence_t buffered_;

    /// Skip progress carried between streaming readers.
    skip_state_t skip;

    /// Progress of probing for the next whole structure, relative to the head.
    std::size_t probe_offset;
    skip_state_t probe;

    cancellation_t::registration_type registration;

public:
    async_reader_t(source_t& source,
                   std::size_t minimum_fetch_size = 4096,
                   cancellation_t cancellation = cancellation_t());

    ~async_reader_t();

    SHAPESHIFT_DECLARE_NONCOPYABLE(async_reader_t)

    /// Number of fetched bytes not consumed yet.
    std::size_t
    buffered() const {
        return tail - head;
    }

    /// Number of bytes consumed from the beginning of the stream.
    std::size_t
    position() const {
        return consumed;
    }

    /// Whether the source has reported the end of the stream.
    bool
    eof() const {
        return eof_;
    }

    bool
    lent() const {
        return lender.state() == detail::lender_t::state_t::lent;
    }

    /// Lends a non-throwing reader over everything buffered so far.
    loan<streaming_reader_t>
    create_streaming_reader(object_layout layout = object_layout::map);

    /// Lends a throwing reader over everything buffered so far.
    ///
    /// Meant to be used after `buffer_next_structure` or `buffered_structures_count`, which
    /// guarantee that the structures read through it are complete.
    loan<reader_t>
    create_buffered_reader(object_layout layout = object_layout::map);

    /// Takes back the reader, consuming everything it has read.
    void
    return_reader(loan<streaming_reader_t>&& reader);

    void
    return_reader(loan<reader_t>&& reader);

    /// Fetches at least one more byte from the source.
    ///
    /// Completes successfully without new bytes when the stream has ended, after which
    /// `eof()` returns true. Fails with end_of_stream_error when called after that.
    void
    fetch_more_bytes(handler_type handler);

    /// Fetches until the next whole structure is buffered.
    ///
    /// After a streaming reader has been returned in the middle of `try_skip`, this is the rest of
    /// the structure being skipped.
    ///
    /// Completes with end_of_stream_error when the stream ends before the structure does.
    void
    buffer_next_structure(context_t& context, handler_type handler);

    /// Counts the whole structures buffered, stopping at the given limit.
    ///
    /// The rest of a structure a streaming reader was interrupted skipping is not counted, and
    /// nothing is when that rest is not buffered yet.
    std::size_t
    buffered_structures_count(std::size_t limit, context_t& context);

private:
    void
    rebuild();

    void
    consume(std::size_t size);

    void
    on_fetch(const boost::system::error_code& ec, std::size_t size, handler_type handler);

    void
    on_buffered(const std::exception_ptr& err, context_t& context, handler_type handler);
};

} // namespace shapeshift

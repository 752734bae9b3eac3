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

#include "shapeshift/buffer.hpp"
#include "shapeshift/cancellation.hpp"
#include "shapeshift/common.hpp"
#include "shapeshift/loan.hpp"
#include "shapeshift/sink.hpp"
#include "shapeshift/writer.hpp"

namespace shapeshift {

/*!
 * Asynchronous MessagePack writer over a byte sink.
 *
 * Lends synchronous writers appending to its internal buffer and pushes the buffered bytes to the
 * sink on flush. Follows the same idle/lent/busy protocol as the asynchronous reader.
 *
 * \warning the sink must outlive the writer, and the writer must outlive its pending operations.
 */
class async_writer_t {
public:
    typedef std::function<void(const std::exception_ptr&)> handler_type;

private:
    sink_t& sink;
    cancellation_t cancellation;
    std::size_t threshold;
    detail::lender_t lender;
    output_buffer_t buffer;
    std::size_t flushing;
    std::size_t flushed_;
    cancellation_t::registration_type registration;

public:
    async_writer_t(sink_t& sink,
                   std::size_t unflushed_bytes_threshold = 64 * 1024,
                   cancellation_t cancellation = cancellation_t());

    ~async_writer_t();

    SHAPESHIFT_DECLARE_NONCOPYABLE(async_writer_t)

    /// Number of bytes written, but not flushed yet.
    std::size_t
    unflushed() const {
        return buffer.size();
    }

    /// Total number of bytes pushed to the sink.
    std::size_t
    flushed() const {
        return flushed_;
    }

    bool
    lent() const {
        return lender.state() == detail::lender_t::state_t::lent;
    }

    /// Lends a synchronous writer appending to the buffer.
    loan<writer_t>
    create_writer(object_layout layout = object_layout::map);

    /// Takes back the writer, keeping everything it has written.
    void
    return_writer(loan<writer_t>&& writer);

    /// Whether enough bytes are buffered to be worth flushing.
    bool
    is_time_to_flush() const;

    /// Flushes when enough bytes are buffered, completes immediately otherwise.
    void
    flush_if_appropriate(handler_type handler);

    /// Pushes every buffered byte to the sink.
    ///
    /// Fails with end_of_stream_error when the sink no longer accepts data.
    void
    flush(handler_type handler);

    /// Convenience methods that lend a writer internally.
    void
    write_nil();

    void
    write_array_header(std::uint32_t count);

    void
    write_map_header(std::uint32_t count);

    void
    write_raw(const sequence_t& data);

private:
    void
    on_flush(const boost::system::error_code& ec, handler_type handler);
};

} // namespace shapeshift

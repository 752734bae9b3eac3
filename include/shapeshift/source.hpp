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
#include <deque>
#include <functional>
#include <string>
#include <vector>

#include <boost/asio/buffer.hpp>
#include <boost/asio/error.hpp>
#include <boost/system/error_code.hpp>

#include "shapeshift/common.hpp"
#include "shapeshift/config.hpp"

namespace shapeshift {

/*!
 * Asynchronous byte source.
 *
 * Completion handlers receive the number of bytes read. The end of the stream is reported with
 * `boost::asio::error::eof` and zero bytes, an aborted read with `boost::asio::error::operation_aborted`.
 */
class source_t {
public:
    typedef std::function<void(const boost::system::error_code&, std::size_t)> handler_type;

    virtual
    ~source_t() {}

    /// Reads at least one byte into the given memory, unless the stream has ended.
    ///
    /// \warning the memory must stay valid until the handler is invoked.
    virtual
    void
    async_read_some(char* data, std::size_t size, handler_type handler) = 0;

    /// Aborts the pending read, if any.
    virtual
    void
    cancel() {}
};

/*!
 * In-memory source, delivering the given chunks one read at a time.
 *
 * Reads are completed through the event loop, never inline. A read issued when no chunk is
 * available stays pending until more data is pushed or the source is closed.
 */
class memory_source_t : public source_t {
    struct request_t {
        char* data;
        std::size_t size;
        handler_type handler;
    };

    loop_t& loop;
    std::deque<std::string> chunks;
    std::size_t offset;
    bool closed;
    bool pending;
    request_t request;
    std::size_t reads_;

public:
    /// Creates an open source.
    explicit memory_source_t(loop_t& loop);

    /// Creates a source that is closed once the given chunks are consumed.
    memory_source_t(loop_t& loop, std::vector<std::string> chunks);

    SHAPESHIFT_DECLARE_NONCOPYABLE(memory_source_t)

    /// Appends a chunk, completing the pending read if any.
    void
    push(std::string chunk);

    /// Marks the end of the stream.
    void
    close();

    /// Number of completed reads.
    std::size_t
    reads() const {
        return reads_;
    }

    void
    async_read_some(char* data, std::size_t size, handler_type handler);

    void
    cancel();

private:
    void
    complete();
};

/*!
 * Adapter for any Boost.Asio asynchronous read stream, e.g. a socket or a stream descriptor.
 *
 * \warning the stream must outlive the adapter.
 */
template<class Stream>
class stream_source : public source_t {
    Stream& stream;

public:
    explicit stream_source(Stream& stream) :
        stream(stream)
    {}

    void
    async_read_some(char* data, std::size_t size, handler_type handler) {
        stream.async_read_some(boost::asio::buffer(data, size), std::move(handler));
    }

    void
    cancel() {
        stream.cancel();
    }
};

} // namespace shapeshift

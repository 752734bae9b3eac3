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
#include <functional>
#include <string>

#include <boost/asio/buffer.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/write.hpp>
#include <boost/system/error_code.hpp>

#include "shapeshift/common.hpp"
#include "shapeshift/config.hpp"

namespace shapeshift {

/*!
 * Asynchronous byte sink.
 *
 * The handler is invoked once every byte has been written, or with an error. A sink that stopped
 * accepting data reports `boost::asio::error::broken_pipe`.
 */
class sink_t {
public:
    typedef std::function<void(const boost::system::error_code&)> handler_type;

    virtual
    ~sink_t() {}

    /// \warning the memory must stay valid until the handler is invoked.
    virtual
    void
    async_write(const char* data, std::size_t size, handler_type handler) = 0;

    virtual
    void
    cancel() {}
};

/// In-memory sink, completing every write through the event loop.
class memory_sink_t : public sink_t {
    loop_t& loop;
    std::string data_;
    std::size_t writes_;
    bool closed;

public:
    explicit memory_sink_t(loop_t& loop);

    SHAPESHIFT_DECLARE_NONCOPYABLE(memory_sink_t)

    const std::string&
    data() const {
        return data_;
    }

    /// Number of completed writes.
    std::size_t
    writes() const {
        return writes_;
    }

    /// Stops accepting data, failing subsequent writes.
    void
    close();

    void
    async_write(const char* data, std::size_t size, handler_type handler);
};

/// Adapter for any Boost.Asio asynchronous write stream.
template<class Stream>
class stream_sink : public sink_t {
    Stream& stream;

public:
    explicit stream_sink(Stream& stream) :
        stream(stream)
    {}

    void
    async_write(const char* data, std::size_t size, handler_type handler) {
        boost::asio::async_write(stream, boost::asio::buffer(data, size),
            std::bind(&stream_sink::on_write, std::placeholders::_1, std::move(handler)));
    }

    void
    cancel() {
        stream.cancel();
    }

private:
    static
    void
    on_write(const boost::system::error_code& ec, const handler_type& handler) {
        handler(ec);
    }
};

} // namespace shapeshift

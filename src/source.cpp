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

#include "shapeshift/source.hpp"
#include "shapeshift/sink.hpp"

#include <algorithm>
#include <cstring>

#include "shapeshift/detail/log.hpp"

using namespace shapeshift;

namespace ph = std::placeholders;

namespace {

void
deliver_read(const source_t::handler_type& handler, const boost::system::error_code& ec, std::size_t size) {
    handler(ec, size);
}

void
deliver_write(const sink_t::handler_type& handler, const boost::system::error_code& ec) {
    handler(ec);
}

} // namespace

memory_source_t::memory_source_t(loop_t& loop) :
    loop(loop),
    offset(0),
    closed(false),
    pending(false),
    reads_(0)
{}

memory_source_t::memory_source_t(loop_t& loop, std::vector<std::string> chunks) :
    loop(loop),
    offset(0),
    closed(true),
    pending(false),
    reads_(0)
{
    for (auto it = chunks.begin(); it != chunks.end(); ++it) {
        if (!it->empty()) {
            this->chunks.push_back(std::move(*it));
        }
    }
}

void
memory_source_t::push(std::string chunk) {
    if (!chunk.empty()) {
        chunks.push_back(std::move(chunk));
    }

    if (pending) {
        complete();
    }
}

void
memory_source_t::close() {
    closed = true;

    if (pending) {
        complete();
    }
}

void
memory_source_t::async_read_some(char* data, std::size_t size, handler_type handler) {
    request.data = data;
    request.size = size;
    request.handler = std::move(handler);
    pending = true;

    if (!chunks.empty() || closed) {
        complete();
    }
}

void
memory_source_t::cancel() {
    if (!pending) {
        return;
    }

    pending = false;
    loop.post(std::bind(&deliver_read,
        std::move(request.handler), boost::asio::error::operation_aborted, std::size_t(0)));
}

void
memory_source_t::complete() {
    pending = false;

    if (chunks.empty()) {
        loop.post(std::bind(&deliver_read,
            std::move(request.handler), boost::asio::error::eof, std::size_t(0)));
        return;
    }

    const std::string& chunk = chunks.front();
    const std::size_t size = std::min(request.size, chunk.size() - offset);

    std::memcpy(request.data, chunk.data() + offset, size);
    offset += size;

    if (offset == chunk.size()) {
        chunks.pop_front();
        offset = 0;
    }

    ++reads_;
    loop.post(std::bind(&deliver_read, std::move(request.handler), boost::system::error_code(), size));
}

memory_sink_t::memory_sink_t(loop_t& loop) :
    loop(loop),
    writes_(0),
    closed(false)
{}

void
memory_sink_t::close() {
    closed = true;
}

void
memory_sink_t::async_write(const char* data, std::size_t size, handler_type handler) {
    if (closed) {
        loop.post(std::bind(&deliver_write, std::move(handler), boost::asio::error::broken_pipe));
        return;
    }

    data_.append(data, size);
    ++writes_;
    loop.post(std::bind(&deliver_write, std::move(handler), boost::system::error_code()));
}

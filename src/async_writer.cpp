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

#include "shapeshift/async_writer.hpp"

#include <boost/system/system_error.hpp>

#include "shapeshift/error.hpp"

#include "shapeshift/detail/log.hpp"

using namespace shapeshift;

namespace ph = std::placeholders;

async_writer_t::async_writer_t(sink_t& sink, std::size_t unflushed_bytes_threshold, cancellation_t cancellation) :
    sink(sink),
    cancellation(std::move(cancellation)),
    threshold(unflushed_bytes_threshold),
    lender("async writer"),
    flushing(0),
    flushed_(0),
    registration(0)
{}

async_writer_t::~async_writer_t() {
    if (lender.state() != detail::lender_t::state_t::idle) {
        SHAPESHIFT_WRN("async writer: destroyed while not idle");
    }

    if (registration != 0) {
        cancellation.unsubscribe(registration);
    }
}

loan<writer_t>
async_writer_t::create_writer(object_layout layout) {
    const std::uint64_t id = lender.lend();
    return loan<writer_t>(writer_t(buffer, layout), this, id);
}

void
async_writer_t::return_writer(loan<writer_t>&& writer) {
    lender.take_back(this, writer.owner(), writer.id());
    writer.release();
}

bool
async_writer_t::is_time_to_flush() const {
    lender.ensure_idle("check the flush threshold");
    return buffer.size() >= threshold;
}

void
async_writer_t::flush_if_appropriate(handler_type handler) {
    if (is_time_to_flush()) {
        flush(std::move(handler));
        return;
    }

    if (cancellation.cancelled()) {
        handler(shapeshift::make_exception_ptr(cancelled_error()));
        return;
    }

    handler(std::exception_ptr());
}

void
async_writer_t::flush(handler_type handler) {
    lender.ensure_idle("flush");

    if (cancellation.cancelled()) {
        handler(shapeshift::make_exception_ptr(cancelled_error()));
        return;
    }

    if (buffer.empty()) {
        handler(std::exception_ptr());
        return;
    }

    lender.begin("flush");
    flushing = buffer.size();

    SHAPESHIFT_DBG(">> flush: %llu bytes", SHAPESHIFT_US(flushing));

    registration = cancellation.subscribe(std::bind(&sink_t::cancel, &sink));
    sink.async_write(buffer.data(), flushing,
        std::bind(&async_writer_t::on_flush, this, ph::_1, std::move(handler)));
}

void
async_writer_t::on_flush(const boost::system::error_code& ec, handler_type handler) {
    if (registration != 0) {
        cancellation.unsubscribe(registration);
        registration = 0;
    }

    lender.end();

    SHAPESHIFT_DBG("<< flush: %s", ec ? ec.message().c_str() : "ok");

    if (ec == boost::asio::error::operation_aborted || cancellation.cancelled()) {
        handler(shapeshift::make_exception_ptr(cancelled_error()));
        return;
    }

    if (ec == boost::asio::error::broken_pipe || ec == boost::asio::error::eof) {
        handler(shapeshift::make_exception_ptr(end_of_stream_error()));
        return;
    }

    if (ec) {
        handler(shapeshift::make_exception_ptr(boost::system::system_error(ec)));
        return;
    }

    buffer.consume(flushing);
    flushed_ += flushing;
    flushing = 0;

    handler(std::exception_ptr());
}

void
async_writer_t::write_nil() {
    auto writer = create_writer();
    writer->write_nil();
    return_writer(std::move(writer));
}

void
async_writer_t::write_array_header(std::uint32_t count) {
    auto writer = create_writer();
    writer->write_array_header(count);
    return_writer(std::move(writer));
}

void
async_writer_t::write_map_header(std::uint32_t count) {
    auto writer = create_writer();
    writer->write_map_header(count);
    return_writer(std::move(writer));
}

void
async_writer_t::write_raw(const sequence_t& data) {
    auto writer = create_writer();
    writer->write_raw(data);
    return_writer(std::move(writer));
}

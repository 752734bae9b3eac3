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

#include "shapeshift/async_reader.hpp"

#include <algorithm>
#include <cstring>

#include <boost/system/system_error.hpp>

#include "shapeshift/context.hpp"
#include "shapeshift/error.hpp"

#include "shapeshift/detail/log.hpp"

using namespace shapeshift;

namespace ph = std::placeholders;

async_reader_t::async_reader_t(source_t& source, std::size_t minimum_fetch_size, cancellation_t cancellation) :
    source(source),
    cancellation(std::move(cancellation)),
    minimum_fetch_size(std::max<std::size_t>(minimum_fetch_size, 1)),
    lender("async reader"),
    head(0),
    tail(0),
    consumed(0),
    eof_(false),
    probe_offset(0),
    registration(0)
{}

async_reader_t::~async_reader_t() {
    if (lender.state() != detail::lender_t::state_t::idle) {
        SHAPESHIFT_WRN("async reader: destroyed while not idle");
    }

    if (registration != 0) {
        cancellation.unsubscribe(registration);
    }
}

loan<streaming_reader_t>
async_reader_t::create_streaming_reader(object_layout layout) {
    const std::uint64_t id = lender.lend();
    return loan<streaming_reader_t>(streaming_reader_t(cursor_t(buffered_), eof_, skip, layout), this, id);
}

loan<reader_t>
async_reader_t::create_buffered_reader(object_layout layout) {
    const std::uint64_t id = lender.lend();
    return loan<reader_t>(reader_t(buffered_, layout), this, id);
}

void
async_reader_t::return_reader(loan<streaming_reader_t>&& reader) {
    lender.take_back(this, reader.owner(), reader.id());

    const streaming_reader_t view = reader.release();
    skip = view.skip_state();
    consume(view.position());
}

void
async_reader_t::return_reader(loan<reader_t>&& reader) {
    lender.take_back(this, reader.owner(), reader.id());

    const reader_t view = reader.release();
    consume(view.position());
}

void
async_reader_t::fetch_more_bytes(handler_type handler) {
    lender.ensure_idle("fetch more bytes");

    if (eof_) {
        handler(shapeshift::make_exception_ptr(end_of_stream_error()));
        return;
    }

    if (cancellation.cancelled()) {
        handler(shapeshift::make_exception_ptr(cancelled_error()));
        return;
    }

    if (head > 0) {
        std::memmove(storage.data(), storage.data() + head, tail - head);
        tail -= head;
        head = 0;
    }

    if (storage.size() - tail < minimum_fetch_size) {
        storage.resize(std::max(storage.size() * 2, tail + minimum_fetch_size));
    }

    rebuild();
    lender.begin("fetch more bytes");

    SHAPESHIFT_DBG(">> fetch: %llu bytes buffered", SHAPESHIFT_US(buffered()));

    registration = cancellation.subscribe(std::bind(&source_t::cancel, &source));
    source.async_read_some(storage.data() + tail, storage.size() - tail,
        std::bind(&async_reader_t::on_fetch, this, ph::_1, ph::_2, std::move(handler)));
}

void
async_reader_t::on_fetch(const boost::system::error_code& ec, std::size_t size, handler_type handler) {
    if (registration != 0) {
        cancellation.unsubscribe(registration);
        registration = 0;
    }

    lender.end();
    tail += size;
    rebuild();

    SHAPESHIFT_DBG("<< fetch: %llu bytes, %s", SHAPESHIFT_US(size), ec ? ec.message().c_str() : "ok");

    if (ec == boost::asio::error::operation_aborted || cancellation.cancelled()) {
        handler(shapeshift::make_exception_ptr(cancelled_error()));
        return;
    }

    if (ec == boost::asio::error::eof || (!ec && size == 0)) {
        eof_ = true;
        handler(std::exception_ptr());
        return;
    }

    if (ec) {
        handler(shapeshift::make_exception_ptr(boost::system::system_error(ec)));
        return;
    }

    handler(std::exception_ptr());
}

void
async_reader_t::buffer_next_structure(context_t& context, handler_type handler) {
    lender.ensure_idle("buffer the next structure");

    cursor_t cursor(buffered_);
    cursor.try_advance(probe_offset);

    // A fresh probe first completes the skip the last streaming reader was interrupted in.
    if (probe_offset == 0 && probe.empty()) {
        probe = skip;
    }

    streaming_reader_t reader(cursor, eof_, probe);

    decode_result result;
    try {
        result = reader.try_skip(context);
    } catch (const std::exception&) {
        probe_offset = 0;
        probe = skip_state_t();
        handler(std::current_exception());
        return;
    }

    switch (result) {
    case decode_result::success:
        probe_offset = 0;
        probe = skip_state_t();
        handler(std::exception_ptr());
        break;
    case decode_result::insufficient_data:
        probe_offset = reader.position();
        probe = reader.skip_state();
        fetch_more_bytes(std::bind(&async_reader_t::on_buffered, this, ph::_1, std::ref(context), std::move(handler)));
        break;
    default:
        probe_offset = 0;
        probe = skip_state_t();
        handler(shapeshift::make_exception_ptr(end_of_stream_error()));
        break;
    }
}

void
async_reader_t::on_buffered(const std::exception_ptr& err, context_t& context, handler_type handler) {
    if (err) {
        handler(err);
        return;
    }

    buffer_next_structure(context, std::move(handler));
}

std::size_t
async_reader_t::buffered_structures_count(std::size_t limit, context_t& context) {
    lender.ensure_idle("count buffered structures");

    streaming_reader_t reader(cursor_t(buffered_), eof_, skip);

    // The rest of an interrupted skip is not a structure of its own.
    if (!skip.empty() && reader.try_skip(context) != decode_result::success) {
        return 0;
    }

    std::size_t count = 0;
    while (count < limit && reader.try_skip(context) == decode_result::success) {
        ++count;
    }

    return count;
}

void
async_reader_t::rebuild() {
    buffered_ = sequence_t(storage.data() + head, tail - head);
}

void
async_reader_t::consume(std::size_t size) {
    if (size == 0) {
        return;
    }

    consumed += std::min(size, tail - head);
    head = std::min(head + size, tail);
    if (head == tail) {
        head = 0;
        tail = 0;
    }

    probe_offset = 0;
    probe = skip_state_t();
    rebuild();
}

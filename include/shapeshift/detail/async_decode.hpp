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

#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <utility>

#include "shapeshift/async_reader.hpp"
#include "shapeshift/common.hpp"
#include "shapeshift/error.hpp"
#include "shapeshift/streaming_reader.hpp"

namespace shapeshift {

namespace detail {

/// Retries a non-throwing decode step over a lent streaming reader, fetching more bytes until the
/// step either succeeds or fails for good.
template<class T>
class decode_op : public std::enable_shared_from_this<decode_op<T>> {
public:
    typedef std::function<decode_result(streaming_reader_t&, T&)> step_type;
    typedef std::function<void(const std::exception_ptr&, T)> handler_type;

private:
    async_reader_t& reader;
    object_layout layout;
    const char* expected;
    step_type step;
    handler_type handler;

public:
    decode_op(async_reader_t& reader, object_layout layout, const char* expected, step_type step, handler_type handler) :
        reader(reader),
        layout(layout),
        expected(expected),
        step(std::move(step)),
        handler(std::move(handler))
    {}

    void
    run() {
        T value = T();
        std::uint8_t code = 0;
        const std::size_t offset = reader.position();

        decode_result result;
        try {
            auto view = reader.create_streaming_reader(layout);
            try {
                view->try_peek_code(code);
                result = step(*view, value);
            } catch (...) {
                reader.return_reader(std::move(view));
                throw;
            }
            reader.return_reader(std::move(view));
        } catch (const std::exception&) {
            handler(std::current_exception(), T());
            return;
        }

        switch (result) {
        case decode_result::success:
            handler(std::exception_ptr(), std::move(value));
            break;
        case decode_result::insufficient_data:
            reader.fetch_more_bytes(std::bind(&decode_op::on_fetch, this->shared_from_this(), std::placeholders::_1));
            break;
        case decode_result::end_of_stream:
            handler(shapeshift::make_exception_ptr(end_of_stream_error(offset)), T());
            break;
        default:
            handler(shapeshift::make_exception_ptr(unexpected_token_error(code, offset, expected)), T());
            break;
        }
    }

private:
    void
    on_fetch(const std::exception_ptr& err) {
        if (err) {
            handler(err, T());
            return;
        }

        run();
    }
};

template<class T>
void
async_decode(async_reader_t& reader,
             object_layout layout,
             const char* expected,
             typename decode_op<T>::step_type step,
             typename decode_op<T>::handler_type handler)
{
    std::make_shared<decode_op<T>>(reader, layout, expected, std::move(step), std::move(handler))->run();
}

/// Reads a collection header asynchronously. Nil yields `none` set.
struct header_t {
    bool nil;
    std::uint32_t count;

    header_t() :
        nil(false),
        count(0)
    {}
};

inline
decode_result
try_read_array_or_nil(streaming_reader_t& reader, header_t& header) {
    const decode_result result = reader.try_read_nil();
    if (result == decode_result::success) {
        header.nil = true;
        return result;
    }

    if (result != decode_result::token_mismatch) {
        return result;
    }

    return reader.try_read_array_header(header.count);
}

inline
decode_result
try_read_map_or_nil(streaming_reader_t& reader, header_t& header) {
    const decode_result result = reader.try_read_nil();
    if (result == decode_result::success) {
        header.nil = true;
        return result;
    }

    if (result != decode_result::token_mismatch) {
        return result;
    }

    return reader.try_read_map_header(header.count);
}

/*!
 * Drives a loop of possibly asynchronous steps without growing the stack when steps complete
 * inline.
 *
 * A step is started with `begin()` and finished with `complete()`. When `complete()` is called
 * from within the step, `pending()` returns false right after the step returns, and the caller
 * proceeds to the next iteration. Otherwise the completion resumes the loop itself.
 */
class trampoline_t {
    bool inside;
    bool done;

public:
    trampoline_t() :
        inside(false),
        done(false)
    {}

    void
    begin() {
        inside = true;
        done = false;
    }

    /// Returns true when the loop must be resumed by the caller of `complete()`.
    bool
    complete() {
        done = true;
        return !inside;
    }

    /// Returns true when the step is still in flight after it returned.
    bool
    pending() {
        inside = false;
        return !done;
    }
};

} // namespace detail

} // namespace shapeshift

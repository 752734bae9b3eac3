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

#include <exception>
#include <functional>
#include <utility>

#include "shapeshift/async_reader.hpp"
#include "shapeshift/async_writer.hpp"
#include "shapeshift/context.hpp"
#include "shapeshift/reader.hpp"
#include "shapeshift/writer.hpp"

namespace shapeshift {

class converter_base_t {
public:
    virtual
    ~converter_base_t() {}

    /// Whether the converter benefits from reading and writing incrementally when used
    /// asynchronously, instead of buffering whole structures.
    virtual
    bool
    prefers_async() const {
        return false;
    }
};

/*!
 * Encodes and decodes values of a single type.
 *
 * Converters are stateless and may be shared between concurrent operations. Every bit of
 * per-operation state lives in the context.
 *
 * The asynchronous defaults buffer the whole structure and delegate to the synchronous methods.
 * Converters of large aggregates override them to process elements as they arrive.
 */
template<class T>
class converter : public converter_base_t {
public:
    typedef T value_type;

    typedef std::function<void(const std::exception_ptr&)> write_handler;
    typedef std::function<void(const std::exception_ptr&, T)> read_handler;

    virtual
    void
    write(writer_t& writer, const T& value, context_t& context) const = 0;

    virtual
    T
    read(reader_t& reader, context_t& context) const = 0;

    /// Writes the value through a lent writer, flushing when enough bytes are buffered.
    ///
    /// \warning the value must stay valid until the handler is invoked.
    virtual
    void
    write_async(async_writer_t& writer, const T& value, context_t& context, write_handler handler) const {
        try {
            auto view = writer.create_writer(context.layout());
            try {
                write(*view, value, context);
            } catch (...) {
                writer.return_writer(std::move(view));
                throw;
            }
            writer.return_writer(std::move(view));
        } catch (const std::exception&) {
            handler(std::current_exception());
            return;
        }

        writer.flush_if_appropriate(std::move(handler));
    }

    /// Buffers the next whole structure and reads it through a lent reader.
    virtual
    void
    read_async(async_reader_t& reader, context_t& context, read_handler handler) const {
        const int depth = context.depth();

        reader.buffer_next_structure(context,
            std::bind(&converter::on_buffered, this,
                std::placeholders::_1, std::ref(reader), std::ref(context), depth, std::move(handler)));
    }

protected:
    /// Reads one value synchronously from the bytes already buffered by the reader.
    T
    read_buffered(async_reader_t& reader, context_t& context) const {
        auto view = reader.create_buffered_reader(context.layout());

        try {
            T value = read(*view, context);
            reader.return_reader(std::move(view));
            return value;
        } catch (...) {
            reader.return_reader(std::move(view));
            throw;
        }
    }

private:
    void
    on_buffered(const std::exception_ptr& err, async_reader_t& reader, context_t& context, int depth,
                const read_handler& handler) const
    {
        context.restore_depth(depth);

        if (err) {
            handler(err, T());
            return;
        }

        T value;
        try {
            value = read_buffered(reader, context);
        } catch (const std::exception&) {
            handler(std::current_exception(), T());
            return;
        }

        handler(std::exception_ptr(), std::move(value));
    }
};

} // namespace shapeshift

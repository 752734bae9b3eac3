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

#include <algorithm>
#include <cstdint>
#include <functional>
#include <memory>
#include <type_traits>
#include <vector>

#include "shapeshift/converter.hpp"
#include "shapeshift/converters/primitive.hpp"

#include "shapeshift/detail/accelerated.hpp"
#include "shapeshift/detail/async_decode.hpp"

namespace shapeshift {

namespace detail {

/// Upper bound of elements reserved up front, whatever the announced count is.
const std::size_t max_reserved_elements = 64 * 1024;

template<class T, class = void>
struct builtin_converter {
    typedef integer_converter<T> type;
};

template<class T>
struct builtin_converter<T, typename std::enable_if<std::is_floating_point<T>::value>::type> {
    typedef floating_converter<T> type;
};

template<>
struct builtin_converter<bool> {
    typedef boolean_converter type;
};

/// Bulk coding applies only while the element type keeps its built-in converter.
template<class T>
bool
use_bulk(context_t& context) {
    if (!context.options().hardware_acceleration) {
        return false;
    }

    return dynamic_cast<const typename builtin_converter<T>::type*>(context.converter_for<T>().get()) != nullptr;
}

template<class T, class Iterator>
void
write_elements(writer_t& writer, Iterator first, Iterator last, context_t& context, std::false_type) {
    auto element = context.converter_for<T>();
    for (; first != last; ++first) {
        element->write(writer, *first, context);
    }
}

template<class T, class Iterator>
void
write_elements(writer_t& writer, Iterator first, Iterator last, context_t& context, std::true_type) {
    if (use_bulk<T>(context)) {
        write_bulk(writer, first, last);
    } else {
        write_elements<T>(writer, first, last, context, std::false_type());
    }
}

template<class T, class Container>
void
read_elements(reader_t& reader, std::size_t count, Container& values, context_t& context, std::false_type) {
    auto element = context.converter_for<T>();
    for (std::size_t i = 0; i < count; ++i) {
        values.push_back(element->read(reader, context));
    }
}

template<class T, class Container>
void
read_elements(reader_t& reader, std::size_t count, Container& values, context_t& context, std::true_type) {
    if (use_bulk<T>(context)) {
        read_bulk<T>(reader, count, values);
    } else {
        read_elements<T>(reader, count, values, context, std::false_type());
    }
}

template<class T, class Container>
void
read_elements(reader_t& reader, std::size_t count, Container& values, context_t& context) {
    read_elements<T>(reader, count, values, context, is_accelerated<T>());
}

template<class T, class Iterator>
void
write_elements(writer_t& writer, Iterator first, Iterator last, context_t& context) {
    write_elements<T>(writer, first, last, context, is_accelerated<T>());
}

/*!
 * Reads an array element by element as the bytes arrive.
 *
 * Elements with asynchronous converters are read one at a time. The rest are read in batches of
 * whatever whole structures are already buffered.
 */
template<class T, class Allocator>
class vector_read_op : public std::enable_shared_from_this<vector_read_op<T, Allocator>> {
public:
    typedef std::vector<T, Allocator> value_type;
    typedef std::function<void(const std::exception_ptr&, value_type)> handler_type;

private:
    async_reader_t& reader;
    context_t& context;
    handler_type handler;

    std::shared_ptr<const converter<T>> element;
    value_type result;
    std::uint32_t count;
    std::uint32_t index;
    int depth;
    trampoline_t trampoline;

public:
    vector_read_op(async_reader_t& reader, context_t& context, handler_type handler) :
        reader(reader),
        context(context),
        handler(std::move(handler)),
        count(0),
        index(0),
        depth(context.depth())
    {}

    void
    run() {
        try {
            element = context.converter_for<T>();
        } catch (const std::exception&) {
            finish(std::current_exception());
            return;
        }

        async_decode<header_t>(reader, context.layout(), "array", &try_read_array_or_nil,
            std::bind(&vector_read_op::on_header, this->shared_from_this(), std::placeholders::_1,
                std::placeholders::_2));
    }

private:
    void
    on_header(const std::exception_ptr& err, header_t header) {
        context.restore_depth(depth);

        if (err) {
            finish(err);
            return;
        }

        if (header.nil) {
            finish(std::exception_ptr());
            return;
        }

        try {
            context.depth_step();
        } catch (const std::exception&) {
            finish(std::current_exception());
            return;
        }

        count = header.count;
        result.reserve(std::min<std::size_t>(count, max_reserved_elements));
        next();
    }

    void
    next() {
        while (index < count) {
            context.restore_depth(depth + 1);

            if (!element->prefers_async()) {
                std::size_t consumed = 0;
                try {
                    consumed = read_buffered();
                } catch (const std::exception&) {
                    finish(std::current_exception());
                    return;
                }

                if (consumed > 0) {
                    continue;
                }
            }

            trampoline.begin();

            if (element->prefers_async()) {
                element->read_async(reader, context,
                    std::bind(&vector_read_op::on_element, this->shared_from_this(), std::placeholders::_1,
                        std::placeholders::_2));
            } else {
                reader.buffer_next_structure(context,
                    std::bind(&vector_read_op::on_buffered, this->shared_from_this(), std::placeholders::_1));
            }

            if (trampoline.pending()) {
                return;
            }
        }

        finish(std::exception_ptr());
    }

    /// Reads every whole element already buffered, returning their number.
    std::size_t
    read_buffered() {
        const std::size_t available = reader.buffered_structures_count(count - index, context);
        if (available == 0) {
            return 0;
        }

        auto view = reader.create_buffered_reader(context.layout());
        try {
            read_elements<T>(*view, available, result, context);
        } catch (...) {
            reader.return_reader(std::move(view));
            throw;
        }
        reader.return_reader(std::move(view));

        index += static_cast<std::uint32_t>(available);
        return available;
    }

    void
    on_element(const std::exception_ptr& err, T value) {
        if (err) {
            finish(err);
            return;
        }

        result.push_back(std::move(value));
        ++index;

        if (trampoline.complete()) {
            next();
        }
    }

    void
    on_buffered(const std::exception_ptr& err) {
        if (err) {
            finish(err);
            return;
        }

        if (trampoline.complete()) {
            next();
        }
    }

    void
    finish(const std::exception_ptr& err) {
        context.restore_depth(depth);

        if (err) {
            handler(err, value_type());
        } else {
            handler(err, std::move(result));
        }
    }
};

/// Writes an array, flushing between blocks of elements.
template<class T, class Allocator>
class vector_write_op : public std::enable_shared_from_this<vector_write_op<T, Allocator>> {
public:
    typedef std::vector<T, Allocator> value_type;
    typedef std::function<void(const std::exception_ptr&)> handler_type;

private:
    async_writer_t& writer;
    context_t& context;
    const value_type& value;
    handler_type handler;

    std::shared_ptr<const converter<T>> element;
    std::size_t index;
    bool started;
    int depth;
    trampoline_t trampoline;

public:
    vector_write_op(async_writer_t& writer, context_t& context, const value_type& value, handler_type handler) :
        writer(writer),
        context(context),
        value(value),
        handler(std::move(handler)),
        index(0),
        started(false),
        depth(context.depth())
    {}

    void
    run() {
        try {
            element = context.converter_for<T>();
            context.depth_step();
        } catch (const std::exception&) {
            finish(std::current_exception());
            return;
        }

        next();
    }

private:
    void
    next() {
        while (!started || index < value.size()) {
            context.restore_depth(depth + 1);
            trampoline.begin();

            if (started && element->prefers_async()) {
                element->write_async(writer, value[index++], context,
                    std::bind(&vector_write_op::on_written, this->shared_from_this(), std::placeholders::_1));
            } else {
                try {
                    write_block();
                } catch (const std::exception&) {
                    finish(std::current_exception());
                    return;
                }

                writer.flush_if_appropriate(
                    std::bind(&vector_write_op::on_written, this->shared_from_this(), std::placeholders::_1));
            }

            if (trampoline.pending()) {
                return;
            }
        }

        finish(std::exception_ptr());
    }

    /// Writes the header when not written yet, then as many synchronous elements as fit into the
    /// flush threshold.
    void
    write_block() {
        auto view = writer.create_writer(context.layout());

        try {
            if (!started) {
                view->write_array_header(static_cast<std::uint32_t>(value.size()));
                started = true;
            }

            if (!element->prefers_async()) {
                const std::size_t threshold = context.options().unflushed_bytes_threshold;
                const std::size_t step = is_accelerated<T>::value ? bulk_block_size : 1;

                while (index < value.size()) {
                    const std::size_t last = std::min(value.size(), index + step);
                    write_elements<T>(*view, value.begin() + index, value.begin() + last, context);
                    index = last;

                    if (view->written() >= threshold) {
                        break;
                    }
                }
            }
        } catch (...) {
            writer.return_writer(std::move(view));
            throw;
        }

        writer.return_writer(std::move(view));
    }

    void
    on_written(const std::exception_ptr& err) {
        if (err) {
            finish(err);
            return;
        }

        if (trampoline.complete()) {
            next();
        }
    }

    void
    finish(const std::exception_ptr& err) {
        context.restore_depth(depth);
        handler(err);
    }
};

} // namespace detail

/// Arrays of any element type.
template<class T, class Allocator = std::allocator<T>>
class vector_converter : public converter<std::vector<T, Allocator>> {
public:
    typedef std::vector<T, Allocator> value_type;
    typedef typename converter<value_type>::read_handler read_handler;
    typedef typename converter<value_type>::write_handler write_handler;

    virtual
    bool
    prefers_async() const {
        return true;
    }

    virtual
    void
    write(writer_t& writer, const value_type& value, context_t& context) const {
        context_t::depth_scope_t scope(context);

        writer.write_array_header(static_cast<std::uint32_t>(value.size()));
        detail::write_elements<T>(writer, value.begin(), value.end(), context);
    }

    /// Nil is read as an empty array.
    virtual
    value_type
    read(reader_t& reader, context_t& context) const {
        value_type value;
        if (reader.try_read_nil()) {
            return value;
        }

        context_t::depth_scope_t scope(context);

        const std::uint32_t count = reader.read_array_header();
        value.reserve(std::min<std::size_t>(std::min<std::size_t>(count, reader.remaining()),
            detail::max_reserved_elements));

        detail::read_elements<T>(reader, count, value, context);
        return value;
    }

    virtual
    void
    write_async(async_writer_t& writer, const value_type& value, context_t& context, write_handler handler) const {
        std::make_shared<detail::vector_write_op<T, Allocator>>(writer, context, value, std::move(handler))->run();
    }

    virtual
    void
    read_async(async_reader_t& reader, context_t& context, read_handler handler) const {
        std::make_shared<detail::vector_read_op<T, Allocator>>(reader, context, std::move(handler))->run();
    }
};

} // namespace shapeshift

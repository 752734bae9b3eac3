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
#include <memory>
#include <typeinfo>
#include <vector>

#include "shapeshift/async_reader.hpp"
#include "shapeshift/async_writer.hpp"
#include "shapeshift/buffer.hpp"
#include "shapeshift/cancellation.hpp"
#include "shapeshift/common.hpp"
#include "shapeshift/context.hpp"
#include "shapeshift/converter_cache.hpp"
#include "shapeshift/error.hpp"
#include "shapeshift/interner.hpp"
#include "shapeshift/options.hpp"
#include "shapeshift/reader.hpp"
#include "shapeshift/sink.hpp"
#include "shapeshift/source.hpp"
#include "shapeshift/streaming_reader.hpp"
#include "shapeshift/traits.hpp"
#include "shapeshift/writer.hpp"

#include "shapeshift/detail/log.hpp"

namespace shapeshift {

namespace detail {

/// Wraps the failure into serialization_error unless it is one already.
std::exception_ptr
wrap(const std::exception_ptr& err);

template<class T>
class deserialize_op;

template<class T>
class serialize_op;

} // namespace detail

/*!
 * Entry point of the library.
 *
 * Owns the settings, the converter cache and the string pool shared by every operation it starts.
 * Each operation gets its own context. Every failure leaving an operation is reported as exactly
 * one serialization_error carrying the original cause.
 *
 * Operations may run concurrently from different threads.
 *
 * \warning the serializer must outlive its pending asynchronous operations.
 */
class serializer_t {
public:
    typedef std::function<void(const std::exception_ptr&)> write_handler;

    template<class T>
    struct read_handler {
        typedef std::function<void(const std::exception_ptr&, T)> type;
    };

private:
    options_t options_;
    std::unique_ptr<converter_cache_t> cache_;
    std::unique_ptr<string_interner_t> interner_;

public:
    serializer_t();
    explicit serializer_t(const options_t& options);

    ~serializer_t();

    SHAPESHIFT_DECLARE_NONCOPYABLE(serializer_t)

    const options_t&
    options() const {
        return options_;
    }

    converter_cache_t&
    cache() const {
        return *cache_;
    }

    string_interner_t&
    interner() const {
        return *interner_;
    }

    /// Uses the given converter for T, overriding any built-in one.
    template<class T>
    void
    register_converter(std::shared_ptr<const converter<T>> converter) {
        cache_->add<T>(std::move(converter));
    }

    /// Creates a fresh context for a single top-level operation.
    context_t
    make_context(cancellation_t cancellation = cancellation_t()) const;

    template<class T>
    void
    serialize(writer_t& writer, const T& value) const {
        try {
            context_t context = make_context();
            context.converter_for<T>()->write(writer, value, context);
        } catch (const std::exception&) {
            std::rethrow_exception(detail::wrap(std::current_exception()));
        }
    }

    template<class T>
    std::vector<char>
    serialize(const T& value) const {
        output_buffer_t buffer;
        writer_t writer(buffer, options_.layout);
        serialize(writer, value);
        return buffer.to_vector();
    }

    /// Reads the next value, leaving the reader right after it.
    template<class T>
    T
    deserialize(reader_t& reader) const {
        try {
            context_t context = make_context();
            return context.converter_for<T>()->read(reader, context);
        } catch (const std::exception&) {
            std::rethrow_exception(detail::wrap(std::current_exception()));
        }
    }

    template<class T>
    T
    deserialize(const sequence_t& bytes) const {
        reader_t reader(bytes, options_.layout);
        return deserialize<T>(reader);
    }

    template<class T>
    T
    deserialize(const std::vector<char>& bytes) const {
        return deserialize<T>(sequence_t(bytes));
    }

    /// Reads the next value if the reader has all of its bytes.
    ///
    /// Returns `decode_result::insufficient_data` without consuming anything when the value is
    /// incomplete, and `decode_result::end_of_stream` when it will never be.
    template<class T>
    decode_result
    try_deserialize(streaming_reader_t& reader, T& value) const {
        try {
            context_t context = make_context();

            streaming_reader_t probe(reader.cursor(), reader.eof(), reader.layout());
            const decode_result result = probe.try_skip(context);
            if (result != decode_result::success) {
                return result;
            }

            reader_t view(reader.cursor(), reader.layout());
            value = context.converter_for<T>()->read(view, context);
            reader = streaming_reader_t(view.cursor(), reader.eof(), reader.layout());

            return decode_result::success;
        } catch (const std::exception&) {
            std::rethrow_exception(detail::wrap(std::current_exception()));
        }
    }

    /// Writes the value through the asynchronous writer, which flushes as it sees fit.
    ///
    /// \warning the value must stay valid until the handler is invoked.
    template<class T>
    void
    async_serialize(async_writer_t& writer, const T& value, write_handler handler,
                    cancellation_t cancellation = cancellation_t()) const
    {
        std::make_shared<detail::serialize_op<T>>(*this, writer, value, std::move(handler), cancellation)->run();
    }

    /// Writes the value to the sink and flushes it completely.
    template<class T>
    void
    async_serialize(sink_t& sink, const T& value, write_handler handler,
                    cancellation_t cancellation = cancellation_t()) const
    {
        std::unique_ptr<async_writer_t> writer(
            new async_writer_t(sink, options_.unflushed_bytes_threshold, cancellation));

        std::make_shared<detail::serialize_op<T>>(*this, std::move(writer), value, std::move(handler),
            cancellation)->run();
    }

    template<class T>
    void
    async_deserialize(async_reader_t& reader, typename read_handler<T>::type handler,
                      cancellation_t cancellation = cancellation_t()) const
    {
        std::make_shared<detail::deserialize_op<T>>(*this, reader, std::move(handler), cancellation)->run();
    }

    /// Reads a single value from the source.
    ///
    /// Bytes fetched beyond the end of the value are discarded.
    template<class T>
    void
    async_deserialize(source_t& source, typename read_handler<T>::type handler,
                      cancellation_t cancellation = cancellation_t()) const
    {
        std::unique_ptr<async_reader_t> reader(
            new async_reader_t(source, options_.minimum_fetch_size, cancellation));

        std::make_shared<detail::deserialize_op<T>>(*this, std::move(reader), std::move(handler),
            cancellation)->run();
    }
};

namespace detail {

template<class T>
class deserialize_op : public std::enable_shared_from_this<deserialize_op<T>> {
public:
    typedef typename serializer_t::read_handler<T>::type handler_type;

private:
    std::unique_ptr<async_reader_t> owned;
    async_reader_t& reader;
    context_t context;
    handler_type handler;

public:
    deserialize_op(const serializer_t& serializer, async_reader_t& reader, handler_type handler,
                   cancellation_t cancellation) :
        reader(reader),
        context(serializer.make_context(cancellation)),
        handler(std::move(handler))
    {}

    deserialize_op(const serializer_t& serializer, std::unique_ptr<async_reader_t> source, handler_type handler,
                   cancellation_t cancellation) :
        owned(std::move(source)),
        reader(*owned),
        context(serializer.make_context(cancellation)),
        handler(std::move(handler))
    {}

    void
    run() {
        SHAPESHIFT_CTX("deserialize %s", typeid(T).name());
        SHAPESHIFT_DBG(">> deserialize: %llu bytes buffered", SHAPESHIFT_US(reader.buffered()));

        std::shared_ptr<const converter<T>> converter;
        try {
            converter = context.converter_for<T>();
        } catch (const std::exception&) {
            handler(wrap(std::current_exception()), T());
            return;
        }

        converter->read_async(reader, context,
            std::bind(&deserialize_op::on_read, this->shared_from_this(), std::placeholders::_1,
                std::placeholders::_2));
    }

private:
    void
    on_read(const std::exception_ptr& err, T value) {
        SHAPESHIFT_DBG("<< deserialize: %s", err ? "failed" : "ok");

        if (err) {
            handler(wrap(err), T());
            return;
        }

        handler(std::exception_ptr(), std::move(value));
    }
};

template<class T>
class serialize_op : public std::enable_shared_from_this<serialize_op<T>> {
public:
    typedef serializer_t::write_handler handler_type;

private:
    std::unique_ptr<async_writer_t> owned;
    async_writer_t& writer;
    const T& value;
    context_t context;
    handler_type handler;

public:
    serialize_op(const serializer_t& serializer, async_writer_t& writer, const T& value, handler_type handler,
                 cancellation_t cancellation) :
        writer(writer),
        value(value),
        context(serializer.make_context(cancellation)),
        handler(std::move(handler))
    {}

    serialize_op(const serializer_t& serializer, std::unique_ptr<async_writer_t> sink, const T& value,
                 handler_type handler, cancellation_t cancellation) :
        owned(std::move(sink)),
        writer(*owned),
        value(value),
        context(serializer.make_context(cancellation)),
        handler(std::move(handler))
    {}

    void
    run() {
        SHAPESHIFT_CTX("serialize %s", typeid(T).name());
        SHAPESHIFT_DBG(">> serialize: %llu bytes unflushed", SHAPESHIFT_US(writer.unflushed()));

        std::shared_ptr<const converter<T>> converter;
        try {
            converter = context.converter_for<T>();
        } catch (const std::exception&) {
            handler(wrap(std::current_exception()));
            return;
        }

        converter->write_async(writer, value, context,
            std::bind(&serialize_op::on_written, this->shared_from_this(), std::placeholders::_1));
    }

private:
    void
    on_written(const std::exception_ptr& err) {
        if (err || !owned) {
            handler(wrap(err));
            return;
        }

        writer.flush(std::bind(&serialize_op::on_flushed, this->shared_from_this(), std::placeholders::_1));
    }

    void
    on_flushed(const std::exception_ptr& err) {
        SHAPESHIFT_DBG("<< serialize: %s", err ? "failed" : "ok");

        handler(wrap(err));
    }
};

} // namespace detail

} // namespace shapeshift

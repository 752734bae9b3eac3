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

#include <memory>

#include <boost/optional.hpp>

#include "shapeshift/converter.hpp"

#include "shapeshift/detail/async_decode.hpp"

namespace shapeshift {

namespace detail {

/// Consumes nil when it is the next token, reporting whether it was.
inline
decode_result
try_consume_nil(streaming_reader_t& reader, bool& nil) {
    const decode_result result = reader.try_read_nil();

    switch (result) {
    case decode_result::success:
        nil = true;
        return result;
    case decode_result::token_mismatch:
        nil = false;
        return decode_result::success;
    default:
        return result;
    }
}

} // namespace detail

/// Nil stands for an absent value, anything else is decoded by the converter of T.
template<class T>
class optional_converter : public converter<boost::optional<T>> {
public:
    typedef boost::optional<T> value_type;
    typedef typename converter<value_type>::read_handler read_handler;
    typedef typename converter<value_type>::write_handler write_handler;

    virtual
    void
    write(writer_t& writer, const value_type& value, context_t& context) const {
        if (!value) {
            writer.write_nil();
            return;
        }

        context.converter_for<T>()->write(writer, *value, context);
    }

    virtual
    value_type
    read(reader_t& reader, context_t& context) const {
        if (reader.try_read_nil()) {
            return boost::none;
        }

        return context.converter_for<T>()->read(reader, context);
    }

    virtual
    void
    write_async(async_writer_t& writer, const value_type& value, context_t& context, write_handler handler) const {
        if (value) {
            auto inner = context.converter_for<T>();
            if (inner->prefers_async()) {
                inner->write_async(writer, *value, context, std::move(handler));
                return;
            }
        }

        converter<value_type>::write_async(writer, value, context, std::move(handler));
    }

    virtual
    void
    read_async(async_reader_t& reader, context_t& context, read_handler handler) const {
        std::shared_ptr<const converter<T>> inner;
        try {
            inner = context.converter_for<T>();
        } catch (const std::exception&) {
            handler(std::current_exception(), value_type());
            return;
        }

        if (!inner->prefers_async()) {
            converter<value_type>::read_async(reader, context, std::move(handler));
            return;
        }

        detail::async_decode<bool>(reader, context.layout(), "any token", &detail::try_consume_nil,
            std::bind(&optional_converter::on_peeked, std::placeholders::_1, std::placeholders::_2,
                std::ref(reader), std::ref(context), inner, std::move(handler)));
    }

private:
    static
    void
    on_peeked(const std::exception_ptr& err, bool nil, async_reader_t& reader, context_t& context,
              const std::shared_ptr<const converter<T>>& inner, const read_handler& handler)
    {
        if (err) {
            handler(err, value_type());
            return;
        }

        if (nil) {
            handler(std::exception_ptr(), value_type());
            return;
        }

        inner->read_async(reader, context,
            std::bind(&optional_converter::on_read, std::placeholders::_1, std::placeholders::_2, handler));
    }

    static
    void
    on_read(const std::exception_ptr& err, T value, const read_handler& handler) {
        if (err) {
            handler(err, value_type());
            return;
        }

        handler(std::exception_ptr(), value_type(std::move(value)));
    }
};

} // namespace shapeshift

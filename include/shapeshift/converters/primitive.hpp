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

#include <chrono>
#include <string>
#include <type_traits>
#include <vector>

#include "shapeshift/converter.hpp"
#include "shapeshift/primitives.hpp"

#include "shapeshift/detail/async_decode.hpp"

namespace shapeshift {

namespace detail {

template<class T>
inline
decode_result
try_read_value(streaming_reader_t& reader, T& value) {
    return reader.try_read(value);
}

/// Nil is read as an empty string.
inline
decode_result
try_read_string_or_nil(streaming_reader_t& reader, std::string& value) {
    const decode_result result = reader.try_read_nil();
    if (result == decode_result::token_mismatch) {
        return reader.try_read(value);
    }

    if (result == decode_result::success) {
        value.clear();
    }

    return result;
}

template<class Container>
inline
decode_result
try_read_binary_or_nil(streaming_reader_t& reader, Container& value) {
    const decode_result result = reader.try_read_nil();
    if (result == decode_result::success) {
        value.clear();
        return result;
    }

    if (result != decode_result::token_mismatch) {
        return result;
    }

    sequence_t payload;
    const decode_result binary = reader.try_read_binary(payload);
    if (binary == decode_result::success) {
        const std::vector<char> bytes = payload.to_vector();
        value.assign(bytes.begin(), bytes.end());
    }

    return binary;
}

} // namespace detail

template<class T>
class integer_converter : public converter<T> {
public:
    virtual
    void
    write(writer_t& writer, const T& value, context_t&) const {
        writer.write(value);
    }

    virtual
    T
    read(reader_t& reader, context_t&) const {
        return reader.read_integer<T>();
    }

    virtual
    void
    read_async(async_reader_t& reader, context_t& context, typename converter<T>::read_handler handler) const {
        detail::async_decode<T>(reader, context.layout(), "integer", &detail::try_read_value<T>, std::move(handler));
    }
};

class boolean_converter : public converter<bool> {
public:
    virtual
    void
    write(writer_t& writer, const bool& value, context_t&) const {
        writer.write(value);
    }

    virtual
    bool
    read(reader_t& reader, context_t&) const {
        return reader.read_bool();
    }

    virtual
    void
    read_async(async_reader_t& reader, context_t& context, read_handler handler) const {
        detail::async_decode<bool>(reader, context.layout(), "boolean", &detail::try_read_value<bool>, std::move(handler));
    }
};

/// Floats and doubles. Integers on the wire are accepted and converted.
template<class T>
class floating_converter : public converter<T> {
public:
    virtual
    void
    write(writer_t& writer, const T& value, context_t&) const {
        writer.write(value);
    }

    virtual
    T
    read(reader_t& reader, context_t&) const {
        return read_value(reader, static_cast<T*>(nullptr));
    }

    virtual
    void
    read_async(async_reader_t& reader, context_t& context, typename converter<T>::read_handler handler) const {
        detail::async_decode<T>(reader, context.layout(), "float", &detail::try_read_value<T>, std::move(handler));
    }

private:
    static
    float
    read_value(reader_t& reader, float*) {
        return reader.read_float();
    }

    static
    double
    read_value(reader_t& reader, double*) {
        return reader.read_double();
    }
};

class string_converter : public converter<std::string> {
public:
    virtual
    void
    write(writer_t& writer, const std::string& value, context_t&) const {
        writer.write(value);
    }

    virtual
    std::string
    read(reader_t& reader, context_t&) const {
        if (reader.try_read_nil()) {
            return std::string();
        }

        return reader.read_string();
    }

    virtual
    void
    read_async(async_reader_t& reader, context_t& context, read_handler handler) const {
        detail::async_decode<std::string>(reader, context.layout(), "string", &detail::try_read_string_or_nil,
            std::move(handler));
    }
};

/// Byte containers encoded as binary tokens.
template<class Container>
class binary_converter : public converter<Container> {
public:
    virtual
    void
    write(writer_t& writer, const Container& value, context_t&) const {
        writer.write_binary(value.empty() ? nullptr : reinterpret_cast<const char*>(value.data()), value.size());
    }

    virtual
    Container
    read(reader_t& reader, context_t&) const {
        Container value;
        if (reader.try_read_nil()) {
            return value;
        }

        const sequence_t payload = reader.read_binary_sequence();
        value.reserve(payload.size());

        const auto& segments = payload.segments();
        for (auto it = segments.begin(); it != segments.end(); ++it) {
            const auto* data = static_cast<const typename Container::value_type*>(it->data());
            value.insert(value.end(), data, data + it->size());
        }

        return value;
    }

    virtual
    void
    read_async(async_reader_t& reader, context_t& context, typename converter<Container>::read_handler handler) const {
        detail::async_decode<Container>(reader, context.layout(), "binary",
            &detail::try_read_binary_or_nil<Container>, std::move(handler));
    }
};

class timestamp_converter : public converter<timestamp_t> {
public:
    virtual
    void
    write(writer_t& writer, const timestamp_t& value, context_t&) const {
        writer.write(value);
    }

    virtual
    timestamp_t
    read(reader_t& reader, context_t&) const {
        return reader.read_timestamp();
    }

    virtual
    void
    read_async(async_reader_t& reader, context_t& context, read_handler handler) const {
        detail::async_decode<timestamp_t>(reader, context.layout(), "timestamp",
            &detail::try_read_value<timestamp_t>, std::move(handler));
    }
};

class time_point_converter : public converter<std::chrono::system_clock::time_point> {
public:
    virtual
    void
    write(writer_t& writer, const std::chrono::system_clock::time_point& value, context_t&) const {
        writer.write(value);
    }

    virtual
    std::chrono::system_clock::time_point
    read(reader_t& reader, context_t&) const {
        return reader.read_time_point();
    }
};

} // namespace shapeshift

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
#include <functional>
#include <limits>
#include <memory>
#include <string>
#include <vector>

#include "shapeshift/converter.hpp"
#include "shapeshift/preformatted_string.hpp"

#include "shapeshift/detail/async_decode.hpp"
#include "shapeshift/detail/format.hpp"

namespace shapeshift {

namespace detail {

/// Single named property of an object type.
template<class T>
class property_t {
    preformatted_string_t name_;

public:
    typedef std::function<void(const std::exception_ptr&)> handler_type;

    explicit property_t(std::string name) :
        name_(std::move(name))
    {}

    virtual
    ~property_t() {}

    const preformatted_string_t&
    name() const {
        return name_;
    }

    virtual
    bool
    prefers_async(context_t& context) const = 0;

    virtual
    void
    write(writer_t& writer, const T& object, context_t& context) const = 0;

    virtual
    void
    read(reader_t& reader, T& object, context_t& context) const = 0;

    /// \warning the object must stay valid until the handler is invoked.
    virtual
    void
    write_async(async_writer_t& writer, const T& object, context_t& context, handler_type handler) const = 0;

    virtual
    void
    read_async(async_reader_t& reader, T& object, context_t& context, handler_type handler) const = 0;
};

/// Property backed by a data member.
template<class T, class P>
class member_property_t : public property_t<T> {
    P T::* member;

public:
    typedef typename property_t<T>::handler_type handler_type;

    member_property_t(std::string name, P T::* member) :
        property_t<T>(std::move(name)),
        member(member)
    {}

    virtual
    bool
    prefers_async(context_t& context) const {
        return context.converter_for<P>()->prefers_async();
    }

    virtual
    void
    write(writer_t& writer, const T& object, context_t& context) const {
        context.converter_for<P>()->write(writer, object.*member, context);
    }

    virtual
    void
    read(reader_t& reader, T& object, context_t& context) const {
        object.*member = context.converter_for<P>()->read(reader, context);
    }

    virtual
    void
    write_async(async_writer_t& writer, const T& object, context_t& context, handler_type handler) const {
        context.converter_for<P>()->write_async(writer, object.*member, context, std::move(handler));
    }

    virtual
    void
    read_async(async_reader_t& reader, T& object, context_t& context, handler_type handler) const {
        context.converter_for<P>()->read_async(reader, context,
            std::bind(&member_property_t::on_read, member, std::ref(object), std::placeholders::_1,
                std::placeholders::_2, std::move(handler)));
    }

private:
    static
    void
    on_read(P T::* member, T& object, const std::exception_ptr& err, P value, const handler_type& handler) {
        if (!err) {
            object.*member = std::move(value);
        }

        handler(err);
    }
};

/// Property backed by a getter and a setter.
template<class T, class P>
class accessor_property_t : public property_t<T> {
public:
    typedef std::function<P(const T&)> getter_type;
    typedef std::function<void(T&, P)> setter_type;
    typedef typename property_t<T>::handler_type handler_type;

private:
    getter_type getter;
    setter_type setter;

public:
    accessor_property_t(std::string name, getter_type getter, setter_type setter) :
        property_t<T>(std::move(name)),
        getter(std::move(getter)),
        setter(std::move(setter))
    {}

    virtual
    bool
    prefers_async(context_t& context) const {
        return context.converter_for<P>()->prefers_async();
    }

    virtual
    void
    write(writer_t& writer, const T& object, context_t& context) const {
        context.converter_for<P>()->write(writer, getter(object), context);
    }

    virtual
    void
    read(reader_t& reader, T& object, context_t& context) const {
        setter(object, context.converter_for<P>()->read(reader, context));
    }

    virtual
    void
    write_async(async_writer_t& writer, const T& object, context_t& context, handler_type handler) const {
        // The value must outlive the write, so the completion keeps it.
        auto value = std::make_shared<P>(getter(object));

        context.converter_for<P>()->write_async(writer, *value, context,
            std::bind(&accessor_property_t::on_written, value, std::placeholders::_1, std::move(handler)));
    }

    virtual
    void
    read_async(async_reader_t& reader, T& object, context_t& context, handler_type handler) const {
        context.converter_for<P>()->read_async(reader, context,
            std::bind(&accessor_property_t::on_read, setter, std::ref(object), std::placeholders::_1,
                std::placeholders::_2, std::move(handler)));
    }

private:
    static
    void
    on_written(const std::shared_ptr<P>&, const std::exception_ptr& err, const handler_type& handler) {
        handler(err);
    }

    static
    void
    on_read(const setter_type& setter, T& object, const std::exception_ptr& err, P value, const handler_type& handler) {
        if (!err) {
            setter(object, std::move(value));
        }

        handler(err);
    }
};

template<class T>
class object_read_op;

template<class T>
class object_write_op;

} // namespace detail

/*!
 * Converter of a user type described by a list of named properties.
 *
 * With the map layout, every property is written as a name and value pair in declaration order.
 * On read, known names must appear in declaration order, properties may be absent and unknown
 * names are skipped along with their values.
 *
 * With the array layout, properties are written positionally. On read, missing trailing elements
 * leave the properties at their defaults and extra elements are skipped.
 *
 * Nil is read as a default constructed object.
 *
 * \code
 * object_converter<point_t> converter;
 * converter.property("x", &point_t::x)
 *          .property("y", &point_t::y);
 * \endcode
 */
template<class T>
class object_converter : public converter<T> {
    friend class detail::object_read_op<T>;
    friend class detail::object_write_op<T>;

public:
    typedef T value_type;
    typedef typename converter<T>::read_handler read_handler;
    typedef typename converter<T>::write_handler write_handler;

private:
    typedef detail::property_t<T> property_type;

    std::vector<std::shared_ptr<const property_type>> properties;

public:
    static const std::size_t npos = std::numeric_limits<std::size_t>::max();

    template<class P>
    object_converter&
    property(const std::string& name, P T::* member) {
        properties.push_back(std::make_shared<detail::member_property_t<T, P>>(name, member));
        return *this;
    }

    template<class P>
    object_converter&
    property(const std::string& name,
             typename detail::accessor_property_t<T, P>::getter_type getter,
             typename detail::accessor_property_t<T, P>::setter_type setter)
    {
        properties.push_back(std::make_shared<detail::accessor_property_t<T, P>>(name, std::move(getter),
            std::move(setter)));
        return *this;
    }

    std::size_t
    size() const {
        return properties.size();
    }

    virtual
    bool
    prefers_async() const {
        return true;
    }

    virtual
    void
    write(writer_t& writer, const T& value, context_t& context) const {
        context_t::depth_scope_t scope(context);

        const std::uint32_t count = static_cast<std::uint32_t>(properties.size());

        if (writer.layout() == object_layout::array) {
            writer.write_array_header(count);
        } else {
            writer.write_map_header(count);
        }

        for (auto it = properties.begin(); it != properties.end(); ++it) {
            if (writer.layout() == object_layout::map) {
                (*it)->name().write(writer);
            }

            (*it)->write(writer, value, context);
        }
    }

    virtual
    T
    read(reader_t& reader, context_t& context) const {
        T value = T();
        if (reader.try_read_nil()) {
            return value;
        }

        context_t::depth_scope_t scope(context);

        if (reader.layout() == object_layout::array) {
            const std::uint32_t count = reader.read_array_header();
            for (std::uint32_t i = 0; i < count; ++i) {
                if (i < properties.size()) {
                    properties[i]->read(reader, value, context);
                } else {
                    reader.skip(context);
                }
            }

            return value;
        }

        const std::uint32_t count = reader.read_map_header();

        std::size_t next = 0;
        for (std::uint32_t i = 0; i < count; ++i) {
            const std::size_t index = match(reader, next);

            if (index == npos) {
                reader.skip(context);
                reader.skip(context);
                continue;
            }

            properties[index]->read(reader, value, context);
            next = index + 1;
        }

        return value;
    }

    virtual
    void
    write_async(async_writer_t& writer, const T& value, context_t& context, write_handler handler) const {
        bool incremental = false;
        try {
            incremental = any_prefers_async(context);
        } catch (const std::exception&) {
            handler(std::current_exception());
            return;
        }

        if (!incremental) {
            converter<T>::write_async(writer, value, context, std::move(handler));
            return;
        }

        std::make_shared<detail::object_write_op<T>>(*this, writer, context, value, std::move(handler))->run();
    }

    virtual
    void
    read_async(async_reader_t& reader, context_t& context, read_handler handler) const {
        bool incremental = false;
        try {
            incremental = any_prefers_async(context);
        } catch (const std::exception&) {
            handler(std::current_exception(), T());
            return;
        }

        if (!incremental) {
            converter<T>::read_async(reader, context, std::move(handler));
            return;
        }

        std::make_shared<detail::object_read_op<T>>(*this, reader, context, std::move(handler))->run();
    }

private:
    bool
    any_prefers_async(context_t& context) const {
        for (auto it = properties.begin(); it != properties.end(); ++it) {
            if ((*it)->prefers_async(context)) {
                return true;
            }
        }

        return false;
    }

    /// Consumes the next key if it names a property at or after `next`, returning its index.
    ///
    /// Returns npos without consuming anything for an unknown key.
    ///
    /// \throw protocol_error when the key names a property declared before `next`.
    std::size_t
    match(reader_t& reader, std::size_t next) const {
        for (std::size_t i = next; i < properties.size(); ++i) {
            if (properties[i]->name().try_read(reader)) {
                return i;
            }
        }

        for (std::size_t i = 0; i < next; ++i) {
            if (properties[i]->name().try_read(reader)) {
                throw protocol_error(error::property_order,
                    shapeshift::format("property '%s' at offset %d is out of declaration order",
                        properties[i]->name().value(), reader.position()));
            }
        }

        return npos;
    }
};

template<class T>
const std::size_t object_converter<T>::npos;

namespace detail {

/*!
 * Reads an object property by property as the bytes arrive.
 *
 * Every key is buffered and matched synchronously. Values go through the asynchronous path of
 * their converters when those prefer it, and are buffered and read synchronously otherwise.
 */
template<class T>
class object_read_op : public std::enable_shared_from_this<object_read_op<T>> {
public:
    typedef std::function<void(const std::exception_ptr&, T)> handler_type;

private:
    enum class phase_t { key, value };

    const object_converter<T>& parent;
    async_reader_t& reader;
    context_t& context;
    handler_type handler;

    T object;
    object_layout layout;
    std::uint32_t count;
    std::uint32_t index;
    int depth;

    phase_t phase;

    /// Property whose value comes next, npos for a value to skip.
    std::size_t current;

    /// Index of the first property allowed to appear next.
    std::size_t next_allowed;

    trampoline_t trampoline;

public:
    object_read_op(const object_converter<T>& parent, async_reader_t& reader, context_t& context,
                   handler_type handler) :
        parent(parent),
        reader(reader),
        context(context),
        handler(std::move(handler)),
        object(),
        layout(context.layout()),
        count(0),
        index(0),
        depth(context.depth()),
        phase(phase_t::key),
        current(object_converter<T>::npos),
        next_allowed(0)
    {}

    void
    run() {
        async_decode<header_t>(reader, layout, layout == object_layout::array ? "array" : "map",
            layout == object_layout::array ? &try_read_array_or_nil : &try_read_map_or_nil,
            std::bind(&object_read_op::on_header, this->shared_from_this(), std::placeholders::_1,
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
        next();
    }

    void
    next() {
        while (index < count) {
            context.restore_depth(depth + 1);
            trampoline.begin();

            if (layout == object_layout::array) {
                current = index < parent.properties.size() ? index : object_converter<T>::npos;
                phase = phase_t::value;
            }

            bool prefers_async = false;
            if (phase == phase_t::value && current != object_converter<T>::npos) {
                try {
                    prefers_async = parent.properties[current]->prefers_async(context);
                } catch (const std::exception&) {
                    finish(std::current_exception());
                    return;
                }
            }

            if (prefers_async) {
                parent.properties[current]->read_async(reader, object, context,
                    std::bind(&object_read_op::on_value, this->shared_from_this(), std::placeholders::_1));
            } else {
                reader.buffer_next_structure(context,
                    std::bind(&object_read_op::on_buffered, this->shared_from_this(), std::placeholders::_1));
            }

            if (trampoline.pending()) {
                return;
            }
        }

        finish(std::exception_ptr());
    }

    void
    on_buffered(const std::exception_ptr& err) {
        if (err) {
            finish(err);
            return;
        }

        context.restore_depth(depth + 1);

        try {
            auto view = reader.create_buffered_reader(layout);
            try {
                consume(*view);
            } catch (...) {
                reader.return_reader(std::move(view));
                throw;
            }
            reader.return_reader(std::move(view));
        } catch (const std::exception&) {
            finish(std::current_exception());
            return;
        }

        if (trampoline.complete()) {
            next();
        }
    }

    /// Processes the buffered key or value.
    void
    consume(reader_t& view) {
        if (phase == phase_t::key) {
            current = parent.match(view, next_allowed);
            if (current == object_converter<T>::npos) {
                view.skip(context);
            } else {
                next_allowed = current + 1;
            }

            phase = phase_t::value;
            return;
        }

        if (current == object_converter<T>::npos) {
            view.skip(context);
        } else {
            parent.properties[current]->read(view, object, context);
        }

        advance();
    }

    void
    on_value(const std::exception_ptr& err) {
        if (err) {
            finish(err);
            return;
        }

        advance();

        if (trampoline.complete()) {
            next();
        }
    }

    void
    advance() {
        phase = phase_t::key;
        current = object_converter<T>::npos;
        ++index;
    }

    void
    finish(const std::exception_ptr& err) {
        context.restore_depth(depth);

        if (err) {
            handler(err, T());
        } else {
            handler(err, std::move(object));
        }
    }
};

/// Writes an object property by property, flushing in between.
template<class T>
class object_write_op : public std::enable_shared_from_this<object_write_op<T>> {
public:
    typedef std::function<void(const std::exception_ptr&)> handler_type;

private:
    const object_converter<T>& parent;
    async_writer_t& writer;
    context_t& context;
    const T& value;
    handler_type handler;

    object_layout layout;
    bool started;
    std::size_t index;
    int depth;
    trampoline_t trampoline;

public:
    object_write_op(const object_converter<T>& parent, async_writer_t& writer, context_t& context, const T& value,
                    handler_type handler) :
        parent(parent),
        writer(writer),
        context(context),
        value(value),
        handler(std::move(handler)),
        layout(context.layout()),
        started(false),
        index(0),
        depth(context.depth())
    {}

    void
    run() {
        try {
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
        while (!started || index < parent.properties.size()) {
            context.restore_depth(depth + 1);
            trampoline.begin();

            const detail::property_t<T>* incremental = nullptr;
            try {
                incremental = write_block();
            } catch (const std::exception&) {
                finish(std::current_exception());
                return;
            }

            if (incremental) {
                incremental->write_async(writer, value, context,
                    std::bind(&object_write_op::on_written, this->shared_from_this(), std::placeholders::_1));
            } else {
                writer.flush_if_appropriate(
                    std::bind(&object_write_op::on_written, this->shared_from_this(), std::placeholders::_1));
            }

            if (trampoline.pending()) {
                return;
            }
        }

        finish(std::exception_ptr());
    }

    /// Writes the header when not written yet, then whole synchronous properties until one that
    /// prefers asynchronous writing, whose name is written and which is returned.
    const detail::property_t<T>*
    write_block() {
        auto view = writer.create_writer(layout);
        const detail::property_t<T>* incremental = nullptr;

        try {
            if (!started) {
                const std::uint32_t count = static_cast<std::uint32_t>(parent.properties.size());

                if (layout == object_layout::array) {
                    view->write_array_header(count);
                } else {
                    view->write_map_header(count);
                }

                started = true;
            }

            while (index < parent.properties.size() && !incremental) {
                const detail::property_t<T>& property = *parent.properties[index++];

                if (layout == object_layout::map) {
                    property.name().write(*view);
                }

                if (property.prefers_async(context)) {
                    incremental = &property;
                } else {
                    property.write(*view, value, context);
                }
            }
        } catch (...) {
            writer.return_writer(std::move(view));
            throw;
        }

        writer.return_writer(std::move(view));
        return incremental;
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

} // namespace shapeshift

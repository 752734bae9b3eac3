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
#include <map>
#include <memory>
#include <unordered_map>
#include <utility>

#include "shapeshift/converter.hpp"

#include "shapeshift/detail/async_decode.hpp"

namespace shapeshift {

namespace detail {

/// Reads one buffered structure through a lent reader.
template<class T>
T
read_buffered_value(async_reader_t& reader, const converter<T>& converter, context_t& context) {
    auto view = reader.create_buffered_reader(context.layout());

    try {
        T value = converter.read(*view, context);
        reader.return_reader(std::move(view));
        return value;
    } catch (...) {
        reader.return_reader(std::move(view));
        throw;
    }
}

/*!
 * Reads a map entry by entry as the bytes arrive.
 *
 * Keys are always read synchronously once buffered. Values are read asynchronously when their
 * converter prefers so, and otherwise in batches of whole buffered entries.
 */
template<class Map>
class map_read_op : public std::enable_shared_from_this<map_read_op<Map>> {
public:
    typedef typename Map::key_type key_type;
    typedef typename Map::mapped_type mapped_type;
    typedef std::function<void(const std::exception_ptr&, Map)> handler_type;

private:
    async_reader_t& reader;
    context_t& context;
    handler_type handler;

    std::shared_ptr<const converter<key_type>> key_converter;
    std::shared_ptr<const converter<mapped_type>> value_converter;

    Map result;
    std::uint32_t count;
    std::uint32_t index;
    int depth;

    /// Key of the entry whose value has not been read yet.
    key_type key;
    bool has_key;

    trampoline_t trampoline;

public:
    map_read_op(async_reader_t& reader, context_t& context, handler_type handler) :
        reader(reader),
        context(context),
        handler(std::move(handler)),
        count(0),
        index(0),
        depth(context.depth()),
        key(),
        has_key(false)
    {}

    void
    run() {
        try {
            key_converter = context.converter_for<key_type>();
            value_converter = context.converter_for<mapped_type>();
        } catch (const std::exception&) {
            finish(std::current_exception());
            return;
        }

        async_decode<header_t>(reader, context.layout(), "map", &try_read_map_or_nil,
            std::bind(&map_read_op::on_header, this->shared_from_this(), std::placeholders::_1,
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

            if (!has_key && !value_converter->prefers_async()) {
                std::size_t consumed = 0;
                try {
                    consumed = read_buffered_entries();
                } catch (const std::exception&) {
                    finish(std::current_exception());
                    return;
                }

                if (consumed > 0) {
                    continue;
                }
            }

            trampoline.begin();

            if (has_key && value_converter->prefers_async()) {
                value_converter->read_async(reader, context,
                    std::bind(&map_read_op::on_value, this->shared_from_this(), std::placeholders::_1,
                        std::placeholders::_2));
            } else {
                reader.buffer_next_structure(context,
                    std::bind(&map_read_op::on_buffered, this->shared_from_this(), std::placeholders::_1));
            }

            if (trampoline.pending()) {
                return;
            }
        }

        finish(std::exception_ptr());
    }

    /// Reads every whole entry already buffered, returning their number.
    std::size_t
    read_buffered_entries() {
        const std::size_t available = reader.buffered_structures_count(2 * std::size_t(count - index), context) / 2;
        if (available == 0) {
            return 0;
        }

        auto view = reader.create_buffered_reader(context.layout());
        try {
            for (std::size_t i = 0; i < available; ++i) {
                key_type k = key_converter->read(*view, context);
                result[std::move(k)] = value_converter->read(*view, context);
            }
        } catch (...) {
            reader.return_reader(std::move(view));
            throw;
        }
        reader.return_reader(std::move(view));

        index += static_cast<std::uint32_t>(available);
        return available;
    }

    void
    on_buffered(const std::exception_ptr& err) {
        if (err) {
            finish(err);
            return;
        }

        context.restore_depth(depth + 1);

        try {
            if (!has_key) {
                key = read_buffered_value(reader, *key_converter, context);
                has_key = true;
            } else {
                store(read_buffered_value(reader, *value_converter, context));
            }
        } catch (const std::exception&) {
            finish(std::current_exception());
            return;
        }

        if (trampoline.complete()) {
            next();
        }
    }

    void
    on_value(const std::exception_ptr& err, mapped_type value) {
        if (err) {
            finish(err);
            return;
        }

        store(std::move(value));

        if (trampoline.complete()) {
            next();
        }
    }

    /// Later duplicates of a key replace the earlier ones.
    void
    store(mapped_type value) {
        result[std::move(key)] = std::move(value);
        key = key_type();
        has_key = false;
        ++index;
    }

    void
    finish(const std::exception_ptr& err) {
        context.restore_depth(depth);

        if (err) {
            handler(err, Map());
        } else {
            handler(err, std::move(result));
        }
    }
};

/// Writes a map, flushing between blocks of entries.
template<class Map>
class map_write_op : public std::enable_shared_from_this<map_write_op<Map>> {
public:
    typedef typename Map::key_type key_type;
    typedef typename Map::mapped_type mapped_type;
    typedef std::function<void(const std::exception_ptr&)> handler_type;

private:
    async_writer_t& writer;
    context_t& context;
    const Map& value;
    handler_type handler;

    std::shared_ptr<const converter<key_type>> key_converter;
    std::shared_ptr<const converter<mapped_type>> value_converter;

    typename Map::const_iterator current;
    bool started;
    int depth;
    trampoline_t trampoline;

public:
    map_write_op(async_writer_t& writer, context_t& context, const Map& value, handler_type handler) :
        writer(writer),
        context(context),
        value(value),
        handler(std::move(handler)),
        current(value.begin()),
        started(false),
        depth(context.depth())
    {}

    void
    run() {
        try {
            key_converter = context.converter_for<key_type>();
            value_converter = context.converter_for<mapped_type>();
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
        while (!started || current != value.end()) {
            context.restore_depth(depth + 1);
            trampoline.begin();

            const bool incremental = started && value_converter->prefers_async();

            try {
                write_block(incremental);
            } catch (const std::exception&) {
                finish(std::current_exception());
                return;
            }

            if (incremental) {
                const mapped_type& mapped = current->second;
                ++current;

                value_converter->write_async(writer, mapped, context,
                    std::bind(&map_write_op::on_written, this->shared_from_this(), std::placeholders::_1));
            } else {
                writer.flush_if_appropriate(
                    std::bind(&map_write_op::on_written, this->shared_from_this(), std::placeholders::_1));
            }

            if (trampoline.pending()) {
                return;
            }
        }

        finish(std::exception_ptr());
    }

    /// Writes the header when not written yet. Then either writes the key of the next entry only,
    /// or as many whole entries as fit into the flush threshold.
    void
    write_block(bool key_only) {
        auto view = writer.create_writer(context.layout());

        try {
            if (!started) {
                view->write_map_header(static_cast<std::uint32_t>(value.size()));
                started = true;
            } else if (key_only) {
                key_converter->write(*view, current->first, context);
            }

            if (!value_converter->prefers_async()) {
                const std::size_t threshold = context.options().unflushed_bytes_threshold;

                while (current != value.end()) {
                    key_converter->write(*view, current->first, context);
                    value_converter->write(*view, current->second, context);
                    ++current;

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

/*!
 * Maps of any key and value types, `std::map` and `std::unordered_map` alike.
 *
 * Entries are written in the iteration order of the map. When a key occurs more than once on the
 * wire the last value wins.
 */
template<class Map>
class map_converter : public converter<Map> {
public:
    typedef typename Map::key_type key_type;
    typedef typename Map::mapped_type mapped_type;
    typedef typename converter<Map>::read_handler read_handler;
    typedef typename converter<Map>::write_handler write_handler;

    virtual
    bool
    prefers_async() const {
        return true;
    }

    virtual
    void
    write(writer_t& writer, const Map& value, context_t& context) const {
        context_t::depth_scope_t scope(context);

        auto key_converter = context.converter_for<key_type>();
        auto value_converter = context.converter_for<mapped_type>();

        writer.write_map_header(static_cast<std::uint32_t>(value.size()));
        for (auto it = value.begin(); it != value.end(); ++it) {
            key_converter->write(writer, it->first, context);
            value_converter->write(writer, it->second, context);
        }
    }

    /// Nil is read as an empty map.
    virtual
    Map
    read(reader_t& reader, context_t& context) const {
        Map value;
        if (reader.try_read_nil()) {
            return value;
        }

        context_t::depth_scope_t scope(context);

        auto key_converter = context.converter_for<key_type>();
        auto value_converter = context.converter_for<mapped_type>();

        const std::uint32_t count = reader.read_map_header();
        for (std::uint32_t i = 0; i < count; ++i) {
            key_type key = key_converter->read(reader, context);
            value[std::move(key)] = value_converter->read(reader, context);
        }

        return value;
    }

    virtual
    void
    write_async(async_writer_t& writer, const Map& value, context_t& context, write_handler handler) const {
        std::make_shared<detail::map_write_op<Map>>(writer, context, value, std::move(handler))->run();
    }

    virtual
    void
    read_async(async_reader_t& reader, context_t& context, read_handler handler) const {
        std::make_shared<detail::map_read_op<Map>>(reader, context, std::move(handler))->run();
    }
};

} // namespace shapeshift

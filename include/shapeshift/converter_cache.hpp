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

#include <cstddef>
#include <memory>
#include <mutex>
#include <typeindex>
#include <typeinfo>
#include <unordered_map>

#include "shapeshift/context.hpp"
#include "shapeshift/converter.hpp"
#include "shapeshift/error.hpp"

namespace shapeshift {

/*!
 * Type conversion traits.
 *
 * Specializations provide `static std::shared_ptr<const converter<T>> create()`. Types without a
 * specialization must have their converter registered in the cache explicitly.
 */
template<class T, class>
struct converter_traits {
    static
    std::shared_ptr<const converter<T>>
    create() {
        throw converter_not_found_error(typeid(T).name());
    }
};

/*!
 * Thread-safe cache of converters keyed by type.
 *
 * Converters are created on the first request and reused afterwards. Creation happens outside of
 * the lock, so that converters may ask for other converters while being constructed. When two
 * threads race, the first stored converter wins.
 */
class converter_cache_t {
    mutable std::mutex mutex;
    std::unordered_map<std::type_index, std::shared_ptr<const converter_base_t>> converters;

public:
    /// The process-wide cache used by contexts created without an explicit one.
    static
    converter_cache_t&
    instance();

    template<class T>
    std::shared_ptr<const converter<T>>
    get() {
        const std::type_index type(typeid(T));

        {
            std::lock_guard<std::mutex> lock(mutex);

            auto it = converters.find(type);
            if (it != converters.end()) {
                return std::static_pointer_cast<const converter<T>>(it->second);
            }
        }

        std::shared_ptr<const converter<T>> created = converter_traits<T>::create();

        std::lock_guard<std::mutex> lock(mutex);
        auto result = converters.insert(std::make_pair(type, created));
        return std::static_pointer_cast<const converter<T>>(result.first->second);
    }

    /// Registers the converter, replacing the one already cached for the type.
    template<class T>
    void
    add(std::shared_ptr<const converter<T>> converter) {
        std::lock_guard<std::mutex> lock(mutex);
        converters[std::type_index(typeid(T))] = std::move(converter);
    }

    template<class T>
    bool
    contains() const {
        std::lock_guard<std::mutex> lock(mutex);
        return converters.count(std::type_index(typeid(T))) > 0;
    }

    std::size_t
    size() const;
};

template<class T>
std::shared_ptr<const converter<T>>
context_t::converter_for() const {
    return cache().get<T>();
}

} // namespace shapeshift

#include "shapeshift/traits.hpp"

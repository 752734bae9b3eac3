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
#include <map>
#include <memory>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <vector>

#include <boost/optional.hpp>

#include "shapeshift/converter_cache.hpp"

#include "shapeshift/converters/interned.hpp"
#include "shapeshift/converters/map.hpp"
#include "shapeshift/converters/optional.hpp"
#include "shapeshift/converters/primitive.hpp"
#include "shapeshift/converters/raw.hpp"
#include "shapeshift/converters/vector.hpp"

namespace shapeshift {

namespace detail {

template<class T>
struct is_byte :
    public std::integral_constant<bool, std::is_same<T, char>::value || std::is_same<T, unsigned char>::value>
{};

} // namespace detail

template<class T>
struct converter_traits<T, typename std::enable_if<std::is_integral<T>::value && !std::is_same<T, bool>::value>::type> {
    static
    std::shared_ptr<const converter<T>>
    create() {
        return std::make_shared<integer_converter<T>>();
    }
};

template<class T>
struct converter_traits<T, typename std::enable_if<std::is_floating_point<T>::value>::type> {
    static
    std::shared_ptr<const converter<T>>
    create() {
        return std::make_shared<floating_converter<T>>();
    }
};

template<>
struct converter_traits<bool> {
    static
    std::shared_ptr<const converter<bool>>
    create() {
        return std::make_shared<boolean_converter>();
    }
};

template<>
struct converter_traits<std::string> {
    static
    std::shared_ptr<const converter<std::string>>
    create() {
        return std::make_shared<string_converter>();
    }
};

template<>
struct converter_traits<interned_string> {
    static
    std::shared_ptr<const converter<interned_string>>
    create() {
        return std::make_shared<interned_string_converter>();
    }
};

template<>
struct converter_traits<timestamp_t> {
    static
    std::shared_ptr<const converter<timestamp_t>>
    create() {
        return std::make_shared<timestamp_converter>();
    }
};

template<>
struct converter_traits<std::chrono::system_clock::time_point> {
    static
    std::shared_ptr<const converter<std::chrono::system_clock::time_point>>
    create() {
        return std::make_shared<time_point_converter>();
    }
};

template<>
struct converter_traits<raw_t> {
    static
    std::shared_ptr<const converter<raw_t>>
    create() {
        return std::make_shared<raw_converter>();
    }
};

/// Byte vectors are binary tokens rather than arrays of integers.
template<class T, class Allocator>
struct converter_traits<std::vector<T, Allocator>, typename std::enable_if<detail::is_byte<T>::value>::type> {
    static
    std::shared_ptr<const converter<std::vector<T, Allocator>>>
    create() {
        return std::make_shared<binary_converter<std::vector<T, Allocator>>>();
    }
};

template<class T, class Allocator>
struct converter_traits<std::vector<T, Allocator>, typename std::enable_if<!detail::is_byte<T>::value>::type> {
    static
    std::shared_ptr<const converter<std::vector<T, Allocator>>>
    create() {
        return std::make_shared<vector_converter<T, Allocator>>();
    }
};

template<class K, class V, class Compare, class Allocator>
struct converter_traits<std::map<K, V, Compare, Allocator>> {
    typedef std::map<K, V, Compare, Allocator> value_type;

    static
    std::shared_ptr<const converter<value_type>>
    create() {
        return std::make_shared<map_converter<value_type>>();
    }
};

template<class K, class V, class Hash, class Equal, class Allocator>
struct converter_traits<std::unordered_map<K, V, Hash, Equal, Allocator>> {
    typedef std::unordered_map<K, V, Hash, Equal, Allocator> value_type;

    static
    std::shared_ptr<const converter<value_type>>
    create() {
        return std::make_shared<map_converter<value_type>>();
    }
};

template<class T>
struct converter_traits<boost::optional<T>> {
    static
    std::shared_ptr<const converter<boost::optional<T>>>
    create() {
        return std::make_shared<optional_converter<T>>();
    }
};

} // namespace shapeshift

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

#include <string>
#include <utility>

#include <boost/format.hpp>

namespace shapeshift {

namespace detail {

inline
void
substitute(boost::format&) {}

template<typename T, typename... Args>
inline
void
substitute(boost::format& message, const T& argument, const Args&... args) {
    substitute(message % argument, args...);
}

} // namespace detail

/// Formats the given pattern using boost::format, i.e. both printf-like and positional.
template<typename... Args>
inline
std::string
format(const std::string& pattern, const Args&... args) {
    boost::format message(pattern);
    detail::substitute(message, args...);
    return message.str();
}

} // namespace shapeshift

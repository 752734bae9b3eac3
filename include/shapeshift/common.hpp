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
#include <utility>

#define SHAPESHIFT_DECLARE_NONCOPYABLE(name) \
    name(const name&) = delete;              \
    name& operator=(const name&) = delete;

namespace shapeshift {

template<class Exception>
std::exception_ptr
make_exception_ptr(Exception&& e) {
    try {
        throw std::forward<Exception>(e);
    } catch (...) {
        return std::current_exception();
    }
}

} // namespace shapeshift

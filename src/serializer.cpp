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

#include "shapeshift/serializer.hpp"

using namespace shapeshift;

std::exception_ptr
detail::wrap(const std::exception_ptr& err) {
    if (!err) {
        return err;
    }

    try {
        std::rethrow_exception(err);
    } catch (const serialization_error&) {
        return err;
    } catch (const std::exception&) {
        return shapeshift::make_exception_ptr(serialization_error(err));
    }
}

serializer_t::serializer_t() :
    cache_(new converter_cache_t),
    interner_(new string_interner_t)
{}

serializer_t::serializer_t(const options_t& options) :
    options_(options),
    cache_(new converter_cache_t),
    interner_(new string_interner_t)
{}

serializer_t::~serializer_t() {}

context_t
serializer_t::make_context(cancellation_t cancellation) const {
    return context_t(options_, *cache_, interner_.get(), std::move(cancellation));
}

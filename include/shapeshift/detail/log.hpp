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

#include "shapeshift/config.hpp"

#ifdef SHAPESHIFT_USE_INTERNAL_LOGGING

#include <sstream>
#include <string>

#include <boost/preprocessor/cat.hpp>

#define BLACKHOLE_HAS_ATTRIBUTE_LWP
#include <blackhole/logger.hpp>
#include <blackhole/logger/wrapper.hpp>
#include <blackhole/macro.hpp>
#include <blackhole/scoped_attributes.hpp>
#include <blackhole/utils/format.hpp>

namespace shapeshift {

namespace detail {

enum level_t {
    debug,
    notice,
    info,
    warn,
    error
};

typedef blackhole::verbose_logger_t<level_t> logger_type;

logger_type& logger();

std::string merge_context(std::string context);

} // namespace detail

} // namespace shapeshift

/// Silently cast std::uint64_t to unsigned long long to suppress logger format warnings
/// in cross-platform manner.
#define SHAPESHIFT_US(sized) static_cast<unsigned long long>(sized)

#   define SHAPESHIFT_LOG BH_LOG
#   define SHAPESHIFT_DBG(...) SHAPESHIFT_LOG(::shapeshift::detail::logger(), ::shapeshift::detail::debug, __VA_ARGS__)
#   define SHAPESHIFT_WRN(...) SHAPESHIFT_LOG(::shapeshift::detail::logger(), ::shapeshift::detail::warn, __VA_ARGS__)

#define SHAPESHIFT_CTX(...) \
    ::blackhole::scoped_attributes_t BOOST_PP_CAT(__context__, __COUNTER__)( \
        ::shapeshift::detail::logger(), \
        ::blackhole::attribute::set_t({ \
            { "context", ::shapeshift::detail::merge_context(::blackhole::utils::format(__VA_ARGS__)) } \
        }) \
    );

#else
#   define SHAPESHIFT_US(...)
#   define SHAPESHIFT_LOG(...)
#   define SHAPESHIFT_DBG(...)
#   define SHAPESHIFT_WRN(...)
#   define SHAPESHIFT_CTX(...)
#endif

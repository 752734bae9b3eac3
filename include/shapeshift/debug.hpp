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

#include "shapeshift/options.hpp"
#include "shapeshift/sequence.hpp"

namespace shapeshift {

/*!
 * Renders MessagePack bytes in a JSON-like notation for diagnostics.
 *
 * Every token type is told apart: 32-bit floats carry an `f` suffix, binary is rendered as
 * `bin"<hex>"` and extensions as `ext(<type>, "<hex>")`. Consecutive top-level values are separated
 * by newlines.
 *
 * \throw error_t on malformed input. Nesting is limited by `options.max_depth`.
 */
std::string
to_text(const sequence_t& bytes, const options_t& options = options_t());

} // namespace shapeshift

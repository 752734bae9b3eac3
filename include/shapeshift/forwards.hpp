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

namespace shapeshift {

class sequence_t;
class cursor_t;
class output_buffer_t;

class reader_t;
class writer_t;
class streaming_reader_t;

class async_reader_t;
class async_writer_t;

class source_t;
class sink_t;

class cancellation_t;
class context_t;
class converter_cache_t;
class string_interner_t;

struct options_t;

template<class T>
class converter;

template<class T, class = void>
struct converter_traits;

template<class View>
class loan;

class serializer_t;

} // namespace shapeshift

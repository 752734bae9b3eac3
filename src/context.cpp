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

#include "shapeshift/context.hpp"

#include "shapeshift/converter_cache.hpp"
#include "shapeshift/error.hpp"

#include "shapeshift/detail/log.hpp"

using namespace shapeshift;

context_t::depth_scope_t::depth_scope_t(context_t& context) :
    context(context),
    saved(context.depth())
{
    context.depth_step();
}

context_t::depth_scope_t::~depth_scope_t() {
    context.restore_depth(saved);
}

context_t::context_t() :
    depth_(0),
    cache_(&converter_cache_t::instance()),
    interner_(nullptr)
{}

context_t::context_t(const options_t& options) :
    depth_(0),
    options_(options),
    cache_(&converter_cache_t::instance()),
    interner_(nullptr)
{}

context_t::context_t(const options_t& options,
                     converter_cache_t& cache,
                     string_interner_t* interner,
                     cancellation_t cancellation) :
    depth_(0),
    options_(options),
    cache_(&cache),
    interner_(interner),
    cancellation_(std::move(cancellation))
{}

void
context_t::depth_step() {
    cancellation_.throw_if_cancelled();

    if (depth_ + 1 > options_.max_depth) {
        SHAPESHIFT_WRN("depth limit of %d has been hit", options_.max_depth);
        throw depth_exceeded_error(options_.max_depth);
    }

    ++depth_;
}

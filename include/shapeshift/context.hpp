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

#include <memory>

#include "shapeshift/cancellation.hpp"
#include "shapeshift/forwards.hpp"
#include "shapeshift/options.hpp"

namespace shapeshift {

/*!
 * Per-operation serialization state.
 *
 * Tracks the current nesting depth against the configured limit and gives converters access to
 * the converter cache, the string pool and the cancellation token of the operation.
 *
 * A context is owned by a single top-level operation and is never shared between concurrent ones.
 * Asynchronous converters save the depth before suspending and restore it when resumed, so that
 * interleaved completions can not corrupt it.
 */
class context_t {
    int depth_;
    options_t options_;
    converter_cache_t* cache_;
    string_interner_t* interner_;
    cancellation_t cancellation_;

public:
    /// Restores the depth on scope exit, stepping into the next level on construction.
    class depth_scope_t {
        context_t& context;
        int saved;

    public:
        explicit depth_scope_t(context_t& context);
        ~depth_scope_t();

        depth_scope_t(const depth_scope_t&) = delete;
        depth_scope_t& operator=(const depth_scope_t&) = delete;
    };

public:
    /// Uses the default options and the process-wide converter cache.
    context_t();

    explicit context_t(const options_t& options);

    context_t(const options_t& options,
              converter_cache_t& cache,
              string_interner_t* interner,
              cancellation_t cancellation);

    int
    depth() const {
        return depth_;
    }

    int
    max_depth() const {
        return options_.max_depth;
    }

    const options_t&
    options() const {
        return options_;
    }

    object_layout
    layout() const {
        return options_.layout;
    }

    /// Returns the string pool, or nullptr when interning is disabled.
    string_interner_t*
    interner() const {
        return options_.intern_strings ? interner_ : nullptr;
    }

    const cancellation_t&
    cancellation() const {
        return cancellation_;
    }

    converter_cache_t&
    cache() const {
        return *cache_;
    }

    /// Enters the next nesting level.
    ///
    /// \throw depth_exceeded_error when the level is beyond the limit.
    /// \throw cancelled_error when the operation has been cancelled.
    void
    depth_step();

    /// Sets the depth saved before a suspension point.
    void
    restore_depth(int depth) {
        depth_ = depth;
    }

    /// Returns a converter for the given type from the cache this context refers to.
    template<class T>
    std::shared_ptr<const converter<T>>
    converter_for() const;
};

} // namespace shapeshift

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

#include <cstdint>
#include <utility>

#include "shapeshift/common.hpp"
#include "shapeshift/error.hpp"

namespace shapeshift {

/*!
 * Temporary exclusive access to a synchronous view lent by an asynchronous reader or writer.
 *
 * A loan is move-only and must be handed back to the object that created it. Once returned or
 * moved from, any access through it throws loan_violation_error.
 */
template<class View>
class loan {
    View view;
    const void* owner_;
    std::uint64_t id_;

public:
    loan(View view, const void* owner, std::uint64_t id) :
        view(std::move(view)),
        owner_(owner),
        id_(id)
    {}

    loan(loan&& other) :
        view(std::move(other.view)),
        owner_(other.owner_),
        id_(other.id_)
    {
        other.invalidate();
    }

    loan&
    operator=(loan&& other) {
        if (this != &other) {
            view = std::move(other.view);
            owner_ = other.owner_;
            id_ = other.id_;
            other.invalidate();
        }

        return *this;
    }

    SHAPESHIFT_DECLARE_NONCOPYABLE(loan)

    /// Whether the loan still grants access, i.e. it has been neither returned nor moved from.
    bool
    valid() const {
        return id_ != 0;
    }

    const void*
    owner() const {
        return owner_;
    }

    std::uint64_t
    id() const {
        return id_;
    }

    View&
    get() {
        if (!valid()) {
            throw loan_violation_error("the view has already been returned");
        }

        return view;
    }

    View&
    operator*() {
        return get();
    }

    View*
    operator->() {
        return &get();
    }

    /// Ends the loan, leaving the last state of the view to the owner.
    View
    release() {
        View result = get();
        invalidate();
        return result;
    }

private:
    void
    invalidate() {
        owner_ = nullptr;
        id_ = 0;
    }
};

namespace detail {

/// Lending state machine shared by asynchronous readers and writers.
class lender_t {
public:
    enum class state_t {
        /// No view is lent and no operation is in flight.
        idle,
        /// A view is lent to the caller.
        lent,
        /// An asynchronous operation is in flight.
        busy
    };

private:
    const char* name;
    state_t state_;
    std::uint64_t counter;
    std::uint64_t current;

public:
    explicit lender_t(const char* name);

    state_t
    state() const {
        return state_;
    }

    /// Starts a new loan, returning its identifier.
    std::uint64_t
    lend();

    /// Ends the loan with the given identifier.
    void
    take_back(const void* expected, const void* owner, std::uint64_t id);

    /// \throw loan_violation_error unless idle.
    void
    ensure_idle(const char* operation) const;

    /// Marks an asynchronous operation in flight.
    void
    begin(const char* operation);

    void
    end();
};

} // namespace detail

} // namespace shapeshift

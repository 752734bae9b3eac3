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

#include "shapeshift/loan.hpp"

#include "shapeshift/detail/format.hpp"
#include "shapeshift/detail/log.hpp"

using namespace shapeshift;
using namespace shapeshift::detail;

namespace {

void
violation(const char* name, const std::string& reason) {
    SHAPESHIFT_WRN("!! %s: %s", name, reason.c_str());
    throw loan_violation_error(shapeshift::format("%s: %s", name, reason));
}

} // namespace

lender_t::lender_t(const char* name) :
    name(name),
    state_(state_t::idle),
    counter(0),
    current(0)
{}

std::uint64_t
lender_t::lend() {
    ensure_idle("lend");

    state_ = state_t::lent;
    current = ++counter;

    SHAPESHIFT_DBG("%s: lent view #%llu", name, SHAPESHIFT_US(current));
    return current;
}

void
lender_t::take_back(const void* expected, const void* owner, std::uint64_t id) {
    if (id == 0) {
        violation(name, "the view has already been returned");
    }

    if (owner != expected) {
        violation(name, "the view belongs to another object");
    }

    if (state_ != state_t::lent || id != current) {
        violation(name, "the view is stale");
    }

    SHAPESHIFT_DBG("%s: returned view #%llu", name, SHAPESHIFT_US(id));

    state_ = state_t::idle;
    current = 0;
}

void
lender_t::ensure_idle(const char* operation) const {
    if (state_ == state_t::lent) {
        violation(name, shapeshift::format("can not %s while a view is lent, the previous view must be returned first", operation));
    }

    if (state_ == state_t::busy) {
        violation(name, shapeshift::format("can not %s while an asynchronous operation is in progress", operation));
    }
}

void
lender_t::begin(const char* operation) {
    ensure_idle(operation);
    state_ = state_t::busy;
}

void
lender_t::end() {
    state_ = state_t::idle;
}

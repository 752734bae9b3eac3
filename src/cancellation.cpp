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

#include "shapeshift/cancellation.hpp"

#include <vector>

#include "shapeshift/error.hpp"

#include "shapeshift/detail/log.hpp"

using namespace shapeshift;

cancellation_t::cancellation_t() :
    state(std::make_shared<state_t>())
{}

void
cancellation_t::cancel() {
    std::vector<callback_type> callbacks;

    {
        std::lock_guard<std::mutex> lock(state->mutex);
        if (state->cancelled) {
            return;
        }

        state->cancelled = true;
        for (auto it = state->callbacks.begin(); it != state->callbacks.end(); ++it) {
            callbacks.push_back(std::move(it->second));
        }
        state->callbacks.clear();
    }

    SHAPESHIFT_DBG("cancellation requested, notifying %llu subscriber(s)", SHAPESHIFT_US(callbacks.size()));

    for (auto it = callbacks.begin(); it != callbacks.end(); ++it) {
        (*it)();
    }
}

bool
cancellation_t::cancelled() const {
    std::lock_guard<std::mutex> lock(state->mutex);
    return state->cancelled;
}

void
cancellation_t::throw_if_cancelled() const {
    if (cancelled()) {
        throw cancelled_error();
    }
}

cancellation_t::registration_type
cancellation_t::subscribe(callback_type callback) {
    {
        std::lock_guard<std::mutex> lock(state->mutex);
        if (!state->cancelled) {
            const registration_type id = ++state->counter;
            state->callbacks.insert(std::make_pair(id, std::move(callback)));
            return id;
        }
    }

    callback();
    return 0;
}

void
cancellation_t::unsubscribe(registration_type id) {
    std::lock_guard<std::mutex> lock(state->mutex);
    state->callbacks.erase(id);
}

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
#include <functional>
#include <map>
#include <memory>
#include <mutex>

namespace shapeshift {

/*!
 * Cancellation token.
 *
 * Copies share the same state, so that cancelling any of them is observed by all. Asynchronous
 * operations subscribe for the duration of their pending step to abort it.
 */
class cancellation_t {
public:
    typedef std::function<void()> callback_type;
    typedef std::uint64_t registration_type;

private:
    struct state_t {
        std::mutex mutex;
        bool cancelled;
        registration_type counter;
        std::map<registration_type, callback_type> callbacks;

        state_t() :
            cancelled(false),
            counter(0)
        {}
    };

    std::shared_ptr<state_t> state;

public:
    cancellation_t();

    /// Requests cancellation, invoking every subscribed callback once.
    void
    cancel();

    bool
    cancelled() const;

    /// \throw cancelled_error if the cancellation has been requested.
    void
    throw_if_cancelled() const;

    /// Subscribes for the cancellation request.
    ///
    /// The callback is invoked immediately when the cancellation has already been requested.
    /// Returns zero in that case.
    registration_type
    subscribe(callback_type callback);

    void
    unsubscribe(registration_type id);
};

} // namespace shapeshift

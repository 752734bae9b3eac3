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

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "shapeshift/secure/sip_hash.hpp"

namespace shapeshift {

/// Shared immutable string, equal decoded values of which may share a single instance.
typedef std::shared_ptr<const std::string> interned_string;

/*!
 * Thread-safe pool of immutable strings.
 *
 * Lookups are keyed by the keyed hash of the UTF-8 bytes, which does not require allocating a
 * string for the candidate. Colliding entries are told apart by content.
 *
 * The pool holds weak references only: a string is released as soon as no caller holds it, and
 * its expired entry is dropped on the next lookup of the same bucket or on the next sweep.
 */
class string_interner_t {
    typedef std::vector<std::weak_ptr<const std::string>> bucket_type;

    mutable std::mutex mutex;
    sip_hasher_t hasher;
    mutable std::unordered_map<std::uint64_t, bucket_type> pool;
    mutable std::size_t entries;
    mutable std::size_t inserted;

public:
    string_interner_t();
    explicit string_interner_t(const sip_hasher_t& hasher);

    /// Returns the pooled instance equal to the given bytes, adding one when missing.
    interned_string
    intern(const char* data, std::size_t size);

    interned_string
    intern(const std::string& value);

    /// Number of distinct pooled strings that are still alive.
    std::size_t
    size() const;

private:
    /// Drops expired entries of every bucket. Must be called under the lock.
    void
    sweep() const;
};

} // namespace shapeshift

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

#include "shapeshift/interner.hpp"

#include <cstring>

using namespace shapeshift;

string_interner_t::string_interner_t() :
    hasher(sip_hasher_t::instance()),
    entries(0),
    inserted(0)
{}

string_interner_t::string_interner_t(const sip_hasher_t& hasher) :
    hasher(hasher),
    entries(0),
    inserted(0)
{}

interned_string
string_interner_t::intern(const char* data, std::size_t size) {
    const std::uint64_t hash = hasher.hash(data, size);

    std::lock_guard<std::mutex> lock(mutex);

    bucket_type& bucket = pool[hash];
    for (auto it = bucket.begin(); it != bucket.end();) {
        interned_string candidate = it->lock();

        if (!candidate) {
            it = bucket.erase(it);
            --entries;
            continue;
        }

        if (candidate->size() == size && std::memcmp(candidate->data(), data, size) == 0) {
            return candidate;
        }

        ++it;
    }

    // Not made with make_shared, the weak entry must not keep the string storage alive.
    interned_string value(new std::string(data, size));
    bucket.push_back(value);
    ++entries;

    // Amortized: entries of strings that are never looked up again are dropped here.
    if (++inserted > entries / 2 + 64) {
        sweep();
    }

    return value;
}

interned_string
string_interner_t::intern(const std::string& value) {
    return intern(value.data(), value.size());
}

std::size_t
string_interner_t::size() const {
    std::lock_guard<std::mutex> lock(mutex);
    sweep();
    return entries;
}

void
string_interner_t::sweep() const {
    for (auto it = pool.begin(); it != pool.end();) {
        bucket_type& bucket = it->second;

        for (auto entry = bucket.begin(); entry != bucket.end();) {
            if (entry->expired()) {
                entry = bucket.erase(entry);
                --entries;
            } else {
                ++entry;
            }
        }

        if (bucket.empty()) {
            it = pool.erase(it);
        } else {
            ++it;
        }
    }

    inserted = 0;
}

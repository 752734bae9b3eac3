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

#include "shapeshift/secure/sip_hash.hpp"

#include <random>
#include <vector>

using namespace shapeshift;

namespace {

inline
std::uint64_t
rotl(std::uint64_t x, int b) {
    return (x << b) | (x >> (64 - b));
}

inline
std::uint64_t
load_le(const std::uint8_t* data) {
    std::uint64_t result = 0;
    for (int i = 7; i >= 0; --i) {
        result = (result << 8) | data[i];
    }

    return result;
}

inline
void
store_le(std::uint64_t value, std::uint8_t* data) {
    for (int i = 0; i < 8; ++i) {
        data[i] = static_cast<std::uint8_t>(value >> (8 * i));
    }
}

struct state_t {
    std::uint64_t v0;
    std::uint64_t v1;
    std::uint64_t v2;
    std::uint64_t v3;

    state_t(std::uint64_t k0, std::uint64_t k1) :
        v0(0x736f6d6570736575ULL ^ k0),
        v1(0x646f72616e646f6dULL ^ k1),
        v2(0x6c7967656e657261ULL ^ k0),
        v3(0x7465646279746573ULL ^ k1)
    {}

    void
    round() {
        v0 += v1; v1 = rotl(v1, 13); v1 ^= v0; v0 = rotl(v0, 32);
        v2 += v3; v3 = rotl(v3, 16); v3 ^= v2;
        v0 += v3; v3 = rotl(v3, 21); v3 ^= v0;
        v2 += v1; v1 = rotl(v1, 17); v1 ^= v2; v2 = rotl(v2, 32);
    }

    void
    compress(std::uint64_t m) {
        v3 ^= m;
        round();
        round();
        v0 ^= m;
    }

    std::uint64_t
    finalize() {
        v2 ^= 0xff;
        round();
        round();
        round();
        round();
        return v0 ^ v1 ^ v2 ^ v3;
    }
};

} // namespace

sip_hasher_t::sip_hasher_t() {
    std::random_device device;
    std::uniform_int_distribution<std::uint64_t> distribution;

    k0 = distribution(device);
    k1 = distribution(device);
}

sip_hasher_t::sip_hasher_t(std::uint64_t k0, std::uint64_t k1) :
    k0(k0),
    k1(k1)
{}

const sip_hasher_t&
sip_hasher_t::instance() {
    static const sip_hasher_t self;
    return self;
}

std::uint64_t
sip_hasher_t::hash(const void* data, std::size_t size) const {
    const std::uint8_t* it = static_cast<const std::uint8_t*>(data);
    const std::uint8_t* end = it + (size - size % 8);

    state_t state(k0, k1);

    for (; it != end; it += 8) {
        state.compress(load_le(it));
    }

    std::uint64_t last = static_cast<std::uint64_t>(size) << 56;
    for (std::size_t i = 0; i < size % 8; ++i) {
        last |= static_cast<std::uint64_t>(it[i]) << (8 * i);
    }

    state.compress(last);
    return state.finalize();
}

std::uint64_t
sip_hasher_t::hash(const std::uint64_t* words, std::size_t count) const {
    std::vector<std::uint8_t> bytes(count * 8);
    for (std::size_t i = 0; i < count; ++i) {
        store_le(words[i], bytes.data() + i * 8);
    }

    return hash(bytes.data(), bytes.size());
}

std::uint64_t
sip_hasher_t::hash(std::uint64_t word) const {
    return hash(&word, 1);
}

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

namespace shapeshift {

/*!
 * Keyed SipHash-2-4.
 *
 * Hashes of attacker controlled data are unpredictable as long as the key stays secret, which
 * makes crafting colliding inputs impractical.
 */
class sip_hasher_t {
    std::uint64_t k0;
    std::uint64_t k1;

public:
    /// Generates a random key.
    sip_hasher_t();

    sip_hasher_t(std::uint64_t k0, std::uint64_t k1);

    /// Returns the process-wide hasher, keyed randomly on first use.
    static
    const sip_hasher_t&
    instance();

    std::uint64_t
    hash(const void* data, std::size_t size) const;

    /// Hashes the little-endian representation of the words.
    std::uint64_t
    hash(const std::uint64_t* words, std::size_t count) const;

    std::uint64_t
    hash(std::uint64_t word) const;
};

} // namespace shapeshift

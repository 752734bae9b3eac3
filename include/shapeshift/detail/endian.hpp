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
#include <cstring>

namespace shapeshift {

namespace detail {

inline std::uint8_t  load8(const char* p)  { return static_cast<std::uint8_t>(*p); }

inline
std::uint16_t
load16(const char* p) {
    const unsigned char* b = reinterpret_cast<const unsigned char*>(p);
    return static_cast<std::uint16_t>((b[0] << 8) | b[1]);
}

inline
std::uint32_t
load32(const char* p) {
    const unsigned char* b = reinterpret_cast<const unsigned char*>(p);
    return (static_cast<std::uint32_t>(b[0]) << 24) |
           (static_cast<std::uint32_t>(b[1]) << 16) |
           (static_cast<std::uint32_t>(b[2]) << 8)  |
            static_cast<std::uint32_t>(b[3]);
}

inline
std::uint64_t
load64(const char* p) {
    return (static_cast<std::uint64_t>(load32(p)) << 32) | load32(p + 4);
}

inline void store8(char* p, std::uint8_t v) { *p = static_cast<char>(v); }

inline
void
store16(char* p, std::uint16_t v) {
    p[0] = static_cast<char>(v >> 8);
    p[1] = static_cast<char>(v);
}

inline
void
store32(char* p, std::uint32_t v) {
    p[0] = static_cast<char>(v >> 24);
    p[1] = static_cast<char>(v >> 16);
    p[2] = static_cast<char>(v >> 8);
    p[3] = static_cast<char>(v);
}

inline
void
store64(char* p, std::uint64_t v) {
    store32(p, static_cast<std::uint32_t>(v >> 32));
    store32(p + 4, static_cast<std::uint32_t>(v));
}

inline
float
load_float(const char* p) {
    const std::uint32_t bits = load32(p);
    float value;
    std::memcpy(&value, &bits, sizeof(value));
    return value;
}

inline
double
load_double(const char* p) {
    const std::uint64_t bits = load64(p);
    double value;
    std::memcpy(&value, &bits, sizeof(value));
    return value;
}

inline
void
store_float(char* p, float value) {
    std::uint32_t bits;
    std::memcpy(&bits, &value, sizeof(bits));
    store32(p, bits);
}

inline
void
store_double(char* p, double value) {
    std::uint64_t bits;
    std::memcpy(&bits, &value, sizeof(bits));
    store64(p, bits);
}

} // namespace detail

} // namespace shapeshift

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

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <functional>
#include <limits>
#include <memory>
#include <string>
#include <type_traits>
#include <typeinfo>
#include <vector>

#include <boost/optional.hpp>

#include "shapeshift/error.hpp"
#include "shapeshift/primitives.hpp"
#include "shapeshift/secure/sip_hash.hpp"

/// Collision resistant equality comparers.
///
/// Every comparer is a small value type exposing `value_type`, `equals(a, b)` and `hash(a)`, the
/// latter being a keyed 64-bit hash. Comparers for composite values wrap the comparers of their
/// parts, so that keys decoded from untrusted input can be used in hash tables without exposing
/// them to deliberately colliding inputs.

namespace shapeshift {

/// Value returned as the hash of an absent value.
const std::uint64_t absent_hash = 0;

template<class T, class = void>
class secure_equality_comparer;

template<class T>
class secure_equality_comparer<T, typename std::enable_if<std::is_integral<T>::value>::type> {
    const sip_hasher_t* hasher;

public:
    typedef T value_type;

    explicit secure_equality_comparer(const sip_hasher_t& hasher = sip_hasher_t::instance()) :
        hasher(&hasher)
    {}

    bool
    equals(T lhs, T rhs) const {
        return lhs == rhs;
    }

    /// Values of equal magnitude hash equally whatever the integer width is.
    std::uint64_t
    hash(T value) const {
        const std::uint64_t word = std::is_signed<T>::value ?
            static_cast<std::uint64_t>(static_cast<std::int64_t>(value)) :
            static_cast<std::uint64_t>(value);

        return hasher->hash(word);
    }
};

/// Treats `0.0` and `-0.0` as equal, as well as all NaN representations.
template<class T>
class secure_equality_comparer<T, typename std::enable_if<std::is_floating_point<T>::value>::type> {
    const sip_hasher_t* hasher;

public:
    typedef T value_type;

    explicit secure_equality_comparer(const sip_hasher_t& hasher = sip_hasher_t::instance()) :
        hasher(&hasher)
    {}

    bool
    equals(T lhs, T rhs) const {
        return lhs == rhs || (std::isnan(lhs) && std::isnan(rhs));
    }

    std::uint64_t
    hash(T value) const {
        double normalized = static_cast<double>(value);

        if (normalized == 0.0) {
            normalized = 0.0;
        } else if (std::isnan(normalized)) {
            normalized = std::numeric_limits<double>::quiet_NaN();
        }

        std::uint64_t word;
        std::memcpy(&word, &normalized, sizeof(word));
        return hasher->hash(word);
    }
};

template<>
class secure_equality_comparer<std::string> {
    const sip_hasher_t* hasher;

public:
    typedef std::string value_type;

    explicit secure_equality_comparer(const sip_hasher_t& hasher = sip_hasher_t::instance()) :
        hasher(&hasher)
    {}

    bool
    equals(const std::string& lhs, const std::string& rhs) const {
        return lhs == rhs;
    }

    std::uint64_t
    hash(const std::string& value) const {
        return hasher->hash(value.data(), value.size());
    }
};

/// Byte vectors are compared and hashed as opaque blobs.
template<class T, class Allocator>
class secure_equality_comparer<std::vector<T, Allocator>,
    typename std::enable_if<std::is_same<T, char>::value || std::is_same<T, unsigned char>::value>::type>
{
    const sip_hasher_t* hasher;

public:
    typedef std::vector<T, Allocator> value_type;

    explicit secure_equality_comparer(const sip_hasher_t& hasher = sip_hasher_t::instance()) :
        hasher(&hasher)
    {}

    bool
    equals(const value_type& lhs, const value_type& rhs) const {
        return lhs == rhs;
    }

    std::uint64_t
    hash(const value_type& value) const {
        return hasher->hash(value.data(), value.size());
    }
};

template<>
class secure_equality_comparer<timestamp_t> {
    const sip_hasher_t* hasher;

public:
    typedef timestamp_t value_type;

    explicit secure_equality_comparer(const sip_hasher_t& hasher = sip_hasher_t::instance()) :
        hasher(&hasher)
    {}

    bool
    equals(const timestamp_t& lhs, const timestamp_t& rhs) const {
        return lhs == rhs;
    }

    std::uint64_t
    hash(const timestamp_t& value) const {
        const std::uint64_t words[] = {
            static_cast<std::uint64_t>(value.seconds),
            static_cast<std::uint64_t>(value.nanoseconds)
        };

        return hasher->hash(words, 2);
    }
};

/// Absent values are equal to each other only, and hash to `absent_hash`.
template<class Inner>
class optional_comparer {
    Inner inner;

public:
    typedef boost::optional<typename Inner::value_type> value_type;

    explicit optional_comparer(Inner inner = Inner()) :
        inner(std::move(inner))
    {}

    bool
    equals(const value_type& lhs, const value_type& rhs) const {
        if (!lhs || !rhs) {
            return !lhs && !rhs;
        }

        return inner.equals(*lhs, *rhs);
    }

    std::uint64_t
    hash(const value_type& value) const {
        return value ? inner.hash(*value) : absent_hash;
    }
};

/*!
 * Compares objects by a single projected property.
 *
 * Objects of different dynamic types are never equal.
 */
template<class T, class Inner>
class property_comparer {
public:
    typedef T value_type;
    typedef std::function<typename Inner::value_type(const T&)> getter_type;

private:
    getter_type getter;
    Inner inner;

public:
    explicit property_comparer(getter_type getter, Inner inner = Inner()) :
        getter(std::move(getter)),
        inner(std::move(inner))
    {}

    bool
    equals(const T& lhs, const T& rhs) const {
        return typeid(lhs) == typeid(rhs) && inner.equals(getter(lhs), getter(rhs));
    }

    std::uint64_t
    hash(const T& value) const {
        return inner.hash(getter(value));
    }
};

/// Compares values through a surrogate representation that has its own comparer.
template<class T, class Inner>
class surrogate_comparer {
public:
    typedef T value_type;
    typedef typename Inner::value_type surrogate_type;
    typedef std::function<surrogate_type(const T&)> marshaller_type;

private:
    marshaller_type marshal;
    Inner inner;

public:
    explicit surrogate_comparer(marshaller_type marshal, Inner inner = Inner()) :
        marshal(std::move(marshal)),
        inner(std::move(inner))
    {}

    bool
    equals(const T& lhs, const T& rhs) const {
        return inner.equals(marshal(lhs), marshal(rhs));
    }

    std::uint64_t
    hash(const T& value) const {
        return inner.hash(marshal(value));
    }
};

/// Element-wise comparison of ordered sequences.
template<class Container, class Inner>
class sequence_comparer {
    Inner inner;
    const sip_hasher_t* hasher;

public:
    typedef Container value_type;

    explicit sequence_comparer(Inner inner = Inner(), const sip_hasher_t& hasher = sip_hasher_t::instance()) :
        inner(std::move(inner)),
        hasher(&hasher)
    {}

    bool
    equals(const Container& lhs, const Container& rhs) const {
        if (lhs.size() != rhs.size()) {
            return false;
        }

        auto it = rhs.begin();
        for (auto jt = lhs.begin(); jt != lhs.end(); ++jt, ++it) {
            if (!inner.equals(*jt, *it)) {
                return false;
            }
        }

        return true;
    }

    std::uint64_t
    hash(const Container& value) const {
        std::vector<std::uint64_t> hashes;
        hashes.reserve(value.size());

        for (auto it = value.begin(); it != value.end(); ++it) {
            hashes.push_back(inner.hash(*it));
        }

        return hasher->hash(hashes.data(), hashes.size());
    }
};

/*!
 * Comparison of associative containers, independent of their iteration order.
 *
 * Keys are looked up with the container's own lookup, values are compared with the value comparer.
 */
template<class Map, class KeyComparer, class ValueComparer>
class map_comparer {
    KeyComparer keys;
    ValueComparer values;
    const sip_hasher_t* hasher;

public:
    typedef Map value_type;

    explicit map_comparer(KeyComparer keys = KeyComparer(),
                          ValueComparer values = ValueComparer(),
                          const sip_hasher_t& hasher = sip_hasher_t::instance()) :
        keys(std::move(keys)),
        values(std::move(values)),
        hasher(&hasher)
    {}

    bool
    equals(const Map& lhs, const Map& rhs) const {
        if (&lhs == &rhs) {
            return true;
        }

        if (lhs.size() != rhs.size()) {
            return false;
        }

        for (auto it = lhs.begin(); it != lhs.end(); ++it) {
            auto found = rhs.find(it->first);
            if (found == rhs.end() || !values.equals(it->second, found->second)) {
                return false;
            }
        }

        return true;
    }

    std::uint64_t
    hash(const Map& value) const {
        // Wrapping sum keeps the result independent of the iteration order.
        std::uint64_t sum = 0;

        for (auto it = value.begin(); it != value.end(); ++it) {
            const std::uint64_t entry[] = { keys.hash(it->first), values.hash(it->second) };
            sum += hasher->hash(entry, 2);
        }

        const std::uint64_t words[] = { sum, static_cast<std::uint64_t>(value.size()) };
        return hasher->hash(words, 2);
    }
};

/*!
 * Combines several comparers of the same type, typically one property comparer per property.
 *
 * Values are equal when every component considers them equal. At least one component must be
 * added before comparing or hashing.
 */
template<class T>
class aggregate_comparer {
    class component_t {
    public:
        virtual
        ~component_t() {}

        virtual
        bool
        equals(const T& lhs, const T& rhs) const = 0;

        virtual
        std::uint64_t
        hash(const T& value) const = 0;
    };

    template<class Comparer>
    class component : public component_t {
        Comparer comparer;

    public:
        explicit component(Comparer comparer) :
            comparer(std::move(comparer))
        {}

        virtual
        bool
        equals(const T& lhs, const T& rhs) const {
            return comparer.equals(lhs, rhs);
        }

        virtual
        std::uint64_t
        hash(const T& value) const {
            return comparer.hash(value);
        }
    };

    std::vector<std::shared_ptr<const component_t>> components;
    const sip_hasher_t* hasher;

public:
    typedef T value_type;

    explicit aggregate_comparer(const sip_hasher_t& hasher = sip_hasher_t::instance()) :
        hasher(&hasher)
    {}

    template<class Comparer>
    aggregate_comparer&
    add(Comparer comparer) {
        static_assert(std::is_same<typename Comparer::value_type, T>::value, "comparer of the same type required");

        components.push_back(std::make_shared<component<Comparer>>(std::move(comparer)));
        return *this;
    }

    bool
    empty() const {
        return components.empty();
    }

    /// \throw error_t with the not_supported code when there are no components.
    bool
    equals(const T& lhs, const T& rhs) const {
        ensure_components();

        for (auto it = components.begin(); it != components.end(); ++it) {
            if (!(*it)->equals(lhs, rhs)) {
                return false;
            }
        }

        return true;
    }

    /// \throw error_t with the not_supported code when there are no components.
    std::uint64_t
    hash(const T& value) const {
        ensure_components();

        std::vector<std::uint64_t> hashes;
        hashes.reserve(components.size());

        for (auto it = components.begin(); it != components.end(); ++it) {
            hashes.push_back((*it)->hash(value));
        }

        return hasher->hash(hashes.data(), hashes.size());
    }

private:
    void
    ensure_components() const {
        if (components.empty()) {
            throw error_t(error::not_supported, "the aggregate comparer has no components");
        }
    }
};

/// Hasher functor for standard unordered containers.
template<class Comparer>
class secure_hash {
    Comparer comparer;

public:
    secure_hash() {}

    explicit secure_hash(Comparer comparer) :
        comparer(std::move(comparer))
    {}

    std::size_t
    operator()(const typename Comparer::value_type& value) const {
        return static_cast<std::size_t>(comparer.hash(value));
    }
};

/// Key equality functor for standard unordered containers.
template<class Comparer>
class secure_equal {
    Comparer comparer;

public:
    secure_equal() {}

    explicit secure_equal(Comparer comparer) :
        comparer(std::move(comparer))
    {}

    bool
    operator()(const typename Comparer::value_type& lhs, const typename Comparer::value_type& rhs) const {
        return comparer.equals(lhs, rhs);
    }
};

} // namespace shapeshift

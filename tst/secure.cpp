#include <cmath>
#include <cstdint>
#include <limits>
#include <map>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include <boost/optional.hpp>

#include <gtest/gtest.h>

#include <shapeshift/secure/comparer.hpp>
#include <shapeshift/secure/sip_hash.hpp>

using namespace shapeshift;

using namespace testing;

namespace {

/// Key 00 01 .. 0f of the reference test vectors.
sip_hasher_t
reference_hasher() {
    return sip_hasher_t(0x0706050403020100ull, 0x0f0e0d0c0b0a0908ull);
}

std::vector<char>
counting(std::size_t size) {
    std::vector<char> result;
    for (std::size_t i = 0; i < size; ++i) {
        result.push_back(static_cast<char>(i));
    }

    return result;
}

/// Polynomial string hash with multiplier 31, trivially forced into collisions.
std::uint32_t
naive_hash(const std::string& value) {
    std::uint32_t result = 0;
    for (auto it = value.begin(); it != value.end(); ++it) {
        result = 31 * result + static_cast<unsigned char>(*it);
    }

    return result;
}

/// Every concatenation of eight "Aa" or "BB" blocks, all of which share the naive hash.
std::vector<std::string>
naively_colliding_strings() {
    std::vector<std::string> result;

    for (unsigned mask = 0; mask < 256; ++mask) {
        std::string value;
        for (unsigned bit = 0; bit < 8; ++bit) {
            value += (mask & (1u << bit)) ? "BB" : "Aa";
        }

        result.push_back(value);
    }

    return result;
}

struct user_t {
    std::string name;
    int age;

    user_t(std::string name, int age) : name(std::move(name)), age(age) {}
};

} // namespace

TEST(sip_hasher_t, ReferenceVectors) {
    const sip_hasher_t hasher = reference_hasher();

    EXPECT_EQ(0x726fdb47dd0e0e31ull, hasher.hash(counting(0).data(), 0));
    EXPECT_EQ(0x74f839c593dc67fdull, hasher.hash(counting(1).data(), 1));
    EXPECT_EQ(0x93f5f5799a932462ull, hasher.hash(counting(8).data(), 8));
    EXPECT_EQ(0xa129ca6149be45e5ull, hasher.hash(counting(15).data(), 15));
}

TEST(sip_hasher_t, WordsAreHashedLittleEndian) {
    const sip_hasher_t hasher = reference_hasher();

    const std::uint64_t word = 0x0706050403020100ull;
    EXPECT_EQ(0x93f5f5799a932462ull, hasher.hash(word));
    EXPECT_EQ(0x93f5f5799a932462ull, hasher.hash(&word, 1));

    const std::vector<char> bytes = counting(16);
    const std::uint64_t words[] = { 0x0706050403020100ull, 0x0f0e0d0c0b0a0908ull };
    EXPECT_EQ(hasher.hash(bytes.data(), bytes.size()), hasher.hash(words, 2));
}

TEST(sip_hasher_t, DifferentKeysGiveDifferentHashes) {
    const sip_hasher_t first(1, 2);
    const sip_hasher_t second(3, 4);

    const std::string value = "collision";
    EXPECT_NE(first.hash(value.data(), value.size()), second.hash(value.data(), value.size()));

    EXPECT_EQ(&sip_hasher_t::instance(), &sip_hasher_t::instance());
}

TEST(sip_hasher_t, SeparatesNaivelyCollidingStrings) {
    const std::vector<std::string> values = naively_colliding_strings();

    for (auto it = values.begin(); it != values.end(); ++it) {
        ASSERT_EQ(naive_hash(values.front()), naive_hash(*it));
    }

    // Randomly keyed hashers, as every process gets one.
    for (int round = 0; round < 32; ++round) {
        const sip_hasher_t hasher;
        const secure_equality_comparer<std::string> comparer(hasher);

        std::unordered_set<std::uint64_t> hashes;
        for (auto it = values.begin(); it != values.end(); ++it) {
            hashes.insert(comparer.hash(*it));
        }

        EXPECT_EQ(values.size(), hashes.size()) << "round " << round;
    }
}

TEST(sip_hasher_t, RandomKeysGiveUnrelatedHashes) {
    const std::string value = "AaAaAaAa";

    std::unordered_set<std::uint64_t> hashes;
    for (int round = 0; round < 64; ++round) {
        hashes.insert(sip_hasher_t().hash(value.data(), value.size()));
    }

    EXPECT_EQ(64u, hashes.size());
}

TEST(secure_equality_comparer, Integers) {
    const sip_hasher_t hasher = reference_hasher();

    secure_equality_comparer<int> narrow(hasher);
    secure_equality_comparer<std::int64_t> wide(hasher);

    EXPECT_TRUE(narrow.equals(5, 5));
    EXPECT_FALSE(narrow.equals(5, 6));
    EXPECT_EQ(narrow.hash(-7), wide.hash(-7));
    EXPECT_NE(narrow.hash(1), narrow.hash(2));
}

TEST(secure_equality_comparer, FloatingPointZeroesAndNaN) {
    secure_equality_comparer<double> comparer;

    EXPECT_TRUE(comparer.equals(0.0, -0.0));
    EXPECT_EQ(comparer.hash(0.0), comparer.hash(-0.0));

    const double nan = std::numeric_limits<double>::quiet_NaN();
    const double other = -std::numeric_limits<double>::quiet_NaN();

    EXPECT_TRUE(comparer.equals(nan, other));
    EXPECT_EQ(comparer.hash(nan), comparer.hash(other));
    EXPECT_FALSE(comparer.equals(nan, 1.0));

    secure_equality_comparer<float> narrow;
    EXPECT_EQ(comparer.hash(1.5), narrow.hash(1.5f));
}

TEST(secure_equality_comparer, StringsAndBinary) {
    secure_equality_comparer<std::string> strings;
    secure_equality_comparer<std::vector<char>> binary;

    EXPECT_TRUE(strings.equals("abc", "abc"));
    EXPECT_FALSE(strings.equals("abc", "abd"));
    EXPECT_EQ(strings.hash("abc"), binary.hash(std::vector<char>({ 'a', 'b', 'c' })));
}

TEST(secure_equality_comparer, Timestamps) {
    secure_equality_comparer<timestamp_t> comparer;

    EXPECT_TRUE(comparer.equals(timestamp_t(1, 2), timestamp_t(1, 2)));
    EXPECT_NE(comparer.hash(timestamp_t(1, 2)), comparer.hash(timestamp_t(2, 1)));
}

TEST(optional_comparer, AbsentValues) {
    optional_comparer<secure_equality_comparer<int>> comparer;

    const boost::optional<int> none;
    const boost::optional<int> zero(0);

    EXPECT_TRUE(comparer.equals(none, none));
    EXPECT_FALSE(comparer.equals(none, zero));
    EXPECT_TRUE(comparer.equals(zero, boost::optional<int>(0)));
    EXPECT_EQ(absent_hash, comparer.hash(none));
    EXPECT_EQ(secure_equality_comparer<int>().hash(0), comparer.hash(zero));
}

TEST(sequence_comparer, ElementWise) {
    sequence_comparer<std::vector<double>, secure_equality_comparer<double>> comparer;

    EXPECT_TRUE(comparer.equals({ 1.0, -0.0 }, { 1.0, 0.0 }));
    EXPECT_FALSE(comparer.equals({ 1.0 }, { 1.0, 2.0 }));
    EXPECT_FALSE(comparer.equals({ 1.0, 2.0 }, { 2.0, 1.0 }));

    EXPECT_EQ(comparer.hash({ 1.0, -0.0 }), comparer.hash({ 1.0, 0.0 }));
    EXPECT_NE(comparer.hash({ 1.0, 2.0 }), comparer.hash({ 2.0, 1.0 }));
}

TEST(map_comparer, IndependentOfOrder) {
    typedef std::unordered_map<std::string, int> map_type;
    typedef map_comparer<map_type, secure_equality_comparer<std::string>, secure_equality_comparer<int>> comparer_type;

    comparer_type comparer;

    map_type lhs;
    map_type rhs;
    rhs.reserve(64);

    for (int i = 0; i < 20; ++i) {
        lhs[std::to_string(i)] = i;
        rhs[std::to_string(19 - i)] = 19 - i;
    }

    EXPECT_TRUE(comparer.equals(lhs, rhs));
    EXPECT_EQ(comparer.hash(lhs), comparer.hash(rhs));

    rhs["0"] = 100;
    EXPECT_FALSE(comparer.equals(lhs, rhs));
    EXPECT_NE(comparer.hash(lhs), comparer.hash(rhs));

    rhs.erase("0");
    EXPECT_FALSE(comparer.equals(lhs, rhs));
}

TEST(property_comparer, ComparesProjection) {
    property_comparer<user_t, secure_equality_comparer<std::string>> comparer(
        [](const user_t& user) { return user.name; });

    EXPECT_TRUE(comparer.equals(user_t("ann", 1), user_t("ann", 2)));
    EXPECT_FALSE(comparer.equals(user_t("ann", 1), user_t("bob", 1)));
    EXPECT_EQ(comparer.hash(user_t("ann", 1)), comparer.hash(user_t("ann", 2)));
}

TEST(surrogate_comparer, ComparesSurrogate) {
    surrogate_comparer<int, secure_equality_comparer<std::string>> comparer(
        [](const int& value) { return std::to_string(value % 10); });

    EXPECT_TRUE(comparer.equals(3, 13));
    EXPECT_FALSE(comparer.equals(3, 4));
    EXPECT_EQ(comparer.hash(3), comparer.hash(13));
}

TEST(aggregate_comparer, CombinesComponents) {
    aggregate_comparer<user_t> comparer;
    comparer
        .add(property_comparer<user_t, secure_equality_comparer<std::string>>(
            [](const user_t& user) { return user.name; }))
        .add(property_comparer<user_t, secure_equality_comparer<int>>(
            [](const user_t& user) { return user.age; }));

    EXPECT_FALSE(comparer.empty());
    EXPECT_TRUE(comparer.equals(user_t("ann", 1), user_t("ann", 1)));
    EXPECT_FALSE(comparer.equals(user_t("ann", 1), user_t("ann", 2)));
    EXPECT_EQ(comparer.hash(user_t("ann", 1)), comparer.hash(user_t("ann", 1)));
    EXPECT_NE(comparer.hash(user_t("ann", 1)), comparer.hash(user_t("ann", 2)));
}

TEST(aggregate_comparer, RequiresComponents) {
    const aggregate_comparer<user_t> empty;
    EXPECT_TRUE(empty.empty());

    try {
        empty.equals(user_t("ann", 1), user_t("ann", 1));
        FAIL() << "error_t expected";
    } catch (const shapeshift::error_t& err) {
        EXPECT_EQ(error::not_supported, err.code().value());
        EXPECT_TRUE(err.code().category() == error::usage_category());
    }

    EXPECT_THROW(empty.hash(user_t("ann", 1)), shapeshift::error_t);
}

TEST(aggregate_comparer, IsReflexive) {
    aggregate_comparer<user_t> comparer;
    comparer.add(property_comparer<user_t, secure_equality_comparer<int>>(
        [](const user_t& user) { return user.age; }));

    const user_t user("ann", 1);
    EXPECT_TRUE(comparer.equals(user, user));

    typedef aggregate_comparer<user_t> comparer_type;
    std::unordered_set<user_t, secure_hash<comparer_type>, secure_equal<comparer_type>> users(
        0, secure_hash<comparer_type>(comparer), secure_equal<comparer_type>(comparer));

    users.insert(user);
    users.insert(user_t("bob", 1));
    users.insert(user_t("ann", 2));

    EXPECT_EQ(2u, users.size());
}

TEST(secure_hash, UsableInUnorderedContainers) {
    typedef secure_equality_comparer<double> comparer_type;

    std::unordered_set<double, secure_hash<comparer_type>, secure_equal<comparer_type>> values;
    values.insert(0.0);
    values.insert(-0.0);
    values.insert(std::numeric_limits<double>::quiet_NaN());
    values.insert(std::numeric_limits<double>::quiet_NaN());

    EXPECT_EQ(2u, values.size());
}

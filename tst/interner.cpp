#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include <shapeshift/interner.hpp>

using namespace shapeshift;

using namespace testing;

TEST(string_interner_t, SharesEqualStrings) {
    string_interner_t interner;

    const interned_string first = interner.intern("abc");
    const interned_string second = interner.intern(std::string("abc"));
    const interned_string third = interner.intern("abcd", 3);

    EXPECT_EQ("abc", *first);
    EXPECT_EQ(first.get(), second.get());
    EXPECT_EQ(first.get(), third.get());
    EXPECT_EQ(1u, interner.size());
}

TEST(string_interner_t, DistinctStringsAreKeptApart) {
    string_interner_t interner;

    const interned_string a = interner.intern("a");
    const interned_string b = interner.intern("b");
    const interned_string empty = interner.intern("", 0);

    EXPECT_NE(a.get(), b.get());
    EXPECT_EQ("", *empty);
    EXPECT_EQ(3u, interner.size());
}

TEST(string_interner_t, CollidingHashesAreToldApartByContent) {
    // Fixed key.
    string_interner_t interner(sip_hasher_t(0, 0));

    std::vector<interned_string> values;
    for (int i = 0; i < 1000; ++i) {
        values.push_back(interner.intern(std::to_string(i)));
    }

    EXPECT_EQ(1000u, interner.size());

    for (int i = 0; i < 1000; ++i) {
        EXPECT_EQ(values[i].get(), interner.intern(std::to_string(i)).get());
    }
}

TEST(string_interner_t, ConcurrentInterning) {
    string_interner_t interner;

    std::vector<interned_string> results(8);
    std::vector<std::thread> threads;

    for (std::size_t i = 0; i < results.size(); ++i) {
        threads.emplace_back([&interner, &results, i]() {
            for (int j = 0; j < 100; ++j) {
                interner.intern(std::to_string(j));
            }

            results[i] = interner.intern("shared");
        });
    }

    for (auto it = threads.begin(); it != threads.end(); ++it) {
        it->join();
    }

    for (auto it = results.begin(); it != results.end(); ++it) {
        EXPECT_EQ(results.front().get(), it->get());
    }

    // Only the string held by the results is still alive.
    EXPECT_EQ(1u, interner.size());
}

TEST(string_interner_t, ReleasesStringsNoLongerHeld) {
    string_interner_t interner;

    interned_string value = interner.intern("transient");
    const std::weak_ptr<const std::string> observer = value;

    EXPECT_EQ(1u, interner.size());

    value.reset();

    EXPECT_TRUE(observer.expired());
    EXPECT_EQ(0u, interner.size());

    // Interning again creates a fresh instance.
    const interned_string again = interner.intern("transient");
    EXPECT_EQ("transient", *again);
    EXPECT_EQ(1u, interner.size());
}

TEST(string_interner_t, UnheldStringsDoNotAccumulate) {
    string_interner_t interner;

    const interned_string kept = interner.intern("kept");

    for (int i = 0; i < 10000; ++i) {
        interner.intern("value-" + std::to_string(i));
    }

    EXPECT_EQ(1u, interner.size());
    EXPECT_EQ(kept.get(), interner.intern("kept").get());
}

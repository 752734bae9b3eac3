#include <iterator>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include <shapeshift/converters/object.hpp>
#include <shapeshift/serializer.hpp>
#include <shapeshift/sink.hpp>
#include <shapeshift/source.hpp>

#include "util/bytes.hpp"

using namespace shapeshift;

using namespace testing;
using namespace testing::util;

namespace {

struct point_t {
    int x;
    int y;

    point_t() : x(0), y(0) {}
    point_t(int x, int y) : x(x), y(y) {}
};

bool
operator==(const point_t& lhs, const point_t& rhs) {
    return lhs.x == rhs.x && lhs.y == rhs.y;
}

class account_t {
    std::string owner_;
    int balance_;

public:
    std::vector<point_t> path;

    account_t() : balance_(0) {}

    const std::string&
    owner() const {
        return owner_;
    }

    void
    set_owner(std::string owner) {
        owner_ = std::move(owner);
    }

    int
    balance() const {
        return balance_;
    }

    void
    set_balance(int balance) {
        balance_ = balance;
    }
};

void
register_types(serializer_t& serializer) {
    auto point = std::make_shared<object_converter<point_t>>();
    point->property("x", &point_t::x)
          .property("y", &point_t::y);

    auto account = std::make_shared<object_converter<account_t>>();
    account->property<std::string>("owner",
                [](const account_t& account) { return account.owner(); },
                [](account_t& account, std::string owner) { account.set_owner(std::move(owner)); })
            .property("path", &account_t::path)
            .property<int>("balance",
                [](const account_t& account) { return account.balance(); },
                [](account_t& account, int balance) { account.set_balance(balance); });

    serializer.register_converter<point_t>(point);
    serializer.register_converter<account_t>(account);
}

options_t
with_layout(object_layout layout) {
    options_t options;
    options.layout = layout;
    return options;
}

template<class T>
T
decode(const serializer_t& serializer, const std::string& data) {
    return serializer.deserialize<T>(std::vector<char>(data.begin(), data.end()));
}

account_t
make_account() {
    account_t account;
    account.set_owner("alice");
    account.set_balance(-5);

    for (int i = 0; i < 20; ++i) {
        account.path.push_back(point_t(i, 1000 * i));
    }

    return account;
}

void
expect_equal(const account_t& expected, const account_t& actual) {
    EXPECT_EQ(expected.owner(), actual.owner());
    EXPECT_EQ(expected.balance(), actual.balance());
    EXPECT_EQ(expected.path, actual.path);
}

} // namespace

TEST(object_converter, MapLayout) {
    serializer_t serializer;
    register_types(serializer);

    EXPECT_EQ("82a17801a17902", hex(serializer.serialize(point_t(1, 2))));
    EXPECT_EQ(point_t(1, 2), decode<point_t>(serializer, bytes({ 0x82, 0xa1, 'x', 0x01, 0xa1, 'y', 0x02 })));
}

TEST(object_converter, ArrayLayout) {
    serializer_t serializer(with_layout(object_layout::array));
    register_types(serializer);

    EXPECT_EQ("920102", hex(serializer.serialize(point_t(1, 2))));
    EXPECT_EQ(point_t(1, 2), decode<point_t>(serializer, bytes({ 0x92, 0x01, 0x02 })));
}

TEST(object_converter, ArrayLayoutToleratesLengthDifferences) {
    serializer_t serializer(with_layout(object_layout::array));
    register_types(serializer);

    EXPECT_EQ(point_t(1, 0), decode<point_t>(serializer, bytes({ 0x91, 0x01 })));
    EXPECT_EQ(point_t(1, 2), decode<point_t>(serializer, bytes({ 0x93, 0x01, 0x02, 0x92, 0xc0, 0xc3 })));

    // Extra elements are consumed, the next value starts right after them.
    const auto points = decode<std::vector<point_t>>(serializer,
        bytes({ 0x92, 0x93, 0x01, 0x02, 0x03, 0x92, 0x04, 0x05 }));
    EXPECT_EQ(std::vector<point_t>({ point_t(1, 2), point_t(4, 5) }), points);
}

TEST(object_converter, MissingPropertiesKeepDefaults) {
    serializer_t serializer;
    register_types(serializer);

    EXPECT_EQ(point_t(0, 2), decode<point_t>(serializer, bytes({ 0x81, 0xa1, 'y', 0x02 })));
    EXPECT_EQ(point_t(), decode<point_t>(serializer, bytes({ 0x80 })));
}

TEST(object_converter, UnknownPropertiesAreSkipped) {
    serializer_t serializer;
    register_types(serializer);

    const std::string data = bytes({
        0x83,
        0xa1, 'z', 0x92, 0x81, 0xa1, 'x', 0x07, 0xc0,
        0xa1, 'x', 0x05,
        0x01, 0xa1, 'y'
    });

    EXPECT_EQ(point_t(5, 0), decode<point_t>(serializer, data));
}

TEST(object_converter, PropertiesOutOfOrderAreRejected) {
    serializer_t serializer;
    register_types(serializer);

    try {
        decode<point_t>(serializer, bytes({ 0x82, 0xa1, 'y', 0x01, 0xa1, 'x', 0x02 }));
        FAIL() << "serialization_error expected";
    } catch (const serialization_error& err) {
        EXPECT_EQ(error::property_order, err.code().value());
        EXPECT_TRUE(err.code().category() == error::protocol_category());
        EXPECT_THROW(err.rethrow_cause(), protocol_error);
    }
}

TEST(object_converter, NilIsDefaultObject) {
    serializer_t serializer;
    register_types(serializer);

    EXPECT_EQ(point_t(), decode<point_t>(serializer, bytes({ 0xc0 })));
}

TEST(object_converter, AccessorProperties) {
    serializer_t serializer;
    register_types(serializer);

    account_t account;
    account.set_owner("bob");
    account.set_balance(3);
    account.path.push_back(point_t(1, 2));

    const std::vector<char> encoded = serializer.serialize(account);
    EXPECT_EQ("83" "a56f776e6572" "a3626f62" "a470617468" "91" "82a17801a17902" "a762616c616e6365" "03",
        hex(encoded));

    expect_equal(account, serializer.deserialize<account_t>(encoded));
}

TEST(object_converter, UnregisteredPropertyTypeIsReported) {
    struct opaque_t {};
    struct holder_t {
        opaque_t value;
    };

    serializer_t serializer;

    auto holder = std::make_shared<object_converter<holder_t>>();
    holder->property("value", &holder_t::value);
    serializer.register_converter<holder_t>(holder);

    try {
        serializer.serialize(holder_t());
        FAIL() << "serialization_error expected";
    } catch (const serialization_error& err) {
        EXPECT_THROW(err.rethrow_cause(), converter_not_found_error);
    }
}

TEST(object_converter, TryDeserializeSplitAtEveryOffset) {
    const object_layout layouts[] = { object_layout::map, object_layout::array };

    for (auto it = std::begin(layouts); it != std::end(layouts); ++it) {
        serializer_t serializer(with_layout(*it));
        register_types(serializer);

        const account_t account = make_account();
        const std::vector<char> encoded = serializer.serialize(account);
        const std::string data(encoded.begin(), encoded.end());

        for (std::size_t offset = 1; offset < data.size(); ++offset) {
            {
                const sequence_t head(data.data(), offset);
                streaming_reader_t reader(head, false);

                account_t value;
                ASSERT_EQ(decode_result::insufficient_data, serializer.try_deserialize(reader, value))
                    << describe(*it) << ", offset " << offset;
                EXPECT_EQ(0u, reader.position());
            }

            sequence_t whole;
            whole.append(sequence_t::segment_type(data.data(), offset));
            whole.append(sequence_t::segment_type(data.data() + offset, data.size() - offset));
            streaming_reader_t reader(whole, true);

            account_t value;
            ASSERT_EQ(decode_result::success, serializer.try_deserialize(reader, value))
                << describe(*it) << ", offset " << offset;
            expect_equal(account, value);
        }
    }
}

TEST(object_converter, AsyncRoundTripInBothLayouts) {
    const object_layout layouts[] = { object_layout::map, object_layout::array };

    for (auto it = std::begin(layouts); it != std::end(layouts); ++it) {
        options_t options = with_layout(*it);
        options.unflushed_bytes_threshold = 16;

        serializer_t serializer(options);
        register_types(serializer);

        const account_t account = make_account();

        // ===== Set Up Stage =====
        loop_t loop;
        memory_sink_t sink(loop);

        std::exception_ptr written = std::make_exception_ptr(std::runtime_error("not called"));
        serializer.async_serialize(sink, account, [&](const std::exception_ptr& err) {
            written = err;
        });

        loop.run();
        loop.reset();

        ASSERT_FALSE(written) << describe(*it);
        EXPECT_LT(1u, sink.writes());

        const std::vector<char> expected = serializer.serialize(account);
        ASSERT_EQ(std::string(expected.begin(), expected.end()), sink.data()) << describe(*it);

        // ===== Read Stage =====
        for (std::size_t chunk = 1; chunk <= sink.data().size(); chunk += 3) {
            memory_source_t source(loop, split(sink.data(), chunk));

            bool called = false;
            serializer.async_deserialize<account_t>(source, [&](const std::exception_ptr& err, account_t value) {
                called = true;
                ASSERT_FALSE(err);
                expect_equal(account, value);
            });

            loop.run();
            loop.reset();

            EXPECT_TRUE(called) << describe(*it) << ", chunk " << chunk;
        }
    }
}

TEST(object_converter, AsyncReadSkipsUnknownAndRejectsOutOfOrder) {
    serializer_t serializer;
    register_types(serializer);

    const std::string unknown = bytes({
        0x83,
        0xa1, 'q', 0x92, 0x01, 0x02,
        0xa5, 'o', 'w', 'n', 'e', 'r', 0xa1, 'z',
        0xa4, 'p', 'a', 't', 'h', 0x91, 0x82, 0xa1, 'x', 0x01, 0xa1, 'y', 0x02
    });

    const std::string reordered = bytes({
        0x82,
        0xa4, 'p', 'a', 't', 'h', 0x90,
        0xa5, 'o', 'w', 'n', 'e', 'r', 0xa1, 'z'
    });

    loop_t loop;

    for (std::size_t chunk = 1; chunk <= unknown.size(); ++chunk) {
        memory_source_t source(loop, split(unknown, chunk));

        account_t result;
        std::exception_ptr error;
        serializer.async_deserialize<account_t>(source, [&](const std::exception_ptr& err, account_t value) {
            error = err;
            result = std::move(value);
        });

        loop.run();
        loop.reset();

        ASSERT_FALSE(error) << "chunk " << chunk;
        EXPECT_EQ("z", result.owner());
        EXPECT_EQ(std::vector<point_t>(1, point_t(1, 2)), result.path);
    }

    memory_source_t source(loop, split(reordered, 2));

    std::exception_ptr error;
    serializer.async_deserialize<account_t>(source, [&](const std::exception_ptr& err, account_t) {
        error = err;
    });

    loop.run();

    ASSERT_TRUE(error != nullptr);

    try {
        std::rethrow_exception(error);
    } catch (const serialization_error& err) {
        EXPECT_EQ(error::property_order, err.code().value());
    }
}

TEST(object_converter, NestingCountsTowardsDepth) {
    options_t options;
    options.max_depth = 2;

    serializer_t serializer(options);
    register_types(serializer);

    EXPECT_NO_THROW(serializer.serialize(std::vector<point_t>(1, point_t())));
    EXPECT_THROW(serializer.serialize(std::vector<std::vector<point_t>>(1, std::vector<point_t>(1))),
        serialization_error);
}

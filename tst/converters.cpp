#include <chrono>
#include <cstdint>
#include <limits>
#include <map>
#include <string>
#include <unordered_map>
#include <vector>

#include <boost/optional.hpp>

#include <gtest/gtest.h>

#include <shapeshift/serializer.hpp>
#include <shapeshift/sink.hpp>
#include <shapeshift/source.hpp>

#include "util/bytes.hpp"

using namespace shapeshift;

using namespace testing;
using namespace testing::util;

namespace {

template<class T>
std::string
encode(const serializer_t& serializer, const T& value) {
    return hex(serializer.serialize(value));
}

template<class T>
T
decode(const serializer_t& serializer, const std::string& data) {
    return serializer.deserialize<T>(std::vector<char>(data.begin(), data.end()));
}

/// Deserializes the value from a source delivering the data in chunks of the given size.
template<class T>
T
decode_chunked(const serializer_t& serializer, const std::string& data, std::size_t chunk) {
    loop_t loop;
    memory_source_t source(loop, split(data, chunk));

    bool called = false;
    std::exception_ptr error;
    T result = T();

    serializer.async_deserialize<T>(source, [&](const std::exception_ptr& err, T value) {
        called = true;
        error = err;
        result = std::move(value);
    });

    loop.run();

    EXPECT_TRUE(called);
    if (error) {
        std::rethrow_exception(error);
    }

    return result;
}

/// Serializes the value into a memory sink, returning everything it received.
template<class T>
std::string
encode_async(const serializer_t& serializer, const T& value, std::size_t* writes = nullptr) {
    loop_t loop;
    memory_sink_t sink(loop);

    bool called = false;
    std::exception_ptr error;

    serializer.async_serialize(sink, value, [&](const std::exception_ptr& err) {
        called = true;
        error = err;
    });

    loop.run();

    EXPECT_TRUE(called);
    if (error) {
        std::rethrow_exception(error);
    }

    if (writes) {
        *writes = sink.writes();
    }

    return sink.data();
}

options_t
accelerated(bool enabled) {
    options_t options;
    options.hardware_acceleration = enabled;
    return options;
}

} // namespace

TEST(converter, Scalars) {
    serializer_t serializer;

    EXPECT_EQ("2a", encode(serializer, 42));
    EXPECT_EQ("d0df", encode(serializer, -33));
    EXPECT_EQ("cdffff", encode(serializer, std::uint16_t(65535)));
    EXPECT_EQ("c3", encode(serializer, true));
    EXPECT_EQ("cb3ff8000000000000", encode(serializer, 1.5));
    EXPECT_EQ("ca3fc00000", encode(serializer, 1.5f));
    EXPECT_EQ("a3616263", encode(serializer, std::string("abc")));

    EXPECT_EQ(-33, decode<int>(serializer, bytes({ 0xd0, 0xdf })));
    EXPECT_EQ(70000u, decode<std::uint32_t>(serializer, bytes({ 0xce, 0x00, 0x01, 0x11, 0x70 })));
    EXPECT_FALSE(decode<bool>(serializer, bytes({ 0xc2 })));
    EXPECT_DOUBLE_EQ(1.5, decode<double>(serializer, bytes({ 0xca, 0x3f, 0xc0, 0x00, 0x00 })));
    EXPECT_EQ("abc", decode<std::string>(serializer, bytes({ 0xa3, 'a', 'b', 'c' })));
}

TEST(converter, NilStringIsEmpty) {
    serializer_t serializer;
    EXPECT_EQ("", decode<std::string>(serializer, bytes({ 0xc0 })));
}

TEST(converter, OverflowIsReported) {
    serializer_t serializer;

    try {
        decode<std::uint8_t>(serializer, bytes({ 0xcd, 0x01, 0x00 }));
        FAIL() << "serialization_error expected";
    } catch (const serialization_error& err) {
        EXPECT_THROW(err.rethrow_cause(), overflow_error);
    }

    EXPECT_THROW(decode<std::uint32_t>(serializer, bytes({ 0xff })), serialization_error);
}

TEST(converter, ByteVectorsAreBinary) {
    serializer_t serializer;

    const std::vector<char> value({ 0x01, 0x02, 0x03 });
    EXPECT_EQ("c403010203", encode(serializer, value));
    EXPECT_EQ(value, decode<std::vector<char>>(serializer, bytes({ 0xc4, 0x03, 0x01, 0x02, 0x03 })));

    const std::vector<unsigned char> unsigned_value({ 0xff });
    EXPECT_EQ("c401ff", encode(serializer, unsigned_value));
    EXPECT_EQ(unsigned_value, decode<std::vector<unsigned char>>(serializer, bytes({ 0xc4, 0x01, 0xff })));
}

TEST(converter, Optional) {
    serializer_t serializer;

    EXPECT_EQ("c0", encode(serializer, boost::optional<int>()));
    EXPECT_EQ("07", encode(serializer, boost::optional<int>(7)));

    EXPECT_FALSE(decode<boost::optional<int>>(serializer, bytes({ 0xc0 })));
    EXPECT_EQ(7, *decode<boost::optional<int>>(serializer, bytes({ 0x07 })));
}

TEST(converter, OptionalOfAsyncConverterFromChunks) {
    serializer_t serializer;
    const std::string data = bytes({ 0x92, 0x01, 0x02 });

    for (std::size_t chunk = 1; chunk <= data.size(); ++chunk) {
        const auto value = decode_chunked<boost::optional<std::vector<int>>>(serializer, data, chunk);
        ASSERT_TRUE(!!value) << "chunk " << chunk;
        EXPECT_EQ(std::vector<int>({ 1, 2 }), *value);
    }

    EXPECT_FALSE(decode_chunked<boost::optional<std::vector<int>>>(serializer, bytes({ 0xc0 }), 1));
}

TEST(converter, VectorOfIntegers) {
    serializer_t serializer;

    const std::vector<int> value({ 1, -1, 300 });
    EXPECT_EQ("9301ffcd012c", encode(serializer, value));
    EXPECT_EQ(value, decode<std::vector<int>>(serializer, bytes({ 0x93, 0x01, 0xff, 0xcd, 0x01, 0x2c })));
}

TEST(converter, NilVectorIsEmpty) {
    serializer_t serializer;

    EXPECT_TRUE(decode<std::vector<int>>(serializer, bytes({ 0xc0 })).empty());
    EXPECT_TRUE(decode_chunked<std::vector<std::string>>(serializer, bytes({ 0xc0 }), 1).empty());
}

TEST(converter, AccelerationProducesSameBytes) {
    serializer_t plain(accelerated(false));
    serializer_t fast(accelerated(true));

    std::vector<std::int64_t> integers;
    for (std::int64_t i = -70000; i < 70000; i += 997) {
        integers.push_back(i);
    }
    integers.push_back(std::numeric_limits<std::int64_t>::min());
    integers.push_back(std::numeric_limits<std::int64_t>::max());

    const std::vector<double> doubles({ 0.0, -1.25, 1e300, std::numeric_limits<double>::infinity() });
    const std::vector<float> floats({ 0.5f, -3.0f });
    const std::vector<std::uint16_t> shorts({ 0, 127, 128, 255, 256, 65535 });

    EXPECT_EQ(plain.serialize(integers), fast.serialize(integers));
    EXPECT_EQ(plain.serialize(doubles), fast.serialize(doubles));
    EXPECT_EQ(plain.serialize(floats), fast.serialize(floats));
    EXPECT_EQ(plain.serialize(shorts), fast.serialize(shorts));

    EXPECT_EQ(integers, fast.deserialize<std::vector<std::int64_t>>(plain.serialize(integers)));
    EXPECT_EQ(integers, plain.deserialize<std::vector<std::int64_t>>(fast.serialize(integers)));
    EXPECT_EQ(doubles, fast.deserialize<std::vector<double>>(plain.serialize(doubles)));
    EXPECT_EQ(shorts, fast.deserialize<std::vector<std::uint16_t>>(plain.serialize(shorts)));
}

TEST(converter, AcceleratedReadReportsOverflow) {
    serializer_t fast(accelerated(true));

    try {
        fast.deserialize<std::vector<std::int8_t>>(std::vector<char>({ '\x92', 0x01, '\xcc', '\xc8' }));
        FAIL() << "serialization_error expected";
    } catch (const serialization_error& err) {
        EXPECT_THROW(err.rethrow_cause(), overflow_error);
    }
}

TEST(converter, AcceleratedReadAcrossSegments) {
    serializer_t fast(accelerated(true));

    const std::vector<int> value({ 1, 300, -70000, 5 });
    const std::vector<char> encoded = fast.serialize(value);

    for (std::size_t offset = 1; offset < encoded.size(); ++offset) {
        sequence_t sequence;
        sequence.append(sequence_t::segment_type(encoded.data(), offset));
        sequence.append(sequence_t::segment_type(encoded.data() + offset, encoded.size() - offset));

        EXPECT_EQ(value, fast.deserialize<std::vector<int>>(sequence)) << "offset " << offset;
    }
}

TEST(converter, Map) {
    serializer_t serializer;

    std::map<std::string, int> value;
    value["a"] = 1;
    value["b"] = 2;

    EXPECT_EQ("82a16101a16202", encode(serializer, value));
    EXPECT_EQ(value, (decode<std::map<std::string, int>>(serializer, bytes({ 0x82, 0xa1, 'a', 0x01, 0xa1, 'b', 0x02 }))));
}

TEST(converter, MapDuplicateKeyLastWins) {
    serializer_t serializer;
    const std::string data = bytes({ 0x82, 0xa1, 'a', 0x01, 0xa1, 'a', 0x02 });

    const auto value = decode<std::map<std::string, int>>(serializer, data);
    ASSERT_EQ(1u, value.size());
    EXPECT_EQ(2, value.at("a"));

    for (std::size_t chunk = 1; chunk <= data.size(); ++chunk) {
        const auto chunked = decode_chunked<std::unordered_map<std::string, int>>(serializer, data, chunk);
        ASSERT_EQ(1u, chunked.size());
        EXPECT_EQ(2, chunked.at("a"));
    }
}

TEST(converter, UnorderedMap) {
    serializer_t serializer;

    std::unordered_map<int, std::string> value;
    value[1] = "one";
    value[2] = "two";

    EXPECT_EQ(value, (serializer.deserialize<std::unordered_map<int, std::string>>(serializer.serialize(value))));
    EXPECT_TRUE((decode<std::unordered_map<int, std::string>>(serializer, bytes({ 0xc0 })).empty()));
}

TEST(converter, InternedStringsShareInstances) {
    options_t options;
    options.intern_strings = true;

    serializer_t serializer(options);

    const std::string data = bytes({ 0x93, 0xa2, 'a', 'b', 0xa2, 'a', 'b', 0xc0 });
    const auto value = decode<std::vector<interned_string>>(serializer, data);

    ASSERT_EQ(3u, value.size());
    EXPECT_EQ("ab", *value[0]);
    EXPECT_EQ(value[0].get(), value[1].get());
    EXPECT_FALSE(value[2]);

    const auto again = decode<std::vector<interned_string>>(serializer, data);
    EXPECT_EQ(value[0].get(), again[0].get());

    EXPECT_EQ("92a26162c0", encode(serializer, std::vector<interned_string>({ value[0], interned_string() })));
}

TEST(converter, StringsAreDistinctWithoutInterning) {
    serializer_t serializer;

    const auto value = decode<std::vector<interned_string>>(serializer, bytes({ 0x92, 0xa1, 'x', 0xa1, 'x' }));

    ASSERT_EQ(2u, value.size());
    EXPECT_EQ(*value[0], *value[1]);
    EXPECT_NE(value[0].get(), value[1].get());
}

TEST(converter, InternedStringRejectsInvalidUtf8) {
    serializer_t serializer;
    EXPECT_THROW(decode<interned_string>(serializer, bytes({ 0xa2, 0xc3, 0x28 })), serialization_error);
}

TEST(converter, RawKeepsStructureVerbatim) {
    serializer_t serializer;

    const std::string data = bytes({ 0x92, 0x82, 0xa1, 'a', 0x01, 0xa1, 'b', 0x92, 0xc0, 0xc3, 0x07 });

    const auto value = decode<std::vector<raw_t>>(serializer, data);
    ASSERT_EQ(2u, value.size());
    EXPECT_EQ("82a16101a16292c0c3", hex(value[0].bytes));
    EXPECT_EQ("07", hex(value[1].bytes));

    EXPECT_EQ(hex(data), encode(serializer, value));
    EXPECT_EQ("c0", encode(serializer, raw_t()));
}

TEST(converter, Timestamp) {
    serializer_t serializer;

    EXPECT_EQ("d6ff00000001", encode(serializer, timestamp_t(1, 0)));
    EXPECT_EQ(timestamp_t(1, 1),
        decode<timestamp_t>(serializer, bytes({ 0xd7, 0xff, 0x00, 0x00, 0x00, 0x04, 0x00, 0x00, 0x00, 0x01 })));
}

TEST(converter, TimePoint) {
    typedef std::chrono::system_clock clock_type;

    serializer_t serializer;

    const clock_type::time_point epoch;
    const clock_type::time_point later = epoch + std::chrono::seconds(1);

    EXPECT_EQ("d6ff00000000", encode(serializer, epoch));
    EXPECT_EQ("d6ff00000001", encode(serializer, later));
    EXPECT_TRUE(later == decode<clock_type::time_point>(serializer, bytes({ 0xd6, 0xff, 0x00, 0x00, 0x00, 0x01 })));

    const std::vector<clock_type::time_point> points({ epoch, later });
    const std::vector<char> encoded = serializer.serialize(points);
    EXPECT_TRUE(points == decode_chunked<std::vector<clock_type::time_point>>(serializer,
        std::string(encoded.begin(), encoded.end()), 3));
}

TEST(converter, TimePointOutOfRangeIsReported) {
    serializer_t serializer;

    const std::string data = bytes({
        0xc7, 0x0c, 0xff,
        0x00, 0x00, 0x00, 0x00,
        0x80, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00
    });

    try {
        decode<std::chrono::system_clock::time_point>(serializer, data);
        FAIL() << "serialization_error expected";
    } catch (const serialization_error& err) {
        EXPECT_EQ(error::integer_overflow, err.code().value());
        EXPECT_THROW(err.rethrow_cause(), overflow_error);
    }

    EXPECT_EQ(std::numeric_limits<std::int64_t>::min(), decode<timestamp_t>(serializer, data).seconds);
}

TEST(converter, AsyncWriteFlushesInBlocks) {
    options_t options;
    options.unflushed_bytes_threshold = 16;

    serializer_t serializer(options);

    std::vector<std::string> value;
    for (int i = 0; i < 32; ++i) {
        value.push_back("item");
    }

    std::size_t writes = 0;
    const std::string data = encode_async(serializer, value, &writes);

    const std::vector<char> expected = serializer.serialize(value);
    EXPECT_EQ(std::string(expected.begin(), expected.end()), data);
    EXPECT_LT(1u, writes);
}

TEST(converter, AsyncWriteOfNestedContainers) {
    options_t options;
    options.unflushed_bytes_threshold = 8;

    serializer_t serializer(options);

    std::map<std::string, std::vector<int>> value;
    value["first"] = std::vector<int>({ 1, 2, 3 });
    value["second"] = std::vector<int>(40, 300);
    value["third"];

    const std::vector<char> expected = serializer.serialize(value);
    EXPECT_EQ(std::string(expected.begin(), expected.end()), encode_async(serializer, value));
}

TEST(converter, AsyncReadAtEveryChunkSize) {
    serializer_t serializer;

    std::map<std::string, std::vector<std::string>> value;
    value["letters"] = std::vector<std::string>({ "a", "bb", "ccc" });
    value["empty"];
    value["long"] = std::vector<std::string>(1, std::string(40, 'x'));

    const std::vector<char> encoded = serializer.serialize(value);
    const std::string data(encoded.begin(), encoded.end());

    for (std::size_t chunk = 1; chunk <= data.size(); ++chunk) {
        EXPECT_EQ(value, (decode_chunked<std::map<std::string, std::vector<std::string>>>(serializer, data, chunk)))
            << "chunk " << chunk;
    }
}

TEST(converter, AsyncReadOfTruncatedInputFails) {
    serializer_t serializer;
    const std::string data = bytes({ 0x93, 0x01, 0x02 });

    for (std::size_t chunk = 1; chunk <= data.size(); ++chunk) {
        try {
            decode_chunked<std::vector<int>>(serializer, data, chunk);
            FAIL() << "serialization_error expected";
        } catch (const serialization_error& err) {
            EXPECT_THROW(err.rethrow_cause(), end_of_stream_error);
        }
    }
}

TEST(converter, AsyncReadDepthBoundary) {
    typedef std::vector<std::vector<std::vector<std::vector<std::vector<int>>>>> nested_type;

    // Two siblings, each nested exactly five levels deep.
    const std::string data = bytes({
        0x92,
        0x91, 0x91, 0x91, 0x91, 0x01,
        0x91, 0x91, 0x91, 0x91, 0x02
    });

    options_t options;
    options.max_depth = 5;

    const serializer_t at_limit(options);

    options.max_depth = 4;
    const serializer_t below_limit(options);

    for (std::size_t chunk = 1; chunk <= 3; ++chunk) {
        const nested_type value = decode_chunked<nested_type>(at_limit, data, chunk);
        ASSERT_EQ(2u, value.size());
        EXPECT_EQ(1, value[0][0][0][0][0]);
        EXPECT_EQ(2, value[1][0][0][0][0]);

        try {
            decode_chunked<nested_type>(below_limit, data, chunk);
            FAIL() << "serialization_error expected, chunk " << chunk;
        } catch (const serialization_error& err) {
            EXPECT_EQ(error::depth_exceeded, err.code().value());
            EXPECT_TRUE(err.code().category() == error::security_category());
        }
    }
}

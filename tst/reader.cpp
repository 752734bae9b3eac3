#include <chrono>
#include <cstdint>
#include <string>

#include <gtest/gtest.h>

#include <shapeshift/context.hpp>
#include <shapeshift/converter_cache.hpp>
#include <shapeshift/error.hpp>
#include <shapeshift/reader.hpp>

#include "util/bytes.hpp"

using namespace shapeshift;

using namespace testing;
using namespace testing::util;

TEST(reader_t, ReadScalars) {
    const std::string data = bytes({
        0xc0,
        0xc3,
        0xcd, 0x01, 0x00,
        0xff,
        0xcb, 0x3f, 0xf8, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
        0xa2, 'h', 'i'
    });

    const sequence_t sequence(data);
    reader_t reader(sequence);

    EXPECT_TRUE(reader.is_nil());
    reader.read_nil();
    EXPECT_TRUE(reader.read_bool());
    EXPECT_EQ(256, reader.read_integer<int>());
    EXPECT_EQ(-1, reader.read_integer<std::int8_t>());
    EXPECT_DOUBLE_EQ(1.5, reader.read_double());
    EXPECT_EQ("hi", reader.read_string());
    EXPECT_TRUE(reader.end());
}

TEST(reader_t, ThrowsEndOfStreamOnEmptyBuffer) {
    const sequence_t sequence;
    reader_t reader(sequence);

    EXPECT_THROW(reader.read_integer<int>(), end_of_stream_error);
    EXPECT_THROW(reader.peek_code(), end_of_stream_error);
    EXPECT_FALSE(reader.is_nil());
}

TEST(reader_t, ThrowsInsufficientDataOnTruncatedToken) {
    const std::string data = bytes({ 0xa5, 'h', 'e' });
    const sequence_t sequence(data);
    reader_t reader(sequence);

    try {
        reader.read_string();
        FAIL() << "insufficient_data_error expected";
    } catch (const insufficient_data_error& err) {
        EXPECT_EQ(error::insufficient_data, err.code().value());
        EXPECT_TRUE(err.code().category() == error::protocol_category());
    }

    EXPECT_EQ(0u, reader.position());
}

TEST(reader_t, ThrowsUnexpectedTokenWithCodeAndOffset) {
    const std::string data = bytes({ 0x01, 0xa1, 'x' });
    const sequence_t sequence(data);
    reader_t reader(sequence);

    EXPECT_EQ(1, reader.read_integer<int>());

    try {
        reader.read_integer<int>();
        FAIL() << "unexpected_token_error expected";
    } catch (const unexpected_token_error& err) {
        EXPECT_EQ(0xa1, err.code());
        EXPECT_EQ(1u, err.offset());
    }

    EXPECT_EQ("x", reader.read_string());
}

TEST(reader_t, ThrowsOverflow) {
    const std::string data = bytes({ 0xcd, 0x01, 0x00, 0xff });
    const sequence_t sequence(data);
    reader_t reader(sequence);

    EXPECT_THROW(reader.read_integer<std::uint8_t>(), overflow_error);
    EXPECT_EQ(0u, reader.position());
    EXPECT_EQ(256, reader.read_integer<std::uint16_t>());

    EXPECT_THROW(reader.read_integer<unsigned int>(), overflow_error);
    EXPECT_EQ(-1, reader.read_integer<int>());
}

TEST(reader_t, RejectsInvalidUtf8) {
    const std::string data = bytes({ 0xa2, 0xc3, 0x28 });
    const sequence_t sequence(data);
    reader_t reader(sequence);

    try {
        reader.read_string();
        FAIL() << "protocol_error expected";
    } catch (const protocol_error& err) {
        EXPECT_EQ(error::invalid_utf8, err.code().value());
    }

    EXPECT_EQ(0u, reader.position());
}

TEST(reader_t, ReadBinaryAndExtension) {
    const std::string data = bytes({
        0xc4, 0x03, 0x01, 0x02, 0x03,
        0xd5, 0x07, 0xaa, 0xbb
    });

    const sequence_t sequence(data);
    reader_t reader(sequence);

    EXPECT_EQ(std::vector<char>({ 0x01, 0x02, 0x03 }), reader.read_binary());

    const extension_header_t header = reader.read_extension_header();
    EXPECT_EQ(7, header.type);
    EXPECT_EQ(2u, header.length);
    EXPECT_EQ("aabb", hex(reader.read_raw(header.length).to_string()));
    EXPECT_TRUE(reader.end());
}

TEST(reader_t, ReadTimestamp) {
    const std::string data = bytes({ 0xd6, 0xff, 0x00, 0x00, 0x00, 0x2a });
    const sequence_t sequence(data);
    reader_t reader(sequence);

    EXPECT_EQ(timestamp_t(42, 0), reader.read_timestamp());
}

TEST(reader_t, ReadStringSpanAcrossSegments) {
    const std::string data = bytes({ 0xa4, 'a', 'b', 'c', 'd', 0xa2, 'e', 'f' });

    sequence_t sequence;
    sequence.append(sequence_t::segment_type(data.data(), 3));
    sequence.append(sequence_t::segment_type(data.data() + 3, data.size() - 3));

    reader_t reader(sequence);

    const char* span = nullptr;
    std::size_t size = 0;

    EXPECT_FALSE(reader.try_read_string_span(span, size));
    EXPECT_EQ(0u, reader.position());
    EXPECT_EQ("abcd", reader.read_string_sequence().to_string());

    EXPECT_TRUE(reader.try_read_string_span(span, size));
    EXPECT_EQ("ef", std::string(span, size));
}

TEST(reader_t, SkipNestedStructures) {
    // [1, {"a": [nil, true]}, "x"], 7
    const std::string data = bytes({
        0x93, 0x01, 0x81, 0xa1, 'a', 0x92, 0xc0, 0xc3, 0xa1, 'x',
        0x07
    });

    const sequence_t sequence(data);
    reader_t reader(sequence);
    context_t context;

    reader.skip(context);
    EXPECT_EQ(10u, reader.position());
    EXPECT_EQ(7, reader.read_integer<int>());
}

TEST(reader_t, ReadRawStructure) {
    const std::string data = bytes({ 0x92, 0xc4, 0x01, 0xff, 0xc0, 0x05 });
    const sequence_t sequence(data);
    reader_t reader(sequence);
    context_t context;

    EXPECT_EQ("92c401ffc0", hex(reader.read_raw_structure(context).to_string()));
    EXPECT_EQ(5, reader.read_integer<int>());
}

TEST(reader_t, SkipTruncatedStructureKeepsPosition) {
    const std::string data = bytes({ 0x92, 0x01 });
    const sequence_t sequence(data);
    reader_t reader(sequence);
    context_t context;

    EXPECT_THROW(reader.skip(context), insufficient_data_error);
    EXPECT_EQ(0u, reader.position());
}

TEST(reader_t, SkipRejectsNeverUsedMarker) {
    const std::string data = bytes({ 0xc1 });
    const sequence_t sequence(data);
    reader_t reader(sequence);
    context_t context;

    EXPECT_THROW(reader.skip(context), unexpected_token_error);
}

TEST(reader_t, CopyIsCheckpoint) {
    const std::string data = bytes({ 0x01, 0x02 });
    const sequence_t sequence(data);
    reader_t reader(sequence);

    reader_t checkpoint = reader;
    EXPECT_EQ(1, reader.read_integer<int>());
    EXPECT_EQ(1, checkpoint.read_integer<int>());
    EXPECT_EQ(2, reader.read_integer<int>());
}

TEST(reader_t, TimePointOutOfClockRangeIsOverflow) {
    // 96-bit timestamp, 2^62 seconds.
    const std::string data = bytes({
        0xc7, 0x0c, 0xff,
        0x00, 0x00, 0x00, 0x00,
        0x40, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00
    });

    const sequence_t sequence(data);
    reader_t reader(sequence);

    EXPECT_THROW(reader.read_time_point(), overflow_error);
    EXPECT_EQ(0u, reader.position());

    const timestamp_t value = reader.read_timestamp();
    EXPECT_EQ(std::int64_t(1) << 62, value.seconds);
    EXPECT_FALSE(value.representable());
    EXPECT_THROW(value.to_time_point(), overflow_error);
    EXPECT_TRUE(reader.end());
}

TEST(reader_t, TimePointAtSecondsPrecision) {
    // 64-bit timestamp, 1 second and 5 nanoseconds.
    const std::string data = bytes({ 0xd7, 0xff, 0x00, 0x00, 0x00, 0x14, 0x00, 0x00, 0x00, 0x01 });

    const sequence_t sequence(data);
    reader_t reader(sequence);

    const auto expected = std::chrono::system_clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(std::chrono::nanoseconds(1000000005)));

    EXPECT_TRUE(expected == reader.read_time_point());
}

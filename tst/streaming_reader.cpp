#include <string>

#include <gtest/gtest.h>

#include <shapeshift/buffer.hpp>
#include <shapeshift/context.hpp>
#include <shapeshift/converter_cache.hpp>
#include <shapeshift/streaming_reader.hpp>
#include <shapeshift/writer.hpp>

#include "util/bytes.hpp"

using namespace shapeshift;

using namespace testing;
using namespace testing::util;

namespace {

/// {"name": "alpha", "tags": ["a", "bb", nil], "nested": {"x": 1.5, "y": [-100, 70000]}}
std::string
payload() {
    output_buffer_t buffer;
    writer_t writer(buffer);

    writer.write_map_header(3);
    writer.write("name");
    writer.write("alpha");
    writer.write("tags");
    writer.write_array_header(3);
    writer.write("a");
    writer.write("bb");
    writer.write_nil();
    writer.write("nested");
    writer.write_map_header(2);
    writer.write("x");
    writer.write(1.5);
    writer.write("y");
    writer.write_array_header(2);
    writer.write(-100);
    writer.write(70000);

    return buffer.to_string();
}

/// Builds a sequence of two segments split at the given offset.
sequence_t
split_at(const std::string& data, std::size_t offset) {
    sequence_t sequence;
    sequence.append(sequence_t::segment_type(data.data(), offset));
    sequence.append(sequence_t::segment_type(data.data() + offset, data.size() - offset));
    return sequence;
}

} // namespace

TEST(streaming_reader_t, InsufficientDataLeavesPosition) {
    const std::string data = bytes({ 0xcd, 0x01 });
    const sequence_t sequence(data);

    streaming_reader_t reader(sequence, false);

    int value = 0;
    EXPECT_EQ(decode_result::insufficient_data, reader.try_read(value));
    EXPECT_EQ(0u, reader.position());
}

TEST(streaming_reader_t, EndOfStreamWhenNoMoreBytesWillCome) {
    const std::string data = bytes({ 0xcd, 0x01 });
    const sequence_t sequence(data);

    streaming_reader_t reader(sequence, true);

    int value = 0;
    EXPECT_EQ(decode_result::end_of_stream, reader.try_read(value));
    EXPECT_EQ(0u, reader.position());
}

TEST(streaming_reader_t, MismatchLeavesPosition) {
    const std::string data = bytes({ 0xa1, 'x' });
    const sequence_t sequence(data);

    streaming_reader_t reader(sequence, false);

    bool value = false;
    EXPECT_EQ(decode_result::token_mismatch, reader.try_read(value));
    EXPECT_EQ(decode_result::token_mismatch, reader.try_read_nil());

    token_type type;
    EXPECT_EQ(decode_result::success, reader.try_peek_type(type));
    EXPECT_EQ(token_type::string, type);
    EXPECT_EQ(0u, reader.position());
}

TEST(streaming_reader_t, TruncatedStringPayload) {
    const std::string data = bytes({ 0xa3, 'a', 'b' });
    const sequence_t sequence(data);

    streaming_reader_t reader(sequence, false);

    std::string value;
    EXPECT_EQ(decode_result::insufficient_data, reader.try_read(value));
    EXPECT_EQ(0u, reader.position());

    sequence_t raw;
    EXPECT_EQ(decode_result::insufficient_data, reader.try_read_string(raw));
    EXPECT_EQ(0u, reader.position());
}

TEST(streaming_reader_t, ReadTokensSplitAtEveryOffset) {
    const std::string data = bytes({
        0x92, 0xa3, 'a', 'b', 'c', 0xcd, 0x01, 0x00,
        0xc4, 0x02, 0x01, 0x02
    });

    for (std::size_t offset = 0; offset <= data.size(); ++offset) {
        const sequence_t sequence = split_at(data, offset);
        streaming_reader_t reader(sequence, true);

        std::uint32_t count = 0;
        std::string text;
        int number = 0;
        std::vector<char> binary;

        ASSERT_EQ(decode_result::success, reader.try_read_array_header(count)) << "offset " << offset;
        EXPECT_EQ(2u, count);
        ASSERT_EQ(decode_result::success, reader.try_read(text)) << "offset " << offset;
        EXPECT_EQ("abc", text);
        ASSERT_EQ(decode_result::success, reader.try_read(number)) << "offset " << offset;
        EXPECT_EQ(256, number);
        ASSERT_EQ(decode_result::success, reader.try_read_binary(binary)) << "offset " << offset;
        EXPECT_EQ(std::vector<char>({ 0x01, 0x02 }), binary);
        EXPECT_EQ(0u, reader.remaining());
    }
}

TEST(streaming_reader_t, SkipWholePayloadSplitAtEveryOffset) {
    const std::string data = payload();
    context_t context;

    for (std::size_t offset = 0; offset <= data.size(); ++offset) {
        const sequence_t sequence = split_at(data, offset);
        streaming_reader_t reader(sequence, true);

        ASSERT_EQ(decode_result::success, reader.try_skip(context)) << "offset " << offset;
        EXPECT_EQ(data.size(), reader.position());
        EXPECT_TRUE(reader.skip_state().empty());
    }
}

TEST(streaming_reader_t, SkipResumesOverGrowingPrefix) {
    // ===== Set Up Stage =====
    // The payload is revealed one byte at a time. Every attempt either completes or reports
    // insufficient data, carrying the skip progress to the next attempt.
    const std::string data = payload();
    context_t context;

    cursor_t position;
    skip_state_t state;
    std::size_t attempts = 0;

    std::vector<sequence_t> prefixes;
    prefixes.reserve(data.size() + 1);

    decode_result result = decode_result::insufficient_data;
    for (std::size_t size = 1; size <= data.size() && result != decode_result::success; ++size) {
        prefixes.push_back(sequence_t(data.data(), size));

        cursor_t cursor(prefixes.back());
        cursor.try_advance(position.position());

        streaming_reader_t reader(cursor, false, state);
        result = reader.try_skip(context);
        ++attempts;

        if (result == decode_result::insufficient_data) {
            position = reader.cursor();
            state = reader.skip_state();
        } else {
            EXPECT_EQ(data.size(), reader.position());
        }
    }

    EXPECT_EQ(decode_result::success, result);
    EXPECT_EQ(data.size(), attempts);
}

TEST(streaming_reader_t, SkipTruncatedPayloadReportsEndOfStream) {
    const std::string data = payload();
    const sequence_t sequence(data.data(), data.size() - 1);

    context_t context;
    streaming_reader_t reader(sequence, true);

    EXPECT_EQ(decode_result::end_of_stream, reader.try_skip(context));
}

TEST(streaming_reader_t, ReadRawStructureSplitAtEveryOffset) {
    const std::string data = payload() + bytes({ 0x2a });
    context_t context;

    for (std::size_t offset = 0; offset <= data.size(); ++offset) {
        const sequence_t sequence = split_at(data, offset);
        streaming_reader_t reader(sequence, true);

        sequence_t raw;
        ASSERT_EQ(decode_result::success, reader.try_read_raw_structure(context, raw)) << "offset " << offset;
        EXPECT_EQ(data.substr(0, data.size() - 1), raw.to_string());

        int value = 0;
        EXPECT_EQ(decode_result::success, reader.try_read(value));
        EXPECT_EQ(42, value);
    }
}

TEST(streaming_reader_t, IntegerOverflowThrows) {
    const std::string data = bytes({ 0xcc, 0xff });
    const sequence_t sequence(data);

    streaming_reader_t reader(sequence, false);

    std::int8_t value = 0;
    EXPECT_THROW(reader.try_read(value), overflow_error);
    EXPECT_EQ(0u, reader.position());
}

TEST(streaming_reader_t, ReadTimestampAndExtensionHeader) {
    const std::string data = bytes({ 0xd6, 0xff, 0x00, 0x00, 0x00, 0x01, 0xc7, 0x01, 0x03, 0x00 });
    const sequence_t sequence(data);

    streaming_reader_t reader(sequence, true);

    timestamp_t timestamp;
    EXPECT_EQ(decode_result::success, reader.try_read(timestamp));
    EXPECT_EQ(timestamp_t(1, 0), timestamp);

    extension_header_t header;
    EXPECT_EQ(decode_result::token_mismatch, reader.try_read(timestamp));
    EXPECT_EQ(decode_result::success, reader.try_read_extension_header(header));
    EXPECT_EQ(extension_header_t(3, 1), header);
    EXPECT_EQ(decode_result::success, reader.try_skip_raw(1));
    EXPECT_EQ(0u, reader.remaining());
}

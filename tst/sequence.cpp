#include <algorithm>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include <shapeshift/buffer.hpp>
#include <shapeshift/sequence.hpp>

using namespace shapeshift;

using namespace testing;

namespace {

/// Splits "hello, world" into three segments: "hel", "lo, w" and "orld".
sequence_t
segmented(const std::string& data) {
    sequence_t sequence;
    sequence.append(sequence_t::segment_type(data.data(), 3));
    sequence.append(sequence_t::segment_type(data.data() + 3, 0));
    sequence.append(sequence_t::segment_type(data.data() + 3, 5));
    sequence.append(sequence_t::segment_type(data.data() + 8, data.size() - 8));
    return sequence;
}

} // namespace

TEST(sequence_t, Empty) {
    sequence_t sequence;

    EXPECT_TRUE(sequence.empty());
    EXPECT_TRUE(sequence.contiguous());
    EXPECT_EQ(0u, sequence.size());
    EXPECT_EQ("", sequence.to_string());
}

TEST(sequence_t, IgnoresEmptySegments) {
    const std::string data("hello, world");
    const sequence_t sequence = segmented(data);

    EXPECT_EQ(3u, sequence.segments().size());
    EXPECT_EQ(data.size(), sequence.size());
    EXPECT_FALSE(sequence.contiguous());
    EXPECT_EQ(data, sequence.to_string());
}

TEST(sequence_t, Slice) {
    const std::string data("hello, world");
    const sequence_t sequence = segmented(data);

    EXPECT_EQ("lo, wo", sequence.slice(3, 6).to_string());
    EXPECT_EQ(2u, sequence.slice(3, 6).segments().size());
    EXPECT_EQ("world", sequence.slice(7).to_string());
    EXPECT_TRUE(sequence.slice(100).empty());
    EXPECT_TRUE(sequence.slice(4, 2).contiguous());
}

TEST(sequence_t, FromSegments) {
    const std::string head("ab");
    const std::string tail("cd");

    std::vector<boost::asio::const_buffer> buffers;
    buffers.push_back(boost::asio::buffer(head));
    buffers.push_back(boost::asio::buffer(tail));

    const sequence_t sequence = sequence_t::from_segments(buffers.begin(), buffers.end());
    EXPECT_EQ("abcd", sequence.to_string());
    EXPECT_EQ(2u, sequence.segments().size());
}

TEST(cursor_t, AdvanceAcrossSegments) {
    const std::string data("hello, world");
    const sequence_t sequence = segmented(data);

    cursor_t cursor(sequence);
    EXPECT_EQ(3u, boost::asio::buffer_size(cursor.span()));

    EXPECT_TRUE(cursor.try_advance(4));
    EXPECT_EQ(4u, cursor.position());
    EXPECT_EQ(8u, cursor.remaining());
    EXPECT_EQ(4u, boost::asio::buffer_size(cursor.span()));

    std::uint8_t value = 0;
    EXPECT_TRUE(cursor.try_peek(value));
    EXPECT_EQ('o', value);

    EXPECT_FALSE(cursor.try_advance(9));
    EXPECT_EQ(4u, cursor.position());

    EXPECT_TRUE(cursor.try_advance(8));
    EXPECT_TRUE(cursor.end());
    EXPECT_FALSE(cursor.try_peek(value));
}

TEST(cursor_t, CopyAndPeekAcrossSegments) {
    const std::string data("hello, world");
    const sequence_t sequence = segmented(data);

    cursor_t cursor(sequence);
    cursor.try_advance(1);

    char buffer[16] = {};
    EXPECT_EQ(6u, cursor.peek(buffer, 6));
    EXPECT_EQ("ello, ", std::string(buffer, 6));
    EXPECT_EQ(1u, cursor.position());

    EXPECT_TRUE(cursor.try_copy(buffer, 8));
    EXPECT_EQ("ello, wo", std::string(buffer, 8));
    EXPECT_EQ(9u, cursor.position());

    EXPECT_EQ(3u, cursor.peek(buffer, sizeof(buffer)));
    EXPECT_FALSE(cursor.try_copy(buffer, 4));
    EXPECT_EQ(9u, cursor.position());
}

TEST(cursor_t, Equals) {
    const std::string data("hello, world");
    const sequence_t sequence = segmented(data);

    cursor_t cursor(sequence);
    cursor.try_advance(2);

    EXPECT_TRUE(cursor.equals("llo, w", 6));
    EXPECT_FALSE(cursor.equals("llo, x", 6));
    EXPECT_FALSE(cursor.equals("llo, world!", 11));
}

TEST(cursor_t, CopyIsCheckpoint) {
    const std::string data("hello, world");
    const sequence_t sequence = segmented(data);

    cursor_t cursor(sequence);
    cursor_t checkpoint = cursor;

    cursor.try_advance(5);
    EXPECT_EQ(0u, checkpoint.position());
    EXPECT_EQ(", world", cursor.rest().to_string());
    EXPECT_EQ(data, checkpoint.rest().to_string());
}

TEST(output_buffer_t, PrepareCommitConsume) {
    output_buffer_t buffer(2);

    char* data = buffer.prepare(5);
    std::copy_n("hello", 5, data);
    buffer.commit(5);

    data = buffer.prepare(100);
    std::copy_n(", world", 7, data);
    buffer.commit(7);

    EXPECT_EQ("hello, world", buffer.to_string());

    buffer.consume(7);
    EXPECT_EQ("world", buffer.to_string());
    EXPECT_EQ("world", buffer.view().to_string());

    buffer.clear();
    EXPECT_TRUE(buffer.empty());
}

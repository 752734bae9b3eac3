#include <chrono>
#include <limits>
#include <string>

#include <gtest/gtest.h>

#include <shapeshift/buffer.hpp>
#include <shapeshift/reader.hpp>
#include <shapeshift/writer.hpp>

#include "util/bytes.hpp"

using namespace shapeshift;

using namespace testing;
using namespace testing::util;

TEST(writer_t, WriteScalars) {
    output_buffer_t buffer;
    writer_t writer(buffer);

    writer.write_nil();
    writer.write(true);
    writer.write(false);
    writer.write(-33);
    writer.write(static_cast<std::uint16_t>(300));
    writer.write(std::numeric_limits<std::int64_t>::max());

    EXPECT_EQ("c0c3c2d0dfcd012ccf7fffffffffffffff", hex(buffer.to_string()));
    EXPECT_EQ(buffer.size(), writer.written());
}

TEST(writer_t, SmallUnsignedAndSignedValuesShareEncoding) {
    output_buffer_t buffer;
    writer_t writer(buffer);

    writer.write(static_cast<std::uint8_t>(5));
    writer.write(static_cast<std::int64_t>(5));
    writer.write(200u);
    writer.write(200);

    EXPECT_EQ("0505ccc8ccc8", hex(buffer.to_string()));
}

TEST(writer_t, WriteStrings) {
    output_buffer_t buffer;
    writer_t writer(buffer);

    writer.write(std::string("hi"));
    writer.write("");
    writer.write_string("abc", 3);

    EXPECT_EQ("a26869a0a3616263", hex(buffer.to_string()));
}

TEST(writer_t, WriteLongStringUsesWideHeader) {
    output_buffer_t buffer;
    writer_t writer(buffer);

    writer.write(std::string(32, 'x'));

    EXPECT_EQ(34u, buffer.size());
    EXPECT_EQ("d920", hex(buffer.to_string().substr(0, 2)));
}

TEST(writer_t, WriteBinaryAndExtension) {
    output_buffer_t buffer;
    writer_t writer(buffer);

    writer.write_binary("\x01\x02", 2);
    writer.write_extension(9, "\xaa", 1);
    writer.write_extension(9, "abc", 3);

    EXPECT_EQ("c4020102" "d409aa" "c70309616263", hex(buffer.to_string()));
}

TEST(writer_t, WriteContainers) {
    output_buffer_t buffer;
    writer_t writer(buffer);

    writer.write_array_header(2);
    writer.write_map_header(1);
    writer.write("a");
    writer.write(1);
    writer.write_array_header(0);

    EXPECT_EQ("9281a16101" "90", hex(buffer.to_string()));
}

TEST(writer_t, WriteTimePoint) {
    output_buffer_t buffer;
    writer_t writer(buffer);

    writer.write(std::chrono::system_clock::time_point(std::chrono::seconds(42)));

    EXPECT_EQ("d6ff0000002a", hex(buffer.to_string()));
}

TEST(writer_t, WriteRawSegments) {
    const std::string data("abcdef");

    sequence_t sequence;
    sequence.append(sequence_t::segment_type(data.data(), 2));
    sequence.append(sequence_t::segment_type(data.data() + 2, 4));

    output_buffer_t buffer;
    writer_t writer(buffer);
    writer.write_raw(sequence);

    EXPECT_EQ(data, buffer.to_string());
    EXPECT_EQ(6u, writer.written());
}

TEST(writer_t, PrepareAdvance) {
    output_buffer_t buffer;
    writer_t writer(buffer);

    char* data = writer.prepare(primitives::max_header_size * 2);
    std::size_t size = primitives::write(data, static_cast<std::int64_t>(1));
    size += primitives::write(data + size, static_cast<std::int64_t>(-1));
    writer.advance(size);

    EXPECT_EQ("01ff", hex(buffer.to_string()));
    EXPECT_EQ(2u, writer.written());
}

TEST(writer_t, ReaderReadsWhatWriterWrote) {
    output_buffer_t buffer;
    writer_t writer(buffer);

    writer.write_array_header(4);
    writer.write(std::numeric_limits<std::uint64_t>::max());
    writer.write(std::numeric_limits<std::int64_t>::min());
    writer.write(0.25f);
    writer.write(std::string(70000, 'z'));

    const sequence_t sequence = buffer.view();
    reader_t reader(sequence);

    EXPECT_EQ(4u, reader.read_array_header());
    EXPECT_EQ(std::numeric_limits<std::uint64_t>::max(), reader.read_integer<std::uint64_t>());
    EXPECT_EQ(std::numeric_limits<std::int64_t>::min(), reader.read_integer<std::int64_t>());
    EXPECT_EQ(code::float32, reader.peek_code());
    EXPECT_FLOAT_EQ(0.25f, reader.read_float());
    EXPECT_EQ(code::str32, reader.peek_code());
    EXPECT_EQ(70000u, reader.read_string().size());
    EXPECT_TRUE(reader.end());
}

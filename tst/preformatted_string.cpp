#include <cstdlib>
#include <new>
#include <string>

#include <gtest/gtest.h>

#include <shapeshift/buffer.hpp>
#include <shapeshift/preformatted_string.hpp>
#include <shapeshift/reader.hpp>
#include <shapeshift/streaming_reader.hpp>
#include <shapeshift/writer.hpp>

#include "util/bytes.hpp"

using namespace shapeshift;

using namespace testing;
using namespace testing::util;

namespace {

std::size_t allocations = 0;

} // namespace

void*
operator new(std::size_t size) {
    ++allocations;

    if (void* memory = std::malloc(size == 0 ? 1 : size)) {
        return memory;
    }

    throw std::bad_alloc();
}

void
operator delete(void* memory) noexcept {
    std::free(memory);
}

TEST(preformatted_string_t, Encoding) {
    const preformatted_string_t name("abc");

    EXPECT_EQ("abc", name.value());
    EXPECT_EQ("a3616263", hex(static_cast<const char*>(name.formatted().data()), name.formatted().size()));
    EXPECT_EQ("616263", hex(static_cast<const char*>(name.encoded().data()), name.encoded().size()));
}

TEST(preformatted_string_t, LongValueHeader) {
    const preformatted_string_t name(std::string(40, 'x'));

    const std::string formatted = hex(static_cast<const char*>(name.formatted().data()), name.formatted().size());
    EXPECT_EQ("d928", formatted.substr(0, 4));
    EXPECT_EQ(42u, name.formatted().size());
    EXPECT_EQ(40u, name.encoded().size());
}

TEST(preformatted_string_t, Write) {
    const preformatted_string_t name("id");

    output_buffer_t buffer;
    writer_t writer(buffer);
    name.write(writer);

    EXPECT_EQ("a26964", hex(buffer.to_string()));
}

TEST(preformatted_string_t, IsMatch) {
    const preformatted_string_t name("key");

    EXPECT_TRUE(name.is_match("key", 3));
    EXPECT_FALSE(name.is_match("kez", 3));
    EXPECT_FALSE(name.is_match("ke", 2));

    const std::string data = "key";
    sequence_t segmented;
    segmented.append(sequence_t::segment_type(data.data(), 1));
    segmented.append(sequence_t::segment_type(data.data() + 1, 2));

    EXPECT_TRUE(name.is_match(segmented));
    EXPECT_FALSE(name.is_match(sequence_t(data.data(), 2)));
}

TEST(preformatted_string_t, TryReadConsumesOnlyMatch) {
    const preformatted_string_t name("x");

    const std::string data = bytes({ 0xa1, 'y', 0xa1, 'x', 0xc0 });
    const sequence_t sequence(data);
    reader_t reader(sequence);

    EXPECT_FALSE(name.try_read(reader));
    EXPECT_EQ(0u, reader.position());

    reader.skip_raw(2);
    EXPECT_TRUE(name.try_read(reader));
    EXPECT_EQ(4u, reader.position());

    EXPECT_FALSE(name.try_read(reader));
    EXPECT_EQ(4u, reader.position());

    reader.read_nil();
    EXPECT_FALSE(name.try_read(reader));
}

TEST(preformatted_string_t, TryReadDoesNotAllocate) {
    const preformatted_string_t name("property");

    const std::string data = bytes({ 0xa8, 'p', 'r', 'o', 'p', 'e', 'r', 't', 'y', 0xa8, 'p', 'r', 'o', 'p', 'e', 'r', 't', 'i' });
    const sequence_t sequence(data);
    reader_t reader(sequence);

    const std::size_t before = allocations;

    const bool first = name.try_read(reader);
    const bool second = name.try_read(reader);
    const bool raw = name.is_match(data.data() + 1, 8);

    const std::size_t after = allocations;

    EXPECT_TRUE(first);
    EXPECT_FALSE(second);
    EXPECT_TRUE(raw);
    EXPECT_EQ(before, after);
}

TEST(preformatted_string_t, StreamingTryRead) {
    const preformatted_string_t name("abc");

    const std::string data = bytes({ 0xa3, 'a', 'b', 'c', 0xa3, 'a', 'b', 'd', 0x01 });

    {
        const sequence_t prefix(data.data(), 3);
        streaming_reader_t reader(prefix, false);

        bool matched = true;
        EXPECT_EQ(decode_result::insufficient_data, name.try_read(reader, matched));
        EXPECT_FALSE(matched);
        EXPECT_EQ(0u, reader.position());
    }

    {
        const sequence_t prefix(data.data(), 3);
        streaming_reader_t reader(prefix, true);

        bool matched = true;
        EXPECT_EQ(decode_result::end_of_stream, name.try_read(reader, matched));
    }

    const sequence_t sequence(data);
    streaming_reader_t reader(sequence, true);

    bool matched = false;
    EXPECT_EQ(decode_result::success, name.try_read(reader, matched));
    EXPECT_TRUE(matched);
    EXPECT_EQ(4u, reader.position());

    EXPECT_EQ(decode_result::success, name.try_read(reader, matched));
    EXPECT_FALSE(matched);
    EXPECT_EQ(4u, reader.position());

    EXPECT_EQ(decode_result::success, reader.try_skip_raw(4));
    EXPECT_EQ(decode_result::token_mismatch, name.try_read(reader, matched));
}

TEST(preformatted_string_t, Equality) {
    EXPECT_TRUE(preformatted_string_t("a") == preformatted_string_t("a"));
    EXPECT_FALSE(preformatted_string_t("a") == preformatted_string_t("b"));
}

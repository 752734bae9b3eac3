#include <cmath>
#include <limits>
#include <string>

#include <gtest/gtest.h>

#include <shapeshift/primitives.hpp>

#include "util/bytes.hpp"

using namespace shapeshift;

using namespace testing;
using namespace testing::util;

namespace {

std::string
encode_signed(std::int64_t value) {
    char data[primitives::max_header_size];
    return std::string(data, primitives::write(data, value));
}

std::string
encode_unsigned(std::uint64_t value) {
    char data[primitives::max_header_size];
    return std::string(data, primitives::write(data, value));
}

std::string
encode_string_header(std::uint32_t length) {
    char data[primitives::max_header_size];
    return std::string(data, primitives::write_string_header(data, length));
}

std::string
encode_timestamp(const timestamp_t& value) {
    char data[primitives::max_timestamp_size];
    return std::string(data, primitives::write(data, value));
}

integer_t
decode_integer(const std::string& data) {
    integer_t value;
    std::size_t consumed = 0;
    EXPECT_EQ(decode_result::success, primitives::try_read(data.data(), data.size(), value, consumed));
    EXPECT_EQ(data.size(), consumed);
    return value;
}

} // namespace

TEST(primitives, WriteSignedIntegerBoundaries) {
    EXPECT_EQ("00", hex(encode_signed(0)));
    EXPECT_EQ("7f", hex(encode_signed(127)));
    EXPECT_EQ("cc80", hex(encode_signed(128)));
    EXPECT_EQ("ccff", hex(encode_signed(255)));
    EXPECT_EQ("cd0100", hex(encode_signed(256)));
    EXPECT_EQ("cdffff", hex(encode_signed(65535)));
    EXPECT_EQ("ce00010000", hex(encode_signed(65536)));
    EXPECT_EQ("cf0000000100000000", hex(encode_signed(4294967296ll)));

    EXPECT_EQ("ff", hex(encode_signed(-1)));
    EXPECT_EQ("e0", hex(encode_signed(-32)));
    EXPECT_EQ("d0df", hex(encode_signed(-33)));
    EXPECT_EQ("d080", hex(encode_signed(-128)));
    EXPECT_EQ("d1ff7f", hex(encode_signed(-129)));
    EXPECT_EQ("d18000", hex(encode_signed(-32768)));
    EXPECT_EQ("d2ffff7fff", hex(encode_signed(-32769)));
    EXPECT_EQ("d38000000000000000", hex(encode_signed(std::numeric_limits<std::int64_t>::min())));
}

TEST(primitives, WriteUnsignedIntegerBoundaries) {
    EXPECT_EQ("7f", hex(encode_unsigned(127)));
    EXPECT_EQ("cc80", hex(encode_unsigned(128)));
    EXPECT_EQ("ceffffffff", hex(encode_unsigned(4294967295ull)));
    EXPECT_EQ("cfffffffffffffffff", hex(encode_unsigned(std::numeric_limits<std::uint64_t>::max())));
}

TEST(primitives, WriteStringHeaderBoundaries) {
    EXPECT_EQ("a0", hex(encode_string_header(0)));
    EXPECT_EQ("bf", hex(encode_string_header(31)));
    EXPECT_EQ("d920", hex(encode_string_header(32)));
    EXPECT_EQ("d9ff", hex(encode_string_header(255)));
    EXPECT_EQ("da0100", hex(encode_string_header(256)));
    EXPECT_EQ("daffff", hex(encode_string_header(65535)));
    EXPECT_EQ("db00010000", hex(encode_string_header(65536)));
}

TEST(primitives, WriteContainerHeaders) {
    char data[primitives::max_header_size];

    EXPECT_EQ("9f", hex(data, primitives::write_array_header(data, 15)));
    EXPECT_EQ("dc0010", hex(data, primitives::write_array_header(data, 16)));
    EXPECT_EQ("dd00010000", hex(data, primitives::write_array_header(data, 65536)));

    EXPECT_EQ("8f", hex(data, primitives::write_map_header(data, 15)));
    EXPECT_EQ("de0010", hex(data, primitives::write_map_header(data, 16)));
    EXPECT_EQ("df00010000", hex(data, primitives::write_map_header(data, 65536)));

    EXPECT_EQ("c400", hex(data, primitives::write_binary_header(data, 0)));
    EXPECT_EQ("c4ff", hex(data, primitives::write_binary_header(data, 255)));
    EXPECT_EQ("c50100", hex(data, primitives::write_binary_header(data, 256)));
}

TEST(primitives, WriteFloats) {
    char data[primitives::max_header_size];

    EXPECT_EQ("ca3fc00000", hex(data, primitives::write(data, 1.5f)));
    EXPECT_EQ("cb3ff8000000000000", hex(data, primitives::write(data, 1.5)));
}

TEST(primitives, WriteExtensionHeaders) {
    char data[primitives::max_header_size];

    EXPECT_EQ("d405", hex(data, primitives::write_extension_header(data, extension_header_t(5, 1))));
    EXPECT_EQ("d805", hex(data, primitives::write_extension_header(data, extension_header_t(5, 16))));
    EXPECT_EQ("c70305", hex(data, primitives::write_extension_header(data, extension_header_t(5, 3))));
    EXPECT_EQ("c8010005", hex(data, primitives::write_extension_header(data, extension_header_t(5, 256))));
}

TEST(primitives, WriteTimestampShortestForm) {
    EXPECT_EQ("d6ff00000001", hex(encode_timestamp(timestamp_t(1, 0))));
    EXPECT_EQ("d7ff0000000400000001", hex(encode_timestamp(timestamp_t(1, 1))));
    EXPECT_EQ("c70cff00000000ffffffffffffffff", hex(encode_timestamp(timestamp_t(-1, 0))));
}

TEST(primitives, ReadTimestampForms) {
    const std::string forms[] = {
        encode_timestamp(timestamp_t(1, 0)),
        encode_timestamp(timestamp_t(1, 1)),
        encode_timestamp(timestamp_t(-1, 0))
    };

    const timestamp_t expected[] = { timestamp_t(1, 0), timestamp_t(1, 1), timestamp_t(-1, 0) };

    for (std::size_t i = 0; i < 3; ++i) {
        timestamp_t value;
        std::size_t consumed = 0;
        EXPECT_EQ(decode_result::success,
            primitives::try_read(forms[i].data(), forms[i].size(), value, consumed));
        EXPECT_EQ(expected[i], value);
        EXPECT_EQ(forms[i].size(), consumed);
    }
}

TEST(primitives, ReadTimestampRejectsOtherExtensions) {
    const std::string data = bytes({ 0xd6, 0x05, 0x00, 0x00, 0x00, 0x01 });

    timestamp_t value;
    std::size_t consumed = 0;
    EXPECT_EQ(decode_result::token_mismatch, primitives::try_read(data.data(), data.size(), value, consumed));
}

TEST(primitives, ReadIntegers) {
    integer_t value = decode_integer(bytes({ 0xd0, 0xdf }));
    EXPECT_TRUE(value.negative);
    EXPECT_EQ(-33, static_cast<std::int64_t>(value.bits));

    value = decode_integer(bytes({ 0xcf, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff }));
    EXPECT_FALSE(value.negative);
    EXPECT_EQ(std::numeric_limits<std::uint64_t>::max(), value.bits);

    // A non-negative value in a signed marker is not negative.
    value = decode_integer(bytes({ 0xd1, 0x00, 0x10 }));
    EXPECT_FALSE(value.negative);
    EXPECT_EQ(16u, value.bits);
}

TEST(primitives, ReadIntegerFromTruncatedBuffer) {
    const std::string data = bytes({ 0xcd, 0x01 });

    integer_t value;
    std::size_t consumed = 0;
    EXPECT_EQ(decode_result::insufficient_data, primitives::try_read(data.data(), data.size(), value, consumed));
    EXPECT_EQ(0u, consumed);

    EXPECT_EQ(decode_result::insufficient_data, primitives::try_read(data.data(), 0, value, consumed));
}

TEST(primitives, ReadMismatch) {
    const std::string data = bytes({ 0xc0 });

    integer_t integer;
    bool boolean;
    std::uint32_t length;
    std::size_t consumed = 0;

    EXPECT_EQ(decode_result::token_mismatch, primitives::try_read(data.data(), data.size(), integer, consumed));
    EXPECT_EQ(decode_result::token_mismatch, primitives::try_read(data.data(), data.size(), boolean, consumed));
    EXPECT_EQ(decode_result::token_mismatch,
        primitives::try_read_string_header(data.data(), data.size(), length, consumed));
    EXPECT_EQ(decode_result::success, primitives::try_read_nil(data.data(), data.size(), consumed));
    EXPECT_EQ(1u, consumed);
}

TEST(primitives, ReadDoubleAcceptsIntegersAndFloats) {
    double value = 0;
    std::size_t consumed = 0;

    const std::string integer = bytes({ 0xd0, 0xdf });
    EXPECT_EQ(decode_result::success, primitives::try_read(integer.data(), integer.size(), value, consumed));
    EXPECT_DOUBLE_EQ(-33.0, value);

    const std::string single = bytes({ 0xca, 0x3f, 0xc0, 0x00, 0x00 });
    EXPECT_EQ(decode_result::success, primitives::try_read(single.data(), single.size(), value, consumed));
    EXPECT_DOUBLE_EQ(1.5, value);
    EXPECT_EQ(5u, consumed);
}

TEST(primitives, HeaderSize) {
    EXPECT_EQ(1u, primitives::header_size(0x7f));
    EXPECT_EQ(1u, primitives::header_size(0xa5));
    EXPECT_EQ(2u, primitives::header_size(code::str8));
    EXPECT_EQ(3u, primitives::header_size(code::array16));
    EXPECT_EQ(5u, primitives::header_size(code::float32));
    EXPECT_EQ(9u, primitives::header_size(code::float64));
    EXPECT_EQ(0u, primitives::header_size(code::never_used));
}

TEST(primitives, Narrow) {
    integer_t value;
    value.bits = 300;

    std::uint8_t narrow8 = 0;
    EXPECT_FALSE(narrow(value, narrow8));

    std::uint16_t narrow16 = 0;
    EXPECT_TRUE(narrow(value, narrow16));
    EXPECT_EQ(300, narrow16);

    value.negative = true;
    value.bits = static_cast<std::uint64_t>(static_cast<std::int64_t>(-128));

    unsigned int unsigned_value = 0;
    EXPECT_FALSE(narrow(value, unsigned_value));

    std::int8_t signed8 = 0;
    EXPECT_TRUE(narrow(value, signed8));
    EXPECT_EQ(-128, signed8);

    value.bits = static_cast<std::uint64_t>(static_cast<std::int64_t>(-129));
    EXPECT_FALSE(narrow(value, signed8));
}

TEST(primitives, TokenType) {
    EXPECT_EQ(token_type::integer, to_token_type(0x00));
    EXPECT_EQ(token_type::integer, to_token_type(0xe0));
    EXPECT_EQ(token_type::map, to_token_type(0x80));
    EXPECT_EQ(token_type::array, to_token_type(code::array32));
    EXPECT_EQ(token_type::string, to_token_type(0xa0));
    EXPECT_EQ(token_type::binary, to_token_type(code::bin16));
    EXPECT_EQ(token_type::extension, to_token_type(code::fixext4));
    EXPECT_EQ(token_type::floating, to_token_type(code::float32));
    EXPECT_EQ(token_type::boolean, to_token_type(code::true_value));
    EXPECT_EQ(token_type::nil, to_token_type(code::nil));
    EXPECT_EQ(token_type::unknown, to_token_type(code::never_used));
}

TEST(timestamp_t, TimePointConversionKeepsNanosecondsBeforeEpoch) {
    const auto time = std::chrono::system_clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(std::chrono::microseconds(-1500000)));

    const timestamp_t value = timestamp_t::from_time_point(time);
    EXPECT_EQ(-2, value.seconds);
    EXPECT_EQ(500000000u, value.nanoseconds);
    EXPECT_TRUE(time == value.to_time_point());
}

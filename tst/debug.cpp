#include <string>

#include <gtest/gtest.h>

#include <shapeshift/debug.hpp>
#include <shapeshift/error.hpp>

#include "util/bytes.hpp"

using namespace shapeshift;

using namespace testing;
using namespace testing::util;

namespace {

std::string
render(const std::string& data, const options_t& options = options_t()) {
    return to_text(sequence_t(data), options);
}

} // namespace

TEST(to_text, Scalars) {
    EXPECT_EQ("null", render(bytes({ 0xc0 })));
    EXPECT_EQ("true", render(bytes({ 0xc3 })));
    EXPECT_EQ("-33", render(bytes({ 0xd0, 0xdf })));
    EXPECT_EQ("18446744073709551615", render(bytes({ 0xcf, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff })));
    EXPECT_EQ("1.5", render(bytes({ 0xcb, 0x3f, 0xf8, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00 })));
    EXPECT_EQ("1.0", render(bytes({ 0xcb, 0x3f, 0xf0, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00 })));
    EXPECT_EQ("1.5f", render(bytes({ 0xca, 0x3f, 0xc0, 0x00, 0x00 })));
    EXPECT_EQ("NaN", render(bytes({ 0xcb, 0x7f, 0xf8, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00 })));
}

TEST(to_text, StringsAreEscaped) {
    EXPECT_EQ("\"a\\\"b\\n\\u0001\"", render(bytes({ 0xa5, 'a', '"', 'b', '\n', 0x01 })));
}

TEST(to_text, BinaryAndExtensions) {
    EXPECT_EQ("bin\"01ff\"", render(bytes({ 0xc4, 0x02, 0x01, 0xff })));
    EXPECT_EQ("ext(5, \"aabb\")", render(bytes({ 0xd5, 0x05, 0xaa, 0xbb })));
    EXPECT_EQ("ext(-1, \"00000001\")", render(bytes({ 0xd6, 0xff, 0x00, 0x00, 0x00, 0x01 })));
}

TEST(to_text, Containers) {
    const std::string data = bytes({ 0x82, 0xa1, 'a', 0x92, 0x01, 0xc0, 0xa1, 'b', 0x80 });
    EXPECT_EQ("{\"a\": [1, null], \"b\": {}}", render(data));
}

TEST(to_text, ConsecutiveValuesOnSeparateLines) {
    EXPECT_EQ("1\n\"x\"\n[]", render(bytes({ 0x01, 0xa1, 'x', 0x90 })));
}

TEST(to_text, MalformedInputThrows) {
    EXPECT_THROW(render(bytes({ 0xc1 })), unexpected_token_error);
    EXPECT_THROW(render(bytes({ 0x92, 0x01 })), shapeshift::error_t);
}

TEST(to_text, DepthIsLimited) {
    options_t options;
    options.max_depth = 1;

    EXPECT_EQ("[[]]", render(bytes({ 0x91, 0x90 }), options_t()));
    EXPECT_THROW(render(bytes({ 0x91, 0x90 }), options), depth_exceeded_error);
}

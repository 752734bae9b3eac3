#include <cstdint>
#include <iterator>
#include <limits>
#include <map>
#include <string>
#include <vector>

#include <msgpack.hpp>

#include <gtest/gtest.h>

#include <shapeshift/serializer.hpp>

using namespace shapeshift;

using namespace testing;

namespace {

template<class T>
std::vector<char>
pack(const T& value) {
    msgpack::sbuffer buffer;
    msgpack::pack(buffer, value);
    return std::vector<char>(buffer.data(), buffer.data() + buffer.size());
}

template<class T>
T
unpack(const std::vector<char>& data) {
    msgpack::object_handle handle = msgpack::unpack(data.data(), data.size());
    return handle.get().as<T>();
}

} // namespace

TEST(interop, IntegersMatchReferenceEncoder) {
    serializer_t serializer;

    const std::vector<std::int64_t> values({
        0, 1, 127, 128, 255, 256, 65535, 65536, -1, -32, -33, -128, -129, -32768, -32769,
        std::numeric_limits<std::int32_t>::min(),
        std::numeric_limits<std::int64_t>::min(),
        std::numeric_limits<std::int64_t>::max()
    });

    for (auto it = values.begin(); it != values.end(); ++it) {
        EXPECT_EQ(pack(*it), serializer.serialize(*it)) << *it;
        EXPECT_EQ(*it, serializer.deserialize<std::int64_t>(pack(*it))) << *it;
    }

    const std::uint64_t max = std::numeric_limits<std::uint64_t>::max();
    EXPECT_EQ(pack(max), serializer.serialize(max));
}

TEST(interop, StringsMatchReferenceEncoder) {
    serializer_t serializer;

    const std::size_t sizes[] = { 0, 1, 31, 32, 255, 256, 65535, 65536 };

    for (auto it = std::begin(sizes); it != std::end(sizes); ++it) {
        const std::string value(*it, 'q');
        EXPECT_EQ(pack(value), serializer.serialize(value)) << *it;
        EXPECT_EQ(value, serializer.deserialize<std::string>(pack(value))) << *it;
    }
}

TEST(interop, ContainersReadByReferenceDecoder) {
    serializer_t serializer;

    std::map<std::string, std::vector<double>> value;
    value["empty"];
    value["numbers"] = std::vector<double>({ 1.5, -0.25, 1.25e-10 });

    EXPECT_EQ(pack(value), serializer.serialize(value));
    EXPECT_EQ(value, (unpack<std::map<std::string, std::vector<double>>>(serializer.serialize(value))));
    EXPECT_EQ(value, (serializer.deserialize<std::map<std::string, std::vector<double>>>(pack(value))));
}

TEST(interop, BinaryMatchesReferenceEncoder) {
    serializer_t serializer;

    const std::vector<char> value(300, '\x7f');
    EXPECT_EQ(pack(value), serializer.serialize(value));
    EXPECT_EQ(value, serializer.deserialize<std::vector<char>>(pack(value)));
}

TEST(interop, FloatsAreReadFromReferenceEncoder) {
    serializer_t serializer;

    EXPECT_EQ(pack(2.5f), serializer.serialize(2.5f));
    EXPECT_DOUBLE_EQ(2.5, serializer.deserialize<double>(pack(2.5f)));
    EXPECT_EQ(pack(-3.75), serializer.serialize(-3.75));
}

#include <map>
#include <memory>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include <shapeshift/serializer.hpp>
#include <shapeshift/sink.hpp>
#include <shapeshift/source.hpp>

#include "util/bytes.hpp"

using namespace shapeshift;

using namespace testing;
using namespace testing::util;

namespace {

/// Writes integers as strings, reading them back.
class decimal_converter_t : public converter<int> {
public:
    virtual
    void
    write(writer_t& writer, const int& value, context_t&) const {
        writer.write(std::to_string(value));
    }

    virtual
    int
    read(reader_t& reader, context_t&) const {
        return std::stoi(reader.read_string());
    }
};

} // namespace

TEST(serializer_t, DefaultOptions) {
    serializer_t serializer;

    EXPECT_EQ(64, serializer.options().max_depth);
    EXPECT_EQ(object_layout::map, serializer.options().layout);
    EXPECT_FALSE(serializer.options().intern_strings);
    EXPECT_TRUE(serializer.options().hardware_acceleration);
    EXPECT_EQ(64u * 1024, serializer.options().unflushed_bytes_threshold);
    EXPECT_EQ(4096u, serializer.options().minimum_fetch_size);
}

TEST(serializer_t, WrapsFailuresIntoSerializationError) {
    serializer_t serializer;

    try {
        serializer.deserialize<std::string>(std::vector<char>({ 0x01 }));
        FAIL() << "serialization_error expected";
    } catch (const serialization_error& err) {
        EXPECT_EQ(error::unexpected_token, err.code().value());
        EXPECT_TRUE(err.code().category() == error::protocol_category());
        EXPECT_THROW(err.rethrow_cause(), unexpected_token_error);
    }

    try {
        serializer.deserialize<int>(std::vector<char>());
        FAIL() << "serialization_error expected";
    } catch (const serialization_error& err) {
        EXPECT_EQ(error::end_of_stream, err.code().value());
    }
}

TEST(serializer_t, SerializationErrorIsNotWrappedTwice) {
    const auto cause = std::make_exception_ptr(end_of_stream_error());
    const auto wrapped = detail::wrap(cause);

    EXPECT_TRUE(wrapped == detail::wrap(wrapped));
    EXPECT_TRUE(detail::wrap(std::exception_ptr()) == nullptr);
}

TEST(serializer_t, DeserializeLeavesReaderAfterValue) {
    serializer_t serializer;

    const std::string data = bytes({ 0x92, 0x01, 0x02, 0xa1, 'x' });
    const sequence_t sequence(data);
    reader_t reader(sequence);

    EXPECT_EQ(std::vector<int>({ 1, 2 }), serializer.deserialize<std::vector<int>>(reader));
    EXPECT_EQ("x", serializer.deserialize<std::string>(reader));
    EXPECT_TRUE(reader.end());
}

TEST(serializer_t, SerializeThroughWriter) {
    serializer_t serializer;

    output_buffer_t buffer;
    writer_t writer(buffer);

    serializer.serialize(writer, 1);
    serializer.serialize(writer, std::string("a"));

    EXPECT_EQ("01a161", hex(buffer.to_string()));
}

TEST(serializer_t, TryDeserialize) {
    serializer_t serializer;

    const std::string data = bytes({ 0x92, 0xa1, 'a', 0xa2, 'b', 'c', 0x07 });

    // ===== Set Up Stage =====
    // Grows the visible prefix byte by byte, nothing must be consumed until the array is whole.
    for (std::size_t size = 0; size < 6; ++size) {
        const sequence_t prefix(data.data(), size);
        streaming_reader_t reader(prefix, false);

        std::vector<std::string> value;
        EXPECT_EQ(decode_result::insufficient_data, serializer.try_deserialize(reader, value)) << "size " << size;
        EXPECT_EQ(0u, reader.position());
        EXPECT_TRUE(value.empty());
    }

    const sequence_t whole(data);
    streaming_reader_t reader(whole, true);

    std::vector<std::string> value;
    ASSERT_EQ(decode_result::success, serializer.try_deserialize(reader, value));
    EXPECT_EQ(std::vector<std::string>({ "a", "bc" }), value);
    EXPECT_EQ(6u, reader.position());

    int number = 0;
    ASSERT_EQ(decode_result::success, serializer.try_deserialize(reader, number));
    EXPECT_EQ(7, number);
    EXPECT_EQ(decode_result::end_of_stream, serializer.try_deserialize(reader, number));
}

TEST(serializer_t, TryDeserializeMapSplitAtEveryOffset) {
    serializer_t serializer;

    std::map<std::string, std::vector<int>> expected;
    expected["first"] = std::vector<int>({ 1, -200, 70000 });
    expected["second"] = std::vector<int>();
    expected["third"] = std::vector<int>(20, 7);

    const std::vector<char> encoded = serializer.serialize(expected);
    const std::string data(encoded.begin(), encoded.end());

    for (std::size_t offset = 1; offset < data.size(); ++offset) {
        {
            const sequence_t head(data.data(), offset);
            streaming_reader_t reader(head, false);

            std::map<std::string, std::vector<int>> value;
            ASSERT_EQ(decode_result::insufficient_data, serializer.try_deserialize(reader, value))
                << "offset " << offset;
            EXPECT_EQ(0u, reader.position());
        }

        sequence_t whole;
        whole.append(sequence_t::segment_type(data.data(), offset));
        whole.append(sequence_t::segment_type(data.data() + offset, data.size() - offset));
        streaming_reader_t reader(whole, true);

        std::map<std::string, std::vector<int>> value;
        ASSERT_EQ(decode_result::success, serializer.try_deserialize(reader, value)) << "offset " << offset;
        EXPECT_EQ(expected, value);
        EXPECT_EQ(data.size(), reader.position());
    }
}

TEST(serializer_t, TryDeserializeWrapsTypeErrors) {
    serializer_t serializer;

    const std::string data = bytes({ 0xa1, 'a' });
    const sequence_t sequence(data);
    streaming_reader_t reader(sequence, false);

    int value = 0;
    EXPECT_THROW(serializer.try_deserialize(reader, value), serialization_error);
}

TEST(serializer_t, RegisteredConverterOverridesBuiltIn) {
    serializer_t serializer;
    serializer.register_converter<int>(std::make_shared<decimal_converter_t>());

    EXPECT_EQ("92a23432a22d31", hex(serializer.serialize(std::vector<int>({ 42, -1 }))));
    EXPECT_EQ(std::vector<int>({ 42, -1 }),
        serializer.deserialize<std::vector<int>>(serializer.serialize(std::vector<int>({ 42, -1 }))));

    // Other serializers keep the built-in converter.
    serializer_t other;
    EXPECT_EQ("2a", hex(other.serialize(42)));
}

TEST(serializer_t, DepthLimitApplies) {
    options_t options;
    options.max_depth = 1;

    serializer_t serializer(options);

    const std::vector<char> nested({ '\x91', '\x91', 0x01 });

    try {
        serializer.deserialize<std::vector<std::vector<int>>>(nested);
        FAIL() << "serialization_error expected";
    } catch (const serialization_error& err) {
        EXPECT_EQ(error::depth_exceeded, err.code().value());
        EXPECT_TRUE(err.code().category() == error::security_category());
    }

    EXPECT_THROW(serializer.deserialize<raw_t>(nested), serialization_error);
    EXPECT_EQ(std::vector<int>({ 1 }), serializer.deserialize<std::vector<int>>(std::vector<char>({ '\x91', 0x01 })));
}

TEST(serializer_t, AsyncDeserializeFromAsyncReader) {
    serializer_t serializer;

    loop_t loop;
    memory_source_t source(loop, split(bytes({ 0x92, 0x01, 0x02, 0xa1, 'z' }), 2));
    async_reader_t reader(source);

    std::vector<int> first;
    std::string second;

    serializer.async_deserialize<std::vector<int>>(reader, [&](const std::exception_ptr& err, std::vector<int> value) {
        ASSERT_FALSE(err);
        first = std::move(value);

        serializer.async_deserialize<std::string>(reader, [&](const std::exception_ptr& err, std::string value) {
            ASSERT_FALSE(err);
            second = std::move(value);
        });
    });

    loop.run();

    EXPECT_EQ(std::vector<int>({ 1, 2 }), first);
    EXPECT_EQ("z", second);
}

TEST(serializer_t, AsyncSerializeThroughAsyncWriter) {
    serializer_t serializer;

    loop_t loop;
    memory_sink_t sink(loop);
    async_writer_t writer(sink);

    std::map<std::string, int> value;
    value["k"] = 1;

    bool called = false;
    serializer.async_serialize(writer, value, [&](const std::exception_ptr& err) {
        called = true;
        EXPECT_FALSE(err);
    });

    loop.run();
    loop.reset();

    EXPECT_TRUE(called);

    // Below the threshold nothing is flushed on its own.
    EXPECT_EQ("", sink.data());
    EXPECT_EQ(4u, writer.unflushed());

    writer.flush([](const std::exception_ptr& err) {
        EXPECT_FALSE(err);
    });

    loop.run();

    EXPECT_EQ("81a16b01", hex(sink.data()));
}

TEST(serializer_t, AsyncSerializeReportsClosedSink) {
    serializer_t serializer;

    loop_t loop;
    memory_sink_t sink(loop);
    sink.close();

    std::exception_ptr result;
    serializer.async_serialize(sink, std::string("abc"), [&](const std::exception_ptr& err) {
        result = err;
    });

    loop.run();

    ASSERT_TRUE(result != nullptr);

    try {
        std::rethrow_exception(result);
    } catch (const serialization_error& err) {
        EXPECT_EQ(error::end_of_stream, err.code().value());
        EXPECT_THROW(err.rethrow_cause(), end_of_stream_error);
    }
}

TEST(serializer_t, AsyncDeserializeUnknownTypeFailsImmediately) {
    struct unknown_t {};

    serializer_t serializer;

    loop_t loop;
    memory_source_t source(loop, {});

    bool called = false;
    serializer.async_deserialize<unknown_t>(source, [&](const std::exception_ptr& err, unknown_t) {
        called = true;
        EXPECT_THROW(std::rethrow_exception(err), serialization_error);
    });

    EXPECT_TRUE(called);
}

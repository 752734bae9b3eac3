#include <string>
#include <vector>

#include <boost/asio/error.hpp>
#include <boost/system/system_error.hpp>

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <shapeshift/async_reader.hpp>
#include <shapeshift/context.hpp>
#include <shapeshift/converter_cache.hpp>
#include <shapeshift/source.hpp>

#include "mock/stream.hpp"
#include "util/bytes.hpp"

using namespace shapeshift;

using namespace testing;
using namespace testing::util;

namespace {

/// Starts the operation and runs the loop until it completes, returning its outcome.
template<class Operation>
std::exception_ptr
complete(loop_t& loop, Operation operation) {
    bool called = false;
    std::exception_ptr result;

    operation([&](const std::exception_ptr& err) {
        called = true;
        result = err;
    });

    loop.run();
    loop.reset();

    EXPECT_TRUE(called);
    return result;
}

std::exception_ptr
fetch(loop_t& loop, async_reader_t& reader) {
    return complete(loop, [&](const async_reader_t::handler_type& handler) {
        reader.fetch_more_bytes(handler);
    });
}

std::exception_ptr
buffer_next(loop_t& loop, async_reader_t& reader, context_t& context) {
    return complete(loop, [&](const async_reader_t::handler_type& handler) {
        reader.buffer_next_structure(context, handler);
    });
}

} // namespace

TEST(async_reader_t, FetchAndRead) {
    loop_t loop;
    memory_source_t source(loop, { bytes({ 0xcd, 0x01 }), bytes({ 0x00, 0x05 }) });
    async_reader_t reader(source);

    EXPECT_EQ(0u, reader.buffered());
    EXPECT_FALSE(fetch(loop, reader));
    EXPECT_EQ(2u, reader.buffered());

    {
        auto view = reader.create_streaming_reader();
        EXPECT_TRUE(reader.lent());

        int value = 0;
        EXPECT_EQ(decode_result::insufficient_data, view->try_read(value));
        reader.return_reader(std::move(view));
    }

    EXPECT_FALSE(reader.lent());
    EXPECT_EQ(2u, reader.buffered());
    EXPECT_FALSE(fetch(loop, reader));
    EXPECT_EQ(4u, reader.buffered());

    {
        auto view = reader.create_streaming_reader();

        int value = 0;
        EXPECT_EQ(decode_result::success, view->try_read(value));
        EXPECT_EQ(256, value);
        reader.return_reader(std::move(view));
    }

    EXPECT_EQ(1u, reader.buffered());
    EXPECT_EQ(3u, reader.position());
}

TEST(async_reader_t, ReportsEndOfStream) {
    loop_t loop;
    memory_source_t source(loop, { bytes({ 0x01 }) });
    async_reader_t reader(source);

    EXPECT_FALSE(fetch(loop, reader));
    EXPECT_FALSE(reader.eof());

    EXPECT_FALSE(fetch(loop, reader));
    EXPECT_TRUE(reader.eof());
    EXPECT_EQ(1u, reader.buffered());

    {
        auto view = reader.create_streaming_reader();
        EXPECT_TRUE(view->eof());
        reader.return_reader(std::move(view));
    }

    EXPECT_THROW(std::rethrow_exception(fetch(loop, reader)), end_of_stream_error);
}

TEST(async_reader_t, ReturningTwiceIsViolation) {
    loop_t loop;
    memory_source_t source(loop, {});
    async_reader_t reader(source);

    auto view = reader.create_streaming_reader();
    reader.return_reader(std::move(view));

    EXPECT_THROW(reader.return_reader(std::move(view)), loan_violation_error);
    EXPECT_THROW(view->remaining(), loan_violation_error);
}

TEST(async_reader_t, OperationsWhileLentAreViolations) {
    loop_t loop;
    memory_source_t source(loop, {});
    async_reader_t reader(source);
    context_t context;

    auto view = reader.create_streaming_reader();

    EXPECT_THROW(reader.create_streaming_reader(), loan_violation_error);
    EXPECT_THROW(reader.create_buffered_reader(), loan_violation_error);
    EXPECT_THROW(reader.fetch_more_bytes([](const std::exception_ptr&) {}), loan_violation_error);
    EXPECT_THROW(reader.buffer_next_structure(context, [](const std::exception_ptr&) {}), loan_violation_error);
    EXPECT_THROW(reader.buffered_structures_count(1, context), loan_violation_error);

    reader.return_reader(std::move(view));
    EXPECT_NO_THROW(reader.return_reader(reader.create_streaming_reader()));
}

TEST(async_reader_t, ReturningToAnotherReaderIsViolation) {
    loop_t loop;
    memory_source_t source(loop, {});
    async_reader_t reader(source);
    async_reader_t other(source);

    auto view = reader.create_streaming_reader();
    EXPECT_THROW(other.return_reader(std::move(view)), loan_violation_error);
}

TEST(async_reader_t, OperationsWhileFetchingAreViolations) {
    loop_t loop;
    memory_source_t source(loop);
    async_reader_t reader(source);

    std::exception_ptr result;
    bool called = false;
    reader.fetch_more_bytes([&](const std::exception_ptr& err) {
        called = true;
        result = err;
    });

    EXPECT_THROW(reader.create_streaming_reader(), loan_violation_error);
    EXPECT_THROW(reader.fetch_more_bytes([](const std::exception_ptr&) {}), loan_violation_error);

    source.push(bytes({ 0x01 }));
    loop.run();

    EXPECT_TRUE(called);
    EXPECT_FALSE(result);
    EXPECT_EQ(1u, reader.buffered());
}

TEST(async_reader_t, BufferNextStructureFromSingleByteChunks) {
    const std::string data = bytes({ 0x92, 0xa3, 'a', 'b', 'c', 0x81, 0xc0, 0xc3, 0x07 });

    loop_t loop;
    memory_source_t source(loop, split(data, 1));
    async_reader_t reader(source);
    context_t context;

    EXPECT_FALSE(buffer_next(loop, reader, context));
    EXPECT_EQ(8u, reader.buffered());
    EXPECT_EQ(8u, source.reads());

    auto view = reader.create_buffered_reader();
    EXPECT_EQ(2u, view->read_array_header());
    EXPECT_EQ("abc", view->read_string());
    EXPECT_EQ(1u, view->read_map_header());
    view->read_nil();
    EXPECT_TRUE(view->read_bool());
    reader.return_reader(std::move(view));

    EXPECT_EQ(0u, reader.buffered());
    EXPECT_FALSE(buffer_next(loop, reader, context));
    EXPECT_EQ(1u, reader.buffered());
}

TEST(async_reader_t, BufferNextStructureFailsOnTruncatedStream) {
    loop_t loop;
    memory_source_t source(loop, { bytes({ 0x93, 0x01 }), bytes({ 0x02 }) });
    async_reader_t reader(source);
    context_t context;

    EXPECT_THROW(std::rethrow_exception(buffer_next(loop, reader, context)), end_of_stream_error);
    EXPECT_EQ(3u, reader.buffered());
}

TEST(async_reader_t, BufferNextStructureRespectsDepthLimit) {
    options_t options;
    options.max_depth = 2;

    loop_t loop;
    memory_source_t source(loop, { bytes({ 0x91, 0x91 }), bytes({ 0x91, 0x01 }) });
    async_reader_t reader(source);
    context_t context(options);

    EXPECT_THROW(std::rethrow_exception(buffer_next(loop, reader, context)), depth_exceeded_error);
}

TEST(async_reader_t, BufferedStructuresCount) {
    const std::string data = bytes({ 0x01, 0x92, 0x02, 0x03, 0xa2, 'x' });

    loop_t loop;
    memory_source_t source(loop, { data });
    async_reader_t reader(source);
    context_t context;

    EXPECT_FALSE(fetch(loop, reader));
    EXPECT_EQ(2u, reader.buffered_structures_count(10, context));
    EXPECT_EQ(1u, reader.buffered_structures_count(1, context));
}

TEST(async_reader_t, BufferedStructuresCountAfterInterruptedSkip) {
    loop_t loop;
    memory_source_t source(loop, { bytes({ 0x92, 0x01 }), bytes({ 0x02, 0x03, 0xa1, 'x' }) });
    async_reader_t reader(source);
    context_t context;

    EXPECT_FALSE(fetch(loop, reader));

    {
        auto view = reader.create_streaming_reader();
        EXPECT_EQ(decode_result::insufficient_data, view->try_skip(context));
        EXPECT_EQ(2u, view->position());
        reader.return_reader(std::move(view));
    }

    // The array is still missing its second element.
    EXPECT_EQ(0u, reader.buffered_structures_count(10, context));

    EXPECT_FALSE(fetch(loop, reader));
    EXPECT_EQ(4u, reader.buffered());
    EXPECT_EQ(2u, reader.buffered_structures_count(10, context));

    // Buffering the next structure means completing the interrupted one.
    EXPECT_FALSE(buffer_next(loop, reader, context));

    {
        auto view = reader.create_streaming_reader();
        EXPECT_EQ(decode_result::success, view->try_skip(context));
        EXPECT_EQ(1u, view->position());
        reader.return_reader(std::move(view));
    }

    EXPECT_EQ(3u, reader.buffered());
    EXPECT_EQ(2u, reader.buffered_structures_count(10, context));
}

TEST(async_reader_t, FetchRequestsAtLeastMinimumSize) {
    mock::source_t source;
    async_reader_t reader(source, 16);

    EXPECT_CALL(source, async_read_some(_, Ge(16u), _))
        .WillOnce(WithArgs<0, 2>(Invoke([](char* data, const source_t::handler_type& handler) {
            data[0] = 0x2a;
            handler(boost::system::error_code(), 1);
        })));

    std::exception_ptr result;
    reader.fetch_more_bytes([&](const std::exception_ptr& err) {
        result = err;
    });

    EXPECT_FALSE(result);
    EXPECT_EQ(1u, reader.buffered());
}

TEST(async_reader_t, FetchPropagatesSourceErrors) {
    mock::source_t source;
    async_reader_t reader(source);

    EXPECT_CALL(source, async_read_some(_, _, _))
        .WillOnce(WithArg<2>(Invoke([](const source_t::handler_type& handler) {
            handler(boost::asio::error::connection_reset, 0);
        })));

    std::exception_ptr result;
    reader.fetch_more_bytes([&](const std::exception_ptr& err) {
        result = err;
    });

    try {
        std::rethrow_exception(result);
        FAIL() << "boost::system::system_error expected";
    } catch (const boost::system::system_error& err) {
        EXPECT_EQ(boost::system::error_code(boost::asio::error::connection_reset), err.code());
    }

    EXPECT_FALSE(reader.eof());
}

TEST(async_reader_t, CancellationAbortsPendingFetch) {
    loop_t loop;
    memory_source_t source(loop);
    cancellation_t cancellation;
    async_reader_t reader(source, 4096, cancellation);

    bool called = false;
    std::exception_ptr result;
    reader.fetch_more_bytes([&](const std::exception_ptr& err) {
        called = true;
        result = err;
    });

    cancellation.cancel();
    loop.run();

    EXPECT_TRUE(called);
    EXPECT_THROW(std::rethrow_exception(result), cancelled_error);

    loop.reset();
    EXPECT_THROW(std::rethrow_exception(fetch(loop, reader)), cancelled_error);
}

#include <string>

#include <boost/asio/error.hpp>
#include <boost/system/system_error.hpp>

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <shapeshift/async_writer.hpp>
#include <shapeshift/sink.hpp>

#include "mock/stream.hpp"
#include "util/bytes.hpp"

using namespace shapeshift;

using namespace testing;
using namespace testing::util;

namespace {

std::exception_ptr
flush(loop_t& loop, async_writer_t& writer) {
    bool called = false;
    std::exception_ptr result;

    writer.flush([&](const std::exception_ptr& err) {
        called = true;
        result = err;
    });

    loop.run();
    loop.reset();

    EXPECT_TRUE(called);
    return result;
}

} // namespace

TEST(async_writer_t, WriteAndFlush) {
    loop_t loop;
    memory_sink_t sink(loop);
    async_writer_t writer(sink);

    {
        auto view = writer.create_writer();
        EXPECT_TRUE(writer.lent());

        view->write_array_header(2);
        view->write(1);
        view->write("a");
        writer.return_writer(std::move(view));
    }

    writer.write_nil();

    EXPECT_EQ(5u, writer.unflushed());
    EXPECT_EQ("", sink.data());

    EXPECT_FALSE(flush(loop, writer));
    EXPECT_EQ("9201a161c0", hex(sink.data()));
    EXPECT_EQ(0u, writer.unflushed());
    EXPECT_EQ(5u, writer.flushed());
    EXPECT_EQ(1u, sink.writes());
}

TEST(async_writer_t, FlushOfEmptyBufferSkipsSink) {
    loop_t loop;
    memory_sink_t sink(loop);
    async_writer_t writer(sink);

    EXPECT_FALSE(flush(loop, writer));
    EXPECT_EQ(0u, sink.writes());
}

TEST(async_writer_t, FlushIfAppropriateHonorsThreshold) {
    loop_t loop;
    memory_sink_t sink(loop);
    async_writer_t writer(sink, 4);

    writer.write_array_header(3);
    EXPECT_FALSE(writer.is_time_to_flush());

    bool called = false;
    writer.flush_if_appropriate([&](const std::exception_ptr& err) {
        called = true;
        EXPECT_FALSE(err);
    });

    // Completes inline, there is nothing to wait for.
    EXPECT_TRUE(called);
    EXPECT_EQ(0u, sink.writes());

    writer.write_raw(sequence_t(bytes({ 0x01, 0x02, 0x03 })));
    EXPECT_TRUE(writer.is_time_to_flush());

    called = false;
    writer.flush_if_appropriate([&](const std::exception_ptr& err) {
        called = true;
        EXPECT_FALSE(err);
    });

    loop.run();

    EXPECT_TRUE(called);
    EXPECT_EQ("93010203", hex(sink.data()));
}

TEST(async_writer_t, OperationsWhileLentAreViolations) {
    loop_t loop;
    memory_sink_t sink(loop);
    async_writer_t writer(sink);

    auto view = writer.create_writer();

    EXPECT_THROW(writer.create_writer(), loan_violation_error);
    EXPECT_THROW(writer.write_nil(), loan_violation_error);
    EXPECT_THROW(writer.is_time_to_flush(), loan_violation_error);
    EXPECT_THROW(writer.flush([](const std::exception_ptr&) {}), loan_violation_error);

    writer.return_writer(std::move(view));

    EXPECT_THROW(writer.return_writer(std::move(view)), loan_violation_error);
    EXPECT_FALSE(writer.lent());
}

TEST(async_writer_t, OperationsWhileFlushingAreViolations) {
    loop_t loop;
    memory_sink_t sink(loop);
    async_writer_t writer(sink);

    writer.write_nil();
    writer.flush([](const std::exception_ptr&) {});

    EXPECT_THROW(writer.create_writer(), loan_violation_error);
    EXPECT_THROW(writer.flush([](const std::exception_ptr&) {}), loan_violation_error);

    loop.run();

    EXPECT_NO_THROW(writer.return_writer(writer.create_writer()));
}

TEST(async_writer_t, ClosedSinkReportsEndOfStream) {
    loop_t loop;
    memory_sink_t sink(loop);
    async_writer_t writer(sink);

    sink.close();
    writer.write_nil();

    EXPECT_THROW(std::rethrow_exception(flush(loop, writer)), end_of_stream_error);
    EXPECT_EQ(1u, writer.unflushed());
}

TEST(async_writer_t, FlushPropagatesSinkErrors) {
    mock::sink_t sink;
    async_writer_t writer(sink);

    EXPECT_CALL(sink, async_write(_, 1u, _))
        .WillOnce(WithArg<2>(Invoke([](const sink_t::handler_type& handler) {
            handler(boost::asio::error::connection_reset);
        })));

    writer.write_nil();

    std::exception_ptr result;
    writer.flush([&](const std::exception_ptr& err) {
        result = err;
    });

    EXPECT_THROW(std::rethrow_exception(result), boost::system::system_error);
    EXPECT_FALSE(writer.lent());
}

TEST(async_writer_t, CancellationAbortsFlush) {
    mock::sink_t sink;
    cancellation_t cancellation;
    async_writer_t writer(sink, 64 * 1024, cancellation);

    sink_t::handler_type pending;
    EXPECT_CALL(sink, async_write(_, _, _))
        .WillOnce(SaveArg<2>(&pending));
    EXPECT_CALL(sink, cancel())
        .WillOnce(Invoke([&]() {
            pending(boost::asio::error::operation_aborted);
        }));

    writer.write_nil();

    std::exception_ptr result;
    writer.flush([&](const std::exception_ptr& err) {
        result = err;
    });

    EXPECT_FALSE(result);
    cancellation.cancel();

    EXPECT_THROW(std::rethrow_exception(result), cancelled_error);
}

TEST(async_writer_t, FlushAfterCancellationFailsImmediately) {
    loop_t loop;
    memory_sink_t sink(loop);
    cancellation_t cancellation;
    async_writer_t writer(sink, 64 * 1024, cancellation);

    writer.write_nil();
    cancellation.cancel();

    EXPECT_THROW(std::rethrow_exception(flush(loop, writer)), cancelled_error);
    EXPECT_EQ(0u, sink.writes());
}

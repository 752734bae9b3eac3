#include <string>
#include <vector>

#include <gtest/gtest.h>

#include <shapeshift/cancellation.hpp>
#include <shapeshift/serializer.hpp>
#include <shapeshift/source.hpp>

#include "util/bytes.hpp"

using namespace shapeshift;

using namespace testing;
using namespace testing::util;

TEST(cancellation_t, NotifiesSubscribersOnce) {
    cancellation_t cancellation;

    int calls = 0;
    cancellation.subscribe([&]() { ++calls; });
    cancellation.subscribe([&]() { ++calls; });

    EXPECT_FALSE(cancellation.cancelled());
    EXPECT_NO_THROW(cancellation.throw_if_cancelled());

    cancellation.cancel();
    cancellation.cancel();

    EXPECT_EQ(2, calls);
    EXPECT_TRUE(cancellation.cancelled());
    EXPECT_THROW(cancellation.throw_if_cancelled(), cancelled_error);
}

TEST(cancellation_t, CopiesShareState) {
    cancellation_t cancellation;
    cancellation_t copy = cancellation;

    copy.cancel();
    EXPECT_TRUE(cancellation.cancelled());
}

TEST(cancellation_t, UnsubscribedCallbackIsNotInvoked) {
    cancellation_t cancellation;

    bool called = false;
    const auto id = cancellation.subscribe([&]() { called = true; });
    EXPECT_NE(0u, id);

    cancellation.unsubscribe(id);
    cancellation.cancel();

    EXPECT_FALSE(called);
}

TEST(cancellation_t, SubscribingAfterCancelInvokesImmediately) {
    cancellation_t cancellation;
    cancellation.cancel();

    bool called = false;
    EXPECT_EQ(0u, cancellation.subscribe([&]() { called = true; }));
    EXPECT_TRUE(called);
}

TEST(cancellation_t, CancelledErrorCode) {
    const cancelled_error err;
    EXPECT_EQ(std::make_error_code(std::errc::operation_canceled), err.code());
}

TEST(cancellation_t, AbortsPendingDeserialization) {
    // ===== Set Up Stage =====
    // The source delivers the array header and a single element, then stalls. The cancellation
    // must abort the pending fetch and fail the whole operation.
    loop_t loop;
    memory_source_t source(loop);
    source.push(bytes({ 0x93, 0x01 }));

    serializer_t serializer;
    cancellation_t cancellation;

    bool called = false;
    std::exception_ptr result;
    serializer.async_deserialize<std::vector<int>>(source,
        [&](const std::exception_ptr& err, std::vector<int>) {
            called = true;
            result = err;
        },
        cancellation
    );

    loop.poll();
    loop.reset();
    EXPECT_FALSE(called);

    cancellation.cancel();
    loop.run();

    EXPECT_TRUE(called);

    try {
        std::rethrow_exception(result);
        FAIL() << "serialization_error expected";
    } catch (const serialization_error& err) {
        EXPECT_EQ(std::make_error_code(std::errc::operation_canceled), err.code());
        EXPECT_THROW(err.rethrow_cause(), cancelled_error);
    }
}

TEST(cancellation_t, CancelledBeforeStartFailsImmediately) {
    loop_t loop;
    memory_source_t source(loop, { bytes({ 0x91, 0x01 }) });

    serializer_t serializer;
    cancellation_t cancellation;
    cancellation.cancel();

    std::exception_ptr result;
    serializer.async_deserialize<std::vector<int>>(source,
        [&](const std::exception_ptr& err, std::vector<int>) {
            result = err;
        },
        cancellation
    );

    loop.run();

    ASSERT_TRUE(result != nullptr);
    EXPECT_THROW(std::rethrow_exception(result), serialization_error);
}

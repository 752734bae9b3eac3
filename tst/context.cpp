#include <string>
#include <vector>

#include <gtest/gtest.h>

#include <shapeshift/buffer.hpp>
#include <shapeshift/context.hpp>
#include <shapeshift/converter_cache.hpp>
#include <shapeshift/reader.hpp>
#include <shapeshift/writer.hpp>

#include "util/bytes.hpp"

using namespace shapeshift;

using namespace testing;
using namespace testing::util;

namespace {

options_t
with_max_depth(int depth) {
    options_t options;
    options.max_depth = depth;
    return options;
}

/// Encodes `levels` arrays nested into each other, the innermost one holding a single zero.
std::string
nested(int levels) {
    output_buffer_t buffer;
    writer_t writer(buffer);

    for (int i = 0; i < levels; ++i) {
        writer.write_array_header(1);
    }

    writer.write(0);
    return buffer.to_string();
}

} // namespace

TEST(context_t, DefaultOptions) {
    context_t context;

    EXPECT_EQ(0, context.depth());
    EXPECT_EQ(64, context.max_depth());
    EXPECT_EQ(object_layout::map, context.layout());
    EXPECT_TRUE(context.interner() == nullptr);
    EXPECT_EQ(&converter_cache_t::instance(), &context.cache());
}

TEST(context_t, DepthStepUpToLimit) {
    context_t context(with_max_depth(2));

    context.depth_step();
    context.depth_step();
    EXPECT_EQ(2, context.depth());

    try {
        context.depth_step();
        FAIL() << "depth_exceeded_error expected";
    } catch (const depth_exceeded_error& err) {
        EXPECT_EQ(2, err.max_depth());
        EXPECT_EQ(error::depth_exceeded, err.code().value());
        EXPECT_TRUE(err.code().category() == error::security_category());
    }

    EXPECT_EQ(2, context.depth());
}

TEST(context_t, DepthScopeRestoresOnUnwind) {
    context_t context(with_max_depth(1));

    {
        context_t::depth_scope_t scope(context);
        EXPECT_EQ(1, context.depth());

        EXPECT_THROW(context_t::depth_scope_t inner(context), depth_exceeded_error);
        EXPECT_EQ(1, context.depth());
    }

    EXPECT_EQ(0, context.depth());
}

TEST(context_t, DepthStepObservesCancellation) {
    cancellation_t cancellation;
    converter_cache_t cache;
    context_t context(options_t(), cache, nullptr, cancellation);

    context.depth_step();
    cancellation.cancel();

    EXPECT_THROW(context.depth_step(), cancelled_error);
}

TEST(context_t, NestingExactlyAtLimitIsAccepted) {
    const std::string data = nested(5);
    const sequence_t sequence(data);

    context_t context(with_max_depth(5));
    reader_t reader(sequence);

    EXPECT_NO_THROW(reader.skip(context));
    EXPECT_TRUE(reader.end());

    reader_t typed(sequence);
    const auto value = context.converter_for<std::vector<std::vector<std::vector<std::vector<std::vector<int>>>>>>()
        ->read(typed, context);

    EXPECT_EQ(0, value.at(0).at(0).at(0).at(0).at(0));
    EXPECT_EQ(0, context.depth());
}

TEST(context_t, NestingBeyondLimitIsRejected) {
    const std::string data = nested(6);
    const sequence_t sequence(data);

    context_t context(with_max_depth(5));
    reader_t reader(sequence);

    EXPECT_THROW(reader.skip(context), depth_exceeded_error);
    EXPECT_EQ(0u, reader.position());

    reader_t typed(sequence);
    EXPECT_THROW(
        (context.converter_for<std::vector<std::vector<std::vector<std::vector<std::vector<std::vector<int>>>>>>>()
            ->read(typed, context)),
        depth_exceeded_error
    );

    EXPECT_EQ(0, context.depth());
}

TEST(context_t, NestingIsCountedOnWriteToo) {
    std::vector<std::vector<int>> value(1, std::vector<int>(1, 7));

    output_buffer_t buffer;
    writer_t writer(buffer);

    context_t shallow(with_max_depth(1));
    EXPECT_THROW(shallow.converter_for<std::vector<std::vector<int>>>()->write(writer, value, shallow),
        depth_exceeded_error);

    buffer.clear();

    context_t deep(with_max_depth(2));
    EXPECT_NO_THROW(deep.converter_for<std::vector<std::vector<int>>>()->write(writer, value, deep));
    EXPECT_EQ("919107", hex(buffer.to_string()));
}

TEST(converter_cache_t, CachesConverters) {
    converter_cache_t cache;

    EXPECT_FALSE(cache.contains<std::vector<int>>());

    const auto first = cache.get<std::vector<int>>();
    const auto second = cache.get<std::vector<int>>();

    EXPECT_EQ(first.get(), second.get());
    EXPECT_TRUE(cache.contains<std::vector<int>>());
}

TEST(converter_cache_t, ThrowsForUnknownType) {
    struct unknown_t {};

    converter_cache_t cache;
    EXPECT_THROW(cache.get<unknown_t>(), converter_not_found_error);
}

#pragma once

#include <gmock/gmock.h>

#include <shapeshift/sink.hpp>
#include <shapeshift/source.hpp>

namespace testing {

namespace mock {

class source_t : public shapeshift::source_t {
public:
    MOCK_METHOD3(async_read_some, void(char*, std::size_t, handler_type));
    MOCK_METHOD0(cancel, void());
};

class sink_t : public shapeshift::sink_t {
public:
    MOCK_METHOD3(async_write, void(const char*, std::size_t, handler_type));
    MOCK_METHOD0(cancel, void());
};

} // namespace mock

} // namespace testing

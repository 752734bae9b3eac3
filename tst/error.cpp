#include <exception>
#include <string>
#include <system_error>

#include <gtest/gtest.h>

#include <shapeshift/error.hpp>

using namespace shapeshift;

using namespace testing;

TEST(error_t, CarriesCodeOfItsCategory) {
    try {
        throw overflow_error(3, "int8_t");
    } catch (const shapeshift::error_t& err) {
        EXPECT_EQ(error::integer_overflow, err.code().value());
        EXPECT_TRUE(err.code().category() == error::protocol_category());
        EXPECT_NE(std::string::npos, std::string(err.what()).find("int8_t"));
    }

    try {
        throw depth_exceeded_error(4);
    } catch (const shapeshift::error_t& err) {
        EXPECT_TRUE(err.code().category() == error::security_category());
    }
}

TEST(error_t, CancellationUsesGenericCode) {
    const cancelled_error err;
    EXPECT_TRUE(err.code() == std::make_error_code(std::errc::operation_canceled));
}

TEST(error_t, CategoriesHaveDistinctNames) {
    EXPECT_STREQ("shapeshift protocol", error::protocol_category().name());
    EXPECT_STREQ("shapeshift security", error::security_category().name());
    EXPECT_STREQ("shapeshift usage", error::usage_category().name());
}

TEST(serialization_error, ExposesCauseCode) {
    const serialization_error err(std::make_exception_ptr(loan_violation_error("returned twice")));

    EXPECT_EQ(error::loan_violation, err.code().value());
    EXPECT_TRUE(err.code().category() == error::usage_category());
    EXPECT_THROW(err.rethrow_cause(), loan_violation_error);
}

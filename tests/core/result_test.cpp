#include "dsync/core/result.hpp"

#include <gtest/gtest.h>

#include <string>

using dsync::Err;
using dsync::Ok;
using dsync::Result;

namespace {

Result<int> parse_positive(int value) {
    if (value <= 0) {
        return Err("value must be positive");
    }
    return Ok(value);
}

struct CodeError {
    int code;
};

} // namespace

TEST(ResultTest, HoldsValueOrError) {
    auto ok = parse_positive(7);
    ASSERT_TRUE(ok.is_ok());
    EXPECT_FALSE(ok.is_error());
    EXPECT_EQ(ok.value(), 7);

    auto bad = parse_positive(-1);
    ASSERT_TRUE(bad.is_error());
    EXPECT_EQ(bad.error(), "value must be positive");
    EXPECT_EQ(bad.value_or(42), 42);
}

TEST(ResultTest, SameValueAndErrorTypeStayDistinct) {
    Result<std::string, std::string> ok = Ok(std::string("payload"));
    Result<std::string, std::string> bad = Err(std::string("failure"));

    EXPECT_TRUE(ok.is_ok());
    EXPECT_EQ(ok.value(), "payload");
    EXPECT_TRUE(bad.is_error());
    EXPECT_EQ(bad.error(), "failure");
}

TEST(ResultTest, VoidResultWithCustomError) {
    Result<void, CodeError> ok = Ok();
    Result<void, CodeError> bad = Err(CodeError{404});

    EXPECT_TRUE(ok.is_ok());
    ASSERT_TRUE(bad.is_error());
    EXPECT_EQ(bad.error().code, 404);
}

#include <gtest/gtest.h>

#include <colmeta/core/types.h>

#include <stdexcept>
#include <string>
#include <vector>

using namespace colmeta;

TEST(ResultTest, HoldsValue) {
    Result<int> r(42);
    ASSERT_TRUE(r);
    EXPECT_TRUE(r.has_value());
    EXPECT_EQ(r.value(), 42);
    EXPECT_THROW((void)r.error(), std::runtime_error);
}

TEST(ResultTest, HoldsErrorWithMessage) {
    Result<std::string> r(Error{ErrorCode::NotFound, "collection 'a' missing"});
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::NotFound);
    EXPECT_EQ(r.error().message, "collection 'a' missing");
    EXPECT_THROW((void)r.value(), std::runtime_error);
}

TEST(ResultTest, ErrorCodeGetsDefaultMessage) {
    Result<bool> r(ErrorCode::Timeout);
    ASSERT_FALSE(r);
    EXPECT_TRUE(r.error() == ErrorCode::Timeout);
    EXPECT_EQ(r.error().message, errorToString(ErrorCode::Timeout));
}

TEST(ResultTest, BoolPayloadIsNotConfusedWithError) {
    Result<bool> no(false);
    ASSERT_TRUE(no.has_value());
    EXPECT_FALSE(no.value());
}

TEST(ResultTest, MoveOutValue) {
    Result<std::vector<std::string>> r(std::vector<std::string>{"a", "b"});
    auto v = std::move(r).value();
    ASSERT_EQ(v.size(), 2u);
    EXPECT_EQ(v[1], "b");
}

TEST(ResultTest, VoidSpecialisation) {
    Result<void> ok;
    EXPECT_TRUE(ok);
    EXPECT_NO_THROW(ok.value());

    Result<void> failed(Error{ErrorCode::InternalError, "disk"});
    EXPECT_FALSE(failed);
    EXPECT_EQ(failed.error().message, "disk");
    EXPECT_THROW(failed.value(), std::runtime_error);
}

TEST(ErrorCodeFormat, FormatsAsDescription) {
    EXPECT_EQ(fmt::format("{}", ErrorCode::NotFound), "Not found");
    EXPECT_EQ(fmt::format("code={}", ErrorCode::Timeout), "code=Operation timed out");
}

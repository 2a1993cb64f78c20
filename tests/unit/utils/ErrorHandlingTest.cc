#include "stride/utils/ErrorHandling.hh"
#include "gtest/gtest.h"
#include <string>
#include <vector>

class ErrorHandlingTest : public ::testing::Test {};

TEST_F(ErrorHandlingTest, StrideExceptionCarriesMessage) {
  stride::StrideException exception("Test error message");
  ASSERT_STREQ("Test error message", exception.what());
}

TEST_F(ErrorHandlingTest, ThrowErrorThrowsStrideException) {
  try {
    stride::throwError("bad zone descriptor");
    FAIL() << "Expected StrideException";
  } catch (const stride::StrideException &e) {
    ASSERT_STREQ("bad zone descriptor", e.what());
  }
}

TEST_F(ErrorHandlingTest, ErrorCodeToString) {
  EXPECT_EQ(stride::errorCodeToString(stride::ErrorCode::Ok), "Ok");
  EXPECT_EQ(stride::errorCodeToString(stride::ErrorCode::InvalidArgument), "InvalidArgument");
  EXPECT_EQ(stride::errorCodeToString(stride::ErrorCode::NotFound), "NotFound");
  EXPECT_EQ(stride::errorCodeToString(stride::ErrorCode::TypeMismatch), "TypeMismatch");
  EXPECT_EQ(stride::errorCodeToString(stride::ErrorCode::Internal), "Internal");
}

TEST_F(ErrorHandlingTest, ResultOkValue) {
  auto r = stride::Result<int>::ok(42);
  EXPECT_TRUE(r.isOk());
  EXPECT_FALSE(r.isError());
  EXPECT_EQ(r.code(), stride::ErrorCode::Ok);
  EXPECT_EQ(r.value(), 42);
}

TEST_F(ErrorHandlingTest, ResultErrorValue) {
  auto r = stride::Result<int>::error(stride::ErrorCode::NotFound, "missing");
  EXPECT_FALSE(r.isOk());
  EXPECT_TRUE(r.isError());
  EXPECT_EQ(r.code(), stride::ErrorCode::NotFound);
  EXPECT_EQ(r.message(), "missing");
}

TEST_F(ErrorHandlingTest, ResultValueThrowsOnError) {
  auto r = stride::Result<int>::error(stride::ErrorCode::Internal, "broken");
  EXPECT_THROW(r.value(), stride::StrideException);
}

TEST_F(ErrorHandlingTest, ResultValueOr) {
  auto ok = stride::Result<float>::ok(10.0f);
  EXPECT_FLOAT_EQ(ok.valueOr(99.0f), 10.0f);

  auto err = stride::Result<float>::error(stride::ErrorCode::TypeMismatch);
  EXPECT_FLOAT_EQ(err.valueOr(99.0f), 99.0f);
}

TEST_F(ErrorHandlingTest, ResultMoveOnly) {
  auto r = stride::Result<std::vector<int>>::ok({1, 2, 3});
  auto moved = std::move(r);
  EXPECT_TRUE(moved.isOk());
  EXPECT_EQ(moved.value().size(), 3u);
}

TEST_F(ErrorHandlingTest, ResultVoid) {
  auto ok = stride::Result<void>::ok();
  EXPECT_TRUE(ok.isOk());
  EXPECT_EQ(ok.code(), stride::ErrorCode::Ok);

  auto err = stride::Result<void>::error(stride::ErrorCode::InvalidState, "not initialized");
  EXPECT_TRUE(err.isError());
  EXPECT_EQ(err.code(), stride::ErrorCode::InvalidState);
  EXPECT_EQ(err.message(), "not initialized");
}

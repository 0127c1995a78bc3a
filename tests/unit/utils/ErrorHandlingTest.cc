#include "fleet/utils/ErrorHandling.hh"
#include "gtest/gtest.h"
#include <stdexcept>
#include <string>
#include <vector>

// Test fixture for ErrorHandling tests
class ErrorHandlingTest : public ::testing::Test {};

// Test FleetException construction
TEST_F(ErrorHandlingTest, TestFleetExceptionConstruction) {
  fleet::FleetException exception("Test error message");
  ASSERT_STREQ("Test error message", exception.what());
}

// Test throwError function
TEST_F(ErrorHandlingTest, TestThrowError) {
  try {
    fleet::throwError("Test error message");
    FAIL() << "Expected FleetException";
  } catch (const fleet::FleetException &e) {
    ASSERT_STREQ("Test error message", e.what());
  }
}

// Structural exceptions share the base so callers can catch them together
TEST_F(ErrorHandlingTest, StructuralExceptionsDeriveFromBase) {
  EXPECT_THROW(throw fleet::HandlerIncompatibleException("bucket"), fleet::FleetException);
  EXPECT_THROW(throw fleet::HandlerResolutionException("class"), fleet::FleetException);
  EXPECT_THROW(throw fleet::DispatchLimitException("limit"), fleet::FleetException);
  EXPECT_THROW(throw fleet::HandlerError("domain"), std::exception);
}

// ErrorCode tests

TEST_F(ErrorHandlingTest, ErrorCodeToString) {
  EXPECT_EQ(fleet::errorCodeToString(fleet::ErrorCode::Ok), "Ok");
  EXPECT_EQ(fleet::errorCodeToString(fleet::ErrorCode::InvalidArgument), "InvalidArgument");
  EXPECT_EQ(fleet::errorCodeToString(fleet::ErrorCode::NotFound), "NotFound");
  EXPECT_EQ(fleet::errorCodeToString(fleet::ErrorCode::ParseError), "ParseError");
  EXPECT_EQ(fleet::errorCodeToString(fleet::ErrorCode::LimitExceeded), "LimitExceeded");
  EXPECT_EQ(fleet::errorCodeToString(fleet::ErrorCode::Internal), "Internal");
}

// Result<T> tests

TEST_F(ErrorHandlingTest, ResultOkValue) {
  auto r = fleet::Result<int>::ok(42);
  EXPECT_TRUE(r.isOk());
  EXPECT_FALSE(r.isError());
  EXPECT_EQ(r.code(), fleet::ErrorCode::Ok);
  EXPECT_EQ(r.value(), 42);
}

TEST_F(ErrorHandlingTest, ResultErrorValue) {
  auto r = fleet::Result<int>::error(fleet::ErrorCode::NotFound, "missing");
  EXPECT_FALSE(r.isOk());
  EXPECT_TRUE(r.isError());
  EXPECT_EQ(r.code(), fleet::ErrorCode::NotFound);
  EXPECT_EQ(r.message(), "missing");
}

TEST_F(ErrorHandlingTest, ResultValueThrowsOnError) {
  auto r = fleet::Result<int>::error(fleet::ErrorCode::Internal, "broken");
  EXPECT_THROW(r.value(), fleet::FleetException);
}

TEST_F(ErrorHandlingTest, ResultValueOr) {
  auto ok = fleet::Result<int>::ok(10);
  EXPECT_EQ(ok.valueOr(99), 10);

  auto err = fleet::Result<int>::error(fleet::ErrorCode::LimitExceeded);
  EXPECT_EQ(err.valueOr(99), 99);
}

TEST_F(ErrorHandlingTest, ResultMoveOnly) {
  auto r = fleet::Result<std::vector<int>>::ok({1, 2, 3});
  auto moved = std::move(r);
  EXPECT_TRUE(moved.isOk());
  EXPECT_EQ(moved.value().size(), 3u);
}

// Result<void> tests

TEST_F(ErrorHandlingTest, ResultVoidOk) {
  auto r = fleet::Result<void>::ok();
  EXPECT_TRUE(r.isOk());
  EXPECT_FALSE(r.isError());
  EXPECT_EQ(r.code(), fleet::ErrorCode::Ok);
}

TEST_F(ErrorHandlingTest, ResultVoidError) {
  auto r = fleet::Result<void>::error(fleet::ErrorCode::InvalidArgument, "nope");
  EXPECT_TRUE(r.isError());
  EXPECT_EQ(r.code(), fleet::ErrorCode::InvalidArgument);
  EXPECT_EQ(r.message(), "nope");
}

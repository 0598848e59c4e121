/**
 * @file test_error.cpp
 * @brief Unit tests for error codes and Result
 */

#include <gtest/gtest.h>
#include <pasteboard/pasteboard.h>

using namespace pasteboard;

namespace {

Result<int> parse_positive(int value) {
  PASTEBOARD_REQUIRE(value > 0, ErrorCode::InvalidArgument, "not positive");
  return value;
}

Result<void> chain(int value) {
  PASTEBOARD_TRY(parse_positive(value));
  return Result<void>::ok();
}

} // namespace

// ============================================================================
// Server Error
// ============================================================================

TEST(ErrorTest, ServerNoData) {
  Error err = Error::server_no_data();

  EXPECT_EQ(err.code, ErrorCode::ServerNoData);
  EXPECT_EQ(err.numeric_code(), 666);
  EXPECT_EQ(err.domain, "org.pasteboard.server");
  EXPECT_EQ(err.message, "Pasteboard server returned no data.");
  EXPECT_TRUE(err.is_error());
}

TEST(ErrorTest, ToStringIncludesDomainAndCode) {
  Error err = Error::server_no_data();
  err.location = "Pasteboard::get_file_urls";

  EXPECT_EQ(err.to_string(),
            "org.pasteboard.server ServerNoData (666): Pasteboard server "
            "returned no data. [Pasteboard::get_file_urls]");
}

TEST(ErrorTest, ToStringWithoutDomain) {
  Error err(ErrorCode::Timeout, "no reply", "ReadObjects");
  EXPECT_EQ(err.to_string(), "Timeout (7): no reply (ReadObjects)");
}

// ============================================================================
// Error Code Helpers
// ============================================================================

TEST(ErrorTest, CodeNames) {
  EXPECT_STREQ(error_code_name(ErrorCode::Success), "Success");
  EXPECT_STREQ(error_code_name(ErrorCode::ServiceUnavailable),
               "ServiceUnavailable");
  EXPECT_STREQ(error_code_name(ErrorCode::MalformedReply), "MalformedReply");
  EXPECT_STREQ(error_code_name(static_cast<ErrorCode>(9999)), "UnknownError");
}

TEST(ErrorTest, CodeDescriptions) {
  EXPECT_STREQ(error_code_description(ErrorCode::ServerNoData),
               "Pasteboard server returned no data");
  EXPECT_STREQ(error_code_description(static_cast<ErrorCode>(9999)),
               "Unknown error occurred");
}

TEST(ErrorTest, Recoverability) {
  EXPECT_TRUE(is_recoverable(ErrorCode::Timeout));
  EXPECT_TRUE(is_recoverable(ErrorCode::ServiceUnavailable));

  EXPECT_FALSE(is_recoverable(ErrorCode::ServerNoData));
  EXPECT_FALSE(is_recoverable(ErrorCode::NotSupported));
  EXPECT_FALSE(is_recoverable(ErrorCode::InvalidArgument));
  EXPECT_FALSE(is_recoverable(ErrorCode::PermissionDenied));
}

// ============================================================================
// Result
// ============================================================================

TEST(ResultTest, ValueAndError) {
  Result<int> ok = 5;
  EXPECT_TRUE(ok.is_ok());
  EXPECT_EQ(ok.value(), 5);
  EXPECT_EQ(ok.value_or(0), 5);

  Result<int> failed = Error(ErrorCode::InvalidState, "bad");
  EXPECT_TRUE(failed.is_error());
  EXPECT_EQ(failed.value_or(-1), -1);
  EXPECT_FALSE(failed.to_optional().has_value());
}

TEST(ResultTest, MacrosPropagate) {
  EXPECT_TRUE(chain(3).is_ok());

  auto result = chain(0);
  ASSERT_TRUE(result.is_error());
  EXPECT_EQ(result.error().code, ErrorCode::InvalidArgument);
  EXPECT_EQ(result.error().message, "not positive");
}

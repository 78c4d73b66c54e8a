/**
 * @file test_core_types.cpp
 * @brief Unit tests for core types (error codes, result, chunk_types)
 */

#include <gtest/gtest.h>

#include <kcenon/parallel_fetch/core/chunk_types.h>
#include <kcenon/parallel_fetch/core/types.h>

#include <string>

namespace kcenon::parallel_fetch::test {

// =============================================================================
// error_code Tests
// =============================================================================

class ErrorCodeTest : public ::testing::Test {};

TEST_F(ErrorCodeTest, ErrorCodeRanges) {
    // Usage errors: -800 to -809
    EXPECT_EQ(static_cast<int>(error_code::invalid_parallelism), -800);
    EXPECT_EQ(static_cast<int>(error_code::invalid_configuration), -803);

    // Probe errors: -810 to -819
    EXPECT_EQ(static_cast<int>(error_code::probe_failed), -810);
    EXPECT_EQ(static_cast<int>(error_code::range_unsupported), -811);

    // Fetch errors: -820 to -839
    EXPECT_EQ(static_cast<int>(error_code::connection_failed), -820);
    EXPECT_EQ(static_cast<int>(error_code::retries_exhausted), -828);

    // Consistency errors: -840 to -849
    EXPECT_EQ(static_cast<int>(error_code::validator_mismatch), -840);
    EXPECT_EQ(static_cast<int>(error_code::incomplete_coverage), -843);

    // File I/O errors: -850 to -859
    EXPECT_EQ(static_cast<int>(error_code::file_create_error), -850);
    EXPECT_EQ(static_cast<int>(error_code::file_rename_error), -853);

    // Internal errors: -890 to -899
    EXPECT_EQ(static_cast<int>(error_code::internal_error), -890);
    EXPECT_EQ(static_cast<int>(error_code::transport_unavailable), -891);
}

TEST_F(ErrorCodeTest, ToString) {
    EXPECT_STREQ(to_string(error_code::success), "success");
    EXPECT_STREQ(to_string(error_code::range_unsupported),
                 "server does not support range requests");
    EXPECT_STREQ(to_string(error_code::validator_mismatch), "validator mismatch");
    EXPECT_STREQ(to_string(static_cast<error_code>(-999)), "unknown error");
}

TEST_F(ErrorCodeTest, ErrorDefaultsToCodeDescription) {
    error e(error_code::retries_exhausted);
    EXPECT_TRUE(static_cast<bool>(e));
    EXPECT_EQ(e.message, "retries exhausted");

    error none;
    EXPECT_FALSE(static_cast<bool>(none));
}

// =============================================================================
// result Tests
// =============================================================================

class ResultTest : public ::testing::Test {};

TEST_F(ResultTest, HoldsValue) {
    result<int> r = 42;
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r.value(), 42);
}

TEST_F(ResultTest, HoldsError) {
    result<int> r = unexpected(error{error_code::file_write_error, "disk full"});
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, error_code::file_write_error);
    EXPECT_EQ(r.error().message, "disk full");
}

TEST_F(ResultTest, VoidResult) {
    result<void> ok;
    EXPECT_TRUE(ok.has_value());

    result<void> failed = unexpected(error{error_code::internal_error});
    EXPECT_FALSE(failed);
    EXPECT_EQ(failed.error().code, error_code::internal_error);
}

TEST_F(ResultTest, MoveOutValue) {
    result<std::string> r = std::string("payload");
    auto moved = std::move(r).value();
    EXPECT_EQ(moved, "payload");
}

// =============================================================================
// chunk_range Tests
// =============================================================================

class ChunkRangeTest : public ::testing::Test {};

TEST_F(ChunkRangeTest, LengthIsInclusive) {
    chunk_range r(0, 0, 249);
    EXPECT_EQ(r.length(), 250);

    chunk_range single(1, 7, 7);
    EXPECT_EQ(single.length(), 1);
}

TEST_F(ChunkRangeTest, RangeHeader) {
    EXPECT_EQ(chunk_range(0, 0, 249).to_header(), "bytes=0-249");
    EXPECT_EQ(chunk_range(3, 750, 999).to_header(), "bytes=750-999");
}

TEST_F(ChunkRangeTest, EmptyRange) {
    auto r = chunk_range::make_empty();
    EXPECT_TRUE(r.empty);
    EXPECT_EQ(r.length(), 0);
    EXPECT_NE(r, chunk_range(0, 0, 0));
}

// =============================================================================
// content_validator Tests
// =============================================================================

class ContentValidatorTest : public ::testing::Test {};

TEST_F(ContentValidatorTest, EqualityRequiresKindAndValue) {
    auto a = content_validator::etag("abc123");
    auto b = content_validator::etag("abc123");
    auto c = content_validator::etag("abc124");
    auto d = content_validator::last_modified("abc123");

    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
    EXPECT_NE(a, d);
}

TEST_F(ContentValidatorTest, ToString) {
    EXPECT_EQ(content_validator::etag("abc").to_string(), "ETag(abc)");
    EXPECT_EQ(content_validator::last_modified("Wed, 21 Oct 2015 07:28:00 GMT").to_string(),
              "Last-Modified(Wed, 21 Oct 2015 07:28:00 GMT)");
}

}  // namespace kcenon::parallel_fetch::test

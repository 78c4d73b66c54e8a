/**
 * @file test_error_scenarios.cpp
 * @brief Integration tests for failed downloads
 *
 * A failed download never leaves a file at the output path and maps to
 * exactly one exit code.
 */

#include "test_fixtures.h"

#include <algorithm>
#include <string>

namespace kcenon::parallel_fetch::test {

class ErrorScenarioTest : public DownloadFixture {};

// =============================================================================
// Fetch Failure Tests
// =============================================================================

TEST_F(ErrorScenarioTest, ExhaustedRangeFailsDownload) {
    serve(999);
    server_->set_etag("abc123");
    server_->fail_range_with_status(333, 503, 100);

    auto orchestrator = make_builder(3).with_cancel_on_failure(false).build();
    ASSERT_TRUE(orchestrator.has_value());
    auto outcome = orchestrator.value().download(url, download_dir_.string());

    ASSERT_FALSE(outcome.is_success());
    EXPECT_EQ(outcome.kind, failure_kind::partial_fetch_failure);
    EXPECT_EQ(outcome.to_exit_code(), exit_code::network_error);
    EXPECT_TRUE(outcome.partial_cleanup_done);

    ASSERT_EQ(outcome.failed_ranges.size(), 1u);
    EXPECT_EQ(outcome.failed_ranges[0].range, chunk_range(1, 333, 665));
    EXPECT_EQ(outcome.failed_ranges[0].cause.code, error_code::retries_exhausted);
    EXPECT_EQ(outcome.cause.code, error_code::retries_exhausted);
    EXPECT_NE(outcome.message.find("1 of 3 ranges failed"), std::string::npos);

    // One attempt plus three retries
    EXPECT_EQ(server_->requests_for_range(333), 4u);
    EXPECT_EQ(server_->requests_for_range(0), 1u);
    EXPECT_EQ(server_->requests_for_range(666), 1u);

    EXPECT_FALSE(std::filesystem::exists(output_path()));
    EXPECT_EQ(download_dir_entries(), 0u);
}

TEST_F(ErrorScenarioTest, FailureCancelsPendingRetries) {
    serve(1000);
    server_->fail_range_with_status(0, 404, 1);
    server_->fail_range_with_status(500, 503, 100);

    auto orchestrator = make_builder(4).build();
    ASSERT_TRUE(orchestrator.has_value());
    auto outcome = orchestrator.value().download(url, download_dir_.string());

    ASSERT_FALSE(outcome.is_success());
    EXPECT_EQ(outcome.kind, failure_kind::partial_fetch_failure);
    EXPECT_NE(outcome.cause.code, error_code::transfer_cancelled);

    auto first = std::find_if(outcome.failed_ranges.begin(), outcome.failed_ranges.end(),
                              [](const chunk_failure& f) { return f.range.index == 0; });
    ASSERT_NE(first, outcome.failed_ranges.end());
    EXPECT_EQ(first->cause.code, error_code::client_error);

    for (const auto& failure : outcome.failed_ranges) {
        EXPECT_TRUE(failure.cause.code == error_code::client_error ||
                    failure.cause.code == error_code::retries_exhausted ||
                    failure.cause.code == error_code::transfer_cancelled)
            << to_string(failure.cause.code);
    }
    EXPECT_LE(server_->requests_for_range(500), 4u);
    EXPECT_FALSE(std::filesystem::exists(output_path()));
}

TEST_F(ErrorScenarioTest, ClientErrorIsNotRetried) {
    serve(1000);
    server_->fail_range_with_status(250, 403, 100);

    auto outcome = run(4);
    ASSERT_FALSE(outcome.is_success());
    EXPECT_EQ(outcome.kind, failure_kind::partial_fetch_failure);
    EXPECT_EQ(outcome.cause.code, error_code::client_error);
    EXPECT_EQ(server_->requests_for_range(250), 1u);
    EXPECT_FALSE(std::filesystem::exists(output_path()));
}

TEST_F(ErrorScenarioTest, TruncatedRangeIsFatal) {
    serve(1000);
    server_->truncate_range(750);

    auto outcome = run(4);
    ASSERT_FALSE(outcome.is_success());
    EXPECT_EQ(outcome.cause.code, error_code::malformed_response);
    EXPECT_EQ(server_->requests_for_range(750), 1u);
    EXPECT_EQ(download_dir_entries(), 0u);
}

TEST_F(ErrorScenarioTest, RangeIgnoredDuringFetch) {
    serve(1000);
    server_->set_ignore_ranges(true);

    auto outcome = run(4);
    ASSERT_FALSE(outcome.is_success());
    EXPECT_EQ(outcome.kind, failure_kind::partial_fetch_failure);
    EXPECT_EQ(outcome.cause.code, error_code::range_not_honored);
    EXPECT_FALSE(std::filesystem::exists(output_path()));
}

// =============================================================================
// Consistency Failure Tests
// =============================================================================

TEST_F(ErrorScenarioTest, ValidatorMismatchFailsDownload) {
    serve(1000);
    server_->set_etag("abc123");
    server_->set_range_etag(750, "def456");

    auto outcome = run(4);
    ASSERT_FALSE(outcome.is_success());
    EXPECT_EQ(outcome.kind, failure_kind::validator_mismatch);
    EXPECT_EQ(outcome.to_exit_code(), exit_code::validator_mismatch);
    EXPECT_NE(outcome.message.find("range 3"), std::string::npos);
    EXPECT_FALSE(std::filesystem::exists(output_path()));
    EXPECT_EQ(download_dir_entries(), 0u);
}

TEST_F(ErrorScenarioTest, ValidatorMismatchKeepsPreviousFile) {
    serve(1000);
    server_->set_etag("abc123");
    server_->set_range_etag(0, "def456");
    std::ofstream(output_path(), std::ios::binary) << "previous";

    auto outcome = run(4);
    ASSERT_FALSE(outcome.is_success());
    EXPECT_EQ(outcome.kind, failure_kind::validator_mismatch);

    auto kept = read_file(output_path());
    EXPECT_EQ(std::string(kept.begin(), kept.end()), "previous");
    EXPECT_EQ(download_dir_entries(), 1u);
}

TEST_F(ErrorScenarioTest, ChecksumMismatchRemovesFile) {
    serve(1000);
    server_->set_etag("abc123");

    auto orchestrator = make_builder(4).with_check_etag(true).build();
    ASSERT_TRUE(orchestrator.has_value());
    auto outcome = orchestrator.value().download(url, download_dir_.string());

    ASSERT_FALSE(outcome.is_success());
    EXPECT_EQ(outcome.kind, failure_kind::checksum_mismatch);
    EXPECT_EQ(outcome.to_exit_code(), exit_code::checksum_mismatch);
    EXPECT_TRUE(outcome.partial_cleanup_done);
    EXPECT_FALSE(std::filesystem::exists(output_path()));
}

TEST_F(ErrorScenarioTest, CheckEtagWithoutEtag) {
    serve(1000);
    server_->set_last_modified("Wed, 21 Oct 2015 07:28:00 GMT");

    auto orchestrator = make_builder(4).with_check_etag(true).build();
    ASSERT_TRUE(orchestrator.has_value());
    auto outcome = orchestrator.value().download(url, download_dir_.string());

    ASSERT_FALSE(outcome.is_success());
    EXPECT_EQ(outcome.kind, failure_kind::checksum_mismatch);
    EXPECT_FALSE(std::filesystem::exists(output_path()));
}

// =============================================================================
// I/O Failure Tests
// =============================================================================

TEST_F(ErrorScenarioTest, AssemblyWriteFailure) {
    serve(1000);
    server_->set_etag("abc123");

    chunk_assembler failing([](const chunk_range& range) -> result<void> {
        if (range.index == 1) {
            return unexpected(error{error_code::file_write_error, "no space left on device"});
        }
        return {};
    });

    auto orchestrator = make_builder(4).with_assembler(failing).build();
    ASSERT_TRUE(orchestrator.has_value());
    auto outcome = orchestrator.value().download(url, download_dir_.string());

    ASSERT_FALSE(outcome.is_success());
    EXPECT_EQ(outcome.kind, failure_kind::io_error);
    EXPECT_EQ(outcome.to_exit_code(), exit_code::io_error);
    EXPECT_FALSE(std::filesystem::exists(output_path()));
    EXPECT_EQ(download_dir_entries(), 0u);
}

TEST_F(ErrorScenarioTest, MissingOutputDirectory) {
    serve(1000);

    auto orchestrator = make_builder(4).build();
    ASSERT_TRUE(orchestrator.has_value());
    auto outcome =
        orchestrator.value().download(url, (test_dir_ / "missing" / "file.bin").string());

    ASSERT_FALSE(outcome.is_success());
    EXPECT_EQ(outcome.kind, failure_kind::usage_error);
    EXPECT_EQ(outcome.to_exit_code(), exit_code::usage_error);
    EXPECT_EQ(server_->head_count(), 0u);
}

TEST_F(ErrorScenarioTest, UnwritableOutputDirectory) {
    if (!std::filesystem::is_directory("/proc")) {
        GTEST_SKIP() << "procfs not available";
    }
    serve(1000);

    auto orchestrator = make_builder(4).build();
    ASSERT_TRUE(orchestrator.has_value());
    auto outcome = orchestrator.value().download(url, "/proc/file.bin");

    ASSERT_FALSE(outcome.is_success());
    EXPECT_EQ(outcome.kind, failure_kind::usage_error);
    EXPECT_EQ(outcome.to_exit_code(), exit_code::usage_error);
    EXPECT_EQ(outcome.cause.code, error_code::invalid_output_path);
    EXPECT_EQ(server_->head_count(), 0u);
    EXPECT_EQ(server_->get_count(), 0u);
}

// =============================================================================
// Probe Failure Tests
// =============================================================================

TEST_F(ErrorScenarioTest, HeadTransportFailure) {
    serve(1000);
    server_->fail_head_with_error(error_code::connection_failed, 100);

    auto outcome = run(4);
    ASSERT_FALSE(outcome.is_success());
    EXPECT_EQ(outcome.kind, failure_kind::probe_failed);
    EXPECT_EQ(outcome.to_exit_code(), exit_code::network_error);
    EXPECT_EQ(server_->head_count(), 4u);
    EXPECT_EQ(server_->get_count(), 0u);
    EXPECT_FALSE(std::filesystem::exists(output_path()));
}

TEST_F(ErrorScenarioTest, RangesUnsupported) {
    serve(1000);
    server_->set_accept_ranges("none");

    auto outcome = run(4);
    ASSERT_FALSE(outcome.is_success());
    EXPECT_EQ(outcome.kind, failure_kind::range_unsupported);
    EXPECT_EQ(outcome.to_exit_code(), exit_code::range_unsupported);
    EXPECT_EQ(server_->get_count(), 0u);
}

TEST_F(ErrorScenarioTest, RangesSilentlyIgnoredAtProbe) {
    serve(1000);
    server_->set_accept_ranges(std::nullopt);
    server_->set_ignore_ranges(true);

    auto outcome = run(4);
    ASSERT_FALSE(outcome.is_success());
    EXPECT_EQ(outcome.kind, failure_kind::range_unsupported);
    EXPECT_EQ(server_->get_count(), 1u);
}

TEST_F(ErrorScenarioTest, ResourceNotFound) {
    serve(1000);
    server_->set_head_status(404);

    auto outcome = run(4);
    ASSERT_FALSE(outcome.is_success());
    EXPECT_EQ(outcome.kind, failure_kind::probe_failed);
    EXPECT_EQ(outcome.to_exit_code(), exit_code::network_error);
}

}  // namespace kcenon::parallel_fetch::test

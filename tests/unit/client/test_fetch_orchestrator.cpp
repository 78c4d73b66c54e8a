/**
 * @file test_fetch_orchestrator.cpp
 * @brief Unit tests for fetch_orchestrator probing, validation and states
 */

#include <gtest/gtest.h>

#include <kcenon/parallel_fetch/client/fetch_orchestrator.h>

#include "mocks/in_memory_http_transport.h"

#include <algorithm>
#include <filesystem>
#include <memory>
#include <mutex>
#include <vector>

namespace kcenon::parallel_fetch::test {

namespace {

auto make_content(std::size_t size) -> std::vector<uint8_t> {
    std::vector<uint8_t> data(size);
    for (std::size_t i = 0; i < size; ++i) {
        data[i] = static_cast<uint8_t>(i % 256);
    }
    return data;
}

auto make_chunk(uint32_t index, std::optional<content_validator> validator) -> chunk_result {
    chunk_result c;
    c.range = chunk_range(index, index * 10, index * 10 + 9);
    c.data.resize(10);
    c.validator = std::move(validator);
    return c;
}

}  // namespace

class FetchOrchestratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        server_ = std::make_shared<in_memory_http_transport>(make_content(1000));
        server_->set_etag("abc123");
    }

    auto build(uint32_t parallelism = 4) -> fetch_orchestrator {
        auto result = fetch_orchestrator::builder()
            .with_transport(server_)
            .with_parallelism(parallelism)
            .with_max_retries(2)
            .with_retry_policy(retry_policy::immediate())
            .build();
        EXPECT_TRUE(result.has_value());
        return std::move(result).value();
    }

    std::shared_ptr<in_memory_http_transport> server_;
};

// =============================================================================
// Builder Tests
// =============================================================================

TEST_F(FetchOrchestratorTest, BuilderAppliesConfiguration) {
    auto result = fetch_orchestrator::builder()
        .with_transport(server_)
        .with_parallelism(8)
        .with_max_retries(5)
        .with_check_etag(true)
        .with_cancel_on_failure(false)
        .with_user_agent("test-agent")
        .build();
    ASSERT_TRUE(result.has_value());

    const auto& config = result.value().config();
    EXPECT_EQ(config.parallelism, 8u);
    EXPECT_EQ(config.max_retries, 5u);
    EXPECT_TRUE(config.check_etag);
    EXPECT_FALSE(config.cancel_on_failure);
    EXPECT_EQ(config.user_agent.value(), "test-agent");
    EXPECT_EQ(result.value().state(), download_state::idle);
}

TEST_F(FetchOrchestratorTest, BuilderRejectsZeroParallelism) {
    auto result = fetch_orchestrator::builder()
        .with_transport(server_)
        .with_parallelism(0)
        .build();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::invalid_parallelism);
}

// =============================================================================
// Probe Tests
// =============================================================================

TEST_F(FetchOrchestratorTest, ProbeUsesHead) {
    auto orchestrator = build();
    auto target = orchestrator.probe("http://example.com/file.bin");
    ASSERT_TRUE(target.has_value()) << target.error().message;

    EXPECT_EQ(target.value().total_size, 1000u);
    ASSERT_TRUE(target.value().validator.has_value());
    EXPECT_EQ(*target.value().validator, content_validator::etag("abc123"));
    EXPECT_EQ(server_->head_count(), 1u);
    EXPECT_EQ(server_->get_count(), 0u);
}

TEST_F(FetchOrchestratorTest, ProbeAcceptRangesNone) {
    server_->set_accept_ranges("none");
    auto orchestrator = build();

    auto target = orchestrator.probe("http://example.com/file.bin");
    ASSERT_FALSE(target.has_value());
    EXPECT_EQ(target.error().code, error_code::range_unsupported);
    EXPECT_EQ(server_->get_count(), 0u);
}

TEST_F(FetchOrchestratorTest, ProbeFallsBackWhenHeadNotAllowed) {
    server_->fail_head_with_status(405, 1);
    auto orchestrator = build();

    auto target = orchestrator.probe("http://example.com/file.bin");
    ASSERT_TRUE(target.has_value()) << target.error().message;
    EXPECT_EQ(target.value().total_size, 1000u);
    EXPECT_EQ(server_->get_count(), 1u);

    auto headers = server_->range_headers();
    ASSERT_EQ(headers.size(), 1u);
    EXPECT_EQ(headers[0], "bytes=0-0");
}

TEST_F(FetchOrchestratorTest, ProbeFallsBackWithoutAcceptRanges) {
    server_->set_accept_ranges(std::nullopt);
    auto orchestrator = build();

    auto target = orchestrator.probe("http://example.com/file.bin");
    ASSERT_TRUE(target.has_value());
    EXPECT_EQ(target.value().total_size, 1000u);
    EXPECT_EQ(server_->get_count(), 1u);
}

TEST_F(FetchOrchestratorTest, ProbeFallsBackWithoutContentLength) {
    server_->set_head_content_length(false);
    auto orchestrator = build();

    auto target = orchestrator.probe("http://example.com/file.bin");
    ASSERT_TRUE(target.has_value());
    EXPECT_EQ(target.value().total_size, 1000u);
}

TEST_F(FetchOrchestratorTest, ProbeDetectsIgnoredRanges) {
    server_->set_accept_ranges(std::nullopt);
    server_->set_ignore_ranges(true);
    auto orchestrator = build();

    auto target = orchestrator.probe("http://example.com/file.bin");
    ASSERT_FALSE(target.has_value());
    EXPECT_EQ(target.error().code, error_code::range_unsupported);
}

TEST_F(FetchOrchestratorTest, ProbeEmptyResourceThroughRangedGet) {
    server_->set_content({});
    server_->set_head_content_length(false);
    auto orchestrator = build();

    auto target = orchestrator.probe("http://example.com/empty");
    ASSERT_TRUE(target.has_value()) << target.error().message;
    EXPECT_EQ(target.value().total_size, 0u);
}

TEST_F(FetchOrchestratorTest, ProbeRetriesServerErrors) {
    server_->fail_head_with_status(503, 2);
    auto orchestrator = build();

    auto target = orchestrator.probe("http://example.com/file.bin");
    ASSERT_TRUE(target.has_value());
    EXPECT_EQ(server_->head_count(), 3u);
}

TEST_F(FetchOrchestratorTest, ProbeWithMaximumRetryCount) {
    server_->fail_head_with_status(503, 1);
    auto result = fetch_orchestrator::builder()
        .with_transport(server_)
        .with_max_retries(UINT32_MAX)
        .with_retry_policy(retry_policy::immediate())
        .build();
    ASSERT_TRUE(result.has_value());

    auto target = result.value().probe("http://example.com/file.bin");
    ASSERT_TRUE(target.has_value()) << target.error().message;
    EXPECT_EQ(target.value().total_size, 1000u);
    EXPECT_EQ(server_->head_count(), 2u);
}

TEST_F(FetchOrchestratorTest, ProbeGivesUpAfterRetries) {
    server_->fail_head_with_error(error_code::connection_failed, 100);
    auto orchestrator = build();

    auto target = orchestrator.probe("http://example.com/file.bin");
    ASSERT_FALSE(target.has_value());
    EXPECT_EQ(target.error().code, error_code::probe_failed);
    EXPECT_EQ(server_->head_count(), 3u);
}

TEST_F(FetchOrchestratorTest, ProbeNotFound) {
    server_->set_head_status(404);
    auto orchestrator = build();

    auto target = orchestrator.probe("http://example.com/missing");
    ASSERT_FALSE(target.has_value());
    EXPECT_EQ(target.error().code, error_code::probe_failed);
    EXPECT_EQ(server_->head_count(), 1u);
}

// =============================================================================
// Validator Tests
// =============================================================================

TEST_F(FetchOrchestratorTest, ReferencePrefersProbeValidator) {
    download_target target{"http://example.com/f", 30, content_validator::etag("probe"), true};
    std::vector<chunk_result> chunks = {make_chunk(0, content_validator::etag("chunk"))};

    auto reference = fetch_orchestrator::select_reference_validator(target, chunks);
    ASSERT_TRUE(reference.has_value());
    EXPECT_EQ(reference->value, "probe");
}

TEST_F(FetchOrchestratorTest, ReferenceFallsBackToLowestChunk) {
    download_target target{"http://example.com/f", 30, std::nullopt, true};
    std::vector<chunk_result> chunks = {make_chunk(2, content_validator::etag("two")),
                                        make_chunk(0, std::nullopt),
                                        make_chunk(1, content_validator::etag("one"))};

    auto reference = fetch_orchestrator::select_reference_validator(target, chunks);
    ASSERT_TRUE(reference.has_value());
    EXPECT_EQ(reference->value, "one");
}

TEST_F(FetchOrchestratorTest, NoReferenceWithoutAnyValidator) {
    download_target target{"http://example.com/f", 20, std::nullopt, true};
    std::vector<chunk_result> chunks = {make_chunk(0, std::nullopt), make_chunk(1, std::nullopt)};

    auto reference = fetch_orchestrator::select_reference_validator(target, chunks);
    EXPECT_FALSE(reference.has_value());
    EXPECT_TRUE(fetch_orchestrator::validate_chunks(reference, chunks).has_value());
}

TEST_F(FetchOrchestratorTest, MismatchingChunkIsRejected) {
    auto reference = content_validator::etag("v1");
    std::vector<chunk_result> chunks = {make_chunk(0, content_validator::etag("v1")),
                                        make_chunk(1, content_validator::etag("v2"))};

    auto result = fetch_orchestrator::validate_chunks(reference, chunks);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::validator_mismatch);
    EXPECT_NE(result.error().message.find("range 1"), std::string::npos);
}

TEST_F(FetchOrchestratorTest, ChunkWithoutValidatorIsRejected) {
    auto reference = content_validator::etag("v1");
    std::vector<chunk_result> chunks = {make_chunk(0, std::nullopt)};

    auto result = fetch_orchestrator::validate_chunks(reference, chunks);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::validator_mismatch);
}

TEST_F(FetchOrchestratorTest, ValidatorKindsAreDistinct) {
    auto reference = content_validator::etag("same");
    std::vector<chunk_result> chunks = {make_chunk(0, content_validator::last_modified("same"))};
    EXPECT_FALSE(fetch_orchestrator::validate_chunks(reference, chunks).has_value());
}

// =============================================================================
// State Tests
// =============================================================================

class FetchOrchestratorStateTest : public FetchOrchestratorTest {
protected:
    void SetUp() override {
        FetchOrchestratorTest::SetUp();
        output_dir_ = std::filesystem::temp_directory_path() / "parallel_fetch_test_states";
        std::filesystem::remove_all(output_dir_);
        std::filesystem::create_directories(output_dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(output_dir_, ec);
    }

    auto build_observed() -> fetch_orchestrator {
        auto result = fetch_orchestrator::builder()
            .with_transport(server_)
            .with_parallelism(4)
            .with_max_retries(1)
            .with_retry_policy(retry_policy::immediate())
            .with_state_callback([this](download_state state) {
                std::lock_guard lock(mutex_);
                states_.push_back(state);
            })
            .build();
        EXPECT_TRUE(result.has_value());
        return std::move(result).value();
    }

    auto seen(download_state state) -> bool {
        std::lock_guard lock(mutex_);
        return std::find(states_.begin(), states_.end(), state) != states_.end();
    }

    std::filesystem::path output_dir_;
    std::mutex mutex_;
    std::vector<download_state> states_;
};

TEST_F(FetchOrchestratorStateTest, SuccessfulDownloadVisitsEveryPhase) {
    auto orchestrator = build_observed();
    auto outcome = orchestrator.download("http://example.com/file.bin", output_dir_.string());
    ASSERT_TRUE(outcome.is_success()) << outcome.message;

    const std::vector<download_state> expected = {
        download_state::probing, download_state::planning, download_state::fetching,
        download_state::validating, download_state::assembling, download_state::done};
    EXPECT_EQ(states_, expected);
    EXPECT_EQ(orchestrator.state(), download_state::done);
    EXPECT_EQ(outcome.output_path, output_dir_ / "file.bin");
}

TEST_F(FetchOrchestratorStateTest, MismatchNeverReachesAssembling) {
    server_->set_range_etag(500, "changed");
    auto orchestrator = build_observed();

    auto outcome = orchestrator.download("http://example.com/file.bin", output_dir_.string());
    ASSERT_FALSE(outcome.is_success());
    EXPECT_EQ(outcome.kind, failure_kind::validator_mismatch);
    EXPECT_TRUE(seen(download_state::validating));
    EXPECT_FALSE(seen(download_state::assembling));
    EXPECT_EQ(orchestrator.state(), download_state::failed);
    EXPECT_FALSE(std::filesystem::exists(output_dir_ / "file.bin"));
}

TEST_F(FetchOrchestratorStateTest, InvalidUrlFailsBeforeProbing) {
    auto orchestrator = build_observed();
    auto outcome = orchestrator.download("ftp://example.com/file.bin", output_dir_.string());
    ASSERT_FALSE(outcome.is_success());
    EXPECT_EQ(outcome.kind, failure_kind::usage_error);
    EXPECT_EQ(outcome.to_exit_code(), exit_code::usage_error);
    EXPECT_FALSE(seen(download_state::probing));
    EXPECT_EQ(server_->head_count(), 0u);
}

}  // namespace kcenon::parallel_fetch::test

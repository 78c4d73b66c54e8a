/**
 * @file download_types.h
 * @brief Configuration and outcome types of a parallel download
 */

#ifndef KCENON_PARALLEL_FETCH_CLIENT_DOWNLOAD_TYPES_H
#define KCENON_PARALLEL_FETCH_CLIENT_DOWNLOAD_TYPES_H

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "kcenon/parallel_fetch/core/chunk_types.h"
#include "kcenon/parallel_fetch/core/retry_policy.h"
#include "kcenon/parallel_fetch/core/types.h"

namespace kcenon::parallel_fetch {

/// Upper bound for the number of concurrent range requests
inline constexpr uint32_t max_parallelism = 1024;

/**
 * @brief Download configuration
 */
struct download_config {
    uint32_t parallelism = 4;
    uint32_t max_retries = 3;
    retry_policy retry;
    std::chrono::milliseconds request_timeout{30000};
    bool check_etag = false;
    bool cancel_on_failure = true;
    std::optional<std::string> user_agent;

    /**
     * @brief Check the configuration for values that cannot work
     */
    [[nodiscard]] auto validate() const -> result<void> {
        if (parallelism == 0) {
            return unexpected{
                error{error_code::invalid_parallelism, "parallelism must be at least 1"}};
        }
        if (parallelism > max_parallelism) {
            return unexpected{error{error_code::invalid_parallelism,
                                    "parallelism must not exceed " +
                                        std::to_string(max_parallelism)}};
        }
        if (request_timeout.count() <= 0) {
            return unexpected{
                error{error_code::invalid_configuration, "request timeout must be positive"}};
        }
        if (retry.backoff_multiplier < 1.0) {
            return unexpected{error{error_code::invalid_configuration,
                                    "backoff multiplier must be at least 1.0"}};
        }
        if (retry.initial_delay.count() < 0 || retry.max_delay < retry.initial_delay) {
            return unexpected{error{error_code::invalid_configuration,
                                    "retry delays must satisfy 0 <= initial <= max"}};
        }
        return {};
    }
};

/**
 * @brief Lifecycle state of a download
 */
enum class download_state {
    idle,
    probing,
    planning,
    fetching,
    validating,
    assembling,
    verifying,
    done,
    failed
};

[[nodiscard]] constexpr auto to_string(download_state state) -> const char* {
    switch (state) {
        case download_state::idle: return "idle";
        case download_state::probing: return "probing";
        case download_state::planning: return "planning";
        case download_state::fetching: return "fetching";
        case download_state::validating: return "validating";
        case download_state::assembling: return "assembling";
        case download_state::verifying: return "verifying";
        case download_state::done: return "done";
        case download_state::failed: return "failed";
        default: return "unknown";
    }
}

/**
 * @brief Category of a failed download
 */
enum class failure_kind {
    usage_error,
    range_unsupported,
    probe_failed,
    partial_fetch_failure,
    validator_mismatch,
    io_error,
    checksum_mismatch,
    internal_error
};

[[nodiscard]] constexpr auto to_string(failure_kind kind) -> const char* {
    switch (kind) {
        case failure_kind::usage_error: return "usage error";
        case failure_kind::range_unsupported: return "range requests unsupported";
        case failure_kind::probe_failed: return "probe failed";
        case failure_kind::partial_fetch_failure: return "partial fetch failure";
        case failure_kind::validator_mismatch: return "validator mismatch";
        case failure_kind::io_error: return "I/O error";
        case failure_kind::checksum_mismatch: return "checksum mismatch";
        case failure_kind::internal_error: return "internal error";
        default: return "unknown";
    }
}

/**
 * @brief Failure category of an error reported outside the fetch phase
 */
[[nodiscard]] constexpr auto to_failure_kind(error_code code) -> failure_kind {
    switch (code) {
        case error_code::invalid_parallelism:
        case error_code::invalid_url:
        case error_code::invalid_output_path:
        case error_code::invalid_configuration:
            return failure_kind::usage_error;
        case error_code::range_unsupported:
        case error_code::range_not_honored:
            return failure_kind::range_unsupported;
        case error_code::probe_failed:
        case error_code::missing_content_length:
        case error_code::connection_failed:
        case error_code::connection_timeout:
        case error_code::connection_lost:
        case error_code::server_error:
        case error_code::client_error:
        case error_code::range_not_satisfiable:
        case error_code::malformed_response:
        case error_code::retries_exhausted:
        case error_code::transfer_cancelled:
            return failure_kind::probe_failed;
        case error_code::validator_mismatch:
        case error_code::missing_validator:
            return failure_kind::validator_mismatch;
        case error_code::checksum_mismatch:
            return failure_kind::checksum_mismatch;
        case error_code::file_create_error:
        case error_code::file_write_error:
        case error_code::file_read_error:
        case error_code::file_rename_error:
            return failure_kind::io_error;
        default:
            return failure_kind::internal_error;
    }
}

/**
 * @brief Process exit codes of the command-line tool
 */
enum class exit_code : int {
    success = 0,
    unexpected_error = 1,
    usage_error = 2,
    range_unsupported = 3,
    network_error = 4,
    validator_mismatch = 5,
    io_error = 6,
    checksum_mismatch = 7
};

[[nodiscard]] constexpr auto to_exit_code(failure_kind kind) -> exit_code {
    switch (kind) {
        case failure_kind::usage_error: return exit_code::usage_error;
        case failure_kind::range_unsupported: return exit_code::range_unsupported;
        case failure_kind::probe_failed: return exit_code::network_error;
        case failure_kind::partial_fetch_failure: return exit_code::network_error;
        case failure_kind::validator_mismatch: return exit_code::validator_mismatch;
        case failure_kind::io_error: return exit_code::io_error;
        case failure_kind::checksum_mismatch: return exit_code::checksum_mismatch;
        case failure_kind::internal_error: return exit_code::unexpected_error;
        default: return exit_code::unexpected_error;
    }
}

/**
 * @brief Terminal failure of one range
 */
struct chunk_failure {
    chunk_range range;
    error cause;
};

/**
 * @brief Result of one download
 *
 * A successful outcome carries the output path. A failed outcome carries
 * exactly one failure_kind; for partial_fetch_failure it also lists every
 * range that did not complete.
 */
struct download_outcome {
    bool succeeded = false;
    std::filesystem::path output_path;

    failure_kind kind = failure_kind::internal_error;
    bool partial_cleanup_done = false;
    std::vector<chunk_failure> failed_ranges;
    std::string message;
    error cause;

    // Statistics
    uint64_t total_size = 0;
    uint32_t chunk_count = 0;
    uint32_t total_attempts = 0;
    std::chrono::milliseconds elapsed{0};

    [[nodiscard]] static auto success(std::filesystem::path path) -> download_outcome {
        download_outcome outcome;
        outcome.succeeded = true;
        outcome.output_path = std::move(path);
        return outcome;
    }

    [[nodiscard]] static auto failure(failure_kind kind,
                                      error cause,
                                      bool partial_cleanup_done,
                                      std::vector<chunk_failure> failed_ranges = {})
        -> download_outcome {
        download_outcome outcome;
        outcome.kind = kind;
        outcome.message = cause.message;
        outcome.cause = std::move(cause);
        outcome.partial_cleanup_done = partial_cleanup_done;
        outcome.failed_ranges = std::move(failed_ranges);
        return outcome;
    }

    [[nodiscard]] auto is_success() const noexcept -> bool { return succeeded; }

    [[nodiscard]] auto to_exit_code() const -> exit_code {
        return succeeded ? exit_code::success : parallel_fetch::to_exit_code(kind);
    }
};

}  // namespace kcenon::parallel_fetch

#endif  // KCENON_PARALLEL_FETCH_CLIENT_DOWNLOAD_TYPES_H

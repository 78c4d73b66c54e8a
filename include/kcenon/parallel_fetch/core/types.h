/**
 * @file types.h
 * @brief Core type definitions for parallel_fetch
 */

#ifndef KCENON_PARALLEL_FETCH_CORE_TYPES_H
#define KCENON_PARALLEL_FETCH_CORE_TYPES_H

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace kcenon::parallel_fetch {

/**
 * @brief Error codes for download operations
 *
 * Error code ranges:
 * - -800 to -809: Usage Errors
 * - -810 to -819: Probe Errors
 * - -820 to -839: Fetch Errors
 * - -840 to -849: Consistency Errors
 * - -850 to -859: File I/O Errors
 * - -890 to -899: Internal Errors
 */
enum class error_code : int32_t {
    success = 0,

    // Usage errors (-800 to -809)
    invalid_parallelism = -800,
    invalid_url = -801,
    invalid_output_path = -802,
    invalid_configuration = -803,

    // Probe errors (-810 to -819)
    probe_failed = -810,
    range_unsupported = -811,
    missing_content_length = -812,

    // Fetch errors (-820 to -839)
    connection_failed = -820,
    connection_timeout = -821,
    connection_lost = -822,
    server_error = -823,
    client_error = -824,
    range_not_satisfiable = -825,
    range_not_honored = -826,
    malformed_response = -827,
    retries_exhausted = -828,
    transfer_cancelled = -829,

    // Consistency errors (-840 to -849)
    validator_mismatch = -840,
    checksum_mismatch = -841,
    missing_validator = -842,
    incomplete_coverage = -843,

    // File I/O errors (-850 to -859)
    file_create_error = -850,
    file_write_error = -851,
    file_read_error = -852,
    file_rename_error = -853,

    // Internal errors (-890 to -899)
    internal_error = -890,
    transport_unavailable = -891,
};

/**
 * @brief Convert error code to string
 */
[[nodiscard]] constexpr auto to_string(error_code code) -> const char* {
    switch (code) {
        case error_code::success:
            return "success";
        case error_code::invalid_parallelism:
            return "invalid parallelism";
        case error_code::invalid_url:
            return "invalid url";
        case error_code::invalid_output_path:
            return "invalid output path";
        case error_code::invalid_configuration:
            return "invalid configuration";
        case error_code::probe_failed:
            return "probe request failed";
        case error_code::range_unsupported:
            return "server does not support range requests";
        case error_code::missing_content_length:
            return "server did not report content length";
        case error_code::connection_failed:
            return "connection failed";
        case error_code::connection_timeout:
            return "connection timeout";
        case error_code::connection_lost:
            return "connection lost";
        case error_code::server_error:
            return "server error";
        case error_code::client_error:
            return "client error";
        case error_code::range_not_satisfiable:
            return "range not satisfiable";
        case error_code::range_not_honored:
            return "range request not honored";
        case error_code::malformed_response:
            return "malformed response";
        case error_code::retries_exhausted:
            return "retries exhausted";
        case error_code::transfer_cancelled:
            return "transfer cancelled";
        case error_code::validator_mismatch:
            return "validator mismatch";
        case error_code::checksum_mismatch:
            return "checksum mismatch";
        case error_code::missing_validator:
            return "missing validator";
        case error_code::incomplete_coverage:
            return "chunks do not cover the target";
        case error_code::file_create_error:
            return "file create error";
        case error_code::file_write_error:
            return "file write error";
        case error_code::file_read_error:
            return "file read error";
        case error_code::file_rename_error:
            return "file rename error";
        case error_code::internal_error:
            return "internal error";
        case error_code::transport_unavailable:
            return "transport unavailable";
        default:
            return "unknown error";
    }
}

/**
 * @brief Error type with code and optional message
 */
struct error {
    error_code code;
    std::string message;

    error() : code(error_code::success) {}
    explicit error(error_code c) : code(c), message(to_string(c)) {}
    error(error_code c, std::string msg) : code(c), message(std::move(msg)) {}

    [[nodiscard]] explicit operator bool() const noexcept {
        return code != error_code::success;
    }
};

/**
 * @brief Wrapper for unexpected error (used with result<T>)
 */
struct unexpected {
    error err;

    explicit unexpected(error e) : err(std::move(e)) {}
};

/**
 * @brief Result type for operations that can fail
 *
 * Contains either a value of type T or an error.
 */
template <typename T>
class result {
public:
    result() : value_(std::nullopt), error_{} {}

    result(T value) : value_(std::move(value)), error_{} {}

    result(unexpected u) : value_(std::nullopt), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return value_.has_value(); }
    [[nodiscard]] explicit operator bool() const noexcept { return value_.has_value(); }

    [[nodiscard]] auto value() & -> T& { return *value_; }
    [[nodiscard]] auto value() const& -> const T& { return *value_; }
    [[nodiscard]] auto value() && -> T&& { return std::move(*value_); }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    std::optional<T> value_;
    struct error error_;
};

/**
 * @brief Specialization of result for void return type
 */
template <>
class result<void> {
public:
    result() : has_value_(true) {}

    result(unexpected u) : has_value_(false), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return has_value_; }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value_; }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    bool has_value_;
    struct error error_;
};

}  // namespace kcenon::parallel_fetch

#endif  // KCENON_PARALLEL_FETCH_CORE_TYPES_H

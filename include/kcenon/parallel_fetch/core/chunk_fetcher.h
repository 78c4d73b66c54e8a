/**
 * @file chunk_fetcher.h
 * @brief Ranged retrieval of one chunk with bounded retry
 */

#ifndef KCENON_PARALLEL_FETCH_CORE_CHUNK_FETCHER_H
#define KCENON_PARALLEL_FETCH_CORE_CHUNK_FETCHER_H

#include <kcenon/parallel_fetch/core/chunk_types.h>
#include <kcenon/parallel_fetch/core/retry_policy.h>
#include <kcenon/parallel_fetch/core/types.h>
#include <kcenon/parallel_fetch/transport/http_transport.h>

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace kcenon::parallel_fetch {

/**
 * @brief Outcome class of a single request attempt
 */
enum class attempt_outcome {
    success,
    retryable,
    fatal
};

[[nodiscard]] constexpr auto to_string(attempt_outcome outcome) -> const char* {
    switch (outcome) {
        case attempt_outcome::success: return "success";
        case attempt_outcome::retryable: return "retryable";
        case attempt_outcome::fatal: return "fatal";
        default: return "unknown";
    }
}

/**
 * @brief Classification of one attempt together with its cause
 *
 * `cause` is empty (error_code::success) for successful attempts.
 */
struct attempt_classification {
    attempt_outcome outcome = attempt_outcome::success;
    error cause;
};

/**
 * @brief Fetches one byte range of a remote resource
 *
 * Every attempt re-requests the complete range; bytes of a failed attempt
 * are discarded. Transport failures and 5xx answers are retried with the
 * configured backoff, everything else fails immediately.
 *
 * @note A fetcher holds no per-download state and may be shared by
 *       concurrent fetches.
 */
class chunk_fetcher {
public:
    /**
     * @brief Construct fetcher over a transport
     * @param transport HTTP transport used for every attempt
     * @param policy Backoff between attempts
     */
    explicit chunk_fetcher(std::shared_ptr<http_transport_interface> transport,
                           retry_policy policy = {});

    /**
     * @brief Fetch a range
     * @param url Resource URL
     * @param range Range to fetch
     * @param max_retries Additional attempts allowed after the first one
     * @param expected_total Resource size the Content-Range must report, if known
     * @param cancelled Checked before each attempt; stops the fetch when set
     * @return Chunk bytes and validator, or the terminal error
     *
     * Exhausted retries are reported as error_code::retries_exhausted whose
     * message carries the last cause.
     */
    [[nodiscard]] auto fetch(const std::string& url,
                             const chunk_range& range,
                             uint32_t max_retries,
                             std::optional<uint64_t> expected_total = std::nullopt,
                             const std::atomic<bool>* cancelled = nullptr) const
        -> result<chunk_result>;

    /**
     * @brief Classify the answer to a ranged GET
     * @param response Transport result of the attempt
     * @param range Range that was requested
     * @param expected_total Resource size the Content-Range must report, if known
     */
    [[nodiscard]] static auto classify(const result<http_response>& response,
                                       const chunk_range& range,
                                       std::optional<uint64_t> expected_total)
        -> attempt_classification;

    /**
     * @brief Classify a transport-level failure
     *
     * Connection problems are retryable; a missing transport or a rejected
     * URL is not.
     */
    [[nodiscard]] static auto classify_transport_error(const error& err)
        -> attempt_classification;

    /**
     * @brief Classify an HTTP status that is not a valid ranged answer
     *
     * 5xx is retryable, 416 and other 4xx are fatal.
     */
    [[nodiscard]] static auto classify_status(int status_code) -> attempt_classification;

    /**
     * @brief Extract the validator of a response
     * @return ETag if present, else Last-Modified, else nullopt
     */
    [[nodiscard]] static auto extract_validator(const http_response& response)
        -> std::optional<content_validator>;

    [[nodiscard]] auto policy() const -> const retry_policy&;

private:
    std::shared_ptr<http_transport_interface> transport_;
    retry_policy policy_;
};

/**
 * @brief Parsed value of a Content-Range header
 */
struct content_range {
    uint64_t start = 0;
    uint64_t end = 0;
    std::optional<uint64_t> total;  ///< nullopt for "*"

    /**
     * @brief Parse "bytes <start>-<end>/<total|*>"
     */
    [[nodiscard]] static auto parse(const std::string& value) -> std::optional<content_range>;
};

}  // namespace kcenon::parallel_fetch

#endif  // KCENON_PARALLEL_FETCH_CORE_CHUNK_FETCHER_H

/**
 * @file chunk_fetcher.cpp
 * @brief Implementation of ranged chunk retrieval
 */

#include <kcenon/parallel_fetch/core/chunk_fetcher.h>
#include <kcenon/parallel_fetch/core/logging.h>

#include <chrono>
#include <cstdint>
#include <map>
#include <string_view>
#include <thread>
#include <utility>

namespace kcenon::parallel_fetch {

namespace {

auto parse_u64(const std::string& text, uint64_t& out) -> bool {
    if (text.empty()) {
        return false;
    }
    uint64_t value = 0;
    for (char c : text) {
        if (c < '0' || c > '9') {
            return false;
        }
        const uint64_t digit = static_cast<uint64_t>(c - '0');
        if (value > (UINT64_MAX - digit) / 10) {
            return false;
        }
        value = value * 10 + digit;
    }
    out = value;
    return true;
}

auto trim(const std::string& s) -> std::string {
    const auto begin = s.find_first_not_of(" \t");
    if (begin == std::string::npos) {
        return {};
    }
    const auto end = s.find_last_not_of(" \t");
    return s.substr(begin, end - begin + 1);
}

auto strip_quotes(std::string value) -> std::string {
    if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

auto range_label(const chunk_range& range) -> std::string {
    return "range " + std::to_string(range.index) + " [" + std::to_string(range.start) +
           "-" + std::to_string(range.end) + "]";
}

}  // namespace

auto content_range::parse(const std::string& value) -> std::optional<content_range> {
    const auto text = trim(value);
    constexpr std::string_view unit = "bytes ";
    if (text.size() <= unit.size() || text.compare(0, unit.size(), unit) != 0) {
        return std::nullopt;
    }

    const auto range_text = trim(text.substr(unit.size()));
    const auto dash = range_text.find('-');
    const auto slash = range_text.find('/');
    if (dash == std::string::npos || slash == std::string::npos || dash > slash) {
        return std::nullopt;
    }

    content_range parsed;
    if (!parse_u64(range_text.substr(0, dash), parsed.start) ||
        !parse_u64(range_text.substr(dash + 1, slash - dash - 1), parsed.end)) {
        return std::nullopt;
    }
    if (parsed.end < parsed.start) {
        return std::nullopt;
    }

    const auto total = range_text.substr(slash + 1);
    if (total != "*") {
        uint64_t size = 0;
        if (!parse_u64(total, size) || size <= parsed.end) {
            return std::nullopt;
        }
        parsed.total = size;
    }

    return parsed;
}

chunk_fetcher::chunk_fetcher(std::shared_ptr<http_transport_interface> transport,
                             retry_policy policy)
    : transport_(std::move(transport)), policy_(policy) {}

auto chunk_fetcher::policy() const -> const retry_policy& {
    return policy_;
}

auto chunk_fetcher::classify_transport_error(const error& err) -> attempt_classification {
    switch (err.code) {
        case error_code::transport_unavailable:
        case error_code::invalid_url:
        case error_code::invalid_configuration:
            return {attempt_outcome::fatal, err};
        default:
            return {attempt_outcome::retryable, err};
    }
}

auto chunk_fetcher::classify_status(int status_code) -> attempt_classification {
    const auto status = std::to_string(status_code);

    if (status_code >= 500 && status_code < 600) {
        return {attempt_outcome::retryable,
                error{error_code::server_error, "server returned HTTP " + status}};
    }
    if (status_code == 416) {
        return {attempt_outcome::fatal,
                error{error_code::range_not_satisfiable, "server returned HTTP 416"}};
    }
    if (status_code >= 400 && status_code < 500) {
        return {attempt_outcome::fatal,
                error{error_code::client_error, "server returned HTTP " + status}};
    }
    if (status_code == 200) {
        return {attempt_outcome::fatal,
                error{error_code::range_not_honored,
                      "server ignored the Range header and returned HTTP 200"}};
    }
    return {attempt_outcome::fatal,
            error{error_code::malformed_response, "unexpected HTTP " + status}};
}

auto chunk_fetcher::classify(const result<http_response>& response,
                             const chunk_range& range,
                             std::optional<uint64_t> expected_total)
    -> attempt_classification {
    if (!response) {
        return classify_transport_error(response.error());
    }

    const auto& resp = response.value();
    if (resp.status_code != 206) {
        return classify_status(resp.status_code);
    }

    auto header = resp.get_header("Content-Range");
    if (!header) {
        return {attempt_outcome::fatal,
                error{error_code::malformed_response, "206 response without Content-Range"}};
    }

    auto parsed = content_range::parse(*header);
    if (!parsed) {
        return {attempt_outcome::fatal,
                error{error_code::malformed_response,
                      "unparseable Content-Range: " + *header}};
    }

    if (parsed->start != range.start || parsed->end != range.end) {
        return {attempt_outcome::fatal,
                error{error_code::malformed_response,
                      "Content-Range " + *header + " does not match requested " +
                          range.to_header()}};
    }

    if (expected_total && parsed->total && *parsed->total != *expected_total) {
        return {attempt_outcome::fatal,
                error{error_code::malformed_response,
                      "Content-Range reports size " + std::to_string(*parsed->total) +
                          ", expected " + std::to_string(*expected_total)}};
    }

    if (resp.body.size() != range.length()) {
        return {attempt_outcome::fatal,
                error{error_code::malformed_response,
                      "received " + std::to_string(resp.body.size()) + " bytes, expected " +
                          std::to_string(range.length())}};
    }

    return {attempt_outcome::success, error{}};
}

auto chunk_fetcher::extract_validator(const http_response& response)
    -> std::optional<content_validator> {
    if (auto etag = response.get_header("ETag"); etag && !trim(*etag).empty()) {
        auto value = trim(*etag);
        // Weak validators keep their prefix so they never equal a strong one
        if (value.rfind("W/", 0) == 0) {
            return content_validator::etag("W/" + strip_quotes(value.substr(2)));
        }
        return content_validator::etag(strip_quotes(value));
    }

    if (auto modified = response.get_header("Last-Modified");
        modified && !trim(*modified).empty()) {
        return content_validator::last_modified(trim(*modified));
    }

    return std::nullopt;
}

auto chunk_fetcher::fetch(const std::string& url,
                          const chunk_range& range,
                          uint32_t max_retries,
                          std::optional<uint64_t> expected_total,
                          const std::atomic<bool>* cancelled) const
    -> result<chunk_result> {
    if (range.empty) {
        chunk_result empty;
        empty.range = range;
        return empty;
    }

    if (!transport_) {
        return unexpected(error{error_code::transport_unavailable, "no transport configured"});
    }

    const std::map<std::string, std::string> headers{{"Range", range.to_header()}};
    const uint64_t max_attempts = static_cast<uint64_t>(max_retries) + 1;
    error last_cause;

    for (uint64_t attempt = 1; attempt <= max_attempts; ++attempt) {
        if (attempt > 1) {
            auto delay = policy_.delay_for(attempt - 1);
            if (delay.count() > 0) {
                std::this_thread::sleep_for(delay);
            }
        }

        if (cancelled != nullptr && cancelled->load()) {
            return unexpected(
                error{error_code::transfer_cancelled, range_label(range) + " cancelled"});
        }

        const auto started = std::chrono::steady_clock::now();
        auto response = transport_->get(url, headers);
        auto classification = classify(response, range, expected_total);
        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started);

        download_log_context ctx;
        ctx.url = url;
        ctx.chunk_index = range.index;
        ctx.range_start = range.start;
        ctx.range_end = range.end;
        ctx.attempt = static_cast<uint32_t>(attempt);
        ctx.duration_ms = static_cast<uint64_t>(elapsed.count());
        if (response) {
            ctx.status_code = response.value().status_code;
        }

        if (classification.outcome == attempt_outcome::success) {
            auto& resp = response.value();

            chunk_result chunk;
            chunk.range = range;
            chunk.validator = extract_validator(resp);
            chunk.data = std::move(resp.body);
            chunk.attempt_count = static_cast<uint32_t>(attempt);

            ctx.bytes = chunk.data.size();
            PF_LOG_DEBUG_CTX(log_category::fetcher, range_label(range) + " fetched", ctx);
            return chunk;
        }

        ctx.error_message = classification.cause.message;

        if (classification.outcome == attempt_outcome::fatal) {
            PF_LOG_ERROR_CTX(log_category::fetcher,
                             range_label(range) + " failed: " + classification.cause.message,
                             ctx);
            return unexpected(classification.cause);
        }

        PF_LOG_WARN_CTX(log_category::fetcher,
                        range_label(range) + " attempt " + std::to_string(attempt) + "/" +
                            std::to_string(max_attempts) + " failed: " +
                            classification.cause.message,
                        ctx);
        last_cause = std::move(classification.cause);
    }

    return unexpected(error{error_code::retries_exhausted,
                            range_label(range) + " failed after " +
                                std::to_string(max_attempts) + " attempts: " +
                                last_cause.message});
}

}  // namespace kcenon::parallel_fetch

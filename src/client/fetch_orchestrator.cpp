/**
 * @file fetch_orchestrator.cpp
 * @brief Implementation of the parallel download orchestrator
 */

#include "kcenon/parallel_fetch/client/fetch_orchestrator.h"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <charconv>
#include <future>
#include <thread>

#include "kcenon/parallel_fetch/core/checksum.h"
#include "kcenon/parallel_fetch/core/chunk_fetcher.h"
#include "kcenon/parallel_fetch/core/logging.h"
#include "kcenon/parallel_fetch/core/output_path.h"
#include "kcenon/parallel_fetch/core/range_planner.h"
#include "kcenon/parallel_fetch/transport/network_http_transport.h"

namespace kcenon::parallel_fetch {

namespace {

auto trim_lower(std::string value) -> std::string {
    const auto begin = value.find_first_not_of(" \t");
    if (begin == std::string::npos) {
        return {};
    }
    const auto end = value.find_last_not_of(" \t");
    value = value.substr(begin, end - begin + 1);
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

auto parse_content_length(const http_response& response) -> std::optional<uint64_t> {
    auto header = response.get_header("Content-Length");
    if (!header) {
        return std::nullopt;
    }
    const auto text = trim_lower(*header);
    uint64_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size() || text.empty()) {
        return std::nullopt;
    }
    return value;
}

/**
 * @brief Issue a probe request, retrying transport failures and 5xx
 *
 * Any other HTTP answer is returned to the caller for interpretation.
 */
auto request_with_retry(const std::function<result<http_response>()>& send,
                        const std::string& what,
                        uint32_t max_retries,
                        const retry_policy& policy) -> result<http_response> {
    const uint64_t max_attempts = static_cast<uint64_t>(max_retries) + 1;
    error last_cause;

    for (uint64_t attempt = 1; attempt <= max_attempts; ++attempt) {
        if (attempt > 1) {
            auto delay = policy.delay_for(attempt - 1);
            if (delay.count() > 0) {
                std::this_thread::sleep_for(delay);
            }
        }

        auto response = send();
        if (!response) {
            auto classification = chunk_fetcher::classify_transport_error(response.error());
            if (classification.outcome == attempt_outcome::fatal) {
                return unexpected(response.error());
            }
            last_cause = response.error();
        } else if (response.value().status_code >= 500 && response.value().status_code < 600) {
            last_cause = error{error_code::server_error,
                               what + " returned HTTP " +
                                   std::to_string(response.value().status_code)};
        } else {
            return response;
        }

        PF_LOG_WARN(log_category::probe,
                    what + " attempt " + std::to_string(attempt) + "/" +
                        std::to_string(max_attempts) + " failed: " + last_cause.message);
    }

    return unexpected(error{error_code::probe_failed,
                            what + " failed after " + std::to_string(max_attempts) +
                                " attempts: " + last_cause.message});
}

struct fetch_batch {
    std::vector<chunk_result> chunks;
    std::vector<chunk_failure> failures;
    uint32_t attempts = 0;
};

auto summarize_failures(const std::vector<chunk_failure>& failures, std::size_t range_count)
    -> error {
    // The first failure that was not caused by cancellation is the root cause
    auto root = std::find_if(failures.begin(), failures.end(), [](const chunk_failure& f) {
        return f.cause.code != error_code::transfer_cancelled;
    });
    if (root == failures.end()) {
        root = failures.begin();
    }

    return error{root->cause.code,
                 std::to_string(failures.size()) + " of " + std::to_string(range_count) +
                     " ranges failed; " + root->cause.message};
}

}  // namespace

// ============================================================================
// fetch_orchestrator::impl
// ============================================================================

struct fetch_orchestrator::impl {
    download_config config;
    std::shared_ptr<http_transport_interface> transport;
    std::shared_ptr<adapters::fetch_executor_interface> executor;
    chunk_assembler assembler;
    state_callback on_state;
    std::atomic<download_state> current_state{download_state::idle};

    impl(download_config cfg,
         std::shared_ptr<http_transport_interface> t,
         std::shared_ptr<adapters::fetch_executor_interface> e,
         chunk_assembler a,
         state_callback cb)
        : config(std::move(cfg)),
          transport(std::move(t)),
          executor(std::move(e)),
          assembler(std::move(a)),
          on_state(std::move(cb)) {}

    void set_state(download_state state) {
        current_state.store(state);
        PF_LOG_DEBUG(log_category::orchestrator, std::string("state: ") + to_string(state));
        if (on_state) {
            on_state(state);
        }
    }

    auto run_fetches(const download_target& target, const std::vector<chunk_range>& ranges)
        -> fetch_batch;

    auto verify(const std::optional<content_validator>& reference,
                const std::filesystem::path& path) -> result<void>;
};

auto fetch_orchestrator::impl::run_fetches(const download_target& target,
                                           const std::vector<chunk_range>& ranges)
    -> fetch_batch {
    std::atomic<bool> cancelled{false};
    std::vector<result<chunk_result>> results(ranges.size());
    std::vector<std::future<void>> futures(ranges.size());

    auto pool = executor ? executor : adapters::fetch_executor_factory::create(ranges.size());
    const chunk_fetcher fetcher(transport, config.retry);
    const bool cancel_on_failure = config.cancel_on_failure;
    const uint32_t max_retries = config.max_retries;

    for (std::size_t i = 0; i < ranges.size(); ++i) {
        auto task = [&, i]() {
            auto fetched = fetcher.fetch(target.url, ranges[i], max_retries, target.total_size,
                                         &cancelled);
            if (!fetched && cancel_on_failure &&
                fetched.error().code != error_code::transfer_cancelled) {
                cancelled.store(true);
            }
            results[i] = std::move(fetched);
        };

        try {
            futures[i] = pool->submit(std::move(task));
        } catch (const std::exception& e) {
            results[i] = unexpected(
                error{error_code::internal_error,
                      std::string("failed to dispatch range fetch: ") + e.what()});
            cancelled.store(true);
        }
    }

    // Barrier: every dispatched task finishes before results are read
    for (std::size_t i = 0; i < futures.size(); ++i) {
        if (!futures[i].valid()) {
            continue;
        }
        try {
            futures[i].get();
        } catch (const std::exception& e) {
            results[i] = unexpected(
                error{error_code::internal_error, std::string("range fetch threw: ") + e.what()});
        }
    }

    fetch_batch batch;
    batch.chunks.reserve(ranges.size());
    for (std::size_t i = 0; i < ranges.size(); ++i) {
        if (results[i]) {
            batch.attempts += results[i].value().attempt_count;
            batch.chunks.push_back(std::move(results[i]).value());
        } else {
            batch.failures.push_back(chunk_failure{ranges[i], results[i].error()});
        }
    }

    return batch;
}

auto fetch_orchestrator::impl::verify(const std::optional<content_validator>& reference,
                                      const std::filesystem::path& path) -> result<void> {
    if (!reference || reference->kind != validator_kind::etag) {
        return unexpected(
            error{error_code::checksum_mismatch, "server did not provide an ETag to check"});
    }
    return checksum::verify_etag(path, reference->value);
}

// ============================================================================
// fetch_orchestrator::builder
// ============================================================================

fetch_orchestrator::builder::builder() = default;

auto fetch_orchestrator::builder::with_transport(
    std::shared_ptr<http_transport_interface> transport) -> builder& {
    transport_ = std::move(transport);
    return *this;
}

auto fetch_orchestrator::builder::with_executor(
    std::shared_ptr<adapters::fetch_executor_interface> executor) -> builder& {
    executor_ = std::move(executor);
    return *this;
}

auto fetch_orchestrator::builder::with_config(download_config config) -> builder& {
    config_ = std::move(config);
    return *this;
}

auto fetch_orchestrator::builder::with_parallelism(uint32_t parallelism) -> builder& {
    config_.parallelism = parallelism;
    return *this;
}

auto fetch_orchestrator::builder::with_max_retries(uint32_t max_retries) -> builder& {
    config_.max_retries = max_retries;
    return *this;
}

auto fetch_orchestrator::builder::with_retry_policy(retry_policy policy) -> builder& {
    config_.retry = policy;
    return *this;
}

auto fetch_orchestrator::builder::with_timeout(std::chrono::milliseconds timeout) -> builder& {
    config_.request_timeout = timeout;
    return *this;
}

auto fetch_orchestrator::builder::with_check_etag(bool enable) -> builder& {
    config_.check_etag = enable;
    return *this;
}

auto fetch_orchestrator::builder::with_cancel_on_failure(bool enable) -> builder& {
    config_.cancel_on_failure = enable;
    return *this;
}

auto fetch_orchestrator::builder::with_user_agent(std::string user_agent) -> builder& {
    config_.user_agent = std::move(user_agent);
    return *this;
}

auto fetch_orchestrator::builder::with_assembler(chunk_assembler assembler) -> builder& {
    assembler_ = std::move(assembler);
    return *this;
}

auto fetch_orchestrator::builder::with_state_callback(state_callback callback) -> builder& {
    state_callback_ = std::move(callback);
    return *this;
}

auto fetch_orchestrator::builder::build() -> result<fetch_orchestrator> {
    if (auto valid = config_.validate(); !valid) {
        return unexpected{valid.error()};
    }

    auto transport = transport_;
    if (!transport) {
        auto network = make_network_http_transport(config_.request_timeout, config_.user_agent);
        if (!network->is_available()) {
            return unexpected{error{error_code::transport_unavailable,
                                    "no HTTP transport: built without network_system"}};
        }
        transport = std::move(network);
    }

    return fetch_orchestrator{config_, std::move(transport), executor_,
                              assembler_.value_or(chunk_assembler{}), state_callback_};
}

// ============================================================================
// fetch_orchestrator
// ============================================================================

fetch_orchestrator::fetch_orchestrator(
    download_config config,
    std::shared_ptr<http_transport_interface> transport,
    std::shared_ptr<adapters::fetch_executor_interface> executor,
    chunk_assembler assembler,
    state_callback callback)
    : impl_(std::make_unique<impl>(std::move(config), std::move(transport),
                                   std::move(executor), std::move(assembler),
                                   std::move(callback))) {
    // Initialize logger (safe to call multiple times)
    get_logger().initialize();
}

fetch_orchestrator::fetch_orchestrator(fetch_orchestrator&&) noexcept = default;
auto fetch_orchestrator::operator=(fetch_orchestrator&&) noexcept
    -> fetch_orchestrator& = default;
fetch_orchestrator::~fetch_orchestrator() = default;

auto fetch_orchestrator::state() const -> download_state {
    return impl_->current_state.load();
}

auto fetch_orchestrator::config() const -> const download_config& {
    return impl_->config;
}

auto fetch_orchestrator::probe(const std::string& url) -> result<download_target> {
    const auto& cfg = impl_->config;
    auto& transport = impl_->transport;

    auto head = request_with_retry(
        [&]() { return transport->head(url, {}); }, "HEAD", cfg.max_retries, cfg.retry);
    if (!head) {
        return unexpected(head.error());
    }

    std::optional<content_validator> head_validator;
    const auto& head_response = head.value();

    if (head_response.status_code == 405 || head_response.status_code == 501) {
        PF_LOG_DEBUG(log_category::probe, "HEAD refused with HTTP " +
                                              std::to_string(head_response.status_code) +
                                              ", probing with a ranged GET");
    } else if (!head_response.is_success()) {
        return unexpected(error{error_code::probe_failed,
                                "HEAD returned HTTP " +
                                    std::to_string(head_response.status_code)});
    } else {
        const auto accept_ranges = trim_lower(head_response.get_header("Accept-Ranges").value_or(""));
        if (accept_ranges == "none") {
            return unexpected(error{error_code::range_unsupported,
                                    "server reports Accept-Ranges: none"});
        }

        head_validator = chunk_fetcher::extract_validator(head_response);
        const auto length = parse_content_length(head_response);

        download_log_context ctx;
        ctx.url = url;
        ctx.status_code = head_response.status_code;
        if (length) {
            ctx.total_size = *length;
        }
        PF_LOG_INFO_CTX(log_category::probe,
                        "HEAD accept_ranges=" + (accept_ranges.empty() ? "<absent>" : accept_ranges) +
                            " validator=" +
                            (head_validator ? head_validator->to_string() : "<none>"),
                        ctx);

        if (accept_ranges == "bytes" && length) {
            return download_target{url, *length, head_validator, true};
        }
    }

    auto ranged = request_with_retry(
        [&]() { return transport->get(url, {{"Range", "bytes=0-0"}}); }, "ranged probe",
        cfg.max_retries, cfg.retry);
    if (!ranged) {
        return unexpected(ranged.error());
    }

    const auto& response = ranged.value();
    auto validator = chunk_fetcher::extract_validator(response);
    if (!validator) {
        validator = head_validator;
    }

    if (response.status_code == 200) {
        return unexpected(error{error_code::range_unsupported,
                                "server answered a ranged request with HTTP 200"});
    }

    const auto content_range_header = response.get_header("Content-Range");

    // An empty resource cannot satisfy bytes=0-0
    if (response.status_code == 416 && content_range_header &&
        trim_lower(*content_range_header) == "bytes */0") {
        return download_target{url, 0, validator, true};
    }

    if (response.status_code != 206) {
        return unexpected(error{error_code::probe_failed,
                                "ranged probe returned HTTP " +
                                    std::to_string(response.status_code)});
    }

    if (!content_range_header) {
        return unexpected(error{error_code::missing_content_length,
                                "ranged probe answer has no Content-Range"});
    }

    auto parsed = content_range::parse(*content_range_header);
    if (!parsed || !parsed->total) {
        return unexpected(error{error_code::missing_content_length,
                                "ranged probe did not report the resource size: " +
                                    *content_range_header});
    }

    return download_target{url, *parsed->total, validator, true};
}

auto fetch_orchestrator::select_reference_validator(const download_target& target,
                                                    const std::vector<chunk_result>& chunks)
    -> std::optional<content_validator> {
    if (target.validator) {
        return target.validator;
    }

    const chunk_result* lowest = nullptr;
    for (const auto& c : chunks) {
        if (c.range.empty || !c.validator) {
            continue;
        }
        if (lowest == nullptr || c.range.index < lowest->range.index) {
            lowest = &c;
        }
    }

    return lowest ? lowest->validator : std::nullopt;
}

auto fetch_orchestrator::validate_chunks(const std::optional<content_validator>& reference,
                                         const std::vector<chunk_result>& chunks)
    -> result<void> {
    if (!reference) {
        return {};
    }

    for (const auto& c : chunks) {
        if (c.range.empty) {
            continue;
        }
        if (!c.validator || *c.validator != *reference) {
            return unexpected(error{
                error_code::validator_mismatch,
                "range " + std::to_string(c.range.index) + " has " +
                    (c.validator ? c.validator->to_string() : std::string("no validator")) +
                    ", expected " + reference->to_string()});
        }
    }

    return {};
}

auto fetch_orchestrator::download(const std::string& url,
                                  const std::optional<std::string>& output)
    -> download_outcome {
    auto path = resolve_output_path(output, url);
    if (!path) {
        impl_->set_state(download_state::failed);
        PF_LOG_ERROR(log_category::orchestrator, path.error().message);
        return download_outcome::failure(to_failure_kind(path.error().code), path.error(), true);
    }
    return download_to(url, path.value());
}

auto fetch_orchestrator::download_to(const std::string& url,
                                     const std::filesystem::path& output_path)
    -> download_outcome {
    const auto started = std::chrono::steady_clock::now();

    download_log_context ctx;
    ctx.url = url;
    ctx.output_path = output_path.string();
    ctx.parallelism = impl_->config.parallelism;

    auto finish = [&](download_outcome outcome) {
        outcome.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started);
        ctx.duration_ms = static_cast<uint64_t>(outcome.elapsed.count());
        if (outcome.succeeded) {
            impl_->set_state(download_state::done);
            PF_LOG_INFO_CTX(log_category::orchestrator, "download complete", ctx);
        } else {
            impl_->set_state(download_state::failed);
            ctx.error_message = outcome.message;
            PF_LOG_ERROR_CTX(log_category::orchestrator,
                             std::string("download failed: ") + to_string(outcome.kind), ctx);
        }
        return outcome;
    };

    if (auto valid = validate_url(url); !valid) {
        return finish(download_outcome::failure(failure_kind::usage_error, valid.error(), true));
    }

    // Probing
    impl_->set_state(download_state::probing);
    auto target = probe(url);
    if (!target) {
        return finish(download_outcome::failure(to_failure_kind(target.error().code),
                                                target.error(), true));
    }
    ctx.total_size = target.value().total_size;

    // Planning
    impl_->set_state(download_state::planning);
    auto ranges = range_planner::plan(target.value().total_size, impl_->config.parallelism);
    if (!ranges) {
        return finish(download_outcome::failure(to_failure_kind(ranges.error().code),
                                                ranges.error(), true));
    }
    PF_LOG_INFO_CTX(log_category::planner,
                    "planned " + std::to_string(ranges.value().size()) + " ranges", ctx);

    // Fetching
    impl_->set_state(download_state::fetching);
    auto batch = impl_->run_fetches(target.value(), ranges.value());
    if (!batch.failures.empty()) {
        auto cause = summarize_failures(batch.failures, ranges.value().size());
        auto outcome = download_outcome::failure(failure_kind::partial_fetch_failure,
                                                 std::move(cause), true,
                                                 std::move(batch.failures));
        outcome.total_size = target.value().total_size;
        outcome.chunk_count = static_cast<uint32_t>(ranges.value().size());
        outcome.total_attempts = batch.attempts;
        return finish(std::move(outcome));
    }

    // Validating
    impl_->set_state(download_state::validating);
    const auto reference = select_reference_validator(target.value(), batch.chunks);
    if (auto consistent = validate_chunks(reference, batch.chunks); !consistent) {
        return finish(download_outcome::failure(failure_kind::validator_mismatch,
                                                consistent.error(), true));
    }

    // Assembling
    impl_->set_state(download_state::assembling);
    auto assembled =
        impl_->assembler.assemble(batch.chunks, target.value().total_size, output_path);
    if (!assembled) {
        return finish(download_outcome::failure(to_failure_kind(assembled.error().code),
                                                assembled.error(), true));
    }

    // Verifying
    if (impl_->config.check_etag) {
        impl_->set_state(download_state::verifying);
        if (auto verified = impl_->verify(reference, output_path); !verified) {
            std::error_code ec;
            std::filesystem::remove(output_path, ec);
            if (ec) {
                PF_LOG_WARN(log_category::orchestrator,
                            "failed to remove " + output_path.string() + ": " + ec.message());
            }
            return finish(download_outcome::failure(to_failure_kind(verified.error().code),
                                                    verified.error(), !ec));
        }
    }

    auto outcome = download_outcome::success(assembled.value());
    outcome.total_size = target.value().total_size;
    outcome.chunk_count = static_cast<uint32_t>(ranges.value().size());
    outcome.total_attempts = batch.attempts;
    return finish(std::move(outcome));
}

}  // namespace kcenon::parallel_fetch

/**
 * @file fetch_orchestrator.h
 * @brief Coordination of one parallel byte-range download
 */

#ifndef KCENON_PARALLEL_FETCH_CLIENT_FETCH_ORCHESTRATOR_H
#define KCENON_PARALLEL_FETCH_CLIENT_FETCH_ORCHESTRATOR_H

#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "kcenon/parallel_fetch/adapters/fetch_executor.h"
#include "kcenon/parallel_fetch/client/download_types.h"
#include "kcenon/parallel_fetch/core/chunk_assembler.h"
#include "kcenon/parallel_fetch/core/chunk_types.h"
#include "kcenon/parallel_fetch/core/types.h"
#include "kcenon/parallel_fetch/transport/http_transport.h"

namespace kcenon::parallel_fetch {

/**
 * @brief Downloads a remote file through concurrent range requests
 *
 * A download runs probing, planning, fetching, validating, assembling and
 * (optionally) verifying in that order. Every range is fetched as its own
 * task; the orchestrator waits for all of them before it checks the
 * validators, so a failed download never leaves an output file behind.
 *
 * @code
 * auto orchestrator = fetch_orchestrator::builder()
 *     .with_parallelism(8)
 *     .with_max_retries(3)
 *     .with_check_etag(true)
 *     .build();
 *
 * if (orchestrator.has_value()) {
 *     auto outcome = orchestrator.value().download(url, "/tmp");
 *     return static_cast<int>(outcome.to_exit_code());
 * }
 * @endcode
 */
class fetch_orchestrator {
public:
    using state_callback = std::function<void(download_state)>;

    /**
     * @brief Builder for fetch_orchestrator
     */
    class builder {
    public:
        builder();

        /**
         * @brief Use a specific transport
         *
         * Without one, build() creates a network_system transport.
         * @return Reference to builder for chaining
         */
        auto with_transport(std::shared_ptr<http_transport_interface> transport) -> builder&;

        /**
         * @brief Use a specific executor for the chunk tasks
         *
         * Without one, each download creates the best available executor
         * sized to its number of ranges.
         * @return Reference to builder for chaining
         */
        auto with_executor(std::shared_ptr<adapters::fetch_executor_interface> executor)
            -> builder&;

        /**
         * @brief Replace the whole configuration
         * @return Reference to builder for chaining
         */
        auto with_config(download_config config) -> builder&;

        /**
         * @brief Set number of concurrent range requests
         * @param parallelism Number of ranges (default: 4)
         * @return Reference to builder for chaining
         */
        auto with_parallelism(uint32_t parallelism) -> builder&;

        /**
         * @brief Set number of additional attempts per range
         * @param max_retries Retries after the first attempt (default: 3)
         * @return Reference to builder for chaining
         */
        auto with_max_retries(uint32_t max_retries) -> builder&;

        auto with_retry_policy(retry_policy policy) -> builder&;

        /**
         * @brief Set per-request timeout of the default transport
         * @return Reference to builder for chaining
         */
        auto with_timeout(std::chrono::milliseconds timeout) -> builder&;

        /**
         * @brief Verify the MD5 of the assembled file against the ETag
         * @return Reference to builder for chaining
         */
        auto with_check_etag(bool enable) -> builder&;

        /**
         * @brief Stop pending retries once a range failed terminally
         * @param enable Enable eager cancellation (default: true)
         * @return Reference to builder for chaining
         */
        auto with_cancel_on_failure(bool enable) -> builder&;

        auto with_user_agent(std::string user_agent) -> builder&;

        /**
         * @brief Use a specific assembler
         * @return Reference to builder for chaining
         */
        auto with_assembler(chunk_assembler assembler) -> builder&;

        /**
         * @brief Observe state transitions
         * @return Reference to builder for chaining
         */
        auto with_state_callback(state_callback callback) -> builder&;

        /**
         * @brief Build the orchestrator instance
         * @return Result containing the orchestrator or an error
         */
        [[nodiscard]] auto build() -> result<fetch_orchestrator>;

    private:
        download_config config_;
        std::shared_ptr<http_transport_interface> transport_;
        std::shared_ptr<adapters::fetch_executor_interface> executor_;
        std::optional<chunk_assembler> assembler_;
        state_callback state_callback_;
    };

    // Non-copyable, movable
    fetch_orchestrator(const fetch_orchestrator&) = delete;
    auto operator=(const fetch_orchestrator&) -> fetch_orchestrator& = delete;
    fetch_orchestrator(fetch_orchestrator&&) noexcept;
    auto operator=(fetch_orchestrator&&) noexcept -> fetch_orchestrator&;
    ~fetch_orchestrator();

    /**
     * @brief Download a URL
     * @param url Resource URL
     * @param output Output directory or file; current directory when nullopt
     * @return Outcome of the download
     */
    [[nodiscard]] auto download(const std::string& url,
                                const std::optional<std::string>& output = std::nullopt)
        -> download_outcome;

    /**
     * @brief Download a URL to an already resolved file path
     */
    [[nodiscard]] auto download_to(const std::string& url,
                                   const std::filesystem::path& output_path)
        -> download_outcome;

    /**
     * @brief Learn size and validator of the resource
     *
     * HEAD is tried first. When it does not establish range support and a
     * size, a one-byte ranged GET decides.
     */
    [[nodiscard]] auto probe(const std::string& url) -> result<download_target>;

    /**
     * @brief State of the current or last download
     */
    [[nodiscard]] auto state() const -> download_state;

    [[nodiscard]] auto config() const -> const download_config&;

    /**
     * @brief Validator every chunk must match
     * @return Probe validator, else the validator of the lowest-index chunk
     *         that has one, else nullopt
     */
    [[nodiscard]] static auto select_reference_validator(
        const download_target& target,
        const std::vector<chunk_result>& chunks) -> std::optional<content_validator>;

    /**
     * @brief Check every non-empty chunk against the reference validator
     * @return validator_mismatch naming the first offending range
     */
    [[nodiscard]] static auto validate_chunks(
        const std::optional<content_validator>& reference,
        const std::vector<chunk_result>& chunks) -> result<void>;

private:
    fetch_orchestrator(download_config config,
                       std::shared_ptr<http_transport_interface> transport,
                       std::shared_ptr<adapters::fetch_executor_interface> executor,
                       chunk_assembler assembler,
                       state_callback callback);

    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::parallel_fetch

#endif  // KCENON_PARALLEL_FETCH_CLIENT_FETCH_ORCHESTRATOR_H

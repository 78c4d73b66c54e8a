/**
 * @file retry_policy.h
 * @brief Backoff configuration for retried chunk requests
 */

#ifndef KCENON_PARALLEL_FETCH_CORE_RETRY_POLICY_H
#define KCENON_PARALLEL_FETCH_CORE_RETRY_POLICY_H

#include <chrono>
#include <cstddef>

namespace kcenon::parallel_fetch {

/**
 * @brief Delay schedule between attempts of one request
 *
 * The number of attempts is bounded by the caller's max_retries; this
 * policy only decides how long to wait before each retry.
 */
struct retry_policy {
    /// Delay before the first retry
    std::chrono::milliseconds initial_delay{200};

    /// Upper bound for any single delay
    std::chrono::milliseconds max_delay{5000};

    /// Multiplier for exponential backoff
    double backoff_multiplier = 2.0;

    /// Randomize each delay within [0.5, 1.5) of its nominal value
    bool use_jitter = true;

    /**
     * @brief Policy without any delay, used by tests
     */
    [[nodiscard]] static auto immediate() -> retry_policy {
        retry_policy policy;
        policy.initial_delay = std::chrono::milliseconds(0);
        policy.max_delay = std::chrono::milliseconds(0);
        policy.use_jitter = false;
        return policy;
    }

    /**
     * @brief Delay to wait before the given retry
     * @param retry 1-based retry number (1 = first retry)
     */
    [[nodiscard]] auto delay_for(std::size_t retry) const -> std::chrono::milliseconds;
};

}  // namespace kcenon::parallel_fetch

#endif  // KCENON_PARALLEL_FETCH_CORE_RETRY_POLICY_H

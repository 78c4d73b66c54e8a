/**
 * @file retry_policy.cpp
 * @brief Exponential backoff computation
 */

#include <kcenon/parallel_fetch/core/retry_policy.h>

#include <algorithm>
#include <cstdint>
#include <random>

namespace kcenon::parallel_fetch {

auto retry_policy::delay_for(std::size_t retry) const -> std::chrono::milliseconds {
    auto delay = static_cast<double>(initial_delay.count());

    for (std::size_t i = 1; i < retry; ++i) {
        delay *= backoff_multiplier;
    }

    delay = std::min(delay, static_cast<double>(max_delay.count()));

    if (use_jitter && delay > 0.0) {
        thread_local std::mt19937 gen(std::random_device{}());
        std::uniform_real_distribution<> dis(0.5, 1.5);
        delay *= dis(gen);
    }

    return std::chrono::milliseconds(static_cast<int64_t>(delay));
}

}  // namespace kcenon::parallel_fetch

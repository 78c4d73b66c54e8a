/**
 * @file network_http_transport.cpp
 * @brief network_system backed HTTP transport implementation
 */

#include "kcenon/parallel_fetch/transport/network_http_transport.h"

#include "kcenon/parallel_fetch/config/feature_flags.h"

#if KCENON_WITH_NETWORK_SYSTEM
#include <kcenon/network/core/http_client.h>
#endif

#include <algorithm>
#include <cstddef>

namespace kcenon::parallel_fetch {

// ============================================================================
// Implementation
// ============================================================================

struct network_http_transport::impl {
#if KCENON_WITH_NETWORK_SYSTEM
    std::shared_ptr<kcenon::network::core::http_client> client;
#endif
    std::optional<std::string> user_agent;
    bool available = false;

    impl(std::chrono::milliseconds timeout, std::optional<std::string> agent)
        : user_agent(std::move(agent)) {
#if KCENON_WITH_NETWORK_SYSTEM
        client = std::make_shared<kcenon::network::core::http_client>(timeout);
        available = true;
#else
        (void)timeout;
        available = false;
#endif
    }

    auto request_headers(const std::map<std::string, std::string>& headers) const
        -> std::map<std::string, std::string> {
        auto merged = headers;
        if (user_agent && merged.find("User-Agent") == merged.end()) {
            merged["User-Agent"] = *user_agent;
        }
        return merged;
    }

#if KCENON_WITH_NETWORK_SYSTEM
    static auto convert_response(
        const kcenon::network::internal::http_response& resp) -> http_response {
        http_response converted;
        converted.status_code = resp.status_code;
        converted.headers = resp.headers;
        converted.body.resize(resp.body.size());
        std::transform(resp.body.begin(), resp.body.end(), converted.body.begin(),
                       [](auto c) { return static_cast<std::byte>(c); });
        return converted;
    }
#endif
};

network_http_transport::network_http_transport(
    std::chrono::milliseconds timeout,
    std::optional<std::string> user_agent)
    : impl_(std::make_unique<impl>(timeout, std::move(user_agent))) {}

network_http_transport::~network_http_transport() = default;

network_http_transport::network_http_transport(network_http_transport&&) noexcept = default;
auto network_http_transport::operator=(network_http_transport&&) noexcept
    -> network_http_transport& = default;

// ============================================================================
// HTTP Operations
// ============================================================================

auto network_http_transport::head(
    const std::string& url,
    const std::map<std::string, std::string>& headers)
    -> result<http_response> {
#if KCENON_WITH_NETWORK_SYSTEM
    if (!impl_->client) {
        return unexpected{error{error_code::transport_unavailable,
            "HTTP client not initialized"}};
    }

    auto response = impl_->client->head(url, impl_->request_headers(headers));
    if (response.is_err()) {
        return unexpected{error{error_code::connection_failed,
            "HTTP HEAD request failed: " + response.error().message}};
    }
    return impl_->convert_response(response.value());
#else
    (void)url;
    (void)headers;
    return unexpected{error{error_code::transport_unavailable,
        "HTTP client not available (KCENON_WITH_NETWORK_SYSTEM not defined)"}};
#endif
}

auto network_http_transport::get(
    const std::string& url,
    const std::map<std::string, std::string>& headers)
    -> result<http_response> {
#if KCENON_WITH_NETWORK_SYSTEM
    if (!impl_->client) {
        return unexpected{error{error_code::transport_unavailable,
            "HTTP client not initialized"}};
    }

    auto response = impl_->client->get(url, {}, impl_->request_headers(headers));
    if (response.is_err()) {
        return unexpected{error{error_code::connection_failed,
            "HTTP GET request failed: " + response.error().message}};
    }
    return impl_->convert_response(response.value());
#else
    (void)url;
    (void)headers;
    return unexpected{error{error_code::transport_unavailable,
        "HTTP client not available (KCENON_WITH_NETWORK_SYSTEM not defined)"}};
#endif
}

auto network_http_transport::is_available() const noexcept -> bool {
    return impl_->available;
}

// ============================================================================
// Factory Function
// ============================================================================

auto make_network_http_transport(
    std::chrono::milliseconds timeout,
    std::optional<std::string> user_agent)
    -> std::shared_ptr<network_http_transport> {
    return std::make_shared<network_http_transport>(timeout, std::move(user_agent));
}

}  // namespace kcenon::parallel_fetch

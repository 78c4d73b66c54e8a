/**
 * @file network_http_transport.h
 * @brief HTTP transport backed by network_system
 *
 * Wraps kcenon::network::core::http_client for use by the download core.
 * When parallel_fetch is built without network_system every request fails
 * with error_code::transport_unavailable.
 */

#ifndef KCENON_PARALLEL_FETCH_TRANSPORT_NETWORK_HTTP_TRANSPORT_H
#define KCENON_PARALLEL_FETCH_TRANSPORT_NETWORK_HTTP_TRANSPORT_H

#include "kcenon/parallel_fetch/transport/http_transport.h"

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>

// Forward declaration for network_system HTTP client
namespace kcenon::network::core {
class http_client;
}

namespace kcenon::parallel_fetch {

/**
 * @brief http_transport_interface over network_system's HTTP client
 *
 * @note This transport is thread-safe for concurrent requests.
 */
class network_http_transport : public http_transport_interface {
public:
    /**
     * @brief Construct transport with timeout
     * @param timeout Per-request timeout
     * @param user_agent Optional User-Agent header added to every request
     */
    explicit network_http_transport(
        std::chrono::milliseconds timeout = std::chrono::milliseconds(30000),
        std::optional<std::string> user_agent = std::nullopt);

    ~network_http_transport() override;

    network_http_transport(const network_http_transport&) = delete;
    auto operator=(const network_http_transport&) -> network_http_transport& = delete;
    network_http_transport(network_http_transport&&) noexcept;
    auto operator=(network_http_transport&&) noexcept -> network_http_transport&;

    [[nodiscard]] auto head(
        const std::string& url,
        const std::map<std::string, std::string>& headers)
        -> result<http_response> override;

    [[nodiscard]] auto get(
        const std::string& url,
        const std::map<std::string, std::string>& headers)
        -> result<http_response> override;

    /**
     * @brief Check if the HTTP client is available
     * @return true if network_system is compiled in
     */
    [[nodiscard]] auto is_available() const noexcept -> bool;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

/**
 * @brief Factory function to create the network_system transport
 */
[[nodiscard]] auto make_network_http_transport(
    std::chrono::milliseconds timeout = std::chrono::milliseconds(30000),
    std::optional<std::string> user_agent = std::nullopt)
    -> std::shared_ptr<network_http_transport>;

}  // namespace kcenon::parallel_fetch

#endif  // KCENON_PARALLEL_FETCH_TRANSPORT_NETWORK_HTTP_TRANSPORT_H

/**
 * @file http_transport.h
 * @brief HTTP transport abstraction used by the download core
 *
 * The download core never talks to sockets itself. Probing and ranged
 * fetches go through http_transport_interface, which production code backs
 * with network_system and tests back with an in-memory server.
 */

#ifndef KCENON_PARALLEL_FETCH_TRANSPORT_HTTP_TRANSPORT_H
#define KCENON_PARALLEL_FETCH_TRANSPORT_HTTP_TRANSPORT_H

#include "kcenon/parallel_fetch/core/types.h"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace kcenon::parallel_fetch {

/**
 * @brief HTTP response as seen by the download core
 */
struct http_response {
    /// HTTP status code
    int status_code = 0;

    /// Response headers
    std::map<std::string, std::string> headers;

    /// Response body
    std::vector<std::byte> body;

    /**
     * @brief Get header value by key (case-insensitive)
     */
    [[nodiscard]] auto get_header(const std::string& key) const
        -> std::optional<std::string> {
        auto it = headers.find(key);
        if (it != headers.end()) {
            return it->second;
        }

        auto lower = [](std::string s) {
            std::transform(s.begin(), s.end(), s.begin(),
                           [](unsigned char c) { return std::tolower(c); });
            return s;
        };

        const auto lower_key = lower(key);
        for (const auto& [k, v] : headers) {
            if (lower(k) == lower_key) {
                return v;
            }
        }

        return std::nullopt;
    }

    [[nodiscard]] auto is_success() const noexcept -> bool {
        return status_code >= 200 && status_code < 300;
    }
};

/**
 * @brief Request-level capability the download core depends on
 *
 * Implementations report transport failures (DNS, connect, TLS, timeout,
 * reset) as errors with a connection_* code. Any HTTP status, including
 * 4xx and 5xx, is a successful result carrying that status.
 *
 * @note Implementations must be safe to call from several threads at once.
 */
class http_transport_interface {
public:
    virtual ~http_transport_interface() = default;

    /**
     * @brief Execute HEAD request
     */
    [[nodiscard]] virtual auto head(
        const std::string& url,
        const std::map<std::string, std::string>& headers)
        -> result<http_response> = 0;

    /**
     * @brief Execute GET request
     */
    [[nodiscard]] virtual auto get(
        const std::string& url,
        const std::map<std::string, std::string>& headers)
        -> result<http_response> = 0;
};

}  // namespace kcenon::parallel_fetch

#endif  // KCENON_PARALLEL_FETCH_TRANSPORT_HTTP_TRANSPORT_H

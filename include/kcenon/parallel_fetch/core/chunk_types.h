/**
 * @file chunk_types.h
 * @brief Chunk data structures for parallel_fetch
 *
 * This file defines the byte ranges produced by the range planner, the
 * content validators captured from HTTP responses, and the per-chunk
 * results handed from the fetchers to the assembler.
 */

#ifndef KCENON_PARALLEL_FETCH_CORE_CHUNK_TYPES_H
#define KCENON_PARALLEL_FETCH_CORE_CHUNK_TYPES_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace kcenon::parallel_fetch {

/**
 * @brief Inclusive byte range of the remote resource
 *
 * The degenerate range of an empty resource is marked with `empty` and
 * has a length of zero.
 */
struct chunk_range {
    uint32_t index = 0;
    uint64_t start = 0;
    uint64_t end = 0;
    bool empty = false;

    chunk_range() = default;
    chunk_range(uint32_t i, uint64_t s, uint64_t e) : index(i), start(s), end(e) {}

    /**
     * @brief Create the single empty range used for zero-length resources
     */
    [[nodiscard]] static auto make_empty() -> chunk_range {
        chunk_range r;
        r.empty = true;
        return r;
    }

    [[nodiscard]] auto length() const noexcept -> uint64_t {
        return empty ? 0 : end - start + 1;
    }

    /**
     * @brief Value of the HTTP Range request header, e.g. "bytes=0-249"
     */
    [[nodiscard]] auto to_header() const -> std::string {
        return "bytes=" + std::to_string(start) + "-" + std::to_string(end);
    }

    [[nodiscard]] auto operator==(const chunk_range& other) const -> bool = default;
};

/**
 * @brief Kind of content validator reported by the server
 */
enum class validator_kind {
    etag,
    last_modified
};

[[nodiscard]] constexpr auto to_string(validator_kind kind) -> const char* {
    switch (kind) {
        case validator_kind::etag: return "ETag";
        case validator_kind::last_modified: return "Last-Modified";
        default: return "unknown";
    }
}

/**
 * @brief Opaque token identifying one version of the remote resource
 *
 * ETag values are stored without their surrounding quotes; both kinds are
 * compared for exact equality.
 */
struct content_validator {
    validator_kind kind = validator_kind::etag;
    std::string value;

    [[nodiscard]] static auto etag(std::string v) -> content_validator {
        return content_validator{validator_kind::etag, std::move(v)};
    }

    [[nodiscard]] static auto last_modified(std::string v) -> content_validator {
        return content_validator{validator_kind::last_modified, std::move(v)};
    }

    [[nodiscard]] auto to_string() const -> std::string {
        return std::string(parallel_fetch::to_string(kind)) + "(" + value + ")";
    }

    [[nodiscard]] auto operator==(const content_validator& other) const -> bool = default;
};

/**
 * @brief Bytes of one range together with the validator that came with them
 */
struct chunk_result {
    chunk_range range;
    std::vector<std::byte> data;
    std::optional<content_validator> validator;
    uint32_t attempt_count = 0;
};

/**
 * @brief Remote resource as learned from the probe
 */
struct download_target {
    std::string url;
    uint64_t total_size = 0;
    std::optional<content_validator> validator;
    bool accepts_ranges = true;
};

}  // namespace kcenon::parallel_fetch

#endif  // KCENON_PARALLEL_FETCH_CORE_CHUNK_TYPES_H

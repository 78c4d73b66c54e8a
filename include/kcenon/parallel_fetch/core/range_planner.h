/**
 * @file range_planner.h
 * @brief Splitting of a remote resource into byte ranges
 */

#ifndef KCENON_PARALLEL_FETCH_CORE_RANGE_PLANNER_H
#define KCENON_PARALLEL_FETCH_CORE_RANGE_PLANNER_H

#include <kcenon/parallel_fetch/core/chunk_types.h>
#include <kcenon/parallel_fetch/core/types.h>

#include <cstdint>
#include <vector>

namespace kcenon::parallel_fetch {

/**
 * @brief Plans the byte ranges fetched concurrently for one download
 *
 * The produced ranges are ordered by index, contiguous and disjoint, and
 * their union is exactly [0, total_size). Every range except the last has
 * total_size / parallelism bytes; the last one also takes the remainder.
 */
class range_planner {
public:
    /**
     * @brief Compute the byte ranges for a resource
     * @param total_size Size of the resource in bytes
     * @param parallelism Requested number of concurrent fetches
     * @return Ordered ranges, or invalid_parallelism when parallelism is 0
     *
     * A zero-length resource yields a single empty range. When the resource
     * has fewer bytes than the requested parallelism, one single-byte range
     * per byte is returned.
     */
    [[nodiscard]] static auto plan(uint64_t total_size, uint32_t parallelism)
        -> result<std::vector<chunk_range>>;

    /**
     * @brief Number of ranges plan() produces for the given inputs
     * @return 0 when parallelism is 0
     */
    [[nodiscard]] static auto effective_parallelism(uint64_t total_size,
                                                    uint32_t parallelism) -> uint32_t;
};

}  // namespace kcenon::parallel_fetch

#endif  // KCENON_PARALLEL_FETCH_CORE_RANGE_PLANNER_H

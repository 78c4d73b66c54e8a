/**
 * @file range_planner.cpp
 * @brief Implementation of byte range planning
 */

#include <kcenon/parallel_fetch/core/range_planner.h>

#include <algorithm>

namespace kcenon::parallel_fetch {

auto range_planner::effective_parallelism(uint64_t total_size, uint32_t parallelism)
    -> uint32_t {
    if (parallelism == 0) {
        return 0;
    }
    if (total_size == 0) {
        return 1;
    }
    return static_cast<uint32_t>(std::min<uint64_t>(parallelism, total_size));
}

auto range_planner::plan(uint64_t total_size, uint32_t parallelism)
    -> result<std::vector<chunk_range>> {
    if (parallelism == 0) {
        return unexpected(
            error{error_code::invalid_parallelism, "parallelism must be at least 1"});
    }

    // Handle empty resource case
    if (total_size == 0) {
        return std::vector<chunk_range>{chunk_range::make_empty()};
    }

    const uint32_t count = effective_parallelism(total_size, parallelism);
    const uint64_t base = total_size / count;

    std::vector<chunk_range> ranges;
    ranges.reserve(count);

    uint64_t cursor = 0;
    for (uint32_t i = 0; i < count; ++i) {
        // The last range absorbs the remainder of the integer division
        uint64_t end = (i == count - 1) ? total_size - 1 : cursor + base - 1;
        ranges.emplace_back(i, cursor, end);
        cursor = end + 1;
    }

    return ranges;
}

}  // namespace kcenon::parallel_fetch

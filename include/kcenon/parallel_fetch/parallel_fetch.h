/**
 * @file parallel_fetch.h
 * @brief Main header for parallel_fetch library
 * @version 0.1.0
 *
 * This is the primary include file for the parallel_fetch library.
 * Include this header to access all download functionality.
 *
 * @code
 * #include <kcenon/parallel_fetch/parallel_fetch.h>
 *
 * using namespace kcenon::parallel_fetch;
 *
 * auto orchestrator = fetch_orchestrator::builder()
 *     .with_parallelism(8)
 *     .build();
 *
 * auto outcome = orchestrator.value().download("https://example.com/file.iso", "/tmp");
 * @endcode
 */

#ifndef KCENON_PARALLEL_FETCH_PARALLEL_FETCH_H
#define KCENON_PARALLEL_FETCH_PARALLEL_FETCH_H

#include <string>

// Core
#include "kcenon/parallel_fetch/core/types.h"
#include "kcenon/parallel_fetch/core/chunk_types.h"
#include "kcenon/parallel_fetch/core/range_planner.h"
#include "kcenon/parallel_fetch/core/chunk_fetcher.h"
#include "kcenon/parallel_fetch/core/chunk_assembler.h"
#include "kcenon/parallel_fetch/core/checksum.h"
#include "kcenon/parallel_fetch/core/output_path.h"
#include "kcenon/parallel_fetch/core/logging.h"

// Transport
#include "kcenon/parallel_fetch/transport/http_transport.h"
#include "kcenon/parallel_fetch/transport/network_http_transport.h"

// Client
#include "kcenon/parallel_fetch/client/download_types.h"
#include "kcenon/parallel_fetch/client/fetch_orchestrator.h"

// Adapters
#include "kcenon/parallel_fetch/adapters/fetch_executor.h"

namespace kcenon::parallel_fetch {

/**
 * @brief Library version information
 */
struct version {
    static constexpr int major = 0;
    static constexpr int minor = 1;
    static constexpr int patch = 0;

    /**
     * @brief Get version string
     * @return Version string in format "major.minor.patch"
     */
    static std::string to_string() {
        return std::to_string(major) + "." +
               std::to_string(minor) + "." +
               std::to_string(patch);
    }
};

}  // namespace kcenon::parallel_fetch

#endif  // KCENON_PARALLEL_FETCH_PARALLEL_FETCH_H

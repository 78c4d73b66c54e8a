/**
 * @file output_path.h
 * @brief Resolution of the local output path of a download
 */

#ifndef KCENON_PARALLEL_FETCH_CORE_OUTPUT_PATH_H
#define KCENON_PARALLEL_FETCH_CORE_OUTPUT_PATH_H

#include <kcenon/parallel_fetch/core/types.h>

#include <filesystem>
#include <optional>
#include <string>

namespace kcenon::parallel_fetch {

/// File name used when the URL path has no last segment
inline constexpr const char* default_file_name = "index.html";

/**
 * @brief Check that a URL is an absolute http(s) URL with a host
 */
[[nodiscard]] auto validate_url(const std::string& url) -> result<void>;

/**
 * @brief Last path segment of a URL
 *
 * Query and fragment are ignored. Returns default_file_name when the path
 * is empty or ends with '/'.
 */
[[nodiscard]] auto url_file_name(const std::string& url) -> result<std::string>;

/**
 * @brief Resolve where a download is written
 * @param output User-supplied path; current directory when nullopt
 * @param url Resource URL
 *
 * An existing directory receives the URL's file name. Any other path is
 * used as-is and its parent directory must exist. The target directory
 * must accept new files.
 */
[[nodiscard]] auto resolve_output_path(const std::optional<std::string>& output,
                                       const std::string& url)
    -> result<std::filesystem::path>;

}  // namespace kcenon::parallel_fetch

#endif  // KCENON_PARALLEL_FETCH_CORE_OUTPUT_PATH_H

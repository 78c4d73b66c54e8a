/**
 * @file checksum.h
 * @brief Whole-file digest used to verify a download against its ETag
 */

#ifndef KCENON_PARALLEL_FETCH_CORE_CHECKSUM_H
#define KCENON_PARALLEL_FETCH_CORE_CHECKSUM_H

#include <kcenon/parallel_fetch/core/types.h>

#include <cstddef>
#include <filesystem>
#include <span>
#include <string>

namespace kcenon::parallel_fetch {

/**
 * @brief MD5 digests backed by OpenSSL EVP
 *
 * Servers that store objects in a single part (S3, GCS, most static file
 * servers) report the MD5 of the content as the ETag.
 */
class checksum {
public:
    /**
     * @brief Calculate MD5 digest of data
     * @return Lower-case hex string
     */
    [[nodiscard]] static auto md5(std::span<const std::byte> data) -> result<std::string>;

    /**
     * @brief Calculate MD5 digest of a file
     * @param path Path to the file
     * @return Lower-case hex string, or error
     */
    [[nodiscard]] static auto md5_file(const std::filesystem::path& path)
        -> result<std::string>;

    /**
     * @brief Verify a file against an ETag
     * @param path Path to the file
     * @param etag ETag value with or without quotes; compared case-insensitively
     * @return Success, or checksum_mismatch / file_read_error
     */
    [[nodiscard]] static auto verify_etag(const std::filesystem::path& path,
                                          const std::string& etag) -> result<void>;
};

}  // namespace kcenon::parallel_fetch

#endif  // KCENON_PARALLEL_FETCH_CORE_CHECKSUM_H

/**
 * @file chunk_assembler.h
 * @brief Assembly of fetched chunks into the output file
 */

#ifndef KCENON_PARALLEL_FETCH_CORE_CHUNK_ASSEMBLER_H
#define KCENON_PARALLEL_FETCH_CORE_CHUNK_ASSEMBLER_H

#include <kcenon/parallel_fetch/core/chunk_types.h>
#include <kcenon/parallel_fetch/core/types.h>

#include <cstdint>
#include <filesystem>
#include <functional>
#include <vector>

namespace kcenon::parallel_fetch {

/**
 * @brief Writes chunks at their offsets and publishes the file atomically
 *
 * Assembly goes to a hidden temporary file beside the output which is
 * pre-sized to the total size and renamed onto the output path only after
 * every chunk was written. On failure the temporary file is removed and the
 * output path is left as it was.
 *
 * @code
 * chunk_assembler assembler;
 * auto path = assembler.assemble(chunks, target.total_size, "/tmp/file.bin");
 * if (!path) {
 *     // path.error().code is file_create_error, file_write_error, ...
 * }
 * @endcode
 */
class chunk_assembler {
public:
    /**
     * @brief Hook invoked before each chunk is written
     *
     * Returning an error aborts assembly as if the write had failed.
     */
    using write_hook = std::function<result<void>(const chunk_range&)>;

    chunk_assembler() = default;
    explicit chunk_assembler(write_hook hook);

    /**
     * @brief Assemble chunks into the output file
     * @param chunks Chunk results, in any order
     * @param total_size Size of the resource
     * @param output Final output path
     * @return Output path on success
     */
    [[nodiscard]] auto assemble(const std::vector<chunk_result>& chunks,
                                uint64_t total_size,
                                const std::filesystem::path& output) const
        -> result<std::filesystem::path>;

    /**
     * @brief Check that chunks exactly cover [0, total_size)
     *
     * Each chunk must carry exactly range.length() bytes and the ranges must
     * be contiguous without overlap. For an empty resource only empty ranges
     * are accepted.
     */
    [[nodiscard]] static auto validate_coverage(const std::vector<chunk_result>& chunks,
                                                uint64_t total_size) -> result<void>;

    /**
     * @brief Temporary path used while assembling the given output
     */
    [[nodiscard]] static auto temp_path_for(const std::filesystem::path& output)
        -> std::filesystem::path;

private:
    write_hook hook_;
};

}  // namespace kcenon::parallel_fetch

#endif  // KCENON_PARALLEL_FETCH_CORE_CHUNK_ASSEMBLER_H

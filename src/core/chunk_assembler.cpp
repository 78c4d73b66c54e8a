/**
 * @file chunk_assembler.cpp
 * @brief Implementation of chunk assembly into the output file
 */

#include <kcenon/parallel_fetch/core/chunk_assembler.h>

#include <kcenon/parallel_fetch/core/logging.h>

#include <algorithm>
#include <fstream>
#include <random>

namespace kcenon::parallel_fetch {

namespace {

auto generate_temp_suffix() -> std::string {
    static thread_local std::mt19937 gen(std::random_device{}());
    std::uniform_int_distribution<> dis(0, 15);

    constexpr char hex_chars[] = "0123456789abcdef";
    std::string result = ".tmp_";

    for (int i = 0; i < 16; ++i) {
        result += hex_chars[dis(gen)];
    }

    return result;
}

void remove_temp(const std::filesystem::path& temp) {
    std::error_code ec;
    std::filesystem::remove(temp, ec);
    if (ec) {
        PF_LOG_WARN(log_category::assembler,
                    "failed to remove temp file " + temp.string() + ": " + ec.message());
    }
}

}  // namespace

chunk_assembler::chunk_assembler(write_hook hook) : hook_(std::move(hook)) {}

auto chunk_assembler::temp_path_for(const std::filesystem::path& output)
    -> std::filesystem::path {
    auto dir = output.parent_path();
    if (dir.empty()) {
        dir = ".";
    }
    return dir / ("." + output.filename().string() + generate_temp_suffix());
}

auto chunk_assembler::validate_coverage(const std::vector<chunk_result>& chunks,
                                        uint64_t total_size) -> result<void> {
    if (total_size == 0) {
        for (const auto& c : chunks) {
            if (!c.range.empty || !c.data.empty()) {
                return unexpected(error{error_code::incomplete_coverage,
                                        "non-empty chunk for an empty resource"});
            }
        }
        return {};
    }

    std::vector<const chunk_result*> ordered;
    ordered.reserve(chunks.size());
    for (const auto& c : chunks) {
        if (c.range.empty) {
            return unexpected(error{error_code::incomplete_coverage,
                                    "empty range for a resource of " +
                                        std::to_string(total_size) + " bytes"});
        }
        if (c.data.size() != c.range.length()) {
            return unexpected(error{error_code::incomplete_coverage,
                                    "chunk " + std::to_string(c.range.index) + " carries " +
                                        std::to_string(c.data.size()) + " bytes, expected " +
                                        std::to_string(c.range.length())});
        }
        ordered.push_back(&c);
    }

    std::sort(ordered.begin(), ordered.end(),
              [](const chunk_result* a, const chunk_result* b) {
                  return a->range.start < b->range.start;
              });

    uint64_t cursor = 0;
    for (const auto* c : ordered) {
        if (c->range.start != cursor) {
            return unexpected(error{error_code::incomplete_coverage,
                                    (c->range.start > cursor ? "gap" : "overlap") +
                                        std::string(" at offset ") + std::to_string(cursor)});
        }
        cursor = c->range.end + 1;
    }

    if (cursor != total_size) {
        return unexpected(error{error_code::incomplete_coverage,
                                "chunks cover " + std::to_string(cursor) + " of " +
                                    std::to_string(total_size) + " bytes"});
    }

    return {};
}

auto chunk_assembler::assemble(const std::vector<chunk_result>& chunks,
                               uint64_t total_size,
                               const std::filesystem::path& output) const
    -> result<std::filesystem::path> {
    if (auto coverage = validate_coverage(chunks, total_size); !coverage) {
        return unexpected(coverage.error());
    }

    const auto temp_path = temp_path_for(output);

    download_log_context ctx;
    ctx.total_size = total_size;
    ctx.output_path = output.string();
    PF_LOG_DEBUG_CTX(log_category::assembler, "assembling into " + temp_path.string(), ctx);

    {
        std::ofstream file(temp_path, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            return unexpected(error{error_code::file_create_error,
                                    "cannot create temp file: " + temp_path.string()});
        }

        // Pre-allocate file size
        if (total_size > 0) {
            file.seekp(static_cast<std::streamoff>(total_size - 1));
            file.put('\0');
            if (!file.good()) {
                file.close();
                remove_temp(temp_path);
                return unexpected(error{error_code::file_write_error,
                                        "cannot pre-size temp file to " +
                                            std::to_string(total_size) + " bytes"});
            }
        }

        for (const auto& c : chunks) {
            if (c.range.empty) {
                continue;
            }

            if (hook_) {
                if (auto hooked = hook_(c.range); !hooked) {
                    file.close();
                    remove_temp(temp_path);
                    return unexpected(hooked.error());
                }
            }

            file.seekp(static_cast<std::streamoff>(c.range.start));
            if (!file.good()) {
                file.close();
                remove_temp(temp_path);
                return unexpected(error{error_code::file_write_error,
                                        "seek failed for chunk " +
                                            std::to_string(c.range.index)});
            }

            file.write(reinterpret_cast<const char*>(c.data.data()),
                       static_cast<std::streamsize>(c.data.size()));
            if (!file.good()) {
                file.close();
                remove_temp(temp_path);
                return unexpected(error{error_code::file_write_error,
                                        "write failed for chunk " +
                                            std::to_string(c.range.index)});
            }
        }

        file.close();
        if (file.fail()) {
            remove_temp(temp_path);
            return unexpected(error{error_code::file_write_error,
                                    "failed to flush temp file: " + temp_path.string()});
        }
    }

    std::error_code ec;
    std::filesystem::rename(temp_path, output, ec);
    if (ec) {
        remove_temp(temp_path);
        return unexpected(error{error_code::file_rename_error,
                                "failed to move file to " + output.string() + ": " +
                                    ec.message()});
    }

    PF_LOG_INFO_CTX(log_category::assembler, "assembled " + output.string(), ctx);
    return output;
}

}  // namespace kcenon::parallel_fetch

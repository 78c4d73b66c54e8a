/**
 * @file checksum.cpp
 * @brief Implementation of MD5 digests
 */

#include <kcenon/parallel_fetch/core/checksum.h>

#include <openssl/err.h>
#include <openssl/evp.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <vector>

namespace kcenon::parallel_fetch {

namespace {

constexpr std::size_t read_buffer_size = 64 * 1024;

auto get_openssl_error() -> std::string {
    unsigned long err = ERR_get_error();
    if (err == 0) {
        return "Unknown OpenSSL error";
    }
    std::array<char, 256> buffer{};
    ERR_error_string_n(err, buffer.data(), buffer.size());
    return std::string(buffer.data());
}

/**
 * @brief RAII wrapper for EVP_MD_CTX
 */
class evp_md_ctx_wrapper {
public:
    evp_md_ctx_wrapper() : ctx_(EVP_MD_CTX_new()) {}

    ~evp_md_ctx_wrapper() {
        if (ctx_) {
            EVP_MD_CTX_free(ctx_);
        }
    }

    evp_md_ctx_wrapper(const evp_md_ctx_wrapper&) = delete;
    auto operator=(const evp_md_ctx_wrapper&) -> evp_md_ctx_wrapper& = delete;

    [[nodiscard]] auto get() const -> EVP_MD_CTX* { return ctx_; }
    [[nodiscard]] explicit operator bool() const { return ctx_ != nullptr; }

private:
    EVP_MD_CTX* ctx_;
};

auto to_hex(const unsigned char* digest, unsigned int length) -> std::string {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (unsigned int i = 0; i < length; ++i) {
        oss << std::setw(2) << static_cast<int>(digest[i]);
    }
    return oss.str();
}

auto begin_md5(evp_md_ctx_wrapper& ctx) -> result<void> {
    if (!ctx) {
        return unexpected(error{error_code::internal_error, "Failed to allocate digest context"});
    }
    if (EVP_DigestInit_ex(ctx.get(), EVP_md5(), nullptr) != 1) {
        return unexpected(error{error_code::internal_error,
                                "MD5 init failed: " + get_openssl_error()});
    }
    return {};
}

auto finish_md5(evp_md_ctx_wrapper& ctx) -> result<std::string> {
    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int length = 0;
    if (EVP_DigestFinal_ex(ctx.get(), digest.data(), &length) != 1) {
        return unexpected(error{error_code::internal_error,
                                "MD5 finalization failed: " + get_openssl_error()});
    }
    return to_hex(digest.data(), length);
}

auto normalize_etag(const std::string& etag) -> std::string {
    std::string value = etag;
    value.erase(std::remove(value.begin(), value.end(), '"'), value.end());
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

}  // namespace

auto checksum::md5(std::span<const std::byte> data) -> result<std::string> {
    evp_md_ctx_wrapper ctx;
    if (auto init = begin_md5(ctx); !init) {
        return unexpected(init.error());
    }

    if (!data.empty() && EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1) {
        return unexpected(error{error_code::internal_error,
                                "MD5 update failed: " + get_openssl_error()});
    }

    return finish_md5(ctx);
}

auto checksum::md5_file(const std::filesystem::path& path) -> result<std::string> {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return unexpected(
            error{error_code::file_read_error, "Failed to open file: " + path.string()});
    }

    evp_md_ctx_wrapper ctx;
    if (auto init = begin_md5(ctx); !init) {
        return unexpected(init.error());
    }

    std::vector<char> buffer(read_buffer_size);
    while (file) {
        file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        const auto count = file.gcount();
        if (count > 0 &&
            EVP_DigestUpdate(ctx.get(), buffer.data(), static_cast<std::size_t>(count)) != 1) {
            return unexpected(error{error_code::internal_error,
                                    "MD5 update failed: " + get_openssl_error()});
        }
    }

    if (file.bad()) {
        return unexpected(
            error{error_code::file_read_error, "Failed to read file: " + path.string()});
    }

    return finish_md5(ctx);
}

auto checksum::verify_etag(const std::filesystem::path& path, const std::string& etag)
    -> result<void> {
    auto digest = md5_file(path);
    if (!digest) {
        return unexpected(digest.error());
    }

    const auto expected = normalize_etag(etag);
    if (digest.value() != expected) {
        return unexpected(error{error_code::checksum_mismatch,
                                "MD5 " + digest.value() + " does not match ETag " + expected});
    }

    return {};
}

}  // namespace kcenon::parallel_fetch

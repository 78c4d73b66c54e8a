/**
 * @file output_path.cpp
 * @brief Implementation of output path resolution
 */

#include <kcenon/parallel_fetch/core/output_path.h>
#include <kcenon/parallel_fetch/core/chunk_assembler.h>

#include <algorithm>
#include <cctype>
#include <fstream>

namespace kcenon::parallel_fetch {

namespace {

struct url_parts {
    std::string scheme;
    std::string host;
    std::string path;
};

auto split_url(const std::string& url) -> std::optional<url_parts> {
    const auto scheme_end = url.find("://");
    if (scheme_end == std::string::npos || scheme_end == 0) {
        return std::nullopt;
    }

    url_parts parts;
    parts.scheme = url.substr(0, scheme_end);
    std::transform(parts.scheme.begin(), parts.scheme.end(), parts.scheme.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    const auto authority_start = scheme_end + 3;
    const auto path_start = url.find_first_of("/?#", authority_start);
    parts.host = url.substr(authority_start, path_start == std::string::npos
                                                 ? std::string::npos
                                                 : path_start - authority_start);

    // Drop userinfo
    if (auto at = parts.host.rfind('@'); at != std::string::npos) {
        parts.host = parts.host.substr(at + 1);
    }

    if (path_start != std::string::npos && url[path_start] == '/') {
        const auto path_end = url.find_first_of("?#", path_start);
        parts.path = url.substr(path_start, path_end == std::string::npos
                                                ? std::string::npos
                                                : path_end - path_start);
    }

    return parts;
}

// Create and remove a file where the assembler will put its temp file
auto check_writable(const std::filesystem::path& target) -> result<void> {
    const auto scratch = chunk_assembler::temp_path_for(target);
    {
        std::ofstream file(scratch, std::ios::binary);
        if (!file) {
            auto dir = target.parent_path();
            return unexpected(error{error_code::invalid_output_path,
                                    "output directory is not writable: " +
                                        (dir.empty() ? std::string(".") : dir.string())});
        }
    }

    std::error_code ec;
    std::filesystem::remove(scratch, ec);
    if (ec) {
        return unexpected(error{error_code::invalid_output_path,
                                "cannot remove " + scratch.string() + ": " + ec.message()});
    }
    return {};
}

}  // namespace

auto validate_url(const std::string& url) -> result<void> {
    auto parts = split_url(url);
    if (!parts) {
        return unexpected(error{error_code::invalid_url, "not an absolute URL: " + url});
    }
    if (parts->scheme != "http" && parts->scheme != "https") {
        return unexpected(
            error{error_code::invalid_url, "unsupported scheme '" + parts->scheme + "'"});
    }
    if (parts->host.empty()) {
        return unexpected(error{error_code::invalid_url, "URL has no host: " + url});
    }
    return {};
}

auto url_file_name(const std::string& url) -> result<std::string> {
    if (auto valid = validate_url(url); !valid) {
        return unexpected(valid.error());
    }

    const auto path = split_url(url)->path;
    const auto slash = path.rfind('/');
    std::string name = slash == std::string::npos ? path : path.substr(slash + 1);

    if (name.empty() || name == "." || name == "..") {
        return std::string(default_file_name);
    }
    return name;
}

auto resolve_output_path(const std::optional<std::string>& output, const std::string& url)
    -> result<std::filesystem::path> {
    auto name = url_file_name(url);
    if (!name) {
        return unexpected(name.error());
    }

    std::filesystem::path path = output ? std::filesystem::path(*output)
                                        : std::filesystem::current_path();
    if (path.empty()) {
        return unexpected(error{error_code::invalid_output_path, "output path is empty"});
    }

    std::error_code ec;
    if (std::filesystem::is_directory(path, ec)) {
        auto target = path / name.value();
        if (auto writable = check_writable(target); !writable) {
            return unexpected(writable.error());
        }
        return target;
    }

    auto parent = path.parent_path();
    if (parent.empty()) {
        parent = ".";
    }
    if (!std::filesystem::is_directory(parent, ec)) {
        return unexpected(error{error_code::invalid_output_path,
                                "parent directory does not exist: " + parent.string()});
    }

    if (!path.has_filename()) {
        return unexpected(
            error{error_code::invalid_output_path, "output path has no file name"});
    }

    if (auto writable = check_writable(path); !writable) {
        return unexpected(writable.error());
    }

    return path;
}

}  // namespace kcenon::parallel_fetch

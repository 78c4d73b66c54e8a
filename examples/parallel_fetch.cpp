/**
 * @file parallel_fetch.cpp
 * @brief Command-line downloader splitting a file into concurrent range requests
 *
 * Exit codes:
 *   0 success
 *   1 unexpected error
 *   2 usage error
 *   3 server does not support range requests
 *   4 probe or network failure, retries exhausted
 *   5 resource changed during download (validator mismatch)
 *   6 local I/O error
 *   7 checksum mismatch
 */

#include <kcenon/parallel_fetch/parallel_fetch.h>

#include <charconv>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>

using namespace kcenon::parallel_fetch;

namespace {

/**
 * @brief Format bytes into human-readable string
 */
auto format_bytes(uint64_t bytes) -> std::string {
    constexpr uint64_t KB = 1024;
    constexpr uint64_t MB = KB * 1024;
    constexpr uint64_t GB = MB * 1024;

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);

    if (bytes >= GB) {
        oss << static_cast<double>(bytes) / static_cast<double>(GB) << " GB";
    } else if (bytes >= MB) {
        oss << static_cast<double>(bytes) / static_cast<double>(MB) << " MB";
    } else if (bytes >= KB) {
        oss << static_cast<double>(bytes) / static_cast<double>(KB) << " KB";
    } else {
        oss << bytes << " bytes";
    }
    return oss.str();
}

auto parse_number(const char* text, uint64_t& out) -> bool {
    const auto* end = text + std::strlen(text);
    auto [ptr, ec] = std::from_chars(text, end, out);
    return ec == std::errc{} && ptr == end && ptr != text;
}

auto usage_error(const std::string& message) -> int {
    std::cerr << "Error: " << message << std::endl;
    std::cerr << "Run with --help for usage." << std::endl;
    return static_cast<int>(exit_code::usage_error);
}

struct cli_options {
    std::string url;
    std::optional<std::string> output;
    download_config config;
    log_level level = log_level::info;
    bool json_log = false;
};

}  // namespace

void print_usage(const char* program) {
    std::cout << "parallel_fetch " << version::to_string()
              << " - download a file with concurrent range requests" << std::endl;
    std::cout << std::endl;
    std::cout << "Usage: " << program << " -u <url> [options]" << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  -u, --url <url>          URL to download (required)" << std::endl;
    std::cout << "  -o, --output <path>      Output directory or file (default: current directory)" << std::endl;
    std::cout << "  -n, --parallelism <N>    Number of concurrent range requests (default: 4)" << std::endl;
    std::cout << "  -r, --max-retries <N>    Retries per range after the first attempt (default: 3)" << std::endl;
    std::cout << "  -c, --check-etag         Verify the file's MD5 against the server ETag" << std::endl;
    std::cout << "  --timeout <ms>           Per-request timeout in milliseconds (default: 30000)" << std::endl;
    std::cout << "  --log-level <level>      trace, debug, info, warn, error (default: info)" << std::endl;
    std::cout << "  --json-log               Emit log lines as JSON" << std::endl;
    std::cout << "  -h, --help               Show this help message" << std::endl;
    std::cout << std::endl;
    std::cout << "Examples:" << std::endl;
    std::cout << "  " << program << " -u https://example.com/image.iso" << std::endl;
    std::cout << "  " << program << " -u https://example.com/data.bin -o ./downloads -n 8 -c" << std::endl;
}

int main(int argc, char* argv[]) {
    cli_options options;

    // Parse command line arguments
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        auto require_value = [&]() -> const char* {
            return (i + 1 < argc) ? argv[++i] : nullptr;
        };

        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return static_cast<int>(exit_code::success);
        } else if (arg == "-u" || arg == "--url") {
            const char* value = require_value();
            if (!value) {
                return usage_error("--url requires an argument");
            }
            options.url = value;
        } else if (arg == "-o" || arg == "--output") {
            const char* value = require_value();
            if (!value) {
                return usage_error("--output requires an argument");
            }
            options.output = value;
        } else if (arg == "-n" || arg == "--parallelism") {
            const char* value = require_value();
            uint64_t n = 0;
            if (!value || !parse_number(value, n) || n > max_parallelism) {
                return usage_error("--parallelism requires a number between 1 and " +
                                   std::to_string(max_parallelism));
            }
            options.config.parallelism = static_cast<uint32_t>(n);
        } else if (arg == "-r" || arg == "--max-retries") {
            const char* value = require_value();
            uint64_t n = 0;
            if (!value || !parse_number(value, n) || n > UINT32_MAX) {
                return usage_error("--max-retries requires a non-negative number");
            }
            options.config.max_retries = static_cast<uint32_t>(n);
        } else if (arg == "-c" || arg == "--check-etag") {
            options.config.check_etag = true;
        } else if (arg == "--timeout") {
            const char* value = require_value();
            uint64_t ms = 0;
            if (!value || !parse_number(value, ms) || ms == 0) {
                return usage_error("--timeout requires a positive number of milliseconds");
            }
            options.config.request_timeout = std::chrono::milliseconds(ms);
        } else if (arg == "--log-level") {
            const char* value = require_value();
            auto level = value ? log_level_from_string(value) : std::nullopt;
            if (!level) {
                return usage_error("--log-level requires one of trace, debug, info, warn, error");
            }
            options.level = *level;
        } else if (arg == "--json-log") {
            options.json_log = true;
        } else {
            return usage_error("unknown option '" + arg + "'");
        }
    }

    if (options.url.empty()) {
        return usage_error("--url is required");
    }

    auto& logger = get_logger();
    logger.set_level(options.level);
    logger.set_output_format(options.json_log ? log_output_format::json
                                              : log_output_format::text);
    logger.initialize();

    auto orchestrator = fetch_orchestrator::builder()
        .with_config(options.config)
        .with_user_agent("parallel_fetch/" + version::to_string())
        .build();

    if (!orchestrator.has_value()) {
        const auto& err = orchestrator.error();
        std::cerr << "Error: " << err.message << std::endl;
        logger.shutdown();
        return static_cast<int>(to_exit_code(to_failure_kind(err.code)));
    }

    auto outcome = orchestrator.value().download(options.url, options.output);

    if (outcome.is_success()) {
        std::cout << "Downloaded " << outcome.output_path.string() << " ("
                  << format_bytes(outcome.total_size) << " in " << outcome.chunk_count
                  << " ranges, " << outcome.elapsed.count() << " ms)" << std::endl;
    } else {
        std::cerr << "Download failed: " << to_string(outcome.kind) << std::endl;
        std::cerr << "  " << outcome.message << std::endl;
        for (const auto& failed : outcome.failed_ranges) {
            std::cerr << "  range " << failed.range.index << " [" << failed.range.start << "-"
                      << failed.range.end << "]: " << failed.cause.message << std::endl;
        }
    }

    logger.flush();
    logger.shutdown();
    return static_cast<int>(outcome.to_exit_code());
}

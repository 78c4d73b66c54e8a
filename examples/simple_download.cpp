/**
 * @file simple_download.cpp
 * @brief Basic parallel download example
 *
 * This example demonstrates how to:
 * - Configure an orchestrator through its builder
 * - Observe the download state machine
 * - Capture structured log records through the logger callback
 * - Inspect a failed outcome
 */

#include <kcenon/parallel_fetch/parallel_fetch.h>

#include <exception>
#include <iostream>
#include <optional>
#include <string>

using namespace kcenon::parallel_fetch;

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " <url> [output] [parallelism]" << std::endl;
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    std::string url = argv[1];
    std::optional<std::string> output;
    if (argc > 2) {
        output = argv[2];
    }
    uint32_t parallelism = 4;
    if (argc > 3) {
        try {
            parallelism = static_cast<uint32_t>(std::stoul(argv[3]));
        } catch (const std::exception&) {
            print_usage(argv[0]);
            return 2;
        }
    }

    // Route warnings and errors through a callback instead of stderr
    auto& logger = get_logger();
    logger.set_console_output(false);
    logger.set_callback([](log_level level, std::string_view category,
                           std::string_view message, const download_log_context* ctx) {
        if (level < log_level::warn) {
            return;
        }
        std::cerr << "[" << log_level_to_string(level) << "] " << category << ": " << message;
        if (ctx && ctx->chunk_index) {
            std::cerr << " (range " << *ctx->chunk_index << ")";
        }
        std::cerr << std::endl;
    });

    auto orchestrator = fetch_orchestrator::builder()
        .with_parallelism(parallelism)
        .with_max_retries(3)
        .with_state_callback([](download_state state) {
            std::cout << "-> " << to_string(state) << std::endl;
        })
        .build();

    if (!orchestrator.has_value()) {
        std::cerr << "Cannot create orchestrator: " << orchestrator.error().message << std::endl;
        return 1;
    }

    auto outcome = orchestrator.value().download(url, output);
    if (!outcome.is_success()) {
        std::cerr << to_string(outcome.kind) << ": " << outcome.message << std::endl;
        return static_cast<int>(outcome.to_exit_code());
    }

    std::cout << "Saved " << outcome.output_path.string() << " (" << outcome.total_size
              << " bytes, " << outcome.total_attempts << " requests)" << std::endl;
    return 0;
}

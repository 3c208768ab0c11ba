/**
 * @file simple_copy.cpp
 * @brief Folder-to-folder copy through the bulk-copy utility
 *
 * This example demonstrates:
 * - Building a transfer_engine with a session store
 * - Letting the engine tune threads and retries from the endpoints
 * - Following live progress and the utility's log lines
 * - Cancelling a running copy with Ctrl+C
 */

#include <kcenon/ultracopy/ultracopy.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>

using namespace kcenon::ultracopy;

namespace {

std::atomic<bool> interrupted{false};

void signal_handler(int /*signal*/) {
    interrupted = true;
}

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " <source> <destination> [options]\n"
              << "\nOptions:\n"
              << "  --mode <full|incremental|mirror>  Copy mode (default: full)\n"
              << "  --threads <n>                     Thread count when --no-optimize is set\n"
              << "  --no-optimize                     Keep the request's own tuning\n"
              << "  --exclude-dir <name>              Skip a directory (repeatable)\n"
              << "  --exclude-file <pattern>          Skip files matching a pattern (repeatable)\n"
              << "  --exe <path>                      Bulk-copy executable (default: robocopy)\n"
              << "  --log <file>                      Append the utility's log to a file\n"
              << "  --help                            Show this help message\n";
}

}  // namespace

int main(int argc, char* argv[]) {
    if (argc < 3) {
        print_usage(argv[0]);
        return 1;
    }

    transfer_request request;
    request.source = argv[1];
    request.destination = argv[2];

    std::string executable = "robocopy";
    std::string log_file;
    bool auto_optimize = true;

    for (int i = 3; i < argc; ++i) {
        if (std::strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        } else if (std::strcmp(argv[i], "--mode") == 0 && i + 1 < argc) {
            request.mode = parse_transfer_mode(argv[++i]);
        } else if (std::strcmp(argv[i], "--threads") == 0 && i + 1 < argc) {
            request.thread_count = std::stoi(argv[++i]);
        } else if (std::strcmp(argv[i], "--no-optimize") == 0) {
            auto_optimize = false;
        } else if (std::strcmp(argv[i], "--exclude-dir") == 0 && i + 1 < argc) {
            request.exclude_dirs.emplace_back(argv[++i]);
        } else if (std::strcmp(argv[i], "--exclude-file") == 0 && i + 1 < argc) {
            request.exclude_files.emplace_back(argv[++i]);
        } else if (std::strcmp(argv[i], "--exe") == 0 && i + 1 < argc) {
            executable = argv[++i];
        } else if (std::strcmp(argv[i], "--log") == 0 && i + 1 < argc) {
            log_file = argv[++i];
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    auto history = std::make_shared<session_history>();

    auto builder = transfer_engine::builder();
    builder.with_executable(executable)
        .with_auto_optimize(auto_optimize)
        .with_session_store(history);
    if (!log_file.empty()) {
        builder.with_log_file(log_file);
    }

    auto built = builder.build();
    if (!built) {
        std::cerr << "Failed to create engine: " << built.error().message << "\n";
        return 1;
    }
    auto& engine = built.value();

    auto route = engine.plan(request);
    if (!route) {
        std::cerr << "Invalid request: " << route.error().message << "\n";
        return 1;
    }

    std::cout << "=== Bulk Copy ===\n";
    std::cout << "Source:      " << request.source << "\n";
    std::cout << "Destination: " << request.destination << "\n";
    std::cout << "Mode:        " << to_string(request.mode) << "\n";
    std::cout << "Route:       " << to_string(route.value()) << "\n\n";

    engine.on_log([](const std::string& line) {
        std::cout << "  | " << line << "\n";
    });

    engine.on_progress([](const transfer_statistics& stats) {
        std::cout << "\r[" << stats.files_copied << " files, "
                  << format_bytes(stats.bytes_copied) << ", "
                  << std::fixed << std::setprecision(1) << stats.speed_mbps << " MB/s]"
                  << std::flush;
    });

    if (auto started = engine.start(request); !started) {
        std::cerr << "Failed to start: " << started.error().message << "\n";
        return 1;
    }

    while (!engine.wait(std::chrono::milliseconds(200))) {
        if (interrupted) {
            std::cout << "\nCancelling...\n";
            engine.cancel();
            interrupted = false;
        }
    }

    auto outcome = engine.last_outcome();
    if (!outcome) {
        std::cerr << "\nNo outcome reported\n";
        return 1;
    }

    const auto& stats = outcome->statistics;
    std::cout << "\n\n=== Result: " << to_string(outcome->status) << " ===\n";
    std::cout << "Files copied: " << stats.files_copied << "\n";
    std::cout << "Bytes copied: " << format_bytes(stats.bytes_copied) << "\n";
    std::cout << "Errors:       " << stats.error_count << "\n";
    std::cout << "Elapsed:      " << format_duration(stats.elapsed()) << "\n";
    if (stats.exit_code) {
        std::cout << "Exit code:    " << *stats.exit_code << "\n";
    }
    if (outcome->err) {
        std::cout << "Error:        " << outcome->err->message << "\n";
    }

    auto summary = history->summary();
    std::cout << "Sessions recorded: " << summary.total_sessions
              << " (avg " << summary.average_speed_mbps << " MB/s)\n";

    return outcome->succeeded() ? 0 : 1;
}

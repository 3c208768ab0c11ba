/**
 * @file archive_example.cpp
 * @brief Compressing a folder before a transfer and extracting it afterwards
 *
 * This example demonstrates:
 * - Choosing an archive format by name or from the file extension
 * - Excluding build output and VCS folders with patterns
 * - Following per-entry progress
 * - Extracting into a fresh directory
 */

#include <kcenon/ultracopy/ultracopy.h>

#include <cstring>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

using namespace kcenon::ultracopy;

namespace {

void print_usage(const char* program) {
    std::cout << "Usage:\n"
              << "  " << program << " compress <folder> <archive> [options]\n"
              << "  " << program << " extract <archive> <output-dir> [--format <name>]\n"
              << "\nOptions:\n"
              << "  --format <zip|tar|tar.gz|tar.lz4>  Archive format (default: from extension)\n"
              << "  --level <0-9>                      Compression level (default: 6)\n"
              << "  --exclude <pattern>                Skip matching names (repeatable)\n";
}

void print_stats(const archive_stats& stats) {
    std::cout << "Files:      " << stats.processed_files << "/" << stats.total_files << "\n";
    std::cout << "Bytes:      " << stats.total_bytes << "\n";
    std::cout << "Archive:    " << stats.compressed_bytes << " bytes\n";
    std::cout << "Saved:      " << std::fixed << std::setprecision(1)
              << stats.compression_ratio << "%\n";
    std::cout << "Elapsed:    " << stats.elapsed.count() << " ms\n";
}

}  // namespace

int main(int argc, char* argv[]) {
    if (argc < 4) {
        print_usage(argv[0]);
        return 1;
    }

    const std::string command = argv[1];
    const std::filesystem::path first = argv[2];
    const std::filesystem::path second = argv[3];

    std::optional<archive_format> format;
    archive_options options;

    for (int i = 4; i < argc; ++i) {
        if (std::strcmp(argv[i], "--format") == 0 && i + 1 < argc) {
            format = parse_archive_format(argv[++i]);
            if (!format) {
                std::cerr << "Unknown format: " << argv[i] << "\n";
                return 1;
            }
        } else if (std::strcmp(argv[i], "--level") == 0 && i + 1 < argc) {
            options.level = std::stoi(argv[++i]);
        } else if (std::strcmp(argv[i], "--exclude") == 0 && i + 1 < argc) {
            options.exclude_patterns.emplace_back(argv[++i]);
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    archive_engine engine;
    engine.on_log([](const std::string& line) {
        std::cout << "  " << line << "\n";
    });

    if (command == "compress") {
        if (!format) {
            format = detect_archive_format(second);
        }
        if (!format) {
            std::cerr << "Cannot tell the format of " << second << ", use --format\n";
            return 1;
        }
        if (!is_format_available(*format)) {
            std::cerr << to_string(*format) << " support is not built in\n";
            return 1;
        }
        options.format = *format;

        engine.on_progress([](const archive_stats& stats) {
            std::cout << "\r[" << stats.processed_files << "/" << stats.total_files << "] "
                      << stats.current_entry << "\033[K" << std::flush;
        });

        std::cout << "=== Compress " << first << " -> " << second << " ("
                  << to_string(*format) << ") ===\n";
        auto result = engine.compress(first, second, options);
        std::cout << "\n";
        if (!result) {
            std::cerr << "Compression failed: " << result.error().message << "\n";
            return 1;
        }
        print_stats(result.value());
        return 0;
    }

    if (command == "extract") {
        std::cout << "=== Extract " << first << " -> " << second << " ===\n";
        auto result = engine.decompress(first, second, format);
        if (!result) {
            std::cerr << "Extraction failed: " << result.error().message << "\n";
            return 1;
        }
        print_stats(result.value());
        return 0;
    }

    print_usage(argv[0]);
    return 1;
}

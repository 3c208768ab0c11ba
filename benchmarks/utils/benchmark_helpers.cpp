/**
 * @file benchmark_helpers.cpp
 * @brief Implementation of benchmark helper utilities
 */

#include "utils/benchmark_helpers.h"

#include <fstream>
#include <iomanip>
#include <sstream>

namespace kcenon::ultracopy::benchmark {

// test_data_generator implementation

auto test_data_generator::generate_text_data(std::size_t size, uint32_t seed)
    -> std::vector<std::byte> {
    std::vector<std::byte> data;
    data.reserve(size);

    std::mt19937 gen(seed == 0 ? std::random_device{}() : seed);

    static const std::vector<std::string> words = {
        "the", "be", "to", "of", "and", "a", "in", "that", "have", "it",
        "for", "not", "on", "with", "as", "you", "do", "at", "this", "but",
        "copy", "mirror", "source", "destination", "folder", "file", "share",
        "backup", "archive", "device", "staging", "retry", "thread", "network"
    };

    std::uniform_int_distribution<std::size_t> word_dis(0, words.size() - 1);
    std::uniform_int_distribution<int> space_dis(0, 10);

    while (data.size() < size) {
        const auto& word = words[word_dis(gen)];
        for (char c : word) {
            if (data.size() >= size) break;
            data.push_back(static_cast<std::byte>(c));
        }

        if (data.size() < size) {
            data.push_back(static_cast<std::byte>(space_dis(gen) == 0 ? '\n' : ' '));
        }
    }

    data.resize(size);
    return data;
}

auto test_data_generator::generate_copy_output(std::size_t file_count, std::size_t error_every,
                                               uint32_t seed) -> std::vector<std::string> {
    std::mt19937 gen(seed == 0 ? std::random_device{}() : seed);
    std::uniform_int_distribution<uint64_t> size_dis(1, 50 * sizes::MB);

    std::vector<std::string> lines = {
        "-------------------------------------------------------------------------------",
        "   ROBOCOPY     ::     Robust File Copy for Windows",
        "-------------------------------------------------------------------------------",
        "",
        "  Source : C:\\Projects\\",
        "    Dest : \\\\nas\\backup\\Projects\\",
        "",
        "  Options : *.* /S /E /DCOPY:DA /COPY:DAT /MT:16 /R:5 /W:10",
        "",
    };

    uint64_t total_bytes = 0;
    for (std::size_t i = 0; i < file_count; ++i) {
        const auto size = size_dis(gen);
        total_bytes += size;

        std::ostringstream line;
        line << "\t    New File  \t\t" << std::setw(10) << size << "\t";
        if (i % 2 == 1) {
            line << "2024/03/15 10:22:" << std::setw(2) << std::setfill('0') << (i % 60)
                 << std::setfill(' ') << " ";
        }
        line << "C:\\Projects\\module_" << (i / 100) << "\\file_" << i << ".dat";
        lines.push_back(line.str());

        if (error_every > 0 && i % error_every == error_every - 1) {
            lines.push_back("2024/03/15 10:22:31 ERROR 32 (0x00000020) Copying File "
                            "C:\\Projects\\locked_" + std::to_string(i) + ".dat");
            lines.push_back("The process cannot access the file because it is being used "
                            "by another process.");
        }
    }

    lines.push_back("");
    lines.push_back("------------------------------------------------------------------------------");
    lines.push_back("");
    lines.push_back("               Total    Copied   Skipped  Mismatch    FAILED    Extras");
    lines.push_back("    Dirs :        12        12         0         0         0         0");
    lines.push_back("   Files :     " + std::to_string(file_count));
    lines.push_back("   Bytes :     " + std::to_string(total_bytes));
    lines.push_back("   Speed :           125829120 Bytes/sec.");
    lines.push_back("   Speed :            7200.000 MegaBytes/min.");
    return lines;
}

// temp_tree_manager implementation

temp_tree_manager::temp_tree_manager(const std::string& name)
    : root_(std::filesystem::temp_directory_path() / ("ultracopy_bench_" + name)) {
    std::error_code ec;
    std::filesystem::remove_all(root_, ec);
    std::filesystem::create_directories(root_, ec);
}

temp_tree_manager::~temp_tree_manager() {
    cleanup();
}

auto temp_tree_manager::create_tree(std::size_t file_count, std::size_t file_size,
                                    std::size_t folder_count, uint32_t seed)
    -> std::filesystem::path {
    const auto tree = root_ / "tree";
    const auto folders = folder_count == 0 ? 1 : folder_count;

    for (std::size_t i = 0; i < file_count; ++i) {
        const auto dir = tree / ("folder_" + std::to_string(i % folders));
        std::filesystem::create_directories(dir);

        auto data = test_data_generator::generate_text_data(file_size, seed + static_cast<uint32_t>(i));
        std::ofstream file(dir / ("file_" + std::to_string(i) + ".txt"), std::ios::binary);
        file.write(reinterpret_cast<const char*>(data.data()),
                   static_cast<std::streamsize>(data.size()));
    }
    return tree;
}

auto temp_tree_manager::root() const -> const std::filesystem::path& {
    return root_;
}

void temp_tree_manager::cleanup() {
    std::error_code ec;
    std::filesystem::remove_all(root_, ec);
}

}  // namespace kcenon::ultracopy::benchmark

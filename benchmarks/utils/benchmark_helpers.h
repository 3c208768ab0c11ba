/**
 * @file benchmark_helpers.h
 * @brief Helper utilities for benchmarks
 */

#ifndef KCENON_ULTRACOPY_BENCHMARKS_BENCHMARK_HELPERS_H
#define KCENON_ULTRACOPY_BENCHMARKS_BENCHMARK_HELPERS_H

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <random>
#include <string>
#include <vector>

namespace kcenon::ultracopy::benchmark {

/**
 * @brief Helper class for generating test data for benchmarks
 */
class test_data_generator {
public:
    /**
     * @brief Generate compressible text data
     * @param size Approximate size in bytes
     * @param seed Random seed (0 for random)
     */
    static auto generate_text_data(std::size_t size, uint32_t seed = 0)
        -> std::vector<std::byte>;

    /**
     * @brief Generate the output of a bulk-copy run
     *
     * Header, one "New File" line per file (with a timestamp every other
     * line), an ERROR line every @p error_every files when non-zero, then
     * the summary block.
     */
    static auto generate_copy_output(std::size_t file_count, std::size_t error_every = 0,
                                     uint32_t seed = 0) -> std::vector<std::string>;
};

/**
 * @brief Owns a temporary directory tree for archive benchmarks
 */
class temp_tree_manager {
public:
    explicit temp_tree_manager(const std::string& name);
    ~temp_tree_manager();

    // Non-copyable
    temp_tree_manager(const temp_tree_manager&) = delete;
    auto operator=(const temp_tree_manager&) -> temp_tree_manager& = delete;

    /**
     * @brief Fill root()/tree with @p file_count text files spread over @p folder_count folders
     * @return Path of the tree
     */
    auto create_tree(std::size_t file_count, std::size_t file_size, std::size_t folder_count,
                     uint32_t seed = 42) -> std::filesystem::path;

    [[nodiscard]] auto root() const -> const std::filesystem::path&;

    void cleanup();

private:
    std::filesystem::path root_;
};

/**
 * @brief Size constants for benchmarks
 */
namespace sizes {
constexpr std::size_t KB = 1024;
constexpr std::size_t MB = 1024 * KB;

constexpr std::size_t small_file = 4 * KB;
constexpr std::size_t medium_file = 256 * KB;
constexpr std::size_t large_file = 4 * MB;
}  // namespace sizes

}  // namespace kcenon::ultracopy::benchmark

#endif  // KCENON_ULTRACOPY_BENCHMARKS_BENCHMARK_HELPERS_H

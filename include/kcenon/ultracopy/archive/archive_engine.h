/**
 * @file archive_engine.h
 * @brief Compress and extract zip / tar archives around a transfer
 */

#ifndef KCENON_ULTRACOPY_ARCHIVE_ARCHIVE_ENGINE_H
#define KCENON_ULTRACOPY_ARCHIVE_ARCHIVE_ENGINE_H

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "kcenon/ultracopy/core/transfer_types.h"
#include "kcenon/ultracopy/core/types.h"

namespace kcenon::ultracopy {

/**
 * @brief Archive container and compression
 */
enum class archive_format {
    zip,     ///< PKZIP, deflate members
    tar,     ///< Uncompressed ustar
    tar_gz,  ///< ustar inside gzip
    tar_lz4  ///< ustar inside an LZ4 frame (requires LZ4 support)
};

[[nodiscard]] constexpr auto to_string(archive_format format) -> const char* {
    switch (format) {
        case archive_format::zip: return "zip";
        case archive_format::tar: return "tar";
        case archive_format::tar_gz: return "tar.gz";
        case archive_format::tar_lz4: return "tar.lz4";
        default: return "unknown";
    }
}

/**
 * @brief Parse "zip", "tar", "tar.gz", "tgz" or "tar.lz4" (case-insensitive)
 */
[[nodiscard]] auto parse_archive_format(std::string_view name) -> std::optional<archive_format>;

/**
 * @brief Guess the format from the file extension
 */
[[nodiscard]] auto detect_archive_format(const std::filesystem::path& path)
    -> std::optional<archive_format>;

/**
 * @brief Whether this build can read and write @p format
 */
[[nodiscard]] auto is_format_available(archive_format format) -> bool;

/**
 * @brief Compression request options
 */
struct archive_options {
    archive_format format = archive_format::zip;
    int level = 6;  ///< 0-9
    /// fnmatch patterns matched against file and directory names
    std::vector<std::string> exclude_patterns;
};

/**
 * @brief Counters of one compress or decompress run
 */
struct archive_stats {
    uint64_t total_files = 0;
    uint64_t processed_files = 0;
    uint64_t total_bytes = 0;       ///< Uncompressed bytes processed
    uint64_t compressed_bytes = 0;  ///< Archive size on disk
    double compression_ratio = 0.0; ///< Percent saved, (1 - compressed/total) * 100
    std::chrono::milliseconds elapsed{0};
    std::string current_entry;
};

using archive_progress_callback = std::function<void(const archive_stats&)>;

/**
 * @brief Archive stage used before or after a transfer
 *
 * Operations run on the calling thread; cancel() may be called from any
 * other thread and takes effect at the next read or write. A failed or
 * cancelled compress removes the partial archive.
 *
 * @code
 * archive_engine engine;
 * archive_options options;
 * options.format = archive_format::tar_gz;
 * options.exclude_patterns = {"*.tmp", ".git"};
 *
 * auto stats = engine.compress("/data/project", "/tmp/project.tar.gz", options);
 * if (stats) {
 *     std::cout << stats.value().compression_ratio << "% saved\n";
 * }
 * @endcode
 */
class archive_engine {
public:
    archive_engine();
    ~archive_engine();

    // Non-copyable, movable
    archive_engine(const archive_engine&) = delete;
    auto operator=(const archive_engine&) -> archive_engine& = delete;
    archive_engine(archive_engine&&) noexcept;
    auto operator=(archive_engine&&) noexcept -> archive_engine&;

    void on_progress(archive_progress_callback callback);
    void on_log(log_callback callback);

    /**
     * @brief Archive a file or directory tree
     *
     * Member names are relative to the parent of @p source, so the
     * archive contains the source folder itself. Unreadable files are
     * logged and skipped.
     */
    [[nodiscard]] auto compress(const std::filesystem::path& source,
                                const std::filesystem::path& output,
                                const archive_options& options = {}) -> result<archive_stats>;

    /**
     * @brief Extract an archive into @p output_dir
     * @param format Detected from the extension when not given
     *
     * Members whose names are absolute or climb out of @p output_dir fail
     * the whole extraction with error_code::archive_unsafe_entry.
     */
    [[nodiscard]] auto decompress(const std::filesystem::path& archive,
                                  const std::filesystem::path& output_dir,
                                  std::optional<archive_format> format = std::nullopt)
        -> result<archive_stats>;

    void cancel();

    [[nodiscard]] auto is_running() const -> bool;
    [[nodiscard]] auto last_stats() const -> archive_stats;

    /**
     * @brief Whether @p name matches any of @p patterns
     */
    [[nodiscard]] static auto is_excluded(std::string_view name,
                                          const std::vector<std::string>& patterns) -> bool;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::ultracopy

#endif  // KCENON_ULTRACOPY_ARCHIVE_ARCHIVE_ENGINE_H

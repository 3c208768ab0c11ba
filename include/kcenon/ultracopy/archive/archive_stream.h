/**
 * @file archive_stream.h
 * @brief Byte sinks and sources for archive containers
 *
 * Tar archives are written through a chain of sinks (file, optionally
 * wrapped in gzip or LZ4 frame compression) and read back through the
 * matching sources.
 */

#ifndef KCENON_ULTRACOPY_ARCHIVE_ARCHIVE_STREAM_H
#define KCENON_ULTRACOPY_ARCHIVE_ARCHIVE_STREAM_H

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <span>
#include <string>

#include "kcenon/ultracopy/core/types.h"

namespace kcenon::ultracopy {

/**
 * @brief One member of an archive container
 */
struct archive_entry {
    std::string name;  ///< Relative path, '/'-separated, no trailing slash
    bool is_directory = false;
    uint64_t size = 0;
    uint32_t mode = 0644;
    int64_t mtime = 0;  ///< Seconds since the Unix epoch
};

/**
 * @brief Write end of a byte stream
 */
class byte_sink {
public:
    virtual ~byte_sink() = default;

    [[nodiscard]] virtual auto write(std::span<const std::byte> data) -> result<void> = 0;

    /**
     * @brief Flush trailers and close; no writes are accepted afterwards
     */
    [[nodiscard]] virtual auto finish() -> result<void> = 0;
};

/**
 * @brief Read end of a byte stream
 */
class byte_source {
public:
    virtual ~byte_source() = default;

    /**
     * @brief Read up to buffer.size() bytes
     * @return bytes read; 0 only at end of stream
     */
    [[nodiscard]] virtual auto read(std::span<std::byte> buffer) -> result<std::size_t> = 0;
};

[[nodiscard]] auto make_file_sink(const std::filesystem::path& path)
    -> result<std::unique_ptr<byte_sink>>;

[[nodiscard]] auto make_file_source(const std::filesystem::path& path)
    -> result<std::unique_ptr<byte_source>>;

/**
 * @brief gzip (RFC 1952) compression in front of @p inner
 * @param level zlib level 0-9
 */
[[nodiscard]] auto make_gzip_sink(std::unique_ptr<byte_sink> inner, int level)
    -> result<std::unique_ptr<byte_sink>>;

[[nodiscard]] auto make_gzip_source(std::unique_ptr<byte_source> inner)
    -> result<std::unique_ptr<byte_source>>;

/**
 * @brief LZ4 frame compression in front of @p inner
 *
 * Returns error_code::archive_format_unsupported when built without LZ4.
 */
[[nodiscard]] auto make_lz4_sink(std::unique_ptr<byte_sink> inner, int level)
    -> result<std::unique_ptr<byte_sink>>;

[[nodiscard]] auto make_lz4_source(std::unique_ptr<byte_source> inner)
    -> result<std::unique_ptr<byte_source>>;

}  // namespace kcenon::ultracopy

#endif  // KCENON_ULTRACOPY_ARCHIVE_ARCHIVE_STREAM_H

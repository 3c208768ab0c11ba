/**
 * @file tar_format.h
 * @brief ustar writer and reader over byte streams
 */

#ifndef KCENON_ULTRACOPY_ARCHIVE_TAR_FORMAT_H
#define KCENON_ULTRACOPY_ARCHIVE_TAR_FORMAT_H

#include <cstddef>
#include <optional>
#include <span>

#include "kcenon/ultracopy/archive/archive_stream.h"

namespace kcenon::ultracopy {

inline constexpr std::size_t tar_block_size = 512;

/**
 * @brief Writes POSIX ustar members
 *
 * Names longer than the ustar name/prefix split allows are stored with a
 * GNU long-name record. Sizes beyond the octal range use base-256.
 */
class tar_writer {
public:
    explicit tar_writer(byte_sink& sink);

    auto add_directory(const archive_entry& entry) -> result<void>;

    /**
     * @brief Write a file member whose data is read from @p content
     *
     * @p content must deliver exactly entry.size bytes.
     */
    auto add_file(const archive_entry& entry, byte_source& content) -> result<void>;

    /**
     * @brief Write the end-of-archive marker and finish the sink
     */
    auto finish() -> result<void>;

    [[nodiscard]] auto bytes_written() const -> uint64_t { return written_; }

private:
    auto write_header(const archive_entry& entry, char type) -> result<void>;
    auto write_block(std::span<const std::byte> block) -> result<void>;
    auto write_padding(uint64_t size) -> result<void>;

    byte_sink& sink_;
    uint64_t written_ = 0;
};

/**
 * @brief Reads ustar, GNU and old-style tar members
 *
 * Link, pax and other special members are skipped.
 */
class tar_reader {
public:
    explicit tar_reader(byte_source& source);

    /**
     * @brief Advance to the next member, skipping unread data of the current one
     * @return std::nullopt at the end-of-archive marker
     */
    auto next() -> result<std::optional<archive_entry>>;

    /**
     * @brief Read data of the current member
     * @return bytes read; 0 once the member is exhausted
     */
    auto read_data(std::span<std::byte> buffer) -> result<std::size_t>;

private:
    auto read_block(std::span<std::byte> block) -> result<bool>;
    auto skip_remaining() -> result<void>;

    byte_source& source_;
    uint64_t remaining_ = 0;
    uint64_t padding_ = 0;
    bool at_end_ = false;
};

}  // namespace kcenon::ultracopy

#endif  // KCENON_ULTRACOPY_ARCHIVE_TAR_FORMAT_H

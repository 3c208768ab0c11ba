/**
 * @file zip_format.h
 * @brief PKZIP writer and reader (stored and deflate members)
 */

#ifndef KCENON_ULTRACOPY_ARCHIVE_ZIP_FORMAT_H
#define KCENON_ULTRACOPY_ARCHIVE_ZIP_FORMAT_H

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "kcenon/ultracopy/archive/archive_stream.h"

namespace kcenon::ultracopy {

/**
 * @brief Central directory record of a zip member
 */
struct zip_member {
    archive_entry entry;
    uint16_t method = 0;  ///< 0 stored, 8 deflate
    uint16_t flags = 0;
    uint32_t crc = 0;
    uint64_t compressed_size = 0;
    uint64_t local_header_offset = 0;
};

/**
 * @brief Streams a zip archive into a sink
 *
 * File members are always deflated and followed by a data descriptor, so
 * the sink never has to seek. ZIP64 is not written: more than 65535
 * members, or any size or offset of 4 GiB and above, is an error.
 */
class zip_writer {
public:
    /**
     * @param level zlib level 0-9
     */
    zip_writer(byte_sink& sink, int level);

    auto add_directory(const archive_entry& entry) -> result<void>;
    auto add_file(const archive_entry& entry, byte_source& content) -> result<void>;

    /**
     * @brief Write the central directory and finish the sink
     */
    auto finish() -> result<void>;

private:
    /**
     * @brief Check the ZIP32 limits and write the local header of @p member
     */
    auto begin_member(zip_member& member, const std::string& name) -> result<void>;
    auto emit(const std::vector<uint8_t>& bytes) -> result<void>;
    auto check_offset() const -> result<void>;

    byte_sink& sink_;
    int level_;
    uint64_t offset_ = 0;
    std::vector<zip_member> members_;
};

/**
 * @brief Random-access zip reader
 */
class zip_reader {
public:
    zip_reader() = default;

    /**
     * @brief Open @p path and load its central directory
     */
    auto open(const std::filesystem::path& path) -> result<void>;

    [[nodiscard]] auto members() const -> const std::vector<zip_member>& { return members_; }

    /**
     * @brief Decompress one member into @p sink, verifying its CRC-32
     */
    auto extract(const zip_member& member, byte_sink& sink) -> result<void>;

private:
    auto read_at(uint64_t offset, std::size_t size) -> result<std::vector<uint8_t>>;

    std::ifstream file_;
    uint64_t file_size_ = 0;
    std::vector<zip_member> members_;
};

}  // namespace kcenon::ultracopy

#endif  // KCENON_ULTRACOPY_ARCHIVE_ZIP_FORMAT_H

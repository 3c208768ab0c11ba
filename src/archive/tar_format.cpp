/**
 * @file tar_format.cpp
 * @brief ustar writer and reader
 */

#include "kcenon/ultracopy/archive/tar_format.h"

#include <algorithm>
#include <array>
#include <string>
#include <string_view>
#include <vector>

namespace kcenon::ultracopy {

namespace {

using header_block = std::array<std::byte, tar_block_size>;

// ustar header field offsets and widths
constexpr std::size_t name_offset = 0, name_width = 100;
constexpr std::size_t mode_offset = 100, mode_width = 8;
constexpr std::size_t uid_offset = 108, gid_offset = 116, id_width = 8;
constexpr std::size_t size_offset = 124, size_width = 12;
constexpr std::size_t mtime_offset = 136, mtime_width = 12;
constexpr std::size_t checksum_offset = 148, checksum_width = 8;
constexpr std::size_t type_offset = 156;
constexpr std::size_t magic_offset = 257;
constexpr std::size_t version_offset = 263;
constexpr std::size_t prefix_offset = 345, prefix_width = 155;

constexpr std::size_t copy_buffer_size = 64 * 1024;
constexpr uint64_t max_long_name = 64 * 1024;

auto corrupted(const std::string& message) -> unexpected {
    return unexpected(error(error_code::archive_corrupted, message));
}

void put_string(header_block& block, std::size_t offset, std::size_t width,
                std::string_view value) {
    const auto count = std::min(width, value.size());
    for (std::size_t i = 0; i < count; ++i) {
        block[offset + i] = static_cast<std::byte>(value[i]);
    }
}

// Octal with a terminating NUL, or base-256 when the value does not fit
void put_number(header_block& block, std::size_t offset, std::size_t width, uint64_t value) {
    const uint64_t octal_limit = uint64_t{1} << (3 * (width - 1));
    if (value < octal_limit) {
        for (std::size_t i = width - 1; i-- > 0;) {
            block[offset + i] = static_cast<std::byte>('0' + (value & 7));
            value >>= 3;
        }
        block[offset + width - 1] = std::byte{0};
        return;
    }

    for (std::size_t i = width; i-- > 1;) {
        block[offset + i] = static_cast<std::byte>(value & 0xff);
        value >>= 8;
    }
    block[offset] = std::byte{0x80};
}

auto get_string(const header_block& block, std::size_t offset, std::size_t width)
    -> std::string {
    std::string value;
    for (std::size_t i = 0; i < width; ++i) {
        const auto c = static_cast<char>(block[offset + i]);
        if (c == '\0') {
            break;
        }
        value.push_back(c);
    }
    return value;
}

auto get_number(const header_block& block, std::size_t offset, std::size_t width) -> uint64_t {
    const auto first = static_cast<unsigned char>(block[offset]);
    uint64_t value = 0;

    if ((first & 0x80) != 0) {
        value = first & 0x7f;
        for (std::size_t i = 1; i < width; ++i) {
            value = (value << 8) | static_cast<unsigned char>(block[offset + i]);
        }
        return value;
    }

    std::size_t i = 0;
    while (i < width && (block[offset + i] == std::byte{' '} || block[offset + i] == std::byte{0})) {
        ++i;
    }
    for (; i < width; ++i) {
        const auto c = static_cast<char>(block[offset + i]);
        if (c < '0' || c > '7') {
            break;
        }
        value = (value << 3) | static_cast<uint64_t>(c - '0');
    }
    return value;
}

// Sum of all header bytes with the checksum field taken as spaces
auto header_checksum(const header_block& block) -> uint64_t {
    uint64_t sum = 0;
    for (std::size_t i = 0; i < tar_block_size; ++i) {
        if (i >= checksum_offset && i < checksum_offset + checksum_width) {
            sum += ' ';
        } else {
            sum += static_cast<unsigned char>(block[i]);
        }
    }
    return sum;
}

void fill_header(header_block& block, std::string_view name, std::string_view prefix,
                 uint64_t size, uint32_t mode, int64_t mtime, char type) {
    block.fill(std::byte{0});
    put_string(block, name_offset, name_width, name);
    put_number(block, mode_offset, mode_width, mode & 07777);
    put_number(block, uid_offset, id_width, 0);
    put_number(block, gid_offset, id_width, 0);
    put_number(block, size_offset, size_width, size);
    put_number(block, mtime_offset, mtime_width, static_cast<uint64_t>(std::max<int64_t>(mtime, 0)));
    block[type_offset] = static_cast<std::byte>(type);
    put_string(block, magic_offset, 6, std::string_view("ustar\0", 6));
    put_string(block, version_offset, 2, "00");
    put_string(block, prefix_offset, prefix_width, prefix);

    // Six octal digits, NUL, space
    auto sum = header_checksum(block);
    for (std::size_t i = 6; i-- > 0;) {
        block[checksum_offset + i] = static_cast<std::byte>('0' + (sum & 7));
        sum >>= 3;
    }
    block[checksum_offset + 6] = std::byte{0};
    block[checksum_offset + 7] = std::byte{' '};
}

// Position of the '/' splitting @p name into a ustar prefix and name
auto find_split(const std::string& name) -> std::optional<std::size_t> {
    for (auto pos = name.find('/'); pos != std::string::npos && pos <= prefix_width;
         pos = name.find('/', pos + 1)) {
        const auto tail = name.size() - pos - 1;
        if (tail > 0 && tail <= name_width) {
            return pos;
        }
    }
    return std::nullopt;
}

auto is_zero_block(const header_block& block) -> bool {
    return std::all_of(block.begin(), block.end(), [](std::byte b) { return b == std::byte{0}; });
}

auto padding_for(uint64_t size) -> uint64_t {
    return (tar_block_size - size % tar_block_size) % tar_block_size;
}

}  // namespace

// ============================================================================
// tar_writer
// ============================================================================

tar_writer::tar_writer(byte_sink& sink) : sink_(sink) {}

auto tar_writer::add_directory(const archive_entry& entry) -> result<void> {
    archive_entry dir = entry;
    dir.is_directory = true;
    dir.size = 0;
    return write_header(dir, '5');
}

auto tar_writer::add_file(const archive_entry& entry, byte_source& content) -> result<void> {
    auto header = write_header(entry, '0');
    if (!header) {
        return header;
    }

    std::vector<std::byte> buffer(copy_buffer_size);
    uint64_t remaining = entry.size;
    while (remaining > 0) {
        const auto want = static_cast<std::size_t>(std::min<uint64_t>(remaining, buffer.size()));
        auto n = content.read(std::span<std::byte>(buffer.data(), want));
        if (!n) {
            return unexpected(n.error());
        }
        if (n.value() == 0) {
            return unexpected(error(error_code::archive_read_error,
                                    "File shrank while archiving: " + entry.name));
        }

        auto written = sink_.write(std::span<const std::byte>(buffer.data(), n.value()));
        if (!written) {
            return written;
        }
        written_ += n.value();
        remaining -= n.value();
    }

    return write_padding(entry.size);
}

auto tar_writer::finish() -> result<void> {
    header_block zero{};
    for (int i = 0; i < 2; ++i) {
        auto written = write_block(zero);
        if (!written) {
            return written;
        }
    }
    return sink_.finish();
}

auto tar_writer::write_header(const archive_entry& entry, char type) -> result<void> {
    std::string name = entry.name;
    if (entry.is_directory) {
        name += '/';
    }

    std::string prefix;
    if (name.size() > name_width) {
        if (auto split = find_split(name)) {
            prefix = name.substr(0, *split);
            name = name.substr(*split + 1);
        } else {
            // GNU long name record followed by the member with a truncated name
            header_block long_link{};
            fill_header(long_link, "././@LongLink", {}, name.size() + 1, 0, 0, 'L');
            auto written = write_block(long_link);
            if (!written) {
                return written;
            }

            std::vector<std::byte> data(name.size() + 1 + padding_for(name.size() + 1),
                                        std::byte{0});
            std::transform(name.begin(), name.end(), data.begin(),
                           [](char c) { return static_cast<std::byte>(c); });
            written = sink_.write(data);
            if (!written) {
                return written;
            }
            written_ += data.size();
            name.resize(name_width);
        }
    }

    header_block block{};
    fill_header(block, name, prefix, entry.is_directory ? 0 : entry.size, entry.mode,
                entry.mtime, type);
    return write_block(block);
}

auto tar_writer::write_block(std::span<const std::byte> block) -> result<void> {
    auto written = sink_.write(block);
    if (written) {
        written_ += block.size();
    }
    return written;
}

auto tar_writer::write_padding(uint64_t size) -> result<void> {
    const auto padding = padding_for(size);
    if (padding == 0) {
        return {};
    }
    header_block zero{};
    return write_block(std::span<const std::byte>(zero.data(), static_cast<std::size_t>(padding)));
}

// ============================================================================
// tar_reader
// ============================================================================

tar_reader::tar_reader(byte_source& source) : source_(source) {}

auto tar_reader::next() -> result<std::optional<archive_entry>> {
    if (at_end_) {
        return std::optional<archive_entry>{};
    }

    auto skipped = skip_remaining();
    if (!skipped) {
        return unexpected(skipped.error());
    }

    std::optional<std::string> long_name;
    for (;;) {
        header_block block{};
        auto got = read_block(block);
        if (!got) {
            return unexpected(got.error());
        }
        // A missing end marker is tolerated
        if (!got.value() || is_zero_block(block)) {
            at_end_ = true;
            return std::optional<archive_entry>{};
        }

        if (header_checksum(block) != get_number(block, checksum_offset, checksum_width)) {
            return corrupted("Tar header checksum mismatch");
        }

        const auto size = get_number(block, size_offset, size_width);
        const auto type = static_cast<char>(block[type_offset]);
        remaining_ = size;
        padding_ = padding_for(size);

        std::string name = get_string(block, name_offset, name_width);
        if (get_string(block, magic_offset, 5) == "ustar") {
            const auto prefix = get_string(block, prefix_offset, prefix_width);
            if (!prefix.empty()) {
                name = prefix + "/" + name;
            }
        }

        if (type == 'L') {
            if (size > max_long_name) {
                return corrupted("Long name record too large");
            }
            std::string value(static_cast<std::size_t>(size), '\0');
            std::size_t filled = 0;
            while (filled < value.size()) {
                auto n = read_data(std::as_writable_bytes(
                    std::span<char>(value.data() + filled, value.size() - filled)));
                if (!n) {
                    return unexpected(n.error());
                }
                filled += n.value();
            }
            value.erase(std::find(value.begin(), value.end(), '\0'), value.end());
            long_name = std::move(value);

            auto rest = skip_remaining();
            if (!rest) {
                return unexpected(rest.error());
            }
            continue;
        }

        if (type == '0' || type == '\0' || type == '7' || type == '5') {
            archive_entry entry;
            entry.name = long_name.value_or(name);
            entry.is_directory = type == '5' || (!entry.name.empty() && entry.name.back() == '/');
            while (!entry.name.empty() && entry.name.back() == '/') {
                entry.name.pop_back();
            }
            entry.size = entry.is_directory ? 0 : size;
            entry.mode = static_cast<uint32_t>(get_number(block, mode_offset, mode_width));
            entry.mtime = static_cast<int64_t>(get_number(block, mtime_offset, mtime_width));

            if (entry.is_directory) {
                auto rest = skip_remaining();
                if (!rest) {
                    return unexpected(rest.error());
                }
            }
            return std::optional<archive_entry>(std::move(entry));
        }

        // Links, pax headers and device nodes
        long_name.reset();
        auto rest = skip_remaining();
        if (!rest) {
            return unexpected(rest.error());
        }
    }
}

auto tar_reader::read_data(std::span<std::byte> buffer) -> result<std::size_t> {
    if (remaining_ == 0 || buffer.empty()) {
        return std::size_t{0};
    }

    const auto want = static_cast<std::size_t>(std::min<uint64_t>(remaining_, buffer.size()));
    auto n = source_.read(buffer.first(want));
    if (!n) {
        return n;
    }
    if (n.value() == 0) {
        return corrupted("Tar member data truncated");
    }
    remaining_ -= n.value();
    return n;
}

auto tar_reader::read_block(std::span<std::byte> block) -> result<bool> {
    std::size_t filled = 0;
    while (filled < block.size()) {
        auto n = source_.read(block.subspan(filled));
        if (!n) {
            return unexpected(n.error());
        }
        if (n.value() == 0) {
            if (filled == 0) {
                return false;
            }
            return corrupted("Tar header truncated");
        }
        filled += n.value();
    }
    return true;
}

auto tar_reader::skip_remaining() -> result<void> {
    std::array<std::byte, tar_block_size> scratch{};
    uint64_t total = remaining_ + padding_;
    while (total > 0) {
        const auto want = static_cast<std::size_t>(std::min<uint64_t>(total, scratch.size()));
        auto n = source_.read(std::span<std::byte>(scratch.data(), want));
        if (!n) {
            return unexpected(n.error());
        }
        if (n.value() == 0) {
            return corrupted("Tar archive truncated");
        }
        total -= n.value();
    }
    remaining_ = 0;
    padding_ = 0;
    return {};
}

}  // namespace kcenon::ultracopy

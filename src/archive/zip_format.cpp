/**
 * @file zip_format.cpp
 * @brief PKZIP writer and reader
 */

#include "kcenon/ultracopy/archive/zip_format.h"

#include <algorithm>
#include <climits>
#include <ctime>
#include <optional>
#include <span>
#include <utility>

#include <zlib.h>

namespace kcenon::ultracopy {

namespace {

constexpr uint32_t local_header_signature = 0x04034b50;
constexpr uint32_t descriptor_signature = 0x08074b50;
constexpr uint32_t central_header_signature = 0x02014b50;
constexpr uint32_t end_of_directory_signature = 0x06054b50;

constexpr std::size_t local_header_size = 30;
constexpr std::size_t central_header_size = 46;
constexpr std::size_t end_of_directory_size = 22;
constexpr std::size_t max_comment_size = 0xFFFF;

constexpr uint16_t version_needed = 20;
constexpr uint16_t version_made_by = (3 << 8) | 20;  // Unix, 2.0
constexpr uint16_t flag_encrypted = 0x0001;
constexpr uint16_t flag_data_descriptor = 0x0008;
constexpr uint16_t flag_utf8 = 0x0800;
constexpr uint16_t method_stored = 0;
constexpr uint16_t method_deflate = 8;

constexpr uint64_t zip32_limit = 0xFFFFFFFF;
constexpr std::size_t max_members = 0xFFFF;
constexpr std::size_t chunk_size = 64 * 1024;

auto write_error(const std::string& message) -> unexpected {
    return unexpected(error(error_code::archive_write_error, message));
}

auto corrupted(const std::string& message) -> unexpected {
    return unexpected(error(error_code::archive_corrupted, message));
}

void put16(std::vector<uint8_t>& out, uint16_t value) {
    out.push_back(static_cast<uint8_t>(value & 0xff));
    out.push_back(static_cast<uint8_t>(value >> 8));
}

void put32(std::vector<uint8_t>& out, uint32_t value) {
    for (int i = 0; i < 4; ++i) {
        out.push_back(static_cast<uint8_t>((value >> (8 * i)) & 0xff));
    }
}

void put_name(std::vector<uint8_t>& out, const std::string& name) {
    out.insert(out.end(), name.begin(), name.end());
}

auto get16(const std::vector<uint8_t>& in, std::size_t pos) -> uint16_t {
    return static_cast<uint16_t>(in[pos] | (in[pos + 1] << 8));
}

auto get32(const std::vector<uint8_t>& in, std::size_t pos) -> uint32_t {
    return static_cast<uint32_t>(in[pos]) | (static_cast<uint32_t>(in[pos + 1]) << 8) |
           (static_cast<uint32_t>(in[pos + 2]) << 16) |
           (static_cast<uint32_t>(in[pos + 3]) << 24);
}

struct dos_timestamp {
    uint16_t time = 0;
    uint16_t date = (1 << 5) | 1;  // 1980-01-01
};

auto to_dos(int64_t mtime) -> dos_timestamp {
    const auto t = static_cast<std::time_t>(mtime);
    std::tm tm{};
#ifdef _WIN32
    if (localtime_s(&tm, &t) != 0) {
        return {};
    }
#else
    if (localtime_r(&t, &tm) == nullptr) {
        return {};
    }
#endif
    if (tm.tm_year < 80) {
        return {};
    }

    dos_timestamp stamp;
    stamp.time = static_cast<uint16_t>((tm.tm_hour << 11) | (tm.tm_min << 5) | (tm.tm_sec / 2));
    stamp.date = static_cast<uint16_t>(((tm.tm_year - 80) << 9) | ((tm.tm_mon + 1) << 5) |
                                       tm.tm_mday);
    return stamp;
}

auto from_dos(uint16_t time, uint16_t date) -> int64_t {
    std::tm tm{};
    tm.tm_sec = (time & 0x1f) * 2;
    tm.tm_min = (time >> 5) & 0x3f;
    tm.tm_hour = time >> 11;
    tm.tm_mday = date & 0x1f;
    tm.tm_mon = ((date >> 5) & 0x0f) - 1;
    tm.tm_year = (date >> 9) + 80;
    tm.tm_isdst = -1;
    const auto t = std::mktime(&tm);
    return t == static_cast<std::time_t>(-1) ? 0 : static_cast<int64_t>(t);
}

auto external_attributes(const archive_entry& entry) -> uint32_t {
    const uint32_t type = entry.is_directory ? 0040000 : 0100000;
    return ((type | (entry.mode & 07777)) << 16) | (entry.is_directory ? 0x10 : 0);
}

/**
 * @brief Ends a zlib stream when the scope is left
 */
template <int (*End)(z_streamp)>
class z_stream_guard {
public:
    explicit z_stream_guard(z_stream& stream) : stream_(stream) {}
    z_stream_guard(const z_stream_guard&) = delete;
    auto operator=(const z_stream_guard&) -> z_stream_guard& = delete;
    ~z_stream_guard() { End(&stream_); }

private:
    z_stream& stream_;
};

}  // namespace

// ============================================================================
// zip_writer
// ============================================================================

zip_writer::zip_writer(byte_sink& sink, int level)
    : sink_(sink), level_(std::clamp(level, 0, 9)) {}

auto zip_writer::begin_member(zip_member& member, const std::string& name) -> result<void> {
    if (members_.size() >= max_members) {
        return write_error("Too many zip members (ZIP64 not supported)");
    }
    auto offset_ok = check_offset();
    if (!offset_ok) {
        return offset_ok;
    }

    member.local_header_offset = offset_;
    const auto stamp = to_dos(member.entry.mtime);

    // crc and sizes are zero; files carry them in the data descriptor
    std::vector<uint8_t> header;
    put32(header, local_header_signature);
    put16(header, version_needed);
    put16(header, member.flags);
    put16(header, member.method);
    put16(header, stamp.time);
    put16(header, stamp.date);
    put32(header, 0);
    put32(header, 0);
    put32(header, 0);
    put16(header, static_cast<uint16_t>(name.size()));
    put16(header, 0);
    put_name(header, name);
    return emit(header);
}

auto zip_writer::add_directory(const archive_entry& entry) -> result<void> {
    zip_member member;
    member.entry = entry;
    member.entry.is_directory = true;
    member.entry.size = 0;
    member.method = method_stored;
    member.flags = flag_utf8;

    auto written = begin_member(member, member.entry.name + "/");
    if (!written) {
        return written;
    }
    members_.push_back(std::move(member));
    return {};
}

auto zip_writer::add_file(const archive_entry& entry, byte_source& content) -> result<void> {
    zip_member member;
    member.entry = entry;
    member.method = method_deflate;
    member.flags = flag_data_descriptor | flag_utf8;

    auto written = begin_member(member, entry.name);
    if (!written) {
        return written;
    }

    // Raw deflate: negative window bits drop the zlib wrapper
    z_stream stream{};
    if (::deflateInit2(&stream, level_, Z_DEFLATED, -MAX_WBITS, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
        return write_error("deflateInit2 failed");
    }
    z_stream_guard<::deflateEnd> guard(stream);

    std::vector<std::byte> in(chunk_size);
    std::vector<std::byte> out(chunk_size);
    uLong crc = ::crc32(0L, Z_NULL, 0);
    uint64_t uncompressed = 0;
    uint64_t compressed = 0;

    auto pump = [&](int flush) -> result<void> {
        for (;;) {
            stream.next_out = reinterpret_cast<Bytef*>(out.data());
            stream.avail_out = static_cast<uInt>(out.size());
            const int rv = ::deflate(&stream, flush);
            if (rv == Z_STREAM_ERROR) {
                return write_error("deflate failed for " + entry.name);
            }
            const auto produced = out.size() - stream.avail_out;
            if (produced > 0) {
                auto sent = sink_.write(std::span<const std::byte>(out.data(), produced));
                if (!sent) {
                    return sent;
                }
                compressed += produced;
                offset_ += produced;
            }
            if (flush == Z_FINISH ? rv == Z_STREAM_END : stream.avail_out != 0) {
                return {};
            }
        }
    };

    for (;;) {
        auto n = content.read(in);
        if (!n) {
            return unexpected(n.error());
        }
        if (n.value() == 0) {
            break;
        }

        crc = ::crc32(crc, reinterpret_cast<const Bytef*>(in.data()),
                      static_cast<uInt>(n.value()));
        uncompressed += n.value();

        stream.next_in = reinterpret_cast<Bytef*>(in.data());
        stream.avail_in = static_cast<uInt>(n.value());
        auto pumped = pump(Z_NO_FLUSH);
        if (!pumped) {
            return pumped;
        }
    }

    stream.next_in = nullptr;
    stream.avail_in = 0;
    auto pumped = pump(Z_FINISH);
    if (!pumped) {
        return pumped;
    }

    if (uncompressed >= zip32_limit || compressed >= zip32_limit) {
        return write_error(entry.name + " is too large (ZIP64 not supported)");
    }

    member.crc = static_cast<uint32_t>(crc);
    member.compressed_size = compressed;
    member.entry.size = uncompressed;

    std::vector<uint8_t> descriptor;
    put32(descriptor, descriptor_signature);
    put32(descriptor, member.crc);
    put32(descriptor, static_cast<uint32_t>(compressed));
    put32(descriptor, static_cast<uint32_t>(uncompressed));
    written = emit(descriptor);
    if (!written) {
        return written;
    }

    members_.push_back(std::move(member));
    return {};
}

auto zip_writer::finish() -> result<void> {
    auto offset_ok = check_offset();
    if (!offset_ok) {
        return offset_ok;
    }

    const auto directory_offset = offset_;
    std::vector<uint8_t> directory;
    for (const auto& member : members_) {
        const auto name = member.entry.is_directory ? member.entry.name + "/" : member.entry.name;
        const auto stamp = to_dos(member.entry.mtime);

        put32(directory, central_header_signature);
        put16(directory, version_made_by);
        put16(directory, version_needed);
        put16(directory, member.flags);
        put16(directory, member.method);
        put16(directory, stamp.time);
        put16(directory, stamp.date);
        put32(directory, member.crc);
        put32(directory, static_cast<uint32_t>(member.compressed_size));
        put32(directory, static_cast<uint32_t>(member.entry.size));
        put16(directory, static_cast<uint16_t>(name.size()));
        put16(directory, 0);  // extra
        put16(directory, 0);  // comment
        put16(directory, 0);  // disk
        put16(directory, 0);  // internal attributes
        put32(directory, external_attributes(member.entry));
        put32(directory, static_cast<uint32_t>(member.local_header_offset));
        put_name(directory, name);
    }

    const auto directory_size = directory.size();
    if (directory_size >= zip32_limit) {
        return write_error("Central directory too large (ZIP64 not supported)");
    }

    put32(directory, end_of_directory_signature);
    put16(directory, 0);
    put16(directory, 0);
    put16(directory, static_cast<uint16_t>(members_.size()));
    put16(directory, static_cast<uint16_t>(members_.size()));
    put32(directory, static_cast<uint32_t>(directory_size));
    put32(directory, static_cast<uint32_t>(directory_offset));
    put16(directory, 0);

    auto written = emit(directory);
    if (!written) {
        return written;
    }
    return sink_.finish();
}

auto zip_writer::emit(const std::vector<uint8_t>& bytes) -> result<void> {
    auto written = sink_.write(std::as_bytes(std::span<const uint8_t>(bytes)));
    if (written) {
        offset_ += bytes.size();
    }
    return written;
}

auto zip_writer::check_offset() const -> result<void> {
    if (offset_ >= zip32_limit) {
        return write_error("Archive too large (ZIP64 not supported)");
    }
    return {};
}

// ============================================================================
// zip_reader
// ============================================================================

auto zip_reader::open(const std::filesystem::path& path) -> result<void> {
    file_.open(path, std::ios::binary);
    if (!file_.is_open()) {
        return unexpected(error(error_code::archive_read_error, "Cannot open " + path.string()));
    }

    file_.seekg(0, std::ios::end);
    file_size_ = static_cast<uint64_t>(file_.tellg());
    if (file_size_ < end_of_directory_size) {
        return corrupted("Not a zip archive: " + path.string());
    }

    const auto tail_size = static_cast<std::size_t>(
        std::min<uint64_t>(file_size_, end_of_directory_size + max_comment_size));
    auto tail = read_at(file_size_ - tail_size, tail_size);
    if (!tail) {
        return unexpected(tail.error());
    }

    const auto& bytes = tail.value();
    std::optional<std::size_t> eocd;
    for (std::size_t i = tail_size - end_of_directory_size + 1; i-- > 0;) {
        if (get32(bytes, i) == end_of_directory_signature) {
            eocd = i;
            break;
        }
    }
    if (!eocd) {
        return corrupted("End of central directory not found: " + path.string());
    }

    const auto count = get16(bytes, *eocd + 10);
    const auto directory_size = get32(bytes, *eocd + 12);
    const auto directory_offset = get32(bytes, *eocd + 16);
    if (directory_offset == zip32_limit) {
        return unexpected(error(error_code::archive_format_unsupported, "ZIP64 not supported"));
    }
    if (static_cast<uint64_t>(directory_offset) + directory_size > file_size_) {
        return corrupted("Central directory out of range");
    }

    auto directory = read_at(directory_offset, directory_size);
    if (!directory) {
        return unexpected(directory.error());
    }

    const auto& cd = directory.value();
    std::size_t pos = 0;
    members_.clear();
    for (uint16_t i = 0; i < count; ++i) {
        if (pos + central_header_size > cd.size() || get32(cd, pos) != central_header_signature) {
            return corrupted("Bad central directory record");
        }

        const auto name_length = get16(cd, pos + 28);
        const auto extra_length = get16(cd, pos + 30);
        const auto comment_length = get16(cd, pos + 32);
        if (pos + central_header_size + name_length > cd.size()) {
            return corrupted("Central directory name out of range");
        }

        zip_member member;
        member.flags = get16(cd, pos + 8);
        member.method = get16(cd, pos + 10);
        member.crc = get32(cd, pos + 16);
        member.compressed_size = get32(cd, pos + 20);
        member.entry.size = get32(cd, pos + 24);
        member.local_header_offset = get32(cd, pos + 42);
        if (member.compressed_size == zip32_limit || member.entry.size == zip32_limit ||
            member.local_header_offset == zip32_limit) {
            return unexpected(error(error_code::archive_format_unsupported,
                                    "ZIP64 members not supported"));
        }

        std::string name(cd.begin() + static_cast<std::ptrdiff_t>(pos + central_header_size),
                         cd.begin() + static_cast<std::ptrdiff_t>(pos + central_header_size +
                                                                  name_length));
        std::replace(name.begin(), name.end(), '\\', '/');

        const auto external = get32(cd, pos + 38);
        member.entry.is_directory = (!name.empty() && name.back() == '/') || (external & 0x10) != 0;
        while (!name.empty() && name.back() == '/') {
            name.pop_back();
        }
        member.entry.name = std::move(name);

        const auto mode = (external >> 16) & 07777;
        member.entry.mode = mode != 0 ? mode : (member.entry.is_directory ? 0755 : 0644);
        member.entry.mtime = from_dos(get16(cd, pos + 12), get16(cd, pos + 14));
        if (member.entry.is_directory) {
            member.entry.size = 0;
        }

        members_.push_back(std::move(member));
        pos += central_header_size + name_length + extra_length + comment_length;
    }

    return {};
}

auto zip_reader::extract(const zip_member& member, byte_sink& sink) -> result<void> {
    if ((member.flags & flag_encrypted) != 0) {
        return unexpected(error(error_code::archive_format_unsupported,
                                "Encrypted member: " + member.entry.name));
    }
    if (member.method != method_stored && member.method != method_deflate) {
        return unexpected(error(error_code::archive_format_unsupported,
                                "Compression method " + std::to_string(member.method) +
                                    " for " + member.entry.name));
    }

    auto header = read_at(member.local_header_offset, local_header_size);
    if (!header) {
        return unexpected(header.error());
    }
    if (get32(header.value(), 0) != local_header_signature) {
        return corrupted("Bad local header for " + member.entry.name);
    }

    const auto data_offset = member.local_header_offset + local_header_size +
                             get16(header.value(), 26) + get16(header.value(), 28);
    if (data_offset + member.compressed_size > file_size_) {
        return corrupted("Member data out of range: " + member.entry.name);
    }

    file_.clear();
    file_.seekg(static_cast<std::streamoff>(data_offset));

    std::vector<std::byte> in(chunk_size);
    std::vector<std::byte> out(chunk_size);
    uLong crc = ::crc32(0L, Z_NULL, 0);
    uint64_t produced = 0;
    uint64_t remaining = member.compressed_size;

    auto read_chunk = [&]() -> result<std::size_t> {
        const auto want = static_cast<std::size_t>(std::min<uint64_t>(remaining, in.size()));
        file_.read(reinterpret_cast<char*>(in.data()), static_cast<std::streamsize>(want));
        if (static_cast<std::size_t>(file_.gcount()) != want) {
            return corrupted("Member data truncated: " + member.entry.name);
        }
        remaining -= want;
        return want;
    };

    auto deliver = [&](const std::byte* data, std::size_t size) -> result<void> {
        crc = ::crc32(crc, reinterpret_cast<const Bytef*>(data), static_cast<uInt>(size));
        produced += size;
        return sink.write(std::span<const std::byte>(data, size));
    };

    if (member.method == method_stored) {
        while (remaining > 0) {
            auto n = read_chunk();
            if (!n) {
                return unexpected(n.error());
            }
            auto delivered = deliver(in.data(), n.value());
            if (!delivered) {
                return delivered;
            }
        }
    } else {
        z_stream stream{};
        if (::inflateInit2(&stream, -MAX_WBITS) != Z_OK) {
            return unexpected(error(error_code::archive_read_error, "inflateInit2 failed"));
        }
        z_stream_guard<::inflateEnd> guard(stream);

        bool finished = false;
        while (!finished) {
            if (stream.avail_in == 0) {
                if (remaining == 0) {
                    return corrupted("Deflate stream truncated: " + member.entry.name);
                }
                auto n = read_chunk();
                if (!n) {
                    return unexpected(n.error());
                }
                stream.next_in = reinterpret_cast<Bytef*>(in.data());
                stream.avail_in = static_cast<uInt>(n.value());
            }

            stream.next_out = reinterpret_cast<Bytef*>(out.data());
            stream.avail_out = static_cast<uInt>(out.size());
            const int rv = ::inflate(&stream, Z_NO_FLUSH);
            if (rv == Z_STREAM_END) {
                finished = true;
            } else if (rv != Z_OK && rv != Z_BUF_ERROR) {
                return corrupted("Inflate failed for " + member.entry.name);
            }

            const auto size = out.size() - stream.avail_out;
            if (size > 0) {
                auto delivered = deliver(out.data(), size);
                if (!delivered) {
                    return delivered;
                }
            }
        }
    }

    if (produced != member.entry.size || static_cast<uint32_t>(crc) != member.crc) {
        return corrupted("CRC mismatch for " + member.entry.name);
    }
    return sink.finish();
}

auto zip_reader::read_at(uint64_t offset, std::size_t size) -> result<std::vector<uint8_t>> {
    std::vector<uint8_t> bytes(size);
    file_.clear();
    file_.seekg(static_cast<std::streamoff>(offset));
    file_.read(reinterpret_cast<char*>(bytes.data()), static_cast<std::streamsize>(size));
    if (static_cast<std::size_t>(file_.gcount()) != size) {
        return unexpected(error(error_code::archive_read_error, "Short read at offset " +
                                                                    std::to_string(offset)));
    }
    return bytes;
}

}  // namespace kcenon::ultracopy

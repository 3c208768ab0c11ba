/**
 * @file archive_stream.cpp
 * @brief File, gzip and LZ4 frame streams
 */

#include "kcenon/ultracopy/archive/archive_stream.h"

#include "kcenon/ultracopy/core/logging.h"

#include <algorithm>
#include <climits>
#include <fstream>
#include <vector>

#include <zlib.h>

#ifdef ULTRACOPY_ENABLE_LZ4
#include <lz4frame.h>
#endif

namespace kcenon::ultracopy {

namespace {

constexpr std::size_t stream_chunk_size = 64 * 1024;

auto write_error(const std::string& message) -> unexpected {
    return unexpected(error(error_code::archive_write_error, message));
}

auto corrupted(const std::string& message) -> unexpected {
    return unexpected(error(error_code::archive_corrupted, message));
}

// ============================================================================
// Plain files
// ============================================================================

class file_sink : public byte_sink {
public:
    explicit file_sink(const std::filesystem::path& path)
        : path_(path), file_(path, std::ios::binary | std::ios::trunc) {}

    [[nodiscard]] auto is_open() const -> bool { return file_.is_open(); }

    auto write(std::span<const std::byte> data) -> result<void> override {
        file_.write(reinterpret_cast<const char*>(data.data()),
                    static_cast<std::streamsize>(data.size()));
        if (!file_) {
            return write_error("Write failed: " + path_.string());
        }
        return {};
    }

    auto finish() -> result<void> override {
        file_.flush();
        const bool ok = static_cast<bool>(file_);
        file_.close();
        if (!ok) {
            return write_error("Flush failed: " + path_.string());
        }
        return {};
    }

private:
    std::filesystem::path path_;
    std::ofstream file_;
};

class file_source : public byte_source {
public:
    explicit file_source(const std::filesystem::path& path)
        : path_(path), file_(path, std::ios::binary) {}

    [[nodiscard]] auto is_open() const -> bool { return file_.is_open(); }

    auto read(std::span<std::byte> buffer) -> result<std::size_t> override {
        file_.read(reinterpret_cast<char*>(buffer.data()),
                   static_cast<std::streamsize>(buffer.size()));
        if (file_.bad()) {
            return unexpected(error(error_code::archive_read_error,
                                    "Read failed: " + path_.string()));
        }
        return static_cast<std::size_t>(file_.gcount());
    }

private:
    std::filesystem::path path_;
    std::ifstream file_;
};

// ============================================================================
// gzip (zlib)
// ============================================================================

class gzip_sink : public byte_sink {
public:
    explicit gzip_sink(std::unique_ptr<byte_sink> inner)
        : inner_(std::move(inner)), out_(stream_chunk_size) {}

    ~gzip_sink() override {
        if (initialized_) {
            ::deflateEnd(&stream_);
        }
    }

    auto init(int level) -> result<void> {
        // 16 added to the window bits selects the gzip wrapper
        const int rv = ::deflateInit2(&stream_, level, Z_DEFLATED, MAX_WBITS + 16, 8,
                                      Z_DEFAULT_STRATEGY);
        if (rv != Z_OK) {
            return write_error("deflateInit2 failed: " + std::to_string(rv));
        }
        initialized_ = true;
        return {};
    }

    auto write(std::span<const std::byte> data) -> result<void> override {
        while (!data.empty()) {
            const auto chunk = std::min<std::size_t>(data.size(), UINT_MAX);
            stream_.next_in = reinterpret_cast<Bytef*>(const_cast<std::byte*>(data.data()));
            stream_.avail_in = static_cast<uInt>(chunk);

            auto drained = drain(Z_NO_FLUSH);
            if (!drained) {
                return drained;
            }
            data = data.subspan(chunk);
        }
        return {};
    }

    auto finish() -> result<void> override {
        stream_.next_in = nullptr;
        stream_.avail_in = 0;
        auto drained = drain(Z_FINISH);
        if (!drained) {
            return drained;
        }
        return inner_->finish();
    }

private:
    auto drain(int flush) -> result<void> {
        for (;;) {
            stream_.next_out = reinterpret_cast<Bytef*>(out_.data());
            stream_.avail_out = static_cast<uInt>(out_.size());

            const int rv = ::deflate(&stream_, flush);
            if (rv == Z_STREAM_ERROR) {
                return write_error("deflate failed");
            }

            const auto produced = out_.size() - stream_.avail_out;
            if (produced > 0) {
                auto written = inner_->write(std::span<const std::byte>(out_.data(), produced));
                if (!written) {
                    return written;
                }
            }

            if (flush == Z_FINISH) {
                if (rv == Z_STREAM_END) {
                    return {};
                }
            } else if (stream_.avail_out != 0) {
                return {};
            }
        }
    }

    std::unique_ptr<byte_sink> inner_;
    std::vector<std::byte> out_;
    z_stream stream_{};
    bool initialized_ = false;
};

class gzip_source : public byte_source {
public:
    explicit gzip_source(std::unique_ptr<byte_source> inner)
        : inner_(std::move(inner)), in_(stream_chunk_size) {}

    ~gzip_source() override {
        if (initialized_) {
            ::inflateEnd(&stream_);
        }
    }

    auto init() -> result<void> {
        const int rv = ::inflateInit2(&stream_, MAX_WBITS + 16);
        if (rv != Z_OK) {
            return unexpected(error(error_code::archive_read_error,
                                    "inflateInit2 failed: " + std::to_string(rv)));
        }
        initialized_ = true;
        return {};
    }

    auto read(std::span<std::byte> buffer) -> result<std::size_t> override {
        if (done_ || buffer.empty()) {
            return std::size_t{0};
        }

        const auto capacity = std::min<std::size_t>(buffer.size(), UINT_MAX);
        stream_.next_out = reinterpret_cast<Bytef*>(buffer.data());
        stream_.avail_out = static_cast<uInt>(capacity);

        for (;;) {
            if (stream_.avail_in == 0 && !input_eof_) {
                auto n = inner_->read(in_);
                if (!n) {
                    return unexpected(n.error());
                }
                if (n.value() == 0) {
                    input_eof_ = true;
                } else {
                    stream_.next_in = reinterpret_cast<Bytef*>(in_.data());
                    stream_.avail_in = static_cast<uInt>(n.value());
                }
            }

            const int rv = ::inflate(&stream_, Z_NO_FLUSH);
            const auto produced = capacity - stream_.avail_out;

            if (rv == Z_STREAM_END) {
                done_ = true;
                return produced;
            }
            if (rv == Z_BUF_ERROR) {
                if (input_eof_ && stream_.avail_in == 0) {
                    return corrupted("gzip stream truncated");
                }
            } else if (rv != Z_OK) {
                return corrupted("inflate failed: " + std::to_string(rv));
            }

            if (produced > 0) {
                return produced;
            }
        }
    }

private:
    std::unique_ptr<byte_source> inner_;
    std::vector<std::byte> in_;
    z_stream stream_{};
    bool initialized_ = false;
    bool input_eof_ = false;
    bool done_ = false;
};

// ============================================================================
// LZ4 frame
// ============================================================================

#ifdef ULTRACOPY_ENABLE_LZ4

class lz4_sink : public byte_sink {
public:
    explicit lz4_sink(std::unique_ptr<byte_sink> inner) : inner_(std::move(inner)) {}

    ~lz4_sink() override {
        if (context_ != nullptr) {
            LZ4F_freeCompressionContext(context_);
        }
    }

    auto init(int level) -> result<void> {
        const auto rv = LZ4F_createCompressionContext(&context_, LZ4F_VERSION);
        if (LZ4F_isError(rv)) {
            context_ = nullptr;
            return write_error(std::string("LZ4F context: ") + LZ4F_getErrorName(rv));
        }

        prefs_.compressionLevel = level;
        prefs_.frameInfo.contentChecksumFlag = LZ4F_contentChecksumEnabled;
        out_.resize(LZ4F_compressBound(stream_chunk_size, &prefs_) + LZ4F_HEADER_SIZE_MAX);

        const auto header = LZ4F_compressBegin(context_, out_.data(), out_.size(), &prefs_);
        if (LZ4F_isError(header)) {
            return write_error(std::string("LZ4F header: ") + LZ4F_getErrorName(header));
        }
        return emit(header);
    }

    auto write(std::span<const std::byte> data) -> result<void> override {
        while (!data.empty()) {
            const auto chunk = std::min(data.size(), stream_chunk_size);
            const auto n = LZ4F_compressUpdate(context_, out_.data(), out_.size(),
                                               data.data(), chunk, nullptr);
            if (LZ4F_isError(n)) {
                return write_error(std::string("LZ4F compress: ") + LZ4F_getErrorName(n));
            }
            auto emitted = emit(n);
            if (!emitted) {
                return emitted;
            }
            data = data.subspan(chunk);
        }
        return {};
    }

    auto finish() -> result<void> override {
        const auto n = LZ4F_compressEnd(context_, out_.data(), out_.size(), nullptr);
        if (LZ4F_isError(n)) {
            return write_error(std::string("LZ4F end: ") + LZ4F_getErrorName(n));
        }
        auto emitted = emit(n);
        if (!emitted) {
            return emitted;
        }
        return inner_->finish();
    }

private:
    auto emit(std::size_t size) -> result<void> {
        if (size == 0) {
            return {};
        }
        return inner_->write(std::span<const std::byte>(out_.data(), size));
    }

    std::unique_ptr<byte_sink> inner_;
    LZ4F_cctx* context_ = nullptr;
    LZ4F_preferences_t prefs_{};
    std::vector<std::byte> out_;
};

class lz4_source : public byte_source {
public:
    explicit lz4_source(std::unique_ptr<byte_source> inner)
        : inner_(std::move(inner)), in_(stream_chunk_size) {}

    ~lz4_source() override {
        if (context_ != nullptr) {
            LZ4F_freeDecompressionContext(context_);
        }
    }

    auto init() -> result<void> {
        const auto rv = LZ4F_createDecompressionContext(&context_, LZ4F_VERSION);
        if (LZ4F_isError(rv)) {
            context_ = nullptr;
            return unexpected(error(error_code::archive_read_error,
                                    std::string("LZ4F context: ") + LZ4F_getErrorName(rv)));
        }
        return {};
    }

    auto read(std::span<std::byte> buffer) -> result<std::size_t> override {
        for (;;) {
            if (frame_done_ || buffer.empty()) {
                return std::size_t{0};
            }

            if (in_pos_ == in_size_) {
                auto n = inner_->read(in_);
                if (!n) {
                    return unexpected(n.error());
                }
                if (n.value() == 0) {
                    return corrupted("LZ4 frame truncated");
                }
                in_pos_ = 0;
                in_size_ = n.value();
            }

            std::size_t dst_size = buffer.size();
            std::size_t src_size = in_size_ - in_pos_;
            const auto hint = LZ4F_decompress(context_, buffer.data(), &dst_size,
                                              in_.data() + in_pos_, &src_size, nullptr);
            if (LZ4F_isError(hint)) {
                return corrupted(std::string("LZ4F decompress: ") + LZ4F_getErrorName(hint));
            }

            in_pos_ += src_size;
            if (hint == 0) {
                frame_done_ = true;
            }
            if (dst_size > 0) {
                return dst_size;
            }
        }
    }

private:
    std::unique_ptr<byte_source> inner_;
    LZ4F_dctx* context_ = nullptr;
    std::vector<std::byte> in_;
    std::size_t in_pos_ = 0;
    std::size_t in_size_ = 0;
    bool frame_done_ = false;
};

#endif  // ULTRACOPY_ENABLE_LZ4

}  // namespace

auto make_file_sink(const std::filesystem::path& path) -> result<std::unique_ptr<byte_sink>> {
    auto sink = std::make_unique<file_sink>(path);
    if (!sink->is_open()) {
        return write_error("Cannot create " + path.string());
    }
    return std::unique_ptr<byte_sink>(std::move(sink));
}

auto make_file_source(const std::filesystem::path& path)
    -> result<std::unique_ptr<byte_source>> {
    auto source = std::make_unique<file_source>(path);
    if (!source->is_open()) {
        return unexpected(error(error_code::archive_read_error, "Cannot open " + path.string()));
    }
    return std::unique_ptr<byte_source>(std::move(source));
}

auto make_gzip_sink(std::unique_ptr<byte_sink> inner, int level)
    -> result<std::unique_ptr<byte_sink>> {
    auto sink = std::make_unique<gzip_sink>(std::move(inner));
    auto initialized = sink->init(std::clamp(level, 0, 9));
    if (!initialized) {
        return unexpected(initialized.error());
    }
    return std::unique_ptr<byte_sink>(std::move(sink));
}

auto make_gzip_source(std::unique_ptr<byte_source> inner)
    -> result<std::unique_ptr<byte_source>> {
    auto source = std::make_unique<gzip_source>(std::move(inner));
    auto initialized = source->init();
    if (!initialized) {
        return unexpected(initialized.error());
    }
    return std::unique_ptr<byte_source>(std::move(source));
}

auto make_lz4_sink([[maybe_unused]] std::unique_ptr<byte_sink> inner,
                   [[maybe_unused]] int level) -> result<std::unique_ptr<byte_sink>> {
#ifdef ULTRACOPY_ENABLE_LZ4
    auto sink = std::make_unique<lz4_sink>(std::move(inner));
    auto initialized = sink->init(std::clamp(level, 0, 9));
    if (!initialized) {
        return unexpected(initialized.error());
    }
    return std::unique_ptr<byte_sink>(std::move(sink));
#else
    UC_LOG_WARN(log_category::archive, "LZ4 compression not enabled");
    return unexpected(error(error_code::archive_format_unsupported, "LZ4 support not built in"));
#endif
}

auto make_lz4_source([[maybe_unused]] std::unique_ptr<byte_source> inner)
    -> result<std::unique_ptr<byte_source>> {
#ifdef ULTRACOPY_ENABLE_LZ4
    auto source = std::make_unique<lz4_source>(std::move(inner));
    auto initialized = source->init();
    if (!initialized) {
        return unexpected(initialized.error());
    }
    return std::unique_ptr<byte_source>(std::move(source));
#else
    UC_LOG_WARN(log_category::archive, "LZ4 compression not enabled");
    return unexpected(error(error_code::archive_format_unsupported, "LZ4 support not built in"));
#endif
}

}  // namespace kcenon::ultracopy

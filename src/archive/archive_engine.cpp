/**
 * @file archive_engine.cpp
 * @brief Archive engine implementation
 */

#include "kcenon/ultracopy/archive/archive_engine.h"

#include "kcenon/ultracopy/archive/archive_stream.h"
#include "kcenon/ultracopy/archive/tar_format.h"
#include "kcenon/ultracopy/archive/zip_format.h"
#include "kcenon/ultracopy/config/feature_flags.h"
#include "kcenon/ultracopy/core/logging.h"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <mutex>
#include <system_error>

#ifdef _WIN32
#include <windows.h>
#include <shlwapi.h>
#else
#include <fnmatch.h>
#endif

namespace kcenon::ultracopy {

namespace fs = std::filesystem;

namespace {

constexpr std::size_t copy_buffer_size = 64 * 1024;

auto lowercase(std::string_view value) -> std::string {
    std::string out(value);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

auto ends_with(const std::string& value, std::string_view suffix) -> bool {
    return value.size() >= suffix.size() &&
           value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

auto cancelled_error() -> unexpected {
    return unexpected(error(error_code::archive_cancelled, "Archive operation cancelled"));
}

/**
 * @brief Source that fails once cancellation is requested
 */
class cancellable_source : public byte_source {
public:
    cancellable_source(byte_source& inner, const std::atomic<bool>& cancelled)
        : inner_(inner), cancelled_(cancelled) {}

    auto read(std::span<std::byte> buffer) -> result<std::size_t> override {
        if (cancelled_.load()) {
            return cancelled_error();
        }
        return inner_.read(buffer);
    }

private:
    byte_source& inner_;
    const std::atomic<bool>& cancelled_;
};

/**
 * @brief Sink that fails once cancellation is requested
 */
class cancellable_sink : public byte_sink {
public:
    cancellable_sink(byte_sink& inner, const std::atomic<bool>& cancelled)
        : inner_(inner), cancelled_(cancelled) {}

    auto write(std::span<const std::byte> data) -> result<void> override {
        if (cancelled_.load()) {
            return cancelled_error();
        }
        return inner_.write(data);
    }

    auto finish() -> result<void> override { return inner_.finish(); }

private:
    byte_sink& inner_;
    const std::atomic<bool>& cancelled_;
};

/**
 * @brief Common face of the tar and zip writers
 */
class container_writer {
public:
    virtual ~container_writer() = default;
    virtual auto add_directory(const archive_entry& entry) -> result<void> = 0;
    virtual auto add_file(const archive_entry& entry, byte_source& content) -> result<void> = 0;
    virtual auto finish() -> result<void> = 0;
};

class tar_container : public container_writer {
public:
    explicit tar_container(byte_sink& sink) : writer_(sink) {}
    auto add_directory(const archive_entry& entry) -> result<void> override {
        return writer_.add_directory(entry);
    }
    auto add_file(const archive_entry& entry, byte_source& content) -> result<void> override {
        return writer_.add_file(entry, content);
    }
    auto finish() -> result<void> override { return writer_.finish(); }

private:
    tar_writer writer_;
};

class zip_container : public container_writer {
public:
    zip_container(byte_sink& sink, int level) : writer_(sink, level) {}
    auto add_directory(const archive_entry& entry) -> result<void> override {
        return writer_.add_directory(entry);
    }
    auto add_file(const archive_entry& entry, byte_source& content) -> result<void> override {
        return writer_.add_file(entry, content);
    }
    auto finish() -> result<void> override { return writer_.finish(); }

private:
    zip_writer writer_;
};

struct pending_entry {
    fs::path path;
    archive_entry entry;
};

auto to_unix_seconds(fs::file_time_type time) -> int64_t {
    const auto system_time = std::chrono::time_point_cast<std::chrono::seconds>(
        time - fs::file_time_type::clock::now() + std::chrono::system_clock::now());
    return static_cast<int64_t>(system_time.time_since_epoch().count());
}

auto describe(const fs::path& path, const std::string& name, bool is_directory)
    -> archive_entry {
    archive_entry entry;
    entry.name = name;
    entry.is_directory = is_directory;

    std::error_code ec;
    const auto status = fs::status(path, ec);
    if (!ec) {
        entry.mode = static_cast<uint32_t>(status.permissions() & fs::perms::mask);
    } else {
        entry.mode = is_directory ? 0755 : 0644;
    }

    const auto mtime = fs::last_write_time(path, ec);
    if (!ec) {
        entry.mtime = to_unix_seconds(mtime);
    }

    if (!is_directory) {
        const auto size = fs::file_size(path, ec);
        entry.size = ec ? 0 : static_cast<uint64_t>(size);
    }
    return entry;
}

// Join @p name below @p root, refusing names that escape it
auto safe_target(const fs::path& root, const std::string& name) -> result<fs::path> {
    auto unsafe = [&name]() {
        return unexpected(error(error_code::archive_unsafe_entry, "Unsafe entry: " + name));
    };

    if (name.empty() || name.front() == '/' || name.front() == '\\') {
        return unsafe();
    }
    if (name.size() >= 2 && std::isalpha(static_cast<unsigned char>(name[0])) && name[1] == ':') {
        return unsafe();
    }

    const fs::path relative(name);
    if (relative.is_absolute() || relative.has_root_name() || relative.has_root_directory()) {
        return unsafe();
    }
    for (const auto& part : relative) {
        if (part == "..") {
            return unsafe();
        }
    }
    return root / relative.lexically_normal();
}

void update_ratio(archive_stats& stats) {
    if (stats.total_bytes > 0) {
        stats.compression_ratio =
            (1.0 - static_cast<double>(stats.compressed_bytes) /
                       static_cast<double>(stats.total_bytes)) *
            100.0;
    } else {
        stats.compression_ratio = 0.0;
    }
}

}  // namespace

auto parse_archive_format(std::string_view name) -> std::optional<archive_format> {
    const auto value = lowercase(name);
    if (value == "zip") return archive_format::zip;
    if (value == "tar") return archive_format::tar;
    if (value == "tar.gz" || value == "tgz") return archive_format::tar_gz;
    if (value == "tar.lz4") return archive_format::tar_lz4;
    return std::nullopt;
}

auto detect_archive_format(const fs::path& path) -> std::optional<archive_format> {
    const auto name = lowercase(path.filename().string());
    if (ends_with(name, ".zip")) return archive_format::zip;
    if (ends_with(name, ".tar.gz") || ends_with(name, ".tgz")) return archive_format::tar_gz;
    if (ends_with(name, ".tar.lz4")) return archive_format::tar_lz4;
    if (ends_with(name, ".tar")) return archive_format::tar;
    return std::nullopt;
}

auto is_format_available(archive_format format) -> bool {
    if (format == archive_format::tar_lz4) {
        return ULTRACOPY_HAS_LZ4 != 0;
    }
    return true;
}

struct archive_engine::impl {
    std::atomic<bool> running{false};
    std::atomic<bool> cancelled{false};

    mutable std::mutex callback_mutex;
    archive_progress_callback progress_cb;
    log_callback log_cb;

    mutable std::mutex stats_mutex;
    archive_stats stats;

    std::chrono::steady_clock::time_point started;

    void emit_log(const std::string& message) {
        log_callback cb;
        {
            std::lock_guard lock(callback_mutex);
            cb = log_cb;
        }
        if (cb) cb(message);
    }

    void note(const std::string& message) {
        UC_LOG_INFO(log_category::archive, message);
        emit_log(message);
    }

    void publish(const archive_stats& snapshot) {
        {
            std::lock_guard lock(stats_mutex);
            stats = snapshot;
        }
        archive_progress_callback cb;
        {
            std::lock_guard lock(callback_mutex);
            cb = progress_cb;
        }
        if (cb) cb(snapshot);
    }

    auto begin() -> result<void> {
        bool expected = false;
        if (!running.compare_exchange_strong(expected, true)) {
            UC_LOG_WARN(log_category::archive, "Archive operation already in progress");
            return unexpected(error(error_code::process_already_running,
                                    "Archive operation already in progress"));
        }
        cancelled = false;
        started = std::chrono::steady_clock::now();
        {
            std::lock_guard lock(stats_mutex);
            stats = archive_stats{};
        }
        return {};
    }

    [[nodiscard]] auto elapsed() const -> std::chrono::milliseconds {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started);
    }

    auto collect(const fs::path& source, const fs::path& output,
                 const std::vector<std::string>& patterns) -> result<std::vector<pending_entry>> {
        std::vector<pending_entry> entries;
        std::error_code ec;

        if (!fs::is_directory(source, ec)) {
            entries.push_back({source, describe(source, source.filename().string(), false)});
            return entries;
        }

        const auto base = source.parent_path();
        entries.push_back({source, describe(source, source.filename().string(), true)});

        fs::recursive_directory_iterator it(
            source, fs::directory_options::skip_permission_denied, ec);
        if (ec) {
            return unexpected(error(error_code::archive_read_error,
                                    "Cannot read " + source.string() + ": " + ec.message()));
        }

        for (fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
            if (ec) {
                UC_LOG_WARN(log_category::archive, "Directory walk error: " + ec.message());
                ec.clear();
                continue;
            }
            if (cancelled.load()) {
                return cancelled_error();
            }

            const auto& path = it->path();
            std::error_code type_ec;
            const bool is_dir = it->is_directory(type_ec);

            if (is_excluded(path.filename().string(), patterns)) {
                if (is_dir) {
                    it.disable_recursion_pending();
                }
                continue;
            }
            if (path == output) {
                continue;
            }
            if (!is_dir && !it->is_regular_file(type_ec)) {
                continue;
            }

            const auto name = path.lexically_relative(base).generic_string();
            entries.push_back({path, describe(path, name, is_dir)});
        }

        std::sort(entries.begin(), entries.end(),
                  [](const pending_entry& a, const pending_entry& b) {
                      return a.entry.name < b.entry.name;
                  });
        return entries;
    }

    auto open_output(const fs::path& output, const archive_options& options)
        -> result<std::unique_ptr<byte_sink>> {
        auto file = make_file_sink(output);
        if (!file) {
            return file;
        }

        switch (options.format) {
            case archive_format::tar_gz:
                return make_gzip_sink(std::move(file.value()), options.level);
            case archive_format::tar_lz4:
                return make_lz4_sink(std::move(file.value()), options.level);
            default:
                return file;
        }
    }

    auto open_input(const fs::path& archive, archive_format format)
        -> result<std::unique_ptr<byte_source>> {
        auto file = make_file_source(archive);
        if (!file) {
            return file;
        }

        switch (format) {
            case archive_format::tar_gz:
                return make_gzip_source(std::move(file.value()));
            case archive_format::tar_lz4:
                return make_lz4_source(std::move(file.value()));
            default:
                return file;
        }
    }

    auto write_archive(const std::vector<pending_entry>& entries, const fs::path& output,
                       const archive_options& options, archive_stats& current) -> result<void> {
        auto sink = open_output(output, options);
        if (!sink) {
            return unexpected(sink.error());
        }

        cancellable_sink guarded(*sink.value(), cancelled);
        std::unique_ptr<container_writer> writer;
        if (options.format == archive_format::zip) {
            writer = std::make_unique<zip_container>(guarded, options.level);
        } else {
            writer = std::make_unique<tar_container>(guarded);
        }

        for (const auto& pending : entries) {
            if (cancelled.load()) {
                return cancelled_error();
            }

            if (pending.entry.is_directory) {
                auto added = writer->add_directory(pending.entry);
                if (!added) {
                    return added;
                }
                continue;
            }

            auto file = make_file_source(pending.path);
            if (!file) {
                UC_LOG_WARN(log_category::archive, "Skipping unreadable file: " +
                                                       pending.path.string());
                emit_log("Error compressing " + pending.path.string() + ": " +
                         file.error().message);
                continue;
            }

            cancellable_source content(*file.value(), cancelled);
            auto added = writer->add_file(pending.entry, content);
            if (!added) {
                return added;
            }

            current.processed_files++;
            current.total_bytes += pending.entry.size;
            current.current_entry = pending.entry.name;
            current.elapsed = elapsed();
            UC_LOG_DEBUG(log_category::archive, "Compressed: " + pending.entry.name);
            emit_log("Compressed: " + pending.entry.name);
            publish(current);
        }

        return writer->finish();
    }

    auto extract_zip(const fs::path& archive, const fs::path& output_dir,
                     archive_stats& current) -> result<void> {
        zip_reader reader;
        auto opened = reader.open(archive);
        if (!opened) {
            return opened;
        }

        current.total_files = static_cast<uint64_t>(
            std::count_if(reader.members().begin(), reader.members().end(),
                          [](const zip_member& m) { return !m.entry.is_directory; }));

        for (const auto& member : reader.members()) {
            if (cancelled.load()) {
                return cancelled_error();
            }

            auto extracted = extract_entry(output_dir, member.entry, current,
                                           [&](byte_sink& file) {
                                               cancellable_sink guarded(file, cancelled);
                                               return reader.extract(member, guarded);
                                           });
            if (!extracted) {
                return extracted;
            }
        }
        return {};
    }

    auto extract_tar(const fs::path& archive, archive_format format, const fs::path& output_dir,
                     archive_stats& current) -> result<void> {
        auto input = open_input(archive, format);
        if (!input) {
            return unexpected(input.error());
        }

        cancellable_source source(*input.value(), cancelled);
        tar_reader reader(source);
        std::vector<std::byte> buffer(copy_buffer_size);

        auto copy_data = [&](byte_sink& file) -> result<void> {
            for (;;) {
                auto n = reader.read_data(buffer);
                if (!n) {
                    return unexpected(n.error());
                }
                if (n.value() == 0) {
                    return file.finish();
                }
                auto written = file.write(std::span<const std::byte>(buffer.data(), n.value()));
                if (!written) {
                    return written;
                }
            }
        };

        for (;;) {
            auto next = reader.next();
            if (!next) {
                return unexpected(next.error());
            }
            if (!next.value()) {
                return {};
            }

            const auto& entry = *next.value();
            if (!entry.is_directory) {
                current.total_files++;
            }
            auto extracted = extract_entry(output_dir, entry, current, copy_data);
            if (!extracted) {
                return extracted;
            }
        }
    }

    /**
     * @brief Create @p entry under @p output_dir, filling a file through @p fill
     *
     * A file that fails half way is removed.
     */
    template <typename Fill>
    auto extract_entry(const fs::path& output_dir, const archive_entry& entry,
                       archive_stats& current, Fill&& fill) -> result<void> {
        auto target = safe_target(output_dir, entry.name);
        if (!target) {
            return unexpected(target.error());
        }

        std::error_code ec;
        if (entry.is_directory) {
            fs::create_directories(target.value(), ec);
            if (ec) {
                return unexpected(error(error_code::archive_write_error,
                                        "Cannot create " + target.value().string()));
            }
            return {};
        }

        fs::create_directories(target.value().parent_path(), ec);
        auto file = make_file_sink(target.value());
        if (!file) {
            return unexpected(file.error());
        }

        result<void> filled = fill(*file.value());
        if (!filled) {
            file.value().reset();
            fs::remove(target.value(), ec);
            return filled;
        }

        record_extracted(current, entry);
        return {};
    }

    void record_extracted(archive_stats& current, const archive_entry& entry) {
        current.processed_files++;
        current.total_bytes += entry.size;
        current.current_entry = entry.name;
        current.elapsed = elapsed();
        UC_LOG_DEBUG(log_category::archive, "Extracted: " + entry.name);
        emit_log("Extracted: " + entry.name);
        publish(current);
    }
};

archive_engine::archive_engine() : impl_(std::make_unique<impl>()) {}

archive_engine::archive_engine(archive_engine&&) noexcept = default;
auto archive_engine::operator=(archive_engine&&) noexcept -> archive_engine& = default;
archive_engine::~archive_engine() = default;

void archive_engine::on_progress(archive_progress_callback callback) {
    std::lock_guard lock(impl_->callback_mutex);
    impl_->progress_cb = std::move(callback);
}

void archive_engine::on_log(log_callback callback) {
    std::lock_guard lock(impl_->callback_mutex);
    impl_->log_cb = std::move(callback);
}

auto archive_engine::compress(const fs::path& source, const fs::path& output,
                              const archive_options& options) -> result<archive_stats> {
    auto began = impl_->begin();
    if (!began) {
        return unexpected(began.error());
    }

    struct running_reset {
        std::atomic<bool>& flag;
        ~running_reset() { flag = false; }
    } reset{impl_->running};

    std::error_code ec;
    if (!fs::exists(source, ec)) {
        return unexpected(error(error_code::path_not_found,
                                "Source not found: " + source.string()));
    }
    if (!is_format_available(options.format)) {
        return unexpected(error(error_code::archive_format_unsupported,
                                std::string("Format not available: ") + to_string(options.format)));
    }

    auto src = fs::absolute(source, ec).lexically_normal();
    if (!src.has_filename()) {
        src = src.parent_path();
    }
    const auto out = fs::absolute(output, ec).lexically_normal();

    if (out.has_parent_path()) {
        fs::create_directories(out.parent_path(), ec);
        if (ec) {
            return unexpected(error(error_code::archive_write_error,
                                    "Cannot create " + out.parent_path().string() + ": " +
                                        ec.message()));
        }
    }

    impl_->note("Starting compression: " + src.string());
    impl_->note("Output file: " + out.string());
    impl_->note(std::string("Format: ") + to_string(options.format));

    auto entries = impl_->collect(src, out, options.exclude_patterns);
    if (!entries) {
        return unexpected(entries.error());
    }

    archive_stats current;
    current.total_files = static_cast<uint64_t>(
        std::count_if(entries.value().begin(), entries.value().end(),
                      [](const pending_entry& e) { return !e.entry.is_directory; }));
    impl_->note("Total files to compress: " + std::to_string(current.total_files));

    auto written = impl_->write_archive(entries.value(), out, options, current);
    if (!written) {
        fs::remove(out, ec);
        if (written.error().code == error_code::archive_cancelled) {
            impl_->note("Compression cancelled");
        } else {
            UC_LOG_ERROR(log_category::archive, "Compression failed: " + written.error().message);
            impl_->emit_log("Error during compression: " + written.error().message);
        }
        current.elapsed = impl_->elapsed();
        impl_->publish(current);
        return unexpected(written.error());
    }

    const auto archive_size = fs::file_size(out, ec);
    current.compressed_bytes = ec ? 0 : static_cast<uint64_t>(archive_size);
    update_ratio(current);
    current.elapsed = impl_->elapsed();
    current.current_entry.clear();

    impl_->note("Compression completed: " + std::to_string(current.processed_files) +
                " files, " + format_bytes(current.total_bytes) + " -> " +
                format_bytes(current.compressed_bytes) + " in " +
                format_duration(current.elapsed));
    impl_->publish(current);
    return current;
}

auto archive_engine::decompress(const fs::path& archive, const fs::path& output_dir,
                                std::optional<archive_format> format) -> result<archive_stats> {
    auto began = impl_->begin();
    if (!began) {
        return unexpected(began.error());
    }

    struct running_reset {
        std::atomic<bool>& flag;
        ~running_reset() { flag = false; }
    } reset{impl_->running};

    std::error_code ec;
    if (!fs::is_regular_file(archive, ec)) {
        return unexpected(error(error_code::path_not_found,
                                "Archive not found: " + archive.string()));
    }

    if (!format) {
        format = detect_archive_format(archive);
        if (!format) {
            return unexpected(error(error_code::archive_format_unsupported,
                                    "Cannot determine format for: " + archive.string()));
        }
    }
    if (!is_format_available(*format)) {
        return unexpected(error(error_code::archive_format_unsupported,
                                std::string("Format not available: ") + to_string(*format)));
    }

    const auto out = fs::absolute(output_dir, ec).lexically_normal();
    fs::create_directories(out, ec);
    if (ec) {
        return unexpected(error(error_code::archive_write_error,
                                "Cannot create " + out.string() + ": " + ec.message()));
    }

    impl_->note("Starting decompression: " + archive.string());
    impl_->note("Output directory: " + out.string());
    impl_->note(std::string("Format: ") + to_string(*format));

    archive_stats current;
    auto extracted = *format == archive_format::zip
                         ? impl_->extract_zip(archive, out, current)
                         : impl_->extract_tar(archive, *format, out, current);

    current.elapsed = impl_->elapsed();
    if (!extracted) {
        if (extracted.error().code == error_code::archive_cancelled) {
            impl_->note("Decompression cancelled");
        } else {
            UC_LOG_ERROR(log_category::archive,
                         "Decompression failed: " + extracted.error().message);
            impl_->emit_log("Error during decompression: " + extracted.error().message);
        }
        impl_->publish(current);
        return unexpected(extracted.error());
    }

    const auto archive_size = fs::file_size(archive, ec);
    current.compressed_bytes = ec ? 0 : static_cast<uint64_t>(archive_size);
    update_ratio(current);
    current.current_entry.clear();

    impl_->note("Decompression completed: " + std::to_string(current.processed_files) +
                " files in " + format_duration(current.elapsed));
    impl_->publish(current);
    return current;
}

void archive_engine::cancel() {
    if (impl_->running.load()) {
        UC_LOG_INFO(log_category::archive, "Cancelling archive operation");
        impl_->cancelled = true;
    }
}

auto archive_engine::is_running() const -> bool {
    return impl_->running.load();
}

auto archive_engine::last_stats() const -> archive_stats {
    std::lock_guard lock(impl_->stats_mutex);
    return impl_->stats;
}

auto archive_engine::is_excluded(std::string_view name, const std::vector<std::string>& patterns)
    -> bool {
    const std::string value(name);
    for (const auto& pattern : patterns) {
#ifdef _WIN32
        if (PathMatchSpecA(value.c_str(), pattern.c_str())) {
            return true;
        }
#else
        if (::fnmatch(pattern.c_str(), value.c_str(), 0) == 0) {
            return true;
        }
#endif
    }
    return false;
}

}  // namespace kcenon::ultracopy

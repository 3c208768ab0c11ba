// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <functional>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <regex>
#include <sstream>
#include <string>
#include <string_view>

#include "kcenon/ultracopy/config/feature_flags.h"

#if ULTRACOPY_WITH_LOGGER_SYSTEM
#include <kcenon/logger/core/logger.h>
#include <kcenon/logger/core/logger_builder.h>
#include <kcenon/logger/writers/console_writer.h>
#endif

namespace kcenon::ultracopy {

/**
 * @brief Log categories, one per pipeline stage
 */
struct log_category {
    static constexpr std::string_view engine = "ultracopy.engine";
    static constexpr std::string_view process = "ultracopy.process";
    static constexpr std::string_view parser = "ultracopy.parser";
    static constexpr std::string_view network = "ultracopy.network";
    static constexpr std::string_view staging = "ultracopy.staging";
    static constexpr std::string_view device = "ultracopy.device";
    static constexpr std::string_view archive = "ultracopy.archive";
    static constexpr std::string_view session = "ultracopy.session";
};

enum class log_level {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    fatal = 5
};

inline std::string_view log_level_to_string(log_level level) {
    switch (level) {
        case log_level::trace: return "TRACE";
        case log_level::debug: return "DEBUG";
        case log_level::info: return "INFO";
        case log_level::warn: return "WARN";
        case log_level::error: return "ERROR";
        case log_level::fatal: return "FATAL";
        default: return "UNKNOWN";
    }
}

namespace detail {

inline auto escape_json(std::string_view input) -> std::string {
    std::string output;
    output.reserve(input.size() + 8);
    for (char c : input) {
        switch (c) {
            case '"':  output += "\\\""; break;
            case '\\': output += "\\\\"; break;
            case '\b': output += "\\b";  break;
            case '\f': output += "\\f";  break;
            case '\n': output += "\\n";  break;
            case '\r': output += "\\r";  break;
            case '\t': output += "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                    output += buf;
                } else {
                    output += c;
                }
        }
    }
    return output;
}

/**
 * @brief Appends "name":value members to a flat JSON object
 */
class json_members {
public:
    void add(std::string_view name, std::string_view value) {
        key(name);
        out_ << '"' << escape_json(value) << '"';
    }

    void add(std::string_view name, uint64_t value) {
        key(name);
        out_ << value;
    }

    void add(std::string_view name, int value) {
        key(name);
        out_ << value;
    }

    void add(std::string_view name, double value) {
        key(name);
        out_ << std::fixed << std::setprecision(2) << value;
    }

    /// Members without the surrounding braces
    [[nodiscard]] auto str() const -> std::string { return out_.str(); }

private:
    void key(std::string_view name) {
        if (!empty_) {
            out_ << ',';
        }
        out_ << '"' << name << "\":";
        empty_ = false;
    }

    std::ostringstream out_;
    bool empty_ = true;
};

}  // namespace detail

/**
 * @brief What the masker hides in log output
 */
struct masking_config {
    /// Replace folder components of local and share paths, keeping the last element
    bool mask_paths = false;
    /// Replace the server of \\server\share paths and dotted IPv4 hosts
    bool mask_hosts = false;
    char mask_char = '*';

    static masking_config all_masked() {
        return {true, true, '*'};
    }

    static masking_config none() {
        return {};
    }
};

/**
 * @brief Hides copy endpoints in log messages
 *
 * Host masking runs first, so a UNC path keeps its share and file names
 * when only hosts are masked.
 */
class sensitive_info_masker {
public:
    explicit sensitive_info_masker(masking_config config = masking_config::none())
        : config_(config) {}

    [[nodiscard]] auto mask(const std::string& input) const -> std::string {
        std::string result = input;
        if (config_.mask_hosts) {
            result = replace_all(result, unc_host_pattern(), [this](const std::smatch& m) {
                return m.str(1) + std::string(m.length(2), config_.mask_char);
            });
            result = replace_all(result, ipv4_pattern(), [this](const std::smatch& m) {
                return mask_host(m.str());
            });
        }
        if (config_.mask_paths) {
            result = replace_all(result, path_pattern(), [this](const std::smatch& m) {
                return mask_path(m.str());
            });
        }
        return result;
    }

    /**
     * @brief Mask every component of @p path except the last
     *
     * Separators and a leading drive letter or UNC prefix are kept, so
     * "C:\Users\ann\a.txt" becomes "C:\*****\***\a.txt".
     */
    [[nodiscard]] auto mask_path(const std::string& path) const -> std::string {
        if (!config_.mask_paths || path.empty()) {
            return path;
        }

        const auto last_sep = path.find_last_of("/\\");
        if (last_sep == std::string::npos) {
            return path;
        }

        std::size_t begin = 0;
        if (path.size() >= 2 && path[1] == ':') {
            begin = 2;
        }

        std::string result = path;
        for (std::size_t i = begin; i < last_sep; ++i) {
            if (result[i] != '/' && result[i] != '\\') {
                result[i] = config_.mask_char;
            }
        }
        return result;
    }

    /// Keep the final octet so related lines can still be correlated
    [[nodiscard]] auto mask_host(const std::string& host) const -> std::string {
        if (!config_.mask_hosts || host.empty()) {
            return host;
        }
        const auto last_dot = host.find_last_of('.');
        if (last_dot == std::string::npos) {
            return std::string(host.size(), config_.mask_char);
        }
        return std::string(last_dot, config_.mask_char) + host.substr(last_dot);
    }

    [[nodiscard]] auto config() const -> const masking_config& { return config_; }

    [[nodiscard]] auto enabled() const -> bool {
        return config_.mask_paths || config_.mask_hosts;
    }

private:
    template <typename Fn>
    static auto replace_all(const std::string& input, const std::regex& pattern, Fn&& fn)
        -> std::string {
        std::string result;
        std::size_t last = 0;
        for (std::sregex_iterator it(input.begin(), input.end(), pattern), end; it != end; ++it) {
            result.append(input, last, static_cast<std::size_t>(it->position()) - last);
            result += fn(*it);
            last = static_cast<std::size_t>(it->position() + it->length());
        }
        result.append(input, last, std::string::npos);
        return result;
    }

    static auto unc_host_pattern() -> const std::regex& {
        static const std::regex pattern(R"((\\\\|//)([A-Za-z0-9._-]+))");
        return pattern;
    }

    static auto ipv4_pattern() -> const std::regex& {
        static const std::regex pattern(R"(\b\d{1,3}\.\d{1,3}\.\d{1,3}\.\d{1,3}\b)");
        return pattern;
    }

    static auto path_pattern() -> const std::regex& {
        static const std::regex pattern(
            R"((?:[A-Za-z]:|\\\\|//)?(?:[\\/][^\\/\s"]+){2,})");
        return pattern;
    }

    masking_config config_;
};

/**
 * @brief Structured fields attached to a log line about one run
 */
struct transfer_log_context {
    std::string transfer_id;
    std::string filename;
    std::optional<std::string> source;
    std::optional<std::string> destination;
    std::optional<uint64_t> files_copied;
    std::optional<uint64_t> bytes_copied;
    std::optional<uint64_t> error_count;
    std::optional<double> rate_mbps;
    std::optional<uint64_t> duration_ms;
    std::optional<int> exit_code;
    std::optional<std::string> stage;
    std::optional<std::string> device;
    std::optional<std::string> error_message;

    [[nodiscard]] auto to_json(const sensitive_info_masker* masker = nullptr) const
        -> std::string {
        detail::json_members members;
        append_to(members, masker);
        return "{" + members.str() + "}";
    }

    void append_to(detail::json_members& members,
                   const sensitive_info_masker* masker = nullptr) const {
        auto text = [masker](const std::string& value) {
            return masker ? masker->mask(value) : value;
        };

        if (!transfer_id.empty()) members.add("transfer_id", transfer_id);
        if (!filename.empty()) members.add("filename", text(filename));
        if (source) members.add("source", text(*source));
        if (destination) members.add("destination", text(*destination));
        if (files_copied) members.add("files_copied", *files_copied);
        if (bytes_copied) members.add("bytes_copied", *bytes_copied);
        if (error_count) members.add("error_count", *error_count);
        if (rate_mbps) members.add("rate_mbps", *rate_mbps);
        if (duration_ms) members.add("duration_ms", *duration_ms);
        if (exit_code) members.add("exit_code", *exit_code);
        if (stage) members.add("stage", *stage);
        if (device) members.add("device", *device);
        if (error_message) members.add("error_message", text(*error_message));
    }
};

/**
 * @brief One log line with its metadata, as delivered to sinks
 */
struct structured_log_entry {
    std::string timestamp;  ///< ISO 8601, UTC, milliseconds
    log_level level = log_level::info;
    std::string category;
    std::string message;
    std::optional<transfer_log_context> context;
    const char* source_file = nullptr;
    int source_line = 0;
    const char* function_name = nullptr;

    [[nodiscard]] auto to_json(const sensitive_info_masker* masker = nullptr) const
        -> std::string {
        detail::json_members members;
        members.add("timestamp", timestamp);
        members.add("level", log_level_to_string(level));
        members.add("category", category);
        members.add("message", masker ? masker->mask(message) : message);
        if (context) {
            context->append_to(members, masker);
        }

        std::string json = "{" + members.str();
        if (source_file) {
            detail::json_members location;
            location.add("file", source_file);
            location.add("line", source_line);
            if (function_name) {
                location.add("function", function_name);
            }
            json += ",\"location\":{" + location.str() + "}";
        }
        return json + "}";
    }

    /**
     * @brief "<time> [LEVEL] [category] message {context}"
     */
    [[nodiscard]] auto to_text(const sensitive_info_masker* masker = nullptr) const
        -> std::string {
        std::ostringstream oss;
        oss << timestamp << " [" << log_level_to_string(level) << "] [" << category << "] "
            << (masker ? masker->mask(message) : message);
        if (context) {
            oss << ' ' << context->to_json(masker);
        }
        return oss.str();
    }
};

enum class log_output_format {
    text,
    json
};

/**
 * @brief Process-wide logger behind the UC_LOG_* macros
 *
 * Writes to logger_system when built with it, to stderr otherwise. A sink
 * callback, when set, receives every entry that passes the level filter
 * together with its rendered line.
 */
class ultracopy_logger {
public:
    using sink_callback =
        std::function<void(const structured_log_entry& entry, const std::string& rendered)>;

    ultracopy_logger() = default;

    ultracopy_logger(const ultracopy_logger&) = delete;
    ultracopy_logger& operator=(const ultracopy_logger&) = delete;

    /**
     * @brief Create the logger_system backend; later calls do nothing
     *
     * Called when a transfer_engine is built.
     */
    void initialize() {
        bool expected = false;
        if (!initialized_.compare_exchange_strong(expected, true)) {
            return;
        }

#if ULTRACOPY_WITH_LOGGER_SYSTEM
        auto result = kcenon::logger::logger_builder()
            .with_async(true)
            .with_min_level(to_backend_level(min_level_.load()))
            .add_writer("console", std::make_unique<kcenon::logger::console_writer>())
            .build();
        if (result) {
            std::lock_guard<std::mutex> lock(config_mutex_);
            backend_ = std::move(result.value());
        }
#endif
    }

    [[nodiscard]] auto is_initialized() const -> bool { return initialized_.load(); }

    void set_level(log_level level) {
        min_level_.store(level);
#if ULTRACOPY_WITH_LOGGER_SYSTEM
        std::lock_guard<std::mutex> lock(config_mutex_);
        if (backend_) {
            backend_->set_min_level(to_backend_level(level));
        }
#endif
    }

    [[nodiscard]] auto level() const -> log_level { return min_level_.load(); }

    [[nodiscard]] auto is_enabled(log_level level) const -> bool {
        return static_cast<int>(level) >= static_cast<int>(min_level_.load());
    }

    void set_output_format(log_output_format format) {
        std::lock_guard<std::mutex> lock(config_mutex_);
        format_ = format;
    }

    void enable_json_output(bool enable = true) {
        set_output_format(enable ? log_output_format::json : log_output_format::text);
    }

    void set_masking(masking_config config) {
        std::lock_guard<std::mutex> lock(config_mutex_);
        masker_ = sensitive_info_masker(config);
    }

    /// Silence stderr output, e.g. while a sink collects lines in tests
    void set_console_output(bool enable) { console_.store(enable); }

    void set_sink(sink_callback callback) {
        std::lock_guard<std::mutex> lock(sink_mutex_);
        sink_ = std::move(callback);
    }

    void log(log_level level,
             std::string_view category,
             std::string_view message,
             const transfer_log_context* context = nullptr,
             const char* file = nullptr,
             int line = 0,
             const char* function = nullptr) {
        if (!is_enabled(level)) {
            return;
        }

        structured_log_entry entry;
        entry.timestamp = iso8601_now();
        entry.level = level;
        entry.category = std::string(category);
        entry.message = std::string(message);
        if (context) {
            entry.context = *context;
        }
        entry.source_file = file;
        entry.source_line = line;
        entry.function_name = function;

        log_output_format format;
        sensitive_info_masker masker;
        {
            std::lock_guard<std::mutex> lock(config_mutex_);
            format = format_;
            masker = masker_;
        }
        const auto* active_masker = masker.enabled() ? &masker : nullptr;
        const std::string rendered = format == log_output_format::json
                                         ? entry.to_json(active_masker)
                                         : entry.to_text(active_masker);

        sink_callback sink;
        {
            std::lock_guard<std::mutex> lock(sink_mutex_);
            sink = sink_;
        }
        if (sink) {
            sink(entry, rendered);
        }

        write(entry, rendered);
    }

    void flush() {
#if ULTRACOPY_WITH_LOGGER_SYSTEM
        std::lock_guard<std::mutex> lock(config_mutex_);
        if (backend_) {
            backend_->flush();
        }
#endif
    }

private:
    void write([[maybe_unused]] const structured_log_entry& entry, const std::string& rendered) {
#if ULTRACOPY_WITH_LOGGER_SYSTEM
        {
            std::lock_guard<std::mutex> lock(config_mutex_);
            if (backend_) {
                if (entry.source_file && entry.function_name) {
                    backend_->log(to_backend_level(entry.level), rendered, entry.source_file,
                                  entry.source_line, entry.function_name);
                } else {
                    backend_->log(to_backend_level(entry.level), rendered);
                }
                return;
            }
        }
#endif
        if (console_.load()) {
            static std::mutex stderr_mutex;
            std::lock_guard<std::mutex> lock(stderr_mutex);
            std::cerr << rendered << '\n';
        }
    }

    static auto iso8601_now() -> std::string {
        const auto now = std::chrono::system_clock::now();
        const auto seconds = std::chrono::system_clock::to_time_t(now);
        const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
#if defined(_WIN32)
        gmtime_s(&tm_buf, &seconds);
#else
        gmtime_r(&seconds, &tm_buf);
#endif

        std::ostringstream oss;
        oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
        return oss.str();
    }

#if ULTRACOPY_WITH_LOGGER_SYSTEM
    static auto to_backend_level(log_level level) -> kcenon::logger::log_level {
        switch (level) {
            case log_level::trace: return kcenon::logger::log_level::trace;
            case log_level::debug: return kcenon::logger::log_level::debug;
            case log_level::info: return kcenon::logger::log_level::info;
            case log_level::warn: return kcenon::logger::log_level::warning;
            case log_level::error: return kcenon::logger::log_level::error;
            case log_level::fatal: return kcenon::logger::log_level::critical;
            default: return kcenon::logger::log_level::info;
        }
    }

    std::unique_ptr<kcenon::logger::logger> backend_;
#endif

    std::atomic<log_level> min_level_{log_level::info};
    std::atomic<bool> initialized_{false};
    std::atomic<bool> console_{true};

    log_output_format format_{log_output_format::text};
    sensitive_info_masker masker_;
    mutable std::mutex config_mutex_;

    sink_callback sink_;
    std::mutex sink_mutex_;
};

inline ultracopy_logger& get_logger() {
    static ultracopy_logger instance;
    return instance;
}

#define UC_LOG(level, category, message) \
    kcenon::ultracopy::get_logger().log( \
        level, category, message, nullptr, __FILE__, __LINE__, __FUNCTION__)

#define UC_LOG_CTX(level, category, message, context) \
    kcenon::ultracopy::get_logger().log( \
        level, category, message, &(context), __FILE__, __LINE__, __FUNCTION__)

#define UC_LOG_TRACE(category, message) \
    UC_LOG(kcenon::ultracopy::log_level::trace, category, message)
#define UC_LOG_DEBUG(category, message) \
    UC_LOG(kcenon::ultracopy::log_level::debug, category, message)
#define UC_LOG_INFO(category, message) \
    UC_LOG(kcenon::ultracopy::log_level::info, category, message)
#define UC_LOG_WARN(category, message) \
    UC_LOG(kcenon::ultracopy::log_level::warn, category, message)
#define UC_LOG_ERROR(category, message) \
    UC_LOG(kcenon::ultracopy::log_level::error, category, message)
#define UC_LOG_FATAL(category, message) \
    UC_LOG(kcenon::ultracopy::log_level::fatal, category, message)

#define UC_LOG_INFO_CTX(category, message, ctx) \
    UC_LOG_CTX(kcenon::ultracopy::log_level::info, category, message, ctx)
#define UC_LOG_WARN_CTX(category, message, ctx) \
    UC_LOG_CTX(kcenon::ultracopy::log_level::warn, category, message, ctx)
#define UC_LOG_ERROR_CTX(category, message, ctx) \
    UC_LOG_CTX(kcenon::ultracopy::log_level::error, category, message, ctx)

}  // namespace kcenon::ultracopy

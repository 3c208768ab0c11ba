/**
 * @file types.h
 * @brief Core type definitions for ultracopy
 */

#ifndef KCENON_ULTRACOPY_CORE_TYPES_H
#define KCENON_ULTRACOPY_CORE_TYPES_H

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace kcenon::ultracopy {

/**
 * @brief Error codes for transfer orchestration
 *
 * Error code ranges:
 * - -100 to -119: Configuration errors (detected before any process spawn)
 * - -120 to -139: Process errors (reported by the external utility)
 * - -140 to -159: Staging errors (device enumeration / copy-out)
 * - -160 to -169: Partial item errors (single item of a batch)
 * - -170 to -189: Archive errors
 * - -200 to -219: Internal errors
 */
enum class error_code {
    success = 0,

    // Configuration errors (-100 to -119)
    invalid_source = -100,
    invalid_destination = -101,
    path_not_found = -102,
    path_not_readable = -103,
    invalid_configuration = -104,
    device_not_configured = -105,

    // Process errors (-120 to -139)
    process_already_running = -120,
    process_launch_failed = -121,
    process_failed = -122,
    process_cancelled = -123,
    process_signalled = -124,

    // Staging errors (-140 to -159)
    staging_failed = -140,
    staging_directory_error = -141,
    device_enumeration_failed = -142,
    device_copy_out_failed = -143,
    device_path_not_found = -144,
    device_timeout = -145,

    // Partial item errors (-160 to -169)
    item_copy_failed = -160,
    item_skipped = -161,

    // Archive errors (-170 to -189)
    archive_format_unsupported = -170,
    archive_read_error = -171,
    archive_write_error = -172,
    archive_corrupted = -173,
    archive_cancelled = -174,
    archive_unsafe_entry = -175,

    // Internal errors (-200 to -219)
    internal_error = -200,
    not_initialized = -201,
};

/**
 * @brief Error taxonomy used to decide how an error is surfaced
 */
enum class error_category {
    none,
    configuration,
    process,
    staging,
    partial_item,
    archive,
    internal
};

/**
 * @brief Convert error code to string
 */
[[nodiscard]] constexpr auto to_string(error_code code) -> const char* {
    switch (code) {
        case error_code::success:
            return "success";
        case error_code::invalid_source:
            return "invalid source";
        case error_code::invalid_destination:
            return "invalid destination";
        case error_code::path_not_found:
            return "path not found";
        case error_code::path_not_readable:
            return "path not readable";
        case error_code::invalid_configuration:
            return "invalid configuration";
        case error_code::device_not_configured:
            return "device automation not configured";
        case error_code::process_already_running:
            return "process already running";
        case error_code::process_launch_failed:
            return "process launch failed";
        case error_code::process_failed:
            return "process failed";
        case error_code::process_cancelled:
            return "process cancelled";
        case error_code::process_signalled:
            return "process killed by signal";
        case error_code::staging_failed:
            return "staging failed";
        case error_code::staging_directory_error:
            return "staging directory error";
        case error_code::device_enumeration_failed:
            return "device enumeration failed";
        case error_code::device_copy_out_failed:
            return "device copy-out failed";
        case error_code::device_path_not_found:
            return "device path not found";
        case error_code::device_timeout:
            return "device call timed out";
        case error_code::item_copy_failed:
            return "item copy failed";
        case error_code::item_skipped:
            return "item skipped";
        case error_code::archive_format_unsupported:
            return "archive format unsupported";
        case error_code::archive_read_error:
            return "archive read error";
        case error_code::archive_write_error:
            return "archive write error";
        case error_code::archive_corrupted:
            return "archive corrupted";
        case error_code::archive_cancelled:
            return "archive operation cancelled";
        case error_code::archive_unsafe_entry:
            return "archive entry escapes output directory";
        case error_code::internal_error:
            return "internal error";
        case error_code::not_initialized:
            return "not initialized";
        default:
            return "unknown error";
    }
}

/**
 * @brief Map an error code to its category
 */
[[nodiscard]] constexpr auto category_of(error_code code) -> error_category {
    const auto value = static_cast<int>(code);
    if (value == 0) return error_category::none;
    if (value <= -100 && value >= -119) return error_category::configuration;
    if (value <= -120 && value >= -139) return error_category::process;
    if (value <= -140 && value >= -159) return error_category::staging;
    if (value <= -160 && value >= -169) return error_category::partial_item;
    if (value <= -170 && value >= -189) return error_category::archive;
    return error_category::internal;
}

/**
 * @brief Error type with code and optional message
 */
struct error {
    error_code code;
    std::string message;

    error() : code(error_code::success) {}
    explicit error(error_code c) : code(c), message(to_string(c)) {}
    error(error_code c, std::string msg) : code(c), message(std::move(msg)) {}

    [[nodiscard]] explicit operator bool() const noexcept {
        return code != error_code::success;
    }

    [[nodiscard]] auto category() const noexcept -> error_category {
        return category_of(code);
    }
};

/**
 * @brief Wrapper for unexpected error (used with result<T>)
 */
struct unexpected {
    error err;

    explicit unexpected(error e) : err(std::move(e)) {}
};

/**
 * @brief Result type for operations that can fail
 *
 * A simple Result type similar to std::expected (C++23).
 * Contains either a value of type T or an error.
 */
template <typename T>
class result {
public:
    result() : value_(std::nullopt), error_{} {}

    result(T value) : value_(std::move(value)), error_{} {}

    result(unexpected u) : value_(std::nullopt), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return value_.has_value(); }
    [[nodiscard]] explicit operator bool() const noexcept { return value_.has_value(); }

    [[nodiscard]] auto value() & -> T& { return *value_; }
    [[nodiscard]] auto value() const& -> const T& { return *value_; }
    [[nodiscard]] auto value() && -> T&& { return std::move(*value_); }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    std::optional<T> value_;
    struct error error_;
};

/**
 * @brief Specialization of result for void return type
 */
template <>
class result<void> {
public:
    result() : has_value_(true) {}

    result(unexpected u) : has_value_(false), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return has_value_; }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value_; }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    bool has_value_;
    struct error error_;
};

}  // namespace kcenon::ultracopy

#endif  // KCENON_ULTRACOPY_CORE_TYPES_H

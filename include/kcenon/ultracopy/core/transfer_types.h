/**
 * @file transfer_types.h
 * @brief Request, statistics and outcome types shared by the pipeline
 */

#ifndef KCENON_ULTRACOPY_CORE_TRANSFER_TYPES_H
#define KCENON_ULTRACOPY_CORE_TRANSFER_TYPES_H

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "kcenon/ultracopy/core/types.h"

namespace kcenon::ultracopy {

/**
 * @brief Copy mode of a transfer request
 */
enum class transfer_mode {
    full,         ///< Copy everything
    incremental,  ///< Skip files older than the destination copy
    mirror        ///< Make destination identical to source (deletes extras)
};

/**
 * @brief Convert transfer_mode to string
 */
[[nodiscard]] constexpr auto to_string(transfer_mode mode) -> const char* {
    switch (mode) {
        case transfer_mode::full: return "full";
        case transfer_mode::incremental: return "incremental";
        case transfer_mode::mirror: return "mirror";
        default: return "full";
    }
}

/**
 * @brief Parse a mode name; unknown names map to full
 */
[[nodiscard]] auto parse_transfer_mode(std::string_view name) -> transfer_mode;

/**
 * @brief Retry behaviour handed to the bulk-copy utility
 */
struct retry_policy {
    uint32_t retry_count = 1;
    std::chrono::seconds retry_wait{3};

    /**
     * @brief Policy used for local endpoints
     */
    static auto standard() -> retry_policy {
        return {1, std::chrono::seconds{3}};
    }

    /**
     * @brief Elevated policy used when an endpoint is remote
     */
    static auto elevated() -> retry_policy {
        return {5, std::chrono::seconds{10}};
    }
};

/**
 * @brief Description of one copy job
 *
 * Copied into the worker on submission; the caller's instance is never
 * read again.
 */
struct transfer_request {
    std::string source;
    std::string destination;
    transfer_mode mode = transfer_mode::full;
    uint32_t thread_count = 8;
    bool network_optimized = false;
    std::vector<std::string> exclude_dirs;
    std::vector<std::string> exclude_files;
    std::vector<std::string> custom_flags;

    /// Overrides the default retry policy implied by network_optimized
    std::optional<retry_policy> retry;
};

/**
 * @brief Live counters of a run
 *
 * Owned by the worker; everything outside the worker sees copies.
 */
struct transfer_statistics {
    uint64_t files_copied = 0;
    uint64_t bytes_copied = 0;
    double speed_mbps = 0.0;
    std::string current_file;
    uint64_t error_count = 0;
    std::optional<std::chrono::system_clock::time_point> start_time;
    std::optional<std::chrono::system_clock::time_point> end_time;
    bool running = false;
    bool cancelled = false;
    std::optional<int> exit_code;

    /**
     * @brief Wall-clock duration, or zero when not started/finished
     */
    [[nodiscard]] auto elapsed() const -> std::chrono::milliseconds {
        if (!start_time || !end_time) {
            return std::chrono::milliseconds{0};
        }
        return std::chrono::duration_cast<std::chrono::milliseconds>(*end_time - *start_time);
    }
};

/**
 * @brief Terminal status of a run
 */
enum class transfer_status {
    completed,
    failed,
    cancelled
};

/**
 * @brief Convert transfer_status to string
 */
[[nodiscard]] constexpr auto to_string(transfer_status status) -> const char* {
    switch (status) {
        case transfer_status::completed: return "completed";
        case transfer_status::failed: return "failed";
        case transfer_status::cancelled: return "cancelled";
        default: return "unknown";
    }
}

/**
 * @brief Final report delivered to the completion callback
 */
struct transfer_outcome {
    transfer_status status = transfer_status::failed;
    transfer_statistics statistics;
    std::optional<error> err;  ///< Set for failed and cancelled runs

    [[nodiscard]] auto succeeded() const -> bool {
        return status == transfer_status::completed;
    }
};

using log_callback = std::function<void(const std::string&)>;
using progress_callback = std::function<void(const transfer_statistics&)>;
using complete_callback = std::function<void(const transfer_outcome&)>;

/**
 * @brief Format a byte count as a human readable string ("1.50 MB")
 */
[[nodiscard]] auto format_bytes(uint64_t bytes) -> std::string;

/**
 * @brief Format a duration as "1h 02m 03s" / "2m 03s" / "3.25s"
 */
[[nodiscard]] auto format_duration(std::chrono::milliseconds duration) -> std::string;

}  // namespace kcenon::ultracopy

#endif  // KCENON_ULTRACOPY_CORE_TRANSFER_TYPES_H

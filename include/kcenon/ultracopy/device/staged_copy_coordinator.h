/**
 * @file staged_copy_coordinator.h
 * @brief Stage-then-transfer protocol for device endpoints
 */

#ifndef KCENON_ULTRACOPY_DEVICE_STAGED_COPY_COORDINATOR_H
#define KCENON_ULTRACOPY_DEVICE_STAGED_COPY_COORDINATOR_H

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "kcenon/ultracopy/core/command_builder.h"
#include "kcenon/ultracopy/core/transfer_types.h"
#include "kcenon/ultracopy/device/device_automation.h"
#include "kcenon/ultracopy/process/process_supervisor.h"

namespace kcenon::ultracopy {

/**
 * @brief Lifecycle of a staged transfer
 *
 * Pull: idle -> staging -> staging_complete -> final_copy -> final_complete
 * (or staging_failed / final_failed), then cleanup, then idle.
 */
enum class staging_state {
    idle,
    staging,
    staging_complete,
    staging_failed,
    final_copy,
    final_complete,
    final_failed,
    cleanup
};

[[nodiscard]] constexpr auto to_string(staging_state state) -> const char* {
    switch (state) {
        case staging_state::idle: return "idle";
        case staging_state::staging: return "staging";
        case staging_state::staging_complete: return "staging_complete";
        case staging_state::staging_failed: return "staging_failed";
        case staging_state::final_copy: return "final_copy";
        case staging_state::final_complete: return "final_complete";
        case staging_state::final_failed: return "final_failed";
        case staging_state::cleanup: return "cleanup";
        default: return "unknown";
    }
}

/**
 * @brief Coordinator configuration
 */
struct staged_copy_config {
    /// Parent of staging directories; empty uses the system temp directory
    std::filesystem::path staging_root;
    std::string staging_prefix = "ultracopy_stage_";

    /// Ceiling for one copy_out / copy_in call
    std::chrono::milliseconds copy_timeout = std::chrono::hours(1);
    /// Ceiling for one list_children call
    std::chrono::milliseconds listing_timeout = std::chrono::seconds(30);
    /// How long cleanup waits for a timed-out device call before removing the staging folder
    std::chrono::milliseconds cleanup_grace = std::chrono::seconds(10);

    /// Bulk-copy invocation used for the final copy of a pull
    command_options command;
    supervisor_config supervisor;
};

/**
 * @brief Per-item tally of a push
 */
struct push_result {
    uint64_t succeeded = 0;
    uint64_t failed = 0;
    std::vector<std::string> failed_items;
};

using state_callback = std::function<void(staging_state)>;

/**
 * @brief Runs staged pulls from and pushes to a device
 *
 * One transfer at a time, on a dedicated worker thread. The staging
 * directory of a pull is removed on every terminal path.
 *
 * @code
 * auto device = std::make_shared<mounted_device>("Phone", "/run/user/1000/gvfs/mtp:host=Phone");
 * staged_copy_coordinator coordinator(device);
 *
 * transfer_request request;
 * request.destination = "/home/user/Pictures";
 * coordinator.start_pull({"Internal storage", "DCIM"}, request);
 * coordinator.wait(std::chrono::minutes(30));
 * @endcode
 */
class staged_copy_coordinator {
public:
    explicit staged_copy_coordinator(std::shared_ptr<device_automation> device,
                                     staged_copy_config config = {});

    // Non-copyable, movable
    staged_copy_coordinator(const staged_copy_coordinator&) = delete;
    auto operator=(const staged_copy_coordinator&) -> staged_copy_coordinator& = delete;
    staged_copy_coordinator(staged_copy_coordinator&&) noexcept;
    auto operator=(staged_copy_coordinator&&) noexcept -> staged_copy_coordinator&;

    /**
     * @brief Cancels the active transfer and joins the worker
     */
    ~staged_copy_coordinator();

    void on_log(log_callback callback);
    void on_progress(progress_callback callback);
    void on_complete(complete_callback callback);
    void on_state_change(state_callback callback);

    /**
     * @brief Copy the device item at @p source to request.destination
     *
     * request.source is replaced by the staging directory once staging
     * completes; every other request field drives the final copy.
     *
     * @return error_code::process_already_running when busy
     */
    auto start_pull(breadcrumb source, transfer_request request) -> result<void>;

    /**
     * @brief Copy a local file or folder tree into the device folder @p destination
     *
     * Files are pushed one at a time; failed items are counted and the
     * batch continues.
     */
    auto start_push(std::filesystem::path source, breadcrumb destination) -> result<void>;

    void cancel();
    auto wait(std::chrono::milliseconds timeout) -> bool;

    [[nodiscard]] auto is_running() const -> bool;
    [[nodiscard]] auto state() const -> staging_state;
    [[nodiscard]] auto statistics() const -> transfer_statistics;

    /**
     * @brief Staging directory of the active pull, if one exists
     */
    [[nodiscard]] auto staging_directory() const -> std::optional<std::filesystem::path>;

    [[nodiscard]] auto last_push_result() const -> std::optional<push_result>;
    [[nodiscard]] auto last_outcome() const -> std::optional<transfer_outcome>;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::ultracopy

#endif  // KCENON_ULTRACOPY_DEVICE_STAGED_COPY_COORDINATOR_H

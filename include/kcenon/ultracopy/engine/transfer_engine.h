/**
 * @file transfer_engine.h
 * @brief Facade wiring classifier, command builder, supervisor and staging
 */

#ifndef KCENON_ULTRACOPY_ENGINE_TRANSFER_ENGINE_H
#define KCENON_ULTRACOPY_ENGINE_TRANSFER_ENGINE_H

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#include "kcenon/ultracopy/core/command_builder.h"
#include "kcenon/ultracopy/core/transfer_types.h"
#include "kcenon/ultracopy/core/types.h"
#include "kcenon/ultracopy/device/device_automation.h"
#include "kcenon/ultracopy/device/staged_copy_coordinator.h"
#include "kcenon/ultracopy/network/path_classifier.h"
#include "kcenon/ultracopy/process/process_supervisor.h"
#include "kcenon/ultracopy/session/session_store.h"

namespace kcenon::ultracopy {

/**
 * @brief How a request is carried out
 */
enum class transfer_route {
    direct,       ///< One bulk-copy process between two addressable paths
    staged_pull,  ///< Device source, staged locally, then bulk-copied
    staged_push   ///< Local source pushed item by item into a device folder
};

[[nodiscard]] constexpr auto to_string(transfer_route route) -> const char* {
    switch (route) {
        case transfer_route::direct: return "direct";
        case transfer_route::staged_pull: return "staged_pull";
        case transfer_route::staged_push: return "staged_push";
        default: return "unknown";
    }
}

/**
 * @brief Engine configuration assembled by transfer_engine::builder
 */
struct engine_config {
    command_options command;
    supervisor_config supervisor;
    staged_copy_config staging;

    /// Apply the classifier's thread/retry recommendation to direct and pull runs
    bool auto_optimize = true;

    /// Queried at every start; defaults to drive_table::from_system
    drive_table_provider drives;

    std::shared_ptr<device_automation> device;
    std::shared_ptr<session_store> sessions;
};

/**
 * @brief Runs one transfer at a time, picking the route from its endpoints
 *
 * Configuration errors are returned synchronously from start() before
 * anything is spawned; every other outcome arrives through on_complete
 * and last_outcome().
 *
 * @code
 * auto engine = transfer_engine::builder()
 *     .with_log_file("C:\\logs\\copy.log")
 *     .with_session_store(history)
 *     .build();
 *
 * transfer_request request;
 * request.source = "C:\\Projects";
 * request.destination = "\\\\nas\\backup\\Projects";
 * request.mode = transfer_mode::mirror;
 *
 * if (auto started = engine.value().start(request); !started) {
 *     std::cerr << started.error().message << "\n";
 * }
 * engine.value().wait(std::chrono::hours(2));
 * @endcode
 */
class transfer_engine {
public:
    class builder {
    public:
        builder();

        auto with_executable(std::string executable) -> builder&;
        auto with_log_file(std::string path) -> builder&;
        auto with_success_exit_code_limit(int limit) -> builder&;
        auto with_working_directory(std::string directory) -> builder&;
        auto with_auto_optimize(bool enable) -> builder&;
        auto with_drive_table_provider(drive_table_provider provider) -> builder&;
        auto with_device(std::shared_ptr<device_automation> device) -> builder&;
        auto with_session_store(std::shared_ptr<session_store> store) -> builder&;
        auto with_staging_root(std::filesystem::path root) -> builder&;

        /**
         * @brief Ceilings for single device calls
         */
        auto with_device_timeouts(std::chrono::milliseconds copy,
                                  std::chrono::milliseconds listing) -> builder&;

        /**
         * @brief Build the engine
         * @return error_code::invalid_configuration for an empty executable,
         *         a non-positive exit code limit or non-positive timeouts
         */
        [[nodiscard]] auto build() -> result<transfer_engine>;

    private:
        engine_config config_;
    };

    // Non-copyable, movable
    transfer_engine(const transfer_engine&) = delete;
    auto operator=(const transfer_engine&) -> transfer_engine& = delete;
    transfer_engine(transfer_engine&&) noexcept;
    auto operator=(transfer_engine&&) noexcept -> transfer_engine&;

    /**
     * @brief Cancels any active run and waits for its worker
     */
    ~transfer_engine();

    void on_log(log_callback callback);
    void on_progress(progress_callback callback);

    /**
     * @brief Called once per run, on the worker thread, with the final outcome
     *
     * is_running() is already false inside the callback, so it may
     * start() the next run.
     */
    void on_complete(complete_callback callback);

    /**
     * @brief Validate @p request and work out its route without starting it
     */
    [[nodiscard]] auto plan(const transfer_request& request) const -> result<transfer_route>;

    /**
     * @brief Validate and launch @p request
     * @return error_code::process_already_running while a run is active
     */
    [[nodiscard]] auto start(const transfer_request& request) -> result<void>;

    void cancel();

    /**
     * @brief Block until the active run finishes or @p timeout elapses
     * @return true when no run is active and the completion callback has
     *         returned
     */
    auto wait(std::chrono::milliseconds timeout) -> bool;

    [[nodiscard]] auto is_running() const -> bool;
    [[nodiscard]] auto statistics() const -> transfer_statistics;
    [[nodiscard]] auto last_outcome() const -> std::optional<transfer_outcome>;
    [[nodiscard]] auto current_route() const -> std::optional<transfer_route>;
    [[nodiscard]] auto config() const -> const engine_config&;

private:
    explicit transfer_engine(engine_config config);

    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::ultracopy

#endif  // KCENON_ULTRACOPY_ENGINE_TRANSFER_ENGINE_H

/**
 * @file process_supervisor.h
 * @brief Supervision of one external bulk-copy process
 */

#ifndef KCENON_ULTRACOPY_PROCESS_PROCESS_SUPERVISOR_H
#define KCENON_ULTRACOPY_PROCESS_PROCESS_SUPERVISOR_H

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "kcenon/ultracopy/core/transfer_types.h"

namespace kcenon::ultracopy {

/**
 * @brief Supervisor configuration
 */
struct supervisor_config {
    /// Exit codes strictly below this value are treated as success
    int success_exit_code_limit = 8;

    /// Working directory of the child; empty inherits the caller's
    std::string working_directory;
};

/**
 * @brief Owns at most one live external process
 *
 * The process is spawned on a dedicated worker thread. Its stdout and
 * stderr are merged and fed line by line to an output_parser; a snapshot
 * is pushed to the progress callback after every line. All callbacks run
 * on the worker thread.
 *
 * @code
 * process_supervisor supervisor;
 * supervisor.on_progress([](const transfer_statistics& s) {
 *     std::cout << s.files_copied << " files\n";
 * });
 * supervisor.on_complete([](const transfer_outcome& o) {
 *     std::cout << to_string(o.status) << "\n";
 * });
 *
 * if (supervisor.start(build_command(request))) {
 *     supervisor.wait(std::chrono::minutes(10));
 * }
 * @endcode
 *
 * is_running() is already false inside the completion callback, and the
 * callback may start the next process.
 */
class process_supervisor {
public:
    explicit process_supervisor(supervisor_config config = {});

    // Non-copyable, movable
    process_supervisor(const process_supervisor&) = delete;
    auto operator=(const process_supervisor&) -> process_supervisor& = delete;
    process_supervisor(process_supervisor&&) noexcept;
    auto operator=(process_supervisor&&) noexcept -> process_supervisor&;

    /**
     * @brief Cancels a running process and joins the worker
     */
    ~process_supervisor();

    void on_log(log_callback callback);
    void on_progress(progress_callback callback);
    void on_complete(complete_callback callback);

    /**
     * @brief Spawn the process described by @p args
     * @param args Executable followed by its arguments
     * @return false when a process is already running or @p args is empty
     *
     * Returns immediately. Launch failures are reported through the
     * completion callback like any other terminal state.
     */
    auto start(std::vector<std::string> args) -> bool;

    /**
     * @brief Request termination of the running process
     *
     * Termination is confirmed only once the worker observes the exit;
     * use wait() to block for it.
     */
    void cancel();

    /**
     * @brief Block until the current run is terminal
     * @return true when no run is active and the completion callback has
     *         returned
     */
    auto wait(std::chrono::milliseconds timeout) -> bool;

    [[nodiscard]] auto is_running() const -> bool;

    /**
     * @brief Snapshot of the current (or last) run's statistics
     */
    [[nodiscard]] auto statistics() const -> transfer_statistics;

    /**
     * @brief Outcome of the last finished run
     */
    [[nodiscard]] auto last_outcome() const -> std::optional<transfer_outcome>;

    [[nodiscard]] auto config() const -> const supervisor_config&;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::ultracopy

#endif  // KCENON_ULTRACOPY_PROCESS_PROCESS_SUPERVISOR_H

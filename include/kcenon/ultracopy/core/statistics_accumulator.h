/**
 * @file statistics_accumulator.h
 * @brief Per-run statistics accumulation and snapshot publication
 *
 * The accumulator is the single mutation point for transfer_statistics
 * during a run. Readers on other threads only ever receive snapshots.
 */

#ifndef KCENON_ULTRACOPY_CORE_STATISTICS_ACCUMULATOR_H
#define KCENON_ULTRACOPY_CORE_STATISTICS_ACCUMULATOR_H

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "kcenon/ultracopy/core/transfer_types.h"

namespace kcenon::ultracopy {

/**
 * @brief Thread-safe accumulator behind transfer_statistics
 *
 * @code
 * statistics_accumulator stats;
 * stats.start();
 *
 * // Per-file deltas from the output parser
 * stats.record_file_copied(1048576, "C:\\a\\file.bin");
 *
 * // Periodic totals overwrite the running counters
 * stats.override_files_copied(42);
 *
 * stats.finish(0, false);
 * auto snap = stats.snapshot();
 * @endcode
 */
class statistics_accumulator {
public:
    statistics_accumulator();

    // Non-copyable, movable
    statistics_accumulator(const statistics_accumulator&) = delete;
    auto operator=(const statistics_accumulator&) -> statistics_accumulator& = delete;
    statistics_accumulator(statistics_accumulator&&) noexcept;
    auto operator=(statistics_accumulator&&) noexcept -> statistics_accumulator&;

    ~statistics_accumulator();

    /**
     * @brief Reset all counters and mark the run as started now
     */
    void start();

    /**
     * @brief Mark the run as finished
     * @param exit_code Exit code of the external process, if any
     * @param cancelled Whether the run ended because of cancellation
     */
    void finish(std::optional<int> exit_code, bool cancelled);

    /**
     * @brief Reset to the default (never started) state
     */
    void reset();

    // Recording methods

    /**
     * @brief Add one copied file
     * @param bytes Size of the file
     * @param path Path reported for the file (empty keeps the previous one)
     */
    void record_file_copied(uint64_t bytes, const std::string& path);

    /**
     * @brief Overwrite files_copied with a cumulative total
     */
    void override_files_copied(uint64_t files);

    /**
     * @brief Overwrite bytes_copied with a cumulative total
     */
    void override_bytes_copied(uint64_t bytes);

    /**
     * @brief Overwrite the current speed
     * @param mbps Speed in MB/s (1 MB = 1048576 bytes)
     */
    void set_speed(double mbps);

    /**
     * @brief Set the file currently being processed
     */
    void set_current_file(const std::string& path);

    /**
     * @brief Count one error
     */
    void record_error();

    // Retrieval methods

    /**
     * @brief Check whether a run is in progress
     */
    [[nodiscard]] auto is_running() const -> bool;

    /**
     * @brief Average rate since start in MB/s
     *
     * Uses the end time for finished runs and the current time otherwise.
     */
    [[nodiscard]] auto average_rate_mbps() const -> double;

    /**
     * @brief Copy of the current statistics
     */
    [[nodiscard]] auto snapshot() const -> transfer_statistics;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::ultracopy

#endif  // KCENON_ULTRACOPY_CORE_STATISTICS_ACCUMULATOR_H

/**
 * @file session_history.h
 * @brief In-memory history of transfer sessions
 */

#ifndef KCENON_ULTRACOPY_SESSION_SESSION_HISTORY_H
#define KCENON_ULTRACOPY_SESSION_SESSION_HISTORY_H

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "kcenon/ultracopy/session/session_store.h"

namespace kcenon::ultracopy {

/**
 * @brief Condensed view of one session
 */
struct session_entry {
    std::string session_id;
    std::string operation;
    std::string source;
    std::string destination;

    std::optional<std::chrono::system_clock::time_point> start_time;
    std::optional<std::chrono::system_clock::time_point> end_time;
    std::chrono::milliseconds duration{0};

    uint64_t total_bytes = 0;
    uint64_t total_files = 0;
    uint64_t errors = 0;

    double average_speed_mbps = 0.0;  ///< total_bytes over duration
    double peak_speed_mbps = 0.0;
    double min_speed_mbps = 0.0;      ///< Lowest non-zero sample, 0 without samples
    bool success = false;
};

/**
 * @brief Aggregate over every retained session
 */
struct history_summary {
    uint64_t total_sessions = 0;
    uint64_t successful_sessions = 0;
    uint64_t failed_sessions = 0;
    uint64_t total_bytes = 0;
    uint64_t total_files = 0;
    double average_speed_mbps = 0.0;  ///< Mean of non-zero session averages
    double peak_speed_mbps = 0.0;
};

/**
 * @brief Thread-safe session_store keeping the most recent sessions
 */
class session_history : public session_store {
public:
    explicit session_history(std::size_t capacity = 1000);
    ~session_history() override;

    session_history(const session_history&) = delete;
    auto operator=(const session_history&) -> session_history& = delete;

    void record_session(const session_record& record) override;

    /**
     * @brief Retained sessions, oldest first
     * @param limit Keep only the last @p limit matches
     * @param operation Keep only sessions of this operation
     */
    [[nodiscard]] auto history(std::optional<std::size_t> limit = std::nullopt,
                               const std::optional<std::string>& operation = std::nullopt) const
        -> std::vector<session_entry>;

    [[nodiscard]] auto summary() const -> history_summary;
    [[nodiscard]] auto size() const -> std::size_t;
    void clear();

    /**
     * @brief Condense a record without storing it
     */
    [[nodiscard]] static auto summarize(const session_record& record) -> session_entry;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::ultracopy

#endif  // KCENON_ULTRACOPY_SESSION_SESSION_HISTORY_H

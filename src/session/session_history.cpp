/**
 * @file session_history.cpp
 * @brief In-memory session history implementation
 */

#include "kcenon/ultracopy/session/session_history.h"

#include "kcenon/ultracopy/core/logging.h"

#include <algorithm>
#include <ctime>
#include <deque>
#include <iomanip>
#include <mutex>
#include <sstream>

namespace kcenon::ultracopy {

auto generate_session_id() -> std::string {
    const auto now = std::chrono::system_clock::now();
    const auto seconds = std::chrono::system_clock::to_time_t(now);
    const auto micros = std::chrono::duration_cast<std::chrono::microseconds>(
                            now.time_since_epoch()).count() % 1000000;

    std::tm tm{};
#ifdef _WIN32
    localtime_s(&tm, &seconds);
#else
    localtime_r(&seconds, &tm);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y%m%d_%H%M%S") << '_' << std::setw(6) << std::setfill('0')
        << micros;
    return oss.str();
}

struct session_history::impl {
    mutable std::mutex mutex;
    std::deque<session_entry> entries;
    std::size_t capacity;

    explicit impl(std::size_t cap) : capacity(std::max<std::size_t>(cap, 1)) {}
};

session_history::session_history(std::size_t capacity)
    : impl_(std::make_unique<impl>(capacity)) {}

session_history::~session_history() = default;

auto session_history::summarize(const session_record& record) -> session_entry {
    const auto& stats = record.outcome.statistics;

    session_entry entry;
    entry.session_id = record.session_id;
    entry.operation = record.operation;
    entry.source = record.source;
    entry.destination = record.destination;
    entry.start_time = stats.start_time;
    entry.end_time = stats.end_time;
    entry.duration = stats.elapsed();
    entry.total_bytes = stats.bytes_copied;
    entry.total_files = stats.files_copied;
    entry.errors = stats.error_count;
    entry.success = record.outcome.succeeded();

    entry.peak_speed_mbps = stats.speed_mbps;
    for (double sample : record.speed_samples) {
        entry.peak_speed_mbps = std::max(entry.peak_speed_mbps, sample);
        if (sample > 0.0 && (entry.min_speed_mbps == 0.0 || sample < entry.min_speed_mbps)) {
            entry.min_speed_mbps = sample;
        }
    }

    if (entry.duration.count() > 0 && entry.total_bytes > 0) {
        const double bytes_per_sec = static_cast<double>(entry.total_bytes) * 1000.0 /
                                     static_cast<double>(entry.duration.count());
        entry.average_speed_mbps = bytes_per_sec / (1024.0 * 1024.0);
    }
    return entry;
}

void session_history::record_session(const session_record& record) {
    auto entry = summarize(record);

    UC_LOG_DEBUG(log_category::session,
                 "Recorded session " + entry.session_id + " (" + entry.operation + ", " +
                     (entry.success ? "success" : "failure") + ")");

    std::lock_guard lock(impl_->mutex);
    impl_->entries.push_back(std::move(entry));
    while (impl_->entries.size() > impl_->capacity) {
        impl_->entries.pop_front();
    }
}

auto session_history::history(std::optional<std::size_t> limit,
                              const std::optional<std::string>& operation) const
    -> std::vector<session_entry> {
    std::vector<session_entry> result;
    {
        std::lock_guard lock(impl_->mutex);
        for (const auto& entry : impl_->entries) {
            if (!operation || entry.operation == *operation) {
                result.push_back(entry);
            }
        }
    }

    if (limit && result.size() > *limit) {
        result.erase(result.begin(),
                     result.begin() + static_cast<std::ptrdiff_t>(result.size() - *limit));
    }
    return result;
}

auto session_history::summary() const -> history_summary {
    std::lock_guard lock(impl_->mutex);

    history_summary summary;
    double speed_total = 0.0;
    uint64_t speed_count = 0;

    for (const auto& entry : impl_->entries) {
        summary.total_sessions++;
        if (entry.success) {
            summary.successful_sessions++;
        }
        summary.total_bytes += entry.total_bytes;
        summary.total_files += entry.total_files;
        if (entry.average_speed_mbps > 0.0) {
            speed_total += entry.average_speed_mbps;
            speed_count++;
        }
        summary.peak_speed_mbps = std::max(summary.peak_speed_mbps, entry.peak_speed_mbps);
    }

    summary.failed_sessions = summary.total_sessions - summary.successful_sessions;
    if (speed_count > 0) {
        summary.average_speed_mbps = speed_total / static_cast<double>(speed_count);
    }
    return summary;
}

auto session_history::size() const -> std::size_t {
    std::lock_guard lock(impl_->mutex);
    return impl_->entries.size();
}

void session_history::clear() {
    std::lock_guard lock(impl_->mutex);
    impl_->entries.clear();
}

}  // namespace kcenon::ultracopy

/**
 * @file statistics_accumulator.cpp
 * @brief Implementation of per-run statistics accumulation
 */

#include "kcenon/ultracopy/core/statistics_accumulator.h"

#include <chrono>
#include <mutex>

namespace kcenon::ultracopy {

struct statistics_accumulator::impl {
    mutable std::mutex mutex;
    transfer_statistics stats;

    [[nodiscard]] auto average_rate_locked() const -> double {
        if (!stats.start_time) {
            return 0.0;
        }

        auto end = stats.end_time.value_or(std::chrono::system_clock::now());
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            end - *stats.start_time);

        if (elapsed.count() <= 0) {
            return 0.0;
        }

        const double bytes_per_sec = static_cast<double>(stats.bytes_copied) * 1000.0 /
                                     static_cast<double>(elapsed.count());
        return bytes_per_sec / (1024.0 * 1024.0);
    }
};

statistics_accumulator::statistics_accumulator()
    : impl_(std::make_unique<impl>()) {}

statistics_accumulator::statistics_accumulator(statistics_accumulator&&) noexcept = default;
auto statistics_accumulator::operator=(statistics_accumulator&&) noexcept
    -> statistics_accumulator& = default;
statistics_accumulator::~statistics_accumulator() = default;

void statistics_accumulator::start() {
    std::lock_guard lock(impl_->mutex);
    impl_->stats = transfer_statistics{};
    impl_->stats.start_time = std::chrono::system_clock::now();
    impl_->stats.running = true;
}

void statistics_accumulator::finish(std::optional<int> exit_code, bool cancelled) {
    std::lock_guard lock(impl_->mutex);
    impl_->stats.end_time = std::chrono::system_clock::now();
    if (!impl_->stats.start_time) {
        impl_->stats.start_time = impl_->stats.end_time;
    }
    impl_->stats.running = false;
    impl_->stats.cancelled = cancelled;
    impl_->stats.exit_code = exit_code;
}

void statistics_accumulator::reset() {
    std::lock_guard lock(impl_->mutex);
    impl_->stats = transfer_statistics{};
}

void statistics_accumulator::record_file_copied(uint64_t bytes, const std::string& path) {
    std::lock_guard lock(impl_->mutex);
    impl_->stats.files_copied += 1;
    impl_->stats.bytes_copied += bytes;
    if (!path.empty()) {
        impl_->stats.current_file = path;
    }
}

void statistics_accumulator::override_files_copied(uint64_t files) {
    std::lock_guard lock(impl_->mutex);
    impl_->stats.files_copied = files;
}

void statistics_accumulator::override_bytes_copied(uint64_t bytes) {
    std::lock_guard lock(impl_->mutex);
    impl_->stats.bytes_copied = bytes;
}

void statistics_accumulator::set_speed(double mbps) {
    std::lock_guard lock(impl_->mutex);
    impl_->stats.speed_mbps = mbps;
}

void statistics_accumulator::set_current_file(const std::string& path) {
    std::lock_guard lock(impl_->mutex);
    impl_->stats.current_file = path;
}

void statistics_accumulator::record_error() {
    std::lock_guard lock(impl_->mutex);
    impl_->stats.error_count += 1;
}

auto statistics_accumulator::is_running() const -> bool {
    std::lock_guard lock(impl_->mutex);
    return impl_->stats.running;
}

auto statistics_accumulator::average_rate_mbps() const -> double {
    std::lock_guard lock(impl_->mutex);
    return impl_->average_rate_locked();
}

auto statistics_accumulator::snapshot() const -> transfer_statistics {
    std::lock_guard lock(impl_->mutex);
    return impl_->stats;
}

}  // namespace kcenon::ultracopy

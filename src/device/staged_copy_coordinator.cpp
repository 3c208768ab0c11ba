/**
 * @file staged_copy_coordinator.cpp
 * @brief Staged pull / per-item push implementation
 */

#include "kcenon/ultracopy/device/staged_copy_coordinator.h"

#include "kcenon/ultracopy/core/logging.h"
#include "kcenon/ultracopy/core/statistics_accumulator.h"

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <future>
#include <iomanip>
#include <mutex>
#include <random>
#include <sstream>
#include <thread>
#include <vector>

namespace kcenon::ultracopy {

namespace fs = std::filesystem;

namespace {

constexpr auto supervisor_poll_interval = std::chrono::milliseconds(200);

/**
 * @brief Runs a callable when the scope is left, however it is left
 */
template <typename F>
class scope_exit {
public:
    explicit scope_exit(F fn) : fn_(std::move(fn)) {}
    scope_exit(const scope_exit&) = delete;
    auto operator=(const scope_exit&) -> scope_exit& = delete;
    ~scope_exit() { fn_(); }

private:
    F fn_;
};

/**
 * @brief Device calls still running on their own threads
 *
 * Shared with every call thread, so an abandoned call may return after
 * the coordinator is gone. Folders parked in `orphans` are removed again
 * when the last running call returns.
 */
struct device_call_tracker {
    std::mutex mutex;
    std::condition_variable idle_cv;
    int running = 0;
    std::vector<fs::path> orphans;

    void enter() {
        std::lock_guard lock(mutex);
        ++running;
    }

    void leave() {
        std::vector<fs::path> leftovers;
        {
            std::lock_guard lock(mutex);
            if (--running == 0) {
                leftovers.swap(orphans);
            }
        }
        idle_cv.notify_all();

        for (const auto& dir : leftovers) {
            std::error_code ec;
            fs::remove_all(dir, ec);
            if (ec) {
                UC_LOG_ERROR(log_category::staging,
                             "Failed to remove staging folder " + dir.string() + ": " + ec.message());
            } else {
                UC_LOG_DEBUG(log_category::staging,
                             "Removed staging folder after late device call: " + dir.string());
            }
        }
    }

    auto wait_idle(std::chrono::milliseconds timeout) -> bool {
        std::unique_lock lock(mutex);
        return idle_cv.wait_for(lock, timeout, [this] { return running == 0; });
    }

    /**
     * @brief Park @p dir for removal by the last call still running
     * @return false when no call is running and nothing was parked
     */
    auto park_if_busy(const fs::path& dir) -> bool {
        std::lock_guard lock(mutex);
        if (running == 0) {
            return false;
        }
        orphans.push_back(dir);
        return true;
    }
};

/**
 * @brief Run a device call with an outer time ceiling
 *
 * A call that exceeds the ceiling is abandoned on its own thread; the
 * shared state keeps everything it captured alive until it returns.
 */
template <typename T>
auto call_with_timeout(std::function<result<T>()> fn,
                       std::chrono::milliseconds timeout,
                       const std::string& what,
                       const std::shared_ptr<device_call_tracker>& tracker) -> result<T> {
    auto task = std::make_shared<std::packaged_task<result<T>()>>(std::move(fn));
    auto future = task->get_future();
    tracker->enter();
    std::thread([task, tracker]() {
        (*task)();
        tracker->leave();
    }).detach();

    if (future.wait_for(timeout) != std::future_status::ready) {
        UC_LOG_WARN(log_category::staging, what + " abandoned after " +
                                               std::to_string(timeout.count()) + "ms");
        return unexpected(error(error_code::device_timeout,
            what + " timed out after " + std::to_string(timeout.count()) + "ms"));
    }

    try {
        return future.get();
    } catch (const std::exception& e) {
        return unexpected(error(error_code::staging_failed, what + " failed: " + e.what()));
    }
}

auto as_staging_error(const error& err) -> error {
    if (err.category() == error_category::staging) {
        return err;
    }
    return error(error_code::staging_failed, err.message);
}

auto random_suffix() -> std::string {
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(0, 255);

    std::ostringstream oss;
    for (int i = 0; i < 8; ++i) {
        oss << std::hex << std::setw(2) << std::setfill('0') << dis(gen);
    }
    return oss.str();
}

}  // namespace

struct staged_copy_coordinator::impl {
    std::shared_ptr<device_automation> device;
    staged_copy_config config;
    std::shared_ptr<device_call_tracker> calls = std::make_shared<device_call_tracker>();

    process_supervisor supervisor;
    statistics_accumulator stats;
    std::atomic<bool> final_phase{false};

    log_callback log_cb;
    progress_callback progress_cb;
    complete_callback complete_cb;
    state_callback state_cb;
    mutable std::mutex callback_mutex;

    std::thread worker;
    std::thread retired;
    std::atomic<bool> active{false};
    std::atomic<bool> cancel_requested{false};
    std::atomic<staging_state> current_state{staging_state::idle};

    mutable std::mutex staging_mutex;
    std::optional<fs::path> staging_dir;

    mutable std::mutex done_mutex;
    std::condition_variable done_cv;
    std::optional<transfer_outcome> last_outcome;
    std::optional<push_result> last_push;
    int callbacks_running = 0;

    impl(std::shared_ptr<device_automation> dev, staged_copy_config cfg)
        : device(std::move(dev)),
          config(std::move(cfg)),
          supervisor(config.supervisor) {
        supervisor.on_log([this](const std::string& line) { emit_log(line); });
        supervisor.on_progress([this](const transfer_statistics& s) { emit_progress(s); });
    }

    ~impl() {
        cancel_requested = true;
        supervisor.cancel();
        if (worker.joinable()) {
            worker.join();
        }
        if (retired.joinable()) {
            retired.join();
        }
    }

    /**
     * @brief Join the previous worker, or park it when called from it
     */
    void release_worker() {
        if (retired.joinable() && retired.get_id() != std::this_thread::get_id()) {
            retired.join();
        }
        if (!worker.joinable()) {
            return;
        }
        if (worker.get_id() == std::this_thread::get_id()) {
            retired = std::move(worker);
        } else {
            worker.join();
        }
    }

    auto idle() const -> bool {
        return !active.load() && callbacks_running == 0;
    }

    void emit_log(const std::string& message) {
        log_callback cb;
        {
            std::lock_guard lock(callback_mutex);
            cb = log_cb;
        }
        if (cb) cb(message);
    }

    void emit_progress(const transfer_statistics& snapshot) {
        progress_callback cb;
        {
            std::lock_guard lock(callback_mutex);
            cb = progress_cb;
        }
        if (cb) cb(snapshot);
    }

    void emit_complete(const transfer_outcome& outcome) {
        complete_callback cb;
        {
            std::lock_guard lock(callback_mutex);
            cb = complete_cb;
        }
        if (cb) cb(outcome);
    }

    void set_state(staging_state state) {
        current_state = state;
        UC_LOG_DEBUG(log_category::staging, std::string("State: ") + to_string(state));

        state_callback cb;
        {
            std::lock_guard lock(callback_mutex);
            cb = state_cb;
        }
        if (cb) cb(state);
    }

    void note(const std::string& message) {
        UC_LOG_INFO(log_category::staging, message);
        emit_log(message);
    }

    auto create_staging_dir() -> result<fs::path> {
        std::error_code ec;
        fs::path root = config.staging_root;
        if (root.empty()) {
            root = fs::temp_directory_path(ec);
            if (ec) {
                return unexpected(error(error_code::staging_directory_error,
                                        "No temp directory: " + ec.message()));
            }
        }

        fs::create_directories(root, ec);
        if (ec) {
            return unexpected(error(error_code::staging_directory_error,
                "Cannot create staging root " + root.string() + ": " + ec.message()));
        }

        for (int attempt = 0; attempt < 8; ++attempt) {
            auto candidate = root / (config.staging_prefix + random_suffix());
            if (fs::create_directory(candidate, ec)) {
                return candidate;
            }
            if (ec) {
                return unexpected(error(error_code::staging_directory_error,
                    "Cannot create " + candidate.string() + ": " + ec.message()));
            }
        }
        return unexpected(error(error_code::staging_directory_error,
                                "No unique staging directory name under " + root.string()));
    }

    void remove_staging_dir() {
        std::optional<fs::path> dir;
        {
            std::lock_guard lock(staging_mutex);
            dir.swap(staging_dir);
        }
        if (!dir) {
            return;
        }

        // An abandoned copy_out may still write into the folder
        if (!calls->wait_idle(config.cleanup_grace) && calls->park_if_busy(*dir)) {
            UC_LOG_WARN(log_category::staging,
                        "Device call still running; staging folder is removed again when it returns");
        }

        std::error_code ec;
        fs::remove_all(*dir, ec);
        if (ec) {
            UC_LOG_ERROR(log_category::staging,
                         "Failed to remove staging folder " + dir->string() + ": " + ec.message());
            return;
        }
        note("Staging folder removed: " + dir->string());
    }

    auto list(const breadcrumb& location) -> result<std::vector<device_item>> {
        auto dev = device;
        return call_with_timeout<std::vector<device_item>>(
            [dev, location]() { return dev->list_children(location); },
            config.listing_timeout, "Listing " + to_display_path(location), calls);
    }

    /**
     * @brief Resolve the items a pull of @p source has to copy out
     */
    auto collect_pull_items(const breadcrumb& source) -> result<std::vector<device_item>> {
        if (source.empty()) {
            return list(source);
        }

        breadcrumb parent(source.begin(), source.end() - 1);
        auto siblings = list(parent);
        if (!siblings) {
            return unexpected(siblings.error());
        }

        const auto& name = source.back();
        for (const auto& item : siblings.value()) {
            if (item.name != name) {
                continue;
            }
            if (!item.is_folder) {
                auto single = item;
                single.location = source;
                return std::vector<device_item>{single};
            }
            return list(source);
        }

        return unexpected(error(error_code::device_path_not_found,
                                "Not found on device: " + to_display_path(source)));
    }

    auto stage_items(const breadcrumb& source, const fs::path& dir) -> result<void> {
        auto items = collect_pull_items(source);
        if (!items) {
            return unexpected(as_staging_error(items.error()));
        }

        note("Staging " + std::to_string(items.value().size()) + " items from " +
             to_display_path(source));

        auto dev = device;
        for (const auto& item : items.value()) {
            if (cancel_requested) {
                return unexpected(error(error_code::process_cancelled, "Cancelled during staging"));
            }

            auto location = item.location;
            auto copied = call_with_timeout<void>(
                [dev, location, dir]() { return dev->copy_out(location, dir); },
                config.copy_timeout, "Copy of " + item.name, calls);
            if (!copied) {
                return unexpected(as_staging_error(copied.error()));
            }

            stats.record_file_copied(item.is_folder ? 0 : item.size,
                                     to_display_path(item.location));
            emit_progress(stats.snapshot());
        }
        return {};
    }

    auto run_final_copy(transfer_request request) -> transfer_outcome {
        final_phase = true;
        auto args = build_command(request, config.command);

        if (!supervisor.start(std::move(args))) {
            transfer_outcome outcome;
            outcome.err = error(error_code::process_already_running,
                                "Final copy could not be started");
            return outcome;
        }

        while (!supervisor.wait(supervisor_poll_interval)) {
            if (cancel_requested) {
                supervisor.cancel();
            }
        }

        auto outcome = supervisor.last_outcome();
        if (!outcome) {
            transfer_outcome missing;
            missing.err = error(error_code::internal_error, "Final copy produced no outcome");
            return missing;
        }
        return *outcome;
    }

    void run_pull(breadcrumb source, transfer_request request) {
        transfer_outcome outcome;
        bool outcome_ready = false;
        std::optional<error> failure;

        {
            scope_exit guard([this] {
                set_state(staging_state::cleanup);
                remove_staging_dir();
            });

            try {
                set_state(staging_state::staging);

                auto dir = create_staging_dir();
                if (!dir) {
                    failure = dir.error();
                } else {
                    {
                        std::lock_guard lock(staging_mutex);
                        staging_dir = dir.value();
                    }
                    note("Created staging folder: " + dir.value().string());

                    auto staged = stage_items(source, dir.value());
                    if (!staged) {
                        failure = staged.error();
                    }
                }

                if (failure) {
                    set_state(staging_state::staging_failed);
                } else {
                    set_state(staging_state::staging_complete);

                    request.source = dir.value().string();
                    set_state(staging_state::final_copy);
                    if (cancel_requested) {
                        set_state(staging_state::final_failed);
                    } else {
                        outcome = run_final_copy(std::move(request));
                        outcome_ready = true;

                        set_state(outcome.succeeded() ? staging_state::final_complete
                                                      : staging_state::final_failed);
                    }
                }
            } catch (const std::exception& e) {
                failure = error(error_code::internal_error, e.what());
                set_state(current_state == staging_state::final_copy
                              ? staging_state::final_failed
                              : staging_state::staging_failed);
            }
        }

        if (!outcome_ready || failure) {
            outcome = failed_outcome(std::move(failure));
        }
        finish(std::move(outcome), std::nullopt);
    }

    auto failed_outcome(std::optional<error> failure) -> transfer_outcome {
        const bool cancelled = cancel_requested.load();
        stats.finish(std::nullopt, cancelled);

        transfer_outcome outcome;
        outcome.statistics = stats.snapshot();
        if (cancelled) {
            outcome.status = transfer_status::cancelled;
            outcome.err = error(error_code::process_cancelled);
        } else {
            outcome.status = transfer_status::failed;
            outcome.err = failure.value_or(error(error_code::staging_failed));
        }
        emit_progress(outcome.statistics);
        return outcome;
    }

    auto enumerate_push_items(const fs::path& source, const breadcrumb& destination)
        -> std::vector<std::pair<fs::path, breadcrumb>> {
        std::vector<std::pair<fs::path, breadcrumb>> items;
        std::error_code ec;

        if (fs::is_regular_file(source, ec)) {
            items.emplace_back(source, destination);
            return items;
        }

        // A folder lands under its own name, as in a shell copy
        breadcrumb base = destination;
        base.push_back(source.filename().string());

        for (fs::recursive_directory_iterator it(source, ec), end; !ec && it != end;
             it.increment(ec)) {
            std::error_code type_ec;
            if (!it->is_regular_file(type_ec)) {
                continue;
            }
            breadcrumb target = base;
            for (const auto& part : it->path().parent_path().lexically_relative(source)) {
                if (part != ".") {
                    target.push_back(part.string());
                }
            }
            items.emplace_back(it->path(), std::move(target));
        }
        if (ec) {
            UC_LOG_WARN(log_category::staging,
                        "Enumeration of " + source.string() + " stopped early: " + ec.message());
        }

        std::sort(items.begin(), items.end(),
                  [](const auto& a, const auto& b) { return a.first < b.first; });
        return items;
    }

    void run_push(fs::path source, breadcrumb destination) {
        push_result tally;
        std::optional<error> failure;

        try {
            auto items = enumerate_push_items(source, destination);
            note("Pushing " + std::to_string(items.size()) + " files to " +
                 to_display_path(destination));

            auto dev = device;
            for (const auto& [file, target] : items) {
                if (cancel_requested) {
                    break;
                }

                auto copied = call_with_timeout<void>(
                    [dev, file = file, target = target]() { return dev->copy_in(file, target); },
                    config.copy_timeout, "Copy of " + file.filename().string(), calls);

                if (copied) {
                    std::error_code ec;
                    auto size = fs::file_size(file, ec);
                    stats.record_file_copied(ec ? 0 : static_cast<uint64_t>(size), file.string());
                    ++tally.succeeded;
                } else {
                    stats.record_error();
                    ++tally.failed;
                    tally.failed_items.push_back(file.string());
                    const auto message = "Failed to push " + file.string() + ": " +
                                         copied.error().message;
                    UC_LOG_WARN(log_category::staging, message);
                    emit_log(message);
                }
                emit_progress(stats.snapshot());
            }
        } catch (const std::exception& e) {
            failure = error(error_code::internal_error, e.what());
        }

        const bool cancelled = cancel_requested.load();
        stats.finish(std::nullopt, cancelled);

        transfer_outcome outcome;
        outcome.statistics = stats.snapshot();
        if (cancelled) {
            outcome.status = transfer_status::cancelled;
            outcome.err = error(error_code::process_cancelled);
        } else if (failure) {
            outcome.status = transfer_status::failed;
            outcome.err = std::move(failure);
        } else if (tally.failed > 0) {
            outcome.status = transfer_status::failed;
            outcome.err = error(error_code::item_copy_failed,
                std::to_string(tally.failed) + " of " +
                std::to_string(tally.failed + tally.succeeded) + " items failed");
        } else {
            outcome.status = transfer_status::completed;
        }

        transfer_log_context ctx;
        ctx.files_copied = tally.succeeded;
        ctx.error_count = tally.failed;
        ctx.device = device->device_name();
        UC_LOG_INFO_CTX(log_category::staging, "Push finished", ctx);

        emit_progress(outcome.statistics);
        finish(std::move(outcome), std::move(tally));
    }

    void finish(transfer_outcome outcome, std::optional<push_result> tally) {
        {
            std::lock_guard lock(done_mutex);
            last_outcome = outcome;
            if (tally) {
                last_push = std::move(tally);
            }
            current_state = staging_state::idle;
            final_phase = false;
            active = false;
            ++callbacks_running;
        }
        emit_complete(outcome);
        {
            std::lock_guard lock(done_mutex);
            --callbacks_running;
        }
        done_cv.notify_all();
    }

    auto begin_run() -> result<void> {
        if (!device) {
            return unexpected(error(error_code::device_not_configured));
        }

        bool expected = false;
        if (!active.compare_exchange_strong(expected, true)) {
            UC_LOG_WARN(log_category::staging, "Staged transfer already running; start rejected");
            return unexpected(error(error_code::process_already_running));
        }

        release_worker();
        cancel_requested = false;
        final_phase = false;
        stats.start();
        return {};
    }
};

staged_copy_coordinator::staged_copy_coordinator(std::shared_ptr<device_automation> device,
                                                 staged_copy_config config)
    : impl_(std::make_unique<impl>(std::move(device), std::move(config))) {}

staged_copy_coordinator::staged_copy_coordinator(staged_copy_coordinator&&) noexcept = default;
auto staged_copy_coordinator::operator=(staged_copy_coordinator&&) noexcept
    -> staged_copy_coordinator& = default;
staged_copy_coordinator::~staged_copy_coordinator() = default;

void staged_copy_coordinator::on_log(log_callback callback) {
    std::lock_guard lock(impl_->callback_mutex);
    impl_->log_cb = std::move(callback);
}

void staged_copy_coordinator::on_progress(progress_callback callback) {
    std::lock_guard lock(impl_->callback_mutex);
    impl_->progress_cb = std::move(callback);
}

void staged_copy_coordinator::on_complete(complete_callback callback) {
    std::lock_guard lock(impl_->callback_mutex);
    impl_->complete_cb = std::move(callback);
}

void staged_copy_coordinator::on_state_change(state_callback callback) {
    std::lock_guard lock(impl_->callback_mutex);
    impl_->state_cb = std::move(callback);
}

auto staged_copy_coordinator::start_pull(breadcrumb source, transfer_request request)
    -> result<void> {
    if (request.destination.empty()) {
        return unexpected(error(error_code::invalid_destination, "Destination is empty"));
    }

    auto started = impl_->begin_run();
    if (!started) {
        return started;
    }

    UC_LOG_INFO(log_category::staging,
                "Pull " + to_display_path(source) + " -> " + request.destination);

    auto* state = impl_.get();
    impl_->worker = std::thread([state, source = std::move(source),
                                 request = std::move(request)]() mutable {
        state->run_pull(std::move(source), std::move(request));
    });
    return {};
}

auto staged_copy_coordinator::start_push(fs::path source, breadcrumb destination)
    -> result<void> {
    std::error_code ec;
    if (source.empty() || !fs::exists(source, ec)) {
        return unexpected(error(error_code::path_not_found,
                                "Source does not exist: " + source.string()));
    }

    auto started = impl_->begin_run();
    if (!started) {
        return started;
    }

    UC_LOG_INFO(log_category::staging,
                "Push " + source.string() + " -> " + to_display_path(destination));

    auto* state = impl_.get();
    impl_->worker = std::thread([state, source = std::move(source),
                                 destination = std::move(destination)]() mutable {
        state->run_push(std::move(source), std::move(destination));
    });
    return {};
}

void staged_copy_coordinator::cancel() {
    if (!impl_->active) {
        return;
    }
    UC_LOG_INFO(log_category::staging, "Cancellation requested");
    impl_->cancel_requested = true;
    impl_->supervisor.cancel();
}

auto staged_copy_coordinator::wait(std::chrono::milliseconds timeout) -> bool {
    std::unique_lock lock(impl_->done_mutex);
    return impl_->done_cv.wait_for(lock, timeout, [this] { return impl_->idle(); });
}

auto staged_copy_coordinator::is_running() const -> bool {
    return impl_->active.load();
}

auto staged_copy_coordinator::state() const -> staging_state {
    return impl_->current_state.load();
}

auto staged_copy_coordinator::statistics() const -> transfer_statistics {
    if (impl_->active) {
        return impl_->final_phase ? impl_->supervisor.statistics() : impl_->stats.snapshot();
    }

    std::lock_guard lock(impl_->done_mutex);
    if (impl_->last_outcome) {
        return impl_->last_outcome->statistics;
    }
    return impl_->stats.snapshot();
}

auto staged_copy_coordinator::staging_directory() const -> std::optional<fs::path> {
    std::lock_guard lock(impl_->staging_mutex);
    return impl_->staging_dir;
}

auto staged_copy_coordinator::last_push_result() const -> std::optional<push_result> {
    std::lock_guard lock(impl_->done_mutex);
    return impl_->last_push;
}

auto staged_copy_coordinator::last_outcome() const -> std::optional<transfer_outcome> {
    std::lock_guard lock(impl_->done_mutex);
    return impl_->last_outcome;
}

}  // namespace kcenon::ultracopy

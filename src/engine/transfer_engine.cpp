/**
 * @file transfer_engine.cpp
 * @brief Transfer engine facade implementation
 */

#include "kcenon/ultracopy/engine/transfer_engine.h"

#include "kcenon/ultracopy/core/logging.h"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <condition_variable>
#include <mutex>
#include <vector>

namespace kcenon::ultracopy {

namespace {

auto equals_ignore_case(std::string_view a, std::string_view b) -> bool {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

auto config_error(error_code code, const std::string& message) -> unexpected {
    UC_LOG_WARN(log_category::engine, message);
    return unexpected(error(code, message));
}

}  // namespace

struct transfer_engine::impl {
    engine_config config;

    mutable std::mutex callback_mutex;
    log_callback log_cb;
    progress_callback progress_cb;
    complete_callback complete_cb;

    // One run at a time; guards the fields below
    mutable std::mutex run_mutex;
    std::optional<transfer_route> route;
    session_record session;
    std::optional<transfer_outcome> last;
    std::atomic<bool> active{false};

    mutable std::mutex done_mutex;
    std::condition_variable done_cv;
    int callbacks_running = 0;

    // Declared last so their workers are joined before the state above goes away
    process_supervisor supervisor;
    std::unique_ptr<staged_copy_coordinator> coordinator;

    explicit impl(engine_config cfg)
        : config(std::move(cfg)), supervisor(config.supervisor) {
        if (!config.drives) {
            config.drives = &drive_table::from_system;
        }

        supervisor.on_log([this](const std::string& line) { emit_log(line); });
        supervisor.on_progress([this](const transfer_statistics& s) { on_snapshot(s); });
        supervisor.on_complete([this](const transfer_outcome& o) { finish_run(o); });

        if (config.device) {
            coordinator = std::make_unique<staged_copy_coordinator>(config.device, config.staging);
            coordinator->on_log([this](const std::string& line) { emit_log(line); });
            coordinator->on_progress([this](const transfer_statistics& s) { on_snapshot(s); });
            coordinator->on_complete([this](const transfer_outcome& o) { finish_run(o); });
            coordinator->on_state_change([](staging_state state) {
                UC_LOG_DEBUG(log_category::engine,
                             std::string("Staging state: ") + to_string(state));
            });
        }
    }

    void emit_log(const std::string& message) {
        log_callback cb;
        {
            std::lock_guard lock(callback_mutex);
            cb = log_cb;
        }
        if (cb) cb(message);
    }

    void on_snapshot(const transfer_statistics& snapshot) {
        if (snapshot.running && snapshot.speed_mbps > 0.0) {
            std::lock_guard lock(run_mutex);
            session.speed_samples.push_back(snapshot.speed_mbps);
        }

        progress_callback cb;
        {
            std::lock_guard lock(callback_mutex);
            cb = progress_cb;
        }
        if (cb) cb(snapshot);
    }

    void finish_run(const transfer_outcome& outcome) {
        session_record record;
        {
            std::lock_guard lock(run_mutex);
            session.outcome = outcome;
            record = session;
            last = outcome;
        }

        const auto& stats = outcome.statistics;
        transfer_log_context ctx;
        ctx.transfer_id = record.session_id;
        ctx.source = record.source;
        ctx.destination = record.destination;
        ctx.files_copied = stats.files_copied;
        ctx.bytes_copied = stats.bytes_copied;
        ctx.error_count = stats.error_count;
        ctx.duration_ms = static_cast<uint64_t>(stats.elapsed().count());
        ctx.exit_code = stats.exit_code;
        if (outcome.err) {
            ctx.error_message = outcome.err->message;
        }

        const auto summary = std::string("Transfer ") + to_string(outcome.status) + ": " +
                             std::to_string(stats.files_copied) + " files, " +
                             format_bytes(stats.bytes_copied) + " in " +
                             format_duration(stats.elapsed());
        if (outcome.succeeded()) {
            UC_LOG_INFO_CTX(log_category::engine, summary, ctx);
        } else {
            UC_LOG_WARN_CTX(log_category::engine, summary, ctx);
        }
        emit_log(summary);

        if (config.sessions) {
            config.sessions->record_session(record);
        }

        // The callback may start the next transfer
        {
            std::lock_guard lock(done_mutex);
            active = false;
            ++callbacks_running;
        }

        complete_callback cb;
        {
            std::lock_guard lock(callback_mutex);
            cb = complete_cb;
        }
        if (cb) cb(outcome);

        {
            std::lock_guard lock(done_mutex);
            --callbacks_running;
        }
        done_cv.notify_all();
    }

    auto classifier() const -> path_classifier {
        return path_classifier(config.drives());
    }

    auto resolve_device_path(const std::string& path, error_code code) const
        -> result<device_path> {
        if (!config.device) {
            return config_error(error_code::device_not_configured,
                                "No device automation configured for " + path);
        }

        auto parsed = parse_device_path(path);
        if (!parsed) {
            return config_error(code, "Unsupported device path: " + path);
        }

        const auto name = config.device->device_name();
        if (!equals_ignore_case(parsed->device, name)) {
            return config_error(code, "Unknown device '" + parsed->device +
                                          "' (configured: " + name + ")");
        }
        return *parsed;
    }

    auto plan(const transfer_request& request) const -> result<transfer_route> {
        if (request.source.empty()) {
            return config_error(error_code::invalid_source, "Source path is empty");
        }
        if (request.destination.empty()) {
            return config_error(error_code::invalid_destination, "Destination path is empty");
        }

        const bool source_staged = is_staged_device_path(request.source);
        const bool destination_staged = is_staged_device_path(request.destination);

        if (source_staged && destination_staged) {
            return config_error(error_code::invalid_configuration,
                                "Device to device transfers are not supported");
        }

        if (source_staged) {
            auto device = resolve_device_path(request.source, error_code::invalid_source);
            if (!device) {
                return unexpected(device.error());
            }
            return transfer_route::staged_pull;
        }

        if (!classifier().is_network(request.source)) {
            auto access = path_classifier::validate_path_access(request.source);
            if (!access) {
                UC_LOG_WARN(log_category::engine, access.error().message);
                return unexpected(access.error());
            }
        }

        if (destination_staged) {
            auto device = resolve_device_path(request.destination,
                                              error_code::invalid_destination);
            if (!device) {
                return unexpected(device.error());
            }
            return transfer_route::staged_push;
        }

        return transfer_route::direct;
    }

    auto start(const transfer_request& request) -> result<void> {
        auto planned = plan(request);
        if (!planned) {
            return unexpected(planned.error());
        }

        bool expected = false;
        if (!active.compare_exchange_strong(expected, true)) {
            return config_error(error_code::process_already_running,
                                "A transfer is already running");
        }

        const auto chosen = planned.value();
        transfer_request effective = request;

        if (config.auto_optimize && chosen != transfer_route::staged_push) {
            const auto classify = classifier();
            // A pull's final copy reads from the local staging directory
            const std::string source =
                chosen == transfer_route::staged_pull ? std::string{} : effective.source;
            apply_parameters(effective, classify.get_optimized_parameters(source,
                                                                          effective.destination));
        }

        {
            std::lock_guard lock(run_mutex);
            route = chosen;
            session = session_record{};
            session.session_id = generate_session_id();
            session.source = effective.source;
            session.destination = effective.destination;
            switch (chosen) {
                case transfer_route::staged_pull: session.operation = "pull"; break;
                case transfer_route::staged_push: session.operation = "push"; break;
                default: session.operation = to_string(effective.mode); break;
            }
        }

        UC_LOG_INFO(log_category::engine, std::string("Starting ") + to_string(chosen) +
                                              " transfer: " + effective.source + " -> " +
                                              effective.destination);

        result<void> launched;
        switch (chosen) {
            case transfer_route::direct:
                if (!supervisor.start(build_command(effective, config.command))) {
                    launched = unexpected(error(error_code::process_already_running,
                                                "Supervisor is busy"));
                }
                break;
            case transfer_route::staged_pull: {
                auto device = parse_device_path(effective.source);
                launched = coordinator->start_pull(device->location, effective);
                break;
            }
            case transfer_route::staged_push: {
                auto device = parse_device_path(effective.destination);
                launched = coordinator->start_push(effective.source, device->location);
                break;
            }
        }

        if (!launched) {
            {
                std::lock_guard lock(done_mutex);
                active = false;
            }
            done_cv.notify_all();
            UC_LOG_ERROR(log_category::engine, "Launch failed: " + launched.error().message);
        }
        return launched;
    }

    auto wait(std::chrono::milliseconds timeout) -> bool {
        std::unique_lock lock(done_mutex);
        return done_cv.wait_for(lock, timeout,
                                [this] { return !active.load() && callbacks_running == 0; });
    }

    auto statistics() const -> transfer_statistics {
        std::optional<transfer_route> current;
        {
            std::lock_guard lock(run_mutex);
            current = route;
        }

        if (current == transfer_route::direct) {
            return supervisor.statistics();
        }
        if (current && coordinator) {
            return coordinator->statistics();
        }
        return transfer_statistics{};
    }
};

// ============================================================================
// builder
// ============================================================================

transfer_engine::builder::builder() = default;

auto transfer_engine::builder::with_executable(std::string executable) -> builder& {
    config_.command.executable = std::move(executable);
    return *this;
}

auto transfer_engine::builder::with_log_file(std::string path) -> builder& {
    config_.command.log_file = std::move(path);
    return *this;
}

auto transfer_engine::builder::with_success_exit_code_limit(int limit) -> builder& {
    config_.supervisor.success_exit_code_limit = limit;
    return *this;
}

auto transfer_engine::builder::with_working_directory(std::string directory) -> builder& {
    config_.supervisor.working_directory = std::move(directory);
    return *this;
}

auto transfer_engine::builder::with_auto_optimize(bool enable) -> builder& {
    config_.auto_optimize = enable;
    return *this;
}

auto transfer_engine::builder::with_drive_table_provider(drive_table_provider provider)
    -> builder& {
    config_.drives = std::move(provider);
    return *this;
}

auto transfer_engine::builder::with_device(std::shared_ptr<device_automation> device)
    -> builder& {
    config_.device = std::move(device);
    return *this;
}

auto transfer_engine::builder::with_session_store(std::shared_ptr<session_store> store)
    -> builder& {
    config_.sessions = std::move(store);
    return *this;
}

auto transfer_engine::builder::with_staging_root(std::filesystem::path root) -> builder& {
    config_.staging.staging_root = std::move(root);
    return *this;
}

auto transfer_engine::builder::with_device_timeouts(std::chrono::milliseconds copy,
                                                    std::chrono::milliseconds listing)
    -> builder& {
    config_.staging.copy_timeout = copy;
    config_.staging.listing_timeout = listing;
    return *this;
}

auto transfer_engine::builder::build() -> result<transfer_engine> {
    if (config_.command.executable.empty()) {
        return unexpected(error(error_code::invalid_configuration,
                                "Executable must not be empty"));
    }
    if (config_.supervisor.success_exit_code_limit <= 0) {
        return unexpected(error(error_code::invalid_configuration,
                                "Success exit code limit must be positive"));
    }
    if (config_.staging.copy_timeout.count() <= 0 ||
        config_.staging.listing_timeout.count() <= 0) {
        return unexpected(error(error_code::invalid_configuration,
                                "Device timeouts must be positive"));
    }

    // The final copy of a pull runs the same utility as a direct transfer
    config_.staging.command = config_.command;
    config_.staging.supervisor = config_.supervisor;

    return transfer_engine{std::move(config_)};
}

// ============================================================================
// transfer_engine
// ============================================================================

transfer_engine::transfer_engine(engine_config config)
    : impl_(std::make_unique<impl>(std::move(config))) {
    get_logger().initialize();
}

transfer_engine::transfer_engine(transfer_engine&&) noexcept = default;
auto transfer_engine::operator=(transfer_engine&&) noexcept -> transfer_engine& = default;
transfer_engine::~transfer_engine() = default;

void transfer_engine::on_log(log_callback callback) {
    std::lock_guard lock(impl_->callback_mutex);
    impl_->log_cb = std::move(callback);
}

void transfer_engine::on_progress(progress_callback callback) {
    std::lock_guard lock(impl_->callback_mutex);
    impl_->progress_cb = std::move(callback);
}

void transfer_engine::on_complete(complete_callback callback) {
    std::lock_guard lock(impl_->callback_mutex);
    impl_->complete_cb = std::move(callback);
}

auto transfer_engine::plan(const transfer_request& request) const -> result<transfer_route> {
    return impl_->plan(request);
}

auto transfer_engine::start(const transfer_request& request) -> result<void> {
    return impl_->start(request);
}

void transfer_engine::cancel() {
    std::optional<transfer_route> current;
    {
        std::lock_guard lock(impl_->run_mutex);
        current = impl_->route;
    }

    if (!impl_->active.load()) {
        return;
    }
    UC_LOG_INFO(log_category::engine, "Cancelling transfer");
    if (current == transfer_route::direct) {
        impl_->supervisor.cancel();
    } else if (impl_->coordinator) {
        impl_->coordinator->cancel();
    }
}

auto transfer_engine::wait(std::chrono::milliseconds timeout) -> bool {
    return impl_->wait(timeout);
}

auto transfer_engine::is_running() const -> bool {
    return impl_->active.load();
}

auto transfer_engine::statistics() const -> transfer_statistics {
    return impl_->statistics();
}

auto transfer_engine::last_outcome() const -> std::optional<transfer_outcome> {
    std::lock_guard lock(impl_->run_mutex);
    return impl_->last;
}

auto transfer_engine::current_route() const -> std::optional<transfer_route> {
    std::lock_guard lock(impl_->run_mutex);
    return impl_->route;
}

auto transfer_engine::config() const -> const engine_config& {
    return impl_->config;
}

}  // namespace kcenon::ultracopy

/**
 * @file process_supervisor.cpp
 * @brief External process spawn, output streaming and cancellation
 */

#include "kcenon/ultracopy/process/process_supervisor.h"

#include "kcenon/ultracopy/core/command_builder.h"
#include "kcenon/ultracopy/core/logging.h"
#include "kcenon/ultracopy/core/output_parser.h"
#include "kcenon/ultracopy/core/statistics_accumulator.h"

#include <atomic>
#include <cerrno>
#include <condition_variable>
#include <cstring>
#include <mutex>
#include <string_view>
#include <thread>

#ifdef _WIN32
#include <windows.h>
#else
#include <fcntl.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#endif

namespace kcenon::ultracopy {

namespace {

/**
 * @brief How the child ended
 */
struct exit_status {
    bool exited = false;
    int code = -1;
    int signal = 0;
};

#ifdef _WIN32

auto quote_windows_arg(const std::string& arg) -> std::string {
    if (!arg.empty() && arg.find_first_of(" \t\"") == std::string::npos) {
        return arg;
    }

    std::string quoted = "\"";
    std::size_t backslashes = 0;
    for (char c : arg) {
        if (c == '\\') {
            ++backslashes;
            continue;
        }
        if (c == '"') {
            quoted.append(backslashes * 2 + 1, '\\');
        } else {
            quoted.append(backslashes, '\\');
        }
        backslashes = 0;
        quoted += c;
    }
    quoted.append(backslashes * 2, '\\');
    quoted += '"';
    return quoted;
}

/**
 * @brief Child process with merged stdout/stderr (Win32)
 */
class child_process {
public:
    child_process() = default;
    child_process(const child_process&) = delete;
    auto operator=(const child_process&) -> child_process& = delete;

    ~child_process() {
        if (read_handle_ != nullptr) ::CloseHandle(read_handle_);
        if (process_ != nullptr) ::CloseHandle(process_);
    }

    auto spawn(const std::vector<std::string>& args, const std::string& working_dir)
        -> result<void> {
        SECURITY_ATTRIBUTES sa{};
        sa.nLength = sizeof(sa);
        sa.bInheritHandle = TRUE;

        HANDLE write_handle = nullptr;
        if (!::CreatePipe(&read_handle_, &write_handle, &sa, 0)) {
            return unexpected(error(error_code::process_launch_failed,
                "CreatePipe failed: " + std::to_string(::GetLastError())));
        }
        ::SetHandleInformation(read_handle_, HANDLE_FLAG_INHERIT, 0);

        std::string command_line;
        for (const auto& arg : args) {
            if (!command_line.empty()) command_line += ' ';
            command_line += quote_windows_arg(arg);
        }

        STARTUPINFOA si{};
        si.cb = sizeof(si);
        si.dwFlags = STARTF_USESTDHANDLES;
        si.hStdOutput = write_handle;
        si.hStdError = write_handle;
        si.hStdInput = nullptr;

        PROCESS_INFORMATION pi{};
        const BOOL created = ::CreateProcessA(
            nullptr, command_line.data(), nullptr, nullptr, TRUE, CREATE_NO_WINDOW,
            nullptr, working_dir.empty() ? nullptr : working_dir.c_str(), &si, &pi);
        const DWORD create_error = ::GetLastError();
        ::CloseHandle(write_handle);

        if (!created) {
            return unexpected(error(error_code::process_launch_failed,
                "CreateProcess failed for '" + args.front() + "': " +
                std::to_string(create_error)));
        }

        ::CloseHandle(pi.hThread);
        process_ = pi.hProcess;
        return {};
    }

    auto read(char* buffer, std::size_t size) -> long {
        DWORD bytes_read = 0;
        if (!::ReadFile(read_handle_, buffer, static_cast<DWORD>(size), &bytes_read, nullptr)) {
            return ::GetLastError() == ERROR_BROKEN_PIPE ? 0 : -1;
        }
        return static_cast<long>(bytes_read);
    }

    void terminate() {
        if (process_ != nullptr) {
            ::TerminateProcess(process_, 1);
        }
    }

    auto wait_exit() -> exit_status {
        exit_status status;
        ::WaitForSingleObject(process_, INFINITE);
        DWORD code = 0;
        if (::GetExitCodeProcess(process_, &code)) {
            status.exited = true;
            status.code = static_cast<int>(code);
        }
        return status;
    }

    void release() {}

private:
    HANDLE read_handle_ = nullptr;
    HANDLE process_ = nullptr;
};

#else

/**
 * @brief Child process with merged stdout/stderr (POSIX)
 *
 * The child runs in its own process group so termination reaches
 * everything it spawned. A close-on-exec status pipe reports execvp
 * failures back to the parent.
 */
class child_process {
public:
    child_process() = default;
    child_process(const child_process&) = delete;
    auto operator=(const child_process&) -> child_process& = delete;

    ~child_process() {
        if (read_fd_ != -1) ::close(read_fd_);
        if (pid_ > 0 && !reaped_) {
            ::kill(-pid_, SIGKILL);
            int status = 0;
            while (::waitpid(pid_, &status, 0) == -1 && errno == EINTR) {
            }
        }
    }

    auto spawn(const std::vector<std::string>& args, const std::string& working_dir)
        -> result<void> {
        int output_pipe[2] = {-1, -1};
        if (::pipe2(output_pipe, O_CLOEXEC) != 0) {
            return unexpected(error(error_code::process_launch_failed,
                std::string("pipe2 failed: ") + std::strerror(errno)));
        }

        int status_pipe[2] = {-1, -1};
        if (::pipe2(status_pipe, O_CLOEXEC) != 0) {
            const int err = errno;
            ::close(output_pipe[0]);
            ::close(output_pipe[1]);
            return unexpected(error(error_code::process_launch_failed,
                std::string("pipe2 failed: ") + std::strerror(err)));
        }

        std::vector<char*> argv;
        argv.reserve(args.size() + 1);
        for (const auto& arg : args) {
            argv.push_back(const_cast<char*>(arg.c_str()));
        }
        argv.push_back(nullptr);

        const pid_t pid = ::fork();
        if (pid < 0) {
            const int err = errno;
            ::close(output_pipe[0]);
            ::close(output_pipe[1]);
            ::close(status_pipe[0]);
            ::close(status_pipe[1]);
            return unexpected(error(error_code::process_launch_failed,
                std::string("fork failed: ") + std::strerror(err)));
        }

        if (pid == 0) {
            // Child: only async-signal-safe calls from here on
            ::setpgid(0, 0);
            ::dup2(output_pipe[1], STDOUT_FILENO);
            ::dup2(output_pipe[1], STDERR_FILENO);
            const int dev_null = ::open("/dev/null", O_RDONLY);
            if (dev_null != -1) {
                ::dup2(dev_null, STDIN_FILENO);
                ::close(dev_null);
            }
            if (!working_dir.empty() && ::chdir(working_dir.c_str()) != 0) {
                const int err = errno;
                [[maybe_unused]] auto n = ::write(status_pipe[1], &err, sizeof(err));
                ::_exit(127);
            }
            ::execvp(argv[0], argv.data());
            const int err = errno;
            [[maybe_unused]] auto n = ::write(status_pipe[1], &err, sizeof(err));
            ::_exit(127);
        }

        pid_ = pid;
        // Also set from the parent so terminate() cannot race the child's setpgid
        ::setpgid(pid_, pid_);
        ::close(output_pipe[1]);
        ::close(status_pipe[1]);
        read_fd_ = output_pipe[0];

        int child_errno = 0;
        ssize_t n = 0;
        do {
            n = ::read(status_pipe[0], &child_errno, sizeof(child_errno));
        } while (n == -1 && errno == EINTR);
        ::close(status_pipe[0]);

        if (n == static_cast<ssize_t>(sizeof(child_errno))) {
            int status = 0;
            while (::waitpid(pid_, &status, 0) == -1 && errno == EINTR) {
            }
            reaped_ = true;
            return unexpected(error(error_code::process_launch_failed,
                "cannot execute '" + args.front() + "': " + std::strerror(child_errno)));
        }

        return {};
    }

    /**
     * @brief Read merged output
     * @return bytes read, 0 on EOF, -1 on error
     */
    auto read(char* buffer, std::size_t size) -> long {
        for (;;) {
            const ssize_t n = ::read(read_fd_, buffer, size);
            if (n == -1 && errno == EINTR) {
                continue;
            }
            return static_cast<long>(n);
        }
    }

    void terminate() {
        if (pid_ > 0 && !reaped_) {
            if (::kill(-pid_, SIGTERM) != 0) {
                ::kill(pid_, SIGTERM);
            }
        }
    }

    /**
     * @brief Wait for exit without reaping; the pid stays valid for terminate()
     */
    auto wait_exit() -> exit_status {
        exit_status status;
        siginfo_t info{};
        while (::waitid(P_PID, static_cast<id_t>(pid_), &info, WEXITED | WNOWAIT) == -1) {
            if (errno != EINTR) {
                return status;
            }
        }
        if (info.si_code == CLD_EXITED) {
            status.exited = true;
            status.code = info.si_status;
        } else {
            status.signal = info.si_status;
        }
        return status;
    }

    /**
     * @brief Reap the exited child
     */
    void release() {
        if (pid_ > 0 && !reaped_) {
            int status = 0;
            while (::waitpid(pid_, &status, 0) == -1 && errno == EINTR) {
            }
            reaped_ = true;
        }
    }

private:
    pid_t pid_ = -1;
    int read_fd_ = -1;
    bool reaped_ = false;
};

#endif

/**
 * @brief Splits a byte stream into lines, tolerating CRLF
 */
class line_splitter {
public:
    template <typename Fn>
    void feed(const char* data, std::size_t size, Fn&& on_line) {
        pending_.append(data, size);
        std::size_t start = 0;
        for (;;) {
            auto pos = pending_.find('\n', start);
            if (pos == std::string::npos) {
                break;
            }
            auto end = pos;
            if (end > start && pending_[end - 1] == '\r') {
                --end;
            }
            on_line(std::string_view(pending_).substr(start, end - start));
            start = pos + 1;
        }
        pending_.erase(0, start);
    }

    template <typename Fn>
    void flush(Fn&& on_line) {
        if (!pending_.empty()) {
            if (pending_.back() == '\r') {
                pending_.pop_back();
            }
            on_line(std::string_view(pending_));
            pending_.clear();
        }
    }

private:
    std::string pending_;
};

}  // namespace

struct process_supervisor::impl {
    supervisor_config config;

    statistics_accumulator stats;

    log_callback log_cb;
    progress_callback progress_cb;
    complete_callback complete_cb;
    mutable std::mutex callback_mutex;

    std::thread worker;
    // A worker that started its successor from the completion callback
    std::thread retired;
    std::atomic<bool> active{false};
    std::atomic<bool> cancel_requested{false};

    // Guards the live child pointer used by cancel()
    std::mutex child_mutex;
    child_process* live_child = nullptr;

    mutable std::mutex done_mutex;
    std::condition_variable done_cv;
    std::optional<transfer_outcome> last_outcome;
    int callbacks_running = 0;

    explicit impl(supervisor_config cfg) : config(std::move(cfg)) {}

    ~impl() {
        request_cancel();
        if (worker.joinable()) {
            worker.join();
        }
        if (retired.joinable()) {
            retired.join();
        }
    }

    /**
     * @brief Make room for a new worker
     *
     * Called from the completion callback, the current worker is still
     * unwinding; it is parked and joined on the next start or at
     * destruction.
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

    void request_cancel() {
        cancel_requested = true;
        std::lock_guard lock(child_mutex);
        if (live_child != nullptr) {
            live_child->terminate();
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

    void run(std::vector<std::string> args) {
        child_process child;
        std::optional<error> failure;
        std::optional<int> exit_code;

        auto spawned = child.spawn(args, config.working_directory);
        if (!spawned) {
            failure = spawned.error();
            UC_LOG_ERROR(log_category::process, failure->message);
            emit_log(failure->message);
        } else {
            {
                std::lock_guard lock(child_mutex);
                live_child = &child;
            }
            // Cancel may have raced the spawn
            if (cancel_requested) {
                child.terminate();
            }

            stream_output(child);

            const auto status = child.wait_exit();
            {
                std::lock_guard lock(child_mutex);
                live_child = nullptr;
            }
            child.release();

            if (status.exited) {
                exit_code = status.code;
            } else if (!cancel_requested) {
                failure = error(error_code::process_signalled,
                                "process killed by signal " + std::to_string(status.signal));
            }
        }

        finalize(exit_code, std::move(failure));
    }

    void stream_output(child_process& child) {
        output_parser parser(stats);
        line_splitter splitter;
        bool terminated = false;

        auto handle_line = [&](std::string_view line) {
            std::string text(line);
            emit_log(text);
            parser.parse_line(text);
            emit_progress(stats.snapshot());

            if (cancel_requested && !terminated) {
                child.terminate();
                terminated = true;
            }
        };

        char buffer[4096];
        for (;;) {
            const long n = child.read(buffer, sizeof(buffer));
            if (n == 0) {
                break;
            }
            if (n < 0) {
                UC_LOG_WARN(log_category::process, "Error reading process output");
                break;
            }
            splitter.feed(buffer, static_cast<std::size_t>(n), handle_line);
        }
        splitter.flush(handle_line);
    }

    void finalize(std::optional<int> exit_code, std::optional<error> failure) {
        const bool cancelled = cancel_requested.load();
        stats.finish(exit_code, cancelled);

        transfer_outcome outcome;
        outcome.statistics = stats.snapshot();

        if (cancelled) {
            outcome.status = transfer_status::cancelled;
            outcome.err = error(error_code::process_cancelled);
        } else if (failure) {
            outcome.status = transfer_status::failed;
            outcome.err = std::move(failure);
        } else if (exit_code && *exit_code < config.success_exit_code_limit) {
            outcome.status = transfer_status::completed;
        } else {
            outcome.status = transfer_status::failed;
            outcome.err = error(error_code::process_failed,
                "process exited with code " + std::to_string(exit_code.value_or(-1)));
        }

        transfer_log_context ctx;
        ctx.files_copied = outcome.statistics.files_copied;
        ctx.bytes_copied = outcome.statistics.bytes_copied;
        ctx.error_count = outcome.statistics.error_count;
        ctx.duration_ms = static_cast<uint64_t>(outcome.statistics.elapsed().count());
        if (exit_code) {
            ctx.exit_code = *exit_code;
        }

        if (outcome.succeeded()) {
            UC_LOG_INFO_CTX(log_category::process, "Process completed", ctx);
        } else {
            ctx.error_message = outcome.err->message;
            UC_LOG_WARN_CTX(log_category::process,
                            std::string("Process ") + to_string(outcome.status), ctx);
        }

        emit_progress(outcome.statistics);

        // The callback may start the next process
        {
            std::lock_guard lock(done_mutex);
            last_outcome = outcome;
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
};

process_supervisor::process_supervisor(supervisor_config config)
    : impl_(std::make_unique<impl>(std::move(config))) {}

process_supervisor::process_supervisor(process_supervisor&&) noexcept = default;
auto process_supervisor::operator=(process_supervisor&&) noexcept
    -> process_supervisor& = default;
process_supervisor::~process_supervisor() = default;

void process_supervisor::on_log(log_callback callback) {
    std::lock_guard lock(impl_->callback_mutex);
    impl_->log_cb = std::move(callback);
}

void process_supervisor::on_progress(progress_callback callback) {
    std::lock_guard lock(impl_->callback_mutex);
    impl_->progress_cb = std::move(callback);
}

void process_supervisor::on_complete(complete_callback callback) {
    std::lock_guard lock(impl_->callback_mutex);
    impl_->complete_cb = std::move(callback);
}

auto process_supervisor::start(std::vector<std::string> args) -> bool {
    if (args.empty()) {
        UC_LOG_ERROR(log_category::process, "Refusing to start: empty command");
        return false;
    }

    bool expected = false;
    if (!impl_->active.compare_exchange_strong(expected, true)) {
        UC_LOG_WARN(log_category::process, "A process is already running; start rejected");
        return false;
    }

    impl_->release_worker();

    impl_->cancel_requested = false;
    impl_->stats.start();

    UC_LOG_INFO(log_category::process, "Starting: " + join_command(args));

    auto* state = impl_.get();
    impl_->worker = std::thread([state, args = std::move(args)]() mutable {
        state->run(std::move(args));
    });
    return true;
}

void process_supervisor::cancel() {
    if (!impl_->active) {
        return;
    }
    UC_LOG_INFO(log_category::process, "Cancellation requested");
    impl_->request_cancel();
}

auto process_supervisor::wait(std::chrono::milliseconds timeout) -> bool {
    std::unique_lock lock(impl_->done_mutex);
    return impl_->done_cv.wait_for(lock, timeout, [this] { return impl_->idle(); });
}

auto process_supervisor::is_running() const -> bool {
    return impl_->active.load();
}

auto process_supervisor::statistics() const -> transfer_statistics {
    return impl_->stats.snapshot();
}

auto process_supervisor::last_outcome() const -> std::optional<transfer_outcome> {
    std::lock_guard lock(impl_->done_mutex);
    return impl_->last_outcome;
}

auto process_supervisor::config() const -> const supervisor_config& {
    return impl_->config;
}

}  // namespace kcenon::ultracopy

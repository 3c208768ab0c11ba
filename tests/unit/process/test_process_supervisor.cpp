/**
 * @file test_process_supervisor.cpp
 * @brief Unit tests for external process supervision
 *
 * Uses /bin/sh scripts that print bulk-copy style lines.
 */

#include <gtest/gtest.h>

#include <kcenon/ultracopy/process/process_supervisor.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace kcenon::ultracopy::test {

using namespace std::chrono_literals;

namespace {

auto shell(const std::string& script) -> std::vector<std::string> {
    return {"/bin/sh", "-c", script};
}

}  // namespace

class ProcessSupervisorTest : public ::testing::Test {
protected:
    void SetUp() override {
#ifdef _WIN32
        GTEST_SKIP() << "Shell-script driven tests require a POSIX shell";
#endif
    }

    process_supervisor supervisor_;
};

TEST_F(ProcessSupervisorTest, EmptyCommandIsRejected) {
    EXPECT_FALSE(supervisor_.start({}));
    EXPECT_FALSE(supervisor_.is_running());
}

TEST_F(ProcessSupervisorTest, SuccessfulRunParsesOutput) {
    std::vector<std::string> lines;
    std::mutex lines_mutex;
    supervisor_.on_log([&](const std::string& line) {
        std::lock_guard lock(lines_mutex);
        lines.push_back(line);
    });

    ASSERT_TRUE(supervisor_.start(shell(
        "printf '  New File  \\t  1048576\\tC:\\\\a\\\\file.bin\\r\\n';"
        "echo '   Speed :   10485760 Bytes/sec.';"
        "exit 1")));
    ASSERT_TRUE(supervisor_.wait(10s));

    auto outcome = supervisor_.last_outcome();
    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(outcome->status, transfer_status::completed);
    EXPECT_FALSE(outcome->err.has_value());
    EXPECT_EQ(outcome->statistics.files_copied, 1u);
    EXPECT_EQ(outcome->statistics.bytes_copied, 1048576u);
    EXPECT_DOUBLE_EQ(outcome->statistics.speed_mbps, 10.0);
    ASSERT_TRUE(outcome->statistics.exit_code.has_value());
    EXPECT_EQ(*outcome->statistics.exit_code, 1);

    std::lock_guard lock(lines_mutex);
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0].back(), 'n');  // CR stripped
}

TEST_F(ProcessSupervisorTest, ExitCodeAtLimitIsFailure) {
    ASSERT_TRUE(supervisor_.start(shell("exit 8")));
    ASSERT_TRUE(supervisor_.wait(10s));

    auto outcome = supervisor_.last_outcome();
    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(outcome->status, transfer_status::failed);
    ASSERT_TRUE(outcome->err.has_value());
    EXPECT_EQ(outcome->err->code, error_code::process_failed);
    EXPECT_EQ(outcome->statistics.exit_code.value_or(-1), 8);
}

TEST_F(ProcessSupervisorTest, ConfigurableSuccessLimit) {
    supervisor_config config;
    config.success_exit_code_limit = 1;
    process_supervisor strict(config);

    ASSERT_TRUE(strict.start(shell("exit 1")));
    ASSERT_TRUE(strict.wait(10s));

    EXPECT_EQ(strict.last_outcome()->status, transfer_status::failed);
    EXPECT_EQ(strict.config().success_exit_code_limit, 1);
}

TEST_F(ProcessSupervisorTest, StderrIsMerged) {
    ASSERT_TRUE(supervisor_.start(shell(
        "echo '2024/01/02 03:04:05 ERROR 5 (0x00000005) Access is denied.' >&2; exit 0")));
    ASSERT_TRUE(supervisor_.wait(10s));

    EXPECT_EQ(supervisor_.last_outcome()->statistics.error_count, 1u);
}

TEST_F(ProcessSupervisorTest, LaunchFailureIsReportedThroughCompletion) {
    std::atomic<int> completions{0};
    std::optional<transfer_outcome> seen;
    std::mutex seen_mutex;
    supervisor_.on_complete([&](const transfer_outcome& outcome) {
        std::lock_guard lock(seen_mutex);
        seen = outcome;
        ++completions;
    });

    ASSERT_TRUE(supervisor_.start({"/nonexistent/robocopy-does-not-exist", "a", "b"}));
    ASSERT_TRUE(supervisor_.wait(10s));

    EXPECT_EQ(completions.load(), 1);
    std::lock_guard lock(seen_mutex);
    ASSERT_TRUE(seen.has_value());
    EXPECT_EQ(seen->status, transfer_status::failed);
    ASSERT_TRUE(seen->err.has_value());
    EXPECT_EQ(seen->err->code, error_code::process_launch_failed);
    EXPECT_FALSE(seen->statistics.exit_code.has_value());
}

TEST_F(ProcessSupervisorTest, SecondStartWhileRunningIsRejected) {
    ASSERT_TRUE(supervisor_.start(shell("sleep 5")));
    EXPECT_TRUE(supervisor_.is_running());
    EXPECT_FALSE(supervisor_.start(shell("exit 0")));

    supervisor_.cancel();
    ASSERT_TRUE(supervisor_.wait(10s));
}

TEST_F(ProcessSupervisorTest, CancelTerminatesProcessTree) {
    std::atomic<int> completions{0};
    supervisor_.on_complete([&](const transfer_outcome&) { ++completions; });

    ASSERT_TRUE(supervisor_.start(shell("echo started; sleep 30; echo never")));

    const auto begin = std::chrono::steady_clock::now();
    supervisor_.cancel();
    ASSERT_TRUE(supervisor_.wait(10s));
    EXPECT_LT(std::chrono::steady_clock::now() - begin, 10s);

    auto outcome = supervisor_.last_outcome();
    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(outcome->status, transfer_status::cancelled);
    EXPECT_TRUE(outcome->statistics.cancelled);
    ASSERT_TRUE(outcome->err.has_value());
    EXPECT_EQ(outcome->err->code, error_code::process_cancelled);
    EXPECT_TRUE(outcome->statistics.end_time.has_value());
    EXPECT_FALSE(outcome->statistics.running);
    EXPECT_EQ(completions.load(), 1);
    EXPECT_FALSE(supervisor_.is_running());
}

TEST_F(ProcessSupervisorTest, CancelWhenIdleIsNoOp) {
    supervisor_.cancel();
    EXPECT_FALSE(supervisor_.is_running());
    EXPECT_FALSE(supervisor_.last_outcome().has_value());
}

TEST_F(ProcessSupervisorTest, WaitTimesOutWhileRunning) {
    ASSERT_TRUE(supervisor_.start(shell("sleep 5")));

    EXPECT_FALSE(supervisor_.wait(50ms));

    supervisor_.cancel();
    EXPECT_TRUE(supervisor_.wait(10s));
}

TEST_F(ProcessSupervisorTest, ProgressSnapshotsFollowOutput) {
    std::vector<uint64_t> files_seen;
    std::mutex files_mutex;
    supervisor_.on_progress([&](const transfer_statistics& stats) {
        std::lock_guard lock(files_mutex);
        files_seen.push_back(stats.files_copied);
    });

    ASSERT_TRUE(supervisor_.start(shell(
        "echo '  New File  10  /src/a.txt';"
        "echo '  New File  20  /src/b.txt';"
        "echo '   Files : 42';"
        "exit 1")));
    ASSERT_TRUE(supervisor_.wait(10s));

    std::lock_guard lock(files_mutex);
    ASSERT_GE(files_seen.size(), 3u);
    EXPECT_EQ(files_seen[0], 1u);
    EXPECT_EQ(files_seen[1], 2u);
    EXPECT_EQ(files_seen[2], 42u);
    EXPECT_EQ(supervisor_.statistics().files_copied, 42u);
}

TEST_F(ProcessSupervisorTest, WorkingDirectoryIsApplied) {
    auto dir = std::filesystem::temp_directory_path() / "ultracopy_supervisor_cwd";
    std::filesystem::create_directories(dir);

    supervisor_config config;
    config.working_directory = dir.string();
    process_supervisor supervisor(config);

    std::string first_line;
    std::mutex line_mutex;
    supervisor.on_log([&](const std::string& line) {
        std::lock_guard lock(line_mutex);
        if (first_line.empty()) first_line = line;
    });

    ASSERT_TRUE(supervisor.start(shell("pwd -P")));
    ASSERT_TRUE(supervisor.wait(10s));

    {
        std::lock_guard lock(line_mutex);
        EXPECT_EQ(first_line, std::filesystem::canonical(dir).string());
    }
    std::filesystem::remove_all(dir);
}

TEST_F(ProcessSupervisorTest, SupervisorCanBeReused) {
    ASSERT_TRUE(supervisor_.start(shell("exit 0")));
    ASSERT_TRUE(supervisor_.wait(10s));
    ASSERT_TRUE(supervisor_.start(shell("exit 2")));
    ASSERT_TRUE(supervisor_.wait(10s));

    EXPECT_EQ(supervisor_.last_outcome()->statistics.exit_code.value_or(-1), 2);
}

TEST_F(ProcessSupervisorTest, CompletionCallbackCanStartNextProcess) {
    std::atomic<int> completions{0};
    std::atomic<bool> running_in_callback{true};
    std::atomic<bool> restarted{false};
    supervisor_.on_complete([&](const transfer_outcome&) {
        if (++completions == 1) {
            running_in_callback = supervisor_.is_running();
            restarted = supervisor_.start(shell("exit 3"));
        }
    });

    ASSERT_TRUE(supervisor_.start(shell("exit 0")));
    ASSERT_TRUE(supervisor_.wait(10s));

    EXPECT_FALSE(running_in_callback.load());
    EXPECT_TRUE(restarted.load());
    EXPECT_EQ(completions.load(), 2);
    EXPECT_EQ(supervisor_.last_outcome()->statistics.exit_code.value_or(-1), 3);
}

TEST_F(ProcessSupervisorTest, WaitReturnsAfterCompletionCallback) {
    std::atomic<bool> callback_done{false};
    supervisor_.on_complete([&](const transfer_outcome&) {
        std::this_thread::sleep_for(100ms);
        callback_done = true;
    });

    ASSERT_TRUE(supervisor_.start(shell("exit 0")));
    ASSERT_TRUE(supervisor_.wait(10s));

    EXPECT_TRUE(callback_done.load());
    EXPECT_TRUE(supervisor_.start(shell("exit 0")));
    ASSERT_TRUE(supervisor_.wait(10s));
}

}  // namespace kcenon::ultracopy::test

/**
 * @file test_staged_copy_coordinator.cpp
 * @brief Unit tests for staged pulls and per-item pushes
 */

#include <gtest/gtest.h>

#include <kcenon/ultracopy/device/staged_copy_coordinator.h>

#include "unit/device/fake_device.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <random>
#include <thread>
#include <vector>

namespace kcenon::ultracopy::test {

namespace fs = std::filesystem;
using namespace std::chrono_literals;

class StagedCopyCoordinatorTest : public ::testing::Test {
protected:
    void SetUp() override {
#ifdef _WIN32
        GTEST_SKIP() << "Final copy is driven through POSIX tools";
#endif
        base_ = fs::temp_directory_path() /
                ("ultracopy_staged_" + std::to_string(std::random_device{}()));
        staging_root_ = base_ / "staging";
        destination_ = base_ / "dest";
        fs::create_directories(staging_root_);

        device_ = std::make_shared<fake_device>("Pixel 7");
        device_->add_folder({"DCIM"});
        device_->add_file({"DCIM"}, "a.jpg", 100);
        device_->add_file({"DCIM"}, "b.jpg", 200);
        device_->add_folder({"DCIM", "Camera"});
        device_->add_file({}, "notes.txt", 10);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(base_, ec);
    }

    auto make_config(const std::string& executable = "true") -> staged_copy_config {
        staged_copy_config config;
        config.staging_root = staging_root_;
        config.command.executable = executable;
        return config;
    }

    auto write_script(const std::string& name, const std::string& body) -> std::string {
        auto path = base_ / name;
        std::ofstream(path) << "#!/bin/sh\n" << body << "\n";
        fs::permissions(path, fs::perms::owner_all, fs::perm_options::add);
        return path.string();
    }

    auto pull_request() -> transfer_request {
        transfer_request request;
        request.destination = destination_.string();
        return request;
    }

    auto staging_root_is_empty() -> bool {
        return fs::is_empty(staging_root_);
    }

    fs::path base_;
    fs::path staging_root_;
    fs::path destination_;
    std::shared_ptr<fake_device> device_;
};

// =============================================================================
// Pull
// =============================================================================

TEST_F(StagedCopyCoordinatorTest, PullWalksTheFullLifecycle) {
    staged_copy_coordinator coordinator(device_, make_config());

    std::vector<staging_state> states;
    std::vector<std::string> staged_names;
    std::mutex mutex;
    coordinator.on_state_change([&](staging_state state) {
        std::lock_guard lock(mutex);
        states.push_back(state);
        if (state == staging_state::staging_complete) {
            auto dir = coordinator.staging_directory();
            if (dir) {
                for (const auto& entry : fs::directory_iterator(*dir)) {
                    staged_names.push_back(entry.path().filename().string());
                }
            }
        }
    });

    ASSERT_TRUE(coordinator.start_pull({"DCIM"}, pull_request()).has_value());
    ASSERT_TRUE(coordinator.wait(30s));

    auto outcome = coordinator.last_outcome();
    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(outcome->status, transfer_status::completed);

    std::lock_guard lock(mutex);
    EXPECT_EQ(states, (std::vector<staging_state>{
                          staging_state::staging, staging_state::staging_complete,
                          staging_state::final_copy, staging_state::final_complete,
                          staging_state::cleanup}));
    std::sort(staged_names.begin(), staged_names.end());
    EXPECT_EQ(staged_names, (std::vector<std::string>{"Camera", "a.jpg", "b.jpg"}));

    EXPECT_FALSE(coordinator.staging_directory().has_value());
    EXPECT_TRUE(staging_root_is_empty());
    EXPECT_EQ(coordinator.state(), staging_state::idle);
}

TEST_F(StagedCopyCoordinatorTest, PullOfSingleFile) {
    staged_copy_coordinator coordinator(device_, make_config());

    std::vector<std::string> staged_names;
    coordinator.on_state_change([&](staging_state state) {
        if (state == staging_state::staging_complete) {
            for (const auto& entry : fs::directory_iterator(*coordinator.staging_directory())) {
                staged_names.push_back(entry.path().filename().string());
            }
        }
    });

    ASSERT_TRUE(coordinator.start_pull({"notes.txt"}, pull_request()).has_value());
    ASSERT_TRUE(coordinator.wait(30s));

    EXPECT_EQ(coordinator.last_outcome()->status, transfer_status::completed);
    EXPECT_EQ(staged_names, (std::vector<std::string>{"notes.txt"}));
}

TEST_F(StagedCopyCoordinatorTest, FinalCopyReceivesStagingDirectoryAsSource) {
    auto script = write_script("fake_copy.sh",
                               "echo \"  New File  10  $1/notes.txt\"\n"
                               "echo \"   Files : 1\"\n"
                               "exit 1");
    staged_copy_config config = make_config(script);
    staged_copy_coordinator coordinator(device_, config);

    std::vector<std::string> lines;
    std::mutex mutex;
    coordinator.on_log([&](const std::string& line) {
        std::lock_guard lock(mutex);
        lines.push_back(line);
    });

    ASSERT_TRUE(coordinator.start_pull({"notes.txt"}, pull_request()).has_value());
    ASSERT_TRUE(coordinator.wait(30s));

    auto outcome = coordinator.last_outcome();
    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(outcome->status, transfer_status::completed);
    EXPECT_EQ(outcome->statistics.files_copied, 1u);

    std::lock_guard lock(mutex);
    bool saw_staged_source = false;
    for (const auto& line : lines) {
        if (line.find("New File") != std::string::npos &&
            line.find(staging_root_.string()) != std::string::npos) {
            saw_staged_source = true;
        }
    }
    EXPECT_TRUE(saw_staged_source);
}

TEST_F(StagedCopyCoordinatorTest, FailedFinalCopyStillCleansUp) {
    auto script = write_script("failing_copy.sh", "echo 'ERROR 112 (0x00000070) disk full'; exit 16");
    staged_copy_coordinator coordinator(device_, make_config(script));

    std::vector<staging_state> states;
    std::mutex mutex;
    coordinator.on_state_change([&](staging_state state) {
        std::lock_guard lock(mutex);
        states.push_back(state);
    });

    ASSERT_TRUE(coordinator.start_pull({"DCIM"}, pull_request()).has_value());
    ASSERT_TRUE(coordinator.wait(30s));

    auto outcome = coordinator.last_outcome();
    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(outcome->status, transfer_status::failed);
    ASSERT_TRUE(outcome->err.has_value());
    EXPECT_EQ(outcome->err->code, error_code::process_failed);
    EXPECT_EQ(outcome->statistics.exit_code.value_or(-1), 16);

    std::lock_guard lock(mutex);
    ASSERT_GE(states.size(), 2u);
    EXPECT_EQ(states[states.size() - 2], staging_state::final_failed);
    EXPECT_EQ(states.back(), staging_state::cleanup);
    EXPECT_TRUE(staging_root_is_empty());
}

TEST_F(StagedCopyCoordinatorTest, StagingFailureAbortsAndCleansUp) {
    device_->fail_copy_out("b.jpg");
    staged_copy_coordinator coordinator(device_, make_config());

    std::vector<staging_state> states;
    std::mutex mutex;
    coordinator.on_state_change([&](staging_state state) {
        std::lock_guard lock(mutex);
        states.push_back(state);
    });

    ASSERT_TRUE(coordinator.start_pull({"DCIM"}, pull_request()).has_value());
    ASSERT_TRUE(coordinator.wait(30s));

    auto outcome = coordinator.last_outcome();
    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(outcome->status, transfer_status::failed);
    ASSERT_TRUE(outcome->err.has_value());
    EXPECT_EQ(outcome->err->code, error_code::device_copy_out_failed);
    EXPECT_EQ(outcome->err->category(), error_category::staging);

    std::lock_guard lock(mutex);
    EXPECT_EQ(states, (std::vector<staging_state>{staging_state::staging,
                                                  staging_state::staging_failed,
                                                  staging_state::cleanup}));
    EXPECT_TRUE(staging_root_is_empty());
    EXPECT_FALSE(fs::exists(destination_));
}

TEST_F(StagedCopyCoordinatorTest, MissingDeviceItemIsReported) {
    staged_copy_coordinator coordinator(device_, make_config());

    ASSERT_TRUE(coordinator.start_pull({"Music"}, pull_request()).has_value());
    ASSERT_TRUE(coordinator.wait(30s));

    auto outcome = coordinator.last_outcome();
    ASSERT_TRUE(outcome.has_value());
    ASSERT_TRUE(outcome->err.has_value());
    EXPECT_EQ(outcome->err->code, error_code::device_path_not_found);
    EXPECT_TRUE(staging_root_is_empty());
}

TEST_F(StagedCopyCoordinatorTest, DeviceCallTimeout) {
    device_->set_copy_delay(600ms);
    auto config = make_config();
    config.copy_timeout = 100ms;
    config.cleanup_grace = 0ms;
    staged_copy_coordinator coordinator(device_, config);

    const auto begin = std::chrono::steady_clock::now();
    ASSERT_TRUE(coordinator.start_pull({"notes.txt"}, pull_request()).has_value());
    ASSERT_TRUE(coordinator.wait(30s));

    EXPECT_LT(std::chrono::steady_clock::now() - begin, 600ms);
    auto outcome = coordinator.last_outcome();
    ASSERT_TRUE(outcome.has_value());
    ASSERT_TRUE(outcome->err.has_value());
    EXPECT_EQ(outcome->err->code, error_code::device_timeout);

    // The abandoned call writes into the removed folder when it returns
    std::this_thread::sleep_for(800ms);
    EXPECT_TRUE(staging_root_is_empty());
}

TEST_F(StagedCopyCoordinatorTest, CleanupWaitsForAbandonedCall) {
    device_->set_copy_delay(400ms);
    auto config = make_config();
    config.copy_timeout = 50ms;
    staged_copy_coordinator coordinator(device_, config);

    ASSERT_TRUE(coordinator.start_pull({"notes.txt"}, pull_request()).has_value());
    ASSERT_TRUE(coordinator.wait(30s));

    auto outcome = coordinator.last_outcome();
    ASSERT_TRUE(outcome.has_value());
    ASSERT_TRUE(outcome->err.has_value());
    EXPECT_EQ(outcome->err->code, error_code::device_timeout);
    EXPECT_TRUE(staging_root_is_empty());

    std::this_thread::sleep_for(200ms);
    EXPECT_TRUE(staging_root_is_empty());
}

TEST_F(StagedCopyCoordinatorTest, CancelBeforeFinalCopySkipsIt) {
    const auto marker = base_ / "final_copy_ran";
    auto executable = write_script("copier.sh", "touch '" + marker.string() + "'");
    staged_copy_coordinator coordinator(device_, make_config(executable));

    std::vector<staging_state> states;
    std::mutex mutex;
    coordinator.on_state_change([&](staging_state state) {
        {
            std::lock_guard lock(mutex);
            states.push_back(state);
        }
        if (state == staging_state::staging_complete) {
            coordinator.cancel();
        }
    });

    ASSERT_TRUE(coordinator.start_pull({"DCIM"}, pull_request()).has_value());
    ASSERT_TRUE(coordinator.wait(30s));

    auto outcome = coordinator.last_outcome();
    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(outcome->status, transfer_status::cancelled);
    EXPECT_TRUE(outcome->statistics.end_time.has_value());
    EXPECT_FALSE(outcome->statistics.running);
    EXPECT_FALSE(fs::exists(marker));
    EXPECT_TRUE(staging_root_is_empty());

    std::lock_guard lock(mutex);
    EXPECT_EQ(states, (std::vector<staging_state>{
                          staging_state::staging, staging_state::staging_complete,
                          staging_state::final_copy, staging_state::final_failed,
                          staging_state::cleanup}));
}

TEST_F(StagedCopyCoordinatorTest, CompletionCallbackCanStartNextTransfer) {
    staged_copy_coordinator coordinator(device_, make_config());

    std::atomic<int> completions{0};
    std::atomic<bool> running_in_callback{true};
    std::atomic<bool> restarted{false};
    coordinator.on_complete([&](const transfer_outcome&) {
        if (++completions == 1) {
            running_in_callback = coordinator.is_running();
            restarted = coordinator.start_pull({"DCIM"}, pull_request()).has_value();
        }
    });

    ASSERT_TRUE(coordinator.start_pull({"notes.txt"}, pull_request()).has_value());
    ASSERT_TRUE(coordinator.wait(30s));

    EXPECT_FALSE(running_in_callback.load());
    EXPECT_TRUE(restarted.load());
    EXPECT_EQ(completions.load(), 2);
    EXPECT_EQ(coordinator.last_outcome()->status, transfer_status::completed);
}

TEST_F(StagedCopyCoordinatorTest, CancelDuringStaging) {
    device_->add_folder({"Download"});
    for (int i = 0; i < 20; ++i) {
        device_->add_file({"Download"}, "file" + std::to_string(i) + ".bin", 1);
    }
    device_->set_copy_delay(50ms);
    staged_copy_coordinator coordinator(device_, make_config());

    ASSERT_TRUE(coordinator.start_pull({"Download"}, pull_request()).has_value());
    std::this_thread::sleep_for(120ms);
    coordinator.cancel();
    ASSERT_TRUE(coordinator.wait(30s));

    auto outcome = coordinator.last_outcome();
    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(outcome->status, transfer_status::cancelled);
    EXPECT_TRUE(outcome->statistics.cancelled);
    EXPECT_LT(outcome->statistics.files_copied, 20u);
    EXPECT_TRUE(staging_root_is_empty());
}

TEST_F(StagedCopyCoordinatorTest, SecondStartWhileBusyIsRejected) {
    device_->set_copy_delay(200ms);
    staged_copy_coordinator coordinator(device_, make_config());

    ASSERT_TRUE(coordinator.start_pull({"notes.txt"}, pull_request()).has_value());
    auto second = coordinator.start_pull({"DCIM"}, pull_request());

    ASSERT_FALSE(second.has_value());
    EXPECT_EQ(second.error().code, error_code::process_already_running);
    ASSERT_TRUE(coordinator.wait(30s));
}

TEST_F(StagedCopyCoordinatorTest, InvalidStartArguments) {
    staged_copy_coordinator no_device(nullptr, make_config());
    auto missing_device = no_device.start_pull({"DCIM"}, pull_request());
    ASSERT_FALSE(missing_device.has_value());
    EXPECT_EQ(missing_device.error().code, error_code::device_not_configured);

    staged_copy_coordinator coordinator(device_, make_config());
    auto no_destination = coordinator.start_pull({"DCIM"}, transfer_request{});
    ASSERT_FALSE(no_destination.has_value());
    EXPECT_EQ(no_destination.error().code, error_code::invalid_destination);

    auto no_source = coordinator.start_push(base_ / "missing", {"Download"});
    ASSERT_FALSE(no_source.has_value());
    EXPECT_EQ(no_source.error().code, error_code::path_not_found);

    EXPECT_FALSE(coordinator.is_running());
}

// =============================================================================
// Push
// =============================================================================

TEST_F(StagedCopyCoordinatorTest, PushContinuesPastFailedItem) {
    auto source = base_ / "upload";
    fs::create_directories(source);
    for (int i = 0; i < 10; ++i) {
        std::ofstream(source / ("item" + std::to_string(i) + ".txt")) << "payload" << i;
    }
    device_->fail_copy_in("item4.txt");

    staged_copy_coordinator coordinator(device_, make_config());
    ASSERT_TRUE(coordinator.start_push(source, {"Download"}).has_value());
    ASSERT_TRUE(coordinator.wait(30s));

    auto tally = coordinator.last_push_result();
    ASSERT_TRUE(tally.has_value());
    EXPECT_EQ(tally->succeeded, 9u);
    EXPECT_EQ(tally->failed, 1u);
    ASSERT_EQ(tally->failed_items.size(), 1u);
    EXPECT_NE(tally->failed_items[0].find("item4.txt"), std::string::npos);

    auto outcome = coordinator.last_outcome();
    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(outcome->status, transfer_status::failed);
    ASSERT_TRUE(outcome->err.has_value());
    EXPECT_EQ(outcome->err->code, error_code::item_copy_failed);
    EXPECT_EQ(outcome->statistics.files_copied, 9u);
    EXPECT_EQ(outcome->statistics.error_count, 1u);

    EXPECT_FALSE(coordinator.staging_directory().has_value());
    EXPECT_TRUE(staging_root_is_empty());
}

TEST_F(StagedCopyCoordinatorTest, PushFolderKeepsRelativeLayout) {
    auto source = base_ / "Album";
    fs::create_directories(source / "2024");
    std::ofstream(source / "cover.jpg") << "c";
    std::ofstream(source / "2024" / "trip.jpg") << "t";

    staged_copy_coordinator coordinator(device_, make_config());
    ASSERT_TRUE(coordinator.start_push(source, {"Pictures"}).has_value());
    ASSERT_TRUE(coordinator.wait(30s));

    EXPECT_EQ(coordinator.last_outcome()->status, transfer_status::completed);

    auto pushed = device_->pushed();
    ASSERT_EQ(pushed.size(), 2u);
    for (const auto& [name, location] : pushed) {
        if (name == "trip.jpg") {
            EXPECT_EQ(location, (breadcrumb{"Pictures", "Album", "2024"}));
        } else {
            EXPECT_EQ(name, "cover.jpg");
            EXPECT_EQ(location, (breadcrumb{"Pictures", "Album"}));
        }
    }
}

TEST_F(StagedCopyCoordinatorTest, PushSingleFile) {
    auto file = base_ / "report.pdf";
    std::ofstream(file) << "pdf";

    staged_copy_coordinator coordinator(device_, make_config());
    ASSERT_TRUE(coordinator.start_push(file, {"Documents"}).has_value());
    ASSERT_TRUE(coordinator.wait(30s));

    auto tally = coordinator.last_push_result();
    ASSERT_TRUE(tally.has_value());
    EXPECT_EQ(tally->succeeded, 1u);
    EXPECT_EQ(device_->pushed().at(0).second, (breadcrumb{"Documents"}));
    EXPECT_EQ(coordinator.statistics().bytes_copied, 3u);
}

TEST_F(StagedCopyCoordinatorTest, CompletionCallbackFiresOnce) {
    staged_copy_coordinator coordinator(device_, make_config());
    std::atomic<int> completions{0};
    coordinator.on_complete([&](const transfer_outcome&) { ++completions; });

    ASSERT_TRUE(coordinator.start_pull({"notes.txt"}, pull_request()).has_value());
    ASSERT_TRUE(coordinator.wait(30s));

    EXPECT_EQ(completions.load(), 1);
    EXPECT_FALSE(coordinator.is_running());
}

}  // namespace kcenon::ultracopy::test

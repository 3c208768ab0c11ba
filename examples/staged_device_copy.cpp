/**
 * @file staged_device_copy.cpp
 * @brief Copying from and to a portable device through a staging folder
 *
 * This example demonstrates:
 * - Exposing a mounted device (MTP/gvfs mount, SD card) as device_automation
 * - Pulling a device folder: staged locally, then bulk-copied, then cleaned up
 * - Pushing a local folder onto the device item by item
 * - Reviewing the recorded sessions afterwards
 *
 * Usage:
 *   staged_device_copy pull <mount-root> <device-name> <device-folder> <destination>
 *   staged_device_copy push <mount-root> <device-name> <source> <device-folder>
 *
 * Example:
 *   staged_device_copy pull /run/user/1000/gvfs/mtp:host=Pixel "Pixel 7" DCIM/Camera ~/Photos
 */

#include <kcenon/ultracopy/ultracopy.h>

#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

using namespace kcenon::ultracopy;

namespace {

void print_usage(const char* program) {
    std::cout << "Usage:\n"
              << "  " << program
              << " pull <mount-root> <device-name> <device-folder> <destination> [--exe <path>]\n"
              << "  " << program
              << " push <mount-root> <device-name> <source> <device-folder>\n";
}

/**
 * @brief Turn "DCIM/Camera" into the shell path form "Computer\<device>\DCIM\Camera"
 */
auto device_shell_path(const std::string& device_name, const std::string& folder) -> std::string {
    std::string path = "Computer\\" + device_name;
    for (const auto& part : std::filesystem::path(folder)) {
        if (part.empty() || part == "/") {
            continue;
        }
        path += "\\" + part.string();
    }
    return path;
}

void print_sessions(const session_history& history) {
    std::cout << "\n=== Sessions ===\n";
    for (const auto& entry : history.history()) {
        std::cout << entry.session_id << "  " << entry.operation << "  "
                  << (entry.success ? "ok    " : "failed") << "  "
                  << entry.total_files << " files, " << entry.total_bytes << " bytes, "
                  << entry.duration.count() << " ms\n";
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    if (argc < 6) {
        print_usage(argv[0]);
        return 1;
    }

    const std::string direction = argv[1];
    const std::filesystem::path mount_root = argv[2];
    const std::string device_name = argv[3];

    std::string executable = "robocopy";
    for (int i = 6; i + 1 < argc; ++i) {
        if (std::string(argv[i]) == "--exe") {
            executable = argv[++i];
        }
    }

    transfer_request request;
    if (direction == "pull") {
        request.source = device_shell_path(device_name, argv[4]);
        request.destination = argv[5];
    } else if (direction == "push") {
        request.source = argv[4];
        request.destination = device_shell_path(device_name, argv[5]);
    } else {
        print_usage(argv[0]);
        return 1;
    }

    if (!std::filesystem::is_directory(mount_root)) {
        std::cerr << "Mount root not found: " << mount_root << "\n";
        return 1;
    }

    auto history = std::make_shared<session_history>();
    auto built = transfer_engine::builder()
                     .with_executable(executable)
                     .with_device(std::make_shared<mounted_device>(device_name, mount_root))
                     .with_session_store(history)
                     .with_device_timeouts(std::chrono::minutes(30), std::chrono::seconds(15))
                     .build();
    if (!built) {
        std::cerr << "Failed to create engine: " << built.error().message << "\n";
        return 1;
    }
    auto& engine = built.value();

    auto route = engine.plan(request);
    if (!route) {
        std::cerr << "Invalid request: " << route.error().message << "\n";
        return 1;
    }

    std::cout << "=== Device Copy (" << to_string(route.value()) << ") ===\n";
    std::cout << "Source:      " << request.source << "\n";
    std::cout << "Destination: " << request.destination << "\n\n";

    engine.on_log([](const std::string& line) {
        std::cout << "  " << line << "\n";
    });

    engine.on_complete([](const transfer_outcome& outcome) {
        std::cout << "\nFinished: " << to_string(outcome.status) << "\n";
    });

    if (auto started = engine.start(request); !started) {
        std::cerr << "Failed to start: " << started.error().message << "\n";
        return 1;
    }

    engine.wait(std::chrono::hours(4));

    auto outcome = engine.last_outcome();
    if (!outcome) {
        std::cerr << "Copy did not finish\n";
        engine.cancel();
        return 1;
    }

    std::cout << "Files: " << outcome->statistics.files_copied
              << "  Errors: " << outcome->statistics.error_count << "\n";
    if (outcome->err) {
        std::cout << "Error: " << outcome->err->message << "\n";
    }

    print_sessions(*history);
    return outcome->succeeded() ? 0 : 1;
}

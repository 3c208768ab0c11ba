/**
 * @file command_builder.cpp
 * @brief Bulk-copy utility argument construction
 */

#include "kcenon/ultracopy/core/command_builder.h"

namespace kcenon::ultracopy {

namespace {

// Data, attributes, timestamps; none of them need elevated rights
constexpr const char* file_copy_flags = "/COPY:DAT";
constexpr const char* dir_copy_flags = "/DCOPY:DAT";

void append_mode_flags(std::vector<std::string>& args, transfer_mode mode) {
    switch (mode) {
        case transfer_mode::mirror:
            args.emplace_back(copy_flags::mirror);
            break;
        case transfer_mode::incremental:
            args.emplace_back(copy_flags::exclude_older);
            break;
        case transfer_mode::full:
        default:
            break;
    }
}

}  // namespace

auto effective_retry_policy(const transfer_request& request) -> retry_policy {
    if (request.retry.has_value()) {
        return request.retry.value();
    }
    return request.network_optimized ? retry_policy::elevated() : retry_policy::standard();
}

auto build_command(const transfer_request& request, const command_options& options)
    -> std::vector<std::string> {
    std::vector<std::string> args;
    args.reserve(24 + 2 * (request.exclude_dirs.size() + request.exclude_files.size()) +
                 request.custom_flags.size());

    args.push_back(options.executable);
    args.push_back(request.source);
    args.push_back(request.destination);
    args.emplace_back(copy_flags::subdirectories);

    append_mode_flags(args, request.mode);

    if (request.thread_count > 1) {
        args.push_back("/MT:" + std::to_string(request.thread_count));
    }

    const auto retry = effective_retry_policy(request);
    if (request.network_optimized) {
        args.emplace_back(copy_flags::restartable);
        args.emplace_back(copy_flags::backup_mode);
    }
    args.push_back("/R:" + std::to_string(retry.retry_count));
    args.push_back("/W:" + std::to_string(retry.retry_wait.count()));
    args.emplace_back(copy_flags::no_progress);

    args.emplace_back(file_copy_flags);
    args.emplace_back(dir_copy_flags);
    args.emplace_back("/V");
    args.emplace_back("/ETA");

    // Console and log output, sizes in bytes, timestamps, full paths
    args.emplace_back("/TEE");
    args.emplace_back("/BYTES");
    args.emplace_back("/TS");
    args.emplace_back("/FP");

    for (const auto& dir : request.exclude_dirs) {
        args.emplace_back(copy_flags::exclude_dir);
        args.push_back(dir);
    }
    for (const auto& file : request.exclude_files) {
        args.emplace_back(copy_flags::exclude_file);
        args.push_back(file);
    }

    args.insert(args.end(), request.custom_flags.begin(), request.custom_flags.end());

    if (options.log_file.has_value()) {
        args.push_back("/LOG+:" + options.log_file.value());
    }

    return args;
}

auto join_command(const std::vector<std::string>& args) -> std::string {
    std::string joined;
    for (const auto& arg : args) {
        if (!joined.empty()) {
            joined += ' ';
        }
        if (arg.find(' ') != std::string::npos) {
            joined += '"' + arg + '"';
        } else {
            joined += arg;
        }
    }
    return joined;
}

}  // namespace kcenon::ultracopy

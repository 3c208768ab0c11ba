/**
 * @file path_classifier.cpp
 * @brief Path classification implementation
 */

#include "kcenon/ultracopy/network/path_classifier.h"

#include "kcenon/ultracopy/core/logging.h"

#include <cctype>
#include <filesystem>
#include <system_error>

#ifdef _WIN32
#include <io.h>
#include <windows.h>
#else
#include <unistd.h>
#endif

namespace kcenon::ultracopy {

namespace {

constexpr uint32_t local_threads = 32;
constexpr uint32_t remote_threads = 16;
constexpr double local_expected_mbps = 500.0;
constexpr double remote_expected_mbps = 100.0;

auto has_unc_prefix(std::string_view path) -> bool {
    return path.size() >= 2 &&
           ((path[0] == '\\' && path[1] == '\\') || (path[0] == '/' && path[1] == '/'));
}

auto drive_letter_of(std::string_view path) -> std::optional<char> {
    if (path.size() >= 2 && path[1] == ':' &&
        std::isalpha(static_cast<unsigned char>(path[0]))) {
        return static_cast<char>(std::toupper(static_cast<unsigned char>(path[0])));
    }
    return std::nullopt;
}

auto split_components(std::string_view path) -> std::vector<std::string> {
    std::vector<std::string> parts;
    std::string current;
    for (char c : path) {
        if (c == '\\' || c == '/') {
            if (!current.empty()) {
                parts.push_back(std::move(current));
                current.clear();
            }
        } else {
            current += c;
        }
    }
    if (!current.empty()) {
        parts.push_back(std::move(current));
    }
    return parts;
}

}  // namespace

auto drive_table::is_mapped(char letter) const -> bool {
    const char upper = static_cast<char>(std::toupper(static_cast<unsigned char>(letter)));
    return mapped.find(upper) != mapped.end();
}

auto drive_table::from_system() -> drive_table {
    drive_table table;
#ifdef _WIN32
    const DWORD drives = ::GetLogicalDrives();
    for (int i = 0; i < 26; ++i) {
        if ((drives & (1u << i)) == 0) {
            continue;
        }
        const char letter = static_cast<char>('A' + i);
        const char root[] = {letter, ':', '\\', '\0'};
        if (::GetDriveTypeA(root) == DRIVE_REMOTE) {
            table.mapped.emplace(letter, std::string());
        }
    }
#endif
    return table;
}

path_classifier::path_classifier(drive_table table)
    : table_(std::move(table)) {}

auto path_classifier::is_network(std::string_view path) const -> bool {
    if (has_unc_prefix(path)) {
        return true;
    }
    if (auto letter = drive_letter_of(path)) {
        return table_.is_mapped(*letter);
    }
    return false;
}

auto path_classifier::get_optimized_parameters(std::string_view source,
                                               std::string_view destination) const
    -> optimized_parameters {
    const bool source_remote = is_network(source);
    const bool dest_remote = is_network(destination);

    optimized_parameters params;
    params.network_optimized = source_remote || dest_remote;

    if (params.network_optimized) {
        const auto policy = retry_policy::elevated();
        params.threads = remote_threads;
        params.retry_count = policy.retry_count;
        params.retry_wait = policy.retry_wait;
        params.use_restartable = true;
        params.use_backup_mode = true;
        if (source_remote) {
            params.reasons.emplace_back("Source is network path");
        }
        if (dest_remote) {
            params.reasons.emplace_back("Destination is network path");
        }
    } else {
        const auto policy = retry_policy::standard();
        params.threads = local_threads;
        params.retry_count = policy.retry_count;
        params.retry_wait = policy.retry_wait;
        params.reasons.emplace_back("Local to local transfer");
    }

    return params;
}

auto path_classifier::get_network_info(std::string_view path) const
    -> std::optional<network_info> {
    if (!is_network(path)) {
        return std::nullopt;
    }

    network_info info;
    if (has_unc_prefix(path)) {
        info.type = network_path_type::unc;
        auto parts = split_components(path);
        if (!parts.empty()) {
            info.server = parts[0];
        }
        if (parts.size() >= 2) {
            info.share = parts[1];
        }
    } else {
        info.type = network_path_type::mapped_drive;
        info.drive = drive_letter_of(path);
    }
    return info;
}

auto path_classifier::estimate_speed(std::string_view source,
                                     std::string_view destination) const -> speed_estimate {
    const bool source_remote = is_network(source);
    const bool dest_remote = is_network(destination);

    speed_estimate estimate;
    if (!source_remote && !dest_remote) {
        estimate.expected_mbps = local_expected_mbps;
        estimate.scenario = "Local to Local";
        estimate.bottleneck = "Disk I/O speed";
    } else {
        estimate.expected_mbps = remote_expected_mbps;
        if (source_remote && dest_remote) {
            estimate.scenario = "Network to Network";
        } else {
            estimate.scenario = source_remote ? "Network to Local" : "Local to Network";
        }
        estimate.bottleneck = "Network bandwidth";
    }
    return estimate;
}

auto path_classifier::validate_path_access(const std::string& path) -> result<void> {
    std::error_code ec;
    if (path.empty() || !std::filesystem::exists(path, ec)) {
        return unexpected(error(error_code::path_not_found, "Path does not exist: " + path));
    }

#ifdef _WIN32
    const bool readable = ::_access(path.c_str(), 4) == 0;
#else
    const bool readable = ::access(path.c_str(), R_OK) == 0;
#endif
    if (!readable) {
        return unexpected(error(error_code::path_not_readable, "Path is not readable: " + path));
    }
    return {};
}

void apply_parameters(transfer_request& request, const optimized_parameters& params) {
    request.network_optimized = params.network_optimized;
    request.thread_count = params.threads;
    request.retry = retry_policy{params.retry_count, params.retry_wait};

    for (const auto& reason : params.reasons) {
        UC_LOG_DEBUG(log_category::network, "Parameter choice: " + reason);
    }
}

}  // namespace kcenon::ultracopy

/**
 * @file transfer_types.cpp
 * @brief Helpers for transfer request and statistics types
 */

#include "kcenon/ultracopy/core/transfer_types.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdio>
#include <string_view>

namespace kcenon::ultracopy {

auto parse_transfer_mode(std::string_view name) -> transfer_mode {
    std::string lowered(name);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "mirror") {
        return transfer_mode::mirror;
    }
    if (lowered == "incremental") {
        return transfer_mode::incremental;
    }
    return transfer_mode::full;
}

auto format_bytes(uint64_t bytes) -> std::string {
    constexpr std::array<const char*, 5> units = {"B", "KB", "MB", "GB", "TB"};

    auto value = static_cast<double>(bytes);
    for (const char* unit : units) {
        if (value < 1024.0) {
            char buf[32];
            std::snprintf(buf, sizeof(buf), "%.2f %s", value, unit);
            return buf;
        }
        value /= 1024.0;
    }

    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.2f PB", value);
    return buf;
}

auto format_duration(std::chrono::milliseconds duration) -> std::string {
    const double seconds = static_cast<double>(duration.count()) / 1000.0;
    char buf[48];

    if (seconds < 60.0) {
        std::snprintf(buf, sizeof(buf), "%.2fs", seconds);
        return buf;
    }

    const auto total = static_cast<long long>(seconds);
    const auto hours = total / 3600;
    const auto minutes = (total % 3600) / 60;
    const auto secs = total % 60;

    if (hours > 0) {
        std::snprintf(buf, sizeof(buf), "%lldh %02lldm %02llds", hours, minutes, secs);
    } else {
        std::snprintf(buf, sizeof(buf), "%lldm %02llds", minutes, secs);
    }
    return buf;
}

}  // namespace kcenon::ultracopy

/**
 * @file device_path.cpp
 * @brief Device path detection and parsing
 */

#include "kcenon/ultracopy/device/device_automation.h"

#include <algorithm>
#include <array>
#include <cctype>

namespace kcenon::ultracopy {

namespace {

constexpr std::array<std::string_view, 6> staged_indicators = {
    "wpd://",
    "mtp://",
    "::{",
    "USB\\VID_",
    "20D04FE0-3AEA",  // MyComputer
    "6ac27878-a6fa",  // portable devices
};

constexpr std::string_view computer_prefix = "Computer\\";
constexpr std::string_view mtp_scheme = "mtp://";

auto starts_with_icase(std::string_view text, std::string_view prefix) -> bool {
    if (text.size() < prefix.size()) {
        return false;
    }
    return std::equal(prefix.begin(), prefix.end(), text.begin(), [](char a, char b) {
        return std::tolower(static_cast<unsigned char>(a)) ==
               std::tolower(static_cast<unsigned char>(b));
    });
}

auto trim(std::string_view text) -> std::string {
    auto begin = text.find_first_not_of(" \t");
    if (begin == std::string_view::npos) {
        return {};
    }
    auto end = text.find_last_not_of(" \t");
    return std::string(text.substr(begin, end - begin + 1));
}

auto split_any(std::string_view text, std::string_view separators) -> std::vector<std::string> {
    std::vector<std::string> parts;
    std::size_t start = 0;
    while (start <= text.size()) {
        auto pos = text.find_first_of(separators, start);
        if (pos == std::string_view::npos) {
            pos = text.size();
        }
        auto part = trim(text.substr(start, pos - start));
        if (!part.empty()) {
            parts.push_back(std::move(part));
        }
        start = pos + 1;
    }
    return parts;
}

}  // namespace

auto is_staged_device_path(std::string_view path) -> bool {
    if (path.empty()) {
        return false;
    }
    if (starts_with_icase(path, computer_prefix)) {
        return true;
    }
    return std::any_of(staged_indicators.begin(), staged_indicators.end(),
                       [path](std::string_view marker) {
                           return path.find(marker) != std::string_view::npos;
                       });
}

auto parse_device_path(std::string_view path) -> std::optional<device_path> {
    std::vector<std::string> parts;
    if (starts_with_icase(path, computer_prefix)) {
        parts = split_any(path.substr(computer_prefix.size()), "\\");
    } else if (starts_with_icase(path, mtp_scheme)) {
        parts = split_any(path.substr(mtp_scheme.size()), "/\\");
    } else {
        return std::nullopt;
    }

    if (parts.empty()) {
        return std::nullopt;
    }

    device_path parsed;
    parsed.device = parts.front();
    parsed.location.assign(parts.begin() + 1, parts.end());
    return parsed;
}

auto to_display_path(const breadcrumb& location, std::string_view root_label) -> std::string {
    std::string display(root_label);
    for (const auto& name : location) {
        display += '\\';
        display += name;
    }
    return display;
}

}  // namespace kcenon::ultracopy

/**
 * @file output_parser.cpp
 * @brief Bulk-copy utility output parsing
 */

#include "kcenon/ultracopy/core/output_parser.h"

#include <kcenon/ultracopy/core/logging.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <regex>

namespace kcenon::ultracopy {

namespace {

// "  New File  \t\t  1048576\t2024/01/02 03:04:05\tC:\a\file.bin"
// Matches up to the path; the /TS timestamp before it is optional. The
// path itself is the rest of the line and never goes through the regex
// engine, whose backtracking recurses once per character.
const std::regex& file_line_pattern() {
    static const std::regex pattern(
        R"((?:^|\s)(New File|Newer|Older)\s+(\d+)\s+(?:\d{4}/\d{2}/\d{2}\s+\d{2}:\d{2}:\d{2}\s+)?)");
    return pattern;
}

const std::regex& speed_pattern() {
    static const std::regex pattern(
        R"(Speed\s*:\s*(\d+(?:\.\d+)?)\s*(Bytes/sec|MegaBytes/min))",
        std::regex::icase);
    return pattern;
}

const std::regex& files_pattern() {
    static const std::regex pattern(R"(Files\s*:\s*(\d+))");
    return pattern;
}

const std::regex& bytes_pattern() {
    static const std::regex pattern(R"(Bytes\s*:\s*(\d+))");
    return pattern;
}

constexpr double bytes_per_megabyte = 1024.0 * 1024.0;

auto trim_line_end(std::string_view line) -> std::string_view {
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
        line.remove_suffix(1);
    }
    return line;
}

auto parse_uint(const std::string& text) -> std::optional<uint64_t> {
    uint64_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

auto trim_right(std::string_view text) -> std::string_view {
    const auto last = text.find_last_not_of(" \t\r\n");
    return last == std::string_view::npos ? std::string_view{} : text.substr(0, last + 1);
}

auto contains(std::string_view haystack, std::string_view needle) -> bool {
    return haystack.find(needle) != std::string_view::npos;
}

}  // namespace

output_parser::output_parser(statistics_accumulator& stats)
    : stats_(stats) {}

auto output_parser::match_file_line(std::string_view line) -> std::optional<file_line> {
    std::string text(trim_line_end(line));
    std::smatch match;
    if (!std::regex_search(text, match, file_line_pattern())) {
        return std::nullopt;
    }

    auto size = parse_uint(match[2].str());
    if (!size) {
        return std::nullopt;
    }

    const auto path_start = static_cast<std::size_t>(match.position(0) + match.length(0));
    const auto path = trim_right(std::string_view(text).substr(path_start));
    if (path.empty()) {
        return std::nullopt;
    }

    file_line entry;
    entry.tag = match[1].str();
    entry.size = *size;
    entry.path = std::string(path);
    return entry;
}

auto output_parser::match_speed(std::string_view line) -> std::optional<double> {
    std::string text(line);
    std::smatch match;
    if (!std::regex_search(text, match, speed_pattern())) {
        return std::nullopt;
    }

    double value = 0.0;
    try {
        value = std::stod(match[1].str());
    } catch (const std::exception&) {
        return std::nullopt;
    }

    std::string unit = match[2].str();
    std::transform(unit.begin(), unit.end(), unit.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (unit == "megabytes/min") {
        return value / 60.0;
    }
    return value / bytes_per_megabyte;
}

auto output_parser::match_files_total(std::string_view line) -> std::optional<uint64_t> {
    if (contains(line, "Total")) {
        return std::nullopt;
    }
    std::string text(line);
    std::smatch match;
    if (!std::regex_search(text, match, files_pattern())) {
        return std::nullopt;
    }
    return parse_uint(match[1].str());
}

auto output_parser::match_bytes_total(std::string_view line) -> std::optional<uint64_t> {
    if (contains(line, "Total")) {
        return std::nullopt;
    }
    std::string text(line);
    std::smatch match;
    if (!std::regex_search(text, match, bytes_pattern())) {
        return std::nullopt;
    }
    return parse_uint(match[1].str());
}

auto output_parser::is_error_line(std::string_view line) -> bool {
    constexpr std::string_view marker = "error";
    auto it = std::search(line.begin(), line.end(), marker.begin(), marker.end(),
                          [](char a, char b) {
                              return std::tolower(static_cast<unsigned char>(a)) == b;
                          });
    return it != line.end();
}

auto output_parser::parse_line(std::string_view raw) -> line_kind {
    auto line = trim_line_end(raw);
    if (line.find_first_not_of(" \t") == std::string_view::npos) {
        return line_kind::none;
    }

    line_kind kinds = line_kind::none;

    if (auto entry = match_file_line(line)) {
        stats_.record_file_copied(entry->size, entry->path);
        kinds = kinds | line_kind::file_copied;
    }

    if (auto speed = match_speed(line)) {
        stats_.set_speed(*speed);
        kinds = kinds | line_kind::speed;
    }

    if (auto files = match_files_total(line)) {
        stats_.override_files_copied(*files);
        kinds = kinds | line_kind::files_total;
    }

    if (auto bytes = match_bytes_total(line)) {
        stats_.override_bytes_copied(*bytes);
        kinds = kinds | line_kind::bytes_total;
    }

    if (is_error_line(line)) {
        stats_.record_error();
        kinds = kinds | line_kind::error;
    }

    if (kinds == line_kind::none) {
        ++unrecognized_;
        UC_LOG_DEBUG(log_category::parser, std::string("Unrecognized output: ") + std::string(line));
    }

    return kinds;
}

}  // namespace kcenon::ultracopy

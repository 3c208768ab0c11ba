/**
 * @file output_parser.h
 * @brief Tolerant parser for the bulk-copy utility's console output
 *
 * The utility's text format is not a stable contract. Every pattern below
 * is pinned to sample lines in the unit tests and must be revalidated when
 * the wrapped tool changes. Unrecognized lines are logged and ignored; the
 * parser never fails on input.
 */

#ifndef KCENON_ULTRACOPY_CORE_OUTPUT_PARSER_H
#define KCENON_ULTRACOPY_CORE_OUTPUT_PARSER_H

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "kcenon/ultracopy/core/statistics_accumulator.h"

namespace kcenon::ultracopy {

/**
 * @brief Kinds of information found in one output line
 */
enum class line_kind : uint8_t {
    none = 0,
    file_copied = 1 << 0,
    speed = 1 << 1,
    files_total = 1 << 2,
    bytes_total = 1 << 3,
    error = 1 << 4,
};

[[nodiscard]] constexpr auto operator|(line_kind a, line_kind b) -> line_kind {
    return static_cast<line_kind>(static_cast<uint8_t>(a) | static_cast<uint8_t>(b));
}

[[nodiscard]] constexpr auto has_kind(line_kind kinds, line_kind kind) -> bool {
    return (static_cast<uint8_t>(kinds) & static_cast<uint8_t>(kind)) != 0;
}

/**
 * @brief A per-file copy line ("New File  1048576  C:\a\file.bin")
 */
struct file_line {
    std::string tag;   ///< "New File", "Newer" or "Older"
    uint64_t size = 0;
    std::string path;
};

/**
 * @brief Line parser feeding a statistics_accumulator
 *
 * Policy for cumulative totals: "Files :" and "Bytes :" lines overwrite
 * the running counters (last writer wins) instead of adding to the
 * per-file deltas.
 */
class output_parser {
public:
    /**
     * @brief Construct a parser writing into @p stats
     * @param stats Accumulator owned by the caller; must outlive the parser
     */
    explicit output_parser(statistics_accumulator& stats);

    /**
     * @brief Parse one line and update the statistics
     * @param line Raw line, trailing CR/LF tolerated
     * @return What the line contained; line_kind::none for unrecognized lines
     */
    auto parse_line(std::string_view line) -> line_kind;

    /**
     * @brief Number of lines that matched no pattern
     */
    [[nodiscard]] auto unrecognized_lines() const -> uint64_t { return unrecognized_; }

    // Pattern helpers, exposed for tests and benchmarks

    [[nodiscard]] static auto match_file_line(std::string_view line) -> std::optional<file_line>;

    /**
     * @brief Extract a speed normalized to MB/s
     *
     * "Speed : 10485760 Bytes/sec" gives 10.0, "Speed : 600.0 MegaBytes/min"
     * gives 10.0.
     */
    [[nodiscard]] static auto match_speed(std::string_view line) -> std::optional<double>;

    [[nodiscard]] static auto match_files_total(std::string_view line) -> std::optional<uint64_t>;
    [[nodiscard]] static auto match_bytes_total(std::string_view line) -> std::optional<uint64_t>;
    [[nodiscard]] static auto is_error_line(std::string_view line) -> bool;

private:
    statistics_accumulator& stats_;
    uint64_t unrecognized_ = 0;
};

}  // namespace kcenon::ultracopy

#endif  // KCENON_ULTRACOPY_CORE_OUTPUT_PARSER_H

/**
 * @file command_builder.h
 * @brief Translation of a transfer_request into bulk-copy utility arguments
 */

#ifndef KCENON_ULTRACOPY_CORE_COMMAND_BUILDER_H
#define KCENON_ULTRACOPY_CORE_COMMAND_BUILDER_H

#include <optional>
#include <string>
#include <vector>

#include "kcenon/ultracopy/core/transfer_types.h"

namespace kcenon::ultracopy {

/**
 * @brief Flags understood by the robocopy-compatible bulk-copy utility
 */
struct copy_flags {
    static constexpr const char* subdirectories = "/E";
    static constexpr const char* mirror = "/MIR";
    static constexpr const char* exclude_older = "/XO";
    static constexpr const char* restartable = "/Z";
    static constexpr const char* backup_mode = "/ZB";
    static constexpr const char* no_progress = "/NP";
    static constexpr const char* exclude_dir = "/XD";
    static constexpr const char* exclude_file = "/XF";
};

/**
 * @brief Options that do not belong to an individual request
 */
struct command_options {
    std::string executable = "robocopy";
    std::optional<std::string> log_file;  ///< Appended as /LOG+:<file>
};

/**
 * @brief Build the ordered argument list for a request
 *
 * The first element is the executable. Pure function: the same request and
 * options always give the same list.
 *
 * @code
 * transfer_request req;
 * req.source = "C:\\Source";
 * req.destination = "D:\\Backup";
 * req.mode = transfer_mode::mirror;
 * req.thread_count = 16;
 *
 * auto args = build_command(req);
 * // robocopy C:\Source D:\Backup /E /MIR /MT:16 /R:1 /W:3 /NP ...
 * @endcode
 */
[[nodiscard]] auto build_command(const transfer_request& request,
                                 const command_options& options = {})
    -> std::vector<std::string>;

/**
 * @brief Retry policy the builder uses for a request
 */
[[nodiscard]] auto effective_retry_policy(const transfer_request& request) -> retry_policy;

/**
 * @brief Join arguments into one display string for logs
 */
[[nodiscard]] auto join_command(const std::vector<std::string>& args) -> std::string;

}  // namespace kcenon::ultracopy

#endif  // KCENON_ULTRACOPY_CORE_COMMAND_BUILDER_H

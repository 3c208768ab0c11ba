/**
 * @file path_classifier.h
 * @brief Local/remote path classification and parameter recommendation
 */

#ifndef KCENON_ULTRACOPY_NETWORK_PATH_CLASSIFIER_H
#define KCENON_ULTRACOPY_NETWORK_PATH_CLASSIFIER_H

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "kcenon/ultracopy/core/transfer_types.h"
#include "kcenon/ultracopy/core/types.h"

namespace kcenon::ultracopy {

/**
 * @brief Snapshot of mapped network drives
 *
 * Keys are upper-case drive letters, values the remote name when known.
 */
struct drive_table {
    std::map<char, std::string> mapped;

    [[nodiscard]] auto is_mapped(char letter) const -> bool;

    /**
     * @brief Table describing the current machine
     *
     * Queries the drive types on Windows; other platforms have no drive
     * letters and get an empty table.
     */
    [[nodiscard]] static auto from_system() -> drive_table;
};

using drive_table_provider = std::function<drive_table()>;

/**
 * @brief Recommended transfer parameters for a source/destination pair
 */
struct optimized_parameters {
    bool network_optimized = false;
    uint32_t threads = 8;
    uint32_t retry_count = 1;
    std::chrono::seconds retry_wait{3};
    bool use_restartable = false;
    bool use_backup_mode = false;
    std::vector<std::string> reasons;
};

/**
 * @brief Kind of remote path
 */
enum class network_path_type {
    unc,
    mapped_drive
};

[[nodiscard]] constexpr auto to_string(network_path_type type) -> const char* {
    switch (type) {
        case network_path_type::unc: return "unc";
        case network_path_type::mapped_drive: return "mapped_drive";
        default: return "unknown";
    }
}

/**
 * @brief Details of a remote path
 */
struct network_info {
    network_path_type type = network_path_type::unc;
    std::optional<std::string> server;
    std::optional<std::string> share;
    std::optional<char> drive;
};

/**
 * @brief Expected throughput of a source/destination pair
 */
struct speed_estimate {
    double expected_mbps = 0.0;
    std::string scenario;
    std::string bottleneck;
};

/**
 * @brief Deterministic classifier over a drive-table snapshot
 *
 * @code
 * path_classifier classifier(drive_table::from_system());
 * auto params = classifier.get_optimized_parameters("/local/a", "\\\\server\\share\\b");
 * // params.network_optimized == true, params.threads == 16
 * @endcode
 */
class path_classifier {
public:
    path_classifier() = default;
    explicit path_classifier(drive_table table);

    /**
     * @brief UNC prefix (\\\\ or //), or a drive letter found in the table
     */
    [[nodiscard]] auto is_network(std::string_view path) const -> bool;

    [[nodiscard]] auto get_optimized_parameters(std::string_view source,
                                                std::string_view destination) const
        -> optimized_parameters;

    /**
     * @brief Server/share or drive letter of a remote path
     * @return std::nullopt for local paths
     */
    [[nodiscard]] auto get_network_info(std::string_view path) const
        -> std::optional<network_info>;

    [[nodiscard]] auto estimate_speed(std::string_view source,
                                      std::string_view destination) const -> speed_estimate;

    /**
     * @brief Check that @p path exists and is readable
     * @return error_code::path_not_found or error_code::path_not_readable on failure
     */
    [[nodiscard]] static auto validate_path_access(const std::string& path) -> result<void>;

    [[nodiscard]] auto table() const -> const drive_table& { return table_; }

private:
    drive_table table_;
};

/**
 * @brief Copy the recommendation into a request
 *
 * Sets network_optimized, thread_count and the retry policy.
 */
void apply_parameters(transfer_request& request, const optimized_parameters& params);

}  // namespace kcenon::ultracopy

#endif  // KCENON_ULTRACOPY_NETWORK_PATH_CLASSIFIER_H

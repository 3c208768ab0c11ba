/**
 * @file device_automation.h
 * @brief Breadcrumb-addressed device automation interface
 *
 * Portable devices (phones, cameras, tablets) expose their storage only
 * through a shell-automation layer; the bulk-copy utility cannot address
 * them. Items on such a device are identified by a breadcrumb: the list of
 * folder names from the device root. Opaque handles returned by the
 * automation layer cannot be reopened, so every call re-resolves the
 * breadcrumb from the root.
 */

#ifndef KCENON_ULTRACOPY_DEVICE_DEVICE_AUTOMATION_H
#define KCENON_ULTRACOPY_DEVICE_DEVICE_AUTOMATION_H

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "kcenon/ultracopy/core/types.h"

namespace kcenon::ultracopy {

/**
 * @brief Folder names from the device root
 */
using breadcrumb = std::vector<std::string>;

/**
 * @brief One entry of a device folder listing
 */
struct device_item {
    std::string name;
    bool is_folder = false;
    uint64_t size = 0;           ///< Bytes for files, child count for folders when known
    breadcrumb location;         ///< Breadcrumb of the item itself
};

/**
 * @brief Device automation collaborator
 *
 * Implementations talk to the actual device layer. All methods may block;
 * callers apply their own time ceilings.
 */
class device_automation {
public:
    virtual ~device_automation() = default;

    /**
     * @brief Name the device is known by ("Galaxy S21")
     */
    [[nodiscard]] virtual auto device_name() const -> std::string = 0;

    /**
     * @brief List the folder at @p location
     * @return error_code::device_path_not_found when a breadcrumb element
     *         does not exist, error_code::device_enumeration_failed otherwise
     */
    [[nodiscard]] virtual auto list_children(const breadcrumb& location)
        -> result<std::vector<device_item>> = 0;

    /**
     * @brief Copy the item at @p location (file or folder tree) into @p dest_dir
     *
     * The item keeps its name: a folder "DCIM" lands in dest_dir/DCIM.
     */
    [[nodiscard]] virtual auto copy_out(const breadcrumb& location,
                                        const std::filesystem::path& dest_dir)
        -> result<void> = 0;

    /**
     * @brief Copy one local file into the device folder at @p location
     *
     * Missing folders along @p location are created.
     */
    [[nodiscard]] virtual auto copy_in(const std::filesystem::path& source_file,
                                       const breadcrumb& location) -> result<void> = 0;
};

/**
 * @brief A device path split into device name and breadcrumb
 */
struct device_path {
    std::string device;
    breadcrumb location;
};

/**
 * @brief Check whether @p path needs the staged protocol
 *
 * True for shell-namespace and portable-device forms ("wpd://",
 * "mtp://", "::{", "USB\VID_", the MyComputer and portable-device GUIDs)
 * and for "Computer\<device>\..." display paths.
 */
[[nodiscard]] auto is_staged_device_path(std::string_view path) -> bool;

/**
 * @brief Split "Computer\Device\a\b" or "mtp://Device/a/b"
 * @return std::nullopt for any other form
 */
[[nodiscard]] auto parse_device_path(std::string_view path) -> std::optional<device_path>;

/**
 * @brief Display form of a breadcrumb ("Internal storage\DCIM\Camera")
 */
[[nodiscard]] auto to_display_path(const breadcrumb& location,
                                   std::string_view root_label = "Internal storage")
    -> std::string;

}  // namespace kcenon::ultracopy

#endif  // KCENON_ULTRACOPY_DEVICE_DEVICE_AUTOMATION_H

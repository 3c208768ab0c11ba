/**
 * @file mounted_device.h
 * @brief Device automation over a mounted device tree
 */

#ifndef KCENON_ULTRACOPY_DEVICE_MOUNTED_DEVICE_H
#define KCENON_ULTRACOPY_DEVICE_MOUNTED_DEVICE_H

#include <filesystem>
#include <string>

#include "kcenon/ultracopy/device/device_automation.h"

namespace kcenon::ultracopy {

/**
 * @brief device_automation backed by a mount point
 *
 * Works with FUSE-style device mounts (gvfs, jmtpfs) where the device
 * storage appears as a directory tree. Each call walks the breadcrumb from
 * the mount root by name, the same way a shell-automation layer is driven.
 * Breadcrumb elements that are empty, "." or "..", or that contain a path
 * separator, are rejected.
 */
class mounted_device : public device_automation {
public:
    mounted_device(std::string name, std::filesystem::path mount_root);

    [[nodiscard]] auto device_name() const -> std::string override;

    [[nodiscard]] auto list_children(const breadcrumb& location)
        -> result<std::vector<device_item>> override;

    [[nodiscard]] auto copy_out(const breadcrumb& location,
                                const std::filesystem::path& dest_dir)
        -> result<void> override;

    [[nodiscard]] auto copy_in(const std::filesystem::path& source_file,
                               const breadcrumb& location) -> result<void> override;

    [[nodiscard]] auto mount_root() const -> const std::filesystem::path& { return root_; }

private:
    /**
     * @brief Walk @p location from the root, matching names entry by entry
     */
    [[nodiscard]] auto resolve(const breadcrumb& location) const
        -> result<std::filesystem::path>;

    std::string name_;
    std::filesystem::path root_;
};

}  // namespace kcenon::ultracopy

#endif  // KCENON_ULTRACOPY_DEVICE_MOUNTED_DEVICE_H

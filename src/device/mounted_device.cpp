/**
 * @file mounted_device.cpp
 * @brief Mounted device tree implementation
 */

#include "kcenon/ultracopy/device/mounted_device.h"

#include "kcenon/ultracopy/core/logging.h"

#include <algorithm>
#include <system_error>

namespace kcenon::ultracopy {

namespace fs = std::filesystem;

namespace {

auto is_valid_element(const std::string& name) -> bool {
    return !name.empty() && name != "." && name != ".." &&
           name.find_first_of("/\\") == std::string::npos;
}

auto find_entry(const fs::path& dir, const std::string& name) -> std::optional<fs::path> {
    std::error_code ec;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        if (it->path().filename().string() == name) {
            return it->path();
        }
    }
    return std::nullopt;
}

}  // namespace

mounted_device::mounted_device(std::string name, fs::path mount_root)
    : name_(std::move(name)), root_(std::move(mount_root)) {}

auto mounted_device::device_name() const -> std::string {
    return name_;
}

auto mounted_device::resolve(const breadcrumb& location) const -> result<fs::path> {
    std::error_code ec;
    if (!fs::is_directory(root_, ec)) {
        return unexpected(error(error_code::device_enumeration_failed,
                                "Device root not accessible: " + root_.string()));
    }

    fs::path current = root_;
    for (const auto& element : location) {
        if (!is_valid_element(element)) {
            return unexpected(error(error_code::device_path_not_found,
                                    "Invalid breadcrumb element: '" + element + "'"));
        }
        auto next = find_entry(current, element);
        if (!next) {
            return unexpected(error(error_code::device_path_not_found,
                                    "Folder not found: " + element));
        }
        current = std::move(*next);
    }
    return current;
}

auto mounted_device::list_children(const breadcrumb& location)
    -> result<std::vector<device_item>> {
    auto resolved = resolve(location);
    if (!resolved) {
        return unexpected(resolved.error());
    }

    std::error_code ec;
    if (!fs::is_directory(resolved.value(), ec)) {
        return unexpected(error(error_code::device_enumeration_failed,
                                "Not a folder: " + to_display_path(location)));
    }

    std::vector<device_item> items;
    for (fs::directory_iterator it(resolved.value(), ec), end; !ec && it != end;
         it.increment(ec)) {
        device_item item;
        item.name = it->path().filename().string();
        std::error_code type_ec;
        item.is_folder = it->is_directory(type_ec);
        if (item.is_folder) {
            std::error_code count_ec;
            item.size = static_cast<uint64_t>(std::distance(
                fs::directory_iterator(it->path(), count_ec), fs::directory_iterator{}));
        } else {
            std::error_code size_ec;
            auto size = it->file_size(size_ec);
            item.size = size_ec ? 0 : static_cast<uint64_t>(size);
        }
        item.location = location;
        item.location.push_back(item.name);
        items.push_back(std::move(item));
    }

    if (ec) {
        return unexpected(error(error_code::device_enumeration_failed,
                                "Listing failed: " + ec.message()));
    }

    std::sort(items.begin(), items.end(),
              [](const device_item& a, const device_item& b) { return a.name < b.name; });
    return items;
}

auto mounted_device::copy_out(const breadcrumb& location, const fs::path& dest_dir)
    -> result<void> {
    if (location.empty()) {
        return unexpected(error(error_code::device_copy_out_failed,
                                "Cannot copy the device root as one item"));
    }

    auto resolved = resolve(location);
    if (!resolved) {
        return unexpected(resolved.error());
    }

    std::error_code ec;
    fs::create_directories(dest_dir, ec);
    if (ec) {
        return unexpected(error(error_code::device_copy_out_failed,
                                "Cannot create " + dest_dir.string() + ": " + ec.message()));
    }

    const auto target = dest_dir / resolved.value().filename();
    fs::copy(resolved.value(), target,
             fs::copy_options::recursive | fs::copy_options::overwrite_existing, ec);
    if (ec) {
        return unexpected(error(error_code::device_copy_out_failed,
                                "Copy of " + to_display_path(location) + " failed: " +
                                ec.message()));
    }

    UC_LOG_DEBUG(log_category::device, "Copied out " + to_display_path(location));
    return {};
}

auto mounted_device::copy_in(const fs::path& source_file, const breadcrumb& location)
    -> result<void> {
    std::error_code ec;
    if (!fs::is_regular_file(source_file, ec)) {
        return unexpected(error(error_code::item_copy_failed,
                                "Not a regular file: " + source_file.string()));
    }

    if (!fs::is_directory(root_, ec)) {
        return unexpected(error(error_code::item_copy_failed,
                                "Device root not accessible: " + root_.string()));
    }

    fs::path folder = root_;
    for (const auto& element : location) {
        if (!is_valid_element(element)) {
            return unexpected(error(error_code::item_copy_failed,
                                    "Invalid breadcrumb element: '" + element + "'"));
        }
        if (auto existing = find_entry(folder, element)) {
            folder = std::move(*existing);
            continue;
        }
        folder /= element;
        fs::create_directory(folder, ec);
        if (ec) {
            return unexpected(error(error_code::item_copy_failed,
                                    "Cannot create folder " + element + ": " + ec.message()));
        }
    }

    fs::copy_file(source_file, folder / source_file.filename(),
                  fs::copy_options::overwrite_existing, ec);
    if (ec) {
        return unexpected(error(error_code::item_copy_failed,
                                "Copy of " + source_file.filename().string() + " failed: " +
                                ec.message()));
    }
    return {};
}

}  // namespace kcenon::ultracopy

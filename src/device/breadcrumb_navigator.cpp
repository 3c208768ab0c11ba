/**
 * @file breadcrumb_navigator.cpp
 * @brief Breadcrumb navigation implementation
 */

#include "kcenon/ultracopy/device/breadcrumb_navigator.h"

#include "kcenon/ultracopy/core/logging.h"

namespace kcenon::ultracopy {

breadcrumb_navigator::breadcrumb_navigator(std::shared_ptr<device_automation> device,
                                           std::string root_label)
    : device_(std::move(device)), root_label_(std::move(root_label)) {}

auto breadcrumb_navigator::list_at(const breadcrumb& location)
    -> result<std::vector<device_item>> {
    if (!device_) {
        return unexpected(error(error_code::device_not_configured));
    }

    auto items = device_->list_children(location);
    if (!items) {
        UC_LOG_WARN(log_category::device,
                    "Failed to list " + to_display_path(location, root_label_) + ": " +
                    items.error().message);
        return items;
    }

    UC_LOG_DEBUG(log_category::device,
                 "Listed " + std::to_string(items.value().size()) + " items in " +
                 to_display_path(location, root_label_));
    return items;
}

auto breadcrumb_navigator::navigate_to_root() -> result<std::vector<device_item>> {
    return navigate_to_path({});
}

auto breadcrumb_navigator::navigate_into(const std::string& folder_name)
    -> result<std::vector<device_item>> {
    auto target = current_;
    target.push_back(folder_name);
    return navigate_to_path(target);
}

auto breadcrumb_navigator::navigate_up() -> result<std::vector<device_item>> {
    auto target = current_;
    if (!target.empty()) {
        target.pop_back();
    }
    return navigate_to_path(target);
}

auto breadcrumb_navigator::navigate_to_path(const breadcrumb& location)
    -> result<std::vector<device_item>> {
    auto items = list_at(location);
    if (items) {
        current_ = location;
    }
    return items;
}

auto breadcrumb_navigator::list_current() -> result<std::vector<device_item>> {
    return list_at(current_);
}

auto breadcrumb_navigator::current_path() const -> std::string {
    return to_display_path(current_, root_label_);
}

auto breadcrumb_navigator::copy_path() const -> std::string {
    std::string path = "Computer\\";
    path += device_ ? device_->device_name() : std::string();
    for (const auto& name : current_) {
        path += '\\';
        path += name;
    }
    return path;
}

}  // namespace kcenon::ultracopy

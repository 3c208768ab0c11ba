/**
 * @file breadcrumb_navigator.h
 * @brief Name-based navigation over a device automation collaborator
 */

#ifndef KCENON_ULTRACOPY_DEVICE_BREADCRUMB_NAVIGATOR_H
#define KCENON_ULTRACOPY_DEVICE_BREADCRUMB_NAVIGATOR_H

#include <memory>
#include <string>
#include <vector>

#include "kcenon/ultracopy/device/device_automation.h"

namespace kcenon::ultracopy {

/**
 * @brief Tracks a breadcrumb and lists folders by walking from the root
 *
 * Every listing re-resolves the full breadcrumb through the collaborator.
 * A failed navigation leaves the breadcrumb where it was.
 *
 * @code
 * breadcrumb_navigator nav(device);
 * auto root = nav.navigate_to_root();
 * auto dcim = nav.navigate_into("DCIM");
 * // nav.current_path() == "Internal storage\\DCIM"
 * @endcode
 */
class breadcrumb_navigator {
public:
    explicit breadcrumb_navigator(std::shared_ptr<device_automation> device,
                                  std::string root_label = "Internal storage");

    auto navigate_to_root() -> result<std::vector<device_item>>;
    auto navigate_into(const std::string& folder_name) -> result<std::vector<device_item>>;

    /**
     * @brief Move one level up; a no-op at the root
     */
    auto navigate_up() -> result<std::vector<device_item>>;

    auto navigate_to_path(const breadcrumb& location) -> result<std::vector<device_item>>;

    /**
     * @brief List the current folder without moving
     */
    auto list_current() -> result<std::vector<device_item>>;

    [[nodiscard]] auto current() const -> const breadcrumb& { return current_; }

    /**
     * @brief Display path ("Internal storage\a\b")
     */
    [[nodiscard]] auto current_path() const -> std::string;

    /**
     * @brief Path accepted by parse_device_path ("Computer\Device\a\b")
     */
    [[nodiscard]] auto copy_path() const -> std::string;

private:
    auto list_at(const breadcrumb& location) -> result<std::vector<device_item>>;

    std::shared_ptr<device_automation> device_;
    std::string root_label_;
    breadcrumb current_;
};

}  // namespace kcenon::ultracopy

#endif  // KCENON_ULTRACOPY_DEVICE_BREADCRUMB_NAVIGATOR_H

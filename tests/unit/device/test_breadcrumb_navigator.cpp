/**
 * @file test_breadcrumb_navigator.cpp
 * @brief Unit tests for name-based device navigation
 */

#include <gtest/gtest.h>

#include <kcenon/ultracopy/device/breadcrumb_navigator.h>

#include "unit/device/fake_device.h"

namespace kcenon::ultracopy::test {

class BreadcrumbNavigatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        device_ = std::make_shared<fake_device>("Pixel 7");
        device_->add_folder({"DCIM"});
        device_->add_folder({"DCIM", "Camera"});
        device_->add_file({"DCIM", "Camera"}, "IMG_0001.jpg", 2048);
        device_->add_file({}, "notes.txt", 10);
    }

    std::shared_ptr<fake_device> device_;
};

TEST_F(BreadcrumbNavigatorTest, StartsAtRoot) {
    breadcrumb_navigator nav(device_);

    EXPECT_TRUE(nav.current().empty());
    EXPECT_EQ(nav.current_path(), "Internal storage");
    EXPECT_EQ(nav.copy_path(), "Computer\\Pixel 7");
}

TEST_F(BreadcrumbNavigatorTest, NavigateIntoFolders) {
    breadcrumb_navigator nav(device_);

    auto root = nav.navigate_to_root();
    ASSERT_TRUE(root.has_value());
    EXPECT_EQ(root.value().size(), 2u);

    auto dcim = nav.navigate_into("DCIM");
    ASSERT_TRUE(dcim.has_value());
    ASSERT_EQ(dcim.value().size(), 1u);
    EXPECT_EQ(dcim.value()[0].name, "Camera");
    EXPECT_TRUE(dcim.value()[0].is_folder);

    auto camera = nav.navigate_into("Camera");
    ASSERT_TRUE(camera.has_value());
    EXPECT_EQ(camera.value()[0].location, (breadcrumb{"DCIM", "Camera", "IMG_0001.jpg"}));

    EXPECT_EQ(nav.current(), (breadcrumb{"DCIM", "Camera"}));
    EXPECT_EQ(nav.current_path(), "Internal storage\\DCIM\\Camera");
    EXPECT_EQ(nav.copy_path(), "Computer\\Pixel 7\\DCIM\\Camera");
}

TEST_F(BreadcrumbNavigatorTest, EveryListingResolvesFromRoot) {
    breadcrumb_navigator nav(device_);
    ASSERT_TRUE(nav.navigate_into("DCIM").has_value());
    ASSERT_TRUE(nav.navigate_into("Camera").has_value());
    ASSERT_TRUE(nav.list_current().has_value());

    auto listed = device_->listed_locations();
    ASSERT_EQ(listed.size(), 3u);
    EXPECT_EQ(listed[0], (breadcrumb{"DCIM"}));
    EXPECT_EQ(listed[1], (breadcrumb{"DCIM", "Camera"}));
    EXPECT_EQ(listed[2], (breadcrumb{"DCIM", "Camera"}));
}

TEST_F(BreadcrumbNavigatorTest, FailedNavigationKeepsPosition) {
    breadcrumb_navigator nav(device_);
    ASSERT_TRUE(nav.navigate_into("DCIM").has_value());

    auto missing = nav.navigate_into("Screenshots");

    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().code, error_code::device_path_not_found);
    EXPECT_EQ(nav.current(), (breadcrumb{"DCIM"}));
}

TEST_F(BreadcrumbNavigatorTest, NavigateUp) {
    breadcrumb_navigator nav(device_);
    ASSERT_TRUE(nav.navigate_to_path({"DCIM", "Camera"}).has_value());

    ASSERT_TRUE(nav.navigate_up().has_value());
    EXPECT_EQ(nav.current(), (breadcrumb{"DCIM"}));

    ASSERT_TRUE(nav.navigate_up().has_value());
    EXPECT_TRUE(nav.current().empty());

    // No-op at the root
    ASSERT_TRUE(nav.navigate_up().has_value());
    EXPECT_TRUE(nav.current().empty());
}

TEST_F(BreadcrumbNavigatorTest, CustomRootLabel) {
    breadcrumb_navigator nav(device_, "Phone");
    ASSERT_TRUE(nav.navigate_into("DCIM").has_value());

    EXPECT_EQ(nav.current_path(), "Phone\\DCIM");
}

TEST_F(BreadcrumbNavigatorTest, MissingDeviceIsReported) {
    breadcrumb_navigator nav(nullptr);

    auto root = nav.navigate_to_root();

    ASSERT_FALSE(root.has_value());
    EXPECT_EQ(root.error().code, error_code::device_not_configured);
    EXPECT_EQ(nav.copy_path(), "Computer\\");
}

}  // namespace kcenon::ultracopy::test

/**
 * @file test_device_path.cpp
 * @brief Unit tests for device path detection and parsing
 */

#include <gtest/gtest.h>

#include <kcenon/ultracopy/device/device_automation.h>

namespace kcenon::ultracopy::test {

class DevicePathTest : public ::testing::Test {};

TEST_F(DevicePathTest, ShellNamespaceFormsAreStaged) {
    EXPECT_TRUE(is_staged_device_path("wpd://Pixel 7/Internal storage/DCIM"));
    EXPECT_TRUE(is_staged_device_path("mtp://Galaxy/Phone/Download"));
    EXPECT_TRUE(is_staged_device_path("::{20D04FE0-3AEA-1069-A2D8-08002B30309D}\\Phone"));
    EXPECT_TRUE(is_staged_device_path("\\\\?\\USB\\VID_04E8&PID_6860\\R58M"));
    EXPECT_TRUE(is_staged_device_path(
        "shell:::{35786D3C-B075-49b9-88DD-029876E11C01}\\6ac27878-a6fa-4155-ba85-f98f491d4f33"));
}

TEST_F(DevicePathTest, ComputerDisplayPathIsStaged) {
    EXPECT_TRUE(is_staged_device_path("Computer\\Pixel 7\\Internal storage\\DCIM"));
    EXPECT_TRUE(is_staged_device_path("computer\\Camera\\Card"));
}

TEST_F(DevicePathTest, FilesystemPathsAreNotStaged) {
    EXPECT_FALSE(is_staged_device_path(""));
    EXPECT_FALSE(is_staged_device_path("C:\\Users\\me\\Pictures"));
    EXPECT_FALSE(is_staged_device_path("\\\\nas\\share\\photos"));
    EXPECT_FALSE(is_staged_device_path("/home/me/Computer/notes"));
}

TEST_F(DevicePathTest, ParseComputerPath) {
    auto parsed = parse_device_path("Computer\\Pixel 7\\Internal storage\\DCIM\\Camera");

    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->device, "Pixel 7");
    EXPECT_EQ(parsed->location, (breadcrumb{"Internal storage", "DCIM", "Camera"}));
}

TEST_F(DevicePathTest, ParseMtpUrl) {
    auto parsed = parse_device_path("mtp://Galaxy S21/Phone/Download/");

    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->device, "Galaxy S21");
    EXPECT_EQ(parsed->location, (breadcrumb{"Phone", "Download"}));
}

TEST_F(DevicePathTest, ParseDeviceRoot) {
    auto parsed = parse_device_path("Computer\\Camera");

    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->device, "Camera");
    EXPECT_TRUE(parsed->location.empty());
}

TEST_F(DevicePathTest, ParseRejectsOtherForms) {
    EXPECT_FALSE(parse_device_path("Computer\\").has_value());
    EXPECT_FALSE(parse_device_path("wpd://Pixel/DCIM").has_value());
    EXPECT_FALSE(parse_device_path("C:\\Users").has_value());
}

TEST_F(DevicePathTest, DisplayPath) {
    EXPECT_EQ(to_display_path({}), "Internal storage");
    EXPECT_EQ(to_display_path({"DCIM", "Camera"}), "Internal storage\\DCIM\\Camera");
    EXPECT_EQ(to_display_path({"Music"}, "SD card"), "SD card\\Music");
}

}  // namespace kcenon::ultracopy::test

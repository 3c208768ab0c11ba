/**
 * @file test_path_classifier.cpp
 * @brief Unit tests for local/remote path classification
 */

#include <gtest/gtest.h>

#include <kcenon/ultracopy/network/path_classifier.h>

#include <filesystem>
#include <fstream>

namespace kcenon::ultracopy::test {

class PathClassifierTest : public ::testing::Test {
protected:
    void SetUp() override {
        drive_table table;
        table.mapped.emplace('Z', "\\\\fileserver\\archive");
        classifier_ = path_classifier(table);
    }

    path_classifier classifier_;
};

// =============================================================================
// is_network
// =============================================================================

TEST_F(PathClassifierTest, UncPathsAreNetwork) {
    EXPECT_TRUE(classifier_.is_network("\\\\server\\share\\dir"));
    EXPECT_TRUE(classifier_.is_network("//server/share/dir"));
}

TEST_F(PathClassifierTest, MappedDriveIsNetwork) {
    EXPECT_TRUE(classifier_.is_network("Z:\\backups"));
    EXPECT_TRUE(classifier_.is_network("z:/backups"));
}

TEST_F(PathClassifierTest, LocalPathsAreNotNetwork) {
    EXPECT_FALSE(classifier_.is_network("C:\\Users\\me"));
    EXPECT_FALSE(classifier_.is_network("/home/me/data"));
    EXPECT_FALSE(classifier_.is_network("relative\\dir"));
    EXPECT_FALSE(classifier_.is_network(""));
    EXPECT_FALSE(classifier_.is_network("\\single\\slash"));
}

TEST_F(PathClassifierTest, EmptyTableKnowsOnlyUnc) {
    path_classifier bare;

    EXPECT_FALSE(bare.is_network("Z:\\backups"));
    EXPECT_TRUE(bare.is_network("\\\\nas\\share"));
    EXPECT_TRUE(bare.table().mapped.empty());
}

// =============================================================================
// get_optimized_parameters
// =============================================================================

TEST_F(PathClassifierTest, LocalToUncRecommendsNetworkSettings) {
    auto params = classifier_.get_optimized_parameters("C:\\Projects", "\\\\nas\\backup");

    EXPECT_TRUE(params.network_optimized);
    EXPECT_EQ(params.threads, 16u);
    EXPECT_EQ(params.retry_count, 5u);
    EXPECT_EQ(params.retry_wait.count(), 10);
    EXPECT_TRUE(params.use_restartable);
    EXPECT_TRUE(params.use_backup_mode);
    ASSERT_EQ(params.reasons.size(), 1u);
    EXPECT_EQ(params.reasons[0], "Destination is network path");
}

TEST_F(PathClassifierTest, BothRemoteGivesTwoReasons) {
    auto params = classifier_.get_optimized_parameters("Z:\\in", "//nas/out");

    EXPECT_TRUE(params.network_optimized);
    EXPECT_EQ(params.reasons.size(), 2u);
}

TEST_F(PathClassifierTest, LocalToLocalRecommendsHighParallelism) {
    auto params = classifier_.get_optimized_parameters("C:\\a", "D:\\b");

    EXPECT_FALSE(params.network_optimized);
    EXPECT_EQ(params.threads, 32u);
    EXPECT_EQ(params.retry_count, 1u);
    EXPECT_EQ(params.retry_wait.count(), 3);
    EXPECT_FALSE(params.use_restartable);
    EXPECT_FALSE(params.use_backup_mode);
}

TEST_F(PathClassifierTest, ApplyParametersUpdatesRequest) {
    transfer_request request;
    request.source = "C:\\Projects";
    request.destination = "\\\\nas\\backup";

    apply_parameters(request, classifier_.get_optimized_parameters(request.source,
                                                                   request.destination));

    EXPECT_TRUE(request.network_optimized);
    EXPECT_EQ(request.thread_count, 16u);
    ASSERT_TRUE(request.retry.has_value());
    EXPECT_EQ(request.retry->retry_count, 5u);
    EXPECT_EQ(request.retry->retry_wait.count(), 10);
}

// =============================================================================
// get_network_info / estimate_speed
// =============================================================================

TEST_F(PathClassifierTest, UncNetworkInfo) {
    auto info = classifier_.get_network_info("\\\\fileserver\\projects\\2024");

    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->type, network_path_type::unc);
    EXPECT_EQ(info->server.value_or(""), "fileserver");
    EXPECT_EQ(info->share.value_or(""), "projects");
    EXPECT_FALSE(info->drive.has_value());
}

TEST_F(PathClassifierTest, UncServerOnly) {
    auto info = classifier_.get_network_info("\\\\fileserver");

    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->server.value_or(""), "fileserver");
    EXPECT_FALSE(info->share.has_value());
}

TEST_F(PathClassifierTest, MappedDriveNetworkInfo) {
    auto info = classifier_.get_network_info("z:\\data");

    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->type, network_path_type::mapped_drive);
    EXPECT_EQ(info->drive.value_or('?'), 'Z');
    EXPECT_STREQ(to_string(info->type), "mapped_drive");
}

TEST_F(PathClassifierTest, LocalPathHasNoNetworkInfo) {
    EXPECT_FALSE(classifier_.get_network_info("C:\\data").has_value());
}

TEST_F(PathClassifierTest, SpeedEstimates) {
    auto local = classifier_.estimate_speed("C:\\a", "D:\\b");
    EXPECT_DOUBLE_EQ(local.expected_mbps, 500.0);
    EXPECT_EQ(local.scenario, "Local to Local");
    EXPECT_EQ(local.bottleneck, "Disk I/O speed");

    auto upload = classifier_.estimate_speed("C:\\a", "\\\\nas\\b");
    EXPECT_DOUBLE_EQ(upload.expected_mbps, 100.0);
    EXPECT_EQ(upload.scenario, "Local to Network");

    auto download = classifier_.estimate_speed("Z:\\a", "C:\\b");
    EXPECT_EQ(download.scenario, "Network to Local");
    EXPECT_EQ(download.bottleneck, "Network bandwidth");

    EXPECT_EQ(classifier_.estimate_speed("Z:\\a", "\\\\nas\\b").scenario, "Network to Network");
}

// =============================================================================
// validate_path_access
// =============================================================================

class PathAccessTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path() / "ultracopy_path_access_test";
        std::filesystem::create_directories(dir_);
        std::ofstream(dir_ / "readable.txt") << "data";
    }

    void TearDown() override {
        std::filesystem::remove_all(dir_);
    }

    std::filesystem::path dir_;
};

TEST_F(PathAccessTest, ExistingPathsAreAccepted) {
    EXPECT_TRUE(path_classifier::validate_path_access(dir_.string()).has_value());
    EXPECT_TRUE(path_classifier::validate_path_access((dir_ / "readable.txt").string()).has_value());
}

TEST_F(PathAccessTest, MissingPathIsNotFound) {
    auto result = path_classifier::validate_path_access((dir_ / "missing").string());

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::path_not_found);
}

TEST_F(PathAccessTest, EmptyPathIsNotFound) {
    auto result = path_classifier::validate_path_access("");

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::path_not_found);
}

}  // namespace kcenon::ultracopy::test

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <stdexcept>

#include "Server/ServerConfig.hpp"
#include "tbb_manager.hpp"

class ServerConfigTest : public ::testing::Test {
 protected:
  void SetUp() override {
    root_ = std::filesystem::temp_directory_path() /
            ("server_config_test_" +
             std::string(::testing::UnitTest::GetInstance()
                             ->current_test_info()
                             ->name()));
    std::filesystem::remove_all(root_);
    config_.service.downloadRoot = root_ / "downloads";
  }

  void TearDown() override {
    FLAGS_custom_tbb_parallel_control = "";
    std::error_code ec;
    std::filesystem::remove_all(root_, ec);
  }

  std::filesystem::path root_;
  ServerConfig config_;
};

TEST_F(ServerConfigTest, DefaultsAreValidAndCreateRoot) {
  EXPECT_NO_THROW(config_.validate());
  EXPECT_TRUE(std::filesystem::is_directory(config_.service.downloadRoot));
  EXPECT_EQ(config_.port, 8080);
  EXPECT_FALSE(config_.parsedCredentials().enabled());
}

TEST_F(ServerConfigTest, RejectsBadPort) {
  config_.port = 0;
  EXPECT_THROW(config_.validate(), std::invalid_argument);
  config_.port = 70000;
  EXPECT_THROW(config_.validate(), std::invalid_argument);
}

TEST_F(ServerConfigTest, RejectsBadListenAddress) {
  config_.listenAddress = "not-an-ip";
  EXPECT_THROW(config_.validate(), std::invalid_argument);
  config_.listenAddress = "::1";
  EXPECT_NO_THROW(config_.validate());
}

TEST_F(ServerConfigTest, RejectsZeroChunkAndThreads) {
  config_.service.chunkSize = 0;
  EXPECT_THROW(config_.validate(), std::invalid_argument);
  config_.service.chunkSize = 1;
  config_.httpThreads = 0;
  EXPECT_THROW(config_.validate(), std::invalid_argument);
}

TEST_F(ServerConfigTest, RejectsNegativeStatusInterval) {
  config_.statusInterval = std::chrono::milliseconds(-1);
  EXPECT_THROW(config_.validate(), std::invalid_argument);
}

TEST_F(ServerConfigTest, RejectsDownloadRootThatIsAFile) {
  std::filesystem::create_directories(root_);
  config_.service.downloadRoot = root_ / "file";
  { std::ofstream(config_.service.downloadRoot) << "x"; }
  EXPECT_THROW(config_.validate(), std::invalid_argument);
  config_.service.downloadRoot.clear();
  EXPECT_THROW(config_.validate(), std::invalid_argument);
}

TEST_F(ServerConfigTest, RejectsMalformedCredentials) {
  config_.credentials = "admin";
  EXPECT_THROW(config_.validate(), std::invalid_argument);
  config_.credentials = "admin:secret,guest:";
  EXPECT_NO_THROW(config_.validate());
  EXPECT_EQ(config_.parsedCredentials().size(), 2u);
}

TEST_F(ServerConfigTest, RejectsMalformedArenaControl) {
  FLAGS_custom_tbb_parallel_control = "resolve:x";
  EXPECT_ANY_THROW(config_.validate());
  FLAGS_custom_tbb_parallel_control = "resolve:4";
  EXPECT_NO_THROW(config_.validate());
}

TEST(ServerConfigExtensionsTest, NormalisesExtensions) {
  auto extensions = ServerConfig::parseExtensions(".mkv, MP4,,avi");
  ASSERT_EQ(extensions.size(), 3u);
  EXPECT_EQ(extensions[0], ".mkv");
  EXPECT_EQ(extensions[1], ".mp4");
  EXPECT_EQ(extensions[2], ".avi");
  EXPECT_TRUE(ServerConfig::parseExtensions("").empty());
}

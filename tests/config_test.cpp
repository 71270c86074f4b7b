#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <limits>

#include "fliprpc/config.hpp"

using fliprpc::Config;
using fliprpc::ConfigManager;

namespace fs = std::filesystem;

namespace {

class ConfigFileTest : public ::testing::Test {
 protected:
  void SetUp() override {
    dir_ = fs::temp_directory_path() /
           ("fliprpc-config-" + std::to_string(::testing::UnitTest::GetInstance()
                                                   ->random_seed()) +
            "-" + ::testing::UnitTest::GetInstance()
                      ->current_test_info()
                      ->name());
    fs::remove_all(dir_);
    fs::create_directories(dir_);
    setenv("XDG_CONFIG_HOME", dir_.c_str(), 1);
  }

  void TearDown() override {
    unsetenv("XDG_CONFIG_HOME");
    fs::remove_all(dir_);
  }

  fs::path dir_;
};

}  // namespace

TEST(ConfigParseTest, ReadsEveryKey) {
  auto config = ConfigManager::parse_config(R"({
    "port": "/dev/ttyACM0",
    "baud": 230400,
    "timeout_ms": 2500,
    "chunk_size": 1024,
    "prefetch_metadata": true,
    "keepalive": false,
    "keepalive_interval_ms": 1000,
    "varint_decode": "slow"
  })");

  ASSERT_TRUE(config.has_value());
  EXPECT_EQ(config->port, "/dev/ttyACM0");
  EXPECT_EQ(config->baud, 230400);
  EXPECT_EQ(config->timeout_ms, 2500);
  EXPECT_EQ(config->chunk_size, 1024u);
  EXPECT_TRUE(config->prefetch_metadata);
  EXPECT_FALSE(config->keepalive);
  EXPECT_EQ(config->keepalive_interval_ms, 1000);
  EXPECT_EQ(config->varint_decode, fliprpc::VarintDecode::Slow);
}

TEST(ConfigParseTest, MissingAndMistypedKeysKeepDefaults) {
  auto config = ConfigManager::parse_config(
      R"({"port": 5, "chunk_size": 0, "keepalive": "yes"})");

  ASSERT_TRUE(config.has_value());
  EXPECT_EQ(config->port, "");
  EXPECT_EQ(config->baud, fliprpc::DEFAULT_BAUD);
  EXPECT_EQ(config->chunk_size, fliprpc::DEFAULT_CHUNK_SIZE);
  EXPECT_TRUE(config->keepalive);
  EXPECT_EQ(config->timeout_ms, 10000);
  EXPECT_EQ(config->keepalive_interval_ms, 5000);
  EXPECT_EQ(config->varint_decode, fliprpc::VarintDecode::Fast);
}

TEST(ConfigParseTest, HugeNumbersSaturate) {
  auto config = ConfigManager::parse_config(
      R"({"chunk_size": 1e12, "timeout_ms": 4294967296, "baud": 1e300})");

  ASSERT_TRUE(config.has_value());
  EXPECT_EQ(config->chunk_size,
            static_cast<size_t>(std::numeric_limits<int>::max()));
  EXPECT_EQ(config->timeout_ms, std::numeric_limits<int>::max());
  EXPECT_EQ(config->baud, std::numeric_limits<int>::max());
}

TEST(ConfigParseTest, ZeroDurationsKeepDefaults) {
  auto config = ConfigManager::parse_config(
      R"({"timeout_ms": 0, "keepalive_interval_ms": 0, "baud": 0})");

  ASSERT_TRUE(config.has_value());
  EXPECT_EQ(config->timeout_ms, 10000);
  EXPECT_EQ(config->keepalive_interval_ms, 5000);
  EXPECT_EQ(config->baud, fliprpc::DEFAULT_BAUD);

  auto options = ConfigManager::to_session_options(*config);
  EXPECT_GT(options.timeout.count(), 0);
  EXPECT_GT(options.keepalive_interval.count(), 0);
}

TEST(ConfigParseTest, RejectsMalformedJson) {
  EXPECT_FALSE(ConfigManager::parse_config("{\"port\": ").has_value());
  EXPECT_FALSE(ConfigManager::parse_config("[1, 2]").has_value());
}

TEST(ConfigParseTest, SerializedConfigParsesBack) {
  Config config;
  config.port = "/dev/ttyACM1";
  config.chunk_size = 256;
  config.varint_decode = fliprpc::VarintDecode::Slow;

  auto parsed =
      ConfigManager::parse_config(ConfigManager::serialize_config(config));
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(parsed->port, "/dev/ttyACM1");
  EXPECT_EQ(parsed->chunk_size, 256u);
  EXPECT_EQ(parsed->varint_decode, fliprpc::VarintDecode::Slow);
}

TEST(ConfigParseTest, ConvertsToSessionOptions) {
  Config config;
  config.timeout_ms = 1500;
  config.keepalive_interval_ms = 250;
  config.prefetch_metadata = true;

  auto options = ConfigManager::to_session_options(config, true);
  EXPECT_EQ(options.timeout, std::chrono::milliseconds(1500));
  EXPECT_EQ(options.keepalive_interval, std::chrono::milliseconds(250));
  EXPECT_TRUE(options.prefetch_metadata);
  EXPECT_TRUE(options.keepalive);
  EXPECT_TRUE(options.verbose);
  EXPECT_EQ(options.chunk_size, fliprpc::DEFAULT_CHUNK_SIZE);
}

TEST_F(ConfigFileTest, UsesXdgConfigHome) {
  EXPECT_EQ(ConfigManager::get_config_path(),
            (dir_ / "fliprpc" / "config.json").string());
}

TEST_F(ConfigFileTest, MissingFileGivesDefaults) {
  auto config = ConfigManager::load_config();
  ASSERT_TRUE(config.has_value());
  EXPECT_TRUE(config->port.empty());
}

TEST_F(ConfigFileTest, SaveThenLoad) {
  Config config;
  config.port = "/dev/ttyACM0";
  config.keepalive = false;
  ASSERT_TRUE(ConfigManager::save_config(config));

  auto loaded = ConfigManager::load_config();
  ASSERT_TRUE(loaded.has_value());
  EXPECT_EQ(loaded->port, "/dev/ttyACM0");
  EXPECT_FALSE(loaded->keepalive);
}

TEST_F(ConfigFileTest, BrokenFileIsReported) {
  fs::create_directories(dir_ / "fliprpc");
  std::ofstream(dir_ / "fliprpc" / "config.json") << "not json";

  EXPECT_FALSE(ConfigManager::load_config().has_value());
}

/**
 * @file test_config.cpp
 * @brief Unit tests for configuration
 */

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <webclip/webclip.h>

using namespace webclip;
namespace fs = std::filesystem;

class ConfigTest : public ::testing::Test {
protected:
  fs::path dir;

  void SetUp() override {
    dir = fs::temp_directory_path() /
          ("webclip_config_test_" +
           std::string(::testing::UnitTest::GetInstance()
                           ->current_test_info()
                           ->name()));
    fs::remove_all(dir);
    fs::create_directories(dir);
  }

  void TearDown() override { fs::remove_all(dir); }

  fs::path write_file(const std::string &text) {
    fs::path path = dir / "webclip.conf";
    std::ofstream(path) << text;
    return path;
  }
};

// ============================================================================
// PicklingConfig
// ============================================================================

TEST_F(ConfigTest, Defaults) {
  PicklingConfig config;
  config.load_defaults();

  EXPECT_EQ(config.target_platform, host_target_platform());
  EXPECT_TRUE(config.enable_pickling);
  EXPECT_EQ(config.pickled_only_policy, PickledOnlyPolicy::Hide);
  EXPECT_EQ(config.sanitized_types,
            (std::vector<std::string>{"text/plain", "text/html", "image/png"}));
  EXPECT_EQ(config.max_pickled_formats, 100u);
  EXPECT_EQ(config.max_format_length, 1024u);
  EXPECT_EQ(config.max_payload_size, 0u);
  EXPECT_EQ(config.log_level, "warn");
  EXPECT_TRUE(config.validate().is_ok());
}

TEST_F(ConfigTest, ValidateRejectsBadValues) {
  PicklingConfig config;

  config.max_pickled_formats = 0;
  EXPECT_EQ(config.validate().error().code, ErrorCode::InvalidArgument);
  config.max_pickled_formats = 5;

  config.max_format_length = 2;
  EXPECT_EQ(config.validate().error().code, ErrorCode::InvalidArgument);
  config.max_format_length = 64;

  config.log_level = "loud";
  EXPECT_EQ(config.validate().error().code, ErrorCode::InvalidArgument);
  config.log_level = "debug";

  config.sanitized_types = {"text/custom"};
  EXPECT_EQ(config.validate().error().code, ErrorCode::UnsupportedFormat);
}

TEST_F(ConfigTest, LimitsFollowConfig) {
  PicklingConfig config;
  config.max_pickled_formats = 7;
  config.max_format_length = 50;
  config.max_payload_size = 4096;

  EXPECT_EQ(config.unsanitize_limits().max_formats, 7u);
  EXPECT_EQ(config.unsanitize_limits().max_format_length, 50u);
  EXPECT_EQ(config.write_limits().max_pickled_formats, 7u);
  EXPECT_EQ(config.write_limits().max_payload_size, 4096u);
}

// ============================================================================
// Text Form
// ============================================================================

TEST_F(ConfigTest, ParseSettings) {
  auto result = parse_config("# comment\n"
                             "[pickling]\n"
                             "target_platform = \"windows\"\n"
                             "enable_pickling = false\n"
                             "pickled_only_policy = \"expose\"\n"
                             "sanitized_types = \"text/plain, text/rtf\"\n"
                             "max_pickled_formats = 12\n"
                             "log_level = \"debug\"\n");
  ASSERT_TRUE(result.is_ok()) << result.error().to_string();

  const auto &config = result.value();
  EXPECT_EQ(config.target_platform, TargetPlatform::Windows);
  EXPECT_FALSE(config.enable_pickling);
  EXPECT_EQ(config.pickled_only_policy, PickledOnlyPolicy::Expose);
  EXPECT_EQ(config.sanitized_types,
            (std::vector<std::string>{"text/plain", "text/rtf"}));
  EXPECT_EQ(config.max_pickled_formats, 12u);
  EXPECT_EQ(config.log_level, "debug");
}

TEST_F(ConfigTest, UnknownKeysAreIgnored) {
  auto result = parse_config("favorite_color = blue\nmax_format_length = 256\n");
  ASSERT_TRUE(result.is_ok());
  EXPECT_EQ(result.value().max_format_length, 256u);
}

TEST_F(ConfigTest, ParseErrors) {
  for (const char *text :
       {"enable_pickling = maybe\n", "target_platform = \"amiga\"\n",
        "max_pickled_formats = -1\n", "just some words\n",
        "max_pickled_formats = 0\n", "sanitized_types = \"text/custom\"\n"}) {
    auto result = parse_config(text);
    ASSERT_TRUE(result.is_error()) << text;
    EXPECT_EQ(result.error().code, ErrorCode::ConfigParseError) << text;
  }
}

TEST_F(ConfigTest, FormatParsesBack) {
  PicklingConfig config;
  config.target_platform = TargetPlatform::MacOS;
  config.pickled_only_policy = PickledOnlyPolicy::Expose;
  config.sanitized_types = {"text/html"};
  config.max_payload_size = 1 << 20;

  auto parsed = parse_config(format_config(config));
  ASSERT_TRUE(parsed.is_ok());
  EXPECT_EQ(parsed.value().target_platform, TargetPlatform::MacOS);
  EXPECT_EQ(parsed.value().pickled_only_policy, PickledOnlyPolicy::Expose);
  EXPECT_EQ(parsed.value().sanitized_types,
            (std::vector<std::string>{"text/html"}));
  EXPECT_EQ(parsed.value().max_payload_size, 1u << 20);
}

// ============================================================================
// ConfigManager
// ============================================================================

TEST_F(ConfigTest, ManagerUsesDefaultsWithoutFile) {
  ConfigManager manager;
  ASSERT_TRUE(manager.init(dir / "missing.conf").is_ok());
  EXPECT_TRUE(manager.get().enable_pickling);
  EXPECT_EQ(manager.path(), dir / "missing.conf");

  EXPECT_EQ(manager.init(dir / "missing.conf").error().code,
            ErrorCode::AlreadyInitialized);
}

TEST_F(ConfigTest, ManagerLoadsFile) {
  auto path = write_file("enable_pickling = false\n");

  ConfigManager manager;
  ASSERT_TRUE(manager.init(path).is_ok());
  EXPECT_FALSE(manager.get().enable_pickling);
}

TEST_F(ConfigTest, ManagerReportsBadFile) {
  auto path = write_file("enable_pickling = sometimes\n");

  ConfigManager manager;
  auto result = manager.init(path);
  ASSERT_TRUE(result.is_error());
  EXPECT_EQ(result.error().code, ErrorCode::ConfigParseError);
  EXPECT_EQ(result.error().location, path.string());
}

TEST_F(ConfigTest, ManagerSaveAndReload) {
  fs::path path = dir / "nested" / "webclip.conf";

  ConfigManager manager;
  ASSERT_TRUE(manager.init(path).is_ok());
  ASSERT_TRUE(manager.set_pickled_only_policy(PickledOnlyPolicy::Expose).is_ok());
  ASSERT_TRUE(manager.set_target_platform(TargetPlatform::Android).is_ok());
  EXPECT_TRUE(fs::exists(path));

  ConfigManager reloaded;
  ASSERT_TRUE(reloaded.init(path).is_ok());
  EXPECT_EQ(reloaded.get().pickled_only_policy, PickledOnlyPolicy::Expose);
  EXPECT_EQ(reloaded.get().target_platform, TargetPlatform::Android);
}

TEST_F(ConfigTest, ManagerSetValidates) {
  ConfigManager manager;
  ASSERT_TRUE(manager.init(dir / "webclip.conf").is_ok());

  PicklingConfig bad;
  bad.max_pickled_formats = 0;
  EXPECT_TRUE(manager.set(bad).is_error());
  EXPECT_EQ(manager.get().max_pickled_formats, 100u);

  manager.reset_defaults();
  EXPECT_EQ(manager.get().log_level, "warn");
}

TEST_F(ConfigTest, ManagerLoadKeepsConfigOnError) {
  auto path = write_file("max_pickled_formats = 3\n");

  ConfigManager manager;
  ASSERT_TRUE(manager.init(path).is_ok());

  write_file("max_pickled_formats = three\n");
  EXPECT_TRUE(manager.load().is_error());
  EXPECT_EQ(manager.get().max_pickled_formats, 3u);
}

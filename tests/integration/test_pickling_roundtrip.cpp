/**
 * @file test_pickling_roundtrip.cpp
 * @brief Integration test for write-then-read through the native clipboard
 */

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <thread>
#include <webclip/webclip.h>

using namespace webclip;

class RoundTripTest : public ::testing::Test {
protected:
  std::shared_ptr<MemoryClipboard> native = std::make_shared<MemoryClipboard>();

  PicklingConfig config_for(TargetPlatform platform) {
    PicklingConfig config;
    config.load_defaults();
    config.target_platform = platform;
    return config;
  }
};

// ============================================================================
// Every Platform
// ============================================================================

TEST_F(RoundTripTest, CustomAndStandardTypesOnEveryPlatform) {
  for (TargetPlatform platform : ALL_TARGET_PLATFORMS) {
    SCOPED_TRACE(target_platform_name(platform));

    PicklingClipboard clipboard;
    ASSERT_TRUE(clipboard.init(config_for(platform), native).is_ok());

    ClipboardItem item;
    item.set("text/plain", to_bytes("plain"));
    item.set("image/png", Bytes{0x89, 0x50, 0x4E, 0x47, 0x00, 0xFF});
    item.set("text/custom", to_bytes("custom"));
    item.set("application/x.vendor.data", Bytes{0x00, 0x01, 0x02});
    item.unsanitize = {"text/custom", "application/x.vendor.data"};
    ASSERT_TRUE(clipboard.write({item}, true).is_ok());

    auto result =
        clipboard.read({"application/x.vendor.data", "text/custom"}, true);
    ASSERT_TRUE(result.is_ok());
    ASSERT_EQ(result.value().size(), 1u);

    const auto &read = result.value()[0];
    EXPECT_EQ(read.types(),
              (std::vector<std::string>{"application/x.vendor.data",
                                        "text/custom", "text/plain",
                                        "image/png"}));
    EXPECT_EQ(read.get_type("application/x.vendor.data").value(),
              (Bytes{0x00, 0x01, 0x02}));
    EXPECT_EQ(read.get_type("image/png").value(),
              (Bytes{0x89, 0x50, 0x4E, 0x47, 0x00, 0xFF}));
  }
}

TEST_F(RoundTripTest, PlatformsDoNotShareNamespaces) {
  PicklingClipboard writer;
  ASSERT_TRUE(writer.init(config_for(TargetPlatform::MacOS), native).is_ok());

  ClipboardItem item;
  item.set("text/custom", to_bytes("mac"));
  item.unsanitize = {"text/custom"};
  ASSERT_TRUE(writer.write({item}, true).is_ok());
  EXPECT_EQ(native->contents()[0].format, "com.web.text.custom");

  // A Linux reader sees an unrelated native name
  PicklingClipboard reader;
  ASSERT_TRUE(reader.init(config_for(TargetPlatform::Linux), native).is_ok());
  auto result = reader.read({"text/custom"}, true);
  ASSERT_TRUE(result.is_ok());
  EXPECT_TRUE(result.value().empty());
}

// ============================================================================
// Externally Written Content
// ============================================================================

TEST_F(RoundTripTest, ReadsNativeAppContent) {
  // What a native Windows application might leave on the clipboard
  ASSERT_TRUE(native
                  ->write({{"Rich Text Format", to_bytes("{\\rtf1}")},
                           {"CF_TEXT", to_bytes("ansi")},
                           {"CF_UNICODETEXT", to_bytes("unicode")},
                           {"Web Text Custom", to_bytes("from a web app")},
                           {"Web text custom", to_bytes("lookalike")}})
                  .is_ok());

  PicklingClipboard clipboard;
  ASSERT_TRUE(clipboard.init(config_for(TargetPlatform::Windows), native).is_ok());

  auto result = clipboard.read({"text/custom"}, true);
  ASSERT_TRUE(result.is_ok());
  const auto &read = result.value()[0];

  EXPECT_EQ(read.types(),
            (std::vector<std::string>{"text/custom", "text/plain"}));
  // First native entry for a type wins
  EXPECT_EQ(to_text(read.get_type("text/plain").value()), "ansi");
  EXPECT_EQ(to_text(read.get_type("text/custom").value()), "from a web app");
}

// ============================================================================
// Settings File
// ============================================================================

TEST_F(RoundTripTest, ConfiguredFromSettingsFile) {
  auto dir = std::filesystem::temp_directory_path() / "webclip_roundtrip";
  std::filesystem::create_directories(dir);
  auto path = dir / "webclip.conf";
  std::ofstream(path) << "target_platform = \"Windows\"\n"
                         "sanitized_types = \"text/plain, text/rtf\"\n";

  ConfigManager settings;
  ASSERT_TRUE(settings.init(path).is_ok());

  PicklingClipboard clipboard;
  ASSERT_TRUE(clipboard.init(settings.get(), native).is_ok());

  ClipboardItem item;
  item.set("text/rtf", to_bytes("{\\rtf1}"));
  ASSERT_TRUE(clipboard.write({item}, false).is_ok());
  EXPECT_EQ(native->contents()[0].format, "Rich Text Format");

  // text/html is not standardized under this configuration
  ClipboardItem html;
  html.set("text/html", to_bytes("<b/>"));
  EXPECT_EQ(clipboard.write({html}, false).error().code,
            ErrorCode::UnsupportedFormat);

  std::filesystem::remove_all(dir);
}

// ============================================================================
// Concurrency
// ============================================================================

TEST_F(RoundTripTest, ConcurrentCallsSeeCompleteWrites) {
  PicklingClipboard clipboard;
  ASSERT_TRUE(clipboard.init(config_for(TargetPlatform::Test), native).is_ok());

  std::vector<std::future<Result<void>>> writes;
  for (int i = 0; i < 8; ++i) {
    ClipboardItem item;
    std::string payload = "payload-" + std::to_string(i);
    item.set("text/plain", to_bytes(payload));
    item.set("text/custom", to_bytes(payload));
    item.unsanitize = {"text/custom"};
    writes.push_back(clipboard.write_async({item}, true));
  }

  for (int i = 0; i < 8; ++i) {
    auto result = clipboard.read({"text/custom"}, true);
    ASSERT_TRUE(result.is_ok());
    if (result.value().empty()) {
      continue;
    }
    // Never a mix of two writes
    const auto &read = result.value()[0];
    EXPECT_EQ(read.get_type("text/custom").value(),
              read.get_type("text/plain").value());
  }

  for (auto &write : writes) {
    EXPECT_TRUE(write.get().is_ok());
  }
  EXPECT_EQ(native->sequence_number(), 8u);
}

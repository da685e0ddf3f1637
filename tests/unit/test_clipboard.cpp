/**
 * @file test_clipboard.cpp
 * @brief Unit tests for the pickling clipboard
 */

#include <atomic>
#include <gtest/gtest.h>
#include <webclip/webclip.h>

using namespace webclip;

namespace {

/// Memory clipboard that counts native reads
class CountingClipboard : public MemoryClipboard {
public:
  Result<ClipboardSnapshot> read() override {
    ++reads;
    return MemoryClipboard::read();
  }

  std::atomic<int> reads{0};
};

ClipboardItem custom_item() {
  ClipboardItem item;
  item.set("text/plain", to_bytes("text"));
  item.set("text/custom", to_bytes("<custom_markup>pickled_text</custom_markup>"));
  item.unsanitize = {"text/custom"};
  return item;
}

} // namespace

class ClipboardTest : public ::testing::Test {
protected:
  std::shared_ptr<CountingClipboard> native =
      std::make_shared<CountingClipboard>();
  PicklingClipboard clipboard;
  PicklingConfig config;

  void SetUp() override {
    config.load_defaults();
    config.target_platform = TargetPlatform::Test;
    ASSERT_TRUE(clipboard.init(config, native).is_ok());
  }

  void TearDown() override { clipboard.shutdown(); }
};

// ============================================================================
// Lifecycle
// ============================================================================

TEST_F(ClipboardTest, RequiresInit) {
  PicklingClipboard fresh;
  EXPECT_FALSE(fresh.is_initialized());
  EXPECT_EQ(fresh.write({}, true).error().code, ErrorCode::NotInitialized);
  EXPECT_EQ(fresh.read({}, true).error().code, ErrorCode::NotInitialized);
  EXPECT_EQ(fresh.write_async({}, true).get().error().code,
            ErrorCode::NotInitialized);
}

TEST_F(ClipboardTest, InitChecks) {
  EXPECT_TRUE(clipboard.is_initialized());
  EXPECT_EQ(clipboard.init(config, native).error().code,
            ErrorCode::AlreadyInitialized);

  PicklingClipboard other;
  EXPECT_EQ(other.init(config, nullptr).error().code,
            ErrorCode::InvalidArgument);

  PicklingConfig bad = config;
  bad.sanitized_types = {"text/custom"};
  EXPECT_EQ(other.init(bad, native).error().code,
            ErrorCode::UnsupportedFormat);
  EXPECT_FALSE(other.is_initialized());
}

// ============================================================================
// Write
// ============================================================================

TEST_F(ClipboardTest, WriteCustomFormat) {
  ASSERT_TRUE(clipboard.write({custom_item()}, true).is_ok());

  ClipboardSnapshot expected = {
      {"application/web;type=\"text/custom\"",
       to_bytes("<custom_markup>pickled_text</custom_markup>")},
      {"text/plain", to_bytes("text")}};
  EXPECT_EQ(native->contents(), expected);
  EXPECT_EQ(native->sequence_number(), 1u);
}

TEST_F(ClipboardTest, WriteWithoutGestureIsDenied) {
  auto result = clipboard.write({custom_item()}, false);
  ASSERT_TRUE(result.is_error());
  EXPECT_EQ(result.error().code, ErrorCode::NoUserGesture);
  EXPECT_EQ(native->sequence_number(), 0u);
}

TEST_F(ClipboardTest, GateRunsBeforeValidation) {
  ClipboardItem item;
  item.set("text/plain", to_bytes("x"));
  item.unsanitize = {"not a type"};

  EXPECT_EQ(clipboard.write({item}, false).error().code,
            ErrorCode::NoUserGesture);
  EXPECT_EQ(clipboard.write({item}, true).error().code,
            ErrorCode::InvalidContentType);
  EXPECT_EQ(native->sequence_number(), 0u);
}

TEST_F(ClipboardTest, SanitizedWriteNeedsNoGesture) {
  ClipboardItem item;
  item.set("text/html", to_bytes("<b>x</b>"));

  ASSERT_TRUE(clipboard.write({item}, false).is_ok());
  EXPECT_EQ(native->contents(),
            (ClipboardSnapshot{{"text/html", to_bytes("<b>x</b>")}}));
}

TEST_F(ClipboardTest, FailedWriteKeepsPreviousContents) {
  ASSERT_TRUE(clipboard.write({custom_item()}, true).is_ok());
  auto before = native->contents();

  ClipboardItem item;
  item.set("text/plain", to_bytes("new"));
  item.set("text/other", to_bytes("unrequested"));

  auto result = clipboard.write({item}, true);
  ASSERT_TRUE(result.is_error());
  EXPECT_EQ(result.error().code, ErrorCode::UnsupportedFormat);
  EXPECT_EQ(native->contents(), before);
  EXPECT_EQ(native->sequence_number(), 1u);
}

TEST_F(ClipboardTest, NativeFailurePassesThrough) {
  native->set_failure(Error(ErrorCode::PermissionDenied, "denied by OS"));

  ClipboardItem item;
  item.set("text/plain", to_bytes("x"));
  auto result = clipboard.write({item}, false);
  ASSERT_TRUE(result.is_error());
  EXPECT_EQ(result.error().code, ErrorCode::PermissionDenied);
  EXPECT_EQ(result.error().message, "denied by OS");

  auto read = clipboard.read({}, false);
  ASSERT_TRUE(read.is_error());
  EXPECT_EQ(read.error().code, ErrorCode::PermissionDenied);
}

TEST_F(ClipboardTest, CancelledWriteNeverReachesNative) {
  CancellationToken token;
  token.cancel();

  auto result = clipboard.write({custom_item()}, true, token);
  ASSERT_TRUE(result.is_error());
  EXPECT_EQ(result.error().code, ErrorCode::Cancelled);
  EXPECT_EQ(native->sequence_number(), 0u);
}

// ============================================================================
// Read
// ============================================================================

TEST_F(ClipboardTest, ReadRequestedCustomFormat) {
  ASSERT_TRUE(clipboard.write({custom_item()}, true).is_ok());

  auto result = clipboard.read({"text/custom"}, true);
  ASSERT_TRUE(result.is_ok());
  ASSERT_EQ(result.value().size(), 1u);

  const auto &item = result.value()[0];
  EXPECT_EQ(item.types(),
            (std::vector<std::string>{"text/custom", "text/plain"}));
  EXPECT_EQ(to_text(item.get_type("text/custom").value()),
            "<custom_markup>pickled_text</custom_markup>");
}

TEST_F(ClipboardTest, ReadWithoutRequestHidesCustomFormat) {
  ASSERT_TRUE(clipboard.write({custom_item()}, true).is_ok());

  auto result = clipboard.read({}, false);
  ASSERT_TRUE(result.is_ok());
  ASSERT_EQ(result.value().size(), 1u);
  EXPECT_EQ(result.value()[0].types(), (std::vector<std::string>{"text/plain"}));
  EXPECT_EQ(result.value()[0].get_type("text/custom").error().code,
            ErrorCode::FormatNotFound);
}

TEST_F(ClipboardTest, ReadWithoutGestureIsDenied) {
  auto result = clipboard.read({"text/custom"}, false);
  ASSERT_TRUE(result.is_error());
  EXPECT_EQ(result.error().code, ErrorCode::NoUserGesture);
  EXPECT_EQ(native->reads.load(), 0);
}

TEST_F(ClipboardTest, InvalidReadRequestNeverReachesNative) {
  auto result = clipboard.read({"text/custom", "bogus"}, true);
  ASSERT_TRUE(result.is_error());
  EXPECT_EQ(result.error().code, ErrorCode::InvalidContentType);
  EXPECT_EQ(native->reads.load(), 0);
}

TEST_F(ClipboardTest, EmptyClipboardReadsZeroItems) {
  auto result = clipboard.read({}, false);
  ASSERT_TRUE(result.is_ok());
  EXPECT_TRUE(result.value().empty());
}

TEST_F(ClipboardTest, CancelledReadNeverReachesNative) {
  CancellationToken token;
  token.cancel();

  auto result = clipboard.read({}, false, token);
  ASSERT_TRUE(result.is_error());
  EXPECT_EQ(result.error().code, ErrorCode::Cancelled);
  EXPECT_EQ(native->reads.load(), 0);
}

// ============================================================================
// Available Types
// ============================================================================

TEST_F(ClipboardTest, AvailableTypes) {
  ASSERT_TRUE(clipboard.write({custom_item()}, true).is_ok());

  auto outside = clipboard.available_types(false);
  ASSERT_TRUE(outside.is_ok());
  EXPECT_EQ(outside.value(), (std::vector<std::string>{"text/plain"}));

  auto inside = clipboard.available_types(true);
  ASSERT_TRUE(inside.is_ok());
  EXPECT_EQ(inside.value(),
            (std::vector<std::string>{"text/custom", "text/plain"}));
}

// ============================================================================
// Configuration
// ============================================================================

TEST_F(ClipboardTest, DisabledPicklingRejectsUnsanitizeRequests) {
  PicklingConfig disabled = config;
  disabled.enable_pickling = false;
  ASSERT_TRUE(clipboard.set_config(disabled).is_ok());

  EXPECT_EQ(clipboard.write({custom_item()}, true).error().code,
            ErrorCode::NotSupported);
  EXPECT_EQ(clipboard.read({"text/custom"}, true).error().code,
            ErrorCode::NotSupported);

  // Sanitized traffic is unaffected
  ClipboardItem item;
  item.set("text/plain", to_bytes("x"));
  EXPECT_TRUE(clipboard.write({item}, false).is_ok());
}

TEST_F(ClipboardTest, ExposePolicyShowsUnrequestedCustomFormat) {
  ASSERT_TRUE(clipboard.write({custom_item()}, true).is_ok());

  PicklingConfig expose = config;
  expose.pickled_only_policy = PickledOnlyPolicy::Expose;
  ASSERT_TRUE(clipboard.set_config(expose).is_ok());
  EXPECT_EQ(clipboard.get_config().pickled_only_policy,
            PickledOnlyPolicy::Expose);

  auto inside = clipboard.read({}, true);
  ASSERT_TRUE(inside.is_ok());
  EXPECT_TRUE(inside.value()[0].has_type("text/custom"));

  // Outside a gesture window pickled-only types stay hidden
  auto outside = clipboard.read({}, false);
  ASSERT_TRUE(outside.is_ok());
  EXPECT_FALSE(outside.value()[0].has_type("text/custom"));
}

TEST_F(ClipboardTest, WriteLimitFromConfig) {
  PicklingConfig limited = config;
  limited.max_pickled_formats = 1;
  ASSERT_TRUE(clipboard.set_config(limited).is_ok());

  ClipboardItem item;
  item.set("text/a", to_bytes("a"));
  item.set("text/b", to_bytes("b"));
  item.unsanitize = {"text/a", "text/b"};

  EXPECT_EQ(clipboard.write({item}, true).error().code,
            ErrorCode::FormatLimitExceeded);
}

// ============================================================================
// Async
// ============================================================================

TEST_F(ClipboardTest, AsyncWriteThenRead) {
  auto written = clipboard.write_async({custom_item()}, true);
  ASSERT_TRUE(written.get().is_ok());

  auto read = clipboard.read_async({"text/custom"}, true);
  auto result = read.get();
  ASSERT_TRUE(result.is_ok());
  ASSERT_EQ(result.value().size(), 1u);
  EXPECT_TRUE(result.value()[0].has_type("text/custom"));
}

TEST_F(ClipboardTest, AsyncRejectionCarriesErrorKind) {
  auto result = clipboard.read_async({"text/custom"}, false).get();
  ASSERT_TRUE(result.is_error());
  EXPECT_EQ(result.error().code, ErrorCode::NoUserGesture);
}

TEST_F(ClipboardTest, AsyncCallSurvivesShutdown) {
  CancellationToken token;
  auto pending = clipboard.write_async({custom_item()}, true, token);
  clipboard.shutdown();

  // The pending call keeps its own state alive
  EXPECT_TRUE(pending.get().is_ok());
  EXPECT_FALSE(clipboard.is_initialized());
}

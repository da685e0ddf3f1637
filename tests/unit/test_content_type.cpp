/**
 * @file test_content_type.cpp
 * @brief Unit tests for content type parsing
 */

#include <gtest/gtest.h>
#include <webclip/webclip.h>

using namespace webclip;

// ============================================================================
// Valid Types
// ============================================================================

TEST(ContentTypeTest, ParsesTwoSegments) {
  auto result = ContentType::parse("text/plain");
  ASSERT_TRUE(result.is_ok());
  EXPECT_EQ(result.value().category, "text");
  EXPECT_EQ(result.value().subtype, "plain");
  EXPECT_EQ(result.value().to_string(), "text/plain");
}

TEST(ContentTypeTest, AcceptsTokenPunctuation) {
  EXPECT_TRUE(ContentType::is_valid("image/svg+xml"));
  EXPECT_TRUE(ContentType::is_valid("application/vnd.ms-excel"));
  EXPECT_TRUE(ContentType::is_valid("x-custom/a_b~c"));
}

TEST(ContentTypeTest, PreservesCase) {
  auto result = ContentType::parse("text/cUSTOM");
  ASSERT_TRUE(result.is_ok());
  EXPECT_EQ(result.value().subtype, "cUSTOM");
  EXPECT_NE(result.value(), ContentType("text", "custom"));
}

// ============================================================================
// Malformed Types
// ============================================================================

TEST(ContentTypeTest, RejectsBadShape) {
  for (const char *text : {"", "text", "text/", "/plain", "a/b/c", "/"}) {
    auto result = ContentType::parse(text);
    ASSERT_TRUE(result.is_error()) << text;
    EXPECT_EQ(result.error().code, ErrorCode::InvalidContentType) << text;
  }
}

TEST(ContentTypeTest, RejectsNonTokenCharacters) {
  EXPECT_FALSE(ContentType::is_valid("text/plain;charset=utf-8"));
  EXPECT_FALSE(ContentType::is_valid("text/pla in"));
  EXPECT_FALSE(ContentType::is_valid("text/\"quoted\""));
}

TEST(ContentTypeTest, RejectsDotInCategory) {
  EXPECT_FALSE(ContentType::is_valid("web.text/plain"));
  EXPECT_TRUE(ContentType::is_valid("text/plain.v2"));
}

TEST(ContentTypeTest, RejectsUppercaseLeadingLetter) {
  EXPECT_FALSE(ContentType::is_valid("Text/plain"));
  EXPECT_FALSE(ContentType::is_valid("text/Plain"));
  EXPECT_FALSE(ContentType::is_valid("text/Custom"));

  // Only the first letter of a segment is restricted
  EXPECT_TRUE(ContentType::is_valid("text/cUSTOM"));
}

TEST(ContentTypeTest, EnforcesLengthLimit) {
  std::string subtype(20, 'a');
  std::string text = "text/" + subtype;

  EXPECT_TRUE(ContentType::parse(text, text.size()).is_ok());

  auto result = ContentType::parse(text, text.size() - 1);
  ASSERT_TRUE(result.is_error());
  EXPECT_EQ(result.error().code, ErrorCode::InvalidContentType);
}

TEST(ContentTypeTest, Ordering) {
  ContentType a("image", "png");
  ContentType b("text", "html");
  ContentType c("text", "plain");

  EXPECT_TRUE(a < b);
  EXPECT_TRUE(b < c);
  EXPECT_FALSE(c < a);
}

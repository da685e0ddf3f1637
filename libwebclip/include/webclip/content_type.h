/**
 * @file content_type.h
 * @brief Two-segment content type identifiers ("category/subtype")
 *
 * A ContentType names one representation of a clipboard item, the way a
 * MIME type does. Parsing is strict: everything accepted here can be
 * carried through every platform's pickled naming transform and back
 * without loss.
 *
 * Grammar:
 * - exactly one '/' separating a non-empty category and subtype
 * - only RFC 7230 token characters in either segment
 * - no '.' in the category
 * - neither segment starts with an uppercase ASCII letter
 *
 * Case is otherwise preserved.
 */

#ifndef WEBCLIP_CONTENT_TYPE_H
#define WEBCLIP_CONTENT_TYPE_H

#include "error.h"
#include "platform.h"
#include <cstddef>
#include <string>
#include <utility>

namespace webclip {

/// Separator between category and subtype
constexpr char CONTENT_TYPE_SEPARATOR = '/';

/// Default upper bound on a content type's length, in characters
constexpr size_t DEFAULT_MAX_FORMAT_LENGTH = 1024;

/**
 * @brief A validated category/subtype pair
 */
struct WEBCLIP_API ContentType {
  std::string category;
  std::string subtype;

  ContentType() = default;
  ContentType(std::string cat, std::string sub)
      : category(std::move(cat)), subtype(std::move(sub)) {}

  /// "category/subtype"
  std::string to_string() const {
    return category + CONTENT_TYPE_SEPARATOR + subtype;
  }

  bool operator==(const ContentType &other) const {
    return category == other.category && subtype == other.subtype;
  }
  bool operator!=(const ContentType &other) const { return !(*this == other); }
  bool operator<(const ContentType &other) const {
    return category != other.category ? category < other.category
                                      : subtype < other.subtype;
  }

  /**
   * @brief Parse and validate a content type string
   *
   * The leading-uppercase rule holds on every target platform, although
   * only the Windows capitalized-words names need it to stay reversible.
   * A type accepted on one platform is then accepted on all of them.
   *
   * @param text Caller-supplied identifier
   * @param max_length Longest accepted identifier
   * @return The parsed type, or InvalidContentType
   */
  static Result<ContentType>
  parse(const std::string &text, size_t max_length = DEFAULT_MAX_FORMAT_LENGTH);

  /// Check whether a string parses under the default length limit
  static bool is_valid(const std::string &text);
};

/// Check if a character may appear in a content type segment
WEBCLIP_API bool is_token_char(char c);

} // namespace webclip

#endif // WEBCLIP_CONTENT_TYPE_H

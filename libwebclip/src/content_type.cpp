/**
 * @file content_type.cpp
 * @brief Content type parsing
 */

#include "webclip/content_type.h"
#include <cstring>

namespace webclip {

namespace {

bool starts_with_upper(const std::string &segment) {
  return !segment.empty() && segment[0] >= 'A' && segment[0] <= 'Z';
}

Error invalid(const std::string &text, const std::string &why) {
  return Error(ErrorCode::InvalidContentType, why, text);
}

} // namespace

bool is_token_char(char c) {
  if ((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
      (c >= '0' && c <= '9')) {
    return true;
  }
  return c != '\0' && std::strchr("!#$%&'*+-.^_`|~", c) != nullptr;
}

Result<ContentType> ContentType::parse(const std::string &text,
                                       size_t max_length) {
  if (text.empty()) {
    return invalid(text, "Content type is empty");
  }
  if (text.size() > max_length) {
    return invalid(text.substr(0, 64),
                   "Content type longer than " + std::to_string(max_length));
  }

  auto sep = text.find(CONTENT_TYPE_SEPARATOR);
  if (sep == std::string::npos ||
      text.find(CONTENT_TYPE_SEPARATOR, sep + 1) != std::string::npos) {
    return invalid(text, "Content type needs exactly one '/'");
  }

  ContentType type(text.substr(0, sep), text.substr(sep + 1));
  if (type.category.empty() || type.subtype.empty()) {
    return invalid(text, "Empty category or subtype");
  }

  for (char c : type.category) {
    if (!is_token_char(c) || c == '.') {
      return invalid(text, "Illegal character in category");
    }
  }
  for (char c : type.subtype) {
    if (!is_token_char(c)) {
      return invalid(text, "Illegal character in subtype");
    }
  }

  if (starts_with_upper(type.category) || starts_with_upper(type.subtype)) {
    return invalid(text, "Segments must not start with an uppercase letter");
  }

  return type;
}

bool ContentType::is_valid(const std::string &text) {
  return parse(text).is_ok();
}

} // namespace webclip

/**
 * @file unsanitize_list.h
 * @brief Caller-supplied list of content types requested unsanitized
 */

#ifndef WEBCLIP_UNSANITIZE_LIST_H
#define WEBCLIP_UNSANITIZE_LIST_H

#include "content_type.h"
#include "error.h"
#include "platform.h"
#include <cstddef>
#include <string>
#include <vector>

namespace webclip {

/// Default bound on unsanitized formats per call
constexpr size_t DEFAULT_MAX_PICKLED_FORMATS = 100;

/**
 * @brief Ordered set of content types that take the pickled path
 *
 * Duplicates collapse; first-seen order is kept.
 */
class WEBCLIP_API UnsanitizeList {
public:
  UnsanitizeList() = default;

  /// Add a type; returns false if it was already present
  bool insert(const ContentType &type);

  bool contains(const ContentType &type) const;

  const std::vector<ContentType> &types() const { return types_; }
  size_t size() const { return types_.size(); }
  bool empty() const { return types_.empty(); }

  auto begin() const { return types_.begin(); }
  auto end() const { return types_.end(); }

private:
  std::vector<ContentType> types_;
};

/**
 * @brief Validation limits for unsanitize lists
 */
struct UnsanitizeLimits {
  /// Longest accepted content type
  size_t max_format_length = DEFAULT_MAX_FORMAT_LENGTH;

  /// Most distinct types per list
  size_t max_formats = DEFAULT_MAX_PICKLED_FORMATS;
};

/**
 * @brief Normalize and validate a raw unsanitize list
 * @param raw Content type strings as supplied by the caller
 * @param limits Length and count bounds
 * @return The deduplicated list, InvalidContentType for any malformed
 *         entry, or FormatLimitExceeded when too many distinct types remain
 */
WEBCLIP_API Result<UnsanitizeList>
validate_unsanitize_list(const std::vector<std::string> &raw,
                         const UnsanitizeLimits &limits = {});

} // namespace webclip

#endif // WEBCLIP_UNSANITIZE_LIST_H

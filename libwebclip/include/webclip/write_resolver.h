/**
 * @file write_resolver.h
 * @brief Clipboard items -> ordered native entries
 *
 * For each item, every representation whose type is in the item's
 * unsanitize list yields a pickled native entry, and every representation
 * whose type is standardized yields a sanitized native entry. All pickled
 * entries of an item precede all of its sanitized entries. A type in both
 * sets yields both entries with the same payload. A type in neither fails
 * the whole write.
 *
 * The resolver only computes the sequence; committing it is the caller's
 * job and must happen in one native call.
 */

#ifndef WEBCLIP_WRITE_RESOLVER_H
#define WEBCLIP_WRITE_RESOLVER_H

#include "clipboard_item.h"
#include "content_type.h"
#include "error.h"
#include "platform.h"
#include "sanitized_registry.h"
#include "types.h"
#include "unsanitize_list.h"
#include <cstddef>
#include <vector>

namespace webclip {

/**
 * @brief Per-representation decision of the write path
 *
 * At least one of sanitize/pickle is set. Both set means two native
 * entries.
 */
struct ClipboardEntryRequest {
  ContentType content_type;
  Bytes payload;
  bool sanitize = false;
  bool pickle = false;
};

/**
 * @brief Bounds enforced while resolving a write
 */
struct WriteLimits {
  /// Longest accepted content type
  size_t max_format_length = DEFAULT_MAX_FORMAT_LENGTH;

  /// Most pickled entries across one write call
  size_t max_pickled_formats = DEFAULT_MAX_PICKLED_FORMATS;

  /// Largest accepted payload in bytes (0 = unlimited)
  size_t max_payload_size = 0;
};

class WEBCLIP_API WriteResolver {
public:
  /**
   * @param platform Target platform (selects the pickled naming scheme)
   * @param registry Standardized types; must outlive the resolver
   * @param limits Validation bounds
   */
  WriteResolver(TargetPlatform platform,
                const SanitizedFormatRegistry &registry,
                WriteLimits limits = {});

  /**
   * @brief Classify every representation of one item
   * @return Requests in declaration order, or InvalidContentType,
   *         PayloadTooLarge, UnsupportedFormat
   */
  Result<std::vector<ClipboardEntryRequest>>
  plan(const ClipboardItem &item, const UnsanitizeList &unsanitize) const;

  /**
   * @brief Native entries for one item (pickled first, then sanitized)
   */
  Result<ClipboardSnapshot> resolve_item(const ClipboardItem &item,
                                         const UnsanitizeList &unsanitize) const;

  /**
   * @brief Native entries for a whole write call
   * @param items Items in caller order
   * @param unsanitize Validated unsanitize list of each item (same size)
   * @return The full ordered sequence, or the first error; nothing is
   *         produced on error
   */
  Result<ClipboardSnapshot>
  resolve(const std::vector<ClipboardItem> &items,
          const std::vector<UnsanitizeList> &unsanitize) const;

  TargetPlatform platform() const { return platform_; }

private:
  TargetPlatform platform_;
  const SanitizedFormatRegistry &registry_;
  WriteLimits limits_;
};

} // namespace webclip

#endif // WEBCLIP_WRITE_RESOLVER_H

/**
 * @file clipboard_item.h
 * @brief Caller-facing clipboard items for write and read calls
 */

#ifndef WEBCLIP_CLIPBOARD_ITEM_H
#define WEBCLIP_CLIPBOARD_ITEM_H

#include "content_type.h"
#include "error.h"
#include "platform.h"
#include "types.h"
#include <string>
#include <utility>
#include <vector>

namespace webclip {

// ============================================================================
// Write Item
// ============================================================================

/// One representation of a clipboard item: content type string and payload
using Representation = std::pair<std::string, Bytes>;

/**
 * @brief One item of a write call
 *
 * Holds representations keyed by content type (in declaration order) and
 * the raw per-item list of types the caller wants written unsanitized.
 * Content type strings are validated when the item is written, not here;
 * so is uniqueness, since representations can be appended directly.
 *
 * Example usage:
 * @code
 *   ClipboardItem item;
 *   item.set("text/plain", to_bytes("text"));
 *   item.set("text/custom", to_bytes("<custom_markup>pickled_text</custom_markup>"));
 *   item.unsanitize = {"text/custom"};
 * @endcode
 */
struct WEBCLIP_API ClipboardItem {
  /// Representations in declaration order
  std::vector<Representation> representations;

  /// Types to write unsanitized (raw, validated per call)
  std::vector<std::string> unsanitize;

  /// Add a representation; an existing type keeps its position and gets the
  /// new payload
  void set(const std::string &type, Bytes data);

  /// Check if a representation exists for a type
  bool has(const std::string &type) const;

  size_t size() const { return representations.size(); }
  bool empty() const { return representations.empty(); }
};

// ============================================================================
// Read Item
// ============================================================================

/**
 * @brief One item returned by a read call
 *
 * Exposes the available content types and their payloads. Which native
 * representation a payload came from is not visible here.
 */
class WEBCLIP_API ClipboardReadItem {
public:
  ClipboardReadItem() = default;
  explicit ClipboardReadItem(std::vector<std::pair<ContentType, Bytes>> data)
      : data_(std::move(data)) {}

  /// Available types in resolution order
  std::vector<std::string> types() const;

  /// Check if a type is available
  bool has_type(const std::string &type) const;

  /**
   * @brief Fetch the payload of a type
   * @return The payload, or FormatNotFound
   */
  Result<Bytes> get_type(const std::string &type) const;

  size_t size() const { return data_.size(); }
  bool empty() const { return data_.empty(); }

private:
  std::vector<std::pair<ContentType, Bytes>> data_;
};

} // namespace webclip

#endif // WEBCLIP_CLIPBOARD_ITEM_H

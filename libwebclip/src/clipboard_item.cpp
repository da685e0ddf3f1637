/**
 * @file clipboard_item.cpp
 * @brief Clipboard item helpers
 */

#include "webclip/clipboard_item.h"
#include <algorithm>

namespace webclip {

// ============================================================================
// ClipboardItem
// ============================================================================

void ClipboardItem::set(const std::string &type, Bytes data) {
  for (auto &rep : representations) {
    if (rep.first == type) {
      rep.second = std::move(data);
      return;
    }
  }
  representations.emplace_back(type, std::move(data));
}

bool ClipboardItem::has(const std::string &type) const {
  return std::any_of(representations.begin(), representations.end(),
                     [&](const Representation &rep) { return rep.first == type; });
}

// ============================================================================
// ClipboardReadItem
// ============================================================================

std::vector<std::string> ClipboardReadItem::types() const {
  std::vector<std::string> result;
  result.reserve(data_.size());
  for (const auto &entry : data_) {
    result.push_back(entry.first.to_string());
  }
  return result;
}

bool ClipboardReadItem::has_type(const std::string &type) const {
  return get_type(type).is_ok();
}

Result<Bytes> ClipboardReadItem::get_type(const std::string &type) const {
  for (const auto &entry : data_) {
    if (entry.first.to_string() == type) {
      return entry.second;
    }
  }
  return Error(ErrorCode::FormatNotFound, "Type not on clipboard", type);
}

} // namespace webclip

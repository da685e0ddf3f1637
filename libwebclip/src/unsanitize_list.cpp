/**
 * @file unsanitize_list.cpp
 * @brief Unsanitize list validation
 */

#include "webclip/unsanitize_list.h"
#include "webclip/logging.h"
#include <algorithm>

namespace webclip {

namespace {
logging::Logger get_logger() { return logging::get_or_create("webclip.validate"); }
} // namespace

bool UnsanitizeList::insert(const ContentType &type) {
  if (contains(type)) {
    return false;
  }
  types_.push_back(type);
  return true;
}

bool UnsanitizeList::contains(const ContentType &type) const {
  return std::find(types_.begin(), types_.end(), type) != types_.end();
}

Result<UnsanitizeList>
validate_unsanitize_list(const std::vector<std::string> &raw,
                         const UnsanitizeLimits &limits) {
  UnsanitizeList list;

  for (const auto &entry : raw) {
    auto parsed = ContentType::parse(entry, limits.max_format_length);
    if (parsed.is_error()) {
      SPDLOG_LOGGER_DEBUG(get_logger(), "Rejected unsanitize entry '{}': {}",
                          entry, parsed.error().message);
      return parsed.error();
    }
    if (!list.insert(parsed.value())) {
      SPDLOG_LOGGER_TRACE(get_logger(), "Collapsed duplicate '{}'", entry);
    }
  }

  if (list.size() > limits.max_formats) {
    return Error(ErrorCode::FormatLimitExceeded,
                 "Too many unsanitized formats",
                 std::to_string(list.size()) + " > " +
                     std::to_string(limits.max_formats));
  }

  return list;
}

} // namespace webclip

/**
 * @file write_resolver.cpp
 * @brief Write-side format resolution
 */

#include "webclip/write_resolver.h"
#include "webclip/format_translator.h"
#include "webclip/logging.h"

namespace webclip {

namespace {
logging::Logger get_logger() { return logging::get_or_create("webclip.write"); }
} // namespace

WriteResolver::WriteResolver(TargetPlatform platform,
                             const SanitizedFormatRegistry &registry,
                             WriteLimits limits)
    : platform_(platform), registry_(registry), limits_(limits) {}

Result<std::vector<ClipboardEntryRequest>>
WriteResolver::plan(const ClipboardItem &item,
                    const UnsanitizeList &unsanitize) const {
  std::vector<ClipboardEntryRequest> requests;
  requests.reserve(item.representations.size());

  for (const auto &rep : item.representations) {
    auto parsed = ContentType::parse(rep.first, limits_.max_format_length);
    if (parsed.is_error()) {
      return parsed.error();
    }

    if (limits_.max_payload_size > 0 &&
        rep.second.size() > limits_.max_payload_size) {
      return Error(ErrorCode::PayloadTooLarge, "Payload exceeds limit",
                   rep.first + ": " + std::to_string(rep.second.size()) +
                       " bytes");
    }

    ClipboardEntryRequest request;
    request.content_type = std::move(parsed).value();

    // An item maps each type to one payload
    for (const auto &seen : requests) {
      if (seen.content_type == request.content_type) {
        return Error(ErrorCode::InvalidArgument,
                     "Duplicate representation in item", rep.first);
      }
    }
    request.pickle = unsanitize.contains(request.content_type);
    request.sanitize = registry_.is_standard(request.content_type);

    if (!request.pickle && !request.sanitize) {
      SPDLOG_LOGGER_DEBUG(get_logger(), "'{}' is neither standardized nor "
                                        "requested unsanitized", rep.first);
      return Error(ErrorCode::UnsupportedFormat,
                   "Type is not supported for writing", rep.first);
    }

    request.payload = rep.second;
    requests.push_back(std::move(request));
  }

  return requests;
}

Result<ClipboardSnapshot>
WriteResolver::resolve_item(const ClipboardItem &item,
                            const UnsanitizeList &unsanitize) const {
  auto planned = plan(item, unsanitize);
  if (planned.is_error()) {
    return planned.error();
  }
  const auto &requests = planned.value();

  ClipboardSnapshot entries;
  entries.reserve(requests.size() * 2);

  // Pickled formats of an item always precede its sanitized formats
  for (const auto &request : requests) {
    if (request.pickle) {
      entries.push_back(
          {encode_pickled(request.content_type, platform_), request.payload});
    }
  }

  for (const auto &request : requests) {
    if (!request.sanitize) {
      continue;
    }
    auto name = registry_.native_name(request.content_type, platform_);
    if (!name) {
      return Error(ErrorCode::InvalidState, "Standardized type has no name",
                   request.content_type.to_string());
    }
    entries.push_back({*name, request.payload});
  }

  for (const auto &entry : entries) {
    SPDLOG_LOGGER_TRACE(get_logger(), "Emit '{}' ({} bytes)", entry.format,
                        entry.data.size());
  }
  return entries;
}

Result<ClipboardSnapshot>
WriteResolver::resolve(const std::vector<ClipboardItem> &items,
                       const std::vector<UnsanitizeList> &unsanitize) const {
  if (items.size() != unsanitize.size()) {
    return Error(ErrorCode::InvalidArgument,
                 "Each item needs its own unsanitize list");
  }

  ClipboardSnapshot all;
  size_t pickled_count = 0;

  for (size_t i = 0; i < items.size(); ++i) {
    auto entries = resolve_item(items[i], unsanitize[i]);
    if (entries.is_error()) {
      return entries.error();
    }

    for (auto &entry : entries.value()) {
      if (is_pickled_format(entry.format, platform_)) {
        ++pickled_count;
      }
      all.push_back(std::move(entry));
    }
  }

  if (pickled_count > limits_.max_pickled_formats) {
    return Error(ErrorCode::FormatLimitExceeded,
                 "Too many unsanitized formats in one write",
                 std::to_string(pickled_count) + " > " +
                     std::to_string(limits_.max_pickled_formats));
  }

  SPDLOG_LOGGER_DEBUG(get_logger(), "Resolved {} item(s) into {} native "
                                    "entries ({} pickled) for {}",
                      items.size(), all.size(), pickled_count,
                      target_platform_name(platform_));
  return all;
}

} // namespace webclip

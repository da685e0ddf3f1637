/**
 * @file read_resolver.cpp
 * @brief Read-side format resolution
 */

#include "webclip/read_resolver.h"
#include "webclip/format_translator.h"
#include "webclip/logging.h"
#include <algorithm>

namespace webclip {

namespace {

logging::Logger get_logger() { return logging::get_or_create("webclip.read"); }

using Group = std::vector<std::pair<ContentType, const Bytes *>>;

const Bytes *lookup(const Group &group, const ContentType &type) {
  for (const auto &entry : group) {
    if (entry.first == type) {
      return entry.second;
    }
  }
  return nullptr;
}

/**
 * @brief Snapshot split by provenance
 *
 * Within a group the first native entry for a type wins. `order` records
 * each logical type once, at its first appearance in either group.
 */
struct Partition {
  Group pickled;
  Group sanitized;
  std::vector<ContentType> order;

  void note(const ContentType &type) {
    if (std::find(order.begin(), order.end(), type) == order.end()) {
      order.push_back(type);
    }
  }
};

Partition partition(const ClipboardSnapshot &snapshot, TargetPlatform platform,
                    const SanitizedFormatRegistry &registry) {
  Partition parts;

  for (const auto &entry : snapshot) {
    if (auto type = decode_pickled(entry.format, platform)) {
      if (!lookup(parts.pickled, *type)) {
        parts.pickled.emplace_back(*type, &entry.data);
        parts.note(*type);
      }
      continue;
    }

    if (auto type = registry.content_type_for(entry.format, platform)) {
      if (!lookup(parts.sanitized, *type)) {
        parts.sanitized.emplace_back(*type, &entry.data);
        parts.note(*type);
      }
      continue;
    }

    SPDLOG_LOGGER_TRACE(get_logger(), "Dropped native format '{}'",
                        entry.format);
  }

  return parts;
}

} // namespace

// ============================================================================
// PickledOnlyPolicy
// ============================================================================

const char *pickled_only_policy_name(PickledOnlyPolicy policy) {
  switch (policy) {
  case PickledOnlyPolicy::Hide:
    return "hide";
  case PickledOnlyPolicy::Expose:
    return "expose";
  default:
    return "unknown";
  }
}

std::optional<PickledOnlyPolicy>
parse_pickled_only_policy(const std::string &name) {
  if (name == "hide") {
    return PickledOnlyPolicy::Hide;
  }
  if (name == "expose") {
    return PickledOnlyPolicy::Expose;
  }
  return std::nullopt;
}

// ============================================================================
// ResolvedReadResult
// ============================================================================

const ResolvedEntry *ResolvedReadResult::find(const ContentType &type) const {
  for (const auto &entry : entries) {
    if (entry.type == type) {
      return &entry;
    }
  }
  return nullptr;
}

// ============================================================================
// ReadResolver
// ============================================================================

ReadResolver::ReadResolver(TargetPlatform platform,
                           const SanitizedFormatRegistry &registry,
                           PickledOnlyPolicy policy)
    : platform_(platform), registry_(registry), policy_(policy) {}

ResolvedReadResult
ReadResolver::resolve(const ClipboardSnapshot &snapshot,
                      const UnsanitizeList &requested_unsanitize) const {
  Partition parts = partition(snapshot, platform_, registry_);
  ResolvedReadResult result;

  for (const auto &type : requested_unsanitize) {
    if (const Bytes *data = lookup(parts.pickled, type)) {
      result.entries.push_back({type, *data, Provenance::Pickled});
    }
  }

  for (const auto &type : parts.order) {
    if (result.contains(type)) {
      continue;
    }

    if (const Bytes *data = lookup(parts.sanitized, type)) {
      result.entries.push_back({type, *data, Provenance::Sanitized});
      continue;
    }

    // Only a pickled entry exists and the caller did not ask for it
    if (policy_ == PickledOnlyPolicy::Expose) {
      result.entries.push_back(
          {type, *lookup(parts.pickled, type), Provenance::Pickled});
    } else {
      SPDLOG_LOGGER_DEBUG(get_logger(), "Hiding pickled-only '{}'",
                          type.to_string());
    }
  }

  SPDLOG_LOGGER_DEBUG(get_logger(), "Resolved {} of {} native entries into {} "
                                    "type(s) for {}",
                      parts.pickled.size() + parts.sanitized.size(),
                      snapshot.size(), result.size(),
                      target_platform_name(platform_));
  return result;
}

std::vector<ContentType>
ReadResolver::available_types(const ClipboardSnapshot &snapshot,
                              bool include_pickled) const {
  Partition parts = partition(snapshot, platform_, registry_);
  if (include_pickled) {
    return parts.order;
  }

  std::vector<ContentType> types;
  for (const auto &type : parts.order) {
    if (lookup(parts.sanitized, type)) {
      types.push_back(type);
    }
  }
  return types;
}

} // namespace webclip

/**
 * @file read_resolver.h
 * @brief Native clipboard snapshot -> logical content types
 *
 * Native entries are split into a pickled group (names the platform's
 * pickled transform decodes) and a sanitized group (names the registry
 * knows). Everything else is dropped. For each logical type:
 *
 * 1. requested unsanitized and a pickled entry exists -> pickled payload
 * 2. otherwise a sanitized entry exists               -> sanitized payload
 * 3. otherwise (pickled only, not requested)          -> PickledOnlyPolicy
 *
 * A requested pickled entry always wins over a sanitized one, never the
 * reverse.
 */

#ifndef WEBCLIP_READ_RESOLVER_H
#define WEBCLIP_READ_RESOLVER_H

#include "content_type.h"
#include "platform.h"
#include "sanitized_registry.h"
#include "types.h"
#include "unsanitize_list.h"
#include <optional>
#include <string>
#include <vector>

namespace webclip {

/**
 * @brief What to do with a pickled entry that has no sanitized
 *        counterpart and was not requested unsanitized
 */
enum class PickledOnlyPolicy : uint8_t {
  /// Not exposed: callers must opt in to receive pickled content
  Hide = 0,

  /// Exposed with pickled provenance
  Expose = 1
};

WEBCLIP_API const char *pickled_only_policy_name(PickledOnlyPolicy policy);
WEBCLIP_API std::optional<PickledOnlyPolicy>
parse_pickled_only_policy(const std::string &name);

/**
 * @brief One resolved logical type
 */
struct ResolvedEntry {
  ContentType type;
  Bytes data;
  Provenance provenance = Provenance::Sanitized;
};

/**
 * @brief Resolved read, one entry per retrievable type
 *
 * Order: requested unsanitized types that resolved to a pickled payload,
 * in request order, then every other exposed type in order of first
 * appearance in the snapshot.
 */
struct ResolvedReadResult {
  std::vector<ResolvedEntry> entries;

  /// Entry for a type, or nullptr
  const ResolvedEntry *find(const ContentType &type) const;

  bool contains(const ContentType &type) const { return find(type) != nullptr; }
  size_t size() const { return entries.size(); }
  bool empty() const { return entries.empty(); }
};

class WEBCLIP_API ReadResolver {
public:
  /**
   * @param platform Target platform (selects the pickled naming scheme)
   * @param registry Standardized types; must outlive the resolver
   * @param policy Handling of unrequested pickled-only types
   */
  ReadResolver(TargetPlatform platform,
               const SanitizedFormatRegistry &registry,
               PickledOnlyPolicy policy = PickledOnlyPolicy::Hide);

  /**
   * @brief Resolve a snapshot against the requested unsanitize list
   */
  ResolvedReadResult resolve(const ClipboardSnapshot &snapshot,
                             const UnsanitizeList &requested_unsanitize) const;

  /**
   * @brief Logical types present in a snapshot
   * @param include_pickled Also list types that only exist pickled
   * @return Types in order of first appearance
   */
  std::vector<ContentType> available_types(const ClipboardSnapshot &snapshot,
                                           bool include_pickled) const;

  TargetPlatform platform() const { return platform_; }
  PickledOnlyPolicy policy() const { return policy_; }

private:
  TargetPlatform platform_;
  const SanitizedFormatRegistry &registry_;
  PickledOnlyPolicy policy_;
};

} // namespace webclip

#endif // WEBCLIP_READ_RESOLVER_H

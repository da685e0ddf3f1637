/**
 * @file sanitized_registry.h
 * @brief Standardized (sanitized) clipboard formats
 *
 * The registry answers two questions for the resolvers: is a content type
 * standardized, and under which native name does its sanitized form live
 * on a given platform. Each standardized type has one canonical native
 * name per naming scheme (used for writing) and any number of aliases
 * (accepted when reading, e.g. UTF8_STRING for text/plain on X11).
 */

#ifndef WEBCLIP_SANITIZED_REGISTRY_H
#define WEBCLIP_SANITIZED_REGISTRY_H

#include "content_type.h"
#include "error.h"
#include "platform.h"
#include "types.h"
#include <array>
#include <optional>
#include <string>
#include <vector>

namespace webclip {

/**
 * @brief Native names of one standardized type
 */
struct StandardFormat {
  ContentType type;

  /// Canonical native name, indexed by NamingScheme
  std::array<std::string, 3> native_names;

  /// Additional names recognized on read, indexed by NamingScheme
  std::array<std::vector<std::string>, 3> aliases;

  const std::string &native_name(NamingScheme scheme) const {
    return native_names[static_cast<size_t>(scheme)];
  }
};

/**
 * @brief Set of standardized types and their native mappings
 *
 * Example usage:
 * @code
 *   auto registry = SanitizedFormatRegistry::with_defaults();
 *   registry.is_standard(ContentType("text", "plain"));        // true
 *   registry.native_name(ContentType("text", "html"),
 *                        TargetPlatform::Windows);             // "HTML Format"
 * @endcode
 */
class WEBCLIP_API SanitizedFormatRegistry {
public:
  /// Empty registry: nothing is standardized
  SanitizedFormatRegistry() = default;

  /// text/plain, text/html and image/png
  static SanitizedFormatRegistry with_defaults();

  /**
   * @brief Registry restricted to a list of well-known types
   * @param types Content type strings, each one of known_standard_formats()
   * @return Registry, InvalidContentType for malformed entries or
   *         UnsupportedFormat for types without a known native mapping
   */
  static Result<SanitizedFormatRegistry>
  from_type_list(const std::vector<std::string> &types);

  /// Every type with a built-in native mapping
  static const std::vector<StandardFormat> &known_standard_formats();

  /**
   * @brief Register a standardized type
   *
   * Fails with InvalidArgument when the type is already registered, when a
   * native name is empty or already taken, or when a native name falls in
   * the pickled namespace of its scheme.
   */
  Result<void> add(const StandardFormat &format);

  /// Check if a type is standardized
  bool is_standard(const ContentType &type) const;

  /// Canonical native name used when writing the sanitized form
  std::optional<std::string> native_name(const ContentType &type,
                                         TargetPlatform platform) const;

  /// Standardized type behind a native name (canonical or alias)
  std::optional<ContentType> content_type_for(const std::string &native_name,
                                              TargetPlatform platform) const;

  /// Registered types in registration order
  std::vector<ContentType> types() const;

  size_t size() const { return formats_.size(); }
  bool empty() const { return formats_.empty(); }

private:
  const StandardFormat *find(const ContentType &type) const;

  std::vector<StandardFormat> formats_;
};

} // namespace webclip

#endif // WEBCLIP_SANITIZED_REGISTRY_H

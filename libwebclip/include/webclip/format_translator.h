/**
 * @file format_translator.h
 * @brief Content type <-> native clipboard format name mapping
 *
 * Pickled payloads are written under a browser-namespaced native format
 * whose name is derived from the content type by a per-platform rule:
 *
 * | Scheme           | custom/format becomes                  |
 * |------------------|----------------------------------------|
 * | ReverseDns       | com.web.custom.format                  |
 * | CapitalizedWords | Web Custom Format                      |
 * | MimeNamespaced   | application/web;type="custom/format"   |
 *
 * Every transform is injective over valid content types and decoding
 * reverses it exactly. Sanitized payloads use the standardized mapping of
 * SanitizedFormatRegistry instead.
 */

#ifndef WEBCLIP_FORMAT_TRANSLATOR_H
#define WEBCLIP_FORMAT_TRANSLATOR_H

#include "content_type.h"
#include "platform.h"
#include "types.h"
#include <optional>
#include <string>

namespace webclip {

class SanitizedFormatRegistry;

// ============================================================================
// Pickled Namespace Prefixes
// ============================================================================

constexpr const char *REVERSE_DNS_PREFIX = "com.web.";
constexpr const char *CAPITALIZED_WORDS_PREFIX = "Web ";
constexpr const char *MIME_NAMESPACED_PREFIX = "application/web;type=";

/// Naming convention a target platform uses for pickled formats
WEBCLIP_API NamingScheme naming_scheme_for(TargetPlatform platform);

/// Fixed prefix every pickled native name of a scheme starts with
WEBCLIP_API const char *pickled_prefix(NamingScheme scheme);

// ============================================================================
// Pickled Encoding
// ============================================================================

/**
 * @brief Native format name for a pickled content type
 * @param type Validated content type
 * @param scheme Target naming scheme
 */
WEBCLIP_API std::string encode_pickled(const ContentType &type,
                                       NamingScheme scheme);

WEBCLIP_API std::string encode_pickled(const ContentType &type,
                                       TargetPlatform platform);

/**
 * @brief Recover the content type behind a pickled native format name
 * @return The content type, or std::nullopt if the name is not a pickled
 *         format of this scheme (NotAPickledFormat)
 */
WEBCLIP_API std::optional<ContentType>
decode_pickled(const std::string &native_name, NamingScheme scheme);

WEBCLIP_API std::optional<ContentType>
decode_pickled(const std::string &native_name, TargetPlatform platform);

/// Check if a native format name belongs to the pickled namespace
WEBCLIP_API bool is_pickled_format(const std::string &native_name,
                                   TargetPlatform platform);

// ============================================================================
// Provenance-aware Encoding
// ============================================================================

/**
 * @brief Native format name for either provenance
 *
 * Pickled types always have a name. Sanitized types have one only when the
 * registry knows them as standardized.
 */
WEBCLIP_API std::optional<std::string>
encode_native(const ContentType &type, Provenance provenance,
              TargetPlatform platform,
              const SanitizedFormatRegistry &registry);

} // namespace webclip

#endif // WEBCLIP_FORMAT_TRANSLATOR_H

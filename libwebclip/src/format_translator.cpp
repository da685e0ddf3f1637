/**
 * @file format_translator.cpp
 * @brief Per-platform pickled format naming
 */

#include "webclip/format_translator.h"
#include "webclip/sanitized_registry.h"
#include <limits>

namespace webclip {

namespace {

constexpr size_t NO_LENGTH_LIMIT = std::numeric_limits<size_t>::max();

bool starts_with(const std::string &s, const char *prefix) {
  return s.compare(0, std::char_traits<char>::length(prefix), prefix) == 0;
}

char ascii_upper(char c) {
  return (c >= 'a' && c <= 'z') ? static_cast<char>(c - 'a' + 'A') : c;
}

char ascii_lower(char c) {
  return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

std::string capitalize(std::string word) {
  if (!word.empty()) {
    word[0] = ascii_upper(word[0]);
  }
  return word;
}

std::string decapitalize(std::string word) {
  if (!word.empty()) {
    word[0] = ascii_lower(word[0]);
  }
  return word;
}

std::optional<ContentType> parse_segments(const std::string &category,
                                          const std::string &subtype) {
  auto parsed = ContentType::parse(category + CONTENT_TYPE_SEPARATOR + subtype,
                                   NO_LENGTH_LIMIT);
  if (parsed.is_error()) {
    return std::nullopt;
  }
  return std::move(parsed).value();
}

// ============================================================================
// ReverseDns: com.web.<category>.<subtype>
// ============================================================================

std::string encode_reverse_dns(const ContentType &type) {
  return std::string(REVERSE_DNS_PREFIX) + type.category + '.' + type.subtype;
}

std::optional<ContentType> decode_reverse_dns(const std::string &name) {
  if (!starts_with(name, REVERSE_DNS_PREFIX)) {
    return std::nullopt;
  }
  std::string rest = name.substr(std::char_traits<char>::length(REVERSE_DNS_PREFIX));

  // Categories never contain '.', so the first one is the separator
  auto dot = rest.find('.');
  if (dot == std::string::npos) {
    return std::nullopt;
  }
  return parse_segments(rest.substr(0, dot), rest.substr(dot + 1));
}

// ============================================================================
// CapitalizedWords: Web <Category> <Subtype>
// ============================================================================

std::string encode_capitalized_words(const ContentType &type) {
  return std::string(CAPITALIZED_WORDS_PREFIX) + capitalize(type.category) +
         ' ' + capitalize(type.subtype);
}

std::optional<ContentType> decode_capitalized_words(const std::string &name) {
  if (!starts_with(name, CAPITALIZED_WORDS_PREFIX)) {
    return std::nullopt;
  }
  std::string rest =
      name.substr(std::char_traits<char>::length(CAPITALIZED_WORDS_PREFIX));

  auto space = rest.find(' ');
  if (space == std::string::npos) {
    return std::nullopt;
  }
  return parse_segments(decapitalize(rest.substr(0, space)),
                        decapitalize(rest.substr(space + 1)));
}

// ============================================================================
// MimeNamespaced: application/web;type="<category>/<subtype>"
// ============================================================================

std::string encode_mime_namespaced(const ContentType &type) {
  return std::string(MIME_NAMESPACED_PREFIX) + '"' + type.to_string() + '"';
}

std::optional<ContentType> decode_mime_namespaced(const std::string &name) {
  if (!starts_with(name, MIME_NAMESPACED_PREFIX)) {
    return std::nullopt;
  }
  std::string rest =
      name.substr(std::char_traits<char>::length(MIME_NAMESPACED_PREFIX));

  if (rest.size() < 2 || rest.front() != '"' || rest.back() != '"') {
    return std::nullopt;
  }
  auto parsed = ContentType::parse(rest.substr(1, rest.size() - 2),
                                   NO_LENGTH_LIMIT);
  if (parsed.is_error()) {
    return std::nullopt;
  }
  return std::move(parsed).value();
}

// ============================================================================
// Dispatch Table
// ============================================================================

struct SchemeTransform {
  NamingScheme scheme;
  std::string (*encode)(const ContentType &);
  std::optional<ContentType> (*decode)(const std::string &);
};

constexpr SchemeTransform TRANSFORMS[] = {
    {NamingScheme::ReverseDns, &encode_reverse_dns, &decode_reverse_dns},
    {NamingScheme::CapitalizedWords, &encode_capitalized_words,
     &decode_capitalized_words},
    {NamingScheme::MimeNamespaced, &encode_mime_namespaced,
     &decode_mime_namespaced},
};

const SchemeTransform &transform_for(NamingScheme scheme) {
  for (const auto &t : TRANSFORMS) {
    if (t.scheme == scheme) {
      return t;
    }
  }
  return TRANSFORMS[2];
}

} // namespace

NamingScheme naming_scheme_for(TargetPlatform platform) {
  switch (platform) {
  case TargetPlatform::MacOS:
  case TargetPlatform::iOS:
    return NamingScheme::ReverseDns;
  case TargetPlatform::Windows:
    return NamingScheme::CapitalizedWords;
  case TargetPlatform::Linux:
  case TargetPlatform::ChromeOS:
  case TargetPlatform::Android:
  case TargetPlatform::Fuchsia:
  case TargetPlatform::Test:
  case TargetPlatform::Headless:
  default:
    return NamingScheme::MimeNamespaced;
  }
}

const char *pickled_prefix(NamingScheme scheme) {
  switch (scheme) {
  case NamingScheme::ReverseDns:
    return REVERSE_DNS_PREFIX;
  case NamingScheme::CapitalizedWords:
    return CAPITALIZED_WORDS_PREFIX;
  case NamingScheme::MimeNamespaced:
  default:
    return MIME_NAMESPACED_PREFIX;
  }
}

std::string encode_pickled(const ContentType &type, NamingScheme scheme) {
  return transform_for(scheme).encode(type);
}

std::string encode_pickled(const ContentType &type, TargetPlatform platform) {
  return encode_pickled(type, naming_scheme_for(platform));
}

std::optional<ContentType> decode_pickled(const std::string &native_name,
                                          NamingScheme scheme) {
  const auto &transform = transform_for(scheme);
  auto decoded = transform.decode(native_name);

  // Only names this scheme could have produced count as pickled
  if (!decoded || transform.encode(*decoded) != native_name) {
    return std::nullopt;
  }
  return decoded;
}

std::optional<ContentType> decode_pickled(const std::string &native_name,
                                          TargetPlatform platform) {
  return decode_pickled(native_name, naming_scheme_for(platform));
}

bool is_pickled_format(const std::string &native_name,
                       TargetPlatform platform) {
  return decode_pickled(native_name, platform).has_value();
}

std::optional<std::string>
encode_native(const ContentType &type, Provenance provenance,
              TargetPlatform platform,
              const SanitizedFormatRegistry &registry) {
  if (provenance == Provenance::Pickled) {
    return encode_pickled(type, platform);
  }
  return registry.native_name(type, platform);
}

} // namespace webclip

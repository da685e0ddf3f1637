/**
 * @file sanitized_registry.cpp
 * @brief Standardized format table
 */

#include "webclip/sanitized_registry.h"
#include "webclip/format_translator.h"
#include <algorithm>

namespace webclip {

namespace {

constexpr NamingScheme ALL_SCHEMES[] = {NamingScheme::ReverseDns,
                                        NamingScheme::CapitalizedWords,
                                        NamingScheme::MimeNamespaced};

size_t index_of(NamingScheme scheme) { return static_cast<size_t>(scheme); }

// Canonical names, in NamingScheme order: ReverseDns, CapitalizedWords,
// MimeNamespaced
StandardFormat make_format(const char *category, const char *subtype,
                           const char *mac, const char *win, const char *mime) {
  StandardFormat format;
  format.type = ContentType(category, subtype);
  format.native_names = {mac, win, mime};
  return format;
}

std::vector<StandardFormat> build_known_formats() {
  std::vector<StandardFormat> formats;

  auto plain = make_format("text", "plain", "public.utf8-plain-text",
                           "CF_UNICODETEXT", "text/plain");
  plain.aliases[index_of(NamingScheme::ReverseDns)] = {"public.plain-text"};
  plain.aliases[index_of(NamingScheme::CapitalizedWords)] = {"CF_TEXT"};
  plain.aliases[index_of(NamingScheme::MimeNamespaced)] = {
      "text/plain;charset=utf-8", "UTF8_STRING", "STRING", "TEXT"};
  formats.push_back(plain);

  formats.push_back(make_format("text", "html", "public.html", "HTML Format",
                                "text/html"));
  formats.push_back(
      make_format("image", "png", "public.png", "PNG", "image/png"));
  formats.push_back(make_format("text", "uri-list", "public.url",
                                "UniformResourceLocatorW", "text/uri-list"));
  formats.push_back(make_format("image", "svg+xml", "public.svg-image",
                                "image/svg+xml", "image/svg+xml"));
  formats.push_back(make_format("text", "rtf", "public.rtf",
                                "Rich Text Format", "text/rtf"));

  return formats;
}

const StandardFormat *find_known(const ContentType &type) {
  for (const auto &format : SanitizedFormatRegistry::known_standard_formats()) {
    if (format.type == type) {
      return &format;
    }
  }
  return nullptr;
}

} // namespace

const std::vector<StandardFormat> &
SanitizedFormatRegistry::known_standard_formats() {
  static const std::vector<StandardFormat> formats = build_known_formats();
  return formats;
}

SanitizedFormatRegistry SanitizedFormatRegistry::with_defaults() {
  auto result = from_type_list({"text/plain", "text/html", "image/png"});
  return std::move(result).value();
}

Result<SanitizedFormatRegistry>
SanitizedFormatRegistry::from_type_list(const std::vector<std::string> &types) {
  SanitizedFormatRegistry registry;

  for (const auto &text : types) {
    auto parsed = ContentType::parse(text);
    if (parsed.is_error()) {
      return parsed.error();
    }

    const StandardFormat *known = find_known(parsed.value());
    if (!known) {
      return Error(ErrorCode::UnsupportedFormat,
                   "No standardized native mapping", text);
    }

    // Listing a type twice is harmless
    if (registry.is_standard(known->type)) {
      continue;
    }
    WEBCLIP_TRY(registry.add(*known));
  }

  return registry;
}

Result<void> SanitizedFormatRegistry::add(const StandardFormat &format) {
  if (is_standard(format.type)) {
    return Error(ErrorCode::InvalidArgument, "Type already registered",
                 format.type.to_string());
  }

  for (NamingScheme scheme : ALL_SCHEMES) {
    std::vector<std::string> names = format.aliases[index_of(scheme)];
    names.push_back(format.native_name(scheme));

    for (const auto &name : names) {
      if (name.empty()) {
        return Error(ErrorCode::InvalidArgument, "Empty native name",
                     format.type.to_string());
      }
      if (decode_pickled(name, scheme)) {
        return Error(ErrorCode::InvalidArgument,
                     "Native name collides with the pickled namespace", name);
      }
      for (const auto &existing : formats_) {
        const auto &aliases = existing.aliases[index_of(scheme)];
        if (existing.native_name(scheme) == name ||
            std::find(aliases.begin(), aliases.end(), name) != aliases.end()) {
          return Error(ErrorCode::InvalidArgument, "Native name already taken",
                       name);
        }
      }
    }
  }

  formats_.push_back(format);
  return Result<void>::ok();
}

bool SanitizedFormatRegistry::is_standard(const ContentType &type) const {
  return find(type) != nullptr;
}

std::optional<std::string>
SanitizedFormatRegistry::native_name(const ContentType &type,
                                     TargetPlatform platform) const {
  const StandardFormat *format = find(type);
  if (!format) {
    return std::nullopt;
  }
  return format->native_name(naming_scheme_for(platform));
}

std::optional<ContentType>
SanitizedFormatRegistry::content_type_for(const std::string &native_name,
                                          TargetPlatform platform) const {
  NamingScheme scheme = naming_scheme_for(platform);
  for (const auto &format : formats_) {
    if (format.native_name(scheme) == native_name) {
      return format.type;
    }
    const auto &aliases = format.aliases[index_of(scheme)];
    if (std::find(aliases.begin(), aliases.end(), native_name) !=
        aliases.end()) {
      return format.type;
    }
  }
  return std::nullopt;
}

std::vector<ContentType> SanitizedFormatRegistry::types() const {
  std::vector<ContentType> result;
  result.reserve(formats_.size());
  for (const auto &format : formats_) {
    result.push_back(format.type);
  }
  return result;
}

const StandardFormat *
SanitizedFormatRegistry::find(const ContentType &type) const {
  for (const auto &format : formats_) {
    if (format.type == type) {
      return &format;
    }
  }
  return nullptr;
}

} // namespace webclip

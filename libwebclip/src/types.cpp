/**
 * @file types.cpp
 * @brief Core type implementations
 */

#include "webclip/types.h"
#include <algorithm>
#include <cctype>

namespace webclip {

// ============================================================================
// TargetPlatform
// ============================================================================

const char *target_platform_name(TargetPlatform platform) {
  switch (platform) {
  case TargetPlatform::MacOS:
    return "MacOS";
  case TargetPlatform::iOS:
    return "iOS";
  case TargetPlatform::Windows:
    return "Windows";
  case TargetPlatform::Linux:
    return "Linux";
  case TargetPlatform::ChromeOS:
    return "ChromeOS";
  case TargetPlatform::Android:
    return "Android";
  case TargetPlatform::Fuchsia:
    return "Fuchsia";
  case TargetPlatform::Test:
    return "Test";
  case TargetPlatform::Headless:
    return "Headless";
  default:
    return "Unknown";
  }
}

std::optional<TargetPlatform> parse_target_platform(const std::string &name) {
  auto lower = [](std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
      return static_cast<char>(std::tolower(c));
    });
    return s;
  };

  const std::string wanted = lower(name);
  for (TargetPlatform platform : ALL_TARGET_PLATFORMS) {
    if (lower(target_platform_name(platform)) == wanted) {
      return platform;
    }
  }
  return std::nullopt;
}

TargetPlatform host_target_platform() {
#if defined(WEBCLIP_PLATFORM_ANDROID)
  return TargetPlatform::Android;
#elif defined(WEBCLIP_PLATFORM_IOS)
  return TargetPlatform::iOS;
#elif defined(WEBCLIP_PLATFORM_MACOS)
  return TargetPlatform::MacOS;
#elif defined(WEBCLIP_PLATFORM_WINDOWS)
  return TargetPlatform::Windows;
#elif defined(WEBCLIP_PLATFORM_FUCHSIA)
  return TargetPlatform::Fuchsia;
#elif defined(WEBCLIP_PLATFORM_LINUX)
  return TargetPlatform::Linux;
#else
  return TargetPlatform::Headless;
#endif
}

const char *naming_scheme_name(NamingScheme scheme) {
  switch (scheme) {
  case NamingScheme::ReverseDns:
    return "ReverseDns";
  case NamingScheme::CapitalizedWords:
    return "CapitalizedWords";
  case NamingScheme::MimeNamespaced:
    return "MimeNamespaced";
  default:
    return "Unknown";
  }
}

// ============================================================================
// Provenance
// ============================================================================

const char *provenance_name(Provenance provenance) {
  switch (provenance) {
  case Provenance::Sanitized:
    return "Sanitized";
  case Provenance::Pickled:
    return "Pickled";
  default:
    return "Unknown";
  }
}

} // namespace webclip

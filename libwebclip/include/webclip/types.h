/**
 * @file types.h
 * @brief Core type definitions for WebClip
 */

#ifndef WEBCLIP_TYPES_H
#define WEBCLIP_TYPES_H

#include "platform.h"
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace webclip {

// ============================================================================
// Basic Types
// ============================================================================

using Byte = uint8_t;
using Bytes = std::vector<Byte>;

/// Build a byte buffer from a string (no encoding change)
inline Bytes to_bytes(const std::string &text) {
  return Bytes(text.begin(), text.end());
}

/// View a byte buffer as a string (no encoding change)
inline std::string to_text(const Bytes &bytes) {
  return std::string(bytes.begin(), bytes.end());
}

// ============================================================================
// Target Platform
// ============================================================================

/// Platform whose native clipboard namespace the engine targets
enum class TargetPlatform : uint8_t {
  MacOS = 0,
  iOS = 1,
  Windows = 2,
  Linux = 3,
  ChromeOS = 4,
  Android = 5,
  Fuchsia = 6,
  Test = 7,
  Headless = 8
};

/// Every TargetPlatform value, in declaration order
constexpr TargetPlatform ALL_TARGET_PLATFORMS[] = {
    TargetPlatform::MacOS,   TargetPlatform::iOS,      TargetPlatform::Windows,
    TargetPlatform::Linux,   TargetPlatform::ChromeOS, TargetPlatform::Android,
    TargetPlatform::Fuchsia, TargetPlatform::Test,     TargetPlatform::Headless};

/**
 * @brief Naming convention used for pickled formats
 */
enum class NamingScheme : uint8_t {
  /// com.web.category.subtype
  ReverseDns = 0,

  /// Web Category Subtype
  CapitalizedWords = 1,

  /// application/web;type="category/subtype"
  MimeNamespaced = 2
};

/// Get human-readable name for a target platform
WEBCLIP_API const char *target_platform_name(TargetPlatform platform);

/// Parse a platform name (case-insensitive, as produced by
/// target_platform_name)
WEBCLIP_API std::optional<TargetPlatform>
parse_target_platform(const std::string &name);

/// Target platform matching the build host
WEBCLIP_API TargetPlatform host_target_platform();

/// Get human-readable name for a naming scheme
WEBCLIP_API const char *naming_scheme_name(NamingScheme scheme);

// ============================================================================
// Provenance
// ============================================================================

/// Which native representation a clipboard payload travels under
enum class Provenance : uint8_t { Sanitized = 0, Pickled = 1 };

WEBCLIP_API const char *provenance_name(Provenance provenance);

// ============================================================================
// Native Entries
// ============================================================================

/**
 * @brief One entry of the native clipboard format table
 */
struct NativeEntry {
  /// Platform format identifier, written verbatim to the OS clipboard
  std::string format;

  /// Payload bytes, never transformed
  Bytes data;

  bool operator==(const NativeEntry &other) const {
    return format == other.format && data == other.data;
  }
  bool operator!=(const NativeEntry &other) const { return !(*this == other); }
};

/// Ordered native entries as held by the OS clipboard at read time
using ClipboardSnapshot = std::vector<NativeEntry>;

// ============================================================================
// Cancellation
// ============================================================================

/**
 * @brief Shared cancellation flag for a single clipboard call
 *
 * Copies share the same flag. Cancelling after the native operation has
 * committed has no effect on that call.
 */
class WEBCLIP_API CancellationToken {
public:
  CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

  /// Request cancellation
  void cancel() { flag_->store(true); }

  /// Check whether cancellation was requested
  bool is_cancelled() const { return flag_->load(); }

private:
  std::shared_ptr<std::atomic<bool>> flag_;
};

} // namespace webclip

#endif // WEBCLIP_TYPES_H

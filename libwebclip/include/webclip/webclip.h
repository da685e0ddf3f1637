/**
 * @file webclip.h
 * @brief Main WebClip API Header
 *
 * WebClip resolves web clipboard content types to native clipboard format
 * names and back. Content is written either sanitized (standard platform
 * formats) or pickled (a reserved, platform-specific namespace that lets
 * custom types survive a round trip through the OS clipboard).
 *
 * Quick Start:
 * @code
 *   #include <webclip/webclip.h>
 *
 *   webclip::PicklingConfig config;
 *   config.load_defaults();
 *
 *   webclip::PicklingClipboard clipboard;
 *   clipboard.init(config, std::make_shared<webclip::MemoryClipboard>());
 *
 *   webclip::ClipboardItem item;
 *   item.set("text/plain", webclip::to_bytes("hello"));
 *   item.set("text/custom", webclip::to_bytes("payload"));
 *   item.unsanitize = {"text/custom"};
 *   clipboard.write({item}, true);
 * @endcode
 */

#ifndef WEBCLIP_WEBCLIP_H
#define WEBCLIP_WEBCLIP_H

// Core headers (in dependency order)
#include "error.h"
#include "platform.h"
#include "types.h"

// Feature modules (in dependency order)
#include "content_type.h"
#include "format_translator.h"
#include "sanitized_registry.h"
#include "unsanitize_list.h"
#include "gesture_gate.h"
#include "clipboard_item.h"
#include "write_resolver.h"
#include "read_resolver.h"
#include "native_clipboard.h"
#include "config.h"
#include "clipboard.h"

namespace webclip {

// ============================================================================
// Version Information
// ============================================================================

/// WebClip major version
constexpr int VERSION_MAJOR = 1;

/// WebClip minor version
constexpr int VERSION_MINOR = 0;

/// WebClip patch version
constexpr int VERSION_PATCH = 0;

/// WebClip version string
constexpr const char *VERSION_STRING = "1.0.0";

/**
 * @brief Version information
 */
struct VersionInfo {
  int major = VERSION_MAJOR;
  int minor = VERSION_MINOR;
  int patch = VERSION_PATCH;
  const char *version_string = VERSION_STRING;
  const char *build_date = __DATE__;
  const char *build_time = __TIME__;
};

WEBCLIP_API VersionInfo get_version();

} // namespace webclip

#endif // WEBCLIP_WEBCLIP_H

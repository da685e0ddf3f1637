/**
 * @file platform.h
 * @brief Host platform detection and export macros for WebClip
 *
 * The resolution engine itself is platform independent: the target
 * clipboard naming convention is chosen at runtime. The host detection
 * below only selects the default target platform.
 */

#ifndef WEBCLIP_PLATFORM_H
#define WEBCLIP_PLATFORM_H

// ============================================================================
// Host Platform Detection
// ============================================================================

#if defined(__ANDROID__)
#define WEBCLIP_PLATFORM_ANDROID 1
#define WEBCLIP_PLATFORM_NAME "Android"
#elif defined(__APPLE__)
#include <TargetConditionals.h>
#if TARGET_OS_IPHONE
#define WEBCLIP_PLATFORM_IOS 1
#define WEBCLIP_PLATFORM_NAME "iOS"
#else
#define WEBCLIP_PLATFORM_MACOS 1
#define WEBCLIP_PLATFORM_NAME "macOS"
#endif
#elif defined(_WIN32)
#define WEBCLIP_PLATFORM_WINDOWS 1
#define WEBCLIP_PLATFORM_NAME "Windows"
#elif defined(__Fuchsia__)
#define WEBCLIP_PLATFORM_FUCHSIA 1
#define WEBCLIP_PLATFORM_NAME "Fuchsia"
#elif defined(__linux__)
#define WEBCLIP_PLATFORM_LINUX 1
#define WEBCLIP_PLATFORM_NAME "Linux"
#else
#define WEBCLIP_PLATFORM_UNKNOWN 1
#define WEBCLIP_PLATFORM_NAME "Unknown"
#endif

// ============================================================================
// Export/Import Macros
// ============================================================================

#ifdef WEBCLIP_BUILDING_SHARED
#if defined(_WIN32)
#define WEBCLIP_API __declspec(dllexport)
#else
#define WEBCLIP_API __attribute__((visibility("default")))
#endif
#else
#define WEBCLIP_API
#endif

// ============================================================================
// Utility Macros
// ============================================================================

#define WEBCLIP_UNUSED(x) (void)(x)

#endif // WEBCLIP_PLATFORM_H

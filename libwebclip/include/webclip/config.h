/**
 * @file config.h
 * @brief Engine configuration and settings file handling for WebClip
 */

#ifndef WEBCLIP_CONFIG_H
#define WEBCLIP_CONFIG_H

#include "error.h"
#include "platform.h"
#include "read_resolver.h"
#include "sanitized_registry.h"
#include "types.h"
#include "unsanitize_list.h"
#include "write_resolver.h"
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace webclip {

// ============================================================================
// Engine Configuration
// ============================================================================

/**
 * @brief Complete configuration of the resolution engine
 */
struct PicklingConfig {
  // ========================================================================
  // Platform
  // ========================================================================

  /// Native clipboard namespace to target
  TargetPlatform target_platform = host_target_platform();

  // ========================================================================
  // Pickling
  // ========================================================================

  /// Allow unsanitized (pickled) formats at all
  bool enable_pickling = true;

  /// Read-time handling of pickled-only types nobody asked for
  PickledOnlyPolicy pickled_only_policy = PickledOnlyPolicy::Hide;

  /// Types written and read in sanitized form
  std::vector<std::string> sanitized_types = {"text/plain", "text/html",
                                              "image/png"};

  // ========================================================================
  // Limits
  // ========================================================================

  /// Most unsanitized formats per call
  size_t max_pickled_formats = DEFAULT_MAX_PICKLED_FORMATS;

  /// Longest accepted content type
  size_t max_format_length = DEFAULT_MAX_FORMAT_LENGTH;

  /// Largest payload accepted on write, in bytes (0 = unlimited)
  size_t max_payload_size = 0;

  // ========================================================================
  // Logging
  // ========================================================================

  /// Default level of webclip loggers ("trace" ... "off")
  std::string log_level = "warn";

  // ========================================================================
  // Methods
  // ========================================================================

  /// Load defaults based on platform
  void load_defaults();

  /// Validate configuration
  Result<void> validate() const;

  /// Registry holding sanitized_types
  Result<SanitizedFormatRegistry> make_registry() const;

  /// Limits applied to unsanitize lists
  UnsanitizeLimits unsanitize_limits() const;

  /// Limits applied by the write resolver
  WriteLimits write_limits() const;

  /// Get default config directory for platform
  static std::filesystem::path get_default_config_dir();
};

// ============================================================================
// Configuration Manager
// ============================================================================

/**
 * @brief Manages loading, saving, and validating configuration
 *
 * The settings file is a flat `key = value` list; `#` starts a comment
 * and `[section]` headers are ignored:
 * @code
 *   target_platform = "Linux"
 *   enable_pickling = true
 *   pickled_only_policy = "hide"
 *   sanitized_types = "text/plain, text/html, image/png"
 *   max_pickled_formats = 100
 * @endcode
 */
class WEBCLIP_API ConfigManager {
public:
  ConfigManager();
  ~ConfigManager();

  // Non-copyable
  ConfigManager(const ConfigManager &) = delete;
  ConfigManager &operator=(const ConfigManager &) = delete;

  // ========================================================================
  // Initialization
  // ========================================================================

  /**
   * @brief Initialize with config file path
   * @param config_path Path to config file (defaults are used if missing)
   * @return Success or error from loading an existing file
   */
  Result<void> init(const std::filesystem::path &config_path = {});

  // ========================================================================
  // Configuration Access
  // ========================================================================

  /**
   * @brief Get current configuration
   */
  PicklingConfig get() const;

  /**
   * @brief Set entire configuration (validated first)
   */
  Result<void> set(const PicklingConfig &config);

  /// Path of the settings file
  std::filesystem::path path() const;

  // ========================================================================
  // Persistence
  // ========================================================================

  /**
   * @brief Load configuration from file
   *
   * On error the current configuration is left unchanged.
   */
  Result<void> load();

  /**
   * @brief Save configuration to file
   */
  Result<void> save();

  /**
   * @brief Reset to defaults
   */
  void reset_defaults();

  // ========================================================================
  // Individual Settings
  // ========================================================================

  /// Set target platform
  Result<void> set_target_platform(TargetPlatform platform);

  /// Enable or disable unsanitized formats
  Result<void> set_enable_pickling(bool enabled);

  /// Set pickled-only read policy
  Result<void> set_pickled_only_policy(PickledOnlyPolicy policy);

private:
  class Impl;
  std::unique_ptr<Impl> impl_;
};

// ============================================================================
// Text Form
// ============================================================================

/// Parse settings text, starting from defaults
WEBCLIP_API Result<PicklingConfig> parse_config(const std::string &text);

/// Render a configuration as settings text
WEBCLIP_API std::string format_config(const PicklingConfig &config);

} // namespace webclip

#endif // WEBCLIP_CONFIG_H

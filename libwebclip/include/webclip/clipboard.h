/**
 * @file clipboard.h
 * @brief Pickling-aware clipboard for WebClip
 *
 * PicklingClipboard is the call-level entry point. Each call runs the same
 * pipeline:
 * - user gesture gate (only when unsanitized formats are requested)
 * - unsanitize list validation
 * - write or read resolution against the target platform
 * - exactly one call into the native clipboard
 *
 * Validation failures never reach the native clipboard, so a failed write
 * leaves the previous contents untouched.
 */

#ifndef WEBCLIP_CLIPBOARD_H
#define WEBCLIP_CLIPBOARD_H

#include "clipboard_item.h"
#include "config.h"
#include "error.h"
#include "native_clipboard.h"
#include "platform.h"
#include "types.h"
#include <future>
#include <memory>
#include <string>
#include <vector>

namespace webclip {

/**
 * @brief Clipboard front end that resolves sanitized and pickled formats
 *
 * Thread-safe. Each call works on the configuration in effect when it
 * started; set_config() does not affect calls already running.
 */
class WEBCLIP_API PicklingClipboard {
public:
  PicklingClipboard();
  ~PicklingClipboard();

  // Non-copyable
  PicklingClipboard(const PicklingClipboard &) = delete;
  PicklingClipboard &operator=(const PicklingClipboard &) = delete;

  // ========================================================================
  // Initialization
  // ========================================================================

  /**
   * @brief Initialize with configuration and native clipboard
   * @param config Engine configuration (validated)
   * @param native OS clipboard primitives
   */
  Result<void> init(const PicklingConfig &config,
                    std::shared_ptr<NativeClipboard> native);

  /**
   * @brief Release the native clipboard
   */
  void shutdown();

  /**
   * @brief Check if initialized
   */
  bool is_initialized() const;

  // ========================================================================
  // Write
  // ========================================================================

  /**
   * @brief Replace the clipboard with the given items
   *
   * @param items Items in write order, each with its own unsanitize list
   * @param has_transient_activation Caller is inside a user gesture window
   * @param token Checked right before the native write
   * @return Success, or the first gate/validation/native error. On error
   *         the clipboard is unchanged.
   */
  Result<void> write(const std::vector<ClipboardItem> &items,
                     bool has_transient_activation,
                     CancellationToken token = {});

  /**
   * @brief Asynchronous write()
   */
  std::future<Result<void>> write_async(std::vector<ClipboardItem> items,
                                        bool has_transient_activation,
                                        CancellationToken token = {});

  // ========================================================================
  // Read
  // ========================================================================

  /**
   * @brief Read the clipboard
   *
   * @param unsanitize Types the caller wants in their unsanitized form
   * @param has_transient_activation Caller is inside a user gesture window
   * @param token Checked around the native read
   * @return Zero items when nothing is exposable, otherwise one
   */
  Result<std::vector<ClipboardReadItem>>
  read(const std::vector<std::string> &unsanitize,
       bool has_transient_activation, CancellationToken token = {});

  /**
   * @brief Asynchronous read()
   */
  std::future<Result<std::vector<ClipboardReadItem>>>
  read_async(std::vector<std::string> unsanitize,
             bool has_transient_activation, CancellationToken token = {});

  /**
   * @brief List the logical types currently on the clipboard
   *
   * Sanitized types are always listed. Pickled types are listed only
   * inside a user gesture window and only when pickling is enabled.
   */
  Result<std::vector<std::string>>
  available_types(bool has_transient_activation);

  // ========================================================================
  // Configuration
  // ========================================================================

  /**
   * @brief Get current configuration
   */
  PicklingConfig get_config() const;

  /**
   * @brief Update configuration for subsequent calls
   */
  Result<void> set_config(const PicklingConfig &config);

private:
  class Impl;
  std::unique_ptr<Impl> impl_;
};

} // namespace webclip

#endif // WEBCLIP_CLIPBOARD_H

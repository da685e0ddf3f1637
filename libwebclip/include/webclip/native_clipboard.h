/**
 * @file native_clipboard.h
 * @brief OS clipboard collaborator interface
 *
 * The engine talks to the operating system clipboard only through this
 * interface: one call installs a complete ordered entry sequence, one call
 * fetches the current sequence. Implementations own any locking or
 * cross-process round trips; the engine never retries.
 */

#ifndef WEBCLIP_NATIVE_CLIPBOARD_H
#define WEBCLIP_NATIVE_CLIPBOARD_H

#include "error.h"
#include "platform.h"
#include "types.h"
#include <cstdint>
#include <mutex>
#include <optional>

namespace webclip {

/**
 * @brief Native clipboard primitives
 */
class WEBCLIP_API NativeClipboard {
public:
  virtual ~NativeClipboard() = default;

  /**
   * @brief Replace the clipboard contents with the given entries
   *
   * Must be atomic: on failure the previous contents stay in place.
   * @return Success, or NativeClipboardFailure / PermissionDenied
   */
  virtual Result<void> write(const ClipboardSnapshot &entries) = 0;

  /**
   * @brief Fetch the current clipboard contents in native order
   */
  virtual Result<ClipboardSnapshot> read() = 0;
};

/**
 * @brief In-process clipboard used for the Test and Headless platforms
 *
 * Stores the last written sequence verbatim. A failure can be injected to
 * exercise error propagation.
 */
class WEBCLIP_API MemoryClipboard : public NativeClipboard {
public:
  MemoryClipboard() = default;
  explicit MemoryClipboard(ClipboardSnapshot initial);

  Result<void> write(const ClipboardSnapshot &entries) override;
  Result<ClipboardSnapshot> read() override;

  /// Make every following call fail with this error (nullopt clears it)
  void set_failure(std::optional<Error> failure);

  /// Number of successful writes so far
  uint64_t sequence_number() const;

  /// Current contents without going through read()
  ClipboardSnapshot contents() const;

private:
  mutable std::mutex mutex_;
  ClipboardSnapshot entries_;
  std::optional<Error> failure_;
  uint64_t sequence_number_ = 0;
};

} // namespace webclip

#endif // WEBCLIP_NATIVE_CLIPBOARD_H

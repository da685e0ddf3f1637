/**
 * @file native_clipboard.cpp
 * @brief In-memory native clipboard
 */

#include "webclip/native_clipboard.h"

namespace webclip {

MemoryClipboard::MemoryClipboard(ClipboardSnapshot initial)
    : entries_(std::move(initial)) {}

Result<void> MemoryClipboard::write(const ClipboardSnapshot &entries) {
  std::lock_guard<std::mutex> lock(mutex_);

  if (failure_) {
    return *failure_;
  }

  entries_ = entries;
  ++sequence_number_;
  return Result<void>::ok();
}

Result<ClipboardSnapshot> MemoryClipboard::read() {
  std::lock_guard<std::mutex> lock(mutex_);

  if (failure_) {
    return *failure_;
  }
  return entries_;
}

void MemoryClipboard::set_failure(std::optional<Error> failure) {
  std::lock_guard<std::mutex> lock(mutex_);
  failure_ = std::move(failure);
}

uint64_t MemoryClipboard::sequence_number() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return sequence_number_;
}

ClipboardSnapshot MemoryClipboard::contents() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_;
}

} // namespace webclip

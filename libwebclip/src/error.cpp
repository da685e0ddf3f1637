/**
 * @file error.cpp
 * @brief Error handling implementation
 */

#include "webclip/error.h"
#include <sstream>

namespace webclip {

// ============================================================================
// Error Code Names
// ============================================================================

const char *error_code_name(ErrorCode code) {
  switch (code) {
  case ErrorCode::Success:
    return "Success";
  case ErrorCode::Unknown:
    return "Unknown";
  case ErrorCode::InvalidArgument:
    return "InvalidArgument";
  case ErrorCode::InvalidState:
    return "InvalidState";
  case ErrorCode::NotInitialized:
    return "NotInitialized";
  case ErrorCode::AlreadyInitialized:
    return "AlreadyInitialized";
  case ErrorCode::NotSupported:
    return "NotSupported";
  case ErrorCode::Cancelled:
    return "Cancelled";

  case ErrorCode::NoUserGesture:
    return "NoUserGesture";

  case ErrorCode::InvalidContentType:
    return "InvalidContentType";
  case ErrorCode::UnsupportedFormat:
    return "UnsupportedFormat";
  case ErrorCode::FormatLimitExceeded:
    return "FormatLimitExceeded";
  case ErrorCode::PayloadTooLarge:
    return "PayloadTooLarge";
  case ErrorCode::FormatNotFound:
    return "FormatNotFound";

  case ErrorCode::NativeClipboardFailure:
    return "NativeClipboardFailure";
  case ErrorCode::PermissionDenied:
    return "PermissionDenied";

  case ErrorCode::ConfigParseError:
    return "ConfigParseError";
  case ErrorCode::ConfigReadError:
    return "ConfigReadError";
  case ErrorCode::ConfigWriteError:
    return "ConfigWriteError";

  default:
    return "UnknownError";
  }
}

// ============================================================================
// Error Code Descriptions
// ============================================================================

const char *error_code_description(ErrorCode code) {
  switch (code) {
  case ErrorCode::Success:
    return "Operation completed successfully";
  case ErrorCode::Unknown:
    return "An unknown error occurred";
  case ErrorCode::InvalidArgument:
    return "Invalid argument provided";
  case ErrorCode::InvalidState:
    return "Operation not valid in current state";
  case ErrorCode::NotInitialized:
    return "Component not initialized";
  case ErrorCode::AlreadyInitialized:
    return "Component already initialized";
  case ErrorCode::NotSupported:
    return "Operation not supported";
  case ErrorCode::Cancelled:
    return "Operation was cancelled";

  case ErrorCode::NoUserGesture:
    return "Call is not within a transient user activation";

  case ErrorCode::InvalidContentType:
    return "Content type is not a valid category/subtype pair";
  case ErrorCode::UnsupportedFormat:
    return "Content type is neither standardized nor requested unsanitized";
  case ErrorCode::FormatLimitExceeded:
    return "Too many unsanitized formats in one call";
  case ErrorCode::PayloadTooLarge:
    return "Clipboard payload is too large";
  case ErrorCode::FormatNotFound:
    return "Requested content type is not available";

  case ErrorCode::NativeClipboardFailure:
    return "Native clipboard operation failed";
  case ErrorCode::PermissionDenied:
    return "Permission denied";

  case ErrorCode::ConfigParseError:
    return "Configuration file is malformed";
  case ErrorCode::ConfigReadError:
    return "Error reading configuration file";
  case ErrorCode::ConfigWriteError:
    return "Error writing configuration file";

  default:
    return "Unknown error occurred";
  }
}

// ============================================================================
// Recoverability
// ============================================================================

bool is_recoverable(ErrorCode code) {
  switch (code) {
  // A retry of the identical call fails the same way
  case ErrorCode::NotSupported:
  case ErrorCode::InvalidContentType:
  case ErrorCode::UnsupportedFormat:
  case ErrorCode::FormatLimitExceeded:
  case ErrorCode::PayloadTooLarge:
  case ErrorCode::ConfigParseError:
    return false;

  // All others are potentially recoverable
  default:
    return true;
  }
}

// ============================================================================
// Error::to_string
// ============================================================================

std::string Error::to_string() const {
  std::ostringstream oss;

  oss << error_code_name(code);

  if (!message.empty()) {
    oss << ": " << message;
  }

  if (!details.empty()) {
    oss << " (" << details << ")";
  }

  if (!location.empty()) {
    oss << " [" << location << "]";
  }

  return oss.str();
}

} // namespace webclip

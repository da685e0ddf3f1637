/**
 * @file gesture_gate.cpp
 * @brief Transient activation gate
 */

#include "webclip/gesture_gate.h"
#include "webclip/logging.h"

namespace webclip {

GateDecision evaluate_gesture_gate(bool has_transient_activation,
                                   bool requests_pickling) {
  if (requests_pickling && !has_transient_activation) {
    return GateDecision::DenyNoUserGesture;
  }
  return GateDecision::Allow;
}

Result<void> check_gesture_gate(bool has_transient_activation,
                                bool requests_pickling) {
  if (evaluate_gesture_gate(has_transient_activation, requests_pickling) ==
      GateDecision::DenyNoUserGesture) {
    SPDLOG_LOGGER_INFO(logging::get_or_create("webclip.gate"),
                       "Unsanitized clipboard access outside a user gesture");
    return Error(ErrorCode::NoUserGesture,
                 "Unsanitized formats require a transient user activation");
  }
  return Result<void>::ok();
}

} // namespace webclip

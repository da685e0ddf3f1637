/**
 * @file gesture_gate.h
 * @brief Transient user activation check for pickled clipboard access
 *
 * Any call that touches pickled formats must run inside a transient
 * activation window. Calls that do not request pickling always pass, so
 * the sanitized-only path behaves exactly as it would without the gate.
 */

#ifndef WEBCLIP_GESTURE_GATE_H
#define WEBCLIP_GESTURE_GATE_H

#include "error.h"
#include "platform.h"
#include <cstdint>

namespace webclip {

enum class GateDecision : uint8_t { Allow = 0, DenyNoUserGesture = 1 };

/// Pure gate rule: deny iff pickling is requested without activation
WEBCLIP_API GateDecision evaluate_gesture_gate(bool has_transient_activation,
                                               bool requests_pickling);

/**
 * @brief Gate check in Result form
 * @return Success, or NoUserGesture
 */
WEBCLIP_API Result<void> check_gesture_gate(bool has_transient_activation,
                                            bool requests_pickling);

} // namespace webclip

#endif // WEBCLIP_GESTURE_GATE_H

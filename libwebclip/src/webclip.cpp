/**
 * @file webclip.cpp
 * @brief Library version
 */

#include "webclip/webclip.h"

namespace webclip {

VersionInfo get_version() { return VersionInfo{}; }

} // namespace webclip

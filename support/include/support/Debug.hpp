#pragma once

namespace multicol::support {

/// @brief debug tracing switched on by `MULTICOL_DEBUG=1`
bool isDebug();

/// @brief debug tracing for one component.
/// enabled by `MULTICOL_DEBUG=1` or when @param component is listed in `MULTICOL_DEBUG_COMPONENTS` (separated by ';').
bool isDebug(const char *component);

} // namespace multicol::support

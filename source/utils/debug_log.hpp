#ifndef WDSESSION_DEBUG_LOG_HPP
#define WDSESSION_DEBUG_LOG_HPP

// Debug logging to stderr. stdout is reserved for wdsession responses.

#include <string>

namespace debug_log {

// Returns true if WDSESSION_DEBUG env is set to a truthy value (1, true, yes),
// unless an explicit override was installed with set_debug_override().
bool is_debug_enabled();

// Forces debug logging on or off regardless of the environment.
void set_debug_override(bool enabled);

// Drops the override installed by set_debug_override().
void clear_debug_override();

// Writes "[wdsession] <message>" to stderr when debug logging is enabled.
void log(const std::string &message);

// Writes "[wdsession] <component>: <message>" to stderr when debug logging is enabled.
void log(const std::string &component, const std::string &message);

} // namespace debug_log

#endif // WDSESSION_DEBUG_LOG_HPP

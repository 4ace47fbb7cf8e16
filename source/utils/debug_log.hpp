#ifndef POLYBUILD_DEBUG_LOG_HPP
#define POLYBUILD_DEBUG_LOG_HPP

// Console logging for polybuild. Every line goes to stderr with a [polybuild] prefix,
// so stdout stays reserved for command results and streamed tool output.

#include <string>

namespace debug_log {

enum class Level {
    Debug,
    Info,
    Warning,
    Error
};

// Returns true if POLYBUILD_DEBUG env is set to a truthy value (1, true, yes),
// or if debug output was forced on with set_debug_enabled().
bool is_debug_enabled();

// Force debug output on (used by the --debug flag).
void set_debug_enabled(bool enabled);

// Lower-case level name ("debug", "info", "warning", "error").
std::string level_name(Level level);

// Writes message at the given level. Debug lines are dropped unless is_debug_enabled().
void write(Level level, const std::string &message);

void log(const std::string &message);   // debug
void info(const std::string &message);
void warning(const std::string &message);
void error(const std::string &message);

} // namespace debug_log

#endif // POLYBUILD_DEBUG_LOG_HPP

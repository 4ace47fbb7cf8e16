#include "utils/debug_log.hpp"
#include "utils/text_utils.hpp"

#include <atomic>
#include <cstdlib>
#include <iostream>
#include <mutex>
#include <string>

namespace debug_log {

static std::atomic<bool> debug_forced{false};

// Serializes whole lines so output from parallel builds does not interleave.
static std::mutex write_mutex;

bool is_debug_enabled() {
    if (debug_forced.load()) {
        return true;
    }
    const char *value = std::getenv("POLYBUILD_DEBUG");
    if (value == nullptr || value[0] == '\0') {
        return false;
    }
    return text_utils::is_truthy(value);
}

void set_debug_enabled(bool enabled) {
    debug_forced.store(enabled);
}

std::string level_name(Level level) {
    switch (level) {
    case Level::Debug:
        return "debug";
    case Level::Info:
        return "info";
    case Level::Warning:
        return "warning";
    case Level::Error:
        return "error";
    }
    return "info";
}

void write(Level level, const std::string &message) {
    if (level == Level::Debug && !is_debug_enabled()) {
        return;
    }

    std::string prefix = "[polybuild] ";
    if (level == Level::Warning) {
        prefix += "warning: ";
    } else if (level == Level::Error) {
        prefix += "error: ";
    } else if (level == Level::Debug) {
        prefix += "debug: ";
    }

    std::lock_guard<std::mutex> lock(write_mutex);
    std::cerr << prefix << message << std::endl;
}

void log(const std::string &message) {
    write(Level::Debug, message);
}

void info(const std::string &message) {
    write(Level::Info, message);
}

void warning(const std::string &message) {
    write(Level::Warning, message);
}

void error(const std::string &message) {
    write(Level::Error, message);
}

} // namespace debug_log

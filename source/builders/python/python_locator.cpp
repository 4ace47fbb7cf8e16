#include "builders/python/python_locator.hpp"
#include "builders/builder_support.hpp"
#include "platform/platform_abi.hpp"

#include <sys/stat.h>
#include <unistd.h>

namespace python_locator {

const std::vector<std::string> COMMON_LOCATIONS = {
    "/usr/bin/python3",
    "/usr/local/bin/python3",
    "/opt/homebrew/bin/python3",  // macOS on Apple silicon
    "/opt/local/bin/python3",     // MacPorts
    "/usr/bin/python",
    "/usr/local/bin/python",
};

static bool is_executable_file(const std::string &path) {
    struct stat info;
    return stat(path.c_str(), &info) == 0 && S_ISREG(info.st_mode) && access(path.c_str(), X_OK) == 0;
}

std::string find_python_executable(const builder_abi::BuildContext &context) {
    if (!context.config.python_executable.empty()) {
        builder_support::debug(context, "Using configured Python interpreter: " + context.config.python_executable);
        return context.config.python_executable;
    }

    for (const char *name : {"python3", "python"}) {
        std::string found = platform::find_executable(name);
        if (!found.empty()) {
            builder_support::debug(context, "Found Python on PATH: " + found);
            return found;
        }
    }

    for (const auto &candidate : COMMON_LOCATIONS) {
        if (is_executable_file(candidate)) {
            builder_support::debug(context, "Found Python at " + candidate);
            return candidate;
        }
    }
    return "";
}

} // namespace python_locator

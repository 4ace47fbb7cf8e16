#ifndef POLYBUILD_PLATFORM_ABI_HPP
#define POLYBUILD_PLATFORM_ABI_HPP

// Platform abstraction interface.
// Each OS-specific implementation lives under platform/<os>/ and provides
// definitions for the functions declared here.

#include <atomic>
#include <string>
#include <vector>

namespace platform {

// How a child process is run.
struct ProcessOptions {
    // Empty means the current working directory.
    std::string working_directory;

    // Collect stdout/stderr into the result. When false (and echo_output is false)
    // the child inherits our stdout/stderr.
    bool capture_output = true;

    // Echo output live, line by line, prefixed with echo_prefix. Output is still captured.
    bool echo_output = false;
    std::string echo_prefix;

    // Polled while the child runs; once true the child gets SIGTERM, then SIGKILL
    // after kill_grace_milliseconds.
    const std::atomic<bool> *cancel_flag = nullptr;
    int kill_grace_milliseconds = 3000;
};

// Result of running a child process to completion.
struct ProcessResult {
    bool started = false;     // false if fork/exec failed (see error_message)
    bool cancelled = false;
    int exit_code = -1;       // 128 + signal number when killed by a signal
    std::string standard_output;
    std::string standard_error;
    std::string error_message;
};

// Run executable (looked up on PATH when it has no slash) with arguments and wait for it.
ProcessResult run_process(const std::string &executable,
                          const std::vector<std::string> &arguments,
                          const ProcessOptions &options);

// Search PATH for an executable regular file. Returns the full path or an empty string.
std::string find_executable(const std::string &name);

// Read the entire contents of a text file into a string.
// Returns true on success, false on failure (file not found, permission, etc.).
bool read_file_contents(const std::string &file_path, std::string &output_contents);

// Replace the contents of a file. Returns false if it could not be written.
bool write_file_contents(const std::string &file_path, const std::string &contents);

} // namespace platform

#endif // POLYBUILD_PLATFORM_ABI_HPP

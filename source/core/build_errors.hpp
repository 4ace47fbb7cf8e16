#ifndef POLYBUILD_BUILD_ERRORS_HPP
#define POLYBUILD_BUILD_ERRORS_HPP

// Helpers for constructing and rendering builder_abi::BuildError values.

#include <nlohmann/json.hpp>
#include <string>

#include "core/builder_abi.hpp"

namespace build_errors {

using json = nlohmann::json;
using builder_abi::BuildError;
using builder_abi::ErrorKind;

// "EnvironmentMissing", "ProjectNotFound", ... ("None" for ErrorKind::None).
std::string kind_name(ErrorKind kind);

BuildError make_error(ErrorKind kind, const std::string &step, const std::string &message);

// A tool exited non-zero (or could not be started). captured_output is the tool's
// stderr, falling back to stdout when stderr is empty; it is cut to max_output_bytes.
BuildError tool_failure(const std::string &step,
                        const builder_abi::CommandRequest &request,
                        const builder_abi::CommandResult &result,
                        const std::string &message,
                        size_t max_output_bytes);

// {"kind", "step", "message", "command", "exitCode", "output"}; text is UTF-8 sanitized.
json to_json(const BuildError &error);

// Multi-line description for the console: step, message, command and captured output.
std::string format(const BuildError &error);

} // namespace build_errors

#endif // POLYBUILD_BUILD_ERRORS_HPP

#ifndef POLYBUILD_COMMAND_HANDLERS_HPP
#define POLYBUILD_COMMAND_HANDLERS_HPP

// Command handler registration.
// Each command_*.cpp file provides a register function that is called during startup.

#include <atomic>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

#include "core/builder_abi.hpp"

namespace command_handlers {

using json = nlohmann::json;

// Register all commands with the CLI command registry. Running commands observe
// cancel_flag (may be null).
void register_all_commands(const std::atomic<bool> *cancel_flag);

// --- Shared by the command_*.cpp handlers ---

// The project directory argument (first positional), or "" when missing.
std::string project_directory_argument(const json &arguments);

// Effective configuration for a project: defaults, then --config or <dir>/polybuild.json,
// then the environment, then --output / --platform / --resource-group / --app-name / --python.
// false (with error_message) when a config file or flag value is invalid.
bool load_configuration(const json &arguments, const std::string &project_directory,
                        build_config::BuildConfiguration &config, std::string &error_message);

// Configuration plus the real process executor and the console sink.
bool make_context(const json &arguments, const std::string &project_directory, builder_abi::BuildContext &context,
                  std::string &error_message);

// Parsed --platform (or configured platform). Invalid names give an error message.
bool platform_argument(const builder_abi::BuildContext &context,
                       std::optional<project_platform::ProjectPlatform> &platform, std::string &error_message);

// {"isError": true, "error": {...}}; usage errors for InvalidArgument.
json error_result(const builder_abi::BuildError &error);

} // namespace command_handlers

#endif // POLYBUILD_COMMAND_HANDLERS_HPP

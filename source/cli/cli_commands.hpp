#ifndef POLYBUILD_CLI_COMMANDS_HPP
#define POLYBUILD_CLI_COMMANDS_HPP

// CLI command registry: registration, help text, and dispatch of command invocations.

#include <nlohmann/json.hpp>
#include <string>
#include <functional>
#include <vector>

namespace cli_commands {

using json = nlohmann::json;

// A command handler: receives the parsed arguments
// ({"positional": [...], "<option>": "<value>", "<flag>": true}) and returns the
// result document ({"isError": bool, ...}).
using CommandHandler = std::function<json(const json &arguments)>;

struct CommandDefinition {
    std::string name;
    std::string description;
    std::string usage;                       // e.g. "build <dir> [--output P] [--verbose]"
    std::vector<std::string> value_options;  // options taking a value, without "--"
    std::vector<std::string> flag_options;   // boolean flags, without "--"
    CommandHandler handler;
};

// Register a command. Call this during initialization for each command.
void register_command(const CommandDefinition &definition);

// nullptr when no command has that name.
const CommandDefinition *find_command(const std::string &name);

// Usage summary of every registered command.
std::string build_help_text();

// Run a registered command. Unknown names produce a usage error result.
json dispatch_command(const std::string &name, const json &arguments);

// {"isError": true, "usageError": true, "error": {"kind": "InvalidArgument", "message": ...}}
json usage_error(const std::string &message);

// true for results produced by usage_error().
bool is_usage_error(const json &result);

// Get all registered command definitions (for testing or introspection).
const std::vector<CommandDefinition> &get_registered_commands();

} // namespace cli_commands

#endif // POLYBUILD_CLI_COMMANDS_HPP

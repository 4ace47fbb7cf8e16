#ifndef POLYBUILD_CLI_ARGUMENTS_HPP
#define POLYBUILD_CLI_ARGUMENTS_HPP

// Command-line parsing into the JSON argument object handed to command handlers.

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "cli/cli_commands.hpp"

namespace cli_arguments {

using json = nlohmann::json;

// Parses the words after the command name against the command's options:
//   --name value / --name=value  for value_options  -> "name": "value"
//   --flag                       for flag_options   -> "flag": true
//   anything else                                   -> appended to "positional"
// "--" ends option parsing. Returns false (with error_message) for unknown options,
// flags given a value, and options missing their value.
bool parse(const cli_commands::CommandDefinition &command, const std::vector<std::string> &words,
           json &arguments, std::string &error_message);

// Removes every "--debug" from words. Returns true if one was present.
bool take_debug_flag(std::vector<std::string> &words);

} // namespace cli_arguments

#endif // POLYBUILD_CLI_ARGUMENTS_HPP

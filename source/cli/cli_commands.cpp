#include "cli/cli_commands.hpp"

#include <algorithm>

namespace cli_commands {

// Global command registry (module-level, not class-based).
static std::vector<CommandDefinition> registered_commands;

void register_command(const CommandDefinition &definition) {
    registered_commands.push_back(definition);
}

const CommandDefinition *find_command(const std::string &name) {
    for (const auto &command : registered_commands) {
        if (command.name == name) {
            return &command;
        }
    }
    return nullptr;
}

std::string build_help_text() {
    size_t width = 0;
    for (const auto &command : registered_commands) {
        width = std::max(width, command.usage.size());
    }

    std::string text = "Usage: polybuild <command> [arguments] [--debug]\n\nCommands:\n";
    for (const auto &command : registered_commands) {
        text += "  " + command.usage + std::string(width - command.usage.size() + 2, ' ') +
                command.description + "\n";
    }
    return text;
}

json dispatch_command(const std::string &name, const json &arguments) {
    const CommandDefinition *command = find_command(name);
    if (command == nullptr) {
        return usage_error("Unknown command: " + name + " (run 'polybuild help')");
    }
    return command->handler(arguments);
}

json usage_error(const std::string &message) {
    json result;
    result["isError"] = true;
    result["usageError"] = true;
    result["error"]["kind"] = "InvalidArgument";
    result["error"]["message"] = message;
    return result;
}

bool is_usage_error(const json &result) {
    return result.value("usageError", false);
}

const std::vector<CommandDefinition> &get_registered_commands() {
    return registered_commands;
}

} // namespace cli_commands

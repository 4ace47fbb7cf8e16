#include "command_handlers/command_handlers.hpp"
#include "cli/cli_commands.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

// Command handler for "config".
// Prints the configuration a build of the directory would use.

static json handle_config(const json &arguments) {
    std::string project_directory = command_handlers::project_directory_argument(arguments);

    build_config::BuildConfiguration config;
    std::string error_message;
    if (!command_handlers::load_configuration(arguments, project_directory, config, error_message)) {
        return cli_commands::usage_error(error_message);
    }

    json result;
    result["isError"] = false;
    result["configuration"] = build_config::to_json(config);
    return result;
}

namespace command_config {

void register_command() {
    cli_commands::register_command({
        "config",
        "Print the effective configuration",
        "config [<dir>] [--config F] [--output P] [--platform X]",
        {"config", "output", "platform", "resource-group", "app-name", "python"},
        {},
        handle_config
    });
}

} // namespace command_config

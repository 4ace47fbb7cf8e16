#include "command_handlers/command_handlers.hpp"
#include "cli/cli_commands.hpp"
#include "core/orchestrator.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

// Command handler for "clean".

static json handle_clean(const json &arguments) {
    std::string project_directory = command_handlers::project_directory_argument(arguments);
    if (project_directory.empty()) {
        return cli_commands::usage_error("Missing required argument <dir>.");
    }

    builder_abi::BuildContext context;
    std::string error_message;
    if (!command_handlers::make_context(arguments, project_directory, context, error_message)) {
        return cli_commands::usage_error(error_message);
    }
    std::optional<project_platform::ProjectPlatform> platform;
    if (!command_handlers::platform_argument(context, platform, error_message)) {
        return cli_commands::usage_error(error_message);
    }

    orchestrator::BuilderSelection selection = orchestrator::select_builder(context, project_directory, platform);
    if (!selection.success) {
        return command_handlers::error_result(selection.error);
    }

    builder_abi::StepResult step = selection.builder->clean(context, selection.project_directory);
    if (!step.success) {
        return command_handlers::error_result(step.error);
    }

    json result;
    result["isError"] = false;
    result["projectDirectory"] = selection.project_directory;
    result["platform"] = project_platform::manifest_tag(selection.platform);
    return result;
}

namespace command_clean {

void register_command() {
    cli_commands::register_command({
        "clean",
        "Remove build state of a project",
        "clean <dir> [--platform X] [--config F] [--python EXE]",
        {"platform", "config", "python"},
        {},
        handle_clean
    });
}

} // namespace command_clean

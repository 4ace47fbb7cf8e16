#include "command_handlers/command_handlers.hpp"
#include "cli/cli_commands.hpp"
#include "core/build_errors.hpp"
#include "core/orchestrator.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

// Command handler for "app-settings".
// Pushes the project's .env into the web app's settings through the platform builder.

static json handle_app_settings(const json &arguments) {
    std::string project_directory = command_handlers::project_directory_argument(arguments);
    if (project_directory.empty()) {
        return cli_commands::usage_error("Missing required argument <dir>.");
    }

    builder_abi::BuildContext context;
    std::string error_message;
    if (!command_handlers::make_context(arguments, project_directory, context, error_message)) {
        return cli_commands::usage_error(error_message);
    }
    if (context.config.resource_group.empty() || context.config.app_name.empty()) {
        return cli_commands::usage_error("--resource-group and --app-name are required.");
    }
    std::optional<project_platform::ProjectPlatform> platform;
    if (!command_handlers::platform_argument(context, platform, error_message)) {
        return cli_commands::usage_error(error_message);
    }

    orchestrator::BuilderSelection selection = orchestrator::select_builder(context, project_directory, platform);
    if (!selection.success) {
        return command_handlers::error_result(selection.error);
    }

    bool converted = selection.builder->convert_environment_to_deployment_settings(
        context, selection.project_directory, context.config.resource_group, context.config.app_name,
        arguments.value("verbose", false));
    if (!converted) {
        return command_handlers::error_result(build_errors::make_error(
            builder_abi::ErrorKind::ToolInvocationFailed, "app-settings",
            "Converting .env to app settings failed; see the messages above"));
    }

    json result;
    result["isError"] = false;
    result["projectDirectory"] = selection.project_directory;
    result["platform"] = project_platform::manifest_tag(selection.platform);
    result["resourceGroup"] = context.config.resource_group;
    result["appName"] = context.config.app_name;
    return result;
}

namespace command_app_settings {

void register_command() {
    cli_commands::register_command({
        "app-settings",
        "Set the project's .env values as web app settings",
        "app-settings <dir> --resource-group G --app-name A [--platform X] [--verbose] [--config F]",
        {"resource-group", "app-name", "platform", "config"},
        {"verbose"},
        handle_app_settings
    });
}

} // namespace command_app_settings

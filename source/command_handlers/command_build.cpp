#include "command_handlers/command_handlers.hpp"
#include "cli/cli_commands.hpp"
#include "core/orchestrator.hpp"
#include "utils/debug_log.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

// Command handler for "build".
// Runs the whole pipeline (or reuses the last artifact with --restart) and reports
// the manifest, or the step that failed.

static json handle_build(const json &arguments) {
    std::string project_directory = command_handlers::project_directory_argument(arguments);
    if (project_directory.empty()) {
        return cli_commands::usage_error("Missing required argument <dir>.");
    }

    builder_abi::BuildContext context;
    std::string error_message;
    if (!command_handlers::make_context(arguments, project_directory, context, error_message)) {
        return cli_commands::usage_error(error_message);
    }

    orchestrator::PipelineOptions options;
    if (!command_handlers::platform_argument(context, options.platform, error_message)) {
        return cli_commands::usage_error(error_message);
    }
    options.project_directory = project_directory;
    options.output_path = context.config.output_path;
    options.verbose = arguments.value("verbose", false);
    options.restart = arguments.value("restart", false);
    options.resource_group = context.config.resource_group;
    options.app_name = context.config.app_name;

    debug_log::log("build invoked for " + project_directory);
    orchestrator::PipelineResult pipeline = orchestrator::run_pipeline(context, options);

    json result = orchestrator::to_json(pipeline);
    result["isError"] = !pipeline.success;
    return result;
}

namespace command_build {

void register_command() {
    cli_commands::register_command({
        "build",
        "Detect, validate, clean, build and write the deployment manifest",
        "build <dir> [--output P] [--platform X] [--verbose] [--restart] "
        "[--resource-group G --app-name A] [--config F] [--python EXE]",
        {"output", "platform", "resource-group", "app-name", "config", "python"},
        {"verbose", "restart"},
        handle_build
    });
}

} // namespace command_build

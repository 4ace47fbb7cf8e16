#include "command_handlers/command_handlers.hpp"
#include "builders/builder_support.hpp"
#include "cli/cli_commands.hpp"
#include "core/build_errors.hpp"
#include "core/orchestrator.hpp"

#include <filesystem>
#include <nlohmann/json.hpp>
#include <system_error>

using json = nlohmann::json;

// Command handler for "manifest".
// Derives the manifest from an existing artifact directory without building.

static json handle_manifest(const json &arguments) {
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

    const json &positional = arguments["positional"];
    std::string artifact_path = positional.size() > 1
                                    ? builder_support::resolve_output_path(selection.project_directory,
                                                                           positional[1].get<std::string>())
                                    : builder_support::resolve_output_path(selection.project_directory,
                                                                           context.config.output_path);
    std::error_code exists_error;
    if (!std::filesystem::is_directory(artifact_path, exists_error)) {
        return command_handlers::error_result(build_errors::make_error(
            builder_abi::ErrorKind::ArtifactMissing, "manifest", "Artifact directory not found: " + artifact_path));
    }

    builder_abi::ManifestResult manifest_result =
        selection.builder->create_manifest(context, selection.project_directory, artifact_path);
    if (!manifest_result.success) {
        return command_handlers::error_result(manifest_result.error);
    }

    if (arguments.value("write", false) &&
        !manifest::write_files(manifest_result.manifest, artifact_path, error_message)) {
        return command_handlers::error_result(build_errors::make_error(
            builder_abi::ErrorKind::FileSystemFailed, "write-manifest", error_message));
    }

    json result;
    result["isError"] = false;
    result["artifactPath"] = artifact_path;
    result["manifest"] = manifest::to_json(manifest_result.manifest);
    return result;
}

namespace command_manifest {

void register_command() {
    cli_commands::register_command({
        "manifest",
        "Derive the deployment manifest from an existing artifact",
        "manifest <dir> [<artifact>] [--output P] [--platform X] [--write] [--config F]",
        {"output", "platform", "config", "python"},
        {"write"},
        handle_manifest
    });
}

} // namespace command_manifest

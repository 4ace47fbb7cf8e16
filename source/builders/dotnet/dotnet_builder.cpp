#include "builders/dotnet/dotnet_builder.hpp"
#include "builders/builder_support.hpp"
#include "builders/dotnet/dotnet_project.hpp"
#include "core/build_errors.hpp"
#include "utils/text_utils.hpp"

#include <filesystem>
#include <system_error>

namespace dotnet_builder {

namespace fs = std::filesystem;
using builder_abi::BuildResult;
using builder_abi::CommandRequest;
using builder_abi::CommandResult;
using builder_abi::ErrorKind;
using builder_abi::ManifestResult;
using builder_abi::StepResult;

const std::vector<std::string> PROJECT_EXTENSIONS = {".csproj", ".fsproj", ".vbproj"};

static const char DOWNLOAD_URL[] = "https://dotnet.microsoft.com/download";

static CommandRequest dotnet_request(const std::string &project_directory, std::vector<std::string> arguments) {
    CommandRequest request;
    request.program = "dotnet";
    request.arguments = std::move(arguments);
    request.working_directory = project_directory;
    return request;
}

bool validate_environment(const BuildContext &context) {
    builder_support::info(context, "Validating .NET environment...");

    CommandResult result = builder_support::execute(context, dotnet_request("", {"--version"}));
    if (!result.success) {
        builder_support::error(context, std::string(".NET SDK not found. Please install .NET SDK from ") + DOWNLOAD_URL);
        return false;
    }

    builder_support::info(context, ".NET SDK version: " + text_utils::trim(result.standard_output));
    return true;
}

StepResult clean(const BuildContext &context, const std::string &project_directory) {
    StepResult step;
    builder_support::info(context, "Cleaning .NET project...");

    auto project_file = builder_support::resolve_project_file(context, project_directory, PROJECT_EXTENSIONS);
    if (!project_file) {
        step.error = build_errors::make_error(ErrorKind::ProjectNotFound, "clean",
                                              "No .NET project file found in " + project_directory);
        return step;
    }

    CommandRequest request = dotnet_request(project_directory, {"clean", *project_file});
    CommandResult result = builder_support::execute(context, request);
    if (!result.success) {
        step.error = builder_support::tool_failure(context, "clean", request, result, "dotnet clean failed");
        return step;
    }

    step.success = true;
    return step;
}

// Fails the build when the installed SDK is older than the project's target.
// An SDK version that cannot be read only produces a warning.
static bool check_sdk_supports_target(const BuildContext &context, const std::string &project_file_path,
                                      builder_abi::BuildError &error) {
    auto target_version = dotnet_project::detect_target_runtime_version(context, project_file_path);
    if (!target_version) {
        return true;
    }

    CommandResult result = builder_support::execute(context, dotnet_request("", {"--version"}));
    if (result.cancelled) {
        error = build_errors::make_error(ErrorKind::Cancelled, "sdk-check", "sdk-check was cancelled");
        return false;
    }
    std::string sdk_version = text_utils::trim(result.standard_output);
    if (!result.success || !dotnet_project::parse_major_minor(sdk_version)) {
        builder_support::warning(context, "Could not determine the installed .NET SDK version; "
                                          "continuing with target .NET " + *target_version);
        return true;
    }

    if (!dotnet_project::sdk_supports_target(sdk_version, *target_version)) {
        error = build_errors::make_error(
            ErrorKind::EnvironmentMissing, "sdk-check",
            "The project targets .NET " + *target_version + ", but the required .NET SDK is not installed. "
            "Installed SDK version: " + sdk_version + ". Install the .NET " + *target_version +
            " SDK from " + DOWNLOAD_URL);
        return false;
    }

    builder_support::debug(context, ".NET SDK " + sdk_version + " can build target .NET " + *target_version);
    return true;
}

BuildResult build(const BuildContext &context, const std::string &project_directory,
                  const std::string &output_path, bool verbose) {
    BuildResult build_result;
    builder_support::info(context, "Building .NET project...");

    auto project_file = builder_support::resolve_project_file(context, project_directory, PROJECT_EXTENSIONS);
    if (!project_file) {
        build_result.error = build_errors::make_error(ErrorKind::ProjectNotFound, "resolve",
                                                      "No .NET project file found in " + project_directory);
        return build_result;
    }

    std::string publish_path = builder_support::resolve_output_path(project_directory, output_path);
    std::string path_error;
    if (!builder_support::output_path_is_safe(project_directory, publish_path, path_error)) {
        build_result.error = build_errors::make_error(ErrorKind::InvalidArgument, "resolve", path_error);
        return build_result;
    }

    std::string project_file_path = (fs::path(project_directory) / *project_file).string();
    if (!check_sdk_supports_target(context, project_file_path, build_result.error)) {
        return build_result;
    }

    builder_support::info(context, "Restoring NuGet packages...");
    CommandRequest restore = dotnet_request(project_directory, {"restore", *project_file});
    CommandResult restore_result = builder_support::execute(context, restore);
    if (!restore_result.success) {
        build_result.error = builder_support::tool_failure(context, "restore", restore, restore_result,
                                                           "dotnet restore failed");
        return build_result;
    }

    std::string remove_error;
    if (!builder_support::remove_directory(publish_path, remove_error)) {
        build_result.error = build_errors::make_error(ErrorKind::FileSystemFailed, "publish", remove_error);
        return build_result;
    }

    builder_support::info(context, "Publishing .NET application...");
    CommandRequest publish = dotnet_request(project_directory, {
        "publish", *project_file,
        "-c", "Release",
        "-o", publish_path,
        "--self-contained", "false",
        "--verbosity", "minimal",
    });
    CommandResult publish_result = builder_support::execute_with_output(context, publish, verbose, "[dotnet] ");
    if (!publish_result.success) {
        builder_support::error(context, "dotnet publish failed with exit code " +
                                            std::to_string(publish_result.exit_code));
        build_result.error = builder_support::tool_failure(context, "publish", publish, publish_result,
                                                           "dotnet publish failed");
        return build_result;
    }

    if (!builder_support::check_artifact(publish_path, "publish", build_result.error)) {
        return build_result;
    }

    build_result.success = true;
    build_result.artifact_path = publish_path;
    return build_result;
}

ManifestResult create_manifest(const BuildContext &context, const std::string &project_directory,
                               const std::string &artifact_path) {
    ManifestResult manifest_result;
    builder_support::info(context, "Creating Oryx manifest for .NET...");

    auto deps_files = builder_support::list_files_with_extensions(artifact_path, {".deps.json"});
    if (deps_files.empty()) {
        manifest_result.error = build_errors::make_error(
            ErrorKind::ManifestDetectionFailed, "manifest",
            "No .deps.json file found in " + artifact_path + ". Cannot determine entry point.");
        return manifest_result;
    }

    const std::string &deps_file = deps_files.front();
    std::string entry_dll = deps_file.substr(0, deps_file.size() - std::string(".deps.json").size()) + ".dll";
    builder_support::info(context, "Detected entry point: " + entry_dll);

    std::string version;
    auto project_file = builder_support::resolve_project_file(context, project_directory, PROJECT_EXTENSIONS);
    if (project_file) {
        auto detected = dotnet_project::detect_target_runtime_version(
            context, (fs::path(project_directory) / *project_file).string());
        if (detected) {
            version = *detected;
        }
    }
    if (version.empty()) {
        version = context.config.dotnet_default_version;
        builder_support::warning(context, "Could not detect .NET target version, using default " + version);
    }

    manifest_result.manifest.platform = "dotnet";
    manifest_result.manifest.version = version;
    manifest_result.manifest.command = "dotnet " + entry_dll;
    manifest_result.success = true;
    return manifest_result;
}

bool convert_environment_to_deployment_settings(const BuildContext &, const std::string &,
                                                const std::string &, const std::string &, bool) {
    return true;
}

builder_abi::PlatformBuilder make_builder() {
    builder_abi::PlatformBuilder builder;
    builder.platform = project_platform::ProjectPlatform::DotNet;
    builder.validate_environment = validate_environment;
    builder.clean = clean;
    builder.build = build;
    builder.create_manifest = create_manifest;
    builder.convert_environment_to_deployment_settings = convert_environment_to_deployment_settings;
    return builder;
}

} // namespace dotnet_builder

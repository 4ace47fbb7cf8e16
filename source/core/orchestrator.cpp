#include "core/orchestrator.hpp"
#include "builders/builder_support.hpp"
#include "core/build_errors.hpp"
#include "core/builder_registry.hpp"
#include "core/platform_detector.hpp"

#include <filesystem>
#include <system_error>

namespace orchestrator {

namespace fs = std::filesystem;
using builder_abi::ErrorKind;

static BuildError cancelled_error(const std::string &step) {
    return build_errors::make_error(ErrorKind::Cancelled, step, "cancelled before " + step);
}

static void fail(PipelineResult &result, const BuildError &error) {
    result.success = false;
    result.failed_step = error.step;
    result.error = error;
}

BuilderSelection select_builder(const BuildContext &context, const std::string &project_directory,
                                std::optional<ProjectPlatform> platform, const BuilderLookup &lookup) {
    BuilderSelection selection;

    std::error_code error;
    fs::path directory = fs::absolute(project_directory, error);
    if (error || project_directory.empty() || !fs::is_directory(directory, error)) {
        selection.error = build_errors::make_error(ErrorKind::ProjectNotFound, "resolve",
                                                   "Project directory not found: " + project_directory);
        return selection;
    }
    selection.project_directory = directory.lexically_normal().string();

    if (!platform && !context.config.platform_override.empty()) {
        platform = project_platform::parse(context.config.platform_override);
        if (!platform) {
            selection.error = build_errors::make_error(ErrorKind::InvalidArgument, "detect",
                                                       "Unknown platform '" + context.config.platform_override +
                                                           "' (expected dotnet, nodejs or python)");
            return selection;
        }
    }

    if (platform) {
        builder_support::info(context, "Using platform " + project_platform::display_name(*platform) +
                                           " (detection skipped)");
        selection.platform = *platform;
    } else {
        selection.platform = platform_detector::detect(context.diagnostics, selection.project_directory);
    }

    if (selection.platform == ProjectPlatform::Unknown) {
        selection.error = build_errors::make_error(
            ErrorKind::PlatformUndetected, "detect",
            "Could not detect the project platform in " + selection.project_directory +
                ". Expected a .NET project file, package.json or Python sources.");
        return selection;
    }

    selection.builder = lookup ? lookup(selection.platform) : nullptr;
    if (selection.builder == nullptr) {
        selection.error = build_errors::make_error(ErrorKind::PlatformUndetected, "detect",
                                                   "No builder available for platform " +
                                                       project_platform::display_name(selection.platform));
        return selection;
    }

    selection.success = true;
    return selection;
}

BuilderSelection select_builder(const BuildContext &context, const std::string &project_directory,
                                std::optional<ProjectPlatform> platform) {
    return select_builder(context, project_directory, platform, builder_registry::find_builder);
}

static void convert_settings(const BuildContext &context, const PipelineOptions &options,
                             const PlatformBuilder &builder, PipelineResult &result) {
    std::string resource_group = options.resource_group.empty() ? context.config.resource_group
                                                                : options.resource_group;
    std::string app_name = options.app_name.empty() ? context.config.app_name : options.app_name;
    if (resource_group.empty() || app_name.empty()) {
        return;
    }
    if (builder_support::is_cancelled(context)) {
        builder_support::warning(context, "Skipping app settings conversion: cancelled");
        return;
    }

    if (builder.convert_environment_to_deployment_settings(context, result.project_directory, resource_group,
                                                           app_name, options.verbose)) {
        result.settings_converted = true;
        result.completed_steps.push_back("app-settings");
    } else {
        builder_support::warning(context, "Converting .env to app settings failed; set them manually");
    }
}

// Reuses an existing artifact and the manifest written next to it.
static void restart_pipeline(const BuildContext &context, const PipelineOptions &options,
                             const BuilderLookup &lookup, PipelineResult &result) {
    std::string output_path = options.output_path.empty() ? context.config.output_path : options.output_path;
    result.artifact_path = builder_support::resolve_output_path(result.project_directory, output_path);

    std::error_code error;
    if (!fs::is_directory(result.artifact_path, error)) {
        fail(result, build_errors::make_error(ErrorKind::ArtifactMissing, "restart",
                                              "No previous build output at " + result.artifact_path +
                                                  ". Run a full build first."));
        return;
    }

    std::string error_message;
    if (!manifest::read_file(result.artifact_path, result.manifest, error_message)) {
        fail(result, build_errors::make_error(ErrorKind::ArtifactMissing, "restart", error_message));
        return;
    }
    builder_support::info(context, "Reusing build output at " + result.artifact_path);
    result.completed_steps.push_back("restart");

    auto platform = project_platform::parse(result.manifest.platform);
    const PlatformBuilder *builder = (platform && lookup) ? lookup(*platform) : nullptr;
    if (platform) {
        result.platform = *platform;
    }
    if (builder != nullptr) {
        result.builder_selected = true;
        convert_settings(context, options, *builder, result);
    }

    result.success = true;
}

PipelineResult run_pipeline(const BuildContext &context, const PipelineOptions &options,
                            const BuilderLookup &lookup) {
    PipelineResult result;

    if (options.restart) {
        std::error_code error;
        fs::path directory = fs::absolute(options.project_directory, error);
        if (error || options.project_directory.empty() || !fs::is_directory(directory, error)) {
            fail(result, build_errors::make_error(ErrorKind::ProjectNotFound, "resolve",
                                                  "Project directory not found: " + options.project_directory));
            return result;
        }
        result.project_directory = directory.lexically_normal().string();
        restart_pipeline(context, options, lookup, result);
        return result;
    }

    BuilderSelection selection = select_builder(context, options.project_directory, options.platform, lookup);
    result.project_directory = selection.project_directory;
    result.platform = selection.platform;
    if (!selection.success) {
        fail(result, selection.error);
        return result;
    }
    result.builder_selected = true;
    result.completed_steps.push_back("detect");
    const PlatformBuilder &builder = *selection.builder;

    builder_support::info(context, "Building " + project_platform::display_name(result.platform) +
                                       " project in " + result.project_directory);

    if (builder_support::is_cancelled(context)) {
        fail(result, cancelled_error("validate"));
        return result;
    }
    if (!builder.validate_environment(context)) {
        fail(result, build_errors::make_error(ErrorKind::EnvironmentMissing, "validate",
                                              project_platform::display_name(result.platform) +
                                                  " toolchain is missing or unusable; see the messages above"));
        return result;
    }
    result.completed_steps.push_back("validate");

    if (builder_support::is_cancelled(context)) {
        fail(result, cancelled_error("clean"));
        return result;
    }
    builder_abi::StepResult clean_result = builder.clean(context, result.project_directory);
    if (!clean_result.success) {
        fail(result, clean_result.error);
        return result;
    }
    result.completed_steps.push_back("clean");

    if (builder_support::is_cancelled(context)) {
        fail(result, cancelled_error("build"));
        return result;
    }
    std::string output_path = options.output_path.empty() ? context.config.output_path : options.output_path;
    builder_abi::BuildResult build_result = builder.build(context, result.project_directory, output_path,
                                                          options.verbose);
    if (!build_result.success) {
        fail(result, build_result.error);
        return result;
    }
    result.artifact_path = build_result.artifact_path;
    result.completed_steps.push_back("build");

    if (builder_support::is_cancelled(context)) {
        fail(result, cancelled_error("manifest"));
        return result;
    }
    builder_abi::ManifestResult manifest_result = builder.create_manifest(context, result.project_directory,
                                                                          result.artifact_path);
    if (!manifest_result.success) {
        fail(result, manifest_result.error);
        return result;
    }
    result.manifest = manifest_result.manifest;
    result.completed_steps.push_back("manifest");

    std::string error_message;
    if (!manifest::write_files(result.manifest, result.artifact_path, error_message)) {
        fail(result, build_errors::make_error(ErrorKind::FileSystemFailed, "write-manifest", error_message));
        return result;
    }
    result.completed_steps.push_back("write-manifest");
    builder_support::info(context, "Manifest: " + result.manifest.platform + " " + result.manifest.version +
                                       ", start command: " + result.manifest.command);

    convert_settings(context, options, builder, result);

    result.success = true;
    return result;
}

PipelineResult run_pipeline(const BuildContext &context, const PipelineOptions &options) {
    return run_pipeline(context, options, builder_registry::find_builder);
}

json to_json(const PipelineResult &result) {
    json document;
    document["success"] = result.success;
    document["projectDirectory"] = result.project_directory;
    document["platform"] = project_platform::manifest_tag(result.platform);
    document["completedSteps"] = result.completed_steps;
    if (!result.artifact_path.empty()) {
        document["artifactPath"] = result.artifact_path;
    }
    if (result.success) {
        document["manifest"] = manifest::to_json(result.manifest);
        document["settingsConverted"] = result.settings_converted;
    } else {
        document["failedStep"] = result.failed_step;
        document["error"] = build_errors::to_json(result.error);
    }
    return document;
}

} // namespace orchestrator

#include "builders/node/node_builder.hpp"
#include "builders/builder_support.hpp"
#include "core/build_errors.hpp"
#include "platform/platform_abi.hpp"
#include "utils/text_utils.hpp"

#include <filesystem>
#include <regex>
#include <system_error>
#include <vector>

namespace node_builder {

namespace fs = std::filesystem;
using builder_abi::BuildResult;
using builder_abi::CommandRequest;
using builder_abi::CommandResult;
using builder_abi::ErrorKind;
using builder_abi::ManifestResult;
using builder_abi::StepResult;

// Copied into the artifact when present.
static const std::vector<std::string> ARTIFACT_FILES = {
    "package-lock.json", "tsconfig.json", "ToolingManifest.json",
};
static const std::vector<std::string> ARTIFACT_DIRECTORIES = {"src", "dist"};
static const std::vector<std::string> ENTRY_POINTS = {"server.js", "app.js", "index.js", "main.js"};

static CommandRequest tool_request(const std::string &program, const std::string &project_directory,
                                   std::vector<std::string> arguments) {
    CommandRequest request;
    request.program = program;
    request.arguments = std::move(arguments);
    request.working_directory = project_directory;
    return request;
}

static bool read_package(const std::string &project_directory, json &package, std::string &error_message) {
    std::string path = (fs::path(project_directory) / PACKAGE_FILE_NAME).string();
    std::string contents;
    if (!platform::read_file_contents(path, contents)) {
        error_message = "No package.json found in " + project_directory;
        return false;
    }
    try {
        package = json::parse(contents);
    } catch (const json::parse_error &error) {
        error_message = "Invalid package.json: " + std::string(error.what());
        return false;
    }
    if (!package.is_object()) {
        error_message = "Invalid package.json: top level must be an object";
        return false;
    }
    return true;
}

// Non-empty string at package[section][key], or "".
static std::string script_value(const json &package, const char *section, const char *key) {
    auto section_it = package.find(section);
    if (section_it == package.end() || !section_it->is_object()) {
        return "";
    }
    auto value_it = section_it->find(key);
    if (value_it == section_it->end() || !value_it->is_string()) {
        return "";
    }
    return text_utils::trim(value_it->get<std::string>());
}

static bool has_package_file(const std::string &project_directory) {
    std::error_code error;
    return fs::is_regular_file(fs::path(project_directory) / PACKAGE_FILE_NAME, error);
}

bool validate_environment(const BuildContext &context) {
    builder_support::info(context, "Validating Node.js environment...");

    CommandResult node_result = builder_support::execute(context, tool_request("node", "", {"--version"}));
    if (!node_result.success) {
        builder_support::error(context, "Node.js not found. Please install Node.js from https://nodejs.org/");
        return false;
    }

    CommandResult npm_result = builder_support::execute(context, tool_request("npm", "", {"--version"}));
    if (!npm_result.success) {
        builder_support::error(context, "npm not found. Please install Node.js which includes npm.");
        return false;
    }

    builder_support::info(context, "Node.js version: " + text_utils::trim(node_result.standard_output));
    builder_support::info(context, "npm version: " + text_utils::trim(npm_result.standard_output));
    return true;
}

StepResult clean(const BuildContext &context, const std::string &project_directory) {
    StepResult step;
    builder_support::info(context, "Cleaning Node.js project...");

    if (!has_package_file(project_directory)) {
        step.error = build_errors::make_error(ErrorKind::ProjectNotFound, "clean",
                                              "No package.json found in " + project_directory);
        return step;
    }

    std::string node_modules = (fs::path(project_directory) / "node_modules").string();
    std::error_code error;
    if (fs::is_directory(node_modules, error)) {
        builder_support::info(context, "Removing node_modules directory...");
        std::string remove_error;
        if (!builder_support::remove_directory(node_modules, remove_error)) {
            step.error = build_errors::make_error(ErrorKind::FileSystemFailed, "clean", remove_error);
            return step;
        }
    }

    step.success = true;
    return step;
}

// Copies package files, sources, build output and top-level scripts into publish_path.
static bool assemble_artifact(const BuildContext &context, const std::string &project_directory,
                              const std::string &publish_path, std::string &error_message) {
    builder_support::info(context, "Preparing deployment package...");

    std::error_code error;
    fs::create_directories(publish_path, error);
    if (error) {
        error_message = "cannot create " + publish_path + ": " + error.message();
        return false;
    }

    fs::path source(project_directory);
    fs::path destination(publish_path);

    std::vector<std::string> files = {PACKAGE_FILE_NAME};
    files.insert(files.end(), ARTIFACT_FILES.begin(), ARTIFACT_FILES.end());
    for (const auto &script : builder_support::list_files_with_extensions(project_directory, {".js", ".ts"})) {
        files.push_back(script);
    }
    for (const auto &name : files) {
        if (!builder_support::copy_file_if_exists((source / name).string(), (destination / name).string(),
                                                  error_message)) {
            return false;
        }
    }

    for (const auto &name : ARTIFACT_DIRECTORIES) {
        if (!fs::is_directory(source / name, error)) {
            if (name == "dist") {
                builder_support::info(context, "No dist folder found in project; relying on the server-side "
                                               "build to produce runtime output.");
            }
            continue;
        }
        if (fs::equivalent(source / name, destination, error)) {
            continue;
        }
        if (name == "dist") {
            builder_support::info(context, "Found dist folder, copying to publish output...");
        }
        if (!builder_support::copy_directory((source / name).string(), (destination / name).string(), {},
                                             error_message)) {
            return false;
        }
    }

    if (!builder_support::write_deployment_file(publish_path, error_message)) {
        return false;
    }
    builder_support::info(context, "Created .deployment file to enable the server-side build");
    return true;
}

BuildResult build(const BuildContext &context, const std::string &project_directory,
                  const std::string &output_path, bool verbose) {
    BuildResult build_result;
    builder_support::info(context, "Building Node.js project...");

    std::string publish_path = builder_support::resolve_output_path(project_directory, output_path);
    std::string fs_error;
    if (!builder_support::output_path_is_safe(project_directory, publish_path, fs_error)) {
        build_result.error = build_errors::make_error(ErrorKind::InvalidArgument, "resolve", fs_error);
        return build_result;
    }
    if (!builder_support::remove_directory(publish_path, fs_error)) {
        build_result.error = build_errors::make_error(ErrorKind::FileSystemFailed, "prepare", fs_error);
        return build_result;
    }

    if (!has_package_file(project_directory)) {
        build_result.error = build_errors::make_error(ErrorKind::ProjectNotFound, "resolve",
                                                      "No package.json found in " + project_directory);
        return build_result;
    }

    builder_support::info(context, "Installing dependencies...");
    CommandRequest install = tool_request("npm", project_directory, {"ci"});
    CommandResult install_result = builder_support::execute_with_output(context, install, verbose, "[npm] ");
    if (!install_result.success) {
        if (install_result.cancelled) {
            build_result.error = builder_support::tool_failure(context, "install", install, install_result, "");
            return build_result;
        }
        builder_support::warning(context, "npm ci failed, trying npm install...");
        install = tool_request("npm", project_directory, {"install"});
        install_result = builder_support::execute_with_output(context, install, verbose, "[npm] ");
        if (!install_result.success) {
            build_result.error = builder_support::tool_failure(context, "install", install, install_result,
                                                               "npm install failed");
            return build_result;
        }
    }

    json package;
    std::string package_error;
    bool has_build_script = false;
    if (read_package(project_directory, package, package_error)) {
        has_build_script = !script_value(package, "scripts", "build").empty();
    } else {
        builder_support::warning(context, package_error + "; skipping build script detection");
    }

    if (has_build_script) {
        builder_support::info(context, "Running build script...");
        CommandRequest run_build = tool_request("npm", project_directory, {"run", "build"});
        CommandResult run_build_result = builder_support::execute_with_output(context, run_build, verbose, "[npm] ");
        if (!run_build_result.success) {
            build_result.error = builder_support::tool_failure(context, "build", run_build, run_build_result,
                                                               "npm run build failed");
            return build_result;
        }
    } else {
        builder_support::info(context, "No build script found, skipping build step");
    }

    if (!assemble_artifact(context, project_directory, publish_path, fs_error)) {
        build_result.error = build_errors::make_error(ErrorKind::FileSystemFailed, "package", fs_error);
        return build_result;
    }

    if (!builder_support::check_artifact(publish_path, "package", build_result.error)) {
        return build_result;
    }

    build_result.success = true;
    build_result.artifact_path = publish_path;
    return build_result;
}

bool derive_manifest(const json &package, const std::string &artifact_path, const std::string &default_version,
                     manifest::Manifest &result, std::string &error_message) {
    result = manifest::Manifest();
    result.platform = "nodejs";

    result.version = default_version;
    std::string engine = script_value(package, "engines", "node");
    static const std::regex digits(R"((\d+))");
    std::smatch match;
    if (std::regex_search(engine, match, digits)) {
        result.version = match[1].str();
    }

    std::string start = script_value(package, "scripts", "start");
    std::string main_file;
    auto main_it = package.find("main");
    if (main_it != package.end() && main_it->is_string()) {
        main_file = text_utils::trim(main_it->get<std::string>());
    }

    if (!start.empty()) {
        result.command = start;
    } else if (!main_file.empty()) {
        result.command = "node " + main_file;
    } else {
        std::error_code error;
        for (const auto &entry : ENTRY_POINTS) {
            if (fs::is_regular_file(fs::path(artifact_path) / entry, error)) {
                result.command = "node " + entry;
                break;
            }
        }
    }
    if (result.command.empty()) {
        error_message = "No start script, main entry or server.js/app.js/index.js/main.js found";
        return false;
    }

    if (!script_value(package, "scripts", "build").empty()) {
        result.build_required = true;
        result.build_command = "npm run build";
    }
    return true;
}

ManifestResult create_manifest(const BuildContext &context, const std::string &project_directory,
                               const std::string &artifact_path) {
    ManifestResult manifest_result;
    builder_support::info(context, "Creating Oryx manifest for Node.js...");

    json package;
    std::string error_message;
    if (!read_package(project_directory, package, error_message)) {
        ErrorKind kind = has_package_file(project_directory) ? ErrorKind::ManifestDetectionFailed
                                                             : ErrorKind::ProjectNotFound;
        manifest_result.error = build_errors::make_error(kind, "manifest", error_message);
        return manifest_result;
    }

    if (!derive_manifest(package, artifact_path, context.config.node_default_version, manifest_result.manifest,
                         error_message)) {
        manifest_result.error = build_errors::make_error(ErrorKind::ManifestDetectionFailed, "manifest",
                                                         error_message);
        return manifest_result;
    }

    if (script_value(package, "engines", "node").empty()) {
        builder_support::warning(context, "No engines.node in package.json, using default Node.js " +
                                              manifest_result.manifest.version);
    }
    builder_support::info(context, "Detected start command: " + manifest_result.manifest.command);
    if (manifest_result.manifest.build_required) {
        builder_support::info(context, "Detected build script; build command: " +
                                           manifest_result.manifest.build_command);
    }

    manifest_result.success = true;
    return manifest_result;
}

bool convert_environment_to_deployment_settings(const BuildContext &context, const std::string &project_directory,
                                                const std::string &resource_group, const std::string &app_name,
                                                bool verbose) {
    return builder_support::convert_env_to_app_settings(context, project_directory, resource_group, app_name,
                                                        verbose);
}

builder_abi::PlatformBuilder make_builder() {
    builder_abi::PlatformBuilder builder;
    builder.platform = project_platform::ProjectPlatform::NodeJs;
    builder.validate_environment = validate_environment;
    builder.clean = clean;
    builder.build = build;
    builder.create_manifest = create_manifest;
    builder.convert_environment_to_deployment_settings = convert_environment_to_deployment_settings;
    return builder;
}

} // namespace node_builder

#include "builders/python/python_builder.hpp"
#include "builders/builder_support.hpp"
#include "builders/python/python_entry_point.hpp"
#include "builders/python/python_locator.hpp"
#include "core/build_errors.hpp"
#include "platform/platform_abi.hpp"
#include "utils/text_utils.hpp"

#include <filesystem>
#include <regex>
#include <system_error>

namespace python_builder {

namespace fs = std::filesystem;
using builder_abi::BuildResult;
using builder_abi::CommandRequest;
using builder_abi::CommandResult;
using builder_abi::ErrorKind;
using builder_abi::ManifestResult;
using builder_abi::StepResult;

const std::vector<std::string> DESCRIPTOR_FILES = {"requirements.txt", "setup.py", "pyproject.toml"};

const std::vector<std::string> COPY_EXCLUSIONS = {
    "__pycache__", ".git", ".venv*", "venv", "node_modules", ".vs", ".vscode", "*.pyc", ".env",
    ".pytest_cache", "app.zip", "uv.lock", ".venv_test", ".venv_local", ".virtual", "env", "ENV",
};

// Top-level directories removed by clean.
static const std::vector<std::string> CLEAN_DIRECTORIES = {
    "__pycache__", ".pytest_cache", "*.egg-info", "build", ".venv*", "venv", ".venv_test", ".venv_local",
    ".virtual", "env", "ENV", ".mypy_cache", ".coverage", "htmlcov", ".tox", "dist_temp",
};

// Top-level files removed by clean.
static const std::vector<std::string> CLEAN_FILES = {"uv.lock", ".coverage", "pytest.ini", "tox.ini", ".env_backup"};

static const char PYTHON_DOWNLOAD_HINT[] = "Python not found. Please install Python from https://www.python.org/";

static bool is_python_project(const std::string &project_directory) {
    std::error_code error;
    for (const auto &name : DESCRIPTOR_FILES) {
        if (fs::is_regular_file(fs::path(project_directory) / name, error)) {
            return true;
        }
    }
    return !builder_support::list_files_with_extensions(project_directory, {".py"}).empty();
}

static CommandRequest python_request(const std::string &python, const std::string &working_directory,
                                     std::vector<std::string> arguments) {
    CommandRequest request;
    request.program = python;
    request.arguments = std::move(arguments);
    request.working_directory = working_directory;
    return request;
}

bool validate_environment(const BuildContext &context) {
    builder_support::info(context, "Validating Python environment...");

    std::string python = python_locator::find_python_executable(context);
    if (python.empty()) {
        builder_support::error(context, PYTHON_DOWNLOAD_HINT);
        return false;
    }

    CommandResult version_result = builder_support::execute(context, python_request(python, "", {"--version"}));
    if (!version_result.success) {
        builder_support::error(context, PYTHON_DOWNLOAD_HINT);
        return false;
    }

    CommandResult pip_result = builder_support::execute(context, python_request(python, "", {"-m", "pip", "--version"}));
    if (!pip_result.success) {
        builder_support::error(context, "pip not found. Please ensure pip is installed with Python.");
        return false;
    }

    // Older interpreters print their version on stderr.
    std::string version = text_utils::trim(version_result.standard_output);
    if (version.empty()) {
        version = text_utils::trim(version_result.standard_error);
    }
    builder_support::info(context, "Python version: " + version);
    builder_support::info(context, "pip version: " + text_utils::trim(pip_result.standard_output));
    return true;
}

static void remove_quietly(const BuildContext &context, const fs::path &path) {
    std::error_code error;
    builder_support::debug(context, "Removing " + path.filename().string() + "...");
    fs::remove_all(path, error);
    if (error) {
        builder_support::debug(context, "Could not remove " + path.filename().string() + ": " + error.message());
    }
}

StepResult clean(const BuildContext &context, const std::string &project_directory) {
    StepResult step;
    builder_support::debug(context, "Cleaning Python project...");

    if (!is_python_project(project_directory)) {
        step.error = build_errors::make_error(ErrorKind::ProjectNotFound, "clean",
                                              "No Python project (requirements.txt, setup.py, pyproject.toml "
                                              "or *.py) found in " + project_directory);
        return step;
    }

    std::vector<fs::path> directories;
    std::vector<fs::path> files;
    std::error_code error;
    fs::directory_iterator iterator(project_directory, error);
    for (; !error && iterator != fs::directory_iterator(); iterator.increment(error)) {
        std::string name = iterator->path().filename().string();
        std::error_code status_error;
        if (iterator->is_directory(status_error)) {
            if (builder_support::matches_any_pattern(name, CLEAN_DIRECTORIES)) {
                directories.push_back(iterator->path());
            }
        } else if (builder_support::matches_any_pattern(name, CLEAN_FILES)) {
            files.push_back(iterator->path());
        }
    }
    if (error) {
        builder_support::debug(context, "Could not list " + project_directory + ": " + error.message());
    }
    for (const auto &directory : directories) {
        remove_quietly(context, directory);
    }

    // *.pyc anywhere below the project, now that the removed trees are gone.
    fs::recursive_directory_iterator walker(project_directory, error);
    for (; !error && walker != fs::recursive_directory_iterator(); walker.increment(error)) {
        std::error_code status_error;
        if (walker->is_regular_file(status_error) &&
            text_utils::iends_with(walker->path().filename().string(), ".pyc")) {
            files.push_back(walker->path());
        }
    }
    if (error) {
        builder_support::debug(context, "Could not scan for *.pyc files: " + error.message());
    }
    for (const auto &file : files) {
        remove_quietly(context, file);
    }

    step.success = true;
    return step;
}

// dist/ beside the project, else dist/ in its parent directory. "" when neither exists.
static std::string find_dist_directory(const std::string &project_directory) {
    std::error_code error;
    fs::path project = fs::absolute(project_directory, error).lexically_normal();
    if (error) {
        project = fs::path(project_directory);
    }
    if (project.filename().empty()) {
        project = project.parent_path();
    }

    for (const fs::path &candidate : {project / "dist", project.parent_path() / "dist"}) {
        if (fs::is_directory(candidate, error)) {
            return candidate.string();
        }
    }
    return "";
}

static size_t count_wheels(const std::string &directory) {
    return builder_support::list_files_with_extensions(directory, {".whl"}).size();
}

BuildResult build(const BuildContext &context, const std::string &project_directory,
                  const std::string &output_path, bool verbose) {
    BuildResult build_result;

    std::string publish_path = builder_support::resolve_output_path(project_directory, output_path);
    std::string fs_error;
    if (!builder_support::output_path_is_safe(project_directory, publish_path, fs_error)) {
        build_result.error = build_errors::make_error(ErrorKind::InvalidArgument, "resolve", fs_error);
        return build_result;
    }
    builder_support::info(context, "Removing old publish directory...");
    if (!builder_support::remove_directory(publish_path, fs_error)) {
        build_result.error = build_errors::make_error(ErrorKind::FileSystemFailed, "prepare", fs_error);
        return build_result;
    }

    builder_support::info(context, "Building Python project...");
    if (!is_python_project(project_directory)) {
        build_result.error = build_errors::make_error(ErrorKind::ProjectNotFound, "resolve",
                                                      "No Python project found in " + project_directory);
        return build_result;
    }

    std::string python = python_locator::find_python_executable(context);
    if (python.empty()) {
        build_result.error = build_errors::make_error(ErrorKind::EnvironmentMissing, "compile", PYTHON_DOWNLOAD_HINT);
        return build_result;
    }

    for (const auto &file_name : builder_support::list_files_with_extensions(project_directory, {".py"})) {
        std::string file_path = (fs::path(project_directory) / file_name).string();
        CommandRequest compile = python_request(python, project_directory, {"-m", "py_compile", file_path});
        CommandResult compile_result = builder_support::execute(context, compile);
        if (!compile_result.success) {
            builder_support::error(context, "Python syntax error in " + file_name + ":\n" +
                                                text_utils::trim(compile_result.standard_error));
            build_result.error = builder_support::tool_failure(context, "compile", compile, compile_result,
                                                               "Python syntax error in " + file_name);
            return build_result;
        }
    }

    builder_support::info(context, "Copying project files...");
    std::vector<std::string> exclusions = COPY_EXCLUSIONS;
    exclusions.push_back(fs::path(output_path).filename().string());
    if (!builder_support::copy_directory(project_directory, publish_path, exclusions, fs_error)) {
        build_result.error = build_errors::make_error(ErrorKind::FileSystemFailed, "package", fs_error);
        return build_result;
    }

    // The source dist/ is never modified; wheels are copied, and built only inside the artifact.
    std::string publish_dist = (fs::path(publish_path) / "dist").string();
    std::string source_dist = find_dist_directory(project_directory);
    if (!source_dist.empty()) {
        builder_support::info(context, "Copying existing dist folder from " + source_dist + "...");
        if (!builder_support::copy_directory(source_dist, publish_dist, {}, fs_error)) {
            build_result.error = build_errors::make_error(ErrorKind::FileSystemFailed, "package", fs_error);
            return build_result;
        }
        builder_support::info(context, "Copied " + std::to_string(count_wheels(publish_dist)) + " wheel files");
    }

    if (count_wheels(publish_dist) == 0) {
        builder_support::info(context, "No local packages found in publish/dist, running uv build in publish directory...");
        CommandRequest uv_build;
        uv_build.program = "uv";
        uv_build.arguments = {"build"};
        uv_build.working_directory = publish_path;
        CommandResult uv_result = builder_support::execute_with_output(context, uv_build, verbose, "[uv] ");
        if (uv_result.cancelled) {
            build_result.error = builder_support::tool_failure(context, "package", uv_build, uv_result, "");
            return build_result;
        }
        if (!uv_result.success) {
            builder_support::warning(context, "uv build failed: " + text_utils::trim(uv_result.standard_error) +
                                                  ". Continuing without local packages.");
        } else {
            builder_support::info(context, "Built " + std::to_string(count_wheels(publish_dist)) +
                                               " local packages in publish directory");
        }
    } else {
        builder_support::info(context, "Found " + std::to_string(count_wheels(publish_dist)) +
                                           " existing wheel files in publish/dist");
    }

    std::string requirements_path = (fs::path(publish_path) / "requirements.txt").string();
    if (!platform::write_file_contents(requirements_path, REQUIREMENTS_CONTENTS)) {
        build_result.error = build_errors::make_error(ErrorKind::FileSystemFailed, "package",
                                                      "cannot write " + requirements_path);
        return build_result;
    }
    builder_support::info(context, "Created requirements.txt for deployment");

    if (!builder_support::write_deployment_file(publish_path, fs_error) ||
        !builder_support::copy_file_if_exists((fs::path(project_directory) / ".env.template").string(),
                                              (fs::path(publish_path) / ".env.template").string(), fs_error)) {
        build_result.error = build_errors::make_error(ErrorKind::FileSystemFailed, "package", fs_error);
        return build_result;
    }
    builder_support::info(context, "Excluded .env from the deployment package; set its values as app settings");

    if (!builder_support::check_artifact(publish_path, "package", build_result.error)) {
        return build_result;
    }

    build_result.success = true;
    build_result.artifact_path = publish_path;
    return build_result;
}

// runtime.txt, then the interpreter, then the configured default.
static std::string detect_python_version(const BuildContext &context, const std::string &project_directory) {
    std::string runtime;
    if (platform::read_file_contents((fs::path(project_directory) / "runtime.txt").string(), runtime)) {
        static const std::regex runtime_pattern(R"(python-(\d+\.\d+))");
        std::smatch match;
        if (std::regex_search(runtime, match, runtime_pattern)) {
            builder_support::info(context, "Detected Python version from runtime.txt: " + match[1].str());
            return match[1].str();
        }
    }

    std::string python = python_locator::find_python_executable(context);
    if (!python.empty()) {
        CommandResult result = builder_support::execute(context, python_request(python, "", {"--version"}));
        if (result.success) {
            static const std::regex version_pattern(R"(Python (\d+\.\d+))");
            std::string output = result.standard_output + result.standard_error;
            std::smatch match;
            if (std::regex_search(output, match, version_pattern)) {
                builder_support::info(context, "Detected Python version: " + match[1].str());
                return match[1].str();
            }
        }
    }

    builder_support::warning(context, "Could not detect Python version, using default " +
                                          context.config.python_default_version);
    return context.config.python_default_version;
}

ManifestResult create_manifest(const BuildContext &context, const std::string &project_directory,
                               const std::string &artifact_path) {
    ManifestResult manifest_result;
    builder_support::info(context, "Creating Oryx manifest for Python...");

    std::string version = detect_python_version(context, project_directory);

    auto command = python_entry_point::detect_start_command(context, artifact_path);
    if (!command) {
        manifest_result.error = build_errors::make_error(ErrorKind::ManifestDetectionFailed, "manifest",
                                                         "No Python file found in " + artifact_path);
        return manifest_result;
    }

    std::string runtime_path = (fs::path(artifact_path) / "runtime.txt").string();
    if (!platform::write_file_contents(runtime_path, "python-" + version)) {
        manifest_result.error = build_errors::make_error(ErrorKind::FileSystemFailed, "manifest",
                                                         "cannot write " + runtime_path);
        return manifest_result;
    }
    builder_support::info(context, "Created runtime.txt for Python version detection");

    manifest_result.manifest.platform = "python";
    manifest_result.manifest.version = version;
    manifest_result.manifest.command = *command;
    manifest_result.manifest.build_required = true;
    manifest_result.manifest.build_command = "pip install -r requirements.txt";
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
    builder.platform = project_platform::ProjectPlatform::Python;
    builder.validate_environment = validate_environment;
    builder.clean = clean;
    builder.build = build;
    builder.create_manifest = create_manifest;
    builder.convert_environment_to_deployment_settings = convert_environment_to_deployment_settings;
    return builder;
}

} // namespace python_builder

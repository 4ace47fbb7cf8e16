#include "builders/builder_support.hpp"
#include "core/build_errors.hpp"
#include "platform/platform_abi.hpp"
#include "utils/text_utils.hpp"

#include <algorithm>
#include <filesystem>
#include <system_error>

namespace builder_support {

namespace fs = std::filesystem;
using debug_log::Level;

static void emit(const BuildContext &context, Level level, const std::string &message) {
    if (context.diagnostics) {
        context.diagnostics(level, message);
    }
}

void debug(const BuildContext &context, const std::string &message) {
    emit(context, Level::Debug, message);
}

void info(const BuildContext &context, const std::string &message) {
    emit(context, Level::Info, message);
}

void warning(const BuildContext &context, const std::string &message) {
    emit(context, Level::Warning, message);
}

void error(const BuildContext &context, const std::string &message) {
    emit(context, Level::Error, message);
}

bool is_cancelled(const BuildContext &context) {
    return context.cancel_flag != nullptr && context.cancel_flag->load();
}

CommandResult execute(const BuildContext &context, const CommandRequest &request) {
    if (is_cancelled(context)) {
        CommandResult result;
        result.cancelled = true;
        result.standard_error = "cancelled before start";
        return result;
    }
    return context.executor(request);
}

CommandResult execute_with_output(const BuildContext &context, CommandRequest request, bool verbose,
                                  const std::string &output_prefix) {
    request.capture_output = true;
    request.stream_output = verbose;
    request.output_prefix = output_prefix;

    CommandResult result = execute(context, request);

    if (!verbose && !result.success && !result.cancelled) {
        std::string output = text_utils::trim(result.standard_output);
        std::string errors = text_utils::trim(result.standard_error);
        if (!output.empty()) {
            info(context, "Output:\n" + output);
        }
        if (!errors.empty()) {
            warning(context, "Warnings/Errors:\n" + errors);
        }
    }
    return result;
}

BuildError tool_failure(const BuildContext &context, const std::string &step,
                        const CommandRequest &request, const CommandResult &result,
                        const std::string &message) {
    return build_errors::tool_failure(step, request, result, message,
                                      static_cast<size_t>(context.config.max_error_output_bytes));
}

std::string resolve_output_path(const std::string &project_directory, const std::string &output_path) {
    fs::path output(output_path);
    if (output.is_absolute()) {
        return output.lexically_normal().string();
    }
    return (fs::path(project_directory) / output).lexically_normal().string();
}

bool output_path_is_safe(const std::string &project_directory, const std::string &publish_path,
                         std::string &error_message) {
    std::error_code error;
    fs::path project = fs::weakly_canonical(fs::absolute(project_directory, error), error);
    if (error) {
        error_message = "cannot resolve " + project_directory + ": " + error.message();
        return false;
    }
    fs::path publish = fs::weakly_canonical(fs::absolute(publish_path, error), error);
    if (error) {
        error_message = "cannot resolve " + publish_path + ": " + error.message();
        return false;
    }

    auto publish_part = publish.begin();
    auto project_part = project.begin();
    for (; publish_part != publish.end() && project_part != project.end(); ++publish_part, ++project_part) {
        if (publish_part->empty()) {
            break;
        }
        if (*publish_part != *project_part) {
            return true;
        }
    }
    if (publish_part != publish.end() && !publish_part->empty()) {
        return true;
    }
    error_message = "Output path " + publish_path + " contains the project directory " + project_directory +
                    "; choose a subdirectory or a path outside the project";
    return false;
}

bool check_artifact(const std::string &publish_path, const std::string &step, BuildError &error) {
    std::error_code exists_error;
    if (fs::is_directory(publish_path, exists_error)) {
        return true;
    }
    error = build_errors::make_error(builder_abi::ErrorKind::ArtifactMissing, step,
                                     "Expected publish output path not found: " + publish_path);
    return false;
}

bool remove_directory(const std::string &path, std::string &error_message) {
    std::error_code error;
    if (!fs::exists(fs::symlink_status(path, error))) {
        return true;
    }
    fs::remove_all(path, error);
    if (error) {
        error_message = "cannot remove " + path + ": " + error.message();
        return false;
    }
    return true;
}

std::vector<std::string> list_files_with_extensions(const std::string &directory,
                                                    const std::vector<std::string> &extensions) {
    std::vector<std::vector<std::string>> groups(extensions.size());

    std::error_code error;
    fs::directory_iterator iterator(directory, error);
    if (error) {
        return {};
    }
    for (; iterator != fs::directory_iterator(); iterator.increment(error)) {
        if (error) {
            break;
        }
        std::error_code status_error;
        if (!iterator->is_regular_file(status_error)) {
            continue;
        }
        std::string name = iterator->path().filename().string();
        for (size_t index = 0; index < extensions.size(); ++index) {
            if (name.size() > extensions[index].size() && text_utils::ends_with(name, extensions[index])) {
                groups[index].push_back(name);
                break;
            }
        }
    }

    std::vector<std::string> names;
    for (auto &group : groups) {
        std::sort(group.begin(), group.end());
        names.insert(names.end(), group.begin(), group.end());
    }
    return names;
}

std::optional<std::string> resolve_project_file(const BuildContext &context, const std::string &project_directory,
                                                const std::vector<std::string> &extensions) {
    std::vector<std::string> candidates = list_files_with_extensions(project_directory, extensions);
    if (candidates.empty()) {
        error(context, "No project file (" + text_utils::join(extensions, ", ") + ") found in " + project_directory);
        return std::nullopt;
    }
    if (candidates.size() > 1) {
        std::vector<std::string> ignored(candidates.begin() + 1, candidates.end());
        warning(context, "Multiple project files found. Using: " + candidates.front() +
                             " (ignored: " + text_utils::join(ignored, ", ") + ")");
    }
    return candidates.front();
}

bool matches_pattern(const std::string &name, const std::string &pattern) {
    if (pattern == "*") {
        return true;
    }
    if (text_utils::starts_with(pattern, "*.")) {
        return text_utils::iends_with(name, pattern.substr(1));
    }
    if (text_utils::ends_with(pattern, "*")) {
        return text_utils::istarts_with(name, pattern.substr(0, pattern.size() - 1));
    }
    return text_utils::iequals(name, pattern);
}

bool matches_any_pattern(const std::string &name, const std::vector<std::string> &patterns) {
    for (const auto &pattern : patterns) {
        if (matches_pattern(name, pattern)) {
            return true;
        }
    }
    return false;
}

static bool copy_tree(const fs::path &source, const fs::path &destination, const fs::path &root_destination,
                      const std::vector<std::string> &exclude_patterns, std::string &error_message) {
    std::error_code error;
    fs::create_directories(destination, error);
    if (error) {
        error_message = "cannot create " + destination.string() + ": " + error.message();
        return false;
    }

    fs::directory_iterator iterator(source, error);
    if (error) {
        error_message = "cannot read " + source.string() + ": " + error.message();
        return false;
    }
    for (; iterator != fs::directory_iterator(); iterator.increment(error)) {
        if (error) {
            error_message = "cannot read " + source.string() + ": " + error.message();
            return false;
        }
        std::string name = iterator->path().filename().string();
        if (matches_any_pattern(name, exclude_patterns)) {
            continue;
        }

        fs::path target = destination / name;
        std::error_code status_error;
        if (iterator->is_directory(status_error)) {
            // The destination may sit inside the source tree.
            if (fs::equivalent(iterator->path(), root_destination, status_error)) {
                continue;
            }
            if (!copy_tree(iterator->path(), target, root_destination, exclude_patterns, error_message)) {
                return false;
            }
            continue;
        }
        fs::copy_file(iterator->path(), target, fs::copy_options::overwrite_existing, error);
        if (error) {
            error_message = "cannot copy " + iterator->path().string() + ": " + error.message();
            return false;
        }
    }
    return true;
}

bool copy_directory(const std::string &source, const std::string &destination,
                    const std::vector<std::string> &exclude_patterns, std::string &error_message) {
    std::error_code error;
    fs::create_directories(destination, error);
    if (error) {
        error_message = "cannot create " + destination + ": " + error.message();
        return false;
    }
    return copy_tree(source, destination, destination, exclude_patterns, error_message);
}

bool copy_file_if_exists(const std::string &source, const std::string &destination, std::string &error_message) {
    std::error_code error;
    if (!fs::is_regular_file(source, error)) {
        return true;
    }
    fs::copy_file(source, destination, fs::copy_options::overwrite_existing, error);
    if (error) {
        error_message = "cannot copy " + source + ": " + error.message();
        return false;
    }
    return true;
}

bool write_deployment_file(const std::string &artifact_path, std::string &error_message) {
    std::string path = (fs::path(artifact_path) / ".deployment").string();
    if (!platform::write_file_contents(path, "[config]\nSCM_DO_BUILD_DURING_DEPLOYMENT=true\n")) {
        error_message = "cannot write " + path;
        return false;
    }
    return true;
}

std::vector<EnvironmentSetting> parse_env_file(const std::string &contents) {
    std::vector<EnvironmentSetting> settings;
    for (const auto &raw_line : text_utils::split_lines(contents)) {
        std::string line = text_utils::trim(raw_line);
        if (line.empty() || line[0] == '#') {
            continue;
        }
        size_t equals = line.find('=');
        if (equals == std::string::npos || equals == 0 || equals == line.size() - 1) {
            continue;
        }

        std::string key = text_utils::trim(line.substr(0, equals));
        std::string value = text_utils::trim(line.substr(equals + 1));
        if (value.size() >= 2 &&
            ((value.front() == '"' && value.back() == '"') || (value.front() == '\'' && value.back() == '\''))) {
            value = value.substr(1, value.size() - 2);
        }
        if (key.empty() || value.empty()) {
            continue;
        }
        settings.push_back({key, value});
    }
    return settings;
}

std::vector<std::string> build_app_settings_arguments(const std::vector<EnvironmentSetting> &settings,
                                                      const std::string &resource_group,
                                                      const std::string &app_name) {
    std::vector<std::string> arguments = {
        "webapp", "config", "appsettings", "set",
        "-g", resource_group,
        "-n", app_name,
        "--settings",
    };
    for (const auto &setting : settings) {
        arguments.push_back(setting.key + "=" + setting.value);
    }
    return arguments;
}

bool convert_env_to_app_settings(const BuildContext &context, const std::string &project_directory,
                                 const std::string &resource_group, const std::string &app_name,
                                 bool verbose) {
    std::string env_path = (fs::path(project_directory) / ".env").string();
    std::string contents;
    if (!platform::read_file_contents(env_path, contents)) {
        info(context, "No .env file found to convert to app settings");
        return true;
    }

    std::vector<EnvironmentSetting> settings = parse_env_file(contents);
    if (settings.empty()) {
        info(context, "No valid environment variables found in .env file");
        return true;
    }
    for (const auto &setting : settings) {
        debug(context, "Found environment variable: " + setting.key);
    }

    if (resource_group.empty() || app_name.empty()) {
        error(context, "Resource group and app name are required to convert .env to app settings");
        return false;
    }

    info(context, "Setting " + std::to_string(settings.size()) + " environment variables as app settings...");

    CommandRequest request;
    request.program = "az";
    request.arguments = build_app_settings_arguments(settings, resource_group, app_name);
    request.working_directory = project_directory;

    CommandResult result = execute_with_output(context, request, verbose, "[az] ");
    if (!result.success) {
        error(context, "Failed to set app settings: " + text_utils::trim(result.standard_error));
        return false;
    }

    info(context, "Converted " + std::to_string(settings.size()) + " environment variables to app settings");
    return true;
}

} // namespace builder_support

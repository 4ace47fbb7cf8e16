#include "command_handlers/command_handlers.hpp"
#include "cli/cli_commands.hpp"
#include "core/build_errors.hpp"
#include "core/process_executor.hpp"

#include <filesystem>
#include <system_error>

// Forward declarations of individual command registration functions.
// Each command_*.cpp defines its own namespace with a register_command() function.

namespace command_detect { void register_command(); }
namespace command_build { void register_command(); }
namespace command_clean { void register_command(); }
namespace command_manifest { void register_command(); }
namespace command_app_settings { void register_command(); }
namespace command_config { void register_command(); }

namespace command_handlers {

namespace fs = std::filesystem;

static const std::atomic<bool> *active_cancel_flag = nullptr;

static json handle_help(const json &) {
    json result;
    result["isError"] = false;
    result["help"] = cli_commands::build_help_text();
    return result;
}

void register_all_commands(const std::atomic<bool> *cancel_flag) {
    active_cancel_flag = cancel_flag;

    command_detect::register_command();
    command_build::register_command();
    command_clean::register_command();
    command_manifest::register_command();
    command_app_settings::register_command();
    command_config::register_command();

    cli_commands::register_command({"help", "Show this help", "help", {}, {}, handle_help});
}

std::string project_directory_argument(const json &arguments) {
    if (!arguments.contains("positional") || arguments["positional"].empty()) {
        return "";
    }
    return arguments["positional"][0].get<std::string>();
}

static void apply_option(const json &arguments, const char *name, std::string &target) {
    if (arguments.contains(name) && arguments[name].is_string()) {
        target = arguments[name].get<std::string>();
    }
}

bool load_configuration(const json &arguments, const std::string &project_directory,
                        build_config::BuildConfiguration &config, std::string &error_message) {
    config = build_config::BuildConfiguration();

    std::string config_file;
    apply_option(arguments, "config", config_file);
    if (config_file.empty() && !project_directory.empty()) {
        std::error_code error;
        fs::path candidate = fs::path(project_directory) / build_config::CONFIG_FILE_NAME;
        if (fs::is_regular_file(candidate, error)) {
            config_file = candidate.string();
        }
    }
    if (!config_file.empty() && !build_config::load_file(config_file, config, error_message)) {
        return false;
    }

    build_config::apply_environment(config);

    apply_option(arguments, "output", config.output_path);
    apply_option(arguments, "platform", config.platform_override);
    apply_option(arguments, "resource-group", config.resource_group);
    apply_option(arguments, "app-name", config.app_name);
    apply_option(arguments, "python", config.python_executable);

    if (config.output_path.empty()) {
        error_message = "--output must not be empty";
        return false;
    }
    return true;
}

bool make_context(const json &arguments, const std::string &project_directory, builder_abi::BuildContext &context,
                  std::string &error_message) {
    build_config::BuildConfiguration config;
    if (!load_configuration(arguments, project_directory, config, error_message)) {
        return false;
    }
    context = process_executor::make_default_context(config, active_cancel_flag);
    return true;
}

bool platform_argument(const builder_abi::BuildContext &context,
                       std::optional<project_platform::ProjectPlatform> &platform, std::string &error_message) {
    platform.reset();
    if (context.config.platform_override.empty()) {
        return true;
    }
    platform = project_platform::parse(context.config.platform_override);
    if (!platform) {
        error_message = "Unknown platform '" + context.config.platform_override +
                        "' (expected dotnet, nodejs or python)";
        return false;
    }
    return true;
}

json error_result(const builder_abi::BuildError &error) {
    json result;
    result["isError"] = true;
    if (error.kind == builder_abi::ErrorKind::InvalidArgument) {
        result["usageError"] = true;
    }
    result["error"] = build_errors::to_json(error);
    return result;
}

} // namespace command_handlers

#include "command_handlers/command_handlers.hpp"
#include "cli/cli_commands.hpp"
#include "core/build_errors.hpp"
#include "core/platform_detector.hpp"
#include "utils/debug_log.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

// Command handler for "detect".
// Classifies the project directory without running any tool.

static json handle_detect(const json &arguments) {
    std::string project_directory = command_handlers::project_directory_argument(arguments);
    if (project_directory.empty()) {
        return cli_commands::usage_error("Missing required argument <dir>.");
    }

    debug_log::log("detect invoked for " + project_directory);
    project_platform::ProjectPlatform platform = platform_detector::detect(project_directory);

    json result;
    result["projectDirectory"] = project_directory;
    result["platform"] = project_platform::manifest_tag(platform);
    result["displayName"] = project_platform::display_name(platform);
    result["isError"] = (platform == project_platform::ProjectPlatform::Unknown);
    if (platform == project_platform::ProjectPlatform::Unknown) {
        result["error"] = build_errors::to_json(build_errors::make_error(
            builder_abi::ErrorKind::PlatformUndetected, "detect",
            "Could not detect the project platform in " + project_directory));
    }
    return result;
}

namespace command_detect {

void register_command() {
    cli_commands::register_command({
        "detect",
        "Print the platform of a project directory",
        "detect <dir>",
        {},
        {},
        handle_detect
    });
}

} // namespace command_detect

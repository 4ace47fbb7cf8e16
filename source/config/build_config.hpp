#ifndef POLYBUILD_BUILD_CONFIG_HPP
#define POLYBUILD_BUILD_CONFIG_HPP

// Build configuration: built-in defaults, overlaid by a JSON config file
// (polybuild.json in the project directory, or --config), then by environment
// variables, then by command-line flags (applied by the CLI layer).

#include <nlohmann/json.hpp>
#include <string>

namespace build_config {

using json = nlohmann::json;

// Name of the optional per-project configuration file.
static const char CONFIG_FILE_NAME[] = "polybuild.json";

struct BuildConfiguration {
    // Artifact directory, relative to the project directory unless absolute.
    std::string output_path = "publish";

    // Forced platform ("dotnet", "nodejs", "python"); empty means detect.
    std::string platform_override;

    // Target of the environment-to-settings hook.
    std::string resource_group;
    std::string app_name;

    // Python interpreter to use instead of searching PATH and the usual install locations.
    std::string python_executable;

    // Runtime versions written into the manifest when the project does not declare one.
    std::string dotnet_default_version = "8.0";
    std::string node_default_version = "20";
    std::string python_default_version = "3.11";

    // Time between SIGTERM and SIGKILL when a running tool is cancelled.
    int kill_grace_milliseconds = 3000;

    // Cap on tool output carried inside an error (the tail is kept).
    int max_error_output_bytes = 64 * 1024;
};

// Overlay the keys present in document onto config. Unknown keys are ignored.
// Returns false (with error_message set) if a known key has the wrong type or value.
bool apply_json(const json &document, BuildConfiguration &config, std::string &error_message);

// Parse a JSON config file and overlay it. Returns false if the file cannot be read or parsed.
bool load_file(const std::string &file_path, BuildConfiguration &config, std::string &error_message);

// Overlay POLYBUILD_OUTPUT and POLYBUILD_PLATFORM when set.
void apply_environment(BuildConfiguration &config);

// Effective configuration as JSON (keys match the config file format).
json to_json(const BuildConfiguration &config);

} // namespace build_config

#endif // POLYBUILD_BUILD_CONFIG_HPP

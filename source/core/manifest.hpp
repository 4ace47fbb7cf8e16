#ifndef POLYBUILD_MANIFEST_HPP
#define POLYBUILD_MANIFEST_HPP

// Deployment manifest: the platform-independent description of how to start a
// built artifact. `command` must run as-is with the artifact directory as the
// working directory.

#include <nlohmann/json.hpp>
#include <string>

namespace manifest {

using json = nlohmann::json;

// File names written into the artifact directory.
static const char JSON_FILE_NAME[] = "polybuild-manifest.json";
static const char ORYX_FILE_NAME[] = "oryx-manifest.toml";

struct Manifest {
    std::string platform;        // "dotnet", "nodejs", "python"
    std::string version;         // runtime version, e.g. "8.0", "20", "3.11"
    std::string command;         // start command, e.g. "dotnet App.dll"
    bool build_required = false; // deployer must run build_command before starting
    std::string build_command;
};

// {"platform", "version", "command", "buildRequired", "buildCommand"}
json to_json(const Manifest &value);

// Inverse of to_json. platform, version and command are required strings.
bool from_json(const json &document, Manifest &value, std::string &error_message);

// Oryx manifest (TOML). The [build] section is only emitted when build_required.
std::string to_oryx_toml(const Manifest &value);

// Write both manifest files into artifact_path. Returns false (with error_message) on I/O failure.
bool write_files(const Manifest &value, const std::string &artifact_path, std::string &error_message);

// Read polybuild-manifest.json back from an artifact directory.
bool read_file(const std::string &artifact_path, Manifest &value, std::string &error_message);

} // namespace manifest

#endif // POLYBUILD_MANIFEST_HPP

#include "config/build_config.hpp"
#include "core/project_platform.hpp"
#include "platform/platform_abi.hpp"

#include <cstdlib>

namespace build_config {

static bool read_string(const json &document, const char *key, std::string &target, std::string &error_message) {
    if (!document.contains(key)) {
        return true;
    }
    if (!document[key].is_string()) {
        error_message = std::string("'") + key + "' must be a string";
        return false;
    }
    target = document[key].get<std::string>();
    return true;
}

static bool read_positive_int(const json &document, const char *key, int &target, std::string &error_message) {
    if (!document.contains(key)) {
        return true;
    }
    if (!document[key].is_number_integer() || document[key].get<long long>() <= 0) {
        error_message = std::string("'") + key + "' must be a positive integer";
        return false;
    }
    target = document[key].get<int>();
    return true;
}

bool apply_json(const json &document, BuildConfiguration &config, std::string &error_message) {
    if (!document.is_object()) {
        error_message = "configuration must be a JSON object";
        return false;
    }

    BuildConfiguration updated = config;
    bool ok = read_string(document, "outputPath", updated.output_path, error_message) &&
              read_string(document, "platform", updated.platform_override, error_message) &&
              read_string(document, "resourceGroup", updated.resource_group, error_message) &&
              read_string(document, "appName", updated.app_name, error_message) &&
              read_string(document, "pythonExecutable", updated.python_executable, error_message) &&
              read_positive_int(document, "killGraceMilliseconds", updated.kill_grace_milliseconds, error_message) &&
              read_positive_int(document, "maxErrorOutputBytes", updated.max_error_output_bytes, error_message);
    if (!ok) {
        return false;
    }

    if (document.contains("defaultRuntimeVersions")) {
        const json &versions = document["defaultRuntimeVersions"];
        if (!versions.is_object()) {
            error_message = "'defaultRuntimeVersions' must be an object";
            return false;
        }
        ok = read_string(versions, "dotnet", updated.dotnet_default_version, error_message) &&
             read_string(versions, "nodejs", updated.node_default_version, error_message) &&
             read_string(versions, "python", updated.python_default_version, error_message);
        if (!ok) {
            return false;
        }
    }

    if (updated.output_path.empty()) {
        error_message = "'outputPath' must not be empty";
        return false;
    }
    if (!updated.platform_override.empty() && !project_platform::parse(updated.platform_override)) {
        error_message = "'platform' must be one of dotnet, nodejs, python (got '" + updated.platform_override + "')";
        return false;
    }

    config = updated;
    return true;
}

bool load_file(const std::string &file_path, BuildConfiguration &config, std::string &error_message) {
    std::string contents;
    if (!platform::read_file_contents(file_path, contents)) {
        error_message = "cannot read configuration file: " + file_path;
        return false;
    }

    json document;
    try {
        document = json::parse(contents);
    } catch (const json::parse_error &error) {
        error_message = "invalid JSON in " + file_path + ": " + error.what();
        return false;
    }

    if (!apply_json(document, config, error_message)) {
        error_message = file_path + ": " + error_message;
        return false;
    }
    return true;
}

void apply_environment(BuildConfiguration &config) {
    const char *output = std::getenv("POLYBUILD_OUTPUT");
    if (output != nullptr && output[0] != '\0') {
        config.output_path = output;
    }
    const char *platform_name = std::getenv("POLYBUILD_PLATFORM");
    if (platform_name != nullptr && platform_name[0] != '\0') {
        config.platform_override = platform_name;
    }
}

json to_json(const BuildConfiguration &config) {
    json document;
    document["outputPath"] = config.output_path;
    document["platform"] = config.platform_override;
    document["resourceGroup"] = config.resource_group;
    document["appName"] = config.app_name;
    document["pythonExecutable"] = config.python_executable;
    document["defaultRuntimeVersions"] = {
        {"dotnet", config.dotnet_default_version},
        {"nodejs", config.node_default_version},
        {"python", config.python_default_version}
    };
    document["killGraceMilliseconds"] = config.kill_grace_milliseconds;
    document["maxErrorOutputBytes"] = config.max_error_output_bytes;
    return document;
}

} // namespace build_config

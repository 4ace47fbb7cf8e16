// Tests for configuration layering: JSON overlay, config files and environment variables.

#include <nlohmann/json.hpp>
#include <cstdlib>
#include <iostream>
#include <string>

#include "config/build_config.hpp"
#include "test_support.hpp"

using json = nlohmann::json;

namespace test_config {

// Test: Known keys overlay the defaults, unknown keys are ignored.
static bool test_apply_json_overlays_known_keys() {
    build_config::BuildConfiguration config;
    std::string error_message;
    json document = {
        {"outputPath", "out/site"},
        {"platform", "nodejs"},
        {"pythonExecutable", "/opt/python/bin/python3"},
        {"defaultRuntimeVersions", {{"dotnet", "9.0"}}},
        {"somethingElse", 42}
    };
    bool applied = build_config::apply_json(document, config, error_message);
    bool success = applied && config.output_path == "out/site" && config.platform_override == "nodejs" &&
                   config.python_executable == "/opt/python/bin/python3" &&
                   config.dotnet_default_version == "9.0" && config.node_default_version == "20";

    return test_support::report(success, "Known keys overlay defaults and unknown keys are ignored", error_message);
}

// Test: A wrongly typed key rejects the whole document and leaves the config untouched.
static bool test_apply_json_rejects_wrong_type() {
    build_config::BuildConfiguration config;
    std::string error_message;
    json document = {{"outputPath", "elsewhere"}, {"killGraceMilliseconds", "soon"}};
    bool applied = build_config::apply_json(document, config, error_message);
    bool success = !applied && config.output_path == "publish" &&
                   error_message.find("killGraceMilliseconds") != std::string::npos;

    return test_support::report(success, "Wrong types are rejected without partial updates", error_message);
}

// Test: Unsupported platform names and empty output paths are errors.
static bool test_apply_json_validates_values() {
    build_config::BuildConfiguration config;
    std::string platform_error;
    std::string output_error;
    bool platform_applied = build_config::apply_json({{"platform", "cobol"}}, config, platform_error);
    bool output_applied = build_config::apply_json({{"outputPath", ""}}, config, output_error);
    bool success = !platform_applied && !output_applied && platform_error.find("cobol") != std::string::npos;

    return test_support::report(success, "Invalid platform and empty output path are rejected");
}

// Test: A config file on disk is parsed, and malformed JSON names the file.
static bool test_load_file() {
    test_support::TempDirectory directory;
    directory.write_file("polybuild.json", "{\"outputPath\": \"dist-out\", \"appName\": \"web\"}");
    directory.write_file("broken.json", "{\"outputPath\": ");

    build_config::BuildConfiguration config;
    std::string error_message;
    bool loaded = build_config::load_file(directory.file("polybuild.json"), config, error_message);

    build_config::BuildConfiguration untouched;
    std::string broken_error;
    bool broken_loaded = build_config::load_file(directory.file("broken.json"), untouched, broken_error);

    bool success = loaded && config.output_path == "dist-out" && config.app_name == "web" && !broken_loaded &&
                   broken_error.find("broken.json") != std::string::npos;

    return test_support::report(success, "Config files load and parse errors name the file", broken_error);
}

// Test: POLYBUILD_OUTPUT and POLYBUILD_PLATFORM override the file values.
static bool test_apply_environment() {
    setenv("POLYBUILD_OUTPUT", "env-out", 1);
    setenv("POLYBUILD_PLATFORM", "python", 1);

    build_config::BuildConfiguration config;
    config.output_path = "file-out";
    build_config::apply_environment(config);

    unsetenv("POLYBUILD_OUTPUT");
    unsetenv("POLYBUILD_PLATFORM");

    bool success = config.output_path == "env-out" && config.platform_override == "python";
    return test_support::report(success, "Environment variables override configured values");
}

// Test: to_json round-trips through apply_json.
static bool test_to_json_matches_file_format() {
    build_config::BuildConfiguration config;
    config.resource_group = "rg-demo";
    config.python_default_version = "3.12";

    build_config::BuildConfiguration reloaded;
    std::string error_message;
    bool applied = build_config::apply_json(build_config::to_json(config), reloaded, error_message);
    bool success = applied && reloaded.resource_group == "rg-demo" && reloaded.python_default_version == "3.12" &&
                   reloaded.kill_grace_milliseconds == config.kill_grace_milliseconds;

    return test_support::report(success, "Effective configuration uses the config file keys", error_message);
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_apply_json_overlays_known_keys();
    all_passed &= test_apply_json_rejects_wrong_type();
    all_passed &= test_apply_json_validates_values();
    all_passed &= test_load_file();
    all_passed &= test_apply_environment();
    all_passed &= test_to_json_matches_file_format();
    return all_passed;
}

} // namespace test_config

// Tests for the build lifecycle, using a recording builder in place of the real ones.

#include <nlohmann/json.hpp>
#include <atomic>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "core/build_errors.hpp"
#include "core/orchestrator.hpp"
#include "test_support.hpp"

using json = nlohmann::json;

namespace test_orchestrator {

namespace fs = std::filesystem;
using builder_abi::ErrorKind;
using project_platform::ProjectPlatform;

// Builder whose steps append their name to calls and can be told to fail.
struct RecordingBuilder {
    std::shared_ptr<std::vector<std::string>> calls = std::make_shared<std::vector<std::string>>();
    bool environment_valid = true;
    bool build_succeeds = true;
    bool settings_succeed = true;
    builder_abi::PlatformBuilder table;

    RecordingBuilder() {
        auto log = calls;
        table.platform = ProjectPlatform::NodeJs;
        table.validate_environment = [this, log](const builder_abi::BuildContext &) {
            log->push_back("validate");
            return environment_valid;
        };
        table.clean = [log](const builder_abi::BuildContext &, const std::string &) {
            log->push_back("clean");
            builder_abi::StepResult step;
            step.success = true;
            return step;
        };
        table.build = [this, log](const builder_abi::BuildContext &, const std::string &project_directory,
                                  const std::string &output_path, bool) {
            log->push_back("build");
            builder_abi::BuildResult result;
            if (!build_succeeds) {
                result.error = build_errors::make_error(ErrorKind::ToolInvocationFailed, "install", "npm failed");
                return result;
            }
            fs::path artifact = fs::path(project_directory) / output_path;
            fs::create_directories(artifact);
            result.success = true;
            result.artifact_path = artifact.string();
            return result;
        };
        table.create_manifest = [log](const builder_abi::BuildContext &, const std::string &, const std::string &) {
            log->push_back("manifest");
            builder_abi::ManifestResult result;
            result.success = true;
            result.manifest.platform = "nodejs";
            result.manifest.version = "20";
            result.manifest.command = "npm start";
            return result;
        };
        table.convert_environment_to_deployment_settings =
            [this, log](const builder_abi::BuildContext &, const std::string &, const std::string &resource_group,
                        const std::string &app_name, bool) {
                log->push_back("settings:" + resource_group + "/" + app_name);
                return settings_succeed;
            };
    }

    RecordingBuilder(const RecordingBuilder &) = delete;
    RecordingBuilder &operator=(const RecordingBuilder &) = delete;

    orchestrator::BuilderLookup lookup() const {
        const builder_abi::PlatformBuilder *builder = &table;
        return [builder](ProjectPlatform platform) -> const builder_abi::PlatformBuilder * {
            return platform == ProjectPlatform::NodeJs ? builder : nullptr;
        };
    }
};

static orchestrator::PipelineOptions options_for(const std::string &directory) {
    orchestrator::PipelineOptions options;
    options.project_directory = directory;
    return options;
}

// Test: A successful run calls every step in order and writes both manifest files.
static bool test_full_pipeline() {
    test_support::TempDirectory project;
    project.write_file("package.json", "{}");

    RecordingBuilder builder;
    test_support::FakeToolchain toolchain;
    test_support::RecordingSink sink;
    auto context = test_support::make_context(toolchain, sink);

    auto result = orchestrator::run_pipeline(context, options_for(project.path()), builder.lookup());

    std::vector<std::string> expected_calls = {"validate", "clean", "build", "manifest"};
    std::vector<std::string> expected_steps = {"detect", "validate", "clean", "build", "manifest", "write-manifest"};
    bool success = result.success && *builder.calls == expected_calls && result.completed_steps == expected_steps &&
                   result.platform == ProjectPlatform::NodeJs && result.manifest.command == "npm start" &&
                   project.exists(std::string("publish/") + manifest::JSON_FILE_NAME) &&
                   project.exists(std::string("publish/") + manifest::ORYX_FILE_NAME) &&
                   !result.settings_converted;

    if (success) {
        std::cout << "  OK: Pipeline runs validate, clean, build, manifest and writes the manifest files"
                  << std::endl;
    } else {
        std::cout << "  FAIL: " << orchestrator::to_json(result).dump() << std::endl;
    }
    return success;
}

// Test: Failing validation stops the lifecycle before anything else is called.
static bool test_validation_failure_stops() {
    test_support::TempDirectory project;
    project.write_file("index.js", "");

    RecordingBuilder builder;
    builder.environment_valid = false;
    test_support::FakeToolchain toolchain;
    test_support::RecordingSink sink;
    auto context = test_support::make_context(toolchain, sink);

    auto result = orchestrator::run_pipeline(context, options_for(project.path()), builder.lookup());
    bool success = !result.success && result.error.kind == ErrorKind::EnvironmentMissing &&
                   result.failed_step == "validate" && builder.calls->size() == 1 &&
                   !project.exists("publish");
    return test_support::report(success, "Invalid environment stops the pipeline after validate");
}

// Test: A build failure is passed through with its step, and no manifest is created.
static bool test_build_failure_passed_through() {
    test_support::TempDirectory project;
    project.write_file("package.json", "{}");

    RecordingBuilder builder;
    builder.build_succeeds = false;
    test_support::FakeToolchain toolchain;
    test_support::RecordingSink sink;
    auto context = test_support::make_context(toolchain, sink);

    auto result = orchestrator::run_pipeline(context, options_for(project.path()), builder.lookup());
    json document = orchestrator::to_json(result);
    bool success = !result.success && result.failed_step == "install" &&
                   builder.calls->back() == "build" && document["error"]["kind"] == "ToolInvocationFailed" &&
                   !document.contains("manifest");
    return test_support::report(success, "Build errors keep their step and stop before the manifest");
}

// Test: Unknown projects never select a builder.
static bool test_unknown_platform() {
    test_support::TempDirectory project;
    project.write_file("notes.txt", "");

    RecordingBuilder builder;
    test_support::FakeToolchain toolchain;
    test_support::RecordingSink sink;
    auto context = test_support::make_context(toolchain, sink);

    auto result = orchestrator::run_pipeline(context, options_for(project.path()), builder.lookup());
    bool success = !result.success && result.error.kind == ErrorKind::PlatformUndetected &&
                   !result.builder_selected && builder.calls->empty();
    return test_support::report(success, "Unknown platform fails without selecting a builder");
}

// Test: A detected platform without a registered builder is PlatformUndetected too.
static bool test_platform_without_builder() {
    test_support::TempDirectory project;
    project.write_file("main.py", "");

    RecordingBuilder builder;
    test_support::FakeToolchain toolchain;
    test_support::RecordingSink sink;
    auto context = test_support::make_context(toolchain, sink);

    auto result = orchestrator::run_pipeline(context, options_for(project.path()), builder.lookup());
    bool success = !result.success && result.platform == ProjectPlatform::Python &&
                   result.error.kind == ErrorKind::PlatformUndetected && builder.calls->empty();
    return test_support::report(success, "Detected platform without a builder is rejected");
}

// Test: A forced platform skips detection; an invalid configured platform is an argument error.
static bool test_platform_override() {
    test_support::TempDirectory project;
    project.write_file("main.py", "");

    RecordingBuilder builder;
    test_support::FakeToolchain toolchain;
    test_support::RecordingSink sink;
    auto context = test_support::make_context(toolchain, sink);

    auto options = options_for(project.path());
    options.platform = ProjectPlatform::NodeJs;
    auto forced = orchestrator::run_pipeline(context, options, builder.lookup());

    context.config.platform_override = "fortran";
    auto invalid = orchestrator::select_builder(context, project.path(), std::nullopt, builder.lookup());

    bool success = forced.success && forced.platform == ProjectPlatform::NodeJs && !invalid.success &&
                   invalid.error.kind == ErrorKind::InvalidArgument;
    return test_support::report(success, "Forced platform skips detection, invalid override is rejected");
}

// Test: A missing project directory is ProjectNotFound.
static bool test_missing_directory() {
    test_support::TempDirectory parent;
    RecordingBuilder builder;
    test_support::FakeToolchain toolchain;
    test_support::RecordingSink sink;
    auto context = test_support::make_context(toolchain, sink);

    auto result = orchestrator::run_pipeline(context, options_for(parent.file("gone")), builder.lookup());
    bool success = !result.success && result.error.kind == ErrorKind::ProjectNotFound && builder.calls->empty();
    return test_support::report(success, "Missing project directory is ProjectNotFound");
}

// Test: The settings hook runs only with a resource group and app name, and its failure is not fatal.
static bool test_settings_hook() {
    test_support::TempDirectory project;
    project.write_file("package.json", "{}");

    RecordingBuilder builder;
    builder.settings_succeed = false;
    test_support::FakeToolchain toolchain;
    test_support::RecordingSink sink;
    build_config::BuildConfiguration config;
    config.resource_group = "rg-config";
    auto context = test_support::make_context(toolchain, sink, config);

    auto options = options_for(project.path());
    options.app_name = "web";
    auto result = orchestrator::run_pipeline(context, options, builder.lookup());

    bool success = result.success && !result.settings_converted && builder.calls->back() == "settings:rg-config/web" &&
                   sink.contains(debug_log::Level::Warning, "app settings");
    return test_support::report(success, "Settings hook uses config fallback and failures only warn");
}

// Test: Cancellation before the first step stops the pipeline with Cancelled.
static bool test_cancelled_pipeline() {
    test_support::TempDirectory project;
    project.write_file("package.json", "{}");

    std::atomic<bool> cancel(true);
    RecordingBuilder builder;
    test_support::FakeToolchain toolchain;
    test_support::RecordingSink sink;
    auto context = test_support::make_context(toolchain, sink);
    context.cancel_flag = &cancel;

    auto result = orchestrator::run_pipeline(context, options_for(project.path()), builder.lookup());
    bool success = !result.success && result.error.kind == ErrorKind::Cancelled && builder.calls->empty();
    return test_support::report(success, "Cancelled pipeline calls no builder step");
}

// Test: Restart without a previous build is ArtifactMissing; with one it reuses the manifest.
static bool test_restart() {
    test_support::TempDirectory project;
    project.write_file("package.json", "{}");

    RecordingBuilder builder;
    test_support::FakeToolchain toolchain;
    test_support::RecordingSink sink;
    auto context = test_support::make_context(toolchain, sink);

    auto options = options_for(project.path());
    options.restart = true;
    auto without_artifact = orchestrator::run_pipeline(context, options, builder.lookup());

    auto full = orchestrator::run_pipeline(context, options_for(project.path()), builder.lookup());
    builder.calls->clear();
    auto restarted = orchestrator::run_pipeline(context, options, builder.lookup());

    bool success = !without_artifact.success && without_artifact.error.kind == ErrorKind::ArtifactMissing &&
                   full.success && restarted.success && builder.calls->empty() &&
                   restarted.manifest.command == "npm start" && restarted.platform == ProjectPlatform::NodeJs &&
                   restarted.completed_steps == std::vector<std::string>{"restart"};
    return test_support::report(success, "Restart needs a previous build and reuses its manifest");
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_full_pipeline();
    all_passed &= test_validation_failure_stops();
    all_passed &= test_build_failure_passed_through();
    all_passed &= test_unknown_platform();
    all_passed &= test_platform_without_builder();
    all_passed &= test_platform_override();
    all_passed &= test_missing_directory();
    all_passed &= test_settings_hook();
    all_passed &= test_cancelled_pipeline();
    all_passed &= test_restart();
    return all_passed;
}

} // namespace test_orchestrator

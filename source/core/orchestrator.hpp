#ifndef POLYBUILD_ORCHESTRATOR_HPP
#define POLYBUILD_ORCHESTRATOR_HPP

// Runs the build lifecycle for one project directory:
//   detect -> validate -> clean -> build -> manifest -> write manifest files
//   [-> push .env into deployment settings]
// stopping at the first failure. Every outcome is returned as a PipelineResult.

#include <functional>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

#include "core/builder_abi.hpp"

namespace orchestrator {

using json = nlohmann::json;
using builder_abi::BuildContext;
using builder_abi::BuildError;
using builder_abi::PlatformBuilder;
using project_platform::ProjectPlatform;

// Maps a platform to its builder; nullptr when there is none.
using BuilderLookup = std::function<const PlatformBuilder *(ProjectPlatform platform)>;

struct PipelineOptions {
    std::string project_directory;
    std::string output_path;                // empty = context.config.output_path
    std::optional<ProjectPlatform> platform; // skip detection; else context.config.platform_override, else detect
    bool verbose = false;

    // Reuse the artifact of a previous build instead of building again.
    bool restart = false;

    // The settings hook runs only when both are set (after falling back to the config).
    std::string resource_group;
    std::string app_name;
};

struct PipelineResult {
    bool success = false;
    std::string project_directory;          // absolute
    ProjectPlatform platform = ProjectPlatform::Unknown;
    bool builder_selected = false;
    std::vector<std::string> completed_steps;
    std::string failed_step;
    BuildError error;
    std::string artifact_path;
    manifest::Manifest manifest;
    bool settings_converted = false;
};

// Directory, platform and builder for single-step commands.
struct BuilderSelection {
    bool success = false;
    std::string project_directory;
    ProjectPlatform platform = ProjectPlatform::Unknown;
    const PlatformBuilder *builder = nullptr;
    BuildError error;
};

BuilderSelection select_builder(const BuildContext &context, const std::string &project_directory,
                                std::optional<ProjectPlatform> platform, const BuilderLookup &lookup);

// Uses the built-in builder table.
BuilderSelection select_builder(const BuildContext &context, const std::string &project_directory,
                                std::optional<ProjectPlatform> platform);

PipelineResult run_pipeline(const BuildContext &context, const PipelineOptions &options,
                            const BuilderLookup &lookup);

// Uses the built-in builder table.
PipelineResult run_pipeline(const BuildContext &context, const PipelineOptions &options);

// {"success", "projectDirectory", "platform", "completedSteps", "artifactPath",
//  "manifest", "failedStep", "error", "settingsConverted"}
json to_json(const PipelineResult &result);

} // namespace orchestrator

#endif // POLYBUILD_ORCHESTRATOR_HPP

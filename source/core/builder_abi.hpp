#ifndef POLYBUILD_BUILDER_ABI_HPP
#define POLYBUILD_BUILDER_ABI_HPP

// Platform builder abstraction interface.
// Each platform builder (.NET, Node.js, Python) fills in a PlatformBuilder table.
// The orchestrator only talks to builders through this table, and builders only
// reach the outside world through the BuildContext they are handed, so the same
// builder can serve any number of project directories, including concurrently.

#include <atomic>
#include <functional>
#include <string>
#include <vector>

#include "config/build_config.hpp"
#include "core/manifest.hpp"
#include "core/project_platform.hpp"
#include "utils/debug_log.hpp"

namespace builder_abi {

using project_platform::ProjectPlatform;

// --- Command execution boundary ---

// One external tool invocation.
struct CommandRequest {
    std::string program;
    std::vector<std::string> arguments;
    std::string working_directory;  // empty = current directory
    bool capture_output = true;
    bool stream_output = false;     // echo live (still captured)
    std::string output_prefix;      // prepended to echoed lines
};

// Outcome of one tool invocation. success means started and exit code 0.
struct CommandResult {
    bool success = false;
    int exit_code = -1;
    bool cancelled = false;
    std::string standard_output;
    std::string standard_error;
};

using CommandExecutor = std::function<CommandResult(const CommandRequest &request)>;

// Receives every diagnostic line a builder produces.
using DiagnosticsSink = std::function<void(debug_log::Level level, const std::string &message)>;

// Shared, read-only state for one orchestration. Never mutated by builders.
struct BuildContext {
    CommandExecutor executor;
    DiagnosticsSink diagnostics;
    const std::atomic<bool> *cancel_flag = nullptr;
    build_config::BuildConfiguration config;
};

// --- Errors ---

enum class ErrorKind {
    None,
    EnvironmentMissing,       // toolchain absent or too old; user must install it
    ProjectNotFound,          // no project descriptor in the directory
    ToolInvocationFailed,     // tool exited non-zero; captured_output holds its stderr
    ArtifactMissing,          // tool reported success but the artifact is not there
    FileSystemFailed,         // artifact directory could not be removed, created or filled
    ManifestDetectionFailed,  // no unambiguous entry point in the artifact
    PlatformUndetected,       // detector returned Unknown (or no builder for the platform)
    Cancelled,
    InvalidArgument
};

struct BuildError {
    ErrorKind kind = ErrorKind::None;
    std::string step;             // e.g. "clean", "restore", "publish", "manifest"
    std::string command_line;     // the tool invocation that failed, if any
    std::string message;
    std::string captured_output;  // verbatim tool output (tail, if very long)
    int exit_code = 0;
};

// --- Lifecycle results ---

struct StepResult {
    bool success = false;
    BuildError error;
};

struct BuildResult {
    bool success = false;
    std::string artifact_path;
    BuildError error;
};

struct ManifestResult {
    bool success = false;
    manifest::Manifest manifest;
    BuildError error;
};

// --- The builder contract ---
//
// The orchestrator calls validate_environment, clean, build and create_manifest in
// that order, each only after the previous one succeeded. Steps for one project
// directory must never overlap; two builds writing the same output path at the
// same time leave it in an undefined state.
struct PlatformBuilder {
    ProjectPlatform platform = ProjectPlatform::Unknown;

    // Probe the toolchain. false (after logging a remediation hint) if it is unusable.
    std::function<bool(const BuildContext &context)> validate_environment;

    // Remove prior build state for the project.
    std::function<StepResult(const BuildContext &context, const std::string &project_directory)> clean;

    // Restore dependencies and produce the artifact directory at output_path
    // (relative to project_directory unless absolute). Any previous artifact
    // directory is deleted first. An output_path that is the project directory or
    // one of its parents is rejected with InvalidArgument before anything is removed.
    std::function<BuildResult(const BuildContext &context, const std::string &project_directory,
                              const std::string &output_path, bool verbose)> build;

    // Derive the manifest from the produced artifact. Never rebuilds and never touches
    // the project. The Python builder writes runtime.txt into the artifact so the
    // host picks the same interpreter version; the others only read.
    std::function<ManifestResult(const BuildContext &context, const std::string &project_directory,
                                 const std::string &artifact_path)> create_manifest;

    // Push .env values into the deployment target's settings. true when there is nothing to do.
    std::function<bool(const BuildContext &context, const std::string &project_directory,
                       const std::string &resource_group, const std::string &app_name, bool verbose)>
        convert_environment_to_deployment_settings;
};

} // namespace builder_abi

#endif // POLYBUILD_BUILDER_ABI_HPP

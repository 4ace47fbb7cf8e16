#ifndef POLYBUILD_DOTNET_BUILDER_HPP
#define POLYBUILD_DOTNET_BUILDER_HPP

// .NET builder: dotnet CLI restore/publish of the single top-level project file
// (*.csproj, *.fsproj, *.vbproj). The manifest starts the published entry assembly.

#include <string>
#include <vector>

#include "core/builder_abi.hpp"

namespace dotnet_builder {

using builder_abi::BuildContext;

// Descriptor extensions in resolution order.
extern const std::vector<std::string> PROJECT_EXTENSIONS;

// `dotnet --version`. Logs the SDK version, or an install hint when the SDK is missing.
bool validate_environment(const BuildContext &context);

// `dotnet clean <project>`.
builder_abi::StepResult clean(const BuildContext &context, const std::string &project_directory);

// SDK/target compatibility check, `dotnet restore`, then
// `dotnet publish -c Release -o <output> --self-contained false`.
builder_abi::BuildResult build(const BuildContext &context, const std::string &project_directory,
                               const std::string &output_path, bool verbose);

// Entry assembly from the first *.deps.json in the artifact, runtime version from
// the project's target framework.
builder_abi::ManifestResult create_manifest(const BuildContext &context, const std::string &project_directory,
                                            const std::string &artifact_path);

// Nothing to convert for .NET; always true.
bool convert_environment_to_deployment_settings(const BuildContext &context, const std::string &project_directory,
                                                const std::string &resource_group, const std::string &app_name,
                                                bool verbose);

builder_abi::PlatformBuilder make_builder();

} // namespace dotnet_builder

#endif // POLYBUILD_DOTNET_BUILDER_HPP

#ifndef POLYBUILD_NODE_BUILDER_HPP
#define POLYBUILD_NODE_BUILDER_HPP

// Node.js builder: npm install and optional `npm run build`, then an artifact
// holding package.json, sources and build output for a server-side npm install.

#include <nlohmann/json.hpp>
#include <string>

#include "core/builder_abi.hpp"

namespace node_builder {

using json = nlohmann::json;
using builder_abi::BuildContext;

static const char PACKAGE_FILE_NAME[] = "package.json";

// `node --version` and `npm --version`.
bool validate_environment(const BuildContext &context);

// Removes node_modules. ProjectNotFound without package.json.
builder_abi::StepResult clean(const BuildContext &context, const std::string &project_directory);

// `npm ci` (falling back to `npm install`), `npm run build` when package.json
// declares a build script, then assembles the artifact directory.
builder_abi::BuildResult build(const BuildContext &context, const std::string &project_directory,
                               const std::string &output_path, bool verbose);

// Start command and Node version from package.json.
builder_abi::ManifestResult create_manifest(const BuildContext &context, const std::string &project_directory,
                                            const std::string &artifact_path);

// .env -> az webapp config appsettings.
bool convert_environment_to_deployment_settings(const BuildContext &context, const std::string &project_directory,
                                                const std::string &resource_group, const std::string &app_name,
                                                bool verbose);

// Manifest derivation from an already parsed package.json; exposed for tests.
// false (with error_message) when no start command can be found.
bool derive_manifest(const json &package, const std::string &artifact_path, const std::string &default_version,
                     manifest::Manifest &result, std::string &error_message);

builder_abi::PlatformBuilder make_builder();

} // namespace node_builder

#endif // POLYBUILD_NODE_BUILDER_HPP

#ifndef POLYBUILD_BUILDER_SUPPORT_HPP
#define POLYBUILD_BUILDER_SUPPORT_HPP

// Helpers shared by the platform builders: diagnostics shortcuts, tool execution,
// artifact directory handling, and the .env -> app settings conversion.

#include <optional>
#include <string>
#include <vector>

#include "core/builder_abi.hpp"

namespace builder_support {

using builder_abi::BuildContext;
using builder_abi::BuildError;
using builder_abi::CommandRequest;
using builder_abi::CommandResult;

// --- Diagnostics ---

void debug(const BuildContext &context, const std::string &message);
void info(const BuildContext &context, const std::string &message);
void warning(const BuildContext &context, const std::string &message);
void error(const BuildContext &context, const std::string &message);

bool is_cancelled(const BuildContext &context);

// --- Tool execution ---

// Run a tool and capture its output silently.
CommandResult execute(const BuildContext &context, const CommandRequest &request);

// Run a build step. With verbose the output streams live under output_prefix; otherwise
// it is captured, and replayed to the diagnostics sink only if the tool fails.
CommandResult execute_with_output(const BuildContext &context, CommandRequest request, bool verbose,
                                  const std::string &output_prefix);

// Error for a failed request, with output cut to the configured limit.
BuildError tool_failure(const BuildContext &context, const std::string &step,
                        const CommandRequest &request, const CommandResult &result,
                        const std::string &message);

// --- Filesystem ---

// Resolve output_path against project_directory unless it is absolute.
std::string resolve_output_path(const std::string &project_directory, const std::string &output_path);

// false (with error_message) when publish_path is project_directory or one of its
// parents, so replacing the artifact would delete the project itself.
bool output_path_is_safe(const std::string &project_directory, const std::string &publish_path,
                         std::string &error_message);

// Build postcondition: publish_path must exist as a directory once the build step
// reports success. Otherwise error is ArtifactMissing for step.
bool check_artifact(const std::string &publish_path, const std::string &step, BuildError &error);

// Remove a directory tree if it exists. false (with error_message) if it could not be removed.
bool remove_directory(const std::string &path, std::string &error_message);

// Top-level regular files of directory whose names end with one of extensions,
// grouped by extension order, then sorted by name within each group.
std::vector<std::string> list_files_with_extensions(const std::string &directory,
                                                    const std::vector<std::string> &extensions);

// Pick the project descriptor among the top-level files ending in extensions (see
// list_files_with_extensions for the order). With several candidates the first is
// used and a warning names it and the ignored ones. nullopt when there is none.
std::optional<std::string> resolve_project_file(const BuildContext &context, const std::string &project_directory,
                                                const std::vector<std::string> &extensions);

// Case-insensitive name match: exact name, "*.ext" suffix, or "prefix*".
bool matches_pattern(const std::string &name, const std::string &pattern);
bool matches_any_pattern(const std::string &name, const std::vector<std::string> &patterns);

// Copy a directory tree, skipping entries (at any depth) whose name matches an exclusion.
// A destination nested inside source is never copied into itself.
bool copy_directory(const std::string &source, const std::string &destination,
                    const std::vector<std::string> &exclude_patterns, std::string &error_message);

// Copy source to destination if source exists. true when there was nothing to copy.
bool copy_file_if_exists(const std::string &source, const std::string &destination, std::string &error_message);

// .deployment file asking the host to build during deployment.
bool write_deployment_file(const std::string &artifact_path, std::string &error_message);

// --- .env conversion ---

struct EnvironmentSetting {
    std::string key;
    std::string value;
};

// Parse KEY=VALUE lines; blank lines and # comments are skipped, surrounding quotes removed.
// Lines with an empty key or empty value are ignored.
std::vector<EnvironmentSetting> parse_env_file(const std::string &contents);

// Arguments for `az webapp config appsettings set` carrying every setting.
std::vector<std::string> build_app_settings_arguments(const std::vector<EnvironmentSetting> &settings,
                                                      const std::string &resource_group,
                                                      const std::string &app_name);

// Push project_directory/.env into the web app's settings with a single az call.
// true when there is no .env, or nothing in it, or the call succeeded.
bool convert_env_to_app_settings(const BuildContext &context, const std::string &project_directory,
                                 const std::string &resource_group, const std::string &app_name,
                                 bool verbose);

} // namespace builder_support

#endif // POLYBUILD_BUILDER_SUPPORT_HPP

#ifndef POLYBUILD_DOTNET_PROJECT_HPP
#define POLYBUILD_DOTNET_PROJECT_HPP

// Inspection of .NET project files and SDK version strings.

#include <optional>
#include <utility>
#include <string>

#include "core/builder_abi.hpp"

namespace dotnet_project {

// Runtime version ("8.0", "9.0") from <TargetFramework> or <TargetFrameworks> in
// project file contents. With several frameworks the first one wins.
// nullopt when there is no target framework or it is not a netX.Y moniker.
std::optional<std::string> parse_target_runtime_version(const std::string &project_contents,
                                                        std::string &target_framework);

// Same, reading the file and reporting what was found through the context.
std::optional<std::string> detect_target_runtime_version(const builder_abi::BuildContext &context,
                                                         const std::string &project_file_path);

// {major, minor} from "9.0.308" or "8.0". nullopt if there is no leading N.N.
std::optional<std::pair<int, int>> parse_major_minor(const std::string &version);

// true when an SDK of sdk_version can build for runtime target_version (SDKs build
// every older target). Both are "major.minor[...]" strings.
bool sdk_supports_target(const std::string &sdk_version, const std::string &target_version);

} // namespace dotnet_project

#endif // POLYBUILD_DOTNET_PROJECT_HPP

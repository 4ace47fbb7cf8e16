#ifndef POLYBUILD_PROJECT_PLATFORM_HPP
#define POLYBUILD_PROJECT_PLATFORM_HPP

// Technology stack of a project directory, as classified by the platform detector.

#include <optional>
#include <string>

namespace project_platform {

enum class ProjectPlatform {
    Unknown,
    DotNet,   // C#, F#, VB.NET
    NodeJs,   // JavaScript / TypeScript
    Python
};

// Human-readable name: ".NET", "Node.js", "Python", "Unknown".
std::string display_name(ProjectPlatform platform);

// Tag written into deployment manifests: "dotnet", "nodejs", "python", "unknown".
std::string manifest_tag(ProjectPlatform platform);

// Parse user input such as "dotnet", ".net", "node", "nodejs", "python" (case-insensitive).
// Returns nullopt for anything else, including "unknown".
std::optional<ProjectPlatform> parse(const std::string &text);

} // namespace project_platform

#endif // POLYBUILD_PROJECT_PLATFORM_HPP

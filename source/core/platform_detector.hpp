#ifndef POLYBUILD_PLATFORM_DETECTOR_HPP
#define POLYBUILD_PLATFORM_DETECTOR_HPP

// Classifies a project directory by the marker files at its top level.
//
// Priority (first match wins):
//   1. .NET     any *.csproj, *.fsproj or *.vbproj
//   2. Node.js  package.json, or any *.js / *.ts file
//   3. Python   requirements.txt, setup.py, pyproject.toml, or any *.py file
//   4. Unknown
//
// Only the top level is inspected; project files in subdirectories never count.
// A directory holding both a .csproj and a package.json is .NET by design;
// point the detector at the subdirectory to build the other project.

#include <string>

#include "core/builder_abi.hpp"

namespace platform_detector {

using project_platform::ProjectPlatform;

// Never throws. A missing, non-directory or unreadable path yields Unknown and an
// error line on diagnostics.
ProjectPlatform detect(const builder_abi::DiagnosticsSink &diagnostics, const std::string &project_path);

// Same, logging to the console.
ProjectPlatform detect(const std::string &project_path);

} // namespace platform_detector

#endif // POLYBUILD_PLATFORM_DETECTOR_HPP

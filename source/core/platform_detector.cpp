#include "core/platform_detector.hpp"
#include "core/process_executor.hpp"
#include "utils/text_utils.hpp"

#include <filesystem>
#include <system_error>
#include <vector>

namespace platform_detector {

namespace fs = std::filesystem;
using debug_log::Level;

static const std::vector<std::string> DOTNET_EXTENSIONS = {".csproj", ".fsproj", ".vbproj"};
static const std::vector<std::string> NODE_EXTENSIONS = {".js", ".ts"};
static const std::vector<std::string> NODE_MARKERS = {"package.json"};
static const std::vector<std::string> PYTHON_EXTENSIONS = {".py"};
static const std::vector<std::string> PYTHON_MARKERS = {"requirements.txt", "setup.py", "pyproject.toml"};

// Top-level regular file names of a directory.
struct DirectoryListing {
    bool readable = false;
    std::vector<std::string> file_names;
};

static DirectoryListing list_files(const fs::path &directory) {
    DirectoryListing listing;
    std::error_code error;
    fs::directory_iterator iterator(directory, error);
    if (error) {
        return listing;
    }
    for (; iterator != fs::directory_iterator(); iterator.increment(error)) {
        if (error) {
            return listing;
        }
        std::error_code status_error;
        if (iterator->is_regular_file(status_error)) {
            listing.file_names.push_back(iterator->path().filename().string());
        }
    }
    listing.readable = true;
    return listing;
}

static int count_matching(const DirectoryListing &listing,
                          const std::vector<std::string> &extensions,
                          const std::vector<std::string> &exact_names) {
    int count = 0;
    for (const auto &name : listing.file_names) {
        bool matched = false;
        for (const auto &extension : extensions) {
            // ".csproj" alone is a hidden file, not a project file.
            if (name.size() > extension.size() && text_utils::ends_with(name, extension)) {
                matched = true;
            }
        }
        for (const auto &exact : exact_names) {
            if (name == exact) {
                matched = true;
            }
        }
        if (matched) {
            ++count;
        }
    }
    return count;
}

ProjectPlatform detect(const builder_abi::DiagnosticsSink &sink, const std::string &project_path) {
    auto diagnostics = [&sink](Level level, const std::string &message) {
        if (sink) {
            sink(level, message);
        }
    };

    std::error_code error;
    if (text_utils::trim(project_path).empty() || !fs::is_directory(project_path, error)) {
        diagnostics(Level::Error, "Project path does not exist or is not a directory: " + project_path);
        return ProjectPlatform::Unknown;
    }

    diagnostics(Level::Info, "Detecting platform in: " + project_path);

    DirectoryListing listing = list_files(project_path);
    if (!listing.readable) {
        diagnostics(Level::Error, "Cannot read project directory: " + project_path);
        return ProjectPlatform::Unknown;
    }

    int dotnet_count = count_matching(listing, DOTNET_EXTENSIONS, {});
    if (dotnet_count > 0) {
        diagnostics(Level::Info, "Detected .NET project (found " + std::to_string(dotnet_count) +
                                     " project file(s))");
        return ProjectPlatform::DotNet;
    }

    if (count_matching(listing, NODE_EXTENSIONS, NODE_MARKERS) > 0) {
        diagnostics(Level::Info, "Detected Node.js project");
        return ProjectPlatform::NodeJs;
    }

    if (count_matching(listing, PYTHON_EXTENSIONS, PYTHON_MARKERS) > 0) {
        diagnostics(Level::Info, "Detected Python project");
        return ProjectPlatform::Python;
    }

    diagnostics(Level::Warning, "Could not detect project platform in: " + project_path);
    return ProjectPlatform::Unknown;
}

ProjectPlatform detect(const std::string &project_path) {
    return detect(process_executor::make_console_sink(), project_path);
}

} // namespace platform_detector

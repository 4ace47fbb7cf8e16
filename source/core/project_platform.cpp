#include "core/project_platform.hpp"
#include "utils/text_utils.hpp"

namespace project_platform {

std::string display_name(ProjectPlatform platform) {
    switch (platform) {
    case ProjectPlatform::DotNet:
        return ".NET";
    case ProjectPlatform::NodeJs:
        return "Node.js";
    case ProjectPlatform::Python:
        return "Python";
    case ProjectPlatform::Unknown:
        break;
    }
    return "Unknown";
}

std::string manifest_tag(ProjectPlatform platform) {
    switch (platform) {
    case ProjectPlatform::DotNet:
        return "dotnet";
    case ProjectPlatform::NodeJs:
        return "nodejs";
    case ProjectPlatform::Python:
        return "python";
    case ProjectPlatform::Unknown:
        break;
    }
    return "unknown";
}

std::optional<ProjectPlatform> parse(const std::string &text) {
    std::string normalized = text_utils::to_lower(text_utils::trim(text));
    if (normalized == "dotnet" || normalized == ".net" || normalized == "net") {
        return ProjectPlatform::DotNet;
    }
    if (normalized == "nodejs" || normalized == "node" || normalized == "node.js") {
        return ProjectPlatform::NodeJs;
    }
    if (normalized == "python" || normalized == "py") {
        return ProjectPlatform::Python;
    }
    return std::nullopt;
}

} // namespace project_platform

#include "builders/dotnet/dotnet_project.hpp"
#include "builders/builder_support.hpp"
#include "platform/platform_abi.hpp"
#include "utils/text_utils.hpp"

#include <regex>
#include <stdexcept>

namespace dotnet_project {

std::optional<std::string> parse_target_runtime_version(const std::string &project_contents,
                                                        std::string &target_framework) {
    target_framework.clear();

    static const std::regex framework_pattern(R"(<TargetFrameworks?>\s*([^<]+)\s*</TargetFrameworks?>)",
                                              std::regex::icase);
    std::smatch framework_match;
    if (!std::regex_search(project_contents, framework_match, framework_pattern)) {
        return std::nullopt;
    }

    for (const auto &entry : text_utils::split(framework_match[1].str(), ';')) {
        std::string trimmed = text_utils::trim(entry);
        if (!trimmed.empty()) {
            target_framework = trimmed;
            break;
        }
    }
    if (target_framework.empty()) {
        return std::nullopt;
    }

    // net8.0, net9.0-windows, ...
    static const std::regex version_pattern(R"(net(\d+)\.(\d+))", std::regex::icase);
    std::smatch version_match;
    if (!std::regex_search(target_framework, version_match, version_pattern)) {
        return std::nullopt;
    }
    return version_match[1].str() + "." + version_match[2].str();
}

std::optional<std::string> detect_target_runtime_version(const builder_abi::BuildContext &context,
                                                         const std::string &project_file_path) {
    std::string contents;
    if (!platform::read_file_contents(project_file_path, contents)) {
        builder_support::warning(context, "Project file not found: " + project_file_path);
        return std::nullopt;
    }

    std::string target_framework;
    std::optional<std::string> version = parse_target_runtime_version(contents, target_framework);
    if (!version) {
        if (target_framework.empty()) {
            builder_support::warning(context, "No TargetFramework(s) found in project file: " + project_file_path);
        } else {
            builder_support::warning(context, "Unrecognized TargetFramework format: " + target_framework);
        }
        return std::nullopt;
    }

    builder_support::info(context, "Detected TargetFramework: " + target_framework + " -> .NET " + *version);
    return version;
}

std::optional<std::pair<int, int>> parse_major_minor(const std::string &version) {
    static const std::regex pattern(R"(^\s*(\d+)\.(\d+))");
    std::smatch match;
    if (!std::regex_search(version, match, pattern)) {
        return std::nullopt;
    }
    try {
        return std::make_pair(std::stoi(match[1].str()), std::stoi(match[2].str()));
    } catch (const std::out_of_range &) {
        return std::nullopt;
    }
}

bool sdk_supports_target(const std::string &sdk_version, const std::string &target_version) {
    auto sdk = parse_major_minor(sdk_version);
    auto target = parse_major_minor(target_version);
    if (!sdk || !target) {
        return false;
    }
    return *sdk >= *target;
}

} // namespace dotnet_project

#include "core/build_errors.hpp"
#include "utils/text_utils.hpp"

namespace build_errors {

std::string kind_name(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::None:
        return "None";
    case ErrorKind::EnvironmentMissing:
        return "EnvironmentMissing";
    case ErrorKind::ProjectNotFound:
        return "ProjectNotFound";
    case ErrorKind::ToolInvocationFailed:
        return "ToolInvocationFailed";
    case ErrorKind::ArtifactMissing:
        return "ArtifactMissing";
    case ErrorKind::FileSystemFailed:
        return "FileSystemFailed";
    case ErrorKind::ManifestDetectionFailed:
        return "ManifestDetectionFailed";
    case ErrorKind::PlatformUndetected:
        return "PlatformUndetected";
    case ErrorKind::Cancelled:
        return "Cancelled";
    case ErrorKind::InvalidArgument:
        return "InvalidArgument";
    }
    return "None";
}

BuildError make_error(ErrorKind kind, const std::string &step, const std::string &message) {
    BuildError error;
    error.kind = kind;
    error.step = step;
    error.message = message;
    return error;
}

BuildError tool_failure(const std::string &step,
                        const builder_abi::CommandRequest &request,
                        const builder_abi::CommandResult &result,
                        const std::string &message,
                        size_t max_output_bytes) {
    BuildError error;
    error.kind = result.cancelled ? ErrorKind::Cancelled : ErrorKind::ToolInvocationFailed;
    error.step = step;
    error.command_line = text_utils::format_command_line(request.program, request.arguments);
    error.exit_code = result.exit_code;
    error.message = result.cancelled ? step + " was cancelled" : message;

    const std::string &output = text_utils::trim(result.standard_error).empty()
                                    ? result.standard_output
                                    : result.standard_error;
    error.captured_output = text_utils::truncate_output(output, max_output_bytes);
    return error;
}

json to_json(const BuildError &error) {
    json document;
    document["kind"] = kind_name(error.kind);
    document["step"] = error.step;
    document["message"] = text_utils::sanitize_utf8(error.message);
    if (!error.command_line.empty()) {
        document["command"] = text_utils::sanitize_utf8(error.command_line);
        document["exitCode"] = error.exit_code;
    }
    if (!error.captured_output.empty()) {
        document["output"] = text_utils::sanitize_utf8(error.captured_output);
    }
    return document;
}

std::string format(const BuildError &error) {
    std::string text = "[" + kind_name(error.kind) + "]";
    if (!error.step.empty()) {
        text += " " + error.step + ":";
    }
    text += " " + error.message;
    if (!error.command_line.empty()) {
        text += "\n  command: " + error.command_line + " (exit code " + std::to_string(error.exit_code) + ")";
    }
    std::string output = text_utils::trim(error.captured_output);
    if (!output.empty()) {
        text += "\n  output:";
        for (const auto &line : text_utils::split_lines(output)) {
            text += "\n    " + line;
        }
    }
    return text;
}

} // namespace build_errors

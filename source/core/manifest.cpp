#include "core/manifest.hpp"
#include "platform/platform_abi.hpp"

#include <cstdio>
#include <filesystem>

namespace manifest {

namespace fs = std::filesystem;

// TOML basic string: escape backslash, quote and control characters.
static std::string toml_string(const std::string &text) {
    std::string quoted = "\"";
    for (char character : text) {
        switch (character) {
        case '\\':
            quoted += "\\\\";
            break;
        case '"':
            quoted += "\\\"";
            break;
        case '\n':
            quoted += "\\n";
            break;
        case '\t':
            quoted += "\\t";
            break;
        case '\r':
            quoted += "\\r";
            break;
        default:
            if (static_cast<unsigned char>(character) < 0x20 || character == 0x7F) {
                char escaped[8];
                std::snprintf(escaped, sizeof(escaped), "\\u%04X", static_cast<unsigned char>(character));
                quoted += escaped;
            } else {
                quoted += character;
            }
        }
    }
    quoted += '"';
    return quoted;
}

json to_json(const Manifest &value) {
    json document;
    document["platform"] = value.platform;
    document["version"] = value.version;
    document["command"] = value.command;
    document["buildRequired"] = value.build_required;
    document["buildCommand"] = value.build_command;
    return document;
}

bool from_json(const json &document, Manifest &value, std::string &error_message) {
    if (!document.is_object()) {
        error_message = "manifest must be a JSON object";
        return false;
    }
    for (const char *key : {"platform", "version", "command"}) {
        if (!document.contains(key) || !document[key].is_string()) {
            error_message = std::string("manifest is missing string field '") + key + "'";
            return false;
        }
    }

    Manifest parsed;
    parsed.platform = document["platform"].get<std::string>();
    parsed.version = document["version"].get<std::string>();
    parsed.command = document["command"].get<std::string>();
    if (document.contains("buildRequired") && document["buildRequired"].is_boolean()) {
        parsed.build_required = document["buildRequired"].get<bool>();
    }
    if (document.contains("buildCommand") && document["buildCommand"].is_string()) {
        parsed.build_command = document["buildCommand"].get<std::string>();
    }
    value = parsed;
    return true;
}

std::string to_oryx_toml(const Manifest &value) {
    std::string content;
    if (value.build_required) {
        content += "[build]\n";
        content += "platform = " + toml_string(value.platform) + "\n";
        content += "version = " + toml_string(value.version) + "\n";
        if (!value.build_command.empty()) {
            content += "build-command = " + toml_string(value.build_command) + "\n";
        }
        content += "\n";
    }
    content += "[run]\n";
    content += "command = " + toml_string(value.command) + "\n";
    return content;
}

bool write_files(const Manifest &value, const std::string &artifact_path, std::string &error_message) {
    fs::path directory(artifact_path);
    fs::path json_path = directory / JSON_FILE_NAME;
    fs::path oryx_path = directory / ORYX_FILE_NAME;

    if (!platform::write_file_contents(json_path.string(), to_json(value).dump(2, ' ', false, json::error_handler_t::replace) + "\n")) {
        error_message = "cannot write " + json_path.string();
        return false;
    }
    if (!platform::write_file_contents(oryx_path.string(), to_oryx_toml(value))) {
        error_message = "cannot write " + oryx_path.string();
        return false;
    }
    return true;
}

bool read_file(const std::string &artifact_path, Manifest &value, std::string &error_message) {
    fs::path json_path = fs::path(artifact_path) / JSON_FILE_NAME;
    std::string contents;
    if (!platform::read_file_contents(json_path.string(), contents)) {
        error_message = "cannot read " + json_path.string();
        return false;
    }
    try {
        return from_json(json::parse(contents), value, error_message);
    } catch (const json::parse_error &error) {
        error_message = "invalid JSON in " + json_path.string() + ": " + error.what();
        return false;
    }
}

} // namespace manifest

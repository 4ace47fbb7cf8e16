#include "builders/python/python_entry_point.hpp"
#include "builders/builder_support.hpp"
#include "platform/platform_abi.hpp"
#include "utils/text_utils.hpp"

#include <algorithm>
#include <filesystem>
#include <system_error>
#include <utility>

namespace python_entry_point {

namespace fs = std::filesystem;
using text_utils::contains;

const std::vector<std::string> AGENT_ENTRY_FILES = {"start_with_generic_host.py", "host_agent_server.py"};

static const std::vector<std::pair<std::string, std::string>> WELL_KNOWN_ENTRIES = {
    {"app.py", "gunicorn --bind=0.0.0.0:8000 app:app"},
    {"main.py", "python main.py"},
    {"start.py", "python start.py"},
    {"server.py", "python server.py"},
    {"run.py", "python run.py"},
    {"wsgi.py", "gunicorn --bind=0.0.0.0:8000 wsgi:application"},
    {"asgi.py", "uvicorn asgi:application --host 0.0.0.0 --port 8000"},
};

static const char MAIN_GUARD[] = "if __name__ == \"__main__\":";

static bool file_exists(const std::string &artifact_path, const std::string &name) {
    std::error_code error;
    return fs::is_regular_file(fs::path(artifact_path) / name, error);
}

bool has_main_function(const std::string &contents) {
    return contains(contents, MAIN_GUARD) || contains(contents, "def main(");
}

int agent_entry_priority(const std::string &file_name, const std::string &contents) {
    int priority = 0;

    if (contains(file_name, "start")) {
        priority += 10;
    }
    if (contains(file_name, "main")) {
        priority += 8;
    }
    if (contains(file_name, "server")) {
        priority += 6;
    }

    if (contains(contents, MAIN_GUARD)) {
        priority += 15;
    }
    if (contains(contents, "def main(")) {
        priority += 10;
    }
    if (contains(contents, "create_and_run_host") || contains(contents, "run_host")) {
        priority += 5;
    }
    if (contains(contents, "AgentFrameworkAgent")) {
        priority += 3;
    }
    if (contains(contents, "uvicorn") || contains(contents, "run") || contains(contents, "serve")) {
        priority += 2;
    }
    return priority;
}

std::optional<AgentCandidate> best_agent_entry(const builder_abi::BuildContext &context,
                                               const std::string &artifact_path) {
    std::vector<AgentCandidate> candidates;
    for (const auto &file_name : AGENT_ENTRY_FILES) {
        std::string contents;
        if (!platform::read_file_contents((fs::path(artifact_path) / file_name).string(), contents)) {
            continue;
        }
        AgentCandidate candidate;
        candidate.file_name = file_name;
        candidate.priority = agent_entry_priority(file_name, contents);
        candidate.has_main = has_main_function(contents);
        builder_support::debug(context, "Found agent entry candidate: " + file_name + " (priority: " +
                                            std::to_string(candidate.priority) +
                                            ", hasMain: " + (candidate.has_main ? "true" : "false") + ")");
        candidates.push_back(candidate);
    }
    if (candidates.empty()) {
        return std::nullopt;
    }

    std::sort(candidates.begin(), candidates.end(), [](const AgentCandidate &left, const AgentCandidate &right) {
        if (left.has_main != right.has_main) {
            return left.has_main;
        }
        if (left.priority != right.priority) {
            return left.priority > right.priority;
        }
        return left.file_name < right.file_name;
    });
    return candidates.front();
}

// Framework or main-function command for one source file; "" when nothing matches.
static std::string sniff_file(const builder_abi::BuildContext &context, const std::string &file_name,
                              const std::string &contents) {
    std::string module_name = file_name.substr(0, file_name.size() - 3);

    if (contains(contents, "Flask(") || contains(contents, "from flask import")) {
        builder_support::info(context, "Detected Flask application in " + file_name);
        return "gunicorn --bind=0.0.0.0:8000 " + module_name + ":app";
    }
    if (contains(contents, "FastAPI(") || contains(contents, "from fastapi import")) {
        builder_support::info(context, "Detected FastAPI application in " + file_name);
        return "uvicorn " + module_name + ":app --host 0.0.0.0 --port 8000";
    }
    if (contains(contents, "django")) {
        builder_support::info(context, "Detected Django application in " + file_name);
        return "gunicorn --bind=0.0.0.0:8000 wsgi:application";
    }
    if (has_main_function(contents)) {
        builder_support::info(context, "Detected main function in " + file_name);
        return "python " + file_name;
    }
    return "";
}

std::optional<std::string> detect_start_command(const builder_abi::BuildContext &context,
                                                const std::string &artifact_path) {
    auto agent_entry = best_agent_entry(context, artifact_path);
    if (agent_entry) {
        builder_support::info(context, "Selected agent entry point: " + agent_entry->file_name);
        return "python " + agent_entry->file_name;
    }

    for (const auto &entry : WELL_KNOWN_ENTRIES) {
        if (file_exists(artifact_path, entry.first)) {
            builder_support::info(context, "Detected entry point: " + entry.first + ", using command: " +
                                               entry.second);
            return entry.second;
        }
    }

    std::vector<std::string> python_files = builder_support::list_files_with_extensions(artifact_path, {".py"});
    for (const auto &file_name : python_files) {
        std::string contents;
        if (!platform::read_file_contents((fs::path(artifact_path) / file_name).string(), contents)) {
            builder_support::debug(context, "Cannot read " + file_name + " while detecting the entry point");
            continue;
        }
        std::string command = sniff_file(context, file_name, contents);
        if (!command.empty()) {
            return command;
        }
    }

    if (!python_files.empty()) {
        builder_support::warning(context, "Could not detect a specific entry point. Using first Python file found: " +
                                              python_files.front());
        return "python " + python_files.front();
    }
    return std::nullopt;
}

} // namespace python_entry_point

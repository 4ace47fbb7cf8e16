#ifndef POLYBUILD_PYTHON_ENTRY_POINT_HPP
#define POLYBUILD_PYTHON_ENTRY_POINT_HPP

// Start command detection for a Python artifact directory.
//
// Order:
//   1. agent host scripts (start_with_generic_host.py, host_agent_server.py),
//      ranked by content
//   2. well-known entry files (app.py, main.py, ..., wsgi.py, asgi.py)
//   3. framework sniffing over the top-level *.py files (Flask, FastAPI, Django,
//      a __main__ guard or main function)
//   4. the first *.py file

#include <optional>
#include <string>
#include <vector>

#include "core/builder_abi.hpp"

namespace python_entry_point {

struct AgentCandidate {
    std::string file_name;
    int priority = 0;
    bool has_main = false;
};

extern const std::vector<std::string> AGENT_ENTRY_FILES;

// Score of an agent host script from its name and contents.
int agent_entry_priority(const std::string &file_name, const std::string &contents);

// true for `if __name__ == "__main__":` or `def main(`.
bool has_main_function(const std::string &contents);

// Best agent host script present in artifact_path: one with a main function first,
// then the higher priority, then the smaller name. nullopt when none exists.
std::optional<AgentCandidate> best_agent_entry(const builder_abi::BuildContext &context,
                                               const std::string &artifact_path);

// Start command to run from artifact_path. nullopt when the artifact holds no Python file.
std::optional<std::string> detect_start_command(const builder_abi::BuildContext &context,
                                                const std::string &artifact_path);

} // namespace python_entry_point

#endif // POLYBUILD_PYTHON_ENTRY_POINT_HPP

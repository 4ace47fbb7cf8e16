#ifndef POLYBUILD_PYTHON_BUILDER_HPP
#define POLYBUILD_PYTHON_BUILDER_HPP

// Python builder: syntax-checks the top-level sources, then packages the project
// tree with a requirements.txt that installs it (and any local wheels) on the host.

#include <string>
#include <vector>

#include "core/builder_abi.hpp"

namespace python_builder {

using builder_abi::BuildContext;

// Files whose presence marks a Python project (besides any top-level *.py).
extern const std::vector<std::string> DESCRIPTOR_FILES;

// Never copied into the artifact (matched by name at any depth).
extern const std::vector<std::string> COPY_EXCLUSIONS;

// Contents of the generated requirements.txt.
static const char REQUIREMENTS_CONTENTS[] = "--find-links dist\n--pre\n-e .\n";

// Locates the interpreter and checks `--version` and `-m pip --version`.
bool validate_environment(const BuildContext &context);

// Removes caches, virtualenvs, build leftovers and *.pyc files. Removal problems are
// logged and ignored. ProjectNotFound when the directory is not a Python project.
builder_abi::StepResult clean(const BuildContext &context, const std::string &project_directory);

// py_compile every top-level source, copy the tree, bring in local wheels, write
// requirements.txt and .deployment.
builder_abi::BuildResult build(const BuildContext &context, const std::string &project_directory,
                               const std::string &output_path, bool verbose);

// Version from runtime.txt or the interpreter; start command from the artifact contents.
// Writes runtime.txt into the artifact.
builder_abi::ManifestResult create_manifest(const BuildContext &context, const std::string &project_directory,
                                            const std::string &artifact_path);

// .env -> az webapp config appsettings.
bool convert_environment_to_deployment_settings(const BuildContext &context, const std::string &project_directory,
                                                const std::string &resource_group, const std::string &app_name,
                                                bool verbose);

builder_abi::PlatformBuilder make_builder();

} // namespace python_builder

#endif // POLYBUILD_PYTHON_BUILDER_HPP

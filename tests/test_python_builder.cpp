// Tests for the Python builder: entry point detection, artifact packaging and the
// runtime version written for the host. Projects live in an "app" subdirectory so
// the parent dist/ lookup only sees what the test puts there.

#include <iostream>
#include <string>

#include "builders/python/python_builder.hpp"
#include "builders/python/python_entry_point.hpp"
#include "core/build_errors.hpp"
#include "test_support.hpp"

namespace test_python_builder {

using builder_abi::ErrorKind;
using debug_log::Level;

static build_config::BuildConfiguration python_config() {
    build_config::BuildConfiguration config;
    config.python_executable = "python3";
    return config;
}

static std::string start_command(const test_support::TempDirectory &artifact) {
    test_support::FakeToolchain toolchain;
    test_support::RecordingSink sink;
    auto context = test_support::make_context(toolchain, sink);
    auto command = python_entry_point::detect_start_command(context, artifact.path());
    return command ? *command : "<none>";
}

// Test: Agent host scripts are ranked by main function, then score.
static bool test_agent_entry_ranking() {
    test_support::TempDirectory artifact;
    artifact.write_file("start_with_generic_host.py", "from host import create_and_run_host\n");
    artifact.write_file("host_agent_server.py",
                        "import uvicorn\n\ndef main():\n    uvicorn.run(app)\n\nif __name__ == \"__main__\":\n"
                        "    main()\n");
    artifact.write_file("app.py", "from flask import Flask\napp = Flask(__name__)\n");

    std::string command = start_command(artifact);
    bool success = (command == "python host_agent_server.py");

    if (success) {
        std::cout << "  OK: Agent script with a main function wins over the higher-named one" << std::endl;
    } else {
        std::cout << "  FAIL: Start command was: " << command << std::endl;
    }
    return success;
}

// Test: Priority scoring adds name and content signals.
static bool test_agent_entry_priority() {
    int generic = python_entry_point::agent_entry_priority("start_with_generic_host.py",
                                                           "if __name__ == \"__main__\":\n    run_host()\n");
    // start(10) + main guard(15) + run_host(5) + "run"(2)
    bool success = generic == 32 && python_entry_point::agent_entry_priority("x.py", "") == 0;
    return test_support::report(success, "Agent entry priority sums name and content signals",
                                std::to_string(generic));
}

// Test: Well-known files map to their fixed commands in table order.
static bool test_well_known_entries() {
    test_support::TempDirectory flask_style;
    flask_style.write_file("app.py", "");
    flask_style.write_file("main.py", "");

    test_support::TempDirectory wsgi_only;
    wsgi_only.write_file("wsgi.py", "");

    test_support::TempDirectory asgi_only;
    asgi_only.write_file("asgi.py", "");

    bool success = start_command(flask_style) == "gunicorn --bind=0.0.0.0:8000 app:app" &&
                   start_command(wsgi_only) == "gunicorn --bind=0.0.0.0:8000 wsgi:application" &&
                   start_command(asgi_only) == "uvicorn asgi:application --host 0.0.0.0 --port 8000";
    return test_support::report(success, "app.py, wsgi.py and asgi.py use their fixed commands");
}

// Test: Framework sniffing finds Flask and FastAPI apps in arbitrarily named modules.
static bool test_framework_sniffing() {
    test_support::TempDirectory flask_app;
    flask_app.write_file("website.py", "from flask import Flask\napp = Flask(__name__)\n");

    test_support::TempDirectory fastapi_app;
    fastapi_app.write_file("helpers.py", "def helper():\n    return 1\n");
    fastapi_app.write_file("service.py", "from fastapi import FastAPI\napp = FastAPI()\n");

    std::string flask_command = start_command(flask_app);
    std::string fastapi_command = start_command(fastapi_app);
    bool success = flask_command == "gunicorn --bind=0.0.0.0:8000 website:app" &&
                   fastapi_command == "uvicorn service:app --host 0.0.0.0 --port 8000";
    return test_support::report(success, "Flask and FastAPI modules are detected",
                                flask_command + " / " + fastapi_command);
}

// Test: A plain script falls back to the first file with a warning; no .py at all is nullopt.
static bool test_fallback_and_missing() {
    test_support::TempDirectory plain;
    plain.write_file("tool.py", "print('hello')\n");
    plain.write_file("util.py", "X = 1\n");

    test_support::FakeToolchain toolchain;
    test_support::RecordingSink sink;
    auto context = test_support::make_context(toolchain, sink);
    auto fallback = python_entry_point::detect_start_command(context, plain.path());

    test_support::TempDirectory empty;
    auto missing = python_entry_point::detect_start_command(context, empty.path());

    bool success = fallback && *fallback == "python tool.py" && sink.contains(Level::Warning, "tool.py") &&
                   !missing;
    return test_support::report(success, "First Python file is the last resort, none is nullopt");
}

// Test: Build compiles sources, copies the tree without caches and writes deployment files.
static bool test_build_packages_project() {
    test_support::TempDirectory workspace;
    workspace.write_file("app/app.py", "from flask import Flask\napp = Flask(__name__)\n");
    workspace.write_file("app/pyproject.toml", "[project]\nname = \"web\"\n");
    workspace.write_file("app/pkg/views.py", "VIEWS = []\n");
    workspace.write_file("app/pkg/__pycache__/views.cpython-311.pyc", "");
    workspace.write_file("app/.venv/bin/python", "");
    workspace.write_file("app/.env", "SECRET=1\n");
    workspace.write_file("app/.env.template", "SECRET=\n");
    workspace.write_file("dist/web-0.1.0-py3-none-any.whl", "wheel");

    test_support::FakeToolchain toolchain;
    test_support::RecordingSink sink;
    auto context = test_support::make_context(toolchain, sink, python_config());

    auto built = python_builder::build(context, workspace.file("app"), "publish", false);

    bool success = built.success && toolchain.was_called("python3", "-m") &&
                   !toolchain.was_called("uv", "build") &&
                   workspace.exists("app/publish/app.py") && workspace.exists("app/publish/pkg/views.py") &&
                   !workspace.exists("app/publish/pkg/__pycache__") && !workspace.exists("app/publish/.venv") &&
                   !workspace.exists("app/publish/.env") && workspace.exists("app/publish/.env.template") &&
                   workspace.exists("app/publish/dist/web-0.1.0-py3-none-any.whl") &&
                   workspace.read_file("app/publish/requirements.txt") == python_builder::REQUIREMENTS_CONTENTS &&
                   workspace.exists("app/publish/.deployment") && !workspace.exists("app/dist");

    if (success) {
        std::cout << "  OK: Python build packages sources, wheels and deployment files" << std::endl;
    } else {
        std::cout << "  FAIL: " << build_errors::format(built.error) << std::endl;
    }
    return success;
}

// Test: Without local wheels uv build runs inside the artifact; its failure is only a warning.
static bool test_build_runs_uv_without_wheels() {
    test_support::TempDirectory workspace;
    workspace.write_file("app/main.py", "def main():\n    pass\n");

    test_support::FakeToolchain toolchain;
    toolchain.on("uv", {"build"}, test_support::failed(2, "uv: no pyproject.toml"));
    test_support::RecordingSink sink;
    auto context = test_support::make_context(toolchain, sink, python_config());

    auto built = python_builder::build(context, workspace.file("app"), "publish", false);

    bool uv_in_artifact = false;
    for (const auto &request : toolchain.requests()) {
        if (request.program == "uv") {
            uv_in_artifact = request.working_directory == workspace.file("app/publish");
        }
    }
    bool success = built.success && uv_in_artifact && sink.contains(Level::Warning, "uv build failed");
    return test_support::report(success, "uv build runs in the artifact and its failure is a warning");
}

// Test: A syntax error stops the build at the compile step.
static bool test_build_syntax_error() {
    test_support::TempDirectory workspace;
    workspace.write_file("app/app.py", "def broken(:\n");

    test_support::FakeToolchain toolchain;
    toolchain.on("python3", {"-m", "py_compile"},
                 test_support::failed(1, "  File \"app.py\", line 1\nSyntaxError: invalid syntax"));
    test_support::RecordingSink sink;
    auto context = test_support::make_context(toolchain, sink, python_config());

    auto built = python_builder::build(context, workspace.file("app"), "publish", false);
    bool success = !built.success && built.error.kind == ErrorKind::ToolInvocationFailed &&
                   built.error.step == "compile" &&
                   built.error.captured_output.find("SyntaxError") != std::string::npos &&
                   !workspace.exists("app/publish");
    return test_support::report(success, "Syntax errors fail the compile step before packaging");
}

// Test: The manifest takes the version from runtime.txt and writes it into the artifact.
static bool test_manifest_from_runtime_txt() {
    test_support::TempDirectory workspace;
    workspace.write_file("app/runtime.txt", "python-3.12.1\n");
    workspace.write_file("app/publish/app.py", "");

    test_support::FakeToolchain toolchain;
    test_support::RecordingSink sink;
    auto context = test_support::make_context(toolchain, sink, python_config());

    auto described = python_builder::create_manifest(context, workspace.file("app"), workspace.file("app/publish"));
    bool success = described.success && described.manifest.platform == "python" &&
                   described.manifest.version == "3.12" &&
                   described.manifest.command == "gunicorn --bind=0.0.0.0:8000 app:app" &&
                   described.manifest.build_required &&
                   described.manifest.build_command == "pip install -r requirements.txt" &&
                   workspace.read_file("app/publish/runtime.txt") == "python-3.12" &&
                   toolchain.call_count() == 0;
    return test_support::report(success, "runtime.txt version is used and written into the artifact");
}

// Test: Without runtime.txt the interpreter's version (printed on stderr) is used.
static bool test_manifest_from_interpreter() {
    test_support::TempDirectory workspace;
    workspace.write_file("app/publish/main.py", "");

    test_support::FakeToolchain toolchain;
    test_support::CommandResult version = test_support::ok("");
    version.standard_error = "Python 3.10.12\n";
    toolchain.on("python3", {"--version"}, version);
    test_support::RecordingSink sink;
    auto context = test_support::make_context(toolchain, sink, python_config());

    auto described = python_builder::create_manifest(context, workspace.file("app"), workspace.file("app/publish"));
    bool success = described.success && described.manifest.version == "3.10" &&
                   described.manifest.command == "python main.py";
    return test_support::report(success, "Interpreter version is used when runtime.txt is absent");
}

// Test: Clean removes caches, virtualenvs and compiled files but keeps sources.
static bool test_clean() {
    test_support::TempDirectory project;
    project.write_file("app.py", "");
    project.write_file("__pycache__/app.cpython-311.pyc", "");
    project.write_file(".venv/pyvenv.cfg", "");
    project.write_file("web.egg-info/PKG-INFO", "");
    project.write_file("uv.lock", "");
    project.write_file("pkg/helper.pyc", "");
    project.write_file("pkg/helper.py", "");

    test_support::FakeToolchain toolchain;
    test_support::RecordingSink sink;
    auto context = test_support::make_context(toolchain, sink, python_config());

    auto cleaned = python_builder::clean(context, project.path());
    bool success = cleaned.success && !project.exists("__pycache__") && !project.exists(".venv") &&
                   !project.exists("web.egg-info") && !project.exists("uv.lock") &&
                   !project.exists("pkg/helper.pyc") && project.exists("pkg/helper.py") &&
                   project.exists("app.py");
    return test_support::report(success, "Clean removes build leftovers and keeps sources");
}

// Test: Validation fails when pip is missing.
static bool test_validate_without_pip() {
    test_support::FakeToolchain toolchain;
    toolchain.on("python3", {"--version"}, test_support::ok("Python 3.11.4"));
    toolchain.on("python3", {"-m", "pip"}, test_support::failed(1, "No module named pip"));
    test_support::RecordingSink sink;
    auto context = test_support::make_context(toolchain, sink, python_config());

    bool valid = python_builder::validate_environment(context);
    bool success = !valid && sink.contains(Level::Error, "pip not found");
    return test_support::report(success, "Missing pip fails validation");
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_agent_entry_ranking();
    all_passed &= test_agent_entry_priority();
    all_passed &= test_well_known_entries();
    all_passed &= test_framework_sniffing();
    all_passed &= test_fallback_and_missing();
    all_passed &= test_build_packages_project();
    all_passed &= test_build_runs_uv_without_wheels();
    all_passed &= test_build_syntax_error();
    all_passed &= test_manifest_from_runtime_txt();
    all_passed &= test_manifest_from_interpreter();
    all_passed &= test_clean();
    all_passed &= test_validate_without_pip();
    return all_passed;
}

} // namespace test_python_builder

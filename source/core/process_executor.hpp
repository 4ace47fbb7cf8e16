#ifndef POLYBUILD_PROCESS_EXECUTOR_HPP
#define POLYBUILD_PROCESS_EXECUTOR_HPP

// Production implementations of the builder_abi collaborators: a CommandExecutor
// backed by platform::run_process and a DiagnosticsSink backed by debug_log.

#include <atomic>

#include "core/builder_abi.hpp"

namespace process_executor {

// Runs real child processes. Every run observes cancel_flag (may be null).
builder_abi::CommandExecutor make_process_executor(const std::atomic<bool> *cancel_flag,
                                                   int kill_grace_milliseconds);

// Forwards diagnostics to debug_log (stderr).
builder_abi::DiagnosticsSink make_console_sink();

// Context wired to real processes and the console.
builder_abi::BuildContext make_default_context(const build_config::BuildConfiguration &config,
                                               const std::atomic<bool> *cancel_flag);

} // namespace process_executor

#endif // POLYBUILD_PROCESS_EXECUTOR_HPP

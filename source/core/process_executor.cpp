#include "core/process_executor.hpp"
#include "platform/platform_abi.hpp"
#include "utils/text_utils.hpp"

namespace process_executor {

builder_abi::CommandExecutor make_process_executor(const std::atomic<bool> *cancel_flag,
                                                   int kill_grace_milliseconds) {
    return [cancel_flag, kill_grace_milliseconds](const builder_abi::CommandRequest &request) {
        debug_log::log("Executing: " + text_utils::format_command_line(request.program, request.arguments) +
                       (request.working_directory.empty() ? "" : " (in " + request.working_directory + ")"));

        platform::ProcessOptions options;
        options.working_directory = request.working_directory;
        options.capture_output = request.capture_output;
        options.echo_output = request.stream_output;
        options.echo_prefix = request.output_prefix;
        options.cancel_flag = cancel_flag;
        options.kill_grace_milliseconds = kill_grace_milliseconds;

        platform::ProcessResult process_result = platform::run_process(request.program, request.arguments, options);

        builder_abi::CommandResult result;
        result.exit_code = process_result.exit_code;
        result.cancelled = process_result.cancelled;
        result.standard_output = process_result.standard_output;
        result.standard_error = process_result.standard_error;
        if (!process_result.started) {
            // Report launch failures the way a shell would: on stderr, exit code 127.
            result.standard_error = process_result.error_message;
        }
        result.success = process_result.started && !process_result.cancelled && process_result.exit_code == 0;

        if (!result.success) {
            debug_log::log("Command failed with exit code " + std::to_string(result.exit_code) + ": " +
                           text_utils::trim(result.standard_error));
        }
        return result;
    };
}

builder_abi::DiagnosticsSink make_console_sink() {
    return [](debug_log::Level level, const std::string &message) {
        debug_log::write(level, message);
    };
}

builder_abi::BuildContext make_default_context(const build_config::BuildConfiguration &config,
                                               const std::atomic<bool> *cancel_flag) {
    builder_abi::BuildContext context;
    context.executor = make_process_executor(cancel_flag, config.kill_grace_milliseconds);
    context.diagnostics = make_console_sink();
    context.cancel_flag = cancel_flag;
    context.config = config;
    return context;
}

} // namespace process_executor

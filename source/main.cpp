// polybuild – multi-platform build orchestrator
// Entry point: polybuild <command> [arguments].
//
// Command results are printed to stdout as JSON; logs go to stderr.
// Exit status: 0 success, 1 command failure, 2 usage error.

#include <nlohmann/json.hpp>
#include <atomic>
#include <csignal>
#include <iostream>
#include <string>
#include <vector>

#include "cli/cli_arguments.hpp"
#include "cli/cli_commands.hpp"
#include "command_handlers/command_handlers.hpp"
#include "utils/debug_log.hpp"

using json = nlohmann::json;

static const int EXIT_FAILED = 1;
static const int EXIT_USAGE = 2;

// Set by SIGINT/SIGTERM; running tools are stopped and the command returns Cancelled.
static std::atomic<bool> cancel_requested(false);

static void signal_handler(int signal_number) {
    (void)signal_number;
    cancel_requested = true;
}

static int print_result(const json &result) {
    if (result.contains("help")) {
        std::cout << result["help"].get<std::string>();
    } else {
        std::cout << result.dump(2, ' ', false, json::error_handler_t::replace) << std::endl;
    }
    if (cli_commands::is_usage_error(result)) {
        return EXIT_USAGE;
    }
    return result.value("isError", true) ? EXIT_FAILED : 0;
}

int main(int argc, char **argv) {
    std::vector<std::string> words(argv + 1, argv + argc);
    if (cli_arguments::take_debug_flag(words)) {
        debug_log::set_debug_enabled(true);
    }

    std::cerr << "[polybuild] polybuild – multi-platform build orchestrator, build " << __DATE__ << " " << __TIME__
              << std::endl;

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    command_handlers::register_all_commands(&cancel_requested);

    if (words.empty() || words[0] == "--help" || words[0] == "-h") {
        std::cerr << cli_commands::build_help_text();
        return words.empty() ? EXIT_USAGE : 0;
    }

    std::string command_name = words[0];
    words.erase(words.begin());

    const cli_commands::CommandDefinition *command = cli_commands::find_command(command_name);
    if (command == nullptr) {
        return print_result(cli_commands::usage_error("Unknown command: " + command_name + " (run 'polybuild help')"));
    }

    json arguments;
    std::string error_message;
    if (!cli_arguments::parse(*command, words, arguments, error_message)) {
        debug_log::error(error_message);
        std::cerr << "usage: polybuild " << command->usage << std::endl;
        return print_result(cli_commands::usage_error(error_message));
    }

    debug_log::log("Dispatching command: " + command_name);
    json result = cli_commands::dispatch_command(command_name, arguments);
    int exit_code = print_result(result);

    if (cancel_requested) {
        debug_log::warning("Interrupted.");
    }
    return exit_code;
}

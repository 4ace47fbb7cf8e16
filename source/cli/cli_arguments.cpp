#include "cli/cli_arguments.hpp"
#include "utils/text_utils.hpp"

#include <algorithm>

namespace cli_arguments {

static bool is_listed(const std::vector<std::string> &names, const std::string &name) {
    return std::find(names.begin(), names.end(), name) != names.end();
}

bool parse(const cli_commands::CommandDefinition &command, const std::vector<std::string> &words,
           json &arguments, std::string &error_message) {
    arguments = json::object();
    arguments["positional"] = json::array();

    bool options_ended = false;
    for (size_t index = 0; index < words.size(); ++index) {
        const std::string &word = words[index];

        if (options_ended || !text_utils::starts_with(word, "--") || word.size() == 2) {
            if (word == "--" && !options_ended) {
                options_ended = true;
                continue;
            }
            arguments["positional"].push_back(word);
            continue;
        }

        std::string name = word.substr(2);
        std::string value;
        bool has_inline_value = false;
        size_t equals = name.find('=');
        if (equals != std::string::npos) {
            value = name.substr(equals + 1);
            name = name.substr(0, equals);
            has_inline_value = true;
        }

        if (is_listed(command.flag_options, name)) {
            if (has_inline_value) {
                error_message = "--" + name + " does not take a value";
                return false;
            }
            arguments[name] = true;
            continue;
        }

        if (!is_listed(command.value_options, name)) {
            error_message = "Unknown option for '" + command.name + "': --" + name;
            return false;
        }
        if (!has_inline_value) {
            if (index + 1 >= words.size()) {
                error_message = "--" + name + " requires a value";
                return false;
            }
            value = words[++index];
        }
        arguments[name] = value;
    }
    return true;
}

bool take_debug_flag(std::vector<std::string> &words) {
    auto new_end = std::remove(words.begin(), words.end(), std::string("--debug"));
    bool found = new_end != words.end();
    words.erase(new_end, words.end());
    return found;
}

} // namespace cli_arguments

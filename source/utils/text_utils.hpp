#ifndef POLYBUILD_TEXT_UTILS_HPP
#define POLYBUILD_TEXT_UTILS_HPP

// Small string helpers shared by the builders, the process layer and the CLI.

#include <cstddef>
#include <string>
#include <vector>

namespace text_utils {

// Replaces invalid UTF-8 sequences (broken multibyte, invalid bytes) with U+FFFD.
// Tool output must pass through this before it is placed in a JSON document:
// nlohmann::json refuses to dump invalid UTF-8.
void sanitize_utf8_in_place(std::string &text);
std::string sanitize_utf8(const std::string &text);

// Keeps the last max_bytes of text (tool errors are usually at the end),
// prefixed with a marker when something was dropped.
std::string truncate_output(const std::string &text, size_t max_bytes);

std::string trim(const std::string &text);
std::string to_lower(const std::string &text);

// "1", "true", "yes" (any case) are truthy.
bool is_truthy(const std::string &value);

bool starts_with(const std::string &text, const std::string &prefix);
bool ends_with(const std::string &text, const std::string &suffix);
bool iequals(const std::string &left, const std::string &right);
bool iends_with(const std::string &text, const std::string &suffix);
bool istarts_with(const std::string &text, const std::string &prefix);
bool contains(const std::string &text, const std::string &needle);

// Splits on \n, dropping \r. Empty lines are kept.
std::vector<std::string> split_lines(const std::string &text);

std::vector<std::string> split(const std::string &text, char separator);

std::string join(const std::vector<std::string> &parts, const std::string &separator);

// Renders program + arguments as a single display line, quoting arguments
// that contain spaces or are empty.
std::string format_command_line(const std::string &program, const std::vector<std::string> &arguments);

} // namespace text_utils

#endif // POLYBUILD_TEXT_UTILS_HPP

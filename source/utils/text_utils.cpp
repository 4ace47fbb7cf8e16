#include "utils/text_utils.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <sstream>

namespace text_utils {

namespace {

const unsigned char kReplacementUtf8[] = { 0xEF, 0xBF, 0xBD }; // U+FFFD
constexpr size_t kReplacementLength = sizeof(kReplacementUtf8);

// Expected sequence length for a lead byte (1-4), or 0 if the byte cannot start a sequence.
size_t sequence_length(unsigned char lead) {
    if (lead < 0x80u) {
        return 1;
    }
    if (lead >= 0xC2u && lead <= 0xDFu) {
        return 2;
    }
    if (lead >= 0xE0u && lead <= 0xEFu) {
        return 3;
    }
    if (lead >= 0xF0u && lead <= 0xF4u) {
        return 4;
    }
    return 0;
}

bool is_continuation(unsigned char byte) {
    return (byte & 0xC0u) == 0x80u;
}

char lower_char(char character) {
    return static_cast<char>(std::tolower(static_cast<unsigned char>(character)));
}

} // namespace

void sanitize_utf8_in_place(std::string &text) {
    std::string result;
    result.reserve(text.size());

    size_t index = 0;
    while (index < text.size()) {
        unsigned char lead = static_cast<unsigned char>(text[index]);
        size_t length = sequence_length(lead);

        bool valid = length != 0 && index + length <= text.size();
        for (size_t offset = 1; valid && offset < length; ++offset) {
            valid = is_continuation(static_cast<unsigned char>(text[index + offset]));
        }

        if (!valid) {
            result.append(reinterpret_cast<const char *>(kReplacementUtf8), kReplacementLength);
            ++index;
            continue;
        }

        result.append(text, index, length);
        index += length;
    }

    text = std::move(result);
}

std::string sanitize_utf8(const std::string &text) {
    std::string copy = text;
    sanitize_utf8_in_place(copy);
    return copy;
}

std::string truncate_output(const std::string &text, size_t max_bytes) {
    if (text.size() <= max_bytes) {
        return text;
    }
    size_t start = text.size() - max_bytes;
    // Do not cut a multibyte sequence in half.
    while (start < text.size() && is_continuation(static_cast<unsigned char>(text[start]))) {
        ++start;
    }
    return "[... " + std::to_string(start) + " bytes of earlier output omitted ...]\n" + text.substr(start);
}

std::string trim(const std::string &text) {
    size_t begin = 0;
    while (begin < text.size() && std::isspace(static_cast<unsigned char>(text[begin]))) {
        ++begin;
    }
    size_t end = text.size();
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
        --end;
    }
    return text.substr(begin, end - begin);
}

std::string to_lower(const std::string &text) {
    std::string result = text;
    std::transform(result.begin(), result.end(), result.begin(), lower_char);
    return result;
}

bool is_truthy(const std::string &value) {
    std::string normalized = to_lower(trim(value));
    return normalized == "1" || normalized == "true" || normalized == "yes";
}

bool starts_with(const std::string &text, const std::string &prefix) {
    return text.size() >= prefix.size() && text.compare(0, prefix.size(), prefix) == 0;
}

bool ends_with(const std::string &text, const std::string &suffix) {
    return text.size() >= suffix.size() &&
           text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool iequals(const std::string &left, const std::string &right) {
    return to_lower(left) == to_lower(right);
}

bool iends_with(const std::string &text, const std::string &suffix) {
    return ends_with(to_lower(text), to_lower(suffix));
}

bool istarts_with(const std::string &text, const std::string &prefix) {
    return starts_with(to_lower(text), to_lower(prefix));
}

bool contains(const std::string &text, const std::string &needle) {
    return text.find(needle) != std::string::npos;
}

std::vector<std::string> split_lines(const std::string &text) {
    std::vector<std::string> lines;
    std::istringstream stream(text);
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(line);
    }
    return lines;
}

std::vector<std::string> split(const std::string &text, char separator) {
    std::vector<std::string> parts;
    std::string current;
    for (char character : text) {
        if (character == separator) {
            parts.push_back(current);
            current.clear();
        } else {
            current += character;
        }
    }
    parts.push_back(current);
    return parts;
}

std::string join(const std::vector<std::string> &parts, const std::string &separator) {
    std::string result;
    for (size_t index = 0; index < parts.size(); ++index) {
        if (index > 0) {
            result += separator;
        }
        result += parts[index];
    }
    return result;
}

std::string format_command_line(const std::string &program, const std::vector<std::string> &arguments) {
    std::string line = program;
    for (const auto &argument : arguments) {
        line += ' ';
        if (argument.empty() || argument.find_first_of(" \t\"") != std::string::npos) {
            line += '"';
            for (char character : argument) {
                if (character == '"') {
                    line += '\\';
                }
                line += character;
            }
            line += '"';
        } else {
            line += argument;
        }
    }
    return line;
}

} // namespace text_utils

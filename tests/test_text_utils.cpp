// Tests for the string helpers used by builders and the process layer.

#include <nlohmann/json.hpp>
#include <iostream>
#include <string>

#include "utils/text_utils.hpp"

using json = nlohmann::json;

namespace test_text_utils {

// Test: Invalid UTF-8 is replaced so the text can be dumped as JSON.
static bool test_sanitize_invalid_utf8() {
    std::string text = "ok \xC3\x28 end \xFF";
    text_utils::sanitize_utf8_in_place(text);

    bool dumped = true;
    try {
        json document = text;
        document.dump();
    } catch (const json::type_error &) {
        dumped = false;
    }
    bool success = dumped && text.find("ok ") == 0 && text.find(" end ") != std::string::npos;

    if (success) {
        std::cout << "  OK: Invalid UTF-8 is replaced and the text dumps as JSON" << std::endl;
    } else {
        std::cout << "  FAIL: Sanitized text is not valid JSON text: " << text << std::endl;
    }
    return success;
}

// Test: Valid multibyte text passes through untouched.
static bool test_sanitize_keeps_valid_text() {
    std::string original = "caf\xC3\xA9 \xE2\x9C\x93";
    std::string sanitized = text_utils::sanitize_utf8(original);
    bool success = (sanitized == original);

    if (success) {
        std::cout << "  OK: Valid UTF-8 is unchanged" << std::endl;
    } else {
        std::cout << "  FAIL: Valid UTF-8 was modified: " << sanitized << std::endl;
    }
    return success;
}

// Test: The copying form leaves a non-const argument untouched.
static bool test_sanitize_copy_keeps_argument() {
    std::string original = "bad \xFF byte";
    std::string sanitized = text_utils::sanitize_utf8(original);
    bool success = original == "bad \xFF byte" && sanitized != original && sanitized.find("bad ") == 0;

    if (success) {
        std::cout << "  OK: sanitize_utf8 returns a sanitized copy" << std::endl;
    } else {
        std::cout << "  FAIL: Argument was modified or copy not sanitized" << std::endl;
    }
    return success;
}

// Test: Long output keeps its tail behind a marker.
static bool test_truncate_output_keeps_tail() {
    std::string text(100, 'a');
    text += "error: the real problem";
    std::string truncated = text_utils::truncate_output(text, 23);
    bool success = text_utils::ends_with(truncated, "error: the real problem") &&
                   text_utils::starts_with(truncated, "[... 100 bytes") &&
                   text_utils::truncate_output("short", 100) == "short";

    if (success) {
        std::cout << "  OK: Truncation keeps the tail and marks the omission" << std::endl;
    } else {
        std::cout << "  FAIL: Truncated output was: " << truncated << std::endl;
    }
    return success;
}

// Test: Case-insensitive comparisons.
static bool test_case_insensitive_helpers() {
    bool success = text_utils::iequals("DotNet", "dotnet") &&
                   text_utils::iends_with("App.CSPROJ", ".csproj") &&
                   text_utils::istarts_with("Python 3.11.4", "python") &&
                   !text_utils::iends_with("csproj", ".csproj");

    if (success) {
        std::cout << "  OK: Case-insensitive helpers match regardless of case" << std::endl;
    } else {
        std::cout << "  FAIL: Case-insensitive helper mismatch" << std::endl;
    }
    return success;
}

// Test: Truthy values for POLYBUILD_DEBUG style switches.
static bool test_is_truthy() {
    bool success = text_utils::is_truthy("1") && text_utils::is_truthy(" TRUE ") && text_utils::is_truthy("yes") &&
                   !text_utils::is_truthy("0") && !text_utils::is_truthy("") && !text_utils::is_truthy("on");

    if (success) {
        std::cout << "  OK: 1/true/yes are truthy, everything else is not" << std::endl;
    } else {
        std::cout << "  FAIL: is_truthy classified a value wrongly" << std::endl;
    }
    return success;
}

// Test: Line splitting drops carriage returns and keeps empty lines.
static bool test_split_lines() {
    auto lines = text_utils::split_lines("first\r\n\r\nthird");
    bool success = lines.size() == 3 && lines[0] == "first" && lines[1].empty() && lines[2] == "third";

    if (success) {
        std::cout << "  OK: split_lines handles CRLF and empty lines" << std::endl;
    } else {
        std::cout << "  FAIL: split_lines produced " << lines.size() << " lines" << std::endl;
    }
    return success;
}

// Test: Command lines quote arguments with spaces and empty arguments.
static bool test_format_command_line() {
    std::string line = text_utils::format_command_line("dotnet", {"publish", "My App.csproj", "-o", ""});
    bool success = (line == "dotnet publish \"My App.csproj\" -o \"\"");

    if (success) {
        std::cout << "  OK: Command line quotes spaced and empty arguments" << std::endl;
    } else {
        std::cout << "  FAIL: Command line was: " << line << std::endl;
    }
    return success;
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_sanitize_invalid_utf8();
    all_passed &= test_sanitize_keeps_valid_text();
    all_passed &= test_sanitize_copy_keeps_argument();
    all_passed &= test_truncate_output_keeps_tail();
    all_passed &= test_case_insensitive_helpers();
    all_passed &= test_is_truthy();
    all_passed &= test_split_lines();
    all_passed &= test_format_command_line();
    return all_passed;
}

} // namespace test_text_utils

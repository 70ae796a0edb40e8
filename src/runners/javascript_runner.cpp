#include <execbox/runners/javascript_runner.hpp>

#include <execbox/common/strings.hpp>
#include <execbox/runners/language_runner.hpp>

#include <range/v3/range/conversion.hpp>
#include <range/v3/view/split.hpp>

#include <cstddef>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace execbox {

std::vector<std::string> JavaScriptRunner::run_arguments() const {
    return {std::string{entry_file_name()}};
}

std::vector<std::string> JavaScriptRunner::check_arguments() const {
    return {"--check", std::string{entry_file_name()}};
}

/// node --check reports a parse error on stderr as
///
///     /path/to/main.js:3
///     let x = ;
///             ^
///
///     SyntaxError: Unexpected token ';'
///         at ... (stack frames)
std::vector<SyntaxDiagnostic> JavaScriptRunner::parse_check_output(std::string_view /*stdout_output*/,
                                                                   std::string_view stderr_output) const {
    static const std::regex location_regex{R"(main\.js:(\d+)\s*$)"};
    static const std::regex caret_regex{R"(^\s*\^+\s*$)"};
    static const std::regex error_regex{R"(^(\w*Error): (.*)$)"};

    std::vector lines = stderr_output | ranges::views::split('\n') | ranges::to<std::vector<std::string>>;

    SyntaxDiagnostic diagnostic{};
    bool found_error = false;

    for (std::size_t i = 0; i < lines.size(); ++i) {
        const std::string& line = lines[i];
        std::smatch match;

        if (!diagnostic.line && std::regex_search(line, match, location_regex)) {
            diagnostic.line = std::stoi(match[1].str());

            // The offending source line follows, then a line of carets underneath the error
            if (i + 2 < lines.size() && std::regex_match(lines[i + 2], caret_regex)) {
                diagnostic.column = static_cast<int>(lines[i + 2].find('^')) + 1;
            }
            continue;
        }

        if (std::regex_match(line, match, error_regex)) {
            diagnostic.kind = match[1].str();
            diagnostic.message = std::string{trim(match[2].str())};
            found_error = true;
            break;
        }
    }

    if (!found_error) {
        if (trim(stderr_output).empty()) {
            return {};
        }

        // Not in the expected shape; keep the first line node printed
        for (const std::string& line : lines) {
            if (!trim(line).empty()) {
                diagnostic.message = std::string{trim(line)};
                break;
            }
        }
    }

    return {diagnostic};
}

} // namespace execbox

#include <execbox/runners/python_runner.hpp>

#include <execbox/common/strings.hpp>
#include <execbox/runners/language_runner.hpp>

#include <range/v3/range/conversion.hpp>
#include <range/v3/view/split.hpp>

#include <charconv>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace execbox {

namespace {

// Compiles the file named by argv[1] without executing it. Errors are printed as
// "LINE<TAB>COLUMN<TAB>KIND<TAB>MESSAGE" with 0 for an unknown position.
constexpr std::string_view CHECK_SCRIPT = R"py(
import sys
path = sys.argv[1]
with open(path, 'rb') as source_file:
    source = source_file.read()
try:
    compile(source, path, 'exec', dont_inherit=True)
except (SyntaxError, ValueError) as err:
    line = getattr(err, 'lineno', None) or 0
    column = getattr(err, 'offset', None) or 0
    message = getattr(err, 'msg', None) or str(err)
    print(f'{line}\t{column}\t{type(err).__name__}\t{message}')
    sys.exit(1)
)py";

std::optional<int> parse_position(std::string_view str) {
    int value{};
    auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), value);

    if (ec != std::errc{} || value <= 0) {
        return std::nullopt;
    }

    return value;
}

} // namespace

std::vector<std::string> PythonRunner::run_arguments() const {
    return {"-I", "-B", "-u", std::string{entry_file_name()}};
}

std::vector<std::string> PythonRunner::check_arguments() const {
    return {"-I", "-B", "-c", std::string{CHECK_SCRIPT}, std::string{entry_file_name()}};
}

std::vector<SyntaxDiagnostic> PythonRunner::parse_check_output(std::string_view stdout_output,
                                                               std::string_view stderr_output) const {
    std::vector<SyntaxDiagnostic> result;

    for (const std::string& line : stdout_output | ranges::views::split('\n') | ranges::to<std::vector<std::string>>) {
        std::vector fields = line | ranges::views::split('\t') | ranges::to<std::vector<std::string>>;

        if (fields.size() < 4) {
            continue;
        }

        // The message itself may contain tabs
        std::string message = fields[3];
        for (std::size_t i = 4; i < fields.size(); ++i) {
            message += '\t' + fields[i];
        }

        result.push_back({.line = parse_position(fields[0]),
                          .column = parse_position(fields[1]),
                          .kind = fields[2],
                          .message = std::string{trim(message)}});
    }

    // The checker itself blew up (e.g., an unreadable file); surface whatever it said
    if (result.empty() && !trim(stderr_output).empty()) {
        result.push_back({.line = std::nullopt,
                          .column = std::nullopt,
                          .kind = "",
                          .message = std::string{trim(stderr_output)}});
    }

    return result;
}

} // namespace execbox

#include <execbox/runners/language_runner.hpp>

#include <execbox/common/error_types.hpp>
#include <execbox/execution/execution_request.hpp>
#include <execbox/logging.hpp>
#include <execbox/runners/interpreter.hpp>

#include <fmt/format.h>

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace execbox {

std::string SyntaxDiagnostic::to_string() const {
    std::string location;

    if (line) {
        location = column ? fmt::format("Line {}, column {}: ", *line, *column) : fmt::format("Line {}: ", *line);
    }

    if (kind.empty()) {
        return location + message;
    }

    return fmt::format("{}{}: {}", location, kind, message);
}

Result<PreparedProgram> LanguageRunner::prepare(std::string_view code, const Workspace& workspace,
                                                ExecutionMode mode) const {
    std::filesystem::path interpreter_path = TRY(resolve_interpreter(interpreter_));
    std::filesystem::path entry_file = TRY(workspace.write_file(entry_file_name(), code));

    std::vector<std::string> args{interpreter_path.filename().string()};

    auto extra_args = mode == ExecutionMode::SyntaxCheck ? check_arguments() : run_arguments();
    args.insert(args.end(), extra_args.begin(), extra_args.end());

    LOG_TRACE("Prepared {} program {} with {}", language(), entry_file.string(), args);

    return PreparedProgram{.entry_file = std::move(entry_file),
                           .executable = interpreter_path.string(),
                           .args = std::move(args)};
}

} // namespace execbox

#pragma once

#include <execbox/common/error_types.hpp>
#include <execbox/execution/execution_request.hpp>
#include <execbox/execution/language.hpp>
#include <execbox/sandbox/workspace.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace execbox {

/// An entry file written into a workspace together with the command that runs it
struct PreparedProgram
{
    std::filesystem::path entry_file;
    /// Absolute path of the interpreter
    std::string executable;
    /// argv, including argv[0]. Paths are relative to the workspace.
    std::vector<std::string> args;
};

/// A parse error reported by a language's front end
struct SyntaxDiagnostic
{
    std::optional<int> line;
    std::optional<int> column;
    std::string kind;
    std::string message;

    /// "Line L, column C: Kind: message", leaving out what is unknown
    std::string to_string() const;
};

/// Per-language knowledge: entry file name, how to invoke the interpreter, and how to ask
/// it to only parse. Nothing else in the engine branches on the language.
class LanguageRunner
{
public:
    virtual ~LanguageRunner() = default;

    virtual Language language() const = 0;

    /// Conventional entry file name, e.g. "main.py"
    virtual std::string_view entry_file_name() const = 0;

    /// Writes ``code`` to the entry file inside ``workspace`` and resolves the command for ``mode``
    Result<PreparedProgram> prepare(std::string_view code, const Workspace& workspace, ExecutionMode mode) const;

    /// Extracts diagnostics from a check-only run that did not succeed
    virtual std::vector<SyntaxDiagnostic> parse_check_output(std::string_view stdout_output,
                                                             std::string_view stderr_output) const = 0;

    /// Configured name or path of the interpreter
    const std::string& interpreter() const { return interpreter_; }

protected:
    explicit LanguageRunner(std::string interpreter)
        : interpreter_{std::move(interpreter)} {}

    /// Arguments following argv[0] that run the entry file
    virtual std::vector<std::string> run_arguments() const = 0;

    /// Arguments following argv[0] that parse the entry file without running it
    virtual std::vector<std::string> check_arguments() const = 0;

private:
    std::string interpreter_;
};

} // namespace execbox

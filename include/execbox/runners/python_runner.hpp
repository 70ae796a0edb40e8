#pragma once

#include <execbox/execution/language.hpp>
#include <execbox/runners/language_runner.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace execbox {

/// CPython 3. Runs ``main.py`` in isolated mode (-I), without writing bytecode (-B) and with
/// unbuffered output (-u) so that output written before a kill is not lost.
class PythonRunner : public LanguageRunner
{
public:
    explicit PythonRunner(std::string interpreter = "python3")
        : LanguageRunner{std::move(interpreter)} {}

    Language language() const override { return Language::Python; }

    std::string_view entry_file_name() const override { return "main.py"; }

    std::vector<SyntaxDiagnostic> parse_check_output(std::string_view stdout_output,
                                                     std::string_view stderr_output) const override;

protected:
    std::vector<std::string> run_arguments() const override;
    std::vector<std::string> check_arguments() const override;
};

} // namespace execbox

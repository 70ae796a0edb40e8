#pragma once

#include <execbox/execution/language.hpp>
#include <execbox/runners/language_runner.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace execbox {

/// Node.js. Runs ``main.js`` as a CommonJS script; checking uses ``node --check``.
class JavaScriptRunner : public LanguageRunner
{
public:
    explicit JavaScriptRunner(std::string interpreter = "node")
        : LanguageRunner{std::move(interpreter)} {}

    Language language() const override { return Language::JavaScript; }

    std::string_view entry_file_name() const override { return "main.js"; }

    std::vector<SyntaxDiagnostic> parse_check_output(std::string_view stdout_output,
                                                     std::string_view stderr_output) const override;

protected:
    std::vector<std::string> run_arguments() const override;
    std::vector<std::string> check_arguments() const override;
};

} // namespace execbox

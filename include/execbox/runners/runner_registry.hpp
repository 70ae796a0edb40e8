#pragma once

#include <execbox/execution/language.hpp>
#include <execbox/runners/language_runner.hpp>

#include <memory>
#include <string>
#include <vector>

namespace execbox {

/// Names or paths of the interpreters behind each language
struct InterpreterConfig
{
    std::string python = "python3";
    std::string node = "node";
};

/// Creates the runner for ``language``. The only place that maps a Language to a runner type.
std::unique_ptr<LanguageRunner> make_runner(Language language, const InterpreterConfig& interpreters);

/// One runner per supported language
class RunnerRegistry
{
public:
    explicit RunnerRegistry(const InterpreterConfig& interpreters = {});

    const LanguageRunner& get(Language language) const;

private:
    std::vector<std::unique_ptr<LanguageRunner>> runners_;
};

} // namespace execbox

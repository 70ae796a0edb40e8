#include <execbox/runners/runner_registry.hpp>

#include <execbox/execution/language.hpp>
#include <execbox/runners/javascript_runner.hpp>
#include <execbox/runners/language_runner.hpp>
#include <execbox/runners/python_runner.hpp>

#include <libassert/assert.hpp>
#include <range/v3/algorithm/find_if.hpp>

#include <memory>

namespace execbox {

std::unique_ptr<LanguageRunner> make_runner(Language language, const InterpreterConfig& interpreters) {
    switch (language) {
    case Language::Python:
        return std::make_unique<PythonRunner>(interpreters.python);
    case Language::JavaScript:
        return std::make_unique<JavaScriptRunner>(interpreters.node);
    }

    UNREACHABLE(language);
}

RunnerRegistry::RunnerRegistry(const InterpreterConfig& interpreters) {
    for (Language language : SUPPORTED_LANGUAGES) {
        runners_.push_back(make_runner(language, interpreters));
    }
}

const LanguageRunner& RunnerRegistry::get(Language language) const {
    auto iter = ranges::find_if(runners_, [language](const auto& runner) { return runner->language() == language; });

    ASSERT(iter != runners_.end(), "Every supported language has a runner", language);

    return **iter;
}

} // namespace execbox

#include <execbox/validation/syntax_validator.hpp>

#include <execbox/execution/execution_request.hpp>
#include <execbox/execution/execution_result.hpp>
#include <execbox/logging.hpp>
#include <execbox/runners/language_runner.hpp>

#include <fmt/format.h>
#include <libassert/assert.hpp>
#include <range/v3/range/conversion.hpp>
#include <range/v3/view/transform.hpp>

#include <exception>
#include <string>
#include <string_view>
#include <vector>

namespace execbox {

namespace {

ValidationResult invalid(std::string reason) {
    return {.valid = false, .errors = {std::move(reason)}};
}

} // namespace

SyntaxValidator::SyntaxValidator(Executor& executor, const RunnerRegistry& runners)
    : executor_{&executor}
    , runners_{&runners} {}

ValidationResult SyntaxValidator::validate(std::string_view code, Language language) const {
    auto request = ExecutionRequest::create(std::string{code}, language,
                                            {.timeout = CHECK_TIMEOUT,
                                             .max_memory_bytes = CHECK_MAX_MEMORY,
                                             .stdin_input = "",
                                             .mode = ExecutionMode::SyntaxCheck});

    ASSERT(request.has_value(), "The fixed syntax check budget is always valid");

    ExecutionResult result;

    try {
        result = executor_->execute(request.value());
    } catch (const std::exception& ex) {
        LOG_WARN("Syntax check of {} code failed internally: {}", language, ex.what());
        return invalid(fmt::format("Syntax check could not be performed: {}", ex.what()));
    }

    if (result.timed_out) {
        return invalid(fmt::format("Syntax check timed out after {}ms", CHECK_TIMEOUT.count()));
    }

    if (result.memory_exceeded) {
        return invalid(fmt::format("Syntax check exceeded its memory budget of {}", format_memory_size(CHECK_MAX_MEMORY)));
    }

    if (result.exit_code == 0) {
        return {.valid = true, .errors = {}};
    }

    // Neither exited nor killed: the checker never ran
    if (!result.exit_code && !result.term_signal) {
        return invalid(fmt::format("Syntax check could not be performed: {}", result.error.value_or("unknown error")));
    }

    const LanguageRunner& runner = runners_->get(language);

    const std::vector diagnostics = runner.parse_check_output(result.stdout_output, result.stderr_output);

    std::vector errors =
        diagnostics | ranges::views::transform(&SyntaxDiagnostic::to_string) | ranges::to<std::vector<std::string>>;

    if (errors.empty()) {
        errors.push_back(result.error.value_or("Syntax check failed"));
    }

    LOG_DEBUG("{} code has {} syntax error(s)", language, errors.size());

    return {.valid = false, .errors = std::move(errors)};
}

} // namespace execbox

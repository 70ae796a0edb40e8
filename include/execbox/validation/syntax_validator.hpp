#pragma once

#include <execbox/common/memory_size.hpp>
#include <execbox/execution/language.hpp>
#include <execbox/runners/runner_registry.hpp>
#include <execbox/sandbox/sandbox.hpp>

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace execbox {

struct ValidationResult
{
    bool valid{};
    /// Human readable diagnostics; empty when valid
    std::vector<std::string> errors;
};

/// Checks whether code parses, using the language's own front end in check-only mode.
/// User code is never executed. The check runs in the sandbox with a short fixed budget.
class SyntaxValidator
{
public:
    static constexpr std::chrono::milliseconds CHECK_TIMEOUT{5'000};
    static constexpr std::uint64_t CHECK_MAX_MEMORY = 256 * MIB;

    SyntaxValidator(Executor& executor, const RunnerRegistry& runners);

    ValidationResult validate(std::string_view code, Language language) const;

private:
    Executor* executor_;
    const RunnerRegistry* runners_;
};

} // namespace execbox

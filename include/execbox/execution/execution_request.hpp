#pragma once

#include <execbox/common/error_types.hpp>
#include <execbox/common/expected.hpp>
#include <execbox/common/memory_size.hpp>
#include <execbox/execution/language.hpp>

#include <chrono>
#include <cstdint>
#include <string>
#include <utility>

namespace execbox {

/// Whether the sandbox runs the program or only asks the interpreter to parse it
enum class ExecutionMode {
    Execute,
    SyntaxCheck,
};

inline constexpr std::chrono::milliseconds DEFAULT_TIMEOUT{10'000};
inline constexpr std::uint64_t DEFAULT_MAX_MEMORY = 128 * MIB;

struct ExecutionOptions
{
    std::chrono::milliseconds timeout = DEFAULT_TIMEOUT;
    std::uint64_t max_memory_bytes = DEFAULT_MAX_MEMORY;
    std::string stdin_input;
    ExecutionMode mode = ExecutionMode::Execute;
};

/// One run of untrusted code. Immutable once created; obtain one via ``create``
class ExecutionRequest
{
public:
    /// Validates the budget (positive timeout, non-zero memory) and builds the request.
    /// Empty ``code`` is accepted here; rejecting it is the engine boundary's job.
    static Expected<ExecutionRequest, CallerInputError> create(std::string code, Language language,
                                                               ExecutionOptions options = {}) {
        if (options.timeout.count() <= 0) {
            return CallerInputError{.kind = ErrorKind::InvalidArgument,
                                    .message = fmt::format("timeout must be positive (got {}ms)",
                                                           options.timeout.count())};
        }

        if (options.max_memory_bytes == 0) {
            return CallerInputError{.kind = ErrorKind::InvalidArgument, .message = "memory budget must be non-zero"};
        }

        return ExecutionRequest{std::move(code), language, std::move(options)};
    }

    const std::string& code() const { return code_; }

    Language language() const { return language_; }

    const std::string& stdin_input() const { return options_.stdin_input; }

    std::chrono::milliseconds timeout() const { return options_.timeout; }

    std::uint64_t max_memory_bytes() const { return options_.max_memory_bytes; }

    ExecutionMode mode() const { return options_.mode; }

private:
    ExecutionRequest(std::string code, Language language, ExecutionOptions options)
        : code_{std::move(code)}
        , language_{language}
        , options_{std::move(options)} {}

    std::string code_;
    Language language_;
    ExecutionOptions options_;
};

} // namespace execbox

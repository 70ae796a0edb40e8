#include <execbox/engine.hpp>

#include <execbox/common/error_types.hpp>
#include <execbox/common/expected.hpp>
#include <execbox/common/linux.hpp>
#include <execbox/common/memory_size.hpp>
#include <execbox/execution/execution_request.hpp>
#include <execbox/logging.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <chrono>
#include <csignal>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <utility>

#include <unistd.h>

namespace execbox {

namespace {

/// Writes into a pipe whose reader has gone must fail with EPIPE instead of killing the engine
void ignore_sigpipe() {
    static std::once_flag once;

    std::call_once(once, [] {
        if (!linux::signal(SIGPIPE, SIG_IGN)) {
            LOG_WARN("Could not ignore SIGPIPE: {}", get_err_msg());
        }
    });
}

} // namespace

std::size_t EngineConfig::default_concurrency() {
    return std::max(1U, std::thread::hardware_concurrency());
}

Expected<void, std::string> EngineConfig::validate() const {
    if (max_concurrent_executions == 0) {
        return std::string{"max_concurrent_executions must be at least 1"};
    }

    if (max_parallel_cases == 0) {
        return std::string{"max_parallel_cases must be at least 1"};
    }

    if (watch_interval.count() <= 0) {
        return std::string{"watch_interval must be positive"};
    }

    if (kill_grace.count() < 0) {
        return std::string{"kill_grace must not be negative"};
    }

    if (max_output_bytes == 0 || max_file_bytes == 0) {
        return std::string{"output and file size caps must be non-zero"};
    }

    if (max_processes && *max_processes == 0) {
        return std::string{"max_processes must be at least 1"};
    }

    if (workspace_root.empty()) {
        return std::string{"workspace_root must not be empty"};
    }

    if (python_interpreter.empty() || node_interpreter.empty()) {
        return std::string{"interpreter names must not be empty"};
    }

    if (cgroup_root) {
        std::error_code err;

        if (!std::filesystem::is_directory(*cgroup_root, err)) {
            return fmt::format("cgroup root {} is not a directory", cgroup_root->string());
        }

        if (!std::filesystem::exists(*cgroup_root / "cgroup.controllers", err)) {
            return fmt::format("{} is not a cgroup v2 directory", cgroup_root->string());
        }

        if (!linux::access(cgroup_root->string(), W_OK)) {
            return fmt::format("cgroup root {} is not writable", cgroup_root->string());
        }
    }

    return {};
}

SandboxConfig EngineConfig::sandbox_config() const {
    return SandboxConfig{.workspace_root = workspace_root,
                         .limiter = LimiterConfig{.cgroup_root = cgroup_root,
                                                  .kill_grace = kill_grace,
                                                  .watch_interval = watch_interval,
                                                  .max_file_bytes = max_file_bytes,
                                                  .max_processes = max_processes,
                                                  .limit_address_space = limit_address_space},
                         .max_output_bytes = max_output_bytes,
                         .isolate_network = isolate_network};
}

InterpreterConfig EngineConfig::interpreter_config() const {
    return InterpreterConfig{.python = python_interpreter, .node = node_interpreter};
}

Expected<std::unique_ptr<CodeExecutionEngine>, std::string> CodeExecutionEngine::create(EngineConfig config) {
    if (auto valid = config.validate(); !valid) {
        return fmt::format("Invalid engine configuration: {}", valid.error());
    }

    // NOLINTNEXTLINE(*owning-memory) - constructor is private
    return std::unique_ptr<CodeExecutionEngine>(new CodeExecutionEngine(std::move(config)));
}

CodeExecutionEngine::CodeExecutionEngine(EngineConfig config)
    : config_{std::move(config)}
    , runners_{config_.interpreter_config()}
    , gate_{config_.max_concurrent_executions}
    , sandbox_{config_.sandbox_config(), runners_, gate_}
    , validator_{sandbox_, runners_}
    , harness_{sandbox_} {
    ignore_sigpipe();

    LOG_DEBUG("Engine ready: {} concurrent executions, workspaces under {}, memory via {}",
              config_.max_concurrent_executions, config_.workspace_root.string(),
              config_.cgroup_root ? config_.cgroup_root->string() : "the watcher");
}

Expected<Language, CallerInputError> CodeExecutionEngine::check_input(std::string_view code,
                                                                      std::string_view language) {
    if (code.empty()) {
        return CallerInputError{.kind = ErrorKind::MissingCode, .message = "No code was provided"};
    }

    auto parsed = parse_language(language);

    if (!parsed) {
        return CallerInputError{
            .kind = ErrorKind::UnsupportedLanguage,
            .message = fmt::format("Unsupported language \"{}\". Use \"python\" or \"javascript\"", language)};
    }

    return *parsed;
}

Expected<std::uint64_t, CallerInputError> CodeExecutionEngine::check_memory(std::string_view max_memory) {
    auto bytes = parse_memory_size(max_memory);

    if (!bytes) {
        return CallerInputError{.kind = ErrorKind::InvalidArgument,
                                .message = fmt::format("Invalid memory limit: {}", bytes.error())};
    }

    return bytes.value();
}

Expected<void, CallerInputError> CodeExecutionEngine::check_timeout(std::chrono::milliseconds timeout) {
    if (timeout.count() <= 0) {
        return CallerInputError{.kind = ErrorKind::InvalidArgument,
                                .message = fmt::format("Timeout must be positive (got {}ms)", timeout.count())};
    }

    return {};
}

Expected<ExecutionResult, CallerInputError>
CodeExecutionEngine::execute_code(std::string_view code, std::string_view language, const ExecuteOptions& options) {
    Language lang = TRY(check_input(code, language));
    std::uint64_t max_memory = TRY(check_memory(options.max_memory));
    TRY(check_timeout(options.timeout));

    auto request = TRY(ExecutionRequest::create(
        std::string{code}, lang,
        {.timeout = options.timeout, .max_memory_bytes = max_memory, .stdin_input = options.input}));

    return sandbox_.execute(request);
}

Expected<ValidationResult, CallerInputError> CodeExecutionEngine::validate_syntax(std::string_view code,
                                                                                  std::string_view language) {
    Language lang = TRY(check_input(code, language));

    return validator_.validate(code, lang);
}

Expected<TestBatchResult, CallerInputError>
CodeExecutionEngine::run_tests(std::string_view code, std::string_view language, std::span<const TestCase> test_cases,
                               const RunTestsOptions& options, const TestHarness::CaseCallback& on_case_done) {
    Language lang = TRY(check_input(code, language));
    std::uint64_t max_memory = TRY(check_memory(options.max_memory));
    TRY(check_timeout(options.timeout));

    std::size_t parallel_cases = options.max_parallel_cases.value_or(config_.max_parallel_cases);

    if (parallel_cases == 0) {
        return CallerInputError{.kind = ErrorKind::InvalidArgument,
                                .message = "At least one test case must be allowed to run at a time"};
    }

    const TestOptions test_options{
        .timeout = options.timeout, .max_memory_bytes = max_memory, .max_parallel_cases = parallel_cases};

    return harness_.run_tests(code, lang, test_cases, test_options, on_case_done);
}

Expected<SubmissionResult, CallerInputError> CodeExecutionEngine::execute_submission(std::string_view code,
                                                                                     std::string_view language,
                                                                                     const SubmissionOptions& options) {
    if (options.custom_input) {
        ExecutionResult result = TRY(execute_code(code, language, {.input = *options.custom_input}));
        return SubmissionResult{std::move(result)};
    }

    if (!options.test_cases.empty()) {
        TestBatchResult result = TRY(run_tests(code, language, options.test_cases));
        return SubmissionResult{std::move(result)};
    }

    ExecutionResult result = TRY(execute_code(code, language));
    return SubmissionResult{std::move(result)};
}

} // namespace execbox

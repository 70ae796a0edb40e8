#pragma once

#include <execbox/common/class_traits.hpp>
#include <execbox/common/error_types.hpp>
#include <execbox/common/expected.hpp>
#include <execbox/common/memory_size.hpp>
#include <execbox/execution/execution_result.hpp>
#include <execbox/execution/language.hpp>
#include <execbox/execution/test_case.hpp>
#include <execbox/harness/test_harness.hpp>
#include <execbox/runners/runner_registry.hpp>
#include <execbox/sandbox/admission_gate.hpp>
#include <execbox/sandbox/sandbox.hpp>
#include <execbox/validation/syntax_validator.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace execbox {

/// Deployment parameters of an engine. Check with ``validate`` before use.
struct EngineConfig
{
    /// Global cap on executions in flight, across all callers and batches
    std::size_t max_concurrent_executions = default_concurrency();

    std::filesystem::path workspace_root = std::filesystem::temp_directory_path() / "execbox";
    /// Delegated cgroup v2 directory; without one, memory is enforced by the watcher
    std::optional<std::filesystem::path> cgroup_root;

    std::chrono::milliseconds kill_grace{200};
    std::chrono::milliseconds watch_interval{10};

    std::size_t max_output_bytes = 1 * MIB;
    std::uint64_t max_file_bytes = 16 * MIB;
    std::optional<std::uint64_t> max_processes;
    bool limit_address_space = false;
    bool isolate_network = false;

    std::string python_interpreter = "python3";
    std::string node_interpreter = "node";

    /// Default for how many cases of one batch run at the same time
    std::size_t max_parallel_cases = 4;

    Expected<void, std::string> validate() const;

    SandboxConfig sandbox_config() const;
    InterpreterConfig interpreter_config() const;

    static std::size_t default_concurrency();
};

/// Options of a single ad-hoc run
struct ExecuteOptions
{
    std::chrono::milliseconds timeout = DEFAULT_TIMEOUT;
    /// Human readable size token, e.g. "128m"
    std::string max_memory = "128m";
    std::string input;
};

/// Options of a batch run
struct RunTestsOptions
{
    std::chrono::milliseconds timeout = DEFAULT_TIMEOUT;
    std::string max_memory = "128m";
    /// Falls back to EngineConfig::max_parallel_cases
    std::optional<std::size_t> max_parallel_cases;
};

/// A submission as sent by a student: custom input takes precedence over test cases
struct SubmissionOptions
{
    std::optional<std::string> custom_input;
    std::vector<TestCase> test_cases;
};

using SubmissionResult = std::variant<ExecutionResult, TestBatchResult>;

/// Entry point of the engine. Validates caller input at the boundary and routes it to the
/// sandbox, the syntax validator or the test harness. Safe to use from many threads at once;
/// concurrency is bounded by the engine's admission gate.
class CodeExecutionEngine : NonMovable
{
public:
    /// Fails with a description of the first invalid setting
    static Expected<std::unique_ptr<CodeExecutionEngine>, std::string> create(EngineConfig config = {});

    /// Runs ``code`` once. Caller-input errors (unsupported language, missing code, malformed
    /// memory token, non-positive timeout) are returned before anything is spawned.
    Expected<ExecutionResult, CallerInputError> execute_code(std::string_view code, std::string_view language,
                                                             const ExecuteOptions& options = {});

    Expected<ValidationResult, CallerInputError> validate_syntax(std::string_view code, std::string_view language);

    Expected<TestBatchResult, CallerInputError> run_tests(std::string_view code, std::string_view language,
                                                          std::span<const TestCase> test_cases,
                                                          const RunTestsOptions& options = {},
                                                          const TestHarness::CaseCallback& on_case_done = {});

    /// Custom input present: one run with it. Otherwise, test cases present: the batch.
    /// Otherwise: one run with empty input. Uses the default budget in every case.
    Expected<SubmissionResult, CallerInputError> execute_submission(std::string_view code, std::string_view language,
                                                                    const SubmissionOptions& options);

    const EngineConfig& config() const { return config_; }

    AdmissionGate& admission_gate() { return gate_; }

private:
    explicit CodeExecutionEngine(EngineConfig config);

    static Expected<Language, CallerInputError> check_input(std::string_view code, std::string_view language);

    static Expected<std::uint64_t, CallerInputError> check_memory(std::string_view max_memory);

    static Expected<void, CallerInputError> check_timeout(std::chrono::milliseconds timeout);

    EngineConfig config_;

    RunnerRegistry runners_;
    AdmissionGate gate_;
    ExecutionSandbox sandbox_;
    SyntaxValidator validator_;
    TestHarness harness_;
};

} // namespace execbox

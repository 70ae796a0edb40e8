#include "catch2_custom.hpp"

#include <execbox/common/error_types.hpp>
#include <execbox/engine.hpp>
#include <execbox/execution/execution_result.hpp>
#include <execbox/execution/test_case.hpp>

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

using namespace std::chrono_literals;

using execbox::CodeExecutionEngine;
using execbox::EngineConfig;
using execbox::ErrorKind;
using execbox::ExecutionResult;
using execbox::TestBatchResult;
using execbox::TestCase;

namespace {

std::unique_ptr<CodeExecutionEngine> make_engine(const TempDir& root) {
    auto engine = CodeExecutionEngine::create({.max_concurrent_executions = 2, .workspace_root = root / "workspaces"});
    REQUIRE(engine);
    return std::move(engine.value());
}

} // namespace

TEST_CASE("Engine configurations are validated") {
    REQUIRE(EngineConfig{}.validate());

    SECTION("Concurrency") {
        REQUIRE(EngineConfig{.max_concurrent_executions = 0}.validate().has_error());

        EngineConfig config;
        config.max_parallel_cases = 0;
        REQUIRE(config.validate().has_error());
    }

    SECTION("Limiter settings") {
        EngineConfig config;

        config.watch_interval = 0ms;
        REQUIRE(config.validate().has_error());

        config = {};
        config.kill_grace = -1ms;
        REQUIRE(config.validate().has_error());

        config = {};
        config.max_output_bytes = 0;
        REQUIRE(config.validate().has_error());

        config = {};
        config.max_processes = 0;
        REQUIRE(config.validate().has_error());
    }

    SECTION("Paths and interpreters") {
        EngineConfig config;

        config.workspace_root.clear();
        REQUIRE(config.validate().has_error());

        config = {};
        config.python_interpreter.clear();
        REQUIRE(config.validate().has_error());

        TempDir not_a_cgroup;
        config = {};
        config.cgroup_root = not_a_cgroup.path();
        auto result = config.validate();
        REQUIRE(result.has_error());
        REQUIRE_THAT(result.error(), Catch::Matchers::ContainsSubstring("is not a cgroup v2 directory"));
    }

    SECTION("create refuses invalid configurations") {
        auto engine = CodeExecutionEngine::create({.max_concurrent_executions = 0});
        REQUIRE_FALSE(engine);
        REQUIRE_THAT(engine.error(), Catch::Matchers::StartsWith("Invalid engine configuration:"));
    }
}

TEST_CASE("Caller input errors are returned before anything runs") {
    TempDir root;
    auto engine = make_engine(root);

    SECTION("Missing code") {
        auto result = engine->execute_code("", "python");
        REQUIRE(result.has_error());
        REQUIRE(result.error().kind == ErrorKind::MissingCode);
        REQUIRE(result.error().message == "No code was provided");

        REQUIRE(engine->validate_syntax("", "javascript").error().kind == ErrorKind::MissingCode);
        REQUIRE(engine->run_tests("", "python", {}).error().kind == ErrorKind::MissingCode);
    }

    SECTION("Unsupported language") {
        auto result = engine->execute_code("puts 1", "ruby");
        REQUIRE(result.has_error());
        REQUIRE(result.error().kind == ErrorKind::UnsupportedLanguage);
        REQUIRE(result.error().message == "Unsupported language \"ruby\". Use \"python\" or \"javascript\"");

        // Names are case sensitive
        REQUIRE(engine->execute_code("print(1)", "Python").error().kind == ErrorKind::UnsupportedLanguage);
    }

    SECTION("Malformed memory limit") {
        auto result = engine->execute_code("print(1)", "python", {.max_memory = "lots"});
        REQUIRE(result.has_error());
        REQUIRE(result.error().kind == ErrorKind::InvalidArgument);
        REQUIRE_THAT(result.error().message, Catch::Matchers::StartsWith("Invalid memory limit"));

        REQUIRE(engine->run_tests("print(1)", "python", {}, {.max_memory = "12q"}).error().kind ==
                ErrorKind::InvalidArgument);
    }

    SECTION("Non-positive timeout") {
        auto result = engine->execute_code("print(1)", "python", {.timeout = 0ms});
        REQUIRE(result.has_error());
        REQUIRE(result.error().kind == ErrorKind::InvalidArgument);

        REQUIRE(engine->run_tests("print(1)", "python", {}, {.timeout = -5ms}).error().kind ==
                ErrorKind::InvalidArgument);
    }

    SECTION("Zero parallel cases") {
        auto result = engine->run_tests("print(1)", "python", {}, {.max_parallel_cases = 0});
        REQUIRE(result.has_error());
        REQUIRE(result.error().kind == ErrorKind::InvalidArgument);
    }

    REQUIRE(engine->admission_gate().in_use() == 0);
}

TEST_CASE("Code runs end to end") {
    REQUIRE_INTERPRETER("python3");
    TempDir root;
    auto engine = make_engine(root);

    SECTION("Single run") {
        auto result = engine->execute_code("print(2 + 2)", "python");

        REQUIRE(result);
        REQUIRE(result->output() == "4");
        REQUIRE(result->succeeded());
    }

    SECTION("Single run with input and budget") {
        auto result = engine->execute_code("print(input().upper())", "python",
                                           {.timeout = 2s, .max_memory = "64m", .input = "shout\n"});

        REQUIRE(result);
        REQUIRE(result->output() == "SHOUT");
    }

    SECTION("Syntax check") {
        auto valid = engine->validate_syntax("x = [1, 2]\n", "python");
        REQUIRE(valid);
        REQUIRE(valid->valid);

        auto invalid = engine->validate_syntax("x = [1, 2\n", "python");
        REQUIRE(invalid);
        REQUIRE_FALSE(invalid->valid);
        REQUIRE_FALSE(invalid->errors.empty());
    }

    SECTION("Test batch") {
        std::vector<TestCase> cases{
            {.input = "hello\n", .expected_output = "hello", .description = "echo"},
            {.input = "world\n", .expected_output = "something else", .description = std::nullopt},
        };

        std::size_t callbacks = 0;
        auto batch = engine->run_tests("print(input())", "python", cases, {},
                                       [&](std::size_t, const execbox::CaseResult&) { ++callbacks; });

        REQUIRE(batch);
        REQUIRE(batch->total_count == 2);
        REQUIRE(batch->passed_count == 1);
        REQUIRE(batch->score_percent == Catch::Approx(50.0));
        REQUIRE(batch->case_results[0].passed);
        REQUIRE(batch->case_results[1].actual_output == "world");
        REQUIRE(callbacks == 2);
    }

    REQUIRE(engine->admission_gate().in_use() == 0);
}

TEST_CASE("Submissions are routed by what they carry") {
    REQUIRE_INTERPRETER("python3");
    TempDir root;
    auto engine = make_engine(root);

    const std::string code = "import sys\nprint(len(sys.stdin.read().split()))";
    const std::vector<TestCase> cases{{.input = "a b", .expected_output = "2", .description = std::nullopt}};

    SECTION("Custom input wins over test cases") {
        auto result = engine->execute_submission(code, "python", {.custom_input = "x y z", .test_cases = cases});

        REQUIRE(result);
        REQUIRE(std::holds_alternative<ExecutionResult>(*result));
        REQUIRE(std::get<ExecutionResult>(*result).output() == "3");
    }

    SECTION("Test cases without custom input run as a batch") {
        auto result = engine->execute_submission(code, "python", {.custom_input = std::nullopt, .test_cases = cases});

        REQUIRE(result);
        REQUIRE(std::holds_alternative<TestBatchResult>(*result));
        REQUIRE(std::get<TestBatchResult>(*result).passed_count == 1);
    }

    SECTION("Neither runs once with empty input") {
        auto result = engine->execute_submission(code, "python", {});

        REQUIRE(result);
        REQUIRE(std::holds_alternative<ExecutionResult>(*result));
        REQUIRE(std::get<ExecutionResult>(*result).output() == "0");
    }

    SECTION("Caller errors still apply") {
        auto result = engine->execute_submission(code, "cobol", {});

        REQUIRE_FALSE(result);
        REQUIRE(result.error().kind == ErrorKind::UnsupportedLanguage);
    }
}

#include "catch2_custom.hpp"

#include <execbox/common/error_types.hpp>
#include <execbox/execution/execution_request.hpp>
#include <execbox/execution/execution_result.hpp>
#include <execbox/execution/language.hpp>

#include <chrono>
#include <optional>

using namespace std::chrono_literals;
using execbox::ExecutionRequest;
using execbox::Language;

TEST_CASE("Language names are parsed exactly") {
    REQUIRE(execbox::parse_language("python") == Language::Python);
    REQUIRE(execbox::parse_language("javascript") == Language::JavaScript);

    REQUIRE_FALSE(execbox::parse_language("ruby").has_value());
    REQUIRE_FALSE(execbox::parse_language("js").has_value());
    REQUIRE_FALSE(execbox::parse_language("PYTHON").has_value());
    REQUIRE_FALSE(execbox::parse_language("").has_value());

    REQUIRE(fmt::format("{}", Language::JavaScript) == "javascript");
}

TEST_CASE("Language is inferred from file extensions") {
    REQUIRE(execbox::language_from_extension(".py") == Language::Python);
    REQUIRE(execbox::language_from_extension(".js") == Language::JavaScript);
    REQUIRE_FALSE(execbox::language_from_extension(".rb").has_value());
    REQUIRE_FALSE(execbox::language_from_extension("").has_value());
}

TEST_CASE("Execution requests validate their budget") {
    auto request = ExecutionRequest::create("print(1)", Language::Python);

    REQUIRE(request);
    REQUIRE(request->timeout() == execbox::DEFAULT_TIMEOUT);
    REQUIRE(request->max_memory_bytes() == execbox::DEFAULT_MAX_MEMORY);
    REQUIRE(request->stdin_input().empty());
    REQUIRE(request->mode() == execbox::ExecutionMode::Execute);

    auto zero_timeout = ExecutionRequest::create("print(1)", Language::Python, {.timeout = 0ms});
    REQUIRE_FALSE(zero_timeout);
    REQUIRE(zero_timeout.error().kind == execbox::ErrorKind::InvalidArgument);

    REQUIRE_FALSE(ExecutionRequest::create("print(1)", Language::Python, {.timeout = -5ms}));
    REQUIRE_FALSE(ExecutionRequest::create("print(1)", Language::Python, {.max_memory_bytes = 0}));

    // Rejecting empty code is left to the engine boundary
    REQUIRE(ExecutionRequest::create("", Language::JavaScript));
}

TEST_CASE("Execution result helpers") {
    execbox::ExecutionResult result;
    result.stdout_output = "hello\n\n";
    result.exit_code = 0;

    REQUIRE(result.output() == "hello");
    REQUIRE(result.succeeded());

    auto fault = execbox::ExecutionResult::engine_fault("Execution environment error: boom");
    REQUIRE_FALSE(fault.succeeded());
    REQUIRE_FALSE(fault.exit_code.has_value());
    REQUIRE_FALSE(fault.timed_out);
    REQUIRE(fault.stdout_output.empty());
}

#include "app/execbox_app.hpp"

#include "output/plaintext_serializer.hpp"
#include "output/serializer.hpp"
#include "output/stdout_sink.hpp"
#include "output/verbosity.hpp"
#include "user/case_directory_reader.hpp"
#include "user/program_options.hpp"

#include <execbox/common/error_types.hpp>
#include <execbox/engine.hpp>
#include <execbox/execution/language.hpp>
#include <execbox/execution/test_case.hpp>
#include <execbox/logging.hpp>

#include <fmt/format.h>
#include <libassert/assert.hpp>

#include <cstddef>
#include <cstdlib>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace execbox {

int ExecboxApp::run_impl() {
    StdoutSink output_sink;
    PlainTextSerializer serializer{output_sink, OPTS.colorize_option, OPTS.verbosity};

    auto engine = CodeExecutionEngine::create(OPTS.engine);

    if (!engine) {
        serializer.on_error(engine.error());
        serializer.finalize();
        return EXIT_FAILURE;
    }

    // Validated by ProgramOptions::validate
    auto language = OPTS.resolve_language();
    ASSERT(language.has_value());

    auto code = read_whole_file(OPTS.source_file);

    if (!code) {
        serializer.on_error(fmt::format("Failed to read \"{}\": {}", OPTS.source_file.string(), code.error().message()));
        serializer.finalize();
        return EXIT_FAILURE;
    }

    LOG_DEBUG("Running command {} on {} ({})", to_string(OPTS.command), OPTS.source_file.string(), *language);

    int exit_code = EXIT_FAILURE;

    switch (OPTS.command) {
    case ProgramOptions::Command::Run:
        exit_code = run_command(**engine, serializer, *code, *language);
        break;
    case ProgramOptions::Command::Validate:
        exit_code = validate_command(**engine, serializer, *code, *language);
        break;
    case ProgramOptions::Command::Test:
        exit_code = test_command(**engine, serializer, *code, *language);
        break;
    }

    serializer.finalize();

    return exit_code;
}

int ExecboxApp::run_command(CodeExecutionEngine& engine, Serializer& serializer, const std::string& code,
                            Language language) const {
    ExecuteOptions options{.timeout = OPTS.timeout, .max_memory = OPTS.max_memory, .input = {}};

    if (OPTS.input) {
        options.input = *OPTS.input;
    } else if (OPTS.input_file) {
        auto input = read_whole_file(*OPTS.input_file);

        if (!input) {
            serializer.on_error(
                fmt::format("Failed to read \"{}\": {}", OPTS.input_file->string(), input.error().message()));
            return EXIT_FAILURE;
        }

        options.input = std::move(*input);
    }

    auto result = engine.execute_code(code, to_string(language), options);

    if (!result) {
        serializer.on_error(result.error().message);
        return EXIT_FAILURE;
    }

    serializer.on_execution_result(*result);

    return result->succeeded() ? EXIT_SUCCESS : EXIT_FAILURE;
}

int ExecboxApp::validate_command(CodeExecutionEngine& engine, Serializer& serializer, const std::string& code,
                                 Language language) const {
    auto result = engine.validate_syntax(code, to_string(language));

    if (!result) {
        serializer.on_error(result.error().message);
        return EXIT_FAILURE;
    }

    serializer.on_validation_result(*result);

    return result->valid ? EXIT_SUCCESS : EXIT_FAILURE;
}

int ExecboxApp::test_command(CodeExecutionEngine& engine, Serializer& serializer, const std::string& code,
                             Language language) const {
    auto cases = CaseDirectoryReader{OPTS.cases_dir}.read();

    if (!cases) {
        serializer.on_error(cases.error());
        return EXIT_FAILURE;
    }

    RunTestsOptions options{.timeout = OPTS.timeout, .max_memory = OPTS.max_memory, .max_parallel_cases = OPTS.jobs};

    // Calls are serialized by the harness
    auto on_case_done = [&serializer](std::size_t index, const CaseResult& case_result) {
        serializer.on_case_result(index, case_result);
    };

    auto batch = engine.run_tests(code, to_string(language), *cases, options, on_case_done);

    if (!batch) {
        serializer.on_error(batch.error().message);
        return EXIT_FAILURE;
    }

    serializer.on_batch_result(*batch);

    const auto num_failed = static_cast<int>(batch->total_count - batch->passed_count);

    if (OPTS.verbosity == VerbosityLevel::Silent) {
        return num_failed;
    }

    return num_failed == 0 ? EXIT_SUCCESS : EXIT_FAILURE;
}

} // namespace execbox

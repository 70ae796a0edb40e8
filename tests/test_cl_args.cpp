#include "catch2_custom.hpp"

#include "output/verbosity.hpp"
#include "user/cl_args.hpp"
#include "user/program_options.hpp"

#include <execbox/execution/language.hpp>

#include <chrono>
#include <filesystem>
#include <initializer_list>
#include <string>
#include <vector>

using namespace std::chrono_literals;

using execbox::CommandLineArgs;
using execbox::Language;
using execbox::ProgramOptions;
using execbox::VerbosityLevel;

namespace {

/// Parses ``args`` as if they followed the program name on the command line
auto parse(std::initializer_list<std::string> args) {
    std::vector<std::string> storage{"/usr/local/bin/execbox"};
    storage.insert(storage.end(), args.begin(), args.end());

    std::vector<const char*> argv;
    for (const std::string& arg : storage) {
        argv.push_back(arg.c_str());
    }

    CommandLineArgs cl_args{argv};
    return cl_args.parse();
}

} // namespace

TEST_CASE("run takes a source file and an optional budget") {
    TempDir dir;
    const std::string source = dir.write("solution.py", "print(1)\n").string();

    SECTION("Defaults") {
        auto opts = parse({"run", source});

        REQUIRE(opts);
        REQUIRE(opts->command == ProgramOptions::Command::Run);
        REQUIRE(opts->source_file == source);
        REQUIRE(opts->resolve_language() == Language::Python);
        REQUIRE(opts->timeout == execbox::DEFAULT_TIMEOUT);
        REQUIRE(opts->max_memory == "128m");
        REQUIRE(opts->verbosity == ProgramOptions::DEFAULT_VERBOSITY_LEVEL);
        REQUIRE_FALSE(opts->input.has_value());
    }

    SECTION("Explicit budget and input") {
        auto opts = parse({"run", source, "-t", "500", "-m", "64m", "--input", "abc"});

        REQUIRE(opts);
        REQUIRE(opts->timeout == 500ms);
        REQUIRE(opts->max_memory == "64m");
        REQUIRE(opts->input == "abc");
    }

    SECTION("Global options precede the command") {
        auto opts = parse({"-v", "--color", "never", "--max-concurrency", "3", "--python", "/opt/python3",
                           "--isolate-network", "run", source});

        REQUIRE(opts);
        REQUIRE(opts->verbosity == VerbosityLevel::All);
        REQUIRE(opts->colorize_option == ProgramOptions::ColorizeOpt::Never);
        REQUIRE(opts->engine.max_concurrent_executions == 3);
        REQUIRE(opts->engine.python_interpreter == "/opt/python3");
        REQUIRE(opts->engine.isolate_network);
    }

    SECTION("Silent") {
        auto opts = parse({"--silent", "run", source});

        REQUIRE(opts);
        REQUIRE(opts->verbosity == VerbosityLevel::Silent);
    }
}

TEST_CASE("The language is explicit or inferred from the extension") {
    TempDir dir;
    const std::string js_source = dir.write("main.js", "console.log(1)\n").string();
    const std::string txt_source = dir.write("main.txt", "print(1)\n").string();

    REQUIRE(parse({"validate", js_source})->resolve_language() == Language::JavaScript);
    REQUIRE(parse({"validate", txt_source, "-l", "python"})->resolve_language() == Language::Python);

    auto unknown = parse({"validate", txt_source});
    REQUIRE_FALSE(unknown);
    REQUIRE_THAT(unknown.error(), Catch::Matchers::StartsWith("Cannot infer the language"));

    auto unsupported = parse({"validate", txt_source, "--language", "ruby"});
    REQUIRE_FALSE(unsupported);
    REQUIRE_THAT(unsupported.error(), Catch::Matchers::StartsWith("Unsupported language \"ruby\""));
}

TEST_CASE("test needs a case directory") {
    TempDir dir;
    const std::string source = dir.write("solution.py", "print(1)\n").string();
    std::filesystem::create_directory(dir / "cases");

    auto opts = parse({"test", source, "--cases", (dir / "cases").string(), "-j", "2"});

    REQUIRE(opts);
    REQUIRE(opts->command == ProgramOptions::Command::Test);
    REQUIRE(opts->cases_dir == dir / "cases");
    REQUIRE(opts->jobs == 2);

    REQUIRE_FALSE(parse({"test", source}));
    REQUIRE_FALSE(parse({"test", source, "--cases", (dir / "missing").string()}));
}

TEST_CASE("Invalid command lines are rejected with a reason") {
    TempDir dir;
    const std::string source = dir.write("solution.py", "print(1)\n").string();
    const std::string input_file = dir.write("input.txt", "1 2\n").string();

    SECTION("No command") {
        auto opts = parse({});
        REQUIRE_FALSE(opts);
        REQUIRE(opts.error() == "A command is required: one of run, validate, test");
    }

    SECTION("Missing source file") {
        auto opts = parse({"run", (dir / "nope.py").string()});
        REQUIRE_FALSE(opts);
        REQUIRE_THAT(opts.error(), Catch::Matchers::EndsWith("does not exist"));
    }

    SECTION("Non-numeric or zero timeout") {
        auto opts = parse({"run", source, "--timeout", "0"});
        REQUIRE_FALSE(opts);
        REQUIRE_THAT(opts.error(), Catch::Matchers::StartsWith("--timeout expects a positive integer"));

        REQUIRE_FALSE(parse({"run", source, "--timeout", "fast"}));
    }

    SECTION("Malformed memory token") {
        REQUIRE_FALSE(parse({"run", source, "--max-memory", "12 parsecs"}));
    }

    SECTION("Two sources of input") {
        auto opts = parse({"run", source, "--input", "x", "--input-file", input_file});
        REQUIRE_FALSE(opts);
        REQUIRE(opts.error() == "--input and --input-file are mutually exclusive");
    }

    SECTION("Too verbose") {
        REQUIRE_FALSE(parse({"-v", "-v", "-v", "run", source}));
    }
}

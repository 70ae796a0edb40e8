#pragma once

#include "output/verbosity.hpp"

#include <execbox/common/error_types.hpp>
#include <execbox/common/expected.hpp>
#include <execbox/common/memory_size.hpp>
#include <execbox/engine.hpp>
#include <execbox/execution/execution_request.hpp>
#include <execbox/execution/language.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace execbox {

struct ProgramOptions
{

    // ###### Argument fields

    enum class Command { Run, Validate, Test } command = Command::Run;

    /// Level of verbosity for cli output. See \ref VerbosityLevel
    VerbosityLevel verbosity = DEFAULT_VERBOSITY_LEVEL;

    enum class ColorizeOpt { Auto, Always, Never } colorize_option = ColorizeOpt::Auto;

    /// Source file to run, validate or test
    std::filesystem::path source_file;

    /// Explicit language name; inferred from the source file's extension when absent
    std::optional<std::string> language;

    // `run` only. At most one of these is set.
    std::optional<std::string> input;
    std::optional<std::filesystem::path> input_file;

    // `run` and `test`
    std::chrono::milliseconds timeout = DEFAULT_TIMEOUT;
    std::string max_memory = std::string{DEFAULT_MAX_MEMORY_TOKEN};

    // `test` only
    std::filesystem::path cases_dir;
    std::optional<std::size_t> jobs;

    /// Engine-wide settings from the global options
    EngineConfig engine;

    // ###### Argument defaults

    static constexpr std::string_view DEFAULT_MAX_MEMORY_TOKEN = "128m";
    static constexpr auto DEFAULT_VERBOSITY_LEVEL = VerbosityLevel::Summary;

    static Expected<void, std::string> ensure_file_exists(const std::filesystem::path& path,
                                                          fmt::format_string<std::string> fmt) {
        if (!std::filesystem::exists(path)) {
            return (fmt::format(fmt, path.string()) + " does not exist");
        }

        return {};
    }

    static Expected<void, std::string> ensure_is_regular_file(const std::filesystem::path& path,
                                                              fmt::format_string<std::string> fmt) {
        TRY(ensure_file_exists(path, fmt));

        if (!std::filesystem::is_regular_file(path)) {
            return (fmt::format(fmt, path.string()) + " is not a regular file");
        }

        return {};
    }

    static Expected<void, std::string> ensure_is_directory(const std::filesystem::path& path,
                                                           fmt::format_string<std::string> fmt) {
        TRY(ensure_file_exists(path, fmt));

        if (!std::filesystem::is_directory(path)) {
            return (fmt::format(fmt, path.string()) + " is not a directory");
        }

        return {};
    }

    /// The explicit language if one was given, otherwise the one implied by the file extension
    Expected<Language, std::string> resolve_language() const {
        if (language) {
            if (auto parsed = parse_language(*language)) {
                return *parsed;
            }

            return fmt::format("Unsupported language \"{}\". Use \"python\" or \"javascript\"", *language);
        }

        if (auto inferred = language_from_extension(source_file.extension().string())) {
            return *inferred;
        }

        return fmt::format("Cannot infer the language of \"{}\" from its extension; pass --language",
                           source_file.string());
    }

    /// Verify that all fields are valid
    Expected<void, std::string> validate() {
        constexpr auto MAX_VERBOSITY = VerbosityLevel::Max;
        constexpr auto MIN_VERBOSITY = VerbosityLevel{};

        verbosity = std::clamp(verbosity, MIN_VERBOSITY, MAX_VERBOSITY);

        TRY(ensure_is_regular_file(source_file, "Source file \"{}\""));
        TRY(resolve_language());

        if (input && input_file) {
            return std::string{"--input and --input-file are mutually exclusive"};
        }

        if (input_file) {
            TRY(ensure_is_regular_file(*input_file, "Input file \"{}\""));
        }

        if (timeout <= std::chrono::milliseconds::zero()) {
            return fmt::format("Timeout must be positive, got {}ms", timeout.count());
        }

        if (auto mem = parse_memory_size(max_memory); !mem) {
            return mem.error();
        }

        if (command == Command::Test) {
            TRY(ensure_is_directory(cases_dir, "Test case directory \"{}\""));

            if (jobs && *jobs == 0) {
                return std::string{"--jobs must be at least 1"};
            }
        }

        TRY(engine.validate());

        return {};
    }
};

constexpr std::string_view to_string(ProgramOptions::Command command) {
    using enum ProgramOptions::Command;

    switch (command) {
    case Run:
        return "run";
    case Validate:
        return "validate";
    case Test:
        return "test";
    }

    return "<unknown>";
}

} // namespace execbox

template <>
struct fmt::formatter<::execbox::ProgramOptions> : fmt::formatter<std::string>
{
    auto format(const ::execbox::ProgramOptions& from, fmt::format_context& ctx) const {
        std::string out = fmt::format("{{command={}, verbosity={}, color_opt={}, file={}, language={}, timeout={}ms, "
                                      "max_memory={}, cases_dir={}, jobs={}, max_concurrency={}, workspace_root={}}}",
                                      ::execbox::to_string(from.command), fmt::underlying(from.verbosity),
                                      fmt::underlying(from.colorize_option), from.source_file.string(),
                                      from.language.value_or("<inferred>"), from.timeout.count(), from.max_memory,
                                      from.cases_dir.string(), from.jobs.value_or(0),
                                      from.engine.max_concurrent_executions, from.engine.workspace_root.string());

        return fmt::formatter<std::string>::format(out, ctx);
    }
};

#include "user/cl_args.hpp"

#include "common/terminal_checks.hpp"
#include "output/verbosity.hpp"
#include "user/program_options.hpp"
#include "version.hpp"

#include <execbox/common/expected.hpp>
#include <execbox/execution/language.hpp>
#include <execbox/logging.hpp>

#include <argparse/argparse.hpp>
#include <fmt/color.h>
#include <fmt/format.h>

#include <charconv>
#include <chrono>
#include <cstddef>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>

namespace execbox {

CommandLineArgs::CommandLineArgs(std::span<const char*> args)
    : arg_parser_{get_basename(args[0]), /*unused*/ EXECBOX_VERSION_STRING, argparse::default_arguments::help}
    , run_parser_{"run", EXECBOX_VERSION_STRING, argparse::default_arguments::help}
    , validate_parser_{"validate", EXECBOX_VERSION_STRING, argparse::default_arguments::help}
    , test_parser_{"test", EXECBOX_VERSION_STRING, argparse::default_arguments::help}
    , args_{args.begin(), args.end()} {
    // Add parser arguments
    setup_parser();
}

namespace {

/// Strictly positive decimal integer, or std::invalid_argument naming ``option``
std::size_t parse_positive(std::string_view text, std::string_view option) {
    std::size_t value{};
    const auto* end = text.data() + text.size();

    auto [ptr, ec] = std::from_chars(text.data(), end, value);

    if (ec != std::errc{} || ptr != end || value == 0) {
        throw std::invalid_argument(fmt::format("{} expects a positive integer, got \"{}\"", option, text));
    }

    return value;
}

} // namespace

void CommandLineArgs::setup_parser() {
    if (auto term_sz = terminal_size(stdout)) {
        arg_parser_.set_usage_max_line_width(term_sz->ws_col * 3 / 4);
        LOG_DEBUG("Cols = {}, px = {}", term_sz->ws_col, term_sz->ws_xpixel);
    } else {
        constexpr std::size_t DEFAULT_MAX_WIDTH = 80;
        LOG_DEBUG("Failed to get terminal size. Setting max width to 80");
        arg_parser_.set_usage_max_line_width(DEFAULT_MAX_WIDTH);
    }

    arg_parser_.add_description(fmt::format("execbox v{}: run untrusted Python and JavaScript in a sandbox",
                                            EXECBOX_VERSION_STRING));

    add_global_args();

    run_parser_.add_description("Run a program once and print its output");
    add_source_args(run_parser_);
    add_budget_args(run_parser_);

    // clang-format off
    run_parser_.add_argument("-i", "--input")
        .metavar("TEXT")
        .nargs(1)
        .action([this] (const std::string& opt) {
                opts_buffer_.input = opt;
        })
        .help("Text fed to the program's standard input");

    run_parser_.add_argument("--input-file")
        .metavar("PATH")
        .nargs(1)
        .action([this] (const std::string& opt) {
                opts_buffer_.input_file = opt;
        })
        .help("File whose contents are fed to the program's standard input");
    // clang-format on

    validate_parser_.add_description("Check that a program parses, without running it");
    add_source_args(validate_parser_);

    test_parser_.add_description("Grade a program against a directory of test cases");
    add_source_args(test_parser_);
    add_budget_args(test_parser_);

    // clang-format off
    test_parser_.add_argument("--cases")
        .required()
        .metavar("DIR")
        .nargs(1)
        .action([this] (const std::string& opt) {
                opts_buffer_.cases_dir = opt;
        })
        .help("Directory of NAME.in / NAME.out pairs. A missing NAME.in means empty input.");

    test_parser_.add_argument("-j", "--jobs")
        .metavar("N")
        .nargs(1)
        .action([this] (const std::string& opt) {
                opts_buffer_.jobs = parse_positive(opt, "--jobs");
        })
        .help("How many test cases may run at the same time");
    // clang-format on

    arg_parser_.add_subparser(run_parser_);
    arg_parser_.add_subparser(validate_parser_);
    arg_parser_.add_subparser(test_parser_);
}

void CommandLineArgs::add_global_args() {
    // clang-format off

    // Verbatim from argparse.hpp, except replacing `-v` with `-V`
    arg_parser_.add_argument("-V", "--version")
        .default_value(false)
        .implicit_value(true)
        .nargs(0)
        .action([&](const auto & /*unused*/) {
            fmt::print("{}\n", EXECBOX_VERSION_STRING);
            std::exit(0);
        })
        .help("prints version information and exits");

    arg_parser_.add_argument("-v", "--verbose")
        .flag()
        .action([this] (const std::string& /*unused*/) { adjust_verbosity(+1); })
        .append()
        .help("Increase verbosity level");

    arg_parser_.add_argument("-q", "--quiet")
        .flag()
        .action([this] (const std::string& /*unused*/) { adjust_verbosity(-1); })
        .append()
        .help("Decrease verbosity level");

    arg_parser_.add_argument("--silent")
        .flag()
        .action([this] (const std::string& /*unused*/) {
                opts_buffer_.verbosity = VerbosityLevel::Silent;
            })
        .help("Suppress all output except for the return code. Useful for scripting.");

    arg_parser_.add_argument("-c", "--color")
        .choices("never", "auto", "always")
        .default_value(std::string{"auto"})
        .metavar("WHEN")
        .nargs(1)
        .help("When to use colors")
        .action([this] (const std::string& opt) {
                using enum ProgramOptions::ColorizeOpt;

                if (opt == "never") {
                    opts_buffer_.colorize_option = Never;
                } else if (opt == "auto") {
                    opts_buffer_.colorize_option = Auto;
                } else if (opt == "always") {
                    opts_buffer_.colorize_option = Always;
                }
        });

    arg_parser_.add_argument("--max-concurrency")
        .metavar("N")
        .nargs(1)
        .action([this] (const std::string& opt) {
                opts_buffer_.engine.max_concurrent_executions = parse_positive(opt, "--max-concurrency");
        })
        .help(fmt::format("Upper bound on sandboxed programs running at once (default: {})",
                          EngineConfig::default_concurrency()));

    arg_parser_.add_argument("--workspace-root")
        .metavar("DIR")
        .nargs(1)
        .action([this] (const std::string& opt) {
                opts_buffer_.engine.workspace_root = opt;
        })
        .help(fmt::format("Where per-run working directories are created (default: {})",
                          opts_buffer_.engine.workspace_root.string()));

    arg_parser_.add_argument("--cgroup-root")
        .metavar("DIR")
        .nargs(1)
        .action([this] (const std::string& opt) {
                opts_buffer_.engine.cgroup_root = opt;
        })
        .help("Delegated cgroup v2 directory used to contain each run. Without one, memory is watched via /proc.");

    arg_parser_.add_argument("--python")
        .metavar("PATH")
        .nargs(1)
        .action([this] (const std::string& opt) {
                opts_buffer_.engine.python_interpreter = opt;
        })
        .help("Python interpreter, by name or path (default: python3)");

    arg_parser_.add_argument("--node")
        .metavar("PATH")
        .nargs(1)
        .action([this] (const std::string& opt) {
                opts_buffer_.engine.node_interpreter = opt;
        })
        .help("Node.js interpreter, by name or path (default: node)");

    arg_parser_.add_argument("--isolate-network")
        .flag()
        .action([this] (const std::string& /*unused*/) {
                opts_buffer_.engine.isolate_network = true;
        })
        .help("Run programs in their own user and network namespaces, without network access");

    // clang-format on
}

void CommandLineArgs::add_source_args(argparse::ArgumentParser& parser) {
    // clang-format off
    parser.add_argument("file")
        .metavar("FILE")
        .action([this] (const std::string& opt) {
                opts_buffer_.source_file = opt;
        })
        .help("Source file of the program");

    parser.add_argument("-l", "--language")
        .metavar("LANG")
        .nargs(1)
        .action([this] (const std::string& opt) {
                opts_buffer_.language = opt;
        })
        .help(fmt::format("One of: {}, {}. Inferred from the file extension by default.",
                          to_string(Language::Python), to_string(Language::JavaScript)));
    // clang-format on
}

void CommandLineArgs::add_budget_args(argparse::ArgumentParser& parser) {
    // clang-format off
    parser.add_argument("-t", "--timeout")
        .metavar("MS")
        .nargs(1)
        .action([this] (const std::string& opt) {
                opts_buffer_.timeout = std::chrono::milliseconds{parse_positive(opt, "--timeout")};
        })
        .help(fmt::format("Wall-clock budget per run, in milliseconds (default: {})", DEFAULT_TIMEOUT.count()));

    parser.add_argument("-m", "--max-memory")
        .metavar("SIZE")
        .nargs(1)
        .action([this] (const std::string& opt) {
                opts_buffer_.max_memory = opt;
        })
        .help(fmt::format("Memory budget per run, e.g. 64m or 1g (default: {})",
                          ProgramOptions::DEFAULT_MAX_MEMORY_TOKEN));
    // clang-format on
}

void CommandLineArgs::adjust_verbosity(int delta) {
    using UnderlyingT = std::underlying_type_t<VerbosityLevel>;

    const auto current = static_cast<UnderlyingT>(opts_buffer_.verbosity);
    const auto adjusted = current + delta;

    if (adjusted >= static_cast<UnderlyingT>(VerbosityLevel::Max)) {
        throw std::invalid_argument("Verbosity specification exceeds maximum level");
    }

    if (adjusted < static_cast<UnderlyingT>(VerbosityLevel::Silent)) {
        throw std::invalid_argument("Verbosity specification is lower than minimum level");
    }

    opts_buffer_.verbosity = static_cast<VerbosityLevel>(adjusted);
}

Expected<ProgramOptions, std::string> CommandLineArgs::parse() {
    parse_successful_ = false;

    try {
        arg_parser_.parse_args(args_);
    } catch (const std::exception& err) {
        return err.what();
    }

    using enum ProgramOptions::Command;

    if (arg_parser_.is_subcommand_used(run_parser_)) {
        opts_buffer_.command = Run;
    } else if (arg_parser_.is_subcommand_used(validate_parser_)) {
        opts_buffer_.command = Validate;
    } else if (arg_parser_.is_subcommand_used(test_parser_)) {
        opts_buffer_.command = Test;
    } else {
        return std::string{"A command is required: one of run, validate, test"};
    }

    LOG_DEBUG("Parsed CLI arguments: {}", opts_buffer_);

    TRY(opts_buffer_.validate());

    parse_successful_ = true;

    return opts_buffer_;
}

std::string CommandLineArgs::help_message() const {
    if (arg_parser_.is_subcommand_used(run_parser_)) {
        return run_parser_.help().str();
    }
    if (arg_parser_.is_subcommand_used(validate_parser_)) {
        return validate_parser_.help().str();
    }
    if (arg_parser_.is_subcommand_used(test_parser_)) {
        return test_parser_.help().str();
    }

    return arg_parser_.help().str();
}

std::string CommandLineArgs::usage_message() const {
    return arg_parser_.usage();
}

std::string CommandLineArgs::get_basename(std::string_view full_name) {
    return std::string{full_name.substr(full_name.find_last_of('/') + 1)};
}

ProgramOptions parse_args_or_exit(std::span<const char*> args, int exit_code) noexcept {
    CommandLineArgs cl_args{args};
    auto opts_res = cl_args.parse();

    if (!opts_res) {
        fmt::print(stderr, "{}\n{}\n", fmt::styled(opts_res.error(), fmt::fg(fmt::color::red)),
                   cl_args.help_message());
        std::exit(exit_code);
    }

    return opts_res.value();
}

} // namespace execbox

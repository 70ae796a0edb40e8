#pragma once

#include "user/program_options.hpp"

#include <execbox/common/expected.hpp>

#include <argparse/argparse.hpp>

#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace execbox {

/// Just a wrapper around argparse for now
class CommandLineArgs
{
public:
    explicit CommandLineArgs(std::span<const char*> args);

    /// Returns:
    ///   Success - Expected<ProgramOptions> with parsed program options structure
    ///   Failure - Expected<std::string> with failure message
    Expected<ProgramOptions, std::string> parse();

    std::string usage_message() const;

    /// Help of the subcommand that was named on the command line, if any, otherwise the global help
    std::string help_message() const;

private:
    /// Set up the ArgumentParsers for fields of ProgramOptions
    void setup_parser();

    void add_global_args();
    void add_source_args(argparse::ArgumentParser& parser);
    void add_budget_args(argparse::ArgumentParser& parser);

    void adjust_verbosity(int delta);

    /// Obtain the basename of a full pathname
    /// Used for the program name with argparse
    static std::string get_basename(std::string_view full_name);

    argparse::ArgumentParser arg_parser_;

    argparse::ArgumentParser run_parser_;
    argparse::ArgumentParser validate_parser_;
    argparse::ArgumentParser test_parser_;

    std::vector<std::string> args_;

    ProgramOptions opts_buffer_ = {};

    bool parse_successful_ = false;
};

ProgramOptions parse_args_or_exit(std::span<const char*> args, int exit_code = 1) noexcept;

} // namespace execbox

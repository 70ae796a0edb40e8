#pragma once

#include "output/serializer.hpp"
#include "output/sink.hpp"
#include "output/verbosity.hpp"
#include "user/program_options.hpp"

#include <execbox/execution/execution_result.hpp>
#include <execbox/execution/test_case.hpp>
#include <execbox/validation/syntax_validator.hpp>

#include <fmt/color.h>
#include <fmt/format.h>

#include <cstddef>
#include <string>
#include <string_view>

namespace execbox {

class PlainTextSerializer : public Serializer
{
public:
    PlainTextSerializer(Sink& sink, ProgramOptions::ColorizeOpt colorize_option, VerbosityLevel verbosity);

    void on_execution_result(const ExecutionResult& data) override;
    void on_validation_result(const ValidationResult& data) override;

    void on_case_result(std::size_t index, const CaseResult& data) override;
    void on_batch_result(const TestBatchResult& data) override;

    void on_warning(std::string_view what) override;
    void on_error(std::string_view what) override;

    void finalize() override;

private:
    static bool process_colorize_opt(ProgramOptions::ColorizeOpt colorize_option);
    static std::size_t get_terminal_width();

    std::string style_str(std::string_view text, fmt::text_style style) const;

    /// Indented block of program text; "<empty>" if there is none
    std::string format_block(std::string_view label, std::string_view text) const;

    /// Conditionally make a word singular or plural based on `count`
    /// Plural if and only if `count != 1`
    ///
    /// Examples:
    ///  pluralize("case", 0) => "cases"
    ///  pluralize("case", 1) => "case"
    static std::string pluralize(std::string_view root, std::size_t count, std::string_view suffix = "s");

    // Basic styles for different kinds of output:
    //   error    - FAILED messages, run errors, etc.
    //   success  - PASSED messages
    //   value    - literal values such as inputs and outputs
    static constexpr auto ERROR_STYLE = fmt::fg(fmt::color::red) | fmt::emphasis::bold;
    static constexpr auto WARNING_STYLE = fmt::fg(fmt::color::yellow) | fmt::emphasis::bold;
    static constexpr auto SUCCESS_STYLE = fmt::fg(fmt::color::lime_green);
    static constexpr auto VALUE_STYLE = fmt::fg(fmt::color::aqua);

    static constexpr std::size_t DEFAULT_WIDTH = 80;

    static constexpr auto MAKE_LINE_DIVIDER = [](char chr) {
        return [chr](std::size_t len) { return std::string(len, chr); };
    };

    // Line Divider Emphasized    : "======="...
    // Line Divider               : "--------...
    static const inline auto LINE_DIVIDER = MAKE_LINE_DIVIDER('-');
    static const inline auto LINE_DIVIDER_EM = MAKE_LINE_DIVIDER('=');

    bool do_colorize_;
    std::size_t terminal_width_;
};

} // namespace execbox

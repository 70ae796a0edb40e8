#include "output/plaintext_serializer.hpp"

#include "common/terminal_checks.hpp"
#include "output/serializer.hpp"
#include "output/sink.hpp"
#include "output/verbosity.hpp"
#include "user/program_options.hpp"

#include <execbox/common/linux.hpp>
#include <execbox/common/memory_size.hpp>
#include <execbox/common/strings.hpp>
#include <execbox/execution/execution_result.hpp>
#include <execbox/execution/test_case.hpp>
#include <execbox/logging.hpp>
#include <execbox/validation/syntax_validator.hpp>

#include <fmt/color.h>
#include <fmt/format.h>
#include <range/v3/view/split.hpp>

#include <cstddef>
#include <cstdio>
#include <string>
#include <string_view>

#include <sys/ioctl.h>

namespace execbox {

PlainTextSerializer::PlainTextSerializer(Sink& sink, ProgramOptions::ColorizeOpt colorize_option,
                                         VerbosityLevel verbosity)
    : Serializer{sink, verbosity}
    , do_colorize_{process_colorize_opt(colorize_option)}
    , terminal_width_{get_terminal_width()} {}

void PlainTextSerializer::on_execution_result(const ExecutionResult& data) {
    if (should_output_program_output(verbosity_)) {
        sink_.write(data.stdout_output);

        // Keep the verdict off the program's last line
        if (!data.stdout_output.empty() && !data.stdout_output.ends_with('\n')) {
            sink_.write("\n");
        }
    }

    if (should_output_run_statistics(verbosity_) && !data.stderr_output.empty()) {
        sink_.write(format_block("stderr", data.stderr_output));
    }

    if (should_output_verdict(verbosity_)) {
        if (data.stdout_truncated) {
            on_warning("[stdout was truncated]");
        }
        if (data.stderr_truncated) {
            on_warning("[stderr was truncated]");
        }
    }

    if (data.error && should_output_messages(verbosity_)) {
        sink_.write(style_str(*data.error, ERROR_STYLE) + "\n");
    }

    if (!should_output_run_statistics(verbosity_)) {
        return;
    }

    std::string ending;

    if (data.exit_code) {
        ending = fmt::format("exit code {}", *data.exit_code);
    } else if (data.term_signal) {
        ending = fmt::format("killed by {}", linux::Signal{*data.term_signal}.name());
    } else {
        ending = "did not run";
    }

    std::string out = fmt::format("{}\n{} | time {}ms", LINE_DIVIDER(terminal_width_), ending,
                                  data.execution_time.count());

    if (data.peak_memory_bytes) {
        out += fmt::format(" | peak memory {}", format_memory_size(*data.peak_memory_bytes));
    }

    sink_.write(out + "\n");
}

void PlainTextSerializer::on_validation_result(const ValidationResult& data) {
    if (data.valid) {
        if (should_output_verdict(verbosity_)) {
            sink_.write(style_str("Syntax OK", SUCCESS_STYLE) + "\n");
        }
        return;
    }

    if (!should_output_messages(verbosity_)) {
        return;
    }

    sink_.write(style_str("Syntax errors:", ERROR_STYLE) + "\n");

    for (const std::string& err : data.errors) {
        sink_.write(fmt::format("  {}\n", err));
    }
}

void PlainTextSerializer::on_case_result(std::size_t index, const CaseResult& data) {
    if (!should_output_case(verbosity_, data.passed)) {
        return;
    }

    std::string result_str;

    if (data.passed) {
        result_str = style_str("PASSED", SUCCESS_STYLE);
    } else {
        result_str = style_str("FAILED", ERROR_STYLE);
    }

    std::string name = data.description.value_or(fmt::format("#{}", index + 1));

    std::string out = fmt::format("Test Case {} : {} ({}ms)\n", result_str, name, data.execution_time.count());

    if (should_output_case_details(verbosity_, data.passed)) {
        out += format_block("input", data.input);
        out += format_block("expected", std::string{trim(data.expected_output)});
        out += format_block("actual", data.actual_output);

        if (data.error) {
            out += fmt::format("  {}\n", style_str(*data.error, ERROR_STYLE));
        }

        out += "\n";
    }

    sink_.write(out);
}

void PlainTextSerializer::on_batch_result(const TestBatchResult& data) {
    if (!should_output_score(verbosity_)) {
        return;
    }

    std::string out = LINE_DIVIDER_EM(terminal_width_) + "\n";

    if (data.total_count == 0) {
        out += "No test cases.\n";
        sink_.write(out);
        return;
    }

    const std::size_t failed_count = data.total_count - data.passed_count;
    const auto score_style = failed_count == 0 ? SUCCESS_STYLE : ERROR_STYLE;

    std::string score_str = style_str(fmt::format("{:.2f}%", data.score_percent), score_style);

    out += fmt::format("Score {} ({}/{} {} passed", score_str, data.passed_count, data.total_count,
                       pluralize("case", data.total_count));

    if (failed_count != 0) {
        out += fmt::format(", {}", style_str(fmt::format("{} failed", failed_count), ERROR_STYLE));
    }

    out += ")\n";

    sink_.write(out);
}

void PlainTextSerializer::on_warning(std::string_view what) {
    sink_.write(style_str(what, WARNING_STYLE) + "\n");
}

void PlainTextSerializer::on_error(std::string_view what) {
    sink_.write(style_str(what, ERROR_STYLE) + "\n");
}

void PlainTextSerializer::finalize() {
    sink_.flush();
}

bool PlainTextSerializer::process_colorize_opt(ProgramOptions::ColorizeOpt colorize_option) {
    using enum ProgramOptions::ColorizeOpt;

    if (colorize_option == Never) {
        return false;
    }
    if (colorize_option == Always) {
        return true;
    }

    // Colorize if output is going to a color-supporting terminal, otherwise do not
    LOG_DEBUG("In terminal: {} & Color Supporting Terminal: {}", in_terminal(stdout), is_color_terminal());

    return in_terminal(stdout) && is_color_terminal();
}

std::size_t PlainTextSerializer::get_terminal_width() {
    auto width = terminal_size(stdout).transform([](const winsize& size) { return std::size_t{size.ws_col}; });

    if (width.has_error()) {
        LOG_DEBUG("Could not obtain terminal width because {}. Defaulting to {}", width.error().message(),
                  DEFAULT_WIDTH);
    }

    std::size_t result = width.value_or(DEFAULT_WIDTH);

    return result == 0 ? DEFAULT_WIDTH : result;
}

std::string PlainTextSerializer::style_str(std::string_view text, fmt::text_style style) const {
    if (!do_colorize_) {
        return std::string{text};
    }

    return fmt::format(style, "{}", text);
}

std::string PlainTextSerializer::format_block(std::string_view label, std::string_view text) const {
    std::string out = fmt::format("  {}:", label);

    text = trim_end(text);

    if (text.empty()) {
        return out + " <empty>\n";
    }

    out += "\n";

    for (auto&& line : text | ranges::views::split('\n')) {
        std::string line_str;
        for (char chr : line) {
            line_str += chr;
        }
        out += fmt::format("    {}\n", style_str(line_str, VALUE_STYLE));
    }

    return out;
}

std::string PlainTextSerializer::pluralize(std::string_view root, std::size_t count, std::string_view suffix) {
    if (count == 1) {
        return std::string{root};
    }

    return fmt::format("{}{}", root, suffix);
}

} // namespace execbox

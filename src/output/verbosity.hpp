#pragma once

namespace execbox {

/// How much the command line front end prints. `Max` is just used as a sentinal.
enum class VerbosityLevel {
    Silent,  ///< Nothing at all; only the exit status is meaningful
    Quiet,   ///< Program output, diagnostics and the final score only
    Summary, ///< Adds the run verdict and every failing test case
    All,     ///< Adds passing test cases and run statistics
    Extra,   ///< Adds inputs and outputs of every test case
    Max
};

constexpr bool should_output_program_output(VerbosityLevel level) {
    using enum VerbosityLevel;

    return level >= Quiet;
}

constexpr bool should_output_verdict(VerbosityLevel level) {
    using enum VerbosityLevel;

    return level >= Summary;
}

constexpr bool should_output_run_statistics(VerbosityLevel level) {
    using enum VerbosityLevel;

    return level >= All;
}

constexpr bool should_output_case(VerbosityLevel level, bool passed) {
    using enum VerbosityLevel;

    return (level >= All || (level >= Summary && !passed));
}

/// Failing cases always show their input and outputs once they are shown at all
constexpr bool should_output_case_details(VerbosityLevel level, bool passed) {
    using enum VerbosityLevel;

    return level >= Extra || (!passed && should_output_case(level, passed));
}

constexpr bool should_output_score(VerbosityLevel level) {
    using enum VerbosityLevel;

    return level >= Quiet;
}

constexpr bool should_output_messages(VerbosityLevel level) {
    using enum VerbosityLevel;

    return level > Silent;
}

} // namespace execbox

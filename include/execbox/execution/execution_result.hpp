#pragma once

#include <execbox/common/strings.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace execbox {

/// Outcome of exactly one ExecutionRequest. Every failure mode, including faults inside the
/// engine itself, is expressed through these fields.
struct ExecutionResult
{
    std::string stdout_output;
    std::string stderr_output;

    /// Summary of what went wrong; std::nullopt on a clean run (exit code 0)
    std::optional<std::string> error;

    /// std::nullopt if the process did not exit on its own (killed, or never started)
    std::optional<int> exit_code;
    /// Signal that ended the process, if it was ended by one
    std::optional<int> term_signal;

    std::chrono::milliseconds execution_time{};

    bool timed_out{};
    bool memory_exceeded{};
    /// More processes alive at once than the host allows a run
    bool process_limit_exceeded{};

    bool stdout_truncated{};
    bool stderr_truncated{};

    /// Peak resident memory of the run, when the host could measure it
    std::optional<std::uint64_t> peak_memory_bytes;

    /// stdout with trailing whitespace removed
    std::string output() const { return std::string{trim_end(stdout_output)}; }

    bool succeeded() const { return !error.has_value(); }

    /// A well-formed result for a run the engine could not carry out
    static ExecutionResult engine_fault(std::string message) {
        ExecutionResult result;
        result.error = std::move(message);
        return result;
    }
};

} // namespace execbox

#pragma once

#include <execbox/common/strings.hpp>
#include <execbox/execution/execution_request.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace execbox {

struct TestCase
{
    std::string input;
    std::string expected_output;
    std::optional<std::string> description;
};

/// Options shared by every case of one batch
struct TestOptions
{
    std::chrono::milliseconds timeout = DEFAULT_TIMEOUT;
    std::uint64_t max_memory_bytes = DEFAULT_MAX_MEMORY;
    /// Upper bound on cases of this batch running at the same time
    std::size_t max_parallel_cases = 4;
};

/// Outcome of a single case within a batch
struct CaseResult
{
    std::optional<std::string> description;
    std::string input;
    std::string expected_output;
    std::string actual_output;

    bool passed{};

    std::optional<std::string> error;
    std::optional<int> exit_code;

    std::chrono::milliseconds execution_time{};

    bool timed_out{};
    bool memory_exceeded{};
};

struct TestBatchResult
{
    double score_percent{};
    std::size_t passed_count{};
    std::size_t total_count{};

    /// In the same order as the cases that were supplied
    std::vector<CaseResult> case_results;
};

/// Output comparison used for grading: surrounding whitespace is ignored, internal whitespace is not
constexpr bool outputs_match(std::string_view actual, std::string_view expected) {
    return trim(actual) == trim(expected);
}

static_assert(outputs_match("2\n", "2"));
static_assert(!outputs_match("2 3", "23"));

} // namespace execbox

#pragma once

#include <execbox/execution/language.hpp>
#include <execbox/execution/test_case.hpp>
#include <execbox/sandbox/sandbox.hpp>

#include <cstddef>
#include <functional>
#include <span>
#include <string>
#include <string_view>

namespace execbox {

/// Runs one code body against an ordered sequence of test cases and scores it.
///
/// Cases run on a small pool of worker threads (``TestOptions::max_parallel_cases``); every
/// case is isolated, so a failure in one, including an exception thrown by the executor,
/// is recorded against that case alone.
class TestHarness
{
public:
    /// Invoked as each case finishes, from the worker thread that ran it. Calls are serialized.
    /// A std::exception thrown by the callback is logged and does not stop the batch.
    using CaseCallback = std::function<void(std::size_t index, const CaseResult& result)>;

    explicit TestHarness(Executor& executor);

    TestBatchResult run_tests(std::string_view code, Language language, std::span<const TestCase> cases,
                              const TestOptions& options, const CaseCallback& on_case_done = {}) const;

private:
    CaseResult run_one(const std::string& code, Language language, const TestCase& test_case,
                       const TestOptions& options) const;

    Executor* executor_;
};

} // namespace execbox

#pragma once

#include "output/sink.hpp"
#include "output/verbosity.hpp"

#include <execbox/common/class_traits.hpp>
#include <execbox/execution/execution_result.hpp>
#include <execbox/execution/test_case.hpp>
#include <execbox/validation/syntax_validator.hpp>

#include <cstddef>
#include <string_view>

namespace execbox {

class Serializer : NonCopyable
{
public:
    explicit Serializer(Sink& sink, VerbosityLevel verbosity)
        : sink_{sink}
        , verbosity_{verbosity} {}

    virtual ~Serializer() = default;

    virtual void on_execution_result(const ExecutionResult& data) = 0;
    virtual void on_validation_result(const ValidationResult& data) = 0;

    /// ``index`` is the position of the case in the batch; cases may complete out of order
    virtual void on_case_result(std::size_t index, const CaseResult& data) = 0;
    virtual void on_batch_result(const TestBatchResult& data) = 0;

    virtual void on_warning(std::string_view what) = 0;
    virtual void on_error(std::string_view what) = 0;

    virtual void finalize() = 0;

protected:
    Sink& sink_;
    VerbosityLevel verbosity_;
};

} // namespace execbox

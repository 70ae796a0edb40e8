#pragma once

// IWYU pragma: begin_exports
#include <execbox/common/error_types.hpp>
#include <execbox/common/expected.hpp>
#include <execbox/common/memory_size.hpp>
#include <execbox/engine.hpp>
#include <execbox/execution/execution_request.hpp>
#include <execbox/execution/execution_result.hpp>
#include <execbox/execution/language.hpp>
#include <execbox/execution/test_case.hpp>
#include <execbox/validation/syntax_validator.hpp>
// IWYU pragma: end_exports

#pragma once

#include <execbox/common/expected.hpp>

#include <boost/preprocessor/cat.hpp>
#include <fmt/format.h>

#include <string>
#include <string_view>

namespace execbox {

// NOLINTNEXTLINE
enum class ErrorKind {
    TimedOut,            ///< Program / operation surpassed its wall-clock budget
    MemoryExceeded,      ///< Program / operation surpassed its memory budget
    UnsupportedLanguage, ///< Language string is not one of the supported set
    MissingCode,         ///< No source code was supplied
    InvalidArgument,     ///< Malformed caller input (memory token, timeout, ...)
    SyscallFailure,      ///< A Linux syscall failed
    FilesystemFailure,   ///< Creating / writing / removing sandbox files failed
    SpawnFailure,        ///< The child failed between fork and exec
    InterpreterNotFound, ///< The configured interpreter could not be resolved to an executable
    UnknownError,        ///< As named; use this as little as possible

    MaxErrorNum // Not a proper error; used to determine the number of errors
};

constexpr std::string_view to_string(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::TimedOut:
        return "TimedOut";
    case ErrorKind::MemoryExceeded:
        return "MemoryExceeded";
    case ErrorKind::UnsupportedLanguage:
        return "UnsupportedLanguage";
    case ErrorKind::MissingCode:
        return "MissingCode";
    case ErrorKind::InvalidArgument:
        return "InvalidArgument";
    case ErrorKind::SyscallFailure:
        return "SyscallFailure";
    case ErrorKind::FilesystemFailure:
        return "FilesystemFailure";
    case ErrorKind::SpawnFailure:
        return "SpawnFailure";
    case ErrorKind::InterpreterNotFound:
        return "InterpreterNotFound";
    case ErrorKind::UnknownError:
        return "UnknownError";
    case ErrorKind::MaxErrorNum:
        break;
    }

    return "<unknown>";
}

template <typename T>
using Result = Expected<T, ErrorKind>;

/// Rejection of a request at the engine boundary, before any process is spawned
struct CallerInputError
{
    ErrorKind kind;
    std::string message;

    bool operator==(const CallerInputError& rhs) const = default;
};

} // namespace execbox

template <>
struct fmt::formatter<::execbox::ErrorKind> : fmt::formatter<std::string_view>
{
    auto format(::execbox::ErrorKind from, fmt::format_context& ctx) const {
        return fmt::formatter<std::string_view>::format(::execbox::to_string(from), ctx);
    }
};

template <>
struct fmt::formatter<::execbox::CallerInputError> : fmt::formatter<std::string>
{
    auto format(const ::execbox::CallerInputError& from, fmt::format_context& ctx) const {
        return fmt::formatter<std::string>::format(fmt::format("{}: {}", from.kind, from.message), ctx);
    }
};

/// If the supplied argument is an error (unexpected) type, then propegate the error type `e` up
/// the call stack. Otherwise, continue execution as normal
// NOLINTBEGIN(bugprone-macro-parentheses)
#define TRYE_IMPL(val, e, ident)                                                                                       \
    __extension__({                                                                                                    \
        auto ident = val;                                                                                              \
        if (!ident.has_value()) {                                                                                      \
            using enum ::execbox::ErrorKind;                                                                           \
            return e;                                                                                                  \
        }                                                                                                              \
        std::move(ident).value();                                                                                      \
    })

#define TRY_IMPL(val, ident) TRYE_IMPL(val, ident.error(), ident)
// NOLINTEND(bugprone-macro-parentheses)

#define TRYE(val, e) TRYE_IMPL(val, e, BOOST_PP_CAT(errref_uniq__, __COUNTER__))

/// If the supplied argument is an error (unexpected) type, then propegate it up the call stack.
/// Otherwise, continue execution as normal
#define TRY(val) TRY_IMPL(val, BOOST_PP_CAT(errrefe_uniq__, __COUNTER__))

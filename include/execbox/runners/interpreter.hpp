#pragma once

#include <execbox/common/error_types.hpp>

#include <array>
#include <filesystem>
#include <string_view>

namespace execbox {

/// Directories searched for interpreters given by name. The caller's PATH is never consulted.
inline constexpr std::array<std::string_view, 3> TRUSTED_INTERPRETER_DIRS = {"/usr/local/bin", "/usr/bin", "/bin"};

/// Resolves ``name_or_path`` to an absolute path of an executable file.
///
/// A value containing a '/' is taken as a path and only checked; a bare name is looked up in
/// TRUSTED_INTERPRETER_DIRS in order. Fails with InterpreterNotFound.
Result<std::filesystem::path> resolve_interpreter(std::string_view name_or_path);

} // namespace execbox

#include <execbox/runners/interpreter.hpp>

#include <execbox/common/error_types.hpp>
#include <execbox/common/linux.hpp>
#include <execbox/logging.hpp>

#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

#include <unistd.h>

namespace execbox {

namespace {

bool is_executable_file(const std::filesystem::path& path) {
    std::error_code err;

    return std::filesystem::is_regular_file(path, err) && linux::access(path.string(), X_OK);
}

} // namespace

Result<std::filesystem::path> resolve_interpreter(std::string_view name_or_path) {
    if (name_or_path.empty()) {
        return ErrorKind::InterpreterNotFound;
    }

    if (name_or_path.find('/') != std::string_view::npos) {
        std::error_code err;
        std::filesystem::path path = std::filesystem::absolute(name_or_path, err);

        if (err || !is_executable_file(path)) {
            LOG_DEBUG("Interpreter path {} is not an executable file", name_or_path);
            return ErrorKind::InterpreterNotFound;
        }

        return path;
    }

    for (std::string_view dir : TRUSTED_INTERPRETER_DIRS) {
        std::filesystem::path candidate = std::filesystem::path{dir} / name_or_path;

        if (is_executable_file(candidate)) {
            return candidate;
        }
    }

    LOG_DEBUG("Interpreter {} not found in any trusted directory", name_or_path);

    return ErrorKind::InterpreterNotFound;
}

} // namespace execbox

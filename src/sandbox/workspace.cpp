#include <execbox/sandbox/workspace.hpp>

#include <execbox/common/error_types.hpp>
#include <execbox/common/linux.hpp>
#include <execbox/logging.hpp>

#include <gsl/util>

#include <cstdlib>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>
#include <tuple>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <sys/stat.h>

namespace execbox {

namespace {

/// Gives the owner full access to ``dir`` and every directory below it, so that it can be removed
void restore_permissions(const std::filesystem::path& dir) {
    std::error_code err;

    std::filesystem::permissions(dir, std::filesystem::perms::owner_all, std::filesystem::perm_options::add, err);

    std::filesystem::directory_iterator iter{dir, err};
    if (err) {
        return;
    }

    for (const std::filesystem::directory_iterator end{}; iter != end; iter.increment(err)) {
        if (err) {
            break;
        }

        const std::filesystem::file_status status = iter->symlink_status(err);
        if (!err && std::filesystem::is_directory(status)) {
            restore_permissions(iter->path());
        }
    }
}

} // namespace

Result<Workspace> Workspace::create(const std::filesystem::path& root) {
    std::error_code err;

    std::filesystem::create_directories(root, err);
    if (err) {
        LOG_WARN("Could not create workspace root {}: {}", root.string(), err.message());
        return ErrorKind::FilesystemFailure;
    }

    // mkdtemp needs a mutable, NUL-terminated template
    std::string dir_template = (root / "run-XXXXXX").string();

    if (::mkdtemp(dir_template.data()) == nullptr) {
        LOG_WARN("mkdtemp in {} failed: {}", root.string(), get_err_msg());
        return ErrorKind::FilesystemFailure;
    }

    LOG_TRACE("Created workspace {}", dir_template);

    return Workspace{std::filesystem::path{std::move(dir_template)}};
}

Workspace::Workspace(Workspace&& other) noexcept
    : path_{std::exchange(other.path_, {})} {}

Workspace& Workspace::operator=(Workspace&& rhs) noexcept {
    if (this != &rhs) {
        remove();
        path_ = std::exchange(rhs.path_, {});
    }

    return *this;
}

Workspace::~Workspace() {
    remove();
}

Result<std::filesystem::path> Workspace::write_file(std::string_view file_name, std::string_view contents) const {
    std::filesystem::path file_path = path_ / file_name;

    int fd = TRYE(linux::open(file_path.string(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, S_IRUSR | S_IWUSR),
                  FilesystemFailure);
    auto close_fd = gsl::finally([fd] { std::ignore = linux::close(fd); });

    while (!contents.empty()) {
        auto written = TRYE(linux::write(fd, contents), FilesystemFailure);
        contents.remove_prefix(gsl::narrow_cast<std::size_t>(written));
    }

    return file_path;
}

void Workspace::remove() {
    // empty if moved from
    if (path_.empty()) {
        return;
    }

    std::error_code err;
    std::filesystem::remove_all(path_, err);

    if (err) {
        // The program may have stripped permissions from directories it created; restore them and retry
        LOG_DEBUG("First attempt at removing {} failed ({}); resetting permissions", path_.string(), err.message());

        restore_permissions(path_);

        err.clear();
        std::filesystem::remove_all(path_, err);
    }

    if (err) {
        LOG_ERROR("Could not remove workspace {}: {}", path_.string(), err.message());
    } else {
        LOG_TRACE("Removed workspace {}", path_.string());
    }

    path_.clear();
}

} // namespace execbox

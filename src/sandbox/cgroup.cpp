#include <execbox/sandbox/cgroup.hpp>

#include <execbox/common/error_types.hpp>
#include <execbox/common/linux.hpp>
#include <execbox/logging.hpp>

#include <fmt/format.h>
#include <gsl/util>

#include <array>
#include <cerrno>
#include <charconv>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <tuple>
#include <utility>

#include <fcntl.h>
#include <unistd.h>

namespace execbox {

Result<Cgroup> Cgroup::create(const std::filesystem::path& root, std::string_view name) {
    std::filesystem::path path = root / name;

    std::error_code err;
    if (!std::filesystem::create_directory(path, err)) {
        LOG_DEBUG("Could not create cgroup {}: {}", path.string(), err ? err.message() : "already exists");
        return ErrorKind::FilesystemFailure;
    }

    Cgroup cgroup{std::move(path)};

    // A missing memory.max means the memory controller is not delegated to us
    if (!std::filesystem::exists(cgroup.path_ / "memory.max", err)) {
        LOG_DEBUG("Memory controller is not enabled for {}", cgroup.path_.string());
        return ErrorKind::FilesystemFailure;
    }

    return std::move(cgroup);
}

Cgroup::Cgroup(Cgroup&& other) noexcept
    : path_{std::exchange(other.path_, {})} {}

Cgroup& Cgroup::operator=(Cgroup&& rhs) noexcept {
    if (this != &rhs) {
        remove();
        path_ = std::exchange(rhs.path_, {});
    }

    return *this;
}

Cgroup::~Cgroup() {
    remove();
}

Result<void> Cgroup::set_memory_max(std::uint64_t bytes) const {
    return write_control("memory.max", fmt::to_string(bytes));
}

Result<void> Cgroup::set_swap_max(std::uint64_t bytes) const {
    return write_control("memory.swap.max", fmt::to_string(bytes));
}

Result<void> Cgroup::set_pids_max(std::uint64_t count) const {
    return write_control("pids.max", fmt::to_string(count));
}

Result<int> Cgroup::open_procs_fd() const {
    return TRYE(linux::open((path_ / "cgroup.procs").string(), O_WRONLY | O_CLOEXEC), FilesystemFailure);
}

Result<std::uint64_t> Cgroup::oom_kill_count() const {
    std::string events = TRY(read_control("memory.events"));

    auto count = parse_flat_keyed(events, "oom_kill");

    if (!count) {
        LOG_WARN("memory.events of {} has no oom_kill entry", path_.string());
        return ErrorKind::FilesystemFailure;
    }

    return *count;
}

std::optional<std::uint64_t> Cgroup::peak_memory() const {
    auto contents = read_control("memory.peak");

    if (!contents) {
        return std::nullopt;
    }

    std::uint64_t value{};
    const std::string& str = contents.value();
    auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), value);

    if (ec != std::errc{}) {
        return std::nullopt;
    }

    return value;
}

Result<void> Cgroup::kill() const {
    return write_control("cgroup.kill", "1");
}

bool Cgroup::is_populated() const {
    auto events = read_control("cgroup.events");

    if (!events) {
        return false;
    }

    return parse_flat_keyed(events.value(), "populated").value_or(0) != 0;
}

Result<void> Cgroup::write_control(std::string_view file, std::string_view value) const {
    int fd = TRYE(linux::open((path_ / file).string(), O_WRONLY | O_CLOEXEC), FilesystemFailure);
    auto close_fd = gsl::finally([fd] { std::ignore = linux::close(fd); });

    TRYE(linux::write(fd, value), FilesystemFailure);

    return {};
}

Result<std::string> Cgroup::read_control(std::string_view file) const {
    int fd = TRYE(linux::open((path_ / file).string(), O_RDONLY | O_CLOEXEC), FilesystemFailure);
    auto close_fd = gsl::finally([fd] { std::ignore = linux::close(fd); });

    // Control files are small; memory.stat, the largest, is not read here
    constexpr std::size_t BUF_SZ = 4096;
    std::array<char, BUF_SZ> buffer{};
    std::string result;

    while (true) {
        std::size_t num_read = TRYE(linux::read(fd, buffer), FilesystemFailure);

        if (num_read == 0) {
            break;
        }

        result.append(buffer.data(), num_read);
    }

    return result;
}

void Cgroup::remove() {
    using namespace std::chrono_literals;

    // empty if moved from
    if (path_.empty()) {
        return;
    }

    if (is_populated()) {
        std::ignore = kill();
    }

    // rmdir fails with EBUSY until the kernel has finished tearing down the killed processes
    constexpr int MAX_ATTEMPTS = 50;

    for (int attempt = 0; attempt < MAX_ATTEMPTS; ++attempt) {
        if (::rmdir(path_.c_str()) == 0) {
            LOG_TRACE("Removed cgroup {}", path_.string());
            path_.clear();
            return;
        }

        if (errno != EBUSY) {
            break;
        }

        std::this_thread::sleep_for(2ms);
    }

    LOG_ERROR("Could not remove cgroup {}: {}", path_.string(), get_err_msg());
    path_.clear();
}

std::optional<std::uint64_t> parse_flat_keyed(std::string_view contents, std::string_view key) {
    while (!contents.empty()) {
        auto line_end = contents.find('\n');
        std::string_view line = contents.substr(0, line_end);
        contents.remove_prefix(line_end == std::string_view::npos ? contents.size() : line_end + 1);

        auto sep = line.find(' ');
        if (sep == std::string_view::npos || line.substr(0, sep) != key) {
            continue;
        }

        std::string_view value = line.substr(sep + 1);
        std::uint64_t result{};
        auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), result);

        if (ec == std::errc{}) {
            return result;
        }
    }

    return std::nullopt;
}

} // namespace execbox

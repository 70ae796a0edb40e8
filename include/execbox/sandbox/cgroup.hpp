#pragma once

#include <execbox/common/class_traits.hpp>
#include <execbox/common/error_types.hpp>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace execbox {

/// A cgroup v2 directory owned by a single run.
///
/// The parent (``root``) must be a delegated cgroup with the memory controller enabled in its
/// cgroup.subtree_control. The directory is killed and removed on destruction.
class Cgroup : NonCopyable
{
public:
    static Result<Cgroup> create(const std::filesystem::path& root, std::string_view name);

    Cgroup(Cgroup&& other) noexcept;
    Cgroup& operator=(Cgroup&& rhs) noexcept;
    ~Cgroup();

    const std::filesystem::path& path() const { return path_; }

    Result<void> set_memory_max(std::uint64_t bytes) const;
    Result<void> set_swap_max(std::uint64_t bytes) const;
    Result<void> set_pids_max(std::uint64_t count) const;

    /// Opens cgroup.procs for writing. A child writes its own pid to it to join the cgroup.
    Result<int> open_procs_fd() const;

    /// Number of processes the kernel OOM killer has killed inside this cgroup (memory.events)
    Result<std::uint64_t> oom_kill_count() const;

    /// memory.peak; unavailable on kernels older than 5.19
    std::optional<std::uint64_t> peak_memory() const;

    /// SIGKILLs every process in the cgroup, including ones that left the process group
    Result<void> kill() const;

    /// Whether the cgroup still holds any process
    bool is_populated() const;

private:
    explicit Cgroup(std::filesystem::path path)
        : path_{std::move(path)} {}

    Result<void> write_control(std::string_view file, std::string_view value) const;
    Result<std::string> read_control(std::string_view file) const;

    void remove();

    std::filesystem::path path_;
};

/// Extracts the value of ``key`` from a flat-keyed cgroup file such as memory.events
std::optional<std::uint64_t> parse_flat_keyed(std::string_view contents, std::string_view key);

} // namespace execbox

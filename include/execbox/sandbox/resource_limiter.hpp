#pragma once

#include <execbox/common/class_traits.hpp>
#include <execbox/common/memory_size.hpp>
#include <execbox/sandbox/cgroup.hpp>
#include <execbox/sandbox/process_tree.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <sys/resource.h>
#include <sys/types.h>

namespace execbox {

/// One setrlimit(2) call applied in the child before exec; soft and hard limits are equal
struct RlimitSetting
{
    int resource;
    rlim_t limit;
};

/// Process count cap when none is configured
constexpr std::uint64_t DEFAULT_MAX_PROCESSES = 64;

/// Host-wide limiter settings, shared by every run
struct LimiterConfig
{
    /// Delegated cgroup v2 directory under which per-run cgroups are created
    std::optional<std::filesystem::path> cgroup_root;

    /// Time between SIGTERM and SIGKILL when tearing a process tree down
    std::chrono::milliseconds kill_grace{200};
    /// Period of the supervisor-side memory watcher
    std::chrono::milliseconds watch_interval{10};

    std::uint64_t max_file_bytes = 16 * MIB;
    /// Process count cap for one run, DEFAULT_MAX_PROCESSES if unset. Applied as pids.max under a
    /// cgroup and by the watcher otherwise. Also applied as RLIMIT_NPROC, which counts every process
    /// of the user, but only if set explicitly.
    std::optional<std::uint64_t> max_processes;
    /// Also cap virtual memory with RLIMIT_AS. Breaks runtimes that reserve large address ranges (node).
    bool limit_address_space = false;
};

/// Budget requested for one run
struct ResourceLimits
{
    std::chrono::milliseconds timeout;
    std::uint64_t max_memory_bytes;
};

/// Makes the time, memory and process budget of one run enforceable, and tears down the run's
/// process tree.
///
/// The process tree is everything below the run's reaper (see Subprocess), plus any process seen
/// there earlier that has since been reparented away, which only happens if the reaper is killed.
/// When a cgroup root is available the run also gets a per-run cgroup v2, and the kernel enforces
/// memory.max and pids.max. Otherwise a watcher running in the supervisor sums the resident memory
/// of the tree from /proc and counts its processes.
class ResourceLimiter : NonMovable
{
public:
    enum class Mechanism {
        Cgroup,
        Watcher,
    };

    /// Never fails; falls back to the watcher if the cgroup cannot be set up
    ResourceLimiter(const LimiterConfig& config, ResourceLimits limits, std::string_view run_name);
    ~ResourceLimiter();

    Mechanism mechanism() const { return cgroup_ ? Mechanism::Cgroup : Mechanism::Watcher; }

    /// Limits for the child to apply to itself between fork and exec
    const std::vector<RlimitSetting>& rlimits() const { return rlimits_; }

    /// Descriptor of the cgroup's cgroup.procs; the child writes its pid to it before exec
    std::optional<int> cgroup_procs_fd() const;

    /// Closes the cgroup.procs descriptor once the child has been spawned
    void release_spawn_resources();

    /// Starts tracking the tree below ``reaper``. The timer and the watcher start from here.
    void attach(pid_t reaper);

    /// Whether the tree has breached its memory budget. Rate limited to the watch interval.
    bool memory_exceeded();

    /// Whether the tree has held more than max_processes() live processes at once.
    /// Only the watcher reports this; under a cgroup, forks past pids.max fail instead.
    bool process_limit_exceeded();

    std::uint64_t max_processes() const { return config_.max_processes.value_or(DEFAULT_MAX_PROCESSES); }

    /// Accounts for the top process's own peak, as reported when it was reaped
    void observe_exit(const struct rusage& usage);

    std::optional<std::uint64_t> peak_memory_bytes() const;

    /// SIGTERM to the whole tree; SIGKILL to whatever is still alive after the kill grace
    void kill();

    /// SIGKILL to every remaining member of the tree, without a grace period
    void kill_remaining();

    const ResourceLimits& limits() const { return limits_; }

private:
    void setup_cgroup(const std::filesystem::path& root, std::string_view run_name);

    /// One rate-limited look at the tree
    void sample();

    /// Current members of the tree, and remembers them
    std::vector<ProcessStatus> members();

    bool tree_alive();

    LimiterConfig config_;
    ResourceLimits limits_;

    std::vector<RlimitSetting> rlimits_;

    std::optional<Cgroup> cgroup_;
    int procs_fd_ = -1;

    pid_t reaper_{};
    /// pid -> start time of every member seen so far
    std::unordered_map<pid_t, std::uint64_t> seen_;

    std::chrono::steady_clock::time_point last_check_{};
    std::uint64_t observed_peak_{};
    bool memory_breached_{};
    bool process_breached_{};
};

/// The rlimits applied to every run: CPU time, file size, core dumps, and the optional
/// RLIMIT_NPROC and address space caps
std::vector<RlimitSetting> make_rlimits(const LimiterConfig& config, const ResourceLimits& limits);

} // namespace execbox

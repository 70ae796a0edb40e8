#include <execbox/sandbox/resource_limiter.hpp>

#include <execbox/common/linux.hpp>
#include <execbox/logging.hpp>
#include <execbox/sandbox/cgroup.hpp>
#include <execbox/sandbox/process_tree.hpp>

#include <fmt/format.h>

#include <range/v3/algorithm/any_of.hpp>
#include <range/v3/algorithm/count_if.hpp>

#include <algorithm>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string_view>
#include <thread>
#include <tuple>
#include <unordered_set>
#include <vector>

#include <sys/resource.h>
#include <sys/types.h>

namespace execbox {

namespace {

/// How long kill_remaining keeps sending SIGKILL to a tree that will not die
constexpr std::chrono::milliseconds KILL_PATIENCE{1000};

bool is_live(const ProcessStatus& proc) {
    return !proc.is_zombie();
}

} // namespace

std::vector<RlimitSetting> make_rlimits(const LimiterConfig& config, const ResourceLimits& limits) {
    using std::chrono::ceil;
    using std::chrono::seconds;

    // CPU time can never exceed wall-clock time for a single thread; the extra second keeps
    // the wall-clock timer in charge while still bounding a runaway that escapes it
    const auto cpu_seconds = ceil<seconds>(limits.timeout).count() + 1;

    std::vector<RlimitSetting> result{
        {.resource = RLIMIT_CPU, .limit = static_cast<rlim_t>(cpu_seconds)},
        {.resource = RLIMIT_FSIZE, .limit = static_cast<rlim_t>(config.max_file_bytes)},
        {.resource = RLIMIT_CORE, .limit = 0},
    };

    if (config.max_processes) {
        result.push_back({.resource = RLIMIT_NPROC, .limit = static_cast<rlim_t>(*config.max_processes)});
    }

    if (config.limit_address_space) {
        result.push_back({.resource = RLIMIT_AS, .limit = static_cast<rlim_t>(limits.max_memory_bytes)});
    }

    return result;
}

ResourceLimiter::ResourceLimiter(const LimiterConfig& config, ResourceLimits limits, std::string_view run_name)
    : config_{config}
    , limits_{limits}
    , rlimits_{make_rlimits(config, limits)} {
    if (config_.cgroup_root) {
        setup_cgroup(*config_.cgroup_root, run_name);
    }

    LOG_DEBUG("Limiter for {}: timeout={}ms memory={} via {}", run_name, limits_.timeout.count(),
              format_memory_size(limits_.max_memory_bytes),
              mechanism() == Mechanism::Cgroup ? "cgroup" : "watcher");
}

ResourceLimiter::~ResourceLimiter() {
    release_spawn_resources();
}

void ResourceLimiter::setup_cgroup(const std::filesystem::path& root, std::string_view run_name) {
    auto cgroup = Cgroup::create(root, fmt::format("execbox-{}", run_name));

    if (!cgroup) {
        LOG_WARN("cgroup unavailable under {}; falling back to the memory watcher", root.string());
        return;
    }

    if (!cgroup->set_memory_max(limits_.max_memory_bytes)) {
        LOG_DEBUG("Could not set memory.max; falling back to the memory watcher");
        return;
    }

    // Without swap accounting memory.swap.max does not exist; memory.max alone still applies
    if (!cgroup->set_swap_max(0)) {
        LOG_DEBUG("Could not set memory.swap.max for {}", cgroup->path().string());
    }

    if (!cgroup->set_pids_max(max_processes())) {
        LOG_DEBUG("Could not set pids.max for {}", cgroup->path().string());
    }

    auto procs_fd = cgroup->open_procs_fd();

    if (!procs_fd) {
        LOG_DEBUG("Could not open cgroup.procs; falling back to the memory watcher");
        return;
    }

    procs_fd_ = procs_fd.value();
    cgroup_.emplace(std::move(cgroup).value());
}

std::optional<int> ResourceLimiter::cgroup_procs_fd() const {
    if (procs_fd_ == -1) {
        return std::nullopt;
    }

    return procs_fd_;
}

void ResourceLimiter::release_spawn_resources() {
    if (procs_fd_ != -1) {
        std::ignore = linux::close(procs_fd_);
        procs_fd_ = -1;
    }
}

void ResourceLimiter::attach(pid_t reaper) {
    reaper_ = reaper;
    last_check_ = std::chrono::steady_clock::now();
}

bool ResourceLimiter::memory_exceeded() {
    sample();
    return memory_breached_;
}

bool ResourceLimiter::process_limit_exceeded() {
    sample();
    return process_breached_;
}

void ResourceLimiter::sample() {
    if (reaper_ == 0 || memory_breached_ || process_breached_) {
        return;
    }

    if (cgroup_) {
        // The kernel enforces memory.max itself; all that is left is noticing that it did
        auto oom_kills = cgroup_->oom_kill_count();
        memory_breached_ = oom_kills && oom_kills.value() > 0;

        if (memory_breached_) {
            LOG_DEBUG("Tree below {} had {} process(es) OOM-killed", reaper_, oom_kills.value());
        }

        return;
    }

    const auto now = std::chrono::steady_clock::now();

    if (now - last_check_ < config_.watch_interval) {
        return;
    }

    last_check_ = now;

    const std::vector<ProcessStatus> tree = members();

    const auto live = static_cast<std::uint64_t>(ranges::count_if(tree, is_live));
    std::uint64_t resident = 0;
    for (const ProcessStatus& proc : tree) {
        resident += proc.resident_bytes;
    }

    observed_peak_ = std::max(observed_peak_, resident);

    if (live > max_processes()) {
        LOG_DEBUG("Tree below {} has {} processes, over the cap of {}", reaper_, live, max_processes());
        process_breached_ = true;
    } else if (resident > limits_.max_memory_bytes) {
        LOG_DEBUG("Tree below {} resident memory {} exceeds budget {}", reaper_, format_memory_size(resident),
                  format_memory_size(limits_.max_memory_bytes));
        memory_breached_ = true;
    }
}

std::vector<ProcessStatus> ResourceLimiter::members() {
    std::vector<ProcessStatus> tree = list_descendants(reaper_);

    std::unordered_set<pid_t> current;
    for (const ProcessStatus& proc : tree) {
        current.insert(proc.pid);
    }

    // Earlier members that are no longer below the reaper still count, as long as the pid has
    // not been reused by another process
    for (auto iter = seen_.begin(); iter != seen_.end();) {
        if (current.contains(iter->first)) {
            ++iter;
            continue;
        }

        auto status = read_process_status(iter->first);

        if (status && status->start_time == iter->second && is_live(*status)) {
            tree.push_back(*status);
            ++iter;
        } else {
            iter = seen_.erase(iter);
        }
    }

    for (const ProcessStatus& proc : tree) {
        seen_.insert_or_assign(proc.pid, proc.start_time);
    }

    return tree;
}

void ResourceLimiter::observe_exit(const struct rusage& usage) {
    // ru_maxrss is in KiB
    const auto max_rss = static_cast<std::uint64_t>(std::max(usage.ru_maxrss, 0L)) * KIB;
    observed_peak_ = std::max(observed_peak_, max_rss);

    if (!cgroup_ && max_rss > limits_.max_memory_bytes) {
        LOG_DEBUG("Top process peaked at {} over budget {}", format_memory_size(max_rss),
                  format_memory_size(limits_.max_memory_bytes));
        memory_breached_ = true;
    }

    // Catch an OOM kill that raced with the exit of the top process
    std::ignore = memory_exceeded();
}

std::optional<std::uint64_t> ResourceLimiter::peak_memory_bytes() const {
    if (cgroup_) {
        if (auto peak = cgroup_->peak_memory()) {
            return peak;
        }
    }

    if (observed_peak_ == 0) {
        return std::nullopt;
    }

    return observed_peak_;
}

void ResourceLimiter::kill() {
    using namespace std::chrono_literals;
    using std::chrono::steady_clock;

    if (reaper_ == 0) {
        return;
    }

    LOG_DEBUG("Terminating the tree below {}", reaper_);

    signal_all(members(), SIGTERM);

    const auto deadline = steady_clock::now() + config_.kill_grace;

    while (steady_clock::now() < deadline && tree_alive()) {
        std::this_thread::sleep_for(std::min<std::chrono::nanoseconds>(5ms, deadline - steady_clock::now()));
    }

    kill_remaining();
}

void ResourceLimiter::kill_remaining() {
    if (reaper_ == 0) {
        return;
    }

    if (cgroup_) {
        std::ignore = cgroup_->kill();
    }

    if (!kill_until_gone([this] { return members(); }, KILL_PATIENCE)) {
        LOG_ERROR("Part of the tree below {} survived SIGKILL", reaper_);
    }
}

bool ResourceLimiter::tree_alive() {
    if (ranges::any_of(members(), is_live)) {
        return true;
    }

    return cgroup_ && cgroup_->is_populated();
}

} // namespace execbox

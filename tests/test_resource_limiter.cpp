#include "catch2_custom.hpp"

#include <execbox/common/memory_size.hpp>
#include <execbox/sandbox/process_tree.hpp>
#include <execbox/sandbox/resource_limiter.hpp>
#include <execbox/sandbox/sandbox.hpp>
#include <execbox/sandbox/subprocess.hpp>

#include <range/v3/algorithm/any_of.hpp>
#include <range/v3/algorithm/find_if.hpp>

#include <chrono>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <sys/resource.h>
#include <sys/wait.h>

using namespace std::chrono_literals;
using execbox::LimiterConfig;
using execbox::MIB;
using execbox::ResourceLimiter;
using execbox::ResourceLimits;
using execbox::RlimitSetting;
using execbox::Subprocess;

namespace {

std::optional<rlim_t> find_limit(const std::vector<RlimitSetting>& settings, int resource) {
    auto iter = ranges::find_if(settings, [resource](const RlimitSetting& s) { return s.resource == resource; });

    if (iter == settings.end()) {
        return std::nullopt;
    }

    return iter->limit;
}

Subprocess spawn_shell(std::string script, const TempDir& dir) {
    return Subprocess{{.executable = "/bin/sh",
                       .args = {"sh", "-c", std::move(script)},
                       .env = execbox::sandbox_environment(dir.path()),
                       .working_dir = dir.path(),
                       .rlimits = {},
                       .cgroup_procs_fd = std::nullopt,
                       .isolate_network = false}};
}

bool any_alive(const std::vector<execbox::ProcessStatus>& members) {
    return ranges::any_of(members, [](const execbox::ProcessStatus& proc) { return !proc.is_zombie(); });
}

} // namespace

TEST_CASE("Default rlimits back up the wall-clock budget") {
    LimiterConfig config;
    auto settings = execbox::make_rlimits(config, {.timeout = 2500ms, .max_memory_bytes = 64 * MIB});

    // ceil(2.5s) + 1s of slack
    REQUIRE(find_limit(settings, RLIMIT_CPU) == rlim_t{4});
    REQUIRE(find_limit(settings, RLIMIT_FSIZE) == rlim_t{config.max_file_bytes});
    REQUIRE(find_limit(settings, RLIMIT_CORE) == rlim_t{0});

    // Opt-in only
    REQUIRE_FALSE(find_limit(settings, RLIMIT_NPROC).has_value());
    REQUIRE_FALSE(find_limit(settings, RLIMIT_AS).has_value());
}

TEST_CASE("Optional rlimits are added when configured") {
    LimiterConfig config{.max_processes = 16, .limit_address_space = true};
    auto settings = execbox::make_rlimits(config, {.timeout = 1000ms, .max_memory_bytes = 256 * MIB});

    REQUIRE(find_limit(settings, RLIMIT_CPU) == rlim_t{2});
    REQUIRE(find_limit(settings, RLIMIT_NPROC) == rlim_t{16});
    REQUIRE(find_limit(settings, RLIMIT_AS) == rlim_t{256 * MIB});
}

TEST_CASE("An unusable cgroup root falls back to the watcher") {
    TempDir not_a_cgroup;

    LimiterConfig config{.cgroup_root = not_a_cgroup.path()};
    ResourceLimiter limiter{config, {.timeout = 1000ms, .max_memory_bytes = 32 * MIB}, "fallback"};

    REQUIRE(limiter.mechanism() == ResourceLimiter::Mechanism::Watcher);
    REQUIRE_FALSE(limiter.cgroup_procs_fd().has_value());

    LimiterConfig no_cgroup;
    ResourceLimiter plain{no_cgroup, {.timeout = 1000ms, .max_memory_bytes = 32 * MIB}, "plain"};

    REQUIRE(plain.mechanism() == ResourceLimiter::Mechanism::Watcher);
}

TEST_CASE("The reaped peak of the top process counts against the budget") {
    LimiterConfig config;
    ResourceLimiter limiter{config, {.timeout = 1000ms, .max_memory_bytes = 32 * MIB}, "peak"};

    // Not attached yet: nothing to watch
    REQUIRE_FALSE(limiter.memory_exceeded());
    REQUIRE_FALSE(limiter.peak_memory_bytes().has_value());

    struct rusage usage{};
    usage.ru_maxrss = 16 * 1024; // KiB

    limiter.observe_exit(usage);
    REQUIRE_FALSE(limiter.memory_exceeded());
    REQUIRE(limiter.peak_memory_bytes() == 16 * MIB);

    usage.ru_maxrss = 40 * 1024;

    limiter.observe_exit(usage);
    REQUIRE(limiter.memory_exceeded());
    REQUIRE(limiter.peak_memory_bytes() == 40 * MIB);
}

TEST_CASE("The process cap defaults to 64") {
    LimiterConfig config;
    ResourceLimiter limiter{config, {.timeout = 1000ms, .max_memory_bytes = 32 * MIB}, "cap"};

    REQUIRE(limiter.max_processes() == execbox::DEFAULT_MAX_PROCESSES);
    REQUIRE(execbox::DEFAULT_MAX_PROCESSES == 64);

    LimiterConfig lowered{.max_processes = 5};
    ResourceLimiter capped{lowered, {.timeout = 1000ms, .max_memory_bytes = 32 * MIB}, "capped"};

    REQUIRE(capped.max_processes() == 5);
}

TEST_CASE("The watcher counts every process in the tree against the cap") {
    TempDir dir;

    LimiterConfig config{.watch_interval = 1ms, .max_processes = 3};
    ResourceLimiter limiter{config, {.timeout = 10000ms, .max_memory_bytes = 1024 * MIB}, "forks"};

    auto proc = spawn_shell("for i in 1 2 3 4 5; do setsid /bin/sleep 30 & done; wait", dir);
    REQUIRE(proc.start());

    limiter.attach(proc.reaper_pid());

    bool exceeded = false;
    for (int i = 0; i < 300 && !exceeded; ++i) {
        std::this_thread::sleep_for(10ms);
        exceeded = limiter.process_limit_exceeded();
    }

    REQUIRE(exceeded);
    REQUIRE_FALSE(limiter.memory_exceeded());

    limiter.kill();

    REQUIRE_FALSE(any_alive(execbox::list_descendants(proc.reaper_pid())));

    auto status = proc.wait();
    REQUIRE(status);
    REQUIRE(WIFSIGNALED(status->status));
}

TEST_CASE("Teardown reaches processes that left the session") {
    TempDir dir;

    LimiterConfig config{.kill_grace = 50ms};
    ResourceLimiter limiter{config, {.timeout = 10000ms, .max_memory_bytes = 1024 * MIB}, "setsid"};

    // The top process exits at once, leaving an orphan in a session of its own
    auto proc = spawn_shell("setsid /bin/sleep 30 &", dir);
    REQUIRE(proc.start());

    limiter.attach(proc.reaper_pid());

    auto status = proc.wait();
    REQUIRE(status);
    REQUIRE(WIFEXITED(status->status));

    std::vector<execbox::ProcessStatus> left;
    for (int i = 0; i < 200 && !any_alive(left); ++i) {
        std::this_thread::sleep_for(10ms);
        left = execbox::list_descendants(proc.reaper_pid());
    }

    REQUIRE(any_alive(left));

    limiter.kill_remaining();

    for (const execbox::ProcessStatus& member : left) {
        auto now = execbox::read_process_status(member.pid);
        REQUIRE((!now || now->is_zombie() || now->start_time != member.start_time));
    }
}

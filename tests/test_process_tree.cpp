#include "catch2_custom.hpp"

#include <execbox/sandbox/cgroup.hpp>
#include <execbox/sandbox/process_tree.hpp>
#include <execbox/sandbox/subprocess.hpp>

#include <range/v3/algorithm/find_if.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <sys/wait.h>
#include <unistd.h>

using namespace std::chrono_literals;
using execbox::parse_flat_keyed;
using execbox::parse_proc_stat;

namespace {

constexpr std::uint64_t PAGE = 4096;

// Captured from a real /proc/<pid>/stat, trailing fields shortened
constexpr std::string_view SLEEP_STAT =
    "4242 (sleep) S 4241 4241 4241 0 -1 4194304 98 0 0 0 0 0 0 0 20 0 1 0 123456 8556544 214 18446744073709551615 "
    "1 1 0 0 0 0 0 0 0 0 0 0 17 3 0 0 0 0 0\n";

} // namespace

TEST_CASE("Parse /proc/<pid>/stat lines") {
    auto status = parse_proc_stat(SLEEP_STAT, PAGE);

    REQUIRE(status.has_value());
    REQUIRE(status->pid == 4242);
    REQUIRE(status->state == 'S');
    REQUIRE(status->ppid == 4241);
    REQUIRE(status->pgrp == 4241);
    REQUIRE(status->session == 4241);
    REQUIRE(status->start_time == 123456);
    REQUIRE(status->resident_bytes == 214 * PAGE);
    REQUIRE_FALSE(status->is_zombie());
}

TEST_CASE("Command names with spaces and parentheses do not shift fields") {
    const std::string stat = "77 (evil ) (name) Z 1 900 900 0 -1 0 0 0 0 0 0 0 0 0 20 0 1 0 5 0 0 0\n";

    auto status = parse_proc_stat(stat, PAGE);

    REQUIRE(status.has_value());
    REQUIRE(status->pid == 77);
    REQUIRE(status->state == 'Z');
    REQUIRE(status->ppid == 1);
    REQUIRE(status->pgrp == 900);
    REQUIRE(status->start_time == 5);
    REQUIRE(status->resident_bytes == 0);
    REQUIRE(status->is_zombie());
}

TEST_CASE("Malformed stat contents are rejected") {
    REQUIRE_FALSE(parse_proc_stat("", PAGE).has_value());
    REQUIRE_FALSE(parse_proc_stat("12 (truncated", PAGE).has_value());
    REQUIRE_FALSE(parse_proc_stat("12 (short) S 1 2", PAGE).has_value());
    REQUIRE_FALSE(parse_proc_stat("abc (x) S 1 2 3 0 -1 0 0 0 0 0 0 0 0 0 20 0 1 0 5 0 7 0", PAGE).has_value());
}

TEST_CASE("Descendants are found through their parents") {
    TempDir dir;
    execbox::Subprocess proc{{.executable = "/bin/sleep",
                              .args = {"sleep", "30"},
                              .env = {},
                              .working_dir = dir.path(),
                              .rlimits = {},
                              .cgroup_procs_fd = std::nullopt,
                              .isolate_network = false}};

    REQUIRE(proc.start());

    auto own = execbox::read_process_status(::getpid());
    REQUIRE(own);
    REQUIRE(own->resident_bytes > 0);

    // The reaper is a child of this process and the program a grandchild
    auto below_us = execbox::list_descendants(::getpid());
    auto find = [&below_us](pid_t pid) {
        return ranges::find_if(below_us, [pid](const execbox::ProcessStatus& proc) { return proc.pid == pid; });
    };

    REQUIRE(find(proc.reaper_pid()) != below_us.end());
    REQUIRE(find(proc.reaper_pid())->ppid == ::getpid());
    REQUIRE(find(proc.get_pid()) != below_us.end());
    REQUIRE(find(proc.get_pid())->ppid == proc.reaper_pid());

    REQUIRE(execbox::kill_descendants(proc.reaper_pid(), 1s));

    auto status = proc.wait();
    REQUIRE(status);
    REQUIRE(WIFSIGNALED(status->status));
}

TEST_CASE("Flat-keyed cgroup files") {
    constexpr std::string_view MEMORY_EVENTS = "low 0\nhigh 0\nmax 12\noom 1\noom_kill 1\noom_group_kill 0\n";

    REQUIRE(parse_flat_keyed(MEMORY_EVENTS, "oom_kill") == 1U);
    REQUIRE(parse_flat_keyed(MEMORY_EVENTS, "max") == 12U);
    REQUIRE(parse_flat_keyed(MEMORY_EVENTS, "oom") == 1U);
    REQUIRE_FALSE(parse_flat_keyed(MEMORY_EVENTS, "oom_").has_value());
    REQUIRE_FALSE(parse_flat_keyed(MEMORY_EVENTS, "missing").has_value());

    REQUIRE(parse_flat_keyed("populated 0\nfrozen 0\n", "populated") == 0U);
    REQUIRE_FALSE(parse_flat_keyed("", "populated").has_value());
}

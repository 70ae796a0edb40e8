#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string_view>
#include <vector>

#include <sys/types.h>

namespace execbox {

/// The fields of /proc/<pid>/stat that the watcher and the tree teardown care about
struct ProcessStatus
{
    pid_t pid;
    char state;
    pid_t ppid;
    pid_t pgrp;
    pid_t session;
    /// Clock ticks after boot; with the pid, identifies a process even if the pid is reused
    std::uint64_t start_time;
    std::uint64_t resident_bytes;

    bool is_zombie() const { return state == 'Z' || state == 'X'; }
};

/// Parses the contents of a /proc/<pid>/stat file.
/// The command name may contain spaces and parentheses, so fields are located from the last ')'.
std::optional<ProcessStatus> parse_proc_stat(std::string_view contents, std::uint64_t page_size);

/// std::nullopt if ``pid`` does not exist (any more)
std::optional<ProcessStatus> read_process_status(pid_t pid);

/// Every process below ``root`` in the parent/child tree, as visible in /proc right now.
/// ``root`` itself is not included; zombies are.
std::vector<ProcessStatus> list_descendants(pid_t root);

/// Sends ``sig`` to every live process in ``members``
void signal_all(const std::vector<ProcessStatus>& members, int sig);

/// SIGKILLs whatever ``list_members`` returns, in rounds, until it returns no live process.
/// Processes forked while a round is under way are picked up by the next one.
/// Returns false if live members remain after ``patience``.
bool kill_until_gone(const std::function<std::vector<ProcessStatus>()>& list_members,
                     std::chrono::milliseconds patience);

/// kill_until_gone over the descendants of ``root``
bool kill_descendants(pid_t root, std::chrono::milliseconds patience);

} // namespace execbox

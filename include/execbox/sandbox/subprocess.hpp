#pragma once

#include <execbox/common/class_traits.hpp>
#include <execbox/common/error_types.hpp>
#include <execbox/common/linux.hpp>
#include <execbox/sandbox/resource_limiter.hpp>

#include <cstddef>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include <sys/types.h>

namespace execbox {

/// Everything the child needs between fork and exec. Prepared in full before forking.
struct SpawnOptions
{
    /// Absolute path of the program to exec
    std::string executable;
    /// argv, including argv[0]
    std::vector<std::string> args;
    /// Complete environment as "KEY=VALUE" entries; nothing is inherited
    std::vector<std::string> env;

    std::filesystem::path working_dir;

    std::vector<RlimitSetting> rlimits;
    /// cgroup.procs of the cgroup the child should join, if any
    std::optional<int> cgroup_procs_fd;
    /// Run in fresh user and network namespaces (no network access)
    bool isolate_network = false;
};

/// A program running below its own reaper, with stdin, stdout and stderr connected to pipes.
///
/// The reaper is forked first. It leads a new session, dies with its parent, and marks itself a
/// child subreaper (PR_SET_CHILD_SUBREAPER) before forking the program. Every process the program
/// starts therefore stays below the reaper, even after its parent exits or it starts a session of
/// its own, until the reaper itself is gone. The reaper reports the program's exit status over a
/// pipe and keeps reaping orphans until the tree is empty.
///
/// The program starts with a clean environment and no inherited descriptors beyond stdio.
class Subprocess : NonCopyable
{
public:
    explicit Subprocess(SpawnOptions options);
    ~Subprocess();
    Subprocess(Subprocess&& other) noexcept;
    Subprocess& operator=(Subprocess&& rhs) noexcept;

    /// Forks the reaper, which forks and execs the configured program.
    /// If either fails before exec, the error is SpawnFailure and ``get_spawn_error`` says why.
    Result<void> start();

    /// The program itself
    pid_t get_pid() const { return program_pid_; }

    /// Root of the run's process tree. Also its session and process group id.
    pid_t reaper_pid() const { return reaper_pid_; }

    /// -1 once closed
    int stdin_fd() const { return stdin_pipe_.write_fd; }
    int stdout_fd() const { return stdout_pipe_.read_fd; }
    int stderr_fd() const { return stderr_pipe_.read_fd; }
    /// Becomes readable when the program's exit has been reported
    int status_fd() const { return status_pipe_.read_fd; }

    Result<void> close_stdin();
    Result<void> close_stdout();
    Result<void> close_stderr();

    /// Close every pipe to the program
    Result<void> close_pipes();

    /// The program's exit status if it has exited; std::nullopt if it is still running
    Result<std::optional<linux::WaitResult>> try_wait();

    /// Blocks until the program exits
    Result<linux::WaitResult> wait();

    /// Started, and its exit not yet collected
    bool is_running() const { return program_pid_ != 0 && !program_exited_; }

    const std::string& get_spawn_error() const { return spawn_error_; }

private:
    Result<void> init_parent();
    Result<void> await_exec();

    /// Reads one fixed-size report from the reaper.
    /// std::nullopt if none is available and ``block`` is false; otherwise the number of bytes
    /// read, which is short of the buffer only if the reaper exited.
    Result<std::optional<std::size_t>> read_report(std::span<char> buffer, bool block);

    Result<std::optional<linux::WaitResult>> collect_exit(bool block);

    /// Kills whatever is left below the reaper, then waits for the reaper to exit
    Result<void> reap_reaper();

    static Result<void> close_fd(int& fd);

    SpawnOptions options_;

    pid_t reaper_pid_{};
    pid_t program_pid_{};
    bool program_exited_{};
    bool reaper_reaped_{};

    /// The parent only makes use of the write end of stdin_pipe_ and the read ends of the others
    linux::Pipe stdin_pipe_{-1, -1};
    linux::Pipe stdout_pipe_{-1, -1};
    linux::Pipe stderr_pipe_{-1, -1};
    /// Close-on-exec pipe over which the reaper or the program reports a failure before exec
    linux::Pipe error_pipe_{-1, -1};
    /// The reaper's reports: the program's pid once forked, then its exit status
    linux::Pipe status_pipe_{-1, -1};

    std::string spawn_error_;
};

} // namespace execbox

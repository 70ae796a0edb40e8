#include <execbox/sandbox/subprocess.hpp>

#include <execbox/common/error_types.hpp>
#include <execbox/common/linux.hpp>
#include <execbox/logging.hpp>
#include <execbox/sandbox/process_tree.hpp>
#include <execbox/sandbox/resource_limiter.hpp>

#include <fmt/format.h>
#include <libassert/assert.hpp>
#include <range/v3/algorithm/transform.hpp>

#include <array>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <tuple>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <linux/close_range.h>
#include <poll.h>
#include <sched.h>
#include <signal.h>
#include <sys/prctl.h>
#include <sys/resource.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace execbox {

namespace {

/// Exit status of a child that failed before exec
constexpr int CHILD_FAILURE_EXIT = 127;

/// What the child was doing when it failed
enum class ChildStage : int {
    Session,
    DeathSignal,
    Reaper,
    Fork,
    Cgroup,
    Namespaces,
    Stdio,
    Descriptors,
    WorkingDir,
    Signals,
    Limits,
    Exec,
};

std::string_view describe(ChildStage stage) {
    switch (stage) {
    case ChildStage::Session:
        return "creating a new session";
    case ChildStage::DeathSignal:
        return "setting the parent-death signal";
    case ChildStage::Reaper:
        return "becoming the run's child reaper";
    case ChildStage::Fork:
        return "forking the program";
    case ChildStage::Cgroup:
        return "joining the run's cgroup";
    case ChildStage::Namespaces:
        return "entering new user and network namespaces";
    case ChildStage::Stdio:
        return "connecting standard streams";
    case ChildStage::Descriptors:
        return "closing inherited descriptors";
    case ChildStage::WorkingDir:
        return "entering the working directory";
    case ChildStage::Signals:
        return "resetting signal state";
    case ChildStage::Limits:
        return "applying resource limits";
    case ChildStage::Exec:
        return "executing the interpreter";
    }

    return "<unknown stage>";
}

/// How long teardown waits for a tree to die after SIGKILL, and for the reaper to follow
constexpr std::chrono::milliseconds TEARDOWN_PATIENCE{1000};

/// Sent over the error pipe, raw
struct ChildFailure
{
    ChildStage stage;
    int err;
};

/// Sent over the status pipe, raw. Both kinds have the same size, and each is written whole
/// (well below PIPE_BUF).
struct ReaperReport
{
    enum Kind : int {
        Started,
        Exited,
    };

    Kind kind;
    pid_t pid;
    int status;
    struct rusage usage;
};

/// Pointers into storage owned by the parent's stack frame, set up before fork
struct ChildContext
{
    const char* executable;
    char* const* argv;
    char* const* envp;
    const char* working_dir;
    std::span<const RlimitSetting> rlimits;
    int cgroup_procs_fd;
    bool isolate_network;
    pid_t parent_pid;

    int stdin_fd;
    int stdout_fd;
    int stderr_fd;
    int error_fd;
    int status_fd;
};

// Everything from here until execve runs in a forked child of a possibly multi-threaded process.
// Only async-signal-safe functions may be used: no allocation, no locks, no logging.

[[noreturn]] void fail_child(const ChildContext& ctx, ChildStage stage) noexcept {
    ChildFailure failure{.stage = stage, .err = errno};

    // Nothing more can be done if this fails; the parent then only sees exit status 127
    [[maybe_unused]] ssize_t res = ::write(ctx.error_fd, &failure, sizeof(failure));

    ::_exit(CHILD_FAILURE_EXIT);
}

bool redirect_fd(int from, int to) noexcept {
    if (from == to) {
        // dup2 would be a no-op and leave close-on-exec set
        return ::fcntl(from, F_SETFD, 0) != -1; // NOLINT(*vararg)
    }

    return ::dup2(from, to) != -1;
}

bool mark_inherited_fds_cloexec() noexcept {
    if (::close_range(3, ~0U, CLOSE_RANGE_CLOEXEC) == 0) {
        return true;
    }

    // Kernels older than 5.11
    struct rlimit nofile{};
    if (::getrlimit(RLIMIT_NOFILE, &nofile) == -1) {
        return false;
    }

    for (rlim_t fd = 3; fd < nofile.rlim_cur; ++fd) {
        // EBADF for descriptors that are not open is expected
        ::fcntl(static_cast<int>(fd), F_SETFD, FD_CLOEXEC); // NOLINT(*vararg)
    }

    return true;
}

bool close_all_except(int keep) noexcept {
    // keep is a pipe descriptor, so never one of the standard streams
    if (::close_range(0, static_cast<unsigned>(keep) - 1, 0) == 0 &&
        ::close_range(static_cast<unsigned>(keep) + 1, ~0U, 0) == 0) {
        return true;
    }

    // Kernels older than 5.9
    struct rlimit nofile{};
    if (::getrlimit(RLIMIT_NOFILE, &nofile) == -1) {
        return false;
    }

    for (rlim_t fd = 0; fd < nofile.rlim_cur; ++fd) {
        if (static_cast<int>(fd) != keep) {
            ::close(static_cast<int>(fd));
        }
    }

    return true;
}

[[noreturn]] void run_program(const ChildContext& ctx, pid_t reaper_pid) noexcept {
    // The death signal is not inherited across fork
    if (::prctl(PR_SET_PDEATHSIG, SIGKILL) == -1) {
        fail_child(ctx, ChildStage::DeathSignal);
    }

    if (::getppid() != reaper_pid) {
        ::_exit(CHILD_FAILURE_EXIT);
    }

    // "0" moves the writing process
    if (ctx.cgroup_procs_fd != -1 && ::write(ctx.cgroup_procs_fd, "0", 1) != 1) {
        fail_child(ctx, ChildStage::Cgroup);
    }

    if (ctx.isolate_network && ::unshare(CLONE_NEWUSER | CLONE_NEWNET) == -1) {
        fail_child(ctx, ChildStage::Namespaces);
    }

    if (!redirect_fd(ctx.stdin_fd, STDIN_FILENO) || !redirect_fd(ctx.stdout_fd, STDOUT_FILENO) ||
        !redirect_fd(ctx.stderr_fd, STDERR_FILENO)) {
        fail_child(ctx, ChildStage::Stdio);
    }

    if (!mark_inherited_fds_cloexec()) {
        fail_child(ctx, ChildStage::Descriptors);
    }

    if (::chdir(ctx.working_dir) == -1) {
        fail_child(ctx, ChildStage::WorkingDir);
    }

    ::umask(S_IRWXG | S_IRWXO);

    // Ignored signals stay ignored across exec; the engine and the reaper ignore SIGPIPE
    sigset_t empty_set;
    ::sigemptyset(&empty_set);
    if (::signal(SIGPIPE, SIG_DFL) == SIG_ERR || ::sigprocmask(SIG_SETMASK, &empty_set, nullptr) == -1) {
        fail_child(ctx, ChildStage::Signals);
    }

    for (const RlimitSetting& setting : ctx.rlimits) {
        struct rlimit limit{.rlim_cur = setting.limit, .rlim_max = setting.limit};

        if (::setrlimit(static_cast<__rlimit_resource_t>(setting.resource), &limit) == -1) {
            fail_child(ctx, ChildStage::Limits);
        }
    }

    ::execve(ctx.executable, ctx.argv, ctx.envp);

    fail_child(ctx, ChildStage::Exec);
}

void send_report(int status_fd, const ReaperReport& report) noexcept {
    // The supervisor sees a missing report as the reaper having died
    [[maybe_unused]] ssize_t res = ::write(status_fd, &report, sizeof(report));
}

[[noreturn]] void run_reaper(const ChildContext& ctx) noexcept {
    if (::setsid() == -1) {
        fail_child(ctx, ChildStage::Session);
    }

    if (::prctl(PR_SET_PDEATHSIG, SIGKILL) == -1) {
        fail_child(ctx, ChildStage::DeathSignal);
    }

    // The parent may have died before the death signal was armed
    if (::getppid() != ctx.parent_pid) {
        ::_exit(CHILD_FAILURE_EXIT);
    }

    // Orphans anywhere below are reparented here rather than to init
    if (::prctl(PR_SET_CHILD_SUBREAPER, 1) == -1) {
        fail_child(ctx, ChildStage::Reaper);
    }

    // A report to a supervisor that stopped listening must not kill the reaper
    if (::signal(SIGPIPE, SIG_IGN) == SIG_ERR) {
        fail_child(ctx, ChildStage::Signals);
    }

    const pid_t reaper_pid = ::getpid();
    const pid_t program_pid = ::fork();

    if (program_pid == -1) {
        fail_child(ctx, ChildStage::Fork);
    }

    if (program_pid == 0) {
        run_program(ctx, reaper_pid);
    }

    send_report(ctx.status_fd, {.kind = ReaperReport::Started, .pid = program_pid, .status = 0, .usage = {}});

    // Holding on to the program's pipes would keep them from reaching end of file
    if (!close_all_except(ctx.status_fd)) {
        ::_exit(CHILD_FAILURE_EXIT);
    }

    while (true) {
        ReaperReport report{.kind = ReaperReport::Exited, .pid = 0, .status = 0, .usage = {}};

        report.pid = ::wait4(-1, &report.status, 0, &report.usage);

        if (report.pid == -1) {
            if (errno == EINTR) {
                continue;
            }
            // ECHILD: the whole tree is gone
            ::_exit(0);
        }

        if (report.pid == program_pid) {
            send_report(ctx.status_fd, report);
        }
    }
}

/// argv / envp style array; the strings must outlive the result
std::vector<char*> to_c_array(std::vector<std::string>& strings) {
    std::vector<char*> result(strings.size() + 1, nullptr);

    ranges::transform(strings, result.begin(), [](std::string& str) { return str.data(); });

    return result;
}

} // namespace

Subprocess::Subprocess(SpawnOptions options)
    : options_{std::move(options)} {}

Subprocess::~Subprocess() {
    std::ignore = close_pipes();
    std::ignore = close_fd(error_pipe_.read_fd);

    // Nothing may outlive the object; by now the run is over one way or another
    if (is_running()) {
        LOG_DEBUG("Program {} still running on destruction; killing its tree", program_pid_);
    }

    if (auto reaped = reap_reaper(); !reaped) {
        LOG_WARN("Could not reap the reaper {}: {}", reaper_pid_, reaped.error());
    }

    std::ignore = close_fd(status_pipe_.read_fd);
}

Subprocess::Subprocess(Subprocess&& other) noexcept
    : options_{std::move(other.options_)}
    , reaper_pid_{std::exchange(other.reaper_pid_, 0)}
    , program_pid_{std::exchange(other.program_pid_, 0)}
    , program_exited_{std::exchange(other.program_exited_, false)}
    , reaper_reaped_{std::exchange(other.reaper_reaped_, false)}
    , stdin_pipe_{std::exchange(other.stdin_pipe_, {-1, -1})}
    , stdout_pipe_{std::exchange(other.stdout_pipe_, {-1, -1})}
    , stderr_pipe_{std::exchange(other.stderr_pipe_, {-1, -1})}
    , error_pipe_{std::exchange(other.error_pipe_, {-1, -1})}
    , status_pipe_{std::exchange(other.status_pipe_, {-1, -1})}
    , spawn_error_{std::move(other.spawn_error_)} {}

Subprocess& Subprocess::operator=(Subprocess&& rhs) noexcept {
    if (this != &rhs) {
        std::swap(options_, rhs.options_);
        std::swap(reaper_pid_, rhs.reaper_pid_);
        std::swap(program_pid_, rhs.program_pid_);
        std::swap(program_exited_, rhs.program_exited_);
        std::swap(reaper_reaped_, rhs.reaper_reaped_);
        std::swap(stdin_pipe_, rhs.stdin_pipe_);
        std::swap(stdout_pipe_, rhs.stdout_pipe_);
        std::swap(stderr_pipe_, rhs.stderr_pipe_);
        std::swap(error_pipe_, rhs.error_pipe_);
        std::swap(status_pipe_, rhs.status_pipe_);
        std::swap(spawn_error_, rhs.spawn_error_);
    }

    return *this;
}

Result<void> Subprocess::start() {
    DEBUG_ASSERT(reaper_pid_ == 0, "Subprocess started twice");

    // Everything the children touch is prepared now; they must not allocate
    std::vector<std::string> args = options_.args;
    std::vector<std::string> env = options_.env;
    std::vector<char*> argv = to_c_array(args);
    std::vector<char*> envp = to_c_array(env);
    const std::string working_dir = options_.working_dir.string();

    stdin_pipe_ = TRYE(linux::pipe2(), SyscallFailure);
    stdout_pipe_ = TRYE(linux::pipe2(), SyscallFailure);
    stderr_pipe_ = TRYE(linux::pipe2(), SyscallFailure);
    error_pipe_ = TRYE(linux::pipe2(), SyscallFailure);
    status_pipe_ = TRYE(linux::pipe2(), SyscallFailure);

    const ChildContext ctx{.executable = options_.executable.c_str(),
                           .argv = argv.data(),
                           .envp = envp.data(),
                           .working_dir = working_dir.c_str(),
                           .rlimits = options_.rlimits,
                           .cgroup_procs_fd = options_.cgroup_procs_fd.value_or(-1),
                           .isolate_network = options_.isolate_network,
                           .parent_pid = ::getpid(),
                           .stdin_fd = stdin_pipe_.read_fd,
                           .stdout_fd = stdout_pipe_.write_fd,
                           .stderr_fd = stderr_pipe_.write_fd,
                           .error_fd = error_pipe_.write_fd,
                           .status_fd = status_pipe_.write_fd};

    linux::Fork fork_res = TRYE(linux::fork(), SyscallFailure);

    // Child process
    if (fork_res.which == linux::Fork::Child) {
        run_reaper(ctx);
    }

    // Parent process
    reaper_pid_ = fork_res.pid;

    TRY(init_parent());

    return await_exec();
}

Result<void> Subprocess::init_parent() {
    // Close the pipe ends being used in the children
    //  - read end for stdin
    //  - write end for stdout, stderr, the error pipe and the status pipe
    TRYE(close_fd(stdin_pipe_.read_fd), SyscallFailure);
    TRYE(close_fd(stdout_pipe_.write_fd), SyscallFailure);
    TRYE(close_fd(stderr_pipe_.write_fd), SyscallFailure);
    TRYE(close_fd(error_pipe_.write_fd), SyscallFailure);
    TRYE(close_fd(status_pipe_.write_fd), SyscallFailure);

    // The supervision loop multiplexes these with poll; none may block it
    TRYE(linux::set_nonblocking(stdin_pipe_.write_fd), SyscallFailure);
    TRYE(linux::set_nonblocking(stdout_pipe_.read_fd), SyscallFailure);
    TRYE(linux::set_nonblocking(stderr_pipe_.read_fd), SyscallFailure);
    TRYE(linux::set_nonblocking(status_pipe_.read_fd), SyscallFailure);

    return {};
}

Result<void> Subprocess::await_exec() {
    ChildFailure failure{};
    std::span<char> buffer{reinterpret_cast<char*>(&failure), sizeof(failure)}; // NOLINT(*reinterpret-cast)
    std::size_t total_read = 0;

    // EOF without data means the reaper let go of the pipe and the program's exec closed it
    while (total_read < buffer.size()) {
        auto res = linux::read(error_pipe_.read_fd, buffer.subspan(total_read));

        if (!res) {
            if (res.error() == std::errc::interrupted) {
                continue;
            }
            return ErrorKind::SyscallFailure;
        }

        if (res.value() == 0) {
            break;
        }

        total_read += res.value();
    }

    TRYE(close_fd(error_pipe_.read_fd), SyscallFailure);

    if (total_read == 0) {
        // Written before the reaper closed its end of the error pipe
        ReaperReport started{};
        std::span<char> report{reinterpret_cast<char*>(&started), sizeof(started)}; // NOLINT(*reinterpret-cast)

        auto report_size = TRY(read_report(report, true));

        if (report_size == sizeof(started) && started.kind == ReaperReport::Started) {
            program_pid_ = started.pid;
            LOG_DEBUG("Spawned {} as pid {} below reaper {}", options_.executable, program_pid_, reaper_pid_);
            return {};
        }

        spawn_error_ = "the reaper exited before starting the program";
    } else if (total_read != sizeof(failure)) {
        spawn_error_ = "child reported a truncated failure before exec";
    } else {
        spawn_error_ = fmt::format("{} failed: {}", describe(failure.stage), get_err_msg(failure.err));
    }

    LOG_WARN("Reaper {} failed to exec {}: {}", reaper_pid_, options_.executable, spawn_error_);

    TRY(close_pipes());
    TRY(reap_reaper());

    return ErrorKind::SpawnFailure;
}

Result<void> Subprocess::close_stdin() {
    return close_fd(stdin_pipe_.write_fd);
}

Result<void> Subprocess::close_stdout() {
    return close_fd(stdout_pipe_.read_fd);
}

Result<void> Subprocess::close_stderr() {
    return close_fd(stderr_pipe_.read_fd);
}

Result<void> Subprocess::close_pipes() {
    // Try every pipe even if one fails
    auto stdin_res = close_stdin();
    auto stdout_res = close_stdout();
    auto stderr_res = close_stderr();

    // Ends that belong to the children, if start() failed part way
    std::ignore = close_fd(stdin_pipe_.read_fd);
    std::ignore = close_fd(stdout_pipe_.write_fd);
    std::ignore = close_fd(stderr_pipe_.write_fd);
    std::ignore = close_fd(error_pipe_.write_fd);
    std::ignore = close_fd(status_pipe_.write_fd);

    TRY(stdin_res);
    TRY(stdout_res);
    TRY(stderr_res);

    return {};
}

Result<std::optional<std::size_t>> Subprocess::read_report(std::span<char> buffer, bool block) {
    std::size_t total_read = 0;

    while (total_read < buffer.size()) {
        auto res = linux::read(status_pipe_.read_fd, buffer.subspan(total_read));

        if (!res) {
            if (res.error() == std::errc::interrupted) {
                continue;
            }

            if (res.error() != std::errc::resource_unavailable_try_again) {
                return ErrorKind::SyscallFailure;
            }

            if (!block && total_read == 0) {
                return std::optional<std::size_t>{};
            }

            std::array<struct pollfd, 1> fds{{{.fd = status_pipe_.read_fd, .events = POLLIN, .revents = 0}}};
            TRYE(linux::poll(fds, std::chrono::milliseconds{-1}), SyscallFailure);

            continue;
        }

        if (res.value() == 0) {
            break;
        }

        total_read += res.value();
    }

    return std::optional{total_read};
}

Result<std::optional<linux::WaitResult>> Subprocess::collect_exit(bool block) {
    ReaperReport exited{};
    std::span<char> report{reinterpret_cast<char*>(&exited), sizeof(exited)}; // NOLINT(*reinterpret-cast)

    auto report_size = TRY(read_report(report, block));

    if (!report_size) {
        return std::optional<linux::WaitResult>{};
    }

    program_exited_ = true;

    if (*report_size == sizeof(exited) && exited.kind == ReaperReport::Exited) {
        return std::optional{linux::WaitResult{.pid = exited.pid, .status = exited.status, .usage = exited.usage}};
    }

    // The reaper was killed before the program exited; its own status stands in
    LOG_WARN("Reaper {} exited without reporting on pid {}", reaper_pid_, program_pid_);

    auto status = TRYE(linux::wait4(reaper_pid_), SyscallFailure);
    reaper_reaped_ = true;

    return std::optional{status};
}

Result<std::optional<linux::WaitResult>> Subprocess::try_wait() {
    if (!is_running()) {
        return std::optional<linux::WaitResult>{};
    }

    return collect_exit(false);
}

Result<linux::WaitResult> Subprocess::wait() {
    DEBUG_ASSERT(is_running(), "wait() on a subprocess that is not running");

    auto status = TRY(collect_exit(true));

    DEBUG_ASSERT(status.has_value());

    return *status;
}

Result<void> Subprocess::reap_reaper() {
    using std::chrono::steady_clock;

    if (reaper_pid_ == 0 || reaper_reaped_) {
        return {};
    }

    if (!kill_descendants(reaper_pid_, TEARDOWN_PATIENCE)) {
        LOG_ERROR("Processes below reaper {} survived SIGKILL", reaper_pid_);
    }

    // With the tree gone the reaper runs out of children and exits by itself
    const auto deadline = steady_clock::now() + TEARDOWN_PATIENCE;

    while (true) {
        auto res = TRYE(linux::wait4(reaper_pid_, WNOHANG), SyscallFailure);

        if (res.pid != 0) {
            break;
        }

        if (steady_clock::now() >= deadline) {
            LOG_WARN("Reaper {} did not exit by itself; killing it", reaper_pid_);
            std::ignore = linux::kill(reaper_pid_, SIGKILL);
            TRYE(linux::wait4(reaper_pid_), SyscallFailure);
            break;
        }

        std::this_thread::sleep_for(std::chrono::milliseconds{1});
    }

    reaper_reaped_ = true;

    return {};
}

Result<void> Subprocess::close_fd(int& fd) {
    if (fd == -1) {
        return {};
    }

    int to_close = std::exchange(fd, -1);

    TRYE(linux::close(to_close), SyscallFailure);

    return {};
}

} // namespace execbox

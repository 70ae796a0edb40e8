#include <execbox/sandbox/sandbox.hpp>

#include <execbox/common/error_types.hpp>
#include <execbox/common/linux.hpp>
#include <execbox/common/memory_size.hpp>
#include <execbox/common/strings.hpp>
#include <execbox/execution/execution_request.hpp>
#include <execbox/execution/execution_result.hpp>
#include <execbox/logging.hpp>
#include <execbox/runners/language_runner.hpp>
#include <execbox/runners/runner_registry.hpp>
#include <execbox/sandbox/resource_limiter.hpp>
#include <execbox/sandbox/subprocess.hpp>
#include <execbox/sandbox/workspace.hpp>

#include <fmt/format.h>
#include <gsl/util>
#include <libassert/assert.hpp>

#include <algorithm>
#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include <poll.h>
#include <sys/wait.h>

namespace execbox {

namespace {

using std::chrono::steady_clock;

/// Bounded capture of one output stream. Bytes past the limit are counted but not kept.
class StreamCapture
{
public:
    explicit StreamCapture(std::size_t limit)
        : limit_{limit} {}

    void append(std::span<const char> data) {
        std::size_t room = limit_ - std::min(limit_, data_.size());
        std::size_t kept = std::min(room, data.size());

        data_.append(data.data(), kept);

        if (kept < data.size()) {
            truncated_ = true;
        }
    }

    std::string take() { return std::exchange(data_, {}); }

    bool truncated() const { return truncated_; }

private:
    std::size_t limit_;
    std::string data_;
    bool truncated_{};
};

enum class PipeState {
    Open,
    Closed,
};

/// Reads everything currently available on a non-blocking ``fd``
PipeState drain_available(int fd, StreamCapture& capture) {
    constexpr std::size_t BUF_SZ = 64 * 1024;
    std::array<char, BUF_SZ> buffer; // NOLINT(*member-init)

    while (true) {
        auto res = linux::read(fd, buffer);

        if (!res) {
            if (res.error() == std::errc::resource_unavailable_try_again) {
                return PipeState::Open;
            }
            if (res.error() == std::errc::interrupted) {
                continue;
            }
            // Any other error ends the stream just like EOF
            return PipeState::Closed;
        }

        if (res.value() == 0) {
            return PipeState::Closed;
        }

        capture.append(std::span{buffer}.first(res.value()));
    }
}

/// Writes as much of ``pending`` as the pipe accepts without blocking
PipeState feed_stdin(int fd, std::string_view& pending) {
    while (!pending.empty()) {
        auto res = linux::write(fd, pending);

        if (!res) {
            if (res.error() == std::errc::resource_unavailable_try_again) {
                return PipeState::Open;
            }
            if (res.error() == std::errc::interrupted) {
                continue;
            }
            // EPIPE: the program closed its stdin without reading everything, which is its right
            return PipeState::Closed;
        }

        pending.remove_prefix(gsl::narrow_cast<std::size_t>(res.value()));
    }

    return PipeState::Closed;
}

enum class Ending {
    Exited,
    TimedOut,
    MemoryExceeded,
    ProcessLimitExceeded,
};

struct RunOutcome
{
    linux::WaitResult status;
    Ending ending;
    steady_clock::time_point finished;
};

/// Drives one running child: feeds stdin, captures output, and races exit against the
/// deadline and the memory limit
class RunSupervisor
{
public:
    RunSupervisor(Subprocess& proc, ResourceLimiter& limiter, const SandboxConfig& config,
                  std::string_view stdin_input, steady_clock::time_point deadline)
        : proc_{&proc}
        , limiter_{&limiter}
        , config_{&config}
        , pending_stdin_{stdin_input}
        , deadline_{deadline}
        , stdout_{config.max_output_bytes}
        , stderr_{config.max_output_bytes} {}

    Result<RunOutcome> supervise();

    /// Collects output still buffered in the pipes once the tree is gone, for a bounded time
    Result<void> drain_after_exit();

    ExecutionResult make_result(const RunOutcome& outcome, const ExecutionRequest& request,
                                steady_clock::time_point start_time);

private:
    Result<void> poll_once(std::chrono::milliseconds timeout);

    /// Tears the tree down and collects the top process's status
    Result<RunOutcome> stop(Ending ending);

    RunOutcome ended(linux::WaitResult status, Ending ending) const {
        return {.status = status, .ending = ending, .finished = steady_clock::now()};
    }

    bool output_open() const { return proc_->stdout_fd() != -1 || proc_->stderr_fd() != -1; }

    Subprocess* proc_;
    ResourceLimiter* limiter_;
    const SandboxConfig* config_;

    std::string_view pending_stdin_;
    steady_clock::time_point deadline_;

    StreamCapture stdout_;
    StreamCapture stderr_;
};

Result<RunOutcome> RunSupervisor::supervise() {
    using std::chrono::ceil;
    using std::chrono::milliseconds;

    if (pending_stdin_.empty()) {
        TRY(proc_->close_stdin());
    }

    while (true) {
        if (auto status = TRY(proc_->try_wait())) {
            return ended(*status, Ending::Exited);
        }

        const auto now = steady_clock::now();

        if (now >= deadline_) {
            LOG_DEBUG("pid {} hit its deadline", proc_->get_pid());
            return stop(Ending::TimedOut);
        }

        if (limiter_->memory_exceeded()) {
            LOG_DEBUG("pid {} exceeded its memory budget", proc_->get_pid());
            return stop(Ending::MemoryExceeded);
        }

        if (limiter_->process_limit_exceeded()) {
            LOG_DEBUG("pid {} started too many processes", proc_->get_pid());
            return stop(Ending::ProcessLimitExceeded);
        }

        TRY(poll_once(std::min(ceil<milliseconds>(deadline_ - now), config_->limiter.watch_interval)));
    }
}

Result<RunOutcome> RunSupervisor::stop(Ending ending) {
    // The run ends now, not when the tree finally dies
    auto outcome = ended({}, ending);

    limiter_->kill();
    outcome.status = TRY(proc_->wait());

    return outcome;
}

Result<void> RunSupervisor::poll_once(std::chrono::milliseconds timeout) {
    // poll ignores negative descriptors, so closed streams simply drop out.
    // The status pipe only wakes the loop; supervise() collects the exit.
    std::array<struct pollfd, 4> fds{{
        {.fd = proc_->stdin_fd(), .events = POLLOUT, .revents = 0},
        {.fd = proc_->stdout_fd(), .events = POLLIN, .revents = 0},
        {.fd = proc_->stderr_fd(), .events = POLLIN, .revents = 0},
        {.fd = proc_->is_running() ? proc_->status_fd() : -1, .events = POLLIN, .revents = 0},
    }};

    int num_ready = TRYE(linux::poll(fds, timeout), SyscallFailure);

    if (num_ready == 0) {
        return {};
    }

    auto [stdin_poll, stdout_poll, stderr_poll, status_poll] = fds;

    if ((stdin_poll.revents & (POLLERR | POLLHUP)) != 0) {
        TRY(proc_->close_stdin());
    } else if ((stdin_poll.revents & POLLOUT) != 0) {
        if (feed_stdin(stdin_poll.fd, pending_stdin_) == PipeState::Closed) {
            TRY(proc_->close_stdin());
        }
    }

    if (stdout_poll.revents != 0 && drain_available(stdout_poll.fd, stdout_) == PipeState::Closed) {
        TRY(proc_->close_stdout());
    }

    if (stderr_poll.revents != 0 && drain_available(stderr_poll.fd, stderr_) == PipeState::Closed) {
        TRY(proc_->close_stderr());
    }

    return {};
}

Result<void> RunSupervisor::drain_after_exit() {
    using std::chrono::ceil;
    using std::chrono::milliseconds;

    TRY(proc_->close_stdin());

    const auto drain_deadline = steady_clock::now() + config_->limiter.kill_grace;

    while (output_open()) {
        const auto now = steady_clock::now();

        if (now >= drain_deadline) {
            LOG_DEBUG("Output pipes of pid {} still open after teardown; discarding the rest", proc_->get_pid());
            break;
        }

        TRY(poll_once(std::min(ceil<milliseconds>(drain_deadline - now), config_->limiter.watch_interval)));
    }

    return proc_->close_pipes();
}

std::optional<std::string> describe_failure(const ExecutionResult& result, const ExecutionRequest& request,
                                            std::uint64_t max_processes) {
    if (result.timed_out) {
        return fmt::format("Time limit exceeded: execution took longer than {}ms", request.timeout().count());
    }

    if (result.memory_exceeded) {
        return fmt::format("Memory limit exceeded: the program used more than {}",
                           format_memory_size(request.max_memory_bytes()));
    }

    if (result.process_limit_exceeded) {
        return fmt::format("Process limit exceeded: the program ran more than {} processes at once", max_processes);
    }

    const bool failed_exit = result.exit_code && *result.exit_code != 0;

    if (!failed_exit && !result.term_signal) {
        return std::nullopt;
    }

    if (auto stderr_text = trim_end(result.stderr_output); !stderr_text.empty()) {
        return std::string{stderr_text};
    }

    if (failed_exit) {
        return fmt::format("Process exited with code {}", *result.exit_code);
    }

    return fmt::format("Process terminated by signal {}", linux::Signal{*result.term_signal}.name());
}

ExecutionResult RunSupervisor::make_result(const RunOutcome& outcome, const ExecutionRequest& request,
                                           steady_clock::time_point start_time) {
    ExecutionResult result;

    result.stdout_output = stdout_.take();
    result.stderr_output = stderr_.take();
    result.stdout_truncated = stdout_.truncated();
    result.stderr_truncated = stderr_.truncated();

    result.execution_time = std::chrono::duration_cast<std::chrono::milliseconds>(outcome.finished - start_time);

    result.timed_out = outcome.ending == Ending::TimedOut;
    // An OOM kill may only become visible once the top process has been reaped
    result.process_limit_exceeded = outcome.ending == Ending::ProcessLimitExceeded;
    result.memory_exceeded = outcome.ending == Ending::MemoryExceeded ||
                             (!result.timed_out && !result.process_limit_exceeded && limiter_->memory_exceeded());

    const int status = outcome.status.status;

    if (WIFEXITED(status) && outcome.ending == Ending::Exited && !result.memory_exceeded) {
        result.exit_code = WEXITSTATUS(status);
    }

    if (WIFSIGNALED(status)) {
        result.term_signal = WTERMSIG(status);
    }

    result.peak_memory_bytes = limiter_->peak_memory_bytes();
    result.error = describe_failure(result, request, limiter_->max_processes());

    return result;
}

ExecutionResult engine_fault(std::string_view what, ErrorKind kind) {
    LOG_WARN("Engine fault ({}): {}", kind, what);

    return ExecutionResult::engine_fault(fmt::format("Execution environment error: {}", what));
}

} // namespace

std::vector<std::string> sandbox_environment(const std::filesystem::path& working_dir) {
    return {
        "PATH=/usr/local/bin:/usr/bin:/bin",
        fmt::format("HOME={}", working_dir.string()),
        fmt::format("TMPDIR={}", working_dir.string()),
        "LANG=C.UTF-8",
    };
}

ExecutionSandbox::ExecutionSandbox(SandboxConfig config, const RunnerRegistry& runners, AdmissionGate& gate)
    : config_{std::move(config)}
    , runners_{&runners}
    , gate_{&gate} {}

ExecutionResult ExecutionSandbox::execute(const ExecutionRequest& request) {
    // Released only after run() has torn everything down
    auto slot = gate_->acquire();

    try {
        return run(request);
    } catch (const std::exception& ex) {
        LOG_ERROR("Unexpected exception while executing {} code: {}", request.language(), ex.what());
        return engine_fault(fmt::format("internal error: {}", ex.what()), ErrorKind::UnknownError);
    }
}

ExecutionResult ExecutionSandbox::run(const ExecutionRequest& request) {
    const LanguageRunner& runner = runners_->get(request.language());

    auto workspace = Workspace::create(config_.workspace_root);

    if (!workspace) {
        return engine_fault("could not create a working directory", workspace.error());
    }

    auto program = runner.prepare(request.code(), *workspace, request.mode());

    if (!program) {
        if (program.error() == ErrorKind::InterpreterNotFound) {
            return engine_fault(fmt::format("no {} interpreter found (configured as \"{}\")", request.language(),
                                            runner.interpreter()),
                                program.error());
        }
        return engine_fault("could not write the program into its working directory", program.error());
    }

    ResourceLimiter limiter{config_.limiter, {.timeout = request.timeout(), .max_memory_bytes = request.max_memory_bytes()},
                            workspace->name()};

    Subprocess proc{SpawnOptions{.executable = program->executable,
                                 .args = program->args,
                                 .env = sandbox_environment(workspace->path()),
                                 .working_dir = workspace->path(),
                                 .rlimits = limiter.rlimits(),
                                 .cgroup_procs_fd = limiter.cgroup_procs_fd(),
                                 .isolate_network = config_.isolate_network}};

    const auto start_time = steady_clock::now();

    auto started = proc.start();
    limiter.release_spawn_resources();

    if (!started) {
        if (started.error() == ErrorKind::SpawnFailure) {
            return engine_fault(fmt::format("could not start the program: {}", proc.get_spawn_error()),
                                started.error());
        }
        return engine_fault("could not start the program", started.error());
    }

    limiter.attach(proc.reaper_pid());

    RunSupervisor supervisor{proc, limiter, config_, request.stdin_input(), start_time + request.timeout()};

    auto outcome = supervisor.supervise();

    if (!outcome) {
        // proc's destructor reaps whatever is left of the top process
        limiter.kill();
        return engine_fault("lost track of the running program", outcome.error());
    }

    limiter.kill_remaining();

    if (auto drained = supervisor.drain_after_exit(); !drained) {
        LOG_WARN("Could not drain the output of pid {}: {}", proc.get_pid(), drained.error());
    }

    limiter.observe_exit(outcome->status.usage);

    ExecutionResult result = supervisor.make_result(*outcome, request, start_time);

    LOG_DEBUG("pid {} finished in {}ms: exit={} signal={} timed_out={} memory_exceeded={} process_limit_exceeded={}",
              proc.get_pid(), result.execution_time.count(), result.exit_code.value_or(-1),
              result.term_signal.value_or(0), result.timed_out, result.memory_exceeded, result.process_limit_exceeded);

    return result;
}

} // namespace execbox

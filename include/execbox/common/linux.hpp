#pragma once

#include <execbox/common/expected.hpp>
#include <execbox/logging.hpp>

#include <fmt/format.h>

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstddef>
#include <cstring>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <system_error>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <string.h>
#include <sys/resource.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

/// Thin wrappers around the Linux syscalls used by the supervising (parent) side of a sandbox.
/// None of these may be called between fork and exec in a child; see sandbox/subprocess.cpp.
namespace execbox::linux {

inline std::error_code make_error_code(int err = errno) {
    return {err, std::generic_category()};
}

/// writes to a file descriptor. See write(2)
/// returns success/failure; logs failure at debug level
inline Expected<ssize_t> write(int fd, std::string_view data) {
    ssize_t res = ::write(fd, data.data(), data.size());

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("write failed: '{}'", err.message());
        return err;
    }

    return res;
}

/// reads from a file descriptor into ``buffer``. See read(2)
/// returns the number of bytes read (0 on EOF); logs failure at debug level
inline Expected<std::size_t> read(int fd, std::span<char> buffer) {
    ssize_t res = ::read(fd, buffer.data(), buffer.size());

    if (res == -1) {
        auto err = make_error_code(errno);

        // EAGAIN is expected on non-blocking pipes and is not worth logging
        if (err != std::errc::resource_unavailable_try_again) {
            LOG_DEBUG("read failed: '{}'", err.message());
        }
        return err;
    }

    return static_cast<std::size_t>(res);
}

/// closes a file descriptor. See close(2)
/// returns success/failure; logs failure at debug level
inline Expected<> close(int fd) {
    int res = ::close(fd);

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("close failed: '{}'", err.message());
        return err;
    }

    return {};
}

/// see kill(2)
/// returns success/failure; ESRCH (already gone) is reported but not logged
inline Expected<> kill(pid_t pid, int sig) {
    int res = ::kill(pid, sig);

    if (res == -1) {
        auto err = make_error_code(errno);

        if (err != std::errc::no_such_process) {
            LOG_DEBUG("kill(pid={}, sig={}) failed: '{}'", pid, sig, err.message());
        }
        return err;
    }

    return {};
}

struct Fork
{
    enum { Parent, Child } which;

    pid_t pid; // Only valid if which == Parent
};

/// see fork(2)
/// returns result from enum; logs failure at debug level
inline Expected<Fork> fork() {
    pid_t res = ::fork();

    if (res == -1) {
        auto err = make_error_code(errno);
        LOG_DEBUG("fork failed: '{}'", err.message());
        return err;
    }

    if (res == 0) {
        return Fork{.which = Fork::Child, .pid = 0};
    }

    return Fork{.which = Fork::Parent, .pid = res};
}

/// see open(2)
/// returns success/failure; logs failure at debug level
inline Expected<int> open(const std::string& pathname, int flags, mode_t mode = 0) {
    // NOLINTNEXTLINE(*vararg)
    int res = ::open(pathname.c_str(), flags, mode);

    if (res == -1) {
        auto err = make_error_code(errno);
        LOG_DEBUG("open(\"{}\") failed: '{}'", pathname, err.message());
        return err;
    }

    return res;
}

/// see fcntl(2)
/// returns success/failure; logs failure at debug level
inline Expected<int> fcntl(int fd, int cmd, std::optional<int> arg = std::nullopt) {
    int res{};

    if (arg) {
        // NOLINTNEXTLINE(*vararg)
        res = ::fcntl(fd, cmd, arg.value());
    } else {
        // NOLINTNEXTLINE(*vararg)
        res = ::fcntl(fd, cmd);
    }

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("fcntl failed: '{}'", err.message());

        return err;
    }

    return res;
}

/// Marks ``fd`` as non-blocking, preserving its other status flags
inline Expected<> set_nonblocking(int fd) {
    auto pre_flags = fcntl(fd, F_GETFL);

    if (!pre_flags) {
        return pre_flags.error();
    }

    auto res = fcntl(fd, F_SETFL, pre_flags.value() | O_NONBLOCK); // NOLINT

    if (!res) {
        return res.error();
    }

    return {};
}

struct Pipe
{
    int read_fd;
    int write_fd;
};

// Ensure that fds are packed so that pipe works properly
static_assert(offsetof(Pipe, read_fd) + sizeof(Pipe::read_fd) == offsetof(Pipe, write_fd));

/// see pipe2(2)
/// returns success/failure; logs failure at debug level
inline Expected<Pipe> pipe2(int flags = O_CLOEXEC) {
    Pipe pipe{};

    int res = ::pipe2(&pipe.read_fd, flags);

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("pipe failed: '{}'", err.message());

        return err;
    }

    return pipe;
}

/// Wait status plus resource usage of a reaped child
struct WaitResult
{
    pid_t pid; // 0 if the child has not changed state (WNOHANG)
    int status;
    struct rusage usage;
};

/// see wait4(2)
/// returns success/failure; logs failure at debug level
inline Expected<WaitResult> wait4(pid_t pid, int options = 0) {
    WaitResult result{};

    pid_t res = 0;
    do {
        res = ::wait4(pid, &result.status, options, &result.usage);
    } while (res == -1 && errno == EINTR);

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("wait4(pid={}) failed: '{}'", pid, err.message());

        return err;
    }

    result.pid = res;

    return result;
}

/// see poll(2)
/// returns the number of ready descriptors (0 on timeout). EINTR is reported as 0 ready.
inline Expected<int> poll(std::span<struct pollfd> fds, std::chrono::milliseconds timeout) {
    int res = ::poll(fds.data(), fds.size(), static_cast<int>(timeout.count()));

    if (res == -1) {
        auto err = make_error_code(errno);

        if (err == std::errc::interrupted) {
            return 0;
        }

        LOG_DEBUG("poll failed: '{}'", err.message());

        return err;
    }

    return res;
}

/// see access(2)
inline bool access(const std::string& pathname, int mode) {
    return ::access(pathname.c_str(), mode) == 0;
}

/// Value type to behave as a linux signal
class Signal
{
public:
    // NOLINTNEXTLINE(google-explicit-constructor)
    Signal(int signal_num)
        : signal_num_{signal_num} {};

    // NOLINTNEXTLINE(google-explicit-constructor)
    operator int() const { return signal_num_; }

    /// Abbreviated name with the SIG prefix, e.g. "SIGKILL"
    std::string name() const {
        const char* abbrev = sigabbrev_np(signal_num_);

        if (abbrev == nullptr) {
            return fmt::format("signal {}", signal_num_);
        }

        return fmt::format("SIG{}", abbrev);
    }

    std::string to_string() const { return sigdescr_np(signal_num_); }

private:
    int signal_num_;
};

// TODO: Switch to using sigaction
using SignalHandlerT = void (*)(int);

inline Expected<SignalHandlerT> signal(Signal sig, SignalHandlerT handler) {
    SignalHandlerT prev_handler = ::signal(sig, handler);

    if (prev_handler == SIG_ERR) {
        auto err = make_error_code();

        LOG_DEBUG("signal failed: '{}'", err.message());

        return err;
    }

    return prev_handler;
}

} // namespace execbox::linux

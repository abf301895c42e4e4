#pragma once

#include <codekata/common/expected.hpp>
#include <codekata/logging.hpp>

#include <libassert/assert.hpp>

#include <cerrno>
#include <csignal>
#include <cstddef>
#include <string>
#include <system_error>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <string.h>
#include <sys/prctl.h>
#include <sys/resource.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace codekata::linux {

inline std::error_code make_error_code(int err = errno) {
    return {err, std::generic_category()};
}

/// reads from a file descriptor. See read(2)
/// returns success/failure; logs failure at debug level
inline Expected<std::string> read(int fd, std::size_t count) {
    std::string buffer(count, '\0');

    ssize_t res = ::read(fd, buffer.data(), count);

    if (res == -1) {
        auto err = make_error_code(errno);

        if (err != std::errc::resource_unavailable_try_again) {
            LOG_DEBUG("read failed: '{}'", err.message());
        }
        return err;
    }

    DEBUG_ASSERT(res >= 0, "read result is negative and != -1");
    buffer.resize(static_cast<std::size_t>(res));

    return buffer;
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
/// returns success/failure; logs failure at debug level
inline Expected<> kill(pid_t pid, int sig) {
    int res = ::kill(pid, sig);

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("kill failed: '{}'", err.message());
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
    int res = ::fork();

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

/// see fcntl(2)
/// returns success/failure; logs failure at debug level
inline Expected<int> fcntl(int fd, int cmd) {
    // NOLINTNEXTLINE(*vararg)
    int res = ::fcntl(fd, cmd);

    if (res == -1) {
        auto err = make_error_code(errno);
        LOG_DEBUG("fcntl failed: '{}'", err.message());
        return err;
    }

    return res;
}

inline Expected<int> fcntl(int fd, int cmd, int arg) {
    // NOLINTNEXTLINE(*vararg)
    int res = ::fcntl(fd, cmd, arg);

    if (res == -1) {
        auto err = make_error_code(errno);
        LOG_DEBUG("fcntl failed: '{}'", err.message());
        return err;
    }

    return res;
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
inline Expected<Pipe> pipe2(int flags = 0) {
    Pipe pipe{};

    int res = ::pipe2(&pipe.read_fd, flags);

    if (res == -1) {
        auto err = make_error_code(errno);
        LOG_DEBUG("pipe failed: '{}'", err.message());
        return err;
    }

    return pipe;
}

/// see poll(2)
/// returns the number of ready descriptors (0 on timeout); EINTR is retried
inline Expected<int> poll(struct ::pollfd* fds, nfds_t nfds, int timeout_ms) {
    int res = -1;

    do {
        res = ::poll(fds, nfds, timeout_ms);
    } while (res == -1 && errno == EINTR);

    if (res == -1) {
        auto err = make_error_code(errno);
        LOG_DEBUG("poll failed: '{}'", err.message());
        return err;
    }

    return res;
}

struct WaitStatus
{
    pid_t pid;  // 0 when WNOHANG was given and the child has not changed state
    int status; // raw status as given to the W* macros
};

/// see waitpid(2)
/// returns success/failure; logs failure at debug level
inline Expected<WaitStatus> waitpid(pid_t pid, int options = 0) {
    int status = 0;
    pid_t res = -1;

    do {
        res = ::waitpid(pid, &status, options);
    } while (res == -1 && errno == EINTR);

    if (res == -1) {
        auto err = make_error_code(errno);
        LOG_DEBUG("waitpid failed: '{}'", err.message());
        return err;
    }

    return WaitStatus{.pid = res, .status = status};
}

/// see setrlimit(2). Sets both the soft and hard limit.
/// Does not log; this is meant to be called from a freshly forked worker.
inline Expected<> setrlimit(int resource, rlim_t limit) {
    struct ::rlimit lim{.rlim_cur = limit, .rlim_max = limit};

    if (::setrlimit(resource, &lim) == -1) {
        return make_error_code(errno);
    }

    return {};
}

/// see getrlimit(2)
/// Does not log; this is meant to be called from a freshly forked worker.
inline Expected<struct ::rlimit> getrlimit(int resource) {
    struct ::rlimit lim{};

    if (::getrlimit(resource, &lim) == -1) {
        return make_error_code(errno);
    }

    return lim;
}

/// see close_range(2)
/// Does not log; this is meant to be called from a freshly forked worker.
inline Expected<> close_range(unsigned int first, unsigned int last) {
    if (first > last) {
        return {};
    }

    if (::close_range(first, last, 0) == -1) {
        return make_error_code(errno);
    }

    return {};
}

/// see prctl(2)
/// Does not log; this is meant to be called from a freshly forked worker.
inline Expected<> prctl(int option, unsigned long arg) { // NOLINT(google-runtime-int)
    // NOLINTNEXTLINE(*vararg)
    if (::prctl(option, arg, 0, 0, 0) == -1) {
        return make_error_code(errno);
    }

    return {};
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

    /// Abbreviated name, e.g. "SIGSEGV"
    std::string name() const {
        const char* abbrev = sigabbrev_np(signal_num_);
        if (abbrev == nullptr) {
            return "signal " + std::to_string(signal_num_);
        }
        return std::string{"SIG"} + abbrev;
    }

    std::string to_string() const {
        const char* descr = sigdescr_np(signal_num_);
        return descr == nullptr ? name() : descr;
    }

private:
    int signal_num_;
};

} // namespace codekata::linux

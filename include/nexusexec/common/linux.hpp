#pragma once

#include <nexusexec/common/expected.hpp>
#include <nexusexec/logging.hpp>

#include <libassert/assert.hpp>

#include <cerrno>
#include <csignal>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>
#include <tuple>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/eventfd.h>
#include <sys/resource.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

/// Thin wrappers over the syscalls the engine uses from its own (parent) threads.
///
/// None of these are async-signal-safe: they allocate and log. Code that runs between
/// fork(2) and execve(2) must use the raw syscalls instead.
namespace nexusexec::linux {

inline std::error_code make_error_code(int err = errno) {
    return {err, std::generic_category()};
}

/// writes to a file descriptor. See write(2)
/// returns the number of bytes written; logs failure at debug level
inline Expected<std::size_t> write(int fd, std::string_view data) {
    ssize_t res = ::write(fd, data.data(), data.size());

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("write failed: '{}'", err.message());
        return err;
    }

    return static_cast<std::size_t>(res);
}

/// reads from a file descriptor. See read(2)
/// returns success/failure; logs failure at debug level
inline Expected<std::string> read(int fd, std::size_t count) { // NOLINT
    std::string buffer(count, '\0');

    ssize_t res = ::read(fd, buffer.data(), count);

    if (res == -1) {
        auto err = make_error_code(errno);

        // Non-blocking descriptors report an empty pipe this way; not worth a log line
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

/// see killpg(3)
/// returns success/failure; logs failure at debug level
inline Expected<> killpg(pid_t pgrp, int sig) {
    int res = ::killpg(pgrp, sig);

    if (res == -1) {
        auto err = make_error_code(errno);

        // ESRCH just means the whole group is already gone
        if (err != std::errc::no_such_process) {
            LOG_DEBUG("killpg failed: '{}'", err.message());
        }
        return err;
    }

    return {};
}

struct Fork
{
    enum { Parent, Child } which;

    pid_t pid;
};

/// see fork(2)
/// returns success/failure; logs failure at debug level
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
    int res = ::open(pathname.c_str(), flags, mode);

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("open({:?}) failed: '{}'", pathname, err.message());
        return err;
    }

    return res;
}

/// see fcntl(2)
/// returns the result of the command; logs failure at debug level
inline Expected<int> fcntl(int fd, int cmd, int arg = 0) {
    int res = ::fcntl(fd, cmd, arg);

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("fcntl failed: '{}'", err.message());
        return err;
    }

    return res;
}

/// Sets O_NONBLOCK on ``fd``, preserving other status flags
inline Expected<> set_nonblocking(int fd) {
    auto flags = fcntl(fd, F_GETFL);
    if (!flags) {
        return flags.error();
    }

    if (auto res = fcntl(fd, F_SETFL, *flags | O_NONBLOCK); !res) {
        return res.error();
    }

    return {};
}

struct WaitResult
{
    pid_t pid; ///< 0 if WNOHANG was given and the child has not changed state
    int status;
};

/// see waitpid(2)
/// returns success/failure; logs failure at debug level
inline Expected<WaitResult> waitpid(pid_t pid, int options = 0) {
    int status = 0;
    pid_t res = 0;

    do {
        res = ::waitpid(pid, &status, options);
    } while (res == -1 && errno == EINTR);

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("waitpid failed: '{}'", err.message());
        return err;
    }

    return WaitResult{.pid = res, .status = status};
}

struct Pipe
{
    int read_fd;
    int write_fd;
};

/// see pipe(2)
/// returns success/failure; logs failure at debug level
inline Expected<Pipe> pipe2(int flags = O_CLOEXEC) {
    int pipefd[2] = {}; // NOLINT(*-avoid-c-arrays)

    int res = ::pipe2(pipefd, flags);

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("pipe failed: '{}'", err.message());
        return err;
    }

    return Pipe{.read_fd = pipefd[0], .write_fd = pipefd[1]};
}

/// see eventfd(2). Always non-blocking and close-on-exec.
/// returns success/failure; logs failure at debug level
inline Expected<int> eventfd() {
    int res = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("eventfd failed: '{}'", err.message());
        return err;
    }

    return res;
}

/// see poll(2). EINTR is reported as "nothing ready".
/// returns the number of ready descriptors; logs failure at debug level
inline Expected<int> poll(std::vector<pollfd>& fds, int timeout_ms) {
    int res = ::poll(fds.data(), fds.size(), timeout_ms);

    if (res == -1) {
        if (errno == EINTR) {
            return 0;
        }

        auto err = make_error_code(errno);

        LOG_DEBUG("poll failed: '{}'", err.message());
        return err;
    }

    return res;
}

/// see setpgid(2)
/// returns success/failure; logs failure at debug level
inline Expected<> setpgid(pid_t pid, pid_t pgid) {
    int res = ::setpgid(pid, pgid);

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("setpgid failed: '{}'", err.message());
        return err;
    }

    return {};
}

/// see stat(2)
/// returns success/failure; logs failure at debug level
inline Expected<struct ::stat> stat(const std::string& pathname) {
    struct ::stat res_stat{};

    int res = ::stat(pathname.c_str(), &res_stat);

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_TRACE("stat({:?}) failed: '{}'", pathname, err.message());
        return err;
    }

    return res_stat;
}

/// Read the whole of a (small) file, e.g. under /proc or /sys/fs/cgroup
inline Expected<std::string> read_file(const std::string& pathname) {
    auto fd = open(pathname, O_RDONLY | O_CLOEXEC);
    if (!fd) {
        return fd.error();
    }

    std::string contents;
    while (true) {
        auto chunk = read(*fd, 4096);
        if (!chunk) {
            std::ignore = close(*fd);
            return chunk.error();
        }
        if (chunk->empty()) {
            break;
        }
        contents += *chunk;
    }

    std::ignore = close(*fd);
    return contents;
}

/// Write ``data`` to an existing file, e.g. a cgroup control file
inline Expected<> write_file(const std::string& pathname, std::string_view data) {
    auto fd = open(pathname, O_WRONLY | O_CLOEXEC);
    if (!fd) {
        return fd.error();
    }

    auto res = write(*fd, data);
    std::ignore = close(*fd);

    if (!res) {
        return res.error();
    }

    return {};
}

struct SignalAction
{
    int sig;
    sighandler_t prev_handler;
};

/// see signal(2)
/// returns the previous handler; logs failure at debug level
inline Expected<SignalAction> signal(int sig, sighandler_t handler) {
    sighandler_t prev = ::signal(sig, handler);

    if (prev == SIG_ERR) { // NOLINT(*-cstyle-cast)
        auto err = make_error_code(errno);

        LOG_DEBUG("signal failed: '{}'", err.message());
        return err;
    }

    return SignalAction{.sig = sig, .prev_handler = prev};
}

} // namespace nexusexec::linux

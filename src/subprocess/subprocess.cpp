#include <nexusexec/subprocess/subprocess.hpp>

#include <nexusexec/common/error_types.hpp>
#include <nexusexec/common/expected.hpp>
#include <nexusexec/common/linux.hpp>
#include <nexusexec/logging.hpp>
#include <nexusexec/subprocess/run_result.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <iterator>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <tuple>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ; // NOLINT

namespace nexusexec {

namespace {

void close_fd(int& fd) {
    if (fd != -1) {
        std::ignore = linux::close(fd);
        fd = -1;
    }
}

/// Writes to a pipe whose reader went away must show up as EPIPE, not kill the engine
void ignore_sigpipe_once() {
    static std::once_flag flag;
    std::call_once(flag, [] {
        if (auto res = linux::signal(SIGPIPE, SIG_IGN); !res) {
            LOG_WARN("Could not ignore SIGPIPE: {}", res.error().message());
        }
    });
}

} // namespace

Subprocess::Subprocess(std::string exec, std::vector<std::string> args, SpawnOptions options)
    : exec_{std::move(exec)}
    , args_{std::move(args)}
    , options_{std::move(options)} {}

Subprocess::~Subprocess() {
    // if child_pid_ == 0, then the process was never started
    if (child_pid_ != 0 && !run_result_) {
        if (auto res = Subprocess::kill(); !res) {
            LOG_WARN("Failed to kill child process {} ({:?}): {}", child_pid_, exec_, format_as(res.error()));
        }
    }

    std::ignore = close_pipes();
}

Result<void> Subprocess::start() {
    if (child_pid_ != 0) {
        return Error{ErrorKind::InternalSandboxError, "process was already started"};
    }

    auto res = create();
    if (!res) {
        std::ignore = close_pipes();
    }
    return res;
}

Result<void> Subprocess::create() {
    ignore_sigpipe_once();

    // NOLINTBEGIN(cppcoreguidelines-pro-type-const-cast)
    auto to_cstr = [](const std::string& str) { return const_cast<char*>(str.c_str()); };

    argv_.clear();
    argv_.push_back(to_cstr(exec_));
    std::ranges::transform(args_, std::back_inserter(argv_), to_cstr);
    argv_.push_back(nullptr);

    envp_.clear();
    std::ranges::transform(options_.env, std::back_inserter(envp_), to_cstr);
    envp_.push_back(nullptr);
    // NOLINTEND(cppcoreguidelines-pro-type-const-cast)

    stdin_pipe_ = TRYE(linux::pipe2(), SyscallFailure);
    stdout_pipe_ = TRYE(linux::pipe2(), SyscallFailure);
    if (!options_.merge_stderr) {
        stderr_pipe_ = TRYE(linux::pipe2(), SyscallFailure);
    }
    gate_pipe_ = TRYE(linux::pipe2(), SyscallFailure);
    exec_error_pipe_ = TRYE(linux::pipe2(), SyscallFailure);

    linux::Fork fork_res = TRYE(linux::fork(), SyscallFailure);

    // Child process
    if (fork_res.which == linux::Fork::Child) {
        run_child();
    }

    // Parent process
    child_pid_ = fork_res.pid;

    // Both sides set the process group so that neither can observe the child outside of it
    std::ignore = linux::setpgid(child_pid_, child_pid_);

    // Close the pipe ends being used in the child proc
    close_fd(stdin_pipe_.read_fd);
    close_fd(stdout_pipe_.write_fd);
    close_fd(stderr_pipe_.write_fd);
    close_fd(gate_pipe_.read_fd);
    close_fd(exec_error_pipe_.write_fd);

    if (auto parent_res = init_parent(); !parent_res) {
        close_fd(gate_pipe_.write_fd);
        std::ignore = kill();
        return parent_res;
    }

    // Release the child
    std::ignore = linux::write(gate_pipe_.write_fd, "1");
    close_fd(gate_pipe_.write_fd);

    // Blocks until exec succeeds (close-on-exec drops the write end) or the child reports an errno
    std::string child_err;
    while (true) {
        auto chunk = linux::read(exec_error_pipe_.read_fd, sizeof(int));
        if (!chunk) {
            if (chunk.error() == std::errc::interrupted) {
                continue;
            }
            break;
        }
        if (chunk->empty()) {
            break;
        }
        child_err += *chunk;
    }
    close_fd(exec_error_pipe_.read_fd);

    if (child_err.size() >= sizeof(int)) {
        int err = 0;
        std::memcpy(&err, child_err.data(), sizeof(int));

        auto wait_res = TRYE(linux::waitpid(child_pid_), SyscallFailure);
        run_result_ = RunResult::from_wait_status(wait_res.status);

        LOG_WARN("Failed to start {:?}: {}", exec_, get_err_msg(err));
        return Error{ErrorKind::InternalSandboxError, fmt::format("failed to start {:?}: {}", exec_, get_err_msg(err))};
    }

    // Make reading from stdout / stderr and writing to stdin non-blocking
    TRYE(linux::set_nonblocking(stdin_pipe_.write_fd), SyscallFailure);
    TRYE(linux::set_nonblocking(stdout_pipe_.read_fd), SyscallFailure);
    if (stderr_pipe_.read_fd != -1) {
        TRYE(linux::set_nonblocking(stderr_pipe_.read_fd), SyscallFailure);
    }

    LOG_DEBUG("Started {:?} {} as pid {}", exec_, args_, child_pid_);

    return {};
}

void Subprocess::run_child() noexcept {
    ::close(gate_pipe_.write_fd);

    char go = 0;
    ssize_t gate_res = 0;
    do {
        gate_res = ::read(gate_pipe_.read_fd, &go, 1);
    } while (gate_res == -1 && errno == EINTR);
    ::close(gate_pipe_.read_fd);

    int err = gate_res == 1 ? init_child() : ECANCELED;

    if (err == 0) {
        environ = envp_.data();
        ::execvp(argv_.front(), argv_.data());
        err = errno;
    }

    [[maybe_unused]] auto written = ::write(exec_error_pipe_.write_fd, &err, sizeof(err));
    ::_exit(127);
}

int Subprocess::init_child() noexcept {
    if (::setpgid(0, 0) == -1) {
        return errno;
    }

    if (::dup2(stdin_pipe_.read_fd, STDIN_FILENO) == -1 || ::dup2(stdout_pipe_.write_fd, STDOUT_FILENO) == -1) {
        return errno;
    }

    int stderr_target = options_.merge_stderr ? stdout_pipe_.write_fd : stderr_pipe_.write_fd;
    if (::dup2(stderr_target, STDERR_FILENO) == -1) {
        return errno;
    }

    // Ignored dispositions survive exec, and the engine ignores SIGPIPE
    ::signal(SIGPIPE, SIG_DFL);

    sigset_t empty_mask;
    ::sigemptyset(&empty_mask);
    ::sigprocmask(SIG_SETMASK, &empty_mask, nullptr);

    if (!options_.working_dir.empty() && ::chdir(options_.working_dir.c_str()) == -1) {
        return errno;
    }

    return 0;
}

Result<void> Subprocess::init_parent() {
    return {};
}

int Subprocess::exec_error_fd() const {
    return exec_error_pipe_.write_fd;
}

const SpawnOptions& Subprocess::get_options() const {
    return options_;
}

Result<std::string> Subprocess::read_stdout(std::size_t max_bytes) {
    return read_pipe(stdout_pipe_.read_fd, max_bytes);
}

Result<std::string> Subprocess::read_stderr(std::size_t max_bytes) {
    return read_pipe(stderr_pipe_.read_fd, max_bytes);
}

Result<std::string> Subprocess::read_pipe(int& fd, std::size_t max_bytes) {
    constexpr std::size_t CHUNK_SIZE = 64 * 1024;

    std::string res;

    while (fd != -1 && res.size() < max_bytes) {
        auto chunk = linux::read(fd, std::min(CHUNK_SIZE, max_bytes - res.size()));

        if (!chunk) {
            if (chunk.error() == std::errc::interrupted) {
                continue;
            }
            if (chunk.error() == std::errc::resource_unavailable_try_again) {
                break;
            }
            return ErrorKind::SyscallFailure;
        }

        // EOF: every writer (the child and anything it spawned) has closed the pipe
        if (chunk->empty()) {
            close_fd(fd);
            break;
        }

        res += *chunk;
    }

    return res;
}

Result<std::size_t> Subprocess::write_stdin(std::string_view str) {
    if (stdin_pipe_.write_fd == -1) {
        return Error{ErrorKind::RuntimeError, "standard input is closed"};
    }

    if (str.empty()) {
        return std::size_t{0};
    }

    auto res = linux::write(stdin_pipe_.write_fd, str);

    if (!res) {
        if (res.error() == std::errc::resource_unavailable_try_again || res.error() == std::errc::interrupted) {
            return std::size_t{0};
        }
        if (res.error() == std::errc::broken_pipe) {
            close_fd(stdin_pipe_.write_fd);
            return Error{ErrorKind::RuntimeError, "program closed its standard input"};
        }
        return ErrorKind::SyscallFailure;
    }

    return *res;
}

Result<void> Subprocess::send_stdin(std::string_view str) {
    while (!str.empty()) {
        std::size_t written = TRY(write_stdin(str));
        str.remove_prefix(written);

        if (written == 0) {
            std::vector<pollfd> fds{{.fd = stdin_pipe_.write_fd, .events = POLLOUT, .revents = 0}};
            TRYE(linux::poll(fds, 100), SyscallFailure);
        }
    }

    return {};
}

Result<void> Subprocess::close_stdin() {
    if (stdin_pipe_.write_fd != -1) {
        TRYE(linux::close(std::exchange(stdin_pipe_.write_fd, -1)), SyscallFailure);
    }

    return {};
}

Result<std::optional<RunResult>> Subprocess::poll_exit() {
    if (run_result_) {
        return run_result_;
    }

    if (child_pid_ == 0) {
        return Error{ErrorKind::InternalSandboxError, "process was never started"};
    }

    auto wait_res = TRYE(linux::waitpid(child_pid_, WNOHANG), SyscallFailure);

    if (wait_res.pid == 0) {
        return std::optional<RunResult>{};
    }

    run_result_ = RunResult::from_wait_status(wait_res.status);
    LOG_DEBUG("Child {} ({:?}) {}", child_pid_, exec_, format_as(*run_result_));

    return run_result_;
}

Result<RunResult> Subprocess::wait_for_exit(std::chrono::milliseconds timeout) {
    using namespace std::chrono_literals;
    using std::chrono::steady_clock;

    const auto deadline = steady_clock::now() + timeout;

    while (true) {
        std::optional<RunResult> res = TRY(poll_exit());

        if (res) {
            return *res;
        }

        if (steady_clock::now() >= deadline) {
            return ErrorKind::Timeout;
        }

        std::this_thread::sleep_for(5ms);
    }
}

Result<void> Subprocess::terminate(std::chrono::milliseconds grace) {
    if (child_pid_ == 0) {
        return {};
    }

    if (!run_result_) {
        std::ignore = linux::killpg(child_pid_, SIGTERM);

        if (wait_for_exit(grace)) {
            LOG_DEBUG("Child {} exited within {} of SIGTERM", child_pid_, grace);
        }
    }

    // Anything left in the group (including the leader, if it ignored SIGTERM) is killed outright
    return kill();
}

Result<void> Subprocess::kill() {
    if (child_pid_ == 0) {
        return {};
    }

    std::ignore = linux::killpg(child_pid_, SIGKILL);

    if (run_result_) {
        return {};
    }

    auto wait_res = TRYE(linux::waitpid(child_pid_), SyscallFailure);
    run_result_ = RunResult::from_wait_status(wait_res.status);

    return {};
}

bool Subprocess::is_alive() const {
    return child_pid_ != 0 && !run_result_.has_value();
}

pid_t Subprocess::get_pid() const {
    return child_pid_;
}

const std::string& Subprocess::get_exec() const {
    return exec_;
}

int Subprocess::get_stdin_fd() const {
    return stdin_pipe_.write_fd;
}

int Subprocess::get_stdout_fd() const {
    return stdout_pipe_.read_fd;
}

int Subprocess::get_stderr_fd() const {
    return stderr_pipe_.read_fd;
}

std::optional<RunResult> Subprocess::get_run_result() const {
    return run_result_;
}

Result<void> Subprocess::close_pipes() {
    for (int* fd : {&stdin_pipe_.read_fd, &stdin_pipe_.write_fd, &stdout_pipe_.read_fd, &stdout_pipe_.write_fd,
                    &stderr_pipe_.read_fd, &stderr_pipe_.write_fd, &gate_pipe_.read_fd, &gate_pipe_.write_fd,
                    &exec_error_pipe_.read_fd, &exec_error_pipe_.write_fd}) {
        close_fd(*fd);
    }

    return {};
}

} // namespace nexusexec

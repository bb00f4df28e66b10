#pragma once

#include <nexusexec/common/class_traits.hpp>
#include <nexusexec/common/error_types.hpp>
#include <nexusexec/common/linux.hpp>
#include <nexusexec/subprocess/run_result.hpp>

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <sys/types.h>

namespace nexusexec {

struct SpawnOptions
{
    /// Complete environment of the child, as "KEY=value" entries.
    /// The child never inherits the engine's environment.
    std::vector<std::string> env;

    /// Directory to change into before exec. Empty means "stay where the engine is".
    std::string working_dir;

    /// Send stderr into the stdout pipe (used for install / compile logs)
    bool merge_stderr = false;
};

/// A child process with its stdin, stdout and stderr connected to pipes owned by the engine.
///
/// The child is the leader of a new process group, so signals sent through
/// ``terminate`` and ``kill`` reach everything it spawned.
///
/// Subclasses customize the child through ``init_child``, which runs between fork and exec
/// and therefore may only use async-signal-safe calls.
class Subprocess : NonMovable
{
public:
    /// ``exec`` is looked up on the PATH of the child's environment. ``args`` excludes argv[0].
    Subprocess(std::string exec, std::vector<std::string> args, SpawnOptions options = {});
    virtual ~Subprocess();

    /// Fork and exec. Fails with InternalSandboxError if the executable could not be started.
    Result<void> start();

    /// Read whatever is currently available on stdout without blocking, up to ``max_bytes``.
    /// Returns an empty string if nothing is available. Closes the pipe on EOF.
    Result<std::string> read_stdout(std::size_t max_bytes = DEFAULT_READ_LIMIT);
    Result<std::string> read_stderr(std::size_t max_bytes = DEFAULT_READ_LIMIT);

    /// Non-blocking write to stdin. Returns the number of bytes accepted (0 if the pipe is full).
    /// Fails with RuntimeError if the child closed its end of the pipe.
    Result<std::size_t> write_stdin(std::string_view str);

    /// Blocking write of all of ``str`` to stdin
    Result<void> send_stdin(std::string_view str);

    /// Closes stdin, signalling end-of-file to the child
    Result<void> close_stdin();

    /// Reap the child if it has exited, without blocking
    Result<std::optional<RunResult>> poll_exit();

    /// Block until the child exits or ``timeout`` elapses (ErrorKind::Timeout)
    Result<RunResult> wait_for_exit(std::chrono::milliseconds timeout);

    /// SIGTERM the process group, then SIGKILL it if it is still around after ``grace``
    Result<void> terminate(std::chrono::milliseconds grace);

    /// SIGKILL the process group and reap the child
    virtual Result<void> kill();

    bool is_alive() const;

    pid_t get_pid() const;
    const std::string& get_exec() const;

    /// Descriptors are -1 once closed
    int get_stdin_fd() const;
    int get_stdout_fd() const;
    int get_stderr_fd() const;

    std::optional<RunResult> get_run_result() const;

    static constexpr std::size_t DEFAULT_READ_LIMIT = 256 * 1024;

protected:
    /// Runs in the child between fork and exec. Must be async-signal-safe.
    /// Returns 0 on success or an errno value, which is reported back to the parent.
    virtual int init_child() noexcept;

    /// Runs in the parent after fork, before the child is allowed to run ``init_child``
    virtual Result<void> init_parent();

    /// Write end of the pipe the child uses to report exec failure. Close-on-exec.
    int exec_error_fd() const;

    const SpawnOptions& get_options() const;

private:
    Result<void> create();
    [[noreturn]] void run_child() noexcept;
    Result<std::string> read_pipe(int& fd, std::size_t max_bytes);
    Result<void> close_pipes();

    std::string exec_;
    std::vector<std::string> args_;
    SpawnOptions options_;

    // argv / envp are built before fork; the child must not allocate
    std::vector<char*> argv_;
    std::vector<char*> envp_;

    pid_t child_pid_ = 0;
    std::optional<RunResult> run_result_;

    // Parent keeps stdin.write_fd, stdout.read_fd and stderr.read_fd; the other ends belong to the child
    linux::Pipe stdin_pipe_{-1, -1};
    linux::Pipe stdout_pipe_{-1, -1};
    linux::Pipe stderr_pipe_{-1, -1};

    /// Holds the child back until ``init_parent`` is done
    linux::Pipe gate_pipe_{-1, -1};

    /// Carries an errno value from the child if ``init_child`` or exec fails
    linux::Pipe exec_error_pipe_{-1, -1};
};

} // namespace nexusexec

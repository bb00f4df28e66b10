#pragma once

#include <string>

namespace nexusexec {

/// How a child process ended
class RunResult
{
public:
    enum class Kind { Exited, Killed };

    static RunResult make_exited(int code);
    static RunResult make_killed(int signal);

    /// Decode a status as reported by waitpid(2)
    static RunResult from_wait_status(int status);

    Kind get_kind() const;

    /// Exit code for Kind::Exited, signal number for Kind::Killed
    int get_code() const;

    /// Exit code the way a POSIX shell reports it (128 + signal number for killed processes)
    int get_shell_code() const;

    bool operator==(const RunResult&) const = default;

private:
    RunResult(Kind kind, int code);

    Kind kind_;
    int code_;
};

std::string format_as(const RunResult& result);

} // namespace nexusexec

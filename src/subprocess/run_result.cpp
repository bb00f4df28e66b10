#include <nexusexec/subprocess/run_result.hpp>

#include <fmt/format.h>

#include <string>

#include <string.h>
#include <sys/wait.h>

namespace nexusexec {

RunResult RunResult::make_exited(int code) {
    return {Kind::Exited, code};
}

RunResult RunResult::make_killed(int signal) {
    return {Kind::Killed, signal};
}

RunResult RunResult::from_wait_status(int status) {
    if (WIFSIGNALED(status)) {
        return make_killed(WTERMSIG(status));
    }

    return make_exited(WEXITSTATUS(status));
}

RunResult::Kind RunResult::get_kind() const {
    return kind_;
}

int RunResult::get_code() const {
    return code_;
}

int RunResult::get_shell_code() const {
    if (kind_ == Kind::Killed) {
        return 128 + code_;
    }
    return code_;
}

RunResult::RunResult(Kind kind, int code)
    : kind_{kind}
    , code_{code} {}

std::string format_as(const RunResult& result) {
    if (result.get_kind() == RunResult::Kind::Killed) {
        return fmt::format("killed by signal {} ({})", result.get_code(), ::strsignal(result.get_code()));
    }
    return fmt::format("exited with code {}", result.get_code());
}

} // namespace nexusexec

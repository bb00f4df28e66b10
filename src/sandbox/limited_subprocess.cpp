#include "sandbox/limited_subprocess.hpp"

#include <nexusexec/logging.hpp>
#include <nexusexec/sandbox/resource_limits.hpp>
#include <nexusexec/subprocess/subprocess.hpp>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cmath>
#include <filesystem>
#include <optional>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include <sys/resource.h>
#include <sys/stat.h>
#include <unistd.h>

namespace nexusexec {

namespace fs = std::filesystem;

LimitedSubprocess::LimitedSubprocess(std::string exec, std::vector<std::string> args, SpawnOptions options,
                                     const ResourceLimits& limits, std::optional<rlim_t> nproc)
    : Subprocess{std::move(exec), std::move(args), std::move(options)} {
    // Backstop only; the orchestrator enforces the wall clock
    auto cpu_seconds = static_cast<rlim_t>(std::ceil(std::chrono::duration<double>(limits.wall_timeout).count())) + 1;

    rlimits_ = {
        {RLIMIT_DATA, static_cast<rlim_t>(limits.memory_bytes)},
        {RLIMIT_FSIZE, static_cast<rlim_t>(limits.file_size_bytes)},
        {RLIMIT_NOFILE, static_cast<rlim_t>(limits.open_files)},
        {RLIMIT_CORE, 0},
        {RLIMIT_CPU, cpu_seconds},
    };

    if (nproc) {
        rlimits_.push_back({RLIMIT_NPROC, *nproc});
    }
}

int LimitedSubprocess::init_child() noexcept {
    if (int err = Subprocess::init_child(); err != 0) {
        return err;
    }

    return apply_rlimits();
}

int LimitedSubprocess::apply_rlimits() const noexcept {
    for (const auto& [resource, value] : rlimits_) {
        rlimit current{};
        if (::getrlimit(resource, &current) == -1) {
            return errno;
        }

        // Only lower; raising the hard limit needs privileges we may not have
        rlim_t target = std::min(value, current.rlim_max);
        rlimit lim{.rlim_cur = target, .rlim_max = target};

        if (::setrlimit(resource, &lim) == -1) {
            return errno;
        }
    }

    return 0;
}

rlim_t LimitedSubprocess::count_user_processes() {
    const uid_t uid = ::getuid();
    rlim_t count = 0;

    // Processes come and go while /proc is listed; every step uses the non-throwing overloads
    std::error_code err;
    for (fs::directory_iterator procs{"/proc", err}; !err && procs != fs::directory_iterator{}; procs.increment(err)) {
        const fs::path& path = procs->path();
        const auto name = path.filename().string();
        if (name.empty() || !std::all_of(name.begin(), name.end(), [](char chr) { return chr >= '0' && chr <= '9'; })) {
            continue;
        }

        struct ::stat proc_stat{};
        if (::stat(path.c_str(), &proc_stat) == -1 || proc_stat.st_uid != uid) {
            continue;
        }

        rlim_t tasks = 0;
        std::error_code task_err;
        for (fs::directory_iterator task{path / "task", task_err}; !task_err && task != fs::directory_iterator{};
             task.increment(task_err)) {
            ++tasks;
        }
        count += std::max<rlim_t>(tasks, 1);
    }

    if (err) {
        LOG_WARN("Could not list /proc: {}", err.message());
    }

    return count;
}

} // namespace nexusexec

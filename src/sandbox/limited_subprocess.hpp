#pragma once

#include <nexusexec/sandbox/resource_limits.hpp>
#include <nexusexec/subprocess/subprocess.hpp>

#include <optional>
#include <string>
#include <vector>

#include <sys/resource.h>

namespace nexusexec {

/// A Subprocess that applies setrlimit(2) ceilings in the child before exec
class LimitedSubprocess : public Subprocess
{
public:
    struct Rlimit
    {
        int resource;
        rlim_t value;
    };

    /// ``nproc`` is the RLIMIT_NPROC value to apply, if any. RLIMIT_NPROC counts every
    /// process of the real uid, so callers usually need more than ``limits.max_processes``.
    LimitedSubprocess(std::string exec, std::vector<std::string> args, SpawnOptions options,
                      const ResourceLimits& limits, std::optional<rlim_t> nproc);

    const std::vector<Rlimit>& get_rlimits() const { return rlimits_; }

    /// Number of processes (threads included) the current real uid owns right now
    static rlim_t count_user_processes();

protected:
    int init_child() noexcept override;

    /// Async-signal-safe; returns 0 or an errno value
    int apply_rlimits() const noexcept;

private:
    std::vector<Rlimit> rlimits_;
};

} // namespace nexusexec

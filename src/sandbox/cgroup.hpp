#pragma once

#include <nexusexec/common/class_traits.hpp>
#include <nexusexec/common/error_types.hpp>
#include <nexusexec/sandbox/resource_limits.hpp>

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

#include <sys/types.h>

namespace nexusexec {

/// A cgroup v2 directory created below a delegated parent. Removed on destruction.
///
/// The parent must have the memory, cpu and pids controllers available; they are enabled
/// in its ``cgroup.subtree_control`` on creation.
class Cgroup : NonCopyable
{
public:
    static Result<Cgroup> create(const std::filesystem::path& parent, std::string_view name);

    Cgroup(Cgroup&& other) noexcept;
    Cgroup& operator=(Cgroup&& rhs) noexcept;
    ~Cgroup();

    /// memory.max / memory.swap.max, pids.max and cpu.max
    Result<void> apply_limits(const ResourceLimits& limits);

    Result<void> add_process(pid_t pid);

    /// Value of the ``oom_kill`` counter in memory.events
    std::uint64_t oom_kill_count() const;

    /// Kill every process in the cgroup
    Result<void> kill_all();

    /// Kill everything and remove the directory. Idempotent.
    Result<void> remove();

    const std::filesystem::path& path() const { return path_; }

    static constexpr std::uint64_t CPU_PERIOD_USEC = 100'000;

private:
    explicit Cgroup(std::filesystem::path path);

    Result<void> write_control(std::string_view file, std::string_view value) const;

    std::filesystem::path path_;
};

} // namespace nexusexec

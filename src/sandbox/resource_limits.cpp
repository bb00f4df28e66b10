#include <nexusexec/sandbox/resource_limits.hpp>

#include <fmt/chrono.h>
#include <fmt/format.h>

#include <algorithm>
#include <string>

namespace nexusexec {

std::string format_as(const ResourceLimits& limits) {
    return fmt::format("{{timeout={}, memory={}MiB, processes={}, cpus={}, output={}KiB}}", limits.wall_timeout,
                       limits.memory_bytes / (1024 * 1024), limits.max_processes, limits.cpu_cores,
                       limits.output_bytes / 1024);
}

bool LimitOverrides::empty() const {
    return !wall_timeout && !memory_bytes && !max_processes && !cpu_cores && !output_bytes;
}

ResourceLimits LimitOverrides::apply_to(ResourceLimits base) const {
    base.wall_timeout = wall_timeout.value_or(base.wall_timeout);
    base.memory_bytes = memory_bytes.value_or(base.memory_bytes);
    base.max_processes = max_processes.value_or(base.max_processes);
    base.cpu_cores = cpu_cores.value_or(base.cpu_cores);
    base.output_bytes = output_bytes.value_or(base.output_bytes);

    return base;
}

ResourceLimits LimitOverrides::tighten(ResourceLimits base) const {
    if (wall_timeout) {
        base.wall_timeout = std::min(base.wall_timeout, *wall_timeout);
    }
    if (memory_bytes) {
        base.memory_bytes = std::min(base.memory_bytes, *memory_bytes);
    }
    if (max_processes) {
        base.max_processes = std::min(base.max_processes, *max_processes);
    }
    if (cpu_cores) {
        base.cpu_cores = std::min(base.cpu_cores, *cpu_cores);
    }
    if (output_bytes) {
        base.output_bytes = std::min(base.output_bytes, *output_bytes);
    }

    return base;
}

Expected<void, std::string> LimitOverrides::validate() const {
    if (wall_timeout && wall_timeout->count() <= 0) {
        return "timeout must be positive";
    }
    if (memory_bytes && *memory_bytes == 0) {
        return "memory limit must be positive";
    }
    if (max_processes && *max_processes == 0) {
        return "process limit must be positive";
    }
    if (cpu_cores && *cpu_cores <= 0.0) {
        return "cpu share must be positive";
    }
    if (output_bytes && *output_bytes == 0) {
        return "output limit must be positive";
    }

    return {};
}

} // namespace nexusexec

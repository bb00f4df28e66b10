#pragma once

#include <nexusexec/common/expected.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace nexusexec {

/// Effective limits for one sandboxed run
struct ResourceLimits
{
    std::chrono::milliseconds wall_timeout{10'000};
    std::uint64_t memory_bytes = 256ULL * 1024 * 1024;
    std::uint32_t max_processes = 64;
    double cpu_cores = 0.5;
    std::uint64_t output_bytes = 1024ULL * 1024;
    std::uint64_t file_size_bytes = 64ULL * 1024 * 1024;
    std::uint32_t open_files = 256;

    bool operator==(const ResourceLimits&) const = default;
};

std::string format_as(const ResourceLimits& limits);

/// Partial set of limits, as found in a policy or a request
struct LimitOverrides
{
    std::optional<std::chrono::milliseconds> wall_timeout;
    std::optional<std::uint64_t> memory_bytes;
    std::optional<std::uint32_t> max_processes;
    std::optional<double> cpu_cores;
    std::optional<std::uint64_t> output_bytes;

    bool empty() const;

    /// Returns ``base`` with every set field replaced
    ResourceLimits apply_to(ResourceLimits base) const;

    /// Returns ``base`` with every set field lowered to the override, never raised
    ResourceLimits tighten(ResourceLimits base) const;

    /// Rejects zero / negative values
    Expected<void, std::string> validate() const;
};

} // namespace nexusexec

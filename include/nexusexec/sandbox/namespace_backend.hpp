#pragma once

#include <nexusexec/common/error_types.hpp>
#include <nexusexec/execution/source_file.hpp>
#include <nexusexec/language/language_descriptor.hpp>
#include <nexusexec/sandbox/isolation_backend.hpp>
#include <nexusexec/sandbox/resource_limits.hpp>

#include <filesystem>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

namespace nexusexec {

/// Runs every step in fresh user, PID, mount, IPC, UTS and (except for dependency
/// installation) network namespaces, inside a minimal root built from read-only binds
/// of the host's system directories.
///
/// The workspace is mounted at /workspace. If a delegated cgroup v2 directory is configured,
/// memory, CPU and process limits are enforced through it; otherwise only rlimits apply.
///
/// Requires unprivileged user namespaces.
class NamespaceBackend : public IsolationBackend
{
public:
    NamespaceBackend(std::filesystem::path workspace_root, std::optional<std::filesystem::path> cgroup_root);

    Result<std::unique_ptr<Sandbox>> acquire(const std::vector<SourceFile>& files,
                                             const LanguageDescriptor& descriptor,
                                             const ResourceLimits& limits) override;

    std::string_view name() const override { return "namespace"; }

    /// Probes whether this host lets the engine create the namespaces it needs
    static bool is_supported();

private:
    std::filesystem::path workspace_root_;
    std::optional<std::filesystem::path> cgroup_root_;
};

} // namespace nexusexec

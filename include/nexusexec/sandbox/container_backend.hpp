#pragma once

#include <nexusexec/common/error_types.hpp>
#include <nexusexec/execution/source_file.hpp>
#include <nexusexec/language/language_descriptor.hpp>
#include <nexusexec/sandbox/isolation_backend.hpp>
#include <nexusexec/sandbox/resource_limits.hpp>

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace nexusexec {

/// Runs every step in a throwaway container of the language's image, through a
/// Docker-compatible command line client. The workspace is bind-mounted at /workspace.
class ContainerBackend : public IsolationBackend
{
public:
    ContainerBackend(std::filesystem::path workspace_root, std::string runtime);

    Result<std::unique_ptr<Sandbox>> acquire(const std::vector<SourceFile>& files,
                                             const LanguageDescriptor& descriptor,
                                             const ResourceLimits& limits) override;

    std::string_view name() const override { return "container"; }

    /// Runtime arguments (everything after the runtime executable) for one step
    static std::vector<std::string> make_run_args(std::string_view container_name, std::string_view image,
                                                  std::string_view host_workspace, const StepSpec& step,
                                                  const std::vector<std::pair<std::string, std::string>>& env);

private:
    std::filesystem::path workspace_root_;
    std::string runtime_;
};

} // namespace nexusexec

#pragma once

#include <nexusexec/common/error_types.hpp>
#include <nexusexec/execution/source_file.hpp>
#include <nexusexec/language/language_descriptor.hpp>
#include <nexusexec/sandbox/isolation_backend.hpp>
#include <nexusexec/sandbox/resource_limits.hpp>

#include <filesystem>
#include <memory>
#include <string_view>
#include <vector>

namespace nexusexec {

/// Runs programs as plain child processes of the engine, confined only by rlimits,
/// a private working directory and a scrubbed environment.
///
/// Works everywhere, isolates little: intended for development and tests.
class ProcessBackend : public IsolationBackend
{
public:
    explicit ProcessBackend(std::filesystem::path workspace_root);

    Result<std::unique_ptr<Sandbox>> acquire(const std::vector<SourceFile>& files,
                                             const LanguageDescriptor& descriptor,
                                             const ResourceLimits& limits) override;

    std::string_view name() const override { return "process"; }

private:
    std::filesystem::path workspace_root_;
};

} // namespace nexusexec

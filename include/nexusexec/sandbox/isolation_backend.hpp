#pragma once

#include <nexusexec/common/class_traits.hpp>
#include <nexusexec/common/error_types.hpp>
#include <nexusexec/execution/source_file.hpp>
#include <nexusexec/language/language_descriptor.hpp>
#include <nexusexec/sandbox/resource_limits.hpp>
#include <nexusexec/sandbox/workspace.hpp>
#include <nexusexec/subprocess/run_result.hpp>
#include <nexusexec/subprocess/subprocess.hpp>

#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace nexusexec {

struct EngineConfig;

enum class StepKind { Install, Compile, Run };

std::string_view format_as(StepKind kind);

/// One command to run inside a sandbox
struct StepSpec
{
    StepKind kind = StepKind::Run;

    /// Fully expanded argv; argv[0] is looked up on the sandbox PATH
    std::vector<std::string> argv;

    /// Added on top of the sandbox base environment and the descriptor environment
    std::vector<std::pair<std::string, std::string>> env;

    ResourceLimits limits;

    /// Only dependency installation gets network access
    bool network = false;

    /// Send stderr into stdout (install / compile logs)
    bool merge_stderr = false;
};

/// An isolated environment for one run: a workspace plus whatever the backend needs to
/// confine processes spawned into it. Released (processes killed, workspace removed) by
/// ``release`` or on destruction.
class Sandbox : NonMovable
{
public:
    Sandbox(Workspace workspace, LanguageDescriptor descriptor, ResourceLimits limits);
    virtual ~Sandbox() = default;

    /// Start ``step`` inside the sandbox. The returned process is already running.
    virtual Result<std::unique_ptr<Subprocess>> spawn(const StepSpec& step) = 0;

    /// Whether ``result`` of the last step came from a kernel-enforced ceiling.
    /// The base version recognizes SIGXCPU and SIGXFSZ.
    virtual bool limit_exceeded(const RunResult& result) const;

    /// Kill anything still running and remove the workspace. Idempotent.
    virtual Result<void> release();

    /// Workspace root as the sandboxed program sees it
    virtual std::string workspace_view() const;

    const Workspace& workspace() const;
    const LanguageDescriptor& descriptor() const;
    const ResourceLimits& limits() const;

protected:
    /// Base environment + ``language_environment``, as "KEY=value"
    std::vector<std::string> make_environment(const StepSpec& step) const;

    /// Descriptor environment (placeholders expanded against ``workspace_view``) + step environment
    std::vector<std::pair<std::string, std::string>> language_environment(const StepSpec& step) const;

    Workspace& mutable_workspace();

private:
    Workspace workspace_;
    LanguageDescriptor descriptor_;
    ResourceLimits limits_;
};

/// Creates sandboxes. One instance is shared by all sessions and must be thread-safe.
class IsolationBackend
{
public:
    IsolationBackend() = default;
    IsolationBackend(const IsolationBackend&) = delete;
    IsolationBackend& operator=(const IsolationBackend&) = delete;
    IsolationBackend(IsolationBackend&&) = delete;
    IsolationBackend& operator=(IsolationBackend&&) = delete;
    virtual ~IsolationBackend() = default;

    /// Create a fresh sandbox with ``files`` written into its workspace
    virtual Result<std::unique_ptr<Sandbox>> acquire(const std::vector<SourceFile>& files,
                                                     const LanguageDescriptor& descriptor,
                                                     const ResourceLimits& limits) = 0;

    virtual std::string_view name() const = 0;
};

/// Backend selected by ``config.backend``. Throws ConfigError if it cannot work on this host.
std::unique_ptr<IsolationBackend> make_isolation_backend(const EngineConfig& config);

} // namespace nexusexec

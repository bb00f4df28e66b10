#include <nexusexec/sandbox/process_backend.hpp>

#include "sandbox/limited_subprocess.hpp"

#include <nexusexec/common/error_types.hpp>
#include <nexusexec/logging.hpp>
#include <nexusexec/sandbox/isolation_backend.hpp>
#include <nexusexec/sandbox/workspace.hpp>
#include <nexusexec/subprocess/subprocess.hpp>

#include <filesystem>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace nexusexec {

namespace {

class ProcessSandbox : public Sandbox
{
public:
    using Sandbox::Sandbox;

    Result<std::unique_ptr<Subprocess>> spawn(const StepSpec& step) override {
        if (step.argv.empty()) {
            return Error{ErrorKind::InternalSandboxError, "empty command"};
        }

        SpawnOptions options{
            .env = make_environment(step),
            .working_dir = workspace().path().string(),
            .merge_stderr = step.merge_stderr,
        };

        // Every process of the engine's uid counts against RLIMIT_NPROC, so the ceiling is
        // whatever already runs plus the step's own allowance
        const rlim_t nproc = LimitedSubprocess::count_user_processes() + step.limits.max_processes;

        std::vector<std::string> args(step.argv.begin() + 1, step.argv.end());
        auto proc =
            std::make_unique<LimitedSubprocess>(step.argv.front(), std::move(args), std::move(options), step.limits, nproc);

        TRY(proc->start());

        LOG_DEBUG("{} step of {} running as pid {} in {}", format_as(step.kind), descriptor().id, proc->get_pid(),
                  workspace().path().string());

        return std::unique_ptr<Subprocess>{std::move(proc)};
    }
};

} // namespace

ProcessBackend::ProcessBackend(std::filesystem::path workspace_root)
    : workspace_root_{std::move(workspace_root)} {}

Result<std::unique_ptr<Sandbox>> ProcessBackend::acquire(const std::vector<SourceFile>& files,
                                                         const LanguageDescriptor& descriptor,
                                                         const ResourceLimits& limits) {
    Workspace workspace = TRY(Workspace::create(workspace_root_));
    TRY(workspace.write_files(files));

    return std::unique_ptr<Sandbox>{std::make_unique<ProcessSandbox>(std::move(workspace), descriptor, limits)};
}

} // namespace nexusexec

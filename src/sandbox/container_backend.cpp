#include <nexusexec/sandbox/container_backend.hpp>

#include <nexusexec/common/error_types.hpp>
#include <nexusexec/logging.hpp>
#include <nexusexec/sandbox/isolation_backend.hpp>
#include <nexusexec/sandbox/workspace.hpp>
#include <nexusexec/subprocess/run_result.hpp>
#include <nexusexec/subprocess/subprocess.hpp>

#include <fmt/format.h>

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <unistd.h>

extern char** environ; // NOLINT

namespace nexusexec {

namespace {

constexpr std::string_view CONTAINER_WORKSPACE = "/workspace";

/// Exit status the runtime reports when the container's main process was SIGKILLed
/// from inside the container (the kernel OOM killer, in practice)
constexpr int CONTAINER_SIGKILL_EXIT = 137;

/// The runtime client runs with the engine's own environment (DOCKER_HOST etc.)
std::vector<std::string> engine_environment() {
    std::vector<std::string> env;
    for (char** entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
        env.emplace_back(*entry);
    }
    return env;
}

/// The runtime client, attached to a container. Killing the client alone would leave the
/// container running, so ``kill`` removes the container first.
class ContainerSubprocess : public Subprocess
{
public:
    ContainerSubprocess(std::string runtime, std::vector<std::string> args, std::string container_name)
        : Subprocess{runtime, std::move(args), SpawnOptions{.env = engine_environment()}}
        , runtime_{std::move(runtime)}
        , container_name_{std::move(container_name)} {}

    ~ContainerSubprocess() override {
        if (is_alive()) {
            if (auto res = ContainerSubprocess::kill(); !res) {
                LOG_WARN("Failed to stop container {}: {}", container_name_, format_as(res.error()));
            }
        }
    }

    Result<void> kill() override {
        using namespace std::chrono_literals;

        if (is_alive()) {
            Subprocess remove{runtime_, {"rm", "-f", container_name_}, SpawnOptions{.env = engine_environment()}};

            if (auto res = remove.start(); !res) {
                LOG_ERROR("Could not run {} rm: {}", runtime_, format_as(res.error()));
            } else if (auto waited = remove.wait_for_exit(10s); !waited) {
                LOG_ERROR("{} rm -f {} did not finish: {}", runtime_, container_name_, format_as(waited.error()));
            }
        }

        return Subprocess::kill();
    }

private:
    std::string runtime_;
    std::string container_name_;
};

class ContainerSandbox : public Sandbox
{
public:
    ContainerSandbox(Workspace workspace, LanguageDescriptor descriptor, ResourceLimits limits, std::string runtime)
        : Sandbox{std::move(workspace), std::move(descriptor), limits}
        , runtime_{std::move(runtime)} {}

    Result<std::unique_ptr<Subprocess>> spawn(const StepSpec& step) override {
        if (step.argv.empty()) {
            return Error{ErrorKind::InternalSandboxError, "empty command"};
        }

        auto name = fmt::format("nexusexec-{}-{}", workspace().id(), ++step_counter_);

        auto env = language_environment(step);
        env.emplace(env.begin(), "HOME", std::string{CONTAINER_WORKSPACE});

        auto args = ContainerBackend::make_run_args(name, descriptor().image, workspace().path().string(), step, env);
        auto proc = std::make_unique<ContainerSubprocess>(runtime_, std::move(args), name);

        TRY(proc->start());

        LOG_DEBUG("{} step of {} running in container {}", format_as(step.kind), descriptor().id, name);

        return std::unique_ptr<Subprocess>{std::move(proc)};
    }

    bool limit_exceeded(const RunResult& result) const override {
        return Sandbox::limit_exceeded(result) ||
               (result.get_kind() == RunResult::Kind::Exited && result.get_code() == CONTAINER_SIGKILL_EXIT);
    }

    std::string workspace_view() const override { return std::string{CONTAINER_WORKSPACE}; }

private:
    std::string runtime_;
    int step_counter_ = 0;
};

} // namespace

ContainerBackend::ContainerBackend(std::filesystem::path workspace_root, std::string runtime)
    : workspace_root_{std::move(workspace_root)}
    , runtime_{std::move(runtime)} {}

std::vector<std::string> ContainerBackend::make_run_args(std::string_view container_name, std::string_view image,
                                                         std::string_view host_workspace, const StepSpec& step,
                                                         const std::vector<std::pair<std::string, std::string>>& env) {
    const auto& limits = step.limits;

    std::vector<std::string> args{
        "run",
        "--rm",
        "--interactive",
        "--name",
        std::string{container_name},
        "--network",
        step.network ? "bridge" : "none",
        "--memory",
        std::to_string(limits.memory_bytes),
        "--memory-swap",
        std::to_string(limits.memory_bytes),
        "--pids-limit",
        std::to_string(limits.max_processes),
        "--cpus",
        fmt::format("{:.2f}", limits.cpu_cores),
        "--ulimit",
        fmt::format("nofile={0}:{0}", limits.open_files),
        "--user",
        fmt::format("{}:{}", ::getuid(), ::getgid()),
        "--read-only",
        "--tmpfs",
        "/tmp:rw,nosuid,size=64m",
        "--volume",
        fmt::format("{}:{}", host_workspace, CONTAINER_WORKSPACE),
        "--workdir",
        std::string{CONTAINER_WORKSPACE},
    };

    for (const auto& [key, value] : env) {
        args.emplace_back("--env");
        args.push_back(fmt::format("{}={}", key, value));
    }

    args.emplace_back(image);
    args.insert(args.end(), step.argv.begin(), step.argv.end());

    return args;
}

Result<std::unique_ptr<Sandbox>> ContainerBackend::acquire(const std::vector<SourceFile>& files,
                                                           const LanguageDescriptor& descriptor,
                                                           const ResourceLimits& limits) {
    if (descriptor.image.empty()) {
        LOG_ERROR("Language {} has no container image configured", descriptor.id);
        return Error{ErrorKind::InternalSandboxError, "internal sandbox error"};
    }

    Workspace workspace = TRY(Workspace::create(workspace_root_));
    TRY(workspace.write_files(files));

    return std::unique_ptr<Sandbox>{
        std::make_unique<ContainerSandbox>(std::move(workspace), descriptor, limits, runtime_)};
}

} // namespace nexusexec

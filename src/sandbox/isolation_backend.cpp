#include <nexusexec/sandbox/isolation_backend.hpp>

#include <nexusexec/config/engine_config.hpp>
#include <nexusexec/exceptions.hpp>
#include <nexusexec/language/language_descriptor.hpp>
#include <nexusexec/logging.hpp>
#include <nexusexec/sandbox/container_backend.hpp>
#include <nexusexec/sandbox/namespace_backend.hpp>
#include <nexusexec/sandbox/process_backend.hpp>
#include <nexusexec/subprocess/run_result.hpp>

#include <fmt/format.h>

#include <csignal>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace nexusexec {

std::string_view format_as(StepKind kind) {
    switch (kind) {
    case StepKind::Install:
        return "install";
    case StepKind::Compile:
        return "compile";
    case StepKind::Run:
        return "run";
    }
    return "<unknown step>";
}

Sandbox::Sandbox(Workspace workspace, LanguageDescriptor descriptor, ResourceLimits limits)
    : workspace_{std::move(workspace)}
    , descriptor_{std::move(descriptor)}
    , limits_{limits} {}

bool Sandbox::limit_exceeded(const RunResult& result) const {
    return result.get_kind() == RunResult::Kind::Killed &&
           (result.get_code() == SIGXCPU || result.get_code() == SIGXFSZ);
}

Result<void> Sandbox::release() {
    return workspace_.remove();
}

std::string Sandbox::workspace_view() const {
    return workspace_.path().string();
}

const Workspace& Sandbox::workspace() const {
    return workspace_;
}

const LanguageDescriptor& Sandbox::descriptor() const {
    return descriptor_;
}

const ResourceLimits& Sandbox::limits() const {
    return limits_;
}

Workspace& Sandbox::mutable_workspace() {
    return workspace_;
}

std::vector<std::pair<std::string, std::string>> Sandbox::language_environment(const StepSpec& step) const {
    const CommandContext ctx{.main_file = {}, .sources = {}, .workspace = workspace_view()};

    std::vector<std::pair<std::string, std::string>> env;

    for (const auto& [key, value] : descriptor_.environment) {
        env.emplace_back(key, expand_placeholders(value, ctx));
    }
    env.insert(env.end(), step.env.begin(), step.env.end());

    return env;
}

std::vector<std::string> Sandbox::make_environment(const StepSpec& step) const {
    std::vector<std::string> env{
        "PATH=/usr/local/sbin:/usr/local/bin:/usr/sbin:/usr/bin:/sbin:/bin",
        fmt::format("HOME={}", workspace_view()),
        "LANG=C.UTF-8",
        "TMPDIR=/tmp",
    };

    for (const auto& [key, value] : language_environment(step)) {
        env.push_back(fmt::format("{}={}", key, value));
    }

    return env;
}

std::unique_ptr<IsolationBackend> make_isolation_backend(const EngineConfig& config) {
    LOG_INFO("Using the {} isolation backend", format_as(config.backend));

    switch (config.backend) {
    case BackendKind::Process:
        LOG_WARN("The process backend does not isolate programs from the host; use it for development only");
        return std::make_unique<ProcessBackend>(config.workspace_root);

    case BackendKind::Namespace:
        if (!NamespaceBackend::is_supported()) {
            throw ConfigError("the namespace backend needs unprivileged user namespaces, which this host does not allow");
        }
        return std::make_unique<NamespaceBackend>(config.workspace_root, config.cgroup_root);

    case BackendKind::Container:
        return std::make_unique<ContainerBackend>(config.workspace_root, config.container_runtime);
    }

    throw ConfigError(fmt::format("unknown backend {}", static_cast<int>(config.backend)));
}

} // namespace nexusexec

#include <nexusexec/config/engine_config.hpp>

#include <nexusexec/exceptions.hpp>
#include <nexusexec/language/language_descriptor.hpp>
#include <nexusexec/logging.hpp>
#include <nexusexec/sandbox/resource_limits.hpp>

#include <fmt/format.h>
#include <fmt/std.h>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace nexusexec {

using nlohmann::json;

std::string_view format_as(BackendKind kind) {
    switch (kind) {
    case BackendKind::Process:
        return "process";
    case BackendKind::Namespace:
        return "namespace";
    case BackendKind::Container:
        return "container";
    }
    return "<unknown backend>";
}

std::optional<BackendKind> parse_backend_kind(std::string_view str) {
    for (auto kind : {BackendKind::Process, BackendKind::Namespace, BackendKind::Container}) {
        if (format_as(kind) == str) {
            return kind;
        }
    }
    return std::nullopt;
}

namespace {

constexpr std::uint64_t MiB = 1024ULL * 1024;

void warn_unknown_keys(const json& obj, std::string_view where, std::initializer_list<std::string_view> known) {
    for (const auto& [key, value] : obj.items()) {
        if (std::find(known.begin(), known.end(), key) == known.end()) {
            LOG_WARN("Ignoring unknown configuration key {:?} in {}", key, where);
        }
    }
}

std::chrono::milliseconds get_ms(const json& obj, const std::string& key, std::chrono::milliseconds fallback) {
    if (!obj.contains(key)) {
        return fallback;
    }
    return std::chrono::milliseconds{obj.at(key).get<std::int64_t>()};
}

LimitOverrides parse_limits(const json& obj, std::string_view where) {
    if (!obj.is_object()) {
        throw ConfigError(fmt::format("{} must be an object", where));
    }

    warn_unknown_keys(obj, where, {"timeout_ms", "memory_mb", "max_processes", "cpu_cores", "output_kb"});

    LimitOverrides res;

    if (obj.contains("timeout_ms")) {
        res.wall_timeout = std::chrono::milliseconds{obj.at("timeout_ms").get<std::int64_t>()};
    }
    if (obj.contains("memory_mb")) {
        res.memory_bytes = obj.at("memory_mb").get<std::uint64_t>() * MiB;
    }
    if (obj.contains("max_processes")) {
        res.max_processes = obj.at("max_processes").get<std::uint32_t>();
    }
    if (obj.contains("cpu_cores")) {
        res.cpu_cores = obj.at("cpu_cores").get<double>();
    }
    if (obj.contains("output_kb")) {
        res.output_bytes = obj.at("output_kb").get<std::uint64_t>() * 1024;
    }

    if (auto valid = res.validate(); !valid) {
        throw ConfigError(fmt::format("{}: {}", where, valid.error()));
    }

    return res;
}

std::vector<std::string> get_argv(const json& obj, const std::string& key) {
    auto argv = obj.at(key).get<std::vector<std::string>>();
    if (argv.empty()) {
        throw ConfigError(fmt::format("{} must not be empty", key));
    }
    return argv;
}

LanguageDescriptor parse_language(const json& obj) {
    if (!obj.is_object()) {
        throw ConfigError("each entry of \"languages\" must be an object");
    }

    warn_unknown_keys(obj, "language",
                      {"id", "aliases", "image", "entry_file", "source_extension", "compile_command", "run_command",
                       "manifest", "install_command", "environment", "limits"});

    for (const auto* required : {"id", "entry_file", "source_extension", "run_command"}) {
        if (!obj.contains(required)) {
            throw ConfigError(fmt::format("language entry is missing {:?}", required));
        }
    }

    LanguageDescriptor descriptor{
        .id = obj.at("id").get<std::string>(),
        .aliases = obj.value("aliases", std::vector<std::string>{}),
        .image = obj.value("image", std::string{}),
        .entry_file = obj.at("entry_file").get<std::string>(),
        .source_extension = obj.at("source_extension").get<std::string>(),
        .compile_command = std::nullopt,
        .run_command = get_argv(obj, "run_command"),
        .manifest = ManifestFormat::None,
        .install_command = obj.value("install_command", std::vector<std::string>{}),
        .environment = {},
        .default_limits = {},
    };

    if (obj.contains("compile_command")) {
        descriptor.compile_command = get_argv(obj, "compile_command");
    }

    if (obj.contains("manifest")) {
        auto name = obj.at("manifest").get<std::string>();
        auto format = parse_manifest_format(name);
        if (!format) {
            throw ConfigError(fmt::format("language {:?}: unknown manifest format {:?}", descriptor.id, name));
        }
        descriptor.manifest = *format;
    }

    if (descriptor.manifest != ManifestFormat::None && descriptor.install_command.empty()) {
        throw ConfigError(fmt::format("language {:?} declares a manifest but no install_command", descriptor.id));
    }

    if (obj.contains("environment")) {
        for (const auto& [key, value] : obj.at("environment").items()) {
            descriptor.environment.emplace_back(key, value.get<std::string>());
        }
    }

    if (obj.contains("limits")) {
        descriptor.default_limits = parse_limits(obj.at("limits"), fmt::format("limits of {:?}", descriptor.id))
                                        .apply_to(descriptor.default_limits);
    }

    return descriptor;
}

void apply_json(EngineConfig& config, const json& doc) {
    if (!doc.is_object()) {
        throw ConfigError("configuration must be a JSON object");
    }

    warn_unknown_keys(doc, "configuration",
                      {"backend", "workspace_root", "timeouts_ms", "install_memory_mb", "event_channel_kb",
                       "cgroup_root", "container_runtime", "default_policy", "policies", "languages"});

    if (doc.contains("backend")) {
        auto name = doc.at("backend").get<std::string>();
        auto kind = parse_backend_kind(name);
        if (!kind) {
            throw ConfigError(fmt::format("unknown backend {:?} (expected process, namespace or container)", name));
        }
        config.backend = *kind;
    }

    if (doc.contains("workspace_root")) {
        config.workspace_root = doc.at("workspace_root").get<std::string>();
    }

    if (doc.contains("timeouts_ms")) {
        const auto& timeouts = doc.at("timeouts_ms");
        warn_unknown_keys(timeouts, "timeouts_ms", {"install", "compile", "grading", "kill_grace", "idle"});

        config.install_timeout = get_ms(timeouts, "install", config.install_timeout);
        config.compile_timeout = get_ms(timeouts, "compile", config.compile_timeout);
        config.grading_timeout = get_ms(timeouts, "grading", config.grading_timeout);
        config.kill_grace = get_ms(timeouts, "kill_grace", config.kill_grace);
        config.idle_grace = get_ms(timeouts, "idle", config.idle_grace);
    }

    if (doc.contains("install_memory_mb")) {
        config.install_memory_bytes = doc.at("install_memory_mb").get<std::uint64_t>() * MiB;
    }

    if (doc.contains("event_channel_kb")) {
        config.event_channel_bytes = doc.at("event_channel_kb").get<std::size_t>() * 1024;
    }

    if (doc.contains("cgroup_root")) {
        config.cgroup_root = doc.at("cgroup_root").get<std::string>();
    }

    if (doc.contains("container_runtime")) {
        config.container_runtime = doc.at("container_runtime").get<std::string>();
    }

    if (doc.contains("default_policy")) {
        config.default_policy = doc.at("default_policy").get<std::string>();
    }

    if (doc.contains("policies")) {
        for (const auto& [name, limits] : doc.at("policies").items()) {
            config.policies[name] = parse_limits(limits, fmt::format("policy {:?}", name));
        }
    }

    if (doc.contains("languages")) {
        for (const auto& entry : doc.at("languages")) {
            config.languages.push_back(parse_language(entry));
        }
    }
}

} // namespace

EngineConfig EngineConfig::defaults() {
    using namespace std::chrono_literals;

    EngineConfig config;

    LimitOverrides playground;
    playground.wall_timeout = 10s;
    playground.memory_bytes = 128 * MiB;
    playground.max_processes = 32;
    playground.cpu_cores = 0.5;
    playground.output_bytes = 256 * 1024;

    config.policies.emplace("playground", playground);
    config.policies.emplace("authenticated", LimitOverrides{});

    return config;
}

EngineConfig EngineConfig::parse(std::string_view json_text) {
    EngineConfig config = defaults();

    try {
        apply_json(config, json::parse(json_text));
    } catch (const json::exception& ex) {
        throw ConfigError(fmt::format("invalid configuration: {}", ex.what()));
    }

    if (auto valid = config.validate(); !valid) {
        throw ConfigError(fmt::format("invalid configuration: {}", valid.error()));
    }

    return config;
}

EngineConfig EngineConfig::load(const std::filesystem::path& path) {
    std::ifstream file{path};

    if (!file) {
        throw ConfigError(fmt::format("could not open configuration file {}", path));
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    LOG_INFO("Loading configuration from {}", path);

    return parse(buffer.str());
}

Expected<void, std::string> EngineConfig::validate() const {
    using namespace std::chrono_literals;

    if (workspace_root.empty() || !workspace_root.is_absolute()) {
        return "workspace_root must be an absolute path";
    }

    for (auto [name, timeout] : {std::pair{"install", install_timeout}, std::pair{"compile", compile_timeout},
                                 std::pair{"grading", grading_timeout}, std::pair{"idle", idle_grace}}) {
        if (timeout <= 0ms) {
            return fmt::format("{} timeout must be positive", name);
        }
    }

    // A silent toolchain step must not look idle before its own timeout runs out
    for (auto [name, timeout] : {std::pair{"install", install_timeout}, std::pair{"compile", compile_timeout},
                                 std::pair{"grading", grading_timeout}}) {
        if (idle_grace <= timeout) {
            return fmt::format("idle timeout must be longer than the {} timeout", name);
        }
    }

    if (kill_grace < 0ms) {
        return "kill_grace must not be negative";
    }

    if (event_channel_bytes == 0) {
        return "event channel size must be positive";
    }

    if (!policies.contains(default_policy)) {
        return fmt::format("default policy {:?} is not defined", default_policy);
    }

    if (backend == BackendKind::Container && container_runtime.empty()) {
        return "container backend needs a container_runtime";
    }

    for (const auto& language : languages) {
        if (language.id.empty() || language.run_command.empty()) {
            return "every language needs an id and a run_command";
        }
        if (language.entry_file.empty() || language.source_extension.empty()) {
            return fmt::format("language {:?} needs an entry_file and a source_extension", language.id);
        }
    }

    return {};
}

Expected<ResourceLimits, std::string> EngineConfig::limits_for(const LanguageDescriptor& descriptor,
                                                               std::string_view policy,
                                                               const LimitOverrides& request) const {
    std::string_view policy_name = policy.empty() ? std::string_view{default_policy} : policy;

    auto iter = policies.find(policy_name);
    if (iter == policies.end()) {
        return fmt::format("unknown policy {:?}", policy_name);
    }

    return request.tighten(iter->second.apply_to(descriptor.default_limits));
}

} // namespace nexusexec

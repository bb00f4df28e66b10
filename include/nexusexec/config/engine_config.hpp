#pragma once

#include <nexusexec/common/expected.hpp>
#include <nexusexec/language/language_descriptor.hpp>
#include <nexusexec/sandbox/resource_limits.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace nexusexec {

enum class BackendKind { Process, Namespace, Container };

std::string_view format_as(BackendKind kind);
std::optional<BackendKind> parse_backend_kind(std::string_view str);

/// Engine-wide settings. Built-in defaults, optionally overridden by a JSON file.
///
/// Example file:
/// \code{.json}
/// {
///   "backend": "namespace",
///   "workspace_root": "/var/lib/nexusexec",
///   "timeouts_ms": {"install": 120000, "compile": 30000, "grading": 15000, "kill_grace": 500, "idle": 300000},
///   "cgroup_root": "/sys/fs/cgroup/nexusexec",
///   "default_policy": "authenticated",
///   "policies": {"playground": {"timeout_ms": 5000, "memory_mb": 128}},
///   "languages": [{"id": "ruby", "entry_file": "main.rb", "source_extension": ".rb",
///                  "run_command": ["ruby", "{main}"]}]
/// }
/// \endcode
struct EngineConfig
{
    BackendKind backend = BackendKind::Process;

    std::filesystem::path workspace_root = std::filesystem::temp_directory_path() / "nexusexec";

    std::chrono::milliseconds install_timeout{120'000};
    std::chrono::milliseconds compile_timeout{30'000};
    std::chrono::milliseconds grading_timeout{15'000};
    std::chrono::milliseconds kill_grace{500};
    std::chrono::milliseconds idle_grace{300'000};

    /// Memory ceiling for dependency installation; package managers need more than programs
    std::uint64_t install_memory_bytes = 1024ULL * 1024 * 1024;

    /// Bytes of undelivered output a stream may buffer before the producer blocks
    std::size_t event_channel_bytes = 256 * 1024;

    /// Delegated cgroup v2 directory for the namespace backend; unset disables cgroups
    std::optional<std::filesystem::path> cgroup_root;

    /// Docker-compatible CLI used by the container backend
    std::string container_runtime = "docker";

    std::map<std::string, LimitOverrides, std::less<>> policies;
    std::string default_policy = "authenticated";

    /// Extra languages, or replacements for built-in ones with the same id
    std::vector<LanguageDescriptor> languages;

    /// Defaults, including the "playground" and "authenticated" policies
    static EngineConfig defaults();

    /// Defaults overridden by the JSON document ``json_text``. Throws ConfigError.
    static EngineConfig parse(std::string_view json_text);

    /// Defaults overridden by the JSON file at ``path``. Throws ConfigError.
    static EngineConfig load(const std::filesystem::path& path);

    Expected<void, std::string> validate() const;

    /// Descriptor defaults, then the policy (empty name: ``default_policy``), then the request,
    /// which may only tighten. Fails if the policy does not exist.
    Expected<ResourceLimits, std::string> limits_for(const LanguageDescriptor& descriptor, std::string_view policy,
                                                     const LimitOverrides& request) const;
};

} // namespace nexusexec

#include "catch2_custom.hpp"

#include "test_helpers.hpp"

#include <nexusexec/config/engine_config.hpp>
#include <nexusexec/exceptions.hpp>
#include <nexusexec/language/language_registry.hpp>
#include <nexusexec/sandbox/resource_limits.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>

using namespace std::chrono_literals;
using nexusexec::BackendKind;
using nexusexec::ConfigError;
using nexusexec::EngineConfig;
using nexusexec::LanguageRegistry;
using nexusexec::LimitOverrides;
using nexusexec::ResourceLimits;

namespace {

constexpr std::uint64_t MiB = 1024ULL * 1024;

} // namespace

TEST_CASE("Defaults are valid") {
    EngineConfig config = EngineConfig::defaults();

    REQUIRE(config.validate());
    REQUIRE(config.backend == BackendKind::Process);
    REQUIRE(config.policies.contains("playground"));
    REQUIRE(config.policies.contains("authenticated"));
    REQUIRE(config.default_policy == "authenticated");
}

TEST_CASE("JSON overrides the defaults") {
    EngineConfig config = EngineConfig::parse(R"({
        "backend": "container",
        "workspace_root": "/var/tmp/nexusexec",
        "timeouts_ms": {"compile": 1000, "idle": 250000},
        "install_memory_mb": 512,
        "container_runtime": "podman",
        "default_policy": "playground",
        "policies": {"classroom": {"timeout_ms": 3000, "memory_mb": 64, "output_kb": 16}}
    })");

    REQUIRE(config.backend == BackendKind::Container);
    REQUIRE(config.workspace_root == "/var/tmp/nexusexec");
    REQUIRE(config.compile_timeout == 1000ms);
    REQUIRE(config.idle_grace == 250000ms);
    REQUIRE(config.install_timeout == EngineConfig::defaults().install_timeout);
    REQUIRE(config.install_memory_bytes == 512 * MiB);
    REQUIRE(config.container_runtime == "podman");
    REQUIRE(config.default_policy == "playground");

    const LimitOverrides& classroom = config.policies.at("classroom");
    REQUIRE(classroom.wall_timeout == 3000ms);
    REQUIRE(classroom.memory_bytes == 64 * MiB);
    REQUIRE(classroom.output_bytes == 16 * 1024);
    REQUIRE_FALSE(classroom.max_processes);
}

TEST_CASE("Invalid configurations are rejected") {
    REQUIRE_THROWS_AS(EngineConfig::parse("not json"), ConfigError);
    REQUIRE_THROWS_AS(EngineConfig::parse("[]"), ConfigError);
    REQUIRE_THROWS_AS(EngineConfig::parse(R"({"backend": "vm"})"), ConfigError);
    REQUIRE_THROWS_AS(EngineConfig::parse(R"({"workspace_root": "relative/dir"})"), ConfigError);
    REQUIRE_THROWS_AS(EngineConfig::parse(R"({"timeouts_ms": {"grading": 0}})"), ConfigError);
    REQUIRE_THROWS_AS(EngineConfig::parse(R"({"timeouts_ms": {"idle": 60000}})"), ConfigError);
    REQUIRE_THROWS_AS(EngineConfig::parse(R"({"timeouts_ms": {"install": 5000, "compile": 5000, "grading": 5000, "idle": 5000}})"),
                      ConfigError);
    REQUIRE_THROWS_AS(EngineConfig::parse(R"({"default_policy": "nonexistent"})"), ConfigError);
    REQUIRE_THROWS_AS(EngineConfig::parse(R"({"policies": {"bad": {"memory_mb": 0}}})"), ConfigError);
    REQUIRE_THROWS_AS(EngineConfig::parse(R"({"languages": [{"id": "ruby"}]})"), ConfigError);
    REQUIRE_THROWS_AS(EngineConfig::parse(R"({"languages": [{"id": "ruby", "entry_file": "main.rb",
        "source_extension": ".rb", "run_command": ["ruby", "{main}"], "manifest": "Gemfile",
        "install_command": ["bundle"]}]})"),
                      ConfigError);

    // Manifest without a way to install it
    REQUIRE_THROWS_AS(EngineConfig::parse(R"({"languages": [{"id": "ruby", "entry_file": "main.rb",
        "source_extension": ".rb", "run_command": ["ruby", "{main}"], "manifest": "requirements.txt"}]})"),
                      ConfigError);
}

TEST_CASE("Unknown keys are ignored") {
    EngineConfig config = EngineConfig::parse(R"({"color": "blue", "timeouts_ms": {"forever": 1}})");
    REQUIRE(config.validate());
}

TEST_CASE("Languages from the configuration reach the registry") {
    EngineConfig config = nexusexec::test::make_test_config();
    LanguageRegistry registry{config.languages};

    auto shell = registry.resolve("sh");
    REQUIRE(shell);
    REQUIRE(shell->get().id == "shell");
    REQUIRE(shell->get().default_limits.wall_timeout == 5000ms);
    REQUIRE(shell->get().default_limits.output_bytes == 1024 * 1024);

    REQUIRE(registry.resolve("checked-shell")->get().is_compiled());
    REQUIRE(registry.resolve("shell-deps")->get().manifest == nexusexec::ManifestFormat::Requirements);
}

TEST_CASE("Limits are layered and requests only tighten") {
    EngineConfig config = EngineConfig::defaults();
    LanguageRegistry registry;
    const auto& python = registry.resolve("python")->get();

    auto authenticated = config.limits_for(python, "", {});
    REQUIRE(authenticated);
    REQUIRE(*authenticated == python.default_limits);

    auto playground = config.limits_for(python, "playground", {});
    REQUIRE(playground);
    REQUIRE(playground->memory_bytes == 128 * MiB);
    REQUIRE(playground->output_bytes == 256 * 1024);
    REQUIRE(playground->max_processes == 32);

    LimitOverrides request;
    request.wall_timeout = 1s;
    request.memory_bytes = 4096 * MiB;

    auto tightened = config.limits_for(python, "playground", request);
    REQUIRE(tightened);
    REQUIRE(tightened->wall_timeout == 1s);
    REQUIRE(tightened->memory_bytes == 128 * MiB);

    auto unknown = config.limits_for(python, "enterprise", {});
    REQUIRE(unknown.has_error());
    REQUIRE_THAT(unknown.error(), Catch::Matchers::ContainsSubstring("enterprise"));
}

TEST_CASE("Limit overrides validate their values") {
    LimitOverrides overrides;
    REQUIRE(overrides.empty());
    REQUIRE(overrides.validate());

    overrides.cpu_cores = 0.0;
    REQUIRE_FALSE(overrides.empty());
    REQUIRE(overrides.validate().has_error());

    overrides.cpu_cores = 2.0;
    overrides.wall_timeout = -5ms;
    REQUIRE(overrides.validate().has_error());

    overrides.wall_timeout = 5ms;
    ResourceLimits applied = overrides.apply_to(ResourceLimits{});
    REQUIRE(applied.cpu_cores == 2.0);
    REQUIRE(applied.wall_timeout == 5ms);
}

TEST_CASE("Configuration files are loaded from disk") {
    const auto path = std::filesystem::temp_directory_path() / "nexusexec-config-test.json";
    {
        std::ofstream out{path};
        out << R"({"timeouts_ms": {"kill_grace": 50}})";
    }

    REQUIRE(EngineConfig::load(path).kill_grace == 50ms);
    std::filesystem::remove(path);

    REQUIRE_THROWS_AS(EngineConfig::load("/nonexistent/nexusexec.json"), ConfigError);
}

#include "catch2_custom.hpp"

#include "test_helpers.hpp"

#include <nexusexec/config/engine_config.hpp>
#include <nexusexec/execution/execution_types.hpp>
#include <nexusexec/execution/orchestrator.hpp>
#include <nexusexec/language/language_registry.hpp>
#include <nexusexec/sandbox/namespace_backend.hpp>
#include <nexusexec/session/session_registry.hpp>

#include <fmt/format.h>

#include <chrono>
#include <optional>
#include <string>

using namespace std::chrono_literals;
using nexusexec::ExecutionStatus;
using nexusexec::NamespaceBackend;
using nexusexec::test::shell_request;

namespace {

struct Engine
{
    nexusexec::EngineConfig config = nexusexec::test::make_test_config();
    nexusexec::LanguageRegistry languages{config.languages};
    NamespaceBackend backend{config.workspace_root, std::nullopt};
    nexusexec::SessionRegistry sessions{config.idle_grace, config.event_channel_bytes, false};
    nexusexec::Orchestrator orchestrator{config, languages, backend, sessions};
};

} // namespace

TEST_CASE("Programs run confined to their own namespaces") {
    if (!NamespaceBackend::is_supported()) {
        WARN("Unprivileged user namespaces are unavailable; skipping");
        return;
    }

    Engine engine;

    auto result = engine.orchestrator.run(shell_request(
        "ns", fmt::format("pwd\n"
                          "test -e {0} && echo host-visible || echo host-hidden\n"
                          "touch /usr/nexusexec-probe 2>/dev/null && echo writable || echo read-only\n"
                          "echo data > out.txt && cat out.txt\n",
                          engine.config.workspace_root.string())));

    REQUIRE(result);
    REQUIRE(result->status == ExecutionStatus::Ok);
    REQUIRE(result->stdout_text == "/workspace\nhost-hidden\nread-only\ndata\n");
}

TEST_CASE("Namespace runs enforce the wall timeout") {
    if (!NamespaceBackend::is_supported()) {
        WARN("Unprivileged user namespaces are unavailable; skipping");
        return;
    }

    Engine engine;

    auto request = shell_request("ns-timeout", "sleep 10\n");
    request.limits.wall_timeout = 300ms;

    auto result = engine.orchestrator.run(request);
    REQUIRE(result);
    REQUIRE(result->status == ExecutionStatus::Timeout);
}

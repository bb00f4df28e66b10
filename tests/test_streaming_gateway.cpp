#include "catch2_custom.hpp"

#include "test_helpers.hpp"

#include <nexusexec/common/error_types.hpp>
#include <nexusexec/exceptions.hpp>
#include <nexusexec/execution/execution_types.hpp>
#include <nexusexec/gateway/streaming_gateway.hpp>
#include <nexusexec/sandbox/isolation_backend.hpp>
#include <nexusexec/sandbox/process_backend.hpp>

#include <fmt/format.h>

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include <thread>
#include <utility>
#include <vector>

using namespace std::chrono_literals;
using Catch::Matchers::ContainsSubstring;
using Catch::Matchers::VectorContains;
using nexusexec::EngineError;
using nexusexec::ErrorKind;
using nexusexec::EventStream;
using nexusexec::ExecutionGateway;
using nexusexec::ExecutionRequest;
using nexusexec::ExecutionStatus;
using nexusexec::test::collect_events;
using nexusexec::test::make_test_config;
using nexusexec::test::shell_request;

namespace {

auto next_from(EventStream& stream) {
    return [&stream](std::chrono::milliseconds timeout) { return stream.next(timeout); };
}

void wait_until_gone(const ExecutionGateway& gateway, std::chrono::milliseconds limit = 5s) {
    const auto deadline = std::chrono::steady_clock::now() + limit;
    while (gateway.live_sessions() != 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(10ms);
    }
}

} // namespace

TEST_CASE("The gateway lists its languages") {
    ExecutionGateway gateway{make_test_config()};

    auto languages = gateway.languages();
    REQUIRE_THAT(languages, VectorContains(std::string{"python"}));
    REQUIRE_THAT(languages, VectorContains(std::string{"cpp"}));
    REQUIRE_THAT(languages, VectorContains(std::string{"shell"}));
    REQUIRE(gateway.config().backend == nexusexec::BackendKind::Process);
}

TEST_CASE("A gateway needs a backend") {
    REQUIRE_THROWS_AS(ExecutionGateway(make_test_config(), std::unique_ptr<nexusexec::IsolationBackend>{}),
                      EngineError);
}

TEST_CASE("Batch execution through the gateway") {
    auto config = make_test_config();
    ExecutionGateway gateway{config, std::make_unique<nexusexec::ProcessBackend>(config.workspace_root)};

    auto result = gateway.execute(shell_request("batch", "echo 6 \\* 7 = $((6 * 7))\n"));
    REQUIRE(result);
    REQUIRE(result->status == ExecutionStatus::Ok);
    REQUIRE(result->stdout_text == "6 * 7 = 42\n");
    REQUIRE(gateway.live_sessions() == 0);

    auto unsupported = shell_request("batch", "echo hi\n");
    unsupported.language = "fortran";
    REQUIRE(gateway.execute(unsupported).error().kind == ErrorKind::UnsupportedLanguage);
}

TEST_CASE("Streaming through the gateway") {
    ExecutionGateway gateway{make_test_config()};

    auto stream = gateway.stream(shell_request("streamed", "echo line1\necho line2\nexit 4\n"));
    REQUIRE(stream);
    REQUIRE(stream->session_id() == "streamed");
    REQUIRE_FALSE(stream->result());

    auto events = collect_events(next_from(*stream));
    REQUIRE(events.ended);
    REQUIRE(events.stdout_text == "line1\nline2\n");

    // A runtime error is visible in the result only; no error notice
    REQUIRE(events.notices.empty());

    REQUIRE(stream->finished());
    REQUIRE_FALSE(stream->next(10ms));

    auto result = stream->result();
    REQUIRE(result);
    REQUIRE(result->status == ExecutionStatus::RuntimeError);
    REQUIRE(result->exit_code == 4);
}

TEST_CASE("Interactive input through the gateway") {
    ExecutionGateway gateway{make_test_config()};

    ExecutionRequest request = shell_request("chat", "while read line; do\n"
                                                     "  [ \"$line\" = quit ] && break\n"
                                                     "  echo \"echo: $line\"\n"
                                                     "done\n"
                                                     "echo bye\n");
    request.interactive = true;

    EventStream stream = gateway.stream(request).value();

    REQUIRE(gateway.send_input("chat", "hello"));
    REQUIRE(gateway.send_input("chat", "wor", false));
    REQUIRE(gateway.send_input("chat", "ld"));
    REQUIRE(gateway.send_input("chat", "quit"));

    auto events = collect_events(next_from(stream));
    REQUIRE(events.ended);
    REQUIRE(events.stdout_text == "echo: hello\necho: world\nbye\n");
    REQUIRE(stream.result()->status == ExecutionStatus::Ok);

    REQUIRE(gateway.send_input("chat", "anyone?").error().kind == ErrorKind::SessionNotFound);
}

TEST_CASE("Cancelling through the gateway") {
    ExecutionGateway gateway{make_test_config()};

    EventStream stream = gateway.stream(shell_request("long", "sleep 30\n")).value();
    REQUIRE(gateway.live_sessions() == 1);

    REQUIRE(gateway.cancel("long"));

    auto events = collect_events(next_from(stream));
    REQUIRE(events.ended);
    REQUIRE(events.notices.size() == 1);
    REQUIRE_THAT(events.notices.front(), ContainsSubstring("Cancelled"));
    REQUIRE(stream.result()->status == ExecutionStatus::Cancelled);

    REQUIRE(gateway.cancel("long").error().kind == ErrorKind::SessionNotFound);
    REQUIRE(gateway.cancel("never-existed").error().kind == ErrorKind::SessionNotFound);
}

TEST_CASE("Dropping a stream cancels its run") {
    ExecutionGateway gateway{make_test_config()};

    {
        EventStream stream = gateway.stream(shell_request("dropped", "while :; do echo spam; done\n")).value();
        REQUIRE(stream.next(5s));
    }

    wait_until_gone(gateway);
    REQUIRE(gateway.live_sessions() == 0);
}

TEST_CASE("Moving a stream keeps the run alive") {
    ExecutionGateway gateway{make_test_config()};

    EventStream first = gateway.stream(shell_request("moved", "sleep 0.2\necho moved\n")).value();
    EventStream second = std::move(first);

    REQUIRE(second.session_id() == "moved");
    REQUIRE_FALSE(first.next(0ms)); // NOLINT(bugprone-use-after-move)

    auto events = collect_events(next_from(second));
    REQUIRE(events.ended);
    REQUIRE(events.stdout_text == "moved\n");
    REQUIRE(second.result()->status == ExecutionStatus::Ok);
}

TEST_CASE("Concurrent runs do not interfere") {
    ExecutionGateway gateway{make_test_config()};

    constexpr int RUNS = 6;
    std::vector<std::string> outputs(RUNS);

    {
        std::vector<std::jthread> threads;
        for (int i = 0; i < RUNS; ++i) {
            threads.emplace_back([&gateway, &outputs, i] {
                auto result = gateway.execute(
                    shell_request(fmt::format("concurrent-{}", i), fmt::format("sleep 0.1\necho run {}\n", i)));
                if (result) {
                    outputs[static_cast<std::size_t>(i)] = result->stdout_text;
                }
            });
        }
    }

    for (int i = 0; i < RUNS; ++i) {
        REQUIRE(outputs[static_cast<std::size_t>(i)] == fmt::format("run {}\n", i));
    }
    REQUIRE(gateway.live_sessions() == 0);
}

TEST_CASE("Input a program never reads is accepted") {
    ExecutionGateway gateway{make_test_config()};

    SECTION("Program ignores its input") {
        ExecutionRequest request = shell_request("deaf", "sleep 0.5\necho done\n");
        request.interactive = true;

        EventStream stream = gateway.stream(request).value();
        REQUIRE(gateway.send_input("deaf", "is anyone there?"));

        auto events = collect_events(next_from(stream));
        REQUIRE(events.ended);
        REQUIRE(events.stdout_text == "done\n");
        REQUIRE(stream.result()->status == ExecutionStatus::Ok);
    }

    SECTION("Program closed its input") {
        ExecutionRequest request = shell_request("closed", "exec 0<&-\nsleep 0.5\necho done\n");
        request.interactive = true;

        EventStream stream = gateway.stream(request).value();
        std::this_thread::sleep_for(100ms);
        REQUIRE(gateway.send_input("closed", "first"));
        REQUIRE(gateway.send_input("closed", "second"));

        auto events = collect_events(next_from(stream));
        REQUIRE(events.ended);
        REQUIRE(events.stdout_text == "done\n");
        REQUIRE(events.notices.empty());
        REQUIRE(stream.result()->status == ExecutionStatus::Ok);
    }
}

TEST_CASE("A failed installation leaves other sessions alone") {
    ExecutionGateway gateway{make_test_config()};

    EventStream steady = gateway.stream(shell_request("steady", "sleep 0.5\necho steady\n")).value();

    ExecutionRequest broken = shell_request("broken", "echo unreachable\n");
    broken.language = "broken-deps";
    broken.dependencies = {{"nonexistent-package", "*"}};

    auto failed = gateway.execute(broken);
    REQUIRE(failed);
    REQUIRE(failed->status == ExecutionStatus::DependencyInstallError);

    // Only the failed session left the registry
    REQUIRE(gateway.live_sessions() == 1);
    REQUIRE(gateway.send_input("broken", "x").error().kind == ErrorKind::SessionNotFound);

    auto events = collect_events(next_from(steady));
    REQUIRE(events.ended);
    REQUIRE(events.stdout_text == "steady\n");
    REQUIRE(steady.result()->status == ExecutionStatus::Ok);
    REQUIRE(gateway.live_sessions() == 0);
}

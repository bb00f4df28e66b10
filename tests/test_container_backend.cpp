#include "catch2_custom.hpp"

#include <nexusexec/sandbox/container_backend.hpp>
#include <nexusexec/sandbox/isolation_backend.hpp>

#include <fmt/format.h>
#include <range/v3/algorithm/find.hpp>

#include <chrono>
#include <string>
#include <vector>

#include <unistd.h>

using namespace std::chrono_literals;
using nexusexec::ContainerBackend;
using nexusexec::StepKind;
using nexusexec::StepSpec;
using Catch::Matchers::VectorContains;

namespace {

/// Value following ``flag`` in ``args``
std::string flag_value(const std::vector<std::string>& args, std::string_view flag) {
    auto iter = ranges::find(args, flag);
    REQUIRE(iter != args.end());
    REQUIRE(iter + 1 != args.end());
    return *(iter + 1);
}

StepSpec run_step() {
    StepSpec step;
    step.kind = StepKind::Run;
    step.argv = {"python3", "-u", "main.py"};
    step.limits.memory_bytes = 128ULL * 1024 * 1024;
    step.limits.max_processes = 32;
    step.limits.cpu_cores = 0.5;
    step.limits.open_files = 64;
    return step;
}

} // namespace

TEST_CASE("Container arguments carry the limits") {
    auto args = ContainerBackend::make_run_args("nexusexec-ws-abc-0", "nexusquest-python", "/var/lib/ws-abc", run_step(),
                                                {{"PYTHONUNBUFFERED", "1"}});

    REQUIRE(args.front() == "run");
    REQUIRE_THAT(args, VectorContains(std::string{"--rm"}));
    REQUIRE_THAT(args, VectorContains(std::string{"--read-only"}));

    REQUIRE(flag_value(args, "--name") == "nexusexec-ws-abc-0");
    REQUIRE(flag_value(args, "--network") == "none");
    REQUIRE(flag_value(args, "--memory") == std::to_string(128ULL * 1024 * 1024));
    REQUIRE(flag_value(args, "--memory-swap") == std::to_string(128ULL * 1024 * 1024));
    REQUIRE(flag_value(args, "--pids-limit") == "32");
    REQUIRE(flag_value(args, "--cpus") == "0.50");
    REQUIRE(flag_value(args, "--ulimit") == "nofile=64:64");
    REQUIRE(flag_value(args, "--user") == fmt::format("{}:{}", ::getuid(), ::getgid()));
    REQUIRE(flag_value(args, "--volume") == "/var/lib/ws-abc:/workspace");
    REQUIRE(flag_value(args, "--workdir") == "/workspace");
    REQUIRE(flag_value(args, "--env") == "PYTHONUNBUFFERED=1");

    // Image, then the program's own argv
    const std::vector<std::string> tail(args.end() - 4, args.end());
    REQUIRE(tail == std::vector<std::string>{"nexusquest-python", "python3", "-u", "main.py"});
}

TEST_CASE("Only installation steps reach the network") {
    StepSpec install = run_step();
    install.kind = StepKind::Install;
    install.network = true;

    auto args = ContainerBackend::make_run_args("c", "img", "/ws", install, {});
    REQUIRE(flag_value(args, "--network") == "bridge");
    REQUIRE(ranges::find(args, std::string{"--env"}) == args.end());
}

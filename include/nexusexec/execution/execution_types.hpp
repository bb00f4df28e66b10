#pragma once

#include <nexusexec/dependency/dependency_resolver.hpp>
#include <nexusexec/execution/source_file.hpp>
#include <nexusexec/sandbox/resource_limits.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace nexusexec {

enum class ExecutionStatus {
    Ok,
    CompileError,
    RuntimeError,
    Timeout,
    ResourceLimit,
    DependencyInstallError,
    Cancelled,
    InternalError,
};

std::string_view format_as(ExecutionStatus status);

/// Outcome of one run. Everything the submitted program does (including crashing, hanging
/// or failing to compile) is described here rather than reported as an engine error.
struct ExecutionResult
{
    std::string stdout_text;
    std::string stderr_text;

    /// -1 if the program never ran; 128 + signal number if it was killed
    int exit_code = -1;

    bool timed_out = false;
    std::int64_t duration_ms = 0;

    ExecutionStatus status = ExecutionStatus::InternalError;

    /// Compiler output, install log, or a short human-readable reason
    std::string diagnostics;

    /// Copied verbatim from the request
    std::string correlation;

    bool ok() const { return status == ExecutionStatus::Ok; }
};

std::string format_as(const ExecutionResult& result);

struct ExecutionRequest
{
    /// Caller-chosen identifier, unique among live runs
    std::string session_id;

    std::string language;
    std::vector<SourceFile> files;

    /// Defaults to the language's entry file
    std::string main_file;

    DependencyMap dependencies;

    std::optional<std::string> stdin_data;

    /// Keep stdin open after ``stdin_data`` so input can be sent while the program runs
    bool interactive = false;

    /// Limits profile; empty selects the configured default
    std::string policy;

    /// Can only lower the policy's limits
    LimitOverrides limits;

    /// Replaces the wall timeout outright, whatever the policy says. Used for grading.
    std::optional<std::chrono::milliseconds> fixed_timeout;

    std::string correlation;
};

} // namespace nexusexec

#include <nexusexec/execution/execution_types.hpp>

#include <nexusexec/execution/output_event.hpp>

#include <fmt/format.h>

#include <string>
#include <string_view>
#include <variant>

namespace nexusexec {

std::string_view format_as(ExecutionStatus status) {
    switch (status) {
    case ExecutionStatus::Ok:
        return "Ok";
    case ExecutionStatus::CompileError:
        return "CompileError";
    case ExecutionStatus::RuntimeError:
        return "RuntimeError";
    case ExecutionStatus::Timeout:
        return "Timeout";
    case ExecutionStatus::ResourceLimit:
        return "ResourceLimit";
    case ExecutionStatus::DependencyInstallError:
        return "DependencyInstallError";
    case ExecutionStatus::Cancelled:
        return "Cancelled";
    case ExecutionStatus::InternalError:
        return "InternalError";
    }
    return "<unknown status>";
}

std::string format_as(const ExecutionResult& result) {
    return fmt::format("{{status={}, exit_code={}, timed_out={}, duration={}ms, stdout={}B, stderr={}B}}",
                       format_as(result.status), result.exit_code, result.timed_out, result.duration_ms,
                       result.stdout_text.size(), result.stderr_text.size());
}

std::string_view format_as(const OutputEvent& event) {
    return std::visit(Overloaded{
                          [](const StdoutChunk&) { return std::string_view{"stdout"}; },
                          [](const StderrChunk&) { return std::string_view{"stderr"}; },
                          [](const ErrorNotice&) { return std::string_view{"error"}; },
                          [](const EndOfStream&) { return std::string_view{"end"}; },
                      },
                      event);
}

} // namespace nexusexec

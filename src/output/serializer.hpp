#pragma once

#include <nexusexec/common/class_traits.hpp>
#include <nexusexec/execution/execution_types.hpp>
#include <nexusexec/execution/output_event.hpp>
#include <nexusexec/grading/grading_types.hpp>

#include "output/sink.hpp"
#include "output/verbosity.hpp"

#include <string_view>

namespace nexusexec {

class Serializer : NonCopyable
{
public:
    explicit Serializer(Sink& sink, VerbosityLevel verbosity)
        : sink_{sink}
        , verbosity_{verbosity} {}

    virtual ~Serializer() = default;

    /// One event of a streaming run, as it arrives
    virtual void on_output_event(const OutputEvent& event) = 0;

    /// ``streamed``: the program's output was already written through ``on_output_event``
    virtual void on_execution_result(const ExecutionResult& result, bool streamed) = 0;

    virtual void on_test_result(const TestResult& result) = 0;
    virtual void on_grading_result(const GradingResult& result) = 0;

    virtual void on_warning(std::string_view what) = 0;
    virtual void on_error(std::string_view what) = 0;

    virtual void finalize() = 0;

protected:
    Sink& sink_;
    VerbosityLevel verbosity_;
};

} // namespace nexusexec

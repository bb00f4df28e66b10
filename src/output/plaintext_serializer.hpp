#pragma once

#include <nexusexec/execution/execution_types.hpp>
#include <nexusexec/execution/output_event.hpp>
#include <nexusexec/grading/grading_types.hpp>

#include "output/serializer.hpp"
#include "output/sink.hpp"
#include "output/verbosity.hpp"
#include "user/program_options.hpp"

#include <fmt/color.h>
#include <fmt/format.h>

#include <cstddef>
#include <string>
#include <string_view>

namespace nexusexec {

class PlainTextSerializer : public Serializer
{
public:
    PlainTextSerializer(Sink& sink, ProgramOptions::ColorizeOpt colorize_option, VerbosityLevel verbosity);

    void on_output_event(const OutputEvent& event) override;
    void on_execution_result(const ExecutionResult& result, bool streamed) override;
    void on_test_result(const TestResult& result) override;
    void on_grading_result(const GradingResult& result) override;

    void on_warning(std::string_view what) override;
    void on_error(std::string_view what) override;

    void finalize() override;

private:
    static bool process_colorize_opt(ProgramOptions::ColorizeOpt colorize_option);
    static std::size_t get_terminal_width();

    std::string style_str(std::string_view text, fmt::text_style style) const;

    /// Conditionally make a word singular or plural based on `count`
    /// Singular if and only if `count == 1`
    ///
    /// Examples:
    ///  pluralize("test", 0) => "tests"
    ///  pluralize("test", 1) => "test"
    static std::string pluralize(std::string_view root, std::size_t count, std::string_view suffix = "s");

    /// Indent every line of ``text`` by ``width`` spaces, ending with a newline
    static std::string indent(std::string_view text, std::size_t width);

    // Basic styles for different kinds of output:
    //   error    - FAILED messages, engine errors, program stderr
    //   success  - PASSED messages
    //   value    - literal values (inputs, outputs)
    static constexpr auto ERROR_STYLE = fmt::fg(fmt::color::red) | fmt::emphasis::bold;
    static constexpr auto WARNING_STYLE = fmt::fg(fmt::color::yellow) | fmt::emphasis::bold;
    static constexpr auto STDERR_STYLE = fmt::fg(fmt::color::indian_red);
    static constexpr auto SUCCESS_STYLE = fmt::fg(fmt::color::lime_green);
    static constexpr auto VALUE_STYLE = fmt::fg(fmt::color::aqua);

    static constexpr std::size_t DEFAULT_WIDTH = 80;

    static std::string line_divider(std::size_t len) { return std::string(len, '-'); }

    bool do_colorize_;
    std::size_t terminal_width_;
};

} // namespace nexusexec

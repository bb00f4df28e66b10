#include "output/plaintext_serializer.hpp"

#include <nexusexec/execution/output_event.hpp>
#include <nexusexec/logging.hpp>

#include "common/terminal_checks.hpp"
#include "output/serializer.hpp"
#include "output/sink.hpp"
#include "output/verbosity.hpp"
#include "user/program_options.hpp"

#include <fmt/color.h>
#include <fmt/format.h>

#include <cstddef>
#include <cstdio>
#include <string>
#include <string_view>
#include <variant>

namespace nexusexec {

PlainTextSerializer::PlainTextSerializer(Sink& sink, ProgramOptions::ColorizeOpt colorize_option,
                                         VerbosityLevel verbosity)
    : Serializer{sink, verbosity}
    , do_colorize_{process_colorize_opt(colorize_option)}
    , terminal_width_{get_terminal_width()} {}

void PlainTextSerializer::on_output_event(const OutputEvent& event) {
    std::visit(Overloaded{
                   [this](const StdoutChunk& chunk) {
                       if (should_output_program_output(verbosity_)) {
                           sink_.write(chunk.data);
                       }
                   },
                   [this](const StderrChunk& chunk) {
                       if (should_output_program_output(verbosity_)) {
                           sink_.write(style_str(chunk.data, STDERR_STYLE));
                       }
                   },
                   [this](const ErrorNotice& notice) { on_error(notice.message); },
                   [](const EndOfStream&) {},
               },
               event);
}

void PlainTextSerializer::on_execution_result(const ExecutionResult& result, bool streamed) {
    if (!streamed && should_output_program_output(verbosity_)) {
        sink_.write(result.stdout_text);
        if (!result.stderr_text.empty()) {
            sink_.write(style_str(result.stderr_text, STDERR_STYLE));
        }
    }

    // Streams already carried the diagnostics in their error event
    if (!streamed && !result.ok() && !result.diagnostics.empty() && should_output_program_output(verbosity_)) {
        on_error(result.diagnostics);
    }

    if (!should_output_summary(verbosity_)) {
        return;
    }

    std::string status = result.ok() ? style_str(format_as(result.status), SUCCESS_STYLE)
                                     : style_str(format_as(result.status), ERROR_STYLE);

    std::string out = fmt::format("{}\n{} (exit code {}, {} ms)\n", line_divider(terminal_width_), status,
                                  result.exit_code, result.duration_ms);

    sink_.write(out);
}

void PlainTextSerializer::on_test_result(const TestResult& result) {
    if (!should_output_test(verbosity_, result.passed)) {
        return;
    }

    std::string verdict = result.passed ? style_str("PASSED", SUCCESS_STYLE) : style_str("FAILED", ERROR_STYLE);
    std::string out = fmt::format("Test #{} {}\n", result.index, verdict);

    if (should_output_test_details(verbosity_, result.passed)) {
        out += fmt::format("  Input:\n{}", indent(result.input, 4));
        out += fmt::format("  Expected:\n{}", indent(result.expected_output, 4));
        out += fmt::format("  Actual:\n{}", indent(result.actual_output, 4));
    }

    if (result.error) {
        out += fmt::format("  Error:\n{}", style_str(indent(*result.error, 4), ERROR_STYLE));
    }

    sink_.write(out);
}

void PlainTextSerializer::on_grading_result(const GradingResult& result) {
    if (!should_output_summary(verbosity_)) {
        return;
    }

    std::string out = line_divider(terminal_width_) + "\n";

    if (result.all_passed) {
        out += fmt::format("{} ({} {})\n", style_str("All tests passed", SUCCESS_STYLE), result.total,
                           pluralize("test", result.total));
    } else {
        std::string passed_msg = fmt::format("{} passed", result.passed_count);
        std::string failed_msg = fmt::format("{} failed", result.total - result.passed_count);

        out += fmt::format("Tests: {} total | {} | {}\n", result.total, style_str(passed_msg, SUCCESS_STYLE),
                           style_str(failed_msg, ERROR_STYLE));
    }

    sink_.write(out);
}

void PlainTextSerializer::on_warning(std::string_view what) {
    sink_.write(style_str(what, WARNING_STYLE) + "\n");
}

void PlainTextSerializer::on_error(std::string_view what) {
    sink_.write(style_str(what, ERROR_STYLE) + "\n");
}

void PlainTextSerializer::finalize() {
    sink_.flush();
}

std::string PlainTextSerializer::style_str(std::string_view text, fmt::text_style style) const {
    if (!do_colorize_) {
        return std::string{text};
    }
    return fmt::format(style, "{}", text);
}

bool PlainTextSerializer::process_colorize_opt(ProgramOptions::ColorizeOpt colorize_option) {
    using enum ProgramOptions::ColorizeOpt;

    if (colorize_option == Never) {
        return false;
    }
    if (colorize_option == Always) {
        return true;
    }

    // Colorize if output is going to a color-supporting terminal, otherwise do not
    LOG_DEBUG("In terminal: {} & Color Supporting Terminal: {}", in_terminal(stdout), is_color_terminal());

    return in_terminal(stdout) && is_color_terminal();
}

std::string PlainTextSerializer::pluralize(std::string_view root, std::size_t count, std::string_view suffix) {
    if (count == 1) {
        return std::string{root};
    }

    return fmt::format("{}{}", root, suffix);
}

std::string PlainTextSerializer::indent(std::string_view text, std::size_t width) {
    if (text.empty()) {
        return fmt::format("{:{}}<empty>\n", "", width);
    }

    if (text.ends_with('\n')) {
        text.remove_suffix(1);
    }

    std::string out;

    while (true) {
        auto end = text.find('\n');
        out += fmt::format("{:{}}{}\n", "", width, text.substr(0, end));
        if (end == std::string_view::npos) {
            break;
        }
        text.remove_prefix(end + 1);
    }

    return out;
}

std::size_t PlainTextSerializer::get_terminal_width() {
    auto width = terminal_size(stdout);

    if (!width) {
        LOG_DEBUG("Could not obtain terminal width because {}. Defaulting to {}", width.error().message(),
                  DEFAULT_WIDTH);
        return DEFAULT_WIDTH;
    }

    return width->ws_col == 0 ? DEFAULT_WIDTH : width->ws_col;
}

} // namespace nexusexec

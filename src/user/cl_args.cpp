#include "user/cl_args.hpp"

#include <nexusexec/common/expected.hpp>
#include <nexusexec/logging.hpp>

#include "common/terminal_checks.hpp"
#include "user/program_options.hpp"

#include <argparse/argparse.hpp>
#include <fmt/color.h>
#include <fmt/format.h>

#include <cstddef>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>

namespace nexusexec {

CommandLineArgs::CommandLineArgs(std::span<const char*> args)
    : arg_parser_{get_basename(args[0]), /*unused*/ NEXUSEXEC_VERSION_STRING, argparse::default_arguments::help}
    , run_parser_{"run", NEXUSEXEC_VERSION_STRING, argparse::default_arguments::help}
    , grade_parser_{"grade", NEXUSEXEC_VERSION_STRING, argparse::default_arguments::help}
    , args_{args.begin(), args.end()} {
    // Add parser arguments
    setup_parser();
}

void CommandLineArgs::add_common_arguments(argparse::ArgumentParser& parser) {
    constexpr auto DEFAULT_VERBOSITY_VALUE =
        static_cast<VerbosityLevelUnderlyingT>(ProgramOptions::DEFAULT_VERBOSITY_LEVEL);
    constexpr auto MAX_VERBOSITY_VALUE = static_cast<VerbosityLevelUnderlyingT>(VerbosityLevel::Max);
    constexpr auto MIN_VERBOSITY_VALUE = static_cast<VerbosityLevelUnderlyingT>(VerbosityLevel::Silent);

    constexpr auto MAX_VERBOSITY_INCREASE = MAX_VERBOSITY_VALUE - DEFAULT_VERBOSITY_VALUE;
    constexpr auto MAX_VERBOSITY_DECREASE = DEFAULT_VERBOSITY_VALUE - MIN_VERBOSITY_VALUE;

    // clang-format off
    parser.add_argument("files")
        .nargs(argparse::nargs_pattern::at_least_one)
        .metavar("FILE")
        .help("Source files, sent to the engine under their base names");

    parser.add_argument("-l", "--language")
        .required()
        .store_into(opts_buffer_.language)
        .metavar("LANG")
        .help("Language id or alias (python, javascript, java, cpp, ...)");

    parser.add_argument("-m", "--main")
        .store_into(opts_buffer_.main_file)
        .metavar("FILE")
        .help("File to run; defaults to the language's entry file");

    parser.add_argument("-d", "--dep")
        .append()
        .metavar("NAME[=VERSION]")
        .help("Dependency to install before running (repeatable)");

    parser.add_argument("--config")
        .metavar("FILE")
        .action([this] (const std::string& opt) { opts_buffer_.config_path = opt; })
        .help("JSON engine configuration");

    parser.add_argument("--policy")
        .store_into(opts_buffer_.policy)
        .metavar("NAME")
        .help("Limits profile (playground, authenticated, ...)");

    parser.add_argument("-v", "--verbose")
        .flag()
        .action([this] (const std::string& /*unused*/) {
                auto value = static_cast<VerbosityLevelUnderlyingT>(opts_buffer_.verbosity) + 1;

                if (value > MAX_VERBOSITY_VALUE) {
                    throw std::invalid_argument("Verbosity specification exceeds maximum level");
                }

                opts_buffer_.verbosity = static_cast<VerbosityLevel>(value);
            })
        .append()
        .help(fmt::format("Increase verbosity level (up to {}x)", MAX_VERBOSITY_INCREASE));

    parser.add_argument("-q", "--quiet")
        .flag()
        .action([this] (const std::string& /*unused*/) {
                auto value = static_cast<VerbosityLevelUnderlyingT>(opts_buffer_.verbosity) - 1;

                if (value < MIN_VERBOSITY_VALUE) {
                    throw std::invalid_argument("Verbosity specification is lower than minimum level");
                }

                opts_buffer_.verbosity = static_cast<VerbosityLevel>(value);
            })
        .append()
        .help(fmt::format("Decrease verbosity level (up to {}x)", MAX_VERBOSITY_DECREASE));

    parser.add_argument("-c", "--color")
        .choices("never", "auto", "always")
        .default_value(std::string{"auto"})
        .metavar("WHEN")
        .nargs(1)
        .help("When to use colors")
        .action([this] (const std::string& opt) {
                using enum ProgramOptions::ColorizeOpt;

                if (opt == "never") {
                    opts_buffer_.colorize_option = Never;
                } else if (opt == "auto") {
                    opts_buffer_.colorize_option = Auto;
                } else if (opt == "always") {
                    opts_buffer_.colorize_option = Always;
                }
        });
    // clang-format on
}

void CommandLineArgs::setup_parser() {
    if (auto term_sz = terminal_size(stdout)) {
        arg_parser_.set_usage_max_line_width(term_sz->ws_col * 3 / 4);
    } else {
        constexpr std::size_t DEFAULT_MAX_WIDTH = 80;
        LOG_DEBUG("Failed to get terminal size. Setting max width to 80");
        arg_parser_.set_usage_max_line_width(DEFAULT_MAX_WIDTH);
    }

    arg_parser_.add_description(fmt::format("nexusexec v{} - sandboxed code execution", NEXUSEXEC_VERSION_STRING));

    // clang-format off
    // Verbatim from argparse.hpp, except replacing `-v` with `-V`
    arg_parser_.add_argument("-V", "--version")
        .default_value(false)
        .implicit_value(true)
        .nargs(0)
        .action([&](const auto & /*unused*/) {
            fmt::print("{}\n", NEXUSEXEC_VERSION_STRING);
            std::exit(0);
        })
        .help("prints version information and exits");

    run_parser_.add_description("Run a program once and print its output");
    add_common_arguments(run_parser_);

    run_parser_.add_argument("-i", "--stdin")
        .metavar("FILE")
        .action([this] (const std::string& opt) { opts_buffer_.stdin_path = opt; })
        .help("File whose contents are sent to the program's stdin");

    run_parser_.add_argument("-s", "--stream")
        .store_into(opts_buffer_.stream)
        .help("Print output as it is produced");

    run_parser_.add_argument("--interactive")
        .store_into(opts_buffer_.interactive)
        .help("Forward this terminal's stdin to the program while it runs (needs --stream)");

    grade_parser_.add_description("Grade a program against the test cases of a fixture file");

    grade_parser_.add_argument("fixtures")
        .metavar("FIXTURES")
        .help("JSON file with the test cases");

    add_common_arguments(grade_parser_);

    grade_parser_.add_argument("--visible-only")
        .store_into(opts_buffer_.visible_only)
        .help("Skip hidden test cases");
    // clang-format on

    arg_parser_.add_subparser(run_parser_);
    arg_parser_.add_subparser(grade_parser_);
}

Expected<ProgramOptions, std::string> CommandLineArgs::parse() {
    try {
        arg_parser_.parse_args(args_);

        const bool is_grade = arg_parser_.is_subcommand_used(grade_parser_);
        if (!is_grade && !arg_parser_.is_subcommand_used(run_parser_)) {
            return "Expected a command: run or grade";
        }

        argparse::ArgumentParser& sub = is_grade ? grade_parser_ : run_parser_;

        opts_buffer_.command = is_grade ? ProgramOptions::Command::Grade : ProgramOptions::Command::Run;

        opts_buffer_.files.clear();
        for (const auto& file : sub.get<std::vector<std::string>>("files")) {
            opts_buffer_.files.emplace_back(file);
        }

        if (auto deps = sub.present<std::vector<std::string>>("--dep")) {
            opts_buffer_.dependencies = *deps;
        }

        if (is_grade) {
            opts_buffer_.fixtures_path = sub.get<std::string>("fixtures");
        }
    } catch (const std::exception& err) {
        return err.what();
    }

    LOG_DEBUG("Parsed CLI arguments: {}", opts_buffer_);

    TRY(opts_buffer_.validate());

    return opts_buffer_;
}

std::string CommandLineArgs::help_message() const {
    return arg_parser_.help().str();
}

std::string CommandLineArgs::usage_message() const {
    return arg_parser_.usage();
}

std::string CommandLineArgs::get_basename(std::string_view full_name) {
    return std::string{full_name.substr(full_name.find_last_of('/') + 1)};
}

ProgramOptions parse_args_or_exit(std::span<const char*> args, int exit_code) noexcept {
    CommandLineArgs cl_args{args};
    auto opts_res = cl_args.parse();

    if (!opts_res) {
        fmt::print(stderr, "{}\n{}\n", fmt::styled(opts_res.error(), fmt::fg(fmt::color::red)),
                   cl_args.usage_message());
        std::exit(exit_code);
    }

    return opts_res.value();
}

} // namespace nexusexec

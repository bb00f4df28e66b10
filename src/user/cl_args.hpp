#pragma once

#include <nexusexec/common/expected.hpp>

#include "user/program_options.hpp"

#include <argparse/argparse.hpp>

#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace nexusexec {

/// Just a wrapper around argparse for now
class CommandLineArgs
{
public:
    explicit CommandLineArgs(std::span<const char*> args);

    /// Returns:
    ///   Success - Expected<ProgramOptions> with parsed program options structure
    ///   Failure - Expected<std::string> with failure message
    Expected<ProgramOptions, std::string> parse();

    std::string usage_message() const;
    std::string help_message() const;

private:
    /// Set up the ArgumentParser for fields of ProgramOptions
    void setup_parser();

    /// Options shared by every subcommand
    void add_common_arguments(argparse::ArgumentParser& parser);

    /// Obtain the basename of a full pathname
    /// Used for the program name with argparse
    static std::string get_basename(std::string_view full_name);

    argparse::ArgumentParser arg_parser_;
    argparse::ArgumentParser run_parser_;
    argparse::ArgumentParser grade_parser_;
    std::vector<std::string> args_;

    ProgramOptions opts_buffer_ = {};

    using VerbosityLevelUnderlyingT = std::underlying_type_t<VerbosityLevel>;
};

/// Exit status for command line usage errors
constexpr int USAGE_EXIT_CODE = 2;

ProgramOptions parse_args_or_exit(std::span<const char*> args, int exit_code = USAGE_EXIT_CODE) noexcept;

} // namespace nexusexec

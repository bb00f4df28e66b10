#pragma once

#include <spdlog/common.h>

namespace nexusexec {

/// How much the CLI prints besides the program's own output.
/// `Max` is just used as a sentinal for now
enum class VerbosityLevel {
    Silent,  ///< Nothing; only the exit status
    Quiet,   ///< Program output and failures
    Summary, ///< + a result / grading summary line
    All,     ///< + every test case, passing or not
    Extra,   ///< + engine info logs
    Max      ///< + engine debug logs
};

constexpr bool should_output_program_output(VerbosityLevel level) {
    return level >= VerbosityLevel::Quiet;
}

constexpr bool should_output_summary(VerbosityLevel level) {
    return level >= VerbosityLevel::Summary;
}

constexpr bool should_output_test(VerbosityLevel level, bool passed) {
    using enum VerbosityLevel;

    return (level >= All || (level >= Quiet && !passed));
}

constexpr bool should_output_test_details(VerbosityLevel level, bool passed) {
    using enum VerbosityLevel;

    return (level >= All || (level >= Summary && !passed));
}

/// Engine log level matching a CLI verbosity
constexpr spdlog::level::level_enum log_level_for(VerbosityLevel level) {
    switch (level) {
    case VerbosityLevel::Silent:
        return spdlog::level::off;
    case VerbosityLevel::Quiet:
        return spdlog::level::err;
    case VerbosityLevel::Summary:
    case VerbosityLevel::All:
        return spdlog::level::warn;
    case VerbosityLevel::Extra:
        return spdlog::level::info;
    case VerbosityLevel::Max:
        break;
    }
    return spdlog::level::debug;
}

} // namespace nexusexec

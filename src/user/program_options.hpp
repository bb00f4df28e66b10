#pragma once

#include <nexusexec/common/error_types.hpp>
#include <nexusexec/common/expected.hpp>

#include "output/verbosity.hpp"

#include <fmt/format.h>

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace nexusexec {

struct ProgramOptions
{

    // ###### Argument fields

    enum class Command { Run, Grade } command = Command::Run;

    VerbosityLevel verbosity = DEFAULT_VERBOSITY_LEVEL;

    enum class ColorizeOpt { Auto, Always, Never } colorize_option = ColorizeOpt::Auto;

    std::vector<std::filesystem::path> files;
    std::string language;

    /// Empty = the language's entry file
    std::string main_file;

    std::optional<std::filesystem::path> config_path;
    std::string policy;

    /// "name=version" or "name"
    std::vector<std::string> dependencies;

    // Run only
    std::optional<std::filesystem::path> stdin_path;
    bool stream = false;
    bool interactive = false;

    // Grade only
    std::filesystem::path fixtures_path;
    bool visible_only = false;

    // ###### Argument defaults

    static constexpr auto DEFAULT_VERBOSITY_LEVEL = VerbosityLevel::Summary;

    static Expected<void, std::string> ensure_is_regular_file(const std::filesystem::path& path,
                                                              std::string_view what) {
        if (!std::filesystem::exists(path)) {
            return fmt::format("{} {:?} does not exist", what, path.string());
        }

        if (!std::filesystem::is_regular_file(path)) {
            return fmt::format("{} {:?} is not a regular file", what, path.string());
        }

        return {};
    }

    /// Verify that all fields are valid
    Expected<void, std::string> validate() const {
        if (files.empty()) {
            return "At least one source file is required";
        }

        for (const auto& file : files) {
            TRY(ensure_is_regular_file(file, "Source file"));
        }

        if (language.empty()) {
            return "--language is required";
        }

        if (config_path) {
            TRY(ensure_is_regular_file(*config_path, "Configuration file"));
        }

        if (command == Command::Grade) {
            TRY(ensure_is_regular_file(fixtures_path, "Fixture file"));
            return {};
        }

        if (stdin_path) {
            TRY(ensure_is_regular_file(*stdin_path, "Input file"));
        }

        if (interactive && !stream) {
            return "--interactive requires --stream";
        }

        return {};
    }
};

} // namespace nexusexec

template <>
struct fmt::formatter<::nexusexec::ProgramOptions> : fmt::formatter<std::string_view>
{
    auto format(const ::nexusexec::ProgramOptions& from, fmt::format_context& ctx) const {
        using ::nexusexec::ProgramOptions;

        std::vector<std::string> files;
        for (const auto& file : from.files) {
            files.push_back(file.string());
        }

        ctx.advance_to(fmt::format_to(ctx.out(), "{{command={}, verbosity={}, language={:?}, files={}, main={:?}",
                                      from.command == ProgramOptions::Command::Run ? "run" : "grade",
                                      fmt::underlying(from.verbosity), from.language, fmt::join(files, ","),
                                      from.main_file));

        if (from.command == ProgramOptions::Command::Grade) {
            return fmt::format_to(ctx.out(), ", fixtures={:?}, visible_only={}}}", from.fixtures_path.string(),
                                  from.visible_only);
        }

        return fmt::format_to(ctx.out(), ", stream={}, interactive={}}}", from.stream, from.interactive);
    }
};

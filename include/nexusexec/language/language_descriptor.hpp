#pragma once

#include <nexusexec/execution/source_file.hpp>
#include <nexusexec/sandbox/resource_limits.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace nexusexec {

/// Dependency manifest understood by a language's package manager
enum class ManifestFormat { None, Requirements, PackageJson, PomXml, Conanfile };

std::string_view format_as(ManifestFormat format);

/// Accepts the manifest file name ("requirements.txt", ...) or "none"
std::optional<ManifestFormat> parse_manifest_format(std::string_view str);

/// File the manifest is written to, relative to the workspace root
std::string_view manifest_file_name(ManifestFormat format);

/// Values substituted into argv templates and environment values
struct CommandContext
{
    std::string main_file;
    std::vector<std::string> sources;

    /// Workspace root as seen from inside the sandbox
    std::string workspace;
};

/// Everything the engine needs to know to build and run one language.
///
/// Argv templates may use ``{main}``, ``{main_stem}`` (main file without extension,
/// directory separators turned into dots, i.e. a Java class name), ``{workspace}``
/// and, as a whole argument, ``{sources}``.
struct LanguageDescriptor
{
    std::string id;
    std::vector<std::string> aliases;

    /// Container image reference, only used by the container backend
    std::string image;

    std::string entry_file;
    std::string source_extension;

    std::optional<std::vector<std::string>> compile_command;
    std::vector<std::string> run_command;

    ManifestFormat manifest = ManifestFormat::None;
    std::vector<std::string> install_command;

    std::vector<std::pair<std::string, std::string>> environment;

    ResourceLimits default_limits;

    bool is_compiled() const { return compile_command.has_value(); }

    /// Names of the files in ``files`` that carry this language's source extension, in order
    std::vector<std::string> source_files(const std::vector<SourceFile>& files) const;

    CommandContext make_context(const std::vector<SourceFile>& files, std::string main_file,
                                std::string workspace) const;
};

/// Expand an argv template. A ``{sources}`` argument becomes one argument per source file.
std::vector<std::string> expand_command(const std::vector<std::string>& templ, const CommandContext& ctx);

/// Expand placeholders inside a single string (used for environment values)
std::string expand_placeholders(std::string_view templ, const CommandContext& ctx);

/// The four languages shipped with the engine: python, javascript, java, cpp
std::vector<LanguageDescriptor> builtin_languages();

} // namespace nexusexec

#include <nexusexec/language/language_descriptor.hpp>

#include <nexusexec/execution/source_file.hpp>
#include <nexusexec/sandbox/resource_limits.hpp>

#include <range/v3/algorithm/replace.hpp>
#include <range/v3/range/conversion.hpp>
#include <range/v3/view/filter.hpp>
#include <range/v3/view/transform.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace nexusexec {

std::string_view format_as(ManifestFormat format) {
    switch (format) {
    case ManifestFormat::None:
        return "none";
    case ManifestFormat::Requirements:
        return "requirements.txt";
    case ManifestFormat::PackageJson:
        return "package.json";
    case ManifestFormat::PomXml:
        return "pom.xml";
    case ManifestFormat::Conanfile:
        return "conanfile.txt";
    }
    return "<unknown manifest>";
}

std::optional<ManifestFormat> parse_manifest_format(std::string_view str) {
    for (auto format : {ManifestFormat::None, ManifestFormat::Requirements, ManifestFormat::PackageJson,
                        ManifestFormat::PomXml, ManifestFormat::Conanfile}) {
        if (format_as(format) == str) {
            return format;
        }
    }
    return std::nullopt;
}

std::string_view manifest_file_name(ManifestFormat format) {
    if (format == ManifestFormat::None) {
        return "";
    }
    return format_as(format);
}

std::vector<std::string> LanguageDescriptor::source_files(const std::vector<SourceFile>& files) const {
    auto has_extension = [this](const SourceFile& file) {
        return file.name.size() > source_extension.size() && file.name.ends_with(source_extension);
    };

    return files | ranges::views::filter(has_extension) |
           ranges::views::transform([](const SourceFile& file) { return file.name; }) |
           ranges::to<std::vector<std::string>>();
}

CommandContext LanguageDescriptor::make_context(const std::vector<SourceFile>& files, std::string main_file,
                                                std::string workspace) const {
    return CommandContext{
        .main_file = std::move(main_file), .sources = source_files(files), .workspace = std::move(workspace)};
}

namespace {

std::string main_stem(std::string_view main_file) {
    auto dot = main_file.rfind('.');
    auto slash = main_file.rfind('/');

    if (dot != std::string_view::npos && (slash == std::string_view::npos || dot > slash)) {
        main_file = main_file.substr(0, dot);
    }

    std::string stem{main_file};
    ranges::replace(stem, '/', '.');

    return stem;
}

void replace_all(std::string& str, std::string_view from, std::string_view to) {
    std::size_t pos = 0;
    while ((pos = str.find(from, pos)) != std::string::npos) {
        str.replace(pos, from.size(), to);
        pos += to.size();
    }
}

} // namespace

std::string expand_placeholders(std::string_view templ, const CommandContext& ctx) {
    std::string res{templ};

    replace_all(res, "{main_stem}", main_stem(ctx.main_file));
    replace_all(res, "{main}", ctx.main_file);
    replace_all(res, "{workspace}", ctx.workspace);

    return res;
}

std::vector<std::string> expand_command(const std::vector<std::string>& templ, const CommandContext& ctx) {
    std::vector<std::string> argv;
    argv.reserve(templ.size() + ctx.sources.size());

    for (const auto& arg : templ) {
        if (arg == "{sources}") {
            argv.insert(argv.end(), ctx.sources.begin(), ctx.sources.end());
            continue;
        }
        argv.push_back(expand_placeholders(arg, ctx));
    }

    return argv;
}

std::vector<LanguageDescriptor> builtin_languages() {
    using namespace std::chrono_literals;

    constexpr std::uint64_t MiB = 1024ULL * 1024;

    LanguageDescriptor python{
        .id = "python",
        .aliases = {"py", "python3"},
        .image = "nexusquest-python",
        .entry_file = "main.py",
        .source_extension = ".py",
        .compile_command = std::nullopt,
        .run_command = {"python3", "-u", "{main}"},
        .manifest = ManifestFormat::Requirements,
        .install_command = {"pip", "install", "--no-cache-dir", "--disable-pip-version-check", "--target", ".deps",
                            "-r", "requirements.txt"},
        .environment = {{"PYTHONPATH", "{workspace}:{workspace}/.deps"},
                        {"PYTHONUNBUFFERED", "1"},
                        {"PYTHONDONTWRITEBYTECODE", "1"}},
        .default_limits = {},
    };
    python.default_limits.wall_timeout = 10s;
    python.default_limits.memory_bytes = 128 * MiB;

    LanguageDescriptor javascript{
        .id = "javascript",
        .aliases = {"js", "node", "nodejs"},
        .image = "nexusquest-javascript",
        .entry_file = "main.js",
        .source_extension = ".js",
        .compile_command = std::nullopt,
        .run_command = {"node", "{main}"},
        .manifest = ManifestFormat::PackageJson,
        .install_command = {"npm", "install", "--no-audit", "--no-fund", "--loglevel=error"},
        .environment = {{"NODE_PATH", "{workspace}/node_modules"}},
        .default_limits = {},
    };
    javascript.default_limits.wall_timeout = 10s;
    javascript.default_limits.memory_bytes = 256 * MiB;

    LanguageDescriptor java{
        .id = "java",
        .aliases = {},
        .image = "nexusquest-java",
        .entry_file = "Main.java",
        .source_extension = ".java",
        .compile_command = std::vector<std::string>{"javac", "-encoding", "UTF-8", "-cp", ".:lib/*", "-d", ".",
                                                    "{sources}"},
        .run_command = {"java", "-Xss64m", "-cp", ".:lib/*", "{main_stem}"},
        .manifest = ManifestFormat::PomXml,
        .install_command = {"mvn", "-q", "dependency:copy-dependencies", "-DoutputDirectory=lib"},
        .environment = {},
        .default_limits = {},
    };
    java.default_limits.wall_timeout = 15s;
    java.default_limits.memory_bytes = 256 * MiB;

    LanguageDescriptor cpp{
        .id = "cpp",
        .aliases = {"c++", "cxx"},
        .image = "nexusquest-cpp",
        .entry_file = "main.cpp",
        .source_extension = ".cpp",
        .compile_command = std::vector<std::string>{"g++", "-std=c++20", "-O2", "-pipe", "-I.", "-Ibuild/include",
                                                    "{sources}", "-o", "a.out"},
        .run_command = {"./a.out"},
        .manifest = ManifestFormat::Conanfile,
        .install_command = {"conan", "install", ".", "--output-folder=build", "--build=missing"},
        .environment = {},
        .default_limits = {},
    };
    cpp.default_limits.wall_timeout = 10s;
    cpp.default_limits.memory_bytes = 256 * MiB;

    return {python, javascript, java, cpp};
}

} // namespace nexusexec

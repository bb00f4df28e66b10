#include "catch2_custom.hpp"

#include <nexusexec/common/error_types.hpp>
#include <nexusexec/execution/source_file.hpp>
#include <nexusexec/language/language_descriptor.hpp>
#include <nexusexec/language/language_registry.hpp>

#include <string>
#include <vector>

using nexusexec::CommandContext;
using nexusexec::ErrorKind;
using nexusexec::LanguageDescriptor;
using nexusexec::LanguageRegistry;
using nexusexec::ManifestFormat;
using nexusexec::SourceFile;
using Catch::Matchers::Equals;

TEST_CASE("Built-in languages resolve by id and alias") {
    LanguageRegistry registry;

    REQUIRE_THAT(registry.ids(), Equals(std::vector<std::string>{"python", "javascript", "java", "cpp"}));

    for (const auto* name : {"python", "Python", "py", "PYTHON3"}) {
        auto res = registry.resolve(name);
        REQUIRE(res);
        REQUIRE(res->get().id == "python");
    }

    REQUIRE(registry.resolve("node")->get().id == "javascript");
    REQUIRE(registry.resolve("c++")->get().id == "cpp");
    REQUIRE(registry.contains("JAVA"));
}

TEST_CASE("Unknown languages are reported") {
    LanguageRegistry registry;

    auto res = registry.resolve("cobol");
    REQUIRE(res.has_error());
    REQUIRE(res.error().kind == ErrorKind::UnsupportedLanguage);
    REQUIRE_THAT(res.error().message, Catch::Matchers::ContainsSubstring("cobol"));

    REQUIRE_FALSE(registry.contains(""));
}

TEST_CASE("Built-in descriptors") {
    LanguageRegistry registry;

    const LanguageDescriptor& java = registry.resolve("java")->get();
    REQUIRE(java.is_compiled());
    REQUIRE(java.entry_file == "Main.java");
    REQUIRE(java.manifest == ManifestFormat::PomXml);

    const LanguageDescriptor& python = registry.resolve("python")->get();
    REQUIRE_FALSE(python.is_compiled());
    REQUIRE(python.manifest == ManifestFormat::Requirements);
    REQUIRE_FALSE(python.install_command.empty());

    REQUIRE(registry.resolve("cpp")->get().manifest == ManifestFormat::Conanfile);
    REQUIRE(registry.resolve("javascript")->get().manifest == ManifestFormat::PackageJson);
}

TEST_CASE("Configured languages extend and override the built-in ones") {
    LanguageDescriptor ruby{.id = "ruby", .aliases = {"rb"}, .entry_file = "main.rb", .source_extension = ".rb",
                            .run_command = {"ruby", "{main}"}};
    LanguageDescriptor python{.id = "python", .entry_file = "app.py", .source_extension = ".py",
                              .run_command = {"pypy3", "{main}"}};

    LanguageRegistry registry{{ruby, python}};

    REQUIRE(registry.size() == 5);
    REQUIRE(registry.resolve("rb")->get().id == "ruby");

    // Replaced in place, aliases included
    REQUIRE(registry.ids().front() == "python");
    REQUIRE(registry.resolve("python")->get().entry_file == "app.py");
    REQUIRE_FALSE(registry.contains("py"));
}

TEST_CASE("Command templates expand placeholders") {
    LanguageRegistry registry;
    const LanguageDescriptor& java = registry.resolve("java")->get();

    std::vector<SourceFile> files{
        SourceFile{.name = "com/example/Main.java", .content = ""},
        SourceFile{.name = "com/example/Util.java", .content = ""},
        SourceFile{.name = "notes.txt", .content = ""},
    };

    CommandContext ctx = java.make_context(files, "com/example/Main.java", "/workspace");
    REQUIRE_THAT(ctx.sources, Equals(std::vector<std::string>{"com/example/Main.java", "com/example/Util.java"}));

    auto compile = expand_command(*java.compile_command, ctx);
    REQUIRE(compile.size() == java.compile_command->size() + 1);
    REQUIRE(compile.back() == "com/example/Util.java");

    auto run = expand_command(java.run_command, ctx);
    REQUIRE(run.back() == "com.example.Main");

    REQUIRE(expand_placeholders("{workspace}/.deps:{main}", ctx) == "/workspace/.deps:com/example/Main.java");
}

TEST_CASE("Source files need a name before the extension") {
    LanguageDescriptor shell{.id = "shell", .entry_file = "main.sh", .source_extension = ".sh",
                             .run_command = {"sh", "{main}"}};

    std::vector<SourceFile> files{SourceFile{.name = ".sh", .content = ""}, SourceFile{.name = "a.sh", .content = ""}};
    REQUIRE_THAT(shell.source_files(files), Equals(std::vector<std::string>{"a.sh"}));
}

TEST_CASE("Manifest formats parse from their file names") {
    using nexusexec::parse_manifest_format;

    REQUIRE(parse_manifest_format("requirements.txt") == ManifestFormat::Requirements);
    REQUIRE(parse_manifest_format("package.json") == ManifestFormat::PackageJson);
    REQUIRE(parse_manifest_format("none") == ManifestFormat::None);
    REQUIRE_FALSE(parse_manifest_format("Gemfile"));

    REQUIRE(nexusexec::manifest_file_name(ManifestFormat::None).empty());
    REQUIRE(nexusexec::manifest_file_name(ManifestFormat::PomXml) == "pom.xml");
}
